#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace geoscan {

enum class FieldType {
    BOOL,
    INT64,
    DOUBLE,
    STRING
};

const char* field_type_name(FieldType type) noexcept;

// Null is std::monostate
using Value = std::variant<std::monostate, bool, int64_t, double, std::string>;

inline bool is_null(const Value& v) noexcept {
    return std::holds_alternative<std::monostate>(v);
}

// Numeric view of a value; nullopt for null, bool and string
std::optional<double> as_double(const Value& v) noexcept;

std::string value_to_string(const Value& v);

struct Field {
    std::string name;
    FieldType type;
    bool nullable;

    bool operator==(const Field& other) const {
        return name == other.name && type == other.type && nullable == other.nullable;
    }
};

class Schema {
public:
    Schema() = default;
    explicit Schema(std::vector<Field> fields);

    const std::vector<Field>& fields() const noexcept { return fields_; }
    size_t size() const noexcept { return fields_.size(); }

    // Column position, or -1
    int index_of(const std::string& name) const noexcept;
    bool contains(const std::string& name) const noexcept { return index_of(name) >= 0; }

    // Copy with one more field at the end; duplicate names are rejected
    Schema add(Field field) const;

    bool operator==(const Schema& other) const { return fields_ == other.fields_; }

private:
    std::vector<Field> fields_;
};

using Row = std::vector<Value>;

/**
 * Minimal in-memory row store used as the inference input and output.
 * Every row has exactly one value per schema field.
 */
class Table {
public:
    Table() = default;
    explicit Table(Schema schema) : schema_(std::move(schema)) {}
    Table(Schema schema, std::vector<Row> rows);

    const Schema& schema() const noexcept { return schema_; }
    const std::vector<Row>& rows() const noexcept { return rows_; }
    size_t num_rows() const noexcept { return rows_.size(); }

    void add_row(Row row);

    const Value& at(size_t row, const std::string& column) const;

private:
    void check_row(const Row& row) const;

    Schema schema_;
    std::vector<Row> rows_;
};

} // namespace geoscan
