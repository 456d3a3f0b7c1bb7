#include "geoscan/table.hpp"
#include "geoscan/error.hpp"

#include <charconv>

namespace geoscan {

const char* field_type_name(FieldType type) noexcept {
    switch (type) {
        case FieldType::BOOL:   return "bool";
        case FieldType::INT64:  return "int64";
        case FieldType::DOUBLE: return "double";
        case FieldType::STRING: return "string";
    }
    return "unknown";
}

std::optional<double> as_double(const Value& v) noexcept {
    if (const auto* d = std::get_if<double>(&v)) return *d;
    if (const auto* i = std::get_if<int64_t>(&v)) return static_cast<double>(*i);
    return std::nullopt;
}

std::string value_to_string(const Value& v) {
    struct Visitor {
        std::string operator()(std::monostate) const { return ""; }
        std::string operator()(bool b) const { return b ? "true" : "false"; }
        std::string operator()(int64_t i) const { return std::to_string(i); }
        std::string operator()(double d) const {
            // Shortest text that parses back to the same double
            char buf[32];
            auto result = std::to_chars(buf, buf + sizeof(buf), d);
            return std::string(buf, result.ptr);
        }
        std::string operator()(const std::string& s) const { return s; }
    };
    return std::visit(Visitor{}, v);
}

Schema::Schema(std::vector<Field> fields) : fields_(std::move(fields)) {
    for (size_t i = 0; i < fields_.size(); ++i) {
        GEOSCAN_CHECK_ARGUMENT(!fields_[i].name.empty(), "Field names must not be empty");
        for (size_t j = 0; j < i; ++j) {
            if (fields_[i].name == fields_[j].name) {
                throw InvalidArgumentError("Duplicate field '" + fields_[i].name + "'", __func__);
            }
        }
    }
}

int Schema::index_of(const std::string& name) const noexcept {
    for (size_t i = 0; i < fields_.size(); ++i) {
        if (fields_[i].name == name) return static_cast<int>(i);
    }
    return -1;
}

Schema Schema::add(Field field) const {
    std::vector<Field> fields = fields_;
    fields.push_back(std::move(field));
    return Schema(std::move(fields));
}

Table::Table(Schema schema, std::vector<Row> rows) : schema_(std::move(schema)) {
    for (const auto& row : rows) {
        check_row(row);
    }
    rows_ = std::move(rows);
}

void Table::check_row(const Row& row) const {
    if (row.size() != schema_.size()) {
        throw InvalidArgumentError("Row has " + std::to_string(row.size()) +
                                   " values, schema has " + std::to_string(schema_.size()) +
                                   " fields", __func__);
    }

    for (size_t i = 0; i < row.size(); ++i) {
        const Field& field = schema_.fields()[i];
        const Value& v = row[i];
        bool ok;
        switch (field.type) {
            case FieldType::BOOL:   ok = std::holds_alternative<bool>(v); break;
            case FieldType::INT64:  ok = std::holds_alternative<int64_t>(v); break;
            case FieldType::DOUBLE: ok = std::holds_alternative<double>(v); break;
            case FieldType::STRING: ok = std::holds_alternative<std::string>(v); break;
            default:                ok = false; break;
        }
        if (is_null(v)) {
            ok = field.nullable;
        }
        if (!ok) {
            throw InvalidArgumentError("Value in column '" + field.name + "' does not match type " +
                                       field_type_name(field.type), __func__);
        }
    }
}

void Table::add_row(Row row) {
    check_row(row);
    rows_.push_back(std::move(row));
}

const Value& Table::at(size_t row, const std::string& column) const {
    int col = schema_.index_of(column);
    if (col < 0) {
        throw InvalidArgumentError("No column named '" + column + "'", __func__);
    }
    if (row >= rows_.size()) {
        throw InvalidArgumentError("Row " + std::to_string(row) + " out of range", __func__);
    }
    return rows_[row][static_cast<size_t>(col)];
}

} // namespace geoscan
