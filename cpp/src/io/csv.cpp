#include "geoscan/csv.hpp"
#include "geoscan/error.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <optional>

namespace geoscan {

namespace {

// One logical record; quoted fields may span lines
bool read_record(std::istream& in, std::vector<std::optional<std::string>>& fields, size_t& line_no) {
    fields.clear();
    std::string line;
    if (!std::getline(in, line)) {
        return false;
    }
    ++line_no;

    std::string field;
    bool quoted = false;
    bool was_quoted = false;
    size_t i = 0;
    while (true) {
        if (i >= line.size()) {
            if (quoted) {
                // Embedded newline inside quotes
                std::string next;
                if (!std::getline(in, next)) {
                    throw InvalidArgumentError("Unterminated quote at line " + std::to_string(line_no),
                                               "read_csv");
                }
                ++line_no;
                field += '\n';
                line = std::move(next);
                i = 0;
                continue;
            }
            break;
        }

        char c = line[i];
        if (quoted) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    field += '"';
                    ++i;
                } else {
                    quoted = false;
                }
            } else {
                field += c;
            }
        } else if (c == '"' && field.empty()) {
            quoted = true;
            was_quoted = true;
        } else if (c == ',') {
            if (field.empty() && !was_quoted) {
                fields.emplace_back(std::nullopt);
            } else {
                fields.emplace_back(std::move(field));
            }
            field.clear();
            was_quoted = false;
        } else if (c == '\r' && i + 1 == line.size()) {
            // CRLF line ending
        } else {
            field += c;
        }
        ++i;
    }

    if (field.empty() && !was_quoted) {
        fields.emplace_back(std::nullopt);
    } else {
        fields.emplace_back(std::move(field));
    }
    return true;
}

std::optional<double> parse_number(const std::string& text) {
    if (text.empty()) return std::nullopt;
    try {
        size_t consumed = 0;
        double value = std::stod(text, &consumed);
        if (consumed != text.size() || !std::isfinite(value)) {
            return std::nullopt;
        }
        return value;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

std::string quote(const std::string& field) {
    if (field.find_first_of(",\"\n\r") == std::string::npos) {
        return field;
    }
    std::string out = "\"";
    for (char c : field) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

} // anonymous namespace

Table read_csv(std::istream& in, const std::vector<std::string>& numeric_columns) {
    size_t line_no = 0;
    std::vector<std::optional<std::string>> header;
    if (!read_record(in, header, line_no)) {
        throw InvalidArgumentError("CSV input has no header row", __func__);
    }

    std::vector<std::vector<std::optional<std::string>>> raw;
    std::vector<std::optional<std::string>> fields;
    while (read_record(in, fields, line_no)) {
        if (fields.size() == 1 && !fields[0]) {
            continue;  // blank line
        }
        if (fields.size() != header.size()) {
            throw InvalidArgumentError("CSV line " + std::to_string(line_no) + " has " +
                                       std::to_string(fields.size()) + " fields, header has " +
                                       std::to_string(header.size()), __func__);
        }
        raw.push_back(fields);
    }

    std::vector<Field> schema_fields;
    schema_fields.reserve(header.size());
    for (size_t col = 0; col < header.size(); ++col) {
        if (!header[col]) {
            throw InvalidArgumentError("CSV header column " + std::to_string(col) + " is empty", __func__);
        }
        bool numeric = std::find(numeric_columns.begin(), numeric_columns.end(), *header[col]) !=
                        numeric_columns.end();
        for (size_t r = 0; numeric && r < raw.size(); ++r) {
            if (raw[r][col] && !parse_number(*raw[r][col])) {
                numeric = false;
            }
        }
        schema_fields.push_back(Field{*header[col], numeric ? FieldType::DOUBLE : FieldType::STRING, true});
    }

    Schema schema(std::move(schema_fields));
    std::vector<Row> rows;
    rows.reserve(raw.size());
    for (const auto& record : raw) {
        Row row;
        row.reserve(record.size());
        for (size_t col = 0; col < record.size(); ++col) {
            if (!record[col]) {
                row.emplace_back(std::monostate{});
            } else if (schema.fields()[col].type == FieldType::DOUBLE) {
                row.emplace_back(*parse_number(*record[col]));
            } else {
                row.emplace_back(*record[col]);
            }
        }
        rows.push_back(std::move(row));
    }
    return Table(std::move(schema), std::move(rows));
}

Table read_csv_file(const std::string& path, const std::vector<std::string>& numeric_columns) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw NotFoundError("Cannot open " + path, __func__);
    }
    return read_csv(in, numeric_columns);
}

void write_csv(const Table& table, std::ostream& out) {
    const auto& fields = table.schema().fields();
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i) out << ',';
        out << quote(fields[i].name);
    }
    out << '\n';

    for (const auto& row : table.rows()) {
        for (size_t i = 0; i < row.size(); ++i) {
            if (i) out << ',';
            out << quote(value_to_string(row[i]));
        }
        out << '\n';
    }
}

void write_csv_file(const Table& table, const std::string& path) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw IOError("Cannot open " + path + " for writing", __func__);
    }
    write_csv(table, out);
    out.flush();
    if (!out) {
        throw IOError("Failed writing " + path, __func__);
    }
}

} // namespace geoscan
