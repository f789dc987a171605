#include "dataset.hpp"
#include "util.hpp"
#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace sciclaw {

using json = nlohmann::json;

std::string Dataset::column_dtype(size_t col) const {
    bool any = false;
    bool all_int = true;
    bool all_number = true;
    bool all_bool = true;
    for (const auto& row : rows) {
        if (col >= row.size() || row[col].is_null()) continue;
        const auto& v = row[col];
        any = true;
        if (!v.is_number_integer()) all_int = false;
        if (!v.is_number()) all_number = false;
        if (!v.is_boolean()) all_bool = false;
    }
    if (!any) return "object";
    if (all_bool) return "bool";
    if (all_int) return "int64";
    if (all_number) return "float64";
    return "object";
}

json Dataset::to_json() const {
    json j;
    j["columns"] = columns;
    json rows_json = json::array();
    for (const auto& row : rows) rows_json.push_back(row);
    j["rows"] = std::move(rows_json);
    return j;
}

Dataset Dataset::from_json(const json& j) {
    Dataset ds;
    if (j.is_object() && j.contains("columns") && j["columns"].is_array()) {
        for (const auto& c : j["columns"]) {
            ds.columns.push_back(c.is_string() ? c.get<std::string>() : c.dump());
        }
        if (j.contains("rows") && j["rows"].is_array()) {
            for (const auto& r : j["rows"]) {
                if (!r.is_array()) throw std::invalid_argument("table row is not an array");
                std::vector<json> row(r.begin(), r.end());
                row.resize(ds.columns.size());
                ds.rows.push_back(std::move(row));
            }
        }
        return ds;
    }
    if (j.is_array()) {
        // Row records: column order of first appearance
        for (const auto& rec : j) {
            if (!rec.is_object()) throw std::invalid_argument("table record is not an object");
            for (auto& [key, _] : rec.items()) {
                bool known = false;
                for (const auto& c : ds.columns) {
                    if (c == key) { known = true; break; }
                }
                if (!known) ds.columns.push_back(key);
            }
        }
        for (const auto& rec : j) {
            std::vector<json> row;
            row.reserve(ds.columns.size());
            for (const auto& c : ds.columns) {
                row.push_back(rec.contains(c) ? rec[c] : json(nullptr));
            }
            ds.rows.push_back(std::move(row));
        }
        return ds;
    }
    throw std::invalid_argument("not a table");
}

json Dataset::preview(size_t max_rows) const {
    json data = json::array();
    size_t n = std::min(max_rows, rows.size());
    for (size_t i = 0; i < n; ++i) {
        json rec = json::object();
        for (size_t c = 0; c < columns.size(); ++c) {
            rec[columns[c]] = c < rows[i].size() ? rows[i][c] : json(nullptr);
        }
        data.push_back(std::move(rec));
    }
    json cols = json::array();
    for (size_t c = 0; c < columns.size(); ++c) {
        cols.push_back({{"name", columns[c]}, {"dtype", column_dtype(c)}});
    }
    return {
        {"data", std::move(data)},
        {"columns", std::move(cols)},
        {"total_rows", rows.size()},
        {"preview_rows", n}
    };
}

// ── CSV ──────────────────────────────────────────────────────────

namespace {

struct Field {
    std::string text;
    bool quoted = false;
};

json infer_cell(const Field& f) {
    if (f.quoted) return f.text;
    std::string t = trim(f.text);
    if (t.empty() || t == "NA" || t == "NaN" || t == "nan" || t == "null") return nullptr;
    if (t == "TRUE" || t == "true" || t == "True") return true;
    if (t == "FALSE" || t == "false" || t == "False") return false;

    const char* begin = t.c_str();
    char* end = nullptr;
    errno = 0;
    long long iv = std::strtoll(begin, &end, 10);
    if (errno == 0 && end == begin + t.size()) return static_cast<int64_t>(iv);

    errno = 0;
    double dv = std::strtod(begin, &end);
    if (errno == 0 && end == begin + t.size() && std::isfinite(dv)) {
        // strtod accepts hex and inf/nan spellings; keep those as text
        if (t.find_first_of("xXiInN") == std::string::npos) return dv;
    }
    return f.text;
}

// Splits CSV text into records of fields (RFC 4180 quoting, CRLF or LF).
std::vector<std::vector<Field>> split_records(const std::string& text) {
    std::vector<std::vector<Field>> records;
    std::vector<Field> record;
    Field field;
    bool in_quotes = false;
    bool field_started = false;

    auto end_field = [&]() {
        record.push_back(std::move(field));
        field = Field{};
        field_started = false;
    };
    auto end_record = [&]() {
        end_field();
        bool blank = record.size() == 1 && record[0].text.empty() && !record[0].quoted;
        if (!blank) records.push_back(std::move(record));
        record.clear();
    };

    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < text.size() && text[i + 1] == '"') {
                    field.text += '"';
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                field.text += c;
            }
            continue;
        }
        if (c == '"' && !field_started) {
            in_quotes = true;
            field.quoted = true;
            field_started = true;
        } else if (c == ',') {
            end_field();
        } else if (c == '\r') {
            if (i + 1 < text.size() && text[i + 1] == '\n') ++i;
            end_record();
        } else if (c == '\n') {
            end_record();
        } else {
            field.text += c;
            field_started = true;
        }
    }
    if (in_quotes) throw std::runtime_error("CSV: unterminated quoted field");
    if (field_started || !record.empty()) end_record();
    return records;
}

std::string csv_quote(const std::string& s) {
    return "\"" + replace_all(s, "\"", "\"\"") + "\"";
}

std::string csv_cell(const json& v) {
    if (v.is_null()) return "NA";
    if (v.is_boolean()) return v.get<bool>() ? "TRUE" : "FALSE";
    if (v.is_number_float()) {
        double d = v.get<double>();
        if (!std::isfinite(d)) return "NA";
        return v.dump();
    }
    if (v.is_number()) return v.dump();
    if (v.is_string()) return csv_quote(v.get<std::string>());
    return csv_quote(v.dump());
}

} // namespace

Dataset parse_csv(const std::string& text) {
    std::string body = text;
    if (starts_with(body, "\xEF\xBB\xBF")) body.erase(0, 3);  // UTF-8 BOM

    auto records = split_records(body);
    Dataset ds;
    if (records.empty()) return ds;

    for (const auto& f : records[0]) ds.columns.push_back(f.text);
    for (size_t r = 1; r < records.size(); ++r) {
        std::vector<json> row;
        row.reserve(ds.columns.size());
        for (size_t c = 0; c < ds.columns.size(); ++c) {
            row.push_back(c < records[r].size() ? infer_cell(records[r][c]) : json(nullptr));
        }
        ds.rows.push_back(std::move(row));
    }
    return ds;
}

Dataset read_csv(const std::string& path) {
    return parse_csv(read_file(path));
}

std::string to_csv(const Dataset& ds) {
    std::string out;
    for (size_t c = 0; c < ds.columns.size(); ++c) {
        if (c) out += ',';
        out += csv_quote(ds.columns[c]);
    }
    out += '\n';
    for (const auto& row : ds.rows) {
        for (size_t c = 0; c < ds.columns.size(); ++c) {
            if (c) out += ',';
            out += c < row.size() ? csv_cell(row[c]) : "NA";
        }
        out += '\n';
    }
    return out;
}

void write_csv(const Dataset& ds, const std::string& path) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) throw std::runtime_error("Failed to open " + path + " for writing");
    out << to_csv(ds);
    if (!out) throw std::runtime_error("Failed to write " + path);
}

} // namespace sciclaw
