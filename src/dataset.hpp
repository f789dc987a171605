#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace sciclaw {

// Named-column table. Cells are JSON scalars: null, bool, integer, float or string.
struct Dataset {
    std::vector<std::string> columns;
    std::vector<std::vector<nlohmann::json>> rows;

    size_t row_count() const { return rows.size(); }
    size_t column_count() const { return columns.size(); }

    // "int64", "float64", "bool" or "object"
    std::string column_dtype(size_t col) const;

    // {"columns": [...], "rows": [[...], ...]}
    nlohmann::json to_json() const;
    // Accepts the to_json() shape or a list of row records. Throws std::invalid_argument.
    static Dataset from_json(const nlohmann::json& j);

    // {data: first n rows as records, columns: [{name, dtype}], total_rows, preview_rows}
    nlohmann::json preview(size_t max_rows = 20) const;

    bool operator==(const Dataset& other) const {
        return columns == other.columns && rows == other.rows;
    }
    bool operator!=(const Dataset& other) const { return !(*this == other); }
};

// CSV text with a header row. Unquoted fields are type-inferred
// ("" and NA become null, TRUE/FALSE booleans, numbers numbers).
Dataset parse_csv(const std::string& text);

// Throws std::runtime_error if the file cannot be read
Dataset read_csv(const std::string& path);

// Header plus rows; strings quoted, null written as NA.
std::string to_csv(const Dataset& ds);
void write_csv(const Dataset& ds, const std::string& path);

} // namespace sciclaw
