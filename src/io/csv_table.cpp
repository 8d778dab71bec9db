/// @file csv_table.cpp
/// @brief CSV truth-table parser and writer

#include "io/csv_table.hpp"

#include "common/text_utils.hpp"
#include "synthesis/errors.hpp"

#include <fstream>
#include <istream>
#include <ostream>
#include <stdexcept>
#include <unordered_set>

namespace gatesynth {

std::vector<NamedColumn> parse_truth_table_csv(std::istream& in, const std::string& source) {
    std::vector<std::string> header;
    std::vector<std::vector<bool>> cells;
    std::string line;
    size_t line_number = 0;

    while (std::getline(in, line)) {
        line_number++;
        std::string_view text = trim(line);
        if (text.empty()) {
            continue;
        }

        std::vector<std::string> fields = split_fields(text, ',');
        if (header.empty()) {
            std::unordered_set<std::string> seen;
            for (const std::string& name : fields) {
                if (name.empty()) {
                    throw ConfigurationError(source + ":" + std::to_string(line_number) +
                                             ": empty column name in header");
                }
                if (!seen.insert(name).second) {
                    throw ConfigurationError(source + ":" + std::to_string(line_number) +
                                             ": column '" + name + "' appears more than once");
                }
            }
            header = std::move(fields);
            cells.resize(header.size());
            continue;
        }

        if (fields.size() != header.size()) {
            throw ConfigurationError(source + ":" + std::to_string(line_number) + ": expected " +
                                     std::to_string(header.size()) + " cells, found " +
                                     std::to_string(fields.size()));
        }
        for (size_t i = 0; i < fields.size(); i++) {
            if (fields[i] != "0" && fields[i] != "1") {
                throw ConfigurationError(source + ":" + std::to_string(line_number) + ": cell '" +
                                         fields[i] + "' in column '" + header[i] +
                                         "' is not 0 or 1");
            }
            cells[i].push_back(fields[i] == "1");
        }
    }

    if (header.empty()) {
        throw ConfigurationError(source + ": missing header row");
    }

    std::vector<NamedColumn> columns;
    for (size_t i = 0; i < header.size(); i++) {
        columns.push_back({header[i], BitVector::from_bools(cells[i])});
    }
    return columns;
}

std::vector<NamedColumn> read_truth_table_csv(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open " + path);
    }
    return parse_truth_table_csv(in, path);
}

void write_truth_table_csv(std::ostream& out, const std::vector<NamedColumn>& columns) {
    size_t rows = columns.empty() ? 0 : columns.front().bits.size();
    for (const NamedColumn& column : columns) {
        if (column.bits.size() != rows) {
            throw std::invalid_argument("Truth table columns must have equal length");
        }
    }

    for (size_t i = 0; i < columns.size(); i++) {
        out << (i == 0 ? "" : ",") << columns[i].name;
    }
    out << '\n';
    for (size_t row = 0; row < rows; row++) {
        for (size_t i = 0; i < columns.size(); i++) {
            out << (i == 0 ? "" : ",") << (columns[i].bits.get(row) ? '1' : '0');
        }
        out << '\n';
    }
}

void write_truth_table_csv(const std::string& path, const std::vector<NamedColumn>& columns) {
    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("Cannot write " + path);
    }
    write_truth_table_csv(out, columns);
    if (!out) {
        throw std::runtime_error("Failed while writing " + path);
    }
}

} // namespace gatesynth
