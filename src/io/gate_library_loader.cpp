/// @file gate_library_loader.cpp
/// @brief Gate table parser

#include "io/gate_library_loader.hpp"

#include "common/text_utils.hpp"
#include "synthesis/errors.hpp"

#include <fstream>
#include <istream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace gatesynth {

namespace {

/// Parses a whole field as a number, rejecting trailing characters
double parse_number(const std::string& field, const std::string& where) {
    size_t consumed = 0;
    double value = 0.0;
    try {
        value = std::stod(field, &consumed);
    } catch (const std::logic_error&) {
        throw ConfigurationError(where + ": '" + field + "' is not a number");
    }
    if (consumed != field.size()) {
        throw ConfigurationError(where + ": '" + field + "' is not a number");
    }
    return value;
}

} // namespace

GateLibrary parse_gate_library_csv(std::istream& in, const std::string& source) {
    std::vector<GateDescriptor> gates;
    std::string line;
    size_t line_number = 0;
    bool seen_header = false;

    while (std::getline(in, line)) {
        line_number++;
        std::string_view text = trim(line);
        if (text.empty() || text.front() == '#') {
            continue;
        }
        if (!seen_header) {
            seen_header = true;
            continue;
        }

        std::string where = source + ":" + std::to_string(line_number);
        std::vector<std::string> fields = split_fields(text, ',');
        if (fields.size() < 3) {
            throw ConfigurationError(where + ": expected gate_name,num_inputs,complexity");
        }

        double arity = parse_number(fields[1], where);
        double cost = parse_number(fields[2], where);

        GateDescriptor gate;
        try {
            gate = make_gate(fields[0], cost);
        } catch (const ConfigurationError& e) {
            throw ConfigurationError(where + ": " + e.what());
        }
        if (arity != static_cast<double>(gate.arity)) {
            throw ConfigurationError(where + ": gate " + gate.name + " has " +
                                     std::to_string(gate.arity) + " inputs, table says " +
                                     fields[1]);
        }
        gates.push_back(std::move(gate));
    }

    try {
        return GateLibrary(std::move(gates));
    } catch (const ConfigurationError& e) {
        throw ConfigurationError(source + ": " + e.what());
    }
}

GateLibrary load_gate_library_csv(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open " + path);
    }
    return parse_gate_library_csv(in, path);
}

} // namespace gatesynth
