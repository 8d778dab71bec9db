/// @file expression.cpp
/// @brief Recursive-descent expression parser, evaluator and circuit-file reader

#include "io/expression.hpp"

#include "common/text_utils.hpp"
#include "synthesis/errors.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <istream>
#include <set>
#include <stdexcept>
#include <utility>

namespace gatesynth {

namespace {

bool is_identifier_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool is_identifier_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

class ExpressionParser {
  public:
    explicit ExpressionParser(std::string_view text) : text_(text) {}

    Expression parse() {
        Expression expression = parse_term();
        skip_space();
        if (pos_ != text_.size()) {
            fail(std::string("unexpected '") + text_[pos_] + "'");
        }
        return expression;
    }

  private:
    Expression parse_term() {
        skip_space();
        if (pos_ == text_.size()) {
            fail("unexpected end of expression");
        }

        char c = text_[pos_];
        if (c == '0' || c == '1') {
            pos_++;
            if (pos_ < text_.size() && is_identifier_char(text_[pos_])) {
                fail("constants must be 0 or 1");
            }
            Expression constant;
            constant.kind = Expression::Kind::Constant;
            constant.value = c == '1';
            return constant;
        }
        if (!is_identifier_start(c)) {
            fail(std::string("unexpected '") + c + "'");
        }

        size_t start = pos_;
        while (pos_ < text_.size() && is_identifier_char(text_[pos_])) {
            pos_++;
        }
        std::string name(text_.substr(start, pos_ - start));

        skip_space();
        if (pos_ == text_.size() || text_[pos_] != '(') {
            Expression variable;
            variable.kind = Expression::Kind::Variable;
            variable.name = std::move(name);
            return variable;
        }
        return parse_call(name, start);
    }

    Expression parse_call(const std::string& name, size_t name_pos) {
        pos_++; // '('

        Expression call;
        call.kind = Expression::Kind::Gate;
        try {
            call.gate = make_gate(name, 0.0);
        } catch (const ConfigurationError&) {
            pos_ = name_pos;
            fail("unknown gate '" + name + "'");
        }
        if (call.gate.arity < 1 || call.gate.arity > MAX_GATE_ARITY ||
            is_unary(call.gate.function) != (call.gate.arity == 1)) {
            pos_ = name_pos;
            fail("unknown gate '" + name + "'");
        }
        call.name = call.gate.name;

        while (true) {
            call.args.push_back(parse_term());
            skip_space();
            if (pos_ == text_.size()) {
                fail("missing ')'");
            }
            if (text_[pos_] == ',') {
                pos_++;
                continue;
            }
            if (text_[pos_] == ')') {
                pos_++;
                break;
            }
            fail(std::string("expected ',' or ')' but found '") + text_[pos_] + "'");
        }

        if (static_cast<int>(call.args.size()) != call.gate.arity) {
            pos_ = name_pos;
            fail(call.gate.name + " takes " + std::to_string(call.gate.arity) + " arguments, got " +
                 std::to_string(call.args.size()));
        }
        return call;
    }

    void skip_space() {
        while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_]))) {
            pos_++;
        }
    }

    [[noreturn]] void fail(const std::string& message) const {
        throw ConfigurationError("Expression '" + std::string(text_) + "' at column " +
                                 std::to_string(pos_ + 1) + ": " + message);
    }

    std::string_view text_;
    size_t pos_ = 0;
};

void collect_variables(const Expression& expression, std::set<std::string>& names) {
    if (expression.kind == Expression::Kind::Variable) {
        names.insert(expression.name);
    }
    for (const Expression& arg : expression.args) {
        collect_variables(arg, names);
    }
}

/// Removes a "[complexity=N]" annotation left by a previous search run
std::string strip_annotation(std::string_view line) {
    size_t open = line.find("[complexity=");
    if (open == std::string_view::npos) {
        return std::string(line);
    }
    size_t close = line.find(']', open);
    std::string stripped(line.substr(0, open));
    if (close != std::string_view::npos) {
        stripped += line.substr(close + 1);
    }
    return std::string(trim(stripped));
}

} // namespace

Expression parse_expression(std::string_view text) {
    return ExpressionParser(text).parse();
}

std::vector<std::string> extract_variables(const Expression& expression) {
    std::set<std::string> names;
    collect_variables(expression, names);
    return {names.begin(), names.end()};
}

BitVector evaluate_expression(const Expression& expression, const InputSet& inputs) {
    switch (expression.kind) {
    case Expression::Kind::Constant:
        return BitVector::constant(inputs.num_rows(), expression.value);

    case Expression::Kind::Variable:
        for (const NamedColumn& column : inputs.columns()) {
            if (column.name == expression.name) {
                return column.bits;
            }
        }
        throw ConfigurationError("Expression uses unknown variable '" + expression.name + "'");

    case Expression::Kind::Gate: {
        std::vector<BitVector> values;
        values.reserve(expression.args.size());
        for (const Expression& arg : expression.args) {
            values.push_back(evaluate_expression(arg, inputs));
        }
        std::vector<const BitVector*> columns;
        for (const BitVector& value : values) {
            columns.push_back(&value);
        }
        return evaluate_gate(expression.gate, columns);
    }
    }
    throw std::logic_error("Unknown expression kind");
}

std::string to_string(const Expression& expression) {
    switch (expression.kind) {
    case Expression::Kind::Constant:
        return expression.value ? "1" : "0";
    case Expression::Kind::Variable:
        return expression.name;
    case Expression::Kind::Gate: {
        std::string text = expression.name + "(";
        for (size_t i = 0; i < expression.args.size(); i++) {
            text += (i == 0 ? "" : ", ") + to_string(expression.args[i]);
        }
        return text + ")";
    }
    }
    return {};
}

CircuitFile parse_circuit_file(std::istream& in, const std::string& source) {
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        std::string_view text = trim(line);
        if (!text.empty()) {
            lines.emplace_back(text);
        }
    }
    if (lines.empty()) {
        throw ConfigurationError(source + ": no circuit expressions");
    }

    CircuitFile file;
    if (to_upper(lines.front()) == "NO OUTPUTS") {
        if (lines.size() < 2) {
            throw ConfigurationError(source +
                                     ": 'NO OUTPUTS' needs a second line with input variable names");
        }
        file.inputs_only = true;
        std::string_view names = lines[1];
        size_t pos = 0;
        while (pos < names.size()) {
            while (pos < names.size() && std::isspace(static_cast<unsigned char>(names[pos]))) {
                pos++;
            }
            size_t start = pos;
            while (pos < names.size() && !std::isspace(static_cast<unsigned char>(names[pos]))) {
                pos++;
            }
            if (pos > start) {
                file.variables.emplace_back(names.substr(start, pos - start));
            }
        }
        std::sort(file.variables.begin(), file.variables.end());
        return file;
    }

    for (size_t i = 0; i < lines.size(); i++) {
        std::string text = strip_annotation(lines[i]);

        CircuitFile::Output output;
        std::string_view body = text;
        if (size_t colon = text.find(':'); colon != std::string::npos) {
            output.name = std::string(trim(std::string_view(text).substr(0, colon)));
            body = trim(std::string_view(text).substr(colon + 1));
            if (output.name.empty()) {
                throw ConfigurationError(source + ": line " + std::to_string(i + 1) +
                                         " has an empty output name");
            }
        } else {
            output.name = lines.size() > 1 ? "Output" + std::to_string(i + 1) : "Output";
        }
        output.expression = parse_expression(body);
        file.outputs.push_back(std::move(output));
    }
    return file;
}

CircuitFile load_circuit_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open " + path);
    }
    return parse_circuit_file(in, path);
}

GeneratedTables generate_tables(const CircuitFile& file) {
    std::vector<std::string> variables = file.variables;
    if (!file.inputs_only) {
        std::set<std::string> names;
        for (const CircuitFile::Output& output : file.outputs) {
            for (std::string& name : extract_variables(output.expression)) {
                names.insert(std::move(name));
            }
        }
        variables.assign(names.begin(), names.end());
    }
    if (variables.empty()) {
        throw ConfigurationError("Circuit file uses no input variables");
    }

    size_t count = variables.size();
    GeneratedTables tables{InputSet::canonical(count, std::move(variables)), {}};
    for (const CircuitFile::Output& output : file.outputs) {
        tables.outputs.push_back({output.name, evaluate_expression(output.expression, tables.inputs)});
    }
    return tables;
}

} // namespace gatesynth
