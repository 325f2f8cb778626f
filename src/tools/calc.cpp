#include "calc.hpp"
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <vector>

namespace tether {

namespace {

constexpr double kPi = 3.14159265358979323846;
constexpr double kE = 2.71828182845904523536;

double checked(double value) {
    if (std::isnan(value)) {
        throw std::domain_error("math domain error");
    }
    return value;
}

double factorial(double n) {
    if (n < 0 || n != std::floor(n)) {
        throw std::domain_error("factorial() only accepts non-negative integral values");
    }
    if (n > 170) {
        throw std::domain_error("factorial() result too large");
    }
    double result = 1.0;
    for (int i = 2; i <= static_cast<int>(n); ++i) {
        result *= i;
    }
    return result;
}

double call_function(const std::string& name, const std::vector<double>& args) {
    auto arity = [&](size_t n) {
        if (args.size() != n) {
            throw std::invalid_argument(name + "() takes exactly " + std::to_string(n) +
                                        " argument" + (n == 1 ? "" : "s"));
        }
    };

    if (name == "sqrt") {
        arity(1);
        if (args[0] < 0) throw std::domain_error("math domain error");
        return std::sqrt(args[0]);
    }
    if (name == "sin") { arity(1); return std::sin(args[0]); }
    if (name == "cos") { arity(1); return std::cos(args[0]); }
    if (name == "tan") { arity(1); return std::tan(args[0]); }
    if (name == "asin") { arity(1); return checked(std::asin(args[0])); }
    if (name == "acos") { arity(1); return checked(std::acos(args[0])); }
    if (name == "atan") { arity(1); return std::atan(args[0]); }
    if (name == "atan2") { arity(2); return std::atan2(args[0], args[1]); }
    if (name == "exp") { arity(1); return std::exp(args[0]); }
    if (name == "fabs" || name == "abs") { arity(1); return std::fabs(args[0]); }
    if (name == "floor") { arity(1); return std::floor(args[0]); }
    if (name == "ceil") { arity(1); return std::ceil(args[0]); }
    if (name == "trunc") { arity(1); return std::trunc(args[0]); }
    if (name == "degrees") { arity(1); return args[0] * 180.0 / kPi; }
    if (name == "radians") { arity(1); return args[0] * kPi / 180.0; }
    if (name == "hypot") { arity(2); return std::hypot(args[0], args[1]); }
    if (name == "factorial") { arity(1); return factorial(args[0]); }
    if (name == "pow") { arity(2); return checked(std::pow(args[0], args[1])); }
    if (name == "log10" || name == "log2" || name == "log") {
        if (name == "log" && args.size() == 2) {
            if (args[0] <= 0 || args[1] <= 0 || args[1] == 1) {
                throw std::domain_error("math domain error");
            }
            return std::log(args[0]) / std::log(args[1]);
        }
        arity(1);
        if (args[0] <= 0) throw std::domain_error("math domain error");
        if (name == "log10") return std::log10(args[0]);
        if (name == "log2") return std::log2(args[0]);
        return std::log(args[0]);
    }
    throw std::invalid_argument("name '" + name + "' is not defined");
}

// Recursive-descent evaluator. Precedence, loosest first:
//   additive, multiplicative, unary sign, power (right-assoc), primary
class Parser {
public:
    explicit Parser(const std::string& text) : text_(text) {}

    double parse() {
        double value = additive();
        skip_space();
        if (pos_ != text_.size()) {
            throw std::invalid_argument("unexpected '" + std::string(1, text_[pos_]) +
                                        "' at position " + std::to_string(pos_));
        }
        return value;
    }

private:
    void skip_space() {
        while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_]))) {
            ++pos_;
        }
    }

    bool accept(const char* token) {
        skip_space();
        size_t len = std::char_traits<char>::length(token);
        if (text_.compare(pos_, len, token) == 0) {
            pos_ += len;
            return true;
        }
        return false;
    }

    double additive() {
        double value = multiplicative();
        while (true) {
            if (accept("+")) {
                value += multiplicative();
            } else if (accept("-")) {
                value -= multiplicative();
            } else {
                return value;
            }
        }
    }

    double multiplicative() {
        double value = unary();
        while (true) {
            skip_space();
            // "**" belongs to power(); never treat it as two '*'
            if (text_.compare(pos_, 2, "**") == 0) return value;
            if (accept("//")) {
                double rhs = unary();
                if (rhs == 0) throw std::domain_error("division by zero");
                value = std::floor(value / rhs);
            } else if (accept("*")) {
                value *= unary();
            } else if (accept("/")) {
                double rhs = unary();
                if (rhs == 0) throw std::domain_error("division by zero");
                value /= rhs;
            } else if (accept("%")) {
                double rhs = unary();
                if (rhs == 0) throw std::domain_error("modulo by zero");
                // Result takes the sign of the divisor
                value = value - rhs * std::floor(value / rhs);
            } else {
                return value;
            }
        }
    }

    double unary() {
        if (accept("-")) return -unary();
        if (accept("+")) return unary();
        return power();
    }

    double power() {
        double base = primary();
        if (accept("**")) {
            double exponent = unary();
            if (base == 0 && exponent < 0) {
                throw std::domain_error("zero cannot be raised to a negative power");
            }
            return checked(std::pow(base, exponent));
        }
        return base;
    }

    double primary() {
        skip_space();
        if (pos_ >= text_.size()) {
            throw std::invalid_argument("unexpected end of expression");
        }

        char c = text_[pos_];
        if (c == '(') {
            ++pos_;
            double value = additive();
            if (!accept(")")) throw std::invalid_argument("missing ')'");
            return value;
        }
        if (std::isdigit(static_cast<unsigned char>(c)) || c == '.') {
            return number();
        }
        if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
            std::string name = identifier();
            if (accept("(")) {
                std::vector<double> args;
                if (!accept(")")) {
                    do {
                        args.push_back(additive());
                    } while (accept(","));
                    if (!accept(")")) throw std::invalid_argument("missing ')' after arguments");
                }
                return call_function(name, args);
            }
            if (name == "pi") return kPi;
            if (name == "e") return kE;
            if (name == "tau") return 2 * kPi;
            if (name == "inf") return std::numeric_limits<double>::infinity();
            throw std::invalid_argument("name '" + name + "' is not defined");
        }
        throw std::invalid_argument("unexpected '" + std::string(1, c) +
                                    "' at position " + std::to_string(pos_));
    }

    double number() {
        const char* begin = text_.c_str() + pos_;
        char* end = nullptr;
        double value = std::strtod(begin, &end);
        if (end == begin) {
            throw std::invalid_argument("invalid number at position " + std::to_string(pos_));
        }
        pos_ += static_cast<size_t>(end - begin);
        return value;
    }

    std::string identifier() {
        size_t start = pos_;
        while (pos_ < text_.size() &&
               (std::isalnum(static_cast<unsigned char>(text_[pos_])) || text_[pos_] == '_')) {
            ++pos_;
        }
        return text_.substr(start, pos_ - start);
    }

    const std::string& text_;
    size_t pos_ = 0;
};

} // namespace

double evaluate_expression(const std::string& expression) {
    Parser parser(expression);
    return parser.parse();
}

std::string format_number(double value) {
    if (std::isinf(value)) return value > 0 ? "inf" : "-inf";
    if (std::isnan(value)) return "nan";
    if (value == std::floor(value) && std::fabs(value) < 1e15) {
        return std::to_string(static_cast<long long>(value));
    }
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.15g", value);
    return buf;
}

std::string CalcTool::execute(const nlohmann::json& args) {
    if (!args.contains("expression") || !args["expression"].is_string()) {
        return "Error: Missing required parameter: expression";
    }
    std::string expression = args["expression"].get<std::string>();
    try {
        return format_number(evaluate_expression(expression));
    } catch (const std::exception& e) {
        return std::string("Error: ") + e.what();
    }
}

ToolDefinition CalcTool::definition() const {
    return ToolDefinition{
        "tool_calc",
        "A tiny safe calculator. Handles + - * / ** () and math functions "
        "such as sqrt, sin, cos, log, exp and factorial.",
        {ArgumentSpec{"expression", true, "Arithmetic expression to evaluate, e.g. '2 ** 10 / 4'", "string"}}
    };
}

} // namespace tether
