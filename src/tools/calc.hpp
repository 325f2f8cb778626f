#pragma once
#include "../tool.hpp"
#include <string>

namespace tether {

// Evaluate an arithmetic expression: + - * / // % ** (), unary signs,
// constants (pi, e, tau, inf) and math functions.
// Throws std::invalid_argument on syntax errors and std::domain_error on
// math errors (division by zero, sqrt of a negative, ...).
double evaluate_expression(const std::string& expression);

// Integral values print without a fractional part, others with %.15g
std::string format_number(double value);

class CalcTool : public Tool {
public:
    std::string execute(const nlohmann::json& args) override;
    ToolDefinition definition() const override;
};

} // namespace tether
