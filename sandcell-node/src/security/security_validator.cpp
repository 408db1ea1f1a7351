// security_validator.cpp - AST walk over the rule table
#include "security/security_validator.h"
#include "security/python_interpreter.h"
#include "security/validation_rules.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>
#include <tuple>

namespace py = pybind11;

namespace sandcell::node::security {

namespace {

ValidationReport Reject(ValidationError error) {
    ValidationReport report;
    report.is_valid = false;
    report.errors.push_back(std::move(error));
    return report;
}

ValidationError SyntaxViolation(const py::error_already_set& e) {
    ValidationError error;
    error.rule_kind = RuleKind::SyntaxError;

    if (e.matches(PyExc_SyntaxError)) {
        const py::object& value = e.value();
        std::string msg = py::getattr(value, "msg", py::str("invalid syntax")).cast<std::string>();
        error.message = "syntax error: " + msg;

        py::object lineno = py::getattr(value, "lineno", py::none());
        if (!lineno.is_none()) error.line = lineno.cast<int>();
        py::object offset = py::getattr(value, "offset", py::none());
        if (!offset.is_none()) error.column = offset.cast<int>();
    } else {
        // ValueError for NUL bytes, RecursionError/MemoryError for pathological nesting
        error.message = std::string("syntax error: code could not be parsed (") + e.what() + ")";
    }
    return error;
}

bool ErrorLess(const ValidationError& a, const ValidationError& b) {
    return std::make_tuple(a.line.value_or(0), a.column.value_or(0), static_cast<int>(a.rule_kind), a.message) <
           std::make_tuple(b.line.value_or(0), b.column.value_or(0), static_cast<int>(b.rule_kind), b.message);
}

bool ErrorEqual(const ValidationError& a, const ValidationError& b) {
    return a.line == b.line && a.column == b.column &&
           a.rule_kind == b.rule_kind && a.message == b.message;
}

} // namespace

SecurityValidator::SecurityValidator(ValidatorConfig config)
    : config_(std::move(config)) {}

ValidationReport SecurityValidator::Validate(const std::string& code,
                                             const std::set<std::string>& capabilities) const {
    if (code.size() > config_.max_code_bytes) {
        ValidationError error;
        error.rule_kind = RuleKind::SyntaxError;
        error.message = "code exceeds size limit of " + std::to_string(config_.max_code_bytes) + " bytes";
        return Reject(std::move(error));
    }

    if (!PythonInterpreter::IsAvailable()) {
        throw std::runtime_error("SecurityValidator: Python interpreter not initialized");
    }

    std::set<std::string> allowed = config_.allowed_modules;
    for (const auto& capability : capabilities) {
        if (GetAlwaysBlockedModules().count(capability) || GetNetworkModules().count(capability)) {
            spdlog::warn("SecurityValidator: Ignoring capability '{}' (never importable)", capability);
            continue;
        }
        allowed.insert(capability);
    }

    py::gil_scoped_acquire gil;

    py::module_ ast = py::module_::import("ast");
    py::object tree;
    try {
        tree = ast.attr("parse")(code, "<candidate>", "exec");
    } catch (const py::error_already_set& e) {
        // Nothing further is analysed once parsing fails
        return Reject(SyntaxViolation(e));
    }

    AstClasses classes = AstClasses::Resolve(ast);
    RuleContext ctx(classes, allowed, config_.scratch_prefix);
    const auto& rules = GetValidationRules();

    try {
        for (auto node : ast.attr("walk")(tree)) {
            if (py::isinstance(node, classes.Call)) {
                ctx.callees.insert(node.attr("func").ptr());
            }
            for (const auto& rule : rules) {
                rule.match(node, ctx);
            }
        }
    } catch (const py::error_already_set& e) {
        // Deny whatever could not be fully analysed
        ValidationError error;
        error.rule_kind = RuleKind::SyntaxError;
        error.message = std::string("syntax error: code could not be analysed (") + e.what() + ")";
        return Reject(std::move(error));
    }

    ValidationReport report;
    report.errors = std::move(ctx.Errors());
    std::sort(report.errors.begin(), report.errors.end(), ErrorLess);
    report.errors.erase(std::unique(report.errors.begin(), report.errors.end(), ErrorEqual),
                        report.errors.end());
    report.is_valid = report.errors.empty();

    if (!report.is_valid) {
        spdlog::debug("SecurityValidator: {} violation(s)", report.errors.size());
    }
    return report;
}

} // namespace sandcell::node::security
