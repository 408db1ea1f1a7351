// validation_rules.h - Tagged rule table applied to every AST node
#pragma once

#include "security/validation_types.h"
#include <pybind11/pybind11.h>
#include <functional>
#include <set>
#include <string>
#include <unordered_set>
#include <vector>

namespace sandcell::node::security {

namespace py = pybind11;

// Node classes from Python's ast module, resolved once per validation
struct AstClasses {
    py::object Import;
    py::object ImportFrom;
    py::object Call;
    py::object Name;
    py::object Attribute;
    py::object Constant;

    static AstClasses Resolve(const py::module_& ast);
};

// Shared state handed to every matcher during one walk
class RuleContext {
public:
    RuleContext(const AstClasses& ast,
                const std::set<std::string>& allowed_modules,
                const std::string& scratch_prefix);

    const AstClasses& ast;
    const std::set<std::string>& allowed_modules;
    const std::string& scratch_prefix;

    // Nodes that appear as the callee of some Call. ast.walk is breadth
    // first, so a Call is always seen before its callee.
    std::unordered_set<const void*> callees;

    bool IsCallee(const py::handle& node) const;

    void Report(RuleKind kind, std::string message, const py::handle& node);
    std::vector<ValidationError>& Errors() { return errors_; }

private:
    std::vector<ValidationError> errors_;
};

using RuleMatcher = std::function<void(const py::handle& node, RuleContext& ctx)>;

struct ValidationRule {
    RuleKind kind;
    const char* name;
    RuleMatcher match;
};

// The full rule set, in evaluation order. New restrictions are new entries.
const std::vector<ValidationRule>& GetValidationRules();

// Module roots that are refused even if a request lists them as capabilities
const std::set<std::string>& GetAlwaysBlockedModules();

// Module roots and names that give network access
const std::set<std::string>& GetNetworkModules();
const std::set<std::string>& GetNetworkNames();

// "a.b.c" for a Name/Attribute chain, empty for anything else
std::string DottedName(const py::handle& node, const AstClasses& ast);

} // namespace sandcell::node::security
