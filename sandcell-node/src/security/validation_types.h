// validation_types.h - Static analysis verdicts produced by SecurityValidator
#pragma once

#include <optional>
#include <string>
#include <vector>

namespace sandcell::node::security {

// Kinds of rule a piece of candidate code can violate
enum class RuleKind {
    BlockedImport,
    BlockedCall,
    DynamicImport,
    SyntaxError,
    DisallowedFileAccess,
    NetworkReference
};

const char* GetRuleKindName(RuleKind kind);

struct ValidationError {
    RuleKind rule_kind = RuleKind::SyntaxError;
    std::string message;
    std::optional<int> line;     // 1-based
    std::optional<int> column;   // 1-based
};

struct ValidationReport {
    bool is_valid = true;
    std::vector<ValidationError> errors;

    // "line:col kind: message" per violation, one per line
    std::string Summary() const;
};

} // namespace sandcell::node::security
