// validation_types.cpp - Validation verdict helpers
#include "security/validation_types.h"
#include <sstream>

namespace sandcell::node::security {

const char* GetRuleKindName(RuleKind kind) {
    switch (kind) {
        case RuleKind::BlockedImport: return "BlockedImport";
        case RuleKind::BlockedCall: return "BlockedCall";
        case RuleKind::DynamicImport: return "DynamicImport";
        case RuleKind::SyntaxError: return "SyntaxError";
        case RuleKind::DisallowedFileAccess: return "DisallowedFileAccess";
        case RuleKind::NetworkReference: return "NetworkReference";
        default: return "Unknown";
    }
}

std::string ValidationReport::Summary() const {
    std::ostringstream out;
    for (const auto& error : errors) {
        if (error.line) {
            out << *error.line;
            if (error.column) out << ":" << *error.column;
            out << " ";
        }
        out << GetRuleKindName(error.rule_kind) << ": " << error.message << "\n";
    }
    return out.str();
}

} // namespace sandcell::node::security
