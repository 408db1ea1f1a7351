// security_validator.h - Static pre-execution analysis of candidate code
#pragma once

#include "security/validation_types.h"
#include <cstddef>
#include <set>
#include <string>

namespace sandcell::node::security {

struct ValidatorConfig {
    // Top-level modules candidate code may import (data and numeric libraries)
    std::set<std::string> allowed_modules{
        "__future__", "abc", "bisect", "collections", "copy", "dataclasses", "datetime",
        "decimal", "enum", "fractions", "functools", "heapq", "itertools", "json", "math",
        "numbers", "operator", "random", "re", "statistics", "string", "time", "typing",
        "warnings",
        "numpy", "pandas", "scipy", "talib"
    };

    // Only literal paths under this prefix may be opened
    std::string scratch_prefix = "/scratch/";

    size_t max_code_bytes = 256 * 1024;
};

// Stateless and side-effect free: the same code string always yields the same
// report. Requires a live PythonInterpreter.
class SecurityValidator {
public:
    explicit SecurityValidator(ValidatorConfig config = {});

    // capabilities extend the allowed modules for this call only; they can
    // never unlock a networking or always-blocked module
    ValidationReport Validate(const std::string& code,
                              const std::set<std::string>& capabilities = {}) const;

    const ValidatorConfig& GetConfig() const { return config_; }

private:
    ValidatorConfig config_;
};

} // namespace sandcell::node::security
