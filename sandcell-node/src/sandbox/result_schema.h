// result_schema.h - Versioned contract for the result file written by candidate code
//
// Version 1: flat object of string -> number, optional "schema_version": 1
//   {"sharpe_ratio": 1.23, "max_drawdown": -0.1}
// Version 2: metrics nested under a key
//   {"schema_version": 2, "metrics": {"sharpe_ratio": 1.23}}
#pragma once

#include <cstddef>
#include <map>
#include <string>

namespace sandcell::node::sandbox {

constexpr int kResultSchemaLatest = 2;
constexpr size_t kMaxResultBytes = 1024 * 1024;

struct ResultDocument {
    bool valid = false;
    int schema_version = 0;
    std::map<std::string, double> metrics;
    std::string error;   // Why the document was rejected
};

ResultDocument ParseResultDocument(const std::string& content);

} // namespace sandcell::node::sandbox
