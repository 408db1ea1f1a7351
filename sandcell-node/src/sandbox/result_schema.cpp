// result_schema.cpp - Result file parsing
#include "sandbox/result_schema.h"
#include <nlohmann/json.hpp>
#include <cmath>
#include <cstdint>

namespace sandcell::node::sandbox {

namespace {

ResultDocument Reject(std::string reason) {
    ResultDocument doc;
    doc.error = std::move(reason);
    return doc;
}

// Copies a string -> finite number object into metrics; skip_key is ignored
bool ReadMetricObject(const nlohmann::json& object, const char* skip_key,
                      std::map<std::string, double>& metrics, std::string& error) {
    for (auto it = object.begin(); it != object.end(); ++it) {
        if (skip_key && it.key() == skip_key) continue;

        // is_number() is false for booleans, which are rejected on purpose
        if (!it.value().is_number()) {
            error = "metric '" + it.key() + "' is not a number";
            return false;
        }
        double value = it.value().get<double>();
        if (!std::isfinite(value)) {
            error = "metric '" + it.key() + "' is not finite";
            return false;
        }
        metrics[it.key()] = value;
    }
    return true;
}

} // namespace

ResultDocument ParseResultDocument(const std::string& content) {
    if (content.empty()) {
        return Reject("result file is empty");
    }
    if (content.size() > kMaxResultBytes) {
        return Reject("result file exceeds " + std::to_string(kMaxResultBytes) + " bytes");
    }

    nlohmann::json j = nlohmann::json::parse(content, nullptr, false);
    if (j.is_discarded()) {
        return Reject("result file is not valid JSON");
    }
    if (!j.is_object()) {
        return Reject("result file must contain a JSON object");
    }

    int64_t version = 1;
    if (j.contains("schema_version")) {
        const auto& v = j["schema_version"];
        if (!v.is_number_integer()) {
            return Reject("schema_version must be an integer");
        }
        // Read at full width so large values cannot wrap onto a known version
        if (v.is_number_unsigned() && v.get<uint64_t>() > 2) {
            return Reject("unsupported schema_version " + v.dump());
        }
        version = v.get<int64_t>();
    }

    ResultDocument doc;
    doc.schema_version = static_cast<int>(version);

    switch (version) {
        case 1:
            if (!ReadMetricObject(j, "schema_version", doc.metrics, doc.error)) {
                return Reject(doc.error);
            }
            break;

        case 2: {
            if (!j.contains("metrics") || !j["metrics"].is_object()) {
                return Reject("schema_version 2 requires a 'metrics' object");
            }
            for (auto it = j.begin(); it != j.end(); ++it) {
                if (it.key() != "schema_version" && it.key() != "metrics") {
                    return Reject("unexpected top-level key '" + it.key() + "'");
                }
            }
            if (!ReadMetricObject(j["metrics"], nullptr, doc.metrics, doc.error)) {
                return Reject(doc.error);
            }
            break;
        }

        default:
            return Reject("unsupported schema_version " + std::to_string(version));
    }

    doc.valid = true;
    return doc;
}

} // namespace sandcell::node::sandbox
