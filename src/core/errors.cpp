#include "core/errors.hpp"

namespace gho {

std::string warning_cause_to_string(DegenerateClusterWarning::Cause cause) {
    switch (cause) {
        case DegenerateClusterWarning::Cause::ThresholdFallback: return "threshold_fallback";
        case DegenerateClusterWarning::Cause::DuplicateHubs: return "duplicate_hubs";
        default: return "threshold_fallback";
    }
}

DegenerateClusterWarning::Cause warning_cause_from_string(const std::string& name) {
    if (name == "threshold_fallback") return DegenerateClusterWarning::Cause::ThresholdFallback;
    if (name == "duplicate_hubs") return DegenerateClusterWarning::Cause::DuplicateHubs;
    throw std::invalid_argument("Unknown warning cause: " + name);
}

nlohmann::json DegenerateClusterWarning::to_json() const {
    nlohmann::json j;
    j["cause"] = warning_cause_to_string(cause);
    j["message"] = message;
    return j;
}

DegenerateClusterWarning DegenerateClusterWarning::from_json(const nlohmann::json& j) {
    DegenerateClusterWarning warning;
    warning.cause = warning_cause_from_string(j.at("cause").get<std::string>());
    warning.message = j.value("message", "");
    return warning;
}

} // namespace gho
