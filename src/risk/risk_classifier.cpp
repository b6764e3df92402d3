#include "risk/risk_classifier.hpp"
#include <algorithm>
#include <iterator>

namespace gho {

std::string risk_tier_to_string(RiskTier tier) {
    switch (tier) {
        case RiskTier::Primary: return "primary";
        case RiskTier::Relaxed: return "relaxed";
        case RiskTier::FullNetwork: return "full_network";
        default: return "primary";
    }
}

std::vector<CoordinateSample> RiskSubset::samples() const {
    std::vector<CoordinateSample> out;
    out.reserve(members.size());
    for (const auto& node : members) {
        out.push_back({node.lat, node.lon});
    }
    return out;
}

nlohmann::json RiskSubset::to_json() const {
    nlohmann::json j;
    j["tier"] = risk_tier_to_string(tier);
    j["requested_min_degree"] = requested_min_degree;
    j["applied_min_degree"] = applied_min_degree;
    j["primary_count"] = primary_count;
    j["size"] = members.size();

    nlohmann::json members_json = nlohmann::json::array();
    for (const auto& node : members) {
        members_json.push_back(node.to_json());
    }
    j["members"] = members_json;

    nlohmann::json warnings_json = nlohmann::json::array();
    for (const auto& w : warnings) {
        warnings_json.push_back(w.to_json());
    }
    j["warnings"] = warnings_json;
    return j;
}

RiskClassifier::RiskClassifier(int relaxed_min_degree)
    : relaxed_min_degree_(relaxed_min_degree) {}

std::vector<NetworkNode> RiskClassifier::select(
    const std::vector<NetworkNode>& nodes,
    int min_degree
) {
    std::vector<NetworkNode> selected;
    std::copy_if(nodes.begin(), nodes.end(), std::back_inserter(selected),
                 [min_degree](const NetworkNode& n) { return n.degree >= min_degree; });
    return selected;
}

RiskSubset RiskClassifier::classify(
    const std::vector<NetworkNode>& nodes,
    int min_degree,
    size_t required_count
) const {
    RiskSubset subset;
    subset.requested_min_degree = min_degree;

    auto primary = select(nodes, min_degree);
    subset.primary_count = primary.size();

    if (primary.size() >= required_count) {
        subset.members = std::move(primary);
        subset.tier = RiskTier::Primary;
        subset.applied_min_degree = min_degree;
        return subset;
    }

    DegenerateClusterWarning warning;
    warning.cause = DegenerateClusterWarning::Cause::ThresholdFallback;

    auto relaxed = select(nodes, relaxed_min_degree_);
    if (relaxed.size() >= required_count) {
        warning.message = "Only " + std::to_string(subset.primary_count) +
                          " intersections with degree >= " + std::to_string(min_degree) +
                          " (need " + std::to_string(required_count) +
                          "); including nodes with degree >= " +
                          std::to_string(relaxed_min_degree_);
        subset.members = std::move(relaxed);
        subset.tier = RiskTier::Relaxed;
        subset.applied_min_degree = relaxed_min_degree_;
    } else {
        warning.message = "Only " + std::to_string(relaxed.size()) +
                          " intersections with degree >= " +
                          std::to_string(relaxed_min_degree_) +
                          " (need " + std::to_string(required_count) +
                          "); using all " + std::to_string(nodes.size()) + " network nodes";
        subset.members = nodes;
        subset.tier = RiskTier::FullNetwork;
        subset.applied_min_degree = 0;
    }

    subset.warnings.push_back(warning);
    return subset;
}

} // namespace gho
