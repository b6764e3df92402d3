#pragma once

#include "core/errors.hpp"
#include "network/road_network.hpp"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace gho {

/**
 * @brief Secondary degree threshold used when the requested one under-qualifies
 *
 * Fixed, independent of the caller's threshold.
 */
constexpr int kRelaxedMinDegree = 2;

/**
 * @brief Flattened (latitude, longitude) pair used as clustering input
 */
struct CoordinateSample {
    double lat = 0.0;
    double lon = 0.0;
};

/**
 * @brief Rung of the fallback ladder that produced a risk subset
 */
enum class RiskTier {
    Primary,        // degree >= requested threshold
    Relaxed,        // degree >= kRelaxedMinDegree
    FullNetwork     // every node, unfiltered
};

std::string risk_tier_to_string(RiskTier tier);

/**
 * @brief Ordered selection of high-risk intersections for one optimization run
 *
 * Members keep the ingestion order of the network they came from.
 */
struct RiskSubset {
    std::vector<NetworkNode> members;
    RiskTier tier = RiskTier::Primary;
    int requested_min_degree = 0;          // Threshold the caller asked for
    int applied_min_degree = 0;            // Threshold actually used (0 for FullNetwork)
    size_t primary_count = 0;              // Size of the primary candidate set
    std::vector<DegenerateClusterWarning> warnings;

    size_t size() const { return members.size(); }
    bool empty() const { return members.empty(); }
    bool fell_back() const { return tier != RiskTier::Primary; }

    /**
     * @brief Coordinates of the members, in member order
     */
    std::vector<CoordinateSample> samples() const;

    nlohmann::json to_json() const;
};

/**
 * @brief Filters network nodes into a high-risk subset
 *
 * Applies a fixed-priority fallback ladder:
 *   1. degree >= min_degree, if that yields at least required_count nodes
 *   2. degree >= relaxed threshold, if that yields at least required_count nodes
 *   3. the whole node sequence
 * Rungs 2 and 3 attach a ThresholdFallback warning. Deterministic; selection
 * preserves input order.
 */
class RiskClassifier {
public:
    explicit RiskClassifier(int relaxed_min_degree = kRelaxedMinDegree);

    RiskSubset classify(
        const std::vector<NetworkNode>& nodes,
        int min_degree,
        size_t required_count
    ) const;

    /**
     * @brief All nodes with degree >= min_degree, in input order
     */
    static std::vector<NetworkNode> select(
        const std::vector<NetworkNode>& nodes,
        int min_degree
    );

    int relaxed_min_degree() const { return relaxed_min_degree_; }

private:
    int relaxed_min_degree_;
};

} // namespace gho
