#include <gtest/gtest.h>
#include "risk/risk_classifier.hpp"

using namespace gho;

namespace {

NetworkNode node_with_degree(const std::string& id, int degree, double lat = 0.0, double lon = 0.0) {
    NetworkNode node;
    node.id = id;
    node.lat = lat;
    node.lon = lon;
    node.degree = degree;
    return node;
}

} // anonymous namespace

class RiskClassifierTest : public ::testing::Test {
protected:
    RiskClassifier classifier;
    std::vector<NetworkNode> nodes;

    void SetUp() override {
        // Degrees in ingestion order: 4 1 3 5 2 4 1 3
        int degrees[] = {4, 1, 3, 5, 2, 4, 1, 3};
        for (int i = 0; i < 8; ++i) {
            nodes.push_back(node_with_degree("n" + std::to_string(i), degrees[i], i * 0.001, 0.0));
        }
    }

    static std::vector<std::string> ids(const RiskSubset& subset) {
        std::vector<std::string> out;
        for (const auto& n : subset.members) out.push_back(n.id);
        return out;
    }
};

// ==========================================
// Selection Tests
// ==========================================

TEST_F(RiskClassifierTest, SelectPreservesInputOrder) {
    auto selected = RiskClassifier::select(nodes, 4);
    ASSERT_EQ(selected.size(), 3);
    EXPECT_EQ(selected[0].id, "n0");
    EXPECT_EQ(selected[1].id, "n3");
    EXPECT_EQ(selected[2].id, "n5");
}

TEST_F(RiskClassifierTest, SelectIsMonotoneInThreshold) {
    for (int d = 0; d < 7; ++d) {
        auto looser = RiskClassifier::select(nodes, d);
        auto stricter = RiskClassifier::select(nodes, d + 1);
        EXPECT_GE(looser.size(), stricter.size());
        // Every stricter member appears in the looser set
        for (const auto& s : stricter) {
            bool found = false;
            for (const auto& l : looser) {
                if (l.id == s.id) found = true;
            }
            EXPECT_TRUE(found) << s.id << " missing at threshold " << d;
        }
    }
}

TEST_F(RiskClassifierTest, ThresholdAboveMaxDegreeSelectsNothing) {
    EXPECT_TRUE(RiskClassifier::select(nodes, 6).empty());
}

// ==========================================
// Fallback Ladder Tests
// ==========================================

TEST_F(RiskClassifierTest, PrimaryTierWhenEnoughCandidates) {
    RiskSubset subset = classifier.classify(nodes, 4, 3);
    EXPECT_EQ(subset.tier, RiskTier::Primary);
    EXPECT_FALSE(subset.fell_back());
    EXPECT_EQ(subset.applied_min_degree, 4);
    EXPECT_EQ(subset.requested_min_degree, 4);
    EXPECT_EQ(subset.primary_count, 3);
    EXPECT_TRUE(subset.warnings.empty());
    EXPECT_EQ(ids(subset), (std::vector<std::string>{"n0", "n3", "n5"}));
}

TEST_F(RiskClassifierTest, RelaxedTierWhenPrimaryTooSmall) {
    RiskSubset subset = classifier.classify(nodes, 4, 5);
    EXPECT_EQ(subset.tier, RiskTier::Relaxed);
    EXPECT_EQ(subset.applied_min_degree, kRelaxedMinDegree);
    EXPECT_EQ(subset.primary_count, 3);
    EXPECT_EQ(ids(subset), (std::vector<std::string>{"n0", "n2", "n3", "n4", "n5", "n7"}));

    ASSERT_EQ(subset.warnings.size(), 1);
    EXPECT_EQ(subset.warnings[0].cause, DegenerateClusterWarning::Cause::ThresholdFallback);
    EXPECT_FALSE(subset.warnings[0].message.empty());
}

TEST_F(RiskClassifierTest, FullNetworkWhenRelaxedTooSmall) {
    RiskSubset subset = classifier.classify(nodes, 4, 7);
    EXPECT_EQ(subset.tier, RiskTier::FullNetwork);
    EXPECT_EQ(subset.applied_min_degree, 0);
    EXPECT_EQ(subset.size(), nodes.size());
    EXPECT_EQ(ids(subset).front(), "n0");
    EXPECT_EQ(ids(subset).back(), "n7");
    ASSERT_EQ(subset.warnings.size(), 1);
    EXPECT_EQ(subset.warnings[0].cause, DegenerateClusterWarning::Cause::ThresholdFallback);
}

TEST_F(RiskClassifierTest, FullNetworkMayStillBeTooSmall) {
    // The classifier never fails; the optimizer reports the shortfall
    RiskSubset subset = classifier.classify(nodes, 4, 20);
    EXPECT_EQ(subset.tier, RiskTier::FullNetwork);
    EXPECT_EQ(subset.size(), 8);
}

TEST_F(RiskClassifierTest, ExactlyRequiredCountStaysPrimary) {
    RiskSubset subset = classifier.classify(nodes, 5, 1);
    EXPECT_EQ(subset.tier, RiskTier::Primary);
    EXPECT_EQ(ids(subset), (std::vector<std::string>{"n3"}));
}

TEST_F(RiskClassifierTest, RelaxedThresholdIsIndependentOfRequest) {
    // A request already below the relaxed threshold still falls back to 2
    RiskSubset subset = classifier.classify(nodes, 6, 2);
    EXPECT_EQ(subset.tier, RiskTier::Relaxed);
    EXPECT_EQ(subset.applied_min_degree, 2);
}

TEST_F(RiskClassifierTest, CustomRelaxedThreshold) {
    RiskClassifier strict(3);
    RiskSubset subset = strict.classify(nodes, 5, 4);
    EXPECT_EQ(subset.tier, RiskTier::Relaxed);
    EXPECT_EQ(subset.applied_min_degree, 3);
    EXPECT_EQ(subset.size(), 5);
}

TEST_F(RiskClassifierTest, Deterministic) {
    RiskSubset a = classifier.classify(nodes, 3, 4);
    RiskSubset b = classifier.classify(nodes, 3, 4);
    EXPECT_EQ(ids(a), ids(b));
    EXPECT_EQ(a.tier, b.tier);
}

TEST_F(RiskClassifierTest, EmptyNetwork) {
    RiskSubset subset = classifier.classify({}, 4, 1);
    EXPECT_TRUE(subset.empty());
    EXPECT_EQ(subset.tier, RiskTier::FullNetwork);
}

// ==========================================
// Sample Flattening Tests
// ==========================================

TEST_F(RiskClassifierTest, SamplesFollowMemberOrder) {
    RiskSubset subset = classifier.classify(nodes, 4, 1);
    auto samples = subset.samples();
    ASSERT_EQ(samples.size(), subset.size());
    for (size_t i = 0; i < samples.size(); ++i) {
        EXPECT_DOUBLE_EQ(samples[i].lat, subset.members[i].lat);
        EXPECT_DOUBLE_EQ(samples[i].lon, subset.members[i].lon);
    }
}

TEST_F(RiskClassifierTest, ToJson) {
    RiskSubset subset = classifier.classify(nodes, 4, 5);
    auto j = subset.to_json();
    EXPECT_EQ(j["tier"], "relaxed");
    EXPECT_EQ(j["size"], 6);
    EXPECT_EQ(j["members"].size(), 6);
    EXPECT_EQ(j["warnings"][0]["cause"], "threshold_fallback");
}

TEST(RiskTierTest, Names) {
    EXPECT_EQ(risk_tier_to_string(RiskTier::Primary), "primary");
    EXPECT_EQ(risk_tier_to_string(RiskTier::Relaxed), "relaxed");
    EXPECT_EQ(risk_tier_to_string(RiskTier::FullNetwork), "full_network");
}

// ==========================================
// Warning Serialization Tests
// ==========================================

TEST(DegenerateClusterWarningTest, CauseNames) {
    using Cause = DegenerateClusterWarning::Cause;
    EXPECT_EQ(warning_cause_to_string(Cause::ThresholdFallback), "threshold_fallback");
    EXPECT_EQ(warning_cause_to_string(Cause::DuplicateHubs), "duplicate_hubs");
    EXPECT_EQ(warning_cause_from_string("duplicate_hubs"), Cause::DuplicateHubs);
    EXPECT_THROW(warning_cause_from_string("meteor_strike"), std::invalid_argument);
}

TEST(DegenerateClusterWarningTest, JsonRoundTrip) {
    DegenerateClusterWarning w;
    w.cause = DegenerateClusterWarning::Cause::DuplicateHubs;
    w.message = "Hubs 1 and 2 converged";
    auto restored = DegenerateClusterWarning::from_json(w.to_json());
    EXPECT_EQ(restored.cause, w.cause);
    EXPECT_EQ(restored.message, w.message);
}
