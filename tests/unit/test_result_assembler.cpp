#include <gtest/gtest.h>
#include "network/geo.hpp"
#include "result/optimization_result.hpp"
#include <cstdio>
#include <fstream>

using namespace gho;

class ResultAssemblerTest : public ::testing::Test {
protected:
    RiskSubset subset;
    std::vector<Hub> hubs;

    void SetUp() override {
        auto add = [this](const std::string& id, double lat, double lon) {
            NetworkNode node;
            node.id = id;
            node.lat = lat;
            node.lon = lon;
            node.degree = 4;
            subset.members.push_back(node);
        };
        add("a", 12.9300, 77.6200);
        add("b", 12.9302, 77.6200);
        add("c", 12.9500, 77.6400);
        subset.tier = RiskTier::Primary;
        subset.requested_min_degree = 4;
        subset.applied_min_degree = 4;
        subset.primary_count = 3;

        hubs.push_back({1, 12.9301, 77.6200});
        hubs.push_back({2, 12.9500, 77.6400});
    }
};

// ==========================================
// Assembly Tests
// ==========================================

TEST_F(ResultAssemblerTest, SummaryCounts) {
    OptimizationResult result = ResultAssembler::assemble(subset, hubs, 250);
    EXPECT_EQ(result.network_size, 250);
    EXPECT_EQ(result.risk_subset_size, 3);
    EXPECT_EQ(result.hub_count, 2);
    EXPECT_EQ(result.subset.size(), 3);
}

TEST_F(ResultAssemblerTest, HubOrderIsPreserved) {
    std::vector<Hub> reversed = {hubs[1], hubs[0]};
    OptimizationResult result = ResultAssembler::assemble(subset, reversed, 10);
    ASSERT_EQ(result.hubs.size(), 2);
    EXPECT_EQ(result.hubs[0].index, 2);
    EXPECT_EQ(result.hubs[1].index, 1);
}

TEST_F(ResultAssemblerTest, CarriesClassifierWarnings) {
    DegenerateClusterWarning w;
    w.cause = DegenerateClusterWarning::Cause::ThresholdFallback;
    w.message = "relaxed";
    subset.warnings.push_back(w);

    OptimizationResult result = ResultAssembler::assemble(subset, hubs, 10);
    ASSERT_EQ(result.warnings.size(), 1);
    EXPECT_EQ(result.warnings[0].message, "relaxed");
}

// ==========================================
// Formatting Tests
// ==========================================

TEST_F(ResultAssemblerTest, UnitLines) {
    OptimizationResult result = ResultAssembler::assemble(subset, hubs, 10);
    EXPECT_EQ(result.format_unit_lines(),
              "Unit 1: 12.930100, 77.620000\n"
              "Unit 2: 12.950000, 77.640000");
}

TEST_F(ResultAssemblerTest, HubLines) {
    OptimizationResult result = ResultAssembler::assemble(subset, hubs, 10);
    EXPECT_EQ(result.format_hub_lines(),
              "  Hub 1: 12.930100, 77.620000\n"
              "  Hub 2: 12.950000, 77.640000\n");
}

TEST(ResultFormattingTest, NegativeCoordinatesAndRounding) {
    OptimizationResult result;
    result.hubs.push_back({1, -33.8688197, 151.2092957});
    EXPECT_EQ(result.format_unit_lines(), "Unit 1: -33.868820, 151.209296");
}

TEST(ResultFormattingTest, NoHubsGivesEmptyText) {
    OptimizationResult result;
    EXPECT_EQ(result.format_unit_lines(), "");
    EXPECT_EQ(result.format_hub_lines(), "");
}

// ==========================================
// Coverage Tests
// ==========================================

TEST_F(ResultAssemblerTest, CoverageAssignsNearestHub) {
    auto coverage = compute_hub_coverage(subset, hubs);
    ASSERT_EQ(coverage.size(), 2);

    EXPECT_EQ(coverage[0].hub_index, 1);
    EXPECT_EQ(coverage[0].assigned_nodes, 2);
    double expected = geo::haversine_m(12.9300, 77.6200, 12.9301, 77.6200);
    EXPECT_NEAR(coverage[0].mean_distance_m, expected, 1e-6);
    EXPECT_NEAR(coverage[0].max_distance_m, expected, 1e-3);

    EXPECT_EQ(coverage[1].hub_index, 2);
    EXPECT_EQ(coverage[1].assigned_nodes, 1);
    EXPECT_NEAR(coverage[1].max_distance_m, 0.0, 1e-9);
}

TEST_F(ResultAssemblerTest, CoverageOfUnusedHub) {
    hubs.push_back({3, 0.0, 0.0});
    auto coverage = compute_hub_coverage(subset, hubs);
    ASSERT_EQ(coverage.size(), 3);
    EXPECT_EQ(coverage[2].assigned_nodes, 0);
    EXPECT_DOUBLE_EQ(coverage[2].mean_distance_m, 0.0);
}

// ==========================================
// Serialization Tests
// ==========================================

TEST_F(ResultAssemblerTest, ToJson) {
    OptimizationResult result = ResultAssembler::assemble(subset, hubs, 42);
    result.coverage = compute_hub_coverage(subset, hubs);
    result.snapshot_id = "file:abc";
    result.place_name = "Koramangala";

    auto j = result.to_json();
    EXPECT_EQ(j["snapshot_id"], "file:abc");
    EXPECT_EQ(j["summary"]["network_size"], 42);
    EXPECT_EQ(j["summary"]["risk_subset_size"], 3);
    EXPECT_EQ(j["summary"]["hub_count"], 2);
    EXPECT_EQ(j["hubs"].size(), 2u);
    EXPECT_EQ(j["coverage"].size(), 2u);
    EXPECT_EQ(j["risk_subset"]["tier"], "primary");
}

TEST_F(ResultAssemblerTest, SaveToJson) {
    OptimizationResult result = ResultAssembler::assemble(subset, hubs, 42);
    std::string path = ::testing::TempDir() + "gho_result.json";
    result.save_to_json(path);

    std::ifstream in(path);
    ASSERT_TRUE(in.is_open());
    auto j = nlohmann::json::parse(in);
    EXPECT_EQ(j["hubs"][1]["index"], 2);
    std::remove(path.c_str());
}

TEST_F(ResultAssemblerTest, SaveToUnwritablePathThrows) {
    OptimizationResult result = ResultAssembler::assemble(subset, hubs, 42);
    EXPECT_THROW(result.save_to_json("/nonexistent/dir/result.json"), std::runtime_error);
}
