#include <gtest/gtest.h>
#include "pipeline/optimization_pipeline.hpp"
#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <fstream>

using namespace gho;

namespace {

// Grid of rows x cols intersections; interior nodes have four streets
RoadNetwork make_grid(int rows, int cols) {
    RoadNetwork network;
    network.place_name = "Test grid";
    auto id = [cols](int r, int c) { return std::to_string(r * cols + c); };
    for (int r = 0; r < rows; ++r) {
        for (int c = 0; c < cols; ++c) {
            NetworkNode node;
            node.id = id(r, c);
            node.lat = 12.93 + r * 0.001;
            node.lon = 77.62 + c * 0.001;
            network.add_node(node);
        }
    }
    for (int r = 0; r < rows; ++r) {
        for (int c = 0; c < cols; ++c) {
            if (c + 1 < cols) network.add_edge({id(r, c), id(r, c + 1), "", "residential", 110.0});
            if (r + 1 < rows) network.add_edge({id(r, c), id(r + 1, c), "", "residential", 110.0});
        }
    }
    network.compute_degrees_from_edges();
    return network;
}

// Serves a fixed network and counts calls
class FakeProvider : public NetworkProvider {
public:
    FakeProvider(RoadNetwork network, int* calls) : network_(std::move(network)), calls_(calls) {}

    RoadNetwork fetch(const NetworkQuery& query) override {
        (*calls_)++;
        last_query_ = query.describe();
        return network_;
    }

    std::string get_provider_name() const override { return "fake"; }

    std::string last_query_;

private:
    RoadNetwork network_;
    int* calls_;
};

class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : name_(name) {
        setenv(name, value, 1);
    }
    ~ScopedEnv() { unsetenv(name_); }

private:
    const char* name_;
};

} // anonymous namespace

// ==========================================
// RunConfig Tests
// ==========================================

TEST(RunConfigTest, DefaultsValidate) {
    RunConfig config;
    std::string error;
    EXPECT_TRUE(config.validate(error)) << error;
    EXPECT_EQ(config.mode, "city");
    EXPECT_EQ(config.n_facilities, 5);
    EXPECT_EQ(config.min_degree, 4);
    EXPECT_EQ(config.seed, 42u);
}

TEST(RunConfigTest, HighwayPreset) {
    RunConfig config;
    config.mode = "highway";
    config.apply_mode_defaults();
    EXPECT_TRUE(config.is_highway());
    EXPECT_EQ(config.min_degree, 3);
    EXPECT_EQ(config.search_radius_m, 5000);
    EXPECT_DOUBLE_EQ(config.center_lat, 28.2378);
    EXPECT_DOUBLE_EQ(config.center_lon, 77.0697);
    EXPECT_EQ(config.to_query().mode, NetworkQuery::Mode::Point);
}

TEST(RunConfigTest, ValidationFailures) {
    std::string error;

    RunConfig bad_mode;
    bad_mode.mode = "rural";
    EXPECT_FALSE(bad_mode.validate(error));

    RunConfig no_units;
    no_units.n_facilities = 0;
    EXPECT_FALSE(no_units.validate(error));

    RunConfig missing_file;
    missing_file.provider = "file";
    EXPECT_FALSE(missing_file.validate(error));

    RunConfig bad_center;
    bad_center.center_lat = 95.0;
    EXPECT_FALSE(bad_center.validate(error));

    RunConfig bad_restarts;
    bad_restarts.n_init = 0;
    EXPECT_FALSE(bad_restarts.validate(error));

    RunConfig bad_radius;
    bad_radius.search_radius_m = 0;
    EXPECT_FALSE(bad_radius.validate(error));
}

TEST(RunConfigTest, OutOfRangeValuesAreAdvisory) {
    RunConfig config;
    config.n_facilities = 25;
    config.min_degree = 8;
    std::string error;
    EXPECT_TRUE(config.validate(error));
    EXPECT_EQ(config.range_notes().size(), 2u);
}

TEST(RunConfigTest, JsonFileRoundTrip) {
    RunConfig config;
    config.place_name = "Indiranagar, Bengaluru";
    config.n_facilities = 8;
    config.seed = 7;
    config.parallel_restarts = true;

    std::string path = ::testing::TempDir() + "gho_config.json";
    config.to_json_file(path);
    RunConfig loaded = RunConfig::from_json_file(path);
    std::remove(path.c_str());

    EXPECT_EQ(loaded.place_name, "Indiranagar, Bengaluru");
    EXPECT_EQ(loaded.n_facilities, 8);
    EXPECT_EQ(loaded.seed, 7u);
    EXPECT_TRUE(loaded.parallel_restarts);
}

TEST(RunConfigTest, JsonAcceptsShortNames) {
    auto j = nlohmann::json::parse(R"({"mode": "highway", "n_ambulances": 3, "risk_threshold": 2})");
    RunConfig config = RunConfig::from_json(j);
    EXPECT_EQ(config.n_facilities, 3);
    EXPECT_EQ(config.min_degree, 2);
    EXPECT_EQ(config.search_radius_m, 5000);
}

TEST(RunConfigTest, JsonRejectsNegativeOrFractionalSeed) {
    EXPECT_THROW(RunConfig::from_json(nlohmann::json::parse(R"({"seed": -1})")),
                 std::invalid_argument);
    EXPECT_THROW(RunConfig::from_json(nlohmann::json::parse(R"({"seed": 1.5})")),
                 std::invalid_argument);
    EXPECT_EQ(RunConfig::from_json(nlohmann::json::parse(R"({"seed": 9})")).seed, 9u);
}

TEST(RunConfigTest, MalformedFileThrows) {
    std::string path = ::testing::TempDir() + "gho_bad_config.json";
    {
        std::ofstream out(path);
        out << "{\"n_facilities\": ";
    }
    EXPECT_THROW(RunConfig::from_json_file(path), std::runtime_error);

    {
        std::ofstream out(path);
        out << "{\"n_facilities\": \"five\"}";
    }
    EXPECT_THROW(RunConfig::from_json_file(path), std::invalid_argument);
    std::remove(path.c_str());

    EXPECT_THROW(RunConfig::from_json_file("/nonexistent/gho.json"), std::runtime_error);
}

TEST(RunConfigTest, FromEnvironment) {
    ScopedEnv place("GHO_PLACE", "HSR Layout, Bengaluru");
    ScopedEnv units("GHO_UNITS", "9");
    ScopedEnv seed("GHO_SEED", "123");

    RunConfig config = RunConfig::from_environment();
    EXPECT_EQ(config.place_name, "HSR Layout, Bengaluru");
    EXPECT_EQ(config.n_facilities, 9);
    EXPECT_EQ(config.seed, 123u);
}

TEST(RunConfigTest, FromEnvironmentRejectsGarbage) {
    ScopedEnv units("GHO_UNITS", "many");
    EXPECT_THROW(RunConfig::from_environment(), std::invalid_argument);
}

TEST(RunConfigTest, FromEnvironmentRejectsNegativeSeed) {
    ScopedEnv seed("GHO_SEED", "-1");
    EXPECT_THROW(RunConfig::from_environment(), std::invalid_argument);
}

// ==========================================
// ResultCache Tests
// ==========================================

TEST(ResultCacheTest, FindAndStore) {
    ResultCache cache;
    RunKey key{"snap", 4, 5, 42};
    EXPECT_EQ(cache.find(key), nullptr);

    auto result = std::make_shared<const OptimizationResult>();
    cache.store(key, result);
    EXPECT_EQ(cache.find(key), result);
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_EQ(cache.hits(), 1u);
    EXPECT_EQ(cache.misses(), 1u);

    RunKey other_seed{"snap", 4, 5, 43};
    EXPECT_EQ(cache.find(other_seed), nullptr);

    cache.clear();
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_EQ(cache.hits(), 0u);
}

// ==========================================
// Pipeline Tests
// ==========================================

class OptimizationPipelineTest : public ::testing::Test {
protected:
    RunConfig config;
    int fetch_calls = 0;

    void SetUp() override {
        config.verbose = false;
        config.n_facilities = 3;
        config.min_degree = 4;
    }

    std::unique_ptr<OptimizationPipeline> make_pipeline(const RoadNetwork& network) {
        auto pipeline = std::make_unique<OptimizationPipeline>(config);
        pipeline->set_provider(std::make_unique<FakeProvider>(network, &fetch_calls));
        return pipeline;
    }
};

TEST_F(OptimizationPipelineTest, InvalidConfigThrows) {
    config.n_facilities = 0;
    EXPECT_THROW(OptimizationPipeline{config}, std::invalid_argument);
}

TEST_F(OptimizationPipelineTest, RunProducesRequestedHubs) {
    auto pipeline = make_pipeline(make_grid(6, 6));
    auto result = pipeline->run();

    EXPECT_EQ(fetch_calls, 1);
    EXPECT_EQ(result->network_size, 36);
    EXPECT_EQ(result->risk_subset_size, 16);   // 4x4 interior
    EXPECT_EQ(result->hub_count, 3);
    EXPECT_EQ(result->coverage.size(), 3u);
    EXPECT_EQ(result->subset.tier, RiskTier::Primary);
    EXPECT_TRUE(result->warnings.empty());
    EXPECT_EQ(result->place_name, "Test grid");

    size_t covered = 0;
    for (const auto& c : result->coverage) covered += c.assigned_nodes;
    EXPECT_EQ(covered, 16u);
}

TEST_F(OptimizationPipelineTest, SecondRunIsServedFromCache) {
    RoadNetwork network = make_grid(6, 6);
    auto pipeline = make_pipeline(network);

    auto first = pipeline->run(network);
    auto second = pipeline->run(network);
    EXPECT_EQ(first, second);
    EXPECT_EQ(pipeline->get_statistics().runs, 1);
    EXPECT_EQ(pipeline->get_statistics().cache_hits, 1);

    auto other_seed = pipeline->run(network, 4, 3, 7);
    EXPECT_NE(other_seed, first);
    EXPECT_EQ(pipeline->cache().size(), 2u);
}

TEST_F(OptimizationPipelineTest, SharedSnapshotIdDoesNotShareCacheEntry) {
    RoadNetwork a;
    a.add_node({"a", 0.0, 0.0, 4});
    a.snapshot_id = "overpass:place:Same";
    RoadNetwork b;
    b.add_node({"b", 10.0, 10.0, 4});
    b.add_node({"c", 10.0, 10.0, 4});
    b.snapshot_id = "overpass:place:Same";

    auto pipeline = make_pipeline(a);
    auto first = pipeline->run(a, 4, 1, 42);
    auto second = pipeline->run(b, 4, 1, 42);

    EXPECT_NE(first, second);
    EXPECT_EQ(pipeline->get_statistics().cache_hits, 0);
    EXPECT_DOUBLE_EQ(second->hubs[0].lat, 10.0);
    EXPECT_EQ(second->network_size, 2);
    EXPECT_EQ(pipeline->cache().size(), 2u);
}

TEST_F(OptimizationPipelineTest, FallbackWarningReachesResult) {
    RoadNetwork network = make_grid(3, 3);   // one interior node
    auto pipeline = make_pipeline(network);

    auto result = pipeline->run(network, 4, 3, 42);
    EXPECT_EQ(result->subset.tier, RiskTier::Relaxed);
    ASSERT_FALSE(result->warnings.empty());
    EXPECT_EQ(result->warnings[0].cause, DegenerateClusterWarning::Cause::ThresholdFallback);
}

TEST_F(OptimizationPipelineTest, InsufficientSamplesPropagatesAndIsNotCached) {
    RoadNetwork network = make_grid(2, 2);
    auto pipeline = make_pipeline(network);

    EXPECT_THROW(pipeline->run(network, 4, 5, 42), InsufficientSamplesError);
    EXPECT_EQ(pipeline->cache().size(), 0u);
    EXPECT_EQ(pipeline->get_statistics().failures, 1);
}

TEST_F(OptimizationPipelineTest, SameInputsSameHubs) {
    RoadNetwork network = make_grid(8, 8);
    auto a = make_pipeline(network)->run(network);
    auto b = make_pipeline(network)->run(network);
    ASSERT_EQ(a->hubs.size(), b->hubs.size());
    for (size_t i = 0; i < a->hubs.size(); ++i) {
        EXPECT_EQ(a->hubs[i].lat, b->hubs[i].lat);
        EXPECT_EQ(a->hubs[i].lon, b->hubs[i].lon);
    }
}

TEST_F(OptimizationPipelineTest, ProgressCallbackReportsStages) {
    RoadNetwork network = make_grid(5, 5);
    auto pipeline = make_pipeline(network);

    std::vector<std::string> stages;
    pipeline->set_progress_callback([&stages](const std::string& stage, int, int, const std::string&) {
        stages.push_back(stage);
    });
    pipeline->run();

    EXPECT_NE(std::find(stages.begin(), stages.end(), "Downloading"), stages.end());
    EXPECT_NE(std::find(stages.begin(), stages.end(), "Classifying"), stages.end());
    EXPECT_NE(std::find(stages.begin(), stages.end(), "Optimizing"), stages.end());
    EXPECT_NE(std::find(stages.begin(), stages.end(), "Assembling"), stages.end());
}

TEST_F(OptimizationPipelineTest, NullProviderRejected) {
    OptimizationPipeline pipeline(config);
    EXPECT_THROW(pipeline.set_provider(nullptr), std::invalid_argument);
}

TEST_F(OptimizationPipelineTest, FileProviderLoadsSnapshot) {
    RoadNetwork network = make_grid(4, 4);
    std::string path = ::testing::TempDir() + "gho_pipeline_snapshot.json";
    network.save_to_json(path);

    config.provider = "file";
    config.network_file = path;
    OptimizationPipeline pipeline(config);
    auto result = pipeline.run(pipeline.load_network(), 4, 2, 42);
    std::remove(path.c_str());

    EXPECT_EQ(result->network_size, 16);
    EXPECT_EQ(result->hub_count, 2);
    EXPECT_EQ(result->snapshot_id.rfind("file:", 0), 0u);
}

TEST_F(OptimizationPipelineTest, StatisticsJson) {
    RoadNetwork network = make_grid(5, 5);
    auto pipeline = make_pipeline(network);
    pipeline->run(network);

    auto j = pipeline->get_statistics().to_json();
    EXPECT_EQ(j["runs"], 1);
    EXPECT_EQ(j["last_hub_count"], 3);

    pipeline->reset_statistics();
    EXPECT_EQ(pipeline->get_statistics().runs, 0);
}
