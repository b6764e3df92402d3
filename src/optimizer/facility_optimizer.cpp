#include "optimizer/facility_optimizer.hpp"
#include <algorithm>
#include <cmath>
#include <future>
#include <limits>
#include <numeric>
#include <random>
#include <sstream>
#include <iomanip>
#include <stdexcept>

namespace gho {

namespace {

struct RestartResult {
    std::vector<CoordinateSample> centroids;
    std::vector<int> labels;
    double inertia = 0.0;
    int iterations = 0;
    bool converged = false;
    std::vector<double> history;
};

inline double squared_distance(const CoordinateSample& a, const CoordinateSample& b) {
    double dlat = a.lat - b.lat;
    double dlon = a.lon - b.lon;
    return dlat * dlat + dlon * dlon;
}

double inertia_of(
    const std::vector<CoordinateSample>& samples,
    const std::vector<int>& labels,
    const std::vector<CoordinateSample>& centroids
) {
    double total = 0.0;
    for (size_t i = 0; i < samples.size(); ++i) {
        total += squared_distance(samples[i], centroids[labels[i]]);
    }
    return total;
}

// Greedy k-means++ seeding: each new center is the best of a few
// D^2-weighted candidates
std::vector<CoordinateSample> seed_centroids(
    const std::vector<CoordinateSample>& samples,
    int k,
    std::mt19937_64& rng
) {
    const size_t n = samples.size();
    const int n_local_trials = 2 + static_cast<int>(std::log(static_cast<double>(k)));

    std::vector<CoordinateSample> centers;
    centers.reserve(k);

    std::uniform_int_distribution<size_t> pick(0, n - 1);
    centers.push_back(samples[pick(rng)]);

    std::vector<double> closest(n);
    for (size_t i = 0; i < n; ++i) {
        closest[i] = squared_distance(samples[i], centers[0]);
    }
    double potential = std::accumulate(closest.begin(), closest.end(), 0.0);

    std::vector<double> candidate_dist(n);
    std::vector<double> best_dist(n);

    for (int c = 1; c < k; ++c) {
        if (potential <= 0.0) {
            // Every sample already sits on a center
            centers.push_back(samples[pick(rng)]);
            continue;
        }

        size_t best_candidate = 0;
        double best_potential = std::numeric_limits<double>::infinity();

        for (int t = 0; t < n_local_trials; ++t) {
            std::uniform_real_distribution<double> draw(0.0, potential);
            double r = draw(rng);

            size_t candidate = n - 1;
            double acc = 0.0;
            for (size_t i = 0; i < n; ++i) {
                acc += closest[i];
                if (acc > r) {
                    candidate = i;
                    break;
                }
            }

            double new_potential = 0.0;
            for (size_t i = 0; i < n; ++i) {
                candidate_dist[i] = std::min(closest[i], squared_distance(samples[i], samples[candidate]));
                new_potential += candidate_dist[i];
            }

            if (new_potential < best_potential) {
                best_potential = new_potential;
                best_candidate = candidate;
                best_dist.swap(candidate_dist);
            }
        }

        centers.push_back(samples[best_candidate]);
        closest = best_dist;
        potential = best_potential;
    }

    return centers;
}

// Nearest-centroid assignment; ties go to the lowest cluster index
bool assign_labels(
    const std::vector<CoordinateSample>& samples,
    const std::vector<CoordinateSample>& centroids,
    std::vector<int>& labels
) {
    bool changed = false;
    for (size_t i = 0; i < samples.size(); ++i) {
        int best = 0;
        double best_d = squared_distance(samples[i], centroids[0]);
        for (size_t c = 1; c < centroids.size(); ++c) {
            double d = squared_distance(samples[i], centroids[c]);
            if (d < best_d) {
                best_d = d;
                best = static_cast<int>(c);
            }
        }
        if (labels[i] != best) {
            labels[i] = best;
            changed = true;
        }
    }
    return changed;
}

void update_centroids(
    const std::vector<CoordinateSample>& samples,
    const std::vector<int>& labels,
    std::vector<CoordinateSample>& centroids
) {
    const size_t k = centroids.size();
    std::vector<double> sum_lat(k, 0.0);
    std::vector<double> sum_lon(k, 0.0);
    std::vector<size_t> counts(k, 0);

    for (size_t i = 0; i < samples.size(); ++i) {
        sum_lat[labels[i]] += samples[i].lat;
        sum_lon[labels[i]] += samples[i].lon;
        counts[labels[i]]++;
    }

    std::vector<size_t> empty;
    std::vector<CoordinateSample> previous = centroids;
    for (size_t c = 0; c < k; ++c) {
        if (counts[c] == 0) {
            empty.push_back(c);
            continue;
        }
        centroids[c].lat = sum_lat[c] / counts[c];
        centroids[c].lon = sum_lon[c] / counts[c];
    }

    if (empty.empty()) return;

    // Re-seed empty clusters at the samples farthest from their centroid
    std::vector<size_t> order(samples.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        return squared_distance(samples[a], previous[labels[a]]) >
               squared_distance(samples[b], previous[labels[b]]);
    });

    for (size_t j = 0; j < empty.size(); ++j) {
        centroids[empty[j]] = samples[order[j % order.size()]];
    }
}

RestartResult run_restart(
    const std::vector<CoordinateSample>& samples,
    int k,
    int max_iter,
    uint64_t restart_seed
) {
    std::mt19937_64 rng(restart_seed);

    RestartResult result;
    result.centroids = seed_centroids(samples, k, rng);
    result.labels.assign(samples.size(), -1);

    for (int iter = 0; iter < max_iter; ++iter) {
        if (!assign_labels(samples, result.centroids, result.labels)) {
            result.converged = true;
            break;
        }
        update_centroids(samples, result.labels, result.centroids);
        result.history.push_back(inertia_of(samples, result.labels, result.centroids));
        result.iterations = iter + 1;
    }

    if (!result.converged) {
        // Labels must describe the final centroids
        assign_labels(samples, result.centroids, result.labels);
    }

    result.inertia = inertia_of(samples, result.labels, result.centroids);
    return result;
}

std::string format_coordinate(double lat, double lon) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(6) << lat << ", " << lon;
    return ss.str();
}

} // anonymous namespace

// ============================================================================
// Hub / OptimizerConfig
// ============================================================================

nlohmann::json Hub::to_json() const {
    nlohmann::json j;
    j["index"] = index;
    j["lat"] = lat;
    j["lon"] = lon;
    return j;
}

Hub Hub::from_json(const nlohmann::json& j) {
    Hub hub;
    hub.index = j.at("index").get<int>();
    hub.lat = j.at("lat").get<double>();
    hub.lon = j.at("lon").get<double>();
    return hub;
}

bool OptimizerConfig::validate(std::string& error_message) const {
    if (n_init < 1) {
        error_message = "n_init must be at least 1";
        return false;
    }
    if (max_iter < 1) {
        error_message = "max_iter must be at least 1";
        return false;
    }
    if (!(duplicate_tolerance_deg >= 0.0)) {
        error_message = "duplicate_tolerance_deg must be non-negative";
        return false;
    }
    return true;
}

// ============================================================================
// FacilityOptimizer
// ============================================================================

FacilityOptimizer::FacilityOptimizer(const OptimizerConfig& config)
    : config_(config) {
    std::string error;
    if (!config_.validate(error)) {
        throw std::invalid_argument("Invalid configuration: " + error);
    }
}

std::vector<Hub> FacilityOptimizer::optimize(
    const std::vector<CoordinateSample>& samples,
    int n_facilities,
    uint64_t seed
) const {
    return cluster(samples, n_facilities, seed).hubs;
}

ClusteringOutcome FacilityOptimizer::cluster(
    const std::vector<CoordinateSample>& samples,
    int n_facilities,
    uint64_t seed
) const {
    if (n_facilities < 1) {
        throw std::invalid_argument("n_facilities must be at least 1");
    }
    if (samples.size() < static_cast<size_t>(n_facilities)) {
        throw InsufficientSamplesError(samples.size(), static_cast<size_t>(n_facilities));
    }
    for (const auto& s : samples) {
        if (!std::isfinite(s.lat) || !std::isfinite(s.lon)) {
            throw std::invalid_argument("Coordinate samples must be finite");
        }
    }

    // Seeds are fixed before any restart runs
    std::mt19937_64 master(seed);
    std::vector<uint64_t> restart_seeds(config_.n_init);
    for (auto& s : restart_seeds) {
        s = master();
    }

    std::vector<RestartResult> restarts(config_.n_init);
    if (config_.parallel_restarts && config_.n_init > 1) {
        std::vector<std::future<RestartResult>> futures;
        futures.reserve(config_.n_init);
        for (int r = 0; r < config_.n_init; ++r) {
            futures.push_back(std::async(std::launch::async, run_restart,
                                         std::cref(samples), n_facilities,
                                         config_.max_iter, restart_seeds[r]));
        }
        for (int r = 0; r < config_.n_init; ++r) {
            restarts[r] = futures[r].get();
        }
    } else {
        for (int r = 0; r < config_.n_init; ++r) {
            restarts[r] = run_restart(samples, n_facilities, config_.max_iter, restart_seeds[r]);
        }
    }

    ClusteringOutcome outcome;
    int best = 0;
    for (int r = 0; r < config_.n_init; ++r) {
        outcome.restart_inertia.push_back(restarts[r].inertia);
        if (restarts[r].inertia < restarts[best].inertia) {
            best = r;
        }
    }

    RestartResult& winner = restarts[best];
    outcome.best_restart = best;
    outcome.inertia = winner.inertia;
    outcome.iterations = winner.iterations;
    outcome.converged = winner.converged;
    outcome.labels = std::move(winner.labels);
    outcome.inertia_history = std::move(winner.history);

    for (size_t c = 0; c < winner.centroids.size(); ++c) {
        Hub hub;
        hub.index = static_cast<int>(c) + 1;
        hub.lat = winner.centroids[c].lat;
        hub.lon = winner.centroids[c].lon;
        outcome.hubs.push_back(hub);
    }

    const double tol = config_.duplicate_tolerance_deg;
    for (size_t a = 0; a < outcome.hubs.size(); ++a) {
        for (size_t b = a + 1; b < outcome.hubs.size(); ++b) {
            const Hub& ha = outcome.hubs[a];
            const Hub& hb = outcome.hubs[b];
            if (std::abs(ha.lat - hb.lat) <= tol && std::abs(ha.lon - hb.lon) <= tol) {
                DegenerateClusterWarning warning;
                warning.cause = DegenerateClusterWarning::Cause::DuplicateHubs;
                warning.message = "Hubs " + std::to_string(ha.index) + " and " +
                                  std::to_string(hb.index) + " converged to the same point (" +
                                  format_coordinate(ha.lat, ha.lon) + ")";
                outcome.warnings.push_back(warning);
            }
        }
    }

    return outcome;
}

double compute_inertia(
    const std::vector<CoordinateSample>& samples,
    const std::vector<int>& labels,
    const std::vector<Hub>& hubs
) {
    if (labels.size() != samples.size()) {
        throw std::invalid_argument("labels and samples differ in length");
    }
    double total = 0.0;
    for (size_t i = 0; i < samples.size(); ++i) {
        if (labels[i] < 0 || static_cast<size_t>(labels[i]) >= hubs.size()) {
            throw std::out_of_range("label outside hub range");
        }
        const Hub& h = hubs[labels[i]];
        total += squared_distance(samples[i], {h.lat, h.lon});
    }
    return total;
}

} // namespace gho
