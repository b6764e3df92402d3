#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

namespace gho {

/**
 * @brief Raised when fewer coordinate samples are available than facilities requested
 *
 * The clustering step cannot place more distinct centers than it has input
 * points. Retrying with the same input cannot succeed, so the caller decides
 * whether to reduce the unit count, widen the network snapshot, or abort.
 */
class InsufficientSamplesError : public std::runtime_error {
public:
    InsufficientSamplesError(size_t available, size_t required)
        : std::runtime_error(
              "Insufficient samples: " + std::to_string(available) +
              " available, " + std::to_string(required) + " facilities requested"),
          available_(available),
          required_(required) {}

    size_t available() const { return available_; }
    size_t required() const { return required_; }

private:
    size_t available_;
    size_t required_;
};

/**
 * @brief Non-fatal signal raised by the classifier or the optimizer
 *
 * Never thrown. Collected alongside results so the presentation layer can
 * decide how to surface it.
 */
struct DegenerateClusterWarning {
    enum class Cause {
        ThresholdFallback,   // Classifier relaxed past the requested degree threshold
        DuplicateHubs        // Two or more centroids converged to the same point
    };

    Cause cause = Cause::ThresholdFallback;
    std::string message;

    nlohmann::json to_json() const;
    static DegenerateClusterWarning from_json(const nlohmann::json& j);
};

std::string warning_cause_to_string(DegenerateClusterWarning::Cause cause);
DegenerateClusterWarning::Cause warning_cause_from_string(const std::string& name);

} // namespace gho
