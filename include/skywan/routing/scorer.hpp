#pragma once
/**
 * @file scorer.hpp
 * @brief External interface-scoring collaborator that recommends which uplink to prefer.
 */

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <string_view>
#include <vector>

#include "skywan/compat/expected.hpp"

namespace skywan::routing {

/** @struct ScoreRecommendation
 *  @brief Recommended interface and its optional numeric score.
 */
struct ScoreRecommendation {
    std::string           interface; ///< Preferred interface name
    std::optional<double> score;     ///< Score reported alongside, if any

    bool operator==(const ScoreRecommendation&) const = default;
};

enum class ScorerErrc : std::uint8_t {
    Unavailable = 1, ///< Command failed, timed out or exited non-zero
    Malformed        ///< No interface token in the output
};

struct ScorerError {
    ScorerErrc  code;
    std::string detail;
};

using ScoreResult = skywan_detail::expected<ScoreRecommendation, ScorerError>;

/** @class Scorer
 *  @brief Narrow interface over the scoring service.
 */
class Scorer {
public:
    virtual ~Scorer() = default;

    /// Recommend an interface given the one currently in use.
    virtual ScoreResult recommend(const std::string& current_primary) = 0;
};

/**
 * @brief Parse "<iface> [score]" from scorer output. Only the first line is considered.
 */
ScoreResult parse_recommendation(std::string_view output);

/** @class CommandScorer
 *  @brief Runs `argv + [current_primary]` and parses its stdout.
 */
class CommandScorer final : public Scorer {
public:
    CommandScorer(std::vector<std::string> argv, std::chrono::milliseconds timeout)
        : argv_(std::move(argv)), timeout_(timeout) {}

    ScoreResult recommend(const std::string& current_primary) override;

private:
    std::vector<std::string>  argv_;
    std::chrono::milliseconds timeout_;
};

} // namespace skywan::routing
