/**
 * @file scorer.cpp
 * @brief Scorer output parsing and the subprocess adapter.
 */
#include "skywan/routing/scorer.hpp"
#include "skywan/os/subprocess.hpp"

#include <charconv>
#include <sstream>

namespace skywan::routing {

ScoreResult parse_recommendation(std::string_view output) {
    const auto eol = output.find('\n');
    std::istringstream line{std::string(output.substr(0, eol))};

    ScoreRecommendation rec;
    if (!(line >> rec.interface)) {
        return skywan_detail::unexpected(ScorerError{ScorerErrc::Malformed, "empty scorer output"});
    }

    std::string score_tok;
    if (line >> score_tok) {
        double v = 0.0;
        const auto* first = score_tok.data();
        const auto* last = first + score_tok.size();
        const auto [ptr, ec] = std::from_chars(first, last, v);
        if (ec == std::errc{} && ptr == last) rec.score = v;
    }
    return rec;
}

ScoreResult CommandScorer::recommend(const std::string& current_primary) {
    auto argv = argv_;
    argv.push_back(current_primary);

    auto run = os::run_command(argv, timeout_);
    if (!run) {
        return skywan_detail::unexpected(ScorerError{ScorerErrc::Unavailable,
            std::string(os::to_string(run.error().code)) + ": " + run.error().detail});
    }
    if (!run->ok()) {
        return skywan_detail::unexpected(ScorerError{ScorerErrc::Unavailable,
            os::describe(argv) + " exited with status " + std::to_string(run->exit_status)});
    }
    return parse_recommendation(run->output);
}

} // namespace skywan::routing
