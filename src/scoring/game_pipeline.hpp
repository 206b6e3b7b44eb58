#pragma once

#include <optional>
#include <string>
#include <vector>

#include "common/config.hpp"
#include "common/models.hpp"
#include "scoring/play_normalizer.hpp"

namespace scorebook {

struct GameOutcome {
    std::string gameId;
    std::optional<Game> game;
    // Failure message when game is empty.
    std::string error;

    bool ok() const { return game.has_value(); }
};

// Contiguous runs of plays sharing an inning and half, in input order.
std::vector<std::vector<RawPlay>> groupHalfInnings(const std::vector<RawPlay> &plays);

std::string gameIdOf(const GameInput &input);

class GamePipeline
{
public:
    explicit GamePipeline(PipelineConfig config = PipelineConfig());

    // Runs every stage for one game. IncompleteGameData propagates.
    Game build(const GameInput &input) const;

    // One task per game on a pool of jobs threads (ideal thread count when jobs <= 0).
    // Outcomes keep input order; a failed game never affects the others.
    std::vector<GameOutcome> buildAll(const std::vector<GameInput> &inputs, int jobs = 0) const;

    const PipelineConfig &config() const { return m_config; }

private:
    GameOutcome buildOutcome(const GameInput &input) const;

    PipelineConfig m_config;
    PlayNormalizer m_normalizer;
};

} // namespace scorebook
