#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/config.hpp"
#include "common/models.hpp"
#include "scoring/base_state_simulator.hpp"
#include "scoring/earned_run_ledger.hpp"

namespace scorebook {

// Fatal for one game: the half-inning sequence cannot form a finished game.
class IncompleteGameData : public std::runtime_error
{
public:
    IncompleteGameData(const std::string &message, int inning, HalfSide half);

    int inning() const { return m_inning; }
    HalfSide half() const { return m_half; }

private:
    int m_inning;
    HalfSide m_half;
};

/**
 * Merge simulated half-innings and their ledgers into one Game.
 *
 * Half-innings must run top 1, bottom 1, top 2, ... without gaps, every
 * half but the last must reach three outs, and the last must finish the
 * game: a walk-off bottom half, or a completed half at or past regulation
 * that leaves the score untied. Anything else throws IncompleteGameData.
 */
Game assembleGame(const nlohmann::json &metadata,
                  const std::vector<HalfInningSimulation> &halfInnings,
                  const std::vector<LedgerResult> &ledgers,
                  const PipelineConfig &config);

} // namespace scorebook
