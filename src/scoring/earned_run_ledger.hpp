#pragma once

#include <map>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace scorebook {

struct RunAttribution {
    int playIndex = 0;
    std::string runnerId;
    std::string runnerName;
    bool earned = false;
    std::string chargedPitcherId;
    bool ghost = false;

    bool operator==(const RunAttribution &) const = default;
};

struct LedgerResult {
    std::vector<RunAttribution> runs;
    int totalRuns = 0;
    int earnedRuns = 0;
    std::map<std::string, int> runsByPitcher;
    std::map<std::string, int> earnedRunsByPitcher;
    // Pitchers in order of appearance with the runners each put on base.
    std::vector<PitcherResponsibility> pitchers;
    // Plays with an error, a batter reaching on a misplay, or a passed ball.
    int errorPlays = 0;
    bool contested = false;
};

/**
 * Split a half-inning's runs into earned and unearned.
 *
 * The half-inning is replayed without its errors: a batter who reached on
 * an error or catcher's interference counts as an out, and advances made
 * on errors or passed balls do not happen. A run is earned when its runner
 * neither reached on an error nor started as the extra-inning runner, and
 * the same runner also scores in the replay before it records three outs.
 * Every run is charged to the pitcher responsible for the runner.
 */
LedgerResult attributeRuns(const std::vector<PlateAppearanceRecord> &records);

// Copy of records with each scored run's earned flag and charged pitcher filled in.
std::vector<PlateAppearanceRecord> applyLedger(std::vector<PlateAppearanceRecord> records,
                                               const LedgerResult &ledger);

} // namespace scorebook
