#pragma once

#include <optional>
#include <string>
#include <vector>

#include "common/models.hpp"
#include "scoring/play_normalizer.hpp"

namespace scorebook {

struct AdvanceResult {
    BaseState state;
    int runsScored = 0;
    int outsRecorded = 0;
    std::vector<ScoredRun> scoredRunners;
    // Set when the event could not be applied literally; state is best effort.
    bool illegal = false;
    std::string violation;
};

// Apply one event. The batter, if they reach, is charged to pitcherId.
AdvanceResult advance(const BaseState &state, const PlayEvent &event,
                      const std::string &pitcherId);

struct HalfInningContext {
    int inning = 1;
    HalfSide half = HalfSide::Top;
    int regulationInnings = 9;
    // Last batter of the same team's previous half-inning, if any.
    std::string ghostCandidateId;
    std::string ghostCandidateName;
};

struct HalfInningSimulation {
    int inning = 1;
    HalfSide half = HalfSide::Top;
    bool ghostRunnerPlaced = false;
    std::optional<Runner> ghostRunner;
    std::vector<PlateAppearanceRecord> records;
    int outs = 0;
    std::vector<Anomaly> anomalies;
};

// Extra innings start with this runner on second.
std::optional<Runner> ghostRunnerFor(const HalfInningContext &context,
                                     const std::string &startingPitcherId);

/**
 * Fold one half-inning's plays through the normalizer and advance().
 *
 * Outs never exceed 3: a fourth out is capped and recorded as
 * InconsistentOutCount, and plays listed after the third out leave the
 * state untouched. Illegal moves and fallback classifications flag the
 * record; the fold always continues.
 */
HalfInningSimulation simulateHalfInning(const std::vector<RawPlay> &plays,
                                        const HalfInningContext &context,
                                        const PlayNormalizer &normalizer);

} // namespace scorebook
