#pragma once

#include <array>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/enums.hpp"

namespace scorebook {

struct RawPlay {
    int inning = 0;
    HalfSide half = HalfSide::Top;
    std::string batterId;
    std::string batterName;
    std::string pitcherId;
    std::string pitcherName;
    std::string description;
    std::vector<PitchResult> pitches;
    // Totals reported by the feed; absent when the source omits them.
    std::optional<int> runsScored;
    std::optional<int> outsRecorded;
    // Home-team win probability, 0..1.
    double wpBefore = 0.5;
    double wpAfter = 0.5;
};

struct GameInput {
    nlohmann::json metadata;
    std::vector<RawPlay> plays;
};

struct RunnerMove {
    // Base the runner starts from; Home means the batter.
    Base from = Base::First;
    // Destination, or the base at which the runner was put out.
    Base to = Base::First;
    bool out = false;
    bool onError = false;
    std::string runnerId;

    bool operator==(const RunnerMove &) const = default;
};

struct PlayEvent {
    PlayKind kind = PlayKind::GenericOut;
    std::string notation;
    std::string ruleName;
    double confidence = 0.0;

    std::string batterId;
    std::string batterName;
    BatterFate batterFate = BatterFate::Out;
    // Meaningful when batterFate == Reaches.
    Base batterBase = Base::Home;
    bool batterReachedOnError = false;
    // Batter took extra bases on a misplay after the hit itself.
    bool batterAdvancedOnError = false;

    std::vector<int> fielders;
    std::vector<int> errorFielders;
    // One entry per runner on base before the play, lead runner first.
    std::vector<RunnerMove> runnerMoves;

    int outsOnPlay = 0;
    int rbi = 0;
    bool cleanOuts = true;

    bool operator==(const PlayEvent &) const = default;
};

struct Runner {
    std::string playerId;
    std::string name;
    std::string responsiblePitcherId;
    Base base = Base::First;
    bool ghost = false;
    bool reachedOnError = false;

    bool operator==(const Runner &) const = default;
};

struct BaseState {
    std::array<std::optional<Runner>, 3> occupants;

    const std::optional<Runner> &runnerOn(Base base) const
    {
        return occupants[static_cast<size_t>(base) - 1];
    }

    std::optional<Runner> &runnerOn(Base base)
    {
        return occupants[static_cast<size_t>(base) - 1];
    }

    bool occupied(Base base) const { return runnerOn(base).has_value(); }

    bool empty() const
    {
        return !occupants[0] && !occupants[1] && !occupants[2];
    }

    int count() const
    {
        int total = 0;
        for (const auto &slot : occupants) {
            if (slot) {
                ++total;
            }
        }
        return total;
    }

    // Lead runner first.
    std::vector<Runner> runners() const
    {
        std::vector<Runner> result;
        for (int i = 2; i >= 0; --i) {
            if (occupants[static_cast<size_t>(i)]) {
                result.push_back(*occupants[static_cast<size_t>(i)]);
            }
        }
        return result;
    }

    bool operator==(const BaseState &) const = default;
};

struct ScoredRun {
    std::string runnerId;
    std::string runnerName;
    std::string responsiblePitcherId;
    bool ghost = false;
    bool reachedOnError = false;
    bool earned = false;
    std::string chargedPitcherId;

    bool operator==(const ScoredRun &) const = default;
};

struct Anomaly {
    AnomalyKind kind = AnomalyKind::UnrecognizedPlayPattern;
    int inning = 0;
    HalfSide half = HalfSide::Top;
    int playIndex = -1;
    std::string description;
    std::string detail;
    std::string recovery;

    bool operator==(const Anomaly &) const = default;
};

struct PlateAppearanceRecord {
    int index = 0;
    std::string batterId;
    std::string batterName;
    std::string pitcherId;
    std::string pitcherName;
    std::vector<PitchResult> pitches;
    std::string description;
    PlayEvent event;
    BaseState before;
    BaseState after;
    int outsBefore = 0;
    int outsAfter = 0;
    int runsScored = 0;
    std::vector<ScoredRun> runs;
    double wpBefore = 0.5;
    double wpAfter = 0.5;
    bool keyPlay = false;
    bool flagged = false;

    bool operator==(const PlateAppearanceRecord &) const = default;
};

struct PitcherResponsibility {
    std::string pitcherId;
    std::string pitcherName;
    std::vector<std::string> runnerIds;

    bool operator==(const PitcherResponsibility &) const = default;
};

struct HalfInning {
    int inning = 0;
    HalfSide half = HalfSide::Top;
    bool ghostRunnerPlaced = false;
    std::optional<Runner> ghostRunner;
    std::vector<PlateAppearanceRecord> plays;
    int outs = 0;
    int runs = 0;
    int earnedRuns = 0;
    int unearnedRuns = 0;
    std::map<std::string, int> runsByPitcher;
    std::map<std::string, int> earnedRunsByPitcher;
    std::vector<PitcherResponsibility> pitchers;
    bool earnedRunsContested = false;

    bool operator==(const HalfInning &) const = default;
};

struct TeamLine {
    std::string team;
    std::vector<int> runsByInning;
    int runs = 0;
    int hits = 0;
    int errors = 0;

    bool operator==(const TeamLine &) const = default;
};

struct Linescore {
    TeamLine away;
    TeamLine home;

    bool operator==(const Linescore &) const = default;
};

struct PitcherLine {
    std::string pitcherId;
    std::string name;
    std::string team;
    int outsRecorded = 0;
    int battersFaced = 0;
    int hits = 0;
    int walks = 0;
    int strikeouts = 0;
    int homeRuns = 0;
    int runs = 0;
    int earnedRuns = 0;

    bool operator==(const PitcherLine &) const = default;
};

struct BatterLine {
    std::string batterId;
    std::string name;
    std::string team;
    int plateAppearances = 0;
    int hits = 0;
    int walks = 0;
    int strikeouts = 0;
    int rbi = 0;
    std::map<int, std::vector<std::string>> notationByInning;

    bool operator==(const BatterLine &) const = default;
};

struct KeyPlay {
    int inning = 0;
    HalfSide half = HalfSide::Top;
    int playIndex = 0;
    std::string batterName;
    std::string description;
    double wpBefore = 0.5;
    double wpAfter = 0.5;

    bool operator==(const KeyPlay &) const = default;
};

struct Game {
    std::string gameId;
    nlohmann::json metadata;
    int regulationInnings = 9;
    std::vector<HalfInning> halfInnings;
    Linescore linescore;
    std::vector<PitcherLine> pitchers;
    std::vector<BatterLine> batters;
    std::vector<KeyPlay> keyPlays;
    std::vector<Anomaly> anomalies;
};

} // namespace scorebook
