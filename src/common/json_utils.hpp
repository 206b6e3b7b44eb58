#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace scorebook {

inline std::string toHalfString(HalfSide half)
{
    switch (half) {
    case HalfSide::Top:
        return "top";
    case HalfSide::Bottom:
        return "bottom";
    }
    return "top";
}

inline HalfSide parseHalfString(const std::string &value)
{
    if (value == "bottom" || value == "bot" || value == "b" || value == "Bot") {
        return HalfSide::Bottom;
    }
    return HalfSide::Top;
}

inline std::string toBaseString(Base base)
{
    switch (base) {
    case Base::Home:
        return "home";
    case Base::First:
        return "1B";
    case Base::Second:
        return "2B";
    case Base::Third:
        return "3B";
    case Base::Scored:
        return "scored";
    }
    return "home";
}

inline std::string toPitchString(PitchResult pitch)
{
    switch (pitch) {
    case PitchResult::Ball:
        return "B";
    case PitchResult::Strike:
        return "S";
    case PitchResult::Foul:
        return "F";
    case PitchResult::InPlay:
        return "X";
    }
    return "B";
}

// Accepts both single-letter tags and the longer names used by pitch feeds.
inline PitchResult parsePitchString(const std::string &value)
{
    if (value == "S" || value == "called_strike" || value == "swinging_strike"
        || value == "swinging_strike_blocked" || value == "missed_bunt") {
        return PitchResult::Strike;
    }
    if (value == "F" || value == "foul" || value == "foul_tip" || value == "foul_bunt") {
        return PitchResult::Foul;
    }
    if (value == "X" || value == "hit_into_play" || value == "in_play") {
        return PitchResult::InPlay;
    }
    return PitchResult::Ball;
}

inline std::string toPlayKindString(PlayKind kind)
{
    switch (kind) {
    case PlayKind::Strikeout:
        return "strikeout";
    case PlayKind::Walk:
        return "walk";
    case PlayKind::HitByPitch:
        return "hit_by_pitch";
    case PlayKind::Single:
        return "single";
    case PlayKind::Double:
        return "double";
    case PlayKind::Triple:
        return "triple";
    case PlayKind::HomeRun:
        return "home_run";
    case PlayKind::GroundOut:
        return "ground_out";
    case PlayKind::FlyOut:
        return "fly_out";
    case PlayKind::FieldersChoice:
        return "fielders_choice";
    case PlayKind::DoublePlay:
        return "double_play";
    case PlayKind::TriplePlay:
        return "triple_play";
    case PlayKind::SacrificeFly:
        return "sacrifice_fly";
    case PlayKind::SacrificeBunt:
        return "sacrifice_bunt";
    case PlayKind::Error:
        return "error";
    case PlayKind::CatcherInterference:
        return "catcher_interference";
    case PlayKind::StolenBase:
        return "stolen_base";
    case PlayKind::CaughtStealing:
        return "caught_stealing";
    case PlayKind::WildPitch:
        return "wild_pitch";
    case PlayKind::PassedBall:
        return "passed_ball";
    case PlayKind::Balk:
        return "balk";
    case PlayKind::GenericOut:
        return "generic_out";
    }
    return "generic_out";
}

inline std::string toBatterFateString(BatterFate fate)
{
    switch (fate) {
    case BatterFate::Out:
        return "out";
    case BatterFate::Reaches:
        return "reaches";
    case BatterFate::NotInvolved:
        return "not_involved";
    }
    return "out";
}

inline std::string toAnomalyKindString(AnomalyKind kind)
{
    switch (kind) {
    case AnomalyKind::UnrecognizedPlayPattern:
        return "UnrecognizedPlayPattern";
    case AnomalyKind::IllegalAdvancement:
        return "IllegalAdvancement";
    case AnomalyKind::InconsistentOutCount:
        return "InconsistentOutCount";
    case AnomalyKind::ReportedTotalsMismatch:
        return "ReportedTotalsMismatch";
    case AnomalyKind::ContestedEarnedRuns:
        return "ContestedEarnedRuns";
    case AnomalyKind::IncompleteGameData:
        return "IncompleteGameData";
    }
    return "UnrecognizedPlayPattern";
}

inline void to_json(nlohmann::json &j, const HalfSide &half)
{
    j = toHalfString(half);
}

inline void from_json(const nlohmann::json &j, HalfSide &half)
{
    if (j.is_string()) {
        half = parseHalfString(j.get<std::string>());
    } else {
        half = HalfSide::Top;
    }
}

inline void to_json(nlohmann::json &j, const Base &base)
{
    j = toBaseString(base);
}

inline void to_json(nlohmann::json &j, const PitchResult &pitch)
{
    j = toPitchString(pitch);
}

inline void from_json(const nlohmann::json &j, PitchResult &pitch)
{
    if (j.is_string()) {
        pitch = parsePitchString(j.get<std::string>());
    } else {
        pitch = PitchResult::Ball;
    }
}

inline void to_json(nlohmann::json &j, const PlayKind &kind)
{
    j = toPlayKindString(kind);
}

inline void to_json(nlohmann::json &j, const BatterFate &fate)
{
    j = toBatterFateString(fate);
}

inline void to_json(nlohmann::json &j, const AnomalyKind &kind)
{
    j = toAnomalyKindString(kind);
}

inline void to_json(nlohmann::json &j, const RawPlay &play)
{
    j = nlohmann::json{
        {"inning", play.inning},
        {"half", play.half},
        {"batterId", play.batterId},
        {"batterName", play.batterName},
        {"pitcherId", play.pitcherId},
        {"pitcherName", play.pitcherName},
        {"description", play.description},
        {"pitches", play.pitches},
        {"runsScored", play.runsScored ? nlohmann::json(*play.runsScored) : nlohmann::json()},
        {"outsRecorded", play.outsRecorded ? nlohmann::json(*play.outsRecorded)
                                           : nlohmann::json()},
        {"wpBefore", play.wpBefore},
        {"wpAfter", play.wpAfter}
    };
}

inline void from_json(const nlohmann::json &j, RawPlay &play)
{
    play.inning = j.value("inning", 0);
    if (j.contains("half")) {
        play.half = j.at("half").get<HalfSide>();
    } else {
        play.half = HalfSide::Top;
    }
    play.batterId = j.value("batterId", "");
    play.batterName = j.value("batterName", "");
    play.pitcherId = j.value("pitcherId", "");
    play.pitcherName = j.value("pitcherName", "");
    play.description = j.value("description", "");
    if (j.contains("pitches") && j.at("pitches").is_array()) {
        play.pitches = j.at("pitches").get<std::vector<PitchResult>>();
    } else {
        play.pitches.clear();
    }
    if (j.contains("runsScored") && j.at("runsScored").is_number_integer()) {
        play.runsScored = j.at("runsScored").get<int>();
    } else {
        play.runsScored.reset();
    }
    if (j.contains("outsRecorded") && j.at("outsRecorded").is_number_integer()) {
        play.outsRecorded = j.at("outsRecorded").get<int>();
    } else {
        play.outsRecorded.reset();
    }
    play.wpBefore = j.value("wpBefore", 0.5);
    play.wpAfter = j.value("wpAfter", 0.5);
}

inline void from_json(const nlohmann::json &j, GameInput &input)
{
    if (j.contains("metadata") && j.at("metadata").is_object()) {
        input.metadata = j.at("metadata");
    } else {
        input.metadata = nlohmann::json::object();
    }
    if (j.contains("plays") && j.at("plays").is_array()) {
        input.plays = j.at("plays").get<std::vector<RawPlay>>();
    } else {
        input.plays.clear();
    }
}

inline void to_json(nlohmann::json &j, const RunnerMove &move)
{
    j = nlohmann::json{
        {"runnerId", move.runnerId},
        {"from", move.from},
        {"to", move.to},
        {"out", move.out},
        {"onError", move.onError}
    };
}

inline void to_json(nlohmann::json &j, const PlayEvent &event)
{
    j = nlohmann::json{
        {"kind", event.kind},
        {"notation", event.notation},
        {"rule", event.ruleName},
        {"confidence", event.confidence},
        {"batterId", event.batterId},
        {"batterFate", event.batterFate},
        {"batterBase", event.batterBase},
        {"batterReachedOnError", event.batterReachedOnError},
        {"batterAdvancedOnError", event.batterAdvancedOnError},
        {"fielders", event.fielders},
        {"errorFielders", event.errorFielders},
        {"runnerMoves", event.runnerMoves},
        {"outs", event.outsOnPlay},
        {"rbi", event.rbi},
        {"cleanOuts", event.cleanOuts}
    };
}

inline void to_json(nlohmann::json &j, const Runner &runner)
{
    j = nlohmann::json{
        {"playerId", runner.playerId},
        {"name", runner.name},
        {"responsiblePitcherId", runner.responsiblePitcherId},
        {"base", runner.base},
        {"ghost", runner.ghost},
        {"reachedOnError", runner.reachedOnError}
    };
}

inline void to_json(nlohmann::json &j, const BaseState &state)
{
    j = nlohmann::json::object();
    const Base bases[] = {Base::First, Base::Second, Base::Third};
    for (Base base : bases) {
        const auto &runner = state.runnerOn(base);
        j[toBaseString(base)] = runner ? nlohmann::json(*runner) : nlohmann::json();
    }
}

inline void to_json(nlohmann::json &j, const ScoredRun &run)
{
    j = nlohmann::json{
        {"runnerId", run.runnerId},
        {"runnerName", run.runnerName},
        {"responsiblePitcherId", run.responsiblePitcherId},
        {"ghost", run.ghost},
        {"reachedOnError", run.reachedOnError},
        {"earned", run.earned},
        {"chargedPitcherId", run.chargedPitcherId}
    };
}

inline void to_json(nlohmann::json &j, const Anomaly &anomaly)
{
    j = nlohmann::json{
        {"kind", anomaly.kind},
        {"inning", anomaly.inning},
        {"half", anomaly.half},
        {"playIndex", anomaly.playIndex},
        {"description", anomaly.description},
        {"detail", anomaly.detail},
        {"recovery", anomaly.recovery}
    };
}

inline void to_json(nlohmann::json &j, const PlateAppearanceRecord &record)
{
    j = nlohmann::json{
        {"index", record.index},
        {"batterId", record.batterId},
        {"batterName", record.batterName},
        {"pitcherId", record.pitcherId},
        {"pitcherName", record.pitcherName},
        {"pitches", record.pitches},
        {"description", record.description},
        {"event", record.event},
        {"before", record.before},
        {"after", record.after},
        {"outsBefore", record.outsBefore},
        {"outsAfter", record.outsAfter},
        {"runsScored", record.runsScored},
        {"runs", record.runs},
        {"wpBefore", record.wpBefore},
        {"wpAfter", record.wpAfter},
        {"keyPlay", record.keyPlay},
        {"flagged", record.flagged}
    };
}

inline void to_json(nlohmann::json &j, const PitcherResponsibility &entry)
{
    j = nlohmann::json{
        {"pitcherId", entry.pitcherId},
        {"pitcherName", entry.pitcherName},
        {"runnerIds", entry.runnerIds}
    };
}

inline void to_json(nlohmann::json &j, const HalfInning &halfInning)
{
    j = nlohmann::json{
        {"inning", halfInning.inning},
        {"half", halfInning.half},
        {"ghostRunnerPlaced", halfInning.ghostRunnerPlaced},
        {"ghostRunner", halfInning.ghostRunner ? nlohmann::json(*halfInning.ghostRunner)
                                               : nlohmann::json()},
        {"plays", halfInning.plays},
        {"outs", halfInning.outs},
        {"runs", halfInning.runs},
        {"earnedRuns", halfInning.earnedRuns},
        {"unearnedRuns", halfInning.unearnedRuns},
        {"runsByPitcher", halfInning.runsByPitcher},
        {"earnedRunsByPitcher", halfInning.earnedRunsByPitcher},
        {"pitchers", halfInning.pitchers},
        {"earnedRunsContested", halfInning.earnedRunsContested}
    };
}

inline void to_json(nlohmann::json &j, const TeamLine &line)
{
    j = nlohmann::json{
        {"team", line.team},
        {"runsByInning", line.runsByInning},
        {"R", line.runs},
        {"H", line.hits},
        {"E", line.errors}
    };
}

inline void to_json(nlohmann::json &j, const Linescore &linescore)
{
    j = nlohmann::json{{"away", linescore.away}, {"home", linescore.home}};
}

inline void to_json(nlohmann::json &j, const PitcherLine &line)
{
    j = nlohmann::json{
        {"pitcherId", line.pitcherId},
        {"name", line.name},
        {"team", line.team},
        {"outsRecorded", line.outsRecorded},
        {"battersFaced", line.battersFaced},
        {"H", line.hits},
        {"BB", line.walks},
        {"SO", line.strikeouts},
        {"HR", line.homeRuns},
        {"R", line.runs},
        {"ER", line.earnedRuns}
    };
}

inline void to_json(nlohmann::json &j, const BatterLine &line)
{
    nlohmann::json innings = nlohmann::json::object();
    for (const auto &[inning, marks] : line.notationByInning) {
        innings[std::to_string(inning)] = marks;
    }
    j = nlohmann::json{
        {"batterId", line.batterId},
        {"name", line.name},
        {"team", line.team},
        {"PA", line.plateAppearances},
        {"H", line.hits},
        {"BB", line.walks},
        {"SO", line.strikeouts},
        {"RBI", line.rbi},
        {"innings", innings}
    };
}

inline void to_json(nlohmann::json &j, const KeyPlay &play)
{
    j = nlohmann::json{
        {"inning", play.inning},
        {"half", play.half},
        {"playIndex", play.playIndex},
        {"batterName", play.batterName},
        {"description", play.description},
        {"wpBefore", play.wpBefore},
        {"wpAfter", play.wpAfter}
    };
}

inline void to_json(nlohmann::json &j, const Game &game)
{
    j = nlohmann::json{
        {"gameId", game.gameId},
        {"metadata", game.metadata},
        {"regulationInnings", game.regulationInnings},
        {"halfInnings", game.halfInnings},
        {"linescore", game.linescore},
        {"finalScore", nlohmann::json{{"away", game.linescore.away.runs},
                                      {"home", game.linescore.home.runs}}},
        {"pitchers", game.pitchers},
        {"batters", game.batters},
        {"keyPlays", game.keyPlays},
        {"anomalies", game.anomalies}
    };
}

} // namespace scorebook
