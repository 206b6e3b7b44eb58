#include "scoring/base_state_simulator.hpp"

#include <array>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace scorebook {

namespace {

int baseIndex(Base base)
{
    return static_cast<int>(base);
}

ScoredRun scoredRunFor(const Runner &runner)
{
    ScoredRun run;
    run.runnerId = runner.playerId;
    run.runnerName = runner.name;
    run.responsiblePitcherId = runner.responsiblePitcherId;
    run.ghost = runner.ghost;
    run.reachedOnError = runner.reachedOnError;
    run.chargedPitcherId = runner.responsiblePitcherId;
    return run;
}

void addViolation(AdvanceResult &result, const std::string &message)
{
    result.illegal = true;
    if (!result.violation.empty()) {
        result.violation += "; ";
    }
    result.violation += message;
}

// Move whoever stands on base one base ahead, cascading forward.
void pushForward(AdvanceResult &result, int index)
{
    if (index < 1 || index > 3) {
        return;
    }
    std::optional<Runner> &slot = result.state.runnerOn(static_cast<Base>(index));
    if (!slot) {
        return;
    }
    Runner runner = *slot;
    slot.reset();
    if (index == 3) {
        result.scoredRunners.push_back(scoredRunFor(runner));
        return;
    }
    pushForward(result, index + 1);
    runner.base = static_cast<Base>(index + 1);
    result.state.runnerOn(runner.base) = runner;
}

// Highest open base in [low, high]; 0 when none.
int highestFreeBase(const BaseState &state, int low, int high)
{
    for (int index = high; index >= low; --index) {
        if (index >= 1 && index <= 3 && !state.occupied(static_cast<Base>(index))) {
            return index;
        }
    }
    return 0;
}

void placeRunner(AdvanceResult &result, Runner runner, int origin, int target)
{
    if (target < origin) {
        addViolation(result, runner.playerId + " moved backward from "
                                 + toBaseString(static_cast<Base>(origin)));
        target = origin;
    }

    if (result.state.occupied(static_cast<Base>(target))) {
        addViolation(result, runner.playerId + " moved onto occupied "
                                 + toBaseString(static_cast<Base>(target)));
        int fallback = highestFreeBase(result.state, origin, target - 1);
        if (fallback == 0) {
            fallback = highestFreeBase(result.state, 1, 3);
        }
        if (fallback == 0) {
            result.scoredRunners.push_back(scoredRunFor(runner));
            return;
        }
        target = fallback;
    }

    runner.base = static_cast<Base>(target);
    result.state.runnerOn(runner.base) = runner;
}

Anomaly anomalyFor(AnomalyKind kind, const RawPlay &raw, int playIndex,
                   const std::string &detail, const std::string &recovery)
{
    Anomaly anomaly;
    anomaly.kind = kind;
    anomaly.inning = raw.inning;
    anomaly.half = raw.half;
    anomaly.playIndex = playIndex;
    anomaly.description = raw.description;
    anomaly.detail = detail;
    anomaly.recovery = recovery;
    return anomaly;
}

void logAnomaly(const Anomaly &anomaly)
{
    SBLOG_WARN(QStringLiteral("BaseStateSimulator"),
               QStringLiteral("simulateHalfInning"),
               QString::fromStdString(toAnomalyKindString(anomaly.kind)),
               QStringLiteral("simulation"),
               QString::fromStdString(anomaly.recovery),
               scorebook::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"inning", anomaly.inning},
                               {"half", toHalfString(anomaly.half)},
                               {"playIndex", anomaly.playIndex},
                               {"detail", anomaly.detail}}));
}

} // namespace

AdvanceResult advance(const BaseState &state, const PlayEvent &event,
                      const std::string &pitcherId)
{
    AdvanceResult result;
    std::array<bool, 4> moved{};

    // Lead runner first so trailing runners see the bases ahead already settled.
    for (const RunnerMove &move : event.runnerMoves) {
        const int origin = baseIndex(move.from);
        if (origin < 1 || origin > 3 || !state.occupied(move.from)) {
            addViolation(result, "no runner on " + toBaseString(move.from));
            continue;
        }
        moved[static_cast<size_t>(origin)] = true;
        const Runner &runner = *state.runnerOn(move.from);

        if (move.out) {
            ++result.outsRecorded;
            continue;
        }
        if (move.to == Base::Scored) {
            result.scoredRunners.push_back(scoredRunFor(runner));
            continue;
        }
        placeRunner(result, runner, origin, baseIndex(move.to));
    }

    // Runners the event did not mention stay put.
    for (int index = 3; index >= 1; --index) {
        const Base base = static_cast<Base>(index);
        if (state.occupied(base) && !moved[static_cast<size_t>(index)]) {
            placeRunner(result, *state.runnerOn(base), index, index);
        }
    }

    if (event.batterFate == BatterFate::Out) {
        ++result.outsRecorded;
    } else if (event.batterFate == BatterFate::Reaches) {
        Runner batter;
        batter.playerId = event.batterId;
        batter.name = event.batterName;
        batter.responsiblePitcherId = pitcherId;
        batter.reachedOnError = event.batterReachedOnError;

        Base target = event.batterBase == Base::Home ? Base::First : event.batterBase;
        if (target == Base::Scored) {
            result.scoredRunners.push_back(scoredRunFor(batter));
        } else {
            if (result.state.occupied(target)) {
                addViolation(result, "batter's base " + toBaseString(target) + " was occupied");
                pushForward(result, baseIndex(target));
            }
            batter.base = target;
            result.state.runnerOn(target) = batter;
        }
    }

    result.runsScored = static_cast<int>(result.scoredRunners.size());
    return result;
}

std::optional<Runner> ghostRunnerFor(const HalfInningContext &context,
                                     const std::string &startingPitcherId)
{
    if (context.inning <= context.regulationInnings) {
        return std::nullopt;
    }

    Runner ghost;
    if (context.ghostCandidateId.empty()) {
        ghost.playerId = "ghost-" + std::to_string(context.inning) + "-"
            + toHalfString(context.half);
        ghost.name = "Ghost runner";
    } else {
        ghost.playerId = context.ghostCandidateId;
        ghost.name = context.ghostCandidateName;
    }
    ghost.responsiblePitcherId = startingPitcherId;
    ghost.base = Base::Second;
    ghost.ghost = true;
    return ghost;
}

HalfInningSimulation simulateHalfInning(const std::vector<RawPlay> &plays,
                                        const HalfInningContext &context,
                                        const PlayNormalizer &normalizer)
{
    HalfInningSimulation simulation;
    simulation.inning = context.inning;
    simulation.half = context.half;

    BaseState state;
    int outs = 0;

    const std::string startingPitcher = plays.empty() ? std::string() : plays.front().pitcherId;
    if (auto ghost = ghostRunnerFor(context, startingPitcher)) {
        state.runnerOn(Base::Second) = *ghost;
        simulation.ghostRunnerPlaced = true;
        simulation.ghostRunner = ghost;
    }

    for (size_t i = 0; i < plays.size(); ++i) {
        const RawPlay &raw = plays[i];
        const int playIndex = static_cast<int>(i);

        PlateAppearanceRecord record;
        record.index = playIndex;
        record.batterId = raw.batterId;
        record.batterName = raw.batterName;
        record.pitcherId = raw.pitcherId;
        record.pitcherName = raw.pitcherName;
        record.pitches = raw.pitches;
        record.description = raw.description;
        record.wpBefore = raw.wpBefore;
        record.wpAfter = raw.wpAfter;
        record.before = state;
        record.outsBefore = outs;

        NormalizeResult normalized = normalizer.normalize(raw, PlayContext{outs, state});
        record.event = normalized.event;
        if (normalized.warning) {
            Anomaly warning = *normalized.warning;
            warning.playIndex = playIndex;
            simulation.anomalies.push_back(warning);
            record.flagged = true;
        }

        if (outs >= 3) {
            const Anomaly anomaly = anomalyFor(AnomalyKind::InconsistentOutCount, raw, playIndex,
                                               "play listed after the third out",
                                               "base state and outs left unchanged");
            logAnomaly(anomaly);
            simulation.anomalies.push_back(anomaly);
            record.flagged = true;
            record.after = state;
            record.outsAfter = outs;
            simulation.records.push_back(record);
            continue;
        }

        const AdvanceResult advanced = advance(state, record.event, raw.pitcherId);
        if (advanced.illegal) {
            const Anomaly anomaly = anomalyFor(AnomalyKind::IllegalAdvancement, raw, playIndex,
                                               advanced.violation,
                                               "runners kept on the nearest legal base");
            logAnomaly(anomaly);
            simulation.anomalies.push_back(anomaly);
            record.flagged = true;
        }

        int outsAfter = outs + advanced.outsRecorded;
        if (outsAfter > 3) {
            const Anomaly anomaly = anomalyFor(AnomalyKind::InconsistentOutCount, raw, playIndex,
                                               "play would record out number "
                                                   + std::to_string(outsAfter),
                                               "out count capped at 3");
            logAnomaly(anomaly);
            simulation.anomalies.push_back(anomaly);
            record.flagged = true;
            outsAfter = 3;
        }

        if (raw.runsScored && *raw.runsScored != advanced.runsScored) {
            simulation.anomalies.push_back(
                anomalyFor(AnomalyKind::ReportedTotalsMismatch, raw, playIndex,
                           "feed reports " + std::to_string(*raw.runsScored)
                               + " runs, simulation scored "
                               + std::to_string(advanced.runsScored),
                           "simulated runs kept"));
        }
        if (raw.outsRecorded && *raw.outsRecorded != advanced.outsRecorded) {
            simulation.anomalies.push_back(
                anomalyFor(AnomalyKind::ReportedTotalsMismatch, raw, playIndex,
                           "feed reports " + std::to_string(*raw.outsRecorded)
                               + " outs, simulation recorded "
                               + std::to_string(advanced.outsRecorded),
                           "simulated outs kept"));
        }

        record.after = advanced.state;
        record.outsAfter = outsAfter;
        record.runsScored = advanced.runsScored;
        record.runs = advanced.scoredRunners;
        simulation.records.push_back(record);

        state = advanced.state;
        outs = outsAfter;
    }

    simulation.outs = outs;

    SBLOG_DEBUG(QStringLiteral("BaseStateSimulator"),
                QStringLiteral("simulateHalfInning"),
                QStringLiteral("half_inning_simulated"),
                QStringLiteral("simulation"),
                QStringLiteral("fold_plays"),
                scorebook::logging::defaultWho(),
                QString(),
                (nlohmann::json{{"inning", context.inning},
                                {"half", toHalfString(context.half)},
                                {"plays", plays.size()},
                                {"outs", outs},
                                {"ghostRunner", simulation.ghostRunnerPlaced}}));
    return simulation;
}

} // namespace scorebook
