#include "scoring/earned_run_ledger.hpp"

#include <algorithm>
#include <array>
#include <optional>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"
#include "scoring/play_normalizer.hpp"

namespace scorebook {

namespace {

// Error-free replay of the half-inning. Slot 0 is unused.
struct Replay {
    std::array<std::optional<std::string>, 4> bases;
    int outs = 0;

    int find(const std::string &runnerId) const
    {
        for (int index = 1; index <= 3; ++index) {
            if (bases[static_cast<size_t>(index)] == runnerId) {
                return index;
            }
        }
        return 0;
    }
};

// Passed balls are misplays but not errors, so they never make a half contested.
bool isErrorPlay(const PlayEvent &event)
{
    return !event.errorFielders.empty() || event.kind == PlayKind::Error
        || event.kind == PlayKind::CatcherInterference;
}

// Bases gained in the replay for an actual move; misplays gain nothing.
int replayGain(const PlayEvent &event, const RunnerMove &move)
{
    if (move.onError || event.kind == PlayKind::PassedBall || event.kind == PlayKind::Error
        || event.kind == PlayKind::CatcherInterference) {
        return 0;
    }
    const int from = static_cast<int>(move.from);
    const int to = static_cast<int>(move.to);
    return std::max(to - from, 0);
}

// Force the replay runner on index one base ahead, cascading.
void forceAhead(Replay &replay, int index, std::vector<std::string> &scored)
{
    if (index < 1 || index > 3 || !replay.bases[static_cast<size_t>(index)]) {
        return;
    }
    const std::string runnerId = *replay.bases[static_cast<size_t>(index)];
    replay.bases[static_cast<size_t>(index)].reset();
    if (index == 3) {
        scored.push_back(runnerId);
        return;
    }
    forceAhead(replay, index + 1, scored);
    replay.bases[static_cast<size_t>(index + 1)] = runnerId;
}

// Returns the ids that scored in the replay on this play.
std::vector<std::string> replayPlay(Replay &replay, const PlateAppearanceRecord &record)
{
    const PlayEvent &event = record.event;
    std::vector<std::string> scored;

    for (const RunnerMove &move : event.runnerMoves) {
        const int current = replay.find(move.runnerId);
        if (current == 0) {
            continue;
        }
        replay.bases[static_cast<size_t>(current)].reset();
        if (move.out) {
            continue;
        }
        int target = current + replayGain(event, move);
        if (target >= 4) {
            scored.push_back(move.runnerId);
            continue;
        }
        while (target > current && replay.bases[static_cast<size_t>(target)]) {
            --target;
        }
        if (replay.bases[static_cast<size_t>(target)]) {
            forceAhead(replay, target, scored);
        }
        replay.bases[static_cast<size_t>(target)] = move.runnerId;
    }

    replay.outs += std::max(record.outsAfter - record.outsBefore, 0);

    if (event.batterFate == BatterFate::Reaches) {
        if (event.batterReachedOnError) {
            ++replay.outs;
        } else {
            Base base = event.batterBase;
            if (event.batterAdvancedOnError) {
                base = naturalBatterBase(event.kind);
            }
            const int index = base == Base::Home ? 1 : static_cast<int>(base);
            if (index >= 4) {
                // Runners ahead of a home run batter score too.
                for (int ahead = 3; ahead >= 1; --ahead) {
                    if (replay.bases[static_cast<size_t>(ahead)]) {
                        scored.push_back(*replay.bases[static_cast<size_t>(ahead)]);
                        replay.bases[static_cast<size_t>(ahead)].reset();
                    }
                }
                scored.push_back(event.batterId);
            } else {
                for (int passed = 1; passed <= index; ++passed) {
                    if (replay.bases[static_cast<size_t>(passed)]) {
                        forceAhead(replay, passed, scored);
                    }
                }
                replay.bases[static_cast<size_t>(index)] = event.batterId;
            }
        }
    }
    return scored;
}

void addResponsibility(std::vector<PitcherResponsibility> &pitchers, const Runner &runner)
{
    for (PitcherResponsibility &entry : pitchers) {
        if (entry.pitcherId != runner.responsiblePitcherId) {
            continue;
        }
        if (std::find(entry.runnerIds.begin(), entry.runnerIds.end(), runner.playerId)
            == entry.runnerIds.end()) {
            entry.runnerIds.push_back(runner.playerId);
        }
        return;
    }
    PitcherResponsibility entry;
    entry.pitcherId = runner.responsiblePitcherId;
    entry.runnerIds.push_back(runner.playerId);
    pitchers.push_back(entry);
}

void addPitcher(std::vector<PitcherResponsibility> &pitchers, const std::string &pitcherId,
                const std::string &pitcherName)
{
    for (PitcherResponsibility &entry : pitchers) {
        if (entry.pitcherId == pitcherId) {
            if (entry.pitcherName.empty()) {
                entry.pitcherName = pitcherName;
            }
            return;
        }
    }
    PitcherResponsibility entry;
    entry.pitcherId = pitcherId;
    entry.pitcherName = pitcherName;
    pitchers.push_back(entry);
}

} // namespace

LedgerResult attributeRuns(const std::vector<PlateAppearanceRecord> &records)
{
    LedgerResult result;
    Replay replay;

    // Runners already aboard when the half-inning starts belong in the replay.
    if (!records.empty()) {
        for (const Runner &runner : records.front().before.runners()) {
            if (!runner.ghost && !runner.reachedOnError) {
                replay.bases[static_cast<size_t>(runner.base)] = runner.playerId;
            }
        }
    }

    for (const PlateAppearanceRecord &record : records) {
        addPitcher(result.pitchers, record.pitcherId, record.pitcherName);
        for (const Runner &runner : record.before.runners()) {
            addResponsibility(result.pitchers, runner);
        }

        if (record.outsBefore >= 3) {
            continue;
        }

        if (isErrorPlay(record.event)) {
            ++result.errorPlays;
        }

        const int replayOutsBefore = replay.outs;
        const std::vector<std::string> replayScored = replayPlay(replay, record);
        const bool replayOver = replay.outs >= 3 || replayOutsBefore >= 3;

        for (const ScoredRun &run : record.runs) {
            RunAttribution attribution;
            attribution.playIndex = record.index;
            attribution.runnerId = run.runnerId;
            attribution.runnerName = run.runnerName;
            attribution.ghost = run.ghost;
            attribution.chargedPitcherId = run.responsiblePitcherId;
            attribution.earned = !run.ghost && !run.reachedOnError && !replayOver
                && std::find(replayScored.begin(), replayScored.end(), run.runnerId)
                    != replayScored.end();

            ++result.totalRuns;
            ++result.runsByPitcher[attribution.chargedPitcherId];
            if (attribution.earned) {
                ++result.earnedRuns;
                ++result.earnedRunsByPitcher[attribution.chargedPitcherId];
            }
            result.runs.push_back(attribution);

            Runner scorer;
            scorer.playerId = run.runnerId;
            scorer.responsiblePitcherId = run.responsiblePitcherId;
            addResponsibility(result.pitchers, scorer);
        }

        for (const Runner &runner : record.after.runners()) {
            addResponsibility(result.pitchers, runner);
        }
    }

    result.contested = result.errorPlays >= 2;

    if (!records.empty()) {
        SBLOG_DEBUG(QStringLiteral("EarnedRunLedger"),
                    QStringLiteral("attributeRuns"),
                    QStringLiteral("runs_attributed"),
                    QStringLiteral("earned_run_reconstruction"),
                    QStringLiteral("error_free_replay"),
                    scorebook::logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"runs", result.totalRuns},
                                    {"earnedRuns", result.earnedRuns},
                                    {"replayOuts", replay.outs},
                                    {"errorPlays", result.errorPlays}}));
    }
    return result;
}

std::vector<PlateAppearanceRecord> applyLedger(std::vector<PlateAppearanceRecord> records,
                                               const LedgerResult &ledger)
{
    for (const RunAttribution &attribution : ledger.runs) {
        for (PlateAppearanceRecord &record : records) {
            if (record.index != attribution.playIndex) {
                continue;
            }
            for (ScoredRun &run : record.runs) {
                if (run.runnerId == attribution.runnerId) {
                    run.earned = attribution.earned;
                    run.chargedPitcherId = attribution.chargedPitcherId;
                }
            }
        }
    }
    return records;
}

} // namespace scorebook
