#include "scoring/timeline_assembler.hpp"

#include <algorithm>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "scoring/key_play_detector.hpp"
#include "scoring/play_normalizer.hpp"

namespace scorebook {

namespace {

std::string metadataString(const nlohmann::json &metadata, const char *key,
                           const std::string &fallback)
{
    if (!metadata.is_object() || !metadata.contains(key)) {
        return fallback;
    }
    const nlohmann::json &value = metadata.at(key);
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_null()) {
        return fallback;
    }
    return value.dump();
}

std::string halfLabel(int inning, HalfSide half)
{
    return toHalfString(half) + " " + std::to_string(inning);
}

// Plays listed after the third out never count toward totals.
bool counts(const PlateAppearanceRecord &record)
{
    return record.outsBefore < 3;
}

void checkSequence(const std::vector<HalfInningSimulation> &halfInnings)
{
    if (halfInnings.empty()) {
        throw IncompleteGameData("game has no plays", 1, HalfSide::Top);
    }
    for (size_t i = 0; i < halfInnings.size(); ++i) {
        const int inning = static_cast<int>(i / 2) + 1;
        const HalfSide half = i % 2 == 0 ? HalfSide::Top : HalfSide::Bottom;
        const HalfInningSimulation &actual = halfInnings[i];
        if (actual.inning != inning || actual.half != half) {
            throw IncompleteGameData("missing half-inning " + halfLabel(inning, half)
                                         + " before " + halfLabel(actual.inning, actual.half),
                                     inning, half);
        }
        if (i + 1 < halfInnings.size() && actual.outs < 3) {
            throw IncompleteGameData(halfLabel(inning, half) + " ended with "
                                         + std::to_string(actual.outs) + " outs",
                                     inning, half);
        }
    }
}

void checkFinalState(const HalfInningSimulation &last, int awayRuns, int homeRuns,
                     int regulationInnings)
{
    bool complete = false;
    if (last.inning >= regulationInnings) {
        if (last.half == HalfSide::Bottom) {
            complete = last.outs >= 3 ? homeRuns != awayRuns : homeRuns > awayRuns;
        } else {
            // Home already ahead, so the bottom half is not played.
            complete = last.outs >= 3 && homeRuns > awayRuns;
        }
    }
    if (!complete) {
        throw IncompleteGameData("game does not end in a completed state after "
                                     + halfLabel(last.inning, last.half) + " ("
                                     + std::to_string(awayRuns) + "-"
                                     + std::to_string(homeRuns) + ", "
                                     + std::to_string(last.outs) + " outs)",
                                 last.inning, last.half);
    }
}

PitcherLine &pitcherLineFor(std::vector<PitcherLine> &lines, const std::string &pitcherId,
                            const std::string &name, const std::string &team)
{
    for (PitcherLine &line : lines) {
        if (line.pitcherId == pitcherId) {
            return line;
        }
    }
    PitcherLine line;
    line.pitcherId = pitcherId;
    line.name = name;
    line.team = team;
    lines.push_back(line);
    return lines.back();
}

BatterLine &batterLineFor(std::vector<BatterLine> &lines, const std::string &batterId,
                          const std::string &name, const std::string &team)
{
    for (BatterLine &line : lines) {
        if (line.batterId == batterId) {
            return line;
        }
    }
    BatterLine line;
    line.batterId = batterId;
    line.name = name;
    line.team = team;
    lines.push_back(line);
    return lines.back();
}

} // namespace

IncompleteGameData::IncompleteGameData(const std::string &message, int inning, HalfSide half)
    : std::runtime_error(message)
    , m_inning(inning)
    , m_half(half)
{
}

Game assembleGame(const nlohmann::json &metadata,
                  const std::vector<HalfInningSimulation> &halfInnings,
                  const std::vector<LedgerResult> &ledgers,
                  const PipelineConfig &config)
{
    if (ledgers.size() != halfInnings.size()) {
        throw std::runtime_error("ledger count does not match half-inning count");
    }
    checkSequence(halfInnings);

    Game game;
    game.metadata = metadata;
    game.gameId = metadataString(metadata, "gameId", "");
    game.regulationInnings = config.regulationInnings;
    game.linescore.away.team = metadataString(metadata, "awayTeam", "away");
    game.linescore.home.team = metadataString(metadata, "homeTeam", "home");

    for (size_t i = 0; i < halfInnings.size(); ++i) {
        const HalfInningSimulation &simulation = halfInnings[i];
        const LedgerResult &ledger = ledgers[i];
        const bool top = simulation.half == HalfSide::Top;
        TeamLine &batting = top ? game.linescore.away : game.linescore.home;
        TeamLine &fielding = top ? game.linescore.home : game.linescore.away;

        HalfInning half;
        half.inning = simulation.inning;
        half.half = simulation.half;
        half.ghostRunnerPlaced = simulation.ghostRunnerPlaced;
        half.ghostRunner = simulation.ghostRunner;
        half.outs = simulation.outs;
        half.plays = applyLedger(simulation.records, ledger);
        half.runs = ledger.totalRuns;
        half.earnedRuns = ledger.earnedRuns;
        half.unearnedRuns = ledger.totalRuns - ledger.earnedRuns;
        half.runsByPitcher = ledger.runsByPitcher;
        half.earnedRunsByPitcher = ledger.earnedRunsByPitcher;
        half.pitchers = ledger.pitchers;
        half.earnedRunsContested = ledger.contested;

        game.anomalies.insert(game.anomalies.end(), simulation.anomalies.begin(),
                              simulation.anomalies.end());
        if (ledger.contested) {
            Anomaly anomaly;
            anomaly.kind = AnomalyKind::ContestedEarnedRuns;
            anomaly.inning = simulation.inning;
            anomaly.half = simulation.half;
            anomaly.detail = std::to_string(ledger.errorPlays)
                + " separate error plays in the half-inning";
            anomaly.recovery = "standard error-free reconstruction applied";
            game.anomalies.push_back(anomaly);
        }

        batting.runsByInning.push_back(half.runs);
        batting.runs += half.runs;

        for (PlateAppearanceRecord &record : half.plays) {
            record.keyPlay = isKeyPlay(record.event, record.wpBefore, record.wpAfter,
                                       config.keyPlayThreshold);
            if (record.keyPlay) {
                KeyPlay keyPlay;
                keyPlay.inning = half.inning;
                keyPlay.half = half.half;
                keyPlay.playIndex = record.index;
                keyPlay.batterName = record.batterName;
                keyPlay.description = record.description;
                keyPlay.wpBefore = record.wpBefore;
                keyPlay.wpAfter = record.wpAfter;
                game.keyPlays.push_back(keyPlay);
            }

            if (!counts(record)) {
                continue;
            }

            const PlayEvent &event = record.event;
            const bool batterInvolved = event.batterFate != BatterFate::NotInvolved;
            const bool hit = isHit(event.kind);
            if (hit) {
                ++batting.hits;
            }
            fielding.errors += static_cast<int>(event.errorFielders.size());

            PitcherLine &pitcher = pitcherLineFor(game.pitchers, record.pitcherId,
                                                  record.pitcherName, fielding.team);
            pitcher.outsRecorded += record.outsAfter - record.outsBefore;
            if (batterInvolved) {
                ++pitcher.battersFaced;
            }
            pitcher.hits += hit ? 1 : 0;
            pitcher.walks += event.kind == PlayKind::Walk ? 1 : 0;
            pitcher.strikeouts += event.kind == PlayKind::Strikeout ? 1 : 0;
            pitcher.homeRuns += event.kind == PlayKind::HomeRun ? 1 : 0;

            if (batterInvolved) {
                BatterLine &batter = batterLineFor(game.batters, record.batterId,
                                                   record.batterName, batting.team);
                ++batter.plateAppearances;
                batter.hits += hit ? 1 : 0;
                batter.walks += event.kind == PlayKind::Walk ? 1 : 0;
                batter.strikeouts += event.kind == PlayKind::Strikeout ? 1 : 0;
                batter.rbi += event.rbi;
                batter.notationByInning[half.inning].push_back(event.notation);
            }
        }

        for (const auto &[pitcherId, runs] : ledger.runsByPitcher) {
            pitcherLineFor(game.pitchers, pitcherId, "", fielding.team).runs += runs;
        }
        for (const auto &[pitcherId, runs] : ledger.earnedRunsByPitcher) {
            pitcherLineFor(game.pitchers, pitcherId, "", fielding.team).earnedRuns += runs;
        }

        game.halfInnings.push_back(half);
    }

    checkFinalState(halfInnings.back(), game.linescore.away.runs, game.linescore.home.runs,
                    config.regulationInnings);

    SBLOG_INFO(QStringLiteral("TimelineAssembler"),
               QStringLiteral("assembleGame"),
               QStringLiteral("game_assembled"),
               QStringLiteral("pipeline"),
               QStringLiteral("merge_half_innings"),
               scorebook::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"gameId", game.gameId},
                               {"halfInnings", game.halfInnings.size()},
                               {"away", game.linescore.away.runs},
                               {"home", game.linescore.home.runs},
                               {"keyPlays", game.keyPlays.size()},
                               {"anomalies", game.anomalies.size()}}));
    return game;
}

} // namespace scorebook
