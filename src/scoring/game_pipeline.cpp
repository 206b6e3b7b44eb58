#include "scoring/game_pipeline.hpp"

#include <algorithm>
#include <map>
#include <utility>

#include <QFuture>
#include <QList>
#include <QThread>
#include <QThreadPool>
#include <QtConcurrent/QtConcurrentRun>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "scoring/base_state_simulator.hpp"
#include "scoring/earned_run_ledger.hpp"
#include "scoring/timeline_assembler.hpp"

namespace scorebook {

std::vector<std::vector<RawPlay>> groupHalfInnings(const std::vector<RawPlay> &plays)
{
    std::vector<std::vector<RawPlay>> groups;
    for (const RawPlay &play : plays) {
        if (groups.empty() || groups.back().front().inning != play.inning
            || groups.back().front().half != play.half) {
            groups.emplace_back();
        }
        groups.back().push_back(play);
    }
    return groups;
}

std::string gameIdOf(const GameInput &input)
{
    if (input.metadata.is_object() && input.metadata.contains("gameId")) {
        const nlohmann::json &id = input.metadata.at("gameId");
        return id.is_string() ? id.get<std::string>() : id.dump();
    }
    return std::string();
}

GamePipeline::GamePipeline(PipelineConfig config)
    : m_config(config)
    , m_normalizer(config.minimumRuleConfidence)
{
}

Game GamePipeline::build(const GameInput &input) const
{
    const std::string gameId = gameIdOf(input);
    scorebook::logging::CorrelationScope scope(QString::fromStdString(gameId));

    SBLOG_INFO(QStringLiteral("GamePipeline"),
               QStringLiteral("build"),
               QStringLiteral("game_build_start"),
               QStringLiteral("pipeline"),
               QStringLiteral("normalize_simulate_attribute_assemble"),
               scorebook::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"gameId", gameId}, {"plays", input.plays.size()}}));

    std::vector<HalfInningSimulation> simulations;
    std::vector<LedgerResult> ledgers;
    // Last batter to complete a plate appearance, per batting half.
    std::map<HalfSide, std::pair<std::string, std::string>> lastBatter;

    for (const std::vector<RawPlay> &plays : groupHalfInnings(input.plays)) {
        HalfInningContext context;
        context.inning = plays.front().inning;
        context.half = plays.front().half;
        context.regulationInnings = m_config.regulationInnings;
        const auto previous = lastBatter.find(context.half);
        if (previous != lastBatter.end()) {
            context.ghostCandidateId = previous->second.first;
            context.ghostCandidateName = previous->second.second;
        }

        HalfInningSimulation simulation = simulateHalfInning(plays, context, m_normalizer);
        for (const PlateAppearanceRecord &record : simulation.records) {
            if (record.event.batterFate != BatterFate::NotInvolved && !record.batterId.empty()) {
                lastBatter[context.half] = {record.batterId, record.batterName};
            }
        }

        ledgers.push_back(attributeRuns(simulation.records));
        simulations.push_back(std::move(simulation));
    }

    return assembleGame(input.metadata, simulations, ledgers, m_config);
}

GameOutcome GamePipeline::buildOutcome(const GameInput &input) const
{
    GameOutcome outcome;
    outcome.gameId = gameIdOf(input);
    try {
        outcome.game = build(input);
    } catch (const IncompleteGameData &ex) {
        outcome.error = ex.what();
        SBLOG_ERROR(QStringLiteral("GamePipeline"),
                    QStringLiteral("buildAll"),
                    QStringLiteral("incomplete_game_data"),
                    QStringLiteral("pipeline"),
                    QStringLiteral("skip_game"),
                    scorebook::logging::defaultWho(),
                    QString::fromStdString(outcome.gameId),
                    (nlohmann::json{{"inning", ex.inning()},
                                    {"half", toHalfString(ex.half())},
                                    {"error", ex.what()}}));
    } catch (const std::exception &ex) {
        outcome.error = ex.what();
        SBLOG_ERROR(QStringLiteral("GamePipeline"),
                    QStringLiteral("buildAll"),
                    QStringLiteral("game_build_failed"),
                    QStringLiteral("pipeline"),
                    QStringLiteral("skip_game"),
                    scorebook::logging::defaultWho(),
                    QString::fromStdString(outcome.gameId),
                    (nlohmann::json{{"error", ex.what()}}));
    }
    return outcome;
}

std::vector<GameOutcome> GamePipeline::buildAll(const std::vector<GameInput> &inputs,
                                                int jobs) const
{
    QThreadPool pool;
    pool.setMaxThreadCount(jobs > 0 ? jobs : QThread::idealThreadCount());

    QList<QFuture<GameOutcome>> futures;
    for (const GameInput &input : inputs) {
        futures.append(QtConcurrent::run(&pool, [this, &input]() {
            return buildOutcome(input);
        }));
    }

    std::vector<GameOutcome> outcomes;
    outcomes.reserve(inputs.size());
    for (QFuture<GameOutcome> &future : futures) {
        outcomes.push_back(future.result());
    }

    SBLOG_INFO(QStringLiteral("GamePipeline"),
               QStringLiteral("buildAll"),
               QStringLiteral("batch_complete"),
               QStringLiteral("pipeline"),
               QStringLiteral("thread_pool"),
               scorebook::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"games", inputs.size()},
                               {"threads", pool.maxThreadCount()},
                               {"failed", std::count_if(outcomes.begin(), outcomes.end(),
                                                        [](const GameOutcome &outcome) {
                                                            return !outcome.ok();
                                                        })}}));
    return outcomes;
}

} // namespace scorebook
