#include "cli/ScorebookCli.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <sstream>
#include <vector>

#include <QDir>
#include <QFile>
#include <QFileInfo>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "scoring/game_pipeline.hpp"
#include "scoring/play_normalizer.hpp"
#include "scoring/timeline_assembler.hpp"

namespace scorebook {

namespace {

QString usageText()
{
    return QStringLiteral(
        "Usage:\n"
        "  scorebook build --input GAME.json [--out PATH] [--format json|markdown]\n"
        "                  [--config PATH] [--regulation-innings N]\n"
        "                  [--key-play-threshold X] [--unknown-plays PATH]\n"
        "  scorebook batch --input DIR --out DIR [--jobs N] [--config PATH]\n"
        "  scorebook check-play --text DESCRIPTION\n"
        "Options:\n"
        "  --trace   write verbose trace logs\n");
}

QString getArgValue(const QStringList &args, const QString &key)
{
    const int idx = args.indexOf(key);
    if (idx < 0 || idx + 1 >= args.size()) {
        return {};
    }
    return args.at(idx + 1);
}

QString getFormat(const QStringList &args)
{
    const QString value = getArgValue(args, QStringLiteral("--format"));
    if (value.isEmpty()) {
        return QStringLiteral("json");
    }
    return value.toLower();
}

bool writeTextFile(const QString &path, const std::string &text)
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return false;
    }
    const QByteArray data = QByteArray::fromStdString(text);
    return file.write(data) == data.size();
}

// Reads a game file; the error text is set when the file is unusable.
std::optional<GameInput> readGameFile(const QString &path, std::string &error)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        error = "cannot open " + path.toStdString();
        return std::nullopt;
    }
    try {
        const nlohmann::json document = nlohmann::json::parse(file.readAll().toStdString());
        if (!document.is_object()) {
            error = "game file is not a JSON object";
            return std::nullopt;
        }
        return document.get<GameInput>();
    } catch (const nlohmann::json::parse_error &ex) {
        error = std::string("malformed JSON: ") + ex.what();
    } catch (const nlohmann::json::exception &ex) {
        error = std::string("unexpected field type: ") + ex.what();
    }
    return std::nullopt;
}

bool appendUnknownPlays(const QString &path, const Game &game)
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        return false;
    }
    for (const Anomaly &anomaly : game.anomalies) {
        if (anomaly.kind != AnomalyKind::UnrecognizedPlayPattern) {
            continue;
        }
        const std::string line = game.gameId + "\t" + std::to_string(anomaly.inning) + "\t"
            + toHalfString(anomaly.half) + "\t" + anomaly.description + "\n";
        file.write(QByteArray::fromStdString(line));
    }
    return true;
}

std::string formatProbability(double value)
{
    return QString::number(value, 'f', 3).toStdString();
}

std::string capitalized(const std::string &value)
{
    if (value.empty()) {
        return value;
    }
    std::string result = value;
    result[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(result[0])));
    return result;
}

} // namespace

std::string renderGameMarkdown(const Game &game)
{
    const TeamLine &away = game.linescore.away;
    const TeamLine &home = game.linescore.home;
    const size_t innings = std::max(away.runsByInning.size(), home.runsByInning.size());

    std::ostringstream out;
    out << "# " << away.team << " at " << home.team << "\n\n";
    if (!game.gameId.empty()) {
        out << "Game: " << game.gameId << "\n\n";
    }

    out << "| Team |";
    for (size_t i = 0; i < innings; ++i) {
        out << " " << (i + 1) << " |";
    }
    out << " R | H | E |\n|------|";
    for (size_t i = 0; i < innings; ++i) {
        out << "---|";
    }
    out << "---|---|---|\n";

    for (const TeamLine *line : {&away, &home}) {
        out << "| " << line->team << " |";
        for (size_t i = 0; i < innings; ++i) {
            if (i < line->runsByInning.size()) {
                out << " " << line->runsByInning[i] << " |";
            } else {
                // Home side did not need its last turn at bat.
                out << " X |";
            }
        }
        out << " " << line->runs << " | " << line->hits << " | " << line->errors << " |\n";
    }

    out << "\nFinal: " << away.team << " " << away.runs << ", " << home.team << " "
        << home.runs << "\n";

    out << "\n## Key Plays\n\n";
    if (game.keyPlays.empty()) {
        out << "No key plays.\n";
    }
    for (const KeyPlay &play : game.keyPlays) {
        out << "- " << capitalized(toHalfString(play.half)) << " " << play.inning << ": "
            << play.batterName << " - " << play.description << " (home WP "
            << formatProbability(play.wpBefore) << " -> " << formatProbability(play.wpAfter)
            << ")\n";
    }

    out << "\n## Anomalies\n\n";
    if (game.anomalies.empty()) {
        out << "None.\n";
    }
    for (const Anomaly &anomaly : game.anomalies) {
        out << "- [" << toAnomalyKindString(anomaly.kind) << "] "
            << toHalfString(anomaly.half) << " " << anomaly.inning;
        if (anomaly.playIndex >= 0) {
            out << ", play " << (anomaly.playIndex + 1);
        }
        out << ": " << anomaly.detail;
        if (!anomaly.recovery.empty()) {
            out << " (" << anomaly.recovery << ")";
        }
        out << "\n";
    }
    return out.str();
}

int ScorebookCli::run(int argc, char *argv[])
{
    QStringList args;
    args.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        args.push_back(QString::fromLocal8Bit(argv[i]));
    }

    if (args.size() < 2) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    const QString command = args.at(1);
    SBLOG_INFO(QStringLiteral("ScorebookCli"),
               QStringLiteral("run"),
               QStringLiteral("cli_command"),
               QStringLiteral("user_invocation"),
               QStringLiteral("cli"),
               scorebook::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"command", command.toStdString()}}));
    if (command == QStringLiteral("build")) {
        return runBuild(args);
    }
    if (command == QStringLiteral("batch")) {
        return runBatch(args);
    }
    if (command == QStringLiteral("check-play")) {
        return runCheckPlay(args);
    }

    std::cerr << usageText().toStdString();
    return 1;
}

std::optional<PipelineConfig> ScorebookCli::resolveConfig(const QStringList &args) const
{
    PipelineConfig config = loadPipelineConfig(getArgValue(args, QStringLiteral("--config")));

    const QString innings = getArgValue(args, QStringLiteral("--regulation-innings"));
    if (!innings.isEmpty()) {
        bool ok = false;
        const int value = innings.toInt(&ok);
        if (!ok || !setRegulationInnings(config, value)) {
            std::cerr << "Invalid --regulation-innings. Use a whole number of at least 1."
                      << std::endl;
            return std::nullopt;
        }
    }

    const QString threshold = getArgValue(args, QStringLiteral("--key-play-threshold"));
    if (!threshold.isEmpty()) {
        bool ok = false;
        const double value = threshold.toDouble(&ok);
        if (!ok || !setKeyPlayThreshold(config, value)) {
            std::cerr << "Invalid --key-play-threshold. Use a number between 0 and 1."
                      << std::endl;
            return std::nullopt;
        }
    }
    return config;
}

int ScorebookCli::runBuild(const QStringList &args)
{
    const QString inputPath = getArgValue(args, QStringLiteral("--input"));
    const QString outPath = getArgValue(args, QStringLiteral("--out"));
    const QString unknownPlaysPath = getArgValue(args, QStringLiteral("--unknown-plays"));
    const QString format = getFormat(args);

    if (inputPath.isEmpty()) {
        std::cerr << usageText().toStdString();
        return 1;
    }
    if (format != QStringLiteral("markdown") && format != QStringLiteral("json")) {
        std::cerr << "Invalid format. Use markdown or json." << std::endl;
        return 1;
    }

    const std::optional<PipelineConfig> config = resolveConfig(args);
    if (!config) {
        return 1;
    }

    std::string error;
    const std::optional<GameInput> input = readGameFile(inputPath, error);
    if (!input) {
        std::cerr << "Cannot read game file: " << error << std::endl;
        return 1;
    }

    Game game;
    try {
        game = GamePipeline(*config).build(*input);
    } catch (const IncompleteGameData &ex) {
        std::cerr << "Incomplete game data: " << ex.what() << std::endl;
        return 2;
    } catch (const std::exception &ex) {
        std::cerr << "Game build failed: " << ex.what() << std::endl;
        return 2;
    }

    if (!unknownPlaysPath.isEmpty() && !appendUnknownPlays(unknownPlaysPath, game)) {
        std::cerr << "Failed to write unknown plays file." << std::endl;
        return 1;
    }

    const std::string rendered = format == QStringLiteral("json")
        ? nlohmann::json(game).dump(2) + "\n"
        : renderGameMarkdown(game);

    SBLOG_INFO(QStringLiteral("ScorebookCli"),
               QStringLiteral("runBuild"),
               QStringLiteral("game_rendered"),
               QStringLiteral("user_invocation"),
               format,
               scorebook::logging::defaultWho(),
               QString::fromStdString(game.gameId),
               (nlohmann::json{{"anomalies", game.anomalies.size()},
                               {"out", outPath.toStdString()}}));

    if (outPath.isEmpty()) {
        std::cout << rendered;
        return 0;
    }
    if (!writeTextFile(outPath, rendered)) {
        std::cerr << "Failed to write output file." << std::endl;
        return 1;
    }
    return 0;
}

int ScorebookCli::runBatch(const QStringList &args)
{
    const QString inputPath = getArgValue(args, QStringLiteral("--input"));
    const QString outPath = getArgValue(args, QStringLiteral("--out"));
    const QString jobsValue = getArgValue(args, QStringLiteral("--jobs"));

    if (inputPath.isEmpty() || outPath.isEmpty()) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    int jobs = 0;
    if (!jobsValue.isEmpty()) {
        bool ok = false;
        jobs = jobsValue.toInt(&ok);
        if (!ok || jobs < 1) {
            std::cerr << "Invalid --jobs. Use a positive whole number." << std::endl;
            return 1;
        }
    }

    const std::optional<PipelineConfig> config = resolveConfig(args);
    if (!config) {
        return 1;
    }

    QDir inputDir(inputPath);
    if (!inputDir.exists()) {
        std::cerr << "Input path does not exist." << std::endl;
        return 1;
    }
    if (!QDir().mkpath(outPath)) {
        std::cerr << "Cannot create output directory." << std::endl;
        return 1;
    }

    std::vector<GameInput> inputs;
    std::vector<QString> names;
    bool anyFailed = false;

    const QFileInfoList entries = inputDir.entryInfoList(
        {QStringLiteral("*.json")}, QDir::Files, QDir::Name);
    for (const QFileInfo &entry : entries) {
        if (entry.fileName().endsWith(QStringLiteral(".game.json"))) {
            continue;
        }
        const QString name = entry.completeBaseName();
        std::string error;
        std::optional<GameInput> input = readGameFile(entry.absoluteFilePath(), error);
        if (!input) {
            anyFailed = true;
            std::cout << "failed " << name.toStdString() << ": " << error << "\n";
            continue;
        }
        inputs.push_back(std::move(*input));
        names.push_back(name);
    }

    const std::vector<GameOutcome> outcomes = GamePipeline(*config).buildAll(inputs, jobs);
    for (size_t i = 0; i < outcomes.size(); ++i) {
        const GameOutcome &outcome = outcomes[i];
        const std::string name = names[i].toStdString();
        if (!outcome.ok()) {
            anyFailed = true;
            std::cout << "failed " << name << ": " << outcome.error << "\n";
            continue;
        }
        const QString target = QDir(outPath).filePath(names[i] + QStringLiteral(".game.json"));
        if (!writeTextFile(target, nlohmann::json(*outcome.game).dump(2) + "\n")) {
            anyFailed = true;
            std::cout << "failed " << name << ": cannot write " << target.toStdString() << "\n";
            continue;
        }
        std::cout << "ok " << name << "\n";
    }

    SBLOG_INFO(QStringLiteral("ScorebookCli"),
               QStringLiteral("runBatch"),
               QStringLiteral("batch_written"),
               QStringLiteral("user_invocation"),
               QStringLiteral("thread_pool"),
               scorebook::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"files", entries.size()},
                               {"built", outcomes.size()},
                               {"anyFailed", anyFailed}}));
    return anyFailed ? 2 : 0;
}

int ScorebookCli::runCheckPlay(const QStringList &args)
{
    const QString text = getArgValue(args, QStringLiteral("--text"));
    if (text.isEmpty()) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    const std::optional<PipelineConfig> config = resolveConfig(args);
    if (!config) {
        return 1;
    }

    const PlayNormalizer normalizer(config->minimumRuleConfidence);
    const std::optional<RuleMatch> match = normalizer.classify(text.toStdString());

    nlohmann::json payload;
    payload["description"] = text.toStdString();
    payload["recognized"] = match.has_value();
    if (match) {
        RawPlay raw;
        raw.description = text.toStdString();
        const NormalizeResult result = normalizer.normalize(raw, PlayContext{});
        payload["rule"] = match->ruleName;
        payload["kind"] = toPlayKindString(match->kind);
        payload["confidence"] = match->confidence;
        payload["notation"] = result.event.notation;
        payload["batterFate"] = toBatterFateString(result.event.batterFate);
        payload["fielders"] = result.event.fielders;
    }

    std::cout << payload.dump(2) << std::endl;
    return 0;
}

} // namespace scorebook
