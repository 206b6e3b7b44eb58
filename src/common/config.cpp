#include "common/config.hpp"

#include <QFile>

#include "common/logging.hpp"

namespace scorebook {

namespace {

void warnRejected(const char *key, const nlohmann::json &value)
{
    SBLOG_WARN(QStringLiteral("Config"),
               QStringLiteral("applyConfig"),
               QStringLiteral("config_value_rejected"),
               QStringLiteral("validation"),
               QStringLiteral("keep_previous"),
               scorebook::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"key", key}, {"value", value}}));
}

} // namespace

bool setRegulationInnings(PipelineConfig &config, int value)
{
    if (value < 1) {
        return false;
    }
    config.regulationInnings = value;
    return true;
}

bool setKeyPlayThreshold(PipelineConfig &config, double value)
{
    if (value < 0.0 || value > 1.0) {
        return false;
    }
    config.keyPlayThreshold = value;
    return true;
}

bool setMinimumRuleConfidence(PipelineConfig &config, double value)
{
    if (value < 0.0 || value > 1.0) {
        return false;
    }
    config.minimumRuleConfidence = value;
    return true;
}

PipelineConfig applyConfigJson(PipelineConfig config, const nlohmann::json &json)
{
    if (!json.is_object()) {
        return config;
    }

    if (json.contains("regulationInnings")) {
        const auto &value = json.at("regulationInnings");
        if (!value.is_number_integer()
            || !setRegulationInnings(config, value.get<int>())) {
            warnRejected("regulationInnings", value);
        }
    }
    if (json.contains("keyPlayThreshold")) {
        const auto &value = json.at("keyPlayThreshold");
        if (!value.is_number() || !setKeyPlayThreshold(config, value.get<double>())) {
            warnRejected("keyPlayThreshold", value);
        }
    }
    if (json.contains("minimumRuleConfidence")) {
        const auto &value = json.at("minimumRuleConfidence");
        if (!value.is_number()
            || !setMinimumRuleConfidence(config, value.get<double>())) {
            warnRejected("minimumRuleConfidence", value);
        }
    }
    return config;
}

PipelineConfig applyEnvironment(PipelineConfig config)
{
    bool ok = false;

    const QString innings = qEnvironmentVariable("SCOREBOOK_REGULATION_INNINGS");
    if (!innings.isEmpty()) {
        const int value = innings.toInt(&ok);
        if (!ok || !setRegulationInnings(config, value)) {
            warnRejected("SCOREBOOK_REGULATION_INNINGS", innings.toStdString());
        }
    }

    const QString threshold = qEnvironmentVariable("SCOREBOOK_KEY_PLAY_THRESHOLD");
    if (!threshold.isEmpty()) {
        const double value = threshold.toDouble(&ok);
        if (!ok || !setKeyPlayThreshold(config, value)) {
            warnRejected("SCOREBOOK_KEY_PLAY_THRESHOLD", threshold.toStdString());
        }
    }

    const QString confidence = qEnvironmentVariable("SCOREBOOK_MIN_RULE_CONFIDENCE");
    if (!confidence.isEmpty()) {
        const double value = confidence.toDouble(&ok);
        if (!ok || !setMinimumRuleConfidence(config, value)) {
            warnRejected("SCOREBOOK_MIN_RULE_CONFIDENCE", confidence.toStdString());
        }
    }
    return config;
}

PipelineConfig loadPipelineConfig(const QString &configPath)
{
    PipelineConfig config;

    const QString path = configPath.isEmpty()
        ? qEnvironmentVariable("SCOREBOOK_CONFIG")
        : configPath;

    if (!path.isEmpty()) {
        QFile file(path);
        if (file.open(QIODevice::ReadOnly)) {
            try {
                config = applyConfigJson(config,
                                         nlohmann::json::parse(file.readAll().toStdString()));
            } catch (const nlohmann::json::parse_error &ex) {
                SBLOG_WARN(QStringLiteral("Config"),
                           QStringLiteral("loadPipelineConfig"),
                           QStringLiteral("config_parse_failed"),
                           QStringLiteral("startup"),
                           QStringLiteral("use_defaults"),
                           scorebook::logging::defaultWho(),
                           QString(),
                           (nlohmann::json{{"path", path.toStdString()},
                                           {"error", ex.what()}}));
            }
        } else {
            SBLOG_WARN(QStringLiteral("Config"),
                       QStringLiteral("loadPipelineConfig"),
                       QStringLiteral("config_open_failed"),
                       QStringLiteral("startup"),
                       QStringLiteral("use_defaults"),
                       scorebook::logging::defaultWho(),
                       QString(),
                       (nlohmann::json{{"path", path.toStdString()}}));
        }
    }

    config = applyEnvironment(config);

    SBLOG_DEBUG(QStringLiteral("Config"),
                QStringLiteral("loadPipelineConfig"),
                QStringLiteral("config_resolved"),
                QStringLiteral("startup"),
                QStringLiteral("defaults_file_env"),
                scorebook::logging::defaultWho(),
                QString(),
                toJson(config));
    return config;
}

nlohmann::json toJson(const PipelineConfig &config)
{
    return nlohmann::json{
        {"regulationInnings", config.regulationInnings},
        {"keyPlayThreshold", config.keyPlayThreshold},
        {"minimumRuleConfidence", config.minimumRuleConfidence}
    };
}

} // namespace scorebook
