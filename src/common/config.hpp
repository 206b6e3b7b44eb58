#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace scorebook {

struct PipelineConfig {
    // Innings beyond this count start with a runner on second.
    int regulationInnings = 9;
    // Minimum absolute win-probability swing for a key play.
    double keyPlayThreshold = 0.10;
    // Rule matches below this confidence fall back to a generic out.
    double minimumRuleConfidence = 0.5;
};

// Apply the keys present in a config object. Invalid values are logged and skipped.
PipelineConfig applyConfigJson(PipelineConfig config, const nlohmann::json &json);

// SCOREBOOK_REGULATION_INNINGS, SCOREBOOK_KEY_PLAY_THRESHOLD, SCOREBOOK_MIN_RULE_CONFIDENCE.
PipelineConfig applyEnvironment(PipelineConfig config);

/**
 * Resolve the pipeline configuration: defaults, then the JSON file at
 * configPath (or $SCOREBOOK_CONFIG when configPath is empty), then environment
 * overrides. A missing or unreadable file leaves the defaults in place.
 */
PipelineConfig loadPipelineConfig(const QString &configPath);

bool setRegulationInnings(PipelineConfig &config, int value);
bool setKeyPlayThreshold(PipelineConfig &config, double value);
bool setMinimumRuleConfidence(PipelineConfig &config, double value);

nlohmann::json toJson(const PipelineConfig &config);

} // namespace scorebook
