#pragma once

#include <optional>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace scorebook {

struct PlayContext {
    int outsBefore = 0;
    BaseState baseStateBefore;
};

struct RuleMatch {
    std::string ruleName;
    PlayKind kind = PlayKind::GenericOut;
    double confidence = 0.0;
};

struct NormalizeResult {
    PlayEvent event;
    // Set when the description fell back to a generic out.
    std::optional<Anomaly> warning;
};

/**
 * Turns a free-text play description into a PlayEvent.
 *
 * Classification walks an ordered rule table, most specific rule first. The
 * matched template is then resolved against the base state before the play:
 * explicit runner clauses in the text ("Smith scores", "Jones to 3rd",
 * "Lee out at home") win over the outcome's default advancement.
 */
class PlayNormalizer
{
public:
    explicit PlayNormalizer(double minimumConfidence = 0.5);

    // First rule matching the primary sentence (then the whole text) whose
    // confidence reaches the minimum; nothing means the pattern is unrecognized.
    std::optional<RuleMatch> classify(const std::string &description) const;

    NormalizeResult normalize(const RawPlay &raw, const PlayContext &context) const;

    double minimumConfidence() const { return m_minimumConfidence; }

private:
    double m_minimumConfidence;
};

// Lowercased text with season counters like "(12)" and filler words removed.
std::string cleanDescription(const std::string &description);

// Splits on sentence-ending periods, keeping initials such as "J.D." intact.
std::vector<std::string> splitSentences(const std::string &text);

// Scorer position numbers (1-9) in order of appearance.
std::vector<int> extractFielders(const std::string &text);

// Position of each distinct error charged in the text; 0 when the fielder is not
// named. Repeat mentions ("on the error") are the same error.
std::vector<int> extractErrorFielders(const std::string &text);

// Base the batter reaches on the outcome alone, before any misplay.
Base naturalBatterBase(PlayKind kind);

bool isHit(PlayKind kind);

} // namespace scorebook
