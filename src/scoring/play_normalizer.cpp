#include "scoring/play_normalizer.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <regex>
#include <string>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace scorebook {

namespace {

// Called third strike, the scorer's backwards K.
const char *const kStrikeoutLooking = "\xEA\x9E\xB0";

struct PlayRule {
    const char *name;
    std::regex pattern;
    PlayKind kind;
    double confidence;
};

std::regex rulePattern(const char *expression)
{
    return std::regex(expression, std::regex::ECMAScript | std::regex::icase);
}

// First match wins, so compound phrasings come before the phrases they contain.
const std::vector<PlayRule> &ruleTable()
{
    static const std::vector<PlayRule> rules = {
        {"triple_play", rulePattern(R"(triple play)"), PlayKind::TriplePlay, 0.95},
        {"lined_into_double_play",
         rulePattern(R"((lines|lined|flies|flied|pops|popped) into (a |an )?(unassisted )?double play)"),
         PlayKind::DoublePlay, 0.95},
        {"grounded_into_double_play",
         rulePattern(R"((grounds|grounded|bunts|bunted) into (a |an )?(unassisted )?double play)"),
         PlayKind::DoublePlay, 0.95},
        {"double_play", rulePattern(R"(double play)"), PlayKind::DoublePlay, 0.8},
        {"catcher_interference",
         rulePattern(R"(catcher'?s? interference|interference by catcher)"),
         PlayKind::CatcherInterference, 0.95},
        {"sacrifice_fly", rulePattern(R"(sacrifice fly|sac fly)"), PlayKind::SacrificeFly, 0.95},
        {"sacrifice_bunt", rulePattern(R"(sacrifice bunt|sac bunt)"), PlayKind::SacrificeBunt, 0.95},
        {"hit_by_pitch", rulePattern(R"(hit by (a )?pitch)"), PlayKind::HitByPitch, 0.95},
        {"intentional_walk", rulePattern(R"(intentional(ly)? walk)"), PlayKind::Walk, 0.95},
        {"walk", rulePattern(R"(\bwalks\b|\bwalked\b|base on balls)"), PlayKind::Walk, 0.9},
        {"strikeout_looking",
         rulePattern(R"(called out on strikes|(strikes|struck) out looking)"),
         PlayKind::Strikeout, 0.95},
        {"strikeout", rulePattern(R"(strikes out|struck out|strikeout)"), PlayKind::Strikeout, 0.95},
        {"home_run", rulePattern(R"(\bhomers\b|\bhomered\b|home run|grand slam)"),
         PlayKind::HomeRun, 0.95},
        {"triple", rulePattern(R"(\btripl(e|es|ed)\b)"), PlayKind::Triple, 0.95},
        {"double", rulePattern(R"(\bdoubl(e|es|ed)\b)"), PlayKind::Double, 0.95},
        {"single", rulePattern(R"(\bsingl(e|es|ed)\b)"), PlayKind::Single, 0.95},
        {"fielders_choice",
         rulePattern(R"(fielder'?s'? choice|force ?out|forced out)"),
         PlayKind::FieldersChoice, 0.9},
        {"reached_on_error",
         rulePattern(R"((reach|reaches|reached|safe) on (a |an )?([a-z' ]+ )?error)"),
         PlayKind::Error, 0.95},
        {"caught_stealing", rulePattern(R"(caught stealing|picked off|picks off)"),
         PlayKind::CaughtStealing, 0.9},
        {"stolen_base", rulePattern(R"(\bsteals\b|\bstole\b|stolen base)"), PlayKind::StolenBase, 0.9},
        {"wild_pitch", rulePattern(R"(wild pitch)"), PlayKind::WildPitch, 0.9},
        {"passed_ball", rulePattern(R"(passed ball)"), PlayKind::PassedBall, 0.9},
        {"balk", rulePattern(R"(\bbalks?\b)"), PlayKind::Balk, 0.9},
        {"ground_out", rulePattern(R"(ground(s|ed)? ?out|bunts? out)"), PlayKind::GroundOut, 0.9},
        {"line_out", rulePattern(R"(lines out|lined out|line ?out|line drive out)"),
         PlayKind::FlyOut, 0.9},
        {"pop_out", rulePattern(R"(pops (out|up)|popped (out|up)|pop ?out|pop ?fly|pop ?up)"),
         PlayKind::FlyOut, 0.9},
        {"fly_out", rulePattern(R"(flies out|flied out|fly ?out|fly ?ball)"), PlayKind::FlyOut, 0.9},
        {"foul_out", rulePattern(R"(fouls out|fouled out|foul ?out)"), PlayKind::FlyOut, 0.85},
        {"error_mention", rulePattern(R"(\berror\b)"), PlayKind::Error, 0.6},
        {"out_mention", rulePattern(R"(\bout\b)"), PlayKind::GenericOut, 0.3},
    };
    return rules;
}

const PlayRule *firstMatch(const std::string &text)
{
    for (const PlayRule &rule : ruleTable()) {
        if (std::regex_search(text, rule.pattern)) {
            return &rule;
        }
    }
    return nullptr;
}

// Rule for an already cleaned description, ignoring the confidence floor.
const PlayRule *lookupRule(const std::string &cleaned)
{
    if (cleaned.empty()) {
        return nullptr;
    }
    const std::vector<std::string> sentences = splitSentences(cleaned);
    const PlayRule *rule = sentences.empty() ? nullptr : firstMatch(sentences.front());
    return rule ? rule : firstMatch(cleaned);
}

std::string trim(const std::string &value)
{
    size_t start = 0;
    while (start < value.size()
           && std::isspace(static_cast<unsigned char>(value[start]))) {
        ++start;
    }
    size_t end = value.size();
    while (end > start
           && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
        --end;
    }
    return value.substr(start, end - start);
}

std::string lowercase(const std::string &value)
{
    std::string lowered;
    lowered.reserve(value.size());
    for (char c : value) {
        lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return lowered;
}

bool contains(const std::string &text, const char *needle)
{
    return text.find(needle) != std::string::npos;
}

int positionNumber(const std::string &words)
{
    static const std::map<std::string, int> positions = {
        {"pitcher", 1},
        {"catcher", 2},
        {"first baseman", 3},
        {"second baseman", 4},
        {"third baseman", 5},
        {"shortstop", 6},
        {"left fielder", 7},
        {"left field", 7},
        {"center fielder", 8},
        {"center field", 8},
        {"right fielder", 9},
        {"right field", 9},
    };
    const auto it = positions.find(words);
    return it == positions.end() ? 0 : it->second;
}

int baseIndex(Base base)
{
    return static_cast<int>(base);
}

Base toBase(int index)
{
    if (index <= 0) {
        return Base::Home;
    }
    if (index >= 4) {
        return Base::Scored;
    }
    return static_cast<Base>(index);
}

std::optional<Base> parseBaseToken(const std::string &token)
{
    if (token == "1st") {
        return Base::First;
    }
    if (token == "2nd") {
        return Base::Second;
    }
    if (token == "3rd") {
        return Base::Third;
    }
    if (token == "home") {
        return Base::Home;
    }
    return std::nullopt;
}

struct RunnerClause {
    // Destination, or the base where the runner was put out (Home for the plate).
    Base to = Base::First;
    bool out = false;
    bool onError = false;
};

std::optional<RunnerClause> parseClauseTail(const std::string &tail)
{
    static const std::regex scores(R"(^\s*(scores|scored)\b)");
    static const std::regex advances(R"(^\s*(?:advances |advanced |moves )?to (1st|2nd|3rd|home)\b)");
    static const std::regex outAt(
        R"(^\s*(?:out|thrown out|tagged out|forced out|out stretching)\s+at\s+(1st|2nd|3rd|home)\b)");
    static const std::regex doubledOff(R"(^\s*doubled off (?:at )?(1st|2nd|3rd)\b)");
    static const std::regex caught(
        R"(^\s*(?:picked off and )?caught stealing (?:at )?(2nd|3rd|home)\b)");
    static const std::regex pickedOff(R"(^\s*picked off (?:at )?(1st|2nd|3rd)\b)");
    static const std::regex steals(R"(^\s*steals (2nd|3rd|home)\b)");
    static const std::regex misplay(R"(\berror\b|passed ball)");

    RunnerClause clause;
    clause.onError = std::regex_search(tail, misplay);

    std::smatch match;
    if (std::regex_search(tail, match, scores)) {
        clause.to = Base::Scored;
        return clause;
    }
    if (std::regex_search(tail, match, advances) || std::regex_search(tail, match, steals)) {
        const std::optional<Base> base = parseBaseToken(match[1].str());
        clause.to = *base == Base::Home ? Base::Scored : *base;
        return clause;
    }
    if (std::regex_search(tail, match, outAt) || std::regex_search(tail, match, doubledOff)
        || std::regex_search(tail, match, caught) || std::regex_search(tail, match, pickedOff)) {
        clause.to = *parseBaseToken(match[1].str());
        clause.out = true;
        return clause;
    }
    return std::nullopt;
}

bool isWordChar(char c)
{
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

// An out wins over any advance; otherwise the furthest base is kept.
void mergeClause(std::optional<RunnerClause> &merged, const RunnerClause &clause)
{
    if (!merged) {
        merged = clause;
        return;
    }
    if (merged->out) {
        return;
    }
    if (clause.out) {
        merged = clause;
        return;
    }
    if (baseIndex(clause.to) > baseIndex(merged->to)) {
        merged->to = clause.to;
    }
    merged->onError = merged->onError || clause.onError;
}

// Every clause naming the runner counts, so "steals 2nd" followed by
// "advances to 3rd on a throwing error" ends on third.
std::optional<RunnerClause> findClause(const std::vector<std::string> &sentences,
                                       const std::string &name,
                                       size_t firstSentence)
{
    if (name.empty()) {
        return std::nullopt;
    }
    std::optional<RunnerClause> merged;
    for (size_t i = firstSentence; i < sentences.size(); ++i) {
        const std::string &sentence = sentences[i];
        size_t pos = sentence.find(name);
        while (pos != std::string::npos) {
            const size_t end = pos + name.size();
            const bool startsWord = pos == 0 || !isWordChar(sentence[pos - 1]);
            const bool endsWord = end >= sentence.size() || !isWordChar(sentence[end]);
            if (startsWord && endsWord) {
                if (auto clause = parseClauseTail(sentence.substr(end))) {
                    mergeClause(merged, *clause);
                }
            }
            pos = sentence.find(name, pos + 1);
        }
    }
    return merged;
}

// Full name first, then the surname alone.
std::optional<RunnerClause> findRunnerClause(const std::vector<std::string> &sentences,
                                             const std::string &displayName,
                                             size_t firstSentence)
{
    const std::string fullName = trim(lowercase(displayName));
    if (auto clause = findClause(sentences, fullName, firstSentence)) {
        return clause;
    }

    std::vector<std::string> tokens;
    size_t start = 0;
    while (start < fullName.size()) {
        const size_t space = fullName.find(' ', start);
        const size_t end = space == std::string::npos ? fullName.size() : space;
        if (end > start) {
            tokens.push_back(fullName.substr(start, end - start));
        }
        start = end + 1;
    }
    while (tokens.size() > 1) {
        const std::string &last = tokens.back();
        if (last == "jr." || last == "jr" || last == "sr." || last == "sr"
            || last == "ii" || last == "iii") {
            tokens.pop_back();
            continue;
        }
        break;
    }
    if (tokens.size() < 2) {
        return std::nullopt;
    }
    return findClause(sentences, tokens.back(), firstSentence);
}

int genericRunCount(const std::string &text)
{
    static const std::regex pattern(R"(\b(?:(\d|one|two|three|four) )?runs? scores?\b)");
    int total = 0;
    for (auto it = std::sregex_iterator(text.begin(), text.end(), pattern);
         it != std::sregex_iterator(); ++it) {
        const std::string count = (*it)[1].str();
        if (count.empty() || count == "one") {
            total += 1;
        } else if (count == "two") {
            total += 2;
        } else if (count == "three") {
            total += 3;
        } else if (count == "four") {
            total += 4;
        } else {
            total += std::stoi(count);
        }
    }
    return total;
}

int leadBase(const BaseState &state)
{
    for (int index = 3; index >= 1; --index) {
        if (state.occupied(toBase(index))) {
            return index;
        }
    }
    return 0;
}

// Lead runner whose next base is open; the runner on third can always try for home.
int stealerBase(const BaseState &state)
{
    for (int index = 3; index >= 1; --index) {
        if (!state.occupied(toBase(index))) {
            continue;
        }
        if (index == 3 || !state.occupied(toBase(index + 1))) {
            return index;
        }
    }
    return 0;
}

// Origin base -> base where that runner is put out when the text names nobody.
std::map<int, int> defaultOuts(PlayKind kind, const std::string &ruleName,
                               const BaseState &state)
{
    std::map<int, int> outs;
    const int lead = leadBase(state);
    switch (kind) {
    case PlayKind::FieldersChoice:
        if (state.occupied(Base::First)) {
            outs[1] = 2;
        } else if (lead > 0) {
            outs[lead] = lead + 1 >= 4 ? 0 : lead + 1;
        }
        break;
    case PlayKind::DoublePlay:
        if (ruleName == "lined_into_double_play") {
            if (lead > 0) {
                outs[lead] = lead;
            }
        } else if (state.occupied(Base::First)) {
            outs[1] = 2;
        } else if (lead > 0) {
            outs[lead] = lead + 1 >= 4 ? 0 : lead + 1;
        }
        break;
    case PlayKind::TriplePlay: {
        int taken = 0;
        for (int index = 1; index <= 3 && taken < 2; ++index) {
            if (state.occupied(toBase(index))) {
                outs[index] = index + 1 >= 4 ? 0 : index + 1;
                ++taken;
            }
        }
        break;
    }
    case PlayKind::CaughtStealing: {
        const int stealer = stealerBase(state);
        if (stealer > 0) {
            outs[stealer] = stealer + 1 >= 4 ? 0 : stealer + 1;
        }
        break;
    }
    default:
        break;
    }
    return outs;
}

int defaultTarget(PlayKind kind, int origin, int stealer)
{
    switch (kind) {
    case PlayKind::Single:
        return std::min(origin + 2, 4);
    case PlayKind::Double:
    case PlayKind::Triple:
    case PlayKind::HomeRun:
        return 4;
    case PlayKind::SacrificeFly:
        return origin == 3 ? 4 : origin;
    case PlayKind::SacrificeBunt:
    case PlayKind::WildPitch:
    case PlayKind::PassedBall:
    case PlayKind::Balk:
        return std::min(origin + 1, 4);
    case PlayKind::StolenBase:
        return origin == stealer ? std::min(origin + 1, 4) : origin;
    default:
        return origin;
    }
}

std::string joinFielders(const std::vector<int> &fielders, const char *separator)
{
    std::string joined;
    for (size_t i = 0; i < fielders.size(); ++i) {
        if (i > 0) {
            joined += separator;
        }
        joined += std::to_string(fielders[i]);
    }
    return joined;
}

std::string notationFor(const PlayEvent &event, const std::string &text)
{
    const std::vector<int> &fielders = event.fielders;
    const std::string first = fielders.empty() ? std::string() : std::to_string(fielders.front());

    switch (event.kind) {
    case PlayKind::Strikeout:
        return event.ruleName == "strikeout_looking" ? kStrikeoutLooking : "K";
    case PlayKind::Walk:
        return event.ruleName == "intentional_walk" ? "IBB" : "BB";
    case PlayKind::HitByPitch:
        return "HBP";
    case PlayKind::Single:
        return "1B";
    case PlayKind::Double:
        return "2B";
    case PlayKind::Triple:
        return "3B";
    case PlayKind::HomeRun:
        return "HR";
    case PlayKind::GroundOut:
        if (fielders.size() == 1) {
            return contains(text, "unassisted") ? "GO" + first + "U" : "GO" + first;
        }
        return "GO" + joinFielders(fielders, "-");
    case PlayKind::FlyOut:
        if (event.ruleName == "line_out") {
            return "L" + first;
        }
        if (event.ruleName == "pop_out") {
            return "P" + first;
        }
        return "F" + first;
    case PlayKind::FieldersChoice:
        return "FC";
    case PlayKind::DoublePlay:
        return fielders.empty() ? "DP" : joinFielders(fielders, "-") + " DP";
    case PlayKind::TriplePlay:
        return fielders.empty() ? "TP" : joinFielders(fielders, "-") + " TP";
    case PlayKind::SacrificeFly:
        return "SF" + first;
    case PlayKind::SacrificeBunt:
        return fielders.empty() ? "SAC" : "SAC " + joinFielders(fielders, "-");
    case PlayKind::Error:
        if (!event.errorFielders.empty() && event.errorFielders.front() > 0) {
            return "E" + std::to_string(event.errorFielders.front());
        }
        return "E";
    case PlayKind::CatcherInterference:
        return "CI";
    case PlayKind::StolenBase:
        return "SB";
    case PlayKind::CaughtStealing:
        return "CS";
    case PlayKind::WildPitch:
        return "WP";
    case PlayKind::PassedBall:
        return "PB";
    case PlayKind::Balk:
        return "BK";
    case PlayKind::GenericOut:
        break;
    }
    return "-";
}

int rbiFor(const PlayEvent &event, int outsBefore)
{
    int eligible = 0;
    for (const RunnerMove &move : event.runnerMoves) {
        if (!move.out && move.to == Base::Scored && !move.onError) {
            ++eligible;
        }
    }
    if (event.batterFate == BatterFate::Reaches && event.batterBase == Base::Scored
        && !event.batterAdvancedOnError) {
        ++eligible;
    }

    switch (event.kind) {
    case PlayKind::DoublePlay:
    case PlayKind::TriplePlay:
    case PlayKind::WildPitch:
    case PlayKind::PassedBall:
    case PlayKind::Balk:
    case PlayKind::StolenBase:
    case PlayKind::CaughtStealing:
    case PlayKind::GenericOut:
        return 0;
    case PlayKind::Error:
    case PlayKind::CatcherInterference:
        // With fewer than two outs the run would have scored on the out anyway.
        return outsBefore < 2 ? eligible : 0;
    default:
        return eligible;
    }
}

} // namespace

std::string cleanDescription(const std::string &description)
{
    static const std::regex counters(R"(\s*\(\d+\))");
    static const std::regex fillers(R"(\b(?:deep|short|weak|thru|hole)\b)");
    static const std::regex spaces(R"(\s+)");
    static const std::regex spaceBeforePunctuation(R"(\s+([.,;]))");

    std::string cleaned = std::regex_replace(lowercase(description), counters, "");
    cleaned = std::regex_replace(cleaned, fillers, "");
    cleaned = std::regex_replace(cleaned, spaces, " ");
    cleaned = std::regex_replace(cleaned, spaceBeforePunctuation, "$1");
    return trim(cleaned);
}

std::vector<std::string> splitSentences(const std::string &text)
{
    std::vector<std::string> sentences;
    std::string current;

    auto flush = [&]() {
        const std::string sentence = trim(current);
        if (!sentence.empty()) {
            sentences.push_back(sentence);
        }
        current.clear();
    };

    for (size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (c != '.') {
            current.push_back(c);
            continue;
        }

        const bool atBoundary = i + 1 >= text.size() || text[i + 1] == ' ';
        const size_t space = current.find_last_of(' ');
        const std::string word = space == std::string::npos ? current : current.substr(space + 1);
        const bool abbreviation = word.size() <= 1 || word.find('.') != std::string::npos
            || word == "jr" || word == "sr" || word == "st";
        if (!atBoundary || abbreviation) {
            current.push_back(c);
            continue;
        }
        flush();
    }
    flush();
    return sentences;
}

std::vector<int> extractFielders(const std::string &text)
{
    static const std::regex pattern(
        R"(\b(pitcher|catcher|first baseman|second baseman|third baseman|shortstop|)"
        R"(left fielder|center fielder|right fielder|left field|center field|right field)\b)");

    std::vector<int> fielders;
    for (auto it = std::sregex_iterator(text.begin(), text.end(), pattern);
         it != std::sregex_iterator(); ++it) {
        fielders.push_back(positionNumber((*it)[1].str()));
    }
    return fielders;
}

std::vector<int> extractErrorFielders(const std::string &text)
{
    static const std::regex pattern(
        R"(\b(?:(throwing|fielding|catching) )?error\b(?: by (pitcher|catcher|first baseman|)"
        R"(second baseman|third baseman|shortstop|left fielder|center fielder|right fielder))?)");

    struct ChargedError {
        std::string kind;
        int fielder = 0;
    };
    std::vector<ChargedError> charged;
    for (auto it = std::sregex_iterator(text.begin(), text.end(), pattern);
         it != std::sregex_iterator(); ++it) {
        const std::string kind = (*it)[1].str();
        const int fielder = (*it)[2].matched ? positionNumber((*it)[2].str()) : 0;

        // "on the error" refers back to an error already charged.
        if (fielder == 0) {
            if (charged.empty()) {
                charged.push_back(ChargedError{kind, 0});
            }
            continue;
        }

        bool repeat = false;
        for (ChargedError &entry : charged) {
            if (entry.fielder == 0) {
                entry = ChargedError{kind, fielder};
                repeat = true;
                break;
            }
            if (entry.fielder == fielder
                && (entry.kind == kind || entry.kind.empty() || kind.empty())) {
                repeat = true;
                break;
            }
        }
        if (!repeat) {
            charged.push_back(ChargedError{kind, fielder});
        }
    }

    std::vector<int> fielders;
    fielders.reserve(charged.size());
    for (const ChargedError &entry : charged) {
        fielders.push_back(entry.fielder);
    }
    return fielders;
}

Base naturalBatterBase(PlayKind kind)
{
    switch (kind) {
    case PlayKind::Walk:
    case PlayKind::HitByPitch:
    case PlayKind::Single:
    case PlayKind::FieldersChoice:
    case PlayKind::Error:
    case PlayKind::CatcherInterference:
        return Base::First;
    case PlayKind::Double:
        return Base::Second;
    case PlayKind::Triple:
        return Base::Third;
    case PlayKind::HomeRun:
        return Base::Scored;
    default:
        return Base::Home;
    }
}

bool isHit(PlayKind kind)
{
    return kind == PlayKind::Single || kind == PlayKind::Double
        || kind == PlayKind::Triple || kind == PlayKind::HomeRun;
}

PlayNormalizer::PlayNormalizer(double minimumConfidence)
    : m_minimumConfidence(minimumConfidence)
{
}

std::optional<RuleMatch> PlayNormalizer::classify(const std::string &description) const
{
    const PlayRule *rule = lookupRule(cleanDescription(description));
    if (!rule || rule->confidence < m_minimumConfidence) {
        return std::nullopt;
    }
    return RuleMatch{rule->name, rule->kind, rule->confidence};
}

NormalizeResult PlayNormalizer::normalize(const RawPlay &raw, const PlayContext &context) const
{
    NormalizeResult result;
    PlayEvent &event = result.event;
    event.batterId = raw.batterId;
    event.batterName = raw.batterName;

    const BaseState &state = context.baseStateBefore;
    const std::vector<Runner> runners = state.runners();
    const std::string text = cleanDescription(raw.description);
    const std::vector<std::string> sentences = splitSentences(text);
    const std::string primary = sentences.empty() ? text : sentences.front();

    const std::optional<RuleMatch> match = classify(raw.description);
    if (!match) {
        event.kind = PlayKind::GenericOut;
        event.notation = "-";
        event.ruleName = "fallback_generic_out";
        event.batterFate = BatterFate::Out;
        event.outsOnPlay = 1;
        for (const Runner &runner : runners) {
            RunnerMove hold;
            hold.from = runner.base;
            hold.to = runner.base;
            hold.runnerId = runner.playerId;
            event.runnerMoves.push_back(hold);
        }

        const PlayRule *weak = lookupRule(text);
        Anomaly warning;
        warning.kind = AnomalyKind::UnrecognizedPlayPattern;
        warning.inning = raw.inning;
        warning.half = raw.half;
        warning.description = raw.description;
        warning.detail = weak
            ? std::string("best rule ") + weak->name + " is below the minimum confidence"
            : std::string("no classification rule matched");
        warning.recovery = "treated as generic out with no runner advancement";
        result.warning = warning;

        SBLOG_WARN(QStringLiteral("PlayNormalizer"),
                   QStringLiteral("normalize"),
                   QStringLiteral("unrecognized_play_pattern"),
                   QStringLiteral("classification"),
                   QStringLiteral("generic_out_fallback"),
                   scorebook::logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"inning", raw.inning},
                                   {"half", toHalfString(raw.half)},
                                   {"description", raw.description},
                                   {"detail", warning.detail}}));
        return result;
    }

    event.kind = match->kind;
    event.ruleName = match->ruleName;
    event.confidence = match->confidence;
    event.fielders = extractFielders(primary);
    event.errorFielders = extractErrorFielders(text);
    if (event.kind == PlayKind::CatcherInterference && event.errorFielders.empty()) {
        event.errorFielders.push_back(2);
    }

    // Batter.
    Base batterBase = naturalBatterBase(event.kind);
    switch (event.kind) {
    case PlayKind::StolenBase:
    case PlayKind::CaughtStealing:
    case PlayKind::WildPitch:
    case PlayKind::PassedBall:
    case PlayKind::Balk:
        event.batterFate = BatterFate::NotInvolved;
        break;
    default:
        event.batterFate = batterBase == Base::Home ? BatterFate::Out : BatterFate::Reaches;
        break;
    }
    event.batterReachedOnError = event.kind == PlayKind::Error
        || event.kind == PlayKind::CatcherInterference;

    if (event.kind == PlayKind::Strikeout && contains(primary, "reache")) {
        // Dropped third strike.
        event.batterFate = BatterFate::Reaches;
        batterBase = Base::First;
        event.batterReachedOnError = contains(primary, "passed ball") || contains(primary, "error");
    }

    if (event.batterFate == BatterFate::Reaches) {
        if (auto clause = findRunnerClause(sentences, raw.batterName, 1)) {
            if (clause->out) {
                event.batterFate = BatterFate::Out;
                batterBase = Base::Home;
            } else if (baseIndex(clause->to) > baseIndex(batterBase)) {
                batterBase = clause->to;
                event.batterAdvancedOnError = clause->onError;
            }
        }
    }
    event.batterBase = event.batterFate == BatterFate::Reaches ? batterBase : Base::Home;
    const bool batterReaches = event.batterFate == BatterFate::Reaches;

    // Runners: explicit clauses first, then the generic run count, then defaults.
    struct RunnerFate {
        int to = 0;
        bool out = false;
        bool onError = false;
        bool stated = false;
    };
    std::map<int, RunnerFate> fates;
    for (const Runner &runner : runners) {
        if (auto clause = findRunnerClause(sentences, runner.name, 0)) {
            fates[baseIndex(runner.base)] = RunnerFate{baseIndex(clause->to), clause->out,
                                                       clause->onError, true};
        }
    }

    const int genericRuns = genericRunCount(text);
    const bool anyStated = !fates.empty() || genericRuns > 0;
    const std::map<int, int> victims = defaultOuts(event.kind, event.ruleName, state);
    const int stealer = stealerBase(state);

    for (const Runner &runner : runners) {
        const int origin = baseIndex(runner.base);
        if (fates.count(origin)) {
            continue;
        }
        if (anyStated) {
            fates[origin] = RunnerFate{origin, false, false, false};
        } else if (victims.count(origin)) {
            fates[origin] = RunnerFate{victims.at(origin), true, false, false};
        } else {
            fates[origin] = RunnerFate{defaultTarget(event.kind, origin, stealer), false, false, false};
        }
    }

    int statedScorers = 0;
    for (const auto &[origin, fate] : fates) {
        if (fate.stated && !fate.out && fate.to >= 4) {
            ++statedScorers;
        }
    }
    int unnamedRuns = genericRuns - statedScorers;
    for (const Runner &runner : runners) {
        if (unnamedRuns <= 0) {
            break;
        }
        RunnerFate &fate = fates[baseIndex(runner.base)];
        if (fate.stated) {
            continue;
        }
        fate = RunnerFate{4, false, false, true};
        --unnamedRuns;
    }

    int outs = event.batterFate == BatterFate::Out ? 1 : 0;
    for (const auto &[origin, fate] : fates) {
        if (fate.out) {
            ++outs;
        }
    }

    if (context.outsBefore + outs >= 3) {
        // Nothing scores behind the third out unless the text says so.
        for (auto &[origin, fate] : fates) {
            if (!fate.stated && !fate.out) {
                fate.to = origin;
            }
        }
    } else {
        int trailing = batterReaches ? baseIndex(batterBase) : 0;
        bool forceChain = batterReaches;
        for (int origin = 1; origin <= 3; ++origin) {
            const auto it = fates.find(origin);
            if (it == fates.end()) {
                forceChain = false;
                continue;
            }
            RunnerFate &fate = it->second;
            if (fate.out) {
                continue;
            }
            if (!fate.stated && fate.to < 4) {
                int minimum = trailing > 0 ? trailing + 1 : 0;
                if (forceChain) {
                    minimum = std::max(minimum, origin + 1);
                }
                if (fate.to < minimum) {
                    fate.to = std::min(minimum, 4);
                }
            }
            trailing = std::min(fate.to, 4);
        }
    }

    for (const Runner &runner : runners) {
        const RunnerFate &fate = fates.at(baseIndex(runner.base));
        RunnerMove move;
        move.from = runner.base;
        move.to = toBase(fate.to);
        move.out = fate.out;
        move.onError = fate.onError;
        move.runnerId = runner.playerId;
        event.runnerMoves.push_back(move);
    }

    event.outsOnPlay = outs;
    event.cleanOuts = event.errorFielders.empty();
    event.rbi = rbiFor(event, context.outsBefore);
    event.notation = notationFor(event, text);

    SBLOG_DEBUG(QStringLiteral("PlayNormalizer"),
                QStringLiteral("normalize"),
                QStringLiteral("play_classified"),
                QStringLiteral("classification"),
                QStringLiteral("rule_table"),
                scorebook::logging::defaultWho(),
                QString(),
                (nlohmann::json{{"rule", event.ruleName},
                                {"kind", toPlayKindString(event.kind)},
                                {"notation", event.notation},
                                {"outsOnPlay", event.outsOnPlay}}));
    return result;
}

} // namespace scorebook
