#pragma once

#include <cctype>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

// Hand-built games for the scoring tests. Each team bats a fixed nine-man
// order with distinct surnames so runner clauses resolve unambiguously.
namespace scorebook::testing {

inline const std::vector<std::string> &awayOrder()
{
    static const std::vector<std::string> names = {
        "Vic Adams", "Vic Baker", "Vic Clark", "Vic Dunn", "Vic Evans",
        "Vic Ford", "Vic Gray", "Vic Hill", "Vic Irwin"};
    return names;
}

inline const std::vector<std::string> &homeOrder()
{
    static const std::vector<std::string> names = {
        "Hal Young", "Hal Zane", "Hal Lowe", "Hal Moss", "Hal Nash",
        "Hal Owen", "Hal Pike", "Hal Quinn", "Hal Reed"};
    return names;
}

inline std::string playerId(const std::string &name)
{
    std::string id;
    for (char c : name) {
        id.push_back(c == ' ' ? '-' : static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return id;
}

inline RawPlay makePlay(int inning, HalfSide half, const std::string &batterName,
                        const std::string &description, const std::string &pitcherName,
                        double wpBefore = 0.5, double wpAfter = 0.5)
{
    RawPlay play;
    play.inning = inning;
    play.half = half;
    play.batterId = playerId(batterName);
    play.batterName = batterName;
    play.pitcherId = playerId(pitcherName);
    play.pitcherName = pitcherName;
    play.description = description;
    play.pitches = {PitchResult::Ball, PitchResult::Strike, PitchResult::InPlay};
    play.wpBefore = wpBefore;
    play.wpAfter = wpAfter;
    return play;
}

class GameBuilder
{
public:
    // "{b}" in a description is replaced with the current batter's name.
    GameBuilder &play(int inning, HalfSide half, const std::string &description,
                      double wpBefore = 0.5, double wpAfter = 0.5)
    {
        const bool top = half == HalfSide::Top;
        int &slot = top ? m_nextAway : m_nextHome;
        const std::string batter = (top ? awayOrder() : homeOrder())[static_cast<size_t>(slot % 9)];
        ++slot;

        std::string text = description;
        const size_t marker = text.find("{b}");
        if (marker != std::string::npos) {
            text.replace(marker, 3, batter);
        }
        m_plays.push_back(makePlay(inning, half, batter, text,
                                   top ? m_homePitcher : m_awayPitcher, wpBefore, wpAfter));
        return *this;
    }

    GameBuilder &strikeouts(int inning, HalfSide half, int count = 3)
    {
        for (int i = 0; i < count; ++i) {
            play(inning, half, "{b} strikes out swinging.");
        }
        return *this;
    }

    // Three strikeouts in each half of innings first..last.
    GameBuilder &quietInnings(int first, int last)
    {
        for (int inning = first; inning <= last; ++inning) {
            strikeouts(inning, HalfSide::Top);
            strikeouts(inning, HalfSide::Bottom);
        }
        return *this;
    }

    // Pitcher of the team fielding during the given half.
    GameBuilder &pitcher(HalfSide battingHalf, const std::string &name)
    {
        (battingHalf == HalfSide::Top ? m_homePitcher : m_awayPitcher) = name;
        return *this;
    }

    // Batter due up next for the given half.
    std::string nextBatter(HalfSide half) const
    {
        const bool top = half == HalfSide::Top;
        return (top ? awayOrder() : homeOrder())[static_cast<size_t>((top ? m_nextAway : m_nextHome) % 9)];
    }

    GameInput build(const std::string &gameId = "test-game") const
    {
        GameInput input;
        input.metadata = nlohmann::json{{"gameId", gameId},
                                        {"awayTeam", "VIS"},
                                        {"homeTeam", "LOC"},
                                        {"venue", "Test Park"}};
        input.plays = m_plays;
        return input;
    }

    std::vector<RawPlay> &plays() { return m_plays; }

private:
    std::vector<RawPlay> m_plays;
    int m_nextAway = 0;
    int m_nextHome = 0;
    std::string m_homePitcher = "Hal Ace";
    std::string m_awayPitcher = "Vic Ace";
};

} // namespace scorebook::testing
