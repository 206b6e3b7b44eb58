#include <QtTest/QtTest>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"

using scorebook::Base;
using scorebook::BaseState;
using scorebook::GameInput;
using scorebook::HalfSide;
using scorebook::PitchResult;
using scorebook::RawPlay;
using scorebook::Runner;

class ModelsJsonTests : public QObject
{
    Q_OBJECT
private slots:
    void testGameInputParse();
    void testMissingFieldsDefaults();
    void testPitchAliases();
    void testRawPlayRoundTrip();
    void testEnumStrings();
    void testBaseStateJson();
    void testLinesUseScorebookKeys();
    void testBaseStateHelpers();
};

void ModelsJsonTests::testGameInputParse()
{
    const auto json = nlohmann::json::parse(R"({
        "metadata": {"gameId": "g-1", "awayTeam": "VIS", "homeTeam": "LOC"},
        "plays": [
            {"inning": 1, "half": "top", "batterId": "b1", "batterName": "Vic Adams",
             "pitcherId": "p1", "pitcherName": "Hal Ace",
             "description": "Vic Adams singles to left field.",
             "pitches": ["B", "S", "X"], "runsScored": 0, "outsRecorded": 0,
             "wpBefore": 0.5, "wpAfter": 0.46},
            {"inning": 1, "half": "bottom", "batterId": "b2", "batterName": "Hal Young",
             "pitcherId": "p2", "pitcherName": "Vic Ace",
             "description": "Hal Young strikes out swinging.", "pitches": []}
        ]
    })");

    const GameInput input = json.get<GameInput>();
    QCOMPARE(QString::fromStdString(input.metadata.at("gameId").get<std::string>()),
             QStringLiteral("g-1"));
    QCOMPARE(static_cast<int>(input.plays.size()), 2);

    const RawPlay &first = input.plays.at(0);
    QCOMPARE(first.inning, 1);
    QCOMPARE(first.half, HalfSide::Top);
    QCOMPARE(QString::fromStdString(first.batterName), QStringLiteral("Vic Adams"));
    QCOMPARE(static_cast<int>(first.pitches.size()), 3);
    QCOMPARE(first.pitches.at(2), PitchResult::InPlay);
    QVERIFY(first.runsScored.has_value());
    QCOMPARE(*first.runsScored, 0);
    QCOMPARE(first.wpAfter, 0.46);

    const RawPlay &second = input.plays.at(1);
    QCOMPARE(second.half, HalfSide::Bottom);
    QVERIFY(second.pitches.empty());
    QVERIFY(!second.runsScored.has_value());
    QVERIFY(!second.outsRecorded.has_value());
    QCOMPARE(second.wpBefore, 0.5);
}

void ModelsJsonTests::testMissingFieldsDefaults()
{
    const GameInput empty = nlohmann::json::object().get<GameInput>();
    QVERIFY(empty.metadata.is_object());
    QVERIFY(empty.plays.empty());

    const RawPlay play = nlohmann::json{{"description", "Walk."}}.get<RawPlay>();
    QCOMPARE(play.inning, 0);
    QCOMPARE(play.half, HalfSide::Top);
    QVERIFY(play.batterId.empty());
    QCOMPARE(play.wpBefore, 0.5);
    QCOMPARE(play.wpAfter, 0.5);

    const RawPlay nullTotals =
        nlohmann::json{{"runsScored", nullptr}, {"outsRecorded", "two"}}.get<RawPlay>();
    QVERIFY(!nullTotals.runsScored.has_value());
    QVERIFY(!nullTotals.outsRecorded.has_value());
}

void ModelsJsonTests::testPitchAliases()
{
    QCOMPARE(scorebook::parsePitchString("called_strike"), PitchResult::Strike);
    QCOMPARE(scorebook::parsePitchString("foul_tip"), PitchResult::Foul);
    QCOMPARE(scorebook::parsePitchString("hit_into_play"), PitchResult::InPlay);
    QCOMPARE(scorebook::parsePitchString("ball"), PitchResult::Ball);
    QCOMPARE(scorebook::parseHalfString("bottom"), HalfSide::Bottom);
    QCOMPARE(scorebook::parseHalfString("top"), HalfSide::Top);
}

void ModelsJsonTests::testRawPlayRoundTrip()
{
    RawPlay play;
    play.inning = 7;
    play.half = HalfSide::Bottom;
    play.batterId = "b9";
    play.batterName = "Hal Reed";
    play.pitcherId = "p3";
    play.pitcherName = "Vic Relief";
    play.description = "Hal Reed walks.";
    play.pitches = {PitchResult::Ball, PitchResult::Foul, PitchResult::Ball};
    play.runsScored = 1;
    play.wpBefore = 0.3;
    play.wpAfter = 0.35;

    const nlohmann::json json = play;
    QCOMPARE(QString::fromStdString(json.at("half").get<std::string>()), QStringLiteral("bottom"));
    QVERIFY(json.at("outsRecorded").is_null());

    const RawPlay parsed = json.get<RawPlay>();
    QCOMPARE(parsed.inning, play.inning);
    QCOMPARE(parsed.half, play.half);
    QVERIFY(parsed.pitches == play.pitches);
    QCOMPARE(*parsed.runsScored, 1);
    QVERIFY(!parsed.outsRecorded.has_value());
    QCOMPARE(parsed.wpAfter, play.wpAfter);
}

void ModelsJsonTests::testEnumStrings()
{
    QCOMPARE(QString::fromStdString(scorebook::toPlayKindString(scorebook::PlayKind::HomeRun)),
             QStringLiteral("home_run"));
    QCOMPARE(QString::fromStdString(
                 scorebook::toPlayKindString(scorebook::PlayKind::CatcherInterference)),
             QStringLiteral("catcher_interference"));
    QCOMPARE(QString::fromStdString(scorebook::toBatterFateString(scorebook::BatterFate::NotInvolved)),
             QStringLiteral("not_involved"));
    QCOMPARE(QString::fromStdString(
                 scorebook::toAnomalyKindString(scorebook::AnomalyKind::ContestedEarnedRuns)),
             QStringLiteral("ContestedEarnedRuns"));
    QCOMPARE(QString::fromStdString(scorebook::toBaseString(Base::Scored)), QStringLiteral("scored"));
    QCOMPARE(QString::fromStdString(scorebook::toPitchString(PitchResult::Strike)),
             QStringLiteral("S"));
}

void ModelsJsonTests::testBaseStateJson()
{
    BaseState state;
    Runner runner;
    runner.playerId = "r2";
    runner.name = "Vic Baker";
    runner.responsiblePitcherId = "p1";
    runner.base = Base::Second;
    state.runnerOn(Base::Second) = runner;

    const nlohmann::json json = state;
    QVERIFY(json.at("1B").is_null());
    QVERIFY(json.at("3B").is_null());
    QCOMPARE(QString::fromStdString(json.at("2B").at("playerId").get<std::string>()),
             QStringLiteral("r2"));
    QCOMPARE(QString::fromStdString(json.at("2B").at("base").get<std::string>()),
             QStringLiteral("2B"));
    QVERIFY(!json.at("2B").at("ghost").get<bool>());
}

void ModelsJsonTests::testLinesUseScorebookKeys()
{
    scorebook::TeamLine team;
    team.team = "VIS";
    team.runsByInning = {0, 2, 1};
    team.runs = 3;
    team.hits = 7;
    team.errors = 1;
    const nlohmann::json teamJson = team;
    QCOMPARE(teamJson.at("R").get<int>(), 3);
    QCOMPARE(teamJson.at("H").get<int>(), 7);
    QCOMPARE(teamJson.at("E").get<int>(), 1);
    QCOMPARE(static_cast<int>(teamJson.at("runsByInning").size()), 3);

    scorebook::PitcherLine pitcher;
    pitcher.pitcherId = "p1";
    pitcher.earnedRuns = 2;
    pitcher.strikeouts = 9;
    const nlohmann::json pitcherJson = pitcher;
    QCOMPARE(pitcherJson.at("ER").get<int>(), 2);
    QCOMPARE(pitcherJson.at("SO").get<int>(), 9);
    QVERIFY(pitcherJson.contains("BB"));

    scorebook::BatterLine batter;
    batter.batterId = "b1";
    batter.notationByInning[1] = {"1B"};
    batter.notationByInning[4] = {"K", "F8"};
    const nlohmann::json batterJson = batter;
    QCOMPARE(static_cast<int>(batterJson.at("innings").at("4").size()), 2);
    QCOMPARE(QString::fromStdString(batterJson.at("innings").at("1").at(0).get<std::string>()),
             QStringLiteral("1B"));
    QVERIFY(batterJson.contains("RBI"));
}

void ModelsJsonTests::testBaseStateHelpers()
{
    BaseState state;
    QVERIFY(state.empty());
    QCOMPARE(state.count(), 0);

    Runner first;
    first.playerId = "r1";
    first.base = Base::First;
    Runner third;
    third.playerId = "r3";
    third.base = Base::Third;
    state.runnerOn(Base::First) = first;
    state.runnerOn(Base::Third) = third;

    QVERIFY(!state.empty());
    QCOMPARE(state.count(), 2);
    QVERIFY(!state.occupied(Base::Second));
    const std::vector<Runner> runners = state.runners();
    QCOMPARE(QString::fromStdString(runners.at(0).playerId), QStringLiteral("r3"));
    QCOMPARE(QString::fromStdString(runners.at(1).playerId), QStringLiteral("r1"));
}

QTEST_MAIN(ModelsJsonTests)
#include "test_models_and_json.moc"
