#include <QtTest/QtTest>

#include <QTemporaryDir>

#include "scoring/base_state_simulator.hpp"
#include "scoring/earned_run_ledger.hpp"
#include "scorebook_fixtures.hpp"

using scorebook::HalfInningContext;
using scorebook::HalfInningSimulation;
using scorebook::HalfSide;
using scorebook::LedgerResult;
using scorebook::PlateAppearanceRecord;
using scorebook::PlayNormalizer;
using scorebook::RawPlay;
using scorebook::testing::makePlay;

class EarnedRunLedgerTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();

    void testGrandSlamSplitsAcrossPitchers();
    void testRunAfterTwoOutErrorIsUnearned();
    void testRunsAfterReplayThirdOutAreUnearned();
    void testRunnerWhoReachedOnErrorIsUnearned();
    void testPassedBallAdvanceIsUnearned();
    void testResponsibilityAcrossPitchingChange();
    void testGhostRunIsUnearned();
    void testTwoErrorPlaysAreContested();
    void testErrorAndPassedBallAreNotContested();
    void testApplyLedgerMarksRuns();
    void testEmptyHalfInning();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
};

static HalfInningSimulation simulate(const std::vector<RawPlay> &plays, int inning = 1)
{
    HalfInningContext context;
    context.inning = inning;
    context.half = HalfSide::Top;
    return scorebook::simulateHalfInning(plays, context, PlayNormalizer());
}

static RawPlay top(const std::string &batter, const std::string &description,
                   const std::string &pitcher = "Hal Ace", int inning = 1)
{
    return makePlay(inning, HalfSide::Top, batter, description, pitcher);
}

static int earnedFor(const LedgerResult &ledger, const std::string &pitcherId)
{
    const auto it = ledger.earnedRunsByPitcher.find(pitcherId);
    return it == ledger.earnedRunsByPitcher.end() ? 0 : it->second;
}

static int runsFor(const LedgerResult &ledger, const std::string &pitcherId)
{
    const auto it = ledger.runsByPitcher.find(pitcherId);
    return it == ledger.runsByPitcher.end() ? 0 : it->second;
}

void EarnedRunLedgerTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void EarnedRunLedgerTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void EarnedRunLedgerTests::testGrandSlamSplitsAcrossPitchers()
{
    const HalfInningSimulation simulation = simulate({
        top("Vic Adams", "Vic Adams walks."),
        top("Vic Baker", "Vic Baker walks."),
        top("Vic Clark", "Vic Clark walks."),
        top("Vic Dunn", "Vic Dunn homers to left field.", "Hal Relief"),
        top("Vic Evans", "Vic Evans strikes out swinging.", "Hal Relief"),
        top("Vic Ford", "Vic Ford strikes out swinging.", "Hal Relief"),
        top("Vic Gray", "Vic Gray strikes out swinging.", "Hal Relief"),
    });
    QCOMPARE(simulation.records.at(3).runsScored, 4);
    QCOMPARE(simulation.records.at(3).event.rbi, 4);

    const LedgerResult ledger = scorebook::attributeRuns(simulation.records);
    QCOMPARE(ledger.totalRuns, 4);
    QCOMPARE(ledger.earnedRuns, 4);
    QCOMPARE(runsFor(ledger, "hal-ace"), 3);
    QCOMPARE(earnedFor(ledger, "hal-ace"), 3);
    QCOMPARE(runsFor(ledger, "hal-relief"), 1);
    QCOMPARE(earnedFor(ledger, "hal-relief"), 1);
    QCOMPARE(ledger.errorPlays, 0);
    QVERIFY(!ledger.contested);
}

void EarnedRunLedgerTests::testRunAfterTwoOutErrorIsUnearned()
{
    const HalfInningSimulation simulation = simulate({
        top("Vic Adams", "Vic Adams triples to right field."),
        top("Vic Baker", "Vic Baker strikes out swinging."),
        top("Vic Clark", "Vic Clark strikes out swinging."),
        top("Vic Dunn", "Vic Dunn reaches on a throwing error by shortstop. Vic Adams scores."),
        top("Vic Evans", "Vic Evans strikes out swinging."),
    });
    const PlateAppearanceRecord &error = simulation.records.at(3);
    QCOMPARE(error.runsScored, 1);
    QCOMPARE(error.event.rbi, 0);

    const LedgerResult ledger = scorebook::attributeRuns(simulation.records);
    QCOMPARE(ledger.totalRuns, 1);
    QCOMPARE(ledger.earnedRuns, 0);
    QCOMPARE(runsFor(ledger, "hal-ace"), 1);
    QCOMPARE(earnedFor(ledger, "hal-ace"), 0);
    QCOMPARE(ledger.errorPlays, 1);
    QVERIFY(!ledger.contested);
    QCOMPARE(QString::fromStdString(ledger.runs.at(0).runnerId), QStringLiteral("vic-adams"));
    QVERIFY(!ledger.runs.at(0).earned);
}

void EarnedRunLedgerTests::testRunsAfterReplayThirdOutAreUnearned()
{
    const HalfInningSimulation simulation = simulate({
        top("Vic Adams", "Vic Adams strikes out swinging."),
        top("Vic Baker", "Vic Baker strikes out swinging."),
        top("Vic Clark", "Vic Clark reaches on a fielding error by third baseman."),
        top("Vic Dunn", "Vic Dunn homers to center field."),
        top("Vic Evans", "Vic Evans strikes out swinging."),
    });
    QCOMPARE(simulation.records.at(3).runsScored, 2);

    const LedgerResult ledger = scorebook::attributeRuns(simulation.records);
    QCOMPARE(ledger.totalRuns, 2);
    QCOMPARE(ledger.earnedRuns, 0);
}

void EarnedRunLedgerTests::testRunnerWhoReachedOnErrorIsUnearned()
{
    const HalfInningSimulation simulation = simulate({
        top("Vic Adams", "Vic Adams reaches on a fielding error by shortstop."),
        top("Vic Baker", "Vic Baker homers to right field."),
        top("Vic Clark", "Vic Clark strikes out swinging."),
        top("Vic Dunn", "Vic Dunn strikes out swinging."),
        top("Vic Evans", "Vic Evans strikes out swinging."),
    });

    const LedgerResult ledger = scorebook::attributeRuns(simulation.records);
    QCOMPARE(ledger.totalRuns, 2);
    QCOMPARE(ledger.earnedRuns, 1);
    for (const auto &run : ledger.runs) {
        QCOMPARE(run.earned, run.runnerId == "vic-baker");
    }
}

void EarnedRunLedgerTests::testPassedBallAdvanceIsUnearned()
{
    const HalfInningSimulation simulation = simulate({
        top("Vic Adams", "Vic Adams singles to left field."),
        top("Vic Baker", "Passed ball. Vic Adams to 2nd."),
        top("Vic Baker", "Vic Baker singles to center field."),
        top("Vic Clark", "Vic Clark strikes out swinging."),
        top("Vic Dunn", "Vic Dunn strikes out swinging."),
        top("Vic Evans", "Vic Evans strikes out swinging."),
    });
    QCOMPARE(simulation.records.at(2).runsScored, 1);

    const LedgerResult ledger = scorebook::attributeRuns(simulation.records);
    QCOMPARE(ledger.totalRuns, 1);
    QCOMPARE(ledger.earnedRuns, 0);
    QCOMPARE(ledger.errorPlays, 0);
    QVERIFY(!ledger.contested);
}

void EarnedRunLedgerTests::testResponsibilityAcrossPitchingChange()
{
    const HalfInningSimulation simulation = simulate({
        top("Vic Adams", "Vic Adams singles to left field."),
        top("Vic Baker", "Vic Baker strikes out swinging.", "Hal Relief"),
        top("Vic Clark", "Vic Clark doubles to left field.", "Hal Relief"),
        top("Vic Dunn", "Vic Dunn strikes out swinging.", "Hal Relief"),
        top("Vic Evans", "Vic Evans strikes out swinging.", "Hal Relief"),
    });

    const LedgerResult ledger = scorebook::attributeRuns(simulation.records);
    QCOMPARE(ledger.totalRuns, 1);
    QCOMPARE(ledger.earnedRuns, 1);
    QCOMPARE(runsFor(ledger, "hal-ace"), 1);
    QCOMPARE(runsFor(ledger, "hal-relief"), 0);
    QCOMPARE(QString::fromStdString(ledger.runs.at(0).chargedPitcherId), QStringLiteral("hal-ace"));

    QCOMPARE(static_cast<int>(ledger.pitchers.size()), 2);
    QCOMPARE(QString::fromStdString(ledger.pitchers.at(0).pitcherId), QStringLiteral("hal-ace"));
    QCOMPARE(QString::fromStdString(ledger.pitchers.at(0).pitcherName), QStringLiteral("Hal Ace"));
    QCOMPARE(static_cast<int>(ledger.pitchers.at(0).runnerIds.size()), 1);
    QCOMPARE(QString::fromStdString(ledger.pitchers.at(0).runnerIds.at(0)),
             QStringLiteral("vic-adams"));
    QCOMPARE(QString::fromStdString(ledger.pitchers.at(1).pitcherId), QStringLiteral("hal-relief"));
    QCOMPARE(QString::fromStdString(ledger.pitchers.at(1).runnerIds.at(0)),
             QStringLiteral("vic-clark"));
}

void EarnedRunLedgerTests::testGhostRunIsUnearned()
{
    HalfInningContext context;
    context.inning = 10;
    context.half = HalfSide::Top;
    context.ghostCandidateId = "vic-irwin";
    context.ghostCandidateName = "Vic Irwin";

    const HalfInningSimulation simulation = scorebook::simulateHalfInning(
        {
            makePlay(10, HalfSide::Top, "Vic Adams", "Vic Adams doubles to right field.", "Hal Ace"),
            makePlay(10, HalfSide::Top, "Vic Baker", "Vic Baker singles to left field.", "Hal Ace"),
            makePlay(10, HalfSide::Top, "Vic Clark", "Vic Clark strikes out swinging.", "Hal Ace"),
            makePlay(10, HalfSide::Top, "Vic Dunn", "Vic Dunn strikes out swinging.", "Hal Ace"),
            makePlay(10, HalfSide::Top, "Vic Evans", "Vic Evans strikes out swinging.", "Hal Ace"),
        },
        context, PlayNormalizer());
    QVERIFY(simulation.ghostRunnerPlaced);

    const LedgerResult ledger = scorebook::attributeRuns(simulation.records);
    QCOMPARE(ledger.totalRuns, 2);
    QCOMPARE(ledger.earnedRuns, 1);
    QCOMPARE(QString::fromStdString(ledger.runs.at(0).runnerId), QStringLiteral("vic-irwin"));
    QVERIFY(ledger.runs.at(0).ghost);
    QVERIFY(!ledger.runs.at(0).earned);
    QCOMPARE(QString::fromStdString(ledger.runs.at(0).chargedPitcherId), QStringLiteral("hal-ace"));
    QCOMPARE(QString::fromStdString(ledger.runs.at(1).runnerId), QStringLiteral("vic-adams"));
    QVERIFY(ledger.runs.at(1).earned);
}

void EarnedRunLedgerTests::testTwoErrorPlaysAreContested()
{
    const HalfInningSimulation simulation = simulate({
        top("Vic Adams", "Vic Adams reaches on a fielding error by third baseman."),
        top("Vic Baker", "Vic Baker reaches on a throwing error by shortstop."),
        top("Vic Clark", "Vic Clark strikes out swinging."),
        top("Vic Dunn", "Vic Dunn strikes out swinging."),
        top("Vic Evans", "Vic Evans strikes out swinging."),
    });

    const LedgerResult ledger = scorebook::attributeRuns(simulation.records);
    QCOMPARE(ledger.errorPlays, 2);
    QVERIFY(ledger.contested);
    QCOMPARE(ledger.totalRuns, 0);
}

void EarnedRunLedgerTests::testErrorAndPassedBallAreNotContested()
{
    const HalfInningSimulation simulation = simulate({
        top("Vic Adams", "Vic Adams reaches on a fielding error by shortstop."),
        top("Vic Baker", "Passed ball. Vic Adams to 2nd."),
        top("Vic Baker", "Vic Baker strikes out swinging."),
        top("Vic Clark", "Vic Clark strikes out swinging."),
        top("Vic Dunn", "Vic Dunn strikes out swinging."),
    });

    const LedgerResult ledger = scorebook::attributeRuns(simulation.records);
    QCOMPARE(ledger.errorPlays, 1);
    QVERIFY(!ledger.contested);
    QCOMPARE(ledger.totalRuns, 0);
}

void EarnedRunLedgerTests::testApplyLedgerMarksRuns()
{
    const HalfInningSimulation simulation = simulate({
        top("Vic Adams", "Vic Adams reaches on a fielding error by shortstop."),
        top("Vic Baker", "Vic Baker homers to right field.", "Hal Relief"),
        top("Vic Clark", "Vic Clark strikes out swinging.", "Hal Relief"),
        top("Vic Dunn", "Vic Dunn strikes out swinging.", "Hal Relief"),
        top("Vic Evans", "Vic Evans strikes out swinging.", "Hal Relief"),
    });

    const LedgerResult ledger = scorebook::attributeRuns(simulation.records);
    const std::vector<PlateAppearanceRecord> records =
        scorebook::applyLedger(simulation.records, ledger);
    const auto &runs = records.at(1).runs;
    QCOMPARE(static_cast<int>(runs.size()), 2);
    QCOMPARE(QString::fromStdString(runs.at(0).runnerId), QStringLiteral("vic-adams"));
    QVERIFY(!runs.at(0).earned);
    QCOMPARE(QString::fromStdString(runs.at(0).chargedPitcherId), QStringLiteral("hal-ace"));
    QCOMPARE(QString::fromStdString(runs.at(1).runnerId), QStringLiteral("vic-baker"));
    QVERIFY(runs.at(1).earned);
    QCOMPARE(QString::fromStdString(runs.at(1).chargedPitcherId), QStringLiteral("hal-relief"));
}

void EarnedRunLedgerTests::testEmptyHalfInning()
{
    const LedgerResult ledger = scorebook::attributeRuns({});
    QCOMPARE(ledger.totalRuns, 0);
    QCOMPARE(ledger.earnedRuns, 0);
    QVERIFY(ledger.runs.empty());
    QVERIFY(ledger.pitchers.empty());
    QVERIFY(!ledger.contested);
}

QTEST_MAIN(EarnedRunLedgerTests)
#include "test_earned_run_ledger.moc"
