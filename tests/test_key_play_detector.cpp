#include <QtTest/QtTest>

#include "scoring/key_play_detector.hpp"

using scorebook::PlayEvent;

class KeyPlayDetectorTests : public QObject
{
    Q_OBJECT
private slots:
    void testSwingAtThresholdIsKey();
    void testSwingBelowThresholdIsNotKey();
    void testDirectionDoesNotMatter();
    void testZeroThresholdMarksEveryPlay();
};

void KeyPlayDetectorTests::testSwingAtThresholdIsKey()
{
    const PlayEvent event;
    QVERIFY(scorebook::isKeyPlay(event, 0.40, 0.50, 0.10));
    QVERIFY(scorebook::isKeyPlay(event, 0.30, 0.75, 0.10));
}

void KeyPlayDetectorTests::testSwingBelowThresholdIsNotKey()
{
    const PlayEvent event;
    QVERIFY(!scorebook::isKeyPlay(event, 0.40, 0.49, 0.10));
    QVERIFY(!scorebook::isKeyPlay(event, 0.5, 0.5, 0.10));
}

void KeyPlayDetectorTests::testDirectionDoesNotMatter()
{
    const PlayEvent event;
    QVERIFY(scorebook::isKeyPlay(event, 0.62, 0.20, 0.25));
    QVERIFY(scorebook::isKeyPlay(event, 0.20, 0.62, 0.25));
}

void KeyPlayDetectorTests::testZeroThresholdMarksEveryPlay()
{
    const PlayEvent event;
    QVERIFY(scorebook::isKeyPlay(event, 0.5, 0.5, 0.0));
}

QTEST_MAIN(KeyPlayDetectorTests)
#include "test_key_play_detector.moc"
