#include <QtTest>
#include "../TestHelpers.hpp"
#include "timing/TimingModel.hpp"

using namespace lf;
using namespace lf::test;

class TestTimingModel : public QObject {
    Q_OBJECT

private slots:
    void testDisjointRangesAreATimingGap() {
        auto model = TimingModel::create(makeTrack(10.0), {makeCue(20.0, 22.0, "late")});
        QVERIFY(model.isErr());
        QVERIFY(model.error().kind == ErrorKind::TimingGap);
    }

    void testOverlappingCuesRejected() {
        auto model = TimingModel::create(
                makeTrack(10.0), {makeCue(1.0, 3.0, "a"), makeCue(2.5, 4.0, "b")});
        QVERIFY(model.isErr());
        QVERIFY(model.error().kind == ErrorKind::InvalidArgument);
    }

    void testActiveCueLookup() {
        auto model = TimingModel::create(
                makeTrack(10.0), {makeCue(1.0, 2.0, "one"), makeCue(4.0, 6.0, "two")});
        QVERIFY(model.isOk());

        QVERIFY(!model->contextAt(0.5).activeCue.has_value());
        QCOMPARE(*model->contextAt(1.0).activeCue, size_t(0));
        QVERIFY(!model->contextAt(2.0).activeCue.has_value()); // end exclusive
        QVERIFY(!model->contextAt(3.0).activeCue.has_value());

        // Past the last cue but still inside the track
        QVERIFY(!model->contextAt(6.0).activeCue.has_value());
        QVERIFY(!model->contextAt(7.0).activeCue.has_value());
        QCOMPARE(model->contextAt(7.0).cueProgress, 0.0f);

        auto ctx = model->contextAt(5.0);
        QCOMPARE(*ctx.activeCue, size_t(1));
        QCOMPARE(ctx.cueProgress, 0.5f);
        QCOMPARE(ctx.timeInCue, 1.0);
        QCOMPARE(ctx.timeToCueEnd, 1.0);
    }

    void testBandEnergiesInterpolateAndClamp() {
        TimingTrack track;
        track.samples.push_back({0.0, 0.0f, false, {0.0f}});
        track.samples.push_back({1.0, 0.5f, false, {1.0f}});
        auto model = TimingModel::create(track, {});
        QVERIFY(model.isOk());

        QCOMPARE(model->contextAt(0.25).band(0), 0.25f);
        QCOMPARE(model->contextAt(-3.0).band(0), 0.0f);
        QCOMPARE(model->contextAt(9.0).band(0), 1.0f);
        QCOMPARE(model->contextAt(0.5).energy, 0.5f);
    }

    void testBeatPhaseWrapsForward() {
        TimingTrack track;
        track.samples.push_back({0.0, 0.8f, false, {}});
        track.samples.push_back({1.0, 0.2f, false, {}});
        auto model = TimingModel::create(track, {});
        QVERIFY(model.isOk());

        // 0.8 -> 1.2 halfway is 1.0, i.e. phase 0
        const f32 phase = model->contextAt(0.5).beatPhase;
        QVERIFY(phase < 0.01f || phase > 0.99f);
        QVERIFY(model->contextAt(0.75).beatPhase > 0.05f);
        QVERIFY(model->contextAt(0.75).beatPhase < 0.15f);
    }

    void testWordsDistributedEvenly() {
        auto model = TimingModel::create(makeTrack(10.0),
                                         {makeCue(2.0, 4.0, "one two three four")});
        QVERIFY(model.isOk());

        const auto& words = model->cue(0)->words;
        QCOMPARE(words.size(), size_t(4));
        QCOMPARE(words[1].start, 2.5);
        QCOMPARE(words[3].end, 4.0);

        auto ctx = model->contextAt(2.75);
        QCOMPARE(ctx.perWordProgress.size(), size_t(4));
        QCOMPARE(ctx.perWordProgress[0], 1.0f);
        QCOMPARE(ctx.perWordProgress[1], 0.5f);
        QCOMPARE(ctx.perWordProgress[2], 0.0f);
    }

    void testOnsetTolerance() {
        TimingTrack track = makeTrack(2.0);
        track.samples[10].onset = true; // t = 1.0
        auto model = TimingModel::create(track, {});
        QVERIFY(model.isOk());

        QVERIFY(model->contextAt(1.02).onset);
        QVERIFY(!model->contextAt(1.05).onset);
    }

    void testBeatSnapping() {
        TimingTrack track = makeTrack(10.0);
        track.beatTimes = {1.0, 2.0, 3.0, 4.0};

        TimingOptions options;
        options.snapToBeats = true;
        auto model = TimingModel::create(
                track,
                {makeCue(1.1, 1.9, "near"), makeCue(2.5, 3.5, "between")},
                options);
        QVERIFY(model.isOk());

        QCOMPARE(model->cue(0)->startTime, 1.0);
        QCOMPARE(model->cue(0)->endTime, 2.0);
        // 0.5s from any beat, beyond the default 0.2s shift
        QCOMPARE(model->cue(1)->startTime, 2.5);
        QCOMPARE(model->cue(1)->endTime, 3.5);
    }
};

int runTestTimingModel(int argc, char** argv) {
    TestTimingModel tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "test_TimingModel.moc"
