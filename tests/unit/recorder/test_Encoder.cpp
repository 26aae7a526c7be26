#include <QtTest>
#include "../TestHelpers.hpp"
#include "recorder/Encoder.hpp"

using namespace lf;
using namespace lf::test;

namespace {

EncoderSettings settings() {
    EncoderSettings s;
    s.outputPath = "/tmp/lyricforge_encoder_test.mp4";
    s.width = 64;
    s.height = 36;
    s.fps = 30;
    return s;
}

Result<void> submitRange(Encoder& encoder, u64 first, u64 count) {
    FrameBuffer buffer(64, 36, 0);
    for (u64 i = first; i < first + count; ++i) {
        buffer.index = i;
        if (auto r = encoder.submitFrame(buffer); !r)
            return r;
    }
    return Result<void>::ok();
}

} // namespace

class TestEncoder : public QObject {
    Q_OBJECT

private slots:
    void testHardwarePathRunsToDone() {
        FakeProvider provider;
        Encoder encoder(settings(), 12, provider);

        std::vector<JobState> states;
        encoder.stateChanged.connect([&](JobState s) { states.push_back(s); });

        QVERIFY(encoder.start().isOk());
        QVERIFY(submitRange(encoder, 0, 12).isOk());
        QVERIFY(encoder.finalize().isOk());

        const auto job = encoder.snapshot();
        QVERIFY(job.state == JobState::Done);
        QCOMPARE(job.framesEncoded, u64(12));
        QCOMPARE(job.activeBackend, std::string("h264_nvenc"));
        QVERIFY(!job.fellBack);
        QVERIFY(provider.finalized);
        QCOMPARE(provider.softwareCreated, 0);

        const std::vector<JobState> expected{JobState::Analyzing, JobState::Rendering,
                                             JobState::Encoding, JobState::Done};
        QVERIFY(states == expected);
    }

    void testFallbackResumesAtFailingFrame() {
        FakeProvider provider;
        provider.hardwareFailAt = 7;
        Encoder encoder(settings(), 20, provider);

        QVERIFY(encoder.start().isOk());
        QVERIFY(submitRange(encoder, 0, 20).isOk());
        QVERIFY(encoder.finalize().isOk());

        const auto hw = provider.log.indicesFor("h264_nvenc");
        const auto sw = provider.log.indicesFor("libx264");
        QCOMPARE(hw.size(), size_t(7));
        QCOMPARE(sw.size(), size_t(13));
        QCOMPARE(sw.front(), u64(7));
        QCOMPARE(sw.back(), u64(19));

        // Hardware queue drained before switching, nothing re-encoded
        QCOMPARE(provider.log.flushed.front(), std::string("h264_nvenc"));
        QCOMPARE(provider.log.frames.size(), size_t(20));

        const auto job = encoder.snapshot();
        QVERIFY(job.fellBack);
        QCOMPARE(job.fallbackFrame, u64(7));
        QCOMPARE(job.activeBackend, std::string("libx264"));
        QCOMPARE(provider.softwareCreated, 1);
    }

    void testFallbackReencodesFramesHeldByHardware() {
        FakeProvider provider;
        provider.hardware = "h264_qsv";
        provider.hardwareDelay = 2;
        provider.hardwareFailAt = 7;
        provider.hardwareFlushFails = true;
        Encoder encoder(settings(), 20, provider);

        QVERIFY(encoder.start().isOk());
        QVERIFY(submitRange(encoder, 0, 20).isOk());
        QVERIFY(encoder.finalize().isOk());

        // Frames 5 and 6 were accepted by qsv but never written
        const auto hw = provider.log.indicesFor("h264_qsv");
        const auto sw = provider.log.indicesFor("libx264");
        QCOMPARE(hw.size(), size_t(5));
        QCOMPARE(hw.back(), u64(4));
        QCOMPARE(sw.size(), size_t(15));
        QCOMPARE(sw.front(), u64(5));
        QCOMPARE(sw.back(), u64(19));

        std::vector<u64> written;
        for (const auto& [name, index] : provider.log.frames)
            written.push_back(index);
        std::vector<u64> expected(20);
        for (u64 i = 0; i < 20; ++i)
            expected[i] = i;
        QVERIFY(written == expected);

        const auto job = encoder.snapshot();
        QVERIFY(job.state == JobState::Done);
        QCOMPARE(job.framesEncoded, u64(20));
        QCOMPARE(job.fallbackFrame, u64(5));
    }

    void testFallbackFailsWhenHeldFramesAreLost() {
        FakeProvider provider;
        provider.hardware = "h264_qsv";
        provider.hardwareDelay = Encoder::kMaxUnacknowledgedFrames + 2;
        provider.hardwareFailAt = Encoder::kMaxUnacknowledgedFrames + 3;
        provider.hardwareFlushFails = true;
        Encoder encoder(settings(), 30, provider);

        QVERIFY(encoder.start().isOk());
        auto r = submitRange(encoder, 0, 30);
        QVERIFY(r.isErr());
        QVERIFY(r.error().kind == ErrorKind::Encoding);
        QCOMPARE(r.error().frameIndex.value_or(0), u64(1));

        QVERIFY(encoder.state() == JobState::Failed);
        QVERIFY(provider.aborted);
        QVERIFY(!provider.finalized);
    }

    void testHardwareOpenFailureUsesSoftware() {
        FakeProvider provider;
        provider.hardwareCreateFails = true;
        Encoder encoder(settings(), 3, provider);

        QVERIFY(encoder.start().isOk());
        QCOMPARE(encoder.snapshot().activeBackend, std::string("libx264"));
        QVERIFY(submitRange(encoder, 0, 3).isOk());
        QVERIFY(encoder.finalize().isOk());
    }

    void testNoHardwareUsesSoftware() {
        FakeProvider provider;
        provider.hardware.reset();
        Encoder encoder(settings(), 2, provider);

        QVERIFY(encoder.start().isOk());
        QCOMPARE(encoder.snapshot().activeBackend, std::string("libx264"));
        QVERIFY(!encoder.snapshot().fellBack);
    }

    void testBothBackendsFailing() {
        FakeProvider provider;
        provider.hardwareFailAt = 4;
        provider.softwareFailAt = 4;
        Encoder encoder(settings(), 10, provider);

        QVERIFY(encoder.start().isOk());
        auto r = submitRange(encoder, 0, 10);
        QVERIFY(r.isErr());
        QVERIFY(r.error().kind == ErrorKind::Encoding);
        QCOMPARE(r.error().frameIndex.value_or(0), u64(4));

        const auto job = encoder.snapshot();
        QVERIFY(job.state == JobState::Failed);
        QVERIFY(job.lastError.has_value());
        QVERIFY(provider.aborted);
        QVERIFY(!provider.finalized);
    }

    void testSoftwareErrorDoesNotFallBack() {
        FakeProvider provider;
        provider.hardware.reset();
        provider.softwareFailAt = 2;
        Encoder encoder(settings(), 5, provider);

        QVERIFY(encoder.start().isOk());
        QVERIFY(submitRange(encoder, 0, 5).isErr());
        QCOMPARE(provider.softwareCreated, 1);
        QVERIFY(encoder.state() == JobState::Failed);
    }

    void testOutOfOrderFrameRejected() {
        FakeProvider provider;
        Encoder encoder(settings(), 5, provider);
        QVERIFY(encoder.start().isOk());
        QVERIFY(submitRange(encoder, 0, 2).isOk());

        FrameBuffer skipped(64, 36, 0);
        skipped.index = 3;
        auto r = encoder.submitFrame(skipped);
        QVERIFY(r.isErr());
        QCOMPARE(r.error().frameIndex.value_or(0), u64(3));
        QVERIFY(encoder.state() == JobState::Failed);
    }

    void testFinalizeRequiresAllFrames() {
        FakeProvider provider;
        Encoder encoder(settings(), 5, provider);
        QVERIFY(encoder.start().isOk());
        QVERIFY(submitRange(encoder, 0, 4).isOk());

        QVERIFY(encoder.finalize().isErr());
        QVERIFY(encoder.state() == JobState::Failed);
        QVERIFY(provider.aborted);
    }

    void testProgressReported() {
        FakeProvider provider;
        Encoder encoder(settings(), 4, provider);

        std::vector<u64> encoded;
        encoder.progress.connect([&](const ProgressEvent& ev) {
            if (ev.state == JobState::Rendering)
                encoded.push_back(ev.framesEncoded);
            QCOMPARE(ev.framesExpected, u64(4));
        });

        QVERIFY(encoder.start().isOk());
        QVERIFY(submitRange(encoder, 0, 4).isOk());

        const std::vector<u64> expected{0, 1, 2, 3, 4};
        QVERIFY(encoded == expected);
    }

    void testCancelledFailure() {
        FakeProvider provider;
        Encoder encoder(settings(), 4, provider);
        QVERIFY(encoder.start().isOk());

        encoder.fail(Error(ErrorKind::Cancelled, "stopped by user"));
        const auto job = encoder.snapshot();
        QVERIFY(job.state == JobState::Failed);
        QVERIFY(job.lastError->kind == ErrorKind::Cancelled);
        QVERIFY(provider.aborted);

        // Terminal states stick
        encoder.fail(Error(ErrorKind::Encoding, "late"));
        QVERIFY(encoder.snapshot().lastError->kind == ErrorKind::Cancelled);
    }

    void testInvalidSettingsFailAnalysis() {
        FakeProvider provider;
        auto s = settings();
        s.width = 63;
        Encoder encoder(s, 1, provider);

        auto r = encoder.start();
        QVERIFY(r.isErr());
        QVERIFY(r.error().kind == ErrorKind::InvalidArgument);
        QVERIFY(encoder.state() == JobState::Failed);
        QVERIFY(!provider.opened);
    }

    void testQualityPresets() {
        auto s = settings();
        s.quality = QualityPreset::Fast;
        QCOMPARE(s.softwarePreset(), std::string("fast"));
        QCOMPARE(s.crf(), 28u);
        QCOMPARE(s.hardwarePreset("h264_nvenc"), std::string("p2"));

        s.quality = QualityPreset::HighQuality;
        QCOMPARE(s.softwarePreset(), std::string("slow"));
        QCOMPARE(s.crf(), 18u);
        QCOMPARE(s.hardwarePreset("h264_amf"), std::string("quality"));
        QCOMPARE(s.effectiveGop(), 60u);
    }
};

int runTestEncoder(int argc, char** argv) {
    TestEncoder tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "test_Encoder.moc"
