#include <QTemporaryDir>
#include <QtTest>
#include <fstream>
#include "../TestHelpers.hpp"
#include "core/Config.hpp"
#include "job/RenderJob.hpp"

using namespace lf;
using namespace lf::test;

namespace {

RenderJobConfig smallJob() {
    RenderJobConfig cfg;
    cfg.video.width = 160;
    cfg.video.height = 90;
    cfg.video.fps = 10;
    cfg.video.durationPadding = 0.5;
    cfg.canvas.pad = 16;
    cfg.safeZone = {8, 8, 8, 8};
    cfg.layout.minFontSize = 8;
    cfg.scheduler.workers = 2;
    cfg.scheduler.poolSize = 3;
    cfg.scheduler.reorderCapacity = 3;
    cfg.scheduler.frameTimeoutMs = 10000;

    EffectConfig glow;
    glow.kind = EffectKind::Glow;
    glow.base = 2.0f;
    glow.scale = 2.0f;
    cfg.effects.push_back(glow);
    return cfg;
}

StyleSheet smallStyles() {
    StyleSheet sheet;
    sheet.base.fontSize = 16;
    sheet.base.strokeWidth = 1.0f;
    Style chorus = sheet.base;
    chorus.animation = AnimationKind::SlideUp;
    sheet.templates["chorus"] = chorus;
    return sheet;
}

std::vector<LyricCue> smallCues() {
    auto second = makeCue(1.2, 1.8, "world");
    second.styleTemplate = "chorus";
    return {makeCue(0.2, 1.0, "hello"), second};
}

class StaticFeatures : public AudioFeatureProvider {
public:
    Result<TimingTrack> load(const fs::path&) override {
        return Result<TimingTrack>::ok(makeTrack(2.0));
    }
};

class StaticLyrics : public LyricParser {
public:
    bool fail{false};

    Result<std::vector<LyricCue>> parse(const fs::path& source) override {
        if (fail) {
            return Result<std::vector<LyricCue>>::err(ErrorKind::Io,
                                                      "cannot read " + source.string());
        }
        return Result<std::vector<LyricCue>>::ok(smallCues());
    }
};

} // namespace

class TestRenderJob : public QObject {
    Q_OBJECT

private:
    FixedTextMeasurer measurer_;
    SolidColorBackground background_{Color{20, 20, 60, 255}, FrameGeometry{160, 90}};

private slots:
    void testFrameCount() {
        FakeProvider provider;
        RenderJob job(makeTrack(2.0), smallCues(), background_, smallStyles(),
                      smallJob(), provider, measurer_);
        QCOMPARE(job.frameCount(), u64(25));

        auto cfg = smallJob();
        cfg.video.duration = 1.0;
        RenderJob fixed(makeTrack(2.0), smallCues(), background_, smallStyles(),
                        cfg, provider, measurer_);
        QCOMPARE(fixed.frameCount(), u64(10));
    }

    void testRunsToDone() {
        FakeProvider provider;
        RenderJob job(makeTrack(2.0), smallCues(), background_, smallStyles(),
                      smallJob(), provider, measurer_);
        job.setOutputPath("/tmp/lyricforge_job_test.mp4");

        u64 lastEncoded = 0;
        job.progress.connect([&](const ProgressEvent& ev) { lastEncoded = ev.framesEncoded; });

        auto result = job.run();
        QVERIFY2(result.isOk(), result.isOk() ? "" : result.error().describe().c_str());
        QCOMPARE(result->string(), std::string("/tmp/lyricforge_job_test.mp4"));

        const auto snap = job.snapshot();
        QVERIFY(snap.state == JobState::Done);
        QCOMPARE(snap.framesEncoded, u64(25));
        QCOMPARE(lastEncoded, u64(25));
        QVERIFY(provider.finalized);

        const auto frames = provider.log.indicesFor("h264_nvenc");
        QCOMPARE(frames.size(), size_t(25));
        for (u64 i = 0; i < frames.size(); ++i)
            QCOMPARE(frames[i], i);
    }

    void testHardwareFailureMidJobFallsBack() {
        FakeProvider provider;
        provider.hardwareFailAt = 10;
        RenderJob job(makeTrack(2.0), smallCues(), background_, smallStyles(),
                      smallJob(), provider, measurer_);
        job.setOutputPath("/tmp/lyricforge_job_fallback.mp4");

        QVERIFY(job.run().isOk());
        QCOMPARE(provider.log.indicesFor("h264_nvenc").size(), size_t(10));
        QCOMPARE(provider.log.indicesFor("libx264").front(), u64(10));
        QVERIFY(job.snapshot().fellBack);
    }

    void testOversizedEffectFailsBeforeRendering() {
        FakeProvider provider;
        auto cfg = smallJob();
        cfg.effects.front().base = 40.0f;
        RenderJob job(makeTrack(2.0), smallCues(), background_, smallStyles(),
                      cfg, provider, measurer_);
        job.setOutputPath("/tmp/lyricforge_job_effect.mp4");

        auto result = job.run();
        QVERIFY(result.isErr());
        QVERIFY(result.error().kind == ErrorKind::EffectConfig);
        QVERIFY(job.snapshot().state == JobState::Failed);
        QVERIFY(!provider.opened);
        QVERIFY(provider.log.frames.empty());
    }

    void testSectionsRunToDone() {
        FakeProvider provider;
        auto cfg = smallJob();
        EffectConfig flash;
        flash.kind = EffectKind::BeatFlash;
        flash.base = 0.5f;
        flash.scale = 0.0f;
        cfg.effects.push_back(flash);

        cfg.sections.spans = {{0.0, 1.1, SectionKind::Intro},
                              {1.1, 2.5, SectionKind::Chorus}};
        SectionStyle intro;
        intro.energyBursts = false;
        intro.hueShift = 90.0f;
        SectionStyle chorus;
        chorus.styleTemplate = "chorus";
        chorus.glowIntensity = 2.0f; // 8px blur + 3px outline margin < 16px pad
        chorus.verticalPosition = VerticalPosition::Top;
        cfg.sections.styles = {{SectionKind::Intro, intro},
                               {SectionKind::Chorus, chorus}};

        RenderJob job(makeTrack(2.0), smallCues(), background_, smallStyles(),
                      cfg, provider, measurer_);
        job.setOutputPath("/tmp/lyricforge_job_sections.mp4");

        auto result = job.run();
        QVERIFY2(result.isOk(), result.isOk() ? "" : result.error().describe().c_str());
        QVERIFY(job.snapshot().state == JobState::Done);
        QCOMPARE(provider.log.indicesFor("h264_nvenc").size(), size_t(25));
    }

    void testSectionGlowValidatedBeforeRendering() {
        FakeProvider provider;
        auto cfg = smallJob();
        cfg.sections.spans = {{1.1, 2.5, SectionKind::Chorus}};
        cfg.sections.styles[SectionKind::Chorus].glowIntensity = 4.0f;

        RenderJob job(makeTrack(2.0), smallCues(), background_, smallStyles(),
                      cfg, provider, measurer_);
        job.setOutputPath("/tmp/lyricforge_job_section_glow.mp4");

        auto result = job.run();
        QVERIFY(result.isErr());
        QVERIFY(result.error().kind == ErrorKind::EffectConfig);
        QVERIFY(result.error().message.find("Section chorus") != std::string::npos);
        QVERIFY(!provider.opened);
    }

    void testSectionTemplateAppliesToPlainCues() {
        FakeProvider provider;
        StyleSheet styles = smallStyles();
        Style wide = styles.base;
        wide.glowRadius = 30.0f;
        styles.templates["wide"] = wide;

        // The first cue names no template, so the bridge's template applies
        auto cfg = smallJob();
        cfg.sections.spans = {{0.0, 0.6, SectionKind::Bridge}};
        cfg.sections.styles[SectionKind::Bridge].styleTemplate = "wide";

        RenderJob job(makeTrack(2.0), smallCues(), background_, styles, cfg,
                      provider, measurer_);
        job.setOutputPath("/tmp/lyricforge_job_section_template.mp4");

        auto result = job.run();
        QVERIFY(result.isErr());
        QVERIFY(result.error().kind == ErrorKind::EffectConfig);
        QVERIFY(result.error().message.find("Style template 'wide', section bridge") !=
                std::string::npos);
    }

    void testOverlappingSectionsFailJob() {
        FakeProvider provider;
        auto cfg = smallJob();
        cfg.sections.spans = {{0.0, 1.0, SectionKind::Intro},
                              {0.5, 2.0, SectionKind::Verse}};

        RenderJob job(makeTrack(2.0), smallCues(), background_, smallStyles(),
                      cfg, provider, measurer_);
        job.setOutputPath("/tmp/lyricforge_job_section_overlap.mp4");

        auto result = job.run();
        QVERIFY(result.isErr());
        QVERIFY(result.error().kind == ErrorKind::InvalidArgument);
        QVERIFY(job.snapshot().state == JobState::Failed);
    }

    void testJobConfigTakesTimingAndSections() {
        Config config;
        QVERIFY(config.loadFromString(R"(
[timing]
snap_to_beats = true
max_snap_shift = 0.1

[[sections]]
start = 0.0
end = 4.0
kind = "intro"
)").isOk());

        auto cfg = RenderJobConfig::fromConfig(config);
        QVERIFY(cfg.timing.snapToBeats);
        QCOMPARE(cfg.timing.maxSnapShift, 0.1);
        QCOMPARE(cfg.timing.onsetTolerance, 0.025);
        QCOMPARE(cfg.sections.spans.size(), size_t(1));
        QVERIFY(cfg.sections.spans[0].kind == SectionKind::Intro);
    }

    void testTimingGapFailsJob() {
        FakeProvider provider;
        RenderJob job(makeTrack(2.0), {makeCue(30.0, 31.0, "late")}, background_,
                      smallStyles(), smallJob(), provider, measurer_);
        job.setOutputPath("/tmp/lyricforge_job_gap.mp4");

        auto result = job.run();
        QVERIFY(result.isErr());
        QVERIFY(result.error().kind == ErrorKind::TimingGap);
    }

    void testOverflowPolicies() {
        StyleSheet huge = smallStyles();
        huge.base.fontSize = 200; // taller than the 74px safe zone

        {
            FakeProvider provider;
            auto cfg = smallJob();
            cfg.layout.overflowPolicy = OverflowPolicy::Fail;
            RenderJob job(makeTrack(2.0), smallCues(), background_, huge, cfg,
                          provider, measurer_);
            job.setOutputPath("/tmp/lyricforge_job_overflow.mp4");
            auto result = job.run();
            QVERIFY(result.isErr());
            QVERIFY(result.error().kind == ErrorKind::LayoutOverflow);
        }
        {
            FakeProvider provider;
            auto cfg = smallJob();
            cfg.layout.overflowPolicy = OverflowPolicy::ShrinkFont;
            RenderJob job(makeTrack(2.0), smallCues(), background_, huge, cfg,
                          provider, measurer_);
            job.setOutputPath("/tmp/lyricforge_job_shrink.mp4");
            QVERIFY(job.run().isOk());
        }
        {
            FakeProvider provider;
            auto cfg = smallJob();
            cfg.layout.overflowPolicy = OverflowPolicy::Skip;
            RenderJob job(makeTrack(2.0), smallCues(), background_, huge, cfg,
                          provider, measurer_);
            job.setOutputPath("/tmp/lyricforge_job_skip.mp4");
            QVERIFY(job.run().isOk());
            QCOMPARE(job.snapshot().framesEncoded, u64(25));
        }
    }

    void testCancellationFailsWithCancelled() {
        FakeProvider provider;
        RenderJob job(makeTrack(2.0), smallCues(), background_, smallStyles(),
                      smallJob(), provider, measurer_);
        job.setOutputPath("/tmp/lyricforge_job_cancel.mp4");

        std::stop_source stop;
        job.progress.connect([&](const ProgressEvent& ev) {
            if (ev.framesEncoded == 5)
                stop.request_stop();
        });

        auto result = job.run(stop.get_token());
        QVERIFY(result.isErr());
        QVERIFY(result.error().kind == ErrorKind::Cancelled);

        const auto snap = job.snapshot();
        QVERIFY(snap.state == JobState::Failed);
        QVERIFY(snap.lastError->kind == ErrorKind::Cancelled);
        QVERIFY(snap.framesEncoded < 25);
        QVERIFY(provider.aborted);
    }

    void testSourceOverload() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const fs::path audio = fs::path(dir.path().toStdString()) / "song.wav";
        std::ofstream(audio) << "RIFF";

        StaticFeatures features;
        StaticLyrics lyrics;
        FakeProvider provider;
        auto cfg = smallJob();
        cfg.recording.outputDirectory = dir.path().toStdString();
        cfg.recording.defaultFilename = "{title}";

        auto result = renderJob(audio, "song.lrc", features, lyrics, background_,
                                smallStyles(), cfg, provider, measurer_);
        QVERIFY2(result.isOk(), result.isOk() ? "" : result.error().describe().c_str());
        QCOMPARE(result->filename().string(), std::string("song.mp4"));

        lyrics.fail = true;
        auto failed = renderJob(audio, "missing.lrc", features, lyrics, background_,
                                smallStyles(), cfg, provider, measurer_);
        QVERIFY(failed.isErr());
        QVERIFY(failed.error().kind == ErrorKind::Io);
    }
};

int runTestRenderJob(int argc, char** argv) {
    TestRenderJob tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "test_RenderJob.moc"
