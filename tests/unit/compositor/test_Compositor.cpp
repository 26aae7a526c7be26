#include <QtTest>
#include <cmath>
#include "../TestHelpers.hpp"
#include "compositor/Blend.hpp"
#include "compositor/Compositor.hpp"
#include "compositor/Effects.hpp"

using namespace lf;
using namespace lf::test;

namespace {

Color pixelAt(const QImage& img, int x, int y) {
    const u8* p = img.constScanLine(y) + x * 4;
    return {p[0], p[1], p[2], p[3]};
}

// Solid square standing in for rendered glyphs, placed at a layout's
// canvas position
TextSurface block(const LayoutResult& layout, Color color, int size = 10) {
    TextSurface s;
    s.image = QImage(size, size, QImage::Format_RGBA8888);
    s.image.fill(QColor(color.r, color.g, color.b, color.a));
    s.origin = layout.paintPosition;
    s.glyphBox = {layout.paintPosition.x, layout.paintPosition.y,
                  static_cast<f32>(size), static_cast<f32>(size)};
    return s;
}

EffectConfig effect(EffectKind kind, f32 base, f32 scale) {
    EffectConfig e;
    e.kind = kind;
    e.base = base;
    e.scale = scale;
    return e;
}

} // namespace

class TestCompositor : public QObject {
    Q_OBJECT

private:
    FixedTextMeasurer measurer_;

private slots:
    void testBlendModes() {
        const Color black = Color::black();
        QVERIFY(blend::pixel(black, Color{10, 20, 30, 255}, BlendMode::Normal) ==
                (Color{10, 20, 30, 255}));
        QVERIFY(blend::pixel(black, Color::white(), BlendMode::Normal, 0.5f) ==
                (Color{128, 128, 128, 255}));
        QVERIFY(blend::pixel(Color{0, 128, 0, 255}, Color{255, 0, 0, 255},
                             BlendMode::Add) == (Color{255, 128, 0, 255}));
        QVERIFY(blend::pixel(Color{255, 0, 255, 255}, Color{128, 128, 128, 255},
                             BlendMode::Multiply) == (Color{128, 0, 128, 255}));

        // Over transparent the source colour survives with its own alpha
        const Color over = blend::pixel(Color::transparent(),
                                        Color{200, 100, 50, 128},
                                        BlendMode::Normal);
        QVERIFY(over == (Color{200, 100, 50, 128}));
    }

    void testValidateEffectsAgainstPadding() {
        const Size box{400.0f, 100.0f};

        auto glow = effect(EffectKind::Glow, 8.0f, 16.0f);
        QVERIFY(effects::validate({glow}, 30, box).isOk());
        auto tooWide = effects::validate({glow}, 20, box);
        QVERIFY(tooWide.isErr());
        QVERIFY(tooWide.error().kind == ErrorKind::EffectConfig);

        auto shadow = effect(EffectKind::Shadow, 5.0f, 10.0f);
        shadow.offset = {10.0f, -4.0f};
        QCOMPARE(effects::maxExtent(shadow, box), 25.0f);
        QVERIFY(effects::validate({shadow}, 20, box).isErr());

        auto pulse = effect(EffectKind::Pulse, 1.0f, 0.2f);
        QCOMPARE(effects::maxExtent(pulse, box), 40.0f);
        QVERIFY(effects::validate({pulse}, 30, box).isErr());
        QVERIFY(effects::validate({pulse}, 50, box).isOk());

        auto negative = effect(EffectKind::Glow, -2.0f, 1.0f);
        QVERIFY(effects::validate({negative}, 200, box).isErr());

        auto disabled = effect(EffectKind::Glow, 500.0f, 0.0f);
        disabled.enabled = false;
        QVERIFY(effects::validate({disabled}, 10, box).isOk());

        QCOMPARE(effects::maxExtent(effect(EffectKind::Tint, 1.0f, 0.0f), box), 0.0f);
    }

    void testOutlineMarginCountsTowardBlurExtent() {
        const Size box{400.0f, 100.0f};
        Style style;
        style.strokeWidth = 3.0f;
        const f32 margin = TextRenderer::surfaceMargin(style.strokeWidth);
        QCOMPARE(margin, 5.0f);

        // The rendered surface carries exactly that margin around the box
        TextLayoutEngine engine({320, 240}, {20, 20, 20, 20}, {40}, measurer_);
        auto laid = engine.layout("hi", style);
        QVERIFY(laid.isOk());
        auto surface = TextRenderer::render("hi", style, *laid, AnimationState{});
        QCOMPARE(surface.image.width(),
                 static_cast<int>(std::ceil(laid->textSize.width + 2.0f * margin)));
        QVERIFY(surface.origin.x <= laid->paintPosition.x - margin);

        // 24px of blur fits a 26px pad only when the outline is ignored
        auto glow = effect(EffectKind::Glow, 8.0f, 16.0f);
        QCOMPARE(effects::maxExtent(glow, box, margin), 29.0f);
        QVERIFY(effects::validate({glow}, 26, box).isOk());
        auto clipped = effects::validate({glow}, 26, box, margin);
        QVERIFY(clipped.isErr());
        QVERIFY(clipped.error().kind == ErrorKind::EffectConfig);
        QVERIFY(effects::validate({glow}, 29, box, margin).isOk());

        auto shadow = effect(EffectKind::Shadow, 5.0f, 10.0f);
        shadow.offset = {10.0f, -4.0f};
        QCOMPARE(effects::maxExtent(shadow, box, margin), 30.0f);

        // Scale and full-canvas effects do not blur the outline outward
        QCOMPARE(effects::maxExtent(effect(EffectKind::Pulse, 1.0f, 0.2f), box, margin),
                 40.0f);
        QCOMPARE(effects::maxExtent(effect(EffectKind::HueShift, 90.0f, 0.0f), box, margin),
                 0.0f);
    }

    void testSectionModifiersApplied() {
        auto flash = effect(EffectKind::BeatFlash, 0.5f, 0.0f);
        auto tint = effect(EffectKind::Tint, 0.3f, 0.0f);
        auto base = std::vector<EffectConfig>{effect(EffectKind::Glow, 4.0f, 2.0f),
                                              effect(EffectKind::Shadow, 1.0f, 1.0f),
                                              flash,
                                              tint};

        auto neutral = effects::forSection(base, SectionStyle{});
        QCOMPARE(neutral.size(), size_t(4));
        QCOMPARE(neutral[0].base, 4.0f);
        QVERIFY(neutral[2].enabled);

        SectionStyle chorus;
        chorus.glowIntensity = 2.0f;
        chorus.energyBursts = false;
        chorus.hueShift = 30.0f;
        auto list = effects::forSection(base, chorus);
        QCOMPARE(list.size(), size_t(5));
        QCOMPARE(list[0].base, 8.0f);
        QCOMPARE(list[0].scale, 4.0f);
        QCOMPARE(list[1].base, 2.0f);
        QVERIFY(!list[2].enabled);
        QCOMPARE(list[3].base, 0.3f);
        QVERIFY(list[4].kind == EffectKind::HueShift);
        QCOMPARE(list[4].base, 30.0f);
    }

    void testHueShiftRecoloursText() {
        QImage img(3, 1, QImage::Format_RGBA8888);
        img.setPixelColor(0, 0, QColor(255, 0, 0, 255));
        img.setPixelColor(1, 0, QColor(255, 255, 255, 255));
        img.setPixelColor(2, 0, QColor(255, 0, 0, 0));
        effects::rotateHue(img, 120.0f);
        QVERIFY(pixelAt(img, 0, 0) == (Color{0, 255, 0, 255}));
        QVERIFY(pixelAt(img, 1, 0) == Color::white()); // no hue to rotate
        QVERIFY(pixelAt(img, 2, 0) == (Color{255, 0, 0, 0}));

        // Through the layer stack: energy drives the angle, the caller's
        // surface stays untouched
        Compositor compositor({320, 240}, {40});
        TextLayoutEngine engine({320, 240}, {20, 20, 20, 20}, {40}, measurer_);
        auto laid = engine.layout("hi", Style{});
        QVERIFY(laid.isOk());

        const TextSurface text = block(*laid, Color{255, 0, 0, 255});
        RenderContext ctx;
        ctx.energy = 1.0f;
        auto layers = compositor.buildLayers(
                QImage{}, text, {effect(EffectKind::HueShift, 0.0f, 240.0f)}, ctx);
        QCOMPARE(layers.size(), size_t(1));
        QCOMPARE(layers[0].zOrder, z::Text);
        QVERIFY(pixelAt(layers[0].source, 0, 0) == (Color{0, 0, 255, 255}));
        QVERIFY(pixelAt(text.image, 0, 0) == (Color{255, 0, 0, 255}));
    }

    void testParameterFollowsBandEnergy() {
        RenderContext ctx;
        ctx.bandEnergies = {0.25f, 2.0f};
        ctx.energy = 0.5f;

        auto e = effect(EffectKind::Glow, 4.0f, 8.0f);
        QCOMPARE(effects::parameter(e, ctx), 8.0f);
        e.band = 0;
        QCOMPARE(effects::parameter(e, ctx), 6.0f);
        e.band = 1; // clamped to 1
        QCOMPARE(effects::parameter(e, ctx), 12.0f);
        e.band = 7; // missing band reads as silence
        QCOMPARE(effects::parameter(e, ctx), 4.0f);
    }

    void testStyleGlowAppended() {
        Style style;
        style.glowRadius = 6.0f;
        auto list = effects::forStyle({effect(EffectKind::Tint, 0.2f, 0.0f)}, style);
        QCOMPARE(list.size(), size_t(2));
        QVERIFY(list.back().kind == EffectKind::Glow);
        QCOMPARE(list.back().base, 6.0f);

        style.glowRadius = 0.0f;
        QCOMPARE(effects::forStyle({}, style).size(), size_t(0));
    }

    void testBeatFlashEnvelope() {
        RenderContext ctx;
        ctx.beatPhase = 0.0f;
        QCOMPARE(effects::beatFlashEnvelope(ctx), 1.0f);
        ctx.beatPhase = 0.125f;
        QCOMPARE(effects::beatFlashEnvelope(ctx), 0.5f);
        ctx.beatPhase = 0.6f;
        QCOMPARE(effects::beatFlashEnvelope(ctx), 0.0f);
        ctx.onset = true;
        QCOMPARE(effects::beatFlashEnvelope(ctx), 1.0f);
    }

    void testLayerOrder() {
        Compositor compositor({320, 240}, {40});
        TextLayoutEngine engine({320, 240}, {20, 20, 20, 20}, {40}, measurer_);
        auto laid = engine.layout("hi", Style{});
        QVERIFY(laid.isOk());

        RenderContext ctx;
        ctx.onset = true;
        ctx.energy = 1.0f;

        QImage bg(320, 240, QImage::Format_RGBA8888);
        bg.fill(Qt::black);

        auto tint = effect(EffectKind::Tint, 0.5f, 0.0f);
        auto glow = effect(EffectKind::Glow, 2.0f, 2.0f);
        auto flash = effect(EffectKind::BeatFlash, 0.5f, 0.0f);

        auto layers = compositor.buildLayers(
                bg, block(*laid, Color::white()), {tint, glow, flash}, ctx);

        QCOMPARE(layers.size(), size_t(5));
        QCOMPARE(layers[0].zOrder, z::Background);
        QCOMPARE(layers[0].x, 40);
        QCOMPARE(layers[1].zOrder, z::UnderText);
        QCOMPARE(layers[2].zOrder, z::Text);
        QCOMPARE(layers[3].zOrder, z::OverText);
        QVERIFY(layers[3].blendMode == BlendMode::Multiply);
        QVERIFY(layers[4].blendMode == BlendMode::Add);
        QVERIFY(layers[3].isSolid());
        QCOMPARE(layers[3].width, 400);
    }

    void testCompositeCropsTextToFramePosition() {
        const Color red{255, 0, 0, 255};
        const Color blue{0, 0, 255, 255};

        for (u32 pad : {0u, 200u}) {
            const FrameGeometry frame{640, 360};
            Compositor compositor(frame, {pad});
            TextLayoutEngine engine(frame, {40, 40, 30, 60}, {pad}, measurer_);
            SolidColorBackground background(red, frame);
            BufferPool pool(2, frame.width, frame.height, pad);

            auto laid = engine.layout("lyric", Style{});
            QVERIFY(laid.isOk());

            RenderContext ctx;
            ctx.timestamp = 1.5;
            auto result = compositor.composite(
                    background, block(*laid, blue), {}, ctx, pool);
            QVERIFY(result.isOk());
            QCOMPARE(pool.outstanding(), size_t(1));

            const FrameBuffer& buf = **result;
            QCOMPARE(buf.frame.width(), 640);
            QCOMPARE(buf.frame.height(), 360);
            QCOMPARE(buf.canvas.width(), static_cast<int>(640 + 2 * pad));
            QCOMPARE(buf.timestamp, 1.5);

            const int x = static_cast<int>(laid->framePosition.x);
            const int y = static_cast<int>(laid->framePosition.y);
            QVERIFY(pixelAt(buf.frame, x, y) == blue);
            QVERIFY(pixelAt(buf.frame, x + 9, y + 9) == blue);
            QVERIFY(pixelAt(buf.frame, x - 1, y) == red);
            QVERIFY(pixelAt(buf.frame, 0, 0) == red);

            pool.release(std::move(result).value());
            QCOMPARE(pool.outstanding(), size_t(0));
        }
    }

    void testGlowMayBleedIntoPadding() {
        const FrameGeometry frame{200, 100};
        Compositor compositor(frame, {32});
        SolidColorBackground background(Color::transparent(), frame);
        BufferPool pool(1, frame.width, frame.height, 32);

        TextSurface text;
        text.image = QImage(8, 8, QImage::Format_RGBA8888);
        text.image.fill(Qt::white);
        text.origin = {32.0f, 32.0f}; // frame (0, 0)

        auto glow = effect(EffectKind::Glow, 12.0f, 0.0f);
        glow.opacity = 1.0f;
        auto result = compositor.composite(background, text, {glow}, {}, pool);
        QVERIFY(result.isOk());

        // Blurred alpha reaches left of the frame edge, inside the padding
        QVERIFY(pixelAt((*result)->canvas, 28, 36).a > 0);
        QVERIFY(pixelAt((*result)->frame, 0, 0).a == 255);
        pool.release(std::move(result).value());
    }

    void testMissedDeadlineReturnsBuffer() {
        const FrameGeometry frame{64, 64};
        Compositor compositor(frame, {8});
        SolidColorBackground background(Color::black(), frame);
        BufferPool pool(1, 64, 64, 8);

        auto late = compositor.composite(background, std::nullopt, {}, {}, pool,
                                         Clock::now() - std::chrono::seconds(1));
        QVERIFY(late.isErr());
        QVERIFY(late.error().kind == ErrorKind::FrameRenderTimeout);
        QVERIFY(late.error().recoverable);
        QCOMPARE(pool.available(), size_t(1));
    }

    void testStopRequestedCancels() {
        const FrameGeometry frame{64, 64};
        Compositor compositor(frame, {8});
        SolidColorBackground background(Color::black(), frame);
        BufferPool pool(1, 64, 64, 8);

        std::stop_source source;
        source.request_stop();
        auto r = compositor.composite(background, std::nullopt, {}, {}, pool,
                                      TimePoint::max(), source.get_token());
        QVERIFY(r.isErr());
        QVERIFY(r.error().kind == ErrorKind::Cancelled);
        QCOMPARE(pool.available(), size_t(1));
    }

    void testPulseScalesAroundCentre() {
        TextSurface s;
        s.image = QImage(20, 10, QImage::Format_RGBA8888);
        s.image.fill(Qt::white);
        s.origin = {100.0f, 50.0f};

        auto bigger = TextRenderer::scaled(s, 2.0f);
        QCOMPARE(bigger.image.width(), 40);
        QCOMPARE(bigger.image.height(), 20);
        QCOMPARE(bigger.origin.x, 90.0f);
        QCOMPARE(bigger.origin.y, 45.0f);
    }
};

int runTestCompositor(int argc, char** argv) {
    TestCompositor tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "test_Compositor.moc"
