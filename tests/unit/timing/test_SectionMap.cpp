#include <QtTest>
#include "timing/SectionMap.hpp"

using namespace lf;

namespace {

SectionsConfig songStructure() {
    SectionsConfig cfg;
    // Deliberately out of order; create() sorts by start
    cfg.spans = {{20.0, 35.0, SectionKind::Chorus},
                 {0.0, 8.0, SectionKind::Intro},
                 {8.0, 20.0, SectionKind::Verse},
                 {50.0, 60.0, SectionKind::Outro}};
    SectionStyle chorus;
    chorus.glowIntensity = 1.5f;
    chorus.styleTemplate = "loud";
    cfg.styles[SectionKind::Chorus] = chorus;
    return cfg;
}

} // namespace

class TestSectionMap : public QObject {
    Q_OBJECT

private slots:
    void testLookupIsHalfOpen() {
        auto map = SectionMap::create(songStructure());
        QVERIFY(map.isOk());

        QVERIFY(map->sectionAt(0.0) == SectionKind::Intro);
        QVERIFY(map->sectionAt(7.99) == SectionKind::Intro);
        QVERIFY(map->sectionAt(8.0) == SectionKind::Verse);
        QVERIFY(map->sectionAt(20.0) == SectionKind::Chorus);
        QVERIFY(map->sectionAt(34.9) == SectionKind::Chorus);
        QVERIFY(map->sectionAt(59.9) == SectionKind::Outro);
    }

    void testUncoveredTimeIsVerse() {
        auto map = SectionMap::create(songStructure());
        QVERIFY(map.isOk());

        QVERIFY(map->sectionAt(-1.0) == SectionKind::Verse);
        QVERIFY(map->sectionAt(35.0) == SectionKind::Verse); // gap 35..50
        QVERIFY(map->sectionAt(60.0) == SectionKind::Verse);

        SectionMap empty;
        QVERIFY(empty.empty());
        QVERIFY(empty.sectionAt(12.0) == SectionKind::Verse);
        QCOMPARE(empty.kinds().size(), size_t(1));
    }

    void testSectionsBetweenIncludesGaps() {
        auto map = SectionMap::create(songStructure());
        QVERIFY(map.isOk());

        auto inside = map->sectionsBetween(21.0, 24.0);
        QCOMPARE(inside.size(), size_t(1));
        QVERIFY(inside[0] == SectionKind::Chorus);

        auto across = map->sectionsBetween(6.0, 10.0);
        QCOMPARE(across.size(), size_t(2));
        QVERIFY(across[0] == SectionKind::Intro);
        QVERIFY(across[1] == SectionKind::Verse);

        // Chorus end, the uncovered gap, then the outro
        auto gap = map->sectionsBetween(33.0, 52.0);
        QCOMPARE(gap.size(), size_t(3));
        QVERIFY(gap[0] == SectionKind::Chorus);
        QVERIFY(gap[1] == SectionKind::Verse);
        QVERIFY(gap[2] == SectionKind::Outro);
    }

    void testStylesDefaultToNeutral() {
        auto map = SectionMap::create(songStructure());
        QVERIFY(map.isOk());

        QCOMPARE(map->style(SectionKind::Chorus).styleTemplate, std::string("loud"));
        QCOMPARE(map->style(SectionKind::Chorus).glowIntensity, 1.5f);

        const SectionStyle& intro = map->style(SectionKind::Intro);
        QVERIFY(intro.styleTemplate.empty());
        QCOMPARE(intro.glowIntensity, 1.0f);
        QVERIFY(intro.energyBursts);
        QVERIFY(!intro.verticalPosition.has_value());
        QCOMPARE(intro.hueShift, 0.0f);
    }

    void testInvalidSpansRejected() {
        SectionsConfig overlap;
        overlap.spans = {{0.0, 10.0, SectionKind::Intro},
                         {9.0, 20.0, SectionKind::Chorus}};
        auto a = SectionMap::create(overlap);
        QVERIFY(a.isErr());
        QVERIFY(a.error().kind == ErrorKind::InvalidArgument);

        SectionsConfig backwards;
        backwards.spans = {{10.0, 10.0, SectionKind::Bridge}};
        QVERIFY(SectionMap::create(backwards).isErr());

        SectionsConfig touching;
        touching.spans = {{0.0, 10.0, SectionKind::Intro},
                          {10.0, 20.0, SectionKind::Chorus}};
        QVERIFY(SectionMap::create(touching).isOk());
    }
};

int runTestSectionMap(int argc, char** argv) {
    TestSectionMap tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "test_SectionMap.moc"
