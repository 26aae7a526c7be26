#include <QTemporaryDir>
#include <QtTest>
#include <fstream>
#include <iterator>
#include "core/Logger.hpp"

class TestLogger : public QObject {
    Q_OBJECT

private slots:
    void initTestCase() {
        lf::Logger::shutdown();
    }

    void testInitialization() {
        lf::Logger::init("lyricforge_test", true);
        QVERIFY(lf::Logger::get() != nullptr);
        QVERIFY(lf::Logger::get()->should_log(spdlog::level::debug));

        LOG_INFO("Test info message");
        LOG_WARN("Test warn message {}", 42);
        LOG_ERROR("Test error message");

        lf::Logger::shutdown();
    }

    void testLazyInitOnGet() {
        lf::Logger::shutdown();
        QVERIFY(lf::Logger::get() != nullptr);
        QVERIFY(!lf::Logger::get()->should_log(spdlog::level::debug));
        lf::Logger::shutdown();
    }

    void testDoubleInit() {
        lf::Logger::init("lyricforge_test", false);
        lf::Logger::init("lyricforge_test", true);
        QVERIFY(lf::Logger::get() != nullptr);
        QVERIFY(lf::Logger::get()->should_log(spdlog::level::debug));
        lf::Logger::shutdown();
    }

    void testFileSinkInCustomDirectory() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());

        lf::LogOptions options;
        options.console = false;
        options.directory = std::filesystem::path(dir.path().toStdString()) / "logs";
        lf::Logger::init("lyricforge_file", options);

        const auto path = lf::Logger::logFile();
        QVERIFY(path == *options.directory / "lyricforge_file.log");
        LOG_WARN("frame {} retried", 7);
        lf::Logger::get()->flush();

        std::ifstream in(path);
        std::string contents((std::istreambuf_iterator<char>(in)),
                             std::istreambuf_iterator<char>());
        QVERIFY(contents.find("frame 7 retried") != std::string::npos);

        lf::Logger::shutdown();
        QVERIFY(lf::Logger::logFile().empty());
    }

    void testParseLevel() {
        QCOMPARE(lf::Logger::parseLevel("trace"), spdlog::level::trace);
        QCOMPARE(lf::Logger::parseLevel("warning"), spdlog::level::warn);
        QCOMPARE(lf::Logger::parseLevel("error"), spdlog::level::err);
        QCOMPARE(lf::Logger::parseLevel("off"), spdlog::level::off);
        QCOMPARE(lf::Logger::parseLevel("loud"), spdlog::level::info);
    }

    void cleanupTestCase() {
        // Leave a quiet logger for the suites that follow
        lf::Logger::init("lyricforge_test", false);
    }
};

int runTestLogger(int argc, char** argv) {
    TestLogger tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "test_Logger.moc"
