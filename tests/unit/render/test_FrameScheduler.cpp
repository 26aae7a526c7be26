#include <QtTest>
#include <atomic>
#include <random>
#include <thread>
#include "render/FrameScheduler.hpp"

using namespace lf;

namespace {

SchedulerConfig schedulerConfig(u32 workers, u32 pool, u32 reorder) {
    SchedulerConfig cfg;
    cfg.workers = workers;
    cfg.poolSize = pool;
    cfg.reorderCapacity = reorder;
    cfg.frameTimeoutMs = 1000;
    cfg.maxRenderAttempts = 3;
    return cfg;
}

Result<FrameBufferPtr> renderInto(BufferPool& pool, u64 index,
                                  const RenderAttempt& attempt) {
    auto buffer = pool.acquire(attempt.stop);
    if (!buffer)
        return buffer;
    buffer.value()->timestamp = static_cast<f64>(index) / 30.0;
    return buffer;
}

} // namespace

class TestFrameScheduler : public QObject {
    Q_OBJECT

private slots:
    void testDeliversInOrderUnderRandomDelays() {
        BufferPool pool(4, 16, 16, 2);
        FrameScheduler scheduler(schedulerConfig(4, 4, 4), pool);

        std::mutex rngMutex;
        std::mt19937 rng(1234);
        std::vector<u64> consumed;

        auto result = scheduler.run(
                {0, 120},
                [&](u64 index, const RenderAttempt& attempt) {
                    int delay;
                    {
                        std::lock_guard lock(rngMutex);
                        delay = std::uniform_int_distribution<int>(0, 3)(rng);
                    }
                    std::this_thread::sleep_for(std::chrono::milliseconds(delay));
                    return renderInto(pool, index, attempt);
                },
                [&](const FrameBuffer& frame) {
                    consumed.push_back(frame.index);
                    return Result<void>::ok();
                });

        QVERIFY(result.isOk());
        QCOMPARE(consumed.size(), size_t(120));
        for (u64 i = 0; i < consumed.size(); ++i)
            QCOMPARE(consumed[i], i);
        QCOMPARE(pool.available(), size_t(4));
    }

    void testBackpressureBoundsFramesInFlight() {
        BufferPool pool(3, 16, 16, 0);
        FrameScheduler scheduler(schedulerConfig(8, 3, 16), pool);
        QCOMPARE(scheduler.window(), size_t(3));

        std::atomic<u64> consumedCount{0};
        std::atomic<u64> maxAhead{0};

        auto result = scheduler.run(
                {0, 60},
                [&](u64 index, const RenderAttempt& attempt) {
                    const u64 ahead = index - consumedCount.load();
                    u64 prev = maxAhead.load();
                    while (ahead > prev && !maxAhead.compare_exchange_weak(prev, ahead)) {
                    }
                    return renderInto(pool, index, attempt);
                },
                [&](const FrameBuffer&) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(2));
                    ++consumedCount;
                    return Result<void>::ok();
                });

        QVERIFY(result.isOk());
        QVERIFY(maxAhead.load() < 3);
        QVERIFY(pool.peakOutstanding() <= 3);
    }

    void testCancellationStopsRun() {
        BufferPool pool(4, 16, 16, 0);
        FrameScheduler scheduler(schedulerConfig(3, 4, 4), pool);
        std::stop_source stop;
        u64 consumed = 0;

        auto result = scheduler.run(
                {0, 1000},
                [&](u64 index, const RenderAttempt& attempt) {
                    return renderInto(pool, index, attempt);
                },
                [&](const FrameBuffer&) {
                    if (++consumed == 5)
                        stop.request_stop();
                    return Result<void>::ok();
                },
                stop.get_token());

        QVERIFY(result.isErr());
        QVERIFY(result.error().kind == ErrorKind::Cancelled);
        QVERIFY(consumed < 1000);
        QCOMPARE(pool.available(), size_t(4));
    }

    void testTimedOutFrameIsRetried() {
        BufferPool pool(2, 16, 16, 0);
        FrameScheduler scheduler(schedulerConfig(2, 2, 2), pool);
        std::vector<u64> consumed;

        auto result = scheduler.run(
                {0, 10},
                [&](u64 index, const RenderAttempt& attempt) -> Result<FrameBufferPtr> {
                    if (index == 3 && attempt.attempt == 1) {
                        return Result<FrameBufferPtr>::err(
                                Error(ErrorKind::FrameRenderTimeout, "slow")
                                        .markRecoverable());
                    }
                    return renderInto(pool, index, attempt);
                },
                [&](const FrameBuffer& frame) {
                    consumed.push_back(frame.index);
                    return Result<void>::ok();
                });

        QVERIFY(result.isOk());
        QCOMPARE(scheduler.retries(), u64(1));
        QCOMPARE(consumed.size(), size_t(10));
        QCOMPARE(consumed[3], u64(3));
    }

    void testExhaustedRetriesReportFrame() {
        BufferPool pool(2, 16, 16, 0);
        auto cfg = schedulerConfig(2, 2, 2);
        cfg.maxRenderAttempts = 2;
        FrameScheduler scheduler(cfg, pool);

        auto result = scheduler.run(
                {0, 10},
                [&](u64 index, const RenderAttempt& attempt) -> Result<FrameBufferPtr> {
                    if (index == 2) {
                        return Result<FrameBufferPtr>::err(
                                Error(ErrorKind::FrameRenderTimeout, "slow")
                                        .markRecoverable());
                    }
                    return renderInto(pool, index, attempt);
                },
                [](const FrameBuffer&) { return Result<void>::ok(); });

        QVERIFY(result.isErr());
        QVERIFY(result.error().kind == ErrorKind::FrameRenderTimeout);
        QCOMPARE(result.error().frameIndex.value_or(0), u64(2));
        QCOMPARE(pool.available(), size_t(2));
    }

    void testFirstFailureStopsTheRest() {
        BufferPool pool(4, 16, 16, 0);
        FrameScheduler scheduler(schedulerConfig(4, 4, 4), pool);
        std::vector<u64> consumed;

        auto result = scheduler.run(
                {0, 50},
                [&](u64 index, const RenderAttempt& attempt) -> Result<FrameBufferPtr> {
                    if (index == 7) {
                        return Result<FrameBufferPtr>::err(ErrorKind::LayoutOverflow,
                                                           "does not fit");
                    }
                    return renderInto(pool, index, attempt);
                },
                [&](const FrameBuffer& frame) {
                    consumed.push_back(frame.index);
                    return Result<void>::ok();
                });

        QVERIFY(result.isErr());
        QVERIFY(result.error().kind == ErrorKind::LayoutOverflow);
        QCOMPARE(result.error().frameIndex.value_or(0), u64(7));
        QVERIFY(consumed.size() <= 7);
        for (u64 i = 0; i < consumed.size(); ++i)
            QCOMPARE(consumed[i], i);
        QCOMPARE(pool.available(), size_t(4));
    }

    void testRendererCancellationWithoutStopFailsRun() {
        BufferPool pool(4, 16, 16, 0);
        FrameScheduler scheduler(schedulerConfig(2, 4, 4), pool);
        std::vector<u64> consumed;

        auto result = scheduler.run(
                {0, 10},
                [&](u64 index, const RenderAttempt& attempt) -> Result<FrameBufferPtr> {
                    if (index == 3) {
                        return Result<FrameBufferPtr>::err(ErrorKind::Cancelled,
                                                           "font service went away");
                    }
                    return renderInto(pool, index, attempt);
                },
                [&](const FrameBuffer& frame) {
                    consumed.push_back(frame.index);
                    return Result<void>::ok();
                });

        QVERIFY(result.isErr());
        QVERIFY(result.error().kind == ErrorKind::Cancelled);
        QCOMPARE(result.error().frameIndex.value_or(0), u64(3));
        QVERIFY(consumed.size() <= 3);
        QCOMPARE(pool.available(), size_t(4));
    }

    void testConsumerErrorPropagates() {
        BufferPool pool(2, 16, 16, 0);
        FrameScheduler scheduler(schedulerConfig(2, 2, 2), pool);

        auto result = scheduler.run(
                {0, 20},
                [&](u64 index, const RenderAttempt& attempt) {
                    return renderInto(pool, index, attempt);
                },
                [](const FrameBuffer& frame) {
                    if (frame.index == 4)
                        return Result<void>::err(ErrorKind::Encoding, "disk full");
                    return Result<void>::ok();
                });

        QVERIFY(result.isErr());
        QVERIFY(result.error().kind == ErrorKind::Encoding);
        QCOMPARE(result.error().frameIndex.value_or(0), u64(4));
    }

    void testReorderBufferRejectsDuplicates() {
        ReorderBuffer reorder(4);
        auto a = std::make_unique<FrameBuffer>(4, 4, 0);
        a->index = 1;
        auto b = std::make_unique<FrameBuffer>(4, 4, 0);
        b->index = 1;
        auto far = std::make_unique<FrameBuffer>(4, 4, 0);
        far->index = 9;

        QVERIFY(reorder.push(std::move(a)).isOk());
        QVERIFY(reorder.push(std::move(b)).isErr());
        QVERIFY(reorder.push(std::move(far)).isErr());
        QCOMPARE(reorder.pending(), size_t(1));
        QCOMPARE(reorder.next(), u64(0));
    }
};

int runTestFrameScheduler(int argc, char** argv) {
    TestFrameScheduler tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "test_FrameScheduler.moc"
