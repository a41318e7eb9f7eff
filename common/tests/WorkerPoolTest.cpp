#include <gtest/gtest.h>
#include <WorkerPool.hpp>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

using autotrader::common::CommandException;
using autotrader::common::WorkerPool;

class WorkerPoolTest : public ::testing::Test {
protected:
    WorkerPool pool{2};
};

// ============================================================================
// ТЕСТЫ: результаты и исключения
// ============================================================================

TEST_F(WorkerPoolTest, Submit_ReturnsValueThroughFuture) {
    auto future = pool.submit([]() { return 6 * 7; });
    EXPECT_EQ(future.get(), 42);
}

TEST_F(WorkerPoolTest, Submit_ExceptionPropagatesToCaller) {
    auto future = pool.submit([]() -> int { throw std::runtime_error("boom"); });
    EXPECT_THROW(future.get(), std::runtime_error);
}

TEST_F(WorkerPoolTest, ManyTasks_AllExecuted) {
    std::atomic<int> counter{0};
    std::vector<std::future<void>> futures;
    for (int i = 0; i < 100; ++i) {
        futures.push_back(pool.submit([&counter]() { counter++; }));
    }
    for (auto& f : futures) {
        f.get();
    }
    EXPECT_EQ(counter, 100);
}

// ============================================================================
// ТЕСТЫ: таймаут ожидания
// ============================================================================

TEST_F(WorkerPoolTest, WaitFor_TimesOutButTaskStillCompletes) {
    std::atomic<bool> finished{false};
    auto future = pool.submit([&finished]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(150));
        finished = true;
        return 1;
    });

    EXPECT_EQ(future.wait_for(std::chrono::milliseconds(10)), std::future_status::timeout);
    EXPECT_EQ(future.get(), 1);
    EXPECT_TRUE(finished);
}

// ============================================================================
// ТЕСТЫ: остановка
// ============================================================================

TEST_F(WorkerPoolTest, SubmitAfterStop_Throws) {
    pool.stop();
    EXPECT_THROW(pool.submit([]() { return 0; }), CommandException);
}

TEST_F(WorkerPoolTest, Stop_DrainsQueuedTasks) {
    std::atomic<int> counter{0};
    for (int i = 0; i < 10; ++i) {
        pool.submit([&counter]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
            counter++;
        });
    }
    pool.stop();
    EXPECT_EQ(counter, 10);
}
