#pragma once

#include "CommandException.hpp"
#include "ICommand.hpp"
#include "ThreadSafeQueue.hpp"

#include <atomic>
#include <future>
#include <iostream>
#include <memory>
#include <thread>
#include <type_traits>
#include <vector>

namespace autotrader::common {

/**
 * @brief Команда-обёртка над packaged_task
 *
 * Исключение из задачи попадает в future, а не в поток пула.
 */
template <typename R>
class TaskCommand : public ICommand {
public:
    template <typename F>
    explicit TaskCommand(F&& fn) : task_(std::forward<F>(fn)) {}

    std::future<R> getFuture() { return task_.get_future(); }

    void execute() override { task_(); }

private:
    std::packaged_task<R()> task_;
};

/**
 * @brief Ограниченный пул потоков поверх ThreadSafeQueue
 *
 * Используется циклом торговли для анализа символов и чтений из БД,
 * чтобы ожидание можно было ограничить таймаутом через future::wait_for.
 * Таймаут отменяет только ожидание: задача дорабатывает в пуле,
 * её результат отбрасывается.
 *
 * @example
 * ```cpp
 * WorkerPool pool(4);
 * auto f = pool.submit([] { return 42; });
 * if (f.wait_for(std::chrono::seconds(1)) == std::future_status::ready) {
 *     int v = f.get();
 * }
 * ```
 */
class WorkerPool {
public:
    explicit WorkerPool(size_t threads = 4) {
        if (threads == 0) threads = 1;
        workers_.reserve(threads);
        for (size_t i = 0; i < threads; ++i) {
            workers_.emplace_back([this]() { workerLoop(); });
        }
    }

    ~WorkerPool() {
        stop();
    }

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * @brief Поставить задачу в пул
     * @throws CommandException если пул уже остановлен
     */
    template <typename F>
    auto submit(F&& fn) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
        using R = std::invoke_result_t<std::decay_t<F>>;
        auto command = std::make_shared<TaskCommand<R>>(std::forward<F>(fn));
        auto future = command->getFuture();
        if (!queue_.push(command)) {
            throw CommandException("WorkerPool is stopped");
        }
        return future;
    }

    /**
     * @brief Закрыть очередь и дождаться завершения уже поставленных задач
     */
    void stop() {
        if (stopped_.exchange(true)) return;
        queue_.shutdown();
        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    size_t threadCount() const { return workers_.size(); }
    size_t pending() const { return queue_.size(); }

private:
    void workerLoop() {
        while (auto command = queue_.pop()) {
            try {
                command->execute();
            } catch (const std::exception& e) {
                std::cerr << "[WorkerPool] Command failed: " << e.what() << std::endl;
            }
        }
    }

    ThreadSafeQueue queue_;
    std::vector<std::thread> workers_;
    std::atomic<bool> stopped_{false};
};

} // namespace autotrader::common
