#pragma once

#include "ICommand.hpp"
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>

namespace autotrader::common {

/**
 * @file ThreadSafeQueue.hpp
 * @brief Блокирующая очередь команд для WorkerPool
 * @details
 * pop() ждёт, пока появится команда или очередь будет закрыта.
 * После shutdown() новые команды не принимаются, но уже поставленные
 * дорабатываются до конца.
 */
class ThreadSafeQueue {
private:
    std::deque<std::shared_ptr<ICommand>> queue_;
    mutable std::mutex mutex_;
    std::condition_variable condVar_;
    bool shutdown_ = false;

public:
    ThreadSafeQueue();
    ~ThreadSafeQueue();

    ThreadSafeQueue(const ThreadSafeQueue&) = delete;
    ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;

    /**
     * @brief Поставить команду в очередь
     * @return false если очередь закрыта или command == nullptr
     */
    bool push(std::shared_ptr<ICommand> command);

    /**
     * @brief Извлечь команду (блокирующий вызов)
     * @return команда, либо nullptr если очередь закрыта и пуста
     */
    std::shared_ptr<ICommand> pop();

    /**
     * @brief Закрыть очередь и разбудить все ожидающие потоки
     */
    void shutdown();

    bool isShutdown() const;
    bool isEmpty() const;
    size_t size() const;
};

} // namespace autotrader::common
