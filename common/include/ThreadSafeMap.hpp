#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace autotrader::common {

/**
 * @brief Потокобезопасный словарь ключ → shared_ptr<V>
 *
 * Чтение под shared_lock, запись под unique_lock.
 * update() выполняет read-modify-write атомарно относительно других писателей.
 */
template <typename K, typename V>
class ThreadSafeMap
{
public:
    ThreadSafeMap() = default;

    void insert(const K &key, const std::shared_ptr<V> &value)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        map_[key] = value;
    }

    std::shared_ptr<V> find(const K &key) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = map_.find(key);
        return (it != map_.end()) ? it->second : nullptr;
    }

    bool contains(const K &key) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return map_.find(key) != map_.end();
    }

    /**
     * @brief Изменить значение под эксклюзивной блокировкой
     *
     * Если ключа нет, значение создаётся через factory().
     * mutator получает копию, результат публикуется новым shared_ptr,
     * поэтому ранее выданные через find() указатели не меняются.
     */
    V update(const K &key,
             const std::function<V()> &factory,
             const std::function<void(V &)> &mutator)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = map_.find(key);
        V value = (it != map_.end() && it->second) ? *it->second : factory();
        mutator(value);
        map_[key] = std::make_shared<V>(value);
        return value;
    }

    bool erase(const K &key)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        return map_.erase(key) > 0;
    }

    std::vector<K> keys() const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        std::vector<K> result;
        result.reserve(map_.size());
        for (const auto &entry : map_) {
            result.push_back(entry.first);
        }
        return result;
    }

    size_t size() const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return map_.size();
    }

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<K, std::shared_ptr<V>> map_;
};

} // namespace autotrader::common
