#pragma once

#include <unordered_map>
#include <shared_mutex>
#include <memory>
#include <mutex>
#include <optional>
#include <cstddef>

/**
 * @brief Потокобезопасная map со значениями по shared_ptr
 *
 * Чтение под shared_lock, запись под unique_lock. Составные операции
 * (insertIfAbsent, update, eraseIf) выполняются целиком под одной
 * блокировкой и поэтому атомарны относительно друг друга.
 *
 * Хранимые объекты наружу не отдаются: чтение только копией (get, forEach),
 * изменение только через update().
 */
template <typename K, typename V>
class ThreadSafeMap
{
public:
    ThreadSafeMap() = default;

    /**
     * @return false если ключ уже есть (значение не меняется)
     */
    bool insertIfAbsent(const K &key, const std::shared_ptr<V> &value)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        return map_.emplace(key, value).second;
    }

    /**
     * @brief Изменить значение под эксклюзивной блокировкой
     *
     * fn(V&) -> bool. Если ключа нет, fn не вызывается.
     * @return результат fn, либо false если ключа нет
     */
    template <typename Fn>
    bool update(const K &key, Fn &&fn)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = map_.find(key);
        if (it == map_.end() || !it->second)
            return false;
        return fn(*it->second);
    }

    /**
     * @return количество удалённых элементов
     */
    template <typename Pred>
    size_t eraseIf(Pred &&pred)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        size_t erased = 0;
        for (auto it = map_.begin(); it != map_.end();)
        {
            if (pred(*it->second))
            {
                it = map_.erase(it);
                ++erased;
            }
            else
            {
                ++it;
            }
        }
        return erased;
    }

    /// Копия значения под shared_lock

    std::optional<V> get(const K &key) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = map_.find(key);
        if (it == map_.end() || !it->second)
            return std::nullopt;
        return *it->second;
    }

    /// fn(const K&, const V&) для каждого элемента под shared_lock
    template <typename Fn>
    void forEach(Fn &&fn) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        for (const auto &[key, value] : map_)
        {
            if (value)
                fn(key, *value);
        }
    }

    size_t size() const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return map_.size();
    }

    void clear()
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        map_.clear();
    }

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<K, std::shared_ptr<V>> map_;
};
