#pragma once

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <future>
#include <memory>
#include <optional>
#include <stdexcept>
#include <type_traits>

namespace magiclink::utils {

/**
 * @brief Выполнение операций с ограничением по времени ожидания
 *
 * Операции идут в фиксированный пул потоков (boost::asio::thread_pool).
 * Если результат не готов за timeout, вызывающий получает std::nullopt,
 * а операция доработает в пуле и её результат будет отброшен. Поэтому fn
 * должна владеть всем, что использует (захват по значению, shared_ptr).
 *
 * Число незавершённых операций (в очереди и в работе) ограничено maxInFlight.
 * При достижении лимита run() сразу возвращает std::nullopt, ничего
 * не ставя в очередь: зависшее хранилище не копит потоки и задачи.
 *
 * Исключение из fn пробрасывается вызывающему, если оно успело произойти
 * до истечения timeout.
 */
class DeadlineExecutor {
public:
    DeadlineExecutor(size_t workers, size_t maxInFlight)
        : maxInFlight_(maxInFlight)
        , pool_(checkedWorkers(workers, maxInFlight))
    {}

    ~DeadlineExecutor() {
        pool_.stop();
        pool_.join();
    }

    DeadlineExecutor(const DeadlineExecutor&) = delete;
    DeadlineExecutor& operator=(const DeadlineExecutor&) = delete;

    template <typename Fn>
    std::optional<std::invoke_result_t<Fn>> run(std::chrono::milliseconds timeout, Fn fn) {
        using Result = std::invoke_result_t<Fn>;

        if (!tryAcquire()) {
            return std::nullopt;
        }

        auto task = std::make_shared<std::packaged_task<Result()>>(std::move(fn));
        auto future = task->get_future();

        boost::asio::post(pool_, [this, task]() {
            SlotGuard guard(inFlight_);
            (*task)();
        });

        if (future.wait_for(timeout) != std::future_status::ready) {
            return std::nullopt;
        }
        return future.get();
    }

    /// Операции в очереди и в работе, включая брошенные по таймауту
    size_t inFlight() const { return inFlight_.load(); }

    size_t capacity() const { return maxInFlight_; }

private:
    struct SlotGuard {
        explicit SlotGuard(std::atomic<size_t>& counter) : counter_(counter) {}
        ~SlotGuard() { counter_.fetch_sub(1); }
        std::atomic<size_t>& counter_;
    };

    static size_t checkedWorkers(size_t workers, size_t maxInFlight) {
        if (workers == 0 || maxInFlight == 0) {
            throw std::invalid_argument("DeadlineExecutor needs at least one worker and one slot");
        }
        return workers;
    }

    bool tryAcquire() {
        size_t current = inFlight_.load();
        while (current < maxInFlight_) {
            if (inFlight_.compare_exchange_weak(current, current + 1)) {
                return true;
            }
        }
        return false;
    }

    const size_t maxInFlight_;
    std::atomic<size_t> inFlight_{0};
    boost::asio::thread_pool pool_;
};

} // namespace magiclink::utils
