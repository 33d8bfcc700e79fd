#pragma once

#include "ports/input/ITokenLedger.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <iostream>
#include <memory>
#include <mutex>
#include <thread>

namespace magiclink::application {

/**
 * @brief Фоновая очистка погашенных и просроченных токенов
 *
 * Для корректности не нужна: погашение само проверяет срок и флаг.
 * interval == 0 отключает фоновый поток.
 */
class TokenSweeper {
public:
    TokenSweeper(
        std::shared_ptr<ports::input::ITokenLedger> ledger,
        std::chrono::seconds interval
    ) : ledger_(std::move(ledger))
      , interval_(interval)
      , running_(false)
      , sweepCount_(0)
      , purgedTotal_(0)
    {}

    ~TokenSweeper() {
        stop();
    }

    TokenSweeper(const TokenSweeper&) = delete;
    TokenSweeper& operator=(const TokenSweeper&) = delete;

    void start() {
        if (interval_.count() <= 0) {
            std::cout << "[TokenSweeper] Disabled" << std::endl;
            return;
        }
        if (running_.exchange(true)) return;

        thread_ = std::thread([this]() {
            std::unique_lock<std::mutex> lock(mutex_);
            while (running_) {
                if (cv_.wait_for(lock, interval_, [this]() { return !running_; })) {
                    break;
                }
                lock.unlock();
                doSweep();
                lock.lock();
            }
        });
        std::cout << "[TokenSweeper] Started, interval=" << interval_.count() << "s" << std::endl;
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!running_.exchange(false)) {
                return;
            }
        }
        cv_.notify_all();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    bool isRunning() const { return running_; }

    uint64_t getSweepCount() const { return sweepCount_; }

    uint64_t getPurgedTotal() const { return purgedTotal_; }

    /**
     * @brief Выполнить одну очистку вручную (для тестов)
     * @return сколько токенов удалено
     */
    size_t manualSweep() {
        return doSweep();
    }

private:
    std::shared_ptr<ports::input::ITokenLedger> ledger_;
    std::chrono::seconds interval_;
    std::atomic<bool> running_;
    std::atomic<uint64_t> sweepCount_;
    std::atomic<uint64_t> purgedTotal_;
    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable cv_;

    size_t doSweep() {
        size_t purged = 0;
        try {
            purged = ledger_->sweep();
        } catch (const std::exception& e) {
            std::cerr << "[TokenSweeper] Sweep failed: " << e.what() << std::endl;
            return 0;
        }

        ++sweepCount_;
        purgedTotal_ += purged;
        if (purged > 0) {
            std::cout << "[TokenSweeper] Purged " << purged << " tokens" << std::endl;
        }
        return purged;
    }
};

} // namespace magiclink::application
