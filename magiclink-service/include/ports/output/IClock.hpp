#pragma once

#include <chrono>

namespace magiclink::ports::output {

/**
 * @brief Источник текущего времени
 *
 * Все проверки сроков (токены, сессии, cooldown) идут через него,
 * чтобы тесты могли двигать время вручную.
 */
class IClock {
public:
    virtual ~IClock() = default;

    virtual std::chrono::system_clock::time_point now() const = 0;
};

} // namespace magiclink::ports::output
