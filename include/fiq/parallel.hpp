// ==============================================================================
// fiq/parallel.hpp - Data-parallel пул для хеширования и поиска по содержимому
// ==============================================================================
//
// Назначение:
// - Выполнить функцию для каждого индекса [0, count) на N потоках
// - Раздача работы через атомарный счётчик (без очереди задач)
//
// Размер пула: FIQ_POOL_THREADS / config pool_threads, иначе число ядер.
// Пул не пересекается с потоками walker'а.
//
// ==============================================================================

#ifndef FIQ_PARALLEL_HPP
#define FIQ_PARALLEL_HPP

#include "fiq/config.hpp"
#include "fiq/platform.hpp"

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <exception>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

namespace fiq::parallel {

/// Число потоков data-parallel пула
inline std::size_t pool_threads() {
    auto settings = config::current();
    if (settings.pool_threads.has_value()) {
        return *settings.pool_threads;
    }
    return platform::available_cores();
}

/// Вызвать fn(i) для каждого i в [0, count).
/// Порядок вызовов не определён. Первое исключение из fn пробрасывается
/// вызывающему после остановки всех потоков.
template <typename Fn>
void for_each_index(std::size_t count, Fn&& fn, std::size_t threads) {
    if (count == 0) {
        return;
    }
    std::size_t n = std::min(std::max<std::size_t>(1, threads), count);
    if (n == 1) {
        for (std::size_t i = 0; i < count; ++i) {
            fn(i);
        }
        return;
    }

    std::atomic<std::size_t> next{0};
    std::atomic<bool> failed{false};
    std::exception_ptr first_error;
    std::mutex error_mutex;

    auto worker = [&]() {
        while (!failed.load(std::memory_order_relaxed)) {
            std::size_t i = next.fetch_add(1, std::memory_order_relaxed);
            if (i >= count) {
                return;
            }
            try {
                fn(i);
            } catch (...) {
                std::lock_guard<std::mutex> lock(error_mutex);
                if (!first_error) {
                    first_error = std::current_exception();
                }
                failed.store(true, std::memory_order_relaxed);
            }
        }
    };

    std::vector<std::thread> workers;
    workers.reserve(n);
    for (std::size_t t = 0; t < n; ++t) {
        workers.emplace_back(worker);
    }
    for (auto& w : workers) {
        w.join();
    }

    if (first_error) {
        std::rethrow_exception(first_error);
    }
}

/// То же на пуле размера pool_threads()
template <typename Fn>
void for_each_index(std::size_t count, Fn&& fn) {
    for_each_index(count, std::forward<Fn>(fn), pool_threads());
}

}  // namespace fiq::parallel

#endif  // FIQ_PARALLEL_HPP
