// parallel.hpp
#pragma once
#include <algorithm>
#include <cstddef>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

namespace par {

inline unsigned hw_threads() {
    unsigned t = std::thread::hardware_concurrency();
    return t ? t : 4;
}

// Runs fn(i) for i in [begin, end). Ranges shorter than `grain` stay on the
// calling thread. The first exception thrown by a worker is rethrown here
// after all workers have joined.
template <class Fn>
inline void parallel_for(std::size_t begin, std::size_t end, Fn fn,
                         unsigned threads = 0, std::size_t grain = 1024) {
    const std::size_t N = (end > begin) ? (end - begin) : 0;
    if (N == 0) return;

    unsigned T = threads ? threads : hw_threads();
    if (T <= 1 || N < grain) {
        for (std::size_t i = begin; i < end; ++i) fn(i);
        return;
    }

    T = std::min<unsigned>(T, (unsigned)N);
    std::vector<std::thread> pool; pool.reserve(T);
    std::size_t chunk = (N + T - 1) / T;

    std::mutex m;
    std::exception_ptr first;
    for (unsigned t = 0; t < T; ++t) {
        std::size_t s = begin + t * chunk;
        std::size_t e = std::min(begin + (t + 1) * chunk, end);
        if (s >= e) break;
        pool.emplace_back([=, &fn, &m, &first]() {
            try {
                for (std::size_t i = s; i < e; ++i) fn(i);
            } catch (...) {
                std::lock_guard<std::mutex> lk(m);
                if (!first) first = std::current_exception();
            }
        });
    }
    for (auto& th : pool) th.join();
    if (first) std::rethrow_exception(first);
}

}
