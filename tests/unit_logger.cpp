// SPDX-License-Identifier: Apache-2.0
// unit_logger.cpp
// Lines logged while the async consumer is shutting down are written, not stranded in the queue.
#include "common/logger.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>
#include <vector>

using namespace serpent;

int main()
{
    log::set_level(log::level::warn);
    log::init(); // asynchronous consumer
    assert(log::detail::g_running.load());

    constexpr int k_writers = 4;
    constexpr int k_lines = 200;
    uint64_t before = log::lines_written();

    std::vector<std::thread> writers;
    for (int w = 0; w < k_writers; ++w) {
        writers.emplace_back([w] {
            for (int i = 0; i < k_lines; ++i)
                log::warn("writer={} line={}", w, i);
        });
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
    log::detail::shutdown();
    for (auto &t : writers)
        t.join();

    assert(!log::detail::g_running.load());
    assert(log::detail::g_queue.empty());
    assert(log::lines_written() - before == static_cast<uint64_t>(k_writers * k_lines));

    // After shutdown lines go straight to stderr.
    log::warn("after shutdown");
    assert(log::lines_written() - before == static_cast<uint64_t>(k_writers * k_lines + 1));

    std::cout << "unit_logger OK" << std::endl;
    return 0;
}
