#include "StaticBarrier.hpp"
#include <cassert>
#include <iostream>
#include <vector>
#include <thread>
#include <atomic>
#include <chrono>
#include <stdexcept>

void test_static_barrier_releases_together() {
    const size_t num_threads = 5;
    StaticBarrier ready(num_threads);
    StaticBarrier check(num_threads);
    std::atomic<size_t> initialized{0};

    std::vector<std::thread> threads;
    for (size_t i = 0; i < num_threads; ++i) {
        threads.emplace_back([&]() {
            initialized++;

            // Nobody passes before every worker is initialized
            ready.arrive();
            assert(initialized == num_threads);

            check.arrive();
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    assert(initialized == num_threads);
    std::cout << "test_static_barrier_releases_together passed" << std::endl;
}

void test_static_barrier_generations() {
    const size_t num_threads = 3;
    StaticBarrier barrier(num_threads);
    std::atomic<size_t> counter{0};
    std::atomic<bool> generations_ok{true};

    std::vector<std::thread> threads;
    for (size_t i = 0; i < num_threads; ++i) {
        threads.emplace_back([&]() {
            counter++;
            if (barrier.arrive() != 0) generations_ok = false;
            if (counter < num_threads) generations_ok = false;

            // Second generation: nobody may leave it before everyone counted again
            if (barrier.arrive() != 1) generations_ok = false;
            counter++;
            if (barrier.arrive() != 2) generations_ok = false;
            if (counter != num_threads * 2) generations_ok = false;
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    assert(generations_ok);
    assert(counter == num_threads * 2);
    std::cout << "test_static_barrier_generations passed" << std::endl;
}

void test_static_barrier_single_party() {
    StaticBarrier barrier(1);
    assert(barrier.parties() == 1);
    assert(barrier.arrive() == 0);
    assert(barrier.arrive() == 1);
    std::cout << "test_static_barrier_single_party passed" << std::endl;
}

void test_static_barrier_waits_for_last_arrival() {
    const size_t num_threads = 4;
    StaticBarrier barrier(num_threads);
    std::atomic<bool> all_passed{true};

    std::vector<std::thread> threads;
    for (size_t i = 0; i < num_threads; ++i) {
        threads.emplace_back([i, &barrier, &all_passed]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(i * 10));

            auto start_time = std::chrono::steady_clock::now();
            barrier.arrive();
            auto end_time = std::chrono::steady_clock::now();

            // The first worker waits for the slowest one
            if (i == 0) {
                auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);
                if (waited.count() < 25) {
                    all_passed = false;
                }
            }
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    assert(all_passed == true);
    std::cout << "test_static_barrier_waits_for_last_arrival passed" << std::endl;
}

void test_static_barrier_rejects_zero_parties() {
    bool threw = false;
    try {
        StaticBarrier barrier(0);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    (void)threw;
    assert(threw);
    std::cout << "test_static_barrier_rejects_zero_parties passed" << std::endl;
}

int main() {
    test_static_barrier_releases_together();
    test_static_barrier_generations();
    test_static_barrier_single_party();
    test_static_barrier_waits_for_last_arrival();
    test_static_barrier_rejects_zero_parties();

    std::cout << "All StaticBarrier tests passed!" << std::endl;
    return 0;
}
