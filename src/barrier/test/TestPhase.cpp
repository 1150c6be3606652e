#include "Phase.hpp"
#include <cassert>
#include <iostream>
#include <vector>
#include <thread>
#include <atomic>
#include <chrono>
#include <stdexcept>

void test_phase_advances_on_last_arrival() {
    Phase phase(3);
    assert(phase.phase() == 0);

    assert(phase.arrive() == 0);
    assert(phase.arrive() == 0);
    assert(phase.unarrived_parties() == 1);
    assert(phase.phase() == 0);

    assert(phase.arrive() == 0);
    assert(phase.phase() == 1);
    assert(phase.unarrived_parties() == 3);

    // Already advanced: returns at once
    assert(phase.await_advance(0) == 1);
    std::cout << "test_phase_advances_on_last_arrival passed" << std::endl;
}

void test_phase_waiters_released_together() {
    const size_t num_threads = 4;
    Phase phase(num_threads);
    std::atomic<size_t> arrived{0};
    std::atomic<bool> all_ok{true};

    std::vector<std::thread> threads;
    for (size_t i = 0; i < num_threads; ++i) {
        threads.emplace_back([&, i]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(i * 5));
            arrived++;
            phase.arrive_and_await_advance();
            if (arrived != num_threads) all_ok = false;
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    assert(all_ok);
    assert(phase.phase() == 1);
    std::cout << "test_phase_waiters_released_together passed" << std::endl;
}

void test_phase_deregister_completes_phase() {
    Phase phase(3);
    phase.arrive();
    phase.arrive();

    // The missing party leaves instead of arriving
    assert(phase.arrive_and_deregister() == 0);
    assert(phase.phase() == 1);
    assert(phase.registered_parties() == 2);
    assert(phase.unarrived_parties() == 2);

    // Next phase only needs the remaining two
    phase.arrive();
    phase.arrive();
    assert(phase.phase() == 2);
    std::cout << "test_phase_deregister_completes_phase passed" << std::endl;
}

void test_phase_deregister_down_to_zero() {
    Phase phase(1);
    phase.arrive_and_deregister();
    assert(phase.registered_parties() == 0);
    assert(phase.phase() == 1);

    // Nothing left to deregister
    assert(phase.arrive_and_deregister() == 1);
    assert(phase.registered_parties() == 0);

    bool threw = false;
    try {
        phase.arrive();
    } catch (const std::logic_error&) {
        threw = true;
    }
    (void)threw;
    assert(threw);
    std::cout << "test_phase_deregister_down_to_zero passed" << std::endl;
}

void test_phase_timed_wait() {
    Phase phase(2);
    auto current = phase.arrive();

    auto start_time = std::chrono::steady_clock::now();
    bool advanced = phase.await_advance_until(current, start_time + std::chrono::milliseconds(30));
    auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);
    (void)advanced;
    assert(!advanced);
    assert(waited.count() >= 30);

    std::thread late([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        phase.arrive();
    });
    advanced = phase.await_advance_until(current, std::chrono::steady_clock::now() + std::chrono::seconds(5));
    late.join();
    assert(advanced);
    std::cout << "test_phase_timed_wait passed" << std::endl;
}

void test_phase_reset_and_register() {
    Phase phase(3);
    auto current = phase.arrive();

    std::thread waiter([&]() { phase.await_advance(current); });
    std::this_thread::sleep_for(std::chrono::milliseconds(10));

    // Re-arming releases anyone still parked on the old phase
    phase.reset(2);
    waiter.join();
    assert(phase.registered_parties() == 2);
    assert(phase.unarrived_parties() == 2);

    phase.bulk_register(1);
    assert(phase.registered_parties() == 3);
    assert(phase.unarrived_parties() == 3);
    std::cout << "test_phase_reset_and_register passed" << std::endl;
}

int main() {
    test_phase_advances_on_last_arrival();
    test_phase_waiters_released_together();
    test_phase_deregister_completes_phase();
    test_phase_deregister_down_to_zero();
    test_phase_timed_wait();
    test_phase_reset_and_register();

    std::cout << "All Phase tests passed!" << std::endl;
    return 0;
}
