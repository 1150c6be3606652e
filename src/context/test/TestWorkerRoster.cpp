#include "WorkerRoster.hpp"
#include "LogUtils.hpp"
#include <cassert>
#include <iostream>
#include <vector>
#include <thread>
#include <atomic>
#include <stdexcept>

void test_current_context_is_thread_local() {
    WorkerContext main_ctx("main");
    WorkerContext other_ctx("other");
    assert(WorkerContext::current() == nullptr);

    WorkerContext::Scope scope(main_ctx);
    assert(WorkerContext::current() == &main_ctx);
    assert(LogUtils::thread_tag() == "main");

    std::atomic<bool> other_ok{false};
    std::thread t([&]() {
        bool clean = WorkerContext::current() == nullptr;
        {
            WorkerContext::Scope inner(other_ctx);
            clean = clean && WorkerContext::current() == &other_ctx;
            clean = clean && LogUtils::thread_tag() == "other";
        }
        other_ok = clean && WorkerContext::current() == nullptr && LogUtils::thread_tag().empty();
    });
    t.join();

    assert(other_ok);
    assert(WorkerContext::current() == &main_ctx);
    assert(LogUtils::thread_tag() == "main");
    std::cout << "test_current_context_is_thread_local passed" << std::endl;
}

void test_properties() {
    WorkerContext ctx("ThreadIdx[0]", {{"device", "stb-01"}}, false);
    assert(ctx.name() == "ThreadIdx[0]");
    assert(ctx.property("device") == "stb-01");
    assert(ctx.property("missing", "none") == "none");
    assert(!ctx.can_kill());
    assert(ctx.barrier() == nullptr);
    std::cout << "test_properties passed" << std::endl;
}

void test_expand_properties() {
    WorkerContext ctx("worker-3", {{"role", "straggler"}, {"device", "stb-01"}});
    assert(ctx.expand("{name} is the {role} on {device}") == "worker-3 is the straggler on stb-01");
    assert(ctx.expand("no placeholders") == "no placeholders");
    // Unknown keys and unbalanced braces are kept as written
    assert(ctx.expand("{missing} {role") == "{missing} {role");
    assert(ctx.expand("{}{role}}") == "{}straggler}");

    WorkerContext named("alpha", {{"name", "override"}});
    assert(named.expand("{name}") == "override");
    std::cout << "test_expand_properties passed" << std::endl;
}

void test_roster_rejects_duplicates() {
    WorkerRoster roster;
    roster.add("worker-0");
    roster.add("worker-1");
    assert(roster.size() == 2);
    assert(roster.find("worker-1") != nullptr);
    assert(roster.find("worker-9") == nullptr);

    bool threw = false;
    try {
        roster.add("worker-1");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    (void)threw;
    assert(threw);

    threw = false;
    try {
        roster.add("");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    std::cout << "test_roster_rejects_duplicates passed" << std::endl;
}

void test_failed_set_inserts_once_under_contention() {
    WorkerRoster roster;
    auto& victim = roster.add("worker-3");
    roster.add("worker-4");

    const size_t num_threads = 8;
    std::atomic<int> winners{0};
    std::vector<std::thread> threads;
    for (size_t i = 0; i < num_threads; ++i) {
        threads.emplace_back([&]() {
            if (roster.failed().insert(victim)) {
                winners++;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    assert(winners == 1);
    assert(roster.failed().size() == 1);
    assert(roster.failed().contains(victim));
    assert(roster.alive_count() == 1);
    std::cout << "test_failed_set_inserts_once_under_contention passed" << std::endl;
}

void test_failed_names_keep_failure_order() {
    WorkerRoster roster;
    auto& a = roster.add("a");
    auto& b = roster.add("b");
    auto& c = roster.add("c");

    roster.failed().insert(c);
    roster.failed().insert(a);
    roster.failed().insert(c);

    auto names = roster.failed().names();
    assert(names.size() == 2);
    assert(names[0] == "c");
    assert(names[1] == "a");
    assert(!roster.failed().contains(b));
    std::cout << "test_failed_names_keep_failure_order passed" << std::endl;
}

void test_terminate_respects_can_kill() {
    WorkerRoster roster;
    auto& killable = roster.add("killable");
    auto& pinned = roster.add("pinned", {}, false);

    roster.terminate(killable);
    roster.terminate(pinned);
    assert(killable.token().is_cancelled());
    assert(!pinned.token().is_cancelled());

    roster.terminate_all();
    assert(pinned.token().is_cancelled());
    std::cout << "test_terminate_respects_can_kill passed" << std::endl;
}

void test_revive_all() {
    WorkerRoster roster;
    auto& w = roster.add("worker-0");
    roster.failed().insert(w);
    roster.terminate(w);

    roster.revive_all();
    assert(roster.failed().empty());
    assert(!w.token().is_cancelled());
    assert(roster.alive_count() == 1);
    std::cout << "test_revive_all passed" << std::endl;
}

int main() {
    test_current_context_is_thread_local();
    test_properties();
    test_expand_properties();
    test_roster_rejects_duplicates();
    test_failed_set_inserts_once_under_contention();
    test_failed_names_keep_failure_order();
    test_terminate_respects_can_kill();
    test_revive_all();

    std::cout << "All WorkerRoster tests passed!" << std::endl;
    return 0;
}
