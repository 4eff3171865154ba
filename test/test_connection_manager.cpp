#include "test_util.hpp"
#include "fake_tcp_client.hpp"

#include "comm/ConnectionManager.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

using namespace urdash::comm;
using namespace std::chrono_literals;

static std::shared_ptr<fake::FakeNetwork> make_net() {
    return std::make_shared<fake::FakeNetwork>();
}

static void test_connect_first_attempt() {
    std::fprintf(stderr, "-- test_connect_first_attempt\n");
    auto net = make_net();
    std::atomic<bool> abort{false};
    ConnectionManager mgr("robot", 29999, 100ms, 20ms, fake::factoryFor(net));

    CHECK(!mgr.hasHandle());
    CHECK(mgr.connect(1000ms, abort));
    CHECK(mgr.hasHandle());
    CHECK(mgr.current() != nullptr);
    CHECK(mgr.current()->isConnected());
    CHECK_EQ(net->with([](fake::FakeNetwork& n) { return n.created; }), 1);

    // already connected: no new handle
    CHECK(mgr.connect(1000ms, abort));
    CHECK_EQ(net->with([](fake::FakeNetwork& n) { return n.created; }), 1);
}

static void test_retry_keeps_single_handle() {
    std::fprintf(stderr, "-- test_retry_keeps_single_handle\n");
    auto net = make_net();
    net->failConnects = 3;
    std::atomic<bool> abort{false};
    ConnectionManager mgr("robot", 29999, 100ms, 10ms, fake::factoryFor(net));

    CHECK(mgr.connect(2000ms, abort));
    net->with([](fake::FakeNetwork& n) {
        CHECK_EQ(n.created, 4);
        CHECK_EQ(n.opened, 1);
        CHECK_EQ(n.maxLive, 1);
        CHECK_EQ(n.live, 1);
        return 0;
    });

    // replace the handle several times: never two open at once
    for (int i = 0; i < 3; ++i) {
        mgr.disconnect();
        CHECK(!mgr.hasHandle());
        CHECK(mgr.connect(1000ms, abort));
    }
    net->with([](fake::FakeNetwork& n) {
        CHECK_EQ(n.opened, 4);
        CHECK_EQ(n.closed, 3);
        CHECK_EQ(n.maxLive, 1);
        return 0;
    });
}

static void test_budget_exhausted() {
    std::fprintf(stderr, "-- test_budget_exhausted\n");
    auto net = make_net();
    net->refuseAll = true;
    std::atomic<bool> abort{false};
    ConnectionManager mgr("robot", 29999, 100ms, 50ms, fake::factoryFor(net));

    auto t0 = std::chrono::steady_clock::now();
    CHECK(!mgr.connect(300ms, abort));
    auto ms = elapsed_ms(t0);
    CHECK(ms >= 250);
    CHECK(ms < 1500);
    CHECK(!mgr.hasHandle());
    net->with([](fake::FakeNetwork& n) {
        CHECK(n.created >= 2);
        CHECK_EQ(n.live, 0);
        return 0;
    });
}

static void test_abort_stops_connect() {
    std::fprintf(stderr, "-- test_abort_stops_connect\n");
    auto net = make_net();
    net->refuseAll = true;
    std::atomic<bool> abort{true};
    ConnectionManager mgr("robot", 29999, 100ms, 50ms, fake::factoryFor(net));

    auto t0 = std::chrono::steady_clock::now();
    CHECK(!mgr.connect(5000ms, abort));
    CHECK(elapsed_ms(t0) < 500);
    CHECK_EQ(net->with([](fake::FakeNetwork& n) { return n.created; }), 0);
}

static void test_null_factory_rejected() {
    std::fprintf(stderr, "-- test_null_factory_rejected\n");
    bool threw = false;
    try {
        ConnectionManager mgr("robot", 29999, 100ms, 50ms, nullptr);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    CHECK(threw);
}

static void test_write_all() {
    std::fprintf(stderr, "-- test_write_all\n");
    auto net = make_net();
    std::atomic<bool> abort{false};
    ConnectionManager mgr("robot", 29999, 100ms, 20ms, fake::factoryFor(net));

    // no handle: bounded by the budget
    auto t0 = std::chrono::steady_clock::now();
    CHECK(!mgr.writeAll("play\n", 200ms, abort));
    auto ms = elapsed_ms(t0);
    CHECK(ms >= 150);
    CHECK(ms < 1500);

    CHECK(mgr.connect(1000ms, abort));
    CHECK(mgr.writeAll("play\n", 200ms, abort));
    net->with([](fake::FakeNetwork& n) {
        CHECK_EQ(n.written.size(), 1u);
        CHECK(n.written[0] == "play\n");
        return 0;
    });

    mgr.disconnect();
    mgr.disconnect(); // idempotent
    CHECK(!mgr.writeAll("stop\n", 100ms, abort));
}

static void test_write_all_waits_for_hook() {
    std::fprintf(stderr, "-- test_write_all_waits_for_hook\n");
    auto net = make_net();
    std::atomic<bool> abort{false};
    ConnectionManager mgr("robot", 29999, 100ms, 20ms, fake::factoryFor(net));
    CHECK(mgr.connect(1000ms, abort));

    // hook refuses: nothing goes on the wire, bounded by the budget
    int calls = 0;
    auto t0 = std::chrono::steady_clock::now();
    CHECK(!mgr.writeAll("play\n", 200ms, abort, [&calls]() { ++calls; return false; }));
    auto ms = elapsed_ms(t0);
    CHECK(ms >= 150);
    CHECK(ms < 1500);
    CHECK(calls >= 2);
    CHECK_EQ(net->with([](fake::FakeNetwork& n) { return n.written.size(); }), 0u);

    // hook opens after a few rounds: exactly one write follows
    calls = 0;
    CHECK(mgr.writeAll("stop\n", 1000ms, abort, [&calls]() { return ++calls >= 3; }));
    CHECK_EQ(calls, 3);
    net->with([](fake::FakeNetwork& n) {
        CHECK_EQ(n.written.size(), 1u);
        CHECK(n.written.size() == 1 && n.written[0] == "stop\n");
        return 0;
    });

    // no handle: the hook is never asked
    mgr.disconnect();
    calls = 0;
    CHECK(!mgr.writeAll("stop\n", 100ms, abort, [&calls]() { ++calls; return true; }));
    CHECK_EQ(calls, 0);
}

int main() {
    test_connect_first_attempt();
    test_retry_keeps_single_handle();
    test_budget_exhausted();
    test_abort_stops_connect();
    test_null_factory_rejected();
    test_write_all();
    test_write_all_waits_for_hook();

    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
