#include "test_util.hpp"

#include "config/Config.hpp"
#include "protocol/ConnectionState.hpp"

#include <sstream>
#include <stdexcept>
#include <string>

using namespace urdash::config;
using urdash::protocol::ConnectionState;

static bool rejects(const DashboardConfig& cfg) {
    try {
        cfg.validate();
    } catch (const std::invalid_argument&) {
        return true;
    }
    return false;
}

static void test_defaults() {
    std::fprintf(stderr, "-- test_defaults\n");
    DashboardConfig cfg;
    CHECK_EQ(cfg.port, 29999u);
    CHECK_EQ(cfg.reconnectTimeout.count(), 10000);
    CHECK_EQ(cfg.recvBufferSize, 1024u);
    CHECK_EQ(cfg.greetingTimeout.count(), 2000);
    CHECK(!rejects(cfg));
}

static void test_invalid_values() {
    std::fprintf(stderr, "-- test_invalid_values\n");
    DashboardConfig cfg;
    cfg.host.clear();
    CHECK(rejects(cfg));

    cfg = DashboardConfig{};
    cfg.port = 0;
    CHECK(rejects(cfg));

    cfg = DashboardConfig{};
    cfg.reconnectTimeout = ms(0);
    CHECK(rejects(cfg));

    cfg = DashboardConfig{};
    cfg.ioTimeout = ms(-1);
    CHECK(rejects(cfg));

    cfg = DashboardConfig{};
    cfg.replyTimeout = ms(0);
    CHECK(rejects(cfg));

    cfg = DashboardConfig{};
    cfg.settleTime = ms(-5);
    CHECK(rejects(cfg));

    cfg = DashboardConfig{};
    cfg.settleTime = ms(0);
    CHECK(!rejects(cfg));

    cfg = DashboardConfig{};
    cfg.connectRetryInterval = ms(0);
    CHECK(rejects(cfg));

    cfg = DashboardConfig{};
    cfg.greetingTimeout = ms(-1);
    CHECK(rejects(cfg));

    // zero skips the greeting wait
    cfg = DashboardConfig{};
    cfg.greetingTimeout = ms(0);
    CHECK(!rejects(cfg));

    cfg = DashboardConfig{};
    cfg.recvBufferSize = 0;
    CHECK(rejects(cfg));
}

static void test_state_names() {
    std::fprintf(stderr, "-- test_state_names\n");
    CHECK(std::string(toString(ConnectionState::DISCONNECTED)) == "DISCONNECTED");
    CHECK(std::string(toString(ConnectionState::STARTED)) == "STARTED");
    CHECK(std::string(toString(ConnectionState::ERROR)) == "ERROR");
    std::ostringstream os;
    os << ConnectionState::PAUSED;
    CHECK(os.str() == "PAUSED");
}

int main() {
    test_defaults();
    test_invalid_values();
    test_state_names();

    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
