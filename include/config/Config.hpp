#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace urdash::config {

using ms = std::chrono::milliseconds;

// 대시보드 서버 기본 포트
constexpr std::uint16_t DEFAULT_DASHBOARD_PORT = 29999;

// (재)연결 시도 전체 예산
constexpr ms DEFAULT_RECONNECT_TIMEOUT_MS = ms(10000);

// 소켓 connect/receive/write 1회 타임아웃
constexpr ms DEFAULT_IO_TIMEOUT_MS = ms(1000);

// 응답 대기타임
constexpr ms DEFAULT_REPLY_TIMEOUT_MS = ms(1000);

// 연결 직후 원격 서비스 안정화 대기
constexpr ms DEFAULT_SETTLE_TIME_MS = ms(500);

// connect 실패 후 재시도 간격
constexpr ms DEFAULT_CONNECT_RETRY_INTERVAL_MS = ms(100);

// 연결 직후 서버 인사말(배너) 한 줄을 기다리는 최대 시간 (0 이면 기다리지 않음)
constexpr ms DEFAULT_GREETING_TIMEOUT_MS = ms(2000);

// receive 1회 최대 바이트
constexpr std::size_t DEFAULT_RECV_BUFFER_SIZE = 1024;

/**
 * DashboardConfig
 *
 * Construction-time settings of a DashboardClient. All timeouts are explicit
 * so tests can shrink them; the defaults match a real controller.
 */
struct DashboardConfig {
    std::string host{"127.0.0.1"};
    std::uint16_t port{DEFAULT_DASHBOARD_PORT};
    ms reconnectTimeout{DEFAULT_RECONNECT_TIMEOUT_MS};
    ms ioTimeout{DEFAULT_IO_TIMEOUT_MS};
    ms replyTimeout{DEFAULT_REPLY_TIMEOUT_MS};
    ms settleTime{DEFAULT_SETTLE_TIME_MS};
    ms connectRetryInterval{DEFAULT_CONNECT_RETRY_INTERVAL_MS};
    ms greetingTimeout{DEFAULT_GREETING_TIMEOUT_MS};
    std::size_t recvBufferSize{DEFAULT_RECV_BUFFER_SIZE};

    // throws std::invalid_argument
    void validate() const {
        if (host.empty()) throw std::invalid_argument("DashboardConfig: host is empty");
        if (port == 0) throw std::invalid_argument("DashboardConfig: port is zero");
        if (reconnectTimeout <= ms::zero()) throw std::invalid_argument("DashboardConfig: reconnectTimeout must be positive");
        if (ioTimeout <= ms::zero()) throw std::invalid_argument("DashboardConfig: ioTimeout must be positive");
        if (replyTimeout <= ms::zero()) throw std::invalid_argument("DashboardConfig: replyTimeout must be positive");
        if (settleTime < ms::zero()) throw std::invalid_argument("DashboardConfig: settleTime is negative");
        if (connectRetryInterval <= ms::zero()) throw std::invalid_argument("DashboardConfig: connectRetryInterval must be positive");
        if (greetingTimeout < ms::zero()) throw std::invalid_argument("DashboardConfig: greetingTimeout is negative");
        if (recvBufferSize == 0) throw std::invalid_argument("DashboardConfig: recvBufferSize is zero");
    }
};

} // namespace urdash::config
