#pragma once
/**
 * ConnectionState.hpp
 *
 * Dashboard 링크 상태. 값의 순서가 의미를 가짐:
 *  - DISCONNECTED < CONNECTED < STARTED
 *  - STARTED 만 "running" 으로 간주 (health check)
 *  - PAUSED 는 stop 요청을 관찰한 worker 가 소켓을 정리하는 동안의 상태
 *  - ERROR 는 연결 손실 후 재연결 시도 중(또는 재연결 실패로 종료된) 상태
 */

#include <cstdint>
#include <ostream>

namespace urdash::protocol {

enum class ConnectionState : std::uint8_t {
    DISCONNECTED = 0,
    CONNECTED = 1,
    STARTED = 2,
    PAUSED = 3,
    ERROR = 4,
};

inline const char* toString(ConnectionState state) noexcept {
    switch (state) {
        case ConnectionState::DISCONNECTED: return "DISCONNECTED";
        case ConnectionState::CONNECTED:    return "CONNECTED";
        case ConnectionState::STARTED:      return "STARTED";
        case ConnectionState::PAUSED:       return "PAUSED";
        case ConnectionState::ERROR:        return "ERROR";
    }
    return "UNKNOWN";
}

inline std::ostream& operator<<(std::ostream& os, ConnectionState state) {
    return os << toString(state);
}

} // namespace urdash::protocol
