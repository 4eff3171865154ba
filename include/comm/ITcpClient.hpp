#pragma once

/**
 * ITcpClient.hpp
 *
 * Dashboard 소켓 핸들 추상 인터페이스
 *
 * 핵심 포인트:
 *  - 모든 동작은 타임아웃으로 제한된 동기 호출
 *  - connect()/disconnect() : 연결 수립/종료 (disconnect 는 idempotent)
 *  - receive(...) : worker 스레드 전용. 최대 maxBytes 를 timeout 안에 읽음
 *  - write(...) : 임의 스레드. 소켓이 writable 일 때만 전송 (readiness wait)
 *
 * 설계 의도:
 *  - 핸들 하나 = TCP 연결 하나. 재연결은 새 핸들을 만드는 것으로 처리 (ConnectionManager)
 *  - 테스트에서는 in-memory fake 로 대체하여 생성/종료 횟수를 계측
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace urdash::comm {

class ITcpClient {
public:
    using ms = std::chrono::milliseconds;

    virtual ~ITcpClient() = default;

    /// 연결 시도. 실패 시 ConnectionException, 타임아웃 시 TimeoutException.
    virtual void connect(const std::string& host, std::uint16_t port, ms timeout) = 0;

    /// 연결을 끊고 내부 리소스를 정리한다. 여러 번 호출해도 안전.
    virtual void disconnect() noexcept = 0;

    /// 현재 연결 상태를 스레드-안전하게 반환
    virtual bool isConnected() const noexcept = 0;

    /**
     * receive
     * - timeout 안에 데이터가 없으면 std::nullopt (idle)
     * - 원격 종료(0 byte read), reset 등은 ConnectionException
     * - 반환 문자열은 비어있지 않음
     */
    virtual std::optional<std::string> receive(std::size_t maxBytes, ms timeout) = 0;

    /**
     * write
     * - data 전체를 timeout 안에 전송하면 true
     * - 연결이 끊어졌거나 시간 내 writable 상태가 되지 않으면 false
     */
    virtual bool write(const std::string& data, ms timeout) = 0;
};

} // namespace urdash::comm
