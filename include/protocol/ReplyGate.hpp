#pragma once
/**
 * ReplyGate.hpp
 *
 * 요청/응답 게이트: worker 스레드가 publish 한 마지막 응답을 호출 스레드가 기다린다.
 *
 * 동작:
 *  - publish(text): 응답 저장 + sequence 증가 + notify_all (worker 전용)
 *  - sequence(): 현재 sequence (send 직전에 스냅샷 -> staleness marker)
 *  - waitNewerThan(seq, timeout): sequence 가 seq 보다 커질 때까지 대기.
 *    타임아웃 또는 close() 시 현재 값을 fresh=false 로 반환
 *  - close(): 대기자 전부 깨움. 이후 wait 는 즉시 반환
 *
 * 명령과 응답의 대응은 시간 순서뿐이다. 여러 호출자가 동시에 send/wait 쌍을
 * 사용하면 응답이 섞일 수 있으므로 호출자가 직렬화해야 한다.
 */

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>

namespace urdash::protocol {

struct ReplySnapshot {
    std::string text;
    std::uint64_t sequence{0};
    bool fresh{false};
};

class ReplyGate {
public:
    ReplyGate() = default;

    ReplyGate(const ReplyGate&) = delete;
    ReplyGate& operator=(const ReplyGate&) = delete;

    // returns the sequence number assigned to this reply
    std::uint64_t publish(const std::string& text);

    std::uint64_t sequence() const;
    ReplySnapshot last() const;

    ReplySnapshot waitNewerThan(std::uint64_t sequence, std::chrono::milliseconds timeout) const;

    // wake every waiter without publishing (shutdown)
    void close();
    bool isClosed() const;

private:
    mutable std::mutex mtx_;
    mutable std::condition_variable cv_;
    std::string lastReply_;
    std::uint64_t sequence_{0};
    bool closed_{false};
};

} // namespace urdash::protocol
