#pragma once
/**
 * DashboardClient.hpp
 *
 * Dashboard 연결 엔진: worker 스레드 + ConnectionManager + ReplyGate.
 *
 * Responsibilities:
 *  - start(): worker 스레드 생성 (idempotent, close() 이후에는 std::logic_error)
 *  - worker: 연결 -> 서버 인사말(배너) 한 줄 소비 -> receive/publish 반복,
 *    연결 손실 시 ERROR -> 재연결, 재연결 실패 시 종료
 *  - 배너는 응답으로 publish 되지 않는다. 매 (재)연결마다 배너를 소비하기 전까지 send 는 대기
 *  - send(command): 현재 소켓에 command 를 그대로 전송 (종료자는 호출자가 붙임).
 *    staleness marker 는 실제로 나가는 write 직전에 잡는다
 *  - waitForReply(): send 이후 publish 된 새 응답을 기다림 (timeout 시 stale 값, fresh=false)
 *  - close(): stop flag -> worker join -> 소켓 정리 -> DISCONNECTED (idempotent)
 *
 * Threading:
 *  - ConnectionState 는 worker 만 변경한다 (close() 는 join 이후에만 기록)
 *  - send/waitForReply 는 임의 스레드에서 호출 가능하지만 한 번에 하나의 send/wait 쌍만
 *    진행되어야 한다. 여러 스레드가 사용할 때의 직렬화는 호출자 책임
 */

#include "../comm/ConnectionManager.hpp"
#include "../config/Config.hpp"
#include "../protocol/ConnectionState.hpp"
#include "../protocol/ReplyDecoder.hpp"
#include "../protocol/ReplyGate.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>

namespace urdash::controller {

class DashboardClient {
public:
    using ms = std::chrono::milliseconds;
    using State = urdash::protocol::ConnectionState;
    using ClientFactory = urdash::comm::ConnectionManager::ClientFactory;

    // factory == nullptr -> AsioTcpClient
    explicit DashboardClient(urdash::config::DashboardConfig config, ClientFactory factory = nullptr);
    ~DashboardClient();

    // non-copyable
    DashboardClient(const DashboardClient&) = delete;
    DashboardClient& operator=(const DashboardClient&) = delete;

    void start();
    void close();

    bool isRunning() const noexcept;     // state == STARTED
    bool isConnected() const noexcept;   // state != DISCONNECTED
    bool workerExited() const noexcept;  // worker thread left its loop
    State state() const noexcept;

    bool send(const std::string& command);

    urdash::protocol::ReplySnapshot waitForReply();
    urdash::protocol::ReplySnapshot waitForReply(ms timeout);

    urdash::protocol::ReplySnapshot lastReply() const;

    const urdash::config::DashboardConfig& config() const noexcept { return config_; }

private:
    void workerLoop();
    void runLoop();
    bool connectAndSettle();
    bool consumeGreeting();
    void publishReplies(const std::string& chunk);
    void setState(State next);

    urdash::config::DashboardConfig config_;
    urdash::comm::ConnectionManager connection_;
    urdash::protocol::ReplyGate gate_;
    urdash::protocol::ReplyDecoder decoder_; // worker only

    std::atomic<State> state_{State::DISCONNECTED};
    std::atomic<bool> stopRequested_{false};
    std::atomic<bool> workerExited_{false};
    std::atomic<bool> linkReady_{false}; // greeting of the current socket consumed
    std::atomic<std::uint64_t> sentSequence_{0};

    std::mutex sendMtx_;
    std::mutex lifecycleMtx_;
    std::thread worker_;
};

} // namespace urdash::controller
