#pragma once
/**
 * ConnectionManager.hpp
 *
 * 소켓 핸들의 생명주기를 소유.
 *
 * 책임:
 *  - connect(budget): 핸들이 이미 있으면 즉시 성공. 없으면 budget 안에서
 *    "새 핸들 생성 -> connect(ioTimeout)" 를 반복. 실패한 핸들은 즉시 disconnect/폐기
 *  - disconnect(): 현재 핸들을 닫고 버림 (idempotent)
 *  - current(): 현재 핸들(shared_ptr 복사). 송신 스레드가 사용
 *  - writeAll(data, budget): current() 로 얻은 핸들에 writable 일 때만 전송,
 *    실패 시 핸들을 다시 얻어 budget 안에서 재시도. beforeWrite 가 주어지면
 *    핸들을 얻은 뒤 write 직전에 호출되고, false 를 반환하면 이번 라운드는 쉼
 *
 * 불변 조건:
 *  - 동시에 열린 핸들은 최대 1개. 교체 전에 이전 핸들을 먼저 닫는다
 *  - connect()/disconnect() 는 worker 스레드(또는 worker 종료 후 close())에서만 호출
 */

#include "ITcpClient.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace urdash::comm {

class ConnectionManager {
public:
    using ms = std::chrono::milliseconds;
    using ClientFactory = std::function<std::shared_ptr<ITcpClient>()>;

    ConnectionManager(std::string host,
                      std::uint16_t port,
                      ms ioTimeout,
                      ms retryInterval,
                      ClientFactory factory);
    ~ConnectionManager();

    // non-copyable
    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    // abort: checked between attempts so a stop request shortens the budget
    bool connect(ms budget, const std::atomic<bool>& abort);

    void disconnect();

    bool hasHandle() const;
    std::shared_ptr<ITcpClient> current() const;

    bool writeAll(const std::string& data, ms budget, const std::atomic<bool>& abort,
                  const std::function<bool()>& beforeWrite = nullptr) const;

    const std::string& host() const noexcept { return host_; }
    std::uint16_t port() const noexcept { return port_; }

private:
    std::string host_;
    std::uint16_t port_;
    ms ioTimeout_;
    ms retryInterval_;
    ClientFactory factory_;

    mutable std::mutex mtx_; // protects socket_
    std::shared_ptr<ITcpClient> socket_;
};

} // namespace urdash::comm
