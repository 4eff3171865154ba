#pragma once

/**
 * AsioTcpClient.hpp
 *
 * Boost.Asio 기반 ITcpClient 구현 (헤더)
 *
 * 설계 요약:
 *  - 핸들 하나가 io_context 하나와 소켓 하나를 소유
 *  - connect(): endpoint 마다 open -> TCP_NODELAY / SO_REUSEADDR -> async_connect, timeout 후 close
 *  - receive(): async_read_some 을 걸고 io_context 를 timeout 동안 실행 (worker 스레드)
 *  - write(): 호출 스레드는 io_context 에 post 만 하고 future 로 결과를 기다림.
 *             실제 async_wait(wait_write) + async_write 는 receive() 를 돌리는 worker 스레드에서 실행
 *  - disconnect(): shutdown/close 후 남은 handler 를 poll 로 완료시켜 대기 중인 writer 를 해제
 *
 * 주의:
 *  - receive()/connect()/disconnect() 는 한 스레드(worker)에서만 호출
 *  - write() 는 임의 스레드에서 호출 가능
 */

#include "ITcpClient.hpp"

#include <memory>
#include <string>

namespace urdash::comm {

class AsioTcpClient : public ITcpClient {
public:
    AsioTcpClient();
    ~AsioTcpClient() override;

    AsioTcpClient(const AsioTcpClient&) = delete;
    AsioTcpClient& operator=(const AsioTcpClient&) = delete;

    void connect(const std::string& host, std::uint16_t port, ms timeout) override;
    void disconnect() noexcept override;

    bool isConnected() const noexcept override;

    std::optional<std::string> receive(std::size_t maxBytes, ms timeout) override;

    bool write(const std::string& data, ms timeout) override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace urdash::comm
