#include "comm/AsioTcpClient.hpp"
#include "protocol/exceptions/ConnectionException.h"
#include "protocol/exceptions/TimeoutException.h"

#include "spdlog/spdlog.h"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/write.hpp>

#include <atomic>
#include <future>
#include <memory>
#include <thread>
#include <vector>

namespace urdash::comm {

using boost::asio::ip::tcp;
using urdash::protocol::ConnectionException;
using urdash::protocol::TimeoutException;

struct AsioTcpClient::Impl {
    // one posted write; phase decides whether the io thread or the caller owns it
    struct WriteOp {
        enum Phase : int { Pending = 0, Running = 1, Abandoned = 2 };

        std::string data;
        ITcpClient::ms timeout{0};
        std::promise<bool> done;
        std::atomic<int> phase{Pending};
    };

    Impl()
        : ioContext_(),
          socket_(ioContext_),
          connected_{false} {}

    boost::asio::io_context ioContext_;
    tcp::socket socket_;
    std::vector<char> readBuffer_;
    std::atomic<bool> connected_;

    // Run the io_context until its work is done or timeout expires. On expiry the
    // outstanding socket operations are aborted and drained so their handlers run.
    void runFor(ITcpClient::ms timeout, bool closeOnTimeout) {
        ioContext_.restart();
        ioContext_.run_for(timeout);
        if (ioContext_.stopped()) return;

        boost::system::error_code ec;
        if (closeOnTimeout) {
            socket_.close(ec);
        } else {
            socket_.cancel(ec);
        }
        ioContext_.run();
    }

    void startWrite(const std::shared_ptr<WriteOp>& op) {
        int expected = WriteOp::Pending;
        if (!op->phase.compare_exchange_strong(expected, WriteOp::Running)) {
            return; // caller already gave up
        }

        auto timer = std::make_shared<boost::asio::steady_timer>(ioContext_, op->timeout);
        timer->async_wait([this](const boost::system::error_code& ec) {
            if (ec) return; // cancelled by finishWrite
            spdlog::warn("Socket did not become writable in time, aborting write.");
            boost::system::error_code ignored;
            socket_.cancel(ignored);
        });

        socket_.async_wait(tcp::socket::wait_write,
            [this, op, timer](const boost::system::error_code& ec) {
                if (ec) {
                    finishWrite(op, *timer, ec);
                    return;
                }
                boost::asio::async_write(socket_, boost::asio::buffer(op->data),
                    [this, op, timer](const boost::system::error_code& wec, std::size_t bytesTransferred) {
                        if (!wec) {
                            spdlog::debug("Successfully transmitted {} bytes of data.", bytesTransferred);
                        }
                        finishWrite(op, *timer, wec);
                    });
            });
    }

    void finishWrite(const std::shared_ptr<WriteOp>& op, boost::asio::steady_timer& timer,
                     const boost::system::error_code& ec) {
        timer.cancel();
        if (ec && ec != boost::asio::error::operation_aborted) {
            spdlog::warn("Write error: {}", ec.message());
            connected_.store(false);
        }
        op->done.set_value(!ec);
    }
};

namespace {

// getaddrinfo cannot be cancelled: a name lookup runs on its own thread and is
// abandoned (not joined) when the timeout expires. Numeric addresses skip it.
std::vector<tcp::endpoint> resolveWithin(const std::string& host, std::uint16_t port, ITcpClient::ms timeout) {
    boost::system::error_code ec;
    auto address = boost::asio::ip::make_address(host, ec);
    if (!ec) {
        return {tcp::endpoint(address, port)};
    }

    auto result = std::make_shared<std::promise<std::vector<tcp::endpoint>>>();
    auto fut = result->get_future();
    std::thread([result, host, port]() {
        boost::asio::io_context io;
        tcp::resolver resolver(io);
        boost::system::error_code rec;
        auto found = resolver.resolve(host, std::to_string(port), rec);
        if (rec) {
            result->set_exception(std::make_exception_ptr(
                ConnectionException("cannot resolve " + host + ": " + rec.message())));
            return;
        }
        std::vector<tcp::endpoint> endpoints;
        for (const auto& entry : found) endpoints.push_back(entry.endpoint());
        result->set_value(std::move(endpoints));
    }).detach();

    if (fut.wait_for(timeout) != std::future_status::ready) {
        throw TimeoutException("resolving " + host + " took longer than " + std::to_string(timeout.count()) + " ms");
    }
    return fut.get();
}

} // namespace

AsioTcpClient::AsioTcpClient()
    : impl_(std::make_unique<Impl>()) {}

AsioTcpClient::~AsioTcpClient() {
    disconnect();
}

void AsioTcpClient::connect(const std::string& host, std::uint16_t port, ms timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    boost::system::error_code ec;
    auto endpoints = resolveWithin(host, port, timeout);

    boost::system::error_code lastError = boost::asio::error::host_not_found;
    for (const auto& entry : endpoints) {
        auto remaining = std::chrono::duration_cast<ms>(deadline - std::chrono::steady_clock::now());
        if (remaining <= ms::zero()) {
            lastError = boost::asio::error::timed_out;
            break;
        }

        boost::system::error_code ignored;
        impl_->socket_.close(ignored);
        impl_->socket_.open(entry.protocol(), ec);
        if (ec) {
            lastError = ec;
            continue;
        }
        impl_->socket_.set_option(tcp::no_delay(true), ec);
        if (!ec) impl_->socket_.set_option(boost::asio::socket_base::reuse_address(true), ec);
        if (ec) {
            lastError = ec;
            continue;
        }

        boost::system::error_code result = boost::asio::error::would_block;
        impl_->socket_.async_connect(entry,
            [&result](const boost::system::error_code& connectEc) { result = connectEc; });
        impl_->runFor(remaining, true);

        if (!result) {
            impl_->connected_.store(true);
            spdlog::info("Successfully connected to the server: {}:{}", host, port);
            return;
        }
        // close() on expiry completes the pending connect with operation_aborted
        lastError = (result == boost::asio::error::operation_aborted) ? boost::asio::error::timed_out : result;
    }

    boost::system::error_code ignored;
    impl_->socket_.close(ignored);
    if (lastError == boost::asio::error::timed_out) {
        throw TimeoutException("connect to " + host + ":" + std::to_string(port) + " timed out");
    }
    throw ConnectionException("connect to " + host + ":" + std::to_string(port) + " failed: " + lastError.message());
}

void AsioTcpClient::disconnect() noexcept {
    boost::system::error_code ec;
    if (impl_->socket_.is_open()) {
        impl_->socket_.shutdown(tcp::socket::shutdown_both, ec);
        impl_->socket_.close(ec);
    }
    impl_->connected_.store(false);

    // let aborted reads/writes complete so blocked writers see their result
    try {
        impl_->ioContext_.restart();
        impl_->ioContext_.poll();
    } catch (const std::exception& ex) {
        spdlog::error("Draining socket handlers failed: {}", ex.what());
    }
}

bool AsioTcpClient::isConnected() const noexcept {
    return impl_->connected_.load();
}

std::optional<std::string> AsioTcpClient::receive(std::size_t maxBytes, ms timeout) {
    if (!impl_->socket_.is_open()) {
        throw ConnectionException("receive on a closed socket");
    }

    impl_->readBuffer_.resize(maxBytes);
    boost::system::error_code result = boost::asio::error::would_block;
    std::size_t received = 0;
    impl_->socket_.async_read_some(boost::asio::buffer(impl_->readBuffer_),
        [&result, &received](const boost::system::error_code& ec, std::size_t bytesTransferred) {
            result = ec;
            received = bytesTransferred;
        });
    impl_->runFor(timeout, false);

    if (result == boost::asio::error::operation_aborted) {
        return std::nullopt; // idle
    }
    if (result == boost::asio::error::eof) {
        impl_->connected_.store(false);
        throw ConnectionException("server closed the connection");
    }
    if (result) {
        impl_->connected_.store(false);
        throw ConnectionException("receive failed: " + result.message());
    }
    if (received == 0) {
        impl_->connected_.store(false);
        throw ConnectionException("zero-byte read");
    }
    return std::string(impl_->readBuffer_.data(), received);
}

bool AsioTcpClient::write(const std::string& data, ms timeout) {
    if (!impl_->connected_.load()) return false;

    auto op = std::make_shared<Impl::WriteOp>();
    op->data = data;
    op->timeout = timeout;
    auto fut = op->done.get_future();

    Impl* impl = impl_.get();
    boost::asio::post(impl_->ioContext_, [impl, op]() { impl->startWrite(op); });

    try {
        if (fut.wait_for(timeout) == std::future_status::ready) {
            return fut.get();
        }
        int expected = Impl::WriteOp::Pending;
        if (op->phase.compare_exchange_strong(expected, Impl::WriteOp::Abandoned)) {
            spdlog::debug("Write was not picked up within {} ms.", timeout.count());
            return false;
        }
        // already on the io thread; its own timer bounds it
        if (fut.wait_for(timeout) == std::future_status::ready) {
            return fut.get();
        }
    } catch (const std::future_error& fe) {
        spdlog::warn("Write abandoned by a closed socket: {}", fe.what());
    }
    return false;
}

} // namespace urdash::comm
