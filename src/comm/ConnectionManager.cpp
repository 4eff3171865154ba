// src/comm/ConnectionManager.cpp
#include "comm/ConnectionManager.hpp"
#include "protocol/exceptions/ConnectionException.h"
#include "protocol/exceptions/TimeoutException.h"

#include "spdlog/spdlog.h"

#include <algorithm>
#include <stdexcept>
#include <thread>
#include <utility>

namespace urdash::comm {

namespace {

using Clock = std::chrono::steady_clock;

ConnectionManager::ms remainingUntil(Clock::time_point deadline) {
    return std::chrono::duration_cast<ConnectionManager::ms>(deadline - Clock::now());
}

} // namespace

ConnectionManager::ConnectionManager(std::string host,
                                     std::uint16_t port,
                                     ms ioTimeout,
                                     ms retryInterval,
                                     ClientFactory factory)
    : host_(std::move(host)),
      port_(port),
      ioTimeout_(ioTimeout),
      retryInterval_(retryInterval),
      factory_(std::move(factory)),
      socket_(nullptr) {
    if (!factory_) {
        throw std::invalid_argument("ConnectionManager: client factory is not valid.");
    }
}

ConnectionManager::~ConnectionManager() {
    disconnect();
}

bool ConnectionManager::connect(ms budget, const std::atomic<bool>& abort) {
    if (hasHandle()) return true;

    const auto deadline = Clock::now() + budget;
    int attempts = 0;
    while (!abort.load()) {
        auto remaining = remainingUntil(deadline);
        if (remaining <= ms::zero()) break;

        auto handle = factory_();
        if (!handle) {
            throw std::logic_error("ConnectionManager: client factory returned null");
        }
        ++attempts;
        try {
            handle->connect(host_, port_, std::min(ioTimeout_, remaining));
            {
                std::lock_guard<std::mutex> lk(mtx_);
                socket_ = std::move(handle);
            }
            spdlog::info("Dashboard connection to {}:{} established (attempt {}).", host_, port_, attempts);
            return true;
        } catch (const urdash::protocol::TimeoutException& e) {
            spdlog::debug("Connect attempt {} timed out: {}", attempts, e.what());
        } catch (const urdash::protocol::ConnectionException& e) {
            spdlog::debug("Connect attempt {} failed: {}", attempts, e.what());
        }

        // discard the failed handle before creating the next one
        handle->disconnect();
        handle.reset();

        auto pause = std::min(retryInterval_, remainingUntil(deadline));
        if (pause > ms::zero()) std::this_thread::sleep_for(pause);
    }

    if (abort.load()) {
        spdlog::info("Connect to {}:{} aborted by stop request.", host_, port_);
    } else {
        spdlog::warn("Dashboard connection to {}:{} failed after {} attempts within {} ms.",
                     host_, port_, attempts, budget.count());
    }
    return false;
}

void ConnectionManager::disconnect() {
    std::shared_ptr<ITcpClient> old;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        old = std::move(socket_);
        socket_.reset();
    }
    if (old) {
        old->disconnect();
        spdlog::debug("Dashboard socket to {}:{} closed.", host_, port_);
    }
}

bool ConnectionManager::hasHandle() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return socket_ != nullptr;
}

std::shared_ptr<ITcpClient> ConnectionManager::current() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return socket_;
}

bool ConnectionManager::writeAll(const std::string& data, ms budget, const std::atomic<bool>& abort,
                                 const std::function<bool()>& beforeWrite) const {
    const auto deadline = Clock::now() + budget;
    while (!abort.load()) {
        auto remaining = remainingUntil(deadline);
        if (remaining <= ms::zero()) break;

        // re-fetch every round: the worker may have replaced the handle
        auto handle = current();
        if (handle && handle->isConnected() && (!beforeWrite || beforeWrite())) {
            if (handle->write(data, std::min(ioTimeout_, remaining))) {
                return true;
            }
            spdlog::debug("Write to {}:{} failed, retrying.", host_, port_);
        }

        auto pause = std::min(retryInterval_, remainingUntil(deadline));
        if (pause > ms::zero()) std::this_thread::sleep_for(pause);
    }
    return false;
}

} // namespace urdash::comm
