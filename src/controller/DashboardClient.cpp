// src/controller/DashboardClient.cpp
#include "controller/DashboardClient.hpp"
#include "comm/AsioTcpClient.hpp"
#include "protocol/exceptions/ConnectionException.h"

#include "spdlog/spdlog.h"

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <utility>

namespace urdash::controller {

using urdash::protocol::ConnectionException;
using urdash::protocol::ReplySnapshot;

namespace {

urdash::config::DashboardConfig validated(urdash::config::DashboardConfig config) {
    config.validate();
    return config;
}

DashboardClient::ClientFactory orDefault(DashboardClient::ClientFactory factory) {
    if (factory) return factory;
    return []() { return std::make_shared<urdash::comm::AsioTcpClient>(); };
}

// commands are logged without their line terminator
std::string printable(const std::string& command) {
    return urdash::protocol::ReplyDecoder::stripTerminator(command);
}

} // namespace

DashboardClient::DashboardClient(urdash::config::DashboardConfig config, ClientFactory factory)
    : config_(validated(std::move(config))),
      connection_(config_.host, config_.port, config_.ioTimeout, config_.connectRetryInterval,
                  orDefault(std::move(factory))),
      gate_(),
      decoder_(config_.recvBufferSize * 4) {}

DashboardClient::~DashboardClient() {
    close();
}

void DashboardClient::start() {
    std::lock_guard<std::mutex> lk(lifecycleMtx_);
    if (stopRequested_.load()) {
        throw std::logic_error("DashboardClient: start() after close(), create a new instance");
    }
    if (worker_.joinable()) return;
    worker_ = std::thread(&DashboardClient::workerLoop, this);
}

void DashboardClient::close() {
    std::lock_guard<std::mutex> lk(lifecycleMtx_);
    const bool first = !stopRequested_.exchange(true);

    if (worker_.joinable()) {
        worker_.join();
    }
    // the worker is gone: nothing else touches the socket or the state any more
    connection_.disconnect();
    gate_.close();
    state_.store(State::DISCONNECTED);

    if (first) {
        spdlog::info("Dashboard client for {}:{} closed.", config_.host, config_.port);
    }
}

bool DashboardClient::isRunning() const noexcept {
    return state_.load() == State::STARTED;
}

bool DashboardClient::isConnected() const noexcept {
    return state_.load() != State::DISCONNECTED;
}

bool DashboardClient::workerExited() const noexcept {
    return workerExited_.load();
}

DashboardClient::State DashboardClient::state() const noexcept {
    return state_.load();
}

bool DashboardClient::send(const std::string& command) {
    std::lock_guard<std::mutex> lk(sendMtx_);
    if (stopRequested_.load()) {
        spdlog::warn("Command '{}' not sent: client is closed.", printable(command));
        return false;
    }
    if (workerExited_.load()) {
        spdlog::warn("Command '{}' not sent: dashboard worker has exited.", printable(command));
        return false;
    }

    // marker is taken right before the write that goes out, after the greeting of
    // that socket was consumed; nothing published earlier counts as the answer
    std::uint64_t marker = 0;
    auto arm = [this, &marker]() {
        if (!linkReady_.load()) return false;
        marker = gate_.sequence();
        return true;
    };
    if (!connection_.writeAll(command, config_.reconnectTimeout, stopRequested_, arm)) {
        spdlog::error("Command '{}' could not be sent within {} ms.", printable(command),
                      config_.reconnectTimeout.count());
        return false;
    }
    sentSequence_.store(marker);
    spdlog::debug("Sent command: {}", printable(command));
    return true;
}

ReplySnapshot DashboardClient::waitForReply() {
    return waitForReply(config_.replyTimeout);
}

ReplySnapshot DashboardClient::waitForReply(ms timeout) {
    const std::uint64_t marker = sentSequence_.load();
    ReplySnapshot snap = gate_.waitNewerThan(marker, timeout);
    if (snap.fresh) {
        // a second wait without a new send blocks for the reply after this one
        sentSequence_.store(snap.sequence);
    } else {
        spdlog::debug("No new reply within {} ms, returning last reply #{}.", timeout.count(), snap.sequence);
    }
    return snap;
}

ReplySnapshot DashboardClient::lastReply() const {
    return gate_.last();
}

void DashboardClient::setState(State next) {
    State prev = state_.exchange(next);
    if (prev != next) {
        spdlog::debug("Dashboard state {} -> {}", urdash::protocol::toString(prev), urdash::protocol::toString(next));
    }
}

bool DashboardClient::connectAndSettle() {
    using Clock = std::chrono::steady_clock;
    const auto deadline = Clock::now() + config_.reconnectTimeout;

    while (!stopRequested_.load()) {
        auto remaining = std::chrono::duration_cast<ms>(deadline - Clock::now());
        if (remaining <= ms::zero()) break;
        if (!connection_.connect(remaining, stopRequested_)) {
            return false;
        }
        setState(State::CONNECTED);
        // give the controller time to accept input
        std::this_thread::sleep_for(config_.settleTime);

        if (consumeGreeting()) {
            linkReady_.store(true);
            return true;
        }
        // lost before the greeting: start over with a new socket
        setState(State::ERROR);
        connection_.disconnect();
        decoder_.reset();
    }
    return false;
}

bool DashboardClient::consumeGreeting() {
    if (config_.greetingTimeout <= ms::zero()) return true;

    auto handle = connection_.current();
    if (!handle) return false;

    using Clock = std::chrono::steady_clock;
    const auto deadline = Clock::now() + config_.greetingTimeout;
    try {
        while (!stopRequested_.load()) {
            auto remaining = std::chrono::duration_cast<ms>(deadline - Clock::now());
            if (remaining <= ms::zero()) {
                spdlog::warn("No greeting from {}:{} within {} ms, continuing without it.",
                             config_.host, config_.port, config_.greetingTimeout.count());
                return true;
            }
            auto chunk = handle->receive(config_.recvBufferSize, std::min(config_.ioTimeout, remaining));
            if (!chunk) continue;

            auto lines = decoder_.feed(*chunk);
            if (lines.empty()) continue;

            spdlog::info("Dashboard greeting: {}", lines.front());
            setState(State::STARTED);
            // nothing was sent yet, so anything after the greeting is unsolicited
            for (std::size_t i = 1; i < lines.size(); ++i) {
                auto seq = gate_.publish(lines[i]);
                spdlog::debug("Reply #{} from robot: {}", seq, lines[i]);
            }
            return true;
        }
    } catch (const ConnectionException& e) {
        spdlog::warn("Connection lost while waiting for the greeting: {}", e.what());
        return false;
    }
    return true; // stop requested
}

void DashboardClient::publishReplies(const std::string& chunk) {
    for (const auto& reply : decoder_.feed(chunk)) {
        // publish first: isRunning() implies the reply is visible
        auto seq = gate_.publish(reply);
        setState(State::STARTED);
        spdlog::debug("Reply #{} from robot: {}", seq, reply);
    }
}

void DashboardClient::workerLoop() {
    try {
        runLoop();
    } catch (const std::exception& e) {
        spdlog::error("Dashboard worker failed: {}", e.what());
        linkReady_.store(false);
        setState(State::ERROR);
        connection_.disconnect();
        gate_.close();
    }
    workerExited_.store(true);
}

void DashboardClient::runLoop() {
    spdlog::info("Dashboard worker started for {}:{}", config_.host, config_.port);

    bool fatal = false;
    if (!connectAndSettle()) {
        if (!stopRequested_.load()) {
            spdlog::error("Dashboard interface not able to connect to {}:{} and timed out!",
                          config_.host, config_.port);
            fatal = true;
        }
    }

    while (!fatal && !stopRequested_.load()) {
        try {
            auto handle = connection_.current();
            if (!handle) {
                throw ConnectionException("no socket handle");
            }
            auto chunk = handle->receive(config_.recvBufferSize, config_.ioTimeout);
            if (!chunk) continue; // idle tick

            publishReplies(*chunk);
        } catch (const ConnectionException& e) {
            if (stopRequested_.load()) break;

            linkReady_.store(false);
            setState(State::ERROR);
            spdlog::warn("Dashboard server interface stopped running: {}", e.what());
            connection_.disconnect();
            decoder_.reset();

            if (connectAndSettle()) {
                spdlog::info("Dashboard server interface restarted running");
            } else if (!stopRequested_.load()) {
                spdlog::error("Dashboard server reconnection failed, worker exits.");
                fatal = true;
            }
        }
    }

    linkReady_.store(false);
    if (fatal) {
        // terminal: state stays DISCONNECTED or ERROR until close()
        connection_.disconnect();
        gate_.close();
        return;
    }

    setState(State::PAUSED);
    connection_.disconnect();
    gate_.close();
    setState(State::DISCONNECTED);
    spdlog::info("Dashboard server interface is stopped");
}

} // namespace urdash::controller
