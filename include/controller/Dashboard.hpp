#pragma once
/**
 * Dashboard.hpp
 *
 * Command catalog facade over DashboardClient.
 *
 * Responsibilities:
 *  - lifecycle passthrough (start/close/isRunning/isConnected)
 *  - one method per dashboard command; each sends the command line and waits for
 *    the next reply, then checks it against the documented success prefix
 *  - failures are returned, never thrown: a command that could not be built or
 *    sent comes back with sent == false, a missing reply with fresh == false
 *
 * Threading:
 *  - a Dashboard may be shared between threads only if the caller serializes the
 *    command calls; correlation of command and reply is purely temporal
 */

#include "DashboardClient.hpp"
#include "../protocol/CommandBuilder.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace urdash::controller {

class Dashboard {
public:
    struct Result {
        bool sent{false};      // command bytes delivered
        bool fresh{false};     // reply published after the send
        bool accepted{false};  // fresh and starts with the expected text
        std::string reply;
        std::uint64_t sequence{0};
    };

    explicit Dashboard(urdash::config::DashboardConfig config,
                       DashboardClient::ClientFactory factory = nullptr);
    explicit Dashboard(std::shared_ptr<DashboardClient> client);

    // non-copyable
    Dashboard(const Dashboard&) = delete;
    Dashboard& operator=(const Dashboard&) = delete;

    void start();
    void close();
    bool isRunning() const noexcept;
    bool isConnected() const noexcept;

    Result load(const std::string& program);
    Result play();
    Result stop();
    Result pause();
    Result shutdown();
    Result running();
    Result robotmode();
    Result getLoadedProgram();
    Result popup(const std::string& text);
    Result closePopup();
    Result addLog(const std::string& message);
    Result setUserRole(const std::string& role);
    Result isProgramSaved();
    Result programState();
    Result polyscopeVersion();
    Result powerOn();
    Result powerOff();
    Result brakeRelease();
    Result safetyMode();
    Result unlockProtectiveStop();
    Result closeSafetyPopup();
    Result loadInstallation(const std::string& file);

    Result raw(const std::string& text);

    // shell keys, all lowercase ("play", "programstate", "raw", ...)
    static const std::vector<std::string>& commandNames();
    // runs the command registered under name; nullopt if the name is unknown
    std::optional<Result> invoke(const std::string& name, const std::string& argument = "");

    // parsed answers of "running" and "isProgramSaved"; nullopt without a fresh reply
    std::optional<bool> programRunning();
    std::optional<bool> programSaved();

    DashboardClient& client() noexcept { return *client_; }

private:
    Result execute(const std::function<urdash::protocol::DashboardCommand()>& build);

    std::shared_ptr<DashboardClient> client_;
};

} // namespace urdash::controller
