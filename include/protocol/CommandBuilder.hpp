#pragma once
#include <string>

namespace urdash::protocol {

/**
 * DashboardCommand: one request line and the reply prefix the controller
 * answers with on success (empty -> any fresh reply is accepted).
 */
struct DashboardCommand {
    std::string line;
    std::string expected;
};

struct CommandBuilder {
    // Build "<cmd>[ <argument>]\n". Throws ProtocolException if argument holds a line break.
    static std::string makeCommand(const std::string& cmd, const std::string& argument = {});

    static DashboardCommand load(const std::string& program);
    static DashboardCommand play();
    static DashboardCommand stop();
    static DashboardCommand pause();
    static DashboardCommand shutdown();
    static DashboardCommand running();
    static DashboardCommand robotmode();
    static DashboardCommand getLoadedProgram();
    static DashboardCommand popup(const std::string& text);
    static DashboardCommand closePopup();
    static DashboardCommand addLog(const std::string& message);
    static DashboardCommand setUserRole(const std::string& role);
    static DashboardCommand isProgramSaved();
    static DashboardCommand programState();
    static DashboardCommand polyscopeVersion();
    static DashboardCommand powerOn();
    static DashboardCommand powerOff();
    static DashboardCommand brakeRelease();
    static DashboardCommand safetyMode();
    static DashboardCommand unlockProtectiveStop();
    static DashboardCommand closeSafetyPopup();
    static DashboardCommand loadInstallation(const std::string& file);

    // free text typed by an operator; no expected reply
    static DashboardCommand raw(const std::string& text);
};

} // namespace urdash::protocol
