// src/protocol/CommandBuilder.cpp
#include "protocol/CommandBuilder.hpp"
#include "protocol/exceptions/ProtocolException.h"

namespace urdash::protocol {

std::string CommandBuilder::makeCommand(const std::string& cmd, const std::string& argument) {
    if (cmd.empty()) {
        throw ProtocolException("empty command");
    }
    if (cmd.find_first_of("\r\n") != std::string::npos ||
        argument.find_first_of("\r\n") != std::string::npos) {
        throw ProtocolException("line break inside command '" + cmd + "'");
    }
    std::string out = cmd;
    if (!argument.empty()) {
        out.push_back(' ');
        out += argument;
    }
    out.push_back('\n');
    return out;
}

DashboardCommand CommandBuilder::load(const std::string& program) {
    if (program.empty()) throw ProtocolException("load: program name is empty");
    return {makeCommand("load", program), "Loading program:"};
}

DashboardCommand CommandBuilder::play() {
    return {makeCommand("play"), "Starting program"};
}

DashboardCommand CommandBuilder::stop() {
    return {makeCommand("stop"), "Stopped"};
}

DashboardCommand CommandBuilder::pause() {
    return {makeCommand("pause"), "Pausing program"};
}

DashboardCommand CommandBuilder::shutdown() {
    return {makeCommand("shutdown"), "Shutting down"};
}

DashboardCommand CommandBuilder::running() {
    return {makeCommand("running"), "Program running:"};
}

DashboardCommand CommandBuilder::robotmode() {
    return {makeCommand("robotmode"), "Robotmode:"};
}

DashboardCommand CommandBuilder::getLoadedProgram() {
    return {makeCommand("get loaded program"), "Loaded program:"};
}

DashboardCommand CommandBuilder::popup(const std::string& text) {
    return {makeCommand("popup", text), "showing popup"};
}

DashboardCommand CommandBuilder::closePopup() {
    return {makeCommand("close popup"), "closing popup"};
}

DashboardCommand CommandBuilder::addLog(const std::string& message) {
    return {makeCommand("addToLog", message), "Added log message"};
}

DashboardCommand CommandBuilder::setUserRole(const std::string& role) {
    if (role.empty()) throw ProtocolException("setUserRole: role is empty");
    return {makeCommand("setUserRole", role), "Setting user role:"};
}

DashboardCommand CommandBuilder::isProgramSaved() {
    return {makeCommand("isProgramSaved"), "true"};
}

DashboardCommand CommandBuilder::programState() {
    return {makeCommand("programState"), ""};
}

DashboardCommand CommandBuilder::polyscopeVersion() {
    return {makeCommand("PolyscopeVersion"), ""};
}

DashboardCommand CommandBuilder::powerOn() {
    return {makeCommand("power on"), "Powering on"};
}

DashboardCommand CommandBuilder::powerOff() {
    return {makeCommand("power off"), "Powering off"};
}

DashboardCommand CommandBuilder::brakeRelease() {
    return {makeCommand("brake release"), "Brake releasing"};
}

DashboardCommand CommandBuilder::safetyMode() {
    return {makeCommand("safetymode"), "Safetymode:"};
}

DashboardCommand CommandBuilder::unlockProtectiveStop() {
    return {makeCommand("unlock protective stop"), "Protective stop releasing"};
}

DashboardCommand CommandBuilder::closeSafetyPopup() {
    return {makeCommand("close safety popup"), "closing safety popup"};
}

DashboardCommand CommandBuilder::loadInstallation(const std::string& file) {
    if (file.empty()) throw ProtocolException("load installation: file name is empty");
    return {makeCommand("load installation", file), "Loading installation:"};
}

DashboardCommand CommandBuilder::raw(const std::string& text) {
    return {makeCommand(text), ""};
}

} // namespace urdash::protocol
