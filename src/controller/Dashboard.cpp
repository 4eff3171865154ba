// src/controller/Dashboard.cpp
#include "controller/Dashboard.hpp"
#include "protocol/Parser.hpp"
#include "protocol/ReplyDecoder.hpp"
#include "protocol/exceptions/ProtocolException.h"

#include "spdlog/spdlog.h"

#include <map>
#include <stdexcept>
#include <utility>

namespace urdash::controller {

using urdash::protocol::CommandBuilder;
using urdash::protocol::DashboardCommand;
using urdash::protocol::Parser;

namespace {

using Action = std::function<Dashboard::Result(Dashboard&, const std::string&)>;

const std::map<std::string, Action>& actionTable() {
    static const std::map<std::string, Action> table = {
        {"load",             [](Dashboard& d, const std::string& a) { return d.load(a); }},
        {"play",             [](Dashboard& d, const std::string&) { return d.play(); }},
        {"stop",             [](Dashboard& d, const std::string&) { return d.stop(); }},
        {"pause",            [](Dashboard& d, const std::string&) { return d.pause(); }},
        {"shutdown",         [](Dashboard& d, const std::string&) { return d.shutdown(); }},
        {"running",          [](Dashboard& d, const std::string&) { return d.running(); }},
        {"robotmode",        [](Dashboard& d, const std::string&) { return d.robotmode(); }},
        {"loaded",           [](Dashboard& d, const std::string&) { return d.getLoadedProgram(); }},
        {"popup",            [](Dashboard& d, const std::string& a) { return d.popup(a); }},
        {"closepopup",       [](Dashboard& d, const std::string&) { return d.closePopup(); }},
        {"log",              [](Dashboard& d, const std::string& a) { return d.addLog(a); }},
        {"role",             [](Dashboard& d, const std::string& a) { return d.setUserRole(a); }},
        {"saved",            [](Dashboard& d, const std::string&) { return d.isProgramSaved(); }},
        {"programstate",     [](Dashboard& d, const std::string&) { return d.programState(); }},
        {"version",          [](Dashboard& d, const std::string&) { return d.polyscopeVersion(); }},
        {"poweron",          [](Dashboard& d, const std::string&) { return d.powerOn(); }},
        {"poweroff",         [](Dashboard& d, const std::string&) { return d.powerOff(); }},
        {"brakerelease",     [](Dashboard& d, const std::string&) { return d.brakeRelease(); }},
        {"safetymode",       [](Dashboard& d, const std::string&) { return d.safetyMode(); }},
        {"unlockstop",       [](Dashboard& d, const std::string&) { return d.unlockProtectiveStop(); }},
        {"closesafetypopup", [](Dashboard& d, const std::string&) { return d.closeSafetyPopup(); }},
        {"installation",     [](Dashboard& d, const std::string& a) { return d.loadInstallation(a); }},
        {"raw",              [](Dashboard& d, const std::string& a) { return d.raw(a); }},
    };
    return table;
}

} // namespace

Dashboard::Dashboard(urdash::config::DashboardConfig config, DashboardClient::ClientFactory factory)
    : client_(std::make_shared<DashboardClient>(std::move(config), std::move(factory))) {}

Dashboard::Dashboard(std::shared_ptr<DashboardClient> client)
    : client_(std::move(client)) {
    if (!client_) {
        throw std::invalid_argument("DashboardClient object is not valid.");
    }
}

void Dashboard::start() {
    client_->start();
}

void Dashboard::close() {
    client_->close();
}

bool Dashboard::isRunning() const noexcept {
    return client_->isRunning();
}

bool Dashboard::isConnected() const noexcept {
    return client_->isConnected();
}

Dashboard::Result Dashboard::execute(const std::function<DashboardCommand()>& build) {
    Result result;
    DashboardCommand cmd;
    try {
        cmd = build();
    } catch (const urdash::protocol::ProtocolException& e) {
        spdlog::error("{}", e.what());
        return result;
    }

    result.sent = client_->send(cmd.line);
    if (!result.sent) {
        return result;
    }

    auto snap = client_->waitForReply();
    result.fresh = snap.fresh;
    result.reply = snap.text;
    result.sequence = snap.sequence;
    result.accepted = result.fresh && Parser::startsWith(result.reply, cmd.expected);

    const auto printable = urdash::protocol::ReplyDecoder::stripTerminator(cmd.line);
    if (!result.fresh) {
        spdlog::warn("No reply to '{}' within {} ms.", printable, client_->config().replyTimeout.count());
    } else if (!result.accepted) {
        spdlog::warn("Unexpected reply to '{}': {}", printable, result.reply);
    } else {
        spdlog::info("{} -> {}", printable, result.reply);
    }
    return result;
}

Dashboard::Result Dashboard::load(const std::string& program) {
    return execute([&program]() { return CommandBuilder::load(program); });
}

Dashboard::Result Dashboard::play() {
    return execute(&CommandBuilder::play);
}

Dashboard::Result Dashboard::stop() {
    return execute(&CommandBuilder::stop);
}

Dashboard::Result Dashboard::pause() {
    return execute(&CommandBuilder::pause);
}

Dashboard::Result Dashboard::shutdown() {
    return execute(&CommandBuilder::shutdown);
}

Dashboard::Result Dashboard::running() {
    return execute(&CommandBuilder::running);
}

Dashboard::Result Dashboard::robotmode() {
    return execute(&CommandBuilder::robotmode);
}

Dashboard::Result Dashboard::getLoadedProgram() {
    return execute(&CommandBuilder::getLoadedProgram);
}

Dashboard::Result Dashboard::popup(const std::string& text) {
    return execute([&text]() { return CommandBuilder::popup(text); });
}

Dashboard::Result Dashboard::closePopup() {
    return execute(&CommandBuilder::closePopup);
}

Dashboard::Result Dashboard::addLog(const std::string& message) {
    return execute([&message]() { return CommandBuilder::addLog(message); });
}

Dashboard::Result Dashboard::setUserRole(const std::string& role) {
    return execute([&role]() { return CommandBuilder::setUserRole(role); });
}

Dashboard::Result Dashboard::isProgramSaved() {
    return execute(&CommandBuilder::isProgramSaved);
}

Dashboard::Result Dashboard::programState() {
    return execute(&CommandBuilder::programState);
}

Dashboard::Result Dashboard::polyscopeVersion() {
    return execute(&CommandBuilder::polyscopeVersion);
}

Dashboard::Result Dashboard::powerOn() {
    return execute(&CommandBuilder::powerOn);
}

Dashboard::Result Dashboard::powerOff() {
    return execute(&CommandBuilder::powerOff);
}

Dashboard::Result Dashboard::brakeRelease() {
    return execute(&CommandBuilder::brakeRelease);
}

Dashboard::Result Dashboard::safetyMode() {
    return execute(&CommandBuilder::safetyMode);
}

Dashboard::Result Dashboard::unlockProtectiveStop() {
    return execute(&CommandBuilder::unlockProtectiveStop);
}

Dashboard::Result Dashboard::closeSafetyPopup() {
    return execute(&CommandBuilder::closeSafetyPopup);
}

Dashboard::Result Dashboard::loadInstallation(const std::string& file) {
    return execute([&file]() { return CommandBuilder::loadInstallation(file); });
}

Dashboard::Result Dashboard::raw(const std::string& text) {
    return execute([&text]() { return CommandBuilder::raw(text); });
}

const std::vector<std::string>& Dashboard::commandNames() {
    static const std::vector<std::string> names = []() {
        std::vector<std::string> out;
        for (const auto& entry : actionTable()) out.push_back(entry.first);
        return out;
    }();
    return names;
}

std::optional<Dashboard::Result> Dashboard::invoke(const std::string& name, const std::string& argument) {
    auto it = actionTable().find(name);
    if (it == actionTable().end()) return std::nullopt;
    return it->second(*this, argument);
}

std::optional<bool> Dashboard::programRunning() {
    auto r = running();
    if (!r.accepted) return std::nullopt;
    return Parser::parseBool(r.reply);
}

std::optional<bool> Dashboard::programSaved() {
    auto r = isProgramSaved();
    if (!r.fresh) return std::nullopt;
    return Parser::parseBool(r.reply);
}

} // namespace urdash::controller
