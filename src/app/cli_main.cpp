// src/app/cli_main.cpp
#include <iostream>
#include <string>
#include <sstream>
#include <vector>
#include <atomic>
#include <csignal>
#include <exception>
#include <memory>
#include <stdexcept>

#include <sys/select.h>
#include <unistd.h>

#include "spdlog/spdlog.h"

#include "controller/Dashboard.hpp"

using namespace urdash::controller;
using urdash::config::DashboardConfig;

static std::atomic<bool> g_stop{false};

void sigint_handler(int /*signum*/) {
    // 시그널 핸들러에서는 atomic flag 설정만 수행
    g_stop.store(true);
}

static std::vector<std::string> split_ws(const std::string& s) {
    std::istringstream iss(s);
    std::vector<std::string> out;
    std::string tok;
    while (iss >> tok) out.push_back(tok);
    return out;
}

// 첫 번째 단어를 제외한 나머지 (앞쪽 공백 제거)
static std::string rest_of_line(const std::string& line, const std::string& first) {
    auto pos = line.find(first);
    if (pos == std::string::npos) return {};
    std::string rest = line.substr(pos + first.size());
    auto b = rest.find_first_not_of(" \t");
    if (b == std::string::npos) return {};
    return rest.substr(b);
}

static void print_result(const std::string& name, const Dashboard::Result& r) {
    if (!r.sent) {
        std::cerr << "[CLI] " << name << ": not sent\n";
        return;
    }
    if (!r.fresh) {
        std::cerr << "[CLI] " << name << ": no reply (last: \"" << r.reply << "\")\n";
        return;
    }
    std::cout << "[" << (r.accepted ? "OK" : "??") << "] #" << r.sequence << " " << r.reply << "\n";
}

static void print_help() {
    std::cout << "Commands:\n"
              << "  help                        : show this help\n"
              << "  state                       : print connection state and last reply\n"
              << "  load <program>              : load program (.urp)\n"
              << "  play | stop | pause         : program control\n"
              << "  running | robotmode | programstate | safetymode | version\n"
              << "  loaded                      : get loaded program\n"
              << "  saved                       : isProgramSaved\n"
              << "  popup <text> | closepopup | closesafetypopup\n"
              << "  log <message>               : addToLog\n"
              << "  role <role>                 : setUserRole\n"
              << "  poweron | poweroff | brakerelease | unlockstop\n"
              << "  installation <file>         : load installation\n"
              << "  shutdown                    : shut down the controller\n"
              << "  raw <text>                  : send text as-is (newline appended)\n"
              << "  quit                        : exit CLI\n";
}

int main(int argc, char** argv) {
    DashboardConfig cfg;

    // Parse optional CLI args: host port log-level
    if (argc >= 2) cfg.host = argv[1];
    if (argc >= 3) {
        try {
            int p = std::stoi(argv[2]);
            if (p <= 0 || p > 65535) throw std::out_of_range("port");
            cfg.port = static_cast<uint16_t>(p);
        } catch (const std::exception&) {
            std::cerr << "[CLI] invalid port: " << argv[2] << "\n";
            return 2;
        }
    }
    if (argc >= 4) {
        spdlog::set_level(spdlog::level::from_str(argv[3]));
    }

    std::unique_ptr<Dashboard> dashboard;
    try {
        dashboard = std::make_unique<Dashboard>(cfg);
    } catch (const std::exception& e) {
        std::cerr << "[CLI] invalid configuration: " << e.what() << "\n";
        return 2;
    }

    // install SIGINT handler for graceful shutdown (handler only sets flag)
    std::signal(SIGINT, sigint_handler);

    std::cout << "[CLI] Connecting to " << cfg.host << ":" << cfg.port << " ...\n";
    dashboard->start();

    std::cout << "urdash CLI\n";
    std::cout << "Type 'help' for commands.\n";

    // select() 로 200ms 마다 깨어나 g_stop 과 worker 종료 여부를 확인
    const int STDIN_FD = fileno(stdin);
    std::string line;
    int exitCode = 0;
    while (!g_stop.load()) {
        if (dashboard->client().workerExited()) {
            std::cerr << "[CLI] connection lost and could not be re-established\n";
            exitCode = 1;
            break;
        }

        fd_set readfds;
        FD_ZERO(&readfds);
        FD_SET(STDIN_FD, &readfds);

        struct timeval tv;
        tv.tv_sec = 0;
        tv.tv_usec = 200000; // 200 ms

        int rv = select(STDIN_FD + 1, &readfds, NULL, NULL, &tv);
        if (rv == -1) {
            if (g_stop.load()) break;
            continue;
        } else if (rv == 0) {
            continue;
        }
        if (!FD_ISSET(STDIN_FD, &readfds)) continue;

        if (!std::getline(std::cin, line)) {
            // EOF -> exit loop
            break;
        }
        auto toks = split_ws(line);
        if (toks.empty()) continue;

        const std::string& cmd = toks[0];
        if (cmd == "help") {
            print_help();
        } else if (cmd == "state") {
            auto last = dashboard->client().lastReply();
            std::cout << "state=" << dashboard->client().state()
                      << " lastReply=#" << last.sequence << " \"" << last.text << "\"\n";
        } else if (cmd == "quit" || cmd == "exit") {
            std::cout << "[CLI] quitting...\n";
            break;
        } else {
            auto result = dashboard->invoke(cmd, rest_of_line(line, cmd));
            if (!result) {
                std::cerr << "[CLI] unknown command: " << cmd << " (type 'help')\n";
                continue;
            }
            print_result(cmd, *result);
        }
    } // main loop

    dashboard->close();
    std::cout << "[CLI] exited\n";
    return exitCode;
}
