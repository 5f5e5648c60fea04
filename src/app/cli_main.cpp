// src/app/cli_main.cpp
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include <sys/select.h>
#include <unistd.h>

#include <boost/asio/io_context.hpp>

#include "common/ShutdownSignal.h"
#include "common/SignalHook.hpp"
#include "config/Config.hpp"
#include "protocol/LineFramer.hpp"
#include "protocol/Parser.hpp"
#include "protocol/exceptions/ClientException.h"
#include "spdlog/spdlog.h"

using tlcp::common::ShutdownSignal;
using tlcp::common::SignalHook;
using tlcp::protocol::ClientException;
using tlcp::protocol::extractLines;
using tlcp::protocol::Parser;
using tlcp::protocol::Response;

static void printResponse(const Response& resp) {
    std::cout << "cleaned: " << resp.cleaned << "\n";
    std::cout << "        kind=" << tlcp::protocol::toString(resp.kind) << " cmd=" << resp.command;
    if (!resp.params.empty()) {
        std::cout << " params=";
        for (const auto& p : resp.params) {
            std::cout << "[" << p << "]";
        }
    }
    std::cout << std::endl;
}

static void handleLine(const std::string& line, std::size_t lineNo) {
    try {
        Response resp = Parser::parse(line);
        spdlog::debug("line {}: {} params", lineNo, resp.params.size());
        printResponse(resp);
    } catch (const ClientException& e) {
        spdlog::warn("Skipping line {}: {}", lineNo, e.describe());
    }
}

int main(int argc, char** argv) {
    // Parse optional CLI args: log-level
    spdlog::level::level_enum level = tlcp::config::DEFAULT_LOG_LEVEL;
    if (argc >= 2) {
        const std::string name = argv[1];
        level = spdlog::level::from_str(name);
        // from_str maps unknown names to off
        if (level == spdlog::level::off && name != "off") {
            std::cerr << "[CLI] unknown log level: " << name << "\n";
            std::cerr << "usage: " << argv[0] << " [trace|debug|info|warn|err|critical|off]\n";
            return 2;
        }
    }
    spdlog::set_level(level);

    boost::asio::io_context ioContext;
    auto shutdown = std::make_shared<ShutdownSignal>();
    SignalHook hook(ioContext);
    try {
        hook.install(shutdown);
    } catch (const ClientException& e) {
        spdlog::error("Cannot install signal handler: {}", e.describe());
        return 1;
    }

    // signal handlers run here, not in async-signal context
    std::thread ioThread([&ioContext]() {
        ioContext.run();
    });

    spdlog::info("Reading TLCP lines from stdin. Ctrl+C to stop.");

    // poll stdin with select() so the loop can notice the shutdown signal
    const int STDIN_FD = fileno(stdin);
    const auto interval = tlcp::config::DEFAULT_STDIN_POLL_INTERVAL_MS;
    // read() the descriptor directly: a buffered istream could hold complete lines
    // select() no longer reports, or block on a partial line
    std::string pending;
    char chunk[4096];
    std::size_t lineCount = 0;
    while (!shutdown->waitFor(tlcp::config::ms(0))) {
        fd_set readfds;
        FD_ZERO(&readfds);
        FD_SET(STDIN_FD, &readfds);

        struct timeval tv;
        tv.tv_sec = 0;
        tv.tv_usec = static_cast<suseconds_t>(interval.count() * 1000);

        int rv = select(STDIN_FD + 1, &readfds, NULL, NULL, &tv);
        if (rv <= 0) {
            // timeout or EINTR: re-check shutdown
            continue;
        }
        if (!FD_ISSET(STDIN_FD, &readfds)) continue;

        ssize_t n = read(STDIN_FD, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            spdlog::error("stdin read error: {}", std::strerror(errno));
            break;
        }
        if (n == 0) {
            // EOF: an unterminated last line still counts
            if (!pending.empty()) {
                handleLine(pending, ++lineCount);
            }
            spdlog::debug("stdin closed after {} lines", lineCount);
            break;
        }

        pending.append(chunk, static_cast<std::size_t>(n));
        for (const auto& line : extractLines(pending)) {
            handleLine(line, ++lineCount);
        }
    }

    hook.cancel();
    ioContext.stop();
    if (ioThread.joinable()) {
        ioThread.join();
    }
    spdlog::info("Program exited gracefully.");
    return 0;
}
