#include "common/SignalHook.hpp"
#include "protocol/exceptions/ClientException.h"
#include "spdlog/spdlog.h"

#include <csignal>
#include <utility>

#include <boost/asio/error.hpp>

namespace tlcp::common {

using tlcp::protocol::illegalArgument;
using tlcp::protocol::illegalState;

/**
 * @brief Constructor for SignalHook. Registers SIGINT and SIGTERM with the io_context.
 * @param ioContext The Boost.Asio I/O context that will run the handler.
 */
SignalHook::SignalHook(boost::asio::io_context& ioContext)
    : signals_(ioContext, SIGINT, SIGTERM) {
    spdlog::debug("SignalHook created for SIGINT/SIGTERM.");
}

SignalHook::~SignalHook() {
    cancel();
}

/**
 * @brief Arms the handler so that termination signals notify the given ShutdownSignal.
 * @param shutdown The signal to notify on every SIGINT/SIGTERM.
 */
void SignalHook::install(std::shared_ptr<ShutdownSignal> shutdown) {
    if (!shutdown) {
        throw illegalArgument("SignalHook: shutdown signal is null");
    }
    bool expected = false;
    if (!installed_.compare_exchange_strong(expected, true)) {
        throw illegalState("SignalHook: handler already installed");
    }
    shutdown_ = std::move(shutdown);
    arm();
    spdlog::info("Signal handler installed.");
}

void SignalHook::cancel() {
    if (!installed_.exchange(false)) return;
    boost::system::error_code ec;
    signals_.cancel(ec);
    if (ec) {
        spdlog::warn("Failed to cancel signal wait: {}", ec.message());
    }
}

bool SignalHook::isInstalled() const noexcept {
    return installed_.load();
}

void SignalHook::arm() {
    signals_.async_wait([this](const boost::system::error_code& error, int signalNumber) {
        if (error) {
            if (error != boost::asio::error::operation_aborted) {
                spdlog::error("Signal wait error: {}", error.message());
            }
            return;
        }
        spdlog::info("Received termination signal, initiating graceful shutdown...");
        spdlog::debug("Signal number: {}", signalNumber);
        shutdown_->notifyOne();

        if (installed_.load()) {
            arm();
        }
    });
}

} // namespace tlcp::common
