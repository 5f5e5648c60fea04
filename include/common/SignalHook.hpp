#pragma once
/**
 * SignalHook.hpp
 *
 * Routes SIGINT/SIGTERM to a ShutdownSignal through a Boost.Asio signal_set.
 *
 * - install() arms the handler. Every delivered signal logs once and calls
 *   ShutdownSignal::notifyOne(), then the handler re-arms itself.
 * - Handlers run on whichever thread runs the io_context; nothing here runs in
 *   async-signal context.
 * - cancel() disarms. The io_context must outlive the hook.
 *
 * Usage:
 *   boost::asio::io_context io;
 *   auto shutdown = std::make_shared<ShutdownSignal>();
 *   SignalHook hook(io);
 *   hook.install(shutdown);
 *   std::thread t([&io] { io.run(); });
 *   shutdown->wait();
 */

#include <atomic>
#include <memory>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "ShutdownSignal.h"

namespace tlcp::common {

class SignalHook {
public:
    explicit SignalHook(boost::asio::io_context& ioContext);
    ~SignalHook();

    // non-copyable
    SignalHook(const SignalHook&) = delete;
    SignalHook& operator=(const SignalHook&) = delete;

    // throws ClientException: IllegalArgument on null, IllegalState if already installed
    void install(std::shared_ptr<ShutdownSignal> shutdown);
    void cancel();

    bool isInstalled() const noexcept;

private:
    void arm();

    boost::asio::signal_set signals_;
    std::shared_ptr<ShutdownSignal> shutdown_;
    std::atomic<bool> installed_{false};
};

} // namespace tlcp::common
