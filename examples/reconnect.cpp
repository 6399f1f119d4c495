/*
===============================================================================
Example - Reconnection & Dial Errors
===============================================================================

Observes the reconnection lineage of a connection:

  - every teardown with an error schedules a redial (1 s, 2 s, 4 s ...)
  - every failed redial is reported through on_dial_error with its count
  - a successful redial fires on_reconnect, followed by on_connect once the
    new handshake completed

After `--attempts` consecutive failures the dial-error listener calls
cancel_reconnect() and the lineage stops.

Try it by stopping the server while the example runs, then restarting it
(or leaving it down to see the retries give up).

===============================================================================
*/

#include <atomic>
#include <chrono>
#include <iostream>
#include <thread>

#include "enginewire.hpp"
#include "common/cli/params.hpp"


int main(int argc, char** argv) {
    using namespace enginewire;

    const auto params = examples::cli::configure(argc, argv, "Engine.IO reconnection example");
    params.dump("=== Runtime Parameters ===", std::cout);
    lcr::log::Logger::instance().enable_color(true);

    std::atomic<int> connects{0};
    std::atomic<int> reconnects{0};
    std::atomic<int> disconnects{0};
    std::atomic<bool> gave_up{false};

    core::transport::telemetry::Connection telemetry;
    Client client(params.options(), telemetry);

    client.on_connect([&] {
        ++connects;
        std::cout << "[example] Connected (sid " << client.id() << ", epoch " << client.epoch() << ")" << std::endl;
    });
    client.on_disconnect([&](Error err) {
        ++disconnects;
        std::cout << "[example] Disconnected: " << core::transport::describe(err) << std::endl;
    });
    client.on_reconnect([&] {
        ++reconnects;
        std::cout << "[example] Transport re-established" << std::endl;
    });
    client.on_dial_error([&](DialErrorContext& ctx) {
        std::cout << "[example] Dial error #" << ctx.count() << ": " << core::transport::describe(ctx.error()) << std::endl;
        if (ctx.count() >= params.attempts) {
            std::cout << "[example] Giving up after " << ctx.count() << " attempt(s)" << std::endl;
            ctx.cancel_reconnect();
            gave_up = true;
        }
    });

    if (const Error err = client.dial(); err != Error::None) {
        std::cerr << "[example] Dial failed: " << core::transport::describe(err) << std::endl;
        return 1;
    }

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(params.runtime_s);
    while (std::chrono::steady_clock::now() < deadline && !gave_up.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    client.close();

    std::cout << "\n=== Connection Telemetry ===" << std::endl;
    telemetry.debug_dump(std::cout);

    std::cout << "\n========== SUMMARY ==========" << std::endl;
    std::cout << "Handshakes        : " << connects.load() << std::endl;
    std::cout << "Disconnects       : " << disconnects.load() << std::endl;
    std::cout << "Reconnects        : " << reconnects.load() << std::endl;
    std::cout << "Gave up           : " << (gave_up.load() ? "yes" : "no") << std::endl;
    return 0;
}
