/*
===============================================================================
Example - Echo
===============================================================================

Dials an Engine.IO v4 server, emits a handful of MESSAGE packets and prints
whatever the server sends back.

  1) Register listeners (connect, message, pong, disconnect)
  2) Emit the messages BEFORE dialing: they are buffered while the
     connection is not Connected and flushed, in order, by the handshake
  3) Dial and wait until every reply arrived or the runtime expired
  4) close(): a CLOSE packet is sent and no reconnection follows
  5) Dump connection and transport telemetry

A minimal echo server is enough to try it, e.g. with the node `engine.io`
package:

    server.on("connection", s => s.on("message", m => s.send(m)));

===============================================================================
*/

#include <atomic>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>

#include "enginewire.hpp"
#include "common/cli/params.hpp"


int main(int argc, char** argv) {
    using namespace enginewire;

    const auto params = examples::cli::configure(argc, argv, "Engine.IO echo example");
    params.dump("=== Runtime Parameters ===", std::cout);
    lcr::log::Logger::instance().enable_color(true);

    std::atomic<int> replies{0};
    std::atomic<bool> disconnected{false};

    core::transport::telemetry::Connection telemetry;
    Client client(params.options(), telemetry);

    client.on_connect([&] {
        std::cout << "[example] Connected (sid " << client.id() << ")" << std::endl;
    });
    client.on_message([&](std::string_view msg) {
        ++replies;
        std::cout << "[example] <- " << msg << std::endl;
    });
    client.on_pong([](std::string_view) {
        std::cout << "[example] PONG" << std::endl;
    });
    client.on_disconnect([&](Error err) {
        std::cout << "[example] Disconnected: " << core::transport::describe(err) << std::endl;
        disconnected = true;
    });

    // Buffered until the handshake
    for (int i = 0; i < params.count; ++i) {
        client.emit("hello #" + std::to_string(i));
    }
    std::cout << "[example] " << client.buffered() << " message(s) buffered before dial" << std::endl;

    std::cout << "[example] Dialing " << client.url() << std::endl;
    if (const Error err = client.dial(); err != Error::None) {
        std::cerr << "[example] Dial failed: " << core::transport::describe(err) << std::endl;
        return 1;
    }

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(params.runtime_s);
    while (std::chrono::steady_clock::now() < deadline && replies.load() < params.count && !disconnected.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    client.close();
    // Give the peer a moment to drop the transport
    for (int i = 0; i < 100 && client.status() != Status::Closed; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    std::cout << "\n=== Connection Telemetry ===" << std::endl;
    telemetry.debug_dump(std::cout);

    std::cout << "\n========== SUMMARY ==========" << std::endl;
    std::cout << "Messages emitted  : " << params.count << std::endl;
    std::cout << "Replies received  : " << replies.load() << std::endl;

    return replies.load() >= params.count ? 0 : 1;
}
