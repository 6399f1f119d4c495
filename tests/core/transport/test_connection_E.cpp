/*
===============================================================================
 transport::Connection - Group E Unit Tests
 close(), teardown races & destruction
===============================================================================

Covered Contracts
-----------------
E1. close() while Connected writes exactly one CLOSE; the following
    teardown never reconnects
E2. close() while Opening buffers the CLOSE until the handshake
E3. close() while Closed is a no-op
E4. Packets emitted after close() are buffered and delivered by the next
    explicit dial()
E5. Concurrent teardowns of one attempt: one disconnect, one reconnection
E6. Teardown requests for a retired epoch are ignored
E7. Destruction closes the transport and emits nothing
E8. Destruction with a pending reconnection never redials
E9. Buffered CLOSE / PONG of a dead attempt never reach the next session;
    buffered messages do
E10. A peer that keeps pinging after close() cannot hold the connection:
     teardown at the latest pingTimeout after close()
E11. Same bound when close() was requested while Opening
E12. close() during an automatic redial abandons it: no reconnect event,
     the retry transport is dropped
===============================================================================
*/

#include <atomic>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "common/harness/connection.hpp"


// -----------------------------------------------------------------------------
// E1. close() while Connected
// -----------------------------------------------------------------------------
void test_close_connected() {
    std::cout << "[TEST] Group E1: close() while Connected\n";

    test::ConnectionHarness h;
    auto ws = h.open();

    h.connection->close();
    TEST_CHECK(ws->wait_written(1));
    auto text = ws->written_text();
    TEST_CHECK(text.size() == 1);
    TEST_CHECK(text[0] == "1");

    // Closing is graceful: still Connected until the peer drops
    TEST_CHECK(h.disconnects.load() == 0);

    // The peer acknowledges by dropping the transport
    ws->push_error(Error::RemoteClosed);
    TEST_CHECK(wait_until([&] { return h.disconnects.load() == 1; }));
    TEST_CHECK(h.connection->status() == Status::Closed);

    settle(100ms);
    TEST_CHECK(h.reconnects.load() == 0);
    TEST_CHECK(!h.connection->reconnect_pending());
    TEST_CHECK(WebSocketUnderTest::connect_calls() == 1);

    h.connection->close();   // idempotent
    TEST_CHECK(h.connection->status() == Status::Closed);
    TEST_CHECK(ws->written_text().size() == 1);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// E2. close() while Opening
// -----------------------------------------------------------------------------
void test_close_opening() {
    std::cout << "[TEST] Group E2: close() while Opening\n";

    test::ConnectionHarness h;
    TEST_CHECK(h.connection->dial() == Error::None);
    auto ws = h.connection->ws();

    h.connection->close();
    TEST_CHECK(h.connection->buffered() == 1);
    TEST_CHECK(ws->written().empty());

    h.handshake(*ws);
    const auto text = ws->written_text();
    TEST_CHECK(text.size() == 1);
    TEST_CHECK(text[0] == "1");

    ws->push_text("1");   // peer acknowledges
    TEST_CHECK(wait_until([&] { return h.disconnects.load() == 1; }));
    settle(100ms);
    TEST_CHECK(h.reconnects.load() == 0);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// E3. close() while Closed
// -----------------------------------------------------------------------------
void test_close_closed() {
    std::cout << "[TEST] Group E3: close() while Closed\n";

    test::ConnectionHarness h;
    h.connection->close();
    h.connection->close();
    TEST_CHECK(h.connection->status() == Status::Closed);
    TEST_CHECK(h.connection->buffered() == 0);
    TEST_CHECK(h.disconnects.load() == 0);
    TEST_CHECK(WebSocketUnderTest::connect_calls() == 0);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// E4. emit() after close()
// -----------------------------------------------------------------------------
void test_emit_after_close() {
    std::cout << "[TEST] Group E4: emit() after close() waits for the next dial\n";

    test::ConnectionHarness h;
    auto ws = h.open("s1");

    h.connection->close();
    h.connection->emit("late");
    TEST_CHECK(h.connection->buffered() == 1);

    const auto text = ws->written_text();
    TEST_CHECK(text.size() == 1);
    TEST_CHECK(text[0] == "1");

    // PONG still goes out while closing
    ws->push_text("2");
    TEST_CHECK(ws->wait_written(2));
    TEST_CHECK(ws->written_text()[1] == "3");

    ws->push_text("1");
    TEST_CHECK(wait_until([&] { return h.disconnects.load() == 1; }));

    // Next explicit dial delivers it
    TEST_CHECK(h.connection->dial() == Error::None);
    auto next = h.connection->ws();
    h.handshake(*next, "s2");
    const auto delivered = next->written_text();
    TEST_CHECK(delivered.size() == 1);
    TEST_CHECK(delivered[0] == "4late");
    TEST_CHECK(h.connection->buffered() == 0);

    // closing flag cleared by dial(): emit is immediate again
    h.connection->emit("now");
    TEST_CHECK(next->written_text().size() == 2);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// E5. Concurrent teardown of one attempt
// -----------------------------------------------------------------------------
void test_concurrent_on_close() {
    std::cout << "[TEST] Group E5: concurrent teardowns -> one disconnect, one retry\n";

    test::ConnectionHarness h;
    auto ws = h.open();
    const auto epoch = h.connection->epoch();

    constexpr int N = 8;
    std::vector<std::thread> threads;
    std::atomic<bool> go{false};
    for (int i = 0; i < N; ++i) {
        threads.emplace_back([&, i] {
            while (!go.load()) {
                std::this_thread::yield();
            }
            h.connection->force_on_close(epoch, (i % 2) ? Error::RemoteClosed : Error::TransportFailure);
        });
    }
    go = true;
    for (auto& t : threads) {
        t.join();
    }

    TEST_CHECK(wait_until([&] { return h.reconnects.load() == 1; }));
    settle(150ms);
    TEST_CHECK(h.disconnects.load() == 1);
    TEST_CHECK(h.reconnects.load() == 1);
    TEST_CHECK(WebSocketUnderTest::connect_calls() == 2);
    TEST_CHECK(ws->close_count() == 1);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// E6. Stale epoch
// -----------------------------------------------------------------------------
void test_stale_epoch_ignored() {
    std::cout << "[TEST] Group E6: teardown of a retired epoch is ignored\n";

    test::ConnectionHarness h;
    auto ws = h.open("s1");
    ws->push_error(Error::RemoteClosed);
    TEST_CHECK(wait_until([&] { return h.reconnects.load() == 1; }));

    auto next = h.ws();
    h.handshake(*next, "s2");
    TEST_CHECK(h.connection->epoch() == 2);

    h.connection->force_on_close(1, Error::PingTimeout);
    settle(50ms);
    TEST_CHECK(h.disconnects.load() == 1);
    TEST_CHECK(h.connection->status() == Status::Connected);
    TEST_CHECK(!next->is_closed());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// E7. Destruction
// -----------------------------------------------------------------------------
void test_destruction() {
    std::cout << "[TEST] Group E7: destruction closes the transport silently\n";

    test::ConnectionHarness h;
    auto ws = h.open();
    h.destroy_connection();

    TEST_CHECK(ws->is_closed());
    TEST_CHECK(h.disconnects.load() == 0);
    TEST_CHECK(h.reconnects.load() == 0);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// E8. Destruction with a pending reconnection
// -----------------------------------------------------------------------------
void test_destruction_pending_retry() {
    std::cout << "[TEST] Group E8: destruction cancels a pending reconnection\n";

    Options opts = test::test_options();
    opts.reconnect_base_delay = 100ms;
    test::ConnectionHarness h(opts);
    auto ws = h.open();

    ws->push_error(Error::RemoteClosed);
    TEST_CHECK(wait_until([&] { return h.connection->reconnect_pending(); }));

    const auto start = std::chrono::steady_clock::now();
    h.destroy_connection();
    TEST_CHECK(std::chrono::steady_clock::now() - start < 1s);

    settle(200ms);
    TEST_CHECK(WebSocketUnderTest::connect_calls() == 1);
    TEST_CHECK(h.reconnects.load() == 0);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// E9. Stale control packets
// -----------------------------------------------------------------------------
void test_stale_control_packets_dropped() {
    std::cout << "[TEST] Group E9: CLOSE / PONG of a dead attempt are not replayed\n";

    {
        test::ConnectionHarness h;
        TEST_CHECK(h.connection->dial() == Error::None);
        auto first = h.connection->ws();

        h.connection->emit("keep");
        h.connection->close();
        TEST_CHECK(h.connection->buffered() == 2);

        // Transport dies before the handshake: the CLOSE was never sent
        first->push_error(Error::RemoteClosed);
        TEST_CHECK(wait_until([&] { return h.disconnects.load() == 1; }));
        TEST_CHECK(h.connection->status() == Status::Closed);
        settle(50ms);
        TEST_CHECK(h.reconnects.load() == 0);

        TEST_CHECK(h.connection->dial() == Error::None);
        TEST_CHECK(h.connection->buffered() == 1);
        auto next = h.connection->ws();
        h.handshake(*next, "s2");
        h.connection->emit("hello");

        const auto text = next->written_text();
        TEST_CHECK(text.size() == 2);
        TEST_CHECK(text[0] == "4keep");
        TEST_CHECK(text[1] == "4hello");
        settle(50ms);
        TEST_CHECK(h.connection->status() == Status::Connected);
    }
    {
        test::ConnectionHarness h;
        TEST_CHECK(h.connection->dial() == Error::None);
        auto first = h.connection->ws();

        // PING before the handshake queues its PONG
        first->push_text("2");
        TEST_CHECK(wait_until([&] { return h.connection->buffered() == 1; }));
        first->push_error(Error::RemoteClosed);

        TEST_CHECK(wait_until([&] { return h.reconnects.load() == 1; }));
        TEST_CHECK(h.connection->buffered() == 0);
        auto next = h.ws();
        h.handshake(*next, "s2");
        TEST_CHECK(next->written_text().empty());
    }

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// E10. Pinging peer after close() while Connected
// -----------------------------------------------------------------------------
void test_close_bounded_with_pinging_peer() {
    std::cout << "[TEST] Group E10: close() completes although the peer keeps pinging\n";

    test::ConnectionHarness h;
    auto ws = h.open("sid-1", 200, 150);

    const auto start = std::chrono::steady_clock::now();
    h.connection->close();
    TEST_CHECK(ws->wait_written(1));

    // Pings well inside pingInterval + pingTimeout, CLOSE never acknowledged
    for (int i = 0; i < 40 && h.disconnects.load() == 0; ++i) {
        ws->push_text("2");
        std::this_thread::sleep_for(25ms);
    }
    TEST_CHECK(wait_until([&] { return h.disconnects.load() == 1; }));
    TEST_CHECK(std::chrono::steady_clock::now() - start < 900ms);
    TEST_CHECK(h.disconnect_log()[0] == Error::None);
    TEST_CHECK(h.connection->status() == Status::Closed);
    TEST_CHECK(ws->is_closed());

    const auto text = ws->written_text();
    TEST_CHECK(text[0] == "1");
    TEST_CHECK(text.size() >= 2 && text[1] == "3");   // PONGs still answered meanwhile

    settle(100ms);
    TEST_CHECK(h.reconnects.load() == 0);
    TEST_CHECK(!h.connection->reconnect_pending());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// E11. Pinging peer after close() while Opening
// -----------------------------------------------------------------------------
void test_close_opening_bounded_with_pinging_peer() {
    std::cout << "[TEST] Group E11: close() while Opening, peer keeps pinging\n";

    test::ConnectionHarness h;
    TEST_CHECK(h.connection->dial() == Error::None);
    auto ws = h.connection->ws();
    h.connection->close();

    const auto start = std::chrono::steady_clock::now();
    h.handshake(*ws, "sid-1", 200, 150);
    TEST_CHECK(ws->written_text()[0] == "1");

    for (int i = 0; i < 40 && h.disconnects.load() == 0; ++i) {
        ws->push_text("2");
        std::this_thread::sleep_for(25ms);
    }
    TEST_CHECK(wait_until([&] { return h.disconnects.load() == 1; }));
    TEST_CHECK(std::chrono::steady_clock::now() - start < 900ms);
    TEST_CHECK(h.disconnect_log()[0] == Error::None);

    settle(100ms);
    TEST_CHECK(h.reconnects.load() == 0);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// E12. close() during an automatic redial
// -----------------------------------------------------------------------------
void test_close_during_redial() {
    std::cout << "[TEST] Group E12: close() during a redial abandons it\n";

    test::ConnectionHarness h;
    auto ws = h.open();

    WebSocketUnderTest::set_connect_delay(300ms);
    ws->push_error(Error::RemoteClosed);

    // Retry is inside connect()
    TEST_CHECK(wait_until([&] { return WebSocketUnderTest::connect_calls() == 2; }));
    TEST_CHECK(h.connection->status() == Status::Opening);
    h.connection->close();

    settle(500ms);
    TEST_CHECK(h.connection->status() == Status::Closed);
    TEST_CHECK(h.reconnects.load() == 0);
    TEST_CHECK(h.dial_errors.load() == 0);
    TEST_CHECK(h.connection->ws() == nullptr);
    TEST_CHECK(!h.connection->reconnect_pending());
    TEST_CHECK(WebSocketUnderTest::connect_calls() == 2);

    // The CLOSE queued for the abandoned retry is not replayed
    WebSocketUnderTest::set_connect_delay(0ms);
    TEST_CHECK(h.connection->dial() == Error::None);
    auto next = h.connection->ws();
    h.handshake(*next, "s2");
    TEST_CHECK(next->written_text().empty());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
#include "lcr/log/logger.hpp"

int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Debug);

    test_close_connected();
    test_close_opening();
    test_close_closed();
    test_emit_after_close();
    test_concurrent_on_close();
    test_stale_epoch_ignored();
    test_destruction();
    test_destruction_pending_retry();
    test_stale_control_packets_dropped();
    test_close_bounded_with_pinging_peer();
    test_close_opening_bounded_with_pinging_peer();
    test_close_during_redial();

    std::cout << "\n[GROUP E - CLOSE & TEARDOWN TESTS PASSED]\n";
    return 0;
}
