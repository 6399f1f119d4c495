/*
===============================================================================
 transport::Connection - Group D Unit Tests
 Reconnection lineage, backoff & dial errors
===============================================================================

Covered Contracts
-----------------
D1. Unexpected teardown -> reconnect event -> new attempt (epoch, sid)
D2. Failed redials report 1, 2, 3 ...; backoff grows, resets on success
D3. cancel_reconnect() from a dial-error listener ends the chain
D4. Cancelling the parent context stops the lineage
D5. An explicit dial() cancels a pending reconnection
D6. Backoff sequence observed through the connection is capped
===============================================================================
*/

#include <atomic>
#include <iostream>
#include <string>
#include <vector>

#include "common/harness/connection.hpp"


// -----------------------------------------------------------------------------
// D1. Reconnect after a transport error
// -----------------------------------------------------------------------------
void test_reconnect_after_error() {
    std::cout << "[TEST] Group D1: reconnection after a transport error\n";

    test::ConnectionHarness h;
    auto ws = h.open("first");
    TEST_CHECK(h.connection->epoch() == 1);

    ws->push_error(Error::RemoteClosed);
    TEST_CHECK(wait_until([&] { return h.reconnects.load() == 1; }));

    TEST_CHECK(h.disconnect_log().size() == 1);
    TEST_CHECK(h.disconnect_log()[0] == Error::RemoteClosed);
    TEST_CHECK(h.connection->epoch() == 2);
    TEST_CHECK(h.connection->status() == Status::Opening);
    TEST_CHECK(h.connection->id().empty());   // cleared for the new attempt

    auto next = h.ws();
    TEST_CHECK(next != ws);
    h.handshake(*next, "second");
    TEST_CHECK(h.connection->id() == "second");
    TEST_CHECK(h.connects.load() == 2);

    // Event ordering: disconnect precedes reconnect precedes connect
    const auto log = h.event_log();
    TEST_CHECK(log.size() == 4);
    TEST_CHECK(log[0] == "connect");
    TEST_CHECK(log[1] == "disconnect:RemoteClosed");
    TEST_CHECK(log[2] == "reconnect");
    TEST_CHECK(log[3] == "connect");

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// D2. Failed redials and backoff reset
// -----------------------------------------------------------------------------
void test_failed_redials() {
    std::cout << "[TEST] Group D2: failed redials count up, backoff resets on success\n";

    test::ConnectionHarness h;
    auto ws = h.open();
    TEST_CHECK(h.connection->next_reconnect_delay() == 10ms);

    WebSocketUnderTest::push_connect_result(Error::ConnectionFailed);
    WebSocketUnderTest::push_connect_result(Error::Timeout);
    WebSocketUnderTest::push_connect_result(Error::HandshakeFailed);
    ws->push_error(Error::RemoteClosed);

    TEST_CHECK(wait_until([&] { return h.reconnects.load() == 1; }));

    const auto counts = h.dial_error_log();
    TEST_CHECK(counts.size() == 3);
    TEST_CHECK(counts[0] == 1);
    TEST_CHECK(counts[1] == 2);
    TEST_CHECK(counts[2] == 3);
    TEST_CHECK(WebSocketUnderTest::connect_calls() == 5);

    // reset by the successful dial
    TEST_CHECK(h.connection->next_reconnect_delay() == 10ms);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// D3. cancel_reconnect()
// -----------------------------------------------------------------------------
void test_cancel_reconnect() {
    std::cout << "[TEST] Group D3: cancel_reconnect() ends the chain\n";

    test::ConnectionHarness h;
    std::vector<Error> seen;
    std::mutex seen_mutex;
    h.connection->on_dial_error([&](connection::DialErrorContext& ctx) {
        {
            std::lock_guard<std::mutex> lock(seen_mutex);
            seen.push_back(ctx.error());
        }
        if (ctx.count() >= 2) {
            ctx.cancel_reconnect();
        }
    });
    auto ws = h.open();

    for (int i = 0; i < 5; ++i) {
        WebSocketUnderTest::push_connect_result(Error::ConnectionFailed);
    }
    ws->push_error(Error::RemoteClosed);

    TEST_CHECK(wait_until([&] { return h.dial_errors.load() == 2; }));
    settle(200ms);
    TEST_CHECK(h.dial_errors.load() == 2);
    TEST_CHECK(WebSocketUnderTest::connect_calls() == 3);
    TEST_CHECK(h.reconnects.load() == 0);
    TEST_CHECK(!h.connection->reconnect_pending());
    TEST_CHECK(h.connection->status() == Status::Closed);
    {
        std::lock_guard<std::mutex> lock(seen_mutex);
        TEST_CHECK(seen.size() == 2);
        TEST_CHECK(seen[0] == Error::ConnectionFailed);
    }

    // Still usable: an explicit dial is reported with count -1, not retried
    TEST_CHECK(h.connection->dial() == Error::ConnectionFailed);
    TEST_CHECK(h.dial_error_log().back() == -1);
    settle(100ms);
    TEST_CHECK(WebSocketUnderTest::connect_calls() == 4);
    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// D4. Parent context governs the lineage
// -----------------------------------------------------------------------------
void test_parent_cancel_stops_lineage() {
    std::cout << "[TEST] Group D4: cancelling the parent stops reconnection\n";

    Options opts = test::test_options();
    opts.reconnect_base_delay = 200ms;
    opts.reconnect_max_delay = 200ms;
    test::ConnectionHarness h(opts);

    auto parent = Context::make();
    TEST_CHECK(h.connection->dial(parent) == Error::None);
    auto ws = h.connection->ws();
    h.handshake(*ws);

    ws->push_error(Error::RemoteClosed);
    TEST_CHECK(wait_until([&] { return h.disconnects.load() == 1; }));
    TEST_CHECK(wait_until([&] { return h.connection->reconnect_pending(); }));

    parent->cancel();
    TEST_CHECK(wait_until([&] { return !h.connection->reconnect_pending(); }));
    settle(300ms);
    TEST_CHECK(h.reconnects.load() == 0);
    TEST_CHECK(WebSocketUnderTest::connect_calls() == 1);

    // dial() with the same (cancelled) parent is refused
    TEST_CHECK(h.connection->dial(parent) == Error::Cancelled);
    // a fresh lineage works
    TEST_CHECK(h.connection->dial() == Error::None);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// D5. Explicit dial() overrides a pending retry
// -----------------------------------------------------------------------------
void test_dial_cancels_pending_retry() {
    std::cout << "[TEST] Group D5: explicit dial() cancels a pending reconnection\n";

    Options opts = test::test_options();
    opts.reconnect_base_delay = 200ms;
    test::ConnectionHarness h(opts);
    auto ws = h.open();

    ws->push_error(Error::RemoteClosed);
    TEST_CHECK(wait_until([&] { return h.disconnects.load() == 1; }));
    TEST_CHECK(wait_until([&] { return h.connection->reconnect_pending(); }));

    TEST_CHECK(h.connection->dial() == Error::None);
    TEST_CHECK(!h.connection->reconnect_pending());

    settle(350ms);
    TEST_CHECK(h.reconnects.load() == 0);
    TEST_CHECK(WebSocketUnderTest::connect_calls() == 2);
    TEST_CHECK(h.connection->epoch() == 2);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// D6. Backoff cap
// -----------------------------------------------------------------------------
void test_backoff_capped() {
    std::cout << "[TEST] Group D6: backoff grows to the cap\n";

    Options opts = test::test_options();
    opts.reconnect_base_delay = 5ms;
    opts.reconnect_max_delay = 20ms;
    test::ConnectionHarness h(opts);

    std::atomic<bool> stop{false};
    h.connection->on_dial_error([&](connection::DialErrorContext& ctx) {
        if (ctx.count() >= 5) {
            ctx.cancel_reconnect();
            stop = true;
        }
    });
    auto ws = h.open();
    for (int i = 0; i < 5; ++i) {
        WebSocketUnderTest::push_connect_result(Error::ConnectionFailed);
    }
    ws->push_error(Error::RemoteClosed);

    TEST_CHECK(wait_until([&] { return stop.load(); }));
    // 5, 10, 20, 20, 20 handed out; the next one stays capped
    TEST_CHECK(h.connection->next_reconnect_delay() == 20ms);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
#include "lcr/log/logger.hpp"

int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Debug);

    test_reconnect_after_error();
    test_failed_redials();
    test_cancel_reconnect();
    test_parent_cancel_stops_lineage();
    test_dial_cancels_pending_retry();
    test_backoff_capped();

    std::cout << "\n[GROUP D - RECONNECTION TESTS PASSED]\n";
    return 0;
}
