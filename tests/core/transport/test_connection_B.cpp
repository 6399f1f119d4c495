/*
===============================================================================
 transport::Connection - Group B Unit Tests
 Outbound buffer & send path
===============================================================================

Covered Contracts
-----------------
B1. Packets emitted before dial() are flushed FIFO by the handshake
B2. Text and binary packets buffered while Opening keep their order
B3. emit() while Connected writes immediately and fires send
B4. emit_binary() while Connected writes a binary frame, no send event
B5. A write failure tears the attempt down with the write error
B6. A failed flush keeps the unsent packets; they are delivered by the
    next handshake (nothing emitted is dropped)
===============================================================================
*/

#include <iostream>
#include <string>
#include <vector>

#include "common/harness/connection.hpp"


// -----------------------------------------------------------------------------
// B1. Buffered before dial()
// -----------------------------------------------------------------------------
void test_buffer_before_dial() {
    std::cout << "[TEST] Group B1: packets emitted before dial() are flushed in order\n";

    test::ConnectionHarness h;
    h.connection->emit("a");
    h.connection->emit("b");
    h.connection->emit("c");
    TEST_CHECK(h.connection->buffered() == 3);

    TEST_CHECK(h.connection->dial() == Error::None);
    auto ws = h.connection->ws();
    TEST_CHECK(ws->written().empty());
    TEST_CHECK(h.connection->buffered() == 3);

    h.handshake(*ws);
    TEST_CHECK(h.connection->buffered() == 0);

    const auto text = ws->written_text();
    TEST_CHECK(text.size() == 3);
    TEST_CHECK(text[0] == "4a");
    TEST_CHECK(text[1] == "4b");
    TEST_CHECK(text[2] == "4c");

    // send fires once per flushed frame, before connect
    const auto sent = h.sent_log();
    TEST_CHECK(sent.size() == 3);
    TEST_CHECK(sent[0] == "4a" && sent[2] == "4c");

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// B2. Mixed buffer while Opening
// -----------------------------------------------------------------------------
void test_buffer_while_opening() {
    std::cout << "[TEST] Group B2: mixed text/binary buffer keeps submission order\n";

    test::ConnectionHarness h;
    TEST_CHECK(h.connection->dial() == Error::None);
    auto ws = h.connection->ws();

    h.connection->emit("first");
    h.connection->emit_binary(std::string("\x00\x01\x02", 3));
    h.connection->emit("third");
    TEST_CHECK(h.connection->buffered() == 3);
    TEST_CHECK(ws->written().empty());

    h.handshake(*ws);

    const auto frames = ws->written();
    TEST_CHECK(frames.size() == 3);
    TEST_CHECK(frames[0].kind == websocket::FrameKind::Text && frames[0].data == "4first");
    TEST_CHECK(frames[1].kind == websocket::FrameKind::Binary && frames[1].data == std::string("\x00\x01\x02", 3));
    TEST_CHECK(frames[2].kind == websocket::FrameKind::Text && frames[2].data == "4third");

    // raw send only reports text frames
    TEST_CHECK(h.sent_log().size() == 2);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// B3. emit() while Connected
// -----------------------------------------------------------------------------
void test_emit_connected() {
    std::cout << "[TEST] Group B3: emit() while Connected\n";

    test::ConnectionHarness h;
    auto ws = h.open();

    h.connection->emit("hello");
    TEST_CHECK(h.connection->buffered() == 0);

    const auto text = ws->written_text();
    TEST_CHECK(text.size() == 1);
    TEST_CHECK(text[0] == "4hello");

    const auto sent = h.sent_log();
    TEST_CHECK(sent.size() == 1);
    TEST_CHECK(sent[0] == "4hello");

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// B4. emit_binary() while Connected
// -----------------------------------------------------------------------------
void test_emit_binary_connected() {
    std::cout << "[TEST] Group B4: emit_binary() while Connected\n";

    test::ConnectionHarness h;
    auto ws = h.open();

    const std::string blob("\xff\x00\x10", 3);
    h.connection->emit_binary(blob);

    const auto frames = ws->written();
    TEST_CHECK(frames.size() == 1);
    TEST_CHECK(frames[0].kind == websocket::FrameKind::Binary);
    TEST_CHECK(frames[0].data == blob);
    TEST_CHECK(h.sent_log().empty());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// B5. Write failure
// -----------------------------------------------------------------------------
void test_write_failure() {
    std::cout << "[TEST] Group B5: write failure tears the attempt down\n";

    test::ConnectionHarness h;
    auto ws = h.open();

    ws->fail_writes(Error::TransportFailure);
    h.connection->emit("lost?");

    TEST_CHECK(wait_until([&] { return h.disconnects.load() == 1; }));
    TEST_CHECK(h.disconnect_log()[0] == Error::TransportFailure);
    TEST_CHECK(h.sent_log().empty());
    TEST_CHECK(ws->is_closed());

    // Unexpected teardown: reconnection follows
    TEST_CHECK(wait_until([&] { return h.reconnects.load() == 1; }));

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// B6. Failed flush keeps the buffer
// -----------------------------------------------------------------------------
void test_failed_flush_keeps_buffer() {
    std::cout << "[TEST] Group B6: failed flush keeps unsent packets\n";

    test::ConnectionHarness h;
    h.connection->emit("one");
    h.connection->emit("two");

    TEST_CHECK(h.connection->dial() == Error::None);
    auto ws = h.connection->ws();
    ws->fail_writes(Error::RemoteClosed);
    ws->push_text(test::open_packet("s1"));

    TEST_CHECK(wait_until([&] { return h.disconnects.load() == 1; }));
    TEST_CHECK(h.disconnect_log()[0] == Error::RemoteClosed);
    TEST_CHECK(h.connects.load() == 0);
    TEST_CHECK(h.connection->buffered() == 2);

    // Automatic redial, then a healthy handshake drains everything
    TEST_CHECK(wait_until([&] { return h.reconnects.load() == 1; }));
    auto next = h.ws();
    TEST_CHECK(next != ws);
    h.handshake(*next, "s2");

    const auto text = next->written_text();
    TEST_CHECK(text.size() == 2);
    TEST_CHECK(text[0] == "4one");
    TEST_CHECK(text[1] == "4two");
    TEST_CHECK(h.connection->buffered() == 0);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
#include "lcr/log/logger.hpp"

int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Debug);

    test_buffer_before_dial();
    test_buffer_while_opening();
    test_emit_connected();
    test_emit_binary_connected();
    test_write_failure();
    test_failed_flush_keeps_buffer();

    std::cout << "\n[GROUP B - OUTBOUND BUFFER TESTS PASSED]\n";
    return 0;
}
