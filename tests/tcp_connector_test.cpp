#include <gtest/gtest.h>

#include "interrupt_signal.hpp"
#include "tcp_connector.hpp"
#include "test_support.hpp"

TEST(TCPConnector, ConnectsAndSendsExactBytes) {
    LoopbackListener listener;
    ASSERT_NE(listener.port(), 0);

    TCPConnector conn("127.0.0.1", listener.port());
    Result r = conn.open_connection();
    ASSERT_TRUE(r.is_ok()) << r.reason;
    EXPECT_TRUE(conn.is_open());

    int peer = listener.accept();
    ASSERT_GE(peer, 0);

    EXPECT_TRUE(conn.send_all("hello").is_ok());
    conn.close_connection();
    EXPECT_FALSE(conn.is_open());

    std::string got = read_until_eof(peer);
    ::close(peer);
    ASSERT_EQ(got.size(), 5u);
    const unsigned char want[] = {0x68, 0x65, 0x6c, 0x6c, 0x6f};
    for (size_t i = 0; i < got.size(); ++i) {
        EXPECT_EQ(static_cast<unsigned char>(got[i]), want[i]) << "byte " << i;
    }
}

TEST(TCPConnector, ResolvesLocalhost) {
    LoopbackListener listener;
    TCPConnector conn("localhost", listener.port());
    Result r = conn.open_connection();
    EXPECT_TRUE(r.is_ok()) << r.reason;
}

TEST(TCPConnector, RefusedConnectionIsAFailureValue) {
    TCPConnector conn("127.0.0.1", unused_port());
    Result r = conn.open_connection();
    EXPECT_EQ(r.outcome, Outcome::Failure);
    EXPECT_NE(r.reason.find("refused"), std::string::npos) << r.reason;
    EXPECT_FALSE(conn.is_open());
}

TEST(TCPConnector, SendWithoutConnectionFails) {
    TCPConnector conn("127.0.0.1", 1);
    Result r = conn.send_all("x");
    EXPECT_EQ(r.outcome, Outcome::Failure);
    EXPECT_EQ(r.reason, "not connected");
}

TEST(TCPConnector, SecondOpenIsRejected) {
    LoopbackListener listener;
    TCPConnector conn("127.0.0.1", listener.port());
    ASSERT_TRUE(conn.open_connection().is_ok());
    Result r = conn.open_connection();
    EXPECT_EQ(r.outcome, Outcome::Failure);
    EXPECT_TRUE(conn.is_open());
}

TEST(TCPConnector, SendAfterPeerResetFails) {
    LoopbackListener listener;
    TCPConnector conn("127.0.0.1", listener.port());
    ASSERT_TRUE(conn.open_connection().is_ok());

    int peer = listener.accept();
    ASSERT_GE(peer, 0);
    linger lg{1, 0};
    ::setsockopt(peer, SOL_SOCKET, SO_LINGER, &lg, sizeof(lg));
    ::close(peer);   // RST

    pollfd p{};
    p.fd = conn.fd();
    p.events = POLLIN;
    ASSERT_EQ(::poll(&p, 1, 2000), 1);

    Result r = conn.send_all("hello");
    EXPECT_EQ(r.outcome, Outcome::Failure);
    EXPECT_FALSE(r.reason.empty());
}

TEST(TCPConnector, InterruptStopsSendToStalledPeer) {
    ASSERT_TRUE(install_interrupt_handler().is_ok());
    reset_interrupt();

    LoopbackListener listener;
    TCPConnector conn("127.0.0.1", listener.port());
    ASSERT_TRUE(conn.open_connection().is_ok());
    int peer = listener.accept();   // never read from
    ASSERT_GE(peer, 0);

    std::string payload(STALL_PAYLOAD, 'x');
    Result r;
    {
        DelayedInterrupt interrupt(std::chrono::milliseconds(300));
        r = conn.send_all(payload);
    }
    EXPECT_EQ(r.outcome, Outcome::Interrupted);
    EXPECT_TRUE(interrupt_requested());
    EXPECT_TRUE(conn.is_open());

    reset_interrupt();
    ::close(peer);
}
