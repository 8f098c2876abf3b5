/**
 * @file test_udp_socket.cpp
 * @brief Unit tests for UDP socket abstraction
 */

#include <gtest/gtest.h>
#include <cozyd/net/udp_socket.hpp>

#include <thread>
#include <chrono>
#include <cstring>

using namespace cozyd::net;

class UdpSocketTest : public ::testing::Test {};

TEST_F(UdpSocketTest, CreateAndClose) {
    UdpSocket socket;
    EXPECT_TRUE(socket.isValid());

    socket.close();
    EXPECT_FALSE(socket.isValid());
}

TEST_F(UdpSocketTest, BindToEphemeralPort) {
    UdpSocket socket;
    ASSERT_TRUE(socket.bind(0, "127.0.0.1"));
    EXPECT_GT(socket.getLocalPort(), 0);
}

TEST_F(UdpSocketTest, SendReceiveLoopback) {
    UdpSocket sender;
    UdpSocket receiver;
    ASSERT_TRUE(receiver.bind(0, "127.0.0.1"));
    uint16_t port = receiver.getLocalPort();

    const char* message = "Hello, UDP!";
    int sent = sender.sendTo(SocketAddress("127.0.0.1", port), message, std::strlen(message));
    EXPECT_EQ(sent, static_cast<int>(std::strlen(message)));

    char buffer[256];
    SocketAddress from;
    int received = receiver.receiveFrom(buffer, sizeof(buffer) - 1, 1000, from);

    ASSERT_GT(received, 0);
    buffer[received] = '\0';
    EXPECT_STREQ(buffer, message);
    EXPECT_EQ(from.ip, "127.0.0.1");
    EXPECT_GT(from.port, 0);
}

TEST_F(UdpSocketTest, ReceiveTimeout) {
    UdpSocket socket;
    ASSERT_TRUE(socket.bind(0, "127.0.0.1"));

    char buffer[256];
    SocketAddress from;

    auto start = std::chrono::steady_clock::now();
    int received = socket.receiveFrom(buffer, sizeof(buffer), 100, from);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    EXPECT_EQ(received, 0);
    EXPECT_GE(elapsed.count(), 90); // Allow some tolerance
}

TEST_F(UdpSocketTest, EnableBroadcast) {
    UdpSocket socket;
    EXPECT_TRUE(socket.setBroadcast(true));
    EXPECT_TRUE(socket.setReuseAddress(true));
}

TEST_F(UdpSocketTest, InvalidDestination) {
    UdpSocket socket;
    EXPECT_EQ(socket.sendTo(SocketAddress("bogus", 6095), "x", 1), -1);
}

TEST_F(UdpSocketTest, SocketAddressToString) {
    SocketAddress addr("192.168.1.2", 6095);
    EXPECT_EQ(addr.toString(), "192.168.1.2:6095");
    EXPECT_EQ(addr, SocketAddress("192.168.1.2", 6095));
}
