// Copyright (c) 2025 lanspeed contributors
// Licensed under the MIT License - see LICENSE file

#include <gtest/gtest.h>
#include <asio.hpp>
#include <chrono>
#include <sstream>
#include <thread>

#include "lanspeed/client/offer_listener.h"
#include "lanspeed/core/message.h"
#include "lanspeed/server/offer_broadcaster.h"

using namespace lanspeed;
using namespace std::chrono_literals;

class OfferDiscoveryTest : public ::testing::Test {
protected:
  void SetUp() override {
    config_.discovery_port = 0;  // OS allocates port
    config_.discovery_timeout = 100ms;
    listener_ = std::make_unique<OfferListener>(config_, logger_, state_, offers_);
    listener_thread_ = std::thread([this]() { listener_->Start(); });
  }

  void TearDown() override {
    listener_->Stop();
    listener_thread_.join();
  }

  void SendToListener(const std::vector<uint8_t>& datagram) {
    asio::io_context io_context;
    asio::ip::udp::socket socket(io_context, asio::ip::udp::v4());
    socket.send_to(asio::buffer(datagram),
                   asio::ip::udp::endpoint(asio::ip::make_address("127.0.0.1"),
                                           listener_->LocalPort()));
  }

  bool WaitForDropped(size_t count, std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
      if (listener_->GetDroppedCount() >= count) return true;
      std::this_thread::sleep_for(5ms);
    }
    return false;
  }

  Config config_;
  std::ostringstream log_;
  Logger logger_{"test", log_, Logger::DEBUG};
  TransferState state_;
  OfferQueue offers_;
  std::unique_ptr<OfferListener> listener_;
  std::thread listener_thread_;
};

TEST_F(OfferDiscoveryTest, QueuesOfferWhenIdle) {
  ASSERT_NE(listener_->LocalPort(), 0);
  SendToListener(EncodeOffer(5002, 5001));

  const auto endpoint = offers_.wait_pop(config_.discovery_timeout * 5);
  ASSERT_TRUE(endpoint.has_value());
  EXPECT_EQ(endpoint->address, "127.0.0.1");
  EXPECT_EQ(endpoint->udp_port, 5002);
  EXPECT_EQ(endpoint->tcp_port, 5001);
}

TEST_F(OfferDiscoveryTest, DropsOfferWhileTransferActive) {
  state_.SetActive(true);
  SendToListener(EncodeOffer(5002, 5001));

  ASSERT_TRUE(WaitForDropped(1, 2s));
  EXPECT_TRUE(offers_.empty());

  state_.SetActive(false);
  SendToListener(EncodeOffer(6002, 6001));
  const auto endpoint = offers_.wait_pop(config_.discovery_timeout * 5);
  ASSERT_TRUE(endpoint.has_value());
  EXPECT_EQ(endpoint->udp_port, 6002);
  EXPECT_TRUE(offers_.empty());
}

TEST_F(OfferDiscoveryTest, IgnoresMalformedDatagrams) {
  SendToListener({0x01, 0x02, 0x03});
  SendToListener(EncodeRequest(1000));
  SendToListener(EncodeOffer(7002, 7001));

  const auto endpoint = offers_.wait_pop(config_.discovery_timeout * 5);
  ASSERT_TRUE(endpoint.has_value());
  EXPECT_EQ(endpoint->udp_port, 7002);
  EXPECT_TRUE(offers_.empty());
  EXPECT_EQ(listener_->GetDroppedCount(), 0u);
}

TEST_F(OfferDiscoveryTest, BroadcasterReachesListener) {
  Config server_config;
  server_config.broadcast_address = "127.0.0.1";
  server_config.discovery_port = listener_->LocalPort();
  server_config.offer_interval = 50ms;

  OfferBroadcaster broadcaster(server_config, logger_, 5002, 5001);
  std::thread broadcaster_thread([&broadcaster]() { broadcaster.Start(); });

  const auto first = offers_.wait_pop(2s);
  const auto second = offers_.wait_pop(2s);

  broadcaster.Stop();
  broadcaster_thread.join();

  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(first->tcp_port, 5001);
  EXPECT_EQ(second->udp_port, 5002);
  EXPECT_GE(broadcaster.GetSentCount(), 2u);
  EXPECT_EQ(broadcaster.GetErrorCount(), 0u);
}

TEST_F(OfferDiscoveryTest, StopEndsListenerWithinOneTick) {
  const auto start = std::chrono::steady_clock::now();
  listener_->Stop();
  listener_thread_.join();
  EXPECT_LT(std::chrono::steady_clock::now() - start, config_.discovery_timeout * 10);
  // TearDown joins again
  listener_thread_ = std::thread([]() {});
}

TEST(ClaimOfferTest, TakesOneOfferAndDiscardsTheRest) {
  OfferQueue offers;
  TransferState state;
  offers.push(ServerEndpoint{"10.0.0.1", 1000, 2000});
  offers.push(ServerEndpoint{"10.0.0.2", 1001, 2001});
  offers.push(ServerEndpoint{"10.0.0.3", 1002, 2002});

  const auto offer = ClaimOffer(offers, state, 10ms);
  ASSERT_TRUE(offer.has_value());
  EXPECT_EQ(offer->address, "10.0.0.1");
  EXPECT_TRUE(state.IsActive());
  EXPECT_TRUE(offers.empty());
}

TEST(ClaimOfferTest, TimesOutWithoutGoingActive) {
  OfferQueue offers;
  TransferState state;
  EXPECT_FALSE(ClaimOffer(offers, state, 10ms).has_value());
  EXPECT_FALSE(state.IsActive());
}
