/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "utils/bounded_channel.hpp"

#include <thread>

#include <gtest/gtest.h>

using conductor::BoundedChannel;
using conductor::WaitForSingleObject;
using namespace std::chrono_literals;

/**
 * @given a channel of capacity 2
 * @when a producer sends more values than fit
 * @then the consumer receives all of them in order
 */
TEST(BoundedChannelTest, KeepsOrderUnderBackpressure) {
  BoundedChannel<int> channel{2};
  std::thread producer([&] {
    for (int i = 0; i < 100; ++i) {
      ASSERT_TRUE(channel.send(i));
      EXPECT_LE(channel.size(), channel.capacity());
    }
    channel.close();
  });

  std::vector<int> received;
  while (auto value = channel.receive()) {
    received.push_back(*value);
  }
  producer.join();

  ASSERT_EQ(received.size(), 100);
  for (int i = 0; i < 100; ++i) {
    EXPECT_EQ(received[i], i);
  }
  EXPECT_TRUE(channel.isDrained());
}

/**
 * @given a closed channel holding a value
 * @when values are sent and received
 * @then sending fails, the buffered value is still received
 */
TEST(BoundedChannelTest, CloseKeepsBufferedValues) {
  BoundedChannel<int> channel{4};
  ASSERT_TRUE(channel.send(7));
  channel.close();
  EXPECT_FALSE(channel.send(8));
  EXPECT_TRUE(channel.isClosed());
  EXPECT_FALSE(channel.isDrained());
  EXPECT_EQ(channel.tryReceive(), 7);
  EXPECT_FALSE(channel.tryReceive().has_value());
  EXPECT_FALSE(channel.receive().has_value());
  EXPECT_TRUE(channel.isDrained());
}

/**
 * @given a producer blocked on a full channel
 * @when the channel is closed
 * @then the producer is released
 */
TEST(BoundedChannelTest, CloseReleasesBlockedProducer) {
  BoundedChannel<int> channel{1};
  ASSERT_TRUE(channel.send(1));
  std::thread producer([&] { EXPECT_FALSE(channel.send(2)); });
  std::this_thread::sleep_for(20ms);
  channel.close();
  producer.join();
  EXPECT_EQ(channel.size(), 1);
}

/**
 * @given two channels sharing one readiness object
 * @when either channel gets a value
 * @then the readiness object is signalled
 */
TEST(BoundedChannelTest, SharedReadiness) {
  auto readiness = std::make_shared<WaitForSingleObject>();
  BoundedChannel<int> soft{4, readiness};
  BoundedChannel<int> firm{4, readiness};

  EXPECT_FALSE(readiness->wait(1ms));
  ASSERT_TRUE(firm.send(1));
  EXPECT_TRUE(readiness->wait(1s));
  ASSERT_TRUE(soft.send(2));
  EXPECT_TRUE(readiness->wait(1s));
  soft.close();
  EXPECT_TRUE(readiness->wait(1s));
}
