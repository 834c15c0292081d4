#include "net/OutboundQueue.h"
#include "net/WebSocketServer.h"

#include <gtest/gtest.h>

TEST(WebSocketServer, QueryParamLookup) {
  EXPECT_EQ(WebSocketServer::queryParam("/ws/transcribe?client_id=abc", "client_id"), "abc");
  EXPECT_EQ(WebSocketServer::queryParam("/ws/transcribe?x=1&client_id=abc&y=2", "client_id"),
            "abc");
  EXPECT_EQ(WebSocketServer::queryParam("/ws/transcribe", "client_id"), "");
  EXPECT_EQ(WebSocketServer::queryParam("/ws/transcribe?client_id", "client_id"), "");
  EXPECT_EQ(WebSocketServer::queryParam("/ws/transcribe?client=abc", "client_id"), "");
}

TEST(OutboundQueue, RefusesBeyondLimitAndKeepsMessageInFlight) {
  OutboundQueue queue(3);
  for (int i = 0; i < 3; ++i)
    EXPECT_TRUE(queue.push(std::make_shared<const std::string>("m" + std::to_string(i))));
  EXPECT_FALSE(queue.push(std::make_shared<const std::string>("m3")));
  EXPECT_EQ(queue.size(), 3u);

  queue.dropPending();
  ASSERT_EQ(queue.size(), 1u);
  EXPECT_EQ(queue.front(), "m0");

  queue.pop();
  EXPECT_TRUE(queue.empty());
  EXPECT_TRUE(queue.push(std::make_shared<const std::string>("again")));
}

TEST(OutboundQueue, ZeroLimitStillCarriesOneMessage) {
  OutboundQueue queue(0);
  EXPECT_EQ(queue.limit(), 1u);
  EXPECT_TRUE(queue.push(std::make_shared<const std::string>("only")));
  EXPECT_FALSE(queue.push(std::make_shared<const std::string>("more")));
}
