/**
 * @file NetlinkEvents_uTest.cpp
 * @brief Unit tests for pfrelay::link::NetlinkEventSource notification handling.
 *
 * Notes:
 *  - No socket is opened; track() binds the filter and queue, and messages are
 *    fed through onLinkMessage() as the receive thread would.
 */

#include "src/link/inc/LinkSource.hpp"
#include "src/link/inc/NetlinkEvents.hpp"
#include "src/runtime/inc/CancelScope.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/logger.h>
#include <spdlog/sinks/ringbuffer_sink.h>

using pfrelay::link::NetlinkEventSource;
using pfrelay::link::NotificationQueue;
using pfrelay::runtime::CancelScope;

class NetlinkEventsTest : public ::testing::Test {
protected:
  std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> sink_ =
      std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(256);
  std::shared_ptr<spdlog::logger> log_ = std::make_shared<spdlog::logger>("pfrelay-events", sink_);
  const CancelScope SCOPE;

  void SetUp() override {
    log_->set_pattern("%l %v");
    log_->set_level(spdlog::level::trace);
  }

  std::size_t count(const std::string& text) const {
    const std::vector<std::string> LINES = sink_->last_formatted();
    return static_cast<std::size_t>(std::count_if(
        LINES.begin(), LINES.end(),
        [&text](const std::string& line) { return line.find(text) != std::string::npos; }));
  }
};

/* ----------------------------- Filter Tests ----------------------------- */

/** @test Only tracked indices reach the queue, in arrival order. */
TEST_F(NetlinkEventsTest, ForwardsTrackedOnly) {
  NotificationQueue queue(8);
  NetlinkEventSource events(log_);
  events.track({3, 5}, queue);

  events.onLinkMessage(7);
  events.onLinkMessage(5);
  events.onLinkMessage(1);
  events.onLinkMessage(3);

  EXPECT_EQ(queue.pop(SCOPE), 5);
  EXPECT_EQ(queue.pop(SCOPE), 3);
  EXPECT_EQ(queue.dropped(), 0U);
  EXPECT_EQ(count("link event index=7"), 0U);
}

/** @test Messages before track() are ignored. */
TEST_F(NetlinkEventsTest, UntrackedBeforeStart) {
  NetlinkEventSource events(log_);
  events.onLinkMessage(3);
  EXPECT_EQ(count("link event"), 0U);
}

/* ----------------------------- Overflow Tests ----------------------------- */

/** @test A full queue drops the newest notification with a warning. */
TEST_F(NetlinkEventsTest, DropNewestWarns) {
  NotificationQueue queue(2);
  NetlinkEventSource events(log_);
  events.track({3}, queue);

  events.onLinkMessage(3);
  events.onLinkMessage(3);
  events.onLinkMessage(3);

  EXPECT_EQ(queue.dropped(), 1U);
  EXPECT_EQ(count("notification queue full, dropping link event index=3"), 1U);
}

/** @test An overrun queues every tracked index once. */
TEST_F(NetlinkEventsTest, RequeueAllAfterOverrun) {
  NotificationQueue queue(8);
  NetlinkEventSource events(log_);
  events.track({9, 2, 4}, queue);

  events.requeueAll();

  EXPECT_EQ(queue.pop(SCOPE), 2);
  EXPECT_EQ(queue.pop(SCOPE), 4);
  EXPECT_EQ(queue.pop(SCOPE), 9);
  EXPECT_EQ(queue.dropped(), 0U);
}

/** @test Requeue into a nearly full queue keeps what fits and counts the rest. */
TEST_F(NetlinkEventsTest, RequeueAllRespectsCapacity) {
  NotificationQueue queue(2);
  NetlinkEventSource events(log_);
  events.track({1, 2, 3}, queue);

  events.requeueAll();

  EXPECT_EQ(queue.dropped(), 1U);
  EXPECT_EQ(queue.pop(SCOPE), 1);
  EXPECT_EQ(queue.pop(SCOPE), 2);
}
