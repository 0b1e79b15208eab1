/**
 * @file test_event_bus.cpp
 * @brief Tests for subscription, fan-out, handler isolation and per-kind counters.
 */

#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include "harbor/obs/event_bus.hpp"
#include "harbor/util/clock.hpp"

using harbor::obs::BreakerOpened;
using harbor::obs::Event;
using harbor::obs::EventBus;
using harbor::obs::EventKind;
using harbor::obs::event_name;

/**
 * @test Bus_Kind_Filter_And_Unsubscribe
 */
TEST(EventBus, Bus_Kind_Filter_And_Unsubscribe) {
  EventBus bus;
  std::vector<std::string> seen;
  auto tok = bus.subscribe(EventKind::CircuitBreakerOpened, [&](const Event& e) {
    seen.push_back(std::get<BreakerOpened>(e.payload).endpoint_id);
  });
  EXPECT_EQ(bus.subscriber_count(), 1u);

  bus.publish(EventKind::CircuitBreakerOpened, {}, BreakerOpened{"ep-1"});
  bus.publish(EventKind::HealthChanged, {}, std::monostate{});
  ASSERT_EQ(seen.size(), 1u);
  EXPECT_EQ(seen[0], "ep-1");

  EXPECT_TRUE(bus.unsubscribe(tok));
  EXPECT_FALSE(bus.unsubscribe(tok));
  bus.publish(EventKind::CircuitBreakerOpened, {}, BreakerOpened{"ep-2"});
  EXPECT_EQ(seen.size(), 1u);
  EXPECT_EQ(bus.subscriber_count(), 0u);
}

/**
 * @test Bus_Subscribe_All
 */
TEST(EventBus, Bus_Subscribe_All) {
  EventBus bus;
  std::vector<std::string> names;
  (void)bus.subscribe_all([&](const Event& e) { names.emplace_back(e.name()); });

  bus.publish(EventKind::RouteCreated, {}, std::monostate{});
  bus.publish(EventKind::AlertCreated, {}, std::monostate{});
  EXPECT_EQ(names, (std::vector<std::string>{"routeCreated", "alertCreated"}));
}

/**
 * @test Bus_Throwing_Handler_Isolated
 * @brief A throwing subscriber is skipped; later subscribers still run.
 */
TEST(EventBus, Bus_Throwing_Handler_Isolated) {
  EventBus bus;
  int delivered = 0;
  (void)bus.subscribe(EventKind::RequestRecorded, [](const Event&) {
    throw std::runtime_error("boom");
  });
  (void)bus.subscribe(EventKind::RequestRecorded, [&](const Event&) { ++delivered; });

  EXPECT_NO_THROW(bus.publish(EventKind::RequestRecorded, {}, std::monostate{}));
  EXPECT_EQ(delivered, 1);
}

/**
 * @test Bus_Reentrant_Subscribe
 * @brief Handlers may subscribe during delivery; the new one sees later events only.
 */
TEST(EventBus, Bus_Reentrant_Subscribe) {
  EventBus bus;
  int inner = 0;
  bool added = false;
  (void)bus.subscribe(EventKind::ServiceRegistered, [&](const Event&) {
    if (added) return;
    added = true;
    (void)bus.subscribe(EventKind::ServiceRegistered, [&](const Event&) { ++inner; });
  });

  bus.publish(EventKind::ServiceRegistered, {}, std::monostate{});
  EXPECT_EQ(inner, 0);
  bus.publish(EventKind::ServiceRegistered, {}, std::monostate{});
  EXPECT_EQ(inner, 1);
}

/**
 * @test Bus_Counters
 * @brief Counted per kind, with or without subscribers.
 */
TEST(EventBus, Bus_Counters) {
  EventBus bus;
  bus.publish(EventKind::MetricsCollected, {}, std::monostate{});
  bus.publish(EventKind::MetricsCollected, {}, std::monostate{});
  bus.publish(EventKind::LimitsUpdated, {}, std::monostate{});

  EXPECT_EQ(bus.count(EventKind::MetricsCollected), 2u);
  EXPECT_EQ(bus.count(EventKind::LimitsUpdated), 1u);
  EXPECT_EQ(bus.count(EventKind::AlertCreated), 0u);

  const auto all = bus.counters();
  EXPECT_EQ(all[static_cast<std::size_t>(EventKind::MetricsCollected)], 2u);
}

/**
 * @test Bus_Event_Names
 */
TEST(EventBus, Bus_Event_Names) {
  EXPECT_EQ(event_name(EventKind::ServiceRegistered), "serviceRegistered");
  EXPECT_EQ(event_name(EventKind::ServiceDeregistered), "serviceDeregistered");
  EXPECT_EQ(event_name(EventKind::TrafficPolicySet), "trafficPolicySet");
  EXPECT_EQ(event_name(EventKind::CircuitBreakerOpened), "circuitBreakerOpened");
  EXPECT_EQ(event_name(EventKind::AlertAcknowledged), "alertAcknowledged");
  EXPECT_EQ(event_name(EventKind::LimitsUpdated), "limitsUpdated");
}
