/**
 * @file test_health_checker.cpp
 * @brief Tests for probe → registry health writes, change callbacks and failure handling.
 */

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "harbor/mesh/health_checker.hpp"
#include "harbor/mesh/service_registry.hpp"

using namespace std::chrono_literals;
using harbor::mesh::FunctionProbe;
using harbor::mesh::Health;
using harbor::mesh::HealthChecker;
using harbor::mesh::HealthProbe;
using harbor::mesh::ServiceEndpoint;
using harbor::mesh::ServiceRegistry;

static void add(ServiceRegistry& reg, const std::string& id) {
  ASSERT_EQ(reg.upsertEndpoint(ServiceEndpoint{.id = id, .service_name = "svc", .host = "h", .port = 1}),
            harbor::mesh::RegistryErr::Ok);
}

/**
 * @test Health_Probe_Results_Written_And_Reported
 */
TEST(HealthChecker, Health_Probe_Results_Written_And_Reported) {
  ServiceRegistry reg;
  add(reg, "up");
  add(reg, "down");

  std::vector<std::pair<std::string, Health>> changes;
  HealthChecker hc(reg,
                   std::make_shared<FunctionProbe>([](const ServiceEndpoint& ep) { return ep.id == "up"; }),
                   1h,
                   [&](const ServiceEndpoint& ep, Health previous) {
                     EXPECT_EQ(previous, Health::Unknown);
                     changes.emplace_back(ep.id, ep.health);
                   });

  EXPECT_EQ(hc.run_once(), 2u);
  EXPECT_EQ(reg.find("svc", "up")->health, Health::Healthy);
  EXPECT_EQ(reg.find("svc", "down")->health, Health::Unhealthy);
  ASSERT_EQ(changes.size(), 2u);

  // Second pass: nothing changes, no callbacks.
  EXPECT_EQ(hc.run_once(), 0u);
  EXPECT_EQ(changes.size(), 2u);
}

/**
 * @test Health_Probe_Exception_Counts_As_Unhealthy
 */
TEST(HealthChecker, Health_Probe_Exception_Counts_As_Unhealthy) {
  ServiceRegistry reg;
  add(reg, "boom");
  add(reg, "fine");

  HealthChecker hc(reg,
                   std::make_shared<FunctionProbe>([](const ServiceEndpoint& ep) -> bool {
                     if (ep.id == "boom") throw std::runtime_error("connection refused");
                     return true;
                   }),
                   1h, nullptr);

  EXPECT_EQ(hc.run_once(), 2u);
  EXPECT_EQ(reg.find("svc", "boom")->health, Health::Unhealthy);
  EXPECT_EQ(reg.find("svc", "fine")->health, Health::Healthy);
}

/**
 * @test Health_Recovery_Reported_With_Previous
 */
TEST(HealthChecker, Health_Recovery_Reported_With_Previous) {
  ServiceRegistry reg;
  add(reg, "a");
  bool healthy = false;
  Health last_previous = Health::Unknown;

  HealthChecker hc(reg,
                   std::make_shared<FunctionProbe>([&](const ServiceEndpoint&) { return healthy; }),
                   1h,
                   [&](const ServiceEndpoint&, Health previous) { last_previous = previous; });

  (void)hc.run_once();
  healthy = true;
  EXPECT_EQ(hc.run_once(), 1u);
  EXPECT_EQ(last_previous, Health::Unhealthy);
  EXPECT_EQ(reg.find("svc", "a")->health, Health::Healthy);
}

/**
 * @test Health_Null_Probe_Rejected
 * @brief Construction fails instead of leaving endpoints unknown forever.
 */
TEST(HealthChecker, Health_Null_Probe_Rejected) {
  ServiceRegistry reg;
  add(reg, "a");
  EXPECT_THROW(HealthChecker(reg, nullptr, 1h, nullptr), std::invalid_argument);
  EXPECT_EQ(reg.find("svc", "a")->health, Health::Unknown);
}

/**
 * @test Health_Periodic_Start_Stop
 * @brief The background tick probes on its own and stop() joins cleanly.
 */
TEST(HealthChecker, Health_Periodic_Start_Stop) {
  ServiceRegistry reg;
  add(reg, "a");
  std::atomic<int> probes{0};

  HealthChecker hc(reg,
                   std::make_shared<FunctionProbe>([&](const ServiceEndpoint&) {
                     probes.fetch_add(1, std::memory_order_relaxed);
                     return true;
                   }),
                   5ms, nullptr);

  hc.start();
  EXPECT_TRUE(hc.running());
  for (int i = 0; i < 400 && probes.load() < 2; ++i) std::this_thread::sleep_for(5ms);
  hc.stop();
  EXPECT_FALSE(hc.running());
  EXPECT_GE(probes.load(), 2);
  EXPECT_EQ(reg.find("svc", "a")->health, Health::Healthy);

  const int after = probes.load();
  std::this_thread::sleep_for(30ms);
  EXPECT_EQ(probes.load(), after);
}
