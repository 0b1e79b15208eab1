/**
 * @file test_load_balancer.cpp
 * @brief Tests for healthy-only selection, weighted convergence and degraded strategies.
 */

#include <gtest/gtest.h>
#include <map>
#include <memory>
#include <string>

#include "harbor/mesh/load_balancer.hpp"
#include "harbor/util/random.hpp"

using harbor::mesh::EndpointList;
using harbor::mesh::Health;
using harbor::mesh::LbStrategy;
using harbor::mesh::LoadBalancer;
using harbor::mesh::ServiceEndpoint;
using harbor::util::Random;

static ServiceEndpoint healthy(std::string id, uint32_t weight = 100) {
  return ServiceEndpoint{.id = std::move(id), .service_name = "svc", .host = "10.0.0.1",
                         .port = 80, .health = Health::Healthy, .weight = weight};
}

static LoadBalancer make_lb(uint64_t seed = 7) {
  return LoadBalancer(std::make_shared<Random>(seed));
}

/**
 * @test LB_Empty_Or_All_Unhealthy
 * @brief No healthy endpoint → nullopt for every strategy.
 */
TEST(LoadBalancer, LB_Empty_Or_All_Unhealthy) {
  auto lb = make_lb();
  EndpointList none;
  EXPECT_FALSE(lb.select(none, LbStrategy::Weighted).has_value());

  EndpointList sick{healthy("a"), healthy("b")};
  sick[0].health = Health::Unhealthy;
  sick[1].health = Health::Unknown;
  for (auto s : {LbStrategy::Weighted, LbStrategy::RoundRobin,
                 LbStrategy::LeastConnections, LbStrategy::IpHash}) {
    EXPECT_FALSE(lb.select(sick, s).has_value()) << harbor::mesh::to_string(s);
  }
}

/**
 * @test LB_Never_Selects_Unhealthy
 */
TEST(LoadBalancer, LB_Never_Selects_Unhealthy) {
  auto lb = make_lb();
  EndpointList eps{healthy("up"), healthy("down", 1000)};
  eps[1].health = Health::Unhealthy;

  for (int i = 0; i < 500; ++i) {
    auto w = lb.select(eps, LbStrategy::Weighted);
    auto r = lb.select(eps, LbStrategy::RoundRobin);
    ASSERT_TRUE(w && r);
    EXPECT_EQ(w->id, "up");
    EXPECT_EQ(r->id, "up");
  }
}

/**
 * @test LB_Weighted_Converges_To_Ratio
 * @brief 1:3 weights → the heavy endpoint gets 70–80% of 10,000 draws.
 */
TEST(LoadBalancer, LB_Weighted_Converges_To_Ratio) {
  auto lb = make_lb(42);
  EndpointList eps{healthy("light", 1), healthy("heavy", 3)};

  std::map<std::string, int> hits;
  for (int i = 0; i < 10000; ++i) {
    auto e = lb.select(eps, LbStrategy::Weighted);
    ASSERT_TRUE(e.has_value());
    ++hits[e->id];
  }
  const double share = hits["heavy"] / 10000.0;
  EXPECT_GT(share, 0.70);
  EXPECT_LT(share, 0.80);
}

/**
 * @test LB_Weighted_Zero_Weight_Never_Selected
 */
TEST(LoadBalancer, LB_Weighted_Zero_Weight_Never_Selected) {
  auto lb = make_lb();
  EndpointList eps{healthy("zero", 0), healthy("one", 1)};
  for (int i = 0; i < 1000; ++i) {
    auto e = lb.select(eps, LbStrategy::Weighted);
    ASSERT_TRUE(e.has_value());
    EXPECT_EQ(e->id, "one");
  }

  EndpointList all_zero{healthy("z1", 0), healthy("z2", 0)};
  EXPECT_FALSE(lb.select(all_zero, LbStrategy::Weighted).has_value());
  // Other strategies ignore weights.
  EXPECT_TRUE(lb.select(all_zero, LbStrategy::RoundRobin).has_value());
}

/**
 * @test LB_RoundRobin_Covers_All
 * @brief Random approximation still spreads load over every healthy endpoint.
 */
TEST(LoadBalancer, LB_RoundRobin_Covers_All) {
  auto lb = make_lb(3);
  EndpointList eps{healthy("a"), healthy("b"), healthy("c")};

  std::map<std::string, int> hits;
  for (int i = 0; i < 3000; ++i) ++hits[lb.select(eps, LbStrategy::RoundRobin)->id];
  ASSERT_EQ(hits.size(), 3u);
  for (const auto& [id, n] : hits) EXPECT_GT(n, 800) << id;
}

/**
 * @test LB_Degraded_Strategies_Pick_First_Healthy
 */
TEST(LoadBalancer, LB_Degraded_Strategies_Pick_First_Healthy) {
  auto lb = make_lb();
  EndpointList eps{healthy("a"), healthy("b"), healthy("c")};
  eps[0].health = Health::Unhealthy;

  EXPECT_EQ(lb.select(eps, LbStrategy::LeastConnections)->id, "b");
  EXPECT_EQ(lb.select(eps, LbStrategy::IpHash)->id, "b");
}

/**
 * @test LB_Same_Seed_Same_Sequence
 */
TEST(LoadBalancer, LB_Same_Seed_Same_Sequence) {
  auto a = make_lb(99);
  auto b = make_lb(99);
  EndpointList eps{healthy("x", 2), healthy("y", 5), healthy("z", 1)};
  for (int i = 0; i < 200; ++i) {
    EXPECT_EQ(a.select(eps, LbStrategy::Weighted)->id, b.select(eps, LbStrategy::Weighted)->id);
  }
}

/**
 * @test LB_Strategy_Names
 */
TEST(LoadBalancer, LB_Strategy_Names) {
  using harbor::mesh::parse_strategy;
  EXPECT_EQ(parse_strategy("weighted"), LbStrategy::Weighted);
  EXPECT_EQ(parse_strategy("round_robin"), LbStrategy::RoundRobin);
  EXPECT_EQ(parse_strategy("least_connections"), LbStrategy::LeastConnections);
  EXPECT_EQ(parse_strategy("ip_hash"), LbStrategy::IpHash);
  EXPECT_FALSE(parse_strategy("random").has_value());
}
