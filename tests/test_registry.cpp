/**
 * @file test_registry.cpp
 * @brief Tests for ServiceRegistry RCU semantics, endpoint upsert and health writes.
 *
 * Validates:
 *  - Snapshot publication via atomic_load/store on shared_ptr (RCU pattern)
 *  - upsertEndpoint / removeEndpoint / setHealth behavior
 *  - Heterogeneous lookup with std::string_view keys
 *  - No torn reads under 1 writer / many readers
 */

#include <gtest/gtest.h>
#include <atomic>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "harbor/mesh/endpoint.hpp"
#include "harbor/mesh/service_registry.hpp"

using harbor::mesh::EndpointList;
using harbor::mesh::Health;
using harbor::mesh::RegistryErr;
using harbor::mesh::ServiceEndpoint;
using harbor::mesh::ServiceRegistry;

static ServiceEndpoint ep(std::string id, std::string svc, uint16_t port = 8080) {
  return ServiceEndpoint{.id = std::move(id), .service_name = std::move(svc),
                         .host = "10.0.0.1", .port = port};
}

// --------------------------- Basic construction ----------------------------

/**
 * @test Registry_Construct_Empty
 * @brief Fresh registry publishes a valid empty snapshot.
 */
TEST(ServiceRegistry, Registry_Construct_Empty) {
  ServiceRegistry reg;

  auto snap = reg.snapshot();
  ASSERT_TRUE(snap);
  EXPECT_TRUE(snap->empty());
  EXPECT_EQ(reg.version(), 0u);
}

// --------------------------- Upsert ----------------------------------------

/**
 * @test Registry_Upsert_Creates_Service
 * @brief First endpoint creates the service; list keeps registration order.
 */
TEST(ServiceRegistry, Registry_Upsert_Creates_Service) {
  ServiceRegistry reg;

  auto a = ep("sbx-a", "sandbox", 8080);
  auto b = ep("sbx-b", "sandbox", 8081);
  EXPECT_EQ(reg.upsertEndpoint(a), RegistryErr::Ok);
  EXPECT_EQ(reg.upsertEndpoint(b), RegistryErr::Ok);

  auto snap = reg.snapshot();
  auto it = snap->find(std::string_view{"sandbox"});   // hetero lookup
  ASSERT_NE(it, snap->end());
  ASSERT_EQ(it->second.size(), 2u);
  EXPECT_EQ(it->second[0], a);
  EXPECT_EQ(it->second[1], b);
  EXPECT_EQ(reg.size(), 1u);
  EXPECT_EQ(reg.endpointCount(), 2u);
  EXPECT_EQ(reg.version(), 2u);
}

/**
 * @test Registry_Upsert_Replaces_By_Id
 * @brief Same (service, id) replaces the whole record in place.
 */
TEST(ServiceRegistry, Registry_Upsert_Replaces_By_Id) {
  ServiceRegistry reg;

  (void)reg.upsertEndpoint(ep("sbx-a", "sandbox", 8080));
  (void)reg.upsertEndpoint(ep("sbx-b", "sandbox", 8081));
  auto moved = ep("sbx-a", "sandbox", 9090);
  moved.weight = 5;
  ASSERT_EQ(reg.upsertEndpoint(moved), RegistryErr::Ok);

  auto list = reg.endpoints("sandbox");
  ASSERT_EQ(list.size(), 2u);
  EXPECT_EQ(list[0].id, "sbx-a");
  EXPECT_EQ(list[0].port, 9090);
  EXPECT_EQ(list[0].weight, 5u);
  EXPECT_EQ(list[0].address(), "10.0.0.1:9090");
}

/**
 * @test Registry_Find_Scoped_To_Service
 */
TEST(ServiceRegistry, Registry_Find_Scoped_To_Service) {
  ServiceRegistry reg;
  (void)reg.upsertEndpoint(ep("a1", "alpha"));
  (void)reg.upsertEndpoint(ep("b1", "beta"));

  EXPECT_TRUE(reg.find("alpha", "a1").has_value());
  EXPECT_FALSE(reg.find("alpha", "b1").has_value());
  EXPECT_FALSE(reg.find("gamma", "a1").has_value());

  const std::vector<std::string> expected{"alpha", "beta"};
  EXPECT_EQ(reg.listServices(), expected);
}

// --------------------------- Remove --------------------------------

/**
 * @test Registry_Remove_Last_Forgets_Service
 * @brief Removing the last endpoint erases the service name.
 */
TEST(ServiceRegistry, Registry_Remove_Last_Forgets_Service) {
  ServiceRegistry reg;
  (void)reg.upsertEndpoint(ep("a", "svcX"));
  (void)reg.upsertEndpoint(ep("b", "svcX"));

  auto removed = reg.removeEndpoint("svcX", "a");
  ASSERT_TRUE(removed.has_value());
  EXPECT_EQ(removed->id, "a");
  EXPECT_EQ(reg.listServices(), std::vector<std::string>{"svcX"});

  (void)reg.removeEndpoint("svcX", "b");
  EXPECT_TRUE(reg.listServices().empty());
  EXPECT_EQ(reg.size(), 0u);
  EXPECT_EQ(reg.snapshot()->find(std::string_view{"svcX"}), reg.snapshot()->end());
}

/**
 * @test Registry_Remove_NotFound
 * @brief Removing a missing endpoint leaves snapshot unchanged.
 */
TEST(ServiceRegistry, Registry_Remove_NotFound) {
  ServiceRegistry reg;
  (void)reg.upsertEndpoint(ep("a", "svc"));

  auto before = reg.snapshot();
  const auto v = reg.version();
  EXPECT_FALSE(reg.removeEndpoint("svc", "does_not_exist").has_value());
  EXPECT_FALSE(reg.removeEndpoint("nope", "a").has_value());
  auto after = reg.snapshot();

  EXPECT_EQ(*before, *after);
  EXPECT_EQ(reg.version(), v);
}

// --------------------------- Health writes ---------------------------------

/**
 * @test Registry_SetHealth_Returns_Previous
 * @brief setHealth reports the old value and publishes only on change.
 */
TEST(ServiceRegistry, Registry_SetHealth_Returns_Previous) {
  ServiceRegistry reg;
  (void)reg.upsertEndpoint(ep("a", "svc"));

  auto prev = reg.setHealth("svc", "a", Health::Healthy);
  ASSERT_TRUE(prev.has_value());
  EXPECT_EQ(*prev, Health::Unknown);
  EXPECT_EQ(reg.find("svc", "a")->health, Health::Healthy);

  const auto v = reg.version();
  prev = reg.setHealth("svc", "a", Health::Healthy);
  ASSERT_TRUE(prev.has_value());
  EXPECT_EQ(*prev, Health::Healthy);
  EXPECT_EQ(reg.version(), v);   // no-op write does not publish

  EXPECT_FALSE(reg.setHealth("svc", "missing", Health::Unhealthy).has_value());
  EXPECT_EQ(reg.version(), v);
}

/**
 * @test Registry_Snapshot_Is_Immutable
 * @brief A snapshot taken before a write keeps its old view.
 */
TEST(ServiceRegistry, Registry_Snapshot_Is_Immutable) {
  ServiceRegistry reg;
  (void)reg.upsertEndpoint(ep("a", "svc"));

  auto before = reg.snapshot();
  (void)reg.setHealth("svc", "a", Health::Unhealthy);

  EXPECT_EQ(before->find(std::string_view{"svc"})->second[0].health, Health::Unknown);
  EXPECT_EQ(reg.snapshot()->find(std::string_view{"svc"})->second[0].health, Health::Unhealthy);
}

// --------------------------- Concurrency sanity ----------------------------

/**
 * @test Registry_Concurrency_1W_MR
 * @brief One writer toggles an endpoint's port and health; readers never see a mix.
 *
 * This is a lightweight sanity test (not a full linearizability proof).
 */
TEST(ServiceRegistry, Registry_Concurrency_1W_MR) {
  ServiceRegistry reg;

  auto up = ep("a", "svc", 1000);
  up.health = Health::Healthy;
  auto down = ep("a", "svc", 2000);
  down.health = Health::Unhealthy;
  (void)reg.upsertEndpoint(up);

  std::atomic<bool> running{true};
  std::atomic<int>  ok_reads{0};

  std::thread writer([&]{
    for (int i = 0; i < 4000; ++i) {
      (void)reg.upsertEndpoint((i & 1) == 0 ? down : up);
      if ((i % 32) == 0) std::this_thread::yield();
    }
    running.store(false, std::memory_order_relaxed);
  });

  auto reader_fn = [&]{
    while (running.load(std::memory_order_relaxed)) {
      auto s = reg.snapshot();
      if (!s) continue;
      auto it = s->find(std::string_view{"svc"});
      if (it != s->end() && !it->second.empty()) {
        const auto& e = it->second[0];
        // Port and health were published together; never torn
        if ((e.port == 1000 && e.health == Health::Healthy) ||
            (e.port == 2000 && e.health == Health::Unhealthy)) {
          ok_reads.fetch_add(1, std::memory_order_relaxed);
        } else {
          ADD_FAILURE() << "Observed torn endpoint: port " << e.port;
          break;
        }
      }
      std::this_thread::yield();
    }
  };

  std::thread r1(reader_fn), r2(reader_fn), r3(reader_fn);
  writer.join();
  r1.join(); r2.join(); r3.join();

  EXPECT_GT(ok_reads.load(), 0);
}

// --------------------------- validation guard -------------------------------
/**
 * @test Registry_Validation_Rejections_DoNotPublish
 * @brief Invalid inputs must be rejected without publishing a new snapshot.
 */
TEST(ServiceRegistry, Registry_Validation_Rejections_DoNotPublish) {
  ServiceRegistry reg;

  EXPECT_EQ(reg.upsertEndpoint(ep("", "svc")), RegistryErr::Invalid);
  EXPECT_EQ(reg.upsertEndpoint(ep("a", "")), RegistryErr::Invalid);
  EXPECT_EQ(reg.upsertEndpoint(ep("bad id", "svc")), RegistryErr::Invalid);

  auto no_host = ep("a", "svc");
  no_host.host.clear();
  EXPECT_EQ(reg.upsertEndpoint(no_host), RegistryErr::Invalid);

  EXPECT_TRUE(reg.snapshot()->empty());
  EXPECT_EQ(reg.version(), 0u);

  // Positive control
  EXPECT_EQ(reg.upsertEndpoint(ep("sbx-1.a:b_c", "svc")), RegistryErr::Ok);
  EXPECT_EQ(reg.endpointCount(), 1u);
}
