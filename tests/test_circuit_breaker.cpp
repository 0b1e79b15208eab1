/**
 * @file test_circuit_breaker.cpp
 * @brief Tests for the breaker state machine (closed → open → half-open → closed) and table.
 */

#include <gtest/gtest.h>
#include <chrono>

#include "harbor/mesh/circuit_breaker.hpp"
#include "harbor/util/clock.hpp"

using namespace std::chrono_literals;
using harbor::mesh::Admission;
using harbor::mesh::BreakerState;
using harbor::mesh::CircuitBreaker;
using harbor::mesh::CircuitBreakerParams;
using harbor::mesh::CircuitBreakerTable;
using harbor::mesh::Transition;
using harbor::util::ManualClock;

static CircuitBreakerParams params(uint32_t threshold = 5, uint32_t quota = 3) {
  CircuitBreakerParams p;
  p.threshold = threshold;
  p.open_duration = 60s;
  p.half_open_quota = quota;
  return p;
}

/**
 * @test CB_Full_Cycle
 * @brief 5 failures open; rejected for 60 s; probe half-opens; 3 successes close.
 */
TEST(CircuitBreaker, CB_Full_Cycle) {
  ManualClock clock;
  CircuitBreaker cb("sbx-1", params());

  for (int i = 0; i < 4; ++i) {
    EXPECT_EQ(cb.record_failure(clock.now()), Transition::None);
  }
  EXPECT_EQ(cb.state(), BreakerState::Closed);
  EXPECT_EQ(cb.record_failure(clock.now()), Transition::Opened);
  EXPECT_EQ(cb.state(), BreakerState::Open);
  EXPECT_EQ(cb.snapshot().next_attempt_time, clock.now() + 60s);

  clock.advance(59s);
  EXPECT_EQ(cb.admit(clock.now()), Admission::Rejected);

  clock.advance(1s);
  EXPECT_EQ(cb.admit(clock.now()), Admission::Probing);
  EXPECT_EQ(cb.state(), BreakerState::HalfOpen);
  EXPECT_EQ(cb.admit(clock.now()), Admission::Allowed);

  EXPECT_EQ(cb.record_success(), Transition::None);
  EXPECT_EQ(cb.record_success(), Transition::None);
  EXPECT_EQ(cb.record_success(), Transition::Closed);
  EXPECT_EQ(cb.state(), BreakerState::Closed);
  EXPECT_EQ(cb.snapshot().failure_count, 0u);
  EXPECT_EQ(cb.snapshot().success_count, 0u);
}

/**
 * @test CB_HalfOpen_Failure_Reopens
 */
TEST(CircuitBreaker, CB_HalfOpen_Failure_Reopens) {
  ManualClock clock;
  CircuitBreaker cb("sbx-1", params(1));

  EXPECT_EQ(cb.record_failure(clock.now()), Transition::Opened);
  clock.advance(60s);
  ASSERT_EQ(cb.admit(clock.now()), Admission::Probing);
  EXPECT_EQ(cb.record_success(), Transition::None);

  clock.advance(5s);
  EXPECT_EQ(cb.record_failure(clock.now()), Transition::Reopened);
  EXPECT_EQ(cb.state(), BreakerState::Open);
  EXPECT_EQ(cb.snapshot().next_attempt_time, clock.now() + 60s);
  EXPECT_EQ(cb.admit(clock.now()), Admission::Rejected);
}

/**
 * @test CB_Closed_Success_Resets_Failures
 */
TEST(CircuitBreaker, CB_Closed_Success_Resets_Failures) {
  ManualClock clock;
  CircuitBreaker cb("sbx-1", params());

  for (int i = 0; i < 4; ++i) (void)cb.record_failure(clock.now());
  (void)cb.record_success();
  EXPECT_EQ(cb.snapshot().failure_count, 0u);
  for (int i = 0; i < 4; ++i) (void)cb.record_failure(clock.now());
  EXPECT_EQ(cb.state(), BreakerState::Closed);
}

/**
 * @test CB_Failures_While_Open_Do_Not_Extend
 * @brief Late failures while open count but do not move the retry time.
 */
TEST(CircuitBreaker, CB_Failures_While_Open_Do_Not_Extend) {
  ManualClock clock;
  CircuitBreaker cb("sbx-1", params(1));
  (void)cb.record_failure(clock.now());
  const auto retry = cb.snapshot().next_attempt_time;

  clock.advance(10s);
  EXPECT_EQ(cb.record_failure(clock.now()), Transition::None);
  EXPECT_EQ(cb.snapshot().next_attempt_time, retry);
  EXPECT_EQ(cb.snapshot().last_failure_time, clock.now());
}

/**
 * @test CB_Force_Open_And_Closed
 */
TEST(CircuitBreaker, CB_Force_Open_And_Closed) {
  ManualClock clock;
  CircuitBreaker cb("sbx-1", params());
  (void)cb.record_failure(clock.now());

  cb.force(BreakerState::Open, clock.now());
  EXPECT_EQ(cb.state(), BreakerState::Open);
  EXPECT_EQ(cb.snapshot().next_attempt_time, clock.now() + 60s);

  cb.force(BreakerState::Closed, clock.now());
  EXPECT_EQ(cb.state(), BreakerState::Closed);
  EXPECT_EQ(cb.snapshot().failure_count, 0u);
}

// --------------------------- Table -----------------------------------------

/**
 * @test CB_Table_Creates_With_Route_Params_On_Admit
 */
TEST(CircuitBreakerTable, CB_Table_Creates_With_Route_Params_On_Admit) {
  ManualClock clock;
  CircuitBreakerTable table(params(5));

  EXPECT_EQ(table.admit("a", params(2), clock.now()), Admission::Allowed);
  EXPECT_EQ(table.record("a", false, clock.now()), Transition::None);
  EXPECT_EQ(table.record("a", false, clock.now()), Transition::Opened);   // route threshold 2

  // Unseen endpoint gets the defaults.
  for (int i = 0; i < 4; ++i) EXPECT_EQ(table.record("b", false, clock.now()), Transition::None);
  EXPECT_EQ(table.record("b", false, clock.now()), Transition::Opened);
}

/**
 * @test CB_Table_Admit_Adopts_Route_Params
 * @brief A breaker opened under defaults takes the route's shorter window on admission.
 */
TEST(CircuitBreakerTable, CB_Table_Admit_Adopts_Route_Params) {
  ManualClock clock;
  CircuitBreakerTable table(params());
  for (int i = 0; i < 5; ++i) (void)table.record("a", false, clock.now());
  const auto opened_at = clock.now();

  CircuitBreakerParams fast = params();
  fast.open_duration = 1000ms;
  clock.advance(500ms);
  EXPECT_EQ(table.admit("a", fast, clock.now()), Admission::Rejected);
  EXPECT_EQ(table.get("a")->next_attempt_time, opened_at + 1000ms);

  clock.advance(501ms);
  EXPECT_EQ(table.admit("a", fast, clock.now()), Admission::Probing);

  CircuitBreakerParams one = params(5, 1);
  EXPECT_EQ(table.admit("a", one, clock.now()), Admission::Allowed);
  EXPECT_EQ(table.record("a", true, clock.now()), Transition::Closed);
}

/**
 * @test CB_Table_Force_Rules
 */
TEST(CircuitBreakerTable, CB_Table_Force_Rules) {
  ManualClock clock;
  CircuitBreakerTable table(params());

  EXPECT_FALSE(table.force("missing", BreakerState::Open, clock.now()));
  (void)table.record("a", true, clock.now());
  EXPECT_FALSE(table.force("a", BreakerState::HalfOpen, clock.now()));
  EXPECT_TRUE(table.force("a", BreakerState::Open, clock.now()));
  EXPECT_EQ(table.admit("a", params(), clock.now()), Admission::Rejected);

  auto st = table.get("a");
  ASSERT_TRUE(st.has_value());
  EXPECT_EQ(st->state, BreakerState::Open);
}

/**
 * @test CB_Table_Snapshot_Sorted
 */
TEST(CircuitBreakerTable, CB_Table_Snapshot_Sorted) {
  ManualClock clock;
  CircuitBreakerTable table(params());
  (void)table.record("c", true, clock.now());
  (void)table.record("a", true, clock.now());
  (void)table.record("b", false, clock.now());

  auto all = table.snapshot();
  ASSERT_EQ(all.size(), 3u);
  EXPECT_EQ(all[0].endpoint_id, "a");
  EXPECT_EQ(all[1].endpoint_id, "b");
  EXPECT_EQ(all[1].failure_count, 1u);
  EXPECT_EQ(all[2].endpoint_id, "c");

  EXPECT_TRUE(table.erase("b"));
  EXPECT_FALSE(table.erase("b"));
  EXPECT_EQ(table.snapshot().size(), 2u);
}

/**
 * @test CB_State_Names
 */
TEST(CircuitBreaker, CB_State_Names) {
  EXPECT_EQ(harbor::mesh::to_string(BreakerState::Closed), "closed");
  EXPECT_EQ(harbor::mesh::to_string(BreakerState::Open), "open");
  EXPECT_EQ(harbor::mesh::to_string(BreakerState::HalfOpen), "half-open");
}
