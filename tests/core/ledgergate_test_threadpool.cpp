// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// Tests for the ThreadPool that runs HTTP handlers

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

#include <ledgergate/core/thread_pool.hpp>

#include <atomic>
#include <chrono>
#include <future>
#include <thread>

using namespace ledgergate::core;
using namespace std::chrono_literals;

TEST_CASE("ThreadPool runs every queued task", "[threadpool]")
{
  ledgergate::test::initializeTestLogging();
  std::atomic<int> done{0};
  {
    ThreadPool pool(2, 4);
    for (int i = 0; i < 100; ++i)
    {
      pool.enqueue([&done]() { ++done; });
    }
    pool.shutdown();
  }
  REQUIRE(done == 100);
}

TEST_CASE("ThreadPool grows up to the maximum under load", "[threadpool]")
{
  ThreadPool pool(1, 4, 1s, 64);
  std::promise<void> release;
  std::shared_future<void> gate = release.get_future().share();
  std::atomic<int> running{0};

  for (int i = 0; i < 4; ++i)
  {
    pool.enqueue(
      [&running, gate]()
      {
        ++running;
        gate.wait();
      });
  }

  auto deadline = std::chrono::steady_clock::now() + 5s;
  while (running < 4 && std::chrono::steady_clock::now() < deadline)
  {
    std::this_thread::sleep_for(10ms);
  }
  REQUIRE(running == 4);
  REQUIRE(pool.getTotalThreadCount() == 4);
  release.set_value();
}

TEST_CASE("ThreadPool refuses work when the queue is full", "[threadpool]")
{
  ThreadPool pool(1, 1, 60s, 1);
  std::promise<void> release;
  std::shared_future<void> gate = release.get_future().share();
  std::promise<void> started;

  pool.enqueue(
    [gate, &started]()
    {
      started.set_value();
      gate.wait();
    });
  started.get_future().wait();

  REQUIRE(pool.tryEnqueue([]() {}));
  REQUIRE_FALSE(pool.tryEnqueue([]() {}));
  REQUIRE_THROWS_AS(pool.enqueue([]() {}), std::runtime_error);
  release.set_value();
}

TEST_CASE("ThreadPool refuses work after shutdown", "[threadpool]")
{
  ThreadPool pool(1, 2);
  pool.shutdown();
  pool.shutdown();
  REQUIRE_FALSE(pool.tryEnqueue([]() {}));
  REQUIRE_THROWS_WITH(pool.enqueue([]() {}), "ThreadPool is shutting down");
}

TEST_CASE("ThreadPool reports task exceptions and keeps running", "[threadpool]")
{
  std::atomic<int> errors{0};
  std::atomic<int> done{0};
  {
    ThreadPool pool(1, 1, 60s, 16, [&errors](std::exception_ptr) { ++errors; });
    pool.enqueue([]() { throw std::runtime_error("handler failed"); });
    pool.enqueue([&done]() { ++done; });
    pool.shutdown();
  }
  REQUIRE(errors == 1);
  REQUIRE(done == 1);
}
