/**
 * @file test_log.cpp
 * @brief Tests for log.hpp
 */

#include "fluff/log.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <thread>
#include <vector>

TEST_CASE("Log level defaults", "[log]") {
#ifdef NDEBUG
  REQUIRE(fluff::log::GetLevel() == fluff::log::Level::kInfo);
#else
  REQUIRE(fluff::log::GetLevel() == fluff::log::Level::kDebug);
#endif
}

TEST_CASE("Log SetLevel", "[log]") {
  auto prev = fluff::log::GetLevel();
  fluff::log::SetLevel(fluff::log::Level::kError);
  REQUIRE(fluff::log::GetLevel() == fluff::log::Level::kError);
  fluff::log::SetLevel(prev);
}

TEST_CASE("Log Init and Shutdown", "[log]") {
  REQUIRE(!fluff::log::IsInitialized());
  fluff::log::Init();
  REQUIRE(fluff::log::IsInitialized());
  fluff::log::Shutdown();
  REQUIRE(!fluff::log::IsInitialized());
}

TEST_CASE("Log macros compile and run", "[log]") {
  fluff::log::SetLevel(fluff::log::Level::kDebug);
  FLUFF_LOG_DEBUG("Codec", "frame %u bytes", 4U);
  FLUFF_LOG_INFO("Session", "connected to %s", "AA:BB:CC:DD:EE:FF");
  FLUFF_LOG_WARN("Registry", "dropped");
  FLUFF_LOG_ERROR("Upload", "job %u: %s", 1U, "Stalled");
  REQUIRE(true);
}

TEST_CASE("Log runtime level filtering", "[log]") {
  fluff::log::SetLevel(fluff::log::Level::kOff);
  FLUFF_LOG_DEBUG("Test", "should not appear");
  FLUFF_LOG_ERROR("Test", "should not appear");
  fluff::log::SetLevel(fluff::log::Level::kDebug);
  REQUIRE(true);
}

TEST_CASE("Log with very long message", "[log]") {
  fluff::log::SetLevel(fluff::log::Level::kDebug);
  std::string long_msg(2 * FLUFF_LOG_LINE_MAX, 'x');
  FLUFF_LOG_INFO("Test", "%s", long_msg.c_str());
  REQUIRE(true);
}

TEST_CASE("Log from concurrent threads", "[log][thread]") {
  fluff::log::SetLevel(fluff::log::Level::kWarn);
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([t]() {
      for (int i = 0; i < 50; ++i) {
        FLUFF_LOG_WARN("Test", "thread %d line %d", t, i);
      }
    });
  }
  for (auto& th : threads) th.join();
  fluff::log::SetLevel(fluff::log::Level::kDebug);
  REQUIRE(true);
}
