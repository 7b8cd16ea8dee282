/**
 * @file test_settings.cpp
 * @brief Tests for settings.hpp - config keys onto runtime options.
 */

#include "fluff/settings.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstring>

TEST_CASE("ParseLogLevel names", "[settings]") {
  REQUIRE(fluff::ParseLogLevel("debug").value() == fluff::log::Level::kDebug);
  REQUIRE(fluff::ParseLogLevel("INFO").value() == fluff::log::Level::kInfo);
  REQUIRE(fluff::ParseLogLevel("warning").value() == fluff::log::Level::kWarn);
  REQUIRE(fluff::ParseLogLevel("Error").value() == fluff::log::Level::kError);
  REQUIRE(fluff::ParseLogLevel("off").value() == fluff::log::Level::kOff);
  REQUIRE_FALSE(fluff::ParseLogLevel("loud").has_value());
  REQUIRE_FALSE(fluff::ParseLogLevel(nullptr).has_value());
}

TEST_CASE("ApplySettings sets the log level", "[settings]") {
  const auto prev = fluff::log::GetLevel();
  fluff::Settings s;
  s.log_level = fluff::log::Level::kWarn;
  fluff::ApplySettings(s);
  REQUIRE(fluff::log::GetLevel() == fluff::log::Level::kWarn);
  fluff::log::SetLevel(prev);
}

#ifdef FLUFF_CONFIG_INI_ENABLED

namespace {

fluff::expected<void, fluff::ConfigError> Load(const char* text,
                                               fluff::Settings& out) {
  fluff::IniConfig cfg;
  auto r = cfg.LoadBuffer(text, static_cast<uint32_t>(std::strlen(text)),
                          fluff::ConfigFormat::kIni);
  REQUIRE(r.has_value());
  return fluff::LoadSettings(cfg, out);
}

}  // namespace

TEST_CASE("LoadSettings: empty config keeps defaults", "[settings]") {
  fluff::Settings s;
  REQUIRE(Load("", s).has_value());
  REQUIRE(s.session.keepalive_interval_ms == 3000U);
  REQUIRE(s.session.name_filter == "Furby");
  REQUIRE(s.address.empty());
  REQUIRE(s.upload_slot == fluff::kDefaultUploadSlot);
  REQUIRE(s.upload.filename == "UPLOAD.DLC");
  REQUIRE(s.upload.enable_ack);
  REQUIRE(s.log_level == fluff::log::Level::kInfo);
}

TEST_CASE("LoadSettings: full file", "[settings]") {
  const char* text =
      "[session]\n"
      "keepalive_interval_ms = 0\n"
      "scan_timeout_ms = 2500\n"
      "name_filter = Furby Connect\n"
      "[connect]\n"
      "address = aa:bb:cc:dd:ee:ff\n"
      "timeout_ms = 8000\n"
      "retries = 5\n"
      "retry_delay_ms = 250\n"
      "[upload]\n"
      "slot = 4\n"
      "filename = SONG.DLC\n"
      "enable_ack = false\n"
      "activate = yes\n"
      "chunk_delay_ms = 2\n"
      "max_unacked_chunks = 8\n"
      "completion_timeout_ms = 30000\n"
      "[log]\n"
      "level = debug\n";

  fluff::Settings s;
  REQUIRE(Load(text, s).has_value());
  REQUIRE(s.session.keepalive_interval_ms == 0U);
  REQUIRE(s.session.scan_timeout_ms == 2500U);
  REQUIRE(s.session.name_filter == "Furby Connect");
  REQUIRE(s.address == "aa:bb:cc:dd:ee:ff");
  REQUIRE(s.connect.timeout_ms == 8000U);
  REQUIRE(s.connect.retries == 5U);
  REQUIRE(s.connect.retry_delay_ms == 250U);
  REQUIRE(s.upload_slot == 4U);
  REQUIRE(s.upload.filename == "SONG.DLC");
  REQUIRE_FALSE(s.upload.enable_ack);
  REQUIRE(s.upload.activate);
  REQUIRE(s.upload.chunk_delay_ms == 2U);
  REQUIRE(s.upload.max_unacked_chunks == 8U);
  REQUIRE(s.upload.completion_timeout_ms == 30000U);
  REQUIRE(s.log_level == fluff::log::Level::kDebug);
}

TEST_CASE("LoadSettings: out-of-range retries rejected", "[settings]") {
  fluff::Settings s;
  auto zero = Load("[connect]\nretries = 0\n", s);
  REQUIRE_FALSE(zero.has_value());
  REQUIRE(zero.get_error() == fluff::ConfigError::kInvalidValue);

  auto eleven = Load("[connect]\nretries = 11\n", s);
  REQUIRE_FALSE(eleven.has_value());
}

TEST_CASE("LoadSettings: invalid values rejected", "[settings]") {
  fluff::Settings s;
  REQUIRE_FALSE(Load("[connect]\naddress = not-an-address\n", s).has_value());
  REQUIRE_FALSE(Load("[upload]\nslot = 256\n", s).has_value());
  REQUIRE_FALSE(Load("[upload]\nfilename = WAY_TOO_LONG_NAME.DLC\n", s)
                    .has_value());
  REQUIRE_FALSE(Load("[log]\nlevel = chatty\n", s).has_value());
}

TEST_CASE("LoadSettings: empty address means discovery", "[settings]") {
  fluff::Settings s;
  s.address.assign(fluff::TruncateToCapacity, "AA:BB:CC:DD:EE:FF");
  REQUIRE(Load("[connect]\naddress =\n", s).has_value());
  REQUIRE(s.address.empty());
}

#endif  // FLUFF_CONFIG_INI_ENABLED
