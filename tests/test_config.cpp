/**
 * @file test_config.cpp
 * @brief Tests for config.hpp and the runtime configuration mappings.
 */

#include "cfx/actor.hpp"
#include "cfx/config.hpp"
#include "cfx/thread_pool.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdio>
#include <cstring>
#include <string>

// ============================================================================
// ConfigStore
// ============================================================================

TEST_CASE("ConfigStore Set and typed getters", "[config]") {
  cfx::ConfigStore store;
  REQUIRE(store.Set("pool", "threads", "4").has_value());
  REQUIRE(store.Set("pool", "name", "compute").has_value());
  REQUIRE(store.Set("pool", "ratio", "0.75").has_value());
  REQUIRE(store.Set("group", "fair", "yes").has_value());
  REQUIRE(store.Set("group", "priority", "-3").has_value());

  REQUIRE(store.EntryCount() == 5U);
  REQUIRE(store.GetInt("pool", "threads") == 4);
  REQUIRE(store.GetUint("pool", "threads") == 4U);
  REQUIRE(std::strcmp(store.GetString("pool", "name"), "compute") == 0);
  REQUIRE(store.GetDouble("pool", "ratio") > 0.7);
  REQUIRE(store.GetBool("group", "fair"));
  REQUIRE(store.GetInt("group", "priority") == -3);
  REQUIRE(store.GetUint("group", "priority", 9U) == 0U);
}

TEST_CASE("ConfigStore defaults for missing keys", "[config]") {
  cfx::ConfigStore store;
  REQUIRE(store.GetInt("x", "y", 11) == 11);
  REQUIRE(std::strcmp(store.GetString("x", "y", "dflt"), "dflt") == 0);
  REQUIRE_FALSE(store.GetBool("x", "y"));
  REQUIRE_FALSE(store.FindInt("x", "y").has_value());
  REQUIRE_FALSE(store.FindBool("x", "y").has_value());
  REQUIRE_FALSE(store.HasSection("x"));
}

TEST_CASE("ConfigStore lookups are case-insensitive and overwrite", "[config]") {
  cfx::ConfigStore store;
  REQUIRE(store.Set("Log", "Level", "info").has_value());
  REQUIRE(store.HasSection("log"));
  REQUIRE(store.HasKey("LOG", "level"));

  REQUIRE(store.Set("log", "level", "error").has_value());
  REQUIRE(store.EntryCount() == 1U);
  REQUIRE(std::strcmp(store.GetString("log", "level"), "error") == 0);
}

TEST_CASE("ConfigStore reports kBufferFull at capacity", "[config]") {
  cfx::ConfigStore store;
  char key[16];
  for (uint32_t i = 0U; i < cfx::ConfigStore::kMaxEntries; ++i) {
    (void)std::snprintf(key, sizeof(key), "k%u", i);
    REQUIRE(store.Set("s", key, "v").has_value());
  }
  auto r = store.Set("s", "overflow", "v");
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == cfx::ConfigError::kBufferFull);

  // Overwriting an existing key still works when full.
  REQUIRE(store.Set("s", "k0", "w").has_value());
}

TEST_CASE("FindInt rejects non-numeric values", "[config]") {
  cfx::ConfigStore store;
  REQUIRE(store.Set("s", "n", "abc").has_value());
  REQUIRE_FALSE(store.FindInt("s", "n").has_value());
  REQUIRE(store.GetInt("s", "n", 5) == 5);
}

// ============================================================================
// Backends
// ============================================================================

struct NullBackend {
  static constexpr cfx::ConfigFormat kFormat = cfx::ConfigFormat::kIni;
  static bool MatchesExtension(const char*) noexcept { return true; }
};

TEST_CASE("Config with a backend that has no parser", "[config]") {
  cfx::Config<NullBackend> cfg;
  const char text[] = "[pool]\nthreads = 2\n";
  auto r = cfg.LoadBuffer(text, sizeof(text) - 1U, cfx::ConfigFormat::kIni);
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == cfx::ConfigError::kFormatNotSupported);

  auto other = cfg.LoadBuffer(text, sizeof(text) - 1U, cfx::ConfigFormat::kJson);
  REQUIRE(other.get_error() == cfx::ConfigError::kFormatNotSupported);
}

#ifdef CFX_CONFIG_INI_ENABLED
TEST_CASE("IniConfig loads sections from a buffer", "[config][ini]") {
  cfx::IniConfig cfg;
  const char text[] =
      "[pool]\n"
      "name = compute\n"
      "threads = 3\n"
      "[log]\n"
      "level = warn\n";
  REQUIRE(cfg.LoadBuffer(text, sizeof(text) - 1U, cfx::ConfigFormat::kIni).has_value());
  REQUIRE(cfg.GetUint("pool", "threads") == 3U);
  REQUIRE(std::strcmp(cfg.GetString("log", "level"), "warn") == 0);
}

TEST_CASE("IniConfig missing file", "[config][ini]") {
  cfx::IniConfig cfg;
  auto r = cfg.LoadFile("/nonexistent/conflux.ini");
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == cfx::ConfigError::kFileNotFound);
}
#endif

#ifdef CFX_CONFIG_JSON_ENABLED
TEST_CASE("JsonConfig flattens top-level objects into sections", "[config][json]") {
  cfx::JsonConfig cfg;
  const char text[] = R"({"group": {"name": "actors", "fair": true, "threads": 2}, "debug": 1})";
  REQUIRE(cfg.LoadBuffer(text, sizeof(text) - 1U, cfx::ConfigFormat::kJson).has_value());
  REQUIRE(std::strcmp(cfg.GetString("group", "name"), "actors") == 0);
  REQUIRE(cfg.GetBool("group", "fair"));
  REQUIRE(cfg.GetInt("group", "threads") == 2);
  REQUIRE(cfg.GetInt("", "debug") == 1);
}

TEST_CASE("JsonConfig rejects malformed input", "[config][json]") {
  cfx::JsonConfig cfg;
  const char text[] = "{not json";
  auto r = cfg.LoadBuffer(text, sizeof(text) - 1U, cfx::ConfigFormat::kJson);
  REQUIRE(r.get_error() == cfx::ConfigError::kParseError);
}
#endif

#ifdef CFX_CONFIG_YAML_ENABLED
TEST_CASE("YamlConfig loads mappings", "[config][yaml]") {
  cfx::YamlConfig cfg;
  const char text[] =
      "pool:\n"
      "  threads: 6\n"
      "  name: yaml-pool\n";
  REQUIRE(cfg.LoadBuffer(text, sizeof(text) - 1U, cfx::ConfigFormat::kYaml).has_value());
  REQUIRE(cfg.GetUint("pool", "threads") == 6U);
  REQUIRE(std::strcmp(cfg.GetString("pool", "name"), "yaml-pool") == 0);
}
#endif

// ============================================================================
// Runtime mappings
// ============================================================================

TEST_CASE("ParseLogLevel accepts known names", "[config]") {
  REQUIRE(cfx::ParseLogLevel("DEBUG").value() == cfx::log::Level::kDebug);
  REQUIRE(cfx::ParseLogLevel("info").value() == cfx::log::Level::kInfo);
  REQUIRE(cfx::ParseLogLevel("Warning").value() == cfx::log::Level::kWarn);
  REQUIRE(cfx::ParseLogLevel("off").value() == cfx::log::Level::kOff);
  REQUIRE_FALSE(cfx::ParseLogLevel("verbose").has_value());
  REQUIRE_FALSE(cfx::ParseLogLevel(nullptr).has_value());
}

TEST_CASE("ApplyLogConfig sets the runtime level", "[config]") {
  const auto prev = cfx::log::GetLevel();
  cfx::ConfigStore store;
  REQUIRE_FALSE(cfx::ApplyLogConfig(store));

  REQUIRE(store.Set("log", "level", "ERROR").has_value());
  REQUIRE(cfx::ApplyLogConfig(store));
  REQUIRE(cfx::log::GetLevel() == cfx::log::Level::kError);

  REQUIRE(store.Set("log", "level", "loud").has_value());
  REQUIRE_FALSE(cfx::ApplyLogConfig(store));
  REQUIRE(cfx::log::GetLevel() == cfx::log::Level::kError);

  cfx::log::SetLevel(prev);
}

TEST_CASE("LoadPoolConfig reads the pool section", "[config]") {
  cfx::ConfigStore store;
  REQUIRE(store.Set("pool", "name", "io").has_value());
  REQUIRE(store.Set("pool", "threads", "3").has_value());
  REQUIRE(store.Set("pool", "priority", "-1").has_value());

  cfx::ThreadPoolConfig cfg = cfx::LoadPoolConfig(store);
  REQUIRE(cfg.name == "io");
  REQUIRE(cfg.threads == 3U);
  REQUIRE(cfg.priority == -1);

  cfx::ThreadPoolConfig dflt = cfx::LoadPoolConfig(store, "missing");
  REQUIRE(dflt.name == "pool");
  REQUIRE(dflt.threads == 0U);
}

TEST_CASE("LoadGroupConfig reads the group section", "[config]") {
  cfx::ConfigStore store;
  REQUIRE(store.Set("group", "name", "actors").has_value());
  REQUIRE(store.Set("group", "threads", "2").has_value());
  REQUIRE(store.Set("group", "fair", "true").has_value());
  REQUIRE(store.Set("group", "timer_slots", "8").has_value());

  cfx::ParallelGroupConfig cfg = cfx::LoadGroupConfig(store);
  REQUIRE(cfg.name == "actors");
  REQUIRE(cfg.threads == 2U);
  REQUIRE(cfg.fair);
  REQUIRE(cfg.timer_slots == 8U);
}
