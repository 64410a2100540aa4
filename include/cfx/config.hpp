/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file config.hpp
 * @brief Runtime configuration: flat section/key store with pluggable
 *        file-format backends.
 *
 * Every format is flattened to "section + key = value". Backends are CMake
 * opt-ins and compile away when disabled:
 *   - IniBackend  : inih            (CFX_CONFIG_INI_ENABLED)
 *   - JsonBackend : nlohmann/json   (CFX_CONFIG_JSON_ENABLED)
 *   - YamlBackend : fkYAML          (CFX_CONFIG_YAML_ENABLED)
 *
 * Entries may also be set programmatically with ConfigStore::Set(), which is
 * how embedders without any file backend configure pools and groups.
 *
 * @code
 *   cfx::Config<cfx::IniBackend> cfg;
 *   if (cfg.LoadFile("runtime.ini")) {
 *     cfx::ApplyLogConfig(cfg);
 *     auto pool_cfg = cfx::LoadPoolConfig(cfg);
 *   }
 * @endcode
 */

#ifndef CFX_CONFIG_HPP_
#define CFX_CONFIG_HPP_

#include "cfx/log.hpp"
#include "cfx/platform.hpp"
#include "cfx/vocabulary.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>

#include <string>
#include <tuple>

#ifdef CFX_CONFIG_INI_ENABLED
#include "ini.h"
#endif

#ifdef CFX_CONFIG_JSON_ENABLED
#include <nlohmann/json.hpp>
#endif

#ifdef CFX_CONFIG_YAML_ENABLED
#include <fkYAML/node.hpp>
#endif

namespace cfx {

enum class ConfigFormat : uint8_t {
  kAuto = 0,
  kIni,
  kJson,
  kYaml,
};

namespace detail {

inline char AsciiLower(char c) noexcept {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + ('a' - 'A')) : c;
}

inline bool StrCaseEqual(const char* a, const char* b) noexcept {
  for (; *a != '\0' && *b != '\0'; ++a, ++b) {
    if (AsciiLower(*a) != AsciiLower(*b)) return false;
  }
  return *a == *b;
}

inline void CopyBounded(char* dst, const char* src, uint32_t dst_size) noexcept {
  uint32_t i = 0;
  if (src != nullptr) {
    for (; i + 1U < dst_size && src[i] != '\0'; ++i) dst[i] = src[i];
  }
  dst[i] = '\0';
}

}  // namespace detail

// ============================================================================
// Backend tags
// ============================================================================

struct IniBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kIni;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::StrCaseEqual(ext, "ini") || detail::StrCaseEqual(ext, "cfg") ||
           detail::StrCaseEqual(ext, "conf");
  }
};

struct JsonBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kJson;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::StrCaseEqual(ext, "json");
  }
};

struct YamlBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kYaml;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::StrCaseEqual(ext, "yaml") || detail::StrCaseEqual(ext, "yml");
  }
};

// ============================================================================
// ConfigStore
// ============================================================================

#ifndef CFX_CONFIG_MAX_FILE_SIZE
#define CFX_CONFIG_MAX_FILE_SIZE 8192U
#endif

#ifndef CFX_CONFIG_MAX_ENTRIES
#define CFX_CONFIG_MAX_ENTRIES 64U
#endif

/**
 * @brief Fixed-capacity section/key/value table. Lookups are
 *        case-insensitive; setting an existing key overwrites it.
 */
class ConfigStore {
 public:
  static constexpr uint32_t kMaxEntries = CFX_CONFIG_MAX_ENTRIES;
  static constexpr uint32_t kMaxKeyLen = 48;
  static constexpr uint32_t kMaxValueLen = 128;

  expected<void, ConfigError> Set(const char* section, const char* key,
                                  const char* value) {
    CFX_ASSERT(section != nullptr && key != nullptr);
    if (!AddEntry(section, key, value)) {
      return expected<void, ConfigError>::error(ConfigError::kBufferFull);
    }
    return expected<void, ConfigError>::success();
  }

  const char* GetString(const char* section, const char* key,
                        const char* default_val = "") const {
    const Entry* e = FindEntry(section, key);
    return (e != nullptr) ? e->value : default_val;
  }

  int32_t GetInt(const char* section, const char* key, int32_t default_val = 0) const {
    optional<int32_t> v = FindInt(section, key);
    return v.has_value() ? v.value() : default_val;
  }

  uint32_t GetUint(const char* section, const char* key, uint32_t default_val = 0) const {
    optional<int32_t> v = FindInt(section, key);
    if (!v.has_value()) return default_val;
    return (v.value() < 0) ? 0U : static_cast<uint32_t>(v.value());
  }

  bool GetBool(const char* section, const char* key, bool default_val = false) const {
    const Entry* e = FindEntry(section, key);
    return (e != nullptr) ? ParseBool(e->value) : default_val;
  }

  double GetDouble(const char* section, const char* key, double default_val = 0.0) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) return default_val;
    char* end = nullptr;
    double val = std::strtod(e->value, &end);
    return (end == e->value) ? default_val : val;
  }

  optional<int32_t> FindInt(const char* section, const char* key) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) return {};
    char* end = nullptr;
    long val = std::strtol(e->value, &end, 10);
    if (end == e->value) return {};
    return optional<int32_t>(static_cast<int32_t>(val));
  }

  optional<bool> FindBool(const char* section, const char* key) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) return {};
    return optional<bool>(ParseBool(e->value));
  }

  bool HasSection(const char* section) const {
    CFX_ASSERT(section != nullptr);
    for (uint32_t i = 0; i < count_; ++i) {
      if (detail::StrCaseEqual(entries_[i].section, section)) return true;
    }
    return false;
  }

  bool HasKey(const char* section, const char* key) const {
    return FindEntry(section, key) != nullptr;
  }

  uint32_t EntryCount() const noexcept { return count_; }

 protected:
  struct Entry {
    char section[kMaxKeyLen];
    char key[kMaxKeyLen];
    char value[kMaxValueLen];
  };

  bool AddEntry(const char* section, const char* key, const char* value) {
    Entry* e = FindMutable(section, key);
    if (e == nullptr) {
      if (count_ >= kMaxEntries) return false;
      e = &entries_[count_++];
      detail::CopyBounded(e->section, section, kMaxKeyLen);
      detail::CopyBounded(e->key, key, kMaxKeyLen);
    }
    detail::CopyBounded(e->value, value, kMaxValueLen);
    return true;
  }

  static expected<uint32_t, ConfigError> ReadFile(const char* path, char* buf,
                                                  uint32_t buf_size) {
    FILE* f = std::fopen(path, "r");
    if (f == nullptr) {
      return expected<uint32_t, ConfigError>::error(ConfigError::kFileNotFound);
    }
    size_t bytes = std::fread(buf, 1, buf_size - 1U, f);
    (void)std::fclose(f);
    buf[bytes] = '\0';
    return expected<uint32_t, ConfigError>::success(static_cast<uint32_t>(bytes));
  }

  static bool ParseBool(const char* str) noexcept {
    return detail::StrCaseEqual(str, "true") || detail::StrCaseEqual(str, "1") ||
           detail::StrCaseEqual(str, "yes") || detail::StrCaseEqual(str, "on");
  }

  static const char* Extension(const char* path) noexcept {
    const char* dot = std::strrchr(path, '.');
    return (dot != nullptr) ? dot + 1 : nullptr;
  }

  template <typename>
  friend struct ConfigParser;

 private:
  const Entry* FindEntry(const char* section, const char* key) const {
    CFX_ASSERT(section != nullptr && key != nullptr);
    for (uint32_t i = 0; i < count_; ++i) {
      if (detail::StrCaseEqual(entries_[i].section, section) &&
          detail::StrCaseEqual(entries_[i].key, key)) {
        return &entries_[i];
      }
    }
    return nullptr;
  }

  Entry* FindMutable(const char* section, const char* key) {
    return const_cast<Entry*>(FindEntry(section, key));
  }

  Entry entries_[kMaxEntries];
  uint32_t count_ = 0;
};

// ============================================================================
// ConfigParser<Backend>
// ============================================================================

/** Backends that are compiled out report kFormatNotSupported. */
template <typename Backend>
struct ConfigParser {
  static expected<void, ConfigError> ParseFile(ConfigStore&, const char*) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
  static expected<void, ConfigError> ParseBuffer(ConfigStore&, const char*, uint32_t) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
};

#ifdef CFX_CONFIG_INI_ENABLED
template <>
struct ConfigParser<IniBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store, const char* path) {
    int rc = ini_parse(path, OnEntry, &store);
    if (rc == -1) return expected<void, ConfigError>::error(ConfigError::kFileNotFound);
    if (rc != 0) return expected<void, ConfigError>::error(ConfigError::kParseError);
    return expected<void, ConfigError>::success();
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store, const char* data,
                                                 uint32_t) {
    if (ini_parse_string(data, OnEntry, &store) != 0) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static int OnEntry(void* user, const char* section, const char* name,
                     const char* value) {
    auto* store = static_cast<ConfigStore*>(user);
    return store->AddEntry(section != nullptr ? section : "", name != nullptr ? name : "",
                           value != nullptr ? value : "")
               ? 1
               : 0;
  }
};
#endif

#ifdef CFX_CONFIG_JSON_ENABLED
template <>
struct ConfigParser<JsonBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store, const char* path) {
    char buf[CFX_CONFIG_MAX_FILE_SIZE];
    auto r = ConfigStore::ReadFile(path, buf, sizeof(buf));
    if (!r.has_value()) return expected<void, ConfigError>::error(r.get_error());
    return ParseBuffer(store, buf, r.value());
  }

  /// Top-level objects become sections; top-level scalars land in section "".
  static expected<void, ConfigError> ParseBuffer(ConfigStore& store, const char* data,
                                                 uint32_t size) {
    auto root = nlohmann::json::parse(data, data + size, nullptr, false);
    if (root.is_discarded() || !root.is_object()) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    char val[ConfigStore::kMaxValueLen];
    for (auto it = root.begin(); it != root.end(); ++it) {
      if (!it->is_object()) {
        Stringify(*it, val, sizeof(val));
        if (!store.AddEntry("", it.key().c_str(), val)) return Full();
        continue;
      }
      for (auto kit = it->begin(); kit != it->end(); ++kit) {
        Stringify(*kit, val, sizeof(val));
        if (!store.AddEntry(it.key().c_str(), kit.key().c_str(), val)) return Full();
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static expected<void, ConfigError> Full() {
    return expected<void, ConfigError>::error(ConfigError::kBufferFull);
  }

  static void Stringify(const nlohmann::json& n, char* out, uint32_t size) {
    if (n.is_string()) {
      detail::CopyBounded(out, n.get_ref<const std::string&>().c_str(), size);
    } else if (n.is_boolean()) {
      detail::CopyBounded(out, n.get<bool>() ? "true" : "false", size);
    } else if (n.is_number_integer()) {
      (void)std::snprintf(out, size, "%lld", static_cast<long long>(n.get<int64_t>()));
    } else if (n.is_number_float()) {
      (void)std::snprintf(out, size, "%g", n.get<double>());
    } else {
      detail::CopyBounded(out, n.dump().c_str(), size);
    }
  }
};
#endif

#ifdef CFX_CONFIG_YAML_ENABLED
template <>
struct ConfigParser<YamlBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store, const char* path) {
    char buf[CFX_CONFIG_MAX_FILE_SIZE];
    auto r = ConfigStore::ReadFile(path, buf, sizeof(buf));
    if (!r.has_value()) return expected<void, ConfigError>::error(r.get_error());
    return ParseBuffer(store, buf, r.value());
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store, const char* data,
                                                 uint32_t size) {
    auto root = fkyaml::node::deserialize(std::string(data, size));
    if (root.is_null() || !root.is_mapping()) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    char val[ConfigStore::kMaxValueLen];
    for (auto it = root.begin(); it != root.end(); ++it) {
      auto section = it.key().get_value<std::string>();
      auto& node = *it;
      if (!node.is_mapping()) {
        Stringify(node, val, sizeof(val));
        if (!store.AddEntry("", section.c_str(), val)) return Full();
        continue;
      }
      for (auto kit = node.begin(); kit != node.end(); ++kit) {
        auto key = kit.key().get_value<std::string>();
        Stringify(*kit, val, sizeof(val));
        if (!store.AddEntry(section.c_str(), key.c_str(), val)) return Full();
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static expected<void, ConfigError> Full() {
    return expected<void, ConfigError>::error(ConfigError::kBufferFull);
  }

  static void Stringify(const fkyaml::node& n, char* out, uint32_t size) {
    if (n.is_string()) {
      detail::CopyBounded(out, n.get_value<std::string>().c_str(), size);
    } else if (n.is_boolean()) {
      detail::CopyBounded(out, n.get_value<bool>() ? "true" : "false", size);
    } else if (n.is_integer()) {
      (void)std::snprintf(out, size, "%lld",
                          static_cast<long long>(n.get_value<int64_t>()));
    } else if (n.is_float_number()) {
      (void)std::snprintf(out, size, "%g", n.get_value<double>());
    } else {
      out[0] = '\0';
    }
  }
};
#endif

// ============================================================================
// Config<Backends...>
// ============================================================================

template <typename... Backends>
class Config final : public ConfigStore {
  static_assert(sizeof...(Backends) > 0, "Config requires at least one backend");

 public:
  expected<void, ConfigError> LoadFile(const char* path,
                                       ConfigFormat format = ConfigFormat::kAuto) {
    CFX_ASSERT(path != nullptr);
    if (format == ConfigFormat::kAuto) {
      const char* ext = Extension(path);
      format = (ext == nullptr) ? Head::kFormat : Detect<Backends...>(ext);
    }
    auto r = LoadFileAs<Backends...>(path, format);
    if (!r.has_value()) {
      CFX_LOG_WARN("Config", "failed to load %s (error %u)", path,
                   static_cast<unsigned>(r.get_error()));
    }
    return r;
  }

  expected<void, ConfigError> LoadBuffer(const char* data, uint32_t size,
                                         ConfigFormat format) {
    CFX_ASSERT(data != nullptr);
    return LoadBufferAs<Backends...>(data, size, format);
  }

 private:
  using Head = typename std::tuple_element<0, std::tuple<Backends...>>::type;

  template <typename First, typename... Rest>
  expected<void, ConfigError> LoadFileAs(const char* path, ConfigFormat format) {
    if (First::kFormat == format) return ConfigParser<First>::ParseFile(*this, path);
    if constexpr (sizeof...(Rest) > 0) return LoadFileAs<Rest...>(path, format);
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  template <typename First, typename... Rest>
  expected<void, ConfigError> LoadBufferAs(const char* data, uint32_t size,
                                           ConfigFormat format) {
    if (First::kFormat == format) return ConfigParser<First>::ParseBuffer(*this, data, size);
    if constexpr (sizeof...(Rest) > 0) return LoadBufferAs<Rest...>(data, size, format);
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  template <typename First, typename... Rest>
  static ConfigFormat Detect(const char* ext) noexcept {
    if (First::MatchesExtension(ext)) return First::kFormat;
    if constexpr (sizeof...(Rest) > 0) return Detect<Rest...>(ext);
    return Head::kFormat;
  }
};

#ifdef CFX_CONFIG_INI_ENABLED
using IniConfig = Config<IniBackend>;
#endif
#ifdef CFX_CONFIG_JSON_ENABLED
using JsonConfig = Config<JsonBackend>;
#endif
#ifdef CFX_CONFIG_YAML_ENABLED
using YamlConfig = Config<YamlBackend>;
#endif

// ============================================================================
// Log level mapping
// ============================================================================

/// @brief Parse DEBUG/INFO/WARN/ERROR/FATAL/OFF (case-insensitive).
inline optional<log::Level> ParseLogLevel(const char* text) noexcept {
  if (text == nullptr) return {};
  static constexpr struct {
    const char* name;
    log::Level level;
  } kNames[] = {
      {"debug", log::Level::kDebug}, {"info", log::Level::kInfo},
      {"warn", log::Level::kWarn},   {"warning", log::Level::kWarn},
      {"error", log::Level::kError}, {"fatal", log::Level::kFatal},
      {"off", log::Level::kOff},
  };
  for (const auto& n : kNames) {
    if (detail::StrCaseEqual(text, n.name)) return optional<log::Level>(n.level);
  }
  return {};
}

/**
 * @brief Apply "[section] level = ..." to the runtime log level.
 * @return true if a valid level was found and applied.
 */
inline bool ApplyLogConfig(const ConfigStore& store, const char* section = "log") {
  if (!store.HasKey(section, "level")) return false;
  const char* text = store.GetString(section, "level");
  optional<log::Level> level = ParseLogLevel(text);
  if (!level.has_value()) {
    CFX_LOG_WARN("Config", "unknown log level '%s' in [%s]", text, section);
    return false;
  }
  log::SetLevel(level.value());
  return true;
}

}  // namespace cfx

#endif  // CFX_CONFIG_HPP_
