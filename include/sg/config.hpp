/**
 * @file config.hpp
 * @brief Engine settings store with INI / JSON / YAML loaders.
 *
 * Every format is flattened to "section.key = value" text entries kept in a
 * fixed-capacity ConfigStore. Loaders are composed at compile time:
 *   - IniBackend  : inih           (SG_CONFIG_INI_ENABLED)
 *   - JsonBackend : nlohmann/json  (SG_CONFIG_JSON_ENABLED)
 *   - YamlBackend : fkYAML         (SG_CONFIG_YAML_ENABLED)
 *
 * Nested objects deeper than one level are ignored: the engine only reads
 * `[section] key = value` pairs. Values set later (another file, Set()) win,
 * which is how command-line overrides are layered over a file.
 *
 * Usage:
 * @code
 *   sg::MultiConfig cfg;
 *   if (!cfg.LoadFile("engine.yaml")) { ... }
 *   cfg.Set("run", "concurrency_limit", "16");
 *   auto engine = sg::LoadEngineConfig(cfg);
 * @endcode
 */

#ifndef SG_CONFIG_HPP_
#define SG_CONFIG_HPP_

#include "sg/log.hpp"
#include "sg/platform.hpp"
#include "sg/vocabulary.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>

#include <string>
#include <tuple>

#ifdef SG_CONFIG_INI_ENABLED
#include <ini.h>
#endif

#ifdef SG_CONFIG_JSON_ENABLED
#include <nlohmann/json.hpp>
#endif

#ifdef SG_CONFIG_YAML_ENABLED
#include <fkYAML/node.hpp>
#endif

namespace sg {

enum class ConfigFormat : uint8_t {
  kAuto = 0,
  kIni,
  kJson,
  kYaml,
};

namespace detail {

inline char AsciiLower(char c) noexcept {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

inline bool EqualsNoCase(const char* a, const char* b) noexcept {
  for (; *a != '\0' && *b != '\0'; ++a, ++b) {
    if (AsciiLower(*a) != AsciiLower(*b)) {
      return false;
    }
  }
  return *a == *b;
}

inline const char* FileExtension(const char* path) noexcept {
  const char* dot = nullptr;
  for (const char* p = path; *p != '\0'; ++p) {
    if (*p == '.') {
      dot = p + 1;
    } else if (*p == '/') {
      dot = nullptr;
    }
  }
  return dot;
}

/// @brief Slurp a file; empty result with kFileNotFound if it cannot be opened.
inline expected<std::string, ConfigError> ReadTextFile(const char* path) {
  FILE* f = std::fopen(path, "rb");
  if (f == nullptr) {
    return expected<std::string, ConfigError>::error(ConfigError::kFileNotFound);
  }
  std::string text;
  char chunk[1024];
  size_t n = 0U;
  while ((n = std::fread(chunk, 1U, sizeof(chunk), f)) > 0U) {
    text.append(chunk, n);
  }
  std::fclose(f);
  return expected<std::string, ConfigError>::success(std::move(text));
}

}  // namespace detail

// ============================================================================
// Backend tags
// ============================================================================

struct IniBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kIni;
  static constexpr const char* kName = "ini";
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::EqualsNoCase(ext, "ini") || detail::EqualsNoCase(ext, "conf");
  }
};

struct JsonBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kJson;
  static constexpr const char* kName = "json";
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::EqualsNoCase(ext, "json");
  }
};

struct YamlBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kYaml;
  static constexpr const char* kName = "yaml";
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::EqualsNoCase(ext, "yaml") || detail::EqualsNoCase(ext, "yml");
  }
};

// ============================================================================
// ConfigStore
// ============================================================================

/**
 * @brief Flat, case-insensitive (section, key) -> text value table.
 *
 * Getters never fail: a missing or malformed value yields the default.
 * Find*() variants distinguish "absent" from "present".
 */
class ConfigStore {
 public:
  static constexpr uint32_t kMaxEntries = 64U;
  static constexpr uint32_t kNameLen = 47U;
  static constexpr uint32_t kValueLen = 127U;

  const char* GetString(const char* section, const char* key,
                        const char* default_val = "") const {
    const Entry* e = FindEntry(section, key);
    return (e != nullptr) ? e->value.c_str() : default_val;
  }

  int32_t GetInt(const char* section, const char* key, int32_t default_val = 0) const {
    optional<int32_t> v = FindInt(section, key);
    return v.has_value() ? v.value() : default_val;
  }

  uint32_t GetUint(const char* section, const char* key, uint32_t default_val = 0U) const {
    optional<int32_t> v = FindInt(section, key);
    return (v.has_value() && v.value() >= 0) ? static_cast<uint32_t>(v.value()) : default_val;
  }

  bool GetBool(const char* section, const char* key, bool default_val = false) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) {
      return default_val;
    }
    const char* s = e->value.c_str();
    if (detail::EqualsNoCase(s, "true") || detail::EqualsNoCase(s, "yes") ||
        detail::EqualsNoCase(s, "on") || detail::EqualsNoCase(s, "1")) {
      return true;
    }
    if (detail::EqualsNoCase(s, "false") || detail::EqualsNoCase(s, "no") ||
        detail::EqualsNoCase(s, "off") || detail::EqualsNoCase(s, "0")) {
      return false;
    }
    return default_val;
  }

  /// @brief Integer value, empty if absent or not a whole base-10 int32.
  optional<int32_t> FindInt(const char* section, const char* key) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr || e->value.empty()) {
      return optional<int32_t>();
    }
    char* end = nullptr;
    errno = 0;
    long long v = std::strtoll(e->value.c_str(), &end, 10);
    if (errno != 0 || *end != '\0' || v < INT32_MIN || v > INT32_MAX) {
      return optional<int32_t>();
    }
    return optional<int32_t>(static_cast<int32_t>(v));
  }

  optional<const char*> FindString(const char* section, const char* key) const {
    const Entry* e = FindEntry(section, key);
    return (e != nullptr) ? optional<const char*>(e->value.c_str()) : optional<const char*>();
  }

  bool HasSection(const char* section) const {
    for (uint32_t i = 0U; i < count_; ++i) {
      if (detail::EqualsNoCase(entries_[i].section.c_str(), section)) {
        return true;
      }
    }
    return false;
  }

  bool HasKey(const char* section, const char* key) const {
    return FindEntry(section, key) != nullptr;
  }

  uint32_t EntryCount() const noexcept { return count_; }

  void Clear() noexcept { count_ = 0U; }

  /**
   * @brief Insert or overwrite one value. Over-long text is truncated.
   * @return false if the store is full.
   */
  bool Set(const char* section, const char* key, const char* value) {
    SG_ASSERT(section != nullptr && key != nullptr);
    Entry* e = FindEntry(section, key);
    if (e == nullptr) {
      if (count_ >= kMaxEntries) {
        SG_LOG_WARN("Config", "store full, dropping [%s] %s", section, key);
        return false;
      }
      e = &entries_[count_++];
      e->section.assign(TruncateToCapacity, section);
      e->key.assign(TruncateToCapacity, key);
    }
    e->value.assign(TruncateToCapacity, value != nullptr ? value : "");
    return true;
  }

 private:
  struct Entry {
    FixedString<kNameLen> section;
    FixedString<kNameLen> key;
    FixedString<kValueLen> value;
  };

  const Entry* FindEntry(const char* section, const char* key) const {
    for (uint32_t i = 0U; i < count_; ++i) {
      if (detail::EqualsNoCase(entries_[i].section.c_str(), section) &&
          detail::EqualsNoCase(entries_[i].key.c_str(), key)) {
        return &entries_[i];
      }
    }
    return nullptr;
  }

  Entry* FindEntry(const char* section, const char* key) {
    return const_cast<Entry*>(static_cast<const ConfigStore*>(this)->FindEntry(section, key));
  }

  Entry entries_[kMaxEntries];
  uint32_t count_{0U};
};

// ============================================================================
// ConfigParser<Backend>
// ============================================================================

/// @brief Primary template: the backend is not compiled in.
template <typename Backend>
struct ConfigParser {
  static expected<void, ConfigError> ParseText(ConfigStore&, const std::string&) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
};

#ifdef SG_CONFIG_INI_ENABLED
template <>
struct ConfigParser<IniBackend> {
  static expected<void, ConfigError> ParseText(ConfigStore& store, const std::string& text) {
    int line = ini_parse_string(text.c_str(), &OnEntry, &store);
    if (line != 0) {
      SG_LOG_WARN("Config", "ini: error at line %d", line);
      return expected<void, ConfigError>::error(line > 0 ? ConfigError::kParseError
                                                         : ConfigError::kBufferFull);
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static int OnEntry(void* user, const char* section, const char* name, const char* value) {
    return static_cast<ConfigStore*>(user)->Set(section, name, value) ? 1 : 0;
  }
};
#endif

#ifdef SG_CONFIG_JSON_ENABLED
template <>
struct ConfigParser<JsonBackend> {
  static expected<void, ConfigError> ParseText(ConfigStore& store, const std::string& text) {
    nlohmann::json root = nlohmann::json::parse(text, nullptr, false);
    if (root.is_discarded() || !root.is_object()) {
      SG_LOG_WARN("Config", "json: document is not an object");
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    for (auto sec = root.begin(); sec != root.end(); ++sec) {
      if (!sec->is_object()) {
        if (!store.Set("", sec.key().c_str(), Scalar(*sec).c_str())) {
          return expected<void, ConfigError>::error(ConfigError::kBufferFull);
        }
        continue;
      }
      for (auto kv = sec->begin(); kv != sec->end(); ++kv) {
        if (kv->is_structured()) {
          continue;
        }
        if (!store.Set(sec.key().c_str(), kv.key().c_str(), Scalar(*kv).c_str())) {
          return expected<void, ConfigError>::error(ConfigError::kBufferFull);
        }
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static std::string Scalar(const nlohmann::json& node) {
    return node.is_string() ? node.get<std::string>() : node.dump();
  }
};
#endif

#ifdef SG_CONFIG_YAML_ENABLED
template <>
struct ConfigParser<YamlBackend> {
  static expected<void, ConfigError> ParseText(ConfigStore& store, const std::string& text) {
    fkyaml::node root = fkyaml::node::deserialize(text);
    if (!root.is_mapping()) {
      SG_LOG_WARN("Config", "yaml: document is not a mapping");
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    for (auto sec = root.begin(); sec != root.end(); ++sec) {
      std::string sec_name = sec.key().get_value<std::string>();
      if (!sec->is_mapping()) {
        if (!store.Set("", sec_name.c_str(), Scalar(*sec).c_str())) {
          return expected<void, ConfigError>::error(ConfigError::kBufferFull);
        }
        continue;
      }
      for (auto kv = sec->begin(); kv != sec->end(); ++kv) {
        if (kv->is_mapping() || kv->is_sequence()) {
          continue;
        }
        std::string key = kv.key().get_value<std::string>();
        if (!store.Set(sec_name.c_str(), key.c_str(), Scalar(*kv).c_str())) {
          return expected<void, ConfigError>::error(ConfigError::kBufferFull);
        }
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static std::string Scalar(const fkyaml::node& node) {
    if (node.is_string()) {
      return node.get_value<std::string>();
    }
    if (node.is_boolean()) {
      return node.get_value<bool>() ? "true" : "false";
    }
    if (node.is_integer()) {
      return std::to_string(node.get_value<int64_t>());
    }
    if (node.is_float_number()) {
      return std::to_string(node.get_value<double>());
    }
    return std::string();
  }
};
#endif

// ============================================================================
// Config<Backends...>
// ============================================================================

/**
 * @brief ConfigStore plus file/text loaders for the listed backends.
 *
 * With ConfigFormat::kAuto the backend is picked by file extension, falling
 * back to the first listed backend.
 */
template <typename... Backends>
class Config final : public ConfigStore {
  static_assert(sizeof...(Backends) > 0, "Config requires at least one backend");

 public:
  expected<void, ConfigError> LoadFile(const char* path, ConfigFormat format = ConfigFormat::kAuto) {
    SG_ASSERT(path != nullptr);
    expected<std::string, ConfigError> text = detail::ReadTextFile(path);
    if (!text.has_value()) {
      SG_LOG_WARN("Config", "cannot open %s", path);
      return expected<void, ConfigError>::error(text.get_error());
    }
    if (format == ConfigFormat::kAuto) {
      const char* ext = detail::FileExtension(path);
      format = (ext != nullptr) ? PickByExtension<Backends...>(ext) : Head::kFormat;
    }
    expected<void, ConfigError> r = Parse<Backends...>(text.value(), format);
    if (r.has_value()) {
      SG_LOG_INFO("Config", "loaded %s (%u entries)", path, EntryCount());
    }
    return r;
  }

  expected<void, ConfigError> LoadText(const std::string& text, ConfigFormat format) {
    if (format == ConfigFormat::kAuto) {
      format = Head::kFormat;
    }
    return Parse<Backends...>(text, format);
  }

 private:
  using Head = typename std::tuple_element<0, std::tuple<Backends...>>::type;

  template <typename First, typename... Rest>
  expected<void, ConfigError> Parse(const std::string& text, ConfigFormat format) {
    if (First::kFormat == format) {
      return ConfigParser<First>::ParseText(*this, text);
    }
    if constexpr (sizeof...(Rest) > 0) {
      return Parse<Rest...>(text, format);
    }
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  template <typename First, typename... Rest>
  static ConfigFormat PickByExtension(const char* ext) noexcept {
    if (First::MatchesExtension(ext)) {
      return First::kFormat;
    }
    if constexpr (sizeof...(Rest) > 0) {
      return PickByExtension<Rest...>(ext);
    }
    return Head::kFormat;
  }
};

#ifdef SG_CONFIG_INI_ENABLED
using IniConfig = Config<IniBackend>;
#endif
#ifdef SG_CONFIG_JSON_ENABLED
using JsonConfig = Config<JsonBackend>;
#endif
#ifdef SG_CONFIG_YAML_ENABLED
using YamlConfig = Config<YamlBackend>;
#endif

#if defined(SG_CONFIG_INI_ENABLED) && defined(SG_CONFIG_JSON_ENABLED) && \
    defined(SG_CONFIG_YAML_ENABLED)
using MultiConfig = Config<IniBackend, JsonBackend, YamlBackend>;
#elif defined(SG_CONFIG_INI_ENABLED) && defined(SG_CONFIG_JSON_ENABLED)
using MultiConfig = Config<IniBackend, JsonBackend>;
#elif defined(SG_CONFIG_INI_ENABLED) && defined(SG_CONFIG_YAML_ENABLED)
using MultiConfig = Config<IniBackend, YamlBackend>;
#elif defined(SG_CONFIG_JSON_ENABLED) && defined(SG_CONFIG_YAML_ENABLED)
using MultiConfig = Config<JsonBackend, YamlBackend>;
#elif defined(SG_CONFIG_INI_ENABLED)
using MultiConfig = IniConfig;
#elif defined(SG_CONFIG_JSON_ENABLED)
using MultiConfig = JsonConfig;
#elif defined(SG_CONFIG_YAML_ENABLED)
using MultiConfig = YamlConfig;
#endif

}  // namespace sg

#endif  // SG_CONFIG_HPP_
