#pragma once

#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <vector>

#include "msgforge/common.hpp"

namespace msgforge {

struct KatexOptions {
  bool dollar_syntax{false};
  bool parenthesis_syntax{true};
};

struct MarkdownOptions {
  bool enabled{true};
  bool colors{true};
  bool emoticons{true};
  std::vector<std::string> custom_domains;
  std::optional<KatexOptions> katex{KatexOptions{}};
};

struct BadWordsOptions {
  bool enabled{false};
  std::vector<std::string> words;
  std::vector<std::string> whitelist;
};

struct QuoteOptions {
  int chain_limit{2};
  std::string site_url{"http://localhost:3000"};
  bool use_real_name{false};
};

struct StreamingLinkOptions {
  bool enabled{true};
  std::vector<std::string> hosts{"open.spotify.com", "play.spotify.com"};
  bool fetch_metadata{false};
};

struct ValidationOptions {
  int max_message_size{5000};
  int freshness_tolerance_s{60};
  bool validate_edited_messages{false};
};

// One immutable, internally consistent version of every pipeline parameter.
struct ConfigSnapshot {
  uint64_t version{0};
  MarkdownOptions markdown{};
  BadWordsOptions bad_words{};
  QuoteOptions quotes{};
  StreamingLinkOptions streaming{};
  ValidationOptions validation{};
  bool read_receipts{false};
};

namespace settings_keys {
inline constexpr const char* kBadWordsEnabled = "Message_AllowBadWordsFilter";
inline constexpr const char* kBadWordsList = "Message_BadWordsFilterList";
inline constexpr const char* kBadWordsWhitelist = "Message_BadWordsWhitelist";
inline constexpr const char* kQuoteChainLimit = "Message_QuoteChainLimit";
inline constexpr const char* kSiteUrl = "Site_Url";
inline constexpr const char* kUseRealName = "UI_Use_Real_Name";
inline constexpr const char* kHexColorPreview = "HexColorPreview_Enabled";
inline constexpr const char* kCustomDomains = "Message_CustomDomain_AutoLink";
inline constexpr const char* kKatexEnabled = "Katex_Enabled";
inline constexpr const char* kKatexDollar = "Katex_Dollar_Syntax";
inline constexpr const char* kKatexParenthesis = "Katex_Parenthesis_Syntax";
inline constexpr const char* kStreamingEnabled = "Message_StreamingLinks_Enabled";
inline constexpr const char* kStreamingHosts = "Message_StreamingLinks_Hosts";
inline constexpr const char* kStreamingFetchMetadata = "Message_StreamingLinks_FetchMetadata";
inline constexpr const char* kMaxAllowedSize = "Message_MaxAllowedSize";
inline constexpr const char* kFreshnessTolerance = "Message_FreshnessTolerance_Seconds";
inline constexpr const char* kValidateEdited = "Message_ValidateEditedMessages";
inline constexpr const char* kReadReceipts = "Message_Read_Receipt_Enabled";
}  // namespace settings_keys

inline json default_settings_json() {
  using namespace settings_keys;
  return json{
      {kBadWordsEnabled, false},
      {kBadWordsList, ""},
      {kBadWordsWhitelist, ""},
      {kQuoteChainLimit, 2},
      {kSiteUrl, "http://localhost:3000"},
      {kUseRealName, false},
      {kHexColorPreview, true},
      {kCustomDomains, ""},
      {kKatexEnabled, true},
      {kKatexDollar, false},
      {kKatexParenthesis, true},
      {kStreamingEnabled, true},
      {kStreamingHosts, "open.spotify.com,play.spotify.com"},
      {kStreamingFetchMetadata, false},
      {kMaxAllowedSize, 5000},
      {kFreshnessTolerance, 60},
      {kValidateEdited, false},
      {kReadReceipts, false},
  };
}

inline std::vector<std::string> pipeline_setting_keys() {
  std::vector<std::string> keys;
  const json defaults = default_settings_json();
  for (auto it = defaults.begin(); it != defaults.end(); ++it) {
    keys.push_back(it.key());
  }
  return keys;
}

inline bool markdown_parser_disabled_by_env() {
  const char* v = std::getenv("MSGFORGE_DISABLE_MESSAGE_PARSER");
  if (!v) {
    return false;
  }
  const std::string s = to_lower(trim(v));
  return s == "yes" || s == "true";
}

namespace detail {

inline bool setting_bool(const json& values, const char* key, bool fallback) {
  if (!values.contains(key)) {
    return fallback;
  }
  const json& v = values[key];
  if (v.is_boolean()) {
    return v.get<bool>();
  }
  if (v.is_number_integer()) {
    return v.get<long long>() != 0;
  }
  if (v.is_string()) {
    const std::string s = to_lower(trim(v.get<std::string>()));
    return s == "true" || s == "yes" || s == "1";
  }
  return fallback;
}

inline int int_out_of_range(const char* key, int fallback) {
  Logger::log(Logger::Level::kWarn, std::string("Setting out of range, using default: ") + key,
              json{{"default", fallback}});
  return fallback;
}

inline int setting_int(const json& values, const char* key, int fallback) {
  if (!values.contains(key)) {
    return fallback;
  }
  const json& v = values[key];
  constexpr auto kLo = std::numeric_limits<int>::min();
  constexpr auto kHi = std::numeric_limits<int>::max();
  if (v.is_number_unsigned()) {
    const auto n = v.get<uint64_t>();
    return n <= static_cast<uint64_t>(kHi) ? static_cast<int>(n) : int_out_of_range(key, fallback);
  }
  if (v.is_number_integer()) {
    const auto n = v.get<int64_t>();
    return n >= kLo && n <= kHi ? static_cast<int>(n) : int_out_of_range(key, fallback);
  }
  if (v.is_number_float()) {
    const double d = v.get<double>();
    if (!std::isfinite(d) || d < static_cast<double>(kLo) || d > static_cast<double>(kHi)) {
      return int_out_of_range(key, fallback);
    }
    return static_cast<int>(d);
  }
  if (v.is_string()) {
    try {
      return std::stoi(trim(v.get<std::string>()));
    } catch (const std::exception&) {
      return fallback;
    }
  }
  return fallback;
}

inline std::string setting_string(const json& values, const char* key, const std::string& fallback) {
  if (!values.contains(key) || !values[key].is_string()) {
    return fallback;
  }
  return values[key].get<std::string>();
}

}  // namespace detail

// Builds a snapshot from a full set of setting values. Missing or mistyped
// keys fall back to the defaults.
inline ConfigSnapshot build_snapshot(const json& values, uint64_t version,
                                     bool parser_enabled = !markdown_parser_disabled_by_env()) {
  using namespace settings_keys;
  using detail::setting_bool;
  using detail::setting_int;
  using detail::setting_string;

  ConfigSnapshot cfg{};
  cfg.version = version;

  cfg.markdown.enabled = parser_enabled;
  cfg.markdown.colors = setting_bool(values, kHexColorPreview, cfg.markdown.colors);
  cfg.markdown.emoticons = true;
  cfg.markdown.custom_domains = split_csv(setting_string(values, kCustomDomains, ""));
  if (setting_bool(values, kKatexEnabled, true)) {
    KatexOptions katex;
    katex.dollar_syntax = setting_bool(values, kKatexDollar, katex.dollar_syntax);
    katex.parenthesis_syntax = setting_bool(values, kKatexParenthesis, katex.parenthesis_syntax);
    cfg.markdown.katex = katex;
  } else {
    cfg.markdown.katex.reset();
  }

  cfg.bad_words.enabled = setting_bool(values, kBadWordsEnabled, false);
  if (cfg.bad_words.enabled) {
    cfg.bad_words.words = split_csv(setting_string(values, kBadWordsList, ""));
    cfg.bad_words.whitelist = split_csv(setting_string(values, kBadWordsWhitelist, ""));
  }

  cfg.quotes.chain_limit = setting_int(values, kQuoteChainLimit, cfg.quotes.chain_limit);
  cfg.quotes.site_url = trim(setting_string(values, kSiteUrl, cfg.quotes.site_url));
  cfg.quotes.use_real_name = setting_bool(values, kUseRealName, cfg.quotes.use_real_name);

  cfg.streaming.enabled = setting_bool(values, kStreamingEnabled, cfg.streaming.enabled);
  if (values.contains(kStreamingHosts)) {
    cfg.streaming.hosts.clear();
    for (const auto& h : split_csv(setting_string(values, kStreamingHosts, ""))) {
      cfg.streaming.hosts.push_back(to_lower(h));
    }
  }
  cfg.streaming.fetch_metadata = setting_bool(values, kStreamingFetchMetadata, cfg.streaming.fetch_metadata);

  cfg.validation.max_message_size = setting_int(values, kMaxAllowedSize, cfg.validation.max_message_size);
  cfg.validation.freshness_tolerance_s =
      (std::max)(0, setting_int(values, kFreshnessTolerance, cfg.validation.freshness_tolerance_s));
  cfg.validation.validate_edited_messages =
      setting_bool(values, kValidateEdited, cfg.validation.validate_edited_messages);

  cfg.read_receipts = setting_bool(values, kReadReceipts, false);
  return cfg;
}

// Reads a flat JSON object of settings and merges it over the defaults.
inline json load_settings_file(const fs::path& path) {
  json merged = default_settings_json();
  const std::string raw = read_text_file(path);
  if (raw.empty()) {
    return merged;
  }

  try {
    const json root = json::parse(raw);
    if (!root.is_object()) {
      Logger::log(Logger::Level::kWarn, "Settings file is not a JSON object: " + path.string());
      return merged;
    }
    for (auto it = root.begin(); it != root.end(); ++it) {
      merged[it.key()] = it.value();
    }
  } catch (const std::exception& e) {
    Logger::log(Logger::Level::kWarn, std::string("Failed to parse settings: ") + e.what());
  }
  return merged;
}

}  // namespace msgforge
