#pragma once

#include <regex>
#include <string>
#include <vector>

#include "msgforge/common.hpp"

namespace msgforge {

struct UrlMatch {
  std::size_t pos{0};
  std::string url;
};

inline std::string trim_url_tail(std::string url) {
  while (!url.empty()) {
    const char c = url.back();
    if (c == '.' || c == ',' || c == ';' || c == ':' || c == '!' || c == '?' || c == ')' || c == ']' ||
        c == '\'' || c == '"' || c == '*' || c == '_' || c == '~') {
      url.pop_back();
      continue;
    }
    break;
  }
  return url;
}

// All http(s) URLs in text, in order of appearance.
inline std::vector<UrlMatch> extract_urls(const std::string& text) {
  static const std::regex url_re(R"(https?://[^\s<>"'`]+)", std::regex::icase);
  std::vector<UrlMatch> out;
  for (auto it = std::sregex_iterator(text.begin(), text.end(), url_re); it != std::sregex_iterator(); ++it) {
    std::string url = trim_url_tail(it->str());
    const auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos || url.size() <= scheme_end + 3) {
      continue;
    }
    out.push_back(UrlMatch{static_cast<std::size_t>(it->position()), std::move(url)});
  }
  return out;
}

inline std::string percent_decode(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (std::size_t i = 0; i < s.size(); ++i) {
    if (s[i] == '+') {
      out.push_back(' ');
    } else if (s[i] == '%' && i + 2 < s.size() && std::isxdigit(static_cast<unsigned char>(s[i + 1])) &&
               std::isxdigit(static_cast<unsigned char>(s[i + 2]))) {
      out.push_back(static_cast<char>(std::stoi(s.substr(i + 1, 2), nullptr, 16)));
      i += 2;
    } else {
      out.push_back(s[i]);
    }
  }
  return out;
}

inline std::string percent_encode(const std::string& s) {
  static constexpr char hex[] = "0123456789ABCDEF";
  std::string out;
  for (unsigned char c : s) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back('%');
      out.push_back(hex[c >> 4]);
      out.push_back(hex[c & 0x0F]);
    }
  }
  return out;
}

// Value of the first query parameter named `name`, or "" when absent.
inline std::string url_query_param(const std::string& url, const std::string& name) {
  const auto q = url.find('?');
  if (q == std::string::npos) {
    return "";
  }
  std::string query = url.substr(q + 1);
  const auto hash = query.find('#');
  if (hash != std::string::npos) {
    query.resize(hash);
  }

  std::istringstream in(query);
  std::string pair;
  while (std::getline(in, pair, '&')) {
    const auto eq = pair.find('=');
    const std::string key = percent_decode(pair.substr(0, eq));
    if (key != name) {
      continue;
    }
    return eq == std::string::npos ? "" : percent_decode(pair.substr(eq + 1));
  }
  return "";
}

}  // namespace msgforge
