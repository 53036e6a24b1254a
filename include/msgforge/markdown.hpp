#pragma once

#include <array>
#include <string>
#include <utility>

#include "msgforge/common.hpp"
#include "msgforge/config.hpp"
#include "msgforge/message.hpp"

namespace msgforge {

inline std::string escape_html(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    switch (c) {
      case '&':
        out += "&amp;";
        break;
      case '<':
        out += "&lt;";
        break;
      case '>':
        out += "&gt;";
        break;
      case '"':
        out += "&quot;";
        break;
      case '\'':
        out += "&#39;";
        break;
      default:
        out.push_back(c);
    }
  }
  return out;
}

// Renders the message dialect into HTML. Anything that does not form a
// complete construct is emitted as escaped literal text.
class MarkdownRenderer {
 public:
  explicit MarkdownRenderer(MarkdownOptions opts) : opts_(std::move(opts)) {}

  std::string render(const std::string& raw) const {
    std::string out;
    std::size_t start = 0;
    while (true) {
      const auto nl = raw.find('\n', start);
      std::string line = raw.substr(start, nl == std::string::npos ? std::string::npos : nl - start);
      if (!line.empty() && line.back() == '\r') {
        line.pop_back();
      }
      out += render_inline(line, 0);
      if (nl == std::string::npos) {
        break;
      }
      out += "<br>";
      start = nl + 1;
    }
    return out;
  }

 private:
  static constexpr int kMaxNesting = 8;

  static bool is_word(char c) {
    const auto u = static_cast<unsigned char>(c);
    return std::isalnum(u) || u >= 0x80;
  }

  static bool is_space(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }

  static bool istarts_with_at(const std::string& s, std::size_t i, const std::string& pfx) {
    if (s.size() - i < pfx.size()) {
      return false;
    }
    for (std::size_t k = 0; k < pfx.size(); ++k) {
      if (std::tolower(static_cast<unsigned char>(s[i + k])) != std::tolower(static_cast<unsigned char>(pfx[k]))) {
        return false;
      }
    }
    return true;
  }

  static std::size_t token_end(const std::string& s, std::size_t i) {
    std::size_t j = i;
    while (j < s.size() && !is_space(s[j]) && s[j] != '<' && s[j] != '>' && s[j] != '"') {
      ++j;
    }
    return j;
  }

  static std::string anchor(const std::string& href, const std::string& inner_html) {
    return "<a href=\"" + escape_html(href) + "\" target=\"_blank\" rel=\"noopener noreferrer\">" + inner_html +
           "</a>";
  }

  static std::string trim_link_tail(std::string url) {
    while (!url.empty()) {
      const char c = url.back();
      if (c == '.' || c == ',' || c == ';' || c == ':' || c == '!' || c == '?' || c == ')' || c == ']' ||
          c == '\'' || c == '*' || c == '_' || c == '~') {
        url.pop_back();
        continue;
      }
      break;
    }
    return url;
  }

  bool try_code(const std::string& s, std::size_t& i, std::string& out) const {
    const auto close = s.find('`', i + 1);
    if (close == std::string::npos || close == i + 1) {
      return false;
    }
    out += "<code>" + escape_html(s.substr(i + 1, close - i - 1)) + "</code>";
    i = close + 1;
    return true;
  }

  bool try_katex(const std::string& s, std::size_t& i, std::string& out) const {
    if (!opts_.katex) {
      return false;
    }
    std::string open;
    std::string close;
    if (opts_.katex->dollar_syntax && s[i] == '$') {
      open = "$";
      close = "$";
    } else if (opts_.katex->parenthesis_syntax && s.compare(i, 2, "\\(") == 0) {
      open = "\\(";
      close = "\\)";
    } else {
      return false;
    }
    const auto end = s.find(close, i + open.size());
    if (end == std::string::npos || end == i + open.size()) {
      return false;
    }
    const std::string expr = s.substr(i + open.size(), end - i - open.size());
    if (is_space(expr.front()) || is_space(expr.back())) {
      return false;
    }
    out += "<span class=\"katex\">" + escape_html(expr) + "</span>";
    i = end + close.size();
    return true;
  }

  bool try_link(const std::string& s, std::size_t& i, std::string& out, int depth) const {
    const auto label_end = s.find(']', i + 1);
    if (label_end == std::string::npos || label_end == i + 1 || label_end + 1 >= s.size() ||
        s[label_end + 1] != '(') {
      return false;
    }
    const auto url_end = s.find(')', label_end + 2);
    if (url_end == std::string::npos) {
      return false;
    }
    const std::string url = trim(s.substr(label_end + 2, url_end - label_end - 2));
    if (!(istarts_with_at(url, 0, "http://") || istarts_with_at(url, 0, "https://")) ||
        url.find_first_of(" \t") != std::string::npos) {
      return false;
    }
    out += anchor(url, render_inline(s.substr(i + 1, label_end - i - 1), depth + 1));
    i = url_end + 1;
    return true;
  }

  bool try_autolink(const std::string& s, std::size_t& i, std::string& out) const {
    if (i > 0 && is_word(s[i - 1])) {
      return false;
    }
    if (istarts_with_at(s, i, "http://") || istarts_with_at(s, i, "https://")) {
      const std::string url = trim_link_tail(s.substr(i, token_end(s, i) - i));
      if (url.find("://") + 3 >= url.size()) {
        return false;
      }
      out += anchor(url, escape_html(url));
      i += url.size();
      return true;
    }
    for (const auto& domain : opts_.custom_domains) {
      if (domain.empty() || !istarts_with_at(s, i, domain)) {
        continue;
      }
      const std::size_t after = i + domain.size();
      if (after < s.size() && s[after] != '/' && s[after] != ':' && !is_space(s[after]) &&
          trim_link_tail(s.substr(after, 1)).size() == 1) {
        continue;
      }
      const std::string target = trim_link_tail(s.substr(i, token_end(s, i) - i));
      out += anchor("https://" + target, escape_html(target));
      i += target.size();
      return true;
    }
    return false;
  }

  bool try_color(const std::string& s, std::size_t& i, std::string& out) const {
    if (!opts_.colors || !istarts_with_at(s, i, "color:#") || (i > 0 && is_word(s[i - 1]))) {
      return false;
    }
    const std::size_t hex_start = i + 7;
    std::size_t j = hex_start;
    while (j < s.size() && std::isxdigit(static_cast<unsigned char>(s[j]))) {
      ++j;
    }
    const std::size_t n = j - hex_start;
    if ((n != 3 && n != 6 && n != 8) || (j < s.size() && is_word(s[j]))) {
      return false;
    }
    const std::string hex = "#" + s.substr(hex_start, n);
    out += "<span class=\"color\" style=\"background-color:" + hex + "\"></span>" + hex;
    i = j;
    return true;
  }

  bool try_emphasis(const std::string& s, std::size_t& i, std::string& out, int depth) const {
    const char delim = s[i];
    if (depth >= kMaxNesting || (i > 0 && is_word(s[i - 1])) || i + 1 >= s.size() || is_space(s[i + 1])) {
      return false;
    }
    for (std::size_t j = s.find(delim, i + 1); j != std::string::npos; j = s.find(delim, j + 1)) {
      if (is_space(s[j - 1]) || (j + 1 < s.size() && is_word(s[j + 1]))) {
        continue;
      }
      const std::string inner = s.substr(i + 1, j - i - 1);
      if (inner.find_first_not_of(delim) == std::string::npos) {
        continue;
      }
      const char* tag = delim == '*' ? "strong" : (delim == '_' ? "em" : "del");
      out += std::string("<") + tag + ">" + render_inline(inner, depth + 1) + "</" + tag + ">";
      i = j + 1;
      return true;
    }
    return false;
  }

  bool try_emoticon(const std::string& s, std::size_t& i, std::string& out) const {
    static const std::array<std::pair<const char*, const char*>, 10> table{{
        {":-)", ":slight_smile:"},
        {":)", ":slight_smile:"},
        {":-D", ":smiley:"},
        {":D", ":smiley:"},
        {";)", ":wink:"},
        {":-(", ":frowning:"},
        {":(", ":frowning:"},
        {":P", ":stuck_out_tongue:"},
        {":'(", ":cry:"},
        {"<3", ":heart:"},
    }};
    if (!opts_.emoticons || (i > 0 && !is_space(s[i - 1]))) {
      return false;
    }
    for (const auto& [ascii, code] : table) {
      const std::string a(ascii);
      if (s.compare(i, a.size(), a) != 0) {
        continue;
      }
      if (i + a.size() < s.size() && !is_space(s[i + a.size()])) {
        continue;
      }
      out += std::string("<span class=\"emoji\" title=\"") + code + "\">" + code + "</span>";
      i += a.size();
      return true;
    }
    return false;
  }

  std::string render_inline(const std::string& s, int depth) const {
    std::string out;
    std::size_t i = 0;
    while (i < s.size()) {
      const char c = s[i];
      if (c == '`' && try_code(s, i, out)) {
        continue;
      }
      if ((c == '$' || c == '\\') && try_katex(s, i, out)) {
        continue;
      }
      if (c == '[' && try_link(s, i, out, depth)) {
        continue;
      }
      if (try_autolink(s, i, out)) {
        continue;
      }
      if ((c == 'c' || c == 'C') && try_color(s, i, out)) {
        continue;
      }
      if ((c == '*' || c == '_' || c == '~') && try_emphasis(s, i, out, depth)) {
        continue;
      }
      if ((c == ':' || c == ';' || c == '<') && try_emoticon(s, i, out)) {
        continue;
      }
      out += escape_html(std::string(1, c));
      ++i;
    }
    return out;
  }

  MarkdownOptions opts_;
};

// Fills Message::rendered from the raw text. The raw text is never modified,
// so running the stage twice produces the same output.
class MarkdownStage {
 public:
  Message apply(Message message, const MarkdownOptions& opts) const {
    if (!opts.enabled || message.is_encrypted()) {
      return message;
    }
    message.rendered = MarkdownRenderer(opts).render(message.text);
    return message;
  }
};

}  // namespace msgforge
