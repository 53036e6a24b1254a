#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

#include "msgforge/common.hpp"
#include "msgforge/config.hpp"
#include "msgforge/message.hpp"
#include "msgforge/metrics.hpp"

namespace msgforge {

class BadWordsFilter {
 public:
  BadWordsFilter(const std::vector<std::string>& words, const std::vector<std::string>& whitelist) {
    for (const auto& w : words) {
      words_.insert(to_lower(w));
    }
    for (const auto& w : whitelist) {
      words_.erase(to_lower(w));
    }
  }

  bool empty() const { return words_.empty(); }

  // Masks every banned whole token with one '*' per code point. Underscores
  // join words into a single token. With markup_aware set, HTML tags and
  // character entities are copied untouched.
  std::string clean(const std::string& text, bool markup_aware = false, std::size_t* masked = nullptr) const {
    std::string out;
    out.reserve(text.size());
    std::size_t i = 0;
    while (i < text.size()) {
      const char c = text[i];
      if (markup_aware && c == '<') {
        const auto close = text.find('>', i);
        const std::size_t end = close == std::string::npos ? text.size() : close + 1;
        out.append(text, i, end - i);
        i = end;
        continue;
      }
      if (markup_aware && c == '&') {
        const auto semi = text.find(';', i);
        if (semi != std::string::npos && semi - i <= 10) {
          out.append(text, i, semi + 1 - i);
          i = semi + 1;
          continue;
        }
      }
      if (!is_token_char(c)) {
        out.push_back(c);
        ++i;
        continue;
      }

      std::size_t j = i;
      while (j < text.size() && is_token_char(text[j])) {
        ++j;
      }
      // "_word_" keeps its underscores; "word_suffix" is a different word.
      const std::string token = text.substr(i, j - i);
      const auto first = token.find_first_not_of('_');
      const auto last = token.find_last_not_of('_');
      const std::string core = first == std::string::npos ? "" : token.substr(first, last - first + 1);
      if (!core.empty() && words_.count(to_lower(core)) > 0) {
        out.append(token, 0, first);
        out.append(utf8_length(core), '*');
        out.append(token, last + 1, std::string::npos);
        if (masked) {
          ++*masked;
        }
      } else {
        out += token;
      }
      i = j;
    }
    return out;
  }

 private:
  static bool is_token_char(char c) {
    const auto u = static_cast<unsigned char>(c);
    return std::isalnum(u) || u == '_' || u >= 0x80;
  }

  std::unordered_set<std::string> words_;
};

// Masks banned words in the raw and the rendered text. The compiled filter
// is rebuilt only when the snapshot carries different word lists.
class BadWordsStage {
 public:
  Message apply(Message message, const ConfigSnapshot& cfg) {
    const auto filter = filter_for(cfg);
    if (!filter || message.text.empty()) {
      return message;
    }

    std::size_t masked = 0;
    message.text = filter->clean(message.text, false, &masked);
    if (message.rendered) {
      message.rendered = filter->clean(*message.rendered, true);
    }
    if (masked > 0) {
      metrics().inc("badwords.masked", masked);
    }
    return message;
  }

 private:
  std::shared_ptr<const BadWordsFilter> filter_for(const ConfigSnapshot& cfg) {
    if (!cfg.bad_words.enabled) {
      return nullptr;
    }
    std::lock_guard<std::mutex> lock(mu_);
    if (!filter_ || words_ != cfg.bad_words.words || whitelist_ != cfg.bad_words.whitelist) {
      filter_ = std::make_shared<const BadWordsFilter>(cfg.bad_words.words, cfg.bad_words.whitelist);
      words_ = cfg.bad_words.words;
      whitelist_ = cfg.bad_words.whitelist;
    }
    return filter_->empty() ? nullptr : filter_;
  }

  std::mutex mu_;
  std::shared_ptr<const BadWordsFilter> filter_;
  std::vector<std::string> words_;
  std::vector<std::string> whitelist_;
};

}  // namespace msgforge
