#pragma once

#include <algorithm>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <vector>

#include "msgforge/common.hpp"
#include "msgforge/config.hpp"
#include "msgforge/http.hpp"
#include "msgforge/message.hpp"
#include "msgforge/metrics.hpp"
#include "msgforge/url_scanner.hpp"

namespace msgforge {

struct StreamingPreview {
  std::string title;
  std::string thumbnail_url;
};

class StreamingPreviewResolver {
 public:
  virtual ~StreamingPreviewResolver() = default;
  virtual std::optional<StreamingPreview> resolve(const Attachment& link) = 0;
};

// Looks up title and artwork through the service's oEmbed endpoint.
class OEmbedPreviewResolver : public StreamingPreviewResolver {
 public:
  explicit OEmbedPreviewResolver(int timeout_s = 5) : timeout_s_(timeout_s) {}

  std::optional<StreamingPreview> resolve(const Attachment& link) override {
    const std::string endpoint = "https://" + link.service + "/oembed?url=" + percent_encode(link.url);
    FetchOptions opts;
    opts.timeout_s = timeout_s_;
    HttpFetcher http;
    const FetchResult res = http.get(endpoint, opts);
    if (!res.ok() || !res.is_json()) {
      Logger::log(Logger::Level::kDebug, "oEmbed lookup failed for " + link.url + ": " +
                                             (res.error.empty() ? std::to_string(res.status) : res.error));
      return std::nullopt;
    }
    try {
      const json body = json::parse(res.body);
      StreamingPreview out;
      out.title = body.value("title", "");
      out.thumbnail_url = body.value("thumbnail_url", "");
      return out;
    } catch (const std::exception& e) {
      Logger::log(Logger::Level::kDebug, std::string("oEmbed response not JSON: ") + e.what());
      return std::nullopt;
    }
  }

 private:
  int timeout_s_;
};

struct StreamingLinkMatch {
  std::size_t pos{0};
  Attachment attachment;
};

// Recognizes http(s) links on the configured hosts and spotify: URIs.
inline std::vector<StreamingLinkMatch> find_streaming_links(const std::string& text,
                                                            const std::vector<std::string>& hosts) {
  static const std::regex path_re(
      R"(^/(?:intl-[a-z]{2}(?:-[a-z]{2})?/)?(track|album|playlist|artist|episode|show)/([A-Za-z0-9]+)(?:[/?#].*)?$)",
      std::regex::icase);
  static const std::regex uri_re(R"(spotify:(track|album|playlist|artist|episode|show):([A-Za-z0-9]+))",
                                 std::regex::icase);

  std::vector<StreamingLinkMatch> out;

  for (const auto& u : extract_urls(text)) {
    const auto scheme_end = u.url.find("://");
    const auto path_start = u.url.find('/', scheme_end + 3);
    std::string host = to_lower(u.url.substr(scheme_end + 3, path_start == std::string::npos
                                                                 ? std::string::npos
                                                                 : path_start - scheme_end - 3));
    const auto colon = host.find(':');
    if (colon != std::string::npos) {
      host.resize(colon);
    }
    if (path_start == std::string::npos || std::find(hosts.begin(), hosts.end(), host) == hosts.end()) {
      continue;
    }

    std::smatch m;
    const std::string path = u.url.substr(path_start);
    if (!std::regex_match(path, m, path_re)) {
      continue;
    }
    Attachment a;
    a.kind = AttachmentKind::kStreamingLink;
    a.url = u.url;
    a.service = host;
    a.resource_type = to_lower(m[1].str());
    a.resource_id = m[2].str();
    out.push_back(StreamingLinkMatch{u.pos, std::move(a)});
  }

  for (auto it = std::sregex_iterator(text.begin(), text.end(), uri_re); it != std::sregex_iterator(); ++it) {
    const auto pos = static_cast<std::size_t>(it->position());
    if (pos > 0 && !std::isspace(static_cast<unsigned char>(text[pos - 1]))) {
      continue;
    }
    Attachment a;
    a.kind = AttachmentKind::kStreamingLink;
    a.service = "open.spotify.com";
    a.resource_type = to_lower((*it)[1].str());
    a.resource_id = (*it)[2].str();
    a.url = "https://open.spotify.com/" + a.resource_type + "/" + a.resource_id;
    out.push_back(StreamingLinkMatch{pos, std::move(a)});
  }

  std::stable_sort(out.begin(), out.end(),
                   [](const StreamingLinkMatch& a, const StreamingLinkMatch& b) { return a.pos < b.pos; });
  return out;
}

// Appends one streaming_link attachment per recognized link, left to right.
class LinkEnrichmentStage {
 public:
  explicit LinkEnrichmentStage(std::shared_ptr<StreamingPreviewResolver> resolver = nullptr)
      : resolver_(std::move(resolver)) {}

  Message apply(Message message, const StreamingLinkOptions& opts) const {
    if (!opts.enabled || message.text.empty()) {
      return message;
    }

    for (auto& match : find_streaming_links(message.text, opts.hosts)) {
      if (opts.fetch_metadata && resolver_) {
        try {
          if (auto preview = resolver_->resolve(match.attachment)) {
            match.attachment.title = preview->title;
            match.attachment.thumbnail_url = preview->thumbnail_url;
          }
        } catch (const std::exception& e) {
          Logger::log(Logger::Level::kDebug, std::string("Streaming preview skipped: ") + e.what());
        }
      }
      message.attachments.push_back(std::move(match.attachment));
      metrics().inc("streaming.attached");
    }
    return message;
  }

 private:
  std::shared_ptr<StreamingPreviewResolver> resolver_;
};

}  // namespace msgforge
