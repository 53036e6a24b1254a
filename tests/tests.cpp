#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <future>
#include <iostream>
#include <limits>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "msgforge/bad_words.hpp"
#include "msgforge/config.hpp"
#include "msgforge/constraint_check.hpp"
#include "msgforge/in_memory.hpp"
#include "msgforge/markdown.hpp"
#include "msgforge/mention_guard.hpp"
#include "msgforge/pipeline.hpp"
#include "msgforge/quote_links.hpp"
#include "msgforge/service.hpp"
#include "msgforge/settings.hpp"
#include "msgforge/streaming_links.hpp"

using namespace msgforge;

static int fail(const std::string& msg, const char* file, int line) {
  std::cerr << "TEST FAIL: " << msg << " (" << file << ":" << line << ")\n";
  return 1;
}

#define EXPECT_TRUE(x)                     \
  do {                                     \
    if (!(x)) {                            \
      return fail(#x, __FILE__, __LINE__); \
    }                                      \
  } while (0)

#define EXPECT_EQ(a, b)                                                          \
  do {                                                                           \
    const auto _a = (a);                                                         \
    const auto _b = (b);                                                         \
    if (!(_a == _b)) {                                                           \
      std::ostringstream ss;                                                     \
      ss << #a << " == " << #b << " (got '" << _a << "' vs '" << _b << "')";     \
      return fail(ss.str(), __FILE__, __LINE__);                                 \
    }                                                                            \
  } while (0)

namespace {

const char* kSite = "https://chat.example.com";

json settings_with(const json& overrides) {
  json s = default_settings_json();
  s[settings_keys::kSiteUrl] = kSite;
  for (auto it = overrides.begin(); it != overrides.end(); ++it) {
    s[it.key()] = it.value();
  }
  return s;
}

ConfigSnapshot snapshot_with(const json& overrides) { return build_snapshot(settings_with(overrides), 1, true); }

Message make_message(const std::string& id, const std::string& rid, const std::string& text) {
  Message m;
  m.id = id;
  m.room_id = rid;
  m.sender = UserRef{"u1", "alice", "Alice Liddell"};
  m.text = text;
  m.ts = now_ms();
  return m;
}

ActingUser alice() { return ActingUser{"u1", "alice", "Alice Liddell", "en"}; }

Room make_room(const std::string& id, const std::string& type = "c") {
  Room r;
  r.id = id;
  r.type = type;
  r.name = id;
  return r;
}

std::string permalink(const std::string& mid) { return std::string(kSite) + "/channel/general?msg=" + mid; }

class ThrowingAvatars : public AvatarResolver {
 public:
  std::string avatar_url(const std::string&) override { throw std::runtime_error("avatar backend down"); }
};

class FakePreviews : public StreamingPreviewResolver {
 public:
  std::optional<StreamingPreview> resolve(const Attachment& link) override {
    if (link.resource_id == "bad") {
      throw std::runtime_error("oembed unavailable");
    }
    return StreamingPreview{"Title " + link.resource_id, "https://img.example/" + link.resource_id};
  }
};

class RecordingBroadcaster : public EventBroadcaster {
 public:
  void broadcast(const std::string& event, const json& payload) override {
    std::lock_guard<std::mutex> lock(mu_);
    events_.push_back(event + ":" + payload.value("_id", ""));
  }

  std::vector<std::string> events() const {
    std::lock_guard<std::mutex> lock(mu_);
    return events_;
  }

 private:
  mutable std::mutex mu_;
  std::vector<std::string> events_;
};

class RecordingNotifier : public EphemeralNotifier {
 public:
  void notify(const std::string& user_id, const std::string&, const std::string&) override {
    std::lock_guard<std::mutex> lock(mu_);
    users_.push_back(user_id);
  }

  std::size_t count() const {
    std::lock_guard<std::mutex> lock(mu_);
    return users_.size();
  }

 private:
  mutable std::mutex mu_;
  std::vector<std::string> users_;
};

struct Harness {
  std::shared_ptr<InMemoryMessages> messages{std::make_shared<InMemoryMessages>()};
  std::shared_ptr<InMemoryRooms> rooms{std::make_shared<InMemoryRooms>()};
  std::shared_ptr<StaticAuthorization> auth{std::make_shared<StaticAuthorization>()};
  std::shared_ptr<RecordingBroadcaster> broadcaster{std::make_shared<RecordingBroadcaster>()};
  std::shared_ptr<RecordingNotifier> notifier{std::make_shared<RecordingNotifier>()};
  std::shared_ptr<UsageMeter> usage;
  SettingsRegistry settings;
  std::unique_ptr<MessageService> service;

  explicit Harness(const json& overrides = json::object()) : settings(settings_with(overrides)) {}

  MessageService& start() {
    ServiceDependencies deps;
    deps.messages = messages;
    deps.rooms = rooms;
    deps.authorization = auth;
    deps.avatars = std::make_shared<SiteAvatarResolver>(kSite);
    deps.usage = usage;
    deps.notifier = notifier;
    deps.store = messages;
    deps.broadcaster = broadcaster;
    service = std::make_unique<MessageService>(settings, deps);
    service->created();
    return *service;
  }
};

int test_markdown() {
  MarkdownOptions opts;
  opts.custom_domains = {"intranet.local"};
  const MarkdownRenderer r(opts);

  EXPECT_EQ(r.render("*bold* and _it_"), "<strong>bold</strong> and <em>it</em>");
  EXPECT_EQ(r.render("~gone~"), "<del>gone</del>");
  EXPECT_EQ(r.render("see https://example.com/x."),
            "see <a href=\"https://example.com/x\" target=\"_blank\" rel=\"noopener noreferrer\">"
            "https://example.com/x</a>.");
  EXPECT_EQ(r.render("[docs](https://example.com)"),
            "<a href=\"https://example.com\" target=\"_blank\" rel=\"noopener noreferrer\">docs</a>");
  EXPECT_EQ(r.render("go to intranet.local/wiki"),
            "go to <a href=\"https://intranet.local/wiki\" target=\"_blank\" rel=\"noopener noreferrer\">"
            "intranet.local/wiki</a>");
  EXPECT_EQ(r.render("<b>hi</b>"), "&lt;b&gt;hi&lt;/b&gt;");
  EXPECT_EQ(r.render("`*x* <y>`"), "<code>*x* &lt;y&gt;</code>");
  EXPECT_EQ(r.render("a\nb"), "a<br>b");
  EXPECT_EQ(r.render("\\(x^2\\)"), "<span class=\"katex\">x^2</span>");
  EXPECT_EQ(r.render("color:#ff0000"), "<span class=\"color\" style=\"background-color:#ff0000\"></span>#ff0000");
  EXPECT_EQ(r.render(":)"), "<span class=\"emoji\" title=\":slight_smile:\">:slight_smile:</span>");

  // Malformed markup stays literal.
  EXPECT_EQ(r.render("*unclosed"), "*unclosed");
  EXPECT_EQ(r.render("****"), "****");
  EXPECT_EQ(r.render("snake_case_name"), "snake_case_name");
  EXPECT_EQ(r.render("[label](javascript:alert)"), "[label](javascript:alert)");

  MarkdownOptions no_katex;
  no_katex.katex.reset();
  no_katex.colors = false;
  EXPECT_EQ(MarkdownRenderer(no_katex).render("\\(x\\)"), "\\(x\\)");
  EXPECT_EQ(MarkdownRenderer(no_katex).render("color:#fff"), "color:#fff");

  MarkdownOptions dollars;
  dollars.katex = KatexOptions{true, false};
  EXPECT_EQ(MarkdownRenderer(dollars).render("$a+b$"), "<span class=\"katex\">a+b</span>");

  // Same raw text and options always give the same output, and the stage
  // never feeds rendered output back in.
  const std::string raw = "*hi* <there> & https://example.com/?a=1&b=2";
  EXPECT_EQ(r.render(raw), r.render(raw));
  const MarkdownStage stage{};
  Message once = stage.apply(make_message("m1", "r1", raw), opts);
  Message twice = stage.apply(once, opts);
  EXPECT_TRUE(once.rendered.has_value());
  EXPECT_EQ(*once.rendered, *twice.rendered);
  EXPECT_EQ(twice.text, raw);

  Message encrypted = make_message("m2", "r1", "*ciphertext*");
  encrypted.type = "e2e";
  EXPECT_TRUE(!stage.apply(encrypted, opts).rendered.has_value());

  MarkdownOptions off;
  off.enabled = false;
  EXPECT_TRUE(!stage.apply(make_message("m3", "r1", "*x*"), off).rendered.has_value());
  return 0;
}

int test_bad_words() {
  const ConfigSnapshot cfg = snapshot_with(
      {{settings_keys::kBadWordsEnabled, true}, {settings_keys::kBadWordsList, "damn, heck"}});
  BadWordsStage stage;

  EXPECT_EQ(stage.apply(make_message("m1", "r1", "that's damn annoying"), cfg).text, "that's **** annoying");
  EXPECT_EQ(stage.apply(make_message("m1", "r1", "Damn DAMN heck!"), cfg).text, "**** **** ****!");
  EXPECT_EQ(stage.apply(make_message("m1", "r1", "damnation and hecklers"), cfg).text, "damnation and hecklers");

  const ConfigSnapshot whitelisted =
      snapshot_with({{settings_keys::kBadWordsEnabled, true},
                     {settings_keys::kBadWordsList, "damn,heck"},
                     {settings_keys::kBadWordsWhitelist, "HECK"}});
  EXPECT_EQ(stage.apply(make_message("m1", "r1", "heck damn"), whitelisted).text, "heck ****");

  const ConfigSnapshot disabled =
      snapshot_with({{settings_keys::kBadWordsEnabled, false}, {settings_keys::kBadWordsList, "damn"}});
  EXPECT_EQ(stage.apply(make_message("m1", "r1", "damn"), disabled).text, "damn");

  // Underscores bind identifier-style words; surrounding underscores are kept.
  EXPECT_EQ(stage.apply(make_message("m1", "r1", "damn_it _damn_ damn__ heck_damn"), cfg).text,
            "damn_it _****_ ****__ heck_damn");
  Message underscored = make_message("m1", "r1", "_damn_ damn_it");
  underscored.rendered = MarkdownRenderer(cfg.markdown).render(underscored.text);
  EXPECT_EQ(*underscored.rendered, "<em>damn</em> damn_it");
  EXPECT_EQ(*stage.apply(underscored, cfg).rendered, "<em>****</em> damn_it");

  // Every mask keeps the length of the token it replaces.
  const BadWordsFilter filter({"hello", "x", "schön"}, {});
  const std::string cleaned = filter.clean("x hello schön");
  EXPECT_EQ(cleaned, "* ***** *****");

  // Rendered markup and entities survive masking.
  const ConfigSnapshot amp =
      snapshot_with({{settings_keys::kBadWordsEnabled, true}, {settings_keys::kBadWordsList, "amp,span"}});
  Message m = make_message("m1", "r1", "tom & amp span");
  m.rendered = MarkdownRenderer(amp.markdown).render(m.text);
  const Message out = stage.apply(m, amp);
  EXPECT_EQ(out.text, "tom & *** ****");
  EXPECT_EQ(*out.rendered, "tom &amp; *** ****");
  return 0;
}

int test_streaming_links() {
  const ConfigSnapshot cfg = snapshot_with({{settings_keys::kStreamingHosts, "open.stream.example"}});
  const LinkEnrichmentStage stage;

  const std::string raw = "listen to https://open.stream.example/track/42";
  const Message out = stage.apply(make_message("m1", "r1", raw), cfg.streaming);
  EXPECT_EQ(out.text, raw);
  EXPECT_EQ(out.attachments.size(), static_cast<std::size_t>(1));
  EXPECT_TRUE(out.attachments[0].kind == AttachmentKind::kStreamingLink);
  EXPECT_EQ(out.attachments[0].resource_type, "track");
  EXPECT_EQ(out.attachments[0].resource_id, "42");
  EXPECT_EQ(out.attachments[0].url, "https://open.stream.example/track/42");

  const ConfigSnapshot defaults = snapshot_with(json::object());
  const Message ordered = stage.apply(
      make_message("m2", "r1",
                   "spotify:album:abc then https://open.spotify.com/intl-de/track/xyz?si=1 "
                   "https://open.spotify.com/track/ https://evil.example/track/1 https://open.spotify.com/user/bob"),
      defaults.streaming);
  EXPECT_EQ(ordered.attachments.size(), static_cast<std::size_t>(2));
  EXPECT_EQ(ordered.attachments[0].resource_id, "abc");
  EXPECT_EQ(ordered.attachments[0].url, "https://open.spotify.com/album/abc");
  EXPECT_EQ(ordered.attachments[1].resource_id, "xyz");

  const ConfigSnapshot off = snapshot_with({{settings_keys::kStreamingEnabled, false}});
  EXPECT_TRUE(stage.apply(make_message("m3", "r1", "spotify:track:abc"), off.streaming).attachments.empty());

  const ConfigSnapshot fetch = snapshot_with({{settings_keys::kStreamingFetchMetadata, true}});
  const LinkEnrichmentStage with_previews(std::make_shared<FakePreviews>());
  const Message enriched =
      with_previews.apply(make_message("m4", "r1", "spotify:track:good spotify:track:bad"), fetch.streaming);
  EXPECT_EQ(enriched.attachments.size(), static_cast<std::size_t>(2));
  EXPECT_EQ(enriched.attachments[0].title, "Title good");
  EXPECT_EQ(enriched.attachments[1].title, "");
  return 0;
}

int test_quote_links() {
  auto messages = std::make_shared<InMemoryMessages>();
  auto rooms = std::make_shared<InMemoryRooms>();
  auto auth = std::make_shared<StaticAuthorization>();
  rooms->put(make_room("r1"));
  rooms->put(make_room("r2", "p"));
  auth->allow_room("r1", "u1");

  Message m1 = make_message("m1", "r1", "first");
  m1.sender = UserRef{"u2", "bob", "Bob Builder"};
  Message m2 = make_message("m2", "r1", "second");
  Message secret = make_message("m3", "r2", "secret");
  messages->put(m1);
  messages->put(m2);
  messages->put(secret);

  const QuoteLinkStage stage(messages, rooms, auth, std::make_shared<SiteAvatarResolver>(kSite));

  QuoteOptions one;
  one.chain_limit = 1;
  one.site_url = kSite;
  const Message limited =
      stage.apply(make_message("new", "r1", "see " + permalink("m1") + " and " + permalink("m2")), alice(), one);
  EXPECT_EQ(limited.attachments.size(), static_cast<std::size_t>(1));
  EXPECT_EQ(limited.attachments[0].message_id, "m1");
  EXPECT_EQ(limited.attachments[0].author_name, "bob");
  EXPECT_EQ(limited.attachments[0].avatar_url, std::string(kSite) + "/avatar/bob");
  EXPECT_EQ(limited.attachments[0].url, permalink("m1"));

  // Skipped links do not count against the limit.
  QuoteOptions two = one;
  two.chain_limit = 2;
  const Message skipping = stage.apply(
      make_message("new", "r1",
                   permalink("missing") + " " + permalink("m3") + " " + permalink("m1") + " " + permalink("m2") +
                       " " + permalink("m1")),
      alice(), two);
  EXPECT_EQ(skipping.attachments.size(), static_cast<std::size_t>(2));
  EXPECT_EQ(skipping.attachments[0].message_id, "m1");
  EXPECT_EQ(skipping.attachments[1].message_id, "m2");

  // K below N yields K quotes; other hosts and self links are ignored.
  QuoteOptions five = one;
  five.chain_limit = 5;
  const Message few = stage.apply(
      make_message("m2", "r1",
                   "https://other.example.com/channel/general?msg=m1 " + permalink("m2") + " " + permalink("m1") +
                       " https://chat.example.com.evil.io/x?msg=m1 " + std::string(kSite) + "/channel/general"),
      alice(), five);
  EXPECT_EQ(few.attachments.size(), static_cast<std::size_t>(1));
  EXPECT_EQ(few.attachments[0].message_id, "m1");

  QuoteOptions disabled = one;
  disabled.chain_limit = 0;
  EXPECT_TRUE(stage.apply(make_message("new", "r1", permalink("m1")), alice(), disabled).attachments.empty());

  QuoteOptions real_names = one;
  real_names.use_real_name = true;
  const QuoteLinkStage no_avatars(messages, rooms, auth, std::make_shared<ThrowingAvatars>());
  const Message named = no_avatars.apply(make_message("new", "r1", permalink("m1")), alice(), real_names);
  EXPECT_EQ(named.attachments.size(), static_cast<std::size_t>(1));
  EXPECT_EQ(named.attachments[0].author_name, "Bob Builder");
  EXPECT_EQ(named.attachments[0].avatar_url, "");

  // Livechat visitors can quote their own room without a grant.
  Room livechat = make_room("r9", "l");
  livechat.visitor_token = "tok";
  rooms->put(livechat);
  messages->put(make_message("m9", "r9", "visitor question"));
  Message from_visitor = make_message("new", "r9", permalink("m9"));
  from_visitor.token = "tok";
  ActingUser visitor{"", "guest", "", "en"};
  EXPECT_EQ(stage.apply(from_visitor, visitor, one).attachments.size(), static_cast<std::size_t>(1));

  // Nested quotes are cut at chain_limit - 1 levels.
  Attachment level3;
  level3.kind = AttachmentKind::kQuotedMessage;
  level3.text = "c";
  Attachment level2 = level3;
  level2.text = "b";
  level2.attachments = {level3};
  Attachment level1 = level3;
  level1.text = "a";
  level1.attachments = {level2};
  Message nested = make_message("m4", "r1", "nested");
  nested.attachments = {level1};
  messages->put(nested);

  const Message depth2 = stage.apply(make_message("new", "r1", permalink("m4")), alice(), two);
  EXPECT_EQ(depth2.attachments[0].attachments.size(), static_cast<std::size_t>(1));
  EXPECT_TRUE(depth2.attachments[0].attachments[0].attachments.empty());

  QuoteOptions three = one;
  three.chain_limit = 3;
  const Message depth3 = stage.apply(make_message("new", "r1", permalink("m4")), alice(), three);
  EXPECT_EQ(depth3.attachments[0].attachments[0].attachments.size(), static_cast<std::size_t>(1));
  EXPECT_TRUE(depth3.attachments[0].attachments[0].attachments[0].attachments.empty());

  const Message depth1 = stage.apply(make_message("new", "r1", permalink("m4")), alice(), one);
  EXPECT_TRUE(depth1.attachments[0].attachments.empty());
  return 0;
}

int test_mentions() {
  EXPECT_TRUE(contains_mention("@all", "all"));
  EXPECT_TRUE(contains_mention("hey @all.", "all"));
  EXPECT_TRUE(contains_mention("hey @all, look", "all"));
  EXPECT_TRUE(!contains_mention("@allison hi", "all"));
  EXPECT_TRUE(!contains_mention("mail foo@all", "all"));
  EXPECT_TRUE(!contains_mention("@all-hands", "all"));
  EXPECT_TRUE(!contains_mention("@all.team", "all"));

  auto auth = std::make_shared<StaticAuthorization>();
  auto notifier = std::make_shared<RecordingNotifier>();
  const MentionGuardStage guard(auth, notifier);
  const Room room = make_room("r1");

  const auto denied = guard.check(make_message("m1", "r1", "@everyone look"), alice(), room, everyone_mention_rule());
  EXPECT_TRUE(denied.has_value());
  EXPECT_EQ(std::string(veto_kind_name(denied->kind)), "mention_all");
  EXPECT_EQ(denied->code, "error-action-not-allowed");
  EXPECT_EQ(notifier->count(), static_cast<std::size_t>(1));

  EXPECT_TRUE(!guard.check(make_message("m1", "r1", "no mentions"), alice(), room, everyone_mention_rule()));

  auth->grant("u1", "mention-here", "r1");
  EXPECT_TRUE(!guard.check(make_message("m1", "r1", "@here"), alice(), room, here_mention_rule()));
  EXPECT_TRUE(guard.check(make_message("m1", "r2", "@here"), alice(), make_room("r2"), here_mention_rule()));
  return 0;
}

int test_constraints() {
  const ConstraintCheckStage length({max_length_policy()});
  const ConfigSnapshot cfg = snapshot_with({{settings_keys::kMaxAllowedSize, 5}});
  EXPECT_TRUE(!length.check(make_message("m1", "r1", "short"), make_room("r1"), cfg));
  const auto veto = length.check(make_message("m1", "r1", "longer"), make_room("r1"), cfg);
  EXPECT_TRUE(veto.has_value());
  EXPECT_EQ(veto->code, "error-message-size-exceeded");

  const ConfigSnapshot unlimited = snapshot_with({{settings_keys::kMaxAllowedSize, 0}});
  EXPECT_TRUE(!length.check(make_message("m1", "r1", std::string(10000, 'a')), make_room("r1"), unlimited));

  const ConstraintCheckStage contacts({contact_limit_policy(std::make_shared<FixedUsageMeter>(false))});
  EXPECT_TRUE(!contacts.check(make_message("m1", "r1", "hi"), make_room("r1", "c"), cfg));
  const auto mac = contacts.check(make_message("m1", "r1", "hi"), make_room("r1", "l"), cfg);
  EXPECT_TRUE(mac.has_value());
  EXPECT_EQ(mac->code, "error-mac-limit-reached");
  return 0;
}

int test_freshness_gate() {
  const int64_t now = 1'700'000'000'000;
  Message m = make_message("m1", "r1", "x");
  m.ts = now - 60'000;
  EXPECT_TRUE(is_fresh_and_unedited(m, now, 60));
  m.ts = now - 60'001;
  EXPECT_TRUE(!is_fresh_and_unedited(m, now, 60));
  m.ts = now + 61'000;
  EXPECT_TRUE(!is_fresh_and_unedited(m, now, 60));

  // Extreme timestamps are simply out of the window.
  m.ts = std::numeric_limits<int64_t>::min();
  EXPECT_TRUE(!is_fresh_and_unedited(m, now, 60));
  m.ts = std::numeric_limits<int64_t>::max();
  EXPECT_TRUE(!is_fresh_and_unedited(m, now, 60));
  EXPECT_TRUE(is_fresh_and_unedited(m, std::numeric_limits<int64_t>::max() - 10, 60));
  m.ts = std::numeric_limits<int64_t>::min() + 5;
  EXPECT_TRUE(is_fresh_and_unedited(m, std::numeric_limits<int64_t>::min(), 60));
  m.ts = now;
  EXPECT_TRUE(is_fresh_and_unedited(m, now, 0));

  m.ts.reset();
  EXPECT_TRUE(is_fresh_and_unedited(m, now, 60));
  m.edited_at = now;
  EXPECT_TRUE(!is_fresh_and_unedited(m, now, 60));
  return 0;
}

int test_pipeline_service() {
  {
    Harness h(json{{settings_keys::kStreamingHosts, "open.spotify.com"}});
    MessageService& svc = h.start();
    const Room room = make_room("r1");
    metrics().reset();

    // @everyone without the permission is rejected, but the transformed
    // message is still handed back.
    const PipelineResult rejected =
        svc.process(make_message("m1", "r1", "@everyone https://open.spotify.com/track/abc"), room, alice());
    EXPECT_TRUE(!rejected.accepted);
    EXPECT_TRUE(rejected.validated);
    EXPECT_EQ(std::string(veto_kind_name(rejected.veto->kind)), "mention_all");
    EXPECT_TRUE(rejected.message.rendered.has_value());
    EXPECT_EQ(rejected.message.attachments.size(), static_cast<std::size_t>(1));
    EXPECT_EQ(metrics().get("pipeline.rejected.mention_all"), static_cast<uint64_t>(1));
    EXPECT_EQ(metrics().get("streaming.attached"), static_cast<uint64_t>(1));
    EXPECT_EQ(metrics().to_json()["pipeline"]["runs"].get<uint64_t>(), static_cast<uint64_t>(1));

    bool threw = false;
    try {
      svc.before_save(make_message("m1", "r1", "@everyone"), room, alice());
    } catch (const VetoError& e) {
      threw = e.kind() == VetoKind::kMentionAll;
    }
    EXPECT_TRUE(threw);

    // Edited messages skip validation and keep the mention.
    Message edited = make_message("m1", "r1", "@everyone look");
    edited.edited_at = now_ms();
    const PipelineResult skipped = svc.process(edited, room, alice());
    EXPECT_TRUE(skipped.accepted);
    EXPECT_TRUE(!skipped.validated);
    EXPECT_TRUE(skipped.message.text.find("@everyone") != std::string::npos);

    Message stale = make_message("m1", "r1", "@here old");
    stale.ts = now_ms() - 120'000;
    EXPECT_TRUE(!svc.process(stale, room, alice()).validated);

    Message untimed = make_message("m1", "r1", "@here untimed");
    untimed.ts.reset();
    const PipelineResult untimed_result = svc.process(untimed, room, alice());
    EXPECT_TRUE(untimed_result.validated);
    EXPECT_EQ(std::string(veto_kind_name(untimed_result.veto->kind)), "mention_here");

    h.auth->grant("u1", "mention-all");
    EXPECT_TRUE(svc.process(make_message("m1", "r1", "@everyone"), room, alice()).accepted);
  }

  {
    Harness h(json{{settings_keys::kValidateEdited, true}});
    MessageService& svc = h.start();
    Message edited = make_message("m1", "r1", "@all edited");
    edited.edited_at = now_ms();
    const PipelineResult r = svc.process(edited, make_room("r1"), alice());
    EXPECT_TRUE(r.validated);
    EXPECT_TRUE(!r.accepted);
  }

  {
    // The constraint check is reported ahead of the mention checks.
    Harness h(json{{settings_keys::kMaxAllowedSize, 5}});
    MessageService& svc = h.start();
    const PipelineResult r = svc.process(make_message("m1", "r1", "@all hello"), make_room("r1"), alice());
    EXPECT_TRUE(!r.accepted);
    EXPECT_EQ(std::string(veto_kind_name(r.veto->kind)), "constraint");
  }

  {
    Harness h;
    h.usage = std::make_shared<FixedUsageMeter>(false);
    MessageService& svc = h.start();
    const PipelineResult r = svc.process(make_message("m1", "r1", "hi"), make_room("r1", "l"), alice());
    EXPECT_TRUE(!r.accepted);
    EXPECT_EQ(r.veto->code, "error-mac-limit-reached");
  }

  {
    // Two valid permalinks and a chain limit of one.
    Harness h(json{{settings_keys::kQuoteChainLimit, 1}});
    h.rooms->put(make_room("r1"));
    h.auth->allow_room("r1", "u1");
    h.messages->put(make_message("q1", "r1", "quoted one"));
    h.messages->put(make_message("q2", "r1", "quoted two"));
    MessageService& svc = h.start();
    const PipelineResult r =
        svc.process(make_message("m1", "r1", permalink("q1") + " " + permalink("q2")), make_room("r1"), alice());
    EXPECT_TRUE(r.accepted);
    EXPECT_EQ(r.message.attachments.size(), static_cast<std::size_t>(1));
    EXPECT_EQ(r.message.attachments[0].message_id, "q1");
    EXPECT_EQ(r.message.attachments[0].text, "quoted one");
  }
  return 0;
}

int test_config_snapshots() {
  SettingsRegistry settings(settings_with(json::object()));
  ConfigWatcher watcher(settings, true);
  watcher.start();

  const auto before = watcher.current();
  EXPECT_EQ(before->quotes.chain_limit, 2);

  settings.set_many({{settings_keys::kQuoteChainLimit, 5}, {settings_keys::kUseRealName, true}});
  const auto after = watcher.current();
  EXPECT_EQ(before->quotes.chain_limit, 2);
  EXPECT_TRUE(!before->quotes.use_real_name);
  EXPECT_EQ(after->quotes.chain_limit, 5);
  EXPECT_TRUE(after->quotes.use_real_name);
  EXPECT_EQ(after->version, before->version + 1);

  settings.set("Unrelated_Setting", 1);
  EXPECT_EQ(watcher.current()->version, after->version);

  watcher.stop();
  settings.set(settings_keys::kQuoteChainLimit, 9);
  EXPECT_EQ(watcher.current()->quotes.chain_limit, 5);

  // Numbers outside the int range fall back to the default.
  EXPECT_EQ(snapshot_with({{settings_keys::kMaxAllowedSize, 1e12}}).validation.max_message_size, 5000);
  EXPECT_EQ(snapshot_with({{settings_keys::kMaxAllowedSize, -1e12}}).validation.max_message_size, 5000);
  EXPECT_EQ(snapshot_with({{settings_keys::kMaxAllowedSize, int64_t{10'000'000'000}}}).validation.max_message_size,
            5000);
  EXPECT_EQ(snapshot_with({{settings_keys::kMaxAllowedSize, uint64_t{4'000'000'000}}}).validation.max_message_size,
            5000);
  EXPECT_EQ(snapshot_with({{settings_keys::kMaxAllowedSize, 42.0}}).validation.max_message_size, 42);
  EXPECT_EQ(snapshot_with({{settings_keys::kMaxAllowedSize, "300"}}).validation.max_message_size, 300);

  const ConfigSnapshot katex_off = snapshot_with({{settings_keys::kKatexEnabled, false},
                                                  {settings_keys::kCustomDomains, " a.local , b.local,"}});
  EXPECT_TRUE(!katex_off.markdown.katex.has_value());
  EXPECT_EQ(katex_off.markdown.custom_domains.size(), static_cast<std::size_t>(2));
  EXPECT_EQ(katex_off.markdown.custom_domains[1], "b.local");

  // Bad-word filtering switches on for runs after the change.
  Harness h;
  MessageService& svc = h.start();
  EXPECT_EQ(svc.process(make_message("m1", "r1", "damn it"), make_room("r1"), alice()).message.text, "damn it");
  h.settings.set_many({{settings_keys::kBadWordsEnabled, true}, {settings_keys::kBadWordsList, "damn"}});
  EXPECT_EQ(svc.process(make_message("m1", "r1", "damn it"), make_room("r1"), alice()).message.text, "**** it");
  h.settings.set(settings_keys::kBadWordsEnabled, false);
  EXPECT_EQ(svc.process(make_message("m1", "r1", "damn it"), make_room("r1"), alice()).message.text, "damn it");

  const fs::path tmp = fs::temp_directory_path() / ("msgforge_settings_" + random_id(10) + ".json");
  EXPECT_TRUE(write_text_file(tmp, "{\"Message_QuoteChainLimit\": 7}"));
  EXPECT_EQ(load_settings_file(tmp).value(settings_keys::kQuoteChainLimit, 0), 7);
  EXPECT_TRUE(write_text_file(tmp, "{not json"));
  EXPECT_EQ(load_settings_file(tmp).value(settings_keys::kQuoteChainLimit, 0), 2);
  std::error_code ec;
  fs::remove(tmp, ec);
  return 0;
}

int test_settings_delivery_order() {
  using settings_keys::kQuoteChainLimit;
  using settings_keys::kUseRealName;

  {
    // A writer held up inside an earlier watcher must not roll the snapshot
    // back over a newer change.
    SettingsRegistry settings(settings_with(json::object()));
    std::promise<void> entered;
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
    settings.watch_multiple({kQuoteChainLimit}, [&](const json& values, uint64_t) {
      if (values.value(kQuoteChainLimit, 0) == 5) {
        entered.set_value();
        released.wait();
      }
    });
    ConfigWatcher watcher(settings, true);
    watcher.start();

    std::thread slow([&] { settings.set(kQuoteChainLimit, 5); });
    entered.get_future().wait();
    settings.set(kUseRealName, true);
    release.set_value();
    slow.join();

    const auto cfg = watcher.current();
    EXPECT_EQ(cfg->quotes.chain_limit, 5);
    EXPECT_TRUE(cfg->quotes.use_real_name);
  }

  {
    SettingsRegistry settings(settings_with(json::object()));
    ConfigWatcher watcher(settings, true);
    watcher.start();

    std::thread limits([&] {
      for (int i = 1; i <= 200; ++i) {
        settings.set(kQuoteChainLimit, i);
      }
    });
    std::thread names([&] {
      for (int i = 1; i <= 200; ++i) {
        settings.set_many({{kUseRealName, i % 2 == 0}, {settings_keys::kMaxAllowedSize, i}});
      }
    });
    limits.join();
    names.join();

    const auto cfg = watcher.current();
    EXPECT_EQ(cfg->quotes.chain_limit, 200);
    EXPECT_TRUE(cfg->quotes.use_real_name);
    EXPECT_EQ(cfg->validation.max_message_size, 200);
  }

  {
    // unwatch returns only after a running delivery has finished, and no
    // later change reaches the watcher.
    SettingsRegistry settings(settings_with(json::object()));
    std::promise<void> entered;
    std::atomic<int> sevens{0};
    std::atomic<bool> finished{false};
    const auto id = settings.watch_multiple({kQuoteChainLimit}, [&](const json& values, uint64_t) {
      if (values.value(kQuoteChainLimit, 0) != 7) {
        return;
      }
      if (++sevens == 1) {
        entered.set_value();
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        finished = true;
      }
    });

    std::thread writer([&] { settings.set(kQuoteChainLimit, 7); });
    entered.get_future().wait();
    settings.unwatch(id);
    const bool done_when_unwatched = finished.load();
    writer.join();
    EXPECT_TRUE(done_when_unwatched);

    settings.set(kQuoteChainLimit, 7);
    EXPECT_EQ(sevens.load(), 1);
  }

  {
    // Stopping a service's config watcher while a rebuild is pending is safe.
    SettingsRegistry settings(settings_with(json::object()));
    auto watcher = std::make_unique<ConfigWatcher>(settings, true);
    watcher->start();
    std::thread writer([&] {
      for (int i = 1; i <= 50; ++i) {
        settings.set(kQuoteChainLimit, i);
      }
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
    watcher.reset();
    writer.join();
    EXPECT_EQ(settings.get(kQuoteChainLimit).get<int>(), 50);
  }
  return 0;
}

int test_orchestrator_failures() {
  const ConfigSnapshot cfg = snapshot_with(json::object());
  const Room room = make_room("r1");
  const ActingUser user = alice();

  std::atomic<int> ran{0};
  const PipelineOrchestrator pipeline(
      {
          {"explodes", [](Message, const PipelineContext&) -> Message { throw std::runtime_error("boom"); }},
          {"renames", [](Message m, const PipelineContext&) {
             m.id = "other";
             return m;
           }},
          {"bang", [](Message m, const PipelineContext&) {
             m.text += "!";
             return m;
           }},
      },
      {
          {"veto", [](const Message&, const PipelineContext&) -> std::optional<Veto> {
             return Veto{VetoKind::kConstraint, "first", ""};
           }},
          {"later", [&ran](const Message&, const PipelineContext&) -> std::optional<Veto> {
             ++ran;
             return Veto{VetoKind::kMentionHere, "second", ""};
           }},
      });

  const PipelineResult r = pipeline.run(make_message("m1", "r1", "hi"), room, user, cfg);
  EXPECT_EQ(r.message.text, "hi!");
  EXPECT_EQ(r.message.id, "m1");
  EXPECT_EQ(r.veto->code, "first");
  EXPECT_EQ(ran.load(), 1);

  const PipelineOrchestrator broken({}, {{"throws", [](const Message&, const PipelineContext&) -> std::optional<Veto> {
                                           throw std::runtime_error("authorization backend down");
                                         }}});
  bool threw = false;
  try {
    broken.run(make_message("m1", "r1", "hi"), room, user, cfg);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  EXPECT_TRUE(threw);
  return 0;
}

int test_service_operations() {
  Harness h;
  MessageService& svc = h.start();
  const Room room = make_room("r1");

  bool threw = false;
  try {
    svc.save_system_message("uj", "r1", "joined", UserRef{"u1", "", "Alice"});
  } catch (const std::invalid_argument& e) {
    threw = std::string(e.what()) == "The username cannot be empty.";
  }
  EXPECT_TRUE(threw);

  const std::string sys_id = svc.save_system_message("uj", "r1", "alice joined", UserRef{"u1", "alice", "Alice"},
                                                     json{{"role", "owner"}});
  EXPECT_TRUE(!sys_id.empty());
  EXPECT_EQ(h.messages->find(sys_id)->type, "uj");
  EXPECT_EQ(h.messages->system_meta(sys_id)["extra"]["role"].get<std::string>(), "owner");
  EXPECT_EQ(h.broadcaster->events().back(), "message.sent:" + sys_id);

  Message outgoing;
  outgoing.id = "s1";
  outgoing.text = "*hello* world";
  const Message sent = svc.send_message(alice(), outgoing, room);
  EXPECT_EQ(sent.room_id, "r1");
  EXPECT_EQ(sent.sender.username, "alice");
  EXPECT_EQ(*h.messages->find("s1")->rendered, "<strong>hello</strong> world");
  EXPECT_EQ(h.broadcaster->events().back(), "message.sent:s1");

  Message shout;
  shout.id = "s2";
  shout.text = "@all ping";
  bool vetoed = false;
  try {
    svc.send_message(alice(), shout, room);
  } catch (const VetoError&) {
    vetoed = true;
  }
  EXPECT_TRUE(vetoed);
  EXPECT_TRUE(!h.messages->find("s2").has_value());

  Message edit = *h.messages->find("s1");
  edit.text = "@all edited";
  svc.update_message(edit, alice(), room);
  const Message stored = *h.messages->find("s1");
  EXPECT_EQ(stored.text, "@all edited");
  EXPECT_TRUE(stored.is_edited());
  EXPECT_EQ(stored.edited_by, "alice");

  svc.react_to_message("u1", ":+1:", "s1");
  svc.react_to_message("u1", ":+1:", "s1");
  EXPECT_EQ(h.messages->reactions("s1").size(), static_cast<std::size_t>(1));
  svc.react_to_message("u1", ":+1:", "s1", false);
  EXPECT_TRUE(h.messages->reactions("s1").empty());

  svc.delete_message(alice(), stored);
  EXPECT_TRUE(!h.messages->find("s1").has_value());
  return 0;
}

int test_fixtures_and_json() {
  const json root = json::parse(R"({
    "messages": [{"_id": "q1", "rid": "r1", "msg": "hi", "u": {"_id": "u2", "username": "bob"}, "ts": 5}],
    "rooms": [{"_id": "r1", "t": "l", "v": {"token": "tok"}}],
    "access": {"r1": ["u1"]},
    "permissions": {"u1": ["mention-all", "r1:mention-here"]},
    "withinContactLimit": false
  })");
  const Fixtures fx = load_fixtures(root);

  const auto found = fx.messages->find_visible_by_ids({"q1", "nope"});
  EXPECT_EQ(found.size(), static_cast<std::size_t>(1));
  EXPECT_EQ(found[0].sender.username, "bob");
  EXPECT_EQ(*found[0].ts, 5);

  const auto rooms = fx.rooms->find_by_ids({"r1"});
  EXPECT_EQ(rooms[0].visitor_token, "tok");
  EXPECT_TRUE(rooms[0].is_omnichannel());
  EXPECT_TRUE(fx.authorization->can_access_room(rooms[0], alice()));
  EXPECT_TRUE(fx.authorization->has_permission("u1", "mention-all"));
  EXPECT_TRUE(fx.authorization->has_permission("u1", "mention-here", "r1"));
  EXPECT_TRUE(!fx.authorization->has_permission("u1", "mention-here"));
  EXPECT_TRUE(!fx.usage->is_within_contact_limit(rooms[0]));

  Message m = make_message("m1", "r1", "spotify:track:abc");
  m.attachments.push_back(Attachment{});
  m.attachments.back().kind = AttachmentKind::kStreamingLink;
  m.attachments.back().resource_id = "abc";
  const json j = m;
  EXPECT_EQ(j["u"]["username"].get<std::string>(), "alice");
  EXPECT_EQ(j["attachments"][0]["kind"].get<std::string>(), "streaming_link");
  const Message back = j.get<Message>();
  EXPECT_TRUE(back.attachments[0].kind == AttachmentKind::kStreamingLink);
  EXPECT_EQ(back.attachments[0].resource_id, "abc");

  EXPECT_TRUE(Logger::parse_level(" WARNING ") == Logger::Level::kWarn);
  EXPECT_TRUE(Logger::parse_level("debug") == Logger::Level::kDebug);
  EXPECT_TRUE(!Logger::parse_level("loud").has_value());
  return 0;
}

}  // namespace

int main() {
  Logger::set_min_level(Logger::Level::kError);

  int failures = 0;
  failures += test_markdown();
  failures += test_bad_words();
  failures += test_streaming_links();
  failures += test_quote_links();
  failures += test_mentions();
  failures += test_constraints();
  failures += test_freshness_gate();
  failures += test_pipeline_service();
  failures += test_config_snapshots();
  failures += test_settings_delivery_order();
  failures += test_orchestrator_failures();
  failures += test_service_operations();
  failures += test_fixtures_and_json();

  if (failures > 0) {
    std::cerr << failures << " test group(s) failed\n";
    return 1;
  }
  std::cout << "OK\n";
  return 0;
}
