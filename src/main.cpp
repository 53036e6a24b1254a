#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "msgforge/common.hpp"
#include "msgforge/config.hpp"
#include "msgforge/in_memory.hpp"
#include "msgforge/markdown.hpp"
#include "msgforge/metrics.hpp"
#include "msgforge/service.hpp"
#include "msgforge/settings.hpp"
#include "msgforge/streaming_links.hpp"

namespace {

using namespace msgforge;

void print_usage() {
  std::cout << "msgforge - chat message pre-persistence pipeline\n\n"
            << "Usage:\n"
            << "  msgforge render -m TEXT [--settings FILE]\n"
            << "  msgforge process --message FILE [--room FILE] [--user FILE] [--settings FILE]\n"
            << "                   [--fixtures FILE] [--stats]\n"
            << "  msgforge settings\n"
            << "  msgforge --version\n";
}

bool has_flag(const std::vector<std::string>& args, const std::string& flag) {
  return std::find(args.begin(), args.end(), flag) != args.end();
}

std::string get_flag_value(const std::vector<std::string>& args, const std::string& flag,
                           const std::string& fallback = "") {
  for (std::size_t i = 0; i + 1 < args.size(); ++i) {
    if (args[i] == flag) {
      return args[i + 1];
    }
  }
  return fallback;
}

std::optional<json> read_json_file(const std::string& path) {
  const std::string raw = read_text_file(path);
  if (raw.empty()) {
    std::cerr << "Cannot read " << path << "\n";
    return std::nullopt;
  }
  try {
    return json::parse(raw);
  } catch (const std::exception& e) {
    std::cerr << "Invalid JSON in " << path << ": " << e.what() << "\n";
    return std::nullopt;
  }
}

json settings_from_args(const std::vector<std::string>& args) {
  const std::string path = get_flag_value(args, "--settings");
  return path.empty() ? default_settings_json() : load_settings_file(path);
}

int run_render(const std::vector<std::string>& args) {
  const std::string text = get_flag_value(args, "-m");
  if (text.empty()) {
    std::cerr << "render requires -m TEXT\n";
    return 1;
  }
  const ConfigSnapshot cfg = build_snapshot(settings_from_args(args), 1);
  std::cout << MarkdownRenderer(cfg.markdown).render(text) << "\n";
  return 0;
}

int run_process(const std::vector<std::string>& args) {
  const std::string message_path = get_flag_value(args, "--message");
  if (message_path.empty()) {
    std::cerr << "process requires --message FILE\n";
    return 1;
  }

  const auto message_json = read_json_file(message_path);
  if (!message_json) {
    return 1;
  }

  Fixtures fx;
  const std::string fixtures_path = get_flag_value(args, "--fixtures");
  if (!fixtures_path.empty()) {
    const auto root = read_json_file(fixtures_path);
    if (!root) {
      return 1;
    }
    fx = load_fixtures(*root);
  }

  try {
    Message message = message_json->get<Message>();

    Room room;
    room.id = message.room_id;
    const std::string room_path = get_flag_value(args, "--room");
    if (!room_path.empty()) {
      const auto r = read_json_file(room_path);
      if (!r) {
        return 1;
      }
      room = r->get<Room>();
    }

    ActingUser user{message.sender.id, message.sender.username, message.sender.name};
    const std::string user_path = get_flag_value(args, "--user");
    if (!user_path.empty()) {
      const auto u = read_json_file(user_path);
      if (!u) {
        return 1;
      }
      user = u->get<ActingUser>();
    }

    SettingsRegistry settings(settings_from_args(args));
    const std::string site_url = settings.get(settings_keys::kSiteUrl).is_string()
                                     ? settings.get(settings_keys::kSiteUrl).get<std::string>()
                                     : std::string();

    ServiceDependencies deps;
    deps.messages = fx.messages;
    deps.rooms = fx.rooms;
    deps.authorization = fx.authorization;
    deps.avatars = std::make_shared<SiteAvatarResolver>(site_url);
    deps.usage = fx.usage;
    deps.notifier = std::make_shared<LogNotifier>();
    deps.previews = std::make_shared<OEmbedPreviewResolver>();
    deps.store = fx.messages;
    deps.broadcaster = std::make_shared<LogBroadcaster>();

    MessageService service(settings, deps);
    service.created();
    const PipelineResult result = service.process(std::move(message), room, user);

    json out{{"accepted", result.accepted}, {"validated", result.validated}, {"message", result.message}};
    if (result.veto) {
      out["veto"] = {{"kind", veto_kind_name(result.veto->kind)},
                     {"code", result.veto->code},
                     {"reason", result.veto->reason}};
    }
    if (has_flag(args, "--stats")) {
      out["stats"] = metrics().to_json();
    }
    std::cout << out.dump(2) << "\n";
    return result.accepted ? 0 : 2;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}

}  // namespace

int main(int argc, char** argv) {
  {
    const char* v = std::getenv("MSGFORGE_LOG_JSON");
    if (v && *v && std::string(v) != "0") {
      Logger::set_json(true);
    }
    const char* level = std::getenv("MSGFORGE_LOG_LEVEL");
    if (level) {
      if (const auto parsed = Logger::parse_level(level)) {
        Logger::set_min_level(*parsed);
      }
    }
  }

  std::vector<std::string> args;
  args.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    args.emplace_back(argv[i]);
  }

  if (args.size() <= 1) {
    print_usage();
    return 0;
  }

  const std::string command = args[1];

  if (command == "--version" || command == "-v") {
    std::cout << "msgforge v0.1.0\n";
    return 0;
  }
  if (command == "render") {
    std::vector<std::string> sub(args.begin() + 2, args.end());
    return run_render(sub);
  }
  if (command == "process") {
    std::vector<std::string> sub(args.begin() + 2, args.end());
    return run_process(sub);
  }
  if (command == "settings") {
    std::cout << default_settings_json().dump(2) << "\n";
    return 0;
  }

  print_usage();
  return 1;
}
