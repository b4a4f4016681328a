// Command line front for a conversation store
#include <asio.hpp>
#include <csignal>
#include <functional>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "chatstore/chatstore.hpp"
#include "core/version.hpp"
#include "spdlog/cfg/env.h"

using namespace chatstore;

static void print_usage() {
  std::cout << "Usage: chatstore_cli <command> [args]\n\n"
            << "  new [title]                        Create a conversation\n"
            << "  list                               List conversations, newest first\n"
            << "  show <id> [branch]                 Print messages of a branch (e.g. 0_1)\n"
            << "  add <id> <user|assistant> <text>   Append to the current branch\n"
            << "  edit <id> <n> <text>               Fork at the n-th user message\n"
            << "  retry <id> <position> <text>       Replace the reply at position\n"
            << "  switch <id> <n> <prev|next>        Move to a sibling version\n"
            << "  branches <id>                      List stored branch keys\n"
            << "  versions <id> <n>                  Version info at the n-th user message\n"
            << "  truncate <id> <position>           Delete messages from position on\n"
            << "  dup <id>                           Duplicate a conversation\n"
            << "  search <query>                     Search titles and message text\n"
            << "  delete <id>                        Delete a conversation\n"
            << "  stream <id> [--stop-after n] <text>  Write a reply word by word (Ctrl-C stops)\n";
}

static std::string join_args(int argc, char* argv[], int from) {
  std::string text;
  for (int i = from; i < argc; ++i) {
    if (!text.empty()) text += " ";
    text += argv[i];
  }
  return text;
}

static int fail(const Error& error) {
  std::cerr << "Error: " << error.describe() << "\n";
  return 1;
}

static bool parse_index(const std::string& arg, size_t& out) {
  try {
    size_t used = 0;
    auto value = std::stoul(arg, &used);
    if (used != arg.size()) return false;
    out = value;
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

static void print_messages(const ConversationView& view) {
  std::cout << view.meta.title << "  [" << branch::encode(view.branch) << "]\n";
  for (const auto& item : view.messages) {
    std::cout << "#" << item.position << " " << to_string(item.message.role());
    if (item.user_msg_index) {
      std::cout << " (" << item.current_version << "/" << item.total_versions << ")";
    }
    if (item.message.is_streaming()) {
      std::cout << " [streaming]";
    }
    std::cout << ": " << item.message.text() << "\n";
  }
}

static void print_list(const std::vector<ConversationMeta>& conversations) {
  for (const auto& meta : conversations) {
    std::cout << meta.id << "  " << format_timestamp(meta.updated_at) << "  " << meta.title << "\n";
  }
}

// Feed the text through the async front one word per tick, the way a model
// stream would arrive. Ctrl-C (or --stop-after) stops it through the stream
// registry and the reply is finalized with the stop notice.
static int stream_reply(ConversationService& service, const ConversationId& id, const std::string& text,
                        std::optional<size_t> stop_after) {
  asio::io_context io_ctx;
  AsyncConversationService async(io_ctx, service, service.config().io_threads);
  StreamRegistry registry;
  auto abort_flag = registry.start(id, StreamType::Agent);

  // The pool's work does not keep io_ctx alive on its own
  auto work = asio::make_work_guard(io_ctx);

  asio::signal_set signals(io_ctx, SIGINT);
  signals.async_wait([&registry, id](const std::error_code& ec, int) {
    if (!ec && registry.stop(id)) {
      std::cerr << "Stopping...\n";
    }
  });

  std::vector<std::string> words;
  std::istringstream input(text);
  for (std::string word; input >> word;) {
    words.push_back(word);
  }

  int rc = 0;
  StreamHandle handle;
  StreamAccumulator accumulator;
  asio::steady_timer timer(io_ctx);
  size_t next = 0;

  auto done = [&]() {
    registry.end(id);
    signals.cancel();
    work.reset();
  };

  auto finish = [&]() {
    bool stopped = abort_flag->load();
    async.finish_stream(handle, accumulator, stopped, [&, stopped](Status status) {
      done();
      if (status.failed()) {
        rc = fail(*status.error);
        return;
      }
      std::cout << (stopped ? "Stopped" : "Wrote") << " message " << handle.message_id << "\n";
    });
  };

  std::function<void()> tick = [&]() {
    if (stop_after && next == *stop_after) {
      registry.stop(id);
    }
    if (abort_flag->load() || next == words.size()) {
      finish();
      return;
    }

    accumulator.add_text(next == 0 ? words[next] : " " + words[next]);
    ++next;
    async.patch_stream(handle, accumulator.snapshot(), [](Status status) {
      if (status.failed()) {
        spdlog::warn("Patch failed: {}", status.error->describe());
      }
    });

    timer.expires_after(std::chrono::milliseconds(50));
    timer.async_wait([&tick](const std::error_code& ec) {
      if (!ec) tick();
    });
  };

  async.begin_stream(id, std::nullopt, [&](Result<StreamHandle> started) {
    if (started.failed()) {
      rc = fail(*started.error);
      done();
      return;
    }
    handle = *started;
    tick();
  });

  io_ctx.run();
  async.shutdown();
  return rc;
}

int main(int argc, char* argv[]) {
  spdlog::cfg::load_env_levels();

  if (argc < 2) {
    std::cout << "chatstore " << CHATSTORE_VERSION_STRING << "\n\n";
    print_usage();
    return 1;
  }

  Config config = Config::from_env();
  chatstore::init(config);

  ConversationService service(config);
  std::string command = argv[1];

  if (command == "new") {
    CreateConversationRequest request;
    request.title = join_args(argc, argv, 2);
    auto view = service.create_conversation(request);
    if (view.failed()) return fail(*view.error);
    std::cout << view->meta.id << "\n";
    return 0;
  }

  if (command == "list") {
    print_list(service.list_conversations());
    return 0;
  }

  if (command == "search" && argc >= 3) {
    print_list(service.search_conversations(join_args(argc, argv, 2)));
    return 0;
  }

  if (argc < 3) {
    print_usage();
    return 1;
  }

  ConversationId id = argv[2];

  if (command == "show") {
    std::optional<BranchCoordinate> branch;
    if (argc >= 4) {
      branch = branch::decode(argv[3]);
      if (!branch) {
        std::cerr << "Error: invalid branch key '" << argv[3] << "'\n";
        return 1;
      }
    }
    auto view = service.get_conversation(id, branch);
    if (view.failed()) return fail(*view.error);
    print_messages(*view);
    return 0;
  }

  if (command == "add" && argc >= 5) {
    NewMessage message;
    message.role = role_from_string(argv[3]);
    message.content = join_args(argc, argv, 4);
    auto added = service.add_message(id, message);
    if (added.failed()) return fail(*added.error);
    std::cout << added->id() << "\n";
    return 0;
  }

  if (command == "edit" && argc >= 5) {
    size_t index = 0;
    if (!parse_index(argv[3], index)) {
      print_usage();
      return 1;
    }
    auto meta = service.repository().get(id);
    if (meta.failed()) return fail(*meta.error);
    auto forked = service.edit_message(id, meta->current_branch, index, join_args(argc, argv, 4));
    if (forked.failed()) return fail(*forked.error);
    std::cout << "Branch " << branch::encode(forked->branch) << " (version " << forked->version << "/" << forked->total_versions << ")\n";
    return 0;
  }

  if (command == "retry" && argc >= 5) {
    size_t position = 0;
    if (!parse_index(argv[3], position)) {
      print_usage();
      return 1;
    }
    auto meta = service.repository().get(id);
    if (meta.failed()) return fail(*meta.error);
    auto reply = service.retry_message(id, meta->current_branch, position, join_args(argc, argv, 4));
    if (reply.failed()) return fail(*reply.error);
    std::cout << reply->id() << "\n";
    return 0;
  }

  if (command == "switch" && argc >= 5) {
    size_t index = 0;
    std::string direction = argv[4];
    if (!parse_index(argv[3], index) || (direction != "prev" && direction != "next")) {
      print_usage();
      return 1;
    }
    auto meta = service.repository().get(id);
    if (meta.failed()) return fail(*meta.error);
    auto target = service.switch_branch(id, meta->current_branch, index, direction == "next" ? 1 : -1);
    if (target.failed()) return fail(*target.error);
    std::cout << "Now on " << branch::encode(*target) << "\n";
    return 0;
  }

  if (command == "branches") {
    auto keys = service.list_branches(id);
    if (keys.failed()) return fail(*keys.error);
    for (const auto& key : *keys) {
      std::cout << branch::encode(key) << "  " << branch::to_string(key) << "\n";
    }
    return 0;
  }

  if (command == "versions" && argc >= 4) {
    size_t index = 0;
    if (!parse_index(argv[3], index)) {
      print_usage();
      return 1;
    }
    auto meta = service.repository().get(id);
    if (meta.failed()) return fail(*meta.error);
    auto info = service.get_version_info(id, meta->current_branch, index);
    if (info.failed()) return fail(*info.error);
    std::cout << info->to_json().dump(2) << "\n";
    return 0;
  }

  if (command == "truncate" && argc >= 4) {
    size_t position = 0;
    if (!parse_index(argv[3], position)) {
      print_usage();
      return 1;
    }
    auto removed = service.truncate_from(id, position);
    if (removed.failed()) return fail(*removed.error);
    std::cout << (*removed ? "Deleted" : "Nothing to delete") << "\n";
    return 0;
  }

  if (command == "dup") {
    auto copy = service.duplicate_conversation(id);
    if (copy.failed()) return fail(*copy.error);
    std::cout << copy->id << "\n";
    return 0;
  }

  if (command == "delete") {
    auto status = service.delete_conversation(id);
    if (status.failed()) return fail(*status.error);
    return 0;
  }

  if (command == "stream" && argc >= 4) {
    if (std::string(argv[3]) == "--stop-after") {
      size_t count = 0;
      if (argc < 6 || !parse_index(argv[4], count)) {
        print_usage();
        return 1;
      }
      return stream_reply(service, id, join_args(argc, argv, 5), count);
    }
    return stream_reply(service, id, join_args(argc, argv, 3), std::nullopt);
  }

  print_usage();
  return 1;
}
