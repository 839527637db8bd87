#include "chat_client.hpp"
#include "config.hpp"
#include "key_value_store.hpp"
#include "reply_stream.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace {

static volatile std::sig_atomic_t g_interrupted = 0;

static void OnSigint(int) {
  g_interrupted = 1;
}

static void PrintUsage() {
  std::cout << "usage: llmbridge <command> [args]\n"
            << "  test                 check the configured backend\n"
            << "  models [--refresh]   list models (cached unless --refresh)\n"
            << "  chat <prompt>        stream a single-turn reply\n"
            << "  tokenize <text>      count tokens (estimated without extended endpoints)\n"
            << "  context-size         report the model context window\n"
            << "environment: LLMBRIDGE_API_URL, LLMBRIDGE_API_KEY, LLMBRIDGE_BACKEND, LLMBRIDGE_MODEL,\n"
            << "  LLMBRIDGE_DISABLE_SSL_VERIFICATION, LLMBRIDGE_SSL_CERT_PATH, LLMBRIDGE_USE_EXTENDED_ENDPOINTS,\n"
            << "  LLMBRIDGE_REQUEST_TIMEOUT_MS, LLMBRIDGE_CACHE_PATH\n";
}

static std::string JoinArgs(const std::vector<std::string>& args, size_t from) {
  std::string out;
  for (size_t i = from; i < args.size(); i++) {
    if (!out.empty()) out += " ";
    out += args[i];
  }
  return out;
}

static int RunTest(llmbridge::ChatClient* client) {
  auto report = client->TestConnection();
  std::cout << report.message << "\n" << report.details << "\n";
  return report.success ? 0 : 1;
}

static int RunModels(llmbridge::ChatClient* client, bool refresh) {
  llmbridge::ClientError err;
  auto models = client->GetModels(refresh, &err);
  if (!models) {
    std::cerr << "error: " << err.message << "\n";
    return 1;
  }
  for (const auto& m : *models) std::cout << m.id << "\n";
  return 0;
}

static int RunChat(llmbridge::ChatClient* client, const std::string& prompt) {
  llmbridge::ChatMessage msg;
  msg.role = "user";
  msg.content = prompt;

  // Ctrl-C cancels the request; the handler only sets a flag that a watcher
  // thread forwards to the token.
  llmbridge::CancellationToken cancel;
  std::atomic<bool> finished{false};
  g_interrupted = 0;
  std::signal(SIGINT, OnSigint);
  std::thread watcher([&]() {
    while (!finished.load()) {
      if (g_interrupted) {
        cancel.Cancel();
        return;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
  });

  llmbridge::ClientError err;
  std::optional<std::string> text;
  {
    // Log lines go to stderr for the duration so stdout carries only the reply.
    llmbridge::ReplyStream out(std::cerr.rdbuf());
    text = client->SendChat(
        {msg}, [&out](const std::string& delta) { out.reply() << delta << std::flush; }, &cancel, std::nullopt, &err);
    out.reply() << "\n";
  }

  finished.store(true);
  watcher.join();
  std::signal(SIGINT, SIG_DFL);
  if (!text) {
    std::cerr << "error (" << llmbridge::ErrorKindName(err.kind) << "): " << err.message << "\n";
    return err.kind == llmbridge::ErrorKind::kUserAborted ? 130 : 1;
  }
  return 0;
}

static int RunTokenize(llmbridge::ChatClient* client, const std::string& text) {
  auto r = client->Tokenize(text);
  std::cout << "tokens=" << r.token_count << (r.is_estimation ? " (estimated)" : "") << "\n";
  return 0;
}

static int RunContextSize(llmbridge::ChatClient* client) {
  auto r = client->GetContextSize();
  std::cout << "context_size=" << r.context_size << (r.is_estimation ? " (default)" : "") << "\n";
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);
  if (args.empty() || args[0] == "-h" || args[0] == "--help") {
    PrintUsage();
    return args.empty() ? 2 : 0;
  }

  auto cfg = llmbridge::LoadConfigFromEnv();
  std::cout << "[llmbridge] backend=" << llmbridge::BackendKindName(cfg.backend.backend) << " url=" << cfg.backend.api_url
            << " model=" << (cfg.backend.model_name.empty() ? "<default>" : cfg.backend.model_name)
            << " cache=" << cfg.cache_path << "\n";

  auto store = std::make_shared<llmbridge::FileKeyValueStore>(cfg.cache_path);
  llmbridge::ChatClient client(cfg.backend, store);

  const std::string& cmd = args[0];
  if (cmd == "test") return RunTest(&client);
  if (cmd == "models") {
    const bool refresh = args.size() > 1 && args[1] == "--refresh";
    return RunModels(&client, refresh);
  }
  if (cmd == "chat") {
    auto prompt = JoinArgs(args, 1);
    if (prompt.empty()) {
      std::cerr << "chat: missing prompt\n";
      return 2;
    }
    return RunChat(&client, prompt);
  }
  if (cmd == "tokenize") return RunTokenize(&client, JoinArgs(args, 1));
  if (cmd == "context-size") return RunContextSize(&client);

  std::cerr << "unknown command: " << cmd << "\n";
  PrintUsage();
  return 2;
}
