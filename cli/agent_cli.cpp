#include <spdlog/spdlog.h>

#include <pthread.h>
#include <signal.h>

#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "agent/agent.hpp"
#include "core/config.hpp"
#include "core/logging.hpp"
#include "llm/provider.hpp"
#include "mcp/registry.hpp"
#include "session/session_manager.hpp"
#include "skill/skill.hpp"
#include "tool/builtin/builtins.hpp"

using namespace stepagent;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitConfigError = 1;
constexpr int kExitTaskFailed = 2;

std::mutex g_cli_mutex;
SessionManager *g_sessions = nullptr;
std::string g_current_session;
bool g_busy = false;

// SIGINT is blocked in every thread and picked up here; it only sets the
// session's cancel flag, which takes effect at the next step boundary
void watch_interrupts(sigset_t signals) {
  int sig = 0;
  while (sigwait(&signals, &sig) == 0) {
    std::lock_guard<std::mutex> lock(g_cli_mutex);
    if (g_sessions && g_busy) {
      g_sessions->cancel(g_current_session);
      std::cerr << "\nCancelling after the current step...\n";
    } else {
      std::cerr << "\nUse /exit to quit\n";
    }
  }
}

void set_current(SessionManager *sessions, const std::string &id) {
  std::lock_guard<std::mutex> lock(g_cli_mutex);
  g_sessions = sessions;
  g_current_session = id;
}

void set_busy(bool busy) {
  std::lock_guard<std::mutex> lock(g_cli_mutex);
  g_busy = busy;
}

PromptResult run_prompt(SessionManager &sessions, const std::string &id, const std::string &text) {
  set_busy(true);
  auto result = sessions.prompt(id, text);
  set_busy(false);
  return result;
}

void print_usage(const char *prog) {
  std::cout << "Usage: " << prog << " [--config PATH] [--task TEXT]\n"
            << "\n"
            << "  --config PATH   Configuration file (default: " << config_paths::default_config_file().string() << ")\n"
            << "  --task TEXT     Run a single task and exit\n"
            << "  -h, --help      Show this help\n"
            << "\n"
            << "Interactive commands: /exit quits, /clear starts a new session\n";
}

struct CliOptions {
  std::string config_path;
  std::string task;
  bool help = false;
  std::string error;
};

CliOptions parse_args(int argc, char *argv[]) {
  CliOptions opts;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      opts.help = true;
    } else if (arg == "--config" || arg == "--task") {
      if (i + 1 >= argc) {
        opts.error = arg + " requires a value";
        return opts;
      }
      (arg == "--config" ? opts.config_path : opts.task) = argv[++i];
    } else {
      opts.error = "unknown argument: " + arg;
      return opts;
    }
  }
  return opts;
}

int exit_code_for(StopReason reason) {
  return reason == StopReason::EndTurn ? kExitOk : kExitTaskFailed;
}

void print_result(const PromptResult &result) {
  if (result.stop_reason == StopReason::EndTurn) {
    std::cout << result.content << "\n";
  } else {
    std::cout << "[" << to_string(result.stop_reason) << "] " << result.content << "\n";
  }
}

}  // namespace

int main(int argc, char *argv[]) {
  auto opts = parse_args(argc, argv);
  if (opts.help) {
    print_usage(argv[0]);
    return kExitOk;
  }
  if (!opts.error.empty()) {
    std::cerr << "Error: " << opts.error << "\n";
    print_usage(argv[0]);
    return kExitConfigError;
  }

  // Block SIGINT before any thread starts so only the watcher receives it
  sigset_t signals;
  sigemptyset(&signals);
  sigaddset(&signals, SIGINT);
  pthread_sigmask(SIG_BLOCK, &signals, nullptr);
  std::thread(watch_interrupts, signals).detach();

  // ===== 加载配置 =====
  Config config;
  try {
    config = opts.config_path.empty() ? Config::load_default() : Config::load(opts.config_path);
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << "\n";
    return kExitConfigError;
  }

  logging::setup(config.log_level, config.log_file);

  if (config.llm.api_key.empty()) {
    std::cerr << "Error: No API key configured. Set llm.api_key in the config file or STEPAGENT_API_KEY.\n";
    return kExitConfigError;
  }

  auto llm = llm::create_client(config.llm);
  if (!llm) {
    std::cerr << "Error: Unknown LLM provider '" << config.llm.provider << "'\n";
    return kExitConfigError;
  }
  llm->retry_policy().set_on_retry([](const std::exception &e, int attempt) {
    std::cerr << "[retry " << attempt << "] " << e.what() << "\n";
  });

  std::string system_prompt;
  try {
    system_prompt = config.resolve_system_prompt();
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << "\n";
    return kExitConfigError;
  }

  // ===== 工具 =====
  std::error_code ec;
  std::filesystem::create_directories(config.agent.workspace_dir, ec);
  if (ec) {
    spdlog::warn("Cannot create workspace {}: {}", config.agent.workspace_dir, ec.message());
  }

  auto base_tools = tools::make_builtin_tools(config.tools, config.agent.workspace_dir);

  if (config.tools.enable_skills) {
    auto skills = std::make_shared<skill::SkillRegistry>();
    if (skills->discover(config.tools.skills_dir) > 0) {
      base_tools.push_back(std::make_shared<skill::GetSkillTool>(skills));
      system_prompt += "\n\n" + skills->metadata_prompt();
    }
  }

  mcp::ToolRegistry mcp_registry;
  if (config.tools.enable_mcp) {
    auto mcp_tools = mcp_registry.load(config.tools.mcp_config_path);
    base_tools.insert(base_tools.end(), mcp_tools.begin(), mcp_tools.end());
  }

  spdlog::info("{} tools available", base_tools.size());

  SessionManager sessions([&](const std::string &cwd) {
    AgentOptions options;
    options.system_prompt = system_prompt;
    options.max_steps = config.agent.max_steps;
    options.workspace_dir = cwd.empty() ? config.agent.workspace_dir : cwd;

    auto agent = std::make_unique<Agent>(llm, options, base_tools);
    agent->on_step([](int step, const LlmResponse &response) {
      for (const auto &call : response.tool_calls) {
        std::cerr << "  [step " << step << "] " << call.name << "\n";
      }
    });
    return agent;
  });

  int exit_code = kExitOk;
  auto session_id = sessions.new_session();
  set_current(&sessions, session_id);

  if (!opts.task.empty()) {
    auto result = run_prompt(sessions, session_id, opts.task);
    print_result(result);
    exit_code = exit_code_for(result.stop_reason);
  } else {
    std::cout << "stepagent (" << config.llm.provider << "/" << config.llm.model << ") - /exit to quit, /clear for a new session\n";

    std::string line;
    while (true) {
      std::cout << "> " << std::flush;
      if (!std::getline(std::cin, line)) break;
      if (line.empty()) continue;

      if (line == "/exit" || line == "/quit") break;
      if (line == "/clear") {
        sessions.close(session_id);
        session_id = sessions.new_session();
        set_current(&sessions, session_id);
        std::cout << "Started a new session.\n";
        continue;
      }

      auto result = run_prompt(sessions, session_id, line);
      print_result(result);
      exit_code = exit_code_for(result.stop_reason);
    }
  }

  set_current(nullptr, "");
  mcp_registry.cleanup();
  spdlog::shutdown();
  return exit_code;
}
