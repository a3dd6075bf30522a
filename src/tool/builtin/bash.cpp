#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>

#include "builtins.hpp"

namespace stepagent::tools {

namespace {

constexpr size_t kMaxOutputBytes = 64 * 1024;

struct CommandOutput {
  std::string output;
  int exit_code = -1;
  bool timed_out = false;
  std::string error;
};

CommandOutput run_command(const std::string &command, const std::string &working_dir, std::chrono::seconds timeout) {
  CommandOutput result;

  int pipefd[2];
  if (pipe2(pipefd, O_CLOEXEC) < 0) {
    result.error = std::string("pipe failed: ") + std::strerror(errno);
    return result;
  }

  pid_t pid = fork();
  if (pid < 0) {
    result.error = std::string("fork failed: ") + std::strerror(errno);
    close(pipefd[0]);
    close(pipefd[1]);
    return result;
  }

  if (pid == 0) {
    setpgid(0, 0);
    int devnull = open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
      dup2(devnull, STDIN_FILENO);
      close(devnull);
    }
    dup2(pipefd[1], STDOUT_FILENO);
    dup2(pipefd[1], STDERR_FILENO);
    close(pipefd[0]);
    close(pipefd[1]);
    if (!working_dir.empty() && chdir(working_dir.c_str()) != 0) {
      _exit(126);
    }
    execl("/bin/sh", "sh", "-c", command.c_str(), static_cast<char *>(nullptr));
    _exit(127);
  }

  close(pipefd[1]);
  setpgid(pid, pid);

  auto deadline = std::chrono::steady_clock::now() + timeout;
  char buffer[4096];
  bool truncated = false;

  while (true) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    if (left.count() <= 0) {
      result.timed_out = true;
      break;
    }

    pollfd pfd{pipefd[0], POLLIN, 0};
    int ready = poll(&pfd, 1, static_cast<int>(std::min<int64_t>(left.count(), 100)));
    if (ready < 0) {
      if (errno == EINTR) continue;
      result.error = std::string("poll failed: ") + std::strerror(errno);
      break;
    }
    if (ready == 0) continue;

    ssize_t n = read(pipefd[0], buffer, sizeof(buffer));
    if (n < 0) {
      if (errno == EINTR) continue;
      break;
    }
    if (n == 0) break;  // EOF

    if (result.output.size() < kMaxOutputBytes) {
      result.output.append(buffer, std::min<size_t>(n, kMaxOutputBytes - result.output.size()));
    } else {
      truncated = true;
    }
  }
  close(pipefd[0]);

  if (result.timed_out || !result.error.empty()) {
    kill(-pid, SIGKILL);
  }

  int status = 0;
  while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
  }
  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exit_code = 128 + WTERMSIG(status);
  }

  if (truncated) {
    result.output += "\n... (output truncated)";
  }
  return result;
}

}  // namespace

// ============================================================================
// BashTool
// ============================================================================

BashTool::BashTool(std::string workspace_dir)
    : SimpleTool("bash", "Execute a shell command in the workspace directory and return its combined stdout/stderr."),
      workspace_dir_(std::move(workspace_dir)) {}

std::vector<ParameterSchema> BashTool::parameters() const {
  return {{"command", "string", "Shell command to execute", true, std::nullopt, std::nullopt},
          {"timeout", "integer", "Timeout in seconds (default 120, max 600)", false, json(kDefaultTimeoutSeconds), std::nullopt}};
}

std::future<ToolResult> BashTool::execute(const json &args) {
  return std::async(std::launch::async, [args, workspace = workspace_dir_]() -> ToolResult {
    std::string command = args.value("command", "");
    if (command.empty()) {
      return ToolResult::failure("command is required");
    }

    int timeout = args.value("timeout", kDefaultTimeoutSeconds);
    timeout = std::clamp(timeout, 1, kMaxTimeoutSeconds);

    spdlog::debug("[bash] {}", command);
    auto out = run_command(command, workspace, std::chrono::seconds(timeout));

    if (!out.error.empty()) {
      return ToolResult::failure(out.error);
    }
    if (out.timed_out) {
      return ToolResult::failure("Command timed out after " + std::to_string(timeout) + " seconds\n" + out.output);
    }

    std::string text = out.output.empty() ? "(no output)" : out.output;
    if (out.exit_code != 0) {
      return ToolResult::failure("Command exited with code " + std::to_string(out.exit_code) + "\n" + text);
    }
    return ToolResult::ok(text + "\n[exit code: 0]");
  });
}

}  // namespace stepagent::tools
