#include "genledger/process_client.hpp"

#include "genledger/observability.hpp"

#ifndef _WIN32
#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

#include <algorithm>
#include <chrono>
#include <thread>
#include <utility>

namespace genledger {

namespace {

constexpr size_t kErrorTextMax = 240;

#ifndef _WIN32
void append_limited(std::string& dst, const char* src, ssize_t n, size_t limit, bool& truncated) {
  if (n <= 0) return;
  const size_t avail = dst.size() < limit ? limit - dst.size() : 0;
  const size_t take = std::min<size_t>(static_cast<size_t>(n), avail);
  dst.append(src, take);
  if (take < static_cast<size_t>(n)) truncated = true;
}
#endif

std::string first_line(const std::string& s) {
  std::string line = s.substr(0, s.find('\n'));
  if (line.size() > kErrorTextMax) line.resize(kErrorTextMax);
  return line;
}

}  // namespace

#ifndef _WIN32

ProcessResult run_process(const ProcessSpec& spec) {
  ProcessResult result;
  int out_pipe[2];
  int err_pipe[2];
  if (pipe(out_pipe) != 0) {
    result.error_message = "spawn_failed";
    return result;
  }
  if (pipe(err_pipe) != 0) {
    close(out_pipe[0]);
    close(out_pipe[1]);
    result.error_message = "spawn_failed";
    return result;
  }

  // argv is built before fork; the child only touches async-signal-safe calls.
  std::vector<std::string> all = {spec.command};
  all.insert(all.end(), spec.argv.begin(), spec.argv.end());
  std::vector<char*> argv;
  argv.reserve(all.size() + 1);
  for (auto& s : all) argv.push_back(s.data());
  argv.push_back(nullptr);

  pid_t pid = fork();
  if (pid < 0) {
    close(out_pipe[0]);
    close(out_pipe[1]);
    close(err_pipe[0]);
    close(err_pipe[1]);
    result.error_message = "spawn_failed";
    return result;
  }

  if (pid == 0) {
    setsid();
    dup2(out_pipe[1], STDOUT_FILENO);
    dup2(err_pipe[1], STDERR_FILENO);
    close(out_pipe[0]);
    close(out_pipe[1]);
    close(err_pipe[0]);
    close(err_pipe[1]);
    execv(spec.command.c_str(), argv.data());
    _exit(127);
  }

  close(out_pipe[1]);
  close(err_pipe[1]);
  fcntl(out_pipe[0], F_SETFL, O_NONBLOCK);
  fcntl(err_pipe[0], F_SETFL, O_NONBLOCK);

  const auto deadline =
      std::chrono::steady_clock::now() + std::chrono::milliseconds(spec.timeout_ms);
  char buf[4096];
  int status = 0;
  while (true) {
    ssize_t n = read(out_pipe[0], buf, sizeof(buf));
    append_limited(result.stdout_text, buf, n, spec.max_output_bytes, result.stdout_truncated);
    n = read(err_pipe[0], buf, sizeof(buf));
    append_limited(result.stderr_text, buf, n, spec.max_output_bytes, result.stderr_truncated);

    if (waitpid(pid, &status, WNOHANG) == pid) break;
    if (std::chrono::steady_clock::now() >= deadline) {
      kill(-pid, SIGKILL);
      kill(pid, SIGKILL);
      waitpid(pid, &status, 0);
      result.timed_out = true;
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }

  while (true) {
    ssize_t n = read(out_pipe[0], buf, sizeof(buf));
    if (n <= 0) break;
    append_limited(result.stdout_text, buf, n, spec.max_output_bytes, result.stdout_truncated);
  }
  while (true) {
    ssize_t n = read(err_pipe[0], buf, sizeof(buf));
    if (n <= 0) break;
    append_limited(result.stderr_text, buf, n, spec.max_output_bytes, result.stderr_truncated);
  }
  close(out_pipe[0]);
  close(err_pipe[0]);

  if (result.timed_out) {
    result.exit_code = 124;
  } else if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exit_code = 128 + WTERMSIG(status);
  }
  return result;
}

#else

ProcessResult run_process(const ProcessSpec&) {
  ProcessResult result;
  result.error_message = "spawn_failed";
  return result;
}

#endif

// ---------------------------------------------------------------------------
// ProcessJobClient
// ---------------------------------------------------------------------------

ProcessJobClient::ProcessJobClient(std::string command, uint64_t timeout_ms)
    : command_(std::move(command)), timeout_ms_(timeout_ms) {}

std::string ProcessJobClient::invoke(const std::vector<std::string>& args,
                                     std::string& out) const {
  ProcessSpec spec;
  spec.command = command_;
  spec.argv = args;
  spec.timeout_ms = timeout_ms_;
  ProcessResult pr = run_process(spec);
  if (!pr.error_message.empty()) return "provider " + pr.error_message;
  if (pr.timed_out) return "provider timeout after " + std::to_string(timeout_ms_) + "ms";
  if (pr.stdout_truncated) return "provider response exceeds output limit";
  if (pr.exit_code != 0) {
    std::string msg = "provider exit " + std::to_string(pr.exit_code);
    const std::string detail = first_line(pr.stderr_text);
    if (!detail.empty()) msg += ": " + detail;
    return msg;
  }
  out = std::move(pr.stdout_text);
  return "";
}

CreateJobResult ProcessJobClient::create(const CreateJobRequest& req) {
  std::string out;
  const std::string err = invoke({"create", create_request_to_json(req)}, out);
  if (!err.empty()) {
    log(LogLevel::warn, "provider", "create failed: " + err);
    CreateJobResult r;
    r.error = err;
    return r;
  }
  return parse_create_response(out);
}

PollResult ProcessJobClient::poll(const std::string& job_handle) {
  std::string out;
  const std::string err = invoke({"poll", job_handle}, out);
  if (!err.empty()) {
    log(LogLevel::warn, "provider", "poll " + job_handle + " failed: " + err);
    PollResult r;
    r.error = err;
    return r;
  }
  return parse_poll_response(out);
}

std::string ProcessJobClient::client_id() const { return "process:" + command_; }

}  // namespace genledger
