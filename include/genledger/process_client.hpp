#pragma once

// genledger/process_client.hpp — Provider adapter that drives an external
// executable.
//
// Protocol (PROTOCOL_FRAMING_VERSION 1):
//   <command> create '<request json>'   → stdout: create response JSON
//   <command> poll <job_handle>         → stdout: poll response JSON
//   Exit code 0 = the response on stdout is authoritative. Anything else is a
//   transport failure; stderr (truncated) becomes the error text.
//
// The command is exec'd directly (no shell), so job handles and prompts are
// never shell-interpreted.
//
// POSIX only. On other platforms run_process() reports spawn_failed.

#include <cstdint>
#include <string>
#include <vector>

#include "genledger/remote_client.hpp"

namespace genledger {

struct ProcessSpec {
  std::string              command;
  std::vector<std::string> argv;
  uint64_t                 timeout_ms{30000};
  size_t                   max_output_bytes{1024 * 1024};
};

struct ProcessResult {
  int         exit_code{0};
  bool        timed_out{false};
  bool        stdout_truncated{false};
  bool        stderr_truncated{false};
  std::string stdout_text;
  std::string stderr_text;
  std::string error_message;   // spawn_failed when fork/pipe failed
};

// Timeout → SIGKILL to the process group, exit_code 124.
ProcessResult run_process(const ProcessSpec& spec);

class ProcessJobClient : public IRemoteJobClient {
 public:
  ProcessJobClient(std::string command, uint64_t timeout_ms);

  CreateJobResult create(const CreateJobRequest& req) override;
  PollResult poll(const std::string& job_handle) override;
  std::string client_id() const override;

 private:
  // "" on success, else a one-line failure description.
  std::string invoke(const std::vector<std::string>& args, std::string& out) const;

  std::string command_;
  uint64_t    timeout_ms_;
};

}  // namespace genledger
