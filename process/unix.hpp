#ifndef PROCESS_UNIX_HPP
#define PROCESS_UNIX_HPP
#include <vector>

#include "process/runner.hpp"

namespace process {

// Runner for UNIX-like systems. The child gets its own session, so the wall
// limit kills every process it spawned.
class Unix : public Runner {
 public:
  bool Execute(const ExecutionOptions& options, ExecutionInfo* info,
               std::string* error_msg) override;
  static Runner* Create() { return new Unix(); }
  static int Score() { return 2; }

 protected:
  Unix() = default;

  // Executed before creating the child process. Returns false and sets
  // error_msg if setup fails.
  bool Setup(std::string* error_msg);

  // Creates a child process and saves its PID in child_pid_. The child process
  // should execute Child and must not return.
  virtual bool DoFork(std::string* error_msg);

  // Function that is executed in the child process.
  [[noreturn]] void Child();

  // Waits for the termination of the child, possibly killing it if it exceeds
  // the provided wall time limit.
  bool Wait(ExecutionInfo* info, std::string* error_msg);

  int pipe_fds_[2] = {};
  int child_pid_ = 0;
  const ExecutionOptions* options_ = nullptr;
  // Prepared in the parent, so that the child does not allocate.
  std::vector<std::vector<char>> arg_storage_;
  std::vector<char*> args_;
};

}  // namespace process
#endif
