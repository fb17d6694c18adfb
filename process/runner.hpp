#ifndef PROCESS_RUNNER_HPP
#define PROCESS_RUNNER_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace process {

// Settings to run a host program.
struct ExecutionOptions {
  // Optional values
  int64_t wall_limit_millis = 0;

  std::string stdin_file = "";
  std::string stdout_file = "";
  std::string stderr_file = "";
  std::vector<std::string> args;

  // Required values
  std::string root = "";
  std::string executable = "";
  ExecutionOptions(std::string root, std::string executable)
      : root(std::move(root)), executable(std::move(executable)) {}
};

// Results of the execution.
struct ExecutionInfo {
  int64_t cpu_time_millis = 0;
  int64_t sys_time_millis = 0;
  int64_t wall_time_millis = 0;
  int32_t status_code = 0;
  int32_t signal = 0;
  // The wall limit expired and the process group was killed.
  bool timed_out = false;
};

// Runner interface. Implementations need to register themselves by creating a
// global object of type Runner::Register<RunnerImpl> and should define the
// Create and Score static functions. Create should return a pointer to a newly
// allocated instance of the given implementation, while Score should return a
// value that defines how "good" that runner is: negative if the runner
// should not/cannot be used in the current configuration, positive otherwise
// (a bigger value means a better runner).
// Registering a runner is not thread-safe and should be done before any
// threads are created.
class Runner {
 public:
  using create_t = std::function<Runner*()>;
  using score_t = std::function<int()>;
  static std::unique_ptr<Runner> Create();

  // Runs the specified command. Returns true if the program was started,
  // and sets fields in info. Otherwise, returns false and sets error_msg.
  // A single Runner must not be used by more than one thread at a time.
  virtual bool Execute(const ExecutionOptions& options, ExecutionInfo* info,
                       std::string* error_msg) = 0;

  // Constructor and destructors
  virtual ~Runner() = default;
  Runner() = default;
  Runner(const Runner&) = delete;
  Runner(Runner&&) = delete;
  Runner& operator=(const Runner&) = delete;
  Runner& operator=(Runner&&) = delete;

  template <typename T>
  class Register {
   public:
    Register() { Runner::Register_(&T::Create, &T::Score); }
  };

 private:
  using store_t = std::vector<std::pair<create_t, score_t>>;
  static store_t* Runners_();
  static void Register_(create_t, score_t);
  template <typename T>
  friend class Register;
};

}  // namespace process

#endif
