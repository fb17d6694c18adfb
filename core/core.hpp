#ifndef CORE_CORE_HPP
#define CORE_CORE_HPP

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

#include "core/task_status.hpp"

namespace core {

// A unit of work run by the core on one of its workers.
class Job {
 public:
  using callback_t = std::function<bool(const TaskStatus&)>;

  const std::string& Description() const { return description_; }

 private:
  friend class Core;
  Job(std::string description, std::function<void()> run, callback_t callback)
      : description_(std::move(description)),
        run_(std::move(run)),
        callback_(std::move(callback)) {}

  std::string description_;
  std::function<void()> run_;
  callback_t callback_;
};

// Runs jobs on a fixed pool of worker threads. Callbacks are called on the
// thread calling Run, once when the job starts and once when it ends;
// returning false from a callback makes Run stop and return false.
class Core {
 public:
  Job* AddJob(const std::string& description, std::function<void()> run,
              Job::callback_t callback) {
    jobs_.push_back(std::unique_ptr<Job>(
        new Job(description, std::move(run), std::move(callback))));
    return jobs_.back().get();
  }

  void SetNumWorkers(int32_t num_workers) {
    num_workers_ = num_workers;
    if (num_workers_ <= 0) {
      num_workers_ = std::thread::hardware_concurrency();
    }
  }

  // Makes Run start no further job. Jobs already running are waited for,
  // the others are reported as SKIPPED. Can be called from any thread.
  void Stop() { stopping_ = true; }

  bool Run();

  Core() : num_workers_(1) {}

 private:
  struct RunningJob {
    Job* job;
    std::future<TaskStatus> future;
  };

  std::vector<std::unique_ptr<Job>> jobs_;

  std::queue<std::packaged_task<TaskStatus()>> tasks_;
  std::mutex task_mutex_;
  std::condition_variable task_ready_;
  std::atomic<bool> quitting_{false};
  std::atomic<bool> stopping_{false};

  int num_workers_;

  TaskStatus RunJob(Job* job);

  void ThreadBody();
};

}  // namespace core

#endif
