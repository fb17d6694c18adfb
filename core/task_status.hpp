#ifndef CORE_TASK_STATUS_HPP
#define CORE_TASK_STATUS_HPP

#include <string>

namespace core {

class Job;

struct TaskStatus {
  // SKIPPED is reported for jobs that never started because the core was
  // stopped.
  enum Event { START, SUCCESS, FAILURE, SKIPPED };
  Event event;
  std::string message;
  Job* job;

  TaskStatus() = delete;
  TaskStatus(Event event, std::string message, Job* job)
      : event(event), message(std::move(message)), job(job) {}

 private:
  friend class Core;
  static TaskStatus Start(Job* job) { return TaskStatus(START, "", job); }
  static TaskStatus Success(Job* job) { return TaskStatus(SUCCESS, "", job); }
  static TaskStatus Failure(Job* job, const std::string& msg) {
    return TaskStatus(FAILURE, msg, job);
  }
  static TaskStatus Skipped(Job* job) { return TaskStatus(SKIPPED, "", job); }
};

}  // namespace core

#endif
