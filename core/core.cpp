#include "core/core.hpp"

#include <chrono>
#include <list>

#include "glog/logging.h"

namespace core {

void Core::ThreadBody() {
  while (!quitting_) {
    std::unique_lock<std::mutex> lck(task_mutex_);
    while (!quitting_ && tasks_.empty()) {
      task_ready_.wait(lck);
    }
    if (quitting_) break;
    std::packaged_task<TaskStatus()> task = std::move(tasks_.front());
    tasks_.pop();
    lck.unlock();
    task();
  }
}

TaskStatus Core::RunJob(Job* job) {
  VLOG(1) << "Starting " << job->Description();
  try {
    job->run_();
    return TaskStatus::Success(job);
  } catch (const std::exception& exc) {
    LOG(ERROR) << job->Description() << " failed: " << exc.what();
    return TaskStatus::Failure(job, exc.what());
  }
}

bool Core::Run() {
  std::vector<std::thread> threads(num_workers_);
  quitting_ = false;
  for (int i = 0; i < num_workers_; i++)
    threads[i] = std::thread(std::bind(&Core::ThreadBody, this));

  auto cleanup = [this, &threads]() {
    quitting_ = true;
    task_ready_.notify_all();
    for (std::thread& thread : threads) thread.join();
  };

  auto add_task = [this](std::packaged_task<TaskStatus()> task) {
    std::lock_guard<std::mutex> lck(task_mutex_);
    tasks_.push(std::move(task));
    task_ready_.notify_all();
  };

  std::queue<Job*> pending;
  for (const auto& job : jobs_) pending.push(job.get());
  std::list<RunningJob> running;
  bool ok = true;

  try {
    while (ok && (!pending.empty() || !running.empty())) {
      while (ok && !stopping_ && !pending.empty() &&
             running.size() < threads.size()) {
        Job* job = pending.front();
        pending.pop();
        if (!job->callback_(TaskStatus::Start(job))) {
          LOG(ERROR) << "Job start failed: " << job->Description();
          ok = false;
          break;
        }
        std::packaged_task<TaskStatus()> task(
            std::bind(&Core::RunJob, this, job));
        running.push_back(RunningJob{job, task.get_future()});
        add_task(std::move(task));
      }
      while (ok && stopping_ && !pending.empty()) {
        Job* job = pending.front();
        pending.pop();
        ok = job->callback_(TaskStatus::Skipped(job));
      }
      for (auto it = running.begin(); ok && it != running.end();) {
        if (it->future.wait_for(std::chrono::milliseconds(10)) !=
            std::future_status::ready) {
          ++it;
          continue;
        }
        TaskStatus answer = it->future.get();
        it = running.erase(it);
        if (!answer.job->callback_(answer)) {
          LOG(ERROR) << "Job failed: " << answer.job->Description();
          ok = false;
        }
      }
    }
    // Workers finish the job they are running before quitting.
    if (!running.empty()) {
      LOG(WARNING) << "Waiting for " << running.size() << " running jobs";
      for (RunningJob& job : running) job.future.wait();
    }
  } catch (std::exception& e) {
    cleanup();
    throw std::runtime_error(e.what());
  }
  cleanup();
  return ok;
}

}  // namespace core
