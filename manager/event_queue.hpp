#ifndef MANAGER_EVENT_QUEUE_HPP
#define MANAGER_EVENT_QUEUE_HPP

#include <queue>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"
#include "absl/types/optional.h"
#include "proto/event.pb.h"

namespace manager {

// Progress of the workers, consumed by the main thread.
class EventQueue {
 public:
  void FatalError(const std::string& message) {
    proto::Event event;
    event.mutable_fatal_error()->set_msg(message);
    Enqueue(std::move(event));
  }
  void InstanceStarted(const std::string& instance_id) {
    proto::Event event;
    event.mutable_instance_started()->set_instance_id(instance_id);
    Enqueue(std::move(event));
  }
  void Provisioning(const std::string& instance_id) {
    Phase(instance_id, proto::PROVISIONING);
  }
  void Authoring(const std::string& instance_id) {
    Phase(instance_id, proto::AUTHORING);
  }
  void Extracting(const std::string& instance_id) {
    Phase(instance_id, proto::EXTRACTING);
  }
  void Grading(const std::string& instance_id) {
    Phase(instance_id, proto::GRADING);
  }
  void InstanceFinished(const proto::InstanceResult& result) {
    proto::Event event;
    *event.mutable_instance_finished()->mutable_result() = result;
    Enqueue(std::move(event));
  }
  // Blocks until an event is available. Returns nothing once the queue is
  // stopped and drained.
  absl::optional<proto::Event> Dequeue();
  void Stop();
  bool IsStopped() {
    absl::MutexLock lck(&queue_mutex_);
    return stopped_;
  }

 private:
  absl::Mutex queue_mutex_;
  std::queue<proto::Event> queue_ GUARDED_BY(queue_mutex_);
  bool stopped_ GUARDED_BY(queue_mutex_) = false;
  void Enqueue(proto::Event&& event);
  void Phase(const std::string& instance_id, proto::InstancePhase phase) {
    proto::Event event;
    auto* sub_event = event.mutable_instance_phase();
    sub_event->set_instance_id(instance_id);
    sub_event->set_phase(phase);
    Enqueue(std::move(event));
  }
};

}  // namespace manager

#endif
