#pragma once

#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <queue>

namespace rollout::runtime {

using Task = std::function<void()>;

/*
  Thread-safe blocking queue for pool workers.

  After Shutdown() queued tasks are still handed out; Dequeue returns
  nullopt only once the queue is drained.
*/
class TaskQueue {
 public:
  void Enqueue(Task task);

  // blocking wait
  std::optional<Task> Dequeue();

  void Shutdown();

 private:
  std::mutex              mutex_;
  std::condition_variable cv_;
  std::queue<Task>        queue_;
  bool                    shutdown_ = false;
};

} // namespace rollout::runtime
