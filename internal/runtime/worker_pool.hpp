#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "task_queue.hpp"

namespace rollout::runtime {

/*
  Fixed set of threads draining one TaskQueue.

  Tasks report their own results; an exception escaping a task is
  logged and does not stop the worker or its siblings.
*/
class WorkerPool {
 public:
  WorkerPool(std::size_t workers, std::string name);
  ~WorkerPool();

  WorkerPool(const WorkerPool&)            = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  void Submit(Task task);

  // Runs every queued task to completion, then joins the workers.
  void Stop();

 private:
  void Run();

  std::string                name_;
  std::shared_ptr<TaskQueue> queue_;
  std::vector<std::thread>   threads_;
};

// Runs all tasks with at most `parallelism` in flight and returns when
// every one has finished.
void RunBounded(std::vector<Task> tasks, std::size_t parallelism, const std::string& name);

} // namespace rollout::runtime
