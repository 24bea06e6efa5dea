#include "worker_pool.hpp"

#include <algorithm>
#include <exception>

#include "internal/observability/logging.hpp"

namespace rollout::runtime {

WorkerPool::WorkerPool(std::size_t workers, std::string name)
    : name_(std::move(name)), queue_(std::make_shared<TaskQueue>()) {
  workers = std::max<std::size_t>(workers, 1);
  threads_.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) {
    threads_.emplace_back(&WorkerPool::Run, this);
  }
}

WorkerPool::~WorkerPool() {
  Stop();
}

void WorkerPool::Submit(Task task) {
  queue_->Enqueue(std::move(task));
}

void WorkerPool::Stop() {
  queue_->Shutdown();
  for (auto& thread : threads_) {
    if (thread.joinable()) thread.join();
  }
  threads_.clear();
}

void WorkerPool::Run() {
  while (auto task = queue_->Dequeue()) {
    try {
      (*task)();
    } catch (const std::exception& e) {
      observability::LogError("worker task failed",
                              {observability::StringField("pool", name_), observability::StringField("error", e.what())});
    }
  }
}

void RunBounded(std::vector<Task> tasks, std::size_t parallelism, const std::string& name) {
  if (tasks.empty()) return;

  WorkerPool pool(std::min(std::max<std::size_t>(parallelism, 1), tasks.size()), name);
  for (auto& task : tasks) {
    pool.Submit(std::move(task));
  }
  pool.Stop();
}

} // namespace rollout::runtime
