#ifndef SKILLBENCH_CORE_WORKER_SET_HPP_
#define SKILLBENCH_CORE_WORKER_SET_HPP_

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

namespace skillbench::core {

// Owns background threads launched by a service. Finished threads are joined
// lazily on the next launch; WaitIdle joins everything still alive, including
// threads launched while it waits.
class WorkerSet {
public:
  WorkerSet() = default;
  ~WorkerSet() {
    WaitIdle();
  }

  WorkerSet(const WorkerSet&) = delete;
  WorkerSet& operator=(const WorkerSet&) = delete;

  void Launch(std::function<void()> body) {
    ReapFinished();
    auto done = std::make_shared<std::atomic<bool>>(false);
    std::thread thread([body = std::move(body), done]() {
      body();
      done->store(true);
    });
    std::lock_guard<std::mutex> lock(mu_);
    workers_.push_back(Worker{std::move(thread), done});
  }

  void WaitIdle() {
    for (;;) {
      std::vector<Worker> pending;
      {
        std::lock_guard<std::mutex> lock(mu_);
        pending.swap(workers_);
      }
      if (pending.empty()) {
        return;
      }
      for (Worker& worker : pending) {
        Join(worker);
      }
    }
  }

private:
  struct Worker {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  // A callback running on a worker may itself launch or wait; never join the
  // calling thread.
  static void Join(Worker& worker) {
    if (worker.thread.get_id() == std::this_thread::get_id()) {
      worker.thread.detach();
      return;
    }
    worker.thread.join();
  }

  void ReapFinished() {
    std::vector<Worker> finished;
    {
      std::lock_guard<std::mutex> lock(mu_);
      for (auto it = workers_.begin(); it != workers_.end();) {
        if (it->done->load()) {
          finished.push_back(std::move(*it));
          it = workers_.erase(it);
        } else {
          ++it;
        }
      }
    }
    for (Worker& worker : finished) {
      Join(worker);
    }
  }

  std::mutex mu_;
  std::vector<Worker> workers_;
};

} // namespace skillbench::core

#endif // SKILLBENCH_CORE_WORKER_SET_HPP_
