#pragma once

#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <utility>

namespace statebus {

// Owner's view of one piece of background work. StateStore keeps these
// for mutate_async() and joins them when it is disposed.
struct TaskHandle {
  virtual ~TaskHandle() = default;
  virtual void join() = 0;
  virtual bool joinable() const = 0;
};

// Decides where mutate_async() work runs; supplied through StoreOptions
struct TaskProvider {
  virtual ~TaskProvider() = default;
  virtual std::unique_ptr<TaskHandle> create_task(
      std::function<void()> task_function,
      const std::string& task_name = "") = 0;
};

// One std::thread per task
class StdThreadProvider : public TaskProvider {
 public:
  class StdTaskHandle : public TaskHandle {
   public:
    explicit StdTaskHandle(std::thread&& t) : thread_(std::move(t)) {}

    ~StdTaskHandle() override { join(); }

    // A task that ends up releasing its own handle cannot wait for itself,
    // so the thread is let go instead
    void join() override {
      if (!thread_.joinable()) return;
      if (thread_.get_id() == std::this_thread::get_id()) {
        thread_.detach();
      } else {
        thread_.join();
      }
    }

    bool joinable() const override { return thread_.joinable(); }

   private:
    std::thread thread_;
  };

  std::unique_ptr<TaskHandle> create_task(
      std::function<void()> task_function,
      const std::string& /*task_name*/) override {
    return std::make_unique<StdTaskHandle>(
        std::thread(std::move(task_function)));
  }
};

// Runs the task inline on the calling thread
class SequentialTaskProvider : public TaskProvider {
 public:
  struct FinishedHandle : TaskHandle {
    void join() override {}
    bool joinable() const override { return false; }
  };

  std::unique_ptr<TaskHandle> create_task(
      std::function<void()> task_function,
      const std::string& /*task_name*/) override {
    task_function();
    return std::make_unique<FinishedHandle>();
  }
};

// Shared by every store built without an explicit provider
inline std::shared_ptr<TaskProvider> default_task_provider() {
  static auto provider = std::make_shared<StdThreadProvider>();
  return provider;
}

}  // namespace statebus
