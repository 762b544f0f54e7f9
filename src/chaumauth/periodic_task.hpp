#pragma once

#ifndef CHAUMAUTH_PERIODIC_TASK_HPP
#define CHAUMAUTH_PERIODIC_TASK_HPP

#include <chrono>              // for milliseconds
#include <condition_variable>  // for condition_variable_any
#include <functional>          // for function
#include <mutex>               // for mutex, unique_lock
#include <stop_token>          // for stop_token
#include <thread>              // for jthread
#include <utility>             // for move

namespace chaumauth {

// Runs task every interval on a background thread until destroyed. The
// destructor wakes the thread up instead of waiting for the next tick.
class PeriodicTask {
 public:
  PeriodicTask(std::function<void()> task, std::chrono::milliseconds interval)
      : _task(std::move(task)),
        _interval(interval),
        _thread([this](std::stop_token const &stop) { run(stop); }) {}

  PeriodicTask(PeriodicTask const &) = delete;
  auto operator=(PeriodicTask const &) -> PeriodicTask & = delete;

  ~PeriodicTask() {
    _thread.request_stop();
    _thread.join();
  }

 private:
  auto run(std::stop_token const &stop) -> void {
    std::mutex mutex;
    while (not stop.stop_requested()) {
      {
        std::unique_lock lock{mutex};
        // returns early once a stop is requested
        static_cast<void>(
            _wakeup.wait_for(lock, stop, _interval, [] { return false; }));
      }
      if (stop.stop_requested()) {
        break;
      }
      _task();
    }
  }

  std::function<void()> _task;
  std::chrono::milliseconds _interval;
  std::condition_variable_any _wakeup;
  // last member: the thread must start after everything it reads
  std::jthread _thread;
};

}  // namespace chaumauth

#endif /* CHAUMAUTH_PERIODIC_TASK_HPP */
