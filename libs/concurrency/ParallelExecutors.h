#pragma once

#include "IParallelExecutor.h"
#include <future>
#include <thread>
#include <vector>
#include <functional>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <stdexcept>
#include <exception>
#include <system_error>

/**
 * @file ParallelExecutors.h
 * @brief Executor policies used to run parameter sweeps.
 *
 *  - SingleThreadExecutor: runs tasks inline on the calling thread.
 *  - StdAsyncExecutor: one std::async(std::launch::async) per task.
 *  - ThreadPoolExecutor<N>: a fixed pool of N worker threads.
 *
 * A sweep gives the same results under every policy; only the wall-clock
 * time differs. SingleThreadExecutor is the one to use in unit tests and
 * when debugging a single run.
 */
namespace concurrency
{
  inline std::size_t defaultThreadCount()
  {
    const unsigned hw = std::thread::hardware_concurrency();
    return hw ? hw : 2;
  }

  /**
   * @brief Executes tasks synchronously on the calling thread.
   */
  class SingleThreadExecutor : public IParallelExecutor {
  public:
    std::future<void> submit(std::function<void()> task) override {
      std::promise<void> prom;
      auto fut = prom.get_future();
      try {
	task();
	prom.set_value();
      } catch (...) {
	prom.set_exception(std::current_exception());
      }
      return fut;
    }

    std::size_t getConcurrency() const override {
      return 1;
    }
  };

  /**
   * @brief Executor policy using std::async for each task.
   *
   * Each submit may start a new thread, so this suits a small number of
   * long runs (a coarse sweep over a long series) rather than many short ones.
   */
  class StdAsyncExecutor : public IParallelExecutor {
  public:
    std::future<void> submit(std::function<void()> task) override {
      return std::async(std::launch::async, std::move(task));
    }

    std::size_t getConcurrency() const override {
      return defaultThreadCount();
    }
  };

  /**
   * @brief Fixed-size thread pool executor.
   *
   * Tasks are queued and executed by the worker threads in submission order.
   * With N == 0 the pool size is picked at runtime from
   * std::thread::hardware_concurrency() (2 if that is unknown), unless a
   * positive count is passed to the constructor.
   */
  template <std::size_t N = 0>
  class ThreadPoolExecutor : public IParallelExecutor {
  public:
    ThreadPoolExecutor(const ThreadPoolExecutor&) = delete;
    ThreadPoolExecutor& operator=(const ThreadPoolExecutor&) = delete;
    ThreadPoolExecutor(ThreadPoolExecutor&&) = delete;
    ThreadPoolExecutor& operator=(ThreadPoolExecutor&&) = delete;

    explicit ThreadPoolExecutor(std::size_t numThreads = 0) : stop_(false)
    {
      const std::size_t threads = (N > 0) ? N : ((numThreads > 0) ? numThreads : defaultThreadCount());

      try {
	for (std::size_t i = 0; i < threads; ++i) {
	  workers_.emplace_back([this] { workerLoop(); });
	}
      }
      catch (const std::system_error&) {
	shutdown();
	throw;
      }
    }

    ~ThreadPoolExecutor()
    {
      shutdown();
    }

    std::future<void> submit(std::function<void()> task) override
    {
      auto packaged = std::make_shared<std::packaged_task<void()>>(std::move(task));
      auto fut = packaged->get_future();
      {
	std::unique_lock<std::mutex> lock(tasksMutex_);
	if (stop_)
	  throw std::runtime_error("ThreadPoolExecutor::submit - pool is stopped");
	tasks_.emplace([packaged]() { (*packaged)(); });
      }
      condition_.notify_one();
      return fut;
    }

    std::size_t getConcurrency() const override
    {
      return workers_.size();
    }

  private:
    void workerLoop()
    {
      for (;;) {
	std::function<void()> task;
	{
	  std::unique_lock<std::mutex> lock(tasksMutex_);
	  condition_.wait(lock, [this]{ return stop_ || !tasks_.empty(); });
	  if (stop_ && tasks_.empty()) return;
	  task = std::move(tasks_.front());
	  tasks_.pop();
	}
	// packaged_task stores any exception in the task's future
	task();
      }
    }

    void shutdown()
    {
      {
	std::unique_lock<std::mutex> lock(tasksMutex_);
	stop_ = true;
      }
      condition_.notify_all();
      for (auto &worker : workers_) {
	if (worker.joinable())
	  worker.join();
      }
    }

  private:
    std::vector<std::thread>          workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex                        tasksMutex_;
    std::condition_variable           condition_;
    bool                              stop_;
  };
} // namespace concurrency
