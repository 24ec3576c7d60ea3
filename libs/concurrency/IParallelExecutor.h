#pragma once
#include <cstddef>
#include <future>
#include <vector>
#include <functional>

namespace concurrency
{
  /**
   * @brief Policy interface for running independent tasks.
   *
   * Tasks submitted to an executor must not share mutable state; each
   * backtest run owns its own ledger and result.
   */
  class IParallelExecutor
  {
  public:
    virtual ~IParallelExecutor() = default;

    // Schedule a void() task; its exception, if any, is rethrown by get().
    virtual std::future<void> submit(std::function<void()> task) = 0;

    // Number of tasks that may run at the same time.
    virtual std::size_t getConcurrency() const = 0;

    // Wait for every future, then rethrow the first exception seen.
    virtual void waitAll(std::vector<std::future<void>>& futures)
    {
      std::exception_ptr firstError;
      for (auto& f : futures)
	{
	  try
	    {
	      f.get();
	    }
	  catch (...)
	    {
	      if (!firstError)
		firstError = std::current_exception();
	    }
	}

      if (firstError)
	std::rethrow_exception(firstError);
    }
  };
}
