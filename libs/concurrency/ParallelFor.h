#pragma once

#include <cstdint>
#include <vector>
#include <future>
#include <algorithm>
#include "IParallelExecutor.h"

namespace concurrency {

  // Split [0, total) into at most exec.getConcurrency() contiguous chunks,
  // submit one task per chunk and wait for all of them. body(i) is called
  // exactly once for every i. Any exception thrown by body is rethrown
  // here after every chunk has finished.
  template<typename Body>
  void parallel_for(uint32_t total, IParallelExecutor& exec, Body body) {
    if (total == 0) return;

    const uint32_t numTasks = static_cast<uint32_t>(std::max<std::size_t>(1, exec.getConcurrency()));
    const uint32_t chunkSize = (total + numTasks - 1) / numTasks;

    std::vector<std::future<void>> futures;
    futures.reserve(numTasks);
    for (uint32_t start = 0; start < total; start += chunkSize)
      {
	const uint32_t end = std::min(total, start + chunkSize);
	futures.emplace_back(exec.submit([=]() {
	      for (uint32_t i = start; i < end; ++i)
		body(i);
	    }));
      }
    exec.waitAll(futures);
  }

  // Calls body(container[i]) for every element; see parallel_for.
  template<typename Container, typename Body>
  void parallel_for_each(IParallelExecutor& exec, const Container& container, Body body) {
    parallel_for(static_cast<uint32_t>(container.size()), exec,
		 [&container, body](uint32_t i) { body(container[i]); });
  }
}
