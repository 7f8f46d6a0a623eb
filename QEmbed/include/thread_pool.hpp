/*
 * Copyright (c) 2023, NVIDIA CORPORATION.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */
#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace QEmbed {

class ThreadPool final {
 public:
  ThreadPool(const std::string& name);

  ThreadPool(const std::string& name, size_t num_workers);

  ThreadPool(const ThreadPool&) = delete;

  ~ThreadPool();

  ThreadPool& operator=(const ThreadPool&) = delete;

  const std::string& name() const { return name_; }

  size_t size() const { return workers_.size(); }

  void await_idle() const;

  std::future<void> submit(std::function<void()> task);

  /**
   * Waits for every future in [first, last) and rethrows the first exception encountered, after
   * all of them have completed.
   */
  template <typename TInputIterator>
  static void await(TInputIterator first, const TInputIterator& last);

 private:
  const std::string name_;
  std::vector<std::thread> workers_;

  mutable std::mutex barrier_;  // Must be obtained to ensure exclusive access.
  mutable std::condition_variable
      submit_semaphore_;  // Triggered on submission. Workers wait for this.
  mutable std::condition_variable idle_semaphore_;  // Triggered when a worker becomes idle.

  bool terminate_{false};  // Used to signal to the workers that termination is imminent.
  size_t num_idle_workers_{0};
  std::deque<std::packaged_task<void()>>
      packages_;  // Work packages that have not been processed yet.

  void run_(const size_t thread_index);
};

template <typename TInputIterator>
void ThreadPool::await(TInputIterator first, const TInputIterator& last) {
  std::exception_ptr first_error;
  for (; first != last; ++first) {
    try {
      first->get();
    } catch (...) {
      if (!first_error) {
        first_error = std::current_exception();
      }
    }
  }
  if (first_error) {
    std::rethrow_exception(first_error);
  }
}

}  // namespace QEmbed
