// vim: set sts=4 ts=8 sw=4 tw=99 et:
//
// Copyright (C) 2016-2020 David Anderson
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

namespace wardcast {

// Fixed set of workers draining a FIFO queue. Completion callbacks are handed
// back to whichever thread calls RunCompletionTasks().
class ThreadPool
{
  public:
    explicit ThreadPool(unsigned int n) {
        if (n == 0)
            n = 1;
        threads_.resize(n);
        for (size_t i = 0; i < n; i++)
            threads_[i] = std::make_unique<std::thread>([this]() -> void { Work(); });
    }

    ~ThreadPool() {
        Stop();
    }

    void Do(std::function<void()> fn, std::function<void()> completion = {}) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_)
            return;
        work_.emplace_back(std::move(fn), std::move(completion));
        work_cv_.notify_one();
    }

    // Blocks until the queue and every running task have drained, running
    // completion callbacks on the calling thread as they arrive.
    void RunCompletionTasks() {
        std::unique_lock<std::mutex> lock(mutex_);
        for (;;) {
            while (completion_.empty()) {
                if (work_.empty() && !in_progress_)
                    return;
                completion_cv_.wait(lock);
            }

            auto fn = std::move(completion_.front());
            completion_.pop_front();
            lock.unlock();

            fn();

            lock.lock();
        }
    }

    // Drops every queued task that has not started. Tasks already running
    // finish normally; later calls to Do() are ignored until Reset().
    void Cancel() {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
        work_.clear();
        completion_cv_.notify_all();
    }

    void Reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = false;
    }

    bool cancelled() {
        std::lock_guard<std::mutex> lock(mutex_);
        return cancelled_;
    }

    void Stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            shutdown_ = true;
        }
        work_cv_.notify_all();

        for (const auto& thread : threads_)
            thread->join();
        threads_.clear();
    }

    size_t NumThreads() const { return threads_.size(); }

  private:
    void Work() {
        std::unique_lock<std::mutex> lock(mutex_);
        for (;;) {
            while (work_.empty() && !shutdown_)
                work_cv_.wait(lock);

            if (shutdown_)
                break;

            auto task = std::move(work_.front());
            work_.pop_front();
            in_progress_++;
            lock.unlock();

            task.first();

            lock.lock();
            if (task.second)
                completion_.emplace_back(std::move(task.second));
            in_progress_--;
            completion_cv_.notify_one();
        }
    }

  private:
    bool shutdown_ = false;
    bool cancelled_ = false;
    size_t in_progress_ = 0;
    std::mutex mutex_;
    std::condition_variable work_cv_;
    std::condition_variable completion_cv_;
    std::vector<std::unique_ptr<std::thread>> threads_;
    std::deque<std::pair<std::function<void()>, std::function<void()>>> work_;
    std::deque<std::function<void()>> completion_;
};

} // namespace wardcast
