// Licensed to the Apache Software Foundation (ASF) under one
// or more contributor license agreements.  See the NOTICE file
// distributed with this work for additional information
// regarding copyright ownership.  The ASF licenses this file
// to you under the Apache License, Version 2.0 (the
// "License"); you may not use this file except in compliance
// with the License.  You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing,
// software distributed under the License is distributed on an
// "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
// KIND, either express or implied.  See the License for the
// specific language governing permissions and limitations
// under the License.

#include "util/threadpool.h"

#include <algorithm>
#include <climits>
#include <utility>

#include "common/logging.h"

namespace vigil {
#include "common/compile_check_begin.h"

class FunctionRunnable : public Runnable {
public:
    explicit FunctionRunnable(std::function<void()> func) : _func(std::move(func)) {}

    void run() override { _func(); }

private:
    std::function<void()> _func;
};

ThreadPoolBuilder::ThreadPoolBuilder(std::string name)
        : _name(std::move(name)),
          _min_threads(0),
          _max_threads(static_cast<int>(std::max(1U, std::thread::hardware_concurrency()))),
          _max_queue_size(INT_MAX) {}

ThreadPoolBuilder& ThreadPoolBuilder::set_min_threads(int min_threads) {
    _min_threads = min_threads;
    return *this;
}

ThreadPoolBuilder& ThreadPoolBuilder::set_max_threads(int max_threads) {
    _max_threads = max_threads;
    return *this;
}

ThreadPoolBuilder& ThreadPoolBuilder::set_max_queue_size(int max_queue_size) {
    _max_queue_size = max_queue_size;
    return *this;
}

Status ThreadPoolBuilder::build(std::unique_ptr<ThreadPool>* pool) const {
    if (_min_threads < 0) {
        return Status::InvalidArgument("min_threads of thread pool {} is negative: {}", _name,
                                       _min_threads);
    }
    if (_max_threads <= 0 || _max_threads < _min_threads) {
        return Status::InvalidArgument("invalid max_threads {} of thread pool {}, min_threads {}",
                                       _max_threads, _name, _min_threads);
    }
    if (_max_queue_size <= 0) {
        return Status::InvalidArgument("max_queue_size of thread pool {} must be positive: {}",
                                       _name, _max_queue_size);
    }
    std::unique_ptr<ThreadPool> new_pool(new ThreadPool(*this));
    RETURN_IF_ERROR(new_pool->init());
    *pool = std::move(new_pool);
    return Status::OK();
}

ThreadPool::ThreadPool(const ThreadPoolBuilder& builder)
        : _name(builder._name),
          _min_threads(builder._min_threads),
          _max_threads(builder._max_threads),
          _max_queue_size(builder._max_queue_size) {}

ThreadPool::~ThreadPool() {
    shutdown();
}

Status ThreadPool::init() {
    std::lock_guard<std::mutex> l(_lock);
    if (!_pool_status.is<ErrorCode::SERVICE_UNAVAILABLE>() || !_threads.empty()) {
        return Status::InternalError("Thread pool {} is already initialized", _name);
    }
    _pool_status = Status::OK();
    for (int i = 0; i < _min_threads; i++) {
        create_thread();
    }
    return Status::OK();
}

void ThreadPool::shutdown() {
    std::vector<std::thread> threads;
    {
        std::lock_guard<std::mutex> l(_lock);
        _pool_status = Status::Error<ErrorCode::SERVICE_UNAVAILABLE>(
                "The thread pool {} has been shut down.", _name);
        // Pending tasks are dropped, running ones are left to complete.
        _queue.clear();
        threads.swap(_threads);
        _not_empty_cond.notify_all();
        _idle_cond.notify_all();
    }

    for (auto& thread : threads) {
        if (thread.get_id() == std::this_thread::get_id()) {
            // shutdown() was called from one of our own tasks
            thread.detach();
        } else if (thread.joinable()) {
            thread.join();
        }
    }
}

Status ThreadPool::submit(std::shared_ptr<Runnable> r) {
    std::lock_guard<std::mutex> l(_lock);
    if (UNLIKELY(!_pool_status.ok())) {
        return _pool_status;
    }
    if (static_cast<int>(_queue.size()) >= _max_queue_size) {
        return Status::Error<ErrorCode::SERVICE_UNAVAILABLE>(
                "Thread pool {} is at capacity ({}/{} tasks queued)", _name, _queue.size(),
                _max_queue_size);
    }
    _queue.push_back(Task {std::move(r)});
    if (static_cast<int>(_queue.size()) > _idle_threads &&
        static_cast<int>(_threads.size()) < _max_threads) {
        create_thread();
    }
    _not_empty_cond.notify_one();
    return Status::OK();
}

Status ThreadPool::submit_func(std::function<void()> f) {
    return submit(std::make_shared<FunctionRunnable>(std::move(f)));
}

void ThreadPool::wait() {
    std::unique_lock<std::mutex> l(_lock);
    _idle_cond.wait(l, [this]() {
        return (_active_threads == 0 && _queue.empty()) || !_pool_status.ok();
    });
}

void ThreadPool::create_thread() {
    _threads.emplace_back(&ThreadPool::dispatch_thread, this);
}

void ThreadPool::dispatch_thread() {
    std::unique_lock<std::mutex> l(_lock);
    while (true) {
        if (!_pool_status.ok()) {
            VLOG_CRITICAL << "DispatchThread exiting: " << _pool_status.to_string();
            break;
        }

        if (_queue.empty()) {
            _idle_threads++;
            _not_empty_cond.wait(l, [this]() { return !_queue.empty() || !_pool_status.ok(); });
            _idle_threads--;
            continue;
        }

        Task task = std::move(_queue.front());
        _queue.pop_front();
        _active_threads++;
        l.unlock();

        task.runnable->run();
        // Destruct the task while we do not hold the lock.
        task.runnable.reset();

        l.lock();
        _active_threads--;
        if (_active_threads == 0 && _queue.empty()) {
            _idle_cond.notify_all();
        }
    }
}

#include "common/compile_check_end.h"
} // namespace vigil
