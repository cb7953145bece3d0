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

#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "common/status.h"

namespace vigil {
#include "common/compile_check_begin.h"

class ThreadPool;

class Runnable {
public:
    virtual void run() = 0;
    virtual ~Runnable() = default;
};

// ThreadPool takes a lot of arguments. We provide sane defaults with a builder.
//
// name: Used for debugging output and default names of the worker threads.
//    Since thread names are limited to 16 characters on Linux, it's good to
//    choose a short name here.
//    Required.
//
// min_threads: Minimum number of threads we'll have at any time.
//    Default: 0.
//
// max_threads: Maximum number of threads we'll have at any time.
//    Default: Number of CPUs detected on the system.
//
// max_queue_size: Maximum number of items to enqueue before returning an
//    SERVICE_UNAVAILABLE error from submit().
//    Default: INT_MAX.
//
// Example:
//   std::unique_ptr<ThreadPool> pool;
//   RETURN_IF_ERROR(ThreadPoolBuilder("query-management")
//                           .set_min_threads(0)
//                           .set_max_threads(5)
//                           .set_max_queue_size(1024)
//                           .build(&pool));
class ThreadPoolBuilder {
public:
    explicit ThreadPoolBuilder(std::string name);

    ThreadPoolBuilder& set_min_threads(int min_threads);
    ThreadPoolBuilder& set_max_threads(int max_threads);
    ThreadPoolBuilder& set_max_queue_size(int max_queue_size);

    Status build(std::unique_ptr<ThreadPool>* pool) const;

    ThreadPoolBuilder(const ThreadPoolBuilder&) = delete;
    void operator=(const ThreadPoolBuilder&) = delete;

private:
    friend class ThreadPool;
    const std::string _name;
    int _min_threads;
    int _max_threads;
    int _max_queue_size;
};

// Thread pool with a variable number of threads. Tasks run in FIFO order.
//
// Threads are created lazily when a task is submitted and no thread is idle, up to
// max_threads. Once shutdown() has been called, submissions are rejected and queued
// tasks that did not start are dropped.
class ThreadPool {
public:
    ~ThreadPool();

    // Wait for the running tasks to complete and then shutdown the threads.
    // All the other pending tasks in the queue will be removed.
    // NOTE: That the user may implement an external abort logic for the
    //       runnables, that must be called before Shutdown(), if the system
    //       should know about the non-execution of these tasks, or the runnable
    //       require an explicit "abort" notification to exit from the run loop.
    void shutdown();

    // Submits a Runnable class.
    Status submit(std::shared_ptr<Runnable> r);

    // Submits a function bound using std::bind(&FuncName, args...).
    Status submit_func(std::function<void()> f);

    // Waits until all the tasks are completed.
    void wait();

    int num_threads() const {
        std::lock_guard<std::mutex> l(_lock);
        return static_cast<int>(_threads.size());
    }

    int get_queue_size() const {
        std::lock_guard<std::mutex> l(_lock);
        return static_cast<int>(_queue.size());
    }

    int get_active_threads() const {
        std::lock_guard<std::mutex> l(_lock);
        return _active_threads;
    }

    const std::string& name() const { return _name; }

    ThreadPool(const ThreadPool&) = delete;
    void operator=(const ThreadPool&) = delete;

private:
    friend class ThreadPoolBuilder;

    // Client-provided task to be executed by this pool.
    struct Task {
        std::shared_ptr<Runnable> runnable;
    };

    // Creates a new thread pool using a builder.
    explicit ThreadPool(const ThreadPoolBuilder& builder);

    // Initializes the thread pool by starting the minimum number of threads.
    Status init();

    // Dispatcher responsible for dequeueing and executing the tasks.
    void dispatch_thread();

    // Create new thread.
    //
    // REQUIRES: caller holds '_lock'.
    void create_thread();

    const std::string _name;
    const int _min_threads;
    const int _max_threads;
    const int _max_queue_size;

    // Overall status of the pool. Set to an error when the pool is shut down.
    //
    // Protected by '_lock'.
    Status _pool_status {Status::Uninitialized("The pool was not initialized.")};

    mutable std::mutex _lock;

    // Condition variable for "pool is idle". Waiters wake up when
    // _active_threads reaches zero and the queue is empty.
    std::condition_variable _idle_cond;

    // Condition variable for "there is work or the pool is shutting down".
    std::condition_variable _not_empty_cond;

    std::vector<std::thread> _threads;

    // Number of threads which are currently waiting for a task.
    int _idle_threads = 0;

    // Number of threads which are currently running tasks.
    int _active_threads = 0;

    std::deque<Task> _queue;
};

#include "common/compile_check_end.h"
} // namespace vigil
