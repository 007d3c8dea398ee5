// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of LedgerGate, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <unordered_map>
#include <vector>

#include <ledgergate/core/logger.hpp>

namespace ledgergate
{
namespace core
{

/// A dynamic thread pool for fire-and-forget tasks. It keeps at least
/// `minThreads` workers, grows up to `maxThreads` when every worker is busy,
/// and retires surplus workers after `idleTimeout` without work.
class ThreadPool
{
public:
  /// @param minThreads   Workers that are always kept alive.
  /// @param maxThreads   Hard limit on concurrent workers.
  /// @param idleTimeout  Idle period after which surplus workers exit.
  /// @param maxQueueSize Pending tasks allowed before enqueue is refused.
  /// @param onTaskError  Receives exceptions escaping a task. If unset they are
  ///                     logged at error level.
  ThreadPool(std::size_t minThreads, std::size_t maxThreads,
             std::chrono::milliseconds idleTimeout = std::chrono::seconds(60),
             std::size_t maxQueueSize = 256,
             std::function<void(std::exception_ptr)> onTaskError = nullptr)
      : _minThreads(minThreads == 0 ? 1 : minThreads),
        _maxThreads(maxThreads < _minThreads ? _minThreads : maxThreads),
        _idleTimeout(idleTimeout), _maxQueueSize(maxQueueSize),
        _onTaskError(std::move(onTaskError))
  {
    std::lock_guard<std::mutex> lock(_mutex);
    for (std::size_t i = 0; i < _minThreads; ++i)
    {
      spawnWorkerLocked();
    }
  }

  ~ThreadPool() { shutdown(); }

  ThreadPool(const ThreadPool &) = delete;
  ThreadPool &operator=(const ThreadPool &) = delete;

  /// Enqueue a task.
  /// @throws std::runtime_error if the pool is shutting down or the queue is full.
  void enqueue(std::function<void()> task)
  {
    if (!tryEnqueue(std::move(task)))
    {
      std::lock_guard<std::mutex> lock(_mutex);
      throw std::runtime_error(_shutdown ? "ThreadPool is shutting down"
                                         : "ThreadPool task queue is full");
    }
  }

  /// Enqueue a task, returning false instead of throwing when it is refused.
  bool tryEnqueue(std::function<void()> task)
  {
    {
      std::lock_guard<std::mutex> lock(_mutex);
      if (_shutdown || _tasks.size() >= _maxQueueSize)
      {
        return false;
      }
      _tasks.push(std::move(task));
      reapExitedLocked();
      if (_idleThreads < _tasks.size() && _threads.size() < _maxThreads)
      {
        spawnWorkerLocked();
      }
    }
    _condition.notify_one();
    return true;
  }

  std::size_t getPendingTaskCount() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _tasks.size();
  }

  std::size_t getTotalThreadCount() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _threads.size() - _exited.size();
  }

  /// Stop accepting work, let workers finish the queued tasks and join them.
  /// Safe to call more than once.
  void shutdown()
  {
    std::unordered_map<std::thread::id, std::thread> threads;
    {
      std::lock_guard<std::mutex> lock(_mutex);
      if (_shutdown && _threads.empty())
      {
        return;
      }
      _shutdown = true;
      threads.swap(_threads);
      _exited.clear();
    }
    _condition.notify_all();

    for (auto &entry : threads)
    {
      if (entry.second.joinable() && entry.first != std::this_thread::get_id())
      {
        entry.second.join();
      }
      else if (entry.second.joinable())
      {
        entry.second.detach();
      }
    }
    LEDGERGATE_LOG_DEBUG("ThreadPool stopped, joined " << threads.size() << " workers");
  }

private:
  // Caller holds _mutex.
  void spawnWorkerLocked()
  {
    std::thread t([this]() { workerLoop(); });
    auto id = t.get_id();
    _threads.emplace(id, std::move(t));
  }

  // Caller holds _mutex. Joins workers that retired after idling.
  void reapExitedLocked()
  {
    for (const auto &id : _exited)
    {
      auto it = _threads.find(id);
      if (it != _threads.end())
      {
        if (it->second.joinable())
        {
          it->second.join();
        }
        _threads.erase(it);
      }
    }
    _exited.clear();
  }

  void workerLoop()
  {
    std::unique_lock<std::mutex> lock(_mutex);
    while (true)
    {
      ++_idleThreads;
      bool ready = _condition.wait_for(lock, _idleTimeout,
                                       [this]() { return _shutdown || !_tasks.empty(); });
      --_idleThreads;

      if (!ready)
      {
        if (_threads.size() - _exited.size() > _minThreads)
        {
          _exited.push_back(std::this_thread::get_id());
          return;
        }
        continue;
      }

      if (_tasks.empty())
      {
        // Shutdown requested with nothing left to run.
        return;
      }

      auto task = std::move(_tasks.front());
      _tasks.pop();
      lock.unlock();
      runTask(task);
      lock.lock();
    }
  }

  void runTask(std::function<void()> &task)
  {
    try
    {
      task();
    }
    catch (...)
    {
      if (_onTaskError)
      {
        _onTaskError(std::current_exception());
      }
      else
      {
        logTaskError(std::current_exception());
      }
    }
  }

  static void logTaskError(std::exception_ptr ep)
  {
    try
    {
      std::rethrow_exception(ep);
    }
    catch (const std::exception &ex)
    {
      LEDGERGATE_LOG_ERROR("Unhandled exception in pooled task: " << ex.what());
    }
    catch (...)
    {
      LEDGERGATE_LOG_ERROR("Unhandled non-standard exception in pooled task");
    }
  }

  const std::size_t _minThreads;
  const std::size_t _maxThreads;
  const std::chrono::milliseconds _idleTimeout;
  const std::size_t _maxQueueSize;
  std::function<void(std::exception_ptr)> _onTaskError;

  mutable std::mutex _mutex;
  std::condition_variable _condition;
  std::queue<std::function<void()>> _tasks;
  std::unordered_map<std::thread::id, std::thread> _threads;
  std::vector<std::thread::id> _exited;
  std::size_t _idleThreads = 0;
  bool _shutdown = false;
};

} // namespace core
} // namespace ledgergate
