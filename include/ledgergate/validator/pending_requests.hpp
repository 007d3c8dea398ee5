// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of LedgerGate, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include "validator.pb.h"

namespace ledgergate
{
namespace validator
{

using MessageType = protocol::Message::MessageType;

/// \brief A decoded validator reply: its message type and raw content.
struct Reply
{
  MessageType type = protocol::Message::DEFAULT;
  std::string content;
};

/// \brief Single-assignment result for one outstanding request.
///
/// Exactly one of fulfill() or fail() takes effect; later calls return false.
/// wait() blocks without holding any table lock.
class ReplySlot
{
public:
  enum class State
  {
    Waiting,
    Fulfilled,
    Failed
  };

  bool fulfill(Reply reply)
  {
    {
      std::lock_guard<std::mutex> lock(_mutex);
      if (_state != State::Waiting)
      {
        return false;
      }
      _reply = std::move(reply);
      _state = State::Fulfilled;
    }
    _cv.notify_all();
    return true;
  }

  bool fail(std::string reason)
  {
    {
      std::lock_guard<std::mutex> lock(_mutex);
      if (_state != State::Waiting)
      {
        return false;
      }
      _error = std::move(reason);
      _state = State::Failed;
    }
    _cv.notify_all();
    return true;
  }

  /// \brief Block until resolved or until `deadline`. Returns the state seen,
  /// which is Waiting only if the deadline passed first.
  State waitUntil(std::chrono::steady_clock::time_point deadline)
  {
    std::unique_lock<std::mutex> lock(_mutex);
    _cv.wait_until(lock, deadline, [this]() { return _state != State::Waiting; });
    return _state;
  }

  State state() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _state;
  }

  /// \brief Move the reply out. Valid once the state is Fulfilled.
  Reply takeReply()
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return std::move(_reply);
  }

  std::string error() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _error;
  }

private:
  mutable std::mutex _mutex;
  std::condition_variable _cv;
  State _state = State::Waiting;
  Reply _reply;
  std::string _error;
};

/// \brief Correlation id to slot map shared by the sender and the reader.
///
/// An entry exists from send until it is resolved, failed or abandoned by a
/// timed-out waiter. A reply whose id has no entry is stale and is refused.
class PendingRequestTable
{
public:
  /// \throws std::logic_error if `correlationId` is already outstanding.
  std::shared_ptr<ReplySlot> add(const std::string &correlationId)
  {
    auto slot = std::make_shared<ReplySlot>();
    std::lock_guard<std::mutex> lock(_mutex);
    if (!_slots.emplace(correlationId, slot).second)
    {
      throw std::logic_error("Duplicate correlation id: " + correlationId);
    }
    return slot;
  }

  /// \brief Deliver a reply. Returns false for unknown or already used ids.
  bool resolve(const std::string &correlationId, Reply reply)
  {
    auto slot = take(correlationId);
    return slot && slot->fulfill(std::move(reply));
  }

  /// \brief Fail a single request, e.g. when its frame could not be written.
  bool fail(const std::string &correlationId, const std::string &reason)
  {
    auto slot = take(correlationId);
    return slot && slot->fail(reason);
  }

  /// \brief Fail every outstanding request. Returns how many were failed.
  std::size_t failAll(const std::string &reason)
  {
    std::unordered_map<std::string, std::shared_ptr<ReplySlot>> slots;
    {
      std::lock_guard<std::mutex> lock(_mutex);
      slots.swap(_slots);
    }
    std::size_t failed = 0;
    for (auto &entry : slots)
    {
      if (entry.second->fail(reason))
      {
        ++failed;
      }
    }
    return failed;
  }

  /// \brief Drop an entry whose waiter gave up.
  void remove(const std::string &correlationId)
  {
    std::lock_guard<std::mutex> lock(_mutex);
    _slots.erase(correlationId);
  }

  bool contains(const std::string &correlationId) const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _slots.count(correlationId) > 0;
  }

  std::size_t size() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _slots.size();
  }

private:
  std::shared_ptr<ReplySlot> take(const std::string &correlationId)
  {
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _slots.find(correlationId);
    if (it == _slots.end())
    {
      return nullptr;
    }
    auto slot = std::move(it->second);
    _slots.erase(it);
    return slot;
  }

  mutable std::mutex _mutex;
  std::unordered_map<std::string, std::shared_ptr<ReplySlot>> _slots;
};

} // namespace validator
} // namespace ledgergate
