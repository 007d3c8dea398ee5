// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of LedgerGate, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <atomic>
#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <cstring>
#include <deque>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>

#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <unistd.h>

#include "validator.pb.h"

#include <ledgergate/core/logger.hpp>
#include <ledgergate/ids/uuid.hpp>
#include <ledgergate/validator/frame_codec.hpp>
#include <ledgergate/validator/pending_requests.hpp>

namespace ledgergate
{
namespace validator
{

/// \brief The validator connection failed before a reply arrived.
class ConnectionError : public std::runtime_error
{
public:
  explicit ConnectionError(const std::string &what) : std::runtime_error(what) {}
};

/// \brief No reply arrived within the caller's timeout.
class ReplyTimeout : public std::runtime_error
{
public:
  explicit ReplyTimeout(const std::string &what) : std::runtime_error(what) {}
};

/// \brief Handle to one outstanding request.
class ReplyFuture
{
public:
  ReplyFuture(std::string correlationId, std::shared_ptr<ReplySlot> slot,
              std::shared_ptr<PendingRequestTable> table)
      : _correlationId(std::move(correlationId)), _slot(std::move(slot)),
        _table(std::move(table))
  {
  }

  /// \brief A future that is already failed, for sends that never left.
  static ReplyFuture failed(const std::string &reason)
  {
    auto slot = std::make_shared<ReplySlot>();
    slot->fail(reason);
    return ReplyFuture("", std::move(slot), nullptr);
  }

  /// \brief Wait up to `timeout` for the reply.
  /// \throws ReplyTimeout if the deadline passes; the pending entry is dropped
  /// so a late reply is treated as stale.
  /// \throws ConnectionError if the connection failed first.
  Reply result(std::chrono::milliseconds timeout)
  {
    auto state = _slot->waitUntil(std::chrono::steady_clock::now() + timeout);
    if (state == ReplySlot::State::Waiting)
    {
      if (_table)
      {
        _table->remove(_correlationId);
      }
      // A reply may have landed between the timed wait and the removal.
      if (_slot->state() != ReplySlot::State::Fulfilled)
      {
        throw ReplyTimeout("No validator reply for " + _correlationId + " within " +
                           std::to_string(timeout.count()) + "ms");
      }
      state = ReplySlot::State::Fulfilled;
    }
    if (state == ReplySlot::State::Failed)
    {
      throw ConnectionError(_slot->error());
    }
    return _slot->takeReply();
  }

  const std::string &correlationId() const { return _correlationId; }

private:
  std::string _correlationId;
  std::shared_ptr<ReplySlot> _slot;
  std::shared_ptr<PendingRequestTable> _table;
};

/// \brief Request/reply channel to the validator.
class Connection
{
public:
  virtual ~Connection() = default;

  /// \brief Send `content` tagged with `type`; never blocks on the reply.
  virtual ReplyFuture send(MessageType type, const std::string &content) = 0;
};

/// \brief A single persistent TCP connection shared by all callers.
///
/// Each frame carries a fresh UUID correlation id. Sends only queue the frame;
/// a writer thread drains the queue and a reader thread matches replies to
/// waiters by id, in whatever order they arrive. A validator that stops
/// reading stalls the writer, never a caller. When the socket drops every
/// waiter is failed, and the next send reconnects.
class TcpConnection : public Connection
{
public:
  /// \param url "tcp://host:port"
  /// \throws std::invalid_argument for a malformed url.
  explicit TcpConnection(const std::string &url) : _url(url)
  {
    parseUrl(url, _host, _port);
  }

  TcpConnection(const TcpConnection &) = delete;
  TcpConnection &operator=(const TcpConnection &) = delete;

  ~TcpConnection() override { close(); }

  /// \brief Connect if not connected. Returns false, after logging, if the
  /// validator cannot be reached.
  bool open()
  {
    std::lock_guard<std::mutex> connectLock(_connectMutex);
    std::thread previous;
    {
      std::lock_guard<std::mutex> lock(_mutex);
      if (_closed)
      {
        return false;
      }
      if (_fd >= 0)
      {
        return true;
      }
      previous = std::move(_reader);
    }
    if (previous.joinable())
    {
      previous.join();
    }

    int fd = connectSocket();
    if (fd < 0)
    {
      return false;
    }
    std::lock_guard<std::mutex> lock(_mutex);
    _fd = fd;
    _reader = std::thread([this, fd]() { readLoop(fd); });
    LEDGERGATE_LOG_INFO("Connected to validator at " << _url);
    return true;
  }

  /// \brief Disconnect for good, failing every outstanding request.
  void close()
  {
    std::lock_guard<std::mutex> connectLock(_connectMutex);
    std::thread reader;
    {
      std::lock_guard<std::mutex> lock(_mutex);
      _closed = true;
      if (_fd >= 0)
      {
        ::shutdown(_fd, SHUT_RDWR);
      }
      reader = std::move(_reader);
    }
    _outboxReady.notify_all();
    if (reader.joinable())
    {
      reader.join();
    }
    _pending->failAll("Validator connection closed");
  }

  bool isConnected() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _fd >= 0;
  }

  std::size_t pendingCount() const { return _pending->size(); }

  ReplyFuture send(MessageType type, const std::string &content) override
  {
    if (!open())
    {
      return ReplyFuture::failed("Validator at " + _url + " is not reachable");
    }

    std::string correlationId = ids::Uuid::v4();
    auto slot = _pending->add(correlationId);

    protocol::Message message;
    message.set_message_type(type);
    message.set_correlation_id(correlationId);
    message.set_content(content);
    std::string frame = FrameCodec::encode(message.SerializeAsString());

    LEDGERGATE_LOG_DEBUG("Queueing " << protocol::Message::MessageType_Name(type) << " ("
                                     << correlationId << ", " << content.size() << " bytes)");
    bool queued = false;
    {
      std::lock_guard<std::mutex> lock(_mutex);
      if (_fd >= 0)
      {
        _outbox.push_back(Outgoing{correlationId, std::move(frame)});
        queued = true;
      }
    }
    if (queued)
    {
      _outboxReady.notify_one();
    }
    else
    {
      _pending->fail(correlationId, "Validator connection to " + _url + " dropped");
    }
    return ReplyFuture(std::move(correlationId), std::move(slot), _pending);
  }

  /// \brief Split "tcp://host:port" into its parts.
  static void parseUrl(const std::string &url, std::string &host, int &port)
  {
    static const std::string kScheme = "tcp://";
    if (url.compare(0, kScheme.size(), kScheme) != 0)
    {
      throw std::invalid_argument("Validator url must start with tcp://: " + url);
    }
    std::string rest = url.substr(kScheme.size());
    auto colon = rest.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 == rest.size())
    {
      throw std::invalid_argument("Validator url must be tcp://host:port: " + url);
    }
    host = rest.substr(0, colon);
    try
    {
      std::size_t used = 0;
      port = std::stoi(rest.substr(colon + 1), &used);
      if (used != rest.size() - colon - 1 || port <= 0 || port > 65535)
      {
        throw std::out_of_range(rest);
      }
    }
    catch (const std::logic_error &)
    {
      throw std::invalid_argument("Invalid validator port in url: " + url);
    }
  }

private:
  struct Outgoing
  {
    std::string correlationId;
    std::string frame;
  };

  int connectSocket()
  {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo *res = nullptr;
    std::string port = std::to_string(_port);
    int rc = ::getaddrinfo(_host.c_str(), port.c_str(), &hints, &res);
    if (rc != 0)
    {
      LEDGERGATE_LOG_WARN("Cannot resolve validator host " << _host << ": " << ::gai_strerror(rc));
      return -1;
    }

    int fd = -1;
    for (addrinfo *ai = res; ai != nullptr; ai = ai->ai_next)
    {
      fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
      if (fd < 0)
      {
        continue;
      }
      if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0)
      {
        break;
      }
      ::close(fd);
      fd = -1;
    }
    ::freeaddrinfo(res);

    if (fd < 0)
    {
      LEDGERGATE_LOG_WARN("Cannot connect to validator at " << _url << ": "
                                                            << std::strerror(errno));
      return -1;
    }
    int yes = 1;
    ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &yes, sizeof(yes));
    return fd;
  }

  /// \brief Drain the outbox onto `fd` until the connection is replaced or
  /// dropped. Frames whose waiter already gave up are not sent.
  void writeLoop(int fd)
  {
    while (true)
    {
      Outgoing next;
      {
        std::unique_lock<std::mutex> lock(_mutex);
        _outboxReady.wait(lock, [&]() { return _fd != fd || !_outbox.empty(); });
        if (_fd != fd)
        {
          return;
        }
        next = std::move(_outbox.front());
        _outbox.pop_front();
      }
      if (!_pending->contains(next.correlationId))
      {
        LEDGERGATE_LOG_DEBUG("Skipping expired request " << next.correlationId);
        continue;
      }
      if (!writeAll(fd, next.frame))
      {
        ::shutdown(fd, SHUT_RDWR);
        return;
      }
    }
  }

  static bool writeAll(int fd, const std::string &frame)
  {
    std::size_t offset = 0;
    while (offset < frame.size())
    {
      ssize_t n = ::send(fd, frame.data() + offset, frame.size() - offset, MSG_NOSIGNAL);
      if (n < 0 && errno == EINTR)
      {
        continue;
      }
      if (n <= 0)
      {
        LEDGERGATE_LOG_WARN("Write to validator failed: " << std::strerror(errno));
        return false;
      }
      offset += static_cast<std::size_t>(n);
    }
    return true;
  }

  void readLoop(int fd)
  {
    std::thread writer([this, fd]() { writeLoop(fd); });
    FrameCodec codec;
    char buf[65536];
    std::string reason = "Validator connection lost";
    try
    {
      while (true)
      {
        ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n < 0 && errno == EINTR)
        {
          continue;
        }
        if (n <= 0)
        {
          break;
        }
        codec.feed(buf, static_cast<std::size_t>(n));
        while (auto payload = codec.next())
        {
          dispatch(*payload);
        }
      }
    }
    catch (const FrameTooLarge &ex)
    {
      LEDGERGATE_LOG_ERROR(ex.what() << "; dropping validator connection");
      reason = ex.what();
    }

    {
      std::lock_guard<std::mutex> lock(_mutex);
      if (_fd == fd)
      {
        _fd = -1;
      }
      _outbox.clear();
    }
    _outboxReady.notify_all();
    // Unblocks a writer stuck on a validator that stopped reading.
    ::shutdown(fd, SHUT_RDWR);
    writer.join();
    ::close(fd);
    std::size_t failed = _pending->failAll(reason);
    if (!_closed)
    {
      LEDGERGATE_LOG_WARN("Disconnected from validator at " << _url << ", failed " << failed
                                                            << " pending requests");
    }
  }

  void dispatch(const std::string &payload)
  {
    protocol::Message message;
    if (!message.ParseFromString(payload))
    {
      LEDGERGATE_LOG_WARN("Discarding undecodable validator frame (" << payload.size()
                                                                     << " bytes)");
      return;
    }
    LEDGERGATE_LOG_DEBUG("Received " << protocol::Message::MessageType_Name(
                                          message.message_type())
                                     << " (" << message.correlation_id() << ")");
    Reply reply;
    reply.type = message.message_type();
    reply.content = message.content();
    if (!_pending->resolve(message.correlation_id(), std::move(reply)))
    {
      LEDGERGATE_LOG_WARN("Ignoring validator reply with stale correlation id "
                          << message.correlation_id());
    }
  }

  std::string _url;
  std::string _host;
  int _port = 0;
  std::shared_ptr<PendingRequestTable> _pending = std::make_shared<PendingRequestTable>();

  std::mutex _connectMutex;
  mutable std::mutex _mutex;
  std::condition_variable _outboxReady;
  std::deque<Outgoing> _outbox;
  int _fd = -1;
  std::thread _reader;
  std::atomic<bool> _closed{false};
};

} // namespace validator
} // namespace ledgergate
