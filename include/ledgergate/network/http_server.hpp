// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of LedgerGate, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/socket.h>
#include <unistd.h>

#include <ledgergate/core/logger.hpp>
#include <ledgergate/core/thread_pool.hpp>
#include <ledgergate/parsers/http_message.hpp>

namespace ledgergate
{
namespace network
{

/// \brief Small HTTP/1.1 server: one epoll reactor thread reads and frames
/// requests, handlers run on a core::ThreadPool.
///
/// Routes are patterns such as "/blocks/{block_id}"; a `{name}` segment
/// matches exactly one non-empty path segment and is exposed, URL decoded,
/// through HttpRequest::pathParams. Requests on one connection are answered
/// in order. Bodies must be sent with Content-Length.
class HttpServer
{
public:
  static constexpr std::size_t MAX_HEADER_SIZE = 64 * 1024;
  static constexpr std::size_t DEFAULT_MAX_BODY_SIZE = 10 * 1024 * 1024;

  using Handler = std::function<void(const HttpRequest &, HttpResponse &)>;

  struct Config
  {
    std::string bindAddress = "127.0.0.1";
    int port = 8008; ///< 0 picks an ephemeral port, see boundPort()
    std::size_t maxBodySize = DEFAULT_MAX_BODY_SIZE;
    std::size_t minThreads = 2;
    std::size_t maxThreads = 16;
    std::size_t queueSize = 256;
    std::chrono::seconds idleTimeout{60};
    std::chrono::milliseconds writeTimeout{5000};
  };

  explicit HttpServer(Config config) : _config(std::move(config)) {}

  HttpServer(const HttpServer &) = delete;
  HttpServer &operator=(const HttpServer &) = delete;

  ~HttpServer() { stop(); }

  /// \brief Register a handler. Must be called before start().
  void route(HttpMethod method, const std::string &pattern, Handler handler)
  {
    Route r;
    r.method = method;
    r.pattern = pattern;
    r.segments = split(pattern);
    r.handler = std::move(handler);
    _routes.push_back(std::move(r));
  }

  void onGet(const std::string &pattern, Handler handler)
  {
    route(HttpMethod::GET, pattern, std::move(handler));
  }

  void onPost(const std::string &pattern, Handler handler)
  {
    route(HttpMethod::POST, pattern, std::move(handler));
  }

  /// \brief Bind, listen and start the reactor.
  /// \throws std::runtime_error if the address cannot be bound.
  void start()
  {
    if (_running.load())
    {
      return;
    }
    _stopping = false;
    openListener();

    _epollFd = ::epoll_create1(EPOLL_CLOEXEC);
    _wakeFd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (_epollFd < 0 || _wakeFd < 0)
    {
      std::string err = std::strerror(errno);
      closeFds();
      throw std::runtime_error("HttpServer: epoll setup failed: " + err);
    }
    watch(_listenFd, EPOLLIN);
    watch(_wakeFd, EPOLLIN);

    _pool = std::make_unique<core::ThreadPool>(
      _config.minThreads, _config.maxThreads,
      std::chrono::duration_cast<std::chrono::milliseconds>(_config.idleTimeout),
      _config.queueSize);

    _running = true;
    _reactor = std::thread([this]() { runLoop(); });
    LEDGERGATE_LOG_INFO("HttpServer listening on " << _config.bindAddress << ":" << _boundPort);
  }

  /// \brief Stop accepting, answer queued requests with 503, wait for
  /// running handlers and close every connection.
  void stop()
  {
    if (!_running.exchange(false))
    {
      return;
    }
    LEDGERGATE_LOG_DEBUG("HttpServer stopping");
    _stopping = true;
    std::uint64_t one = 1;
    if (::write(_wakeFd, &one, sizeof(one)) < 0)
    {
      LEDGERGATE_LOG_WARN("HttpServer: wakeup write failed: " << std::strerror(errno));
    }
    if (_reactor.joinable())
    {
      _reactor.join();
    }
    if (_pool)
    {
      _pool->shutdown();
      _pool.reset();
    }

    std::unordered_map<int, std::shared_ptr<Session>> sessions;
    {
      std::lock_guard<std::mutex> lock(_sessionsMutex);
      sessions.swap(_sessions);
    }
    for (auto &entry : sessions)
    {
      std::lock_guard<std::mutex> lock(entry.second->mutex);
      if (!entry.second->released)
      {
        entry.second->released = true;
        ::close(entry.second->fd);
      }
    }
    closeFds();
    LEDGERGATE_LOG_INFO("HttpServer stopped");
  }

  bool isRunning() const { return _running.load(); }

  /// \brief The port actually bound, valid after start().
  int boundPort() const { return _boundPort; }

private:
  struct Route
  {
    HttpMethod method;
    std::string pattern;
    std::vector<std::string> segments;
    Handler handler;
  };

  struct Pending
  {
    std::optional<HttpRequest> request;
    int rejectStatus = 0;
  };

  struct Session
  {
    int fd = -1;
    std::string peer;
    std::mutex mutex;
    std::mutex writeMutex;
    std::string buffer;
    std::deque<Pending> queue;
    bool busy = false;
    bool peerClosed = false;
    bool rejecting = false;
    bool continueSent = false;
    bool released = false;
  };

  static std::vector<std::string> split(const std::string &path)
  {
    std::vector<std::string> parts;
    std::size_t start = 1;
    if (path.empty() || path[0] != '/')
    {
      start = 0;
    }
    while (start <= path.size())
    {
      auto end = path.find('/', start);
      if (end == std::string::npos)
      {
        end = path.size();
      }
      parts.push_back(path.substr(start, end - start));
      start = end + 1;
    }
    return parts;
  }

  static bool isParam(const std::string &segment)
  {
    return segment.size() > 2 && segment.front() == '{' && segment.back() == '}';
  }

  static bool matches(const Route &r, const std::vector<std::string> &parts,
                      std::map<std::string, std::string> &params)
  {
    if (r.segments.size() != parts.size())
    {
      return false;
    }
    std::map<std::string, std::string> bound;
    for (std::size_t i = 0; i < parts.size(); ++i)
    {
      if (isParam(r.segments[i]))
      {
        if (parts[i].empty())
        {
          return false;
        }
        bound[r.segments[i].substr(1, r.segments[i].size() - 2)] = urlDecode(parts[i], false);
      }
      else if (r.segments[i] != parts[i])
      {
        return false;
      }
    }
    params = std::move(bound);
    return true;
  }

  void openListener()
  {
    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_PASSIVE;
    addrinfo *res = nullptr;
    std::string port = std::to_string(_config.port);
    const char *host = _config.bindAddress.empty() ? nullptr : _config.bindAddress.c_str();
    int rc = ::getaddrinfo(host, port.c_str(), &hints, &res);
    if (rc != 0 || res == nullptr)
    {
      throw std::runtime_error("HttpServer: cannot resolve bind address " +
                               _config.bindAddress + ": " + ::gai_strerror(rc));
    }
    std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)> guard(res, &::freeaddrinfo);

    _listenFd = ::socket(res->ai_family, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (_listenFd < 0)
    {
      throw std::runtime_error(std::string("HttpServer: socket failed: ") + std::strerror(errno));
    }
    int yes = 1;
    ::setsockopt(_listenFd, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));
    if (::bind(_listenFd, res->ai_addr, res->ai_addrlen) < 0 || ::listen(_listenFd, SOMAXCONN) < 0)
    {
      std::string err = std::strerror(errno);
      ::close(_listenFd);
      _listenFd = -1;
      throw std::runtime_error("HttpServer: cannot listen on " + _config.bindAddress + ":" +
                               port + ": " + err);
    }

    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (::getsockname(_listenFd, reinterpret_cast<sockaddr *>(&addr), &len) == 0)
    {
      _boundPort = ntohs(addr.sin_port);
    }
    else
    {
      _boundPort = _config.port;
    }
  }

  void closeFds()
  {
    for (int *fd : {&_listenFd, &_epollFd, &_wakeFd})
    {
      if (*fd >= 0)
      {
        ::close(*fd);
        *fd = -1;
      }
    }
  }

  void watch(int fd, std::uint32_t events)
  {
    epoll_event ev{};
    ev.events = events;
    ev.data.fd = fd;
    if (::epoll_ctl(_epollFd, EPOLL_CTL_ADD, fd, &ev) < 0)
    {
      LEDGERGATE_LOG_ERROR("HttpServer: epoll_ctl add failed for fd " << fd << ": "
                                                                       << std::strerror(errno));
    }
  }

  void runLoop()
  {
    epoll_event events[64];
    while (!_stopping.load())
    {
      int n = ::epoll_wait(_epollFd, events, 64, -1);
      if (n < 0)
      {
        if (errno == EINTR)
        {
          continue;
        }
        LEDGERGATE_LOG_ERROR("HttpServer: epoll_wait failed: " << std::strerror(errno));
        break;
      }
      for (int i = 0; i < n && !_stopping.load(); ++i)
      {
        int fd = events[i].data.fd;
        if (fd == _wakeFd)
        {
          continue;
        }
        if (fd == _listenFd)
        {
          acceptAll();
        }
        else
        {
          onReadable(fd);
        }
      }
    }
  }

  void acceptAll()
  {
    while (true)
    {
      sockaddr_in addr{};
      socklen_t len = sizeof(addr);
      int fd = ::accept4(_listenFd, reinterpret_cast<sockaddr *>(&addr), &len,
                         SOCK_NONBLOCK | SOCK_CLOEXEC);
      if (fd < 0)
      {
        if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR)
        {
          LEDGERGATE_LOG_WARN("HttpServer: accept failed: " << std::strerror(errno));
        }
        return;
      }
      int yes = 1;
      ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &yes, sizeof(yes));

      auto session = std::make_shared<Session>();
      session->fd = fd;
      char ip[INET_ADDRSTRLEN] = {0};
      ::inet_ntop(AF_INET, &addr.sin_addr, ip, sizeof(ip));
      session->peer = std::string(ip) + ":" + std::to_string(ntohs(addr.sin_port));
      {
        std::lock_guard<std::mutex> lock(_sessionsMutex);
        _sessions[fd] = session;
      }
      watch(fd, EPOLLIN | EPOLLRDHUP);
      LEDGERGATE_LOG_DEBUG("HttpServer: accepted " << session->peer << " (fd " << fd << ")");
    }
  }

  void onReadable(int fd)
  {
    std::shared_ptr<Session> session;
    {
      std::lock_guard<std::mutex> lock(_sessionsMutex);
      auto it = _sessions.find(fd);
      if (it == _sessions.end())
      {
        return;
      }
      session = it->second;
    }

    bool eof = false;
    std::string incoming;
    char buf[16384];
    while (true)
    {
      ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
      if (n > 0)
      {
        incoming.append(buf, static_cast<std::size_t>(n));
        continue;
      }
      if (n < 0 && errno == EINTR)
      {
        continue;
      }
      if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK))
      {
        break;
      }
      eof = true;
      break;
    }

    bool release = false;
    {
      std::lock_guard<std::mutex> lock(session->mutex);
      if (!session->rejecting)
      {
        session->buffer += incoming;
        frameRequests(*session);
      }
      if (!session->busy && !session->queue.empty())
      {
        session->busy = true;
        if (!schedule(session))
        {
          session->busy = false;
          session->queue.clear();
          rejectNow(*session, 503);
        }
      }
      if (eof && !session->peerClosed)
      {
        session->peerClosed = true;
        ::epoll_ctl(_epollFd, EPOLL_CTL_DEL, fd, nullptr);
        release = !session->busy;
      }
    }
    if (release)
    {
      releaseSession(session);
    }
  }

  // Caller holds session.mutex.
  void reject(Session &session, int status)
  {
    Pending p;
    p.rejectStatus = status;
    session.queue.push_back(std::move(p));
    session.rejecting = true;
    session.buffer.clear();
  }

  // Caller holds session.mutex. Splits complete requests off the buffer.
  void frameRequests(Session &session)
  {
    while (!session.rejecting)
    {
      auto headerEnd = session.buffer.find("\r\n\r\n");
      if (headerEnd == std::string::npos)
      {
        if (session.buffer.size() > MAX_HEADER_SIZE)
        {
          reject(session, 431);
        }
        return;
      }
      if (headerEnd > MAX_HEADER_SIZE)
      {
        reject(session, 431);
        return;
      }

      HttpRequest request;
      try
      {
        request = HttpRequest::parseHead(session.buffer.substr(0, headerEnd));
      }
      catch (const std::invalid_argument &ex)
      {
        LEDGERGATE_LOG_WARN("HttpServer: bad request from " << session.peer << ": "
                                                             << ex.what());
        reject(session, 400);
        return;
      }

      if (request.hasHeader("Transfer-Encoding"))
      {
        reject(session, 411);
        return;
      }

      std::size_t contentLength = 0;
      if (request.hasHeader("Content-Length"))
      {
        const std::string value = request.getHeader("Content-Length");
        try
        {
          std::size_t used = 0;
          contentLength = std::stoull(value, &used);
          if (used != value.size())
          {
            throw std::invalid_argument(value);
          }
        }
        catch (const std::logic_error &)
        {
          reject(session, 400);
          return;
        }
      }
      if (contentLength > _config.maxBodySize)
      {
        reject(session, 413);
        return;
      }

      const std::size_t total = headerEnd + 4 + contentLength;
      if (session.buffer.size() < total)
      {
        if (!session.continueSent &&
            toLower(request.getHeader("Expect")) == "100-continue")
        {
          session.continueSent = true;
          static const std::string kContinue = "HTTP/1.1 100 Continue\r\n\r\n";
          std::lock_guard<std::mutex> writeLock(session.writeMutex);
          sendAll(session.fd, kContinue);
        }
        return;
      }

      request.body = session.buffer.substr(headerEnd + 4, contentLength);
      session.buffer.erase(0, total);
      session.continueSent = false;
      request.remoteAddr = session.peer;
      if (!request.hasHeader("Host"))
      {
        request.headers["Host"] = _config.bindAddress + ":" + std::to_string(_boundPort);
      }
      Pending p;
      p.request = std::move(request);
      session.queue.push_back(std::move(p));
    }
  }

  bool schedule(const std::shared_ptr<Session> &session)
  {
    if (!_pool)
    {
      return false;
    }
    return _pool->tryEnqueue([this, session]() { serviceSession(session); });
  }

  // Caller holds session.mutex. Used when the pool refuses work.
  void rejectNow(Session &session, int status)
  {
    HttpResponse res;
    res.status = status;
    res.setContent(statusText(status), "text/plain");
    res.setHeader("Connection", "close");
    {
      std::lock_guard<std::mutex> writeLock(session.writeMutex);
      sendAll(session.fd, res.toWireFormat());
    }
    LEDGERGATE_LOG_WARN("HttpServer: rejected request from " << session.peer << " with "
                                                              << status);
    session.rejecting = true;
    ::shutdown(session.fd, SHUT_RDWR);
  }

  void serviceSession(const std::shared_ptr<Session> &session)
  {
    while (true)
    {
      Pending item;
      {
        std::lock_guard<std::mutex> lock(session->mutex);
        if (session->queue.empty())
        {
          session->busy = false;
          if (!session->peerClosed)
          {
            return;
          }
          break;
        }
        item = std::move(session->queue.front());
        session->queue.pop_front();
      }

      HttpResponse res;
      bool close = false;
      bool isHead = false;
      if (item.rejectStatus != 0)
      {
        res.status = item.rejectStatus;
        res.setContent(statusText(item.rejectStatus), "text/plain");
        close = true;
      }
      else if (_stopping.load())
      {
        res.status = 503;
        res.setContent("Server Shutting Down", "text/plain");
        close = true;
      }
      else
      {
        const HttpRequest &req = *item.request;
        isHead = req.method == HttpMethod::HEAD;
        dispatch(req, res);
        close = wantsClose(req);
        LEDGERGATE_LOG_INFO(toString(req.method) << " " << req.target << " from "
                                                 << req.remoteAddr << " -> " << res.status);
      }

      res.setHeader("Server", "LedgerGate/1.0");
      res.setHeader("Connection", close ? "close" : "keep-alive");
      bool sent;
      {
        std::lock_guard<std::mutex> writeLock(session->writeMutex);
        sent = sendAll(session->fd, res.toWireFormat(isHead));
      }
      if (!sent || close)
      {
        std::lock_guard<std::mutex> lock(session->mutex);
        session->queue.clear();
        session->rejecting = true;
        ::shutdown(session->fd, SHUT_RDWR);
      }
    }
    releaseSession(session);
  }

  static bool wantsClose(const HttpRequest &req)
  {
    std::string connection = toLower(req.getHeader("Connection"));
    if (req.version == "HTTP/1.0")
    {
      return connection != "keep-alive";
    }
    return connection == "close";
  }

  void dispatch(const HttpRequest &req, HttpResponse &res)
  {
    auto parts = split(req.path);
    std::set<std::string> allowed;
    const Route *target = nullptr;
    std::map<std::string, std::string> params;

    for (const auto &r : _routes)
    {
      std::map<std::string, std::string> bound;
      if (!matches(r, parts, bound))
      {
        continue;
      }
      allowed.insert(toString(r.method));
      bool methodOk = r.method == req.method ||
                      (req.method == HttpMethod::HEAD && r.method == HttpMethod::GET);
      if (methodOk && target == nullptr)
      {
        target = &r;
        params = std::move(bound);
      }
    }

    if (target == nullptr)
    {
      if (allowed.empty())
      {
        res.status = 404;
        res.setContent("Not Found", "text/plain");
        return;
      }
      if (allowed.count("GET"))
      {
        allowed.insert("HEAD");
      }
      std::string allow;
      for (const auto &m : allowed)
      {
        allow += (allow.empty() ? "" : ", ") + m;
      }
      res.status = 405;
      res.setContent("Method Not Allowed", "text/plain");
      res.setHeader("Allow", allow);
      return;
    }

    HttpRequest routed = req;
    routed.pathParams = std::move(params);
    try
    {
      target->handler(routed, res);
    }
    catch (const std::exception &ex)
    {
      LEDGERGATE_LOG_ERROR("HttpServer: handler for " << target->pattern
                                                      << " threw: " << ex.what());
      res = HttpResponse{};
      res.status = 500;
      res.setContent("Internal Server Error", "text/plain");
    }
  }

  bool sendAll(int fd, const std::string &data)
  {
    std::size_t offset = 0;
    while (offset < data.size())
    {
      ssize_t n = ::send(fd, data.data() + offset, data.size() - offset, MSG_NOSIGNAL);
      if (n > 0)
      {
        offset += static_cast<std::size_t>(n);
        continue;
      }
      if (n < 0 && errno == EINTR)
      {
        continue;
      }
      if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK))
      {
        pollfd pfd{fd, POLLOUT, 0};
        int ready = ::poll(&pfd, 1, static_cast<int>(_config.writeTimeout.count()));
        if (ready > 0)
        {
          continue;
        }
        LEDGERGATE_LOG_WARN("HttpServer: write timed out on fd " << fd);
        return false;
      }
      LEDGERGATE_LOG_DEBUG("HttpServer: write failed on fd " << fd << ": "
                                                             << std::strerror(errno));
      return false;
    }
    return true;
  }

  void releaseSession(const std::shared_ptr<Session> &session)
  {
    {
      std::lock_guard<std::mutex> lock(_sessionsMutex);
      auto it = _sessions.find(session->fd);
      if (it != _sessions.end() && it->second == session)
      {
        _sessions.erase(it);
      }
    }
    std::lock_guard<std::mutex> lock(session->mutex);
    if (!session->released)
    {
      session->released = true;
      ::close(session->fd);
      LEDGERGATE_LOG_DEBUG("HttpServer: closed " << session->peer);
    }
  }

  Config _config;
  std::vector<Route> _routes;
  std::unique_ptr<core::ThreadPool> _pool;
  std::thread _reactor;
  std::atomic<bool> _running{false};
  std::atomic<bool> _stopping{false};
  int _listenFd = -1;
  int _epollFd = -1;
  int _wakeFd = -1;
  int _boundPort = 0;
  std::mutex _sessionsMutex;
  std::unordered_map<int, std::shared_ptr<Session>> _sessions;
};

} // namespace network
} // namespace ledgergate
