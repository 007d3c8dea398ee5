// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of LedgerGate, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>

#include <ledgergate/core/config_loader.hpp>
#include <ledgergate/core/logger.hpp>
#include <ledgergate/network/http_server.hpp>
#include <ledgergate/rest/api_error.hpp>
#include <ledgergate/rest/envelope.hpp>
#include <ledgergate/rest/route_handlers.hpp>
#include <ledgergate/validator/connection.hpp>

namespace ledgergate
{

/// \brief The REST gateway process: logging, the validator connection, the
/// route table and the HTTP server, configured from TOML and the command
/// line.
class RestApiService
{
public:
  /// \brief All options, unset until given by the command line or the
  /// configuration file. Defaults are filled in by start().
  struct Config
  {
    struct ServerConfig
    {
      std::optional<std::string> bindAddress;
      std::optional<int> port;
    } server;
    struct ValidatorConfig
    {
      std::optional<std::string> url;
      std::optional<std::chrono::seconds> timeout;
    } validator;
    struct LogConfig
    {
      std::optional<std::string> level;
      std::optional<std::string> file;
      std::optional<bool> async;
      std::optional<int> retentionDays;
      std::optional<std::string> timeFormat;
    } log;
    struct ThreadPool
    {
      std::optional<std::size_t> minThreads;
      std::optional<std::size_t> maxThreads;
      std::optional<std::size_t> queueSize;
      std::optional<std::chrono::seconds> idleTimeoutSeconds;
    } threadPool;

    std::optional<std::string> configFile;
  };

  static constexpr const char *DEFAULT_BIND = "127.0.0.1";
  static constexpr int DEFAULT_PORT = 8008;
  static constexpr const char *DEFAULT_VALIDATOR_URL = "tcp://localhost:4004";
  static constexpr int DEFAULT_TIMEOUT_SECONDS = 300;

  explicit RestApiService(Config config) : _config(std::move(config)) {}

  RestApiService(const RestApiService &) = delete;
  RestApiService &operator=(const RestApiService &) = delete;

  ~RestApiService() { stop(); }

  /// \brief Initialise logging, connect to the validator and start serving.
  /// A validator that cannot be reached is logged, not fatal.
  /// \throws std::runtime_error if the HTTP server cannot start.
  void start()
  {
    if (_server)
    {
      throw std::runtime_error("RestApiService is already running");
    }
    applyConfig();

    _connection = std::make_unique<validator::TcpConnection>(
      _config.validator.url.value_or(DEFAULT_VALIDATOR_URL));
    if (!_connection->open())
    {
      LEDGERGATE_LOG_WARN("Validator is not reachable yet; will retry on the next request");
    }
    _handler = std::make_unique<rest::RouteHandler>(
      *_connection,
      _config.validator.timeout.value_or(std::chrono::seconds(DEFAULT_TIMEOUT_SECONDS)));

    network::HttpServer::Config serverConfig;
    serverConfig.bindAddress = _config.server.bindAddress.value_or(DEFAULT_BIND);
    serverConfig.port = _config.server.port.value_or(DEFAULT_PORT);
    serverConfig.minThreads = _config.threadPool.minThreads.value_or(serverConfig.minThreads);
    serverConfig.maxThreads = _config.threadPool.maxThreads.value_or(serverConfig.maxThreads);
    serverConfig.queueSize = _config.threadPool.queueSize.value_or(serverConfig.queueSize);
    serverConfig.idleTimeout =
      _config.threadPool.idleTimeoutSeconds.value_or(serverConfig.idleTimeout);

    _server = std::make_unique<network::HttpServer>(serverConfig);
    registerRoutes(*_server, *_handler);
    _server->start();
    LEDGERGATE_LOG_INFO("REST API listening on " << serverConfig.bindAddress << ":"
                                                 << _server->boundPort());
  }

  /// \brief Stop serving and close the validator connection, failing any
  /// requests still waiting on it.
  void stop()
  {
    if (_server)
    {
      _server->stop();
      _server.reset();
    }
    if (_connection)
    {
      _connection->close();
    }
    _handler.reset();
    _connection.reset();
  }

  /// \brief Blocks until terminate() is called.
  void waitForTermination()
  {
    std::unique_lock<std::mutex> lock(_terminationMutex);
    _terminationCv.wait(lock, [this]() { return _terminated; });
  }

  void terminate()
  {
    {
      std::lock_guard<std::mutex> lock(_terminationMutex);
      _terminated = true;
    }
    _terminationCv.notify_all();
  }

  int boundPort() const { return _server ? _server->boundPort() : 0; }

  const Config &config() const { return _config; }

  /// \brief Install every endpoint of `handler` on `server`, answering
  /// ApiError with its JSON error body.
  static void registerRoutes(network::HttpServer &server, const rest::RouteHandler &handler)
  {
    using Endpoint = network::HttpResponse (rest::RouteHandler::*)(const network::HttpRequest &)
      const;
    auto bind = [&handler](Endpoint endpoint)
    {
      return [&handler, endpoint](const network::HttpRequest &req, network::HttpResponse &res)
      {
        try
        {
          res = (handler.*endpoint)(req);
        }
        catch (const rest::ApiError &ex)
        {
          LEDGERGATE_LOG_DEBUG(network::toString(req.method)
                               << " " << req.target << " failed: " << ex.title());
          res = errorResponse(ex);
        }
      };
    };

    server.onPost("/batches", bind(&rest::RouteHandler::submitBatches));
    server.onGet("/batch_status", bind(&rest::RouteHandler::listStatuses));
    server.onPost("/batch_status", bind(&rest::RouteHandler::listStatuses));
    server.onGet("/state", bind(&rest::RouteHandler::listState));
    server.onGet("/state/{address}", bind(&rest::RouteHandler::fetchState));
    server.onGet("/blocks", bind(&rest::RouteHandler::listBlocks));
    server.onGet("/blocks/{block_id}", bind(&rest::RouteHandler::fetchBlock));
    server.onGet("/batches", bind(&rest::RouteHandler::listBatches));
    server.onGet("/batches/{batch_id}", bind(&rest::RouteHandler::fetchBatch));
  }

  static network::HttpResponse errorResponse(const rest::ApiError &error)
  {
    network::HttpResponse response;
    response.status = error.status();
    response.setContent(rest::Envelope::format(error.toJson()), rest::Envelope::CONTENT_TYPE);
    return response;
  }

  static void printHelp()
  {
    std::cout
      << "LedgerGate REST API Options:\n"
      << "  -h, --help                       Show this help message\n"
      << "  -c, --config <file>              Configuration file path\n"
      << "  -B, --bind <host:port>           Address to listen on (default: "
         "127.0.0.1:8008)\n"
      << "  -C, --connect <url>              Validator url (default: "
         "tcp://localhost:4004)\n"
      << "  -t, --timeout <seconds>          Validator reply timeout (default: 300)\n"
      << "  -l, --log-level <level>          Log level (trace, debug, info, "
         "warning, error, fatal)\n"
      << "  -f, --log-file <file>            Log file path\n"
      << "      --log-async                  Enable async logging\n"
      << "  -v                               Increase verbosity (repeatable)\n"
      << "      --threadpool-min <n>         Minimum worker threads (default: 2)\n"
      << "      --threadpool-max <n>         Maximum worker threads (default: 16)\n"
      << "      --threadpool-queue <n>       Worker queue size (default: 256)\n";
  }

  /// \brief Parse command-line arguments into `config`. `-c` loads the
  /// configuration file into `configLoader`.
  /// \throws std::runtime_error for unknown options or invalid values.
  static void parseCliArgs(int argc, char **argv, Config &config,
                           std::unique_ptr<core::ConfigLoader> &configLoader)
  {
    int verbosity = 0;
    for (int i = 1; i < argc; ++i)
    {
      std::string arg = argv[i];
      if ((arg == "-c" || arg == "--config") && i + 1 < argc)
      {
        config.configFile = argv[++i];
        configLoader = std::make_unique<core::ConfigLoader>(config.configFile.value());
      }
      else if ((arg == "-B" || arg == "--bind") && i + 1 < argc)
      {
        std::string bind = argv[++i];
        auto colon = bind.rfind(':');
        if (colon == std::string::npos)
        {
          config.server.bindAddress = bind;
        }
        else
        {
          config.server.port = toPort(bind.substr(colon + 1), "Invalid bind port: " + bind);
          if (colon > 0)
          {
            config.server.bindAddress = bind.substr(0, colon);
          }
        }
      }
      else if ((arg == "-C" || arg == "--connect") && i + 1 < argc)
      {
        config.validator.url = argv[++i];
      }
      else if ((arg == "-t" || arg == "--timeout") && i + 1 < argc)
      {
        std::string value = argv[++i];
        config.validator.timeout =
          std::chrono::seconds(toPositive(value, "Invalid timeout: " + value));
      }
      else if ((arg == "-l" || arg == "--log-level") && i + 1 < argc)
      {
        config.log.level = argv[++i];
      }
      else if ((arg == "-f" || arg == "--log-file") && i + 1 < argc)
      {
        config.log.file = argv[++i];
      }
      else if (arg == "--log-async")
      {
        config.log.async = true;
      }
      else if (arg.size() > 1 && arg[0] == '-' && arg.find_first_not_of('v', 1) == std::string::npos)
      {
        verbosity += static_cast<int>(arg.size() - 1);
      }
      else if (arg == "--threadpool-min" && i + 1 < argc)
      {
        std::string value = argv[++i];
        config.threadPool.minThreads =
          toPositive(value, "Invalid threadpool min threads: " + value);
      }
      else if (arg == "--threadpool-max" && i + 1 < argc)
      {
        std::string value = argv[++i];
        config.threadPool.maxThreads =
          toPositive(value, "Invalid threadpool max threads: " + value);
      }
      else if (arg == "--threadpool-queue" && i + 1 < argc)
      {
        std::string value = argv[++i];
        config.threadPool.queueSize = toPositive(value, "Invalid threadpool queue size: " + value);
      }
      else if (arg == "-h" || arg == "--help")
      {
        printHelp();
        std::exit(0);
      }
      else if (!arg.empty() && arg[0] == '-')
      {
        throw std::runtime_error("Unknown option: " + arg);
      }
    }

    if (verbosity > 0 && !config.log.level.has_value())
    {
      static const char *kLevels[] = {"warning", "info", "debug", "trace"};
      config.log.level = kLevels[verbosity > 3 ? 3 : verbosity];
    }
  }

  /// \brief Fill every option the command line left unset from the loaded
  /// configuration file, if any.
  static void parseTomlConfig(Config &config, const std::unique_ptr<core::ConfigLoader> &configLoader)
  {
    if (!configLoader)
    {
      return;
    }
    const auto &loader = *configLoader;
    if (!config.server.bindAddress)
    {
      config.server.bindAddress = loader.getString("server.bind");
    }
    if (!config.server.port)
    {
      if (auto port = loader.getInt("server.port"))
      {
        config.server.port = static_cast<int>(*port);
      }
    }
    if (!config.validator.url)
    {
      config.validator.url = loader.getString("validator.url");
    }
    if (!config.validator.timeout)
    {
      if (auto timeout = loader.getInt("validator.timeout"))
      {
        config.validator.timeout = std::chrono::seconds(*timeout);
      }
    }
    if (!config.log.level)
    {
      config.log.level = loader.getString("log.level");
    }
    if (!config.log.file)
    {
      config.log.file = loader.getString("log.file");
    }
    if (!config.log.async)
    {
      config.log.async = loader.getBool("log.async");
    }
    if (!config.log.retentionDays)
    {
      if (auto days = loader.getInt("log.retention_days"))
      {
        config.log.retentionDays = static_cast<int>(*days);
      }
    }
    if (!config.log.timeFormat)
    {
      config.log.timeFormat = loader.getString("log.time_format");
    }
    if (!config.threadPool.minThreads)
    {
      if (auto n = loader.getInt("thread_pool.min_threads"))
      {
        config.threadPool.minThreads = static_cast<std::size_t>(*n);
      }
    }
    if (!config.threadPool.maxThreads)
    {
      if (auto n = loader.getInt("thread_pool.max_threads"))
      {
        config.threadPool.maxThreads = static_cast<std::size_t>(*n);
      }
    }
    if (!config.threadPool.queueSize)
    {
      if (auto n = loader.getInt("thread_pool.queue_size"))
      {
        config.threadPool.queueSize = static_cast<std::size_t>(*n);
      }
    }
    if (!config.threadPool.idleTimeoutSeconds)
    {
      if (auto n = loader.getInt("thread_pool.idle_timeout"))
      {
        config.threadPool.idleTimeoutSeconds = std::chrono::seconds(*n);
      }
    }
  }

private:
  void applyConfig()
  {
    const char *DEFAULT_LOG_LEVEL = "info";
    const char *DEFAULT_LOG_FILE = "";
    const bool DEFAULT_LOG_ASYNC = false;
    const int DEFAULT_LOG_RETENTION = 7;
    const char *DEFAULT_LOG_TIME_FORMAT = "%Y-%m-%d %H:%M:%S";

    core::Logger::init(core::Logger::levelFromString(_config.log.level.value_or(DEFAULT_LOG_LEVEL)),
                       _config.log.file.value_or(DEFAULT_LOG_FILE),
                       _config.log.async.value_or(DEFAULT_LOG_ASYNC),
                       _config.log.retentionDays.value_or(DEFAULT_LOG_RETENTION),
                       _config.log.timeFormat.value_or(DEFAULT_LOG_TIME_FORMAT));

    LEDGERGATE_LOG_INFO("applyConfig: config file = " << _config.configFile.value_or("<unset>"));
    LEDGERGATE_LOG_INFO("applyConfig: server.bind = "
                        << _config.server.bindAddress.value_or(DEFAULT_BIND) << ":"
                        << _config.server.port.value_or(DEFAULT_PORT));
    LEDGERGATE_LOG_INFO("applyConfig: validator.url = "
                        << _config.validator.url.value_or(DEFAULT_VALIDATOR_URL));
    LEDGERGATE_LOG_INFO("applyConfig: validator.timeout = "
                        << _config.validator.timeout
                             .value_or(std::chrono::seconds(DEFAULT_TIMEOUT_SECONDS))
                             .count()
                        << "s");
    LEDGERGATE_LOG_INFO("applyConfig: log.level = " << _config.log.level.value_or(DEFAULT_LOG_LEVEL));
    LEDGERGATE_LOG_INFO("applyConfig: log.file = " << _config.log.file.value_or("<stdout>"));
  }

  static int toPort(const std::string &value, const std::string &error)
  {
    int port = static_cast<int>(toPositive(value, error));
    if (port > 65535)
    {
      throw std::runtime_error(error);
    }
    return port;
  }

  static std::size_t toPositive(const std::string &value, const std::string &error)
  {
    try
    {
      std::size_t used = 0;
      long n = std::stol(value, &used);
      if (used != value.size() || n <= 0)
      {
        throw std::runtime_error(error);
      }
      return static_cast<std::size_t>(n);
    }
    catch (const std::logic_error &)
    {
      throw std::runtime_error(error);
    }
  }

  Config _config;
  std::unique_ptr<validator::TcpConnection> _connection;
  std::unique_ptr<rest::RouteHandler> _handler;
  std::unique_ptr<network::HttpServer> _server;

  std::mutex _terminationMutex;
  std::condition_variable _terminationCv;
  bool _terminated = false;
};

} // namespace ledgergate
