// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of LedgerGate, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#include <ledgergate/ledgergate.hpp>

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <thread>

#include <pthread.h>

int main(int argc, char **argv)
{
  // Block the termination signals before any thread starts so that only the
  // signal thread below ever receives them.
  sigset_t signals;
  sigemptyset(&signals);
  sigaddset(&signals, SIGINT);
  sigaddset(&signals, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &signals, nullptr);

  std::unique_ptr<ledgergate::RestApiService> service;
  try
  {
    std::unique_ptr<ledgergate::core::ConfigLoader> configLoader;
    ledgergate::RestApiService::Config config;
    ledgergate::RestApiService::parseCliArgs(argc, argv, config, configLoader);
    ledgergate::RestApiService::parseTomlConfig(config, configLoader);

    service = std::make_unique<ledgergate::RestApiService>(config);
    service->start();
  }
  catch (const std::exception &ex)
  {
    std::cerr << "Error starting LedgerGate REST API: " << ex.what() << std::endl;
    service.reset();
    ledgergate::core::Logger::shutdown();
    return EXIT_FAILURE;
  }

  std::thread signalThread(
    [&signals, &service]()
    {
      int signal = 0;
      sigwait(&signals, &signal);
      LEDGERGATE_LOG_INFO("Received signal " << signal << ", shutting down");
      service->terminate();
    });

  service->waitForTermination();
  signalThread.join();

  service->stop();
  service.reset();
  ledgergate::core::Logger::shutdown();
  return EXIT_SUCCESS;
}
