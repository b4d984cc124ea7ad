/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "log/configurator.hpp"

#include <iostream>

#include <libp2p/log/configurator.hpp>

#include "log/logger.hpp"

namespace tribune::log {

  namespace {
    // NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
    std::string embedded_config(R"(
# ----------------
sinks:
  - name: console
    type: console
    stream: stderr
    thread: name
    color: false
    latency: 0
groups:
  - name: main
    sink: console
    level: info
    is_fallback: true
    children:
      - name: libp2p
        level: off
      - name: tribune
        children:
          - name: dispute
          - name: runtime
          - name: network
          - name: threads
      - name: others
        children:
          - name: testing
# ----------------
  )");
  }  // namespace

  Configurator::Configurator(std::shared_ptr<PrevConfigurator> previous)
      : ConfiguratorFromYAML(std::move(previous), embedded_config) {}

  Configurator::Configurator(std::shared_ptr<PrevConfigurator> previous,
                             std::string config)
      : ConfiguratorFromYAML(std::move(previous), std::move(config)) {}

  Configurator::Configurator(std::shared_ptr<PrevConfigurator> previous,
                             std::filesystem::path path)
      : ConfiguratorFromYAML(std::move(previous), std::move(path)) {}

  outcome::result<std::shared_ptr<soralog::LoggingSystem>> setupLoggingSystem(
      std::optional<std::string> yaml) {
    auto libp2p_log_configurator =
        std::make_shared<libp2p::log::Configurator>();

    auto log_configurator =
        yaml.has_value()
            ? std::make_shared<Configurator>(std::move(libp2p_log_configurator),
                                             std::move(yaml.value()))
            : std::make_shared<Configurator>(
                  std::move(libp2p_log_configurator));

    auto logging_system =
        std::make_shared<soralog::LoggingSystem>(std::move(log_configurator));

    auto r = logging_system->configure();
    if (not r.message.empty()) {
      (r.has_error ? std::cerr : std::cout) << r.message << '\n';
    }
    if (r.has_error) {
      return Error::WRONG_CONFIG;
    }

    setLoggingSystem(logging_system);
    return logging_system;
  }

}  // namespace tribune::log
