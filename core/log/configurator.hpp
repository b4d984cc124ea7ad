/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>
#include <optional>

#include <soralog/impl/configurator_from_yaml.hpp>
#include <soralog/logging_system.hpp>

#include "outcome/outcome.hpp"

namespace tribune::log {

  /**
   * YAML configurator of the logging system. Without explicit config the
   * embedded one is used: console sink and the `tribune` group tree.
   */
  class Configurator : public soralog::ConfiguratorFromYAML {
    using PrevConfigurator = soralog::Configurator;

   public:
    Configurator(std::shared_ptr<PrevConfigurator> previous);

    explicit Configurator(std::shared_ptr<PrevConfigurator> previous,
                          std::string config);

    explicit Configurator(std::shared_ptr<PrevConfigurator> previous,
                          std::filesystem::path path);
  };

  /**
   * Configures the logging system (libp2p configurator under ours) from the
   * given YAML, or from the embedded one, and installs it.
   * Configuration messages are printed to the standard streams.
   */
  outcome::result<std::shared_ptr<soralog::LoggingSystem>> setupLoggingSystem(
      std::optional<std::string> yaml);

}  // namespace tribune::log
