/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>

#include <soralog/impl/configurator_from_yaml.hpp>

namespace vigil::log {

  /**
   * Logging configuration with the embedded vigil group tree. A custom YAML
   * string or file may be layered on top of it.
   */
  class Configurator : public soralog::ConfiguratorFromYAML {
    using PrevConfigurator = soralog::Configurator;

   public:
    Configurator();

    explicit Configurator(std::shared_ptr<PrevConfigurator> previous);

    Configurator(std::shared_ptr<PrevConfigurator> previous,
                 std::string config);

    Configurator(std::shared_ptr<PrevConfigurator> previous,
                 std::filesystem::path path);
  };

}  // namespace vigil::log
