/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>

#include <soralog/impl/configurator_from_yaml.hpp>

#include "filesystem/common.hpp"

namespace slotwatch::log {

  class Configurator : public soralog::ConfiguratorFromYAML {
    using PrevConfigurator = soralog::Configurator;

   public:
    Configurator(std::shared_ptr<PrevConfigurator> previous);

    explicit Configurator(std::shared_ptr<PrevConfigurator> previous,
                          filesystem::path path);

    /// @returns value of `--logcfg` if it was passed in command line
    static std::optional<filesystem::path> getLogConfigFile(int argc,
                                                            const char **argv);
  };

}  // namespace slotwatch::log
