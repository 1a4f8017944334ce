// driver_config.h - Runtime configuration of the SeBridge SE driver
// Copyright (c) 2025 ludicrypt. All rights reserved.
// Licensed under the MIT License.

#pragma once

#include "grpc_backend.h"
#include "logging.h"
#include "provider_binder.h"

#include <functional>
#include <optional>
#include <string>

namespace sebridge
{
namespace se
{

/// @brief Complete driver configuration
struct DriverConfig
{
    ConnectionConfig connection;
    BinderSettings binder;
    LogConfig log;
};

/// @brief Environment lookup, returns nullopt for unset variables
using EnvironmentLookup = std::function<std::optional<std::string>(const std::string&)>;

/// @brief Provider policy selected when the library was built
ProviderPolicy BuildProviderPolicy();

/// @brief Compiled-in defaults
DriverConfig DefaultDriverConfig();

/// @brief Load the configuration from defaults and process environment
DriverConfig LoadDriverConfig();

/// @brief Load the configuration from defaults and an environment lookup
/// @param lookup Variable lookup
/// @return Configuration; unusable values are logged and ignored
DriverConfig LoadDriverConfig(const EnvironmentLookup& lookup);

} // namespace se
} // namespace sebridge
