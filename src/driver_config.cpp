// driver_config.cpp - Runtime configuration of the SeBridge SE driver
// Copyright (c) 2025 ludicrypt. All rights reserved.
// Licensed under the MIT License.

#include "driver_config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>

#ifndef SEBRIDGE_PROVIDER_POLICY
#define SEBRIDGE_PROVIDER_POLICY "default"
#endif

namespace sebridge
{
namespace se
{

namespace
{

std::optional<std::string> ProcessEnvironment(const std::string& name)
{
    const char* value = std::getenv(name.c_str());
    if (value == nullptr)
    {
        return std::nullopt;
    }
    return std::string(value);
}

/// @brief "1", "true", "yes" or "on", in any case
bool IsEnabledFlag(const std::string& value)
{
    std::string lower(value);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower == "1" || lower == "true" || lower == "yes" || lower == "on";
}

} // namespace

ProviderPolicy BuildProviderPolicy()
{
    ProviderPolicy policy = ProviderPolicy::AnyExceptCore;
    if (!ParseProviderPolicy(SEBRIDGE_PROVIDER_POLICY, policy))
    {
        LogWarning("Unknown build provider policy '%s', using default", SEBRIDGE_PROVIDER_POLICY);
    }
    return policy;
}

DriverConfig DefaultDriverConfig()
{
    DriverConfig config;
    config.binder.policy = BuildProviderPolicy();
    config.log.enableProcessId = true;
    return config;
}

DriverConfig LoadDriverConfig()
{
    return LoadDriverConfig(ProcessEnvironment);
}

DriverConfig LoadDriverConfig(const EnvironmentLookup& lookup)
{
    DriverConfig config = DefaultDriverConfig();

    if (auto endpoint = lookup("SEBRIDGE_SERVICE_ENDPOINT"); endpoint && !endpoint->empty())
    {
        config.connection.endpoint = *endpoint;
    }

    auto caFile = lookup("SEBRIDGE_TLS_CA_FILE");
    auto certFile = lookup("SEBRIDGE_TLS_CERT_FILE");
    auto keyFile = lookup("SEBRIDGE_TLS_KEY_FILE");

    if (caFile && !caFile->empty())
    {
        config.connection.enableTls = true;
        config.connection.caCertificatePath = *caFile;
    }

    if (certFile && !certFile->empty() && keyFile && !keyFile->empty())
    {
        config.connection.enableTls = true;
        config.connection.certificatePath = *certFile;
        config.connection.privateKeyPath = *keyFile;
    }
    else if ((certFile && !certFile->empty()) || (keyFile && !keyFile->empty()))
    {
        LogWarning("SEBRIDGE_TLS_CERT_FILE and SEBRIDGE_TLS_KEY_FILE must be set together, "
                   "client certificate ignored");
    }

    if (auto level = lookup("SEBRIDGE_LOG_LEVEL"); level && !level->empty())
    {
        if (!ParseLogLevel(*level, config.log.level))
        {
            LogWarning("Ignoring unknown SEBRIDGE_LOG_LEVEL value: %s", level->c_str());
        }
    }

    if (auto logFile = lookup("SEBRIDGE_LOG_FILE"); logFile && !logFile->empty())
    {
        config.log.targets = config.log.targets | LogTarget::File;
        config.log.logFilePath = *logFile;
    }

    if (auto useSyslog = lookup("SEBRIDGE_LOG_SYSLOG"); useSyslog && !useSyslog->empty())
    {
        if (IsEnabledFlag(*useSyslog))
        {
            config.log.targets = config.log.targets | LogTarget::Syslog;
        }
    }

    if (auto ident = lookup("SEBRIDGE_LOG_SYSLOG_IDENT"); ident && !ident->empty())
    {
        config.log.syslogIdent = *ident;
    }

    return config;
}

} // namespace se
} // namespace sebridge
