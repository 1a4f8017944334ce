// provider_binder.cpp - Provider discovery and binding performed by driver init
// Copyright (c) 2025 ludicrypt. All rights reserved.
// Licensed under the MIT License.

#include "provider_binder.h"
#include "error_handling.h"
#include "logging.h"

#include <uuid/uuid.h>

#include <algorithm>
#include <cctype>

namespace sebridge
{
namespace se
{

namespace
{

bool UuidEquals(const std::string& lhs, const char* rhs)
{
    uuid_t left;
    uuid_t right;

    if (uuid_parse(lhs.c_str(), left) != 0 || uuid_parse(rhs, right) != 0)
    {
        return false;
    }

    return uuid_compare(left, right) == 0;
}

bool IsValidUuid(const std::string& text)
{
    uuid_t parsed;
    return uuid_parse(text.c_str(), parsed) == 0;
}

} // namespace

const char* GetProviderPolicyName(ProviderPolicy policy)
{
    switch (policy)
    {
    case ProviderPolicy::HardwareToken: return "hardware";
    case ProviderPolicy::SoftwareToken: return "software";
    default:                            return "default";
    }
}

bool ParseProviderPolicy(const std::string& name, ProviderPolicy& policy)
{
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "hardware")      { policy = ProviderPolicy::HardwareToken; }
    else if (lower == "software") { policy = ProviderPolicy::SoftwareToken; }
    else if (lower == "default")  { policy = ProviderPolicy::AnyExceptCore; }
    else
    {
        return false;
    }
    return true;
}

bool ProviderMatchesPolicy(ProviderPolicy policy, const std::string& uuid)
{
    switch (policy)
    {
    case ProviderPolicy::HardwareToken:
        return UuidEquals(uuid, kHardwareTokenProviderUuid);
    case ProviderPolicy::SoftwareToken:
        return UuidEquals(uuid, kSoftwareTokenProviderUuid);
    case ProviderPolicy::AnyExceptCore:
        return IsValidUuid(uuid) && !UuidEquals(uuid, kCoreProviderUuid);
    }

    return false;
}

const ProviderDescriptor* SelectProvider(const std::vector<ProviderDescriptor>& providers,
                                         ProviderPolicy policy)
{
    for (const auto& provider : providers)
    {
        if (ProviderMatchesPolicy(policy, provider.uuid))
        {
            return &provider;
        }
    }

    return nullptr;
}

psa_status_t BindProvider(CryptoClient& client, const BinderSettings& settings)
{
    LogFunctionEntry();

    client.SetTimeout(settings.callTimeout);

    auto connected = client.Connect();
    if (!connected.success)
    {
        SET_SE_ERROR_INFO(DriverErrorCode::BackendConnectionFailed,
                          "Cannot reach the crypto service",
                          connected.error.Describe());
        return PSA_ERROR_GENERIC_ERROR;
    }

    auto auth = client.SetDefaultAuth(settings.authenticationLabel);
    if (!auth.success)
    {
        SET_SE_ERROR_INFO(DriverErrorCode::AuthenticationSetupFailed,
                          "Failed to set default authentication",
                          auth.error.Describe());
        return PSA_ERROR_GENERIC_ERROR;
    }

    auto providers = client.ListProviders();
    if (!providers.success)
    {
        SET_SE_ERROR_INFO(DriverErrorCode::ProviderDiscoveryFailed,
                          "Failed to list providers",
                          providers.error.Describe());
        return PSA_ERROR_GENERIC_ERROR;
    }

    const ProviderDescriptor* selected = SelectProvider(providers.response, settings.policy);
    if (selected == nullptr)
    {
        SET_SE_ERROR_INFO(DriverErrorCode::NoSuitableProvider,
                          "No provider matches the selection policy",
                          std::string("policy ") + GetProviderPolicyName(settings.policy) + ", " +
                              std::to_string(providers.response.size()) + " provider(s) offered");
        return PSA_ERROR_GENERIC_ERROR;
    }

    client.SetImplicitProvider(selected->id);

    LogInfo("Bound to provider %u (%s, %s)",
            selected->id,
            selected->uuid.c_str(),
            selected->description.c_str());
    LogFunctionExitWithStatus(PSA_SUCCESS);
    return PSA_SUCCESS;
}

} // namespace se
} // namespace sebridge
