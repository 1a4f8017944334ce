// provider_binder.h - Provider discovery and binding performed by driver init
// Copyright (c) 2025 ludicrypt. All rights reserved.
// Licensed under the MIT License.

#pragma once

#include "crypto_client.h"

#include <psa/crypto.h>

#include <chrono>
#include <string>
#include <vector>

namespace sebridge
{
namespace se
{

/// @brief Hardware security module provider
constexpr const char* kHardwareTokenProviderUuid = "1e4954a4-ff21-46d3-ab0c-661eeb667e1d";

/// @brief Software cryptographic token provider
constexpr const char* kSoftwareTokenProviderUuid = "30e39502-eba6-4d60-a4af-c518b7f5e38f";

/// @brief Service core provider, never used for key storage
constexpr const char* kCoreProviderUuid = "47049873-2a43-4845-9d72-831eab668784";

/// @brief Provider selection policy
enum class ProviderPolicy
{
    HardwareToken,  // Only the hardware security module provider
    SoftwareToken,  // Only the software token provider
    AnyExceptCore   // First provider that is not the core provider
};

/// @brief Settings applied while binding
struct BinderSettings
{
    std::chrono::milliseconds callTimeout{std::chrono::seconds(5)};
    std::string authenticationLabel{"SeBridge SE Driver"};
    ProviderPolicy policy{ProviderPolicy::AnyExceptCore};
};

/// @brief Get printable policy name
const char* GetProviderPolicyName(ProviderPolicy policy);

/// @brief Parse "hardware", "software" or "default"
/// @return false if the name is not recognized
bool ParseProviderPolicy(const std::string& name, ProviderPolicy& policy);

/// @brief Check whether a provider qualifies under a policy
/// @param policy Selection policy
/// @param uuid UUID advertised by the provider
/// @return false for non-matching or unparsable UUIDs
bool ProviderMatchesPolicy(ProviderPolicy policy, const std::string& uuid);

/// @brief Pick the first qualifying provider
/// @param providers Providers in service order
/// @param policy Selection policy
/// @return Pointer into providers, nullptr if none qualifies
const ProviderDescriptor* SelectProvider(const std::vector<ProviderDescriptor>& providers,
                                         ProviderPolicy policy);

/// @brief Configure a client and bind it to one provider
///
/// Must run with exclusive access to the client. Every failure is fatal to
/// driver initialization.
///
/// @param client Client to configure
/// @param settings Binding settings
/// @return PSA_SUCCESS or PSA_ERROR_GENERIC_ERROR
psa_status_t BindProvider(CryptoClient& client, const BinderSettings& settings);

} // namespace se
} // namespace sebridge
