// status_translation.h - Remote outcome to psa_status_t translation
// Copyright (c) 2025 ludicrypt. All rights reserved.
// Licensed under the MIT License.

#pragma once

#include "crypto_client.h"

#include <psa/crypto.h>

namespace sebridge
{
namespace se
{

/// @brief Translate a remote call failure into the host status space
/// @param error Outcome reported by the client
/// @return The PSA code of the same meaning, or PSA_ERROR_GENERIC_ERROR when
///         the outcome has no host equivalent (the collapse is logged and
///         recorded as the thread's last driver error)
psa_status_t ToPsaStatus(const ClientError& error);

/// @brief Translate a service ResponseStatus
/// @param status Status carried in a service response
/// @return Host status code
psa_status_t ToPsaStatus(v1::ResponseStatus status);

/// @brief Collapse a client result into a host status
template<typename T>
psa_status_t ToPsaStatus(const ClientResult<T>& result)
{
    return result.success ? PSA_SUCCESS : ToPsaStatus(result.error);
}

} // namespace se
} // namespace sebridge
