// asymmetric.h - Asymmetric sign and verify operations of the SeBridge SE driver
// Copyright (c) 2025 ludicrypt. All rights reserved.
// Licensed under the MIT License.

#pragma once

#include "crypto_client.h"

#include <psa/crypto.h>
#include <psa/crypto_se_driver.h>

namespace sebridge
{
namespace se
{

/// @brief Sign and verify against keys of the bound provider
class AsymmetricAdapter
{
public:
    /// @brief Constructor
    /// @param client Bound client, used for the lifetime of the adapter
    explicit AsymmetricAdapter(CryptoClient& client);

    /// @brief Sign a hash
    /// @param slot Slot number of the private key
    /// @param algorithm PSA signature algorithm
    /// @param hash Hash to sign
    /// @param capacity Host signature buffer size
    /// @param signature Receives the signature when it fits
    /// @return PSA_ERROR_BUFFER_TOO_SMALL when the signature does not fit
    psa_status_t Sign(psa_key_slot_number_t slot,
                      psa_algorithm_t algorithm,
                      const Bytes& hash,
                      size_t capacity,
                      Bytes& signature);

    /// @brief Verify a hash signature
    /// @param slot Slot number of the key
    /// @param algorithm PSA signature algorithm
    /// @param hash Signed hash
    /// @param signature Signature to check
    /// @return PSA_ERROR_INVALID_SIGNATURE on mismatch
    psa_status_t Verify(psa_key_slot_number_t slot,
                        psa_algorithm_t algorithm,
                        const Bytes& hash,
                        const Bytes& signature);

private:
    CryptoClient& m_client;
};

} // namespace se
} // namespace sebridge
