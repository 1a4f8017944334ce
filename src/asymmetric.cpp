// asymmetric.cpp - Asymmetric sign and verify operations of the SeBridge SE driver
// Copyright (c) 2025 ludicrypt. All rights reserved.
// Licensed under the MIT License.

#include "asymmetric.h"
#include "error_handling.h"
#include "key_naming.h"
#include "logging.h"
#include "status_translation.h"

namespace sebridge
{
namespace se
{

AsymmetricAdapter::AsymmetricAdapter(CryptoClient& client)
    : m_client(client)
{
}

psa_status_t AsymmetricAdapter::Sign(psa_key_slot_number_t slot,
                                     psa_algorithm_t algorithm,
                                     const Bytes& hash,
                                     size_t capacity,
                                     Bytes& signature)
{
    LogFunctionEntry();

    std::string keyName = KeySlotToKeyName(slot);
    LogDebug("Signing %zu byte hash with %s, algorithm 0x%08x",
             hash.size(), keyName.c_str(), static_cast<unsigned>(algorithm));

    auto result = m_client.SignHash(keyName, static_cast<uint32_t>(algorithm), hash);
    if (!result.success)
    {
        return ToPsaStatus(result.error);
    }

    if (result.response.size() > capacity)
    {
        SET_SE_ERROR_INFO(DriverErrorCode::BufferTooSmall,
                          "Signature buffer too small",
                          std::to_string(result.response.size()) + " bytes required, " +
                              std::to_string(capacity) + " available");
        return PSA_ERROR_BUFFER_TOO_SMALL;
    }

    signature = std::move(result.response);
    return PSA_SUCCESS;
}

psa_status_t AsymmetricAdapter::Verify(psa_key_slot_number_t slot,
                                       psa_algorithm_t algorithm,
                                       const Bytes& hash,
                                       const Bytes& signature)
{
    LogFunctionEntry();

    std::string keyName = KeySlotToKeyName(slot);

    auto verified = m_client.VerifyHash(keyName, static_cast<uint32_t>(algorithm), hash, signature);
    if (!verified.success)
    {
        return ToPsaStatus(verified.error);
    }

    if (!verified.response)
    {
        LogDebug("Signature mismatch for %s", keyName.c_str());
        return PSA_ERROR_INVALID_SIGNATURE;
    }

    return PSA_SUCCESS;
}

} // namespace se
} // namespace sebridge
