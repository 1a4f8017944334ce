// key_management.h - Key lifecycle operations of the SeBridge SE driver
// Copyright (c) 2025 ludicrypt. All rights reserved.
// Licensed under the MIT License.

#pragma once

#include "crypto_client.h"

#include <psa/crypto.h>
#include <psa/crypto_se_driver.h>

#include <optional>
#include <string>

namespace sebridge
{
namespace se
{

/// @brief Build the wire policy from PSA key attributes
KeyPolicy ToKeyPolicy(const psa_key_attributes_t& attributes);

/// @brief Key lifecycle operations against the bound provider
///
/// Operates on owned values only; copying into host buffers is left to the
/// driver entry points and happens only after an operation succeeded.
class KeyManagementAdapter
{
public:
    /// @brief Constructor
    /// @param client Bound client, used for the lifetime of the adapter
    explicit KeyManagementAdapter(CryptoClient& client);

    /// @brief Choose the slot of a new key
    /// @param attributes Attributes of the key being created
    /// @param method Creation method
    /// @param slot Receives the key identifier on success
    /// @return PSA_ERROR_ALREADY_EXISTS if the derived key name is taken
    psa_status_t Allocate(const psa_key_attributes_t& attributes,
                          psa_key_creation_method_t method,
                          psa_key_slot_number_t& slot);

    /// @brief Check a slot chosen by the application
    /// @param method Creation method; registration requires an existing key
    /// @param slot Slot number
    psa_status_t ValidateSlotNumber(psa_key_creation_method_t method,
                                    psa_key_slot_number_t slot);

    /// @brief Import key material
    /// @param slot Slot number
    /// @param attributes Key attributes
    /// @param data Key material
    /// @param bits Receives the key size on success
    psa_status_t Import(psa_key_slot_number_t slot,
                        const psa_key_attributes_t& attributes,
                        const Bytes& data,
                        size_t& bits);

    /// @brief Generate a key, optionally exporting its public part
    /// @param slot Slot number
    /// @param attributes Key attributes
    /// @param publicKeyCapacity Host buffer size, nullopt when no public key is wanted
    /// @param publicKey Receives the public key when requested
    /// @return On failure to deliver the public key the new key is destroyed
    psa_status_t Generate(psa_key_slot_number_t slot,
                          const psa_key_attributes_t& attributes,
                          std::optional<size_t> publicKeyCapacity,
                          Bytes& publicKey);

    /// @brief Export key material
    /// @param slot Slot number
    /// @param capacity Host buffer size
    /// @param data Receives the material when it fits
    psa_status_t Export(psa_key_slot_number_t slot, size_t capacity, Bytes& data);

    /// @brief Export the public part of a key
    /// @param slot Slot number
    /// @param capacity Host buffer size
    /// @param data Receives the public key when it fits
    psa_status_t ExportPublic(psa_key_slot_number_t slot, size_t capacity, Bytes& data);

    /// @brief Destroy a key
    /// @param slot Slot number
    /// @return PSA_ERROR_DOES_NOT_EXIST for an absent key
    psa_status_t Destroy(psa_key_slot_number_t slot);

private:
    /// @brief Look up a key of the bound provider
    /// @param keyName Remote key name
    /// @param info Receives the key description, nullopt when absent
    psa_status_t FindKey(const std::string& keyName, std::optional<RemoteKeyInfo>& info);

    /// @brief Check material size against the host buffer
    static psa_status_t CheckCapacity(const Bytes& material, size_t capacity,
                                      const std::string& keyName);

private:
    CryptoClient& m_client;
};

} // namespace se
} // namespace sebridge
