// key_management.cpp - Key lifecycle operations of the SeBridge SE driver
// Copyright (c) 2025 ludicrypt. All rights reserved.
// Licensed under the MIT License.

#include "key_management.h"
#include "error_handling.h"
#include "key_naming.h"
#include "logging.h"
#include "status_translation.h"

namespace sebridge
{
namespace se
{

KeyPolicy ToKeyPolicy(const psa_key_attributes_t& attributes)
{
    KeyPolicy policy;
    policy.lifetime = static_cast<uint32_t>(psa_get_key_lifetime(&attributes));
    policy.keyType = static_cast<uint32_t>(psa_get_key_type(&attributes));
    policy.bits = static_cast<uint32_t>(psa_get_key_bits(&attributes));
    policy.usageFlags = static_cast<uint32_t>(psa_get_key_usage_flags(&attributes));
    policy.algorithm = static_cast<uint32_t>(psa_get_key_algorithm(&attributes));
    return policy;
}

KeyManagementAdapter::KeyManagementAdapter(CryptoClient& client)
    : m_client(client)
{
}

psa_status_t KeyManagementAdapter::Allocate(const psa_key_attributes_t& attributes,
                                            psa_key_creation_method_t method,
                                            psa_key_slot_number_t& slot)
{
    LogFunctionEntry();

    psa_key_slot_number_t candidate = static_cast<psa_key_slot_number_t>(
        MBEDTLS_SVC_KEY_ID_GET_KEY_ID(psa_get_key_id(&attributes)));
    std::string keyName = KeySlotToKeyName(candidate);

    std::optional<RemoteKeyInfo> existing;
    psa_status_t status = FindKey(keyName, existing);
    if (status != PSA_SUCCESS)
    {
        return status;
    }

    if (existing)
    {
        SET_SE_ERROR_INFO(DriverErrorCode::KeyAlreadyExists,
                          "Slot already holds a key", keyName);
        return PSA_ERROR_ALREADY_EXISTS;
    }

    slot = candidate;
    LogDebug("Allocated slot %llu (method %u)",
             static_cast<unsigned long long>(slot),
             static_cast<unsigned>(method));
    return PSA_SUCCESS;
}

psa_status_t KeyManagementAdapter::ValidateSlotNumber(psa_key_creation_method_t method,
                                                      psa_key_slot_number_t slot)
{
    LogFunctionEntry();

    std::string keyName = KeySlotToKeyName(slot);

    std::optional<RemoteKeyInfo> existing;
    psa_status_t status = FindKey(keyName, existing);
    if (status != PSA_SUCCESS)
    {
        return status;
    }

    if (method == PSA_KEY_CREATION_REGISTER)
    {
        if (!existing)
        {
            SET_SE_ERROR_INFO(DriverErrorCode::KeyNotFound,
                              "Registered key does not exist", keyName);
            return PSA_ERROR_DOES_NOT_EXIST;
        }
        return PSA_SUCCESS;
    }

    if (existing)
    {
        SET_SE_ERROR_INFO(DriverErrorCode::KeyAlreadyExists,
                          "Slot already holds a key", keyName);
        return PSA_ERROR_ALREADY_EXISTS;
    }

    return PSA_SUCCESS;
}

psa_status_t KeyManagementAdapter::Import(psa_key_slot_number_t slot,
                                          const psa_key_attributes_t& attributes,
                                          const Bytes& data,
                                          size_t& bits)
{
    LogFunctionEntry();

    std::string keyName = KeySlotToKeyName(slot);
    KeyPolicy policy = ToKeyPolicy(attributes);

    auto imported = m_client.ImportKey(keyName, policy, data);
    if (!imported.success)
    {
        return ToPsaStatus(imported.error);
    }

    if (policy.bits != 0)
    {
        bits = policy.bits;
        return PSA_SUCCESS;
    }

    // Size derived by the service from the material
    std::optional<RemoteKeyInfo> info;
    psa_status_t status = FindKey(keyName, info);
    if (status == PSA_SUCCESS && !info)
    {
        SET_SE_ERROR_INFO(DriverErrorCode::KeyNotFound,
                          "Imported key missing from key list", keyName);
        status = PSA_ERROR_DOES_NOT_EXIST;
    }

    if (status != PSA_SUCCESS)
    {
        auto destroyed = m_client.DestroyKey(keyName);
        if (!destroyed.success)
        {
            LogError("Rollback of %s failed: %s",
                     keyName.c_str(), destroyed.error.Describe().c_str());
        }
        return status;
    }

    bits = info->policy.bits;
    return PSA_SUCCESS;
}

psa_status_t KeyManagementAdapter::Generate(psa_key_slot_number_t slot,
                                            const psa_key_attributes_t& attributes,
                                            std::optional<size_t> publicKeyCapacity,
                                            Bytes& publicKey)
{
    LogFunctionEntry();

    std::string keyName = KeySlotToKeyName(slot);

    auto generated = m_client.GenerateKey(keyName, ToKeyPolicy(attributes));
    if (!generated.success)
    {
        return ToPsaStatus(generated.error);
    }

    if (!publicKeyCapacity)
    {
        return PSA_SUCCESS;
    }

    psa_status_t status;
    auto exported = m_client.ExportPublicKey(keyName);
    if (!exported.success)
    {
        status = ToPsaStatus(exported.error);
    }
    else
    {
        status = CheckCapacity(exported.response, *publicKeyCapacity, keyName);
    }

    if (status != PSA_SUCCESS)
    {
        LogWarning("Public key of %s not delivered, destroying the new key", keyName.c_str());
        auto destroyed = m_client.DestroyKey(keyName);
        if (!destroyed.success)
        {
            LogError("Rollback of %s failed: %s",
                     keyName.c_str(), destroyed.error.Describe().c_str());
        }
        return status;
    }

    publicKey = std::move(exported.response);
    return PSA_SUCCESS;
}

psa_status_t KeyManagementAdapter::Export(psa_key_slot_number_t slot, size_t capacity, Bytes& data)
{
    LogFunctionEntry();

    std::string keyName = KeySlotToKeyName(slot);

    auto exported = m_client.ExportKey(keyName);
    if (!exported.success)
    {
        return ToPsaStatus(exported.error);
    }

    psa_status_t status = CheckCapacity(exported.response, capacity, keyName);
    if (status == PSA_SUCCESS)
    {
        data = std::move(exported.response);
    }
    return status;
}

psa_status_t KeyManagementAdapter::ExportPublic(psa_key_slot_number_t slot, size_t capacity,
                                                Bytes& data)
{
    LogFunctionEntry();

    std::string keyName = KeySlotToKeyName(slot);

    auto exported = m_client.ExportPublicKey(keyName);
    if (!exported.success)
    {
        return ToPsaStatus(exported.error);
    }

    psa_status_t status = CheckCapacity(exported.response, capacity, keyName);
    if (status == PSA_SUCCESS)
    {
        data = std::move(exported.response);
    }
    return status;
}

psa_status_t KeyManagementAdapter::Destroy(psa_key_slot_number_t slot)
{
    LogFunctionEntry();

    std::string keyName = KeySlotToKeyName(slot);

    auto destroyed = m_client.DestroyKey(keyName);
    if (!destroyed.success)
    {
        return ToPsaStatus(destroyed.error);
    }

    return PSA_SUCCESS;
}

psa_status_t KeyManagementAdapter::FindKey(const std::string& keyName,
                                           std::optional<RemoteKeyInfo>& info)
{
    auto keys = m_client.ListKeys();
    if (!keys.success)
    {
        return ToPsaStatus(keys.error);
    }

    uint32_t providerId = m_client.ImplicitProvider();
    for (auto& key : keys.response)
    {
        if (key.name == keyName && key.providerId == providerId)
        {
            info = std::move(key);
            return PSA_SUCCESS;
        }
    }

    info.reset();
    return PSA_SUCCESS;
}

psa_status_t KeyManagementAdapter::CheckCapacity(const Bytes& material, size_t capacity,
                                                 const std::string& keyName)
{
    if (material.size() > capacity)
    {
        SET_SE_ERROR_INFO(DriverErrorCode::BufferTooSmall,
                          "Output buffer too small for " + keyName,
                          std::to_string(material.size()) + " bytes required, " +
                              std::to_string(capacity) + " available");
        return PSA_ERROR_BUFFER_TOO_SMALL;
    }

    return PSA_SUCCESS;
}

} // namespace se
} // namespace sebridge
