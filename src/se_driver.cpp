// se_driver.cpp - PSA secure element driver entry points of SeBridge
// Copyright (c) 2025 ludicrypt. All rights reserved.
// Licensed under the MIT License.

#include "se_driver.h"
#include "asymmetric.h"
#include "client_handle.h"
#include "driver_config.h"
#include "error_handling.h"
#include "key_management.h"
#include "logging.h"
#include "provider_binder.h"

#include <cstring>
#include <exception>
#include <optional>

namespace sebridge
{
namespace se
{

namespace
{

/// @brief Keep exceptions from crossing into the host
template<typename Fn>
psa_status_t GuardEntry(const char* operation, Fn&& fn)
{
    CLEAR_SE_ERROR();

    try
    {
        psa_status_t status = fn();
        LogFunctionExitWithStatus(status);
        return status;
    }
    catch (const std::exception& e)
    {
        SET_SE_ERROR_INFO(DriverErrorCode::InternalError,
                          std::string("Exception in ") + operation, e.what());
        return SE_TO_PSA(DriverErrorCode::InternalError);
    }
    catch (...)
    {
        SET_SE_ERROR(DriverErrorCode::InternalError,
                     std::string("Unknown exception in ") + operation);
        return SE_TO_PSA(DriverErrorCode::InternalError);
    }
}

void CopyToHost(const Bytes& material, uint8_t* buffer, size_t* length)
{
    if (!material.empty())
    {
        std::memcpy(buffer, material.data(), material.size());
    }
    *length = material.size();
}

Bytes FromHost(const uint8_t* buffer, size_t length)
{
    if (buffer == nullptr || length == 0)
    {
        return Bytes();
    }
    return Bytes(buffer, buffer + length);
}

/// @brief Null pointer with a non-zero size, or a missing length output
bool ValidateHostOutput(const uint8_t* buffer, size_t size, const size_t* length,
                        const std::string& name)
{
    return ValidateParameter(length, name + " length") &&
           ValidateInputBuffer(buffer, size, name);
}

} // namespace

psa_status_t SeInit(psa_drv_se_context_t* drvContext,
                    void* persistentData,
                    psa_key_location_t location)
{
    (void)drvContext;
    (void)persistentData;

    return GuardEntry("p_init", [&]() -> psa_status_t {
        DriverConfig config = LoadDriverConfig();
        if (InitializeLogging(config.log))
        {
            LogInfo("Logging initialized at level %d", static_cast<int>(config.log.level));
        }

        LogInfo("Initializing SE driver for location 0x%06x, provider policy %s",
                static_cast<unsigned>(location),
                GetProviderPolicyName(config.binder.policy));

        return ClientHandle::GetInstance().WithWriter("p_init", [&](CryptoClient& client) {
            return BindProvider(client, config.binder);
        });
    });
}

psa_status_t SeAllocateKey(psa_drv_se_context_t* drvContext,
                           void* persistentData,
                           const psa_key_attributes_t* attributes,
                           psa_key_creation_method_t method,
                           psa_key_slot_number_t* keySlot)
{
    (void)drvContext;
    (void)persistentData;

    return GuardEntry("p_allocate", [&]() -> psa_status_t {
        if (!ValidateParameter(attributes, "attributes") || !ValidateParameter(keySlot, "key_slot"))
        {
            return SE_TO_PSA(GET_SE_ERROR().errorCode);
        }

        return ClientHandle::GetInstance().WithReader("p_allocate", [&](CryptoClient& client) {
            psa_key_slot_number_t slot = 0;
            psa_status_t status = KeyManagementAdapter(client).Allocate(*attributes, method, slot);
            if (status == PSA_SUCCESS)
            {
                *keySlot = slot;
            }
            return status;
        });
    });
}

psa_status_t SeValidateSlotNumber(psa_drv_se_context_t* drvContext,
                                  void* persistentData,
                                  const psa_key_attributes_t* attributes,
                                  psa_key_creation_method_t method,
                                  psa_key_slot_number_t keySlot)
{
    (void)drvContext;
    (void)persistentData;
    (void)attributes;

    return GuardEntry("p_validate_slot_number", [&]() -> psa_status_t {
        return ClientHandle::GetInstance().WithReader("p_validate_slot_number",
            [&](CryptoClient& client) {
                return KeyManagementAdapter(client).ValidateSlotNumber(method, keySlot);
            });
    });
}

psa_status_t SeImportKey(psa_drv_se_context_t* drvContext,
                         psa_key_slot_number_t keySlot,
                         const psa_key_attributes_t* attributes,
                         const uint8_t* data,
                         size_t dataLength,
                         size_t* bits)
{
    (void)drvContext;

    return GuardEntry("p_import", [&]() -> psa_status_t {
        if (!ValidateParameter(attributes, "attributes") ||
            !ValidateParameter(bits, "bits") ||
            !ValidateInputBuffer(data, dataLength, "data"))
        {
            return SE_TO_PSA(GET_SE_ERROR().errorCode);
        }

        Bytes material = FromHost(data, dataLength);

        return ClientHandle::GetInstance().WithReader("p_import", [&](CryptoClient& client) {
            size_t keyBits = 0;
            psa_status_t status = KeyManagementAdapter(client).Import(keySlot, *attributes,
                                                                      material, keyBits);
            if (status == PSA_SUCCESS)
            {
                *bits = keyBits;
            }
            return status;
        });
    });
}

psa_status_t SeGenerateKey(psa_drv_se_context_t* drvContext,
                           psa_key_slot_number_t keySlot,
                           const psa_key_attributes_t* attributes,
                           uint8_t* pubkey,
                           size_t pubkeySize,
                           size_t* pubkeyLength)
{
    (void)drvContext;

    return GuardEntry("p_generate", [&]() -> psa_status_t {
        if (!ValidateParameter(attributes, "attributes") ||
            !ValidateInputBuffer(pubkey, pubkeySize, "pubkey"))
        {
            return SE_TO_PSA(GET_SE_ERROR().errorCode);
        }

        std::optional<size_t> capacity;
        if (pubkey != nullptr)
        {
            if (!ValidateParameter(pubkeyLength, "pubkey_length"))
            {
                return SE_TO_PSA(GET_SE_ERROR().errorCode);
            }
            capacity = pubkeySize;
        }

        return ClientHandle::GetInstance().WithReader("p_generate", [&](CryptoClient& client) {
            Bytes publicKey;
            psa_status_t status = KeyManagementAdapter(client).Generate(keySlot, *attributes,
                                                                        capacity, publicKey);
            if (status != PSA_SUCCESS)
            {
                return status;
            }

            if (pubkey != nullptr)
            {
                CopyToHost(publicKey, pubkey, pubkeyLength);
            }
            else if (pubkeyLength != nullptr)
            {
                *pubkeyLength = 0;
            }
            return status;
        });
    });
}

psa_status_t SeDestroyKey(psa_drv_se_context_t* drvContext,
                          void* persistentData,
                          psa_key_slot_number_t keySlot)
{
    (void)drvContext;
    (void)persistentData;

    return GuardEntry("p_destroy", [&]() -> psa_status_t {
        return ClientHandle::GetInstance().WithReader("p_destroy", [&](CryptoClient& client) {
            return KeyManagementAdapter(client).Destroy(keySlot);
        });
    });
}

psa_status_t SeExportKey(psa_drv_se_context_t* drvContext,
                         psa_key_slot_number_t keySlot,
                         uint8_t* data,
                         size_t dataSize,
                         size_t* dataLength)
{
    (void)drvContext;

    return GuardEntry("p_export", [&]() -> psa_status_t {
        if (!ValidateHostOutput(data, dataSize, dataLength, "p_data"))
        {
            return SE_TO_PSA(GET_SE_ERROR().errorCode);
        }

        return ClientHandle::GetInstance().WithReader("p_export", [&](CryptoClient& client) {
            Bytes material;
            psa_status_t status = KeyManagementAdapter(client).Export(keySlot, dataSize, material);
            if (status == PSA_SUCCESS)
            {
                CopyToHost(material, data, dataLength);
            }
            return status;
        });
    });
}

psa_status_t SeExportPublicKey(psa_drv_se_context_t* drvContext,
                               psa_key_slot_number_t keySlot,
                               uint8_t* data,
                               size_t dataSize,
                               size_t* dataLength)
{
    (void)drvContext;

    return GuardEntry("p_export_public", [&]() -> psa_status_t {
        if (!ValidateHostOutput(data, dataSize, dataLength, "p_data"))
        {
            return SE_TO_PSA(GET_SE_ERROR().errorCode);
        }

        return ClientHandle::GetInstance().WithReader("p_export_public", [&](CryptoClient& client) {
            Bytes material;
            psa_status_t status = KeyManagementAdapter(client).ExportPublic(keySlot, dataSize,
                                                                            material);
            if (status == PSA_SUCCESS)
            {
                CopyToHost(material, data, dataLength);
            }
            return status;
        });
    });
}

psa_status_t SeSignHash(psa_drv_se_context_t* drvContext,
                        psa_key_slot_number_t keySlot,
                        psa_algorithm_t alg,
                        const uint8_t* hash,
                        size_t hashLength,
                        uint8_t* signature,
                        size_t signatureSize,
                        size_t* signatureLength)
{
    (void)drvContext;

    return GuardEntry("p_sign", [&]() -> psa_status_t {
        if (!ValidateInputBuffer(hash, hashLength, "p_hash") ||
            !ValidateHostOutput(signature, signatureSize, signatureLength, "p_signature"))
        {
            return SE_TO_PSA(GET_SE_ERROR().errorCode);
        }

        Bytes digest = FromHost(hash, hashLength);

        return ClientHandle::GetInstance().WithReader("p_sign", [&](CryptoClient& client) {
            Bytes produced;
            psa_status_t status = AsymmetricAdapter(client).Sign(keySlot, alg, digest,
                                                                 signatureSize, produced);
            if (status == PSA_SUCCESS)
            {
                CopyToHost(produced, signature, signatureLength);
            }
            return status;
        });
    });
}

psa_status_t SeVerifyHash(psa_drv_se_context_t* drvContext,
                          psa_key_slot_number_t keySlot,
                          psa_algorithm_t alg,
                          const uint8_t* hash,
                          size_t hashLength,
                          const uint8_t* signature,
                          size_t signatureLength)
{
    (void)drvContext;

    return GuardEntry("p_verify", [&]() -> psa_status_t {
        if (!ValidateInputBuffer(hash, hashLength, "p_hash") ||
            !ValidateInputBuffer(signature, signatureLength, "p_signature"))
        {
            return SE_TO_PSA(GET_SE_ERROR().errorCode);
        }

        Bytes digest = FromHost(hash, hashLength);
        Bytes received = FromHost(signature, signatureLength);

        return ClientHandle::GetInstance().WithReader("p_verify", [&](CryptoClient& client) {
            return AsymmetricAdapter(client).Verify(keySlot, alg, digest, received);
        });
    });
}

namespace
{

// Field order follows psa_drv_se_key_management_t
const psa_drv_se_key_management_t s_keyManagement = {
    SeAllocateKey,          // p_allocate
    SeValidateSlotNumber,   // p_validate_slot_number
    SeImportKey,            // p_import
    SeGenerateKey,          // p_generate
    SeDestroyKey,           // p_destroy
    SeExportKey,            // p_export
    SeExportPublicKey       // p_export_public
};

const psa_drv_se_asymmetric_t s_asymmetric = {
    SeSignHash,             // p_sign
    SeVerifyHash,           // p_verify
    nullptr,                // p_encrypt
    nullptr                 // p_decrypt
};

} // namespace

} // namespace se
} // namespace sebridge

extern "C" const psa_drv_se_t sebridge_se_driver = {
    PSA_DRV_SE_HAL_VERSION,                 // hal_version
    0,                                      // persistent_data_size
    sebridge::se::SeInit,                   // p_init
    &sebridge::se::s_keyManagement,         // key_management
    nullptr,                                // mac
    nullptr,                                // cipher
    nullptr,                                // aead
    &sebridge::se::s_asymmetric,            // asymmetric
    nullptr                                 // derivation
};
