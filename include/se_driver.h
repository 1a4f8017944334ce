// se_driver.h - PSA secure element driver entry points of SeBridge
// Copyright (c) 2025 ludicrypt. All rights reserved.
// Licensed under the MIT License.

#pragma once

#include <psa/crypto.h>
#include <psa/crypto_se_driver.h>

#include <cstddef>
#include <cstdint>

/// @brief Driver table to pass to psa_register_se_driver()
extern "C" const psa_drv_se_t sebridge_se_driver;

namespace sebridge
{
namespace se
{

/// @brief Bind the driver to a remote provider
///
/// Configures logging, then discovers and binds the provider while holding
/// the client handle exclusively. A repeated call binds again.
psa_status_t SeInit(psa_drv_se_context_t* drvContext,
                    void* persistentData,
                    psa_key_location_t location);

psa_status_t SeAllocateKey(psa_drv_se_context_t* drvContext,
                           void* persistentData,
                           const psa_key_attributes_t* attributes,
                           psa_key_creation_method_t method,
                           psa_key_slot_number_t* keySlot);

psa_status_t SeValidateSlotNumber(psa_drv_se_context_t* drvContext,
                                  void* persistentData,
                                  const psa_key_attributes_t* attributes,
                                  psa_key_creation_method_t method,
                                  psa_key_slot_number_t keySlot);

psa_status_t SeImportKey(psa_drv_se_context_t* drvContext,
                         psa_key_slot_number_t keySlot,
                         const psa_key_attributes_t* attributes,
                         const uint8_t* data,
                         size_t dataLength,
                         size_t* bits);

/// @brief Generate a key
///
/// The public key is exported only when pubkey is not null; in that case a
/// failed export destroys the generated key.
psa_status_t SeGenerateKey(psa_drv_se_context_t* drvContext,
                           psa_key_slot_number_t keySlot,
                           const psa_key_attributes_t* attributes,
                           uint8_t* pubkey,
                           size_t pubkeySize,
                           size_t* pubkeyLength);

psa_status_t SeDestroyKey(psa_drv_se_context_t* drvContext,
                          void* persistentData,
                          psa_key_slot_number_t keySlot);

psa_status_t SeExportKey(psa_drv_se_context_t* drvContext,
                         psa_key_slot_number_t keySlot,
                         uint8_t* data,
                         size_t dataSize,
                         size_t* dataLength);

psa_status_t SeExportPublicKey(psa_drv_se_context_t* drvContext,
                               psa_key_slot_number_t keySlot,
                               uint8_t* data,
                               size_t dataSize,
                               size_t* dataLength);

psa_status_t SeSignHash(psa_drv_se_context_t* drvContext,
                        psa_key_slot_number_t keySlot,
                        psa_algorithm_t alg,
                        const uint8_t* hash,
                        size_t hashLength,
                        uint8_t* signature,
                        size_t signatureSize,
                        size_t* signatureLength);

psa_status_t SeVerifyHash(psa_drv_se_context_t* drvContext,
                          psa_key_slot_number_t keySlot,
                          psa_algorithm_t alg,
                          const uint8_t* hash,
                          size_t hashLength,
                          const uint8_t* signature,
                          size_t signatureLength);

} // namespace se
} // namespace sebridge
