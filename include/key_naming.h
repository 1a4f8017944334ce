// key_naming.h - Key slot to remote key name mapping
// Copyright (c) 2025 ludicrypt. All rights reserved.
// Licensed under the MIT License.

#pragma once

#include <psa/crypto.h>
#include <psa/crypto_se_driver.h>

#include <string>

namespace sebridge
{
namespace se
{

/// @brief Prefix shared by every key this driver creates remotely
constexpr const char* kKeyNamePrefix = "sebridge-se-driver-key";

/// @brief Derive the durable remote name of a key slot
/// @param slot Slot number assigned by the host
/// @return Remote key name, distinct for distinct slots
std::string KeySlotToKeyName(psa_key_slot_number_t slot);

} // namespace se
} // namespace sebridge
