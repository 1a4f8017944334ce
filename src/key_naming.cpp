// key_naming.cpp - Key slot to remote key name mapping
// Copyright (c) 2025 ludicrypt. All rights reserved.
// Licensed under the MIT License.

#include "key_naming.h"

namespace sebridge
{
namespace se
{

std::string KeySlotToKeyName(psa_key_slot_number_t slot)
{
    return std::string(kKeyNamePrefix) + std::to_string(slot);
}

} // namespace se
} // namespace sebridge
