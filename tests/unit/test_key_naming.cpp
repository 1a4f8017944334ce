// test_key_naming.cpp - Unit tests for key slot naming
// Copyright (c) 2025 ludicrypt. All rights reserved.
// Licensed under the MIT License.

#include <gtest/gtest.h>

#include "key_naming.h"

#include <limits>
#include <set>

using namespace sebridge::se;

TEST(KeyNamingTest, KeySlotToKeyName_UsesFixedTemplate)
{
    EXPECT_EQ(KeySlotToKeyName(0), "sebridge-se-driver-key0");
    EXPECT_EQ(KeySlotToKeyName(42), "sebridge-se-driver-key42");
    EXPECT_EQ(KeySlotToKeyName(std::numeric_limits<psa_key_slot_number_t>::max()),
              "sebridge-se-driver-key18446744073709551615");
}

TEST(KeyNamingTest, KeySlotToKeyName_RepeatedCalls_SameName)
{
    EXPECT_EQ(KeySlotToKeyName(7), KeySlotToKeyName(7));
}

TEST(KeyNamingTest, KeySlotToKeyName_DistinctSlots_DistinctNames)
{
    std::set<std::string> names;
    for (psa_key_slot_number_t slot = 0; slot < 1000; ++slot)
    {
        names.insert(KeySlotToKeyName(slot));
    }
    names.insert(KeySlotToKeyName(0x100000000ULL));

    EXPECT_EQ(names.size(), 1001u);
}
