// test_key_management.cpp - Unit tests for key lifecycle operations
// Copyright (c) 2025 ludicrypt. All rights reserved.
// Licensed under the MIT License.

#include "se_test_framework.h"

#include "error_handling.h"
#include "key_management.h"
#include "key_naming.h"

using namespace sebridge::se;
using namespace sebridge::se::test;
using namespace testing;

namespace {

class KeyManagementTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        CLEAR_SE_ERROR();
        client_.SetImplicitProvider(FAKE_HARDWARE_PROVIDER_ID);
    }

    KeyPolicy SigningPolicy(uint32_t bits = 256) const
    {
        psa_key_attributes_t attributes = MakeSigningAttributes(1, bits);
        return ToKeyPolicy(attributes);
    }

    FakeCryptoClient client_;
    KeyManagementAdapter adapter_{client_};
};

TEST_F(KeyManagementTest, ToKeyPolicy_CopiesAttributeFields)
{
    psa_key_attributes_t attributes = MakeSigningAttributes(9, 384);

    KeyPolicy policy = ToKeyPolicy(attributes);

    EXPECT_EQ(policy.keyType, static_cast<uint32_t>(PSA_KEY_TYPE_ECC_KEY_PAIR(PSA_ECC_FAMILY_SECP_R1)));
    EXPECT_EQ(policy.bits, 384u);
    EXPECT_EQ(policy.usageFlags,
              static_cast<uint32_t>(PSA_KEY_USAGE_SIGN_HASH | PSA_KEY_USAGE_VERIFY_HASH));
    EXPECT_EQ(policy.algorithm, static_cast<uint32_t>(PSA_ALG_ECDSA(PSA_ALG_SHA_256)));
    EXPECT_EQ(policy.lifetime, static_cast<uint32_t>(psa_get_key_lifetime(&attributes)));
}

TEST_F(KeyManagementTest, Allocate_FreeKeyId_ReturnsKeyIdAsSlot)
{
    psa_key_attributes_t attributes = MakeSigningAttributes(42);
    psa_key_slot_number_t slot = 0;

    EXPECT_PSA_SUCCESS(adapter_.Allocate(attributes, PSA_KEY_CREATION_GENERATE, slot));
    EXPECT_EQ(slot, 42u);
    EXPECT_EQ(client_.KeyCount(), 0u);
}

TEST_F(KeyManagementTest, Allocate_TakenKeyId_ReturnsAlreadyExists)
{
    client_.AddKey(FAKE_HARDWARE_PROVIDER_ID, KeySlotToKeyName(42), SigningPolicy(), {1, 2, 3});
    psa_key_attributes_t attributes = MakeSigningAttributes(42);
    psa_key_slot_number_t slot = 7;

    EXPECT_EQ(adapter_.Allocate(attributes, PSA_KEY_CREATION_IMPORT, slot), PSA_ERROR_ALREADY_EXISTS);
    EXPECT_EQ(slot, 7u);
    EXPECT_EQ(GET_SE_ERROR().errorCode, DriverErrorCode::KeyAlreadyExists);
}

TEST_F(KeyManagementTest, Allocate_KeyOfOtherProvider_IsNotAConflict)
{
    client_.AddKey(FAKE_SOFTWARE_PROVIDER_ID, KeySlotToKeyName(42), SigningPolicy(), {1});
    psa_key_attributes_t attributes = MakeSigningAttributes(42);
    psa_key_slot_number_t slot = 0;

    EXPECT_PSA_SUCCESS(adapter_.Allocate(attributes, PSA_KEY_CREATION_GENERATE, slot));
    EXPECT_EQ(slot, 42u);
}

TEST_F(KeyManagementTest, Allocate_ListFailure_PropagatesTranslatedStatus)
{
    client_.FailNext("ListKeys", ClientError::Service(v1::RESPONSE_STATUS_PSA_ERROR_STORAGE_FAILURE));
    psa_key_attributes_t attributes = MakeSigningAttributes(1);
    psa_key_slot_number_t slot = 0;

    EXPECT_EQ(adapter_.Allocate(attributes, PSA_KEY_CREATION_GENERATE, slot),
              PSA_ERROR_STORAGE_FAILURE);
}

TEST_F(KeyManagementTest, ValidateSlotNumber_Register_RequiresExistingKey)
{
    EXPECT_EQ(adapter_.ValidateSlotNumber(PSA_KEY_CREATION_REGISTER, 5), PSA_ERROR_DOES_NOT_EXIST);

    client_.AddKey(FAKE_HARDWARE_PROVIDER_ID, KeySlotToKeyName(5), SigningPolicy(), {1});
    EXPECT_PSA_SUCCESS(adapter_.ValidateSlotNumber(PSA_KEY_CREATION_REGISTER, 5));
}

TEST_F(KeyManagementTest, ValidateSlotNumber_OtherMethods_RequireFreeSlot)
{
    EXPECT_PSA_SUCCESS(adapter_.ValidateSlotNumber(PSA_KEY_CREATION_IMPORT, 5));
    EXPECT_PSA_SUCCESS(adapter_.ValidateSlotNumber(PSA_KEY_CREATION_GENERATE, 5));

    client_.AddKey(FAKE_HARDWARE_PROVIDER_ID, KeySlotToKeyName(5), SigningPolicy(), {1});
    EXPECT_EQ(adapter_.ValidateSlotNumber(PSA_KEY_CREATION_IMPORT, 5), PSA_ERROR_ALREADY_EXISTS);
    EXPECT_EQ(adapter_.ValidateSlotNumber(PSA_KEY_CREATION_GENERATE, 5), PSA_ERROR_ALREADY_EXISTS);
}

TEST_F(KeyManagementTest, Import_BitsFromAttributes_ReturnsAttributeBits)
{
    psa_key_attributes_t attributes = MakeSigningAttributes(3, 256);
    Bytes material(32, 0x11);
    size_t bits = 0;

    EXPECT_PSA_SUCCESS(adapter_.Import(3, attributes, material, bits));
    EXPECT_EQ(bits, 256u);

    auto key = client_.GetKey(KeySlotToKeyName(3));
    ASSERT_TRUE(key.has_value());
    EXPECT_EQ(key->providerId, FAKE_HARDWARE_PROVIDER_ID);
}

TEST_F(KeyManagementTest, Import_UnsetBits_UsesSizeReportedByService)
{
    client_.SetDerivedBits(384);
    psa_key_attributes_t attributes = MakeSigningAttributes(3, 0);
    size_t bits = 0;

    EXPECT_PSA_SUCCESS(adapter_.Import(3, attributes, Bytes(48, 0x22), bits));
    EXPECT_EQ(bits, 384u);
}

TEST_F(KeyManagementTest, Import_SizeLookupFails_RemovesImportedKey)
{
    client_.FailNext("ListKeys", ClientError::Service(v1::RESPONSE_STATUS_PSA_ERROR_COMMUNICATION_FAILURE));
    psa_key_attributes_t attributes = MakeSigningAttributes(3, 0);
    size_t bits = 99;

    EXPECT_EQ(adapter_.Import(3, attributes, Bytes(32, 0x22), bits),
              PSA_ERROR_COMMUNICATION_FAILURE);
    EXPECT_EQ(bits, 99u);
    EXPECT_FALSE(client_.HasKey(KeySlotToKeyName(3)));
}

TEST_F(KeyManagementTest, Import_ExistingKey_ReturnsAlreadyExists)
{
    client_.AddKey(FAKE_HARDWARE_PROVIDER_ID, KeySlotToKeyName(3), SigningPolicy(), {1});
    psa_key_attributes_t attributes = MakeSigningAttributes(3);
    size_t bits = 0;

    EXPECT_EQ(adapter_.Import(3, attributes, Bytes(32, 0x33), bits), PSA_ERROR_ALREADY_EXISTS);
}

TEST_F(KeyManagementTest, Generate_WithoutPublicKeyBuffer_CreatesKeyOnly)
{
    psa_key_attributes_t attributes = MakeSigningAttributes(10);
    Bytes publicKey;

    EXPECT_PSA_SUCCESS(adapter_.Generate(10, attributes, std::nullopt, publicKey));
    EXPECT_TRUE(publicKey.empty());
    EXPECT_TRUE(client_.HasKey(KeySlotToKeyName(10)));
}

TEST_F(KeyManagementTest, Generate_WithPublicKeyBuffer_ReturnsPublicKey)
{
    psa_key_attributes_t attributes = MakeSigningAttributes(10);
    std::string keyName = KeySlotToKeyName(10);
    Bytes publicKey;

    EXPECT_PSA_SUCCESS(adapter_.Generate(10, attributes, size_t(128), publicKey));

    ASSERT_EQ(publicKey.size(), keyName.size() + 1);
    EXPECT_EQ(publicKey[0], FAKE_PUBLIC_KEY_MARKER);
}

TEST_F(KeyManagementTest, Generate_PublicKeyDoesNotFit_DestroysNewKey)
{
    psa_key_attributes_t attributes = MakeSigningAttributes(10);
    Bytes publicKey;

    EXPECT_EQ(adapter_.Generate(10, attributes, size_t(4), publicKey), PSA_ERROR_BUFFER_TOO_SMALL);
    EXPECT_TRUE(publicKey.empty());
    EXPECT_FALSE(client_.HasKey(KeySlotToKeyName(10)));
    EXPECT_EQ(client_.CallCount("DestroyKey"), 1);
}

TEST_F(KeyManagementTest, Generate_PublicExportFails_DestroysNewKey)
{
    client_.FailNext("ExportPublicKey",
                     ClientError::Service(v1::RESPONSE_STATUS_PSA_ERROR_HARDWARE_FAILURE));
    psa_key_attributes_t attributes = MakeSigningAttributes(10);
    Bytes publicKey;

    EXPECT_EQ(adapter_.Generate(10, attributes, size_t(128), publicKey), PSA_ERROR_HARDWARE_FAILURE);
    EXPECT_FALSE(client_.HasKey(KeySlotToKeyName(10)));
}

TEST_F(KeyManagementTest, Export_FitsBuffer_ReturnsMaterial)
{
    Bytes material = {0xde, 0xad, 0xbe, 0xef};
    client_.AddKey(FAKE_HARDWARE_PROVIDER_ID, KeySlotToKeyName(8), SigningPolicy(), material);
    Bytes data;

    EXPECT_PSA_SUCCESS(adapter_.Export(8, material.size(), data));
    EXPECT_EQ(data, material);
}

TEST_F(KeyManagementTest, Export_BufferTooSmall_LeavesOutputUntouched)
{
    client_.AddKey(FAKE_HARDWARE_PROVIDER_ID, KeySlotToKeyName(8), SigningPolicy(), Bytes(32, 0x42));
    Bytes data = {0x01};

    EXPECT_EQ(adapter_.Export(8, 31, data), PSA_ERROR_BUFFER_TOO_SMALL);
    EXPECT_EQ(data, Bytes({0x01}));
    EXPECT_EQ(GET_SE_ERROR().errorCode, DriverErrorCode::BufferTooSmall);
}

TEST_F(KeyManagementTest, ExportPublic_MissingKey_ReturnsDoesNotExist)
{
    Bytes data;

    EXPECT_EQ(adapter_.ExportPublic(8, 64, data), PSA_ERROR_DOES_NOT_EXIST);
}

TEST_F(KeyManagementTest, ExportPublic_BufferTooSmall_LeavesOutputUntouched)
{
    client_.AddKey(FAKE_HARDWARE_PROVIDER_ID, KeySlotToKeyName(8), SigningPolicy(), Bytes(32, 0x42));
    size_t publicKeySize = FakeCryptoClient::PublicKeyOf(KeySlotToKeyName(8)).size();
    Bytes data = {0x01};

    EXPECT_EQ(adapter_.ExportPublic(8, publicKeySize - 1, data), PSA_ERROR_BUFFER_TOO_SMALL);
    EXPECT_EQ(data, Bytes({0x01}));
    EXPECT_EQ(GET_SE_ERROR().errorCode, DriverErrorCode::BufferTooSmall);
    EXPECT_TRUE(client_.HasKey(KeySlotToKeyName(8)));

    EXPECT_PSA_SUCCESS(adapter_.ExportPublic(8, publicKeySize, data));
    EXPECT_EQ(data, FakeCryptoClient::PublicKeyOf(KeySlotToKeyName(8)));
}

TEST_F(KeyManagementTest, Destroy_ExistingKey_RemovesIt)
{
    client_.AddKey(FAKE_HARDWARE_PROVIDER_ID, KeySlotToKeyName(12), SigningPolicy(), {1});

    EXPECT_PSA_SUCCESS(adapter_.Destroy(12));
    EXPECT_FALSE(client_.HasKey(KeySlotToKeyName(12)));
}

TEST_F(KeyManagementTest, Destroy_AbsentKey_ReturnsDoesNotExist)
{
    EXPECT_EQ(adapter_.Destroy(12), PSA_ERROR_DOES_NOT_EXIST);
}

TEST(KeyManagementUnboundTest, Operations_WithoutProvider_ReturnGenericError)
{
    FakeCryptoClient client;
    KeyManagementAdapter adapter(client);
    psa_key_attributes_t attributes = MakeSigningAttributes(1);
    psa_key_slot_number_t slot = 0;
    size_t bits = 0;
    Bytes data;

    EXPECT_EQ(adapter.Allocate(attributes, PSA_KEY_CREATION_GENERATE, slot), PSA_ERROR_GENERIC_ERROR);
    EXPECT_EQ(adapter.Import(1, attributes, Bytes(32, 1), bits), PSA_ERROR_GENERIC_ERROR);
    EXPECT_EQ(adapter.Export(1, 64, data), PSA_ERROR_GENERIC_ERROR);
    EXPECT_EQ(adapter.Destroy(1), PSA_ERROR_GENERIC_ERROR);
    EXPECT_EQ(client.KeyCount(), 0u);
}

} // namespace
