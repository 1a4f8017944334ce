// se_test_framework.h - SeBridge SE driver test framework
// Copyright (c) 2025 ludicrypt. All rights reserved.
// Licensed under the MIT License.

#pragma once

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "crypto_client.h"
#include "provider_binder.h"

#include <psa/crypto.h>

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// mbed TLS 2.x headers expose the driver table fields under their plain names
#ifndef MBEDTLS_PRIVATE
#define MBEDTLS_PRIVATE(member) member
#endif

namespace sebridge::se::test {

// Provider ids advertised by the fake service
constexpr uint32_t FAKE_CORE_PROVIDER_ID = 0;
constexpr uint32_t FAKE_HARDWARE_PROVIDER_ID = 2;
constexpr uint32_t FAKE_SOFTWARE_PROVIDER_ID = 3;

// Signature layout of the fake service: marker, key name, hash
constexpr uint8_t FAKE_SIGNATURE_MARKER = 0x5a;

// Public keys of the fake service: marker followed by the key name
constexpr uint8_t FAKE_PUBLIC_KEY_MARKER = 0x04;

/// @brief Core, hardware and software providers in service order
std::vector<ProviderDescriptor> StandardProviders();

/// @brief Key attributes for an ECDSA P-256 signing key
psa_key_attributes_t MakeSigningAttributes(psa_key_id_t id, size_t bits = 256);

/// @brief In-memory CryptoClient emulating the remote service
///
/// Keys are stored per provider; failures can be injected per operation.
class FakeCryptoClient : public CryptoClient {
public:
    FakeCryptoClient();

    ClientResult<bool> Connect() override;
    void SetTimeout(std::chrono::milliseconds timeout) override;
    ClientResult<bool> SetDefaultAuth(const std::string& applicationName) override;
    ClientResult<std::vector<ProviderDescriptor>> ListProviders() override;
    void SetImplicitProvider(uint32_t providerId) override;
    uint32_t ImplicitProvider() const override;
    ClientResult<std::vector<RemoteKeyInfo>> ListKeys() override;
    ClientResult<bool> ImportKey(const std::string& keyName,
                                 const KeyPolicy& policy,
                                 const Bytes& data) override;
    ClientResult<bool> GenerateKey(const std::string& keyName,
                                   const KeyPolicy& policy) override;
    ClientResult<Bytes> ExportKey(const std::string& keyName) override;
    ClientResult<Bytes> ExportPublicKey(const std::string& keyName) override;
    ClientResult<bool> DestroyKey(const std::string& keyName) override;
    ClientResult<Bytes> SignHash(const std::string& keyName,
                                 uint32_t algorithm,
                                 const Bytes& hash) override;
    ClientResult<bool> VerifyHash(const std::string& keyName,
                                  uint32_t algorithm,
                                  const Bytes& hash,
                                  const Bytes& signature) override;

    // Test controls
    void SetProviders(const std::vector<ProviderDescriptor>& providers);
    void FailNext(const std::string& operation, const ClientError& error);
    void AddKey(uint32_t providerId, const std::string& keyName,
                const KeyPolicy& policy, const Bytes& material);
    bool HasKey(const std::string& keyName) const;
    std::optional<RemoteKeyInfo> GetKey(const std::string& keyName) const;
    size_t KeyCount() const;
    std::chrono::milliseconds Timeout() const;
    std::string ApplicationName() const;
    int CallCount(const std::string& operation) const;

    /// @brief Bits reported for imported keys whose policy leaves them unset
    void SetDerivedBits(uint32_t bits);

    /// @brief Public part the fake reports for a key
    static Bytes PublicKeyOf(const std::string& keyName);

private:
    struct StoredKey {
        uint32_t providerId;
        KeyPolicy policy;
        Bytes material;
    };

    std::optional<ClientError> TakeFailure(const std::string& operation);
    std::optional<ClientError> RequireProvider() const;
    static Bytes SignatureOf(const std::string& keyName, const Bytes& hash);

    mutable std::mutex mutex_;
    std::vector<ProviderDescriptor> providers_;
    std::map<std::string, StoredKey> keys_;
    std::map<std::string, ClientError> failures_;
    std::map<std::string, int> calls_;
    std::optional<uint32_t> providerId_;
    std::chrono::milliseconds timeout_{0};
    std::string applicationName_;
    uint32_t derivedBits_{256};
};

/// @brief gMock CryptoClient
class MockCryptoClient : public CryptoClient {
public:
    MOCK_METHOD(ClientResult<bool>, Connect, (), (override));
    MOCK_METHOD(void, SetTimeout, (std::chrono::milliseconds), (override));
    MOCK_METHOD(ClientResult<bool>, SetDefaultAuth, (const std::string&), (override));
    MOCK_METHOD(ClientResult<std::vector<ProviderDescriptor>>, ListProviders, (), (override));
    MOCK_METHOD(void, SetImplicitProvider, (uint32_t), (override));
    MOCK_METHOD(uint32_t, ImplicitProvider, (), (const, override));
    MOCK_METHOD(ClientResult<std::vector<RemoteKeyInfo>>, ListKeys, (), (override));
    MOCK_METHOD(ClientResult<bool>, ImportKey,
                (const std::string&, const KeyPolicy&, const Bytes&), (override));
    MOCK_METHOD(ClientResult<bool>, GenerateKey,
                (const std::string&, const KeyPolicy&), (override));
    MOCK_METHOD(ClientResult<Bytes>, ExportKey, (const std::string&), (override));
    MOCK_METHOD(ClientResult<Bytes>, ExportPublicKey, (const std::string&), (override));
    MOCK_METHOD(ClientResult<bool>, DestroyKey, (const std::string&), (override));
    MOCK_METHOD(ClientResult<Bytes>, SignHash,
                (const std::string&, uint32_t, const Bytes&), (override));
    MOCK_METHOD(ClientResult<bool>, VerifyHash,
                (const std::string&, uint32_t, const Bytes&, const Bytes&), (override));
};

/// @brief Fixture installing a FakeCryptoClient into the process-wide handle
class SeDriverTestBase : public ::testing::Test {
protected:
    void SetUp() override;
    void TearDown() override;

    /// @brief Bind the installed fake the way p_init does
    psa_status_t BindFake(ProviderPolicy policy = ProviderPolicy::AnyExceptCore);

    // Owned by the client handle once installed
    FakeCryptoClient* fake_ = nullptr;
};

} // namespace sebridge::se::test

// Convenience macros
#define EXPECT_PSA_SUCCESS(status) EXPECT_EQ((status), PSA_SUCCESS)
#define ASSERT_PSA_SUCCESS(status) ASSERT_EQ((status), PSA_SUCCESS)
