// grpc_backend.h - gRPC client of the remote cryptographic service for SeBridge
// Copyright (c) 2025 ludicrypt. All rights reserved.
// Licensed under the MIT License.

#pragma once

#include "crypto_client.h"
#include "crypto_service.grpc.pb.h"

#include <grpcpp/grpcpp.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace sebridge
{
namespace se
{

/// @brief Metadata key carrying the authentication identity
constexpr const char* kAppNameMetadataKey = "x-sebridge-app-name";

/// @brief Metadata key carrying the implicit provider id
constexpr const char* kProviderMetadataKey = "x-sebridge-provider";

/// @brief Connection configuration
struct ConnectionConfig
{
    std::string endpoint{"unix:///run/sebridge/api.sock"};
    std::string certificatePath;
    std::string privateKeyPath;
    std::string caCertificatePath;
    std::chrono::seconds connectionTimeout{5};
    bool enableTls{false};
};

/// @brief CryptoClient talking to the sebridge.v1.CryptoService over gRPC
///
/// The client is created naked: no channel, no provider and no identity.
/// The channel is created on first use and shared by all later calls; the
/// stub and channel are safe for concurrent calls.
class GrpcCryptoClient : public CryptoClient
{
public:
    /// @brief Constructor
    /// @param config Connection configuration
    explicit GrpcCryptoClient(const ConnectionConfig& config);

    /// @brief Constructor over an existing channel
    /// @param channel Channel to use for every call
    explicit GrpcCryptoClient(std::shared_ptr<grpc::Channel> channel);

    ~GrpcCryptoClient() override;

    // Disable copy and move
    GrpcCryptoClient(const GrpcCryptoClient&) = delete;
    GrpcCryptoClient& operator=(const GrpcCryptoClient&) = delete;
    GrpcCryptoClient(GrpcCryptoClient&&) = delete;
    GrpcCryptoClient& operator=(GrpcCryptoClient&&) = delete;

    ClientResult<bool> Connect() override;
    void SetTimeout(std::chrono::milliseconds timeout) override;

    /// @brief Select the identity label sent with routed requests
    ///
    /// The service has to offer the direct authenticator for the label to be
    /// accepted.
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

    /// @brief Currently configured call timeout
    std::chrono::milliseconds GetTimeout() const;

private:
    /// @brief Get the service stub, creating the channel on first use
    /// @param error Set when the channel cannot be created
    /// @return Stub or nullptr
    std::shared_ptr<v1::CryptoService::Stub> GetStub(ClientError& error);

    /// @brief Create gRPC channel
    /// @return Shared pointer to channel, nullptr on failure
    std::shared_ptr<grpc::Channel> CreateChannel();

    /// @brief Setup channel credentials
    /// @return Channel credentials, nullptr when TLS material cannot be read
    std::shared_ptr<grpc::ChannelCredentials> SetupTlsCredentials();

    /// @brief Apply deadline and identity metadata to a call
    /// @param context Call context
    /// @param routed Whether the request is addressed to the implicit provider
    void PrepareContext(grpc::ClientContext& context, bool routed) const;

    /// @brief Check that a routed request can be sent
    /// @return true when a provider is bound
    bool CheckProvider(ClientError& error, const char* operation) const;

private:
    mutable std::mutex m_mutex;

    ConnectionConfig m_config;
    std::shared_ptr<grpc::Channel> m_channel;
    std::shared_ptr<v1::CryptoService::Stub> m_stub;

    std::string m_applicationName;
    std::atomic<uint32_t> m_providerId{0};
    std::atomic<bool> m_providerSet{false};
    std::atomic<int64_t> m_timeoutMs{5000};
};

} // namespace se
} // namespace sebridge
