// crypto_client.h - Remote cryptographic service client interface for SeBridge
// Copyright (c) 2025 ludicrypt. All rights reserved.
// Licensed under the MIT License.

#pragma once

#include "crypto_service.pb.h"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace sebridge
{
namespace se
{

/// @brief Where a remote call failed
enum class ClientErrorKind
{
    None,       // No error
    Service,    // The service answered with a non-success ResponseStatus
    Transport,  // The call did not complete (unreachable, deadline, cancelled...)
    Client      // Local client condition, see ClientErrorReason
};

/// @brief Local client failure reasons
enum class ClientErrorReason
{
    None,
    NoProvider,           // No implicit provider has been set
    NoAuthenticator,      // The service offers no usable authenticator
    InvalidConfiguration, // Endpoint or credentials unusable
    InvalidResponse       // Response violates the protocol
};

/// @brief Failure description of a remote call
struct ClientError
{
    ClientErrorKind kind{ClientErrorKind::None};
    v1::ResponseStatus serviceStatus{v1::RESPONSE_STATUS_SUCCESS};
    int transportCode{0};
    ClientErrorReason reason{ClientErrorReason::None};
    std::string message;

    static ClientError Service(v1::ResponseStatus status, const std::string& message = "")
    {
        ClientError error;
        error.kind = ClientErrorKind::Service;
        error.serviceStatus = status;
        error.message = message;
        return error;
    }

    static ClientError Transport(int code, const std::string& message)
    {
        ClientError error;
        error.kind = ClientErrorKind::Transport;
        error.transportCode = code;
        error.message = message;
        return error;
    }

    static ClientError Local(ClientErrorReason reason, const std::string& message)
    {
        ClientError error;
        error.kind = ClientErrorKind::Client;
        error.reason = reason;
        error.message = message;
        return error;
    }

    /// @brief Human readable form used in diagnostics
    std::string Describe() const;
};

/// @brief Remote operation result wrapper
template<typename T>
struct ClientResult
{
    bool success;
    T response;
    ClientError error;

    ClientResult() : success(false), response() {}

    explicit ClientResult(const T& resp)
        : success(true), response(resp) {}

    ClientResult(const ClientError& err)
        : success(false), response(), error(err) {}
};

/// @brief Provider advertised by the service
struct ProviderDescriptor
{
    uint32_t id{0};
    std::string uuid;
    std::string description;
    std::string vendor;
};

/// @brief PSA key policy carried with import and generate requests
struct KeyPolicy
{
    uint32_t lifetime{0};
    uint32_t keyType{0};
    uint32_t bits{0};
    uint32_t usageFlags{0};
    uint32_t algorithm{0};
};

/// @brief Key stored by the service for the bound provider and application
struct RemoteKeyInfo
{
    std::string name;
    uint32_t providerId{0};
    KeyPolicy policy;
};

using Bytes = std::vector<uint8_t>;

/// @brief Operations the driver consumes from the remote service client
class CryptoClient
{
public:
    virtual ~CryptoClient() = default;

    /// @brief Open the session with the service
    virtual ClientResult<bool> Connect() = 0;

    /// @brief Set the deadline applied to every remote call
    virtual void SetTimeout(std::chrono::milliseconds timeout) = 0;

    /// @brief Select the authentication identity sent with requests
    /// @param applicationName Identity label
    virtual ClientResult<bool> SetDefaultAuth(const std::string& applicationName) = 0;

    /// @brief List the providers offered by the service
    virtual ClientResult<std::vector<ProviderDescriptor>> ListProviders() = 0;

    /// @brief Route subsequent key requests to this provider
    virtual void SetImplicitProvider(uint32_t providerId) = 0;

    /// @brief Currently routed provider
    virtual uint32_t ImplicitProvider() const = 0;

    virtual ClientResult<std::vector<RemoteKeyInfo>> ListKeys() = 0;

    virtual ClientResult<bool> ImportKey(const std::string& keyName,
                                         const KeyPolicy& policy,
                                         const Bytes& data) = 0;

    virtual ClientResult<bool> GenerateKey(const std::string& keyName,
                                           const KeyPolicy& policy) = 0;

    virtual ClientResult<Bytes> ExportKey(const std::string& keyName) = 0;

    virtual ClientResult<Bytes> ExportPublicKey(const std::string& keyName) = 0;

    virtual ClientResult<bool> DestroyKey(const std::string& keyName) = 0;

    virtual ClientResult<Bytes> SignHash(const std::string& keyName,
                                         uint32_t algorithm,
                                         const Bytes& hash) = 0;

    /// @brief Verify a signature
    /// @return success with true when the signature matches; a mismatch is
    ///         reported either as false or as the service's invalid-signature status
    virtual ClientResult<bool> VerifyHash(const std::string& keyName,
                                          uint32_t algorithm,
                                          const Bytes& hash,
                                          const Bytes& signature) = 0;
};

} // namespace se
} // namespace sebridge
