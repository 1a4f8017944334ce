// grpc_backend.cpp - gRPC client of the remote cryptographic service for SeBridge
// Copyright (c) 2025 ludicrypt. All rights reserved.
// Licensed under the MIT License.

#include "grpc_backend.h"
#include "error_handling.h"
#include "logging.h"

#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include <fstream>
#include <iterator>

namespace sebridge
{
namespace se
{

namespace
{

ClientError ConvertGrpcStatus(const grpc::Status& status, const char* operation)
{
    LogError("%s failed at transport level: [%d] %s",
             operation,
             static_cast<int>(status.error_code()),
             status.error_message().c_str());
    return ClientError::Transport(static_cast<int>(status.error_code()), status.error_message());
}

/// @brief Check both the gRPC status and the service status of a response
template<typename Response>
bool CheckCall(const grpc::Status& status, const Response& response,
               const char* operation, ClientError& error)
{
    if (!status.ok())
    {
        error = ConvertGrpcStatus(status, operation);
        return false;
    }

    if (response.status() != v1::RESPONSE_STATUS_SUCCESS)
    {
        LogDebug("%s rejected by service: %s",
                 operation,
                 v1::ResponseStatus_Name(response.status()).c_str());
        error = ClientError::Service(response.status(), operation);
        return false;
    }

    return true;
}

bool ReadPemFile(const std::string& path, std::string& contents)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        return false;
    }

    contents.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    return true;
}

void ToWireAttributes(const KeyPolicy& policy, v1::KeyAttributes* attributes)
{
    attributes->set_lifetime(policy.lifetime);
    attributes->set_key_type(policy.keyType);
    attributes->set_bits(policy.bits);
    attributes->set_usage_flags(policy.usageFlags);
    attributes->set_algorithm(policy.algorithm);
}

Bytes ToBytes(const std::string& data)
{
    return Bytes(data.begin(), data.end());
}

} // namespace

GrpcCryptoClient::GrpcCryptoClient(const ConnectionConfig& config)
    : m_config(config)
{
    LogDebug("GrpcCryptoClient created for endpoint: %s", m_config.endpoint.c_str());
}

GrpcCryptoClient::GrpcCryptoClient(std::shared_ptr<grpc::Channel> channel)
    : m_channel(std::move(channel))
{
    m_config.endpoint = "<channel>";
}

GrpcCryptoClient::~GrpcCryptoClient() = default;

ClientResult<bool> GrpcCryptoClient::Connect()
{
    LogFunctionEntry();

    ClientError error;
    auto stub = GetStub(error);
    if (!stub)
    {
        return error;
    }

    std::shared_ptr<grpc::Channel> channel;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        channel = m_channel;
    }

    auto deadline = std::chrono::system_clock::now() + m_config.connectionTimeout;
    if (!channel->WaitForConnected(deadline))
    {
        LogError("Failed to connect to %s within %lld s",
                 m_config.endpoint.c_str(),
                 static_cast<long long>(m_config.connectionTimeout.count()));
        return ClientError::Transport(static_cast<int>(grpc::StatusCode::UNAVAILABLE),
                                      "connection timeout");
    }

    v1::PingRequest request;
    v1::PingResponse response;
    grpc::ClientContext context;
    PrepareContext(context, false);

    grpc::Status status = stub->Ping(&context, request, &response);
    if (!CheckCall(status, response, "Ping", error))
    {
        return error;
    }

    LogInfo("Connected to %s, wire protocol %u.%u",
            m_config.endpoint.c_str(),
            response.wire_protocol_version_maj(),
            response.wire_protocol_version_min());
    return ClientResult<bool>(true);
}

void GrpcCryptoClient::SetTimeout(std::chrono::milliseconds timeout)
{
    m_timeoutMs = timeout.count();
}

std::chrono::milliseconds GrpcCryptoClient::GetTimeout() const
{
    return std::chrono::milliseconds(m_timeoutMs.load());
}

ClientResult<bool> GrpcCryptoClient::SetDefaultAuth(const std::string& applicationName)
{
    LogFunctionEntry();

    ClientError error;
    auto stub = GetStub(error);
    if (!stub)
    {
        return error;
    }

    v1::ListAuthenticatorsRequest request;
    v1::ListAuthenticatorsResponse response;
    grpc::ClientContext context;
    PrepareContext(context, false);

    grpc::Status status = stub->ListAuthenticators(&context, request, &response);
    if (!CheckCall(status, response, "ListAuthenticators", error))
    {
        return error;
    }

    bool directOffered = false;
    for (const auto& authenticator : response.authenticators())
    {
        if (authenticator.id() == v1::AUTHENTICATOR_TYPE_DIRECT)
        {
            directOffered = true;
            break;
        }
    }

    if (!directOffered)
    {
        LogError("Service offers no direct authenticator (%d available)",
                 response.authenticators_size());
        return ClientError::Local(ClientErrorReason::NoAuthenticator,
                                  "direct authenticator not offered");
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_applicationName = applicationName;
    }

    LogDebug("Default authentication set to: %s", applicationName.c_str());
    return ClientResult<bool>(true);
}

ClientResult<std::vector<ProviderDescriptor>> GrpcCryptoClient::ListProviders()
{
    LogFunctionEntry();

    ClientError error;
    auto stub = GetStub(error);
    if (!stub)
    {
        return error;
    }

    v1::ListProvidersRequest request;
    v1::ListProvidersResponse response;
    grpc::ClientContext context;
    PrepareContext(context, false);

    grpc::Status status = stub->ListProviders(&context, request, &response);
    if (!CheckCall(status, response, "ListProviders", error))
    {
        return error;
    }

    std::vector<ProviderDescriptor> providers;
    providers.reserve(static_cast<size_t>(response.providers_size()));
    for (const auto& info : response.providers())
    {
        ProviderDescriptor descriptor;
        descriptor.id = info.id();
        descriptor.uuid = info.uuid();
        descriptor.description = info.description();
        descriptor.vendor = info.vendor();
        providers.push_back(std::move(descriptor));
    }

    return ClientResult<std::vector<ProviderDescriptor>>(providers);
}

void GrpcCryptoClient::SetImplicitProvider(uint32_t providerId)
{
    m_providerId = providerId;
    m_providerSet = true;
    LogDebug("Implicit provider set to: %u", providerId);
}

uint32_t GrpcCryptoClient::ImplicitProvider() const
{
    return m_providerId.load();
}

ClientResult<std::vector<RemoteKeyInfo>> GrpcCryptoClient::ListKeys()
{
    LogFunctionEntry();

    ClientError error;
    if (!CheckProvider(error, "ListKeys"))
    {
        return error;
    }

    auto stub = GetStub(error);
    if (!stub)
    {
        return error;
    }

    v1::ListKeysRequest request;
    v1::ListKeysResponse response;
    grpc::ClientContext context;
    PrepareContext(context, true);

    grpc::Status status = stub->ListKeys(&context, request, &response);
    if (!CheckCall(status, response, "ListKeys", error))
    {
        return error;
    }

    std::vector<RemoteKeyInfo> keys;
    keys.reserve(static_cast<size_t>(response.keys_size()));
    for (const auto& info : response.keys())
    {
        RemoteKeyInfo key;
        key.name = info.name();
        key.providerId = info.provider_id();
        key.policy.lifetime = info.attributes().lifetime();
        key.policy.keyType = info.attributes().key_type();
        key.policy.bits = info.attributes().bits();
        key.policy.usageFlags = info.attributes().usage_flags();
        key.policy.algorithm = info.attributes().algorithm();
        keys.push_back(std::move(key));
    }

    return ClientResult<std::vector<RemoteKeyInfo>>(keys);
}

ClientResult<bool> GrpcCryptoClient::ImportKey(const std::string& keyName,
                                               const KeyPolicy& policy,
                                               const Bytes& data)
{
    LogFunctionEntry();

    ClientError error;
    if (!CheckProvider(error, "ImportKey"))
    {
        return error;
    }

    auto stub = GetStub(error);
    if (!stub)
    {
        return error;
    }

    v1::ImportKeyRequest request;
    request.set_key_name(keyName);
    ToWireAttributes(policy, request.mutable_attributes());
    request.set_data(data.data(), data.size());

    v1::ImportKeyResponse response;
    grpc::ClientContext context;
    PrepareContext(context, true);

    grpc::Status status = stub->ImportKey(&context, request, &response);
    if (!CheckCall(status, response, "ImportKey", error))
    {
        return error;
    }

    LogInfo("Key imported: %s", keyName.c_str());
    return ClientResult<bool>(true);
}

ClientResult<bool> GrpcCryptoClient::GenerateKey(const std::string& keyName,
                                                 const KeyPolicy& policy)
{
    LogFunctionEntry();

    ClientError error;
    if (!CheckProvider(error, "GenerateKey"))
    {
        return error;
    }

    auto stub = GetStub(error);
    if (!stub)
    {
        return error;
    }

    v1::GenerateKeyRequest request;
    request.set_key_name(keyName);
    ToWireAttributes(policy, request.mutable_attributes());

    v1::GenerateKeyResponse response;
    grpc::ClientContext context;
    PrepareContext(context, true);

    grpc::Status status = stub->GenerateKey(&context, request, &response);
    if (!CheckCall(status, response, "GenerateKey", error))
    {
        return error;
    }

    LogInfo("Key generated: %s", keyName.c_str());
    return ClientResult<bool>(true);
}

ClientResult<Bytes> GrpcCryptoClient::ExportKey(const std::string& keyName)
{
    LogFunctionEntry();

    ClientError error;
    if (!CheckProvider(error, "ExportKey"))
    {
        return error;
    }

    auto stub = GetStub(error);
    if (!stub)
    {
        return error;
    }

    v1::ExportKeyRequest request;
    request.set_key_name(keyName);

    v1::ExportKeyResponse response;
    grpc::ClientContext context;
    PrepareContext(context, true);

    grpc::Status status = stub->ExportKey(&context, request, &response);
    if (!CheckCall(status, response, "ExportKey", error))
    {
        return error;
    }

    return ClientResult<Bytes>(ToBytes(response.data()));
}

ClientResult<Bytes> GrpcCryptoClient::ExportPublicKey(const std::string& keyName)
{
    LogFunctionEntry();

    ClientError error;
    if (!CheckProvider(error, "ExportPublicKey"))
    {
        return error;
    }

    auto stub = GetStub(error);
    if (!stub)
    {
        return error;
    }

    v1::ExportPublicKeyRequest request;
    request.set_key_name(keyName);

    v1::ExportPublicKeyResponse response;
    grpc::ClientContext context;
    PrepareContext(context, true);

    grpc::Status status = stub->ExportPublicKey(&context, request, &response);
    if (!CheckCall(status, response, "ExportPublicKey", error))
    {
        return error;
    }

    return ClientResult<Bytes>(ToBytes(response.data()));
}

ClientResult<bool> GrpcCryptoClient::DestroyKey(const std::string& keyName)
{
    LogFunctionEntry();

    ClientError error;
    if (!CheckProvider(error, "DestroyKey"))
    {
        return error;
    }

    auto stub = GetStub(error);
    if (!stub)
    {
        return error;
    }

    v1::DestroyKeyRequest request;
    request.set_key_name(keyName);

    v1::DestroyKeyResponse response;
    grpc::ClientContext context;
    PrepareContext(context, true);

    grpc::Status status = stub->DestroyKey(&context, request, &response);
    if (!CheckCall(status, response, "DestroyKey", error))
    {
        return error;
    }

    LogInfo("Key destroyed: %s", keyName.c_str());
    return ClientResult<bool>(true);
}

ClientResult<Bytes> GrpcCryptoClient::SignHash(const std::string& keyName,
                                               uint32_t algorithm,
                                               const Bytes& hash)
{
    LogFunctionEntry();

    ClientError error;
    if (!CheckProvider(error, "SignHash"))
    {
        return error;
    }

    auto stub = GetStub(error);
    if (!stub)
    {
        return error;
    }

    v1::SignHashRequest request;
    request.set_key_name(keyName);
    request.set_algorithm(algorithm);
    request.set_hash(hash.data(), hash.size());

    v1::SignHashResponse response;
    grpc::ClientContext context;
    PrepareContext(context, true);

    grpc::Status status = stub->SignHash(&context, request, &response);
    if (!CheckCall(status, response, "SignHash", error))
    {
        return error;
    }

    return ClientResult<Bytes>(ToBytes(response.signature()));
}

ClientResult<bool> GrpcCryptoClient::VerifyHash(const std::string& keyName,
                                                uint32_t algorithm,
                                                const Bytes& hash,
                                                const Bytes& signature)
{
    LogFunctionEntry();

    ClientError error;
    if (!CheckProvider(error, "VerifyHash"))
    {
        return error;
    }

    auto stub = GetStub(error);
    if (!stub)
    {
        return error;
    }

    v1::VerifyHashRequest request;
    request.set_key_name(keyName);
    request.set_algorithm(algorithm);
    request.set_hash(hash.data(), hash.size());
    request.set_signature(signature.data(), signature.size());

    v1::VerifyHashResponse response;
    grpc::ClientContext context;
    PrepareContext(context, true);

    grpc::Status status = stub->VerifyHash(&context, request, &response);
    if (!CheckCall(status, response, "VerifyHash", error))
    {
        return error;
    }

    return ClientResult<bool>(true);
}

std::shared_ptr<v1::CryptoService::Stub> GrpcCryptoClient::GetStub(ClientError& error)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_stub)
    {
        return m_stub;
    }

    if (!m_channel)
    {
        m_channel = CreateChannel();
        if (!m_channel)
        {
            error = ClientError::Local(ClientErrorReason::InvalidConfiguration,
                                       "cannot create channel to " + m_config.endpoint);
            return nullptr;
        }
    }

    m_stub = v1::CryptoService::NewStub(m_channel);
    return m_stub;
}

std::shared_ptr<grpc::Channel> GrpcCryptoClient::CreateChannel()
{
    // Called with m_mutex held
    if (m_config.endpoint.empty())
    {
        SET_SE_ERROR(DriverErrorCode::BackendConnectionFailed, "Empty service endpoint");
        return nullptr;
    }

    auto credentials = SetupTlsCredentials();
    if (!credentials)
    {
        SET_SE_ERROR_INFO(DriverErrorCode::BackendConnectionFailed,
                          "Failed to setup channel credentials",
                          m_config.endpoint);
        return nullptr;
    }

    grpc::ChannelArguments args;
    args.SetInt(GRPC_ARG_KEEPALIVE_TIME_MS, 30000);
    args.SetInt(GRPC_ARG_KEEPALIVE_TIMEOUT_MS, 5000);
    args.SetInt(GRPC_ARG_KEEPALIVE_PERMIT_WITHOUT_CALLS, 1);

    LogInfo("Creating channel to %s (%s)",
            m_config.endpoint.c_str(),
            m_config.enableTls ? "tls" : "insecure");
    return grpc::CreateCustomChannel(m_config.endpoint, credentials, args);
}

std::shared_ptr<grpc::ChannelCredentials> GrpcCryptoClient::SetupTlsCredentials()
{
    if (!m_config.enableTls)
    {
        return grpc::InsecureChannelCredentials();
    }

    grpc::SslCredentialsOptions sslOpts;

    if (!m_config.caCertificatePath.empty())
    {
        if (!ReadPemFile(m_config.caCertificatePath, sslOpts.pem_root_certs))
        {
            LogError("Failed to load CA certificate from: %s", m_config.caCertificatePath.c_str());
            return nullptr;
        }
        LogDebug("Loaded CA certificate from: %s", m_config.caCertificatePath.c_str());
    }

    if (!m_config.certificatePath.empty() || !m_config.privateKeyPath.empty())
    {
        if (!ReadPemFile(m_config.certificatePath, sslOpts.pem_cert_chain) ||
            !ReadPemFile(m_config.privateKeyPath, sslOpts.pem_private_key))
        {
            LogError("Failed to load client certificate or key (%s, %s)",
                     m_config.certificatePath.c_str(),
                     m_config.privateKeyPath.c_str());
            return nullptr;
        }
        LogDebug("Loaded client certificate from: %s", m_config.certificatePath.c_str());
    }

    return grpc::SslCredentials(sslOpts);
}

void GrpcCryptoClient::PrepareContext(grpc::ClientContext& context, bool routed) const
{
    context.set_deadline(std::chrono::system_clock::now() + GetTimeout());

    std::string applicationName;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        applicationName = m_applicationName;
    }

    if (!applicationName.empty())
    {
        context.AddMetadata(kAppNameMetadataKey, applicationName);
    }

    if (routed)
    {
        context.AddMetadata(kProviderMetadataKey, std::to_string(m_providerId.load()));
    }
}

bool GrpcCryptoClient::CheckProvider(ClientError& error, const char* operation) const
{
    if (!m_providerSet.load())
    {
        LogError("%s called before a provider was bound", operation);
        error = ClientError::Local(ClientErrorReason::NoProvider, "no implicit provider set");
        return false;
    }

    return true;
}

} // namespace se
} // namespace sebridge
