// client_handle.cpp - Process-wide handle to the remote crypto client
// Copyright (c) 2025 ludicrypt. All rights reserved.
// Licensed under the MIT License.

#include "client_handle.h"
#include "driver_config.h"
#include "grpc_backend.h"

namespace sebridge
{
namespace se
{

ClientHandle& ClientHandle::GetInstance()
{
    static ClientHandle instance;
    return instance;
}

ClientHandle::ClientHandle()
    : m_client(std::make_unique<GrpcCryptoClient>(LoadDriverConfig().connection))
{
}

void ClientHandle::ReplaceClient(std::unique_ptr<CryptoClient> client)
{
    if (!client)
    {
        SET_SE_ERROR(DriverErrorCode::InvalidParameter, "Null client for the client handle");
        return;
    }

    std::unique_lock<std::shared_mutex> lock(m_mutex);
    m_client = std::move(client);
    m_poisoned = false;
}

psa_status_t ClientHandle::ReportPoisoned(const char* operation)
{
    LogCritical("%s refused: client handle is poisoned", operation);
    SET_SE_ERROR(DriverErrorCode::HandlePoisoned, std::string("Poisoned handle in ") + operation);
    return PSA_ERROR_GENERIC_ERROR;
}

} // namespace se
} // namespace sebridge
