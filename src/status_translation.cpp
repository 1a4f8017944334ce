// status_translation.cpp - Remote outcome to psa_status_t translation
// Copyright (c) 2025 ludicrypt. All rights reserved.
// Licensed under the MIT License.

#include "status_translation.h"
#include "error_handling.h"
#include "logging.h"

#include <string>

namespace sebridge
{
namespace se
{

namespace
{

psa_status_t Unmapped(const ClientError& error)
{
    std::string description = error.Describe();
    LogWarning("Remote outcome collapsed to PSA_ERROR_GENERIC_ERROR: %s", description.c_str());
    SET_SE_ERROR_INFO(DriverErrorCode::UnmappedRemoteStatus,
                      "Remote outcome has no PSA equivalent",
                      description);
    return PSA_ERROR_GENERIC_ERROR;
}

} // namespace

psa_status_t ToPsaStatus(v1::ResponseStatus status)
{
    return ToPsaStatus(ClientError::Service(status));
}

psa_status_t ToPsaStatus(const ClientError& error)
{
    if (error.kind == ClientErrorKind::None)
    {
        return PSA_SUCCESS;
    }

    if (error.kind != ClientErrorKind::Service)
    {
        return Unmapped(error);
    }

    switch (error.serviceStatus)
    {
    case v1::RESPONSE_STATUS_SUCCESS:                         return PSA_SUCCESS;
    case v1::RESPONSE_STATUS_PSA_ERROR_GENERIC_ERROR:         return PSA_ERROR_GENERIC_ERROR;
    case v1::RESPONSE_STATUS_PSA_ERROR_NOT_SUPPORTED:         return PSA_ERROR_NOT_SUPPORTED;
    case v1::RESPONSE_STATUS_PSA_ERROR_NOT_PERMITTED:         return PSA_ERROR_NOT_PERMITTED;
    case v1::RESPONSE_STATUS_PSA_ERROR_BUFFER_TOO_SMALL:      return PSA_ERROR_BUFFER_TOO_SMALL;
    case v1::RESPONSE_STATUS_PSA_ERROR_ALREADY_EXISTS:        return PSA_ERROR_ALREADY_EXISTS;
    case v1::RESPONSE_STATUS_PSA_ERROR_DOES_NOT_EXIST:        return PSA_ERROR_DOES_NOT_EXIST;
    case v1::RESPONSE_STATUS_PSA_ERROR_BAD_STATE:             return PSA_ERROR_BAD_STATE;
    case v1::RESPONSE_STATUS_PSA_ERROR_INVALID_ARGUMENT:      return PSA_ERROR_INVALID_ARGUMENT;
    case v1::RESPONSE_STATUS_PSA_ERROR_INSUFFICIENT_MEMORY:   return PSA_ERROR_INSUFFICIENT_MEMORY;
    case v1::RESPONSE_STATUS_PSA_ERROR_INSUFFICIENT_STORAGE:  return PSA_ERROR_INSUFFICIENT_STORAGE;
    case v1::RESPONSE_STATUS_PSA_ERROR_COMMUNICATION_FAILURE: return PSA_ERROR_COMMUNICATION_FAILURE;
    case v1::RESPONSE_STATUS_PSA_ERROR_STORAGE_FAILURE:       return PSA_ERROR_STORAGE_FAILURE;
    case v1::RESPONSE_STATUS_PSA_ERROR_HARDWARE_FAILURE:      return PSA_ERROR_HARDWARE_FAILURE;
    case v1::RESPONSE_STATUS_PSA_ERROR_INSUFFICIENT_ENTROPY:  return PSA_ERROR_INSUFFICIENT_ENTROPY;
    case v1::RESPONSE_STATUS_PSA_ERROR_INVALID_SIGNATURE:     return PSA_ERROR_INVALID_SIGNATURE;
    case v1::RESPONSE_STATUS_PSA_ERROR_INVALID_PADDING:       return PSA_ERROR_INVALID_PADDING;
    case v1::RESPONSE_STATUS_PSA_ERROR_INSUFFICIENT_DATA:     return PSA_ERROR_INSUFFICIENT_DATA;
    case v1::RESPONSE_STATUS_PSA_ERROR_INVALID_HANDLE:        return PSA_ERROR_INVALID_HANDLE;
    default:
        // Non-PSA service statuses, DATA_CORRUPT, DATA_INVALID, CORRUPTION_DETECTED
        return Unmapped(error);
    }
}

} // namespace se
} // namespace sebridge
