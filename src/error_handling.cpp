// error_handling.cpp - Error handling implementation for SeBridge SE driver
// Copyright (c) 2025 ludicrypt. All rights reserved.
// Licensed under the MIT License.

#include "error_handling.h"
#include "logging.h"

#include <string>
#include <unordered_map>

namespace sebridge
{
namespace se
{

// Static initialization
thread_local ErrorContext ErrorManager::m_threadErrorContext;

// Error message mappings
const std::unordered_map<DriverErrorCode, std::string> ErrorManager::s_errorMessages = {
    {DriverErrorCode::Success, "Operation completed successfully"},

    {DriverErrorCode::InvalidParameter, "Invalid parameter provided"},
    {DriverErrorCode::BufferTooSmall, "Buffer too small"},
    {DriverErrorCode::InternalError, "Internal error occurred"},

    {DriverErrorCode::HandlePoisoned, "Client handle is poisoned"},
    {DriverErrorCode::AuthenticationSetupFailed, "Default authentication could not be set"},
    {DriverErrorCode::ProviderDiscoveryFailed, "Provider discovery failed"},
    {DriverErrorCode::NoSuitableProvider, "No suitable provider found"},

    {DriverErrorCode::KeyAlreadyExists, "Key already exists"},
    {DriverErrorCode::KeyNotFound, "Key not found"},

    {DriverErrorCode::BackendConnectionFailed, "Backend connection failed"},
    {DriverErrorCode::BackendError, "Backend service error"},
    {DriverErrorCode::UnmappedRemoteStatus, "Remote outcome has no PSA equivalent"}
};

// psa_status_t mapping
const std::unordered_map<DriverErrorCode, psa_status_t> ErrorManager::s_psaStatusMap = {
    {DriverErrorCode::Success, PSA_SUCCESS},

    {DriverErrorCode::InvalidParameter, PSA_ERROR_INVALID_ARGUMENT},
    {DriverErrorCode::BufferTooSmall, PSA_ERROR_BUFFER_TOO_SMALL},
    {DriverErrorCode::InternalError, PSA_ERROR_GENERIC_ERROR},

    {DriverErrorCode::HandlePoisoned, PSA_ERROR_GENERIC_ERROR},
    {DriverErrorCode::AuthenticationSetupFailed, PSA_ERROR_GENERIC_ERROR},
    {DriverErrorCode::ProviderDiscoveryFailed, PSA_ERROR_GENERIC_ERROR},
    {DriverErrorCode::NoSuitableProvider, PSA_ERROR_GENERIC_ERROR},

    {DriverErrorCode::KeyAlreadyExists, PSA_ERROR_ALREADY_EXISTS},
    {DriverErrorCode::KeyNotFound, PSA_ERROR_DOES_NOT_EXIST},

    {DriverErrorCode::BackendConnectionFailed, PSA_ERROR_GENERIC_ERROR},
    {DriverErrorCode::BackendError, PSA_ERROR_GENERIC_ERROR},
    {DriverErrorCode::UnmappedRemoteStatus, PSA_ERROR_GENERIC_ERROR}
};

ErrorManager& ErrorManager::GetInstance()
{
    static ErrorManager instance;
    return instance;
}

void ErrorManager::SetLastError(
    DriverErrorCode errorCode,
    const std::string& message,
    const std::string& function,
    const std::string& file,
    int line)
{
    ErrorContext& context = GetThreadErrorContext();

    context.errorCode = errorCode;
    context.psaStatus = ConvertToPsaStatus(errorCode);
    context.message = message;
    context.function = function;
    context.file = file;
    context.line = line;
    context.threadId = std::this_thread::get_id();
    context.timestamp = std::chrono::system_clock::now();
    context.additionalInfo.clear();

    if (errorCode != DriverErrorCode::Success)
    {
        LogError("SE driver error [%d] %s: %s in %s:%d",
                 static_cast<int>(errorCode),
                 GetErrorMessage(errorCode).c_str(),
                 message.c_str(),
                 function.empty() ? "<unknown>" : function.c_str(),
                 line);
    }
}

void ErrorManager::SetLastErrorInfo(
    DriverErrorCode errorCode,
    const std::string& message,
    const std::string& additionalInfo,
    const std::string& function,
    const std::string& file,
    int line)
{
    SetLastError(errorCode, message, function, file, line);
    GetThreadErrorContext().additionalInfo = additionalInfo;
    LogDebug("SE driver error detail: %s", additionalInfo.c_str());
}

ErrorContext ErrorManager::GetLastError() const
{
    return GetThreadErrorContext();
}

void ErrorManager::ClearLastError()
{
    GetThreadErrorContext() = ErrorContext{};
}

psa_status_t ErrorManager::ConvertToPsaStatus(DriverErrorCode errorCode)
{
    auto iter = s_psaStatusMap.find(errorCode);
    if (iter != s_psaStatusMap.end())
    {
        return iter->second;
    }

    return PSA_ERROR_GENERIC_ERROR;
}

std::string ErrorManager::GetErrorMessage(DriverErrorCode errorCode)
{
    auto iter = s_errorMessages.find(errorCode);
    if (iter != s_errorMessages.end())
    {
        return iter->second;
    }

    return "Unknown error";
}

ErrorContext& ErrorManager::GetThreadErrorContext() const
{
    return m_threadErrorContext;
}

// Validation helper functions

bool ValidateParameter(const void* pointer, const std::string& parameterName)
{
    if (pointer == nullptr)
    {
        SET_SE_ERROR(DriverErrorCode::InvalidParameter,
                     "Null pointer provided for " + parameterName);
        return false;
    }

    return true;
}

bool ValidateInputBuffer(const void* buffer, size_t length, const std::string& parameterName)
{
    if (buffer == nullptr && length > 0)
    {
        SET_SE_ERROR(DriverErrorCode::InvalidParameter,
                     "Null buffer with non-zero size for " + parameterName);
        return false;
    }

    return true;
}

} // namespace se
} // namespace sebridge
