// error_handling.h - Error handling for SeBridge SE driver
// Copyright (c) 2025 ludicrypt. All rights reserved.
// Licensed under the MIT License.

#pragma once

#include <psa/crypto.h>

#include <chrono>
#include <cstddef>
#include <string>
#include <thread>
#include <unordered_map>

namespace sebridge
{
namespace se
{

/// @brief Driver-side error codes (5000-5999 range)
enum class DriverErrorCode : int
{
    // Success
    Success = 0,

    // General errors (5000-5099)
    InvalidParameter = 5000,
    BufferTooSmall = 5001,
    InternalError = 5002,

    // Binding errors (5100-5199)
    HandlePoisoned = 5100,
    AuthenticationSetupFailed = 5101,
    ProviderDiscoveryFailed = 5102,
    NoSuitableProvider = 5103,

    // Key errors (5200-5299)
    KeyAlreadyExists = 5200,
    KeyNotFound = 5201,

    // Remote service errors (5400-5499)
    BackendConnectionFailed = 5400,
    BackendError = 5401,
    UnmappedRemoteStatus = 5402
};

/// @brief Error context information
struct ErrorContext
{
    DriverErrorCode errorCode{DriverErrorCode::Success};
    psa_status_t psaStatus{PSA_SUCCESS};
    std::string message;
    std::string function;
    std::string file;
    int line{0};
    std::thread::id threadId;
    std::chrono::system_clock::time_point timestamp;
    std::string additionalInfo;
};

/// @brief Error manager keeping the last driver error per thread
class ErrorManager
{
public:
    /// @brief Get singleton instance
    /// @return Reference to singleton instance
    static ErrorManager& GetInstance();

    /// @brief Set last error for current thread
    /// @param errorCode Driver error code
    /// @param message Error message
    /// @param function Function name
    /// @param file File name
    /// @param line Line number
    void SetLastError(
        DriverErrorCode errorCode,
        const std::string& message,
        const std::string& function = "",
        const std::string& file = "",
        int line = 0);

    /// @brief Set last error with additional info
    /// @param errorCode Driver error code
    /// @param message Error message
    /// @param additionalInfo Additional error information
    /// @param function Function name
    /// @param file File name
    /// @param line Line number
    void SetLastErrorInfo(
        DriverErrorCode errorCode,
        const std::string& message,
        const std::string& additionalInfo,
        const std::string& function = "",
        const std::string& file = "",
        int line = 0);

    /// @brief Get last error for current thread
    /// @return Error context
    ErrorContext GetLastError() const;

    /// @brief Clear last error for current thread
    void ClearLastError();

    /// @brief Convert driver error code to a PSA status
    /// @param errorCode Driver error code
    /// @return psa_status_t equivalent
    static psa_status_t ConvertToPsaStatus(DriverErrorCode errorCode);

    /// @brief Get error message for error code
    /// @param errorCode Driver error code
    /// @return Error message
    static std::string GetErrorMessage(DriverErrorCode errorCode);

private:
    ErrorManager() = default;
    ~ErrorManager() = default;

    // Disable copy and move
    ErrorManager(const ErrorManager&) = delete;
    ErrorManager& operator=(const ErrorManager&) = delete;
    ErrorManager(ErrorManager&&) = delete;
    ErrorManager& operator=(ErrorManager&&) = delete;

    /// @brief Get error context for current thread
    /// @return Reference to error context
    ErrorContext& GetThreadErrorContext() const;

private:
    static thread_local ErrorContext m_threadErrorContext;

    // Error message and status mappings
    static const std::unordered_map<DriverErrorCode, std::string> s_errorMessages;
    static const std::unordered_map<DriverErrorCode, psa_status_t> s_psaStatusMap;
};

/// @brief Macro for setting error with file/line information
#define SET_SE_ERROR(code, message) \
    sebridge::se::ErrorManager::GetInstance().SetLastError( \
        code, message, __FUNCTION__, __FILE__, __LINE__)

/// @brief Macro for setting error with additional info
#define SET_SE_ERROR_INFO(code, message, info) \
    sebridge::se::ErrorManager::GetInstance().SetLastErrorInfo( \
        code, message, info, __FUNCTION__, __FILE__, __LINE__)

/// @brief Macro for getting last error
#define GET_SE_ERROR() \
    sebridge::se::ErrorManager::GetInstance().GetLastError()

/// @brief Macro for clearing last error
#define CLEAR_SE_ERROR() \
    sebridge::se::ErrorManager::GetInstance().ClearLastError()

/// @brief Macro for converting a driver error to psa_status_t
#define SE_TO_PSA(code) \
    sebridge::se::ErrorManager::ConvertToPsaStatus(code)

/// @brief Helper function to validate pointer parameter
/// @param pointer Pointer to validate
/// @param parameterName Parameter name for error reporting
/// @return true if valid, false otherwise
bool ValidateParameter(const void* pointer, const std::string& parameterName);

/// @brief Helper function to validate an input buffer
/// @param buffer Buffer pointer
/// @param length Number of bytes the caller claims the buffer holds
/// @param parameterName Parameter name for error reporting
/// @return false for a null buffer with a non-zero length
bool ValidateInputBuffer(const void* buffer, size_t length, const std::string& parameterName);

} // namespace se
} // namespace sebridge
