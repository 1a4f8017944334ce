// client_handle.h - Process-wide handle to the remote crypto client
// Copyright (c) 2025 ludicrypt. All rights reserved.
// Licensed under the MIT License.

#pragma once

#include "crypto_client.h"
#include "error_handling.h"
#include "logging.h"

#include <psa/crypto.h>

#include <atomic>
#include <memory>
#include <mutex>
#include <shared_mutex>

namespace sebridge
{
namespace se
{

/// @brief Single reader/writer locked holder of the active CryptoClient
///
/// Key and asymmetric operations run under the shared lock and may execute
/// concurrently. Binding runs under the exclusive lock. An exception leaving
/// the exclusive section poisons the handle for the rest of the process.
class ClientHandle
{
public:
    /// @brief Get singleton instance
    /// @return Reference to singleton instance
    static ClientHandle& GetInstance();

    /// @brief Run an operation with shared access to the client
    /// @param operation Operation name for diagnostics
    /// @param fn Callable taking CryptoClient& and returning psa_status_t
    /// @return Operation status, PSA_ERROR_GENERIC_ERROR if poisoned
    template<typename Fn>
    psa_status_t WithReader(const char* operation, Fn&& fn)
    {
        std::shared_lock<std::shared_mutex> lock(m_mutex);

        if (m_poisoned.load())
        {
            return ReportPoisoned(operation);
        }

        return fn(*m_client);
    }

    /// @brief Run an operation with exclusive access to the client
    /// @param operation Operation name for diagnostics
    /// @param fn Callable taking CryptoClient& and returning psa_status_t
    /// @return Operation status, PSA_ERROR_GENERIC_ERROR if poisoned
    template<typename Fn>
    psa_status_t WithWriter(const char* operation, Fn&& fn)
    {
        std::unique_lock<std::shared_mutex> lock(m_mutex);

        if (m_poisoned.load())
        {
            return ReportPoisoned(operation);
        }

        try
        {
            return fn(*m_client);
        }
        catch (const std::exception& e)
        {
            m_poisoned = true;
            LogCritical("Exception in %s while holding the client exclusively, handle poisoned: %s",
                        operation, e.what());
            throw;
        }
        catch (...)
        {
            m_poisoned = true;
            LogCritical("Unknown exception in %s while holding the client exclusively, handle poisoned",
                        operation);
            throw;
        }
    }

    /// @brief Install a new client and clear the poisoned state
    /// @param client Client to install
    void ReplaceClient(std::unique_ptr<CryptoClient> client);

    /// @brief Check whether the handle is poisoned
    bool IsPoisoned() const { return m_poisoned.load(); }

private:
    ClientHandle();
    ~ClientHandle() = default;

    // Disable copy and move
    ClientHandle(const ClientHandle&) = delete;
    ClientHandle& operator=(const ClientHandle&) = delete;
    ClientHandle(ClientHandle&&) = delete;
    ClientHandle& operator=(ClientHandle&&) = delete;

    static psa_status_t ReportPoisoned(const char* operation);

private:
    std::shared_mutex m_mutex;
    std::unique_ptr<CryptoClient> m_client;
    std::atomic<bool> m_poisoned{false};
};

} // namespace se
} // namespace sebridge
