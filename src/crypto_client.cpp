// crypto_client.cpp - Remote client outcome helpers
// Copyright (c) 2025 ludicrypt. All rights reserved.
// Licensed under the MIT License.

#include "crypto_client.h"

#include <grpcpp/support/status_code_enum.h>

namespace sebridge
{
namespace se
{

namespace
{

const char* GetReasonName(ClientErrorReason reason)
{
    switch (reason)
    {
    case ClientErrorReason::NoProvider:           return "no provider";
    case ClientErrorReason::NoAuthenticator:      return "no authenticator";
    case ClientErrorReason::InvalidConfiguration: return "invalid configuration";
    case ClientErrorReason::InvalidResponse:      return "invalid response";
    default:                                      return "none";
    }
}

const char* GetTransportCodeName(int code)
{
    switch (static_cast<grpc::StatusCode>(code))
    {
    case grpc::StatusCode::CANCELLED:          return "CANCELLED";
    case grpc::StatusCode::DEADLINE_EXCEEDED:  return "DEADLINE_EXCEEDED";
    case grpc::StatusCode::UNAVAILABLE:        return "UNAVAILABLE";
    case grpc::StatusCode::UNAUTHENTICATED:    return "UNAUTHENTICATED";
    case grpc::StatusCode::PERMISSION_DENIED:  return "PERMISSION_DENIED";
    case grpc::StatusCode::UNIMPLEMENTED:      return "UNIMPLEMENTED";
    case grpc::StatusCode::RESOURCE_EXHAUSTED: return "RESOURCE_EXHAUSTED";
    case grpc::StatusCode::INTERNAL:           return "INTERNAL";
    default:                                   return "UNKNOWN";
    }
}

} // namespace

std::string ClientError::Describe() const
{
    std::string text;

    switch (kind)
    {
    case ClientErrorKind::None:
        return "no error";
    case ClientErrorKind::Service:
        text = "service status " + v1::ResponseStatus_Name(serviceStatus);
        break;
    case ClientErrorKind::Transport:
        text = std::string("transport ") + GetTransportCodeName(transportCode) +
               " (" + std::to_string(transportCode) + ")";
        break;
    case ClientErrorKind::Client:
        text = std::string("client ") + GetReasonName(reason);
        break;
    }

    if (!message.empty())
    {
        text += ": " + message;
    }
    return text;
}

} // namespace se
} // namespace sebridge
