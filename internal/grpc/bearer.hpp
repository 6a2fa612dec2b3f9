#pragma once

#include <string>

#include <grpcpp/grpcpp.h>

namespace relay::grpc {

// Token from "authorization: Bearer <token>" or "x-access-token".
// Throws util::TokenInvalid when neither header is present.
std::string BearerToken(const ::grpc::ServerContext& context);

} // namespace relay::grpc
