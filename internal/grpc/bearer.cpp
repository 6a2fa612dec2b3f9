#include "bearer.hpp"

#include <string_view>

#include "internal/util/errors.hpp"

namespace relay::grpc {

namespace {

constexpr std::string_view kBearerPrefix = "Bearer ";

std::string_view View(const ::grpc::string_ref& ref) {
  return {ref.data(), ref.size()};
}

} // namespace

std::string BearerToken(const ::grpc::ServerContext& context) {
  const auto& metadata = context.client_metadata();

  if (auto it = metadata.find("authorization"); it != metadata.end()) {
    auto value = View(it->second);
    if (value.size() > kBearerPrefix.size() && value.substr(0, kBearerPrefix.size()) == kBearerPrefix) {
      return std::string(value.substr(kBearerPrefix.size()));
    }
    throw util::TokenInvalid("authorization header is not a bearer token");
  }
  if (auto it = metadata.find("x-access-token"); it != metadata.end() && it->second.size() > 0) {
    return std::string(View(it->second));
  }
  throw util::TokenInvalid("missing access token");
}

} // namespace relay::grpc
