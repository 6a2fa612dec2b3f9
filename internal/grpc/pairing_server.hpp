#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/service/pairing_service.hpp"
#include "relay/v1/pairing_service.grpc.pb.h"

namespace relay::grpc {

class PairingServer final : public relay::v1::PairingService::Service {
 public:
  explicit PairingServer(std::shared_ptr<relay::service::PairingService> svc);

  ::grpc::Status CreatePairingCode(::grpc::ServerContext*, const relay::v1::CreatePairingCodeRequest*, relay::v1::CreatePairingCodeResponse*) override;

  ::grpc::Status RedeemPairingCode(::grpc::ServerContext*, const relay::v1::RedeemPairingCodeRequest*, relay::v1::RedeemPairingCodeResponse*) override;

  ::grpc::Status LoginDevice(::grpc::ServerContext*, const relay::v1::LoginDeviceRequest*, relay::v1::LoginDeviceResponse*) override;

  ::grpc::Status RegisterController(::grpc::ServerContext*, const relay::v1::RegisterControllerRequest*,
                                    relay::v1::RegisterControllerResponse*) override;

  ::grpc::Status RefreshToken(::grpc::ServerContext*, const relay::v1::RefreshTokenRequest*, relay::v1::RefreshTokenResponse*) override;

  ::grpc::Status LookupPairing(::grpc::ServerContext*, const relay::v1::LookupPairingRequest*, relay::v1::LookupPairingResponse*) override;

 private:
  std::shared_ptr<relay::service::PairingService> service_;
};

} // namespace relay::grpc
