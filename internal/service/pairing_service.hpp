#pragma once

#include "relay/v1/pairing_service.pb.h"
#include "service_context.hpp"

namespace relay::service {

/*
  Pairing and credential issuance. Calls carry no bearer token; each one
  presents a pairing code, a device secret or a refresh token instead.
*/
class PairingService {
 public:
  explicit PairingService(ServiceContext ctx);

  relay::v1::CreatePairingCodeResponse  CreatePairingCode(const relay::v1::CreatePairingCodeRequest& req);
  relay::v1::RedeemPairingCodeResponse  RedeemPairingCode(const relay::v1::RedeemPairingCodeRequest& req);
  relay::v1::LoginDeviceResponse        LoginDevice(const relay::v1::LoginDeviceRequest& req);
  relay::v1::RegisterControllerResponse RegisterController(const relay::v1::RegisterControllerRequest& req);
  relay::v1::RefreshTokenResponse       RefreshToken(const relay::v1::RefreshTokenRequest& req);
  relay::v1::LookupPairingResponse      LookupPairing(const relay::v1::LookupPairingRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace relay::service
