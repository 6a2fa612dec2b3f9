#include "pairing_service.hpp"

#include "internal/auth/auth_gate.hpp"
#include "internal/service/observe_rpc.hpp"
#include "internal/util/errors.hpp"

namespace relay::service {

using namespace relay::v1;

namespace {

void Fill(const auth::IssuedTokens& tokens, TokenPair* out) {
  out->set_access_token(tokens.access_token);
  out->set_refresh_token(tokens.refresh_token);
  out->set_expires_in_sec(static_cast<uint64_t>(tokens.expires_in_sec));
}

} // namespace

PairingService::PairingService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

CreatePairingCodeResponse PairingService::CreatePairingCode(const CreatePairingCodeRequest& req) {
  return ObserveRpc("PairingService.CreatePairingCode", "", [&] {
    const auto issue = ctx_.auth->IssuePairingCode(req.claim());

    CreatePairingCodeResponse resp;
    resp.set_code(issue.code);
    *resp.mutable_expires_at() = util::ToProto(issue.expires_at);
    return resp;
  });
}

RedeemPairingCodeResponse PairingService::RedeemPairingCode(const RedeemPairingCodeRequest& req) {
  return ObserveRpc("PairingService.RedeemPairingCode", "", [&] {
    if (req.code().empty()) {
      throw util::InvalidArgument("redeem requires a pairing code");
    }
    const auto redeemed = ctx_.auth->RedeemPairingCode(req.code(), req.name(), req.device_info());

    RedeemPairingCodeResponse resp;
    resp.set_device_id(redeemed.device_id);
    resp.set_device_secret(redeemed.device_secret);
    Fill(redeemed.tokens, resp.mutable_tokens());
    return resp;
  });
}

LoginDeviceResponse PairingService::LoginDevice(const LoginDeviceRequest& req) {
  return ObserveRpc("PairingService.LoginDevice", req.device_id(), [&] {
    LoginDeviceResponse resp;
    Fill(ctx_.auth->LoginDevice(req.device_id(), req.secret()), resp.mutable_tokens());
    return resp;
  });
}

RegisterControllerResponse PairingService::RegisterController(const RegisterControllerRequest& req) {
  return ObserveRpc("PairingService.RegisterController", req.device_id(), [&] {
    const auto credentials = ctx_.auth->RegisterController(req.device_id(), req.name());

    RegisterControllerResponse resp;
    resp.set_controller_id(credentials.controller_id);
    Fill(credentials.tokens, resp.mutable_tokens());
    return resp;
  });
}

RefreshTokenResponse PairingService::RefreshToken(const RefreshTokenRequest& req) {
  return ObserveRpc("PairingService.RefreshToken", "", [&] {
    const auto tokens = ctx_.auth->Refresh(req.refresh_token());

    RefreshTokenResponse resp;
    resp.set_access_token(tokens.access_token);
    resp.set_expires_in_sec(static_cast<uint64_t>(tokens.expires_in_sec));
    return resp;
  });
}

LookupPairingResponse PairingService::LookupPairing(const LookupPairingRequest& req) {
  return ObserveRpc("PairingService.LookupPairing", "", [&] {
    LookupPairingResponse resp;
    resp.set_code(req.code());
    resp.set_device_id(ctx_.auth->LookupPairing(req.code()));
    return resp;
  });
}

} // namespace relay::service
