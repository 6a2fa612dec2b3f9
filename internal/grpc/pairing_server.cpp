#include "pairing_server.hpp"

#include "grpc_error.hpp"

namespace relay::grpc {

using namespace relay::v1;

PairingServer::PairingServer(std::shared_ptr<relay::service::PairingService> svc) : service_(std::move(svc)) {
}

::grpc::Status PairingServer::CreatePairingCode(::grpc::ServerContext*, const CreatePairingCodeRequest* req, CreatePairingCodeResponse* resp) {
  try {
    *resp = service_->CreatePairingCode(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status PairingServer::RedeemPairingCode(::grpc::ServerContext*, const RedeemPairingCodeRequest* req, RedeemPairingCodeResponse* resp) {
  try {
    *resp = service_->RedeemPairingCode(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status PairingServer::LoginDevice(::grpc::ServerContext*, const LoginDeviceRequest* req, LoginDeviceResponse* resp) {
  try {
    *resp = service_->LoginDevice(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status PairingServer::RegisterController(::grpc::ServerContext*, const RegisterControllerRequest* req, RegisterControllerResponse* resp) {
  try {
    *resp = service_->RegisterController(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status PairingServer::RefreshToken(::grpc::ServerContext*, const RefreshTokenRequest* req, RefreshTokenResponse* resp) {
  try {
    *resp = service_->RefreshToken(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status PairingServer::LookupPairing(::grpc::ServerContext*, const LookupPairingRequest* req, LookupPairingResponse* resp) {
  try {
    *resp = service_->LookupPairing(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace relay::grpc
