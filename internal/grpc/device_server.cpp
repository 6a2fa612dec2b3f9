#include "device_server.hpp"

#include "bearer.hpp"
#include "grpc_error.hpp"

namespace relay::grpc {

using namespace relay::v1;

DeviceServer::DeviceServer(std::shared_ptr<relay::service::DeviceService> svc, std::shared_ptr<relay::auth::AuthGate> auth)
    : service_(std::move(svc)), auth_(std::move(auth)) {
}

relay::auth::Identity DeviceServer::Authenticate(const ::grpc::ServerContext& context) const {
  return auth_->VerifyAccessToken(BearerToken(context));
}

::grpc::Status DeviceServer::SubmitCommand(::grpc::ServerContext* context, const SubmitCommandRequest* req, SubmitCommandResponse* resp) {
  try {
    *resp = service_->SubmitCommand(Authenticate(*context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DeviceServer::GetCommand(::grpc::ServerContext* context, const GetCommandRequest* req, GetCommandResponse* resp) {
  try {
    *resp = service_->GetCommand(Authenticate(*context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DeviceServer::ListCommands(::grpc::ServerContext* context, const ListCommandsRequest* req, ListCommandsResponse* resp) {
  try {
    *resp = service_->ListCommands(Authenticate(*context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DeviceServer::ListDeviceStatus(::grpc::ServerContext* context, const ListDeviceStatusRequest* req, ListDeviceStatusResponse* resp) {
  try {
    *resp = service_->ListDeviceStatus(Authenticate(*context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DeviceServer::ListDevices(::grpc::ServerContext* context, const ListDevicesRequest* req, ListDevicesResponse* resp) {
  try {
    *resp = service_->ListDevices(Authenticate(*context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DeviceServer::UpdateDeviceSettings(::grpc::ServerContext* context, const UpdateDeviceSettingsRequest* req,
                                                  UpdateDeviceSettingsResponse* resp) {
  try {
    *resp = service_->UpdateDeviceSettings(Authenticate(*context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DeviceServer::UnpairDevice(::grpc::ServerContext* context, const UnpairDeviceRequest* req, google::protobuf::Empty*) {
  try {
    service_->UnpairDevice(Authenticate(*context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DeviceServer::GetRelayStats(::grpc::ServerContext* context, const RelayStatsRequest* req, RelayStatsResponse* resp) {
  try {
    *resp = service_->GetRelayStats(Authenticate(*context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace relay::grpc
