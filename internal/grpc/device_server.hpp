#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/auth/auth_gate.hpp"
#include "internal/service/device_service.hpp"
#include "relay/v1/device_service.grpc.pb.h"

namespace relay::grpc {

/*
  Every call must carry a controller access token; the verified identity
  is handed to the service which enforces the device scope.
*/
class DeviceServer final : public relay::v1::DeviceService::Service {
 public:
  DeviceServer(std::shared_ptr<relay::service::DeviceService> svc, std::shared_ptr<relay::auth::AuthGate> auth);

  ::grpc::Status SubmitCommand(::grpc::ServerContext*, const relay::v1::SubmitCommandRequest*, relay::v1::SubmitCommandResponse*) override;

  ::grpc::Status GetCommand(::grpc::ServerContext*, const relay::v1::GetCommandRequest*, relay::v1::GetCommandResponse*) override;

  ::grpc::Status ListCommands(::grpc::ServerContext*, const relay::v1::ListCommandsRequest*, relay::v1::ListCommandsResponse*) override;

  ::grpc::Status ListDeviceStatus(::grpc::ServerContext*, const relay::v1::ListDeviceStatusRequest*, relay::v1::ListDeviceStatusResponse*) override;

  ::grpc::Status ListDevices(::grpc::ServerContext*, const relay::v1::ListDevicesRequest*, relay::v1::ListDevicesResponse*) override;

  ::grpc::Status UpdateDeviceSettings(::grpc::ServerContext*, const relay::v1::UpdateDeviceSettingsRequest*,
                                      relay::v1::UpdateDeviceSettingsResponse*) override;

  ::grpc::Status UnpairDevice(::grpc::ServerContext*, const relay::v1::UnpairDeviceRequest*, google::protobuf::Empty*) override;

  ::grpc::Status GetRelayStats(::grpc::ServerContext*, const relay::v1::RelayStatsRequest*, relay::v1::RelayStatsResponse*) override;

 private:
  relay::auth::Identity Authenticate(const ::grpc::ServerContext& context) const;

  std::shared_ptr<relay::service::DeviceService> service_;
  std::shared_ptr<relay::auth::AuthGate>         auth_;
};

} // namespace relay::grpc
