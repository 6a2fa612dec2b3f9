#pragma once

#include "internal/auth/auth_gate.hpp"
#include "relay/v1/device_service.pb.h"
#include "service_context.hpp"

namespace relay::service {

/*
  Controller-facing device API. Every call carries the verified caller
  identity; controllers only reach the device their credentials name.
*/
class DeviceService {
 public:
  explicit DeviceService(ServiceContext ctx);

  relay::v1::SubmitCommandResponse    SubmitCommand(const auth::Identity& caller, const relay::v1::SubmitCommandRequest& req);
  relay::v1::GetCommandResponse       GetCommand(const auth::Identity& caller, const relay::v1::GetCommandRequest& req);
  relay::v1::ListCommandsResponse     ListCommands(const auth::Identity& caller, const relay::v1::ListCommandsRequest& req);
  relay::v1::ListDeviceStatusResponse ListDeviceStatus(const auth::Identity& caller, const relay::v1::ListDeviceStatusRequest& req);
  relay::v1::ListDevicesResponse      ListDevices(const auth::Identity& caller, const relay::v1::ListDevicesRequest& req);

  relay::v1::UpdateDeviceSettingsResponse UpdateDeviceSettings(const auth::Identity& caller, const relay::v1::UpdateDeviceSettingsRequest& req);

  void UnpairDevice(const auth::Identity& caller, const relay::v1::UnpairDeviceRequest& req);

  relay::v1::RelayStatsResponse GetRelayStats(const auth::Identity& caller, const relay::v1::RelayStatsRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace relay::service
