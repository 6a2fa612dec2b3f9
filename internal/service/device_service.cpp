#include "device_service.hpp"

#include "internal/db/api/repository.hpp"
#include "internal/media/media_router.hpp"
#include "internal/observability/logging.hpp"
#include "internal/presence/presence_tracker.hpp"
#include "internal/queue/command_queue.hpp"
#include "internal/registry/connection_registry.hpp"
#include "internal/service/observe_rpc.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"

namespace relay::service {

using namespace relay::v1;

namespace {

void RequireController(const auth::Identity& caller) {
  if (caller.role != ROLE_CONTROLLER) {
    throw util::PermissionDenied("device API requires controller credentials");
  }
}

// Empty device_id means the caller's own scope.
const std::string& ScopedDevice(const auth::Identity& caller, const std::string& requested) {
  RequireController(caller);
  if (!requested.empty() && requested != caller.device_id) {
    throw util::PermissionDenied("credentials are not scoped to device " + requested);
  }
  return caller.device_id;
}

db::model::DeviceRecord GetPairedDevice(db::Repository& repository, db::Transaction& tx, const std::string& device_id) {
  auto device = repository.GetDevice(tx, device_id);
  if (!device) {
    throw util::NotFound("device not found: " + device_id);
  }
  if (!device->paired) {
    throw util::InvalidState("device is unpaired: " + device_id);
  }
  return *device;
}

} // namespace

DeviceService::DeviceService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

SubmitCommandResponse DeviceService::SubmitCommand(const auth::Identity& caller, const SubmitCommandRequest& req) {
  return ObserveRpc("DeviceService.SubmitCommand", req.device_id(), [&] {
    const auto& device_id = ScopedDevice(caller, req.device_id());
    if (req.action().empty()) {
      throw util::InvalidArgument("command requires an action");
    }
    {
      auto tx = ctx_.repository->Begin();
      GetPairedDevice(*ctx_.repository, *tx, device_id);
      tx->Commit();
    }

    SubmitCommandResponse resp;
    *resp.mutable_command() = ctx_.queue->Enqueue(device_id, req.action(), req.params());
    return resp;
  });
}

GetCommandResponse DeviceService::GetCommand(const auth::Identity& caller, const GetCommandRequest& req) {
  return ObserveRpc("DeviceService.GetCommand", caller.device_id, [&] {
    RequireController(caller);
    auto command = ctx_.queue->Get(req.command_id());
    if (command.device_id() != caller.device_id) {
      throw util::NotFound("command not found: " + req.command_id());
    }

    GetCommandResponse resp;
    *resp.mutable_command() = std::move(command);
    return resp;
  });
}

ListCommandsResponse DeviceService::ListCommands(const auth::Identity& caller, const ListCommandsRequest& req) {
  return ObserveRpc("DeviceService.ListCommands", req.device_id(), [&] {
    const auto& device_id = ScopedDevice(caller, req.device_id());
    auto        page      = ctx_.queue->List(device_id, req.limit(), req.offset());

    ListCommandsResponse resp;
    for (auto& command : page.commands) {
      *resp.add_commands() = std::move(command);
    }
    resp.set_total(static_cast<uint32_t>(page.total));
    return resp;
  });
}

ListDeviceStatusResponse DeviceService::ListDeviceStatus(const auth::Identity& caller, const ListDeviceStatusRequest& req) {
  return ObserveRpc("DeviceService.ListDeviceStatus", req.device_id(), [&] {
    ListDeviceStatusResponse resp;
    *resp.mutable_status() = ctx_.presence->Snapshot(ScopedDevice(caller, req.device_id()));
    return resp;
  });
}

ListDevicesResponse DeviceService::ListDevices(const auth::Identity& caller, const ListDevicesRequest&) {
  return ObserveRpc("DeviceService.ListDevices", caller.device_id, [&] {
    RequireController(caller);

    auto tx      = ctx_.repository->Begin();
    auto devices = ctx_.repository->ListDevices(*tx);
    tx->Commit();

    ListDevicesResponse resp;
    for (const auto& device : devices) {
      if (device.id == caller.device_id && device.paired) {
        *resp.add_devices() = presence::PresenceTracker::ToDeviceStatus(device);
      }
    }
    return resp;
  });
}

UpdateDeviceSettingsResponse DeviceService::UpdateDeviceSettings(const auth::Identity& caller, const UpdateDeviceSettingsRequest& req) {
  return ObserveRpc("DeviceService.UpdateDeviceSettings", req.device_id(), [&] {
    const auto& device_id = ScopedDevice(caller, req.device_id());

    auto tx     = ctx_.repository->Begin();
    auto device = GetPairedDevice(*ctx_.repository, *tx, device_id);

    auto settings = util::ParseStruct(device.settings_json);
    util::MergeStruct(&settings, req.settings());
    device.settings_json = util::ToJson(settings);
    if (!req.name().empty()) {
      device.name = req.name();
    }
    db::ThrowIfError(ctx_.repository->UpdateDevice(*tx, device), "update device settings");
    tx->Commit();

    UpdateDeviceSettingsResponse resp;
    *resp.mutable_status() = presence::PresenceTracker::ToDeviceStatus(device);
    return resp;
  });
}

void DeviceService::UnpairDevice(const auth::Identity& caller, const UnpairDeviceRequest& req) {
  ObserveRpc("DeviceService.UnpairDevice", req.device_id(), [&] {
    const auto& device_id = ScopedDevice(caller, req.device_id());
    {
      auto tx     = ctx_.repository->Begin();
      auto device = GetPairedDevice(*ctx_.repository, *tx, device_id);
      device.paired = false;
      db::ThrowIfError(ctx_.repository->UpdateDevice(*tx, device), "unpair device");
      tx->Commit();
    }

    ctx_.auth->RevokeDevice(device_id);
    ctx_.registry->CloseDevice(device_id, CLOSE_REASON_UNPAIRED);
    RELAY_LOG_INFO("device unpaired", {observability::DeviceField(device_id), observability::StringField("by", caller.subject)});
  });
}

RelayStatsResponse DeviceService::GetRelayStats(const auth::Identity& caller, const RelayStatsRequest&) {
  return ObserveRpc("DeviceService.GetRelayStats", caller.device_id, [&] {
    RequireController(caller);
    const auto sessions = ctx_.registry->Stats();
    const auto media    = ctx_.media->Stats();

    RelayStatsResponse resp;
    resp.set_device_sessions(sessions.device_sessions);
    resp.set_controller_sessions(sessions.controller_sessions);
    for (const auto& device_id : sessions.online_devices) {
      resp.add_online_devices(device_id);
    }
    resp.set_frames_published(media.published);
    resp.set_frames_relayed(media.relayed);
    resp.set_frames_dropped(media.dropped);
    resp.set_frames_rejected(media.rejected);
    resp.set_pending_commands(ctx_.queue->PendingCount());
    return resp;
  });
}

} // namespace relay::service
