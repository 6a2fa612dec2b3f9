#include <grpcpp/grpcpp.h>

#include <google/protobuf/util/json_util.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include "relay/v1.hpp"

using namespace relay::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  relayctl <addr> pair-code <claim_id> [name]\n"
            << "  relayctl <addr> redeem <code> [name]\n"
            << "  relayctl <addr> login <device_id> <secret>\n"
            << "  relayctl <addr> controller <device_id> [name]\n"
            << "  relayctl <addr> refresh <refresh_token>\n"
            << "  relayctl <addr> lookup <code>\n"
            << "  relayctl <addr> submit <device_id> <action> [params_json]\n"
            << "  relayctl <addr> command <command_id>\n"
            << "  relayctl <addr> commands <device_id> [limit] [offset]\n"
            << "  relayctl <addr> status <device_id>\n"
            << "  relayctl <addr> devices\n"
            << "  relayctl <addr> settings <device_id> <settings_json> [name]\n"
            << "  relayctl <addr> unpair <device_id>\n"
            << "  relayctl <addr> stats\n"
            << "\n"
            << "Device commands read the controller access token from RELAY_TOKEN.\n";
}

static int Print(const ::grpc::Status& status, const google::protobuf::Message& resp) {
  if (!status.ok()) {
    std::cerr << status.error_message() << "\n";
    return 2;
  }

  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = true;
  options.preserve_proto_field_names    = true;
  options.always_print_primitive_fields = true;

  std::string json;
  if (!google::protobuf::util::MessageToJsonString(resp, &json, options).ok()) {
    std::cerr << "failed to render response\n";
    return 2;
  }
  std::cout << json;
  return 0;
}

static bool ParseJson(const std::string& raw, google::protobuf::Message* out) {
  if (google::protobuf::util::JsonStringToMessage(raw, out).ok()) {
    return true;
  }
  std::cerr << "invalid json: " << raw << "\n";
  return false;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());

  auto pairing_stub = PairingService::NewStub(channel);
  auto device_stub  = DeviceService::NewStub(channel);

  grpc::ClientContext ctx;
  if (const char* token = std::getenv("RELAY_TOKEN"); token && *token) {
    ctx.AddMetadata("authorization", std::string("Bearer ") + token);
  }

  // ------------------------------------------------------------
  // Pairing
  // ------------------------------------------------------------

  if (cmd == "pair-code") {
    if (argc < 4) return 1;

    CreatePairingCodeRequest req;
    req.mutable_claim()->set_claim_id(argv[3]);
    if (argc >= 5) req.mutable_claim()->set_name(argv[4]);

    CreatePairingCodeResponse resp;
    return Print(pairing_stub->CreatePairingCode(&ctx, req, &resp), resp);
  }

  if (cmd == "redeem") {
    if (argc < 4) return 1;

    RedeemPairingCodeRequest req;
    req.set_code(argv[3]);
    if (argc >= 5) req.set_name(argv[4]);

    RedeemPairingCodeResponse resp;
    return Print(pairing_stub->RedeemPairingCode(&ctx, req, &resp), resp);
  }

  if (cmd == "login") {
    if (argc < 5) return 1;

    LoginDeviceRequest req;
    req.set_device_id(argv[3]);
    req.set_secret(argv[4]);

    LoginDeviceResponse resp;
    return Print(pairing_stub->LoginDevice(&ctx, req, &resp), resp);
  }

  if (cmd == "controller") {
    if (argc < 4) return 1;

    RegisterControllerRequest req;
    req.set_device_id(argv[3]);
    if (argc >= 5) req.set_name(argv[4]);

    RegisterControllerResponse resp;
    return Print(pairing_stub->RegisterController(&ctx, req, &resp), resp);
  }

  if (cmd == "refresh") {
    if (argc < 4) return 1;

    RefreshTokenRequest req;
    req.set_refresh_token(argv[3]);

    RefreshTokenResponse resp;
    return Print(pairing_stub->RefreshToken(&ctx, req, &resp), resp);
  }

  if (cmd == "lookup") {
    if (argc < 4) return 1;

    LookupPairingRequest req;
    req.set_code(argv[3]);

    LookupPairingResponse resp;
    return Print(pairing_stub->LookupPairing(&ctx, req, &resp), resp);
  }

  // ------------------------------------------------------------
  // Devices (controller token required)
  // ------------------------------------------------------------

  if (cmd == "submit") {
    if (argc < 5) return 1;

    SubmitCommandRequest req;
    req.set_device_id(argv[3]);
    req.set_action(argv[4]);
    if (argc >= 6 && !ParseJson(argv[5], req.mutable_params())) return 1;

    SubmitCommandResponse resp;
    return Print(device_stub->SubmitCommand(&ctx, req, &resp), resp);
  }

  if (cmd == "command") {
    if (argc < 4) return 1;

    GetCommandRequest req;
    req.set_command_id(argv[3]);

    GetCommandResponse resp;
    return Print(device_stub->GetCommand(&ctx, req, &resp), resp);
  }

  if (cmd == "commands") {
    if (argc < 4) return 1;

    ListCommandsRequest req;
    req.set_device_id(argv[3]);
    req.set_limit(argc >= 5 ? static_cast<uint32_t>(std::stoul(argv[4])) : 50);
    req.set_offset(argc >= 6 ? static_cast<uint32_t>(std::stoul(argv[5])) : 0);

    ListCommandsResponse resp;
    return Print(device_stub->ListCommands(&ctx, req, &resp), resp);
  }

  if (cmd == "status") {
    if (argc < 4) return 1;

    ListDeviceStatusRequest req;
    req.set_device_id(argv[3]);

    ListDeviceStatusResponse resp;
    return Print(device_stub->ListDeviceStatus(&ctx, req, &resp), resp);
  }

  if (cmd == "devices") {
    ListDevicesRequest  req;
    ListDevicesResponse resp;
    return Print(device_stub->ListDevices(&ctx, req, &resp), resp);
  }

  if (cmd == "settings") {
    if (argc < 5) return 1;

    UpdateDeviceSettingsRequest req;
    req.set_device_id(argv[3]);
    if (!ParseJson(argv[4], req.mutable_settings())) return 1;
    if (argc >= 6) req.set_name(argv[5]);

    UpdateDeviceSettingsResponse resp;
    return Print(device_stub->UpdateDeviceSettings(&ctx, req, &resp), resp);
  }

  if (cmd == "unpair") {
    if (argc < 4) return 1;

    UnpairDeviceRequest req;
    req.set_device_id(argv[3]);

    google::protobuf::Empty resp;
    auto                    status = device_stub->UnpairDevice(&ctx, req, &resp);
    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }
    std::cout << "unpaired\n";
    return 0;
  }

  if (cmd == "stats") {
    RelayStatsRequest  req;
    RelayStatsResponse resp;
    return Print(device_stub->GetRelayStats(&ctx, req, &resp), resp);
  }

  Usage();
  return 1;
}
