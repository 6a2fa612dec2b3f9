#pragma once

#include "relay/v1/types.pb.h"
#include "relay/v1/envelope.pb.h"
#include "relay/v1/token.pb.h"

#include "relay/v1/pairing_service.pb.h"
#include "relay/v1/device_service.pb.h"
#include "relay/v1/relay_gateway.pb.h"

#include "relay/v1/pairing_service.grpc.pb.h"
#include "relay/v1/device_service.grpc.pb.h"
#include "relay/v1/relay_gateway.grpc.pb.h"
