#pragma once

#include <string>

#include <google/protobuf/message.h>
#include <google/protobuf/struct.pb.h>

namespace relay::util {

/*
  JSON columns are written with protobuf JsonUtil so stored blobs use the
  same field names as the wire API.
*/

std::string ToJson(const google::protobuf::Message& message);

// Throws InvalidArgument when `json` does not parse into `message`.
void FromJson(const std::string& json, google::protobuf::Message* message);

// Empty input yields an empty object.
google::protobuf::Struct ParseStruct(const std::string& json);

// Overwrites `base` keys with the ones present in `patch`.
void MergeStruct(google::protobuf::Struct* base, const google::protobuf::Struct& patch);

} // namespace relay::util
