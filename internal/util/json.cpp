#include "json.hpp"

#include <google/protobuf/util/json_util.h>

#include "errors.hpp"

namespace relay::util {

std::string ToJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("json encode: " + std::string(status.message()));
  }
  return json;
}

void FromJson(const std::string& json, google::protobuf::Message* message) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(json, message, options);
  if (!status.ok()) {
    throw InvalidArgument("json decode: " + std::string(status.message()));
  }
}

google::protobuf::Struct ParseStruct(const std::string& json) {
  google::protobuf::Struct as_struct;
  if (!json.empty()) {
    FromJson(json, &as_struct);
  }
  return as_struct;
}

void MergeStruct(google::protobuf::Struct* base, const google::protobuf::Struct& patch) {
  for (const auto& [key, value] : patch.fields()) {
    (*base->mutable_fields())[key] = value;
  }
}

} // namespace relay::util
