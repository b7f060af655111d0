#include "source/common/protobuf/utility.h"

#include <memory>
#include <string>
#include <vector>

#include "absl/strings/str_cat.h"

namespace Corral {

absl::Status MessageUtil::loadFromJsonNoThrow(absl::string_view json,
                                              Protobuf::Message& message) {
  message.Clear();
  ProtobufUtil::JsonParseOptions options;
  options.ignore_unknown_fields = false;
  const auto status = ProtobufUtil::JsonStringToMessage(std::string(json), &message, options);
  if (!status.ok()) {
    return absl::InvalidArgumentError(absl::StrCat("Unable to parse JSON as proto (",
                                                   status.ToString(), "): ", json));
  }
  return absl::OkStatus();
}

void MessageUtil::loadFromJson(absl::string_view json, Protobuf::Message& message) {
  THROW_IF_NOT_OK(loadFromJsonNoThrow(json, message));
}

absl::StatusOr<std::string> MessageUtil::getJsonStringFromMessage(const Protobuf::Message& message,
                                                                  bool pretty_print) {
  ProtobufUtil::JsonPrintOptions json_options;
  // By default, proto field names are converted to camelCase when the message is converted to JSON.
  // Setting this option makes debugging easier because it keeps field names consistent in JSON
  // printouts.
  json_options.preserve_proto_field_names = true;
  if (pretty_print) {
    json_options.add_whitespace = true;
  }
  std::string json;
  const auto status = ProtobufUtil::MessageToJsonString(message, &json, json_options);
  if (!status.ok()) {
    return absl::InternalError(status.ToString());
  }
  return json;
}

std::string MessageUtil::getJsonStringFromMessageOrError(const Protobuf::Message& message,
                                                         bool pretty_print) {
  auto json_or_error = getJsonStringFromMessage(message, pretty_print);
  return json_or_error.ok() ? std::move(json_or_error).value()
                            : std::string(json_or_error.status().message());
}

ProtobufWkt::Struct MessageUtil::keyValueStruct(const std::string& key, const std::string& value) {
  ProtobufWkt::Struct struct_obj;
  ProtobufWkt::Value val;
  val.set_string_value(value);
  (*struct_obj.mutable_fields())[key] = val;
  return struct_obj;
}

ProtobufWkt::Value ValueUtil::stringValue(absl::string_view str) {
  ProtobufWkt::Value val;
  val.set_string_value(std::string(str));
  return val;
}

ProtobufWkt::Value ValueUtil::boolValue(bool b) {
  ProtobufWkt::Value val;
  val.set_bool_value(b);
  return val;
}

ProtobufWkt::Value ValueUtil::numberValue(double num) {
  ProtobufWkt::Value val;
  val.set_number_value(num);
  return val;
}

ProtobufWkt::Value ValueUtil::structValue(const ProtobufWkt::Struct& obj) {
  ProtobufWkt::Value val;
  (*val.mutable_struct_value()) = obj;
  return val;
}

ProtobufWkt::Value ValueUtil::listValue(const std::vector<ProtobufWkt::Value>& values) {
  auto list = std::make_unique<ProtobufWkt::ListValue>();
  for (const auto& value : values) {
    *list->add_values() = value;
  }
  ProtobufWkt::Value val;
  val.set_allocated_list_value(list.release());
  return val;
}

} // namespace Corral
