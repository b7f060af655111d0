#pragma once

#include <string>
#include <vector>

#include "corral/common/exception.h"

#include "source/common/protobuf/protobuf.h"

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"

// Obtain the value of a wrapped field (e.g. google.protobuf.UInt32Value) if set. Otherwise, return
// the default value.
#define PROTOBUF_GET_WRAPPED_OR_DEFAULT(message, field_name, default_value)                        \
  ((message).has_##field_name() ? (message).field_name().value() : (default_value))

namespace Corral {

class MessageUtil {
public:
  /**
   * Parses a JSON document into a message. Unknown fields are rejected.
   * @param json supplies the document.
   * @param message supplies the message to populate; it is cleared first.
   * @return absl::Status describing the first parse error, if any.
   */
  static absl::Status loadFromJsonNoThrow(absl::string_view json, Protobuf::Message& message);

  /**
   * Same as loadFromJsonNoThrow(), throwing CorralException on failure.
   */
  static void loadFromJson(absl::string_view json, Protobuf::Message& message);

  /**
   * Renders a message as JSON with proto field names preserved.
   * @param message supplies the message to render.
   * @param pretty_print whether to indent the output.
   * @return the JSON document, or the conversion error.
   */
  static absl::StatusOr<std::string> getJsonStringFromMessage(const Protobuf::Message& message,
                                                              bool pretty_print = false);

  /**
   * Renders a message as JSON, returning an error description in place of the document when
   * conversion fails. Intended for logging.
   */
  static std::string getJsonStringFromMessageOrError(const Protobuf::Message& message,
                                                     bool pretty_print = false);

  /**
   * Builds a struct with a single string field.
   */
  static ProtobufWkt::Struct keyValueStruct(const std::string& key, const std::string& value);
};

class ValueUtil {
public:
  /**
   * Wrap absl::string_view into ProtobufWkt::Value string value.
   * @param str string to be wrapped.
   * @return wrapped string.
   */
  static ProtobufWkt::Value stringValue(absl::string_view str);

  /**
   * Wrap boolean into ProtobufWkt::Value boolean value.
   * @param b boolean to be wrapped.
   * @return wrapped boolean.
   */
  static ProtobufWkt::Value boolValue(bool b);

  /**
   * Wrap double into ProtobufWkt::Value number value.
   * @param num double to be wrapped.
   * @return wrapped number.
   */
  static ProtobufWkt::Value numberValue(double num);

  /**
   * Wrap ProtobufWkt::Struct into ProtobufWkt::Value struct value.
   * @param obj struct to be wrapped.
   * @return wrapped struct.
   */
  static ProtobufWkt::Value structValue(const ProtobufWkt::Struct& obj);

  /**
   * Wrap a collection of ProtobufWkt::Values into ProtobufWkt::Value list value.
   * @param values collection of ProtobufWkt::Values to be wrapped.
   * @return wrapped list value.
   */
  static ProtobufWkt::Value listValue(const std::vector<ProtobufWkt::Value>& values);
};

} // namespace Corral
