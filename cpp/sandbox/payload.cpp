#include "sandbox/payload.hpp"

#include <capnp/compat/json.h>
#include <capnp/message.h>
#include <kj/debug.h>

namespace sandbox {

bool ParsePayload(const std::string& json, ResultPayload* payload,
                  std::string* error_msg) {
  payload->clear();
  capnp::JsonCodec codec;
  capnp::MallocMessageBuilder message;
  auto root = message.initRoot<capnp::JsonValue>();
  KJ_IF_MAYBE(exception, kj::runCatchingExceptions([&]() {
                codec.decodeRaw(
                    kj::ArrayPtr<const char>(json.data(), json.size()), root);
              })) {
    *error_msg = "Invalid JSON: ";
    *error_msg += exception->getDescription().cStr();
    return false;
  }
  if (root.which() != capnp::JsonValue::OBJECT) {
    *error_msg = "The result is not a JSON object";
    return false;
  }
  for (auto field : root.asReader().getObject()) {
    (*payload)[field.getName().cStr()] =
        codec.encodeRaw(field.getValue()).cStr();
  }
  return true;
}

std::string PayloadToJson(const ResultPayload& payload) {
  capnp::JsonCodec codec;
  capnp::MallocMessageBuilder message;
  auto root = message.initRoot<capnp::JsonValue>();
  auto fields = root.initObject(payload.size());
  size_t i = 0;
  for (const auto& entry : payload) {
    fields[i].setName(entry.first.c_str());
    codec.decodeRaw(
        kj::ArrayPtr<const char>(entry.second.data(), entry.second.size()),
        fields[i].initValue());
    i++;
  }
  return codec.encodeRaw(root.asReader()).cStr();
}

}  // namespace sandbox
