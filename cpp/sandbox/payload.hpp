#ifndef SANDBOX_PAYLOAD_HPP
#define SANDBOX_PAYLOAD_HPP

#include <map>
#include <string>

namespace sandbox {

// The "result" mapping exposed by generated code: each key maps to the JSON
// text of its value.
using ResultPayload = std::map<std::string, std::string>;

// Decodes a flat JSON object. Returns false and sets error_msg if json is not
// valid JSON or not an object.
bool ParsePayload(const std::string& json, ResultPayload* payload,
                  std::string* error_msg);

// Encodes a payload as a JSON object.
std::string PayloadToJson(const ResultPayload& payload);

}  // namespace sandbox

#endif
