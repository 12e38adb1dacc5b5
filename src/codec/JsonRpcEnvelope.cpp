#include "JsonRpcEnvelope.hpp"

#include "WireDecode.hpp"

namespace kjui {
JsonRpcEnvelope JsonRpcEnvelope::fromJson(const json& message) {
  expectObject(message, "message");
  const json& version = requireField(message, "jsonrpc", "message");
  const json& methodValue = requireField(message, "method", "message");
  if (!methodValue.is_string()) {
    throw CodecException::malformed(
        jsonTypeName(methodValue),
        "method must be a string, got " + jsonTypeName(methodValue));
  }
  string method = methodValue.get<string>();
  auto paramsIt = message.find("params");
  if (paramsIt == message.end()) {
    throw CodecException::malformed(method,
                                    "Method '" + method + "' has no params");
  }
  if (!paramsIt->is_array()) {
    throw CodecException::malformed(method, "Params of '" + method +
                                                "' must be an array, got " +
                                                jsonTypeName(*paramsIt));
  }
  return JsonRpcEnvelope(version, method, *paramsIt);
}

JsonRpcEnvelope JsonRpcEnvelope::wrap(const string& method, json params) {
  return JsonRpcEnvelope(json(JSONRPC_VERSION), method, std::move(params));
}

json JsonRpcEnvelope::toJson() const {
  json message;
  message["jsonrpc"] = version;
  message["method"] = method;
  message["params"] = params;
  return message;
}

json parseMessageText(const string& text) {
  try {
    return json::parse(text);
  } catch (const json::parse_error& pe) {
    throw CodecException::malformed(text,
                                    string("Invalid JSON: ") + pe.what());
  }
}
}  // namespace kjui
