#ifndef __KJUI_JSON_RPC_ENVELOPE__
#define __KJUI_JSON_RPC_ENVELOPE__

#include "CodecException.hpp"
#include "Headers.hpp"
#include "JsonLib.hpp"

namespace kjui {
/**
 * @brief The JSON-RPC object every Kakoune UI message travels in.
 *
 * On the wire: {"jsonrpc": "2.0", "method": <string>, "params": [...]}.
 */
class JsonRpcEnvelope {
 public:
  /**
   * @brief Checks the envelope shape of a parsed message.
   *
   * `jsonrpc` only has to be present; its value is not inspected. Extra
   * top-level keys such as `id` are ignored.
   * @throws CodecException with ErrorKind::MalformedMessage.
   */
  static JsonRpcEnvelope fromJson(const json& message);

  /** @brief Builds an outgoing envelope stamped with JSONRPC_VERSION. */
  static JsonRpcEnvelope wrap(const string& method, json params);

  json toJson() const;

  const json& getVersion() const { return version; }
  const string& getMethod() const { return method; }
  const json& getParams() const { return params; }

 protected:
  JsonRpcEnvelope(json _version, string _method, json _params)
      : version(std::move(_version)),
        method(std::move(_method)),
        params(std::move(_params)) {}

  json version;
  string method;
  json params;
};

/**
 * @brief Parses one complete line of protocol text.
 * @throws CodecException with ErrorKind::MalformedMessage on invalid JSON.
 */
json parseMessageText(const string& text);
}  // namespace kjui

#endif  // __KJUI_JSON_RPC_ENVELOPE__
