#include "WireDecode.hpp"

namespace kjui {
namespace {
CodecException typeMismatch(const char* expected, const json& actual) {
  return CodecException::malformed(
      jsonTypeName(actual), string("Expected ") + expected + ", got " +
                                jsonTypeName(actual));
}
}  // namespace

string jsonTypeName(const json& j) {
  if (j.is_number_unsigned()) {
    return "unsigned integer";
  }
  if (j.is_number_integer()) {
    return "negative integer";
  }
  return j.type_name();
}

string decodeString(const json& j) {
  if (!j.is_string()) {
    throw typeMismatch("string", j);
  }
  return j.get<string>();
}

bool decodeBool(const json& j) {
  if (!j.is_boolean()) {
    throw typeMismatch("boolean", j);
  }
  return j.get<bool>();
}

uint32_t decodeUint32(const json& j) {
  if (!j.is_number_unsigned()) {
    throw typeMismatch("unsigned integer", j);
  }
  uint64_t value = j.get<uint64_t>();
  if (value > std::numeric_limits<uint32_t>::max()) {
    throw CodecException::malformed(
        std::to_string(value),
        "Integer out of range for u32: " + std::to_string(value));
  }
  return uint32_t(value);
}

void expectObject(const json& j, const char* what) {
  if (!j.is_object()) {
    throw CodecException::malformed(
        what, string(what) + " must be an object, got " + jsonTypeName(j));
  }
}

void expectArray(const json& j, const char* what) {
  if (!j.is_array()) {
    throw CodecException::malformed(
        what, string(what) + " must be an array, got " + jsonTypeName(j));
  }
}

const json& requireField(const json& obj, const char* key, const char* what) {
  auto it = obj.find(key);
  if (it == obj.end()) {
    throw CodecException::malformed(
        key, string(what) + " is missing field '" + key + "'");
  }
  return *it;
}
}  // namespace kjui
