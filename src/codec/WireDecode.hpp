#ifndef __KJUI_WIRE_DECODE__
#define __KJUI_WIRE_DECODE__

#include "CodecException.hpp"
#include "Headers.hpp"
#include "JsonLib.hpp"

namespace kjui {
// Structural checks shared by the value and params decoders. Each one throws
// CodecException(MalformedMessage) naming what it expected and what it got.

/** @brief Returns the JSON type name of `j` ("string", "array", ...). */
string jsonTypeName(const json& j);

string decodeString(const json& j);
bool decodeBool(const json& j);
/** @brief Accepts non-negative JSON integers that fit in 32 bits. */
uint32_t decodeUint32(const json& j);

/** @brief Throws unless `j` is an object. `what` names it in the error. */
void expectObject(const json& j, const char* what);
/** @brief Throws unless `j` is an array. `what` names it in the error. */
void expectArray(const json& j, const char* what);

/** @brief Returns `obj[key]`, throwing if `obj` has no such key. */
const json& requireField(const json& obj, const char* key, const char* what);
}  // namespace kjui

#endif  // __KJUI_WIRE_DECODE__
