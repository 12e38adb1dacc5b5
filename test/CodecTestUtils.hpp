#ifndef __KJUI_CODEC_TEST_UTILS__
#define __KJUI_CODEC_TEST_UTILS__

#include "CodecException.hpp"
#include "Face.hpp"
#include "JsonLib.hpp"
#include "TestHeaders.hpp"

namespace kjui {
// Runs `f` and returns the exception it threw. Fails the test if it returned.
template <typename F>
inline CodecException captureCodecException(F f) {
  try {
    f();
  } catch (const CodecException& ce) {
    return ce;
  }
  FAIL("Expected a CodecException");
  return CodecException::malformed("", "unreachable");
}

inline json faceJson(const string& fg = "default", const string& bg = "default",
                     const vector<string>& attributes = {}) {
  json face;
  face["fg"] = fg;
  face["bg"] = bg;
  face["attributes"] = attributes;
  return face;
}

inline json atomJson(const string& contents, const json& face = faceJson()) {
  json atom;
  atom["face"] = face;
  atom["contents"] = contents;
  return atom;
}

inline json coordJson(uint32_t line, uint32_t column) {
  json coord;
  coord["line"] = line;
  coord["column"] = column;
  return coord;
}

inline json messageJson(const string& method, const json& params) {
  json message;
  message["jsonrpc"] = "2.0";
  message["method"] = method;
  message["params"] = params;
  return message;
}

inline Face makeFace(Color fg = Color(), Color bg = Color(),
                     const vector<Attribute>& attributes = {}) {
  Face face;
  face.fg = fg;
  face.bg = bg;
  face.attributes = attributes;
  return face;
}

inline Atom makeAtom(const string& contents, const Face& face = makeFace()) {
  Atom atom;
  atom.face = face;
  atom.contents = contents;
  return atom;
}
}  // namespace kjui

#endif  // __KJUI_CODEC_TEST_UTILS__
