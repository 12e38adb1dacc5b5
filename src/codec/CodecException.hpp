#ifndef __KJUI_CODEC_EXCEPTION__
#define __KJUI_CODEC_EXCEPTION__

#include "Headers.hpp"

namespace kjui {
/** @brief Reasons a Kakoune UI message can fail to decode. */
enum class ErrorKind {
  /** Unknown method, wrong params arity or type, missing field, bad JSON. */
  MalformedMessage,
  /** A face color token outside the color grammar. */
  InvalidColor,
  /** A face attribute token that is not one of the known attributes. */
  InvalidAttribute,
};

/** @brief Returns the name of the error kind, e.g. "InvalidColor". */
string errorKindName(ErrorKind kind);

/**
 * @brief Thrown when a message, or a value inside it, cannot be decoded.
 *
 * `getDetail()` holds the offending method name or token.
 */
class CodecException : public std::exception {
 public:
  CodecException(ErrorKind _kind, const string& _detail, const string& msg)
      : kind(_kind), detail(_detail), message(msg) {}
  const char* what() const noexcept override { return message.c_str(); }

  ErrorKind getKind() const { return kind; }
  const string& getDetail() const { return detail; }

  static CodecException malformed(const string& detail, const string& msg) {
    return CodecException(ErrorKind::MalformedMessage, detail, msg);
  }

 private:
  ErrorKind kind;
  string detail;
  string message;
};

}  // namespace kjui
#endif  // __KJUI_CODEC_EXCEPTION__
