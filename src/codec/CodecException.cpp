#include "CodecException.hpp"

namespace kjui {
string errorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::MalformedMessage:
      return "MalformedMessage";
    case ErrorKind::InvalidColor:
      return "InvalidColor";
    case ErrorKind::InvalidAttribute:
      return "InvalidAttribute";
  }
  return "Unknown";
}
}  // namespace kjui
