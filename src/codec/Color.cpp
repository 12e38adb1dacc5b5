#include "Color.hpp"

namespace kjui {
namespace {
const string RGB_PREFIX = "rgb:";
const string RGBA_PREFIX = "rgba:";

const std::array<std::pair<const char*, Color::Kind>, 9> NAMED_COLORS = {{
    {"black", Color::Black},
    {"red", Color::Red},
    {"green", Color::Green},
    {"yellow", Color::Yellow},
    {"blue", Color::Blue},
    {"purple", Color::Purple},
    {"cyan", Color::Cyan},
    {"white", Color::White},
    {"default", Color::Default},
}};

bool hasPrefix(const string& token, const string& prefix) {
  return token.length() >= prefix.length() &&
         token.compare(0, prefix.length(), prefix) == 0;
}
}  // namespace

Color decodeColor(const string& token) {
  for (const auto& it : NAMED_COLORS) {
    if (token == it.first) {
      return Color(it.second);
    }
  }
  // "rgba:" is not a prefix of "rgb:" and vice versa, so order is free here
  if (hasPrefix(token, RGB_PREFIX)) {
    return Color::rgb(token.substr(RGB_PREFIX.length()));
  }
  if (hasPrefix(token, RGBA_PREFIX)) {
    return Color::rgba(token.substr(RGBA_PREFIX.length()));
  }
  throw CodecException(ErrorKind::InvalidColor, token,
                       "Invalid color: '" + token + "'");
}

string encodeColor(const Color& color) {
  switch (color.getKind()) {
    case Color::Rgb:
      return RGB_PREFIX + color.getPayload();
    case Color::Rgba:
      return RGBA_PREFIX + color.getPayload();
    default:
      break;
  }
  for (const auto& it : NAMED_COLORS) {
    if (it.second == color.getKind()) {
      return it.first;
    }
  }
  STFATAL << "Color kind without a name: " << int(color.getKind());
  return "";
}

std::ostream& operator<<(std::ostream& os, const Color& color) {
  return os << encodeColor(color);
}
}  // namespace kjui
