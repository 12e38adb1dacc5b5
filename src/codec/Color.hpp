#ifndef __KJUI_COLOR__
#define __KJUI_COLOR__

#include "CodecException.hpp"
#include "Headers.hpp"

namespace kjui {
/**
 * @brief A face color as Kakoune sends it.
 *
 * Either one of the nine named colors or an `rgb:`/`rgba:` color whose
 * payload (the text after the prefix) is kept verbatim.
 */
class Color {
 public:
  enum Kind {
    Black,
    Red,
    Green,
    Yellow,
    Blue,
    Purple,
    Cyan,
    White,
    Default,
    Rgb,
    Rgba,
  };

  /** @brief The terminal's default color. */
  Color() : kind(Default) {}
  /** @brief A named color. Use `rgb()`/`rgba()` for the payload kinds. */
  explicit Color(Kind _kind) : kind(_kind) {}

  static Color rgb(const string& payload) { return Color(Rgb, payload); }
  static Color rgba(const string& payload) { return Color(Rgba, payload); }

  Kind getKind() const { return kind; }
  /** @brief Text after the `rgb:`/`rgba:` prefix, empty for named colors. */
  const string& getPayload() const { return payload; }
  bool isNamed() const { return kind != Rgb && kind != Rgba; }

  bool operator==(const Color& other) const {
    return kind == other.kind && payload == other.payload;
  }
  bool operator!=(const Color& other) const { return !(*this == other); }

 protected:
  Color(Kind _kind, const string& _payload) : kind(_kind), payload(_payload) {}

  Kind kind;
  string payload;
};

/**
 * @brief Decodes a color token such as "red", "rgb:ff0000" or "rgba:ff0000ff".
 * @throws CodecException with ErrorKind::InvalidColor for any other token.
 */
Color decodeColor(const string& token);

/** @brief Renders the token that `decodeColor` accepts for this color. */
string encodeColor(const Color& color);

std::ostream& operator<<(std::ostream& os, const Color& color);
}  // namespace kjui

#endif  // __KJUI_COLOR__
