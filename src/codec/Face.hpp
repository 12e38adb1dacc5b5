#ifndef __KJUI_FACE__
#define __KJUI_FACE__

#include "Color.hpp"
#include "Headers.hpp"
#include "JsonLib.hpp"

namespace kjui {
/** @brief A face attribute. The wire name is the snake_case spelling. */
enum class Attribute {
  Underline,
  Reverse,
  Blink,
  Bold,
  Dim,
  Italic,
  FinalFg,
  FinalBg,
  FinalAttr,
};

/**
 * @brief Decodes an attribute keyword such as "bold" or "final_fg".
 * @throws CodecException with ErrorKind::InvalidAttribute otherwise.
 */
Attribute decodeAttribute(const string& token);

/** @brief Returns the wire keyword of the attribute. */
string attributeName(Attribute attribute);

/**
 * @brief Colors and attributes used to render an atom.
 *
 * Attribute order is kept exactly as received, duplicates included.
 */
struct Face {
  Color fg;
  Color bg;
  vector<Attribute> attributes;

  bool operator==(const Face& other) const {
    return fg == other.fg && bg == other.bg && attributes == other.attributes;
  }
  bool operator!=(const Face& other) const { return !(*this == other); }
};

/** @brief A run of text drawn with one face. */
struct Atom {
  Face face;
  string contents;

  bool operator==(const Atom& other) const {
    return face == other.face && contents == other.contents;
  }
  bool operator!=(const Atom& other) const { return !(*this == other); }
};

/** @brief Atoms in left to right rendering order. */
typedef vector<Atom> Line;

/** @brief A 0-indexed buffer or screen position. */
struct Coord {
  uint32_t line = 0;
  uint32_t column = 0;

  bool operator==(const Coord& other) const {
    return line == other.line && column == other.column;
  }
  bool operator!=(const Coord& other) const { return !(*this == other); }
};

// Structural decoders for the JSON shapes Kakoune uses:
//   face:  {"fg": color, "bg": color, "attributes": [attribute, ...]}
//   atom:  {"face": face, "contents": string}
//   line:  [atom, ...]
//   coord: {"line": u32, "column": u32}
// Unknown keys are ignored.
Color colorFromJson(const json& j);
Attribute attributeFromJson(const json& j);
Face faceFromJson(const json& j);
Atom atomFromJson(const json& j);
Line lineFromJson(const json& j);
Coord coordFromJson(const json& j);

/** @brief Concatenated contents of every atom in the line. */
string lineText(const Line& line);

std::ostream& operator<<(std::ostream& os, Attribute attribute);
std::ostream& operator<<(std::ostream& os, const Face& face);
std::ostream& operator<<(std::ostream& os, const Coord& coord);
}  // namespace kjui

#endif  // __KJUI_FACE__
