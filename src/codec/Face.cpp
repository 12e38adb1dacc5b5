#include "Face.hpp"

#include "WireDecode.hpp"

namespace kjui {
namespace {
const std::array<std::pair<const char*, Attribute>, 9> ATTRIBUTE_NAMES = {{
    {"underline", Attribute::Underline},
    {"reverse", Attribute::Reverse},
    {"blink", Attribute::Blink},
    {"bold", Attribute::Bold},
    {"dim", Attribute::Dim},
    {"italic", Attribute::Italic},
    {"final_fg", Attribute::FinalFg},
    {"final_bg", Attribute::FinalBg},
    {"final_attr", Attribute::FinalAttr},
}};
}  // namespace

Attribute decodeAttribute(const string& token) {
  for (const auto& it : ATTRIBUTE_NAMES) {
    if (token == it.first) {
      return it.second;
    }
  }
  throw CodecException(ErrorKind::InvalidAttribute, token,
                       "Invalid attribute: '" + token + "'");
}

string attributeName(Attribute attribute) {
  for (const auto& it : ATTRIBUTE_NAMES) {
    if (it.second == attribute) {
      return it.first;
    }
  }
  STFATAL << "Attribute without a name: " << int(attribute);
  return "";
}

Color colorFromJson(const json& j) { return decodeColor(decodeString(j)); }

Attribute attributeFromJson(const json& j) {
  return decodeAttribute(decodeString(j));
}

Face faceFromJson(const json& j) {
  expectObject(j, "face");
  Face face;
  face.fg = colorFromJson(requireField(j, "fg", "face"));
  face.bg = colorFromJson(requireField(j, "bg", "face"));
  const json& attributes = requireField(j, "attributes", "face");
  expectArray(attributes, "face attributes");
  face.attributes.reserve(attributes.size());
  for (const auto& attribute : attributes) {
    face.attributes.push_back(attributeFromJson(attribute));
  }
  return face;
}

Atom atomFromJson(const json& j) {
  expectObject(j, "atom");
  Atom atom;
  atom.face = faceFromJson(requireField(j, "face", "atom"));
  atom.contents = decodeString(requireField(j, "contents", "atom"));
  return atom;
}

Line lineFromJson(const json& j) {
  expectArray(j, "line");
  Line line;
  line.reserve(j.size());
  for (const auto& atom : j) {
    line.push_back(atomFromJson(atom));
  }
  return line;
}

Coord coordFromJson(const json& j) {
  expectObject(j, "coord");
  Coord coord;
  coord.line = decodeUint32(requireField(j, "line", "coord"));
  coord.column = decodeUint32(requireField(j, "column", "coord"));
  return coord;
}

string lineText(const Line& line) {
  string text;
  for (const auto& atom : line) {
    text += atom.contents;
  }
  return text;
}

std::ostream& operator<<(std::ostream& os, Attribute attribute) {
  return os << attributeName(attribute);
}

std::ostream& operator<<(std::ostream& os, const Face& face) {
  os << "{fg=" << face.fg << " bg=" << face.bg << " attributes=[";
  for (size_t i = 0; i < face.attributes.size(); ++i) {
    if (i) {
      os << ",";
    }
    os << face.attributes[i];
  }
  return os << "]}";
}

std::ostream& operator<<(std::ostream& os, const Coord& coord) {
  return os << "(" << coord.line << "," << coord.column << ")";
}
}  // namespace kjui
