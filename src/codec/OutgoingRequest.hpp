#ifndef __KJUI_OUTGOING_REQUEST__
#define __KJUI_OUTGOING_REQUEST__

#include "Headers.hpp"
#include "JsonLib.hpp"

namespace kjui {
/** Requests the UI sends to Kakoune (frontend -> editor). */
namespace outgoing {
/** @brief Key presses in Kakoune's key syntax, e.g. "a", "<c-x>", "<esc>". */
struct Keys {
  vector<string> keys;

  bool operator==(const Keys& o) const { return keys == o.keys; }
};

struct Resize {
  uint32_t rows = 0;
  uint32_t columns = 0;

  bool operator==(const Resize& o) const {
    return rows == o.rows && columns == o.columns;
  }
};

struct Scroll {
  uint32_t amount = 0;

  bool operator==(const Scroll& o) const { return amount == o.amount; }
};

struct MouseMove {
  uint32_t line = 0;
  uint32_t column = 0;

  bool operator==(const MouseMove& o) const {
    return line == o.line && column == o.column;
  }
};

/** @brief `button` is "left", "middle" or "right". */
struct MousePress {
  string button;
  uint32_t line = 0;
  uint32_t column = 0;

  bool operator==(const MousePress& o) const {
    return button == o.button && line == o.line && column == o.column;
  }
};

struct MouseRelease {
  string button;
  uint32_t line = 0;
  uint32_t column = 0;

  bool operator==(const MouseRelease& o) const {
    return button == o.button && line == o.line && column == o.column;
  }
};

struct MenuSelect {
  uint32_t index = 0;

  bool operator==(const MenuSelect& o) const { return index == o.index; }
};
}  // namespace outgoing

typedef std::variant<outgoing::Keys, outgoing::Resize, outgoing::Scroll,
                     outgoing::MouseMove, outgoing::MousePress,
                     outgoing::MouseRelease, outgoing::MenuSelect>
    OutgoingRequest;

/** @brief Builds the JSON-RPC object for a request. Never throws. */
json encodeOutgoingRequestJson(const OutgoingRequest& request);

/**
 * @brief Encodes a request as one compact line of text, without the trailing
 * newline. Equal requests always encode to identical bytes.
 */
string encodeOutgoingRequest(const OutgoingRequest& request);

/** @brief Wire method name of the request, e.g. "mouse_press". */
string outgoingMethodName(const OutgoingRequest& request);

string describeOutgoingRequest(const OutgoingRequest& request);
}  // namespace kjui

#endif  // __KJUI_OUTGOING_REQUEST__
