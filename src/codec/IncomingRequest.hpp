#ifndef __KJUI_INCOMING_REQUEST__
#define __KJUI_INCOMING_REQUEST__

#include "Face.hpp"
#include "Headers.hpp"
#include "JsonLib.hpp"

namespace kjui {
/** Requests Kakoune sends to the UI (editor -> frontend). */
namespace incoming {
/** @brief Redraw the buffer area. */
struct Draw {
  vector<Line> lines;
  Face defaultFace;
  Face paddingFace;

  bool operator==(const Draw& o) const {
    return lines == o.lines && defaultFace == o.defaultFace &&
           paddingFace == o.paddingFace;
  }
};

/** @brief Redraw the status bar: prompt/message line and mode line. */
struct DrawStatus {
  Line statusLine;
  Line modeLine;
  Face defaultFace;

  bool operator==(const DrawStatus& o) const {
    return statusLine == o.statusLine && modeLine == o.modeLine &&
           defaultFace == o.defaultFace;
  }
};

/** @brief Show a completion or prompt menu at `anchor`. */
struct MenuShow {
  vector<Line> items;
  Coord anchor;
  Face selectedItemFace;
  Face menuFace;
  // "prompt", "inline" or "search"
  string style;

  bool operator==(const MenuShow& o) const {
    return items == o.items && anchor == o.anchor &&
           selectedItemFace == o.selectedItemFace && menuFace == o.menuFace &&
           style == o.style;
  }
};

struct MenuSelect {
  uint32_t selected = 0;

  bool operator==(const MenuSelect& o) const { return selected == o.selected; }
};

struct MenuHide {
  bool operator==(const MenuHide&) const { return true; }
};

/** @brief Show an info box. */
struct InfoShow {
  Line title;
  vector<Line> content;
  Coord anchor;
  Face face;
  // "prompt", "inline", "inlineAbove", "inlineBelow", "menuDoc" or "modal"
  string style;

  bool operator==(const InfoShow& o) const {
    return title == o.title && content == o.content && anchor == o.anchor &&
           face == o.face && style == o.style;
  }
};

struct InfoHide {
  bool operator==(const InfoHide&) const { return true; }
};

/** @brief Place the cursor; `mode` is "prompt" or "buffer". */
struct SetCursor {
  string mode;
  Coord coord;

  bool operator==(const SetCursor& o) const {
    return mode == o.mode && coord == o.coord;
  }
};

/** @brief The ui_options option of the current window. */
struct SetUiOptions {
  map<string, string> options;

  bool operator==(const SetUiOptions& o) const { return options == o.options; }
};

struct Refresh {
  bool force = false;

  bool operator==(const Refresh& o) const { return force == o.force; }
};
}  // namespace incoming

typedef std::variant<incoming::Draw, incoming::DrawStatus, incoming::MenuShow,
                     incoming::MenuSelect, incoming::MenuHide,
                     incoming::InfoShow, incoming::InfoHide,
                     incoming::SetCursor, incoming::SetUiOptions,
                     incoming::Refresh>
    IncomingRequest;

/**
 * @brief Decodes one line of protocol text sent by Kakoune.
 * @throws CodecException (MalformedMessage, InvalidColor or InvalidAttribute).
 */
IncomingRequest decodeIncomingRequest(const string& text);

/** @brief Same as above for an already parsed message. */
IncomingRequest decodeIncomingRequest(const json& message);

/** @brief Wire method name of the request, e.g. "draw_status". */
string incomingMethodName(const IncomingRequest& request);

/** @brief One line human readable summary, used for logs and the inspector. */
string describeIncomingRequest(const IncomingRequest& request);
}  // namespace kjui

#endif  // __KJUI_INCOMING_REQUEST__
