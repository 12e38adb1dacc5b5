#ifndef __KJUI_RAW_REQUESTS__
#define __KJUI_RAW_REQUESTS__

#include "Face.hpp"
#include "Headers.hpp"
#include "IncomingRequest.hpp"
#include "JsonRpcEnvelope.hpp"
#include "OutgoingRequest.hpp"

namespace kjui {
/**
 * Wire shapes of the protocol. Each message is a method tag plus a tuple
 * holding the params array slot by slot, so the arity of a method is the
 * size of its tuple. Not part of the public API: callers use
 * IncomingRequest / OutgoingRequest.
 */
namespace wire {
template <typename Tag, typename... Slots>
struct RawMessage {
  typedef Tag MethodTag;
  typedef std::tuple<Slots...> Params;
  static constexpr size_t ARITY = sizeof...(Slots);

  Params params;
};

struct DrawMethod {
  static constexpr const char* METHOD = "draw";
};
struct DrawStatusMethod {
  static constexpr const char* METHOD = "draw_status";
};
struct MenuShowMethod {
  static constexpr const char* METHOD = "menu_show";
};
// Shared by both directions: [selected] from Kakoune, [index] to Kakoune
struct MenuSelectMethod {
  static constexpr const char* METHOD = "menu_select";
};
struct MenuHideMethod {
  static constexpr const char* METHOD = "menu_hide";
};
struct InfoShowMethod {
  static constexpr const char* METHOD = "info_show";
};
struct InfoHideMethod {
  static constexpr const char* METHOD = "info_hide";
};
struct SetCursorMethod {
  static constexpr const char* METHOD = "set_cursor";
};
struct SetUiOptionsMethod {
  static constexpr const char* METHOD = "set_ui_options";
};
struct RefreshMethod {
  static constexpr const char* METHOD = "refresh";
};
struct KeysMethod {
  static constexpr const char* METHOD = "keys";
};
struct ResizeMethod {
  static constexpr const char* METHOD = "resize";
};
struct ScrollMethod {
  static constexpr const char* METHOD = "scroll";
};
struct MouseMoveMethod {
  static constexpr const char* METHOD = "mouse_move";
};
struct MousePressMethod {
  static constexpr const char* METHOD = "mouse_press";
};
struct MouseReleaseMethod {
  static constexpr const char* METHOD = "mouse_release";
};

// editor -> frontend, same alternative order as IncomingRequest
typedef RawMessage<DrawMethod, vector<Line>, Face, Face> RawDraw;
typedef RawMessage<DrawStatusMethod, Line, Line, Face> RawDrawStatus;
typedef RawMessage<MenuShowMethod, vector<Line>, Coord, Face, Face, string>
    RawMenuShow;
typedef RawMessage<MenuSelectMethod, uint32_t> RawMenuSelect;
typedef RawMessage<MenuHideMethod> RawMenuHide;
typedef RawMessage<InfoShowMethod, Line, vector<Line>, Coord, Face, string>
    RawInfoShow;
typedef RawMessage<InfoHideMethod> RawInfoHide;
typedef RawMessage<SetCursorMethod, string, Coord> RawSetCursor;
typedef RawMessage<SetUiOptionsMethod, map<string, string>> RawSetUiOptions;
typedef RawMessage<RefreshMethod, bool> RawRefresh;

typedef std::variant<RawDraw, RawDrawStatus, RawMenuShow, RawMenuSelect,
                     RawMenuHide, RawInfoShow, RawInfoHide, RawSetCursor,
                     RawSetUiOptions, RawRefresh>
    RawIncomingRequest;

/**
 * @brief `keys` is variadic: the params array is the key list itself, one
 * slot per key, rather than a single slot holding a list.
 */
struct RawKeys {
  typedef KeysMethod MethodTag;

  vector<string> keys;
};

// frontend -> editor, same alternative order as OutgoingRequest
typedef RawMessage<ResizeMethod, uint32_t, uint32_t> RawResize;
typedef RawMessage<ScrollMethod, uint32_t> RawScroll;
typedef RawMessage<MouseMoveMethod, uint32_t, uint32_t> RawMouseMove;
typedef RawMessage<MousePressMethod, string, uint32_t, uint32_t> RawMousePress;
typedef RawMessage<MouseReleaseMethod, string, uint32_t, uint32_t>
    RawMouseRelease;

typedef std::variant<RawKeys, RawResize, RawScroll, RawMouseMove,
                     RawMousePress, RawMouseRelease, RawMenuSelect>
    RawOutgoingRequest;

static_assert(std::variant_size<RawIncomingRequest>::value ==
                  std::variant_size<IncomingRequest>::value,
              "Every incoming request needs a wire shape");
static_assert(std::variant_size<RawOutgoingRequest>::value ==
                  std::variant_size<OutgoingRequest>::value,
              "Every outgoing request needs a wire shape");

template <typename Variant, size_t... I>
constexpr std::array<const char*, sizeof...(I)> methodNames(
    std::index_sequence<I...>) {
  return {{std::variant_alternative<I, Variant>::type::MethodTag::METHOD...}};
}

/** @brief Method names indexed like the alternatives of `Variant`. */
template <typename Variant>
constexpr std::array<const char*, std::variant_size<Variant>::value>
methodNames() {
  return methodNames<Variant>(
      std::make_index_sequence<std::variant_size<Variant>::value>());
}

/**
 * @brief Structural decode: picks the wire shape named by the envelope's
 * method and checks params arity and slot types.
 * @throws CodecException (MalformedMessage, InvalidColor or InvalidAttribute).
 */
RawIncomingRequest decodeRawIncomingRequest(const JsonRpcEnvelope& envelope);

/** @brief Moves every params slot into its named field. Never fails. */
IncomingRequest toIncomingRequest(RawIncomingRequest raw);

/** @brief Lays the named fields out in params order. Never fails. */
RawOutgoingRequest toRawOutgoingRequest(const OutgoingRequest& request);

/** @brief Writes the params array and wraps it in a "2.0" envelope. */
JsonRpcEnvelope encodeRawOutgoingRequest(const RawOutgoingRequest& raw);
}  // namespace wire
}  // namespace kjui

#endif  // __KJUI_RAW_REQUESTS__
