#include "IncomingRequest.hpp"

#include "RawRequests.hpp"
#include "WireDecode.hpp"

namespace kjui {
namespace wire {
namespace {
// One overload per slot type that appears in an incoming params array
void readSlot(const json& j, string& slot) { slot = decodeString(j); }

void readSlot(const json& j, bool& slot) { slot = decodeBool(j); }

void readSlot(const json& j, uint32_t& slot) { slot = decodeUint32(j); }

void readSlot(const json& j, Face& slot) { slot = faceFromJson(j); }

void readSlot(const json& j, Coord& slot) { slot = coordFromJson(j); }

void readSlot(const json& j, Line& slot) { slot = lineFromJson(j); }

void readSlot(const json& j, vector<Line>& slot) {
  expectArray(j, "lines");
  slot.clear();
  slot.reserve(j.size());
  for (const auto& line : j) {
    slot.push_back(lineFromJson(line));
  }
}

void readSlot(const json& j, map<string, string>& slot) {
  expectObject(j, "options");
  slot.clear();
  for (auto it = j.begin(); it != j.end(); ++it) {
    slot[it.key()] = decodeString(it.value());
  }
}

template <typename T>
void decodeSlot(const string& method, const json& params, size_t index,
                T& slot) {
  try {
    readSlot(params[index], slot);
  } catch (const CodecException& ce) {
    if (ce.getKind() != ErrorKind::MalformedMessage) {
      // Bad colors and attributes keep their own kind
      throw;
    }
    throw CodecException::malformed(method, "Param " + to_string(index) +
                                                " of '" + method +
                                                "': " + ce.what());
  }
}

template <typename... Slots>
void decodeParams(const string& method, const json& params,
                  std::tuple<Slots...>& slots) {
  if (params.size() != sizeof...(Slots)) {
    throw CodecException::malformed(
        method, "Method '" + method + "' expects " +
                    to_string(sizeof...(Slots)) + " params, got " +
                    to_string(params.size()));
  }
  size_t index = 0;
  std::apply(
      [&](Slots&... slot) {
        (decodeSlot(method, params, index++, slot), ...);
      },
      slots);
}

template <size_t I = 0>
RawIncomingRequest decodeByMethod(const JsonRpcEnvelope& envelope) {
  const string& method = envelope.getMethod();
  if constexpr (I == std::variant_size<RawIncomingRequest>::value) {
    throw CodecException::malformed(method, "Unknown method: '" + method + "'");
  } else {
    typedef typename std::variant_alternative<I, RawIncomingRequest>::type Raw;
    if (method == Raw::MethodTag::METHOD) {
      Raw raw;
      decodeParams(method, envelope.getParams(), raw.params);
      return raw;
    }
    return decodeByMethod<I + 1>(envelope);
  }
}

struct IncomingRelabeler {
  IncomingRequest operator()(RawDraw&& raw) const {
    auto& [lines, defaultFace, paddingFace] = raw.params;
    return incoming::Draw{std::move(lines), std::move(defaultFace),
                          std::move(paddingFace)};
  }

  IncomingRequest operator()(RawDrawStatus&& raw) const {
    auto& [statusLine, modeLine, defaultFace] = raw.params;
    return incoming::DrawStatus{std::move(statusLine), std::move(modeLine),
                                std::move(defaultFace)};
  }

  IncomingRequest operator()(RawMenuShow&& raw) const {
    auto& [items, anchor, selectedItemFace, menuFace, style] = raw.params;
    return incoming::MenuShow{std::move(items), anchor,
                              std::move(selectedItemFace), std::move(menuFace),
                              std::move(style)};
  }

  IncomingRequest operator()(RawMenuSelect&& raw) const {
    return incoming::MenuSelect{std::get<0>(raw.params)};
  }

  IncomingRequest operator()(RawMenuHide&&) const {
    return incoming::MenuHide{};
  }

  IncomingRequest operator()(RawInfoShow&& raw) const {
    auto& [title, content, anchor, face, style] = raw.params;
    return incoming::InfoShow{std::move(title), std::move(content), anchor,
                              std::move(face), std::move(style)};
  }

  IncomingRequest operator()(RawInfoHide&&) const {
    return incoming::InfoHide{};
  }

  IncomingRequest operator()(RawSetCursor&& raw) const {
    auto& [mode, coord] = raw.params;
    return incoming::SetCursor{std::move(mode), coord};
  }

  IncomingRequest operator()(RawSetUiOptions&& raw) const {
    return incoming::SetUiOptions{std::move(std::get<0>(raw.params))};
  }

  IncomingRequest operator()(RawRefresh&& raw) const {
    return incoming::Refresh{std::get<0>(raw.params)};
  }
};

const auto INCOMING_METHOD_NAMES = methodNames<RawIncomingRequest>();
}  // namespace

RawIncomingRequest decodeRawIncomingRequest(const JsonRpcEnvelope& envelope) {
  return decodeByMethod(envelope);
}

IncomingRequest toIncomingRequest(RawIncomingRequest raw) {
  return std::visit(IncomingRelabeler(), std::move(raw));
}
}  // namespace wire

IncomingRequest decodeIncomingRequest(const string& text) {
  return decodeIncomingRequest(parseMessageText(text));
}

IncomingRequest decodeIncomingRequest(const json& message) {
  JsonRpcEnvelope envelope = JsonRpcEnvelope::fromJson(message);
  return wire::toIncomingRequest(wire::decodeRawIncomingRequest(envelope));
}

string incomingMethodName(const IncomingRequest& request) {
  return wire::INCOMING_METHOD_NAMES[request.index()];
}

namespace {
struct IncomingDescriber {
  std::ostream& os;

  void operator()(const incoming::Draw& r) const {
    os << " lines=" << r.lines.size() << " default_face=" << r.defaultFace
       << " padding_face=" << r.paddingFace;
  }
  void operator()(const incoming::DrawStatus& r) const {
    os << " status_line=\"" << lineText(r.statusLine) << "\" mode_line=\""
       << lineText(r.modeLine) << "\" default_face=" << r.defaultFace;
  }
  void operator()(const incoming::MenuShow& r) const {
    os << " items=" << r.items.size() << " anchor=" << r.anchor
       << " selected_item_face=" << r.selectedItemFace
       << " menu_face=" << r.menuFace << " style=" << r.style;
  }
  void operator()(const incoming::MenuSelect& r) const {
    os << " selected=" << r.selected;
  }
  void operator()(const incoming::MenuHide&) const {}
  void operator()(const incoming::InfoShow& r) const {
    os << " title=\"" << lineText(r.title) << "\" content=" << r.content.size()
       << " anchor=" << r.anchor << " face=" << r.face << " style=" << r.style;
  }
  void operator()(const incoming::InfoHide&) const {}
  void operator()(const incoming::SetCursor& r) const {
    os << " mode=" << r.mode << " coord=" << r.coord;
  }
  void operator()(const incoming::SetUiOptions& r) const {
    os << " options={";
    bool first = true;
    for (const auto& it : r.options) {
      os << (first ? "" : ", ") << it.first << "=" << it.second;
      first = false;
    }
    os << "}";
  }
  void operator()(const incoming::Refresh& r) const {
    os << " force=" << (r.force ? "true" : "false");
  }
};
}  // namespace

string describeIncomingRequest(const IncomingRequest& request) {
  std::ostringstream ss;
  ss << incomingMethodName(request);
  std::visit(IncomingDescriber{ss}, request);
  return ss.str();
}
}  // namespace kjui
