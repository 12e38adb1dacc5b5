#include "OutgoingRequest.hpp"

#include "RawRequests.hpp"

namespace kjui {
namespace wire {
namespace {
struct OutgoingRelabeler {
  RawOutgoingRequest operator()(const outgoing::Keys& r) const {
    return RawKeys{r.keys};
  }
  RawOutgoingRequest operator()(const outgoing::Resize& r) const {
    return RawResize{{r.rows, r.columns}};
  }
  RawOutgoingRequest operator()(const outgoing::Scroll& r) const {
    return RawScroll{{r.amount}};
  }
  RawOutgoingRequest operator()(const outgoing::MouseMove& r) const {
    return RawMouseMove{{r.line, r.column}};
  }
  RawOutgoingRequest operator()(const outgoing::MousePress& r) const {
    return RawMousePress{{r.button, r.line, r.column}};
  }
  RawOutgoingRequest operator()(const outgoing::MouseRelease& r) const {
    return RawMouseRelease{{r.button, r.line, r.column}};
  }
  RawOutgoingRequest operator()(const outgoing::MenuSelect& r) const {
    return RawMenuSelect{{r.index}};
  }
};

json encodeParams(const RawKeys& raw) {
  json params = json::array();
  for (const auto& key : raw.keys) {
    params.push_back(key);
  }
  return params;
}

template <typename Tag, typename... Slots>
json encodeParams(const RawMessage<Tag, Slots...>& raw) {
  json params = json::array();
  std::apply(
      [&](const Slots&... slot) { (params.push_back(json(slot)), ...); },
      raw.params);
  return params;
}

const auto OUTGOING_METHOD_NAMES = methodNames<RawOutgoingRequest>();
}  // namespace

RawOutgoingRequest toRawOutgoingRequest(const OutgoingRequest& request) {
  return std::visit(OutgoingRelabeler(), request);
}

JsonRpcEnvelope encodeRawOutgoingRequest(const RawOutgoingRequest& raw) {
  return std::visit(
      [](const auto& r) {
        typedef typename std::decay<decltype(r)>::type Raw;
        return JsonRpcEnvelope::wrap(Raw::MethodTag::METHOD, encodeParams(r));
      },
      raw);
}
}  // namespace wire

json encodeOutgoingRequestJson(const OutgoingRequest& request) {
  return wire::encodeRawOutgoingRequest(wire::toRawOutgoingRequest(request))
      .toJson();
}

string encodeOutgoingRequest(const OutgoingRequest& request) {
  return dumpCompact(encodeOutgoingRequestJson(request));
}

string outgoingMethodName(const OutgoingRequest& request) {
  return wire::OUTGOING_METHOD_NAMES[request.index()];
}

namespace {
struct OutgoingDescriber {
  std::ostream& os;

  void operator()(const outgoing::Keys& r) const {
    os << " keys=[";
    for (size_t i = 0; i < r.keys.size(); ++i) {
      os << (i ? "," : "") << r.keys[i];
    }
    os << "]";
  }
  void operator()(const outgoing::Resize& r) const {
    os << " rows=" << r.rows << " columns=" << r.columns;
  }
  void operator()(const outgoing::Scroll& r) const {
    os << " amount=" << r.amount;
  }
  void operator()(const outgoing::MouseMove& r) const {
    os << " line=" << r.line << " column=" << r.column;
  }
  void operator()(const outgoing::MousePress& r) const {
    os << " button=" << r.button << " line=" << r.line
       << " column=" << r.column;
  }
  void operator()(const outgoing::MouseRelease& r) const {
    os << " button=" << r.button << " line=" << r.line
       << " column=" << r.column;
  }
  void operator()(const outgoing::MenuSelect& r) const {
    os << " index=" << r.index;
  }
};
}  // namespace

string describeOutgoingRequest(const OutgoingRequest& request) {
  std::ostringstream ss;
  ss << outgoingMethodName(request);
  std::visit(OutgoingDescriber{ss}, request);
  return ss.str();
}
}  // namespace kjui
