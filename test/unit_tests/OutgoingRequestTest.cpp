#include "OutgoingRequest.hpp"

#include "CodecTestUtils.hpp"
#include "RawRequests.hpp"

using namespace kjui;

TEST_CASE("Encode every outgoing request", "[OutgoingRequest]") {
  SECTION("keys") {
    REQUIRE(encodeOutgoingRequest(outgoing::Keys{{"a", "b"}}) ==
            R"({"jsonrpc":"2.0","method":"keys","params":["a","b"]})");
    REQUIRE(encodeOutgoingRequest(outgoing::Keys{{"<c-x>", "<esc>", ":"}}) ==
            R"({"jsonrpc":"2.0","method":"keys","params":["<c-x>","<esc>",":"]})");
  }

  SECTION("keys with no keys") {
    REQUIRE(encodeOutgoingRequest(outgoing::Keys{}) ==
            R"({"jsonrpc":"2.0","method":"keys","params":[]})");
  }

  SECTION("resize") {
    REQUIRE(encodeOutgoingRequest(outgoing::Resize{24, 80}) ==
            R"({"jsonrpc":"2.0","method":"resize","params":[24,80]})");
  }

  SECTION("scroll") {
    REQUIRE(encodeOutgoingRequest(outgoing::Scroll{3}) ==
            R"({"jsonrpc":"2.0","method":"scroll","params":[3]})");
  }

  SECTION("mouse_move") {
    REQUIRE(encodeOutgoingRequest(outgoing::MouseMove{5, 10}) ==
            R"({"jsonrpc":"2.0","method":"mouse_move","params":[5,10]})");
  }

  SECTION("mouse_press") {
    REQUIRE(encodeOutgoingRequest(outgoing::MousePress{"left", 1, 2}) ==
            R"({"jsonrpc":"2.0","method":"mouse_press","params":["left",1,2]})");
  }

  SECTION("mouse_release") {
    REQUIRE(
        encodeOutgoingRequest(outgoing::MouseRelease{"right", 0, 4294967295u}) ==
        R"({"jsonrpc":"2.0","method":"mouse_release","params":["right",0,4294967295]})");
  }

  SECTION("menu_select") {
    REQUIRE(encodeOutgoingRequest(outgoing::MenuSelect{2}) ==
            R"({"jsonrpc":"2.0","method":"menu_select","params":[2]})");
  }
}

TEST_CASE("Keys are the params array itself", "[OutgoingRequest]") {
  json message = encodeOutgoingRequestJson(outgoing::Keys{{"i", "x"}});
  REQUIRE(message["params"].is_array());
  REQUIRE(message["params"].size() == 2);
  REQUIRE(message["params"][0].is_string());
  REQUIRE(message["params"][0] == "i");
  REQUIRE(message["params"][1] == "x");
}

TEST_CASE("Encoding is deterministic and escapes strings",
          "[OutgoingRequest]") {
  OutgoingRequest request = outgoing::Keys{{"\"", "\\", "\n", "é"}};
  string first = encodeOutgoingRequest(request);
  REQUIRE(first == encodeOutgoingRequest(request));
  REQUIRE(first.find('\n') == string::npos);
  REQUIRE(json::parse(first)["params"] ==
          json::array({"\"", "\\", "\n", "é"}));
}

TEST_CASE("The wire layer lays fields out in params order",
          "[OutgoingRequest]") {
  wire::RawOutgoingRequest raw =
      wire::toRawOutgoingRequest(outgoing::MousePress{"middle", 7, 3});
  REQUIRE(std::holds_alternative<wire::RawMousePress>(raw));
  const auto& press = std::get<wire::RawMousePress>(raw);
  REQUIRE(std::get<0>(press.params) == "middle");
  REQUIRE(std::get<1>(press.params) == 7);
  REQUIRE(std::get<2>(press.params) == 3);

  JsonRpcEnvelope envelope = wire::encodeRawOutgoingRequest(raw);
  REQUIRE(envelope.getMethod() == "mouse_press");
  REQUIRE(envelope.getVersion() == "2.0");
  REQUIRE(envelope.getParams() == json::array({"middle", 7, 3}));
}

TEST_CASE("Outgoing method names follow the variant order",
          "[OutgoingRequest]") {
  REQUIRE(outgoingMethodName(outgoing::Keys{}) == "keys");
  REQUIRE(outgoingMethodName(outgoing::Resize{}) == "resize");
  REQUIRE(outgoingMethodName(outgoing::Scroll{}) == "scroll");
  REQUIRE(outgoingMethodName(outgoing::MouseMove{}) == "mouse_move");
  REQUIRE(outgoingMethodName(outgoing::MousePress{}) == "mouse_press");
  REQUIRE(outgoingMethodName(outgoing::MouseRelease{}) == "mouse_release");
  REQUIRE(outgoingMethodName(outgoing::MenuSelect{}) == "menu_select");
}

TEST_CASE("describeOutgoingRequest", "[OutgoingRequest]") {
  REQUIRE(describeOutgoingRequest(outgoing::Keys{{"a", "<ret>"}}) ==
          "keys keys=[a,<ret>]");
  REQUIRE(describeOutgoingRequest(outgoing::Resize{24, 80}) ==
          "resize rows=24 columns=80");
  REQUIRE(describeOutgoingRequest(outgoing::MouseRelease{"left", 1, 2}) ==
          "mouse_release button=left line=1 column=2");
}
