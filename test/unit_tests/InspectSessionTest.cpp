#include "InspectConfig.hpp"
#include "InspectSession.hpp"

#include "TestHeaders.hpp"

using namespace kjui;

namespace {
const string MENU_SELECT =
    R"({"jsonrpc":"2.0","method":"menu_select","params":[1]})";
const string REFRESH = R"({"jsonrpc":"2.0","method":"refresh","params":[false]})";
const string BAD_COLOR =
    R"({"jsonrpc":"2.0","method":"draw_status","params":[[],[],{"fg":"nope","bg":"default","attributes":[]}]})";

string writeTempFile(const string& contents) {
  string tmpPath = GetTempDirectory() + string("kjui_test_XXXXXXXX");
  int fd = ::mkstemp(&tmpPath[0]);
  FATAL_FAIL(fd);
  ::close(fd);
  std::ofstream out(tmpPath);
  out << contents;
  return tmpPath;
}
}  // namespace

TEST_CASE("InspectSession reports each line", "[InspectSession]") {
  std::ostringstream out;
  InspectSession session(out);

  REQUIRE(session.processLine(MENU_SELECT, 1));
  REQUIRE(out.str() == "1: menu_select selected=1\n");

  SECTION("Failures are reported and counted") {
    REQUIRE_FALSE(session.processLine(BAD_COLOR, 2));
    REQUIRE_THAT(out.str(),
                 Catch::Matchers::Contains("2: error InvalidColor: "));
    REQUIRE(session.getDecodedCount() == 1);
    REQUIRE(session.getFailedCount() == 1);
  }

  SECTION("Blank lines and carriage returns") {
    REQUIRE(session.processLine("", 2));
    REQUIRE(session.processLine("   \t", 3));
    REQUIRE(session.processLine(REFRESH + "\r", 4));
    REQUIRE(session.getDecodedCount() == 2);
    REQUIRE(session.getFailedCount() == 0);
    REQUIRE_THAT(out.str(), Catch::Matchers::EndsWith("4: refresh force=false\n"));
  }
}

TEST_CASE("InspectSession::run prints totals", "[InspectSession]") {
  std::ostringstream out;
  InspectSession session(out);

  SECTION("Clean capture") {
    std::istringstream in(MENU_SELECT + "\n" + REFRESH + "\n\n" + MENU_SELECT +
                          "\n");
    REQUIRE(session.run(in));
    REQUIRE(session.getMethodCounts().at("menu_select") == 2);
    REQUIRE(session.getMethodCounts().at("refresh") == 1);
    REQUIRE_THAT(out.str(),
                 Catch::Matchers::EndsWith(
                     "decoded 3 messages, 0 failed (menu_select=2, "
                     "refresh=1)\n"));
  }

  SECTION("A bad line does not stop the capture") {
    std::istringstream in(BAD_COLOR + "\nnot json\n" + REFRESH);
    REQUIRE_FALSE(session.run(in));
    REQUIRE(session.getDecodedCount() == 1);
    REQUIRE(session.getFailedCount() == 2);
    REQUIRE_THAT(out.str(), Catch::Matchers::Contains(
                                "2: error MalformedMessage: Invalid JSON"));
    REQUIRE_THAT(out.str(), Catch::Matchers::Contains("3: refresh force=false"));
    REQUIRE_THAT(out.str(), Catch::Matchers::EndsWith(
                                "decoded 1 messages, 2 failed (refresh=1)\n"));
  }

  SECTION("Empty capture") {
    std::istringstream in("");
    REQUIRE(session.run(in));
    REQUIRE(out.str() == "decoded 0 messages, 0 failed\n");
  }
}

TEST_CASE("parseResizeArgument", "[InspectSession]") {
  REQUIRE(parseResizeArgument("24x80") == outgoing::Resize{24, 80});
  REQUIRE(parseResizeArgument("0x4294967295") ==
          outgoing::Resize{0, 4294967295u});

  for (const string& arg : {"", "x", "24", "24x", "x80", "24x80x", "-1x80",
                            "24X80", "24x 80", "4294967296x1"}) {
    INFO("Checking argument '" << arg << "'");
    REQUIRE_THROWS_AS(parseResizeArgument(arg), std::runtime_error);
  }
}

TEST_CASE("parseKeysArgument", "[InspectSession]") {
  REQUIRE(parseKeysArgument("i h i <esc>").keys ==
          vector<string>{"i", "h", "i", "<esc>"});
  REQUIRE(parseKeysArgument("  <c-x>   q ").keys ==
          vector<string>{"<c-x>", "q"});
  REQUIRE(parseKeysArgument("").keys.empty());
}

TEST_CASE("loadInspectConfigFile", "[InspectSession]") {
  SECTION("Reads the Debug section") {
    string path = writeTempFile(
        "[Debug]\nverbose = 3\nsilent = 1\nlogsize = 1024\n"
        "logdirectory = /tmp/kjui-logs\n");
    InspectConfig config;
    REQUIRE(loadInspectConfigFile(path, &config));
    REQUIRE(config.verbose == 3);
    REQUIRE(config.silent);
    REQUIRE(config.maxLogSize == "1024");
    REQUIRE(config.logDirectory == "/tmp/kjui-logs");
    fs::remove(path);
  }

  SECTION("Absent keys keep their defaults") {
    string path = writeTempFile("[Debug]\nverbose = 1\n");
    InspectConfig config;
    REQUIRE(loadInspectConfigFile(path, &config));
    REQUIRE(config.verbose == 1);
    REQUIRE_FALSE(config.silent);
    REQUIRE(config.maxLogSize == "20971520");
    REQUIRE(config.logDirectory.empty());
    fs::remove(path);
  }

  SECTION("Unreadable numbers fail") {
    string path = writeTempFile("[Debug]\nverbose = loud\n");
    InspectConfig config;
    REQUIRE_FALSE(loadInspectConfigFile(path, &config));
    fs::remove(path);
  }

  SECTION("Missing file fails") {
    InspectConfig config;
    REQUIRE_FALSE(
        loadInspectConfigFile("/nonexistent/kjui/inspect.ini", &config));
  }
}
