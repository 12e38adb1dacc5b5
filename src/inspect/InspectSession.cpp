#include "InspectSession.hpp"

namespace kjui {
bool InspectSession::processLine(const string& rawLine, int lineNumber) {
  string line = chompCarriageReturn(rawLine);
  if (isBlank(line)) {
    return true;
  }
  VLOG(1) << "Line " << lineNumber << ": " << line;
  try {
    IncomingRequest request = decodeIncomingRequest(line);
    decoded++;
    methodCounts[incomingMethodName(request)]++;
    out << lineNumber << ": " << describeIncomingRequest(request) << endl;
    return true;
  } catch (const CodecException& ce) {
    failed++;
    LOG(WARNING) << "Could not decode line " << lineNumber << " ("
                 << errorKindName(ce.getKind()) << "): " << ce.what();
    out << lineNumber << ": error " << errorKindName(ce.getKind()) << ": "
        << ce.what() << endl;
    return false;
  }
}

bool InspectSession::run(std::istream& in) {
  string line;
  int lineNumber = 0;
  while (std::getline(in, line)) {
    lineNumber++;
    processLine(line, lineNumber);
  }
  out << "decoded " << decoded << " messages, " << failed << " failed";
  if (!methodCounts.empty()) {
    out << " (";
    bool first = true;
    for (const auto& it : methodCounts) {
      out << (first ? "" : ", ") << it.first << "=" << it.second;
      first = false;
    }
    out << ")";
  }
  out << endl;
  LOG(INFO) << "Inspected " << lineNumber << " lines: " << decoded
            << " decoded, " << failed << " failed";
  return failed == 0;
}

outgoing::Resize parseResizeArgument(const string& arg) {
  size_t separator = arg.find('x');
  vector<string> tokens;
  if (separator != string::npos) {
    tokens.push_back(arg.substr(0, separator));
    tokens.push_back(arg.substr(separator + 1));
  }
  if (tokens.size() != 2 || tokens[0].empty() || tokens[1].empty() ||
      tokens[0].find_first_not_of("0123456789") != string::npos ||
      tokens[1].find_first_not_of("0123456789") != string::npos) {
    throw std::runtime_error("Resize argument must look like ROWSxCOLUMNS: '" +
                             arg + "'");
  }
  outgoing::Resize resize;
  try {
    unsigned long rows = stoul(tokens[0]);
    unsigned long columns = stoul(tokens[1]);
    if (rows > std::numeric_limits<uint32_t>::max() ||
        columns > std::numeric_limits<uint32_t>::max()) {
      throw std::out_of_range("resize");
    }
    resize.rows = uint32_t(rows);
    resize.columns = uint32_t(columns);
  } catch (const std::logic_error& le) {
    throw std::runtime_error("Invalid resize argument '" + arg +
                             "': " + le.what());
  }
  return resize;
}

outgoing::Keys parseKeysArgument(const string& arg) {
  outgoing::Keys keys;
  for (const auto& key : split(arg, ' ')) {
    if (!key.empty()) {
      keys.keys.push_back(key);
    }
  }
  return keys;
}
}  // namespace kjui
