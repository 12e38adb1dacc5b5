#ifndef __KJUI_INSPECT_SESSION__
#define __KJUI_INSPECT_SESSION__

#include "CodecException.hpp"
#include "Headers.hpp"
#include "IncomingRequest.hpp"
#include "OutgoingRequest.hpp"

namespace kjui {
/**
 * @brief Decodes a capture of Kakoune's JSON UI output, one message per
 * line, and writes a summary line per message to `out`.
 *
 * A line that fails to decode is reported and skipped; the session keeps
 * going so one bad message does not hide the rest of the capture.
 */
class InspectSession {
 public:
  explicit InspectSession(std::ostream& _out) : out(_out) {}

  /**
   * @brief Decodes and reports one line. Blank lines are ignored.
   * @param lineNumber 1-based position in the capture, used in reports.
   * @return false if the line failed to decode.
   */
  bool processLine(const string& line, int lineNumber);

  /** @brief Processes every line of `in` and prints the totals. */
  bool run(std::istream& in);

  int getDecodedCount() const { return decoded; }
  int getFailedCount() const { return failed; }
  /** @brief Number of decoded messages per method name. */
  const map<string, int>& getMethodCounts() const { return methodCounts; }

 protected:
  std::ostream& out;
  int decoded = 0;
  int failed = 0;
  map<string, int> methodCounts;
};

/**
 * @brief Parses a "ROWSxCOLUMNS" string such as "24x80".
 * @throws std::runtime_error on any other syntax.
 */
outgoing::Resize parseResizeArgument(const string& arg);

/** @brief Splits a space separated key list such as "i h i <esc>". */
outgoing::Keys parseKeysArgument(const string& arg);
}  // namespace kjui

#endif  // __KJUI_INSPECT_SESSION__
