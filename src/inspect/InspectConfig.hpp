#ifndef __KJUI_INSPECT_CONFIG__
#define __KJUI_INSPECT_CONFIG__

#include "Headers.hpp"

namespace kjui {
/**
 * @brief Settings of the inspector. Filled from the [Debug] section of the
 * config file, then overridden by command line flags.
 */
struct InspectConfig {
  int verbose = 0;
  bool silent = false;
  bool logToStdout = false;
  string logDirectory;
  // default max log file size is 20MB
  string maxLogSize = "20971520";
};

/**
 * @brief Reads `verbose`, `silent`, `logdirectory` and `logsize` from the
 * [Debug] section of an INI file. Keys that are absent keep their value.
 * @return false if the file cannot be loaded or a number is unreadable.
 */
bool loadInspectConfigFile(const string& path, InspectConfig* config);
}  // namespace kjui

#endif  // __KJUI_INSPECT_CONFIG__
