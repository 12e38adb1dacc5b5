#include "InspectConfig.hpp"

#include "SimpleIni.h"

namespace kjui {
bool loadInspectConfigFile(const string& path, InspectConfig* config) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(path.c_str());
  if (rc < 0) {
    LOG(ERROR) << "Cannot load config file " << path << ": " << rc;
    return false;
  }

  try {
    const char* vlevel = ini.GetValue("Debug", "verbose", NULL);
    if (vlevel) {
      config->verbose = stoi(vlevel);
    }
    const char* silent = ini.GetValue("Debug", "silent", NULL);
    if (silent) {
      config->silent = stoi(silent) != 0;
    }
    const char* logsize = ini.GetValue("Debug", "logsize", NULL);
    if (logsize && stoi(logsize) != 0) {
      // make sure maxlogsize is a string of int value
      config->maxLogSize = std::to_string(stoi(logsize));
    }
  } catch (const std::logic_error& le) {
    LOG(ERROR) << "Invalid number in config file " << path << ": " << le.what();
    return false;
  }

  const char* logDirectory = ini.GetValue("Debug", "logdirectory", NULL);
  if (logDirectory) {
    config->logDirectory = string(logDirectory);
  }
  return true;
}
}  // namespace kjui
