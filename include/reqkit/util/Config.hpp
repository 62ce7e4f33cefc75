#pragma once

#include <cstddef>
#include <string>

namespace reqkit {
namespace util {

class Config {
public:
  // Construct with sensible defaults.
  Config() = default;

  // Load from a simple "key=value" file (unknown keys ignored).
  // Returns true if file read successfully (even if some keys are unknown).
  bool loadFromFile(const std::string& path);

  // Pushes logLevel / logJson / logFile into the global logger.
  void applyLogging() const;

  // --- Runtime ---
  unsigned    ioThreads       = 1;         // threads running the io_context
  unsigned    dispatchThreads = 2;         // workers running response callbacks

  // --- Transport defaults ---
  long        timeoutMs       = 30'000;    // used when a tree sets no timeout
  std::string userAgent       = "reqkit/1.0";
  std::size_t maxBodyBytes    = 8u * 1024u * 1024u;

  // --- Logging ---
  std::string logLevel        = "info";
  bool        logJson         = false;
  std::string logFile;                     // empty -> stdout

private:
  static bool parseLineKV(const std::string& line, std::string& k, std::string& v);
  static std::string trim(const std::string& s);
};

} // namespace util
} // namespace reqkit
