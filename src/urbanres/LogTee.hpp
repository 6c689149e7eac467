#pragma once

#include <filesystem>
#include <memory>
#include <string>

namespace urbanres {

// Mirrors std::cout / std::cerr into a log file for the lifetime of a LogTee.
//
// The command-line tools report progress on stdout and diagnostics (including analyzer
// cleanup drift) on stderr. Batch runs lose the console, so --log keeps a copy of both.
//
// Console output is untouched. Log file lines optionally get a UTC timestamp and a
// stream tag:
//   2026-03-02T09:14:55.120Z [ERR] route: no path (expansion_limit)
//
// Existing logs rotate as <log> -> <log>.1 -> ... -> <log>.<keepFiles>.

struct LogTeeOptions {
  std::filesystem::path path;

  int keepFiles = 3; // 0 truncates the existing log instead of rotating

  bool teeStdout = true;
  bool teeStderr = true;

  bool prefixLines = true;
  bool prefixThreadId = false; // adds [t=0x...] after the stream tag
};

class LogTee {
public:
  LogTee();
  LogTee(const LogTeeOptions& opt, std::string& outError);
  ~LogTee();

  LogTee(const LogTee&) = delete;
  LogTee& operator=(const LogTee&) = delete;

  // Restarts when already active.
  bool start(const LogTeeOptions& opt, std::string& outError);

  // Restores the original stream buffers.
  void stop();

  bool active() const { return m_impl != nullptr; }
  const std::filesystem::path& path() const;

  static std::filesystem::path RotatedPath(const std::filesystem::path& base, int index);
  static bool Rotate(const std::filesystem::path& basePath, int keepFiles, std::string& outError);

private:
  struct Impl;
  std::unique_ptr<Impl> m_impl;
};

} // namespace urbanres
