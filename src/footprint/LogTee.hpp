#pragma once

#include <filesystem>
#include <memory>
#include <string>

namespace footprint {

// RAII helper that copies console output into a log file.
//
// Diagnostics (Log.hpp) go to std::cerr and reports may go to std::cout; while a LogTee
// is active both keep reaching the console and are also appended to `path`, each file
// line prefixed with a UTC timestamp and the stream tag:
//
//   2026-03-02T09:14:55.120Z [ERR] [footprint:WARN] walls: building height not found
//
// Existing logs rotate before the new file is opened: log -> log.1 -> log.2 ...

struct LogTeeOptions {
  std::filesystem::path path;

  // Rotated backups to keep. 0 truncates the existing file instead.
  int keepFiles = 3;

  bool teeStdout = true;
  bool teeStderr = true;

  // Timestamp + stream tag at the start of each file line (console output is untouched).
  bool prefixLines = true;
};

class LogTee {
public:
  LogTee();
  ~LogTee();

  LogTee(const LogTee&) = delete;
  LogTee& operator=(const LogTee&) = delete;

  // Stops a previous session first.
  bool start(const LogTeeOptions& opt, std::string& outError);

  // Restores the original stream buffers and closes the file.
  void stop();

  bool active() const { return m_impl != nullptr; }

  // base -> base.1 -> ... -> base.keepFiles (the oldest is dropped).
  static bool Rotate(const std::filesystem::path& basePath, int keepFiles, std::string& outError);

private:
  struct Impl;
  std::unique_ptr<Impl> m_impl;
};

} // namespace footprint
