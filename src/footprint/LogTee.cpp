#include "footprint/LogTee.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <iostream>
#include <mutex>
#include <system_error>

namespace footprint {

namespace {

std::filesystem::path RotatedPath(const std::filesystem::path& base, int idx)
{
  if (idx <= 0) return base;
  std::filesystem::path p = base;
  p += "." + std::to_string(idx);
  return p;
}

std::string UtcTimestamp()
{
  using clock = std::chrono::system_clock;
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(clock::now().time_since_epoch());
  const auto sec = std::chrono::duration_cast<std::chrono::seconds>(ms);

  const std::time_t tt = static_cast<std::time_t>(sec.count());
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &tt);
#else
  gmtime_r(&tt, &tm);
#endif

  char buf[40];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03lldZ", tm.tm_year + 1900, tm.tm_mon + 1,
                tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<long long>((ms - sec).count()));
  return buf;
}

// State shared by the stdout and stderr buffers: one file, one lock, one line cursor.
struct SharedFile {
  std::ofstream file;
  std::mutex mutex;
  bool atLineStart = true;
  bool prefixLines = true;
};

// Forwards every write to the console buffer and, line-prefixed, to the shared file.
class TeeBuf final : public std::streambuf {
public:
  TeeBuf(std::streambuf* console, SharedFile* shared, const char* tag)
      : m_console(console)
      , m_shared(shared)
      , m_tag(tag)
  {
  }

protected:
  int overflow(int ch) override
  {
    if (ch == traits_type::eof()) return traits_type::not_eof(ch);
    const char c = static_cast<char>(ch);
    return xsputn(&c, 1) == 1 ? ch : traits_type::eof();
  }

  std::streamsize xsputn(const char* s, std::streamsize n) override
  {
    if (n <= 0) return 0;
    std::lock_guard<std::mutex> lock(m_shared->mutex);

    const std::streamsize written = m_console->sputn(s, n);
    writeFileLocked(s, n);
    return written;
  }

  int sync() override
  {
    std::lock_guard<std::mutex> lock(m_shared->mutex);
    m_shared->file.flush();
    return m_console->pubsync();
  }

private:
  void writeFileLocked(const char* s, std::streamsize n)
  {
    std::ofstream& f = m_shared->file;
    for (std::streamsize i = 0; i < n; ++i) {
      if (m_shared->atLineStart && m_shared->prefixLines) {
        f << UtcTimestamp() << " [" << m_tag << "] ";
      }
      m_shared->atLineStart = false;
      f.put(s[i]);
      if (s[i] == '\n') {
        m_shared->atLineStart = true;
        // Flush per line so the log survives a crash right after a diagnostic.
        f.flush();
      }
    }
  }

  std::streambuf* m_console = nullptr;
  SharedFile* m_shared = nullptr;
  const char* m_tag = "";
};

} // namespace

struct LogTee::Impl {
  SharedFile shared;

  std::streambuf* origCout = nullptr;
  std::streambuf* origCerr = nullptr;
  std::unique_ptr<TeeBuf> coutBuf;
  std::unique_ptr<TeeBuf> cerrBuf;
};

LogTee::LogTee() = default;

LogTee::~LogTee()
{
  stop();
}

bool LogTee::Rotate(const std::filesystem::path& basePath, int keepFiles, std::string& outError)
{
  outError.clear();
  if (keepFiles <= 0) return true;

  std::error_code ec;
  for (int i = keepFiles; i >= 1; --i) {
    const std::filesystem::path src = RotatedPath(basePath, i - 1);
    const std::filesystem::path dst = RotatedPath(basePath, i);
    if (!std::filesystem::exists(src, ec)) continue;

    std::filesystem::remove(dst, ec);
    std::filesystem::rename(src, dst, ec);
    if (ec) {
      outError = "failed to rotate log '" + src.string() + "' -> '" + dst.string() + "': " + ec.message();
      return false;
    }
  }
  return true;
}

bool LogTee::start(const LogTeeOptions& opt, std::string& outError)
{
  outError.clear();
  stop();

  if (opt.path.empty()) {
    outError = "log path is empty";
    return false;
  }

  const std::filesystem::path parent = opt.path.parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      outError = "failed to create log directory '" + parent.string() + "': " + ec.message();
      return false;
    }
  }

  if (!Rotate(opt.path, opt.keepFiles, outError)) return false;

  auto impl = std::make_unique<Impl>();
  impl->shared.prefixLines = opt.prefixLines;
  impl->shared.file.open(opt.path, std::ios::out | std::ios::binary | std::ios::trunc);
  if (!impl->shared.file) {
    outError = "unable to open log file for writing: " + opt.path.string();
    return false;
  }

  if (opt.teeStdout) {
    impl->origCout = std::cout.rdbuf();
    impl->coutBuf = std::make_unique<TeeBuf>(impl->origCout, &impl->shared, "OUT");
    std::cout.rdbuf(impl->coutBuf.get());
  }
  if (opt.teeStderr) {
    impl->origCerr = std::cerr.rdbuf();
    impl->cerrBuf = std::make_unique<TeeBuf>(impl->origCerr, &impl->shared, "ERR");
    std::cerr.rdbuf(impl->cerrBuf.get());
  }

  m_impl = std::move(impl);
  return true;
}

void LogTee::stop()
{
  if (!m_impl) return;

  // Restore the console first so logging during teardown never reaches a closed file.
  if (m_impl->coutBuf && std::cout.rdbuf() == m_impl->coutBuf.get()) std::cout.rdbuf(m_impl->origCout);
  if (m_impl->cerrBuf && std::cerr.rdbuf() == m_impl->cerrBuf.get()) std::cerr.rdbuf(m_impl->origCerr);

  m_impl->shared.file.flush();
  m_impl.reset();
}

} // namespace footprint
