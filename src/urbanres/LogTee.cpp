#include "urbanres/LogTee.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <fstream>
#include <functional>
#include <iostream>
#include <mutex>
#include <sstream>
#include <system_error>
#include <thread>

namespace urbanres {

namespace {

// State shared by the stdout and stderr tees: one file, one line-start flag, one lock.
struct LogFileSink {
  std::ofstream file;
  std::mutex mutex;
  bool atLineStart = true;
  bool prefixLines = true;
  bool prefixThreadId = false;
};

std::string UtcTimestamp()
{
  const auto now = std::chrono::system_clock::now();
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch());
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
  return std::string(buf);
}

class TeeBuf final : public std::streambuf {
public:
  TeeBuf(std::streambuf* console, LogFileSink* sink, const char* tag)
      : m_console(console)
      , m_sink(sink)
      , m_tag(tag)
  {
  }

protected:
  int overflow(int ch) override
  {
    if (ch == traits_type::eof()) return traits_type::not_eof(ch);
    const char c = static_cast<char>(ch);
    return (xsputn(&c, 1) == 1) ? ch : traits_type::eof();
  }

  std::streamsize xsputn(const char* s, std::streamsize n) override
  {
    if (!m_console || !m_sink || n <= 0) return 0;
    std::lock_guard<std::mutex> lock(m_sink->mutex);

    const std::streamsize toConsole = m_console->sputn(s, n);
    const std::streamsize toFile = writeFileLocked(s, n);
    return std::min(toConsole, toFile);
  }

  int sync() override
  {
    if (!m_console || !m_sink) return 0;
    std::lock_guard<std::mutex> lock(m_sink->mutex);
    const int rc = m_console->pubsync();
    const int rf = m_sink->file.rdbuf()->pubsync();
    return (rc == 0 && rf == 0) ? 0 : -1;
  }

private:
  std::string prefix() const
  {
    std::ostringstream oss;
    oss << UtcTimestamp() << " [" << m_tag << "]";
    if (m_sink->prefixThreadId) {
      oss << " [t=0x" << std::hex << std::hash<std::thread::id>{}(std::this_thread::get_id()) << std::dec << "]";
    }
    oss << ' ';
    return oss.str();
  }

  std::streamsize writeFileLocked(const char* s, std::streamsize n)
  {
    std::streambuf* file = m_sink->file.rdbuf();
    if (!m_sink->prefixLines) return std::min(file->sputn(s, n), n);

    std::streamsize written = 0;
    const char* p = s;
    const char* end = s + n;
    while (p < end) {
      if (m_sink->atLineStart) {
        const std::string pre = prefix();
        if (file->sputn(pre.data(), static_cast<std::streamsize>(pre.size())) !=
            static_cast<std::streamsize>(pre.size())) {
          return written;
        }
        m_sink->atLineStart = false;
      }

      const char* nl = static_cast<const char*>(std::memchr(p, '\n', static_cast<std::size_t>(end - p)));
      const std::streamsize chunk = nl ? static_cast<std::streamsize>(nl - p + 1) : static_cast<std::streamsize>(end - p);
      const std::streamsize wr = file->sputn(p, chunk);
      if (wr <= 0) return written;
      written += std::min(wr, chunk);
      if (wr < chunk) return written;

      if (nl) {
        // Flushed per line so the log survives a crash right after a diagnostic.
        m_sink->atLineStart = true;
        file->pubsync();
      }
      p += chunk;
    }
    return written;
  }

  std::streambuf* m_console = nullptr;
  LogFileSink* m_sink = nullptr;
  const char* m_tag = "";
};

} // namespace

struct LogTee::Impl {
  std::filesystem::path path;
  LogFileSink sink;

  std::streambuf* origCout = nullptr;
  std::streambuf* origCerr = nullptr;
  std::unique_ptr<TeeBuf> coutBuf;
  std::unique_ptr<TeeBuf> cerrBuf;
};

LogTee::LogTee() = default;

LogTee::LogTee(const LogTeeOptions& opt, std::string& outError)
{
  start(opt, outError);
}

LogTee::~LogTee()
{
  stop();
}

const std::filesystem::path& LogTee::path() const
{
  static const std::filesystem::path kNone;
  return m_impl ? m_impl->path : kNone;
}

std::filesystem::path LogTee::RotatedPath(const std::filesystem::path& base, int index)
{
  if (index <= 0) return base;
  std::filesystem::path p = base;
  p += "." + std::to_string(index);
  return p;
}

bool LogTee::Rotate(const std::filesystem::path& basePath, int keepFiles, std::string& outError)
{
  outError.clear();
  if (keepFiles <= 0) return true;

  for (int i = keepFiles; i >= 1; --i) {
    const std::filesystem::path src = RotatedPath(basePath, i - 1);
    const std::filesystem::path dst = RotatedPath(basePath, i);

    std::error_code ec;
    if (!std::filesystem::exists(src, ec)) continue;

    std::filesystem::remove(dst, ec);
    ec.clear();
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

  std::unique_ptr<Impl> impl = std::make_unique<Impl>();
  impl->path = opt.path;
  impl->sink.prefixLines = opt.prefixLines;
  impl->sink.prefixThreadId = opt.prefixThreadId;
  impl->sink.file.open(opt.path, std::ios::out | std::ios::binary | std::ios::trunc);
  if (!impl->sink.file) {
    outError = "unable to open log file for writing: " + opt.path.string();
    return false;
  }

  if (opt.teeStdout) {
    impl->origCout = std::cout.rdbuf();
    impl->coutBuf = std::make_unique<TeeBuf>(impl->origCout, &impl->sink, "OUT");
    std::cout.rdbuf(impl->coutBuf.get());
  }
  if (opt.teeStderr) {
    impl->origCerr = std::cerr.rdbuf();
    impl->cerrBuf = std::make_unique<TeeBuf>(impl->origCerr, &impl->sink, "ERR");
    std::cerr.rdbuf(impl->cerrBuf.get());
  }

  m_impl = std::move(impl);
  return true;
}

void LogTee::stop()
{
  if (!m_impl) return;

  // Detach first so nothing written during teardown reaches a closed file.
  if (m_impl->coutBuf && std::cout.rdbuf() == m_impl->coutBuf.get()) std::cout.rdbuf(m_impl->origCout);
  if (m_impl->cerrBuf && std::cerr.rdbuf() == m_impl->cerrBuf.get()) std::cerr.rdbuf(m_impl->origCerr);

  m_impl->sink.file.flush();
  m_impl.reset();
}

} // namespace urbanres
