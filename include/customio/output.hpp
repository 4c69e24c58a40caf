#pragma once

#include <boost/log/trivial.hpp>

#include <cstddef>
#include <mutex>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <utility>

namespace customio {

// A single log line. Text is buffered while the expression is built and
// written (prefixed, under the owner's mutex) when the stream is destroyed.
// Enabled streams may also forward the line to Boost.Log.
class LogStream {
public:
  static LogStream make_enabled(
      std::ostream &os, std::string prefix, std::mutex &mutex,
      std::optional<boost::log::trivial::severity_level> forward =
          std::nullopt) {
    LogStream ls;
    ls.os_ = &os;
    ls.prefix_ = std::move(prefix);
    ls.mutex_ = &mutex;
    ls.forward_ = forward;
    return ls;
  }

  // Nothing reaches the console; the line still goes to Boost.Log.
  static LogStream
  make_forward_only(boost::log::trivial::severity_level forward) {
    LogStream ls;
    ls.forward_ = forward;
    return ls;
  }

  LogStream(LogStream &&other) noexcept
      : os_(other.os_), prefix_(std::move(other.prefix_)),
        mutex_(other.mutex_), forward_(other.forward_),
        buffer_(std::move(other.buffer_)) {
    other.os_ = nullptr;
    other.forward_.reset();
  }
  LogStream &operator=(LogStream &&) = delete;
  LogStream(const LogStream &) = delete;
  LogStream &operator=(const LogStream &) = delete;

  ~LogStream();

  bool enabled() const { return os_ != nullptr; }

  template <typename T> LogStream &operator<<(const T &v) {
    if (os_ || forward_) {
      buffer_ << v;
    }
    return *this;
  }

  using Manip = std::ostream &(*)(std::ostream &);
  LogStream &operator<<(Manip m) {
    if (os_ || forward_) {
      m(buffer_);
    }
    return *this;
  }

private:
  LogStream() = default;

  std::ostream *os_{nullptr};
  std::string prefix_;
  std::mutex *mutex_{nullptr};
  std::optional<boost::log::trivial::severity_level> forward_;
  std::ostringstream buffer_;
};

class IOutput {
public:
  virtual ~IOutput() = default;

  virtual LogStream trace() = 0;
  virtual LogStream debug() = 0;
  virtual LogStream info() = 0;
  virtual LogStream warning() = 0;
  virtual LogStream error() = 0;

  // Plain operator-facing output (the resolved identifier is echoed here).
  virtual std::ostream &stream() = 0;
  virtual std::ostream &err_stream() = 0;
  virtual std::size_t verbosity() const = 0;
};

// Console implementation: levels up to `verbosity` are printed to stderr
// (5 = trace ... 1 = error, 0 = silent); every line is forwarded to
// Boost.Log regardless of console verbosity.
class ConsoleLogOutput : public IOutput {
public:
  explicit ConsoleLogOutput(std::size_t verbosity);

  LogStream trace() override;
  LogStream debug() override;
  LogStream info() override;
  LogStream warning() override;
  LogStream error() override;

  std::ostream &stream() override;
  std::ostream &err_stream() override;
  std::size_t verbosity() const override { return verbosity_; }

private:
  LogStream make(std::size_t level, const char *prefix,
                 boost::log::trivial::severity_level severity);

  std::size_t verbosity_;
  std::mutex mutex_;
};

} // namespace customio
