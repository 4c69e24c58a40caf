#include "customio/output.hpp"

#include <iostream>

#include "util/my_logging.hpp"

namespace customio {

LogStream::~LogStream() {
  if (!os_ && !forward_) {
    return;
  }
  std::string line = buffer_.str();
  while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
    line.pop_back();
  }
  if (os_) {
    std::scoped_lock lock(*mutex_);
    (*os_) << prefix_ << line << '\n';
    os_->flush();
  }
  if (forward_ && !line.empty()) {
    auto &lg = devlaunch_logger::get();
    BOOST_LOG_SEV(lg, *forward_) << line;
  }
}

ConsoleLogOutput::ConsoleLogOutput(std::size_t verbosity)
    : verbosity_(verbosity) {}

LogStream ConsoleLogOutput::make(std::size_t level, const char *prefix,
                                 trivial::severity_level severity) {
  if (level > verbosity_) {
    return LogStream::make_forward_only(severity);
  }
  return LogStream::make_enabled(std::cerr, prefix, mutex_, severity);
}

LogStream ConsoleLogOutput::trace() {
  return make(5, "[trace]: ", trivial::trace);
}

LogStream ConsoleLogOutput::debug() {
  return make(4, "[debug]: ", trivial::debug);
}

LogStream ConsoleLogOutput::info() {
  return make(3, "[info]: ", trivial::info);
}

LogStream ConsoleLogOutput::warning() {
  return make(2, "[warning]: ", trivial::warning);
}

LogStream ConsoleLogOutput::error() {
  return make(1, "[error]: ", trivial::error);
}

std::ostream &ConsoleLogOutput::stream() { return std::cout; }

std::ostream &ConsoleLogOutput::err_stream() { return std::cerr; }

} // namespace customio
