#pragma once

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#ifdef _WIN32
#include <io.h>
#else
#include <unistd.h>
#endif

// ANSI color printer for operator-facing headlines. Colors are enabled
// automatically when the stream is a TTY and TERM is not "dumb".
//
//   customio::ColorPrinter cp;           // stderr
//   cp.red() << "runtime missing: " << path << std::endl;
//   cp.green("Setup finished");
//
// A muted printer swallows everything, colors and text alike.

namespace customio {

class ColorPrinter {
 public:
  // Emits the color code on construction and a reset on destruction.
  class ColorProxy {
   public:
    ColorProxy(std::ostream* os, const char* code, bool enabled)
        : os_(os), enabled_(enabled && os != nullptr) {
      if (enabled_) *os_ << code;
    }
    ~ColorProxy() {
      if (enabled_) *os_ << "\033[0m";
    }
    template <typename T>
    ColorProxy& operator<<(const T& v) {
      if (os_) *os_ << v;
      return *this;
    }
    using Manip = std::ostream& (*)(std::ostream&);
    ColorProxy& operator<<(Manip m) {
      if (os_) m(*os_);
      return *this;
    }

   private:
    std::ostream* os_;
    bool enabled_;
  };

  ColorPrinter()
    : stream_(&std::cerr), enable_colors_(detect_tty_for_stream(*stream_)) {}

  explicit ColorPrinter(bool enable_colors)
    : stream_(&std::cerr), enable_colors_(enable_colors) {}

  ColorPrinter(std::ostream& os, bool enable_colors)
    : stream_(&os), enable_colors_(enable_colors) {}

  bool enabled() const { return enable_colors_; }
  bool muted() const { return muted_; }
  void mute() { muted_ = true; }

  void red(const std::string& msg) { red() << msg << std::endl; }
  void green(const std::string& msg) { green() << msg << std::endl; }
  void yellow(const std::string& msg) { yellow() << msg << std::endl; }
  void cyan(const std::string& msg) { cyan() << msg << std::endl; }

  ColorProxy red() { return proxy("\033[31m"); }
  ColorProxy green() { return proxy("\033[32m"); }
  ColorProxy yellow() { return proxy("\033[33m"); }
  ColorProxy cyan() { return proxy("\033[36m"); }
  ColorProxy white() { return proxy("\033[37m"); }

 private:
  std::ostream* stream_;
  bool enable_colors_;
  bool muted_{false};

  ColorProxy proxy(const char* code) {
    return ColorProxy(muted_ ? nullptr : stream_, code, enable_colors_);
  }

  static bool detect_tty_for_stream(std::ostream& os) {
#if defined(_WIN32)
    if (&os == &std::cout) {
      return _isatty(_fileno(stdout)) != 0;
    } else if (&os == &std::cerr) {
      return _isatty(_fileno(stderr)) != 0;
    }
    return false;
#else
    bool is_tty = false;
    if (&os == &std::cout) {
      is_tty = ::isatty(fileno(stdout));
    } else if (&os == &std::cerr) {
      is_tty = ::isatty(fileno(stderr));
    }
    const char* term = std::getenv("TERM");
    bool term_ok = term && std::strcmp(term, "dumb") != 0;
    return is_tty && term_ok;
#endif
  }
};

} // namespace customio
