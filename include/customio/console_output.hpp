#pragma once
#include "customio/color_printer.hpp"
#include "customio/output.hpp"

namespace customio {

// Bundles the leveled logger with a color printer for operator headlines.
class ConsoleOutput {

  customio::IOutput &logger_;
  ColorPrinter printer_{};

public:
  // A logger at verbosity 0 (--silent) mutes the headlines as well.
  explicit ConsoleOutput(customio::IOutput &logger) : logger_(logger) {
    mute_if_silent();
  }
  ConsoleOutput(customio::IOutput &logger, bool enable_colors)
      : logger_(logger), printer_(enable_colors) {
    mute_if_silent();
  }
  ConsoleOutput(customio::IOutput &logger, ColorPrinter printer)
      : logger_(logger), printer_(printer) {
    mute_if_silent();
  }

  customio::IOutput &logger() { return logger_; }
  ColorPrinter &printer() { return printer_; }

private:
  void mute_if_silent() {
    if (logger_.verbosity() == 0) {
      printer_.mute();
    }
  }
};

} // namespace customio
