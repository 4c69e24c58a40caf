#pragma once

#include <iostream>
#include <string>

namespace devlaunch::launch {

// Blocks until the operator acknowledges, keeping the console window open
// after the launcher finishes.
class IOperatorPrompt {
public:
  virtual ~IOperatorPrompt() = default;
  virtual void acknowledge(const std::string &message) = 0;
};

class ConsolePrompt : public IOperatorPrompt {
public:
  ConsolePrompt(std::istream &in = std::cin, std::ostream &out = std::cerr)
      : in_(in), out_(out) {}

  void acknowledge(const std::string &message) override {
    out_ << message << std::flush;
    std::string ignored;
    std::getline(in_, ignored);
  }

private:
  std::istream &in_;
  std::ostream &out_;
};

class NoPausePrompt : public IOperatorPrompt {
public:
  void acknowledge(const std::string &) override {}
};

} // namespace devlaunch::launch
