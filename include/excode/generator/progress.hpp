#pragma once

#include <string_view>

namespace excode {

// Receives one notification per candidate drawn by the generator.
class IProgressSink {
 public:
  virtual ~IProgressSink() = default;

  virtual void on_attempt(std::string_view prefix, bool accepted) noexcept = 0;
};

class NullProgress final : public IProgressSink {
 public:
  void on_attempt(std::string_view, bool) noexcept override {}
};

}  // namespace excode
