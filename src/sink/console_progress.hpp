#pragma once

#include <mutex>
#include <ostream>
#include <string_view>

#include "excode/generator/progress.hpp"

namespace excode::app {

// Writes '+' for an accepted candidate and '.' for a rejected one.
class ConsoleProgress final : public IProgressSink {
 public:
  explicit ConsoleProgress(std::ostream& out);

  ConsoleProgress(const ConsoleProgress&) = delete;
  ConsoleProgress& operator=(const ConsoleProgress&) = delete;

  void on_attempt(std::string_view prefix, bool accepted) noexcept override;

 private:
  std::ostream& out_;
  std::mutex mu_;
};

}  // namespace excode::app
