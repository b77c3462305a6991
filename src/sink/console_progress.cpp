#include "sink/console_progress.hpp"

namespace excode::app {

ConsoleProgress::ConsoleProgress(std::ostream& out) : out_(out) {}

void ConsoleProgress::on_attempt(std::string_view, bool accepted) noexcept {
  std::scoped_lock lock(mu_);
  out_.put(accepted ? '+' : '.');
  // Ticks must show up as they happen; a slow group is only visible this way.
  out_.flush();
}

}  // namespace excode::app
