#include "core/confirmation_gate.hpp"
#include <spdlog/spdlog.h>

namespace connmgr_tui {

ConfirmationGate::ConfirmationGate(Mode &mode) : mode_(mode) {}

void ConfirmationGate::open() {
  if (is_active())
    return;
  ResumableMode previous = is_tree(mode_) ? ResumableMode{TreeMode{}} : ResumableMode{BrowsingMode{}};
  mode_ = ConfirmPendingMode{previous};
  spdlog::debug("[ConfirmationGate] Opened");
}

GateOutcome ConfirmationGate::handle(InputKey key) {
  switch (key) {
  case InputKey::Yes:
    confirm();
    return GateOutcome::Confirmed;
  case InputKey::No:
  case InputKey::Escape:
    cancel();
    return GateOutcome::Cancelled;
  default:
    return GateOutcome::Swallowed;
  }
}

void ConfirmationGate::confirm() {
  spdlog::info("[ConfirmationGate] Quit confirmed");
  if (quit_callback_)
    quit_callback_();
}

void ConfirmationGate::cancel() {
  const auto *pending = std::get_if<ConfirmPendingMode>(&mode_);
  if (!pending)
    return;
  if (std::holds_alternative<TreeMode>(pending->previous))
    mode_ = TreeMode{};
  else
    mode_ = BrowsingMode{};
  spdlog::debug("[ConfirmationGate] Cancelled, resumed {}", mode_label(mode_));
}

void ConfirmationGate::set_quit_callback(std::function<void()> callback) {
  quit_callback_ = std::move(callback);
}

} // namespace connmgr_tui
