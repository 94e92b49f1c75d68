#include "core/module_selector.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace connmgr_tui {

ModuleSelector::ModuleSelector(std::vector<Module> modules) : modules_(std::move(modules)) {
  if (modules_.empty())
    throw std::invalid_argument("module list must not be empty");
}

bool ModuleSelector::hover_previous() {
  if (hovered_ == 0)
    return false;
  --hovered_;
  return true;
}

bool ModuleSelector::hover_next() {
  if (hovered_ + 1 >= modules_.size())
    return false;
  ++hovered_;
  return true;
}

void ModuleSelector::commit() {
  current_ = hovered_;
  spdlog::debug("[ModuleSelector] Committed module {} ({})", modules_[current_].name, current_);
  if (commit_callback_)
    commit_callback_(modules_[current_]);
}

void ModuleSelector::set_commit_callback(std::function<void(const Module &)> callback) {
  commit_callback_ = std::move(callback);
}

} // namespace connmgr_tui
