#include "tui_logic.hpp"
#include <iostream>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace connmgr_tui {

UILogic::UILogic(AppContext &context) : context_(context), renderer_(context) {}

int UILogic::run() {
  try {
    int code = renderer_.run();
    spdlog::info("[UILogic] Exit with code {} (quit confirmed: {})", code,
                 context_.quit_requested);
    return code;
  } catch (const std::exception &e) {
    spdlog::error("[UILogic] UI error: {}", e.what());
    std::cerr << "UI错误: " << e.what() << std::endl;
    return 1;
  }
}

} // namespace connmgr_tui
