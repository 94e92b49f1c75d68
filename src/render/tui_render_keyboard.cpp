#include "tui_render.hpp"
#include "ftxui/component/event.hpp"

using namespace ftxui;

namespace connmgr_tui {

namespace {

bool is_any_char(const Event &event, const char *chars) {
  if (!event.is_character())
    return false;
  for (const char *c = chars; *c; ++c) {
    if (event == Event::Character(*c))
      return true;
  }
  return false;
}

} // namespace

InputKey translate_event(const Event &event) {
  if (event == Event::ArrowUp || is_any_char(event, "kK"))
    return InputKey::Up;
  if (event == Event::ArrowDown || is_any_char(event, "jJ"))
    return InputKey::Down;
  if (event == Event::ArrowLeft || is_any_char(event, "hH"))
    return InputKey::Left;
  if (event == Event::ArrowRight || is_any_char(event, "lL"))
    return InputKey::Right;
  if (event == Event::Return)
    return InputKey::Enter;
  if (event == Event::Escape)
    return InputKey::Escape;
  if (event == Event::Character(' '))
    return InputKey::Space;
  if (is_any_char(event, "qQ"))
    return InputKey::Quit;
  if (is_any_char(event, "yY"))
    return InputKey::Yes;
  if (is_any_char(event, "nN"))
    return InputKey::No;
  return InputKey::Other;
}

// ==================== 键盘事件处理 ====================

bool UIRenderer::handle_keyboard_event(const Event &event,
                                       const std::function<void()> &exit_loop) {
  // 鼠标事件不参与导航
  if (event.is_mouse())
    return is_confirm_pending(context_.mode);

  const InputKey key = translate_event(event);
  switch (dispatch_input(context_, key)) {
  case DispatchResult::QuitRequested:
    exit_loop();
    return true;
  case DispatchResult::Ignored:
    return false;
  case DispatchResult::Unchanged:
  case DispatchResult::Swallowed:
  case DispatchResult::Updated:
    break;
  }
  return true;
}

} // namespace connmgr_tui
