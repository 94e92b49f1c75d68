#include "tui_render.hpp"
#include "ftxui/component/component.hpp"
#include "ftxui/component/event.hpp"
#include "ftxui/component/screen_interactive.hpp"
#include "ftxui/dom/elements.hpp"
#include "terminal_guard.hpp"
#include <spdlog/spdlog.h>

using namespace ftxui;

namespace connmgr_tui {

namespace {

Element render_tree_row(const TreeRow &row, bool tree_active) {
  std::string indent(static_cast<size_t>(row.depth()) * 2, ' ');
  std::string marker = "  ";
  if (row.level != Level::Connection && row.has_children)
    marker = row.expanded ? "▼ " : "▶ ";

  Elements parts;
  parts.push_back(text(indent + marker));

  if (row.status) {
    Color status_color = Color::Red;
    if (*row.status == ConnectionStatus::Connected)
      status_color = Color::Green;
    else if (*row.status == ConnectionStatus::Connecting)
      status_color = Color::Yellow;
    parts.push_back(text("● ") | color(status_color));
  }

  Element label = text(row.label);
  if (row.level == Level::Project)
    label = label | bold;
  parts.push_back(label | flex);

  if (row.status)
    parts.push_back(text(std::string(" ") + status_label(*row.status) + " ") | color(Color::GrayLight));

  Element content = hbox(parts);
  if (tree_active && row.highlighted) {
    content = hbox({text("→") | color(Color::Yellow) | bold, content | flex}) |
              bgcolor(Color::RGB(80, 80, 80)) | focus;
  } else {
    content = hbox({text(" "), content | flex});
  }
  return content;
}

} // namespace

Element render_tree(const ViewSnapshot &snapshot) {
  if (snapshot.rows.empty())
    return text("没有可用的项目") | dim | center;

  Elements rows;
  for (const auto &row : snapshot.rows)
    rows.push_back(render_tree_row(row, snapshot.tree_active));
  return vbox(rows) | yframe;
}

UIRenderer::UIRenderer(AppContext &context) : context_(context) {}

int UIRenderer::run() {
  TerminalGuard guard;

  auto screen = ScreenInteractive::Fullscreen();
  auto component = create_component(screen.ExitLoopClosure());

  spdlog::info("[UIRenderer] Entering event loop");
  screen.Loop(component);
  spdlog::info("[UIRenderer] Event loop finished");

  return 0;
}

Component UIRenderer::create_component(std::function<void()> exit_loop) {
  auto renderer = Renderer([this] { return render_frame(build_view_snapshot(context_)); });

  return CatchEvent(renderer, [this, exit_loop](Event event) {
    return handle_keyboard_event(event, exit_loop);
  });
}

// ==================== 布局 ====================

Element UIRenderer::render_frame(const ViewSnapshot &snapshot) {
  Element main_view = vbox({
      render_module_bar(snapshot),
      render_main_panel(snapshot) | flex,
      render_status_bar(snapshot),
  });

  if (!snapshot.confirm_visible)
    return main_view;

  // 确认框居中覆盖，底层界面变暗
  return dbox({main_view | dim, render_confirm_box() | clear_under | center});
}

Element UIRenderer::render_module_bar(const ViewSnapshot &snapshot) {
  Elements tabs;
  tabs.push_back(text("  "));
  for (size_t i = 0; i < snapshot.tabs.size(); ++i) {
    const auto &tab = snapshot.tabs[i];
    if (i > 0)
      tabs.push_back(text("  "));

    Element label = text(" " + tab.name + " ");
    if (tab.current) {
      label = label | bold | color(Color::White) | bgcolor(Color::Blue);
    }
    if (tab.hovered && !snapshot.tree_active) {
      label = label | underlined | color(Color::Yellow);
    }
    tabs.push_back(label);
  }

  Element bar = window(text("模块选择"), hbox(tabs));
  return snapshot.tree_active ? bar : bar | color(Color::Yellow);
}

Element UIRenderer::render_main_panel(const ViewSnapshot &snapshot) {
  Elements details;
  for (const auto &detail : snapshot.details) {
    details.push_back(text(detail) | dim);
  }

  Element panel = window(text("主要内容"), vbox({
                                               text(snapshot.title) | bold | color(Color::Yellow),
                                               separator(),
                                               render_tree(snapshot) | flex,
                                               separator(),
                                               vbox(details),
                                           }));
  return snapshot.tree_active ? panel | color(Color::Yellow) : panel;
}

Element UIRenderer::render_status_bar(const ViewSnapshot &snapshot) {
  std::string current_module;
  for (const auto &tab : snapshot.tabs) {
    if (tab.current)
      current_module = tab.name;
  }

  Elements line = {
      text("状态: " + snapshot.mode_text) | color(Color::Yellow),
      text(" | "),
      text("当前模块: " + current_module) | color(Color::Blue),
      text(" | "),
      text(snapshot.key_hint) | color(Color::GrayLight),
  };
  Elements rows = {hbox(line)};
  if (!snapshot.status_message.empty())
    rows.push_back(text(snapshot.status_message) | color(Color::Green));

  return window(text("状态"), vbox(rows));
}

Element UIRenderer::render_confirm_box() {
  Element content = vbox({
      text(""),
      text("确定要退出程序吗？") | color(Color::Yellow) | center,
      text(""),
      hbox({text("Yes (Y)") | color(Color::Green), text("    "), text("No (N)") | color(Color::Red)}) |
          center,
  });
  return window(text("确认退出"), content) | color(Color::Yellow) | size(WIDTH, EQUAL, 40) |
         size(HEIGHT, EQUAL, 7);
}

} // namespace connmgr_tui
