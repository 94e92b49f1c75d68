#include <gtest/gtest.h>
#include "ftxui/dom/elements.hpp"
#include "ftxui/dom/node.hpp"
#include "ftxui/screen/screen.hpp"
#include "test_helpers.hpp"
#include "tui_render.hpp"
#include <memory>

using namespace connmgr_tui;
using connmgr_tui::testing::shaped_catalog;

namespace {

std::string render_to_string(const ftxui::Element &element, int width, int height) {
    auto screen = ftxui::Screen::Create(ftxui::Dimension::Fixed(width), ftxui::Dimension::Fixed(height));
    ftxui::Render(screen, element);
    return screen.ToString();
}

/// mysql只有一个项目、一个环境，环境下有40个连接
std::unique_ptr<AppContext> make_long_context() {
    auto context = std::make_unique<AppContext>(std::make_unique<CatalogProvider>(shaped_catalog({{40}})));
    for (InputKey key : {InputKey::Right, InputKey::Enter, InputKey::Enter, InputKey::Enter})
        dispatch_input(*context, key);
    return context;
}

} // namespace

TEST(RenderTest, TreeScrollsToHighlightedRow) {
    auto context = make_long_context();
    for (int i = 0; i < 30; ++i)
        dispatch_input(*context, InputKey::Down);
    ASSERT_EQ(context->navigator.cursor().connection, 30u);

    std::string output = render_to_string(render_tree(build_view_snapshot(*context)), 60, 6);
    EXPECT_NE(output.find("conn-0-0-30 ("), std::string::npos);
    EXPECT_EQ(output.find("project-0"), std::string::npos);
}

TEST(RenderTest, TreeShowsTopWhenCursorNearStart) {
    auto context = make_long_context();
    std::string output = render_to_string(render_tree(build_view_snapshot(*context)), 60, 6);
    EXPECT_NE(output.find("project-0"), std::string::npos);
    EXPECT_NE(output.find("conn-0-0-0 ("), std::string::npos);
}

