#include <gtest/gtest.h>
#include "core/catalog_provider.hpp"
#include "tui_core.hpp"
#include <memory>

using namespace connmgr_tui;

namespace {

std::unique_ptr<AppContext> make_context() {
    return std::make_unique<AppContext>(std::make_unique<CatalogProvider>(CatalogData::builtin()));
}

void press(AppContext &context, std::initializer_list<InputKey> keys) {
    for (InputKey key : keys)
        dispatch_input(context, key);
}

} // namespace

TEST(DispatchTest, StartsBrowsingFirstModule) {
    auto context = make_context();
    EXPECT_TRUE(is_browsing(context->mode));
    EXPECT_EQ(context->selector.current_module().id, "ssh");
    EXPECT_EQ(context->navigator.module().id, "ssh");
    EXPECT_FALSE(context->quit_requested);
}

TEST(DispatchTest, BrowsingMovesHoverOnly) {
    auto context = make_context();
    EXPECT_EQ(dispatch_input(*context, InputKey::Left), DispatchResult::Unchanged);
    EXPECT_EQ(dispatch_input(*context, InputKey::Right), DispatchResult::Updated);
    EXPECT_EQ(context->selector.hovered(), 1u);
    EXPECT_EQ(context->selector.current(), 0u);
    EXPECT_EQ(context->navigator.module().id, "ssh");
}

TEST(DispatchTest, EnterCommitsHoveredModuleAndEntersTree) {
    auto context = make_context();
    press(*context, {InputKey::Right});
    EXPECT_EQ(dispatch_input(*context, InputKey::Enter), DispatchResult::Updated);
    EXPECT_TRUE(is_tree(context->mode));
    EXPECT_EQ(context->selector.current(), 1u);
    EXPECT_EQ(context->navigator.module().id, "mysql");
    EXPECT_EQ(context->navigator.level(), Level::Project);
}

TEST(DispatchTest, DownAlsoEntersTree) {
    auto context = make_context();
    EXPECT_EQ(dispatch_input(*context, InputKey::Down), DispatchResult::Updated);
    EXPECT_TRUE(is_tree(context->mode));
}

TEST(DispatchTest, ThreeCollapsesFromConnectionReturnToBrowsing) {
    auto context = make_context();
    press(*context, {InputKey::Enter, InputKey::Right, InputKey::Right});
    ASSERT_EQ(context->navigator.level(), Level::Connection);

    press(*context, {InputKey::Left});
    EXPECT_EQ(context->navigator.level(), Level::Environment);
    press(*context, {InputKey::Left});
    EXPECT_EQ(context->navigator.level(), Level::Project);
    EXPECT_TRUE(is_tree(context->mode));
    press(*context, {InputKey::Left});
    EXPECT_TRUE(is_browsing(context->mode));
}

TEST(DispatchTest, GateOpenThenCancelLeavesStateIdentical) {
    auto context = make_context();
    press(*context, {InputKey::Right, InputKey::Right, InputKey::Left, InputKey::Enter, InputKey::Right,
                     InputKey::Space, InputKey::Down});
    ASSERT_TRUE(is_tree(context->mode));

    const NavigationCursor cursor = context->navigator.cursor();
    const ModuleSelector selector = context->selector;
    const ExpansionStore expansion = context->expansion;

    EXPECT_EQ(dispatch_input(*context, InputKey::Quit), DispatchResult::Updated);
    EXPECT_TRUE(is_confirm_pending(context->mode));
    EXPECT_EQ(dispatch_input(*context, InputKey::Down), DispatchResult::Swallowed);
    EXPECT_EQ(dispatch_input(*context, InputKey::Left), DispatchResult::Swallowed);
    EXPECT_EQ(dispatch_input(*context, InputKey::Space), DispatchResult::Swallowed);
    EXPECT_EQ(dispatch_input(*context, InputKey::No), DispatchResult::Updated);

    EXPECT_TRUE(is_tree(context->mode));
    EXPECT_EQ(context->navigator.cursor(), cursor);
    EXPECT_TRUE(context->selector.same_selection(selector));
    EXPECT_EQ(context->expansion, expansion);
    EXPECT_FALSE(context->quit_requested);
}

TEST(DispatchTest, GateFromBrowsingReturnsToBrowsing) {
    auto context = make_context();
    press(*context, {InputKey::Quit, InputKey::Escape});
    EXPECT_TRUE(is_browsing(context->mode));
}

TEST(DispatchTest, ConfirmRequestsQuit) {
    auto context = make_context();
    press(*context, {InputKey::Enter, InputKey::Quit});
    EXPECT_EQ(dispatch_input(*context, InputKey::Yes), DispatchResult::QuitRequested);
    EXPECT_TRUE(context->quit_requested);
}

TEST(DispatchTest, UnrelatedKeysAreIgnored) {
    auto context = make_context();
    EXPECT_EQ(dispatch_input(*context, InputKey::Other), DispatchResult::Ignored);
    EXPECT_EQ(dispatch_input(*context, InputKey::Yes), DispatchResult::Ignored);
    press(*context, {InputKey::Enter});
    EXPECT_EQ(dispatch_input(*context, InputKey::No), DispatchResult::Ignored);
    EXPECT_EQ(dispatch_input(*context, InputKey::Other), DispatchResult::Ignored);
}

TEST(DispatchTest, EscapeLeavesTreeKeepingCursorModule) {
    auto context = make_context();
    press(*context, {InputKey::Enter, InputKey::Down});
    EXPECT_EQ(dispatch_input(*context, InputKey::Escape), DispatchResult::Updated);
    EXPECT_TRUE(is_browsing(context->mode));
    EXPECT_EQ(context->navigator.module().id, "ssh");
}

TEST(DispatchTest, ExpansionPersistsAcrossModuleSwitch) {
    auto context = make_context();
    press(*context, {InputKey::Enter, InputKey::Right});
    const NodeKey infra{"ssh", {0}};
    ASSERT_TRUE(context->expansion.get(infra));

    press(*context, {InputKey::Escape, InputKey::Right, InputKey::Enter});
    EXPECT_EQ(context->navigator.module().id, "mysql");
    EXPECT_EQ(context->navigator.cursor(), NavigationCursor{});

    press(*context, {InputKey::Escape, InputKey::Left, InputKey::Enter});
    EXPECT_EQ(context->navigator.module().id, "ssh");
    EXPECT_EQ(context->navigator.level(), Level::Project);
    EXPECT_TRUE(context->expansion.get(infra));
}

TEST(DispatchTest, EnterActivatesAtConnectionLevel) {
    auto context = make_context();
    press(*context, {InputKey::Enter, InputKey::Enter, InputKey::Enter});
    ASSERT_EQ(context->navigator.level(), Level::Connection);
    EXPECT_TRUE(context->status_message.empty());

    EXPECT_EQ(dispatch_input(*context, InputKey::Enter), DispatchResult::Updated);
    EXPECT_NE(context->status_message.find("SSH-Server-01"), std::string::npos);
    EXPECT_NE(context->status_message.find("192.168.1.10:22"), std::string::npos);
    EXPECT_EQ(context->navigator.level(), Level::Connection);
}

TEST(DispatchTest, SpaceTogglesHighlightedNode) {
    auto context = make_context();
    press(*context, {InputKey::Enter});
    const NodeKey key = context->navigator.current_key();
    EXPECT_EQ(dispatch_input(*context, InputKey::Space), DispatchResult::Updated);
    EXPECT_TRUE(context->expansion.get(key));
    press(*context, {InputKey::Space});
    EXPECT_FALSE(context->expansion.get(key));
}

TEST(DispatchTest, MoveUpAtRootReportsUnchanged) {
    auto context = make_context();
    press(*context, {InputKey::Enter});
    EXPECT_EQ(dispatch_input(*context, InputKey::Up), DispatchResult::Unchanged);
}
