#include <gtest/gtest.h>
#include "core/confirmation_gate.hpp"

using namespace connmgr_tui;

TEST(ConfirmationGateTest, OpenFromBrowsingAndCancel) {
    Mode mode = BrowsingMode{};
    ConfirmationGate gate(mode);
    EXPECT_FALSE(gate.is_active());

    gate.open();
    EXPECT_TRUE(gate.is_active());
    EXPECT_EQ(gate.handle(InputKey::No), GateOutcome::Cancelled);
    EXPECT_TRUE(is_browsing(mode));
}

TEST(ConfirmationGateTest, CancelRestoresTreeMode) {
    Mode mode = TreeMode{};
    ConfirmationGate gate(mode);
    gate.open();
    ASSERT_TRUE(is_confirm_pending(mode));
    EXPECT_EQ(gate.handle(InputKey::Escape), GateOutcome::Cancelled);
    EXPECT_TRUE(is_tree(mode));
}

TEST(ConfirmationGateTest, OtherKeysAreSwallowed) {
    Mode mode = TreeMode{};
    ConfirmationGate gate(mode);
    gate.open();
    for (InputKey key : {InputKey::Up, InputKey::Down, InputKey::Left, InputKey::Right, InputKey::Enter,
                         InputKey::Space, InputKey::Quit, InputKey::Other}) {
        EXPECT_EQ(gate.handle(key), GateOutcome::Swallowed);
        EXPECT_TRUE(gate.is_active());
    }
}

TEST(ConfirmationGateTest, ConfirmInvokesQuitCallback) {
    Mode mode = BrowsingMode{};
    ConfirmationGate gate(mode);
    int quits = 0;
    gate.set_quit_callback([&]() { ++quits; });

    gate.open();
    EXPECT_EQ(gate.handle(InputKey::Yes), GateOutcome::Confirmed);
    EXPECT_EQ(quits, 1);
}

TEST(ConfirmationGateTest, ReopenWhilePendingKeepsOriginalMode) {
    Mode mode = TreeMode{};
    ConfirmationGate gate(mode);
    gate.open();
    gate.open();
    gate.cancel();
    EXPECT_TRUE(is_tree(mode));
}

TEST(ConfirmationGateTest, CancelWhenInactiveDoesNothing) {
    Mode mode = TreeMode{};
    ConfirmationGate gate(mode);
    gate.cancel();
    EXPECT_TRUE(is_tree(mode));
    EXPECT_STREQ(mode_label(mode), "Tree");
}
