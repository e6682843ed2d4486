#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "core/dispatch/UiDispatcher.h"
#include "core/input/ControlFocus.h"
#include "fakes/FakeFocusElement.h"

namespace wndtap::test {

using core::dispatch::DispatcherPriority;
using core::dispatch::UiDispatcher;
using core::input::ControlFocus;

class ControlFocusTest : public ::testing::Test {
protected:
    UiDispatcher dispatcher;
    std::vector<std::string> journal;
    FakeFocusElement element{dispatcher, journal, "button"};
};

TEST_F(ControlFocusTest, GiveFocusIsDeferred) {
    ControlFocus::GiveFocus(&element);

    EXPECT_TRUE(journal.empty());
    EXPECT_EQ(dispatcher.GetPendingCount(), 1u);

    dispatcher.ProcessPending();

    EXPECT_EQ(journal, (std::vector<std::string>{"button.Focus", "button.FocusKeyboard"}));
}

TEST_F(ControlFocusTest, CallbackRunsBeforeFocus) {
    ControlFocus::GiveFocus(&element, [this] { journal.push_back("callback"); });

    EXPECT_TRUE(journal.empty());
    dispatcher.ProcessPending();

    EXPECT_EQ(journal, (std::vector<std::string>{
        "callback", "button.Focus", "button.FocusKeyboard"}));
}

TEST_F(ControlFocusTest, EmptyCallbackBehavesLikePlainOverload) {
    ControlFocus::GiveFocus(&element, std::function<void()>());
    dispatcher.ProcessPending();

    EXPECT_EQ(journal, (std::vector<std::string>{"button.Focus", "button.FocusKeyboard"}));
}

TEST_F(ControlFocusTest, NullElementThrowsBeforeQueueing) {
    EXPECT_THROW(ControlFocus::GiveFocus(nullptr), std::invalid_argument);
    EXPECT_THROW(ControlFocus::GiveFocus(nullptr, [] {}), std::invalid_argument);
    EXPECT_EQ(dispatcher.GetPendingCount(), 0u);
}

TEST_F(ControlFocusTest, RunsAtRenderPriority) {
    // Layout-level work queued earlier runs first; anything below
    // Render waits for the focus change.
    dispatcher.BeginInvoke([this] { journal.push_back("background"); },
                           DispatcherPriority::Background);
    dispatcher.BeginInvoke([this] { journal.push_back("loaded"); },
                           DispatcherPriority::Loaded);
    dispatcher.BeginInvoke([this] { journal.push_back("databind"); },
                           DispatcherPriority::DataBind);

    ControlFocus::GiveFocus(&element);
    dispatcher.ProcessPending();

    EXPECT_EQ(journal, (std::vector<std::string>{
        "databind", "button.Focus", "button.FocusKeyboard", "loaded", "background"}));
}

TEST_F(ControlFocusTest, CallbackExceptionPropagatesAndSkipsFocus) {
    ControlFocus::GiveFocus(&element, [] { throw std::runtime_error("callback failed"); });

    EXPECT_THROW(dispatcher.ProcessPending(), std::runtime_error);
    EXPECT_TRUE(journal.empty());
    EXPECT_FALSE(dispatcher.HasPending());
}

TEST_F(ControlFocusTest, RequestsRunInOrder) {
    FakeFocusElement other(dispatcher, journal, "edit");

    ControlFocus::GiveFocus(&element);
    ControlFocus::GiveFocus(&other);
    dispatcher.ProcessPending();

    EXPECT_EQ(journal, (std::vector<std::string>{
        "button.Focus", "button.FocusKeyboard", "edit.Focus", "edit.FocusKeyboard"}));
}

}  // namespace wndtap::test
