#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/window/WindowMessages.h"
#include "core/window/WindowObserver.h"
#include "fakes/FakeWindow.h"

namespace wndtap::test {

using core::window::MakeNotifyCallback;
using core::window::NotifyCallback;
using core::window::NotifyCallbackRef;
using core::window::NotifyEvent;
using core::window::WindowObserver;
namespace messages = core::window::messages;

class WindowObserverTest : public ::testing::Test {
protected:
    // Callback that appends "<tag>:<id>" to the journal
    NotifyCallbackRef Recorder(const std::string& tag) {
        return MakeNotifyCallback([this, tag](const NotifyEvent& e) {
            journal.push_back(tag + ":" + std::to_string(e.messageId));
        });
    }

    FakeWindow window{true};
    std::vector<std::string> journal;
};

// ============================================================================
// Construction and attach
// ============================================================================

TEST(WindowObserverConstructionTest, NullWindowThrows) {
    EXPECT_THROW({ WindowObserver observer(nullptr); }, std::invalid_argument);
}

TEST(WindowObserverConstructionTest, LoadedWindowAttachesImmediately) {
    FakeWindow window(true);
    WindowObserver observer(&window);

    EXPECT_TRUE(observer.IsAttached());
    EXPECT_EQ(window.addHookCalls, 1);
    EXPECT_EQ(window.loadedSubscribeCalls, 0);
    EXPECT_EQ(&observer.GetObservedWindow(), &window);
}

TEST(WindowObserverConstructionTest, UnloadedWindowAttachesOnLoad) {
    FakeWindow window(false);
    WindowObserver observer(&window);

    EXPECT_FALSE(observer.IsAttached());
    EXPECT_EQ(window.addHookCalls, 0);
    EXPECT_EQ(window.LoadedSubscriberCount(), 1u);

    window.Load();

    EXPECT_TRUE(observer.IsAttached());
    EXPECT_EQ(window.addHookCalls, 1);
    EXPECT_EQ(window.LoadedSubscriberCount(), 0u);
}

TEST(WindowObserverConstructionTest, RepeatedLoadHooksOnce) {
    FakeWindow window(false);
    WindowObserver observer(&window);

    window.Load();
    window.Load();

    EXPECT_EQ(window.addHookCalls, 1);
    EXPECT_EQ(window.HookCount(), 1u);
}

TEST(WindowObserverConstructionTest, MessagesBeforeLoadAreNotSeen) {
    FakeWindow window(false);
    WindowObserver observer(&window);

    int seen = 0;
    observer.AddCallback(MakeNotifyCallback([&seen](const NotifyEvent&) { ++seen; }));

    window.Deliver(messages::Paint);
    EXPECT_EQ(seen, 0);

    window.Load();
    window.Deliver(messages::Paint);
    EXPECT_EQ(seen, 1);
}

TEST(WindowObserverConstructionTest, DestructionRemovesHook) {
    FakeWindow window(true);
    {
        WindowObserver observer(&window);
        EXPECT_EQ(window.HookCount(), 1u);
    }
    EXPECT_EQ(window.HookCount(), 0u);
    EXPECT_NO_THROW(window.Deliver(messages::Size));
}

TEST(WindowObserverConstructionTest, DestructionBeforeLoadDropsSubscription) {
    FakeWindow window(false);
    {
        WindowObserver observer(&window);
        EXPECT_EQ(window.LoadedSubscriberCount(), 1u);
    }
    EXPECT_EQ(window.LoadedSubscriberCount(), 0u);
    window.Load();
    EXPECT_EQ(window.addHookCalls, 0);
}

TEST(WindowObserverConstructionTest, ObserverDestroyedDuringDispatchIsNotCalled) {
    FakeWindow window(true);
    WindowObserver first(&window);
    auto second = std::make_unique<WindowObserver>(&window);

    int secondCalls = 0;
    second->AddCallback(MakeNotifyCallback([&secondCalls](const NotifyEvent&) {
        ++secondCalls;
    }));
    first.AddCallback(MakeNotifyCallback([&second](const NotifyEvent&) {
        second.reset();
    }));
    ASSERT_EQ(window.HookCount(), 2u);

    auto delivered = window.Deliver(5);

    EXPECT_FALSE(delivered.handled);
    EXPECT_FALSE(second);
    EXPECT_EQ(secondCalls, 0);
    EXPECT_EQ(window.HookCount(), 1u);
}

// ============================================================================
// Dispatch
// ============================================================================

TEST_F(WindowObserverTest, CatchAllThenCallbacksInRegistrationOrder) {
    WindowObserver observer(&window);

    const NotifyEvent* catchAllEvent = nullptr;
    std::vector<const NotifyEvent*> callbackEvents;
    std::vector<NotifyEvent> values;

    observer.SubscribeMessage([&](WindowObserver& sender, const NotifyEvent& e) {
        EXPECT_EQ(&sender, &observer);
        journal.push_back("Message:" + std::to_string(e.messageId));
        catchAllEvent = &e;
        values.push_back(e);
    });

    observer.AddCallback(MakeNotifyCallback([&](const NotifyEvent& e) {
        journal.push_back("A:" + std::to_string(e.messageId));
        callbackEvents.push_back(&e);
        values.push_back(e);
    }));
    observer.AddCallbackFor(5, MakeNotifyCallback([&](const NotifyEvent& e) {
        journal.push_back("B:" + std::to_string(e.messageId));
        callbackEvents.push_back(&e);
        values.push_back(e);
    }));

    window.Deliver(5);

    EXPECT_EQ(journal, (std::vector<std::string>{"Message:5", "A:5", "B:5"}));

    ASSERT_EQ(values.size(), 3u);
    for (const auto& v : values) {
        EXPECT_EQ(v, NotifyEvent(&window, 5));
    }

    ASSERT_EQ(callbackEvents.size(), 2u);
    EXPECT_NE(callbackEvents[0], catchAllEvent);
    EXPECT_NE(callbackEvents[1], catchAllEvent);
}

TEST_F(WindowObserverTest, FilteredCallbackSkipsOtherMessages) {
    WindowObserver observer(&window);

    int catchAll = 0;
    observer.SubscribeMessage([&catchAll](WindowObserver&, const NotifyEvent&) { ++catchAll; });
    observer.AddCallbackFor(5, Recorder("B"));

    window.Deliver(7);

    EXPECT_EQ(catchAll, 1);
    EXPECT_TRUE(journal.empty());
}

TEST_F(WindowObserverTest, CatchAllFiresWithEmptyRegistry) {
    WindowObserver observer(&window);

    std::vector<uint32_t> ids;
    observer.SubscribeMessage([&ids](WindowObserver&, const NotifyEvent& e) {
        ids.push_back(e.messageId);
    });

    window.Deliver(messages::Activate);
    window.Deliver(messages::KillFocus);

    EXPECT_EQ(ids, (std::vector<uint32_t>{messages::Activate, messages::KillFocus}));
}

TEST_F(WindowObserverTest, NeverSuppressesDefaultProcessing) {
    WindowObserver observer(&window);
    observer.AddCallback(Recorder("A"));
    observer.AddCallbackFor(messages::Close, Recorder("C"));

    for (uint32_t id : {messages::Close, messages::Paint, 0xFFFFFFFFu}) {
        auto result = window.Deliver(id, 42, -1);
        EXPECT_EQ(result.result, 0);
        EXPECT_FALSE(result.handled);
    }

    bool handled = false;
    core::window::NativeMessage msg;
    msg.id = messages::Size;
    EXPECT_EQ(observer.WindowProc(msg, handled), 0);
    EXPECT_FALSE(handled);
}

TEST_F(WindowObserverTest, UnsubscribedCatchAllIsNotInvoked) {
    WindowObserver observer(&window);

    int calls = 0;
    auto id = observer.SubscribeMessage([&calls](WindowObserver&, const NotifyEvent&) { ++calls; });
    window.Deliver(1);
    EXPECT_TRUE(observer.UnsubscribeMessage(id));
    window.Deliver(1);

    EXPECT_EQ(calls, 1);
    EXPECT_FALSE(observer.UnsubscribeMessage(id));
}

TEST_F(WindowObserverTest, EmptyMessageHandlerThrows) {
    WindowObserver observer(&window);
    EXPECT_THROW(observer.SubscribeMessage(nullptr), std::invalid_argument);
}

TEST_F(WindowObserverTest, NestedDispatchIsNotSerialized) {
    WindowObserver observer(&window);

    observer.AddCallbackFor(1, MakeNotifyCallback([this](const NotifyEvent&) {
        journal.push_back("outer-begin");
        window.Deliver(2);
        journal.push_back("outer-end");
    }));
    observer.AddCallbackFor(2, Recorder("inner"));

    window.Deliver(1);

    EXPECT_EQ(journal, (std::vector<std::string>{"outer-begin", "inner:2", "outer-end"}));
}

TEST_F(WindowObserverTest, CallbackMayRemoveItselfDuringDispatch) {
    WindowObserver observer(&window);

    NotifyCallbackRef once;
    once = MakeNotifyCallback([&](const NotifyEvent&) {
        journal.push_back("once");
        observer.RemoveCallback(once);
    });

    observer.AddCallback(Recorder("before"));
    observer.AddCallback(once);

    window.Deliver(3);
    window.Deliver(4);

    EXPECT_EQ(journal, (std::vector<std::string>{"before:3", "once", "before:4"}));
    EXPECT_EQ(observer.GetCallbackCount(), 1u);
}

// ============================================================================
// Registration
// ============================================================================

TEST_F(WindowObserverTest, NullCallbackThrowsAndLeavesRegistryUnchanged) {
    WindowObserver observer(&window);
    observer.AddCallback(Recorder("A"));

    EXPECT_THROW(observer.AddCallback(nullptr), std::invalid_argument);
    EXPECT_THROW(observer.AddCallbackFor(5, nullptr), std::invalid_argument);
    EXPECT_THROW(observer.AddCallbackFor(5, std::make_shared<const NotifyCallback>()),
                 std::invalid_argument);

    EXPECT_EQ(observer.GetCallbackCount(), 1u);
}

TEST_F(WindowObserverTest, AnyMessageIdIsAccepted) {
    WindowObserver observer(&window);
    observer.AddCallbackFor(0xDEADBEEF, Recorder("odd"));

    window.Deliver(messages::Paint);
    EXPECT_TRUE(journal.empty());
    EXPECT_EQ(observer.GetCallbackCount(), 1u);
}

TEST_F(WindowObserverTest, RemoveCallbackRemovesEveryRegistration) {
    WindowObserver observer(&window);
    auto shared = Recorder("S");
    auto other  = Recorder("O");

    observer.AddCallback(shared);
    observer.AddCallbackFor(5, shared);
    observer.AddCallbackFor(5, other);

    observer.RemoveCallback(shared);

    EXPECT_EQ(observer.GetCallbackCount(), 1u);
    window.Deliver(5);
    EXPECT_EQ(journal, (std::vector<std::string>{"O:5"}));
}

TEST_F(WindowObserverTest, RemoveUnknownCallbackIsNoOp) {
    WindowObserver observer(&window);
    observer.AddCallback(Recorder("A"));

    EXPECT_NO_THROW(observer.RemoveCallback(Recorder("never-registered")));
    EXPECT_EQ(observer.GetCallbackCount(), 1u);
    EXPECT_THROW(observer.RemoveCallback(nullptr), std::invalid_argument);
}

TEST_F(WindowObserverTest, RemoveCallbacksForMatchesFilterExactly) {
    WindowObserver observer(&window);
    observer.AddCallback(Recorder("all"));
    observer.AddCallbackFor(5, Recorder("five"));
    observer.AddCallbackFor(5, Recorder("five-again"));
    observer.AddCallbackFor(6, Recorder("six"));

    observer.RemoveCallbacksFor(5);

    EXPECT_EQ(observer.GetCallbackCount(), 2u);
    window.Deliver(5);
    window.Deliver(6);
    EXPECT_EQ(journal, (std::vector<std::string>{"all:5", "all:6", "six:6"}));
}

TEST_F(WindowObserverTest, ClearCallbacksEmptiesRegistry) {
    WindowObserver observer(&window);
    observer.AddCallback(Recorder("A"));
    observer.AddCallbackFor(5, Recorder("B"));

    observer.ClearCallbacks();
    EXPECT_EQ(observer.GetCallbackCount(), 0u);

    window.Deliver(5);
    EXPECT_TRUE(journal.empty());

    EXPECT_NO_THROW(observer.ClearCallbacks());
}

TEST_F(WindowObserverTest, ClearCallbacksKeepsCatchAllSubscribers) {
    WindowObserver observer(&window);

    int calls = 0;
    observer.SubscribeMessage([&calls](WindowObserver&, const NotifyEvent&) { ++calls; });
    observer.AddCallback(Recorder("A"));
    observer.ClearCallbacks();

    window.Deliver(9);
    EXPECT_EQ(calls, 1);
}

}  // namespace wndtap::test
