#include <catch2/catch_test_macros.hpp>

#include "desktop.h"
#include "notifications.h"

#include <string>
#include <variant>
#include <vector>

TEST_CASE("Notification delivery", "[notifications]") {
    const ContentStore store = ContentStore::BuiltIn();
    const Vector2 screen{1920, 1080};
    WindowManager wm;
    const WindowId outlook = wm.Spawn(MakeOutlookWindow(Rectangle{0, 0, 600, 400}));
    const WindowId discord = wm.Spawn(MakeDiscordWindow(Rectangle{600, 0, 600, 400}));

    SECTION("ConversationKeepsNewestLines") {
        MessagesContent messages;
        for (size_t i = 0; i < ConversationLimit + 5; ++i)
        {
            AppendChatLine(messages, ChatLine{"Jar", "line " + std::to_string(i)});
        }
        REQUIRE(messages.conversations.size() == 1);
        REQUIRE(messages.conversations.front().lines.size() == ConversationLimit);
        REQUIRE(messages.conversations.front().lines.front() == "line 5");
        REQUIRE(messages.conversations.front().lines.back() == "line " + std::to_string(ConversationLimit + 4));
    }

    SECTION("DiscordFeedIsBounded") {
        NotificationEvent event{NotificationKind::DiscordInterrupt, 0.0f, ChannelDiscord, 0};
        for (size_t i = 0; i < DiscordFeedLimit + 3; ++i)
        {
            const WindowId interrupt = DeliverNotification(wm, store, event, screen);
            REQUIRE(wm.Close(interrupt));
        }
        REQUIRE(std::get<DiscordContent>(wm.Find(discord)->content).feed.size() == DiscordFeedLimit);
    }

    SECTION("ToastSitsBelowLaterWindows") {
        NotificationEvent event{NotificationKind::Email, 5.0f, ChannelRegularEmail, 0};
        const WindowId toast = DeliverNotification(wm, store, event, screen);
        REQUIRE(wm.ZOrderTopFirst().front() == toast);
        REQUIRE(wm.Focused() == discord);

        wm.Focus(outlook);
        REQUIRE(wm.ZOrderTopFirst() == std::vector<WindowId>{outlook, toast, discord});
    }
}
