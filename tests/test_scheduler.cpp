#include <catch2/catch_test_macros.hpp>

#include "activity_feed.h"
#include "scheduler.h"

#include <algorithm>
#include <set>
#include <string>
#include <vector>

namespace {

ContentStore ChatStore(size_t lines)
{
    ContentStore store;
    std::vector<ChatLine> chat;
    for (size_t i = 0; i < lines; ++i)
    {
        chat.push_back(ChatLine{"jar", "line " + std::to_string(i)});
    }
    store.SetChatChannel(ChannelMessages, chat);
    return store;
}

} // namespace

TEST_CASE("NotificationScheduler", "[scheduler]") {
    const ContentStore store = ChatStore(3);
    NotificationScheduler scheduler(NotificationKind::Chat, ChannelMessages, SelectionPolicy::Sequential, IntervalRange{1.0f, 1.0f});

    SECTION("FiresWhenCountdownExpires") {
        REQUIRE_FALSE(scheduler.Advance(0.5f, store).has_value());
        const auto event = scheduler.Advance(0.5f, store);
        REQUIRE(event.has_value());
        REQUIRE(event->kind == NotificationKind::Chat);
        REQUIRE(event->channel == ChannelMessages);
        REQUIRE(event->contentIndex == 0);
        REQUIRE(event->fireTime == 1.0f);
        REQUIRE(scheduler.FiredCount() == 1);
        REQUIRE(scheduler.Remaining() == 1.0f);
    }

    SECTION("BlockedSchedulerHolds") {
        REQUIRE_FALSE(scheduler.Advance(5.0f, store, true).has_value());
        REQUIRE(scheduler.Remaining() == 1.0f);
        REQUIRE(scheduler.Advance(1.0f, store).has_value());
    }

    SECTION("SequentialWrapsAround") {
        std::vector<int> picks;
        for (int i = 0; i < 4; ++i)
        {
            picks.push_back(scheduler.Advance(1.0f, store)->contentIndex);
        }
        REQUIRE(picks == std::vector<int>{0, 1, 2, 0});
        REQUIRE_FALSE(scheduler.Exhausted());
    }

    SECTION("EmptyChannelUsesPlaceholder") {
        ContentStore empty;
        empty.SetEmailChannel(ChannelRegularEmail, {});
        NotificationScheduler email(NotificationKind::Email, ChannelRegularEmail, SelectionPolicy::Random, IntervalRange{1.0f, 1.0f});

        const auto event = email.Advance(1.0f, empty);
        REQUIRE(event.has_value());
        REQUIRE(event->contentIndex == -1);
        REQUIRE(email.Exhausted());
        REQUIRE(empty.Email(event->channel, event->contentIndex).subject == ContentStore::PlaceholderEmail().subject);

        REQUIRE(email.Advance(1.0f, empty).has_value());
        REQUIRE(email.FiredCount() == 2);
    }
}

TEST_CASE("One-shot scheduler", "[scheduler]") {
    ContentStore store = ContentStore::BuiltIn();
    NotificationScheduler congratulation(NotificationKind::Congratulation, ChannelCongratulation,
                                         SelectionPolicy::NoRepeat, IntervalRange{1.0f, 3.0f}, false);

    SECTION("IdleUntilArmed") {
        REQUIRE_FALSE(congratulation.Armed());
        REQUIRE_FALSE(congratulation.Advance(100.0f, store).has_value());
    }

    SECTION("FiresOnceAfterArm") {
        congratulation.Arm(2.0f);
        REQUIRE_FALSE(congratulation.Advance(1.0f, store).has_value());
        const auto event = congratulation.Advance(1.0f, store);
        REQUIRE(event.has_value());
        REQUIRE(event->kind == NotificationKind::Congratulation);
        REQUIRE(event->contentIndex >= 0);
        REQUIRE_FALSE(congratulation.Armed());
        REQUIRE_FALSE(congratulation.Advance(10.0f, store).has_value());
    }
}

TEST_CASE("ContentCursor", "[scheduler]") {

    SECTION("NoRepeatUsesEveryEntryBeforeRepeating") {
        ContentCursor cursor(SelectionPolicy::NoRepeat);
        std::set<int> seen;
        for (int i = 0; i < 4; ++i)
        {
            seen.insert(cursor.Select(4));
        }
        REQUIRE(seen == std::set<int>{0, 1, 2, 3});
        const int next = cursor.Select(4);
        REQUIRE(next >= 0);
        REQUIRE(next < 4);
    }

    SECTION("RandomStaysInRange") {
        ContentCursor cursor(SelectionPolicy::Random);
        for (int i = 0; i < 50; ++i)
        {
            const int pick = cursor.Select(3);
            REQUIRE(pick >= 0);
            REQUIRE(pick < 3);
        }
    }

    SECTION("EmptyChannelHasNoPick") {
        ContentCursor cursor(SelectionPolicy::Sequential);
        REQUIRE(cursor.Select(0) == -1);
    }

    SECTION("RandomSecondsStaysInRange") {
        for (int i = 0; i < 50; ++i)
        {
            const float seconds = RandomSeconds(IntervalRange{5.0f, 15.0f});
            REQUIRE(seconds >= 5.0f);
            REQUIRE(seconds <= 15.0f);
        }
    }
}

TEST_CASE("ActivityFeed", "[scheduler]") {
    const ContentStore store = ContentStore::BuiltIn();
    ActivityFeed feed(IntervalRange{5.0f, 5.0f}, 5.0f, 12.5f);

    REQUIRE_FALSE(feed.Advance(4.0f, store).has_value());
    const auto event = feed.Advance(1.0f, store);
    REQUIRE(event.has_value());
    REQUIRE(event->line.rfind("Calvelli", 0) == 0);
    REQUIRE(event->work >= 5.0f);
    REQUIRE(event->work <= 12.5f);
    REQUIRE(feed.Count() == 1);
}
