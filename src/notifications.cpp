#include "notifications.h"

#include "desktop.h"

#include "raylib.h"

#include <algorithm>
#include <string>
#include <variant>

static std::string ClockLabel(float seconds)
{
    const int total = static_cast<int>(std::max(0.0f, seconds));
    return TextFormat("%02i:%02i", total / 60, total % 60);
}

static WindowId DeliverEmail(WindowManager &windows, const ContentStore &store, const NotificationEvent &event, Vector2 screen)
{
    const bool congratulation = event.kind == NotificationKind::Congratulation;
    const EmailTemplate &email = store.Email(event.channel, event.contentIndex);

    int inboxId = -1;
    Window *outlookWindow = windows.FindFirst(WindowKind::Outlook);
    if (auto *outlook = outlookWindow ? std::get_if<OutlookContent>(&outlookWindow->content) : nullptr)
    {
        InboxEntry entry;
        entry.id = outlook->nextEntryId++;
        entry.email = email;
        entry.receivedAt = ClockLabel(event.fireTime);
        entry.urgent = congratulation;
        entry.blinking = congratulation;
        outlook->inbox.insert(outlook->inbox.begin(), entry);
        if (outlook->inbox.size() > InboxLimit)
        {
            outlook->inbox.resize(InboxLimit);
        }
        inboxId = entry.id;
    }
    else
    {
        TraceLog(LOG_WARNING, "GAME: no inbox open, '%s' shown as toast only", email.subject.c_str());
    }

    return windows.Spawn(MakeToastWindow(
        PopupStyle::EmailToast, congratulation ? "Urgent Mail" : "Incoming Mail", email.sender + ": " + email.subject, inboxId, screen));
}

static WindowId DeliverChat(WindowManager &windows, const ContentStore &store, const NotificationEvent &event, Vector2 screen)
{
    const ChatLine &line = store.Chat(event.channel, event.contentIndex);
    Window *messagesWindow = windows.FindFirst(WindowKind::Messages);
    if (auto *messages = messagesWindow ? std::get_if<MessagesContent>(&messagesWindow->content) : nullptr)
    {
        AppendChatLine(*messages, line);
    }
    return windows.Spawn(MakeToastWindow(PopupStyle::ChatToast, line.contact, line.text, -1, screen));
}

static WindowId DeliverInterrupt(WindowManager &windows, const ContentStore &store, const NotificationEvent &event, Vector2 screen)
{
    const ChatLine &line = store.Chat(event.channel, event.contentIndex);
    Window *discordWindow = windows.FindFirst(WindowKind::Discord);
    if (auto *discord = discordWindow ? std::get_if<DiscordContent>(&discordWindow->content) : nullptr)
    {
        discord->feed.push_back(line);
        if (discord->feed.size() > DiscordFeedLimit)
        {
            discord->feed.erase(discord->feed.begin());
        }
    }
    return windows.Spawn(MakeInterruptWindow(line, screen));
}

WindowId DeliverNotification(WindowManager &windows, const ContentStore &store, const NotificationEvent &event, Vector2 screen)
{
    switch (event.kind)
    {
    case NotificationKind::Email:
    case NotificationKind::Congratulation:
        return DeliverEmail(windows, store, event, screen);
    case NotificationKind::Chat:
        return DeliverChat(windows, store, event, screen);
    case NotificationKind::Phone:
        return windows.Spawn(MakePhoneCallWindow(store.Phone(event.contentIndex), screen));
    case NotificationKind::DiscordInterrupt:
        return DeliverInterrupt(windows, store, event, screen);
    case NotificationKind::Milestone:
        break;
    }
    TraceLog(LOG_WARNING, "SCHED: %s events are not delivered through schedulers", NotificationKindLabel(event.kind));
    return NoWindow;
}

InboxEntry *FindInboxEntry(WindowManager &windows, int inboxId)
{
    Window *outlookWindow = windows.FindFirst(WindowKind::Outlook);
    auto *outlook = outlookWindow ? std::get_if<OutlookContent>(&outlookWindow->content) : nullptr;
    if (!outlook)
    {
        return nullptr;
    }
    auto it = std::find_if(outlook->inbox.begin(), outlook->inbox.end(), [inboxId](const InboxEntry &e) { return e.id == inboxId; });
    return it == outlook->inbox.end() ? nullptr : &*it;
}

void AppendChatLine(MessagesContent &messages, const ChatLine &line)
{
    auto it = std::find_if(messages.conversations.begin(), messages.conversations.end(),
                           [&line](const Conversation &c) { return c.contact == line.contact; });
    if (it == messages.conversations.end())
    {
        messages.conversations.push_back(Conversation{line.contact, {}, true});
        it = messages.conversations.end() - 1;
    }
    PushLog(it->lines, line.text, ConversationLimit);
    it->unread = true;
}
