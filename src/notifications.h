#pragma once

#include "content_store.h"
#include "scheduler.h"
#include "window_manager.h"

#include <cstddef>

inline constexpr size_t InboxLimit = 50;
inline constexpr size_t ConversationLimit = 30;
inline constexpr size_t DiscordFeedLimit = 30;

// Turns a fired event into window state: an inbox entry, a chat line, a call
// window or an interrupt. Returns the window spawned for the event, if any.
WindowId DeliverNotification(WindowManager &windows, const ContentStore &store, const NotificationEvent &event, Vector2 screen);

InboxEntry *FindInboxEntry(WindowManager &windows, int inboxId);
void AppendChatLine(MessagesContent &messages, const ChatLine &line);
