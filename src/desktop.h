#pragma once

#include "content_store.h"
#include "window.h"

#include <cstddef>
#include <string>
#include <vector>

inline constexpr const char *CategoryMenuCard = "menu_card";
inline constexpr const char *CategorySupply = "supply";
inline constexpr const char *CategoryWeapon = "weapon";

inline constexpr float EmailToastLifetime = 8.0f;
inline constexpr float ChatToastLifetime = 5.0f;
inline constexpr float MilestoneBannerLifetime = 3.0f;

// Themed desktop apps. They stay open for the whole session.
Window MakeInventoryWindow(Rectangle frame, std::vector<ContentItem> items);
Window MakeFtlWindow(Rectangle frame, std::vector<ContentItem> cargo);
Window MakeZomboidWindow(Rectangle frame, std::vector<ContentItem> loot);
Window MakeOutlookWindow(Rectangle frame);
Window MakeMessagesWindow(Rectangle frame);
Window MakeSlackWindow(Rectangle frame, const ContentStore &store);
Window MakeDiscordWindow(Rectangle frame);
Window MakeActivityLogWindow(Rectangle frame, float maxProgress);

// Transient windows, positioned against the screen size.
Window MakeEmailViewWindow(const InboxEntry &entry, Vector2 screen);
Window MakeReplyWindow(const InboxEntry &entry, Vector2 screen);
Window MakePhoneCallWindow(const PhoneScript &script, Vector2 screen);
Window MakeToastWindow(PopupStyle style, std::string heading, std::string body, int inboxId, Vector2 screen);
Window MakeInterruptWindow(const ChatLine &line, Vector2 screen);
Window MakeMilestoneBanner(float percent, Vector2 screen);

// Bounded append to an activity log window's entries; oldest lines drop first.
void PushLog(std::vector<std::string> &log, const std::string &line, size_t maxLines = 16);
