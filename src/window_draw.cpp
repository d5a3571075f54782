#include "window.h"

#include "overloaded.h"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <string>
#include <vector>

constexpr Color WindowBackground{250, 250, 250, 255};
constexpr Color WindowBorder{180, 180, 180, 255};
constexpr Color TitleBarFocused{206, 212, 222, 255};
constexpr Color TitleBarIdle{228, 228, 228, 255};
constexpr Color TextDark{20, 20, 24, 255};
constexpr Color TextMuted{100, 100, 100, 255};
constexpr Color OutlookBlue{0, 120, 212, 255};
constexpr Color MessagesBlue{0, 120, 255, 255};
constexpr Color DiscordDark{54, 57, 63, 255};
constexpr Color SlackPurple{74, 21, 75, 255};

static int PxI(float value)
{
    return static_cast<int>(std::lround(value));
}

static std::string Ellipsize(const std::string &text, int fontSize, float maxWidth)
{
    if (MeasureText(text.c_str(), fontSize) <= PxI(maxWidth))
    {
        return text;
    }

    std::string shortened = text;
    while (!shortened.empty() && MeasureText((shortened + "...").c_str(), fontSize) > PxI(maxWidth))
    {
        shortened.pop_back();
    }
    return shortened + "...";
}

// Returns the y below the last line drawn.
static float DrawWrappedText(const std::string &text, float x, float y, float maxWidth, int fontSize, Color color)
{
    std::istringstream words(text);
    std::string word;
    std::string line;
    const float lineHeight = static_cast<float>(fontSize) + 6.0f;

    while (words >> word)
    {
        const std::string candidate = line.empty() ? word : line + " " + word;
        if (!line.empty() && MeasureText(candidate.c_str(), fontSize) > PxI(maxWidth))
        {
            DrawText(line.c_str(), PxI(x), PxI(y), fontSize, color);
            y += lineHeight;
            line = word;
        }
        else
        {
            line = candidate;
        }
    }

    if (!line.empty())
    {
        DrawText(line.c_str(), PxI(x), PxI(y), fontSize, color);
        y += lineHeight;
    }
    return y;
}

static void DrawButton(Rectangle rect, const char *label, Color fill, Color textColor)
{
    DrawRectangleRec(rect, fill);
    DrawRectangleLinesEx(rect, 1.0f, Fade(BLACK, 0.25f));
    const int width = MeasureText(label, 18);
    DrawText(label, PxI(rect.x + (rect.width - static_cast<float>(width)) * 0.5f), PxI(rect.y + (rect.height - 18.0f) * 0.5f), 18, textColor);
}

static void DrawCloseGlyph(Rectangle rect, Color color)
{
    const float inset = rect.width * 0.25f;
    DrawLineEx(Vector2{rect.x + inset, rect.y + inset}, Vector2{rect.x + rect.width - inset, rect.y + rect.height - inset}, 2.0f, color);
    DrawLineEx(Vector2{rect.x + rect.width - inset, rect.y + inset}, Vector2{rect.x + inset, rect.y + rect.height - inset}, 2.0f, color);
}

static void DrawTray(const Window &window, const ItemTray &tray, Color slotColor)
{
    for (int slot = 0; slot < TrayCapacity(tray); ++slot)
    {
        const Rectangle rect = TraySlotRect(window, slot);
        DrawRectangleRec(rect, slotColor);
        DrawRectangleLinesEx(rect, 2.0f, WindowBorder);
    }

    for (size_t i = 0; i < tray.items.size(); ++i)
    {
        const Rectangle rect = TraySlotRect(window, static_cast<int>(i));
        const Rectangle card{rect.x + 5.0f, rect.y + 5.0f, rect.width - 10.0f, rect.height - 10.0f};
        DrawRectangleRec(card, Color{255, 246, 214, 255});
        DrawRectangleLinesEx(card, 1.0f, Color{180, 150, 90, 255});
        DrawText(Ellipsize(tray.items[i].label, 10, card.width - 4.0f).c_str(), PxI(card.x + 2.0f), PxI(card.y + card.height * 0.5f - 5.0f), 10, TextDark);
    }
}

static void DrawInventory(const Window &window, const InventoryContent &inventory)
{
    DrawTray(window, inventory.tray, Color{220, 220, 220, 255});
}

static void DrawFtl(const Window &window, const FtlContent &ftl)
{
    const Rectangle content = ContentRect(window);
    DrawRectangleGradientV(PxI(content.x), PxI(content.y), PxI(content.width), PxI(content.height), Color{12, 16, 34, 255}, Color{28, 8, 18, 255});
    const unsigned char pulse = static_cast<unsigned char>(120 + std::sin(ftl.alertPulse * 3.0f) * 60.0f);
    DrawText("HULL 18/30   SHIELDS 2/4   CARGO", PxI(content.x + 20.0f), PxI(content.y + content.height - 34.0f), 18, Color{230, 80, 60, pulse});
    DrawTray(window, ftl.cargo, Color{40, 48, 70, 255});
}

static void DrawZomboid(const Window &window, const ZomboidContent &zomboid)
{
    static const Color screens[] = {
        Color{58, 64, 48, 255},
        Color{40, 52, 44, 255},
        Color{70, 58, 44, 255},
        Color{34, 40, 52, 255},
    };
    const Rectangle content = ContentRect(window);
    DrawRectangleRec(content, screens[zomboid.screen % 4]);
    DrawText(TextFormat("Day %i - Muldraugh, KY", 3 + zomboid.screen), PxI(content.x + 20.0f), PxI(content.y + content.height - 34.0f), 18, Color{220, 210, 180, 255});
    DrawTray(window, zomboid.loot, Color{90, 84, 70, 255});
}

static void DrawOutlook(const Window &window, const OutlookContent &outlook)
{
    const Rectangle content = ContentRect(window);
    DrawRectangleRec(Rectangle{content.x, content.y, OutlookSidebarWidth, content.height}, Color{240, 242, 246, 255});
    DrawText("Inbox", PxI(content.x + 16.0f), PxI(content.y + 16.0f), 18, OutlookBlue);
    DrawText("Sent", PxI(content.x + 16.0f), PxI(content.y + 44.0f), 18, TextMuted);

    if (outlook.inbox.empty())
    {
        DrawText("Nothing new. Suspicious.", PxI(content.x + OutlookSidebarWidth + 20.0f), PxI(content.y + 20.0f), 18, TextMuted);
        return;
    }

    const bool blinkOn = std::fmod(outlook.blinkTimer, 1.0f) < 0.5f;
    for (int row = 0; row < InboxVisibleRows && static_cast<size_t>(row) < outlook.inbox.size(); ++row)
    {
        const InboxEntry &entry = outlook.inbox[static_cast<size_t>(row)];
        const Rectangle rect = InboxRowRect(window, row);
        Color fill = entry.read ? WHITE : Color{232, 242, 252, 255};
        if (entry.blinking && blinkOn)
        {
            fill = Color{255, 226, 170, 255};
        }
        DrawRectangleRec(rect, fill);
        DrawRectangleLinesEx(rect, 1.0f, Color{210, 210, 210, 255});
        DrawText(Ellipsize(entry.email.sender, 16, rect.width - 100.0f).c_str(), PxI(rect.x + 8.0f), PxI(rect.y + 6.0f), 16, entry.read ? TextMuted : TextDark);
        DrawText(Ellipsize(entry.email.subject, 16, rect.width - 20.0f).c_str(), PxI(rect.x + 8.0f), PxI(rect.y + 28.0f), 16, TextDark);
        DrawText(entry.receivedAt.c_str(), PxI(rect.x + rect.width - 80.0f), PxI(rect.y + 6.0f), 14, TextMuted);
        if (entry.urgent)
        {
            DrawText("!", PxI(rect.x + rect.width - 16.0f), PxI(rect.y + 28.0f), 20, RED);
        }
        if (entry.replied)
        {
            DrawText("Replied", PxI(rect.x + rect.width - 80.0f), PxI(rect.y + 30.0f), 14, DARKGREEN);
        }
    }
}

static void DrawMessages(const Window &window, const MessagesContent &messages)
{
    const Rectangle content = ContentRect(window);
    DrawRectangleRec(Rectangle{content.x, content.y, MessagesSidebarWidth, content.height}, Color{244, 244, 244, 255});

    for (size_t row = 0; row < messages.conversations.size(); ++row)
    {
        const Conversation &conversation = messages.conversations[row];
        const Rectangle rect = ConversationRowRect(window, static_cast<int>(row));
        if (static_cast<int>(row) == messages.selected)
        {
            DrawRectangleRec(rect, Color{212, 228, 255, 255});
        }
        DrawText(conversation.contact.c_str(), PxI(rect.x + 28.0f), PxI(rect.y + 16.0f), 18, TextDark);
        if (conversation.unread)
        {
            DrawCircleV(Vector2{rect.x + 14.0f, rect.y + 25.0f}, 5.0f, MessagesBlue);
        }
    }

    if (messages.selected < 0 || static_cast<size_t>(messages.selected) >= messages.conversations.size())
    {
        DrawText("Select a conversation", PxI(content.x + MessagesSidebarWidth + 40.0f), PxI(content.y + content.height * 0.5f), 18, TextMuted);
        return;
    }

    const Conversation &conversation = messages.conversations[static_cast<size_t>(messages.selected)];
    float y = content.y + 16.0f;
    for (const auto &line : conversation.lines)
    {
        const Rectangle bubble{content.x + MessagesSidebarWidth + 16.0f, y, 300.0f, 36.0f};
        DrawRectangleRounded(bubble, 0.4f, 6, Color{229, 229, 234, 255});
        DrawText(Ellipsize(line, 16, bubble.width - 20.0f).c_str(), PxI(bubble.x + 10.0f), PxI(bubble.y + 10.0f), 16, TextDark);
        y += 44.0f;
        if (y > content.y + content.height - 44.0f)
        {
            break;
        }
    }
}

static void DrawSlack(const Window &window, const SlackContent &slack)
{
    const Rectangle content = ContentRect(window);
    DrawRectangleRec(Rectangle{content.x, content.y, 180.0f, content.height}, SlackPurple);
    DrawText("Conference HQ", PxI(content.x + 12.0f), PxI(content.y + 12.0f), 18, WHITE);

    for (size_t row = 0; row < slack.channels.size(); ++row)
    {
        const Rectangle rect = SlackChannelRect(window, static_cast<int>(row));
        if (static_cast<int>(row) == slack.selected)
        {
            DrawRectangleRec(rect, Color{17, 100, 163, 255});
        }
        DrawText(slack.channels[row].c_str(), PxI(rect.x + 12.0f), PxI(rect.y + 8.0f), 16, WHITE);
    }

    float y = content.y + 16.0f;
    for (const auto &line : slack.feed)
    {
        if (static_cast<size_t>(slack.selected) < slack.channels.size() && line.contact != slack.channels[static_cast<size_t>(slack.selected)])
        {
            continue;
        }
        y = DrawWrappedText(line.text, content.x + 196.0f, y, content.width - 216.0f, 16, TextDark) + 8.0f;
    }
}

static void DrawDiscord(const Window &window, const DiscordContent &discord)
{
    const Rectangle content = ContentRect(window);
    DrawRectangleRec(content, DiscordDark);
    DrawText(discord.channel.c_str(), PxI(content.x + 16.0f), PxI(content.y + 12.0f), 18, Color{220, 221, 222, 255});

    float y = content.y + 44.0f;
    const size_t first = discord.feed.size() > 12 ? discord.feed.size() - 12 : 0;
    for (size_t i = first; i < discord.feed.size(); ++i)
    {
        DrawText(discord.feed[i].contact.c_str(), PxI(content.x + 16.0f), PxI(y), 16, Color{250, 166, 26, 255});
        y = DrawWrappedText(discord.feed[i].text, content.x + 16.0f, y + 20.0f, content.width - 32.0f, 16, Color{220, 221, 222, 255}) + 6.0f;
    }
}

static void DrawActivityLog(const Window &window, const ActivityLogContent &log)
{
    const Rectangle content = ContentRect(window);
    DrawRectangleRec(content, Color{36, 38, 44, 255});

    const Rectangle bar{content.x + 16.0f, content.y + 16.0f, content.width - 32.0f, 24.0f};
    const float fraction = log.maxProgress > 0.0f ? std::clamp(log.progress / log.maxProgress, 0.0f, 1.0f) : 0.0f;
    DrawRectangleRec(bar, Color{60, 62, 70, 255});
    DrawRectangleRec(Rectangle{bar.x, bar.y, bar.width * fraction, bar.height}, Color{76, 175, 80, 255});
    DrawRectangleLinesEx(bar, 1.0f, Color{120, 120, 130, 255});
    DrawText(TextFormat("Fundraising %.0f%%", fraction * 100.0f), PxI(bar.x + 8.0f), PxI(bar.y + 4.0f), 16, WHITE);

    float y = bar.y + bar.height + 20.0f;
    for (auto it = log.entries.rbegin(); it != log.entries.rend(); ++it)
    {
        y = DrawWrappedText(*it, content.x + 16.0f, y, content.width - 32.0f, 16, Color{210, 214, 220, 255}) + 8.0f;
        if (y > content.y + content.height - 24.0f)
        {
            break;
        }
    }
}

static void DrawEmailView(const Window &window, const EmailViewContent &view)
{
    const Rectangle content = ContentRect(window);
    DrawText(TextFormat("From: %s", view.entry.email.sender.c_str()), PxI(content.x + 20.0f), PxI(content.y + 20.0f), 16, TextMuted);
    DrawText(Ellipsize(view.entry.email.subject, 20, content.width - 160.0f).c_str(), PxI(content.x + 20.0f), PxI(content.y + 44.0f), 20, TextDark);
    DrawWrappedText(view.entry.email.message, content.x + 20.0f, content.y + 90.0f, content.width - 40.0f, 18, TextDark);

    if (view.entry.replied)
    {
        DrawText(TextFormat("You replied: %s", view.entry.replyText.c_str()), PxI(content.x + 20.0f), PxI(content.y + content.height - 40.0f), 16, DARKGREEN);
    }
    else if (!view.entry.email.responses.empty())
    {
        DrawButton(ReplyButtonRect(window), "Reply", OutlookBlue, WHITE);
    }
}

static void DrawReply(const Window &window, const ReplyContent &reply)
{
    const Rectangle content = ContentRect(window);
    DrawText(TextFormat("To: %s", reply.entry.email.sender.c_str()), PxI(content.x + 20.0f), PxI(content.y + 20.0f), 16, TextMuted);
    DrawText("Pick a response, then type it out:", PxI(content.x + 20.0f), PxI(content.y + 120.0f), 16, TextMuted);

    const auto &responses = reply.entry.email.responses;
    for (size_t i = 0; i < responses.size(); ++i)
    {
        const Rectangle rect = ResponseOptionRect(window, static_cast<int>(i));
        const bool chosen = static_cast<int>(i) == reply.responseIndex;
        DrawRectangleRec(rect, chosen ? Color{212, 228, 255, 255} : Color{240, 240, 240, 255});
        DrawText(responses[i].c_str(), PxI(rect.x + 10.0f), PxI(rect.y + 8.0f), 16, TextDark);
    }

    const Rectangle box{content.x + 20.0f, content.y + content.height - 150.0f, content.width - 40.0f, 70.0f};
    DrawRectangleRec(box, WHITE);
    DrawRectangleLinesEx(box, 1.0f, WindowBorder);
    DrawWrappedText(reply.typed + "_", box.x + 10.0f, box.y + 10.0f, box.width - 20.0f, 18, TextDark);

    DrawButton(SendButtonRect(window), "Send", reply.complete ? OutlookBlue : LIGHTGRAY, WHITE);
}

static void DrawPhoneCall(const Window &window, const PhoneCallContent &call)
{
    const Rectangle content = ContentRect(window);
    DrawRectangleRec(content, Color{28, 28, 30, 255});
    DrawCircleV(Vector2{content.x + 50.0f, content.y + 45.0f}, 26.0f, Color{90, 90, 96, 255});
    DrawText(call.script.callerName.c_str(), PxI(content.x + 90.0f), PxI(content.y + 22.0f), 22, WHITE);
    DrawText(call.script.callerNumber.c_str(), PxI(content.x + 90.0f), PxI(content.y + 50.0f), 16, LIGHTGRAY);

    if (!call.answered)
    {
        DrawText("Incoming call...", PxI(content.x + 90.0f), PxI(content.y + 76.0f), 16, LIGHTGRAY);
        DrawButton(AnswerButtonRect(window), "Answer", Color{52, 199, 89, 255}, WHITE);
        DrawButton(HangUpButtonRect(window), "Decline", Color{255, 59, 48, 255}, WHITE);
        return;
    }

    DrawText(TextFormat("%02i:%02i", static_cast<int>(call.callClock) / 60, static_cast<int>(call.callClock) % 60),
             PxI(content.x + content.width - 70.0f), PxI(content.y + 22.0f), 16, LIGHTGRAY);

    for (int bar = 0; bar < 8; ++bar)
    {
        const float amplitude = std::fabs(std::sin(call.callClock * (2.0f + static_cast<float>(bar) * 0.45f) + static_cast<float>(bar)));
        const float height = 6.0f + amplitude * 24.0f;
        DrawRectangleRec(Rectangle{content.x + 90.0f + static_cast<float>(bar) * 12.0f, content.y + 110.0f - height, 8.0f, height}, Color{52, 199, 89, 255});
    }

    if (call.turn < call.script.turns.size())
    {
        const PhoneTurn &turn = call.script.turns[call.turn];
        const std::string shown = turn.text.substr(0, call.typedChars);
        DrawText(turn.speaker == Speaker::Caller ? call.script.callerName.c_str() : "You", PxI(content.x + 20.0f), PxI(content.y + 130.0f), 16, Color{120, 180, 255, 255});
        DrawWrappedText(shown, content.x + 20.0f, content.y + 152.0f, content.width - 40.0f, 18, WHITE);
    }
    DrawButton(HangUpButtonRect(window), "Hang up", Color{255, 59, 48, 255}, WHITE);
}

static void DrawPopup(const Window &window, const PopupContent &popup)
{
    const Rectangle frame = window.frame;
    switch (popup.style)
    {
    case PopupStyle::EmailToast:
    case PopupStyle::ChatToast:
    {
        const bool mail = popup.style == PopupStyle::EmailToast;
        const Color accent = mail ? (popup.inboxId >= 0 ? OutlookBlue : Color{255, 165, 0, 255}) : MessagesBlue;
        DrawRectangleRec(frame, Fade(WHITE, 0.94f));
        DrawRectangleLinesEx(frame, 2.0f, accent);
        DrawRectangleLinesEx(Rectangle{frame.x + 12.0f, frame.y + frame.height * 0.5f - 12.0f, 24.0f, 24.0f}, 2.0f, accent);
        DrawText(popup.heading.c_str(), PxI(frame.x + 48.0f), PxI(frame.y + 12.0f), 20, TextDark);
        DrawText(Ellipsize(popup.body, 16, frame.width - 60.0f).c_str(), PxI(frame.x + 48.0f), PxI(frame.y + 40.0f), 16, TextMuted);
        break;
    }
    case PopupStyle::Milestone:
    {
        const float alpha = window.lifetime > 0.0f && window.lifetime < 0.5f ? window.lifetime / 0.5f : 1.0f;
        DrawRectangleRec(frame, Fade(Color{50, 100, 150, 255}, alpha));
        DrawRectangleLinesEx(frame, 2.0f, Fade(Color{100, 150, 200, 255}, alpha));
        const int width = MeasureText(popup.heading.c_str(), 28);
        DrawText(popup.heading.c_str(), PxI(frame.x + (frame.width - static_cast<float>(width)) * 0.5f), PxI(frame.y + frame.height * 0.5f - 14.0f), 28, Fade(WHITE, alpha));
        break;
    }
    case PopupStyle::Interrupt:
    {
        DrawRectangleRec(frame, DiscordDark);
        DrawRectangleRec(frame, Fade(BLACK, 0.4f));
        DrawText(popup.heading.c_str(), 50, 50, 36, Color{200, 200, 200, 255});
        const float bodyWidth = frame.width - 200.0f;
        DrawWrappedText(popup.body, frame.x + 100.0f, frame.y + frame.height * 0.5f - 30.0f, bodyWidth, 48, WHITE);
        const char *hint = "Click the X to close";
        DrawText(hint, PxI(frame.x + (frame.width - static_cast<float>(MeasureText(hint, 32))) * 0.5f), PxI(frame.y + frame.height - 100.0f), 32, Color{150, 150, 150, 255});
        break;
    }
    }
}

void DrawWindow(const Window &window, bool focused)
{
    if (!window.visible)
    {
        return;
    }

    if (window.chrome)
    {
        DrawRectangleRec(window.frame, WindowBackground);
        const Rectangle titleBar = TitleBarRect(window);
        DrawRectangleRec(titleBar, focused ? TitleBarFocused : TitleBarIdle);
        DrawText(Ellipsize(window.title, 20, titleBar.width - 60.0f).c_str(), PxI(titleBar.x + 10.0f), PxI(titleBar.y + 10.0f), 20, TextDark);
    }

    std::visit(
        Overloaded{
            [&](const InventoryContent &c) { DrawInventory(window, c); },
            [&](const FtlContent &c) { DrawFtl(window, c); },
            [&](const ZomboidContent &c) { DrawZomboid(window, c); },
            [&](const OutlookContent &c) { DrawOutlook(window, c); },
            [&](const MessagesContent &c) { DrawMessages(window, c); },
            [&](const SlackContent &c) { DrawSlack(window, c); },
            [&](const DiscordContent &c) { DrawDiscord(window, c); },
            [&](const ActivityLogContent &c) { DrawActivityLog(window, c); },
            [&](const EmailViewContent &c) { DrawEmailView(window, c); },
            [&](const ReplyContent &c) { DrawReply(window, c); },
            [&](const PhoneCallContent &c) { DrawPhoneCall(window, c); },
            [&](const PopupContent &c) { DrawPopup(window, c); },
        },
        window.content);

    if (window.closable)
    {
        DrawCloseGlyph(CloseButtonRect(window), window.chrome ? TextDark : LIGHTGRAY);
    }
    if (window.chrome)
    {
        DrawRectangleLinesEx(window.frame, focused ? 2.0f : 1.0f, focused ? OutlookBlue : WindowBorder);
    }
}

void DrawCarriedItem(const ContentItem &item, Vector2 point)
{
    const Rectangle card{point.x - 25.0f, point.y - 25.0f, 50.0f, 50.0f};
    DrawRectangleRec(card, Fade(Color{255, 246, 214, 255}, 0.85f));
    DrawRectangleLinesEx(card, 2.0f, Color{180, 150, 90, 255});
    DrawText(Ellipsize(item.label, 10, card.width - 4.0f).c_str(), PxI(card.x + 2.0f), PxI(card.y + 20.0f), 10, TextDark);
}
