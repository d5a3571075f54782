#include "window.h"

#include "overloaded.h"

#include <algorithm>
#include <utility>

constexpr float TypingSecondsPerChar = 0.05f;
constexpr float PauseBetweenTurns = 0.8f;
constexpr float MinWindowWidth = 160.0f;
constexpr float MinWindowHeight = TitleBarHeight + 60.0f;

static const std::string &ReplyTarget(const ReplyContent &reply)
{
    static const std::string fallback = "OK";
    const auto &responses = reply.entry.email.responses;
    if (reply.responseIndex < 0 || static_cast<size_t>(reply.responseIndex) >= responses.size())
    {
        return fallback;
    }
    return responses[static_cast<size_t>(reply.responseIndex)];
}

static void AdvancePhoneCall(PhoneCallContent &call, float dt)
{
    if (!call.answered || call.finished)
    {
        return;
    }

    call.callClock += dt;
    call.turnClock += dt;

    while (call.turn < call.script.turns.size())
    {
        const size_t length = call.script.turns[call.turn].text.size();
        const float typingTime = static_cast<float>(length) * TypingSecondsPerChar;
        if (call.turnClock < typingTime)
        {
            call.typedChars = std::min(length, static_cast<size_t>(call.turnClock / TypingSecondsPerChar));
            return;
        }

        call.typedChars = length;
        if (call.turnClock - typingTime < PauseBetweenTurns)
        {
            return;
        }

        call.turnClock -= typingTime + PauseBetweenTurns;
        ++call.turn;
        call.typedChars = 0;
    }

    call.finished = true;
}

const char *WindowKindLabel(WindowKind kind)
{
    switch (kind)
    {
    case WindowKind::Inventory:
        return "Inventory";
    case WindowKind::Ftl:
        return "FTL";
    case WindowKind::Zomboid:
        return "Zomboid";
    case WindowKind::Outlook:
        return "Outlook";
    case WindowKind::Messages:
        return "Messages";
    case WindowKind::Slack:
        return "Slack";
    case WindowKind::Discord:
        return "Discord";
    case WindowKind::ActivityLog:
        return "Activity Log";
    case WindowKind::EmailView:
        return "Email";
    case WindowKind::Reply:
        return "Reply";
    case WindowKind::PhoneCall:
        return "Phone Call";
    case WindowKind::Popup:
        return "Popup";
    default:
        return "Unknown";
    }
}

Window MakeWindow(std::string title, Rectangle frame, WindowContent content)
{
    Window window;
    window.title = std::move(title);
    window.frame = frame;
    window.content = std::move(content);
    return window;
}

WindowKind KindOf(const Window &window)
{
    return KindOf(window.content);
}

Rectangle TitleBarRect(const Window &window)
{
    if (!window.chrome)
    {
        return Rectangle{window.frame.x, window.frame.y, 0.0f, 0.0f};
    }
    return Rectangle{window.frame.x, window.frame.y, window.frame.width, TitleBarHeight};
}

Rectangle CloseButtonRect(const Window &window)
{
    if (!window.chrome)
    {
        return Rectangle{window.frame.x + window.frame.width - 60.0f, window.frame.y + 20.0f, 40.0f, 40.0f};
    }
    return Rectangle{
        window.frame.x + window.frame.width - 25.0f,
        window.frame.y + (TitleBarHeight - CloseButtonSize) * 0.5f,
        CloseButtonSize,
        CloseButtonSize};
}

Rectangle ContentRect(const Window &window)
{
    if (!window.chrome)
    {
        return window.frame;
    }
    return Rectangle{
        window.frame.x,
        window.frame.y + TitleBarHeight,
        window.frame.width,
        std::max(0.0f, window.frame.height - TitleBarHeight)};
}

bool WindowHitTest(const Window &window, Vector2 point)
{
    return window.visible && CheckCollisionPointRec(point, window.frame);
}

WindowRegion WindowRegionAt(const Window &window, Vector2 point)
{
    if (!WindowHitTest(window, point))
    {
        return WindowRegion::None;
    }
    if (window.closable && CheckCollisionPointRec(point, CloseButtonRect(window)))
    {
        return WindowRegion::CloseButton;
    }
    if (window.chrome && CheckCollisionPointRec(point, TitleBarRect(window)))
    {
        return WindowRegion::TitleBar;
    }
    return WindowRegion::Content;
}

void MoveWindowTo(Window &window, Vector2 topLeft)
{
    window.frame.x = topLeft.x;
    window.frame.y = topLeft.y;
}

void ResizeWindow(Window &window, float width, float height)
{
    if (!window.resizable)
    {
        return;
    }
    window.frame.width = std::max(width, MinWindowWidth);
    window.frame.height = std::max(height, MinWindowHeight);
}

void RequestClose(Window &window)
{
    if (window.closable)
    {
        window.closeRequested = true;
    }
}

ItemTray *WindowTray(Window &window)
{
    return std::visit(
        Overloaded{
            [](InventoryContent &c) -> ItemTray * { return &c.tray; },
            [](FtlContent &c) -> ItemTray * { return &c.cargo; },
            [](ZomboidContent &c) -> ItemTray * { return &c.loot; },
            [](auto &) -> ItemTray * { return nullptr; },
        },
        window.content);
}

const ItemTray *WindowTray(const Window &window)
{
    return std::visit(
        Overloaded{
            [](const InventoryContent &c) -> const ItemTray * { return &c.tray; },
            [](const FtlContent &c) -> const ItemTray * { return &c.cargo; },
            [](const ZomboidContent &c) -> const ItemTray * { return &c.loot; },
            [](const auto &) -> const ItemTray * { return nullptr; },
        },
        window.content);
}

Rectangle TraySlotRect(const Window &window, int slot)
{
    const ItemTray *tray = WindowTray(window);
    const int columns = tray ? std::max(tray->columns, 1) : 1;
    const Rectangle content = ContentRect(window);
    const int col = slot % columns;
    const int row = slot / columns;
    return Rectangle{
        content.x + 20.0f + static_cast<float>(col) * (TraySlotSize + TraySlotPadding),
        content.y + 20.0f + static_cast<float>(row) * (TraySlotSize + TraySlotPadding),
        TraySlotSize,
        TraySlotSize};
}

int TrayItemAt(const Window &window, Vector2 point)
{
    const ItemTray *tray = WindowTray(window);
    if (!tray)
    {
        return -1;
    }

    for (size_t i = 0; i < tray->items.size(); ++i)
    {
        if (CheckCollisionPointRec(point, TraySlotRect(window, static_cast<int>(i))))
        {
            return tray->items[i].id;
        }
    }
    return -1;
}

bool AcceptsDrop(const Window &window, const ContentItem &item, Vector2 point)
{
    const ItemTray *tray = WindowTray(window);
    return tray && window.visible && CheckCollisionPointRec(point, ContentRect(window)) && TrayAccepts(*tray, item);
}

Rectangle InboxRowRect(const Window &window, int visibleRow)
{
    const Rectangle content = ContentRect(window);
    return Rectangle{
        content.x + OutlookSidebarWidth + 10.0f,
        content.y + 10.0f + static_cast<float>(visibleRow) * 60.0f,
        content.width - OutlookSidebarWidth - 20.0f,
        55.0f};
}

Rectangle ConversationRowRect(const Window &window, int row)
{
    const Rectangle content = ContentRect(window);
    return Rectangle{content.x, content.y + static_cast<float>(row) * 50.0f, MessagesSidebarWidth, 50.0f};
}

Rectangle SlackChannelRect(const Window &window, int row)
{
    const Rectangle content = ContentRect(window);
    return Rectangle{content.x, content.y + 40.0f + static_cast<float>(row) * 32.0f, 180.0f, 32.0f};
}

Rectangle ReplyButtonRect(const Window &window)
{
    const Rectangle content = ContentRect(window);
    return Rectangle{content.x + content.width - 120.0f, content.y + 20.0f, 100.0f, 30.0f};
}

Rectangle ResponseOptionRect(const Window &window, int index)
{
    const Rectangle content = ContentRect(window);
    return Rectangle{content.x + 20.0f, content.y + 150.0f + static_cast<float>(index) * 40.0f, content.width - 40.0f, 32.0f};
}

Rectangle SendButtonRect(const Window &window)
{
    return Rectangle{window.frame.x + window.frame.width - 140.0f, window.frame.y + window.frame.height - 60.0f, 120.0f, 40.0f};
}

Rectangle AnswerButtonRect(const Window &window)
{
    return Rectangle{window.frame.x + 50.0f, window.frame.y + window.frame.height - 60.0f, 120.0f, 40.0f};
}

Rectangle HangUpButtonRect(const Window &window)
{
    return Rectangle{window.frame.x + window.frame.width - 170.0f, window.frame.y + window.frame.height - 60.0f, 120.0f, 40.0f};
}

WindowAction HandleContentClick(Window &window, Vector2 point)
{
    WindowAction action;

    std::visit(
        Overloaded{
            [&](OutlookContent &outlook) {
                for (int row = 0; row < InboxVisibleRows; ++row)
                {
                    if (static_cast<size_t>(row) >= outlook.inbox.size())
                    {
                        break;
                    }
                    if (CheckCollisionPointRec(point, InboxRowRect(window, row)))
                    {
                        InboxEntry &entry = outlook.inbox[static_cast<size_t>(row)];
                        entry.read = true;
                        entry.blinking = false;
                        action.type = ActionType::OpenEmail;
                        action.inboxId = entry.id;
                        break;
                    }
                }
            },
            [&](MessagesContent &messages) {
                for (size_t row = 0; row < messages.conversations.size(); ++row)
                {
                    if (CheckCollisionPointRec(point, ConversationRowRect(window, static_cast<int>(row))))
                    {
                        messages.selected = static_cast<int>(row);
                        messages.conversations[row].unread = false;
                        break;
                    }
                }
            },
            [&](SlackContent &slack) {
                for (size_t row = 0; row < slack.channels.size(); ++row)
                {
                    if (CheckCollisionPointRec(point, SlackChannelRect(window, static_cast<int>(row))))
                    {
                        slack.selected = static_cast<int>(row);
                        break;
                    }
                }
            },
            [&](EmailViewContent &view) {
                if (!view.entry.email.responses.empty() && !view.entry.replied &&
                    CheckCollisionPointRec(point, ReplyButtonRect(window)))
                {
                    action.type = ActionType::OpenReply;
                    action.inboxId = view.entry.id;
                    action.responseIndex = 0;
                }
            },
            [&](ReplyContent &reply) {
                const auto &responses = reply.entry.email.responses;
                for (size_t i = 0; i < responses.size(); ++i)
                {
                    if (CheckCollisionPointRec(point, ResponseOptionRect(window, static_cast<int>(i))))
                    {
                        if (reply.responseIndex != static_cast<int>(i))
                        {
                            reply.responseIndex = static_cast<int>(i);
                            reply.typed.clear();
                            reply.complete = false;
                        }
                        return;
                    }
                }

                if (reply.complete && CheckCollisionPointRec(point, SendButtonRect(window)))
                {
                    action.type = ActionType::SendReply;
                    action.inboxId = reply.entry.id;
                    action.text = reply.typed;
                }
            },
            [&](PhoneCallContent &call) {
                if (!call.answered && CheckCollisionPointRec(point, AnswerButtonRect(window)))
                {
                    call.answered = true;
                    call.turn = 0;
                    call.typedChars = 0;
                    call.turnClock = 0.0f;
                    call.callClock = 0.0f;
                    window.frame.height = 300.0f;
                    action.type = ActionType::AnswerCall;
                }
                else if (CheckCollisionPointRec(point, HangUpButtonRect(window)))
                {
                    action.type = ActionType::HangUp;
                }
            },
            [&](PopupContent &popup) {
                if (popup.style != PopupStyle::Interrupt)
                {
                    action.type = ActionType::DismissPopup;
                    action.inboxId = popup.inboxId;
                }
            },
            [](auto &) {},
        },
        window.content);

    return action;
}

WindowAction HandleContentKey(Window &window, int codepoint)
{
    if (codepoint <= 0)
    {
        return WindowAction{};
    }

    if (auto *reply = std::get_if<ReplyContent>(&window.content))
    {
        // Every key press types the next letter of the chosen response.
        const std::string &target = ReplyTarget(*reply);
        if (!reply->complete && reply->typed.size() < target.size())
        {
            reply->typed.push_back(target[reply->typed.size()]);
            reply->complete = reply->typed.size() >= target.size();
        }
    }
    return WindowAction{};
}

void UpdateWindow(Window &window, float dt)
{
    if (window.lifetime > 0.0f)
    {
        window.lifetime -= dt;
        if (window.lifetime <= 0.0f)
        {
            window.closeRequested = true;
        }
    }

    std::visit(
        Overloaded{
            [dt](ZomboidContent &zomboid) {
                zomboid.cycleTimer += dt;
                if (zomboid.cycleTimer >= zomboid.cycleInterval && zomboid.screenCount > 0)
                {
                    zomboid.cycleTimer = 0.0f;
                    zomboid.screen = (zomboid.screen + 1) % zomboid.screenCount;
                }
            },
            [dt](FtlContent &ftl) { ftl.alertPulse += dt; },
            [dt](OutlookContent &outlook) { outlook.blinkTimer += dt; },
            [dt](PopupContent &popup) { popup.age += dt; },
            [dt, &window](PhoneCallContent &call) {
                AdvancePhoneCall(call, dt);
                if (call.finished)
                {
                    window.closeRequested = true;
                }
            },
            [](auto &) {},
        },
        window.content);
}
