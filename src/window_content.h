#pragma once

#include "content_item.h"
#include "content_store.h"

#include <cstddef>
#include <string>
#include <variant>
#include <vector>

struct InventoryContent
{
    ItemTray tray;
};

struct FtlContent
{
    ItemTray cargo;
    float alertPulse = 0.0f;
};

struct ZomboidContent
{
    ItemTray loot;
    int screen = 0;
    int screenCount = 4;
    float cycleTimer = 0.0f;
    float cycleInterval = 3.0f;
};

struct InboxEntry
{
    int id = -1;
    EmailTemplate email;
    std::string receivedAt;
    bool read = false;
    bool urgent = false;
    bool blinking = false;
    bool replied = false;
    std::string replyText;
};

struct OutlookContent
{
    std::vector<InboxEntry> inbox;
    int nextEntryId = 1;
    float blinkTimer = 0.0f;
};

struct Conversation
{
    std::string contact;
    std::vector<std::string> lines;
    bool unread = true;
};

struct MessagesContent
{
    std::vector<Conversation> conversations;
    int selected = -1;
};

struct SlackContent
{
    std::vector<std::string> channels;
    std::vector<ChatLine> feed;
    int selected = 0;
};

struct DiscordContent
{
    std::string channel = "# conference-planning";
    std::vector<ChatLine> feed;
};

struct ActivityLogContent
{
    std::vector<std::string> entries;
    float progress = 0.0f;
    float maxProgress = 100.0f;
};

struct EmailViewContent
{
    InboxEntry entry;
};

struct ReplyContent
{
    InboxEntry entry;
    int responseIndex = 0;
    std::string typed;
    bool complete = false;
};

struct PhoneCallContent
{
    PhoneScript script;
    bool answered = false;
    size_t turn = 0;
    size_t typedChars = 0;
    float turnClock = 0.0f;
    float callClock = 0.0f;
    bool finished = false;
};

enum class PopupStyle
{
    EmailToast,
    ChatToast,
    Milestone,
    Interrupt
};

struct PopupContent
{
    PopupStyle style = PopupStyle::EmailToast;
    std::string heading;
    std::string body;
    int inboxId = -1;
    float age = 0.0f;
};

// Alternative order matches WindowKind.
using WindowContent = std::variant<
    InventoryContent,
    FtlContent,
    ZomboidContent,
    OutlookContent,
    MessagesContent,
    SlackContent,
    DiscordContent,
    ActivityLogContent,
    EmailViewContent,
    ReplyContent,
    PhoneCallContent,
    PopupContent>;

enum class WindowKind
{
    Inventory,
    Ftl,
    Zomboid,
    Outlook,
    Messages,
    Slack,
    Discord,
    ActivityLog,
    EmailView,
    Reply,
    PhoneCall,
    Popup
};

inline WindowKind KindOf(const WindowContent &content)
{
    return static_cast<WindowKind>(content.index());
}

const char *WindowKindLabel(WindowKind kind);

enum class ActionType
{
    None,
    OpenEmail,
    OpenReply,
    SendReply,
    AnswerCall,
    HangUp,
    DismissPopup
};

// What a content click asks the game to do. Windows never act on each other.
struct WindowAction
{
    ActionType type = ActionType::None;
    int inboxId = -1;
    int responseIndex = 0;
    std::string text;
};
