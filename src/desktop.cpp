#include "desktop.h"

#include <cstddef>
#include <utility>

constexpr float ToastWidth = 350.0f;
constexpr float ToastHeight = 80.0f;
constexpr float ToastMargin = 20.0f;

static Window MakeDesktopApp(std::string title, Rectangle frame, WindowContent content)
{
    Window window = MakeWindow(std::move(title), frame, std::move(content));
    window.closable = false;
    return window;
}

static ItemTray MakeTray(std::vector<ContentItem> items, std::vector<std::string> accepted)
{
    ItemTray tray;
    tray.items = std::move(items);
    tray.acceptedCategories = std::move(accepted);
    return tray;
}

static Rectangle CenteredFrame(Vector2 screen, float width, float height)
{
    return Rectangle{(screen.x - width) * 0.5f, (screen.y - height) * 0.5f, width, height};
}

Window MakeInventoryWindow(Rectangle frame, std::vector<ContentItem> items)
{
    return MakeDesktopApp("Inventory", frame, InventoryContent{MakeTray(std::move(items), {})});
}

Window MakeFtlWindow(Rectangle frame, std::vector<ContentItem> cargo)
{
    FtlContent ftl;
    ftl.cargo = MakeTray(std::move(cargo), {CategoryMenuCard, CategoryWeapon});
    ftl.cargo.columns = 4;
    ftl.cargo.rows = 2;
    return MakeDesktopApp("FTL - Ship Cargo", frame, std::move(ftl));
}

Window MakeZomboidWindow(Rectangle frame, std::vector<ContentItem> loot)
{
    ZomboidContent zomboid;
    zomboid.loot = MakeTray(std::move(loot), {CategorySupply, CategoryMenuCard});
    zomboid.loot.columns = 5;
    zomboid.loot.rows = 2;
    return MakeDesktopApp("Project Zomboid - Loot", frame, std::move(zomboid));
}

Window MakeOutlookWindow(Rectangle frame)
{
    return MakeDesktopApp("Outlook", frame, OutlookContent{});
}

Window MakeMessagesWindow(Rectangle frame)
{
    return MakeDesktopApp("Messages", frame, MessagesContent{});
}

Window MakeSlackWindow(Rectangle frame, const ContentStore &store)
{
    SlackContent slack;
    slack.feed = store.ChatChannel(ChannelSlack);
    for (const ChatLine &line : slack.feed)
    {
        bool known = false;
        for (const std::string &channel : slack.channels)
        {
            known = known || channel == line.contact;
        }
        if (!known)
        {
            slack.channels.push_back(line.contact);
        }
    }
    return MakeDesktopApp("Slack", frame, std::move(slack));
}

Window MakeDiscordWindow(Rectangle frame)
{
    return MakeDesktopApp("Discord", frame, DiscordContent{});
}

Window MakeActivityLogWindow(Rectangle frame, float maxProgress)
{
    ActivityLogContent log;
    log.maxProgress = maxProgress;
    return MakeDesktopApp("Activity Log", frame, std::move(log));
}

Window MakeEmailViewWindow(const InboxEntry &entry, Vector2 screen)
{
    return MakeWindow(entry.email.subject, CenteredFrame(screen, 700.0f, 500.0f), EmailViewContent{entry});
}

Window MakeReplyWindow(const InboxEntry &entry, Vector2 screen)
{
    ReplyContent reply;
    reply.entry = entry;
    Rectangle frame = CenteredFrame(screen, 600.0f, 450.0f);
    frame.x += 40.0f;
    frame.y += 40.0f;
    return MakeWindow("RE: " + entry.email.subject, frame, std::move(reply));
}

Window MakePhoneCallWindow(const PhoneScript &script, Vector2 screen)
{
    PhoneCallContent call;
    call.script = script;
    Window window = MakeWindow("Incoming Call", CenteredFrame(screen, 400.0f, 200.0f), std::move(call));
    window.draggable = false;
    return window;
}

Window MakeToastWindow(PopupStyle style, std::string heading, std::string body, int inboxId, Vector2 screen)
{
    PopupContent popup;
    popup.style = style;
    popup.heading = std::move(heading);
    popup.body = std::move(body);
    popup.inboxId = inboxId;

    const float top = style == PopupStyle::ChatToast ? ToastMargin * 2.0f + ToastHeight : ToastMargin;
    std::string title = popup.heading;
    Window window = MakeWindow(
        std::move(title), Rectangle{screen.x - ToastWidth - ToastMargin, top, ToastWidth, ToastHeight}, std::move(popup));
    window.chrome = false;
    window.focusable = false;
    window.closable = false;
    window.draggable = false;
    window.lifetime = style == PopupStyle::ChatToast ? ChatToastLifetime : EmailToastLifetime;
    return window;
}

Window MakeInterruptWindow(const ChatLine &line, Vector2 screen)
{
    PopupContent popup;
    popup.style = PopupStyle::Interrupt;
    popup.heading = "Calvelli";
    popup.body = line.text;

    Window window = MakeWindow("Discord", Rectangle{0.0f, 0.0f, screen.x, screen.y}, std::move(popup));
    window.modal = true;
    window.chrome = false;
    window.draggable = false;
    return window;
}

Window MakeMilestoneBanner(float percent, Vector2 screen)
{
    PopupContent popup;
    popup.style = PopupStyle::Milestone;
    popup.heading = percent >= 100.0f ? "Fundraising complete!" : TextFormat("Fundraising %.0f%% reached", percent);

    Window window = MakeWindow("Milestone", Rectangle{(screen.x - 600.0f) * 0.5f, 40.0f, 600.0f, 60.0f}, std::move(popup));
    window.chrome = false;
    window.focusable = false;
    window.closable = false;
    window.draggable = false;
    window.lifetime = MilestoneBannerLifetime;
    return window;
}

void PushLog(std::vector<std::string> &log, const std::string &line, size_t maxLines)
{
    if (line.empty())
    {
        return;
    }
    log.push_back(line);
    if (log.size() > maxLines)
    {
        const size_t overflow = log.size() - maxLines;
        log.erase(log.begin(), log.begin() + static_cast<std::ptrdiff_t>(overflow));
    }
}
