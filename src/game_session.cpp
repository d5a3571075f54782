#include "game_session.h"

#include "desktop.h"
#include "notifications.h"

#include "raylib.h"

#include <optional>
#include <string>
#include <utility>
#include <variant>

static void AddPlayerWork(GameSession &session, float amount)
{
    session.stats.playerWork += session.progress.Add(amount);
}

static void AddBackgroundWork(GameSession &session, float amount)
{
    session.stats.backgroundWork += session.progress.Add(amount);
}

static void OpenEmail(GameSession &session, int inboxId)
{
    InboxEntry *entry = FindInboxEntry(session.windows, inboxId);
    if (!entry)
    {
        TraceLog(LOG_WARNING, "GAME: inbox entry %i is gone", inboxId);
        return;
    }
    entry->read = true;
    entry->blinking = false;
    session.windows.Spawn(MakeEmailViewWindow(*entry, session.screen));
}

static void CountDismissal(GameSession &session)
{
    ++session.stats.notificationsDismissed;
    AddPlayerWork(session, session.config.progress.dismissalWork);
}

static void HandleAction(GameSession &session, const WindowAction &action, WindowId source)
{
    switch (action.type)
    {
    case ActionType::None:
        break;
    case ActionType::OpenEmail:
        OpenEmail(session, action.inboxId);
        break;
    case ActionType::OpenReply:
    {
        InboxEntry *entry = FindInboxEntry(session.windows, action.inboxId);
        if (!entry)
        {
            TraceLog(LOG_WARNING, "GAME: cannot reply, inbox entry %i is gone", action.inboxId);
            break;
        }
        const InboxEntry snapshot = *entry;
        session.windows.Close(source);
        session.windows.Spawn(MakeReplyWindow(snapshot, session.screen));
        break;
    }
    case ActionType::SendReply:
    {
        std::string subject = "(unknown)";
        if (InboxEntry *entry = FindInboxEntry(session.windows, action.inboxId))
        {
            entry->replied = true;
            entry->replyText = action.text;
            subject = entry->email.subject;
        }
        session.windows.Close(source);
        ++session.stats.repliesSent;
        AddPlayerWork(session, session.config.progress.replyWork);
        LogActivity(session, "REPLY SENT // RE: " + subject);
        break;
    }
    case ActionType::AnswerCall:
        ++session.stats.callsAnswered;
        TraceLog(LOG_INFO, "GAME: call answered");
        break;
    case ActionType::HangUp:
        session.windows.Close(source);
        CountDismissal(session);
        break;
    case ActionType::DismissPopup:
        session.windows.Close(source);
        CountDismissal(session);
        if (action.inboxId >= 0)
        {
            OpenEmail(session, action.inboxId);
        }
        break;
    }
}

static void HandlePointerDown(GameSession &session, const PointerResult &result)
{
    if (!result.closed)
    {
        HandleAction(session, result.action, result.window);
        return;
    }

    TraceLog(LOG_INFO, "GAME: %s window dismissed", WindowKindLabel(result.kind));
    if (result.window == session.interruptWindow)
    {
        ++session.stats.interruptionsDismissed;
        AddPlayerWork(session, session.config.progress.dismissalWork);
        LogActivity(session, "INTERRUPT DISMISSED // back to the menus");
    }
    else if (result.kind == WindowKind::PhoneCall || result.kind == WindowKind::Popup)
    {
        CountDismissal(session);
    }
}

static void HandleDrop(GameSession &session, const DropResult &drop)
{
    if (!drop.wasCarrying)
    {
        return;
    }

    const Window *destination = session.windows.Find(drop.destination);
    const std::string target = destination ? destination->title : "nowhere";
    if (drop.transferred)
    {
        ++session.stats.itemsMoved;
        AddPlayerWork(session, session.config.progress.transferWork);
        LogActivity(session, "ITEM MOVED // " + drop.item.label + " -> " + target);
    }
    else if (destination)
    {
        ++session.stats.dropsRefused;
        LogActivity(session, "DROP REFUSED // " + drop.item.label + " does not fit in " + target);
    }
}

static void HandleInput(GameSession &session, const FrameInput &input)
{
    WindowManager &windows = session.windows;
    windows.PointerMove(input.pointer);

    if (input.pressed)
    {
        HandlePointerDown(session, windows.PointerDown(input.pointer));
    }
    if (input.released)
    {
        HandleDrop(session, windows.PointerUp());
    }
    for (int codepoint : input.codepoints)
    {
        const WindowId target = windows.Focused();
        HandleAction(session, windows.KeyTyped(codepoint), target);
    }
    if (input.cycleFocus)
    {
        windows.CycleFocus();
    }
}

static void AdvanceWork(GameSession &session, float dt)
{
    AddBackgroundWork(session, session.config.progress.autoRate * dt);

    if (std::optional<ActivityEvent> event = session.activity.Advance(dt, session.content))
    {
        ++session.stats.activityEvents;
        LogActivity(session, event->line);
        AddBackgroundWork(session, event->work);
        session.congratulationScheduler.Arm(RandomSeconds(session.config.schedulers.congratulationDelay));
    }
}

static void AdvanceSchedulers(GameSession &session, float dt)
{
    WindowManager &windows = session.windows;
    const ContentStore &store = session.content;

    if (auto event = session.emailScheduler.Advance(dt, store))
    {
        DeliverNotification(windows, store, *event, session.screen);
    }
    if (auto event = session.congratulationScheduler.Advance(dt, store))
    {
        DeliverNotification(windows, store, *event, session.screen);
    }
    if (auto event = session.chatScheduler.Advance(dt, store))
    {
        DeliverNotification(windows, store, *event, session.screen);
    }

    const bool callLive = windows.Find(session.phoneWindow) != nullptr;
    if (auto event = session.phoneScheduler.Advance(dt, store, callLive))
    {
        session.phoneWindow = DeliverNotification(windows, store, *event, session.screen);
        TraceLog(LOG_INFO, "GAME: incoming call from %s", store.Phone(event->contentIndex).callerName.c_str());
    }

    const bool interruptLive = windows.Find(session.interruptWindow) != nullptr;
    if (auto event = session.discordScheduler.Advance(dt, store, interruptLive))
    {
        session.interruptWindow = DeliverNotification(windows, store, *event, session.screen);
    }
}

static void SyncActivityLog(GameSession &session)
{
    Window *window = session.windows.Find(session.activityLogWindow);
    if (auto *log = window ? std::get_if<ActivityLogContent>(&window->content) : nullptr)
    {
        log->progress = session.progress.Value();
        log->maxProgress = session.progress.Max();
    }
}

static void EnterEnding(GameSession &session)
{
    session.phase = GamePhase::Ending;
    BeginEnding(session.ending, session.stats, session.progress.Max(), session.screen);
    TraceLog(LOG_INFO, "GAME: fundraising complete after %.1fs (player %.1f%%, background %.1f%%)",
             session.stats.elapsed,
             PlayerWorkPercent(session.stats, session.progress.Max()),
             BackgroundWorkPercent(session.stats, session.progress.Max()));
}

static std::vector<ContentItem> InventoryItems()
{
    return {
        {1, "Form", CategoryMenuCard},
        {2, "List", CategoryMenuCard},
        {3, "Sheet", CategoryMenuCard},
        {4, "Medkit", CategorySupply},
        {5, "Laser", CategoryWeapon},
    };
}

static void DrawTaskbar(const GameSession &session)
{
    const float height = 36.0f;
    const Rectangle bar{0.0f, session.screen.y - height, session.screen.x, height};
    DrawRectangleRec(bar, Fade(BLACK, 0.75f));

    const Window *focused = session.windows.Find(session.windows.Focused());
    DrawText(focused ? focused->title.c_str() : "Desktop", 16, static_cast<int>(bar.y + 9.0f), 18, RAYWHITE);

    const int total = static_cast<int>(session.stats.elapsed);
    const char *clock = TextFormat("%02i:%02i  |  %.0f%%", total / 60, total % 60, session.progress.Fraction() * 100.0f);
    DrawText(clock, static_cast<int>(bar.width) - MeasureText(clock, 18) - 16, static_cast<int>(bar.y + 9.0f), 18, RAYWHITE);
}

GameSession::GameSession(const GameConfig &gameConfig, ContentStore store)
    : config(gameConfig),
      content(std::move(store)),
      screen{static_cast<float>(gameConfig.display.width), static_cast<float>(gameConfig.display.height)},
      progress(gameConfig.progress.max),
      activity(gameConfig.schedulers.activity, gameConfig.progress.activityMin, gameConfig.progress.activityMax),
      emailScheduler(NotificationKind::Email, ChannelRegularEmail, SelectionPolicy::Random, gameConfig.schedulers.email),
      congratulationScheduler(NotificationKind::Congratulation, ChannelCongratulation, SelectionPolicy::NoRepeat,
                              gameConfig.schedulers.congratulationDelay, false),
      chatScheduler(NotificationKind::Chat, ChannelMessages, SelectionPolicy::Sequential, gameConfig.schedulers.chat),
      phoneScheduler(NotificationKind::Phone, ChannelPhone, SelectionPolicy::NoRepeat, gameConfig.schedulers.phone),
      discordScheduler(NotificationKind::DiscordInterrupt, ChannelDiscord, SelectionPolicy::Sequential, gameConfig.schedulers.discord)
{
}

void InitSession(GameSession &session)
{
    WindowManager &windows = session.windows;
    windows.Spawn(MakeInventoryWindow(Rectangle{60.0f, 80.0f, 450.0f, 340.0f}, InventoryItems()));
    windows.Spawn(MakeFtlWindow(Rectangle{560.0f, 80.0f, 420.0f, 300.0f}, {{6, "Burst Laser", CategoryWeapon}}));
    windows.Spawn(MakeZomboidWindow(Rectangle{1030.0f, 80.0f, 450.0f, 320.0f}, {{7, "Canned Beans", CategorySupply}}));
    windows.Spawn(MakeOutlookWindow(Rectangle{60.0f, 460.0f, 700.0f, 560.0f}));
    windows.Spawn(MakeMessagesWindow(Rectangle{800.0f, 460.0f, 560.0f, 420.0f}));
    windows.Spawn(MakeSlackWindow(Rectangle{1000.0f, 300.0f, 480.0f, 400.0f}, session.content));
    windows.Spawn(MakeDiscordWindow(Rectangle{1500.0f, 120.0f, 400.0f, 320.0f}));
    session.activityLogWindow = windows.Spawn(MakeActivityLogWindow(Rectangle{1380.0f, 600.0f, 500.0f, 420.0f}, session.progress.Max()));

    for (float percent : session.config.progress.milestones)
    {
        const float threshold = session.progress.Max() * percent / 100.0f;
        session.progress.OnThresholdCrossed(threshold, [&session, percent](float) {
            session.windows.Spawn(MakeMilestoneBanner(percent, session.screen));
            LogActivity(session, TextFormat("MILESTONE // %.0f%% raised", percent));
            TraceLog(LOG_INFO, "GAME: milestone %.0f%% reached at %.1fs", percent, session.stats.elapsed);
        });
    }

    LogActivity(session, "DESKTOP READY // Calvelli is on the fundraiser");
    TraceLog(LOG_INFO, "GAME: session started with %i windows", static_cast<int>(windows.Count()));
}

void UpdateSession(GameSession &session, const FrameInput &input, float dt)
{
    if (session.phase == GamePhase::Ending)
    {
        UpdateEnding(session.ending, dt, session.screen);
        if (input.exitPressed)
        {
            session.exitRequested = true;
        }
        return;
    }

    // Completion is observed one tick after the value reached max.
    if (session.progress.Complete())
    {
        EnterEnding(session);
        return;
    }

    session.stats.elapsed += dt;
    HandleInput(session, input);
    AdvanceWork(session, dt);
    AdvanceSchedulers(session, dt);
    session.windows.Update(dt);
    SyncActivityLog(session);
}

void DrawSession(const GameSession &session)
{
    if (session.phase == GamePhase::Ending)
    {
        DrawEnding(session.ending, session.screen);
        return;
    }

    DrawRectangleGradientV(0, 0, static_cast<int>(session.screen.x), static_cast<int>(session.screen.y),
                           Color{0, 120, 180, 255}, Color{0, 60, 110, 255});
    session.windows.DrawAll();
    DrawTaskbar(session);
}

FrameInput ReadFrameInput()
{
    FrameInput input;
    input.pointer = GetMousePosition();
    input.pressed = IsMouseButtonPressed(MOUSE_BUTTON_LEFT);
    input.released = IsMouseButtonReleased(MOUSE_BUTTON_LEFT);
    for (int codepoint = GetCharPressed(); codepoint > 0; codepoint = GetCharPressed())
    {
        input.codepoints.push_back(codepoint);
    }
    input.cycleFocus = IsKeyPressed(KEY_TAB);
    input.exitPressed = IsKeyPressed(KEY_ESCAPE) || IsKeyPressed(KEY_ENTER);
    return input;
}

void LogActivity(GameSession &session, const std::string &line)
{
    Window *window = session.windows.Find(session.activityLogWindow);
    if (auto *log = window ? std::get_if<ActivityLogContent>(&window->content) : nullptr)
    {
        PushLog(log->entries, line);
    }
}
