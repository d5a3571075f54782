#pragma once

#include "activity_feed.h"
#include "config.h"
#include "content_store.h"
#include "ending_screen.h"
#include "progress_tracker.h"
#include "scheduler.h"
#include "window_manager.h"

#include <string>
#include <vector>

enum class GamePhase
{
    Playing,
    Ending
};

// One frame of player input, sampled by ReadFrameInput or built by tests.
struct FrameInput
{
    Vector2 pointer{};
    bool pressed = false;
    bool released = false;
    std::vector<int> codepoints;
    bool cycleFocus = false;
    bool exitPressed = false;
};

// Everything a running game owns. Milestone callbacks hold a reference to the
// session, so it is neither copied nor moved.
struct GameSession
{
    GameSession(const GameConfig &gameConfig, ContentStore store);
    GameSession(const GameSession &) = delete;
    GameSession &operator=(const GameSession &) = delete;

    GameConfig config;
    ContentStore content;
    Vector2 screen{};

    WindowManager windows;
    ProgressTracker progress;
    ActivityFeed activity;
    NotificationScheduler emailScheduler;
    NotificationScheduler congratulationScheduler;
    NotificationScheduler chatScheduler;
    NotificationScheduler phoneScheduler;
    NotificationScheduler discordScheduler;

    GamePhase phase = GamePhase::Playing;
    SessionStats stats;
    EndingScreen ending;
    bool exitRequested = false;

    WindowId activityLogWindow = NoWindow;
    WindowId phoneWindow = NoWindow;
    WindowId interruptWindow = NoWindow;
};

void InitSession(GameSession &session);
void UpdateSession(GameSession &session, const FrameInput &input, float dt);
void DrawSession(const GameSession &session);
FrameInput ReadFrameInput();

// Appends a line to the activity log window, if it is open.
void LogActivity(GameSession &session, const std::string &line);
