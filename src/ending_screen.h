#pragma once

#include "raylib.h"

#include <vector>

struct SessionStats
{
    int itemsMoved = 0;
    int dropsRefused = 0;
    int repliesSent = 0;
    int callsAnswered = 0;
    int interruptionsDismissed = 0;
    int notificationsDismissed = 0;
    int activityEvents = 0;
    float playerWork = 0.0f;
    float backgroundWork = 0.0f;
    float elapsed = 0.0f;
};

struct Particle
{
    Vector2 position{};
    Vector2 velocity{};
    float radius = 4.0f;
    Color color = WHITE;
};

struct EndingScreen
{
    SessionStats stats;
    float maxProgress = 100.0f;
    std::vector<Particle> particles;
    float clock = 0.0f;
};

inline constexpr float SecretRevealDelay = 3.0f;
inline constexpr int ParticleCount = 50;

void BeginEnding(EndingScreen &ending, const SessionStats &stats, float maxProgress, Vector2 screen);
void UpdateEnding(EndingScreen &ending, float dt, Vector2 screen);
void DrawEnding(const EndingScreen &ending, Vector2 screen);

// Share of the progress bar the player filled, in percent.
float PlayerWorkPercent(const SessionStats &stats, float maxProgress);
float BackgroundWorkPercent(const SessionStats &stats, float maxProgress);
