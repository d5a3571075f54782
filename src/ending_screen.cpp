#include "ending_screen.h"

#include <cmath>

constexpr float Gravity = 360.0f;

const Color ParticleColors[] = {
    Color{255, 255, 0, 255},
    Color{255, 200, 0, 255},
    Color{255, 100, 0, 255},
    Color{255, 255, 255, 255},
};

static float RandomFloat(float min, float max)
{
    return min + (max - min) * static_cast<float>(GetRandomValue(0, 1000)) / 1000.0f;
}

static Particle SpawnParticle(Vector2 screen, float y)
{
    Particle p;
    p.position = Vector2{RandomFloat(0.0f, screen.x), y};
    p.velocity = Vector2{RandomFloat(-120.0f, 120.0f), RandomFloat(-180.0f, -60.0f)};
    p.radius = static_cast<float>(GetRandomValue(3, 8));
    p.color = ParticleColors[GetRandomValue(0, 3)];
    return p;
}

static void DrawCentered(const char *text, float centerX, float y, int fontSize, Color color)
{
    const int width = MeasureText(text, fontSize);
    DrawText(text, static_cast<int>(centerX - static_cast<float>(width) * 0.5f), static_cast<int>(y), fontSize, color);
}

float PlayerWorkPercent(const SessionStats &stats, float maxProgress)
{
    return maxProgress > 0.0f ? stats.playerWork / maxProgress * 100.0f : 0.0f;
}

float BackgroundWorkPercent(const SessionStats &stats, float maxProgress)
{
    return maxProgress > 0.0f ? stats.backgroundWork / maxProgress * 100.0f : 0.0f;
}

void BeginEnding(EndingScreen &ending, const SessionStats &stats, float maxProgress, Vector2 screen)
{
    ending.stats = stats;
    ending.maxProgress = maxProgress;
    ending.clock = 0.0f;
    ending.particles.clear();
    for (int i = 0; i < ParticleCount; ++i)
    {
        ending.particles.push_back(SpawnParticle(screen, RandomFloat(0.0f, screen.y)));
    }
}

void UpdateEnding(EndingScreen &ending, float dt, Vector2 screen)
{
    ending.clock += dt;
    for (Particle &p : ending.particles)
    {
        p.position.x += p.velocity.x * dt;
        p.position.y += p.velocity.y * dt;
        p.velocity.y += Gravity * dt;
        if (p.position.y > screen.y + p.radius)
        {
            p = SpawnParticle(screen, -10.0f);
        }
    }
}

void DrawEnding(const EndingScreen &ending, Vector2 screen)
{
    const SessionStats &stats = ending.stats;
    const float cx = screen.x * 0.5f;

    DrawRectangleGradientV(0, 0, static_cast<int>(screen.x), static_cast<int>(screen.y), Color{20, 24, 60, 255}, Color{70, 20, 80, 255});
    for (const Particle &p : ending.particles)
    {
        DrawCircleV(p.position, p.radius, p.color);
    }

    const float pulse = 0.5f + 0.5f * std::sin(ending.clock * 3.0f);
    DrawCentered("CONFERENCE FUNDRAISING COMPLETE!", cx, 120.0f, 56, ColorAlpha(YELLOW, 0.7f + 0.3f * pulse));
    DrawCentered("Your Statistics:", cx, 260.0f, 36, WHITE);

    const int total = static_cast<int>(stats.elapsed);
    float y = 340.0f;
    const Color gold{255, 200, 0, 255};
    DrawCentered(TextFormat("Items Moved: %i", stats.itemsMoved), cx, y, 28, gold);
    DrawCentered(TextFormat("Replies Sent: %i", stats.repliesSent), cx, y += 50.0f, 28, gold);
    DrawCentered(TextFormat("Calls Answered: %i", stats.callsAnswered), cx, y += 50.0f, 28, gold);
    DrawCentered(TextFormat("Interruptions Dismissed: %i", stats.interruptionsDismissed), cx, y += 50.0f, 28, gold);
    DrawCentered(TextFormat("Actual Work Done: %.1f%%", PlayerWorkPercent(stats, ending.maxProgress)), cx, y += 50.0f, 28, gold);
    DrawCentered(TextFormat("Time Spent: %im %is", total / 60, total % 60), cx, y += 50.0f, 28, gold);

    const Color secret{255, 100, 100, 255};
    DrawCentered(TextFormat("Calvelli's Work: %.1f%%", BackgroundWorkPercent(stats, ending.maxProgress)), cx, y += 80.0f, 36, secret);

    if (ending.clock > SecretRevealDelay)
    {
        y += 80.0f;
        DrawCentered("THE SECRET:", cx, y, 30, secret);
        DrawCentered("You didn't actually do anything!", cx, y += 45.0f, 30, secret);
        DrawCentered("Calvelli was doing all the work while you were clicking menus.", cx, y += 45.0f, 30, secret);
        DrawCentered("Thanks for 'helping'!", cx, y += 60.0f, 30, secret);
        DrawCentered("Press ESC or ENTER to exit", cx, screen.y - 60.0f, 24, Color{200, 200, 200, 255});
    }
}
