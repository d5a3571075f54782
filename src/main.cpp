#include "config.h"
#include "content_store.h"
#include "game_session.h"

#include "raylib.h"

#include <memory>
#include <string>
#include <utility>

int main(int argc, char **argv)
{
    const std::string configPath = argc > 1 ? argv[1] : "menusim.json";
    const GameConfig config = GameConfig::Load(configPath);

    InitWindow(config.display.width, config.display.height, "Menu Simulator - raylib");
    SetTargetFPS(config.display.fps);
    SetExitKey(KEY_NULL);

    ContentStore content = ContentStore::BuiltIn();
    if (!content.LoadEmails(config.content.emailsPath))
    {
        TraceLog(LOG_WARNING, "CONTENT: using built-in emails");
    }
    if (!content.LoadPhoneCalls(config.content.phoneCallsPath))
    {
        TraceLog(LOG_WARNING, "CONTENT: using built-in phone calls");
    }

    auto session = std::make_unique<GameSession>(config, std::move(content));
    InitSession(*session);

    while (!WindowShouldClose() && !session->exitRequested)
    {
        const float dt = GetFrameTime();
        UpdateSession(*session, ReadFrameInput(), dt);

        BeginDrawing();
        ClearBackground(BLACK);
        DrawSession(*session);
        EndDrawing();
    }

    CloseWindow();
    return 0;
}
