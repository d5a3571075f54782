#pragma once

#include <string>
#include <vector>

struct IntervalRange
{
    float minSeconds = 0.0f;
    float maxSeconds = 0.0f;
};

struct GameConfig
{
    struct Display
    {
        int width = 1920;
        int height = 1080;
        int fps = 60;
    } display;

    struct Content
    {
        std::string emailsPath = "data/emails.json";
        std::string phoneCallsPath = "data/phone_calls.json";
    } content;

    struct Progress
    {
        float max = 100.0f;
        // Background progress per second while playing.
        float autoRate = 0.05f;
        float transferWork = 0.25f;
        float dismissalWork = 0.5f;
        float replyWork = 1.0f;
        float activityMin = 5.0f;
        float activityMax = 12.5f;
        std::vector<float> milestones = {25.0f, 50.0f, 75.0f, 90.0f, 100.0f};
    } progress;

    struct Schedulers
    {
        IntervalRange email{10.0f, 20.0f};
        IntervalRange chat{10.0f, 20.0f};
        IntervalRange phone{45.0f, 90.0f};
        IntervalRange discord{30.0f, 60.0f};
        IntervalRange activity{5.0f, 15.0f};
        IntervalRange congratulationDelay{1.0f, 3.0f};
    } schedulers;

    static GameConfig Load(const std::string &path);
};
