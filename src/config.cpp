#include "config.h"

#include "raylib.h"

#include <fstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

static void ReadInterval(const json &j, const char *key, IntervalRange &range)
{
    if (!j.contains(key))
    {
        return;
    }

    const auto &r = j.at(key);
    if (r.contains("min")) range.minSeconds = r.at("min").get<float>();
    if (r.contains("max")) range.maxSeconds = r.at("max").get<float>();
    if (range.maxSeconds < range.minSeconds)
    {
        range.maxSeconds = range.minSeconds;
    }
}

GameConfig GameConfig::Load(const std::string &path)
{
    GameConfig cfg;
    std::ifstream f(path);
    if (!f.is_open())
    {
        TraceLog(LOG_WARNING, "CONFIG: could not open %s, using defaults", path.c_str());
        return cfg;
    }

    // Parse into a scratch copy so a type error halfway through leaves pure defaults.
    GameConfig loaded;
    try
    {
        const auto j = json::parse(f);

        if (j.contains("display"))
        {
            const auto &d = j.at("display");
            if (d.contains("width")) loaded.display.width = d.at("width").get<int>();
            if (d.contains("height")) loaded.display.height = d.at("height").get<int>();
            if (d.contains("fps")) loaded.display.fps = d.at("fps").get<int>();
        }

        if (j.contains("content"))
        {
            const auto &c = j.at("content");
            if (c.contains("emails")) loaded.content.emailsPath = c.at("emails").get<std::string>();
            if (c.contains("phone_calls")) loaded.content.phoneCallsPath = c.at("phone_calls").get<std::string>();
        }

        if (j.contains("progress"))
        {
            const auto &p = j.at("progress");
            if (p.contains("max")) loaded.progress.max = p.at("max").get<float>();
            if (p.contains("auto_rate")) loaded.progress.autoRate = p.at("auto_rate").get<float>();
            if (p.contains("transfer_work")) loaded.progress.transferWork = p.at("transfer_work").get<float>();
            if (p.contains("dismissal_work")) loaded.progress.dismissalWork = p.at("dismissal_work").get<float>();
            if (p.contains("reply_work")) loaded.progress.replyWork = p.at("reply_work").get<float>();
            if (p.contains("activity_min")) loaded.progress.activityMin = p.at("activity_min").get<float>();
            if (p.contains("activity_max")) loaded.progress.activityMax = p.at("activity_max").get<float>();
            if (p.contains("milestones")) loaded.progress.milestones = p.at("milestones").get<std::vector<float>>();
        }

        if (j.contains("schedulers"))
        {
            const auto &s = j.at("schedulers");
            ReadInterval(s, "email", loaded.schedulers.email);
            ReadInterval(s, "chat", loaded.schedulers.chat);
            ReadInterval(s, "phone", loaded.schedulers.phone);
            ReadInterval(s, "discord", loaded.schedulers.discord);
            ReadInterval(s, "activity", loaded.schedulers.activity);
            ReadInterval(s, "congratulation_delay", loaded.schedulers.congratulationDelay);
        }
    }
    catch (const json::exception &e)
    {
        TraceLog(LOG_WARNING, "CONFIG: parse error in %s: %s", path.c_str(), e.what());
        return cfg;
    }

    if (loaded.progress.max <= 0.0f)
    {
        TraceLog(LOG_WARNING, "CONFIG: progress.max must be positive, keeping %.1f", cfg.progress.max);
        loaded.progress.max = cfg.progress.max;
    }

    TraceLog(LOG_INFO, "CONFIG: loaded %s", path.c_str());
    return loaded;
}
