#include "scheduler.h"

#include "raylib.h"

#include <algorithm>
#include <utility>

const char *NotificationKindLabel(NotificationKind kind)
{
    switch (kind)
    {
    case NotificationKind::Email:
        return "email";
    case NotificationKind::Congratulation:
        return "congratulation";
    case NotificationKind::Chat:
        return "chat";
    case NotificationKind::Phone:
        return "phone";
    case NotificationKind::DiscordInterrupt:
        return "discord";
    case NotificationKind::Milestone:
        return "milestone";
    default:
        return "unknown";
    }
}

float RandomUniform(float min, float max)
{
    const int low = static_cast<int>(min * 1000.0f);
    const int high = std::max(low, static_cast<int>(max * 1000.0f));
    return static_cast<float>(GetRandomValue(low, high)) / 1000.0f;
}

float RandomSeconds(IntervalRange range)
{
    return RandomUniform(range.minSeconds, range.maxSeconds);
}

ContentCursor::ContentCursor(SelectionPolicy policy)
    : policy_(policy)
{
}

int ContentCursor::Select(size_t count)
{
    if (count == 0)
    {
        return -1;
    }

    switch (policy_)
    {
    case SelectionPolicy::Sequential:
    {
        const size_t index = next_ % count;
        next_ = index + 1;
        return static_cast<int>(index);
    }
    case SelectionPolicy::Random:
        return GetRandomValue(0, static_cast<int>(count) - 1);
    case SelectionPolicy::NoRepeat:
    {
        if (used_.size() != count || std::all_of(used_.begin(), used_.end(), [](bool u) { return u; }))
        {
            used_.assign(count, false);
        }

        std::vector<int> open;
        for (size_t i = 0; i < count; ++i)
        {
            if (!used_[i])
            {
                open.push_back(static_cast<int>(i));
            }
        }
        const int pick = open[static_cast<size_t>(GetRandomValue(0, static_cast<int>(open.size()) - 1))];
        used_[static_cast<size_t>(pick)] = true;
        return pick;
    }
    }
    return -1;
}

NotificationScheduler::NotificationScheduler(NotificationKind kind, std::string channel, SelectionPolicy policy,
                                             IntervalRange interval, bool repeating)
    : kind_(kind),
      channel_(std::move(channel)),
      cursor_(policy),
      interval_(interval),
      repeating_(repeating),
      armed_(repeating)
{
    if (repeating_)
    {
        remaining_ = RandomSeconds(interval_);
    }
}

std::optional<NotificationEvent> NotificationScheduler::Advance(float dt, const ContentStore &store, bool blocked)
{
    clock_ += dt;
    if (!armed_ || blocked)
    {
        return std::nullopt;
    }

    remaining_ -= dt;
    if (remaining_ > 0.0f)
    {
        return std::nullopt;
    }

    NotificationEvent event;
    event.kind = kind_;
    event.fireTime = clock_;
    event.channel = channel_;
    event.contentIndex = cursor_.Select(store.ChannelSize(channel_));

    if (event.contentIndex < 0 && !exhausted_)
    {
        TraceLog(LOG_WARNING, "SCHED: %s channel '%s' has no entries, using placeholder",
                 NotificationKindLabel(kind_), channel_.c_str());
    }
    exhausted_ = event.contentIndex < 0;
    ++fired_;

    if (repeating_)
    {
        remaining_ = RandomSeconds(interval_);
    }
    else
    {
        armed_ = false;
        remaining_ = 0.0f;
    }
    return event;
}

void NotificationScheduler::Arm(float delaySeconds)
{
    armed_ = true;
    remaining_ = delaySeconds;
}
