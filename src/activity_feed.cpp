#include "activity_feed.h"

#include <algorithm>

ActivityFeed::ActivityFeed(IntervalRange interval, float minWork, float maxWork)
    : interval_(interval),
      minWork_(std::min(minWork, maxWork)),
      maxWork_(std::max(minWork, maxWork)),
      remaining_(RandomSeconds(interval))
{
}

std::optional<ActivityEvent> ActivityFeed::Advance(float dt, const ContentStore &store)
{
    remaining_ -= dt;
    if (remaining_ > 0.0f)
    {
        return std::nullopt;
    }
    remaining_ = RandomSeconds(interval_);
    ++count_;

    ActivityEvent event;
    event.line = store.Activity(cursor_.Select(store.ChannelSize(ChannelActivity)));
    event.work = RandomUniform(minWork_, maxWork_);
    return event;
}
