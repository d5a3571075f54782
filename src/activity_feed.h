#pragma once

#include "config.h"
#include "content_store.h"
#include "scheduler.h"

#include <optional>
#include <string>

struct ActivityEvent
{
    std::string line;
    float work = 0.0f;
};

// The colleague who does the actual work: every few seconds a log line and a
// chunk of progress.
class ActivityFeed
{
public:
    ActivityFeed(IntervalRange interval, float minWork, float maxWork);

    std::optional<ActivityEvent> Advance(float dt, const ContentStore &store);

    float Remaining() const { return remaining_; }
    int Count() const { return count_; }

private:
    IntervalRange interval_;
    float minWork_;
    float maxWork_;
    float remaining_;
    ContentCursor cursor_{SelectionPolicy::Random};
    int count_ = 0;
};
