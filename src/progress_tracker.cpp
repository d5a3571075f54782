#include "progress_tracker.h"

#include <algorithm>
#include <utility>

ProgressTracker::ProgressTracker(float max)
    : max_(max > 0.0f ? max : 100.0f)
{
}

float ProgressTracker::Add(float amount)
{
    if (amount <= 0.0f || Complete())
    {
        return 0.0f;
    }

    const float before = value_;
    value_ = std::min(value_ + amount, max_);
    FireCrossed();
    return value_ - before;
}

void ProgressTracker::OnThresholdCrossed(float threshold, MilestoneCallback callback)
{
    Milestone milestone;
    milestone.threshold = std::clamp(threshold, 0.0f, max_);
    milestone.callback = std::move(callback);
    milestones_.push_back(std::move(milestone));

    // Keep firing order ascending when one Add crosses several thresholds.
    std::stable_sort(milestones_.begin(), milestones_.end(),
                     [](const Milestone &a, const Milestone &b) { return a.threshold < b.threshold; });
}

void ProgressTracker::FireCrossed()
{
    for (auto &milestone : milestones_)
    {
        if (milestone.fired || value_ < milestone.threshold)
        {
            continue;
        }
        milestone.fired = true;
        if (milestone.callback)
        {
            milestone.callback(milestone.threshold);
        }
    }
}
