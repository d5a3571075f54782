#pragma once

#include <functional>
#include <vector>

// Bounded, non-decreasing progress value with one-shot threshold observers.
class ProgressTracker
{
public:
    using MilestoneCallback = std::function<void(float threshold)>;

    explicit ProgressTracker(float max = 100.0f);

    // Returns the amount actually applied after clamping. Non-positive amounts
    // and calls after completion apply nothing.
    float Add(float amount);
    void OnThresholdCrossed(float threshold, MilestoneCallback callback);

    float Value() const { return value_; }
    float Max() const { return max_; }
    float Fraction() const { return value_ / max_; }
    bool Complete() const { return value_ >= max_; }

private:
    struct Milestone
    {
        float threshold = 0.0f;
        bool fired = false;
        MilestoneCallback callback;
    };

    void FireCrossed();

    float value_ = 0.0f;
    float max_ = 100.0f;
    std::vector<Milestone> milestones_;
};
