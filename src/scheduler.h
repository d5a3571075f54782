#pragma once

#include "config.h"
#include "content_store.h"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

enum class NotificationKind
{
    Email,
    Congratulation,
    Chat,
    Phone,
    DiscordInterrupt,
    Milestone
};

const char *NotificationKindLabel(NotificationKind kind);

enum class SelectionPolicy
{
    // In order, wrapping around.
    Sequential,
    Random,
    // Random without repeats until every entry has been used once.
    NoRepeat
};

struct NotificationEvent
{
    NotificationKind kind = NotificationKind::Email;
    float fireTime = 0.0f;
    std::string channel;
    // -1 selects the channel placeholder.
    int contentIndex = -1;
};

// Uniform draw in thousandth steps through raylib's generator.
float RandomUniform(float min, float max);
float RandomSeconds(IntervalRange range);

class ContentCursor
{
public:
    explicit ContentCursor(SelectionPolicy policy = SelectionPolicy::Sequential);

    // Index into a channel of count entries, or -1 when there is nothing to pick.
    int Select(size_t count);

private:
    SelectionPolicy policy_;
    size_t next_ = 0;
    std::vector<bool> used_;
};

// Independent countdown advanced once per frame. Repeating schedulers re-arm
// themselves after firing; one-shot schedulers fire only after Arm().
class NotificationScheduler
{
public:
    NotificationScheduler(NotificationKind kind, std::string channel, SelectionPolicy policy,
                          IntervalRange interval, bool repeating = true);

    // A blocked scheduler holds its countdown.
    std::optional<NotificationEvent> Advance(float dt, const ContentStore &store, bool blocked = false);

    void Arm(float delaySeconds);

    NotificationKind Kind() const { return kind_; }
    const std::string &Channel() const { return channel_; }
    bool Armed() const { return armed_; }
    float Remaining() const { return remaining_; }
    bool Exhausted() const { return exhausted_; }
    int FiredCount() const { return fired_; }

private:
    NotificationKind kind_;
    std::string channel_;
    ContentCursor cursor_;
    IntervalRange interval_;
    bool repeating_;
    bool armed_;
    float remaining_ = 0.0f;
    float clock_ = 0.0f;
    bool exhausted_ = false;
    int fired_ = 0;
};
