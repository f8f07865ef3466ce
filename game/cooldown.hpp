#pragma once
#include <functional>

// Countdown measured in simulation ticks.
// Ready -> start() -> Running <-> Paused -> (tick reaches 0) -> Ready
class Cooldown
{
    float duration;
    // double counts whole ticks exactly up to MAX_DURATION
    double remaining;
    bool active{}, paused{};
    std::function<void()> onComplete;

public:
    // 2^53, largest tick count a double decrements exactly
    static constexpr float MAX_DURATION = 9007199254740992.0f;

    // a non-positive or non-finite duration makes the cooldown permanently ready,
    // finite durations above MAX_DURATION are clamped to it
    explicit Cooldown(float duration, std::function<void()> onComplete = {});

    // restarts from full duration, even if already running or paused
    void start();
    // advances one tick; fires onComplete on the tick that reaches 0
    void tick();
    void pause();
    void resume();
    // back to ready without firing onComplete
    void reset();

    void setOnComplete(std::function<void()> callback);

    [[nodiscard]] bool isReady() const;
    // elapsed fraction in [0, 1]
    [[nodiscard]] float progress() const;
    [[nodiscard]] float getDuration() const;
    [[nodiscard]] float getRemaining() const;
    [[nodiscard]] bool isActive() const;
    [[nodiscard]] bool isPaused() const;
};
