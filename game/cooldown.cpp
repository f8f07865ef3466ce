#include "cooldown.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace
{
    std::function<void()> orNoop(std::function<void()> callback)
    {
        if (!callback)
        {
            return [] {};
        }
        return callback;
    }

    // false for zero, negative, NaN and infinity
    bool countsDown(const float duration)
    {
        return duration > 0 && std::isfinite(duration);
    }

    float clampDuration(const float duration)
    {
        if (std::isfinite(duration) && duration > Cooldown::MAX_DURATION)
        {
            return Cooldown::MAX_DURATION;
        }
        return duration;
    }
}

Cooldown::Cooldown(const float duration, std::function<void()> onComplete)
    : duration(clampDuration(duration)), remaining(0), onComplete(orNoop(std::move(onComplete)))
{
}

void Cooldown::start()
{
    paused = false;
    if (!countsDown(duration))
    {
        remaining = 0;
        active = false;
        return;
    }
    remaining = duration;
    active = true;
}

void Cooldown::tick()
{
    if (!active || paused)
    {
        return;
    }
    remaining -= 1.0;
    if (remaining <= 0)
    {
        remaining = 0;
        active = false;
        // already ready here, so the callback may start() again
        onComplete();
    }
}

void Cooldown::pause()
{
    paused = true;
}

void Cooldown::resume()
{
    paused = false;
}

void Cooldown::reset()
{
    remaining = 0;
    active = false;
    paused = false;
}

void Cooldown::setOnComplete(std::function<void()> callback)
{
    onComplete = orNoop(std::move(callback));
}

bool Cooldown::isReady() const
{
    return !active;
}

float Cooldown::progress() const
{
    if (!countsDown(duration))
    {
        return 1.0f;
    }
    return static_cast<float>(std::clamp(1.0 - remaining / duration, 0.0, 1.0));
}

float Cooldown::getDuration() const
{
    return duration;
}

float Cooldown::getRemaining() const
{
    return static_cast<float>(remaining);
}

bool Cooldown::isActive() const
{
    return active;
}

bool Cooldown::isPaused() const
{
    return paused;
}
