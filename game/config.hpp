#pragma once

namespace config
{
    constexpr int WINDOW_WIDTH = 1600;
    constexpr int WINDOW_HEIGHT = 900;
    // logical width/height, SDL scales to the window
    constexpr int LOGICAL_WIDTH = 640;
    constexpr int LOGICAL_HEIGHT = 320;

    constexpr int TICK_RATE = 60; // simulation ticks per second
    constexpr float TICK_SECONDS = 1.0f / TICK_RATE;
    // drop simulation time instead of spiraling after a long stall
    constexpr int MAX_TICKS_PER_FRAME = 5;

    // cooldown durations, in ticks
    constexpr float WEAPON_COOLDOWN = 10;
    constexpr float DASH_COOLDOWN = 90;
    constexpr float FLASH_COOLDOWN = 6;
    constexpr float DASH_LENGTH = 8; // ticks the dash impulse lasts

    // speeds in logical pixels per tick
    constexpr float PLAYER_SPEED = 2.5f;
    constexpr float DASH_SPEED = 9.0f;
    constexpr float BULLET_SPEED = 8.0f;

    constexpr float PLAYER_SIZE = 24;
    constexpr float GROUND_HEIGHT = 40;
    constexpr float BULLET_SIZE = 4;

    // HUD
    constexpr float BAR_X = 10;
    constexpr float BAR_Y = 10;
    constexpr float BAR_WIDTH = 100;
    constexpr float BAR_HEIGHT = 8;
    constexpr float BAR_SPACING = 14;
}
