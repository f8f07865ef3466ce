#include "hud.hpp"

#include "config.hpp"
#include "cooldown.hpp"

void drawCooldownBar(SDL_Renderer* renderer, const CooldownBar& bar, const float x, const float y)
{
    const Cooldown& cd = *bar.cooldown;

    // label on the left, bar after it
    SDL_SetRenderDrawColor(renderer, 255, 255, 255, 255);
    SDL_RenderDebugText(renderer, x, y, bar.label.c_str());

    const float barX = x + SDL_DEBUG_TEXT_FONT_CHARACTER_SIZE * 7;
    const SDL_FRect back{.x = barX, .y = y, .w = config::BAR_WIDTH, .h = config::BAR_HEIGHT};
    SDL_SetRenderDrawColor(renderer, 40, 40, 60, 255);
    SDL_RenderFillRect(renderer, &back);

    const SDL_FRect fill{.x = barX, .y = y, .w = config::BAR_WIDTH * cd.progress(), .h = config::BAR_HEIGHT};
    if (cd.isReady())
    {
        SDL_SetRenderDrawColor(renderer, 80, 220, 90, 255);
    }
    else if (cd.isPaused())
    {
        SDL_SetRenderDrawColor(renderer, 150, 150, 150, 255);
    }
    else
    {
        SDL_SetRenderDrawColor(renderer, 230, 170, 40, 255);
    }
    SDL_RenderFillRect(renderer, &fill);

    SDL_SetRenderDrawColor(renderer, 255, 255, 255, 255);
    SDL_RenderRect(renderer, &back);
}

void drawHud(SDL_Renderer* renderer, const std::vector<CooldownBar>& bars)
{
    for (size_t i = 0; i < bars.size(); ++i)
    {
        drawCooldownBar(renderer, bars[i], config::BAR_X, config::BAR_Y + i * config::BAR_SPACING);
    }
}
