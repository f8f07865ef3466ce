#pragma once
#include <string>
#include <vector>
#include <SDL3/SDL.h>

class Cooldown;

struct CooldownBar
{
    std::string label{};
    const Cooldown* cooldown{};
};

// filled width follows Cooldown::progress(), full bar means ready
void drawCooldownBar(SDL_Renderer* renderer, const CooldownBar& bar, float x, float y);
void drawHud(SDL_Renderer* renderer, const std::vector<CooldownBar>& bars);
