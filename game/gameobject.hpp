#pragma once
#include <SDL3/SDL.h>
#include <glm/glm.hpp>

#include "config.hpp"
#include "cooldown.hpp"

enum class PlayerState
{
    idle, running, dashing
};

enum class BulletState
{
    moving, inactive
};

struct PlayerData
{
    PlayerState state = PlayerState::idle;
    Cooldown weaponCooldown{config::WEAPON_COOLDOWN};
    Cooldown dashCooldown{config::DASH_COOLDOWN};
    // counts down the dash impulse itself, not the ability
    Cooldown dashTimer{config::DASH_LENGTH};
    // start() and reset() unpause a cooldown, so abilities stay locked while set
    bool abilitiesPaused{};
};

struct BulletData
{
    BulletState state = BulletState::moving;
};

enum class ObjectType
{
    player, bullet
};

struct GameObject
{
    ObjectType type = ObjectType::player;
    PlayerData player{};
    BulletData bullet{};
    glm::vec2 position{}, velocity{};
    float direction = 1;
    SDL_FRect collider{};
    Cooldown flashCooldown{config::FLASH_COOLDOWN}; // object blink
    SDL_Color color{255, 255, 255, 255};

    GameObject() = default;
    SDL_FRect GetCollider() const;
    [[nodiscard]] bool isFlashing() const;
    // advance every cooldown the object owns by one simulation tick
    void tickCooldowns();
    // player only: weapon and dash
    void pauseAbilities();
    void resumeAbilities();
    // silent, also clears the pause
    void resetAbilities();
    // start the matching cooldown if ready and not paused, returns true if used
    bool tryShoot();
    bool tryDash();
};
