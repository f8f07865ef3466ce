#include "gameobject.hpp"

SDL_FRect GameObject::GetCollider() const
{
    return {position.x + collider.x, position.y + collider.y, collider.w, collider.h};
}

bool GameObject::isFlashing() const
{
    return !flashCooldown.isReady();
}

void GameObject::tickCooldowns()
{
    flashCooldown.tick();
    if (type == ObjectType::player)
    {
        player.weaponCooldown.tick();
        player.dashCooldown.tick();
        player.dashTimer.tick();
    }
}

void GameObject::pauseAbilities()
{
    player.weaponCooldown.pause();
    player.dashCooldown.pause();
    player.abilitiesPaused = true;
}

void GameObject::resumeAbilities()
{
    player.weaponCooldown.resume();
    player.dashCooldown.resume();
    player.abilitiesPaused = false;
}

void GameObject::resetAbilities()
{
    player.weaponCooldown.reset();
    player.dashCooldown.reset();
    player.abilitiesPaused = false;
}

bool GameObject::tryShoot()
{
    if (player.abilitiesPaused || !player.weaponCooldown.isReady())
    {
        return false;
    }
    player.weaponCooldown.start();
    return true;
}

bool GameObject::tryDash()
{
    if (player.abilitiesPaused || player.state == PlayerState::dashing || !player.dashCooldown.isReady())
    {
        return false;
    }
    player.dashCooldown.start();
    player.dashTimer.start();
    player.state = PlayerState::dashing;
    velocity.x = direction * config::DASH_SPEED;
    return true;
}
