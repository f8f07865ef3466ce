#include <gtest/gtest.h>
#include <gameobject.hpp>

namespace
{
    void tickN(GameObject& obj, int n)
    {
        for (int i = 0; i < n; ++i)
        {
            obj.tickCooldowns();
        }
    }
}

TEST(GameObject, ShootStartsWeaponCooldown)
{
    GameObject p;

    EXPECT_TRUE(p.tryShoot());
    EXPECT_FALSE(p.player.weaponCooldown.isReady());
    EXPECT_FALSE(p.tryShoot());

    tickN(p, static_cast<int>(config::WEAPON_COOLDOWN));
    EXPECT_TRUE(p.tryShoot());
}

TEST(GameObject, PausedAbilitiesCannotBeUsed)
{
    GameObject p;
    p.pauseAbilities();

    EXPECT_FALSE(p.tryShoot());
    EXPECT_FALSE(p.tryDash());
    EXPECT_TRUE(p.player.abilitiesPaused);
    EXPECT_TRUE(p.player.weaponCooldown.isPaused());
    EXPECT_TRUE(p.player.dashCooldown.isReady());

    p.resumeAbilities();
    EXPECT_FALSE(p.player.abilitiesPaused);
    EXPECT_TRUE(p.tryShoot());
    EXPECT_TRUE(p.tryDash());
}

TEST(GameObject, PauseHoldsRunningCooldowns)
{
    GameObject p;
    ASSERT_TRUE(p.tryShoot());
    tickN(p, 2);
    p.pauseAbilities();

    const float remaining = p.player.weaponCooldown.getRemaining();
    EXPECT_FALSE(p.tryShoot());
    tickN(p, 20);

    EXPECT_TRUE(p.player.weaponCooldown.isPaused());
    EXPECT_FLOAT_EQ(p.player.weaponCooldown.getRemaining(), remaining);
}

TEST(GameObject, ResetClearsPause)
{
    GameObject p;
    ASSERT_TRUE(p.tryShoot());
    p.pauseAbilities();

    p.resetAbilities();

    EXPECT_FALSE(p.player.abilitiesPaused);
    EXPECT_FALSE(p.player.weaponCooldown.isPaused());
    EXPECT_TRUE(p.player.weaponCooldown.isReady());
    EXPECT_TRUE(p.player.dashCooldown.isReady());
    EXPECT_TRUE(p.tryShoot());
}

TEST(GameObject, DashLocksUntilCooldownEnds)
{
    GameObject p;
    p.direction = -1;
    p.player.dashTimer.setOnComplete([&p] { p.player.state = PlayerState::idle; });

    ASSERT_TRUE(p.tryDash());
    EXPECT_EQ(p.player.state, PlayerState::dashing);
    EXPECT_FLOAT_EQ(p.velocity.x, -config::DASH_SPEED);
    EXPECT_FALSE(p.tryDash());

    // dash impulse ends first, the ability stays on cooldown
    tickN(p, static_cast<int>(config::DASH_LENGTH));
    EXPECT_TRUE(p.player.dashTimer.isReady());
    EXPECT_EQ(p.player.state, PlayerState::idle);
    EXPECT_FALSE(p.tryDash());

    tickN(p, static_cast<int>(config::DASH_COOLDOWN - config::DASH_LENGTH));
    EXPECT_TRUE(p.player.dashCooldown.isReady());
    EXPECT_TRUE(p.tryDash());
}
