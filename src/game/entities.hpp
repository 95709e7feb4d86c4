// SPDX-License-Identifier: Apache-2.0
// entities.hpp - Plain entity records (enemies, projectiles, mines, pickups) and the enemy archetype table
#pragma once
#include "game/physics.hpp"

#include <box2d/box2d.h>

#include <cstdint>

namespace serpent::game {

enum class EnemyKind : uint8_t
{
    drone, // default / unclassified
    runner,
    tank,
    sniper,
    boss
};

const char *enemy_kind_name(EnemyKind kind);

// Ranged attack parameters. volley == 1 aims at the player, volley > 1 fires an evenly spaced ring.
struct WeaponSpec
{
    bool armed{false};
    float cooldown_min{0.f};
    float cooldown_max{0.f};
    float projectile_speed{0.f};
    float projectile_damage{0.f};
    float projectile_radius{5.f};
    float projectile_ttl{1.8f};
    uint32_t projectile_color{0};
    uint32_t volley{1};
};

// Per-archetype tunables. Behavior is selected from the kind; everything numeric lives here.
struct Archetype
{
    float radius;
    float max_health;
    float speed;
    float contact_damage;
    uint32_t score_value;
    uint32_t color;
    // Fraction of the pursuit velocity blended in per tick (1 = instant turn).
    float steer_blend;
    // Preferred distance to the player (0 = none) and the band around it.
    float standoff;
    float standoff_far_slack;
    float standoff_near_slack;
    WeaponSpec weapon;
    // Body segments granted to the player on kill
    uint32_t growth;
    uint32_t death_particles;
    float death_particle_size;
};

const Archetype &archetype(EnemyKind kind);

struct Enemy
{
    uint32_t id{0};
    EnemyKind kind{EnemyKind::drone};
    b2Vec2 pos{0.f, 0.f};
    b2Vec2 vel{0.f, 0.f};
    float radius{14.f};
    float health{20.f};
    float max_health{20.f};
    float contact_damage{10.f};
    float speed{85.f};
    float fire_cooldown{0.f};
    uint32_t score_value{40};
    uint32_t color{0};
    bool alive{true};
};

// Health/contact/speed multiplier base for a level (1 at level 1).
float level_scale(uint32_t level, float per_level);
// Build an enemy from its archetype, applying the three independent level scalings.
Enemy make_enemy(EnemyKind kind, b2Vec2 pos, float scale, float initial_fire_cooldown);
void damage_enemy(Enemy &e, float amount);

struct Projectile
{
    b2Vec2 pos{0.f, 0.f};
    b2Vec2 vel{0.f, 0.f};
    float damage{0.f};
    float radius{5.f};
    float ttl{1.8f};
    uint32_t color{0x8df2ff};
    bool alive{true};
};

void step_projectile(Projectile &p, float dt, const phys::Bounds &bounds, float margin);

struct Mine
{
    b2Vec2 pos{0.f, 0.f};
    float radius{10.f};
    float arm_timer{0.65f};
    float ttl{6.f};
    bool alive{true};

    bool armed() const { return arm_timer <= 0.f; }
};

void step_mine(Mine &m, float dt);

enum class PickupKind : uint8_t
{
    energy,
    health,
    shield
};

const char *pickup_kind_name(PickupKind kind);
uint32_t pickup_color(PickupKind kind);

struct Pickup
{
    b2Vec2 pos{0.f, 0.f};
    PickupKind kind{PickupKind::energy};
    float radius{8.f};
    float value{25.f};
    bool collected{false};
};

} // namespace serpent::game
