#pragma once

#include <string>
#include <vector>

namespace volley {

struct WeaponStats {
    std::string name;
    float fire_rate = 1.0f;          // shots per second
    float projectile_speed = 100.0f;
    float gravity_start_distance = 50.0f;
    float min_accuracy = 0.0f;       // spread cone half-angle, radians
    int pellets_per_shot = 1;        // server-side; the client predicts one projectile per shot

    float cooldown_ms() const { return 1000.0f / fire_rate; }
};

// Values the server ships with; data/weapons.json may override them.
inline std::vector<WeaponStats> default_weapon_table() {
    return {
        {"pistol", 10.0f, 165.0f, 30.0f, 0.008f, 1},
        {"smg", 9.5f, 160.0f, 30.0f, 0.015f, 1},
        {"lmg", 8.5f, 160.0f, 25.0f, 0.011f, 1},
        {"shotgun", 5.5f, 140.0f, 15.0f, 0.08f, 6},
        {"doublebarrel", 2.5f, 140.0f, 15.0f, 0.10f, 12},
        {"sniper", 1.0f, 240.0f, 90.0f, 0.001f, 1},
        {"assault", 7.5f, 180.0f, 40.0f, 0.008f, 1},
        {"dmr", 6.0f, 200.0f, 70.0f, 0.002f, 1},
        {"rocket", 1.0f, 120.0f, 50.0f, 0.005f, 1},
    };
}

} // namespace volley
