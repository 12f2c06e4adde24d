#include <catch2/catch_test_macros.hpp>
#include "client/entity_synchronizer.hpp"
#include "client/projectile_synchronizer.hpp"
#include <glm/glm.hpp>
#include <vector>

using namespace volley;
using namespace volley::client;
using namespace volley::protocol;

namespace {

constexpr float DT = static_cast<float>(physics::FIXED_TIMESTEP);

ProjectileSpawn make_spawn(uint32_t id, uint32_t owner, const glm::vec3& position,
                           const glm::vec3& direction = {0.0f, 0.0f, 1.0f}, float speed = 60.0f) {
    ProjectileSpawn spawn;
    spawn.entity_id = id;
    spawn.owner_id = owner;
    spawn.position = position;
    spawn.direction = direction;
    spawn.speed = speed;
    return spawn;
}

}

TEST_CASE("Server spawns confirm the owner's prediction", "[projectiles]") {
    EntitySynchronizer entities;
    ProjectileSynchronizer projectiles(entities);

    ProjectileId predicted = projectiles.spawn_predicted(make_spawn(0, 1, {0.0f, 1.0f, 0.0f}));
    REQUIRE(predicted < 0);
    REQUIRE(projectiles.predicted_count() == 1);

    SECTION("Same owner replaces the prediction") {
        REQUIRE(projectiles.spawn_from_server(make_spawn(100, 1, {0.0f, 1.0f, 0.1f})));
        REQUIRE(projectiles.size() == 1);
        REQUIRE(projectiles.predicted_count() == 0);
        REQUIRE(projectiles.find(predicted) == nullptr);
        REQUIRE(projectiles.find(100) != nullptr);
    }

    SECTION("Another owner's spawn leaves it alone") {
        projectiles.spawn_from_server(make_spawn(100, 2, {5.0f, 1.0f, 0.0f}));
        REQUIRE(projectiles.size() == 2);
        REQUIRE(projectiles.predicted_count() == 1);
    }

    SECTION("A batch confirms one prediction and adds every pellet") {
        ProjectileSpawnBatch batch;
        for (uint32_t i = 0; i < 6; ++i) batch.spawns.push_back(make_spawn(200 + i, 1, {0.0f, 1.0f, 0.0f}));
        REQUIRE(projectiles.spawn_batch_from_server(batch) == 6);
        REQUIRE(projectiles.size() == 6);
        REQUIRE(projectiles.predicted_count() == 0);
    }

    SECTION("The oldest prediction is confirmed first") {
        ProjectileId second = projectiles.spawn_predicted(make_spawn(0, 1, {0.0f, 1.0f, 0.0f}));
        projectiles.spawn_from_server(make_spawn(100, 1, {0.0f, 1.0f, 0.0f}));
        REQUIRE(projectiles.find(predicted) == nullptr);
        REQUIRE(projectiles.find(second) != nullptr);
    }
}

TEST_CASE("Duplicate server ids are ignored", "[projectiles]") {
    EntitySynchronizer entities;
    ProjectileSynchronizer projectiles(entities);

    REQUIRE(projectiles.spawn_from_server(make_spawn(7, 3, {0.0f, 1.0f, 0.0f})));
    REQUIRE_FALSE(projectiles.spawn_from_server(make_spawn(7, 3, {0.0f, 1.0f, 0.0f})));
    REQUIRE(projectiles.size() == 1);
}

TEST_CASE("Unconfirmed predictions expire after the match window", "[projectiles]") {
    EntitySynchronizer entities;
    ProjectileSynchronizer projectiles(entities);
    ProjectileId id = projectiles.spawn_predicted(make_spawn(0, 1, {0.0f, 1.0f, 0.0f}));

    for (int i = 0; i < 29; ++i) projectiles.fixed_update(DT);
    REQUIRE(projectiles.find(id) != nullptr);

    projectiles.fixed_update(DT);
    REQUIRE(projectiles.find(id) == nullptr);
    REQUIRE(projectiles.recent_predicted_count() == 0);

    SECTION("A late confirmation simply spawns the server projectile") {
        REQUIRE(projectiles.spawn_from_server(make_spawn(50, 1, {0.0f, 1.0f, 0.0f})));
        REQUIRE(projectiles.size() == 1);
    }
}

TEST_CASE("Server projectiles live out their lifetime", "[projectiles]") {
    EntitySynchronizer entities;
    ProjectileSynchronizer projectiles(entities);
    projectiles.spawn_from_server(make_spawn(1, 9, {0.0f, 100.0f, 0.0f}, {1.0f, 0.0f, 0.0f}, 10.0f));

    for (int i = 0; i < 100; ++i) projectiles.fixed_update(DT);
    REQUIRE(projectiles.size() == 1);

    for (int i = 0; i < 25; ++i) projectiles.fixed_update(DT);
    REQUIRE(projectiles.size() == 0);
}

TEST_CASE("Destroy reports the last position", "[projectiles]") {
    EntitySynchronizer entities;
    ProjectileSynchronizer projectiles(entities);
    projectiles.spawn_from_server(make_spawn(4, 9, {1.0f, 2.0f, 3.0f}));

    auto position = projectiles.destroy(4);
    REQUIRE(position);
    REQUIRE(*position == glm::vec3(1.0f, 2.0f, 3.0f));
    REQUIRE_FALSE(projectiles.destroy(4));
}

TEST_CASE("Local hits despawn the projectile", "[projectiles]") {
    EntitySynchronizer entities;
    entities.create_remote(2, {0.0f, 0.5f, 10.0f});
    ProjectileSynchronizer projectiles(entities);

    std::vector<ProjectileHit> hits;
    projectiles.set_hit_handler([&](const ProjectileHit& hit) { hits.push_back(hit); });

    SECTION("Body") {
        projectiles.spawn_from_server(make_spawn(1, 7, {0.0f, 0.5f, 0.0f}));
        for (int i = 0; i < 30 && hits.empty(); ++i) projectiles.fixed_update(DT);
        REQUIRE(hits.size() == 1);
        REQUIRE(hits[0].entity_id == 2);
        REQUIRE_FALSE(hits[0].headshot);
        REQUIRE(projectiles.size() == 0);
    }

    SECTION("Head") {
        projectiles.spawn_from_server(make_spawn(1, 7, {0.0f, 1.3f, 0.0f}));
        for (int i = 0; i < 30 && hits.empty(); ++i) projectiles.fixed_update(DT);
        REQUIRE(hits.size() == 1);
        REQUIRE(hits[0].headshot);
    }

    SECTION("A low shot hits the lower half of the body") {
        projectiles.spawn_from_server(make_spawn(1, 7, {0.0f, 0.2f, 0.0f}));
        for (int i = 0; i < 30 && hits.empty(); ++i) projectiles.fixed_update(DT);
        REQUIRE(hits.size() == 1);
        REQUIRE_FALSE(hits[0].headshot);
    }

    SECTION("A shot over the head misses") {
        projectiles.spawn_from_server(make_spawn(1, 7, {0.0f, 1.75f, 0.0f}));
        for (int i = 0; i < 30; ++i) projectiles.fixed_update(DT);
        REQUIRE(hits.empty());
    }

    SECTION("The owner is never hit") {
        projectiles.spawn_from_server(make_spawn(1, 2, {0.0f, 0.5f, 0.0f}));
        for (int i = 0; i < 30; ++i) projectiles.fixed_update(DT);
        REQUIRE(hits.empty());
    }

    SECTION("A miss keeps flying") {
        projectiles.spawn_from_server(make_spawn(1, 7, {5.0f, 0.5f, 0.0f}));
        for (int i = 0; i < 30; ++i) projectiles.fixed_update(DT);
        REQUIRE(hits.empty());
        REQUIRE(projectiles.size() == 1);
    }
}

TEST_CASE("Head is tested before body within one segment", "[projectiles]") {
    EntitySynchronizer entities;
    entities.create_remote(2, {0.0f, 0.5f, 10.0f});
    ProjectileSettings settings;
    settings.substeps = 1;
    ProjectileSynchronizer projectiles(entities, settings);

    std::vector<ProjectileHit> hits;
    projectiles.set_hit_handler([&](const ProjectileHit& hit) { hits.push_back(hit); });

    // Climbs through the body box and into the head box in one step
    glm::vec3 dir = glm::normalize(glm::vec3(0.0f, 1.0f, 1.0f));
    projectiles.spawn_from_server(make_spawn(1, 7, {0.0f, 0.2f, 9.2f}, dir, 20.0f));
    projectiles.fixed_update(0.1f);

    REQUIRE(hits.size() == 1);
    REQUIRE(hits[0].headshot);
}

TEST_CASE("ProjectileSynchronizer needs a substep", "[projectiles]") {
    EntitySynchronizer entities;
    ProjectileSettings settings;
    settings.substeps = 0;
    REQUIRE_THROWS_AS(ProjectileSynchronizer(entities, settings), std::invalid_argument);
}
