#pragma once

#include <glm/glm.hpp>
#include <vector>

namespace volley {

struct Aabb {
    glm::vec3 min{0.0f};
    glm::vec3 max{0.0f};

    static Aabb from_center(const glm::vec3& center, const glm::vec3& half) {
        return {center - half, center + half};
    }

    bool overlaps(const Aabb& o) const {
        return min.x < o.max.x && max.x > o.min.x &&
               min.y < o.max.y && max.y > o.min.y &&
               min.z < o.max.z && max.z > o.min.z;
    }
};

/**
 * Read-only collision query over static level geometry (terrain, rocks,
 * placed blocks). Local prediction is the only caller; it never mutates
 * the world through this interface.
 */
class GeometryQuery {
public:
    virtual ~GeometryQuery() = default;

    virtual bool overlaps(const Aabb& box) const = 0;
};

// Flat list of solid boxes. Enough for blocks, tests and the headless client.
class BoxWorld : public GeometryQuery {
public:
    void add_box(const Aabb& box) { boxes_.push_back(box); }
    void clear() { boxes_.clear(); }
    size_t size() const { return boxes_.size(); }

    bool overlaps(const Aabb& box) const override {
        for (const auto& b : boxes_) {
            if (b.overlaps(box)) return true;
        }
        return false;
    }

private:
    std::vector<Aabb> boxes_;
};

} // namespace volley
