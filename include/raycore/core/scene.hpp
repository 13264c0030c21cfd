#pragma once
#include <cstddef>
#include <limits>
#include <optional>
#include <raycore/core/hit.hpp>
#include <raycore/core/material.hpp>
#include <raycore/core/primitive.hpp>
#include <raycore/core/ray.hpp>
#include <vector>

namespace raycore::core {

struct SceneObject {
  Primitive shape;
  Material material;
};

/// @brief Ordered list of primitives, tested linearly
struct Scene {
  std::vector<SceneObject> objects{};

  Scene() = default;

  void add(const Primitive &shape, const Material &material);
  std::size_t size() const { return objects.size(); }
  bool empty() const { return objects.empty(); }
};

/// @brief Nearest hit over all objects in (t_min, t_max).
/// On ties the earlier object wins. The record carries the hit object's material.
std::optional<HitRecord> closest_hit(const Scene &scene, const Ray &ray, double t_min = 0.0,
                                     double t_max = std::numeric_limits<double>::infinity());

} // namespace raycore::core
