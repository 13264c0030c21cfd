#include <raycore/core/scene.hpp>

namespace raycore::core {

void Scene::add(const Primitive &shape, const Material &material) {
  objects.push_back(SceneObject{shape, material});
}

std::optional<HitRecord> closest_hit(const Scene &scene, const Ray &ray, double t_min, double t_max) {
  std::optional<HitRecord> closest;
  double nearest = t_max;

  for (const SceneObject &obj : scene.objects) {
    auto hit = intersect(obj.shape, ray, t_min, nearest);
    if (!hit)
      continue;
    nearest = hit->t;
    hit->material = obj.material;
    closest = std::move(hit);
  }
  return closest;
}

} // namespace raycore::core
