#include <algorithm>
#include <cmath>
#include <raycore/core/scatter.hpp>
#include <raycore/math/utils.hpp>
#include <raycore/sample/warp.hpp>

namespace raycore::core {

namespace {

ScatterRecord scatter_material(const Diffuse &mat, const Ray &ray_in, const HitRecord &hit, RandomStream &rng) {
  const Vec3 dir = safe_unit(hit.normal + sample::cosine_weighted_hemisphere_direction(rng), hit.normal);
  const double cos_theta = std::max(dot(dir, hit.normal), 0.0);

  ScatterRecord rec;
  rec.attenuation = mat.albedo * (cos_theta / M_PI);
  rec.scattered = Ray(hit.position + hit.normal * SURFACE_EPSILON, dir, ray_in.time);
  return rec;
}

ScatterRecord scatter_material(const Metal &mat, const Ray &ray_in, const HitRecord &hit, RandomStream &) {
  const Vec3 dir = reflect(normalize(ray_in.direction), hit.normal);

  ScatterRecord rec;
  rec.attenuation = mat.specular;
  rec.scattered = Ray(hit.position + hit.normal * SURFACE_EPSILON, dir, ray_in.time);
  return rec;
}

ScatterRecord scatter_material(const Dielectric &mat, const Ray &ray_in, const HitRecord &hit, RandomStream &rng) {
  const Vec3 dir = normalize(ray_in.direction);
  const DielectricInterface di = dielectric_interface(dir, hit.normal, mat.ref_idx);

  ScatterRecord rec;
  rec.attenuation = Vec3{1.0, 1.0, 1.0};
  if (di.inside) {
    // Absorbed over the distance travelled inside the medium
    rec.attenuation = math::exp(mat.refract_color * -hit.t);
  }

  if (rng.next_scalar() < di.reflect_prob) {
    rec.scattered = Ray(hit.position + di.outward_normal * SURFACE_EPSILON,
                        reflect(dir, di.outward_normal), ray_in.time);
  } else {
    rec.scattered = Ray(hit.position - di.outward_normal * SURFACE_EPSILON,
                        refract(dir, di.outward_normal, di.ni_over_nt), ray_in.time);
  }
  return rec;
}

} // namespace

std::optional<ScatterRecord> scatter(const Ray &ray_in, const HitRecord &hit, RandomStream &rng) {
  return std::visit(
      [&](const auto &mat) -> std::optional<ScatterRecord> {
        return scatter_material(mat, ray_in, hit, rng);
      },
      hit.material);
}

} // namespace raycore::core
