#include <cmath>
#include <raycore/core/material.hpp>
#include <raycore/log/logger.hpp>

namespace raycore::core {

Material make_diffuse(const Vec3 &albedo) {
  return Diffuse{albedo};
}

Material make_metal(const Vec3 &specular, double roughness) {
  if (roughness != 0.0) {
    RCLOG_DEBUG("make_metal: roughness {} is stored but mirror reflection is used", roughness);
  }
  return Metal{specular, roughness};
}

Material make_dielectric(const Vec3 &refract_color, double ref_idx, double roughness) {
  if (ref_idx <= 0.0) {
    RCLOG_WARN("make_dielectric: refractive index must be positive, got {}", ref_idx);
  }
  if (refract_color.x < 0.0 || refract_color.y < 0.0 || refract_color.z < 0.0) {
    RCLOG_WARN("make_dielectric: negative absorption ({}, {}, {}) amplifies transmitted light",
               refract_color.x, refract_color.y, refract_color.z);
  }
  return Dielectric{refract_color, ref_idx, roughness};
}

double schlick(double cosine, double ref_idx) {
  double r0 = (1.0 - ref_idx) / (1.0 + ref_idx);
  r0 = r0 * r0;
  return r0 + (1.0 - r0) * std::pow(1.0 - cosine, 5);
}

DielectricInterface dielectric_interface(const Vec3 &dir, const Vec3 &normal, double ref_idx) {
  DielectricInterface di{};
  const double d = dot(dir, normal);

  if (d > 0.0) {
    // Leaving the medium
    di.inside = true;
    di.outward_normal = -normal;
    di.ni_over_nt = ref_idx;
    const double sin_t2 = ref_idx * ref_idx * (1.0 - d * d);
    di.total_internal_reflection = sin_t2 > 1.0;
    di.cosine = di.total_internal_reflection ? 0.0 : std::sqrt(1.0 - sin_t2);
  } else {
    di.inside = false;
    di.outward_normal = normal;
    di.ni_over_nt = 1.0 / ref_idx;
    di.cosine = -d;
    di.total_internal_reflection = false;
  }

  di.reflect_prob = di.total_internal_reflection ? 1.0 : schlick(di.cosine, ref_idx);
  return di;
}

} // namespace raycore::core
