#pragma once
#include <raycore/math/vec.hpp>
#include <variant>

using namespace raycore::math;

namespace raycore::core {

struct Diffuse {
  Vec3 albedo{0.5, 0.5, 0.5};
};

struct Metal {
  Vec3 specular{1.0, 1.0, 1.0};
  double roughness{0.0}; // carried, not consumed by scatter
};

struct Dielectric {
  Vec3 refract_color{0.0, 0.0, 0.0}; // Beer's law absorption per unit distance
  double ref_idx{1.5};
  double roughness{0.0}; // carried, not consumed by scatter
};

using Material = std::variant<Diffuse, Metal, Dielectric>;

Material make_diffuse(const Vec3 &albedo);
Material make_metal(const Vec3 &specular, double roughness = 0.0);
Material make_dielectric(const Vec3 &refract_color, double ref_idx, double roughness = 0.0);

/// @brief Schlick's approximation of Fresnel reflectance
/// @param cosine Cosine of the angle to the normal, in [0, 1]
/// @param ref_idx Refractive index of the dielectric
double schlick(double cosine, double ref_idx);

/// @brief Geometry of a ray crossing a dielectric boundary
struct DielectricInterface {
  Vec3 outward_normal;  ///< Normal on the incident side
  double ni_over_nt;    ///< Relative index along the crossing
  double cosine;        ///< Cosine fed to the Fresnel term
  double reflect_prob;  ///< Probability of choosing reflection
  bool inside;          ///< Ray travels from inside the medium
  bool total_internal_reflection;
};

/// @brief Classify a crossing and compute its reflect probability
/// @param dir Unit incident direction
/// @param normal Outward unit surface normal
/// @param ref_idx Refractive index of the dielectric
DielectricInterface dielectric_interface(const Vec3 &dir, const Vec3 &normal, double ref_idx);

} // namespace raycore::core
