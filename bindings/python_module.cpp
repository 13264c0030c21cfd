#include <raycore/core/camera.hpp>
#include <raycore/core/hit.hpp>
#include <raycore/core/integrator.hpp>
#include <raycore/core/material.hpp>
#include <raycore/core/primitive.hpp>
#include <raycore/core/render.hpp>
#include <raycore/core/scatter.hpp>
#include <raycore/core/scene.hpp>
#include <raycore/log/logger.hpp>
#include <raycore/math/rng.hpp>
#include <raycore/math/utils.hpp>
#include <raycore/sample/warp.hpp>

#include <limits>
#include <string>

#include <pybind11/operators.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

namespace py = pybind11;
using namespace raycore::core;
using namespace raycore::sample;
using namespace raycore::log;

PYBIND11_MODULE(raycore, m) {
  m.doc() = "Python bindings for the raycore path tracing core";

  // Math bindings
  py::class_<Vec3>(m, "Vec3")
      .def(py::init<>())
      .def(py::init<double, double, double>(), py::arg("x"), py::arg("y"),
           py::arg("z"))
      .def_readwrite("x", &Vec3::x)
      .def_readwrite("y", &Vec3::y)
      .def_readwrite("z", &Vec3::z)
      .def(py::self + py::self)
      .def(py::self - py::self)
      .def(py::self * double())
      .def("__repr__", [](const Vec3 &v) {
        return "Vec3(" + std::to_string(v.x) + ", " + std::to_string(v.y) +
               ", " + std::to_string(v.z) + ")";
      });

  py::class_<Vec2>(m, "Vec2")
      .def(py::init<double, double>(), py::arg("x"), py::arg("y"))
      .def_readwrite("x", &Vec2::x)
      .def_readwrite("y", &Vec2::y);

  m.def("dot", &dot, py::arg("a"), py::arg("b"));
  m.def("cross", &cross, py::arg("a"), py::arg("b"));
  m.def("normalize", &normalize, py::arg("v"));
  m.def("linear_to_gamma", py::overload_cast<const Vec3 &>(&linear_to_gamma), py::arg("linear"),
        "sRGB-encode a linear color");
  m.def("gamma_to_linear", py::overload_cast<const Vec3 &>(&gamma_to_linear), py::arg("encoded"),
        "Decode an sRGB color to linear light");

  // RandomStream bindings
  py::class_<RandomStream>(m, "RandomStream")
      .def(py::init<float>(), py::arg("seed") = 0.0f,
           "Create a stream from a float seed")
      .def_readwrite("seed", &RandomStream::seed)
      .def("next_scalar", &RandomStream::next_scalar,
           "Draw a uniform number in [0, 1) and advance the seed")
      .def("next_2d", &RandomStream::next_2d, "Draw a point in [0, 1)^2")
      .def("next_3d", &RandomStream::next_3d, "Draw a point in [0, 1)^3");

  m.def("seed_for_pixel", &seed_for_pixel, py::arg("x"), py::arg("y"),
        py::arg("frame") = 0, "Starting seed for one pixel of one frame");
  m.def("uniform_in_unit_disk", &uniform_in_unit_disk, py::arg("rng"));
  m.def("uniform_in_unit_sphere", &uniform_in_unit_sphere, py::arg("rng"));
  m.def("cosine_weighted_hemisphere_direction",
        &cosine_weighted_hemisphere_direction, py::arg("rng"));

  // Ray and camera bindings
  py::class_<Ray>(m, "Ray")
      .def(py::init<>())
      .def(py::init<Vec3, Vec3, double>(), py::arg("origin"),
           py::arg("direction"), py::arg("time") = 0.0)
      .def_readonly("origin", &Ray::origin)
      .def_readonly("direction", &Ray::direction)
      .def_readonly("time", &Ray::time)
      .def("at", &Ray::at, py::arg("t"));

  py::class_<CameraConfig>(m, "CameraConfig")
      .def(py::init<>())
      .def_readwrite("eye", &CameraConfig::eye)
      .def_readwrite("look_at", &CameraConfig::look_at)
      .def_readwrite("up", &CameraConfig::up)
      .def_readwrite("vfov_degrees", &CameraConfig::vfov_degrees)
      .def_readwrite("aspect", &CameraConfig::aspect)
      .def_readwrite("aperture", &CameraConfig::aperture)
      .def_readwrite("focus_distance", &CameraConfig::focus_distance)
      .def_readwrite("time0", &CameraConfig::time0)
      .def_readwrite("time1", &CameraConfig::time1)
      .def_readwrite("image_width", &CameraConfig::image_width);

  py::class_<Camera>(m, "Camera")
      .def(py::init<const CameraConfig &>(), py::arg("config"))
      .def_readonly("u", &Camera::u)
      .def_readonly("v", &Camera::v)
      .def_readonly("n", &Camera::n)
      .def_readonly("lens_radius", &Camera::lens_radius)
      .def_readonly("focus_dist", &Camera::focus_dist)
      .def("generate_ray", &Camera::generate_ray, py::arg("uv"), py::arg("rng"),
           "Generate a world-space ray through a normalized image position");

  // Material bindings
  py::class_<Diffuse>(m, "Diffuse")
      .def(py::init<>())
      .def_readwrite("albedo", &Diffuse::albedo);
  py::class_<Metal>(m, "Metal")
      .def(py::init<>())
      .def_readwrite("specular", &Metal::specular)
      .def_readwrite("roughness", &Metal::roughness);
  py::class_<Dielectric>(m, "Dielectric")
      .def(py::init<>())
      .def_readwrite("refract_color", &Dielectric::refract_color)
      .def_readwrite("ref_idx", &Dielectric::ref_idx)
      .def_readwrite("roughness", &Dielectric::roughness);

  m.def("make_diffuse", &make_diffuse, py::arg("albedo"));
  m.def("make_metal", &make_metal, py::arg("specular"), py::arg("roughness") = 0.0);
  m.def("make_dielectric", &make_dielectric, py::arg("refract_color"),
        py::arg("ref_idx"), py::arg("roughness") = 0.0);
  m.def("schlick", &schlick, py::arg("cosine"), py::arg("ref_idx"),
        "Schlick approximation of Fresnel reflectance");

  // Intersection and scattering bindings
  py::class_<HitRecord>(m, "HitRecord")
      .def_readonly("position", &HitRecord::position)
      .def_readonly("normal", &HitRecord::normal)
      .def_readonly("t", &HitRecord::t)
      .def_readonly("material", &HitRecord::material);

  py::class_<ScatterRecord>(m, "ScatterRecord")
      .def_readonly("attenuation", &ScatterRecord::attenuation)
      .def_readonly("scattered", &ScatterRecord::scattered);

  py::class_<Sphere>(m, "Sphere")
      .def(py::init<Vec3, double>(), py::arg("center"), py::arg("radius"))
      .def_readwrite("center", &Sphere::center)
      .def_readwrite("radius", &Sphere::radius);

  py::class_<MovingSphere>(m, "MovingSphere")
      .def(py::init<Vec3, Vec3, double, double, double>(), py::arg("center0"),
           py::arg("center1"), py::arg("time0"), py::arg("time1"),
           py::arg("radius"))
      .def("center_at", &MovingSphere::center_at, py::arg("time"));

  py::class_<Triangle>(m, "Triangle")
      .def(py::init<Vec3, Vec3, Vec3>(), py::arg("a"), py::arg("b"), py::arg("c"))
      .def("normal", &Triangle::normal);

  m.def(
      "intersect",
      [](const Primitive &shape, const Ray &ray, double t_min, double t_max) {
        return intersect(shape, ray, t_min, t_max);
      },
      py::arg("shape"), py::arg("ray"), py::arg("t_min"), py::arg("t_max"),
      "Intersect a ray with a sphere, moving sphere or triangle");

  m.def("scatter", &scatter, py::arg("ray_in"), py::arg("hit"), py::arg("rng"),
        "Scatter a ray at a hit; returns None when the path is absorbed");

  // Scene and rendering bindings
  py::class_<Scene>(m, "Scene")
      .def(py::init<>())
      .def("add", &Scene::add, py::arg("shape"), py::arg("material"))
      .def("__len__", &Scene::size);

  m.def("closest_hit", &closest_hit, py::arg("scene"), py::arg("ray"),
        py::arg("t_min") = 0.0,
        py::arg("t_max") = std::numeric_limits<double>::infinity());

  py::class_<Background>(m, "Background")
      .def(py::init<>())
      .def_readwrite("horizon", &Background::horizon)
      .def_readwrite("zenith", &Background::zenith);

  py::class_<RenderConfig>(m, "RenderConfig")
      .def(py::init<std::size_t, std::size_t, std::size_t>(), py::arg("width"),
           py::arg("height"), py::arg("samples_per_pixel"))
      .def(py::init<std::uint64_t, std::size_t, std::size_t, std::size_t>(),
           py::arg("seed"), py::arg("width"), py::arg("height"),
           py::arg("samples_per_pixel"))
      .def_readwrite("seed", &RenderConfig::seed)
      .def_readwrite("n_threads", &RenderConfig::n_threads)
      .def_readwrite("max_depth", &RenderConfig::max_depth)
      .def_readwrite("background", &RenderConfig::background);

  py::class_<Image>(m, "Image")
      .def_readonly("width", &Image::width)
      .def_readonly("height", &Image::height)
      .def_readonly("pixels", &Image::pixels)
      .def("mean", &Image::mean);

  m.def(
      "render",
      [](const Camera &camera, const Scene &scene, const RenderConfig &config) {
        py::gil_scoped_release release;
        return render_parallel(camera, scene, config);
      },
      py::arg("camera"), py::arg("scene"), py::arg("config"),
      "Render the scene into a linear-light image");

  // Logger bindings
  py::enum_<Level>(m, "LogLevel")
      .value("debug", Level::debug)
      .value("info", Level::info)
      .value("warn", Level::warn)
      .value("error", Level::error)
      .value("off", Level::off)
      .export_values();

  m.def(
      "set_log_level", [](Level level) { Logger::instance().set_level(level); },
      py::arg("level"), "Set the logging level for the raycore module");
}
