#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <raycore/core/primitive.hpp>
#include <stdexcept>

using namespace raycore::core;

namespace {

constexpr double INF = std::numeric_limits<double>::infinity();

void expect_vec_near(const Vec3 &a, const Vec3 &b, double tol = 1e-12) {
  EXPECT_NEAR(a.x, b.x, tol);
  EXPECT_NEAR(a.y, b.y, tol);
  EXPECT_NEAR(a.z, b.z, tol);
}

} // namespace

TEST(Ray, DirectionIsNormalizedAndAtFollowsIt) {
  const Ray ray({1, 2, 3}, {0, 0, -4}, 0.25);
  expect_vec_near(ray.direction, {0, 0, -1});
  expect_vec_near(ray.at(2.0), {1, 2, 1});
  EXPECT_EQ(ray.time, 0.25);
}

TEST(SphereIntersect, HitsNearSideOnAxis) {
  for (double d : {2.0, 5.0, 10.0}) {
    const Sphere sphere{{0, 0, 0}, 1.5};
    const Ray ray({0, 0, d}, {0, 0, -1});
    const auto hit = intersect(sphere, ray, 1e-6, INF);
    ASSERT_TRUE(hit.has_value());
    EXPECT_NEAR(hit->t, d - 1.5, 1e-12);
    expect_vec_near(hit->normal, {0, 0, 1});
    expect_vec_near(hit->position, {0, 0, 1.5});
  }
}

TEST(SphereIntersect, NegativeRadiusInvertsNormal) {
  const Sphere sphere{{0, 0, 0}, -1.0};
  const Ray ray({0, 0, 4}, {0, 0, -1});
  const auto hit = intersect(sphere, ray, 1e-6, INF);
  ASSERT_TRUE(hit.has_value());
  EXPECT_NEAR(hit->t, 3.0, 1e-12);
  expect_vec_near(hit->normal, {0, 0, -1});
}

TEST(SphereIntersect, MissesWhenPointingAway) {
  const Sphere sphere{{0, 0, 0}, 1.0};
  const Ray ray({0, 0, 3}, {0, 0, 1});
  EXPECT_FALSE(intersect(sphere, ray, 1e-6, INF).has_value());
}

TEST(SphereIntersect, MissesWhenOffset) {
  const Sphere sphere{{0, 0, 0}, 1.0};
  const Ray ray({0, 1.01, 3}, {0, 0, -1});
  EXPECT_FALSE(intersect(sphere, ray, 1e-6, INF).has_value());
}

TEST(SphereIntersect, RespectsOpenInterval) {
  const Sphere sphere{{0, 0, 0}, 1.0};
  const Ray ray({0, 0, 3}, {0, 0, -1});
  // Near root at t = 2, far root at t = 4
  EXPECT_FALSE(intersect(sphere, ray, 1e-6, 2.0).has_value());
  const auto far = intersect(sphere, ray, 2.0, INF);
  ASSERT_TRUE(far.has_value());
  EXPECT_NEAR(far->t, 4.0, 1e-12);
  EXPECT_FALSE(intersect(sphere, ray, 4.0, INF).has_value());
}

TEST(SphereIntersect, FromInsideReportsFarSide) {
  const Sphere sphere{{0, 0, 0}, 2.0};
  const Ray ray({0, 0, 0}, {1, 0, 0});
  const auto hit = intersect(sphere, ray, 1e-6, INF);
  ASSERT_TRUE(hit.has_value());
  EXPECT_NEAR(hit->t, 2.0, 1e-12);
  // Outward normal, same side as the ray direction
  expect_vec_near(hit->normal, {1, 0, 0});
}

TEST(SphereIntersect, RepeatedQueriesAreBitIdentical) {
  const Sphere sphere{{0.3, -0.2, -4}, 1.25};
  const Ray ray({0.1, 0.2, 0.7}, {0.05, -0.07, -1});
  const auto a = intersect(sphere, ray, 1e-6, INF);
  const auto b = intersect(sphere, ray, 1e-6, INF);
  ASSERT_TRUE(a.has_value());
  ASSERT_TRUE(b.has_value());
  EXPECT_EQ(a->t, b->t);
  EXPECT_EQ(a->position, b->position);
  EXPECT_EQ(a->normal, b->normal);
}

TEST(MovingSphereIntersect, CenterFollowsRayTime) {
  const MovingSphere sphere({0, 0, 0}, {4, 0, 0}, 0.0, 2.0, 1.0);
  expect_vec_near(sphere.center_at(0.0), {0, 0, 0});
  expect_vec_near(sphere.center_at(1.0), {2, 0, 0});
  expect_vec_near(sphere.center_at(2.0), {4, 0, 0});

  const Ray early({2, 0, 5}, {0, 0, -1}, 0.0);
  EXPECT_FALSE(intersect(sphere, early, 1e-6, INF).has_value());

  const Ray middle({2, 0, 5}, {0, 0, -1}, 1.0);
  const auto hit = intersect(sphere, middle, 1e-6, INF);
  ASSERT_TRUE(hit.has_value());
  EXPECT_NEAR(hit->t, 4.0, 1e-12);
  expect_vec_near(hit->normal, {0, 0, 1});
}

TEST(MovingSphereIntersect, MatchesStaticSphereAtSameCenter) {
  const MovingSphere moving({-1, 0, -3}, {1, 0, -3}, 0.0, 1.0, 0.8);
  const Sphere fixed{{0, 0, -3}, 0.8};
  const Ray ray({0.1, 0.2, 0}, {0, 0, -1}, 0.5);
  const auto a = intersect(moving, ray, 1e-6, INF);
  const auto b = intersect(fixed, ray, 1e-6, INF);
  ASSERT_TRUE(a.has_value());
  ASSERT_TRUE(b.has_value());
  EXPECT_NEAR(a->t, b->t, 1e-12);
  expect_vec_near(a->normal, b->normal);
}

TEST(MovingSphereIntersect, RejectsEmptyTimeInterval) {
  EXPECT_THROW(MovingSphere({0, 0, 0}, {1, 0, 0}, 1.0, 1.0, 1.0), std::invalid_argument);
}

TEST(TriangleIntersect, CounterClockwiseWindingFacesPlusZ) {
  const Triangle tri{{0, 0, 0}, {1, 0, 0}, {0, 1, 0}};
  expect_vec_near(tri.normal(), {0, 0, 1});

  const Triangle flipped{{0, 0, 0}, {0, 1, 0}, {1, 0, 0}};
  expect_vec_near(flipped.normal(), {0, 0, -1});
}

TEST(TriangleIntersect, HitReportsWindingNormal) {
  const Triangle tri{{-1, -1, -2}, {1, -1, -2}, {0, 1, -2}};
  const Ray ray({0, 0, 0}, {0, 0, -1});
  const auto hit = intersect(tri, ray, 1e-6, INF);
  ASSERT_TRUE(hit.has_value());
  EXPECT_NEAR(hit->t, 2.0, 1e-12);
  expect_vec_near(hit->position, {0, 0, -2});
  expect_vec_near(hit->normal, {0, 0, 1});

  // Both sides are hit, the normal keeps its winding
  const Ray back({0, 0, -4}, {0, 0, 1});
  const auto hit_back = intersect(tri, back, 1e-6, INF);
  ASSERT_TRUE(hit_back.has_value());
  expect_vec_near(hit_back->normal, {0, 0, 1});
}

TEST(TriangleIntersect, MissesOutsideBarycentricRange) {
  const Triangle tri{{0, 0, -1}, {1, 0, -1}, {0, 1, -1}};
  EXPECT_FALSE(intersect(tri, Ray({0.6, 0.6, 0}, {0, 0, -1}), 1e-6, INF).has_value());
  EXPECT_FALSE(intersect(tri, Ray({-0.1, 0.5, 0}, {0, 0, -1}), 1e-6, INF).has_value());
  EXPECT_FALSE(intersect(tri, Ray({0.5, -0.1, 0}, {0, 0, -1}), 1e-6, INF).has_value());
}

TEST(TriangleIntersect, RejectsParallelRays) {
  const Triangle tri{{0, 0, -1}, {1, 0, -1}, {0, 1, -1}};
  const Ray grazing({0.2, 0.2, -1}, {1, 0, 0});
  EXPECT_FALSE(intersect(tri, grazing, -INF, INF).has_value());
}

TEST(TriangleIntersect, RejectsDegenerateTriangle) {
  const Triangle sliver{{0, 0, -1}, {1, 0, -1}, {2, 0, -1}};
  EXPECT_FALSE(intersect(sliver, Ray({0.5, 0, 0}, {0, 0, -1}), 1e-6, INF).has_value());
}

TEST(TriangleIntersect, BehindOriginIsIgnored) {
  const Triangle tri{{-1, -1, 2}, {1, -1, 2}, {0, 1, 2}};
  EXPECT_FALSE(intersect(tri, Ray({0, 0, 0}, {0, 0, -1}), 1e-6, INF).has_value());
}

TEST(PrimitiveIntersect, DispatchesOnVariant) {
  const Primitive shape = Sphere{{0, 0, -2}, 1.0};
  const auto hit = intersect(shape, Ray({0, 0, 0}, {0, 0, -1}), 1e-6, INF);
  ASSERT_TRUE(hit.has_value());
  EXPECT_NEAR(hit->t, 1.0, 1e-12);

  const Primitive tri = Triangle{{-1, -1, -3}, {1, -1, -3}, {0, 1, -3}};
  const auto tri_hit = intersect(tri, Ray({0, 0, 0}, {0, 0, -1}), 1e-6, INF);
  ASSERT_TRUE(tri_hit.has_value());
  EXPECT_NEAR(tri_hit->t, 3.0, 1e-12);
}

TEST(PrimitiveIntersect, ZeroDirectionNeverHits) {
  const Ray degenerate({0, 0, 5}, {0, 0, 0});
  EXPECT_FALSE(intersect(Sphere{{0, 0, 0}, 1.0}, degenerate, 1e-6, INF).has_value());
  EXPECT_FALSE(intersect(Triangle{{-1, -1, 0}, {1, -1, 0}, {0, 1, 0}}, degenerate, 1e-6, INF).has_value());
}
