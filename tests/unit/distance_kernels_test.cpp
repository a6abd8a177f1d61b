#include <catch2/catch_all.hpp>
#include <embdb/kernels/distance.hpp>

#include <vector>

using namespace embdb::kernels;
using embdb::AggregationType;
using embdb::MetricType;

TEST_CASE("distance kernels known values", "[kernels][distance]") {
  using Catch::Approx;

  float a1[1]{3.0f}; float b1[1]{-1.0f};
  REQUIRE(l2_sq(a1, b1) == Approx(16.0f));
  REQUIRE(inner_product(a1, b1) == Approx(-3.0f));

  float a5[5]{1, 2, 3, 4, 5}; float b5[5]{5, 4, 3, 2, 1};
  REQUIRE(inner_product(a5, b5) == Approx(35.0f));
  REQUIRE(l2_sq(a5, b5) == Approx(40.0f));

  float x[2]{1.0f, 0.0f}; float y[2]{0.0f, 1.0f};
  REQUIRE(cosine_distance(x, x) == Approx(0.0f).margin(1e-6));
  REQUIRE(cosine_distance(x, y) == Approx(1.0f));
}

TEST_CASE("metric dispatch: smaller is closer", "[kernels][distance]") {
  using Catch::Approx;
  float q[2]{3.0f, 4.0f};
  float near[2]{3.0f, 4.0f};
  float far[2]{-3.0f, -4.0f};

  REQUIRE(distance(MetricType::euclid, q, near) == Approx(0.0));
  REQUIRE(distance(MetricType::euclid, q, far) == Approx(10.0));
  REQUIRE(distance(MetricType::dot, q, near) == Approx(-25.0));
  REQUIRE(distance(MetricType::dot, q, far) == Approx(25.0));
  REQUIRE(distance(MetricType::cosine, q, far) == Approx(2.0));
  for (auto m : {MetricType::cosine, MetricType::dot, MetricType::euclid}) {
    REQUIRE(distance(m, q, near) < distance(m, q, far));
  }
}

TEST_CASE("cosine distance with a zero vector is 1", "[kernels][distance]") {
  float zero[3]{0, 0, 0}; float v[3]{1, 2, 3};
  REQUIRE(cosine_distance(zero, v) == Catch::Approx(1.0f));
}

TEST_CASE("aggregation of part distances", "[kernels][aggregate]") {
  using Catch::Approx;
  std::vector<double> d{0.1, 0.9};
  REQUIRE(aggregate(AggregationType::min, d) == Approx(0.1));
  REQUIRE(aggregate(AggregationType::avg, d) == Approx(0.5));
  REQUIRE(aggregate(AggregationType::min, {}) == 0.0);
}

TEST_CASE("dimension validation", "[kernels]") {
  std::vector<float> v(3, 0.0f);
  REQUIRE(validate_dimensions(v, 3, "v").has_value());
  auto bad = validate_dimensions(v, 4, "v");
  REQUIRE_FALSE(bad.has_value());
  REQUIRE(bad.error().code == embdb::core::error_code::dimension_mismatch);
}
