#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <cstdlib>  // for rand
#include <climits>  // for INT_MIN, INT_MAX
#include <vector>
#include <ensfit/columns.hpp>
#include <ensfit/math.hpp>
#include <ensfit/svd3.hpp>
#include <ensfit/util.hpp>  // for is_in_list

static double draw() { return 10.0 * std::rand() / RAND_MAX - 5; }

static ensfit::Mat33 random_matrix() {
  ensfit::Mat33 m;
  for (int i = 0; i < 3; ++i)
    for (int j = 0; j < 3; ++j)
      m[i][j] = draw();
  return m;
}

static ensfit::Mat33 diag(const double (&s)[3]) {
  return ensfit::Mat33(s[0], 0, 0, 0, s[1], 0, 0, 0, s[2]);
}

TEST_CASE("Transform::inverse") {
  std::srand(12345);
  ensfit::Transform tr;
  tr.mat = ensfit::rotation_about_axis(ensfit::Vec3(1, 2, 2).normalized(), 0.7);
  tr.vec = ensfit::Vec3(draw(), draw(), draw());
  ensfit::Transform id = tr.combine(tr.inverse());
  CHECK(id.approx(ensfit::Transform(), 1e-12));
  ensfit::Vec3 v(draw(), draw(), draw());
  CHECK(tr.inverse().apply(tr.apply(v)).approx(v, 1e-12));
}

TEST_CASE("rotation_about_axis") {
  ensfit::Mat33 r = ensfit::rotation_about_axis(ensfit::Vec3(0, 0, 1), ensfit::pi() / 2);
  CHECK(r.multiply(ensfit::Vec3(1, 0, 0)).approx(ensfit::Vec3(0, 1, 0), 1e-15));
  CHECK_EQ(r.determinant(), doctest::Approx(1.0));
}

TEST_CASE("svd3 reconstructs the matrix") {
  std::srand(2024);
  for (int k = 0; k < 20; ++k) {
    ensfit::Mat33 a = random_matrix();
    ensfit::Svd3 svd = ensfit::svd3(a);
    CHECK_EQ(svd.rank, 3);
    CHECK(svd.s[0] >= svd.s[1]);
    CHECK(svd.s[1] >= svd.s[2]);
    CHECK_EQ(svd.u.determinant(), doctest::Approx(1.0));
    ensfit::Mat33 b = svd.u.multiply(diag(svd.s)).multiply(svd.v.transpose());
    CHECK(a.approx(b, 1e-9));
  }
}

TEST_CASE("svd3 of rank-deficient matrix") {
  // rank 1: outer product
  ensfit::Vec3 p(1, 2, 3), q(-1, 0.5, 2);
  ensfit::Mat33 a(p.x*q.x, p.x*q.y, p.x*q.z,
                  p.y*q.x, p.y*q.y, p.y*q.z,
                  p.z*q.x, p.z*q.y, p.z*q.z);
  ensfit::Svd3 svd = ensfit::svd3(a);
  CHECK_EQ(svd.rank, 1);
  CHECK_EQ(svd.u.determinant(), doctest::Approx(1.0));
  CHECK(a.approx(svd.u.multiply(diag(svd.s)).multiply(svd.v.transpose()), 1e-9));
  ensfit::Mat33 zero(0, 0, 0, 0, 0, 0, 0, 0, 0);
  CHECK_EQ(ensfit::svd3(zero).rank, 0);

  // rank 1 with round-off: a sum of outer products (a_k u)(b_k v)^T
  for (int n = 0; n < 200; ++n) {
    ensfit::Vec3 u(draw(), draw(), draw());
    ensfit::Vec3 v(draw(), draw(), draw());
    ensfit::Mat33 m(0, 0, 0, 0, 0, 0, 0, 0, 0);
    for (int k = 0; k < 10; ++k) {
      ensfit::Vec3 a1 = u * draw();
      ensfit::Vec3 b1 = v * draw();
      for (int i = 0; i < 3; ++i)
        for (int j = 0; j < 3; ++j)
          m[i][j] += a1.at(i) * b1.at(j);
    }
    CHECK_EQ(ensfit::svd3(m).rank, 1);
  }
}

TEST_CASE("eigen_decomposition") {
  ensfit::Mat33 a(2, 1, 0, 1, 2, 0, 0, 0, 5);
  double d[3];
  ensfit::Mat33 v = ensfit::eigen_decomposition(a, d);
  CHECK_EQ(d[0], doctest::Approx(5));
  CHECK_EQ(d[1], doctest::Approx(3));
  CHECK_EQ(d[2], doctest::Approx(1));
  for (int i = 0; i < 3; ++i) {
    ensfit::Vec3 col = v.column_copy(i);
    CHECK(a.multiply(col).approx(col * d[i], 1e-9));
  }
}

TEST_CASE("Variance3") {
  ensfit::Variance3 v;
  v.add_point(ensfit::Vec3(0, 0, 0));
  v.add_point(ensfit::Vec3(2, 0, 0));
  v.add_point(ensfit::Vec3(1, 3, 0));
  CHECK_EQ(v.n, 3);
  CHECK(v.mean.approx(ensfit::Vec3(1, 1, 0), 1e-15));
  // (1 + 1 + 0) + (1 + 1 + 4) = 8
  CHECK_EQ(v.for_population(), doctest::Approx(8. / 3));
}

TEST_CASE("string_to_int") {
  CHECK_EQ(ensfit::string_to_int(std::to_string(INT_MAX), true), INT_MAX);
  CHECK_EQ(ensfit::string_to_int(std::to_string(INT_MIN), true), INT_MIN);
  CHECK_EQ(ensfit::string_to_int("", false), 0);
}

TEST_CASE("is_in_list") {
  CHECK(ensfit::is_in_list("abc", "abc"));
  CHECK(ensfit::is_in_list("abc", "a,abc"));
  CHECK(!ensfit::is_in_list("abc", ",abcd"));
}

TEST_CASE("vector_Vec3") {
  // superpose_positions depends on the memory layout of Vec3 array.
  std::vector<ensfit::Vec3> vec(5);
  const double* x0 = &vec[0].x;
  const double* x1 = &vec[1].x;
  auto offset = x1 - x0;
  CHECK_EQ(offset, 3);
}
