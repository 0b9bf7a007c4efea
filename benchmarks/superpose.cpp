// Copyright Global Phasing Ltd.

// Microbenchmark of ensfit::superpose_positions() and ensfit::svd3().
// Requires the google/benchmark library. It can be built manually:
// c++ -Wall -O2 -I../include superpose.cpp -L../build -lensfit -lbenchmark -pthread

#include "ensfit/superpose.hpp"
#include "ensfit/svd3.hpp"
#include <benchmark/benchmark.h>
#include <cmath>
#include <vector>

static std::vector<ensfit::Vec3> helix(size_t n, double phase) {
  std::vector<ensfit::Vec3> v;
  for (size_t i = 0; i != n; ++i) {
    double t = 0.9 * i + phase;
    v.emplace_back(3 * std::cos(t), 3 * std::sin(t), 1.5 * i);
  }
  return v;
}

static void superpose_atoms(benchmark::State& state) {
  size_t n = (size_t) state.range(0);
  std::vector<ensfit::Vec3> ref = helix(n, 0.);
  std::vector<ensfit::Vec3> mob = helix(n, 0.4);
  for (auto _ : state) {
    ensfit::SupResult sr = ensfit::superpose_positions(ref.data(), mob.data(), n, nullptr);
    benchmark::DoNotOptimize(sr);
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));
}

static void svd_of_3x3(benchmark::State& state) {
  ensfit::Mat33 m(0.5, -1.2, 3.1,
                  2.2, 0.3, -0.7,
                  -1.5, 4.0, 0.9);
  for (auto _ : state) {
    ensfit::Svd3 svd = ensfit::svd3(m);
    benchmark::DoNotOptimize(svd);
  }
}

BENCHMARK(superpose_atoms)->Arg(100)->Arg(1000)->Arg(10000);
BENCHMARK(svd_of_3x3);
BENCHMARK_MAIN();
