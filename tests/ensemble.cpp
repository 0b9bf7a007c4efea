
#include <doctest/doctest.h>

#include <cmath>
#include <string>
#include <vector>
#include <ensfit/container.hpp>
#include <ensfit/ensemble.hpp>
#include "helpers.h"

using ensfit::Ensemble;
using ensfit::Frame;
using ensfit::Vec3;

// 4 residues, 12 atoms
static ensfit::TopologyPtr peptide() {
  std::vector<ensfit::AtomRecord> atoms;
  add_chain(atoms, "A", {"ALA", "GLY", "SER", "LEU"});
  return ensfit::make_topology(atoms, "pep");
}

// rotated and shifted copies of a frame, with small distortions
static std::vector<Frame> noisy_models(const Frame& base, int n) {
  std::vector<Frame> models;
  for (int k = 0; k < n; ++k) {
    ensfit::Mat33 rot = ensfit::rotation_about_axis(Vec3(1, k, 2).normalized(), 0.3 * k);
    Frame f = transformed(base, rot, Vec3(k, -2 * k, 0.5));
    f[k % base.size()] += Vec3(0.05 * k, 0, -0.02);
    models.push_back(f);
  }
  return models;
}

TEST_CASE("Ensemble frames and sizes") {
  Ensemble ens("test");
  ens.set_atoms(peptide());
  CHECK_EQ(ens.n_atoms(), 12);
  CHECK_THROWS_AS(ens.add_frame(helix_frame(11)), ensfit::SizeMismatch);
  ens.add_frame(helix_frame(12));
  // add_frames is all or nothing
  std::vector<Frame> batch{helix_frame(12), helix_frame(10)};
  CHECK_THROWS_AS(ens.add_frames(batch), ensfit::SizeMismatch);
  CHECK_EQ(ens.size(), 1);
  batch.pop_back();
  ens.add_frames(batch);
  CHECK_EQ(ens.size(), 2);
  CHECK_THROWS_AS(ens.set_reference(5), std::out_of_range);
  CHECK_THROWS_AS(ens.set_reference(helix_frame(3)), ensfit::DimensionMismatch);
  ens.delete_frame(0);
  CHECK_EQ(ens.size(), 1);
  CHECK_THROWS_AS(ens.delete_frame(1), std::out_of_range);
  CHECK_THROWS_AS(ens.set_atoms(ensfit::TopologyPtr()), std::runtime_error);
}

TEST_CASE("Ensemble without topology") {
  Ensemble ens;
  ens.add_frame(helix_frame(5));
  CHECK_EQ(ens.n_atoms(), 5);
  CHECK_EQ(ens.mask().count(), 5);
  CHECK_THROWS_AS(ens.select("calpha"), ensfit::SelectionError);
  // the first frame is the default reference
  CHECK_EQ(&ens.reference(), &ens[0]);
  CHECK_EQ(ens.rmsd(), 0.);
}

TEST_CASE("Ensemble superposition and statistics") {
  Ensemble ens("models");
  ens.set_atoms(peptide());
  Frame base = helix_frame(12);
  ens.add_frames(noisy_models(base, 5));
  ens.select("calpha");
  CHECK_EQ(ens.mask().count(), 4);
  ens.set_reference(base);
  std::vector<double> before = ens.rmsds();
  CHECK(before[3] > 1.0);
  CHECK(!ens.superposition_is_valid());
  ens.superpose();
  CHECK(ens.superposition_is_valid());
  std::vector<double> after = ens.rmsds();
  REQUIRE_EQ(after.size(), 5);
  CHECK(after[0] < 1e-9);
  for (size_t i = 0; i != after.size(); ++i) {
    CHECK(after[i] < 0.3);
    // stored results agree with the current coordinates
    CHECK_EQ(after[i], doctest::Approx(
          ensfit::calculate_current_rmsd(ens[i], base, ens.mask())).epsilon(1e-6));
  }

  // changing the selection invalidates the stored results
  ens.select("backbone");
  CHECK(!ens.superposition_is_valid());
  CHECK_EQ(ens.rmsds().size(), 5);
  ens.superpose();
  CHECK(ens.superposition_is_valid());
  ens.add_frame(base);
  CHECK(!ens.superposition_is_valid());

  std::vector<double> rmsf = ens.rmsfs();
  CHECK_EQ(rmsf.size(), 12);
  std::vector<std::vector<Vec3>> dev = ens.deviations();
  CHECK_EQ(dev.size(), 6);
  CHECK_EQ(dev[0].size(), 12);
  CHECK_EQ(ens.radii_of_gyration().size(), 6);
  Frame mean = ens.mean_coordinates();
  CHECK_EQ(mean.label, "mean");
  CHECK_EQ(mean.size(), 12);
}

TEST_CASE("single-pass RMSF agrees with the two-pass formula") {
  Ensemble ens;
  for (int k = 0; k < 7; ++k) {
    Frame f = helix_frame(6);
    f[2] += Vec3(0.1 * k, 0.05 * k * k, -0.2);
    f[4] += Vec3(std::sin(k), std::cos(k), 0);
    ens.add_frame(f);
  }
  std::vector<double> rmsf = ens.rmsfs();
  Frame mean = ens.mean_coordinates();
  for (size_t i = 0; i != 6; ++i) {
    double sum = 0;
    for (const Frame& f : ens.frames())
      sum += f[i].dist_sq(mean[i]);
    CHECK_EQ(rmsf[i], doctest::Approx(std::sqrt(sum / 7)));
  }
  CHECK_EQ(rmsf[0], doctest::Approx(0.).epsilon(1e-12));
}

TEST_CASE("iterpose converges to the mean structure") {
  Ensemble ens("iter");
  ens.add_frames(noisy_models(helix_frame(10), 6));
  int n = ens.iterpose(1e-6, 20);
  CHECK(n >= 1);
  CHECK(n <= 20);
  const Frame& ref = ens.reference();
  CHECK_EQ(ref.label, "mean");
  Frame mean = ens.mean_coordinates();
  CHECK(ensfit::calculate_current_rmsd(mean, ref, ens.mask()) < 1e-3);
}

TEST_CASE("Conformation") {
  Frame base = helix_frame(12);
  Frame moved = transformed(base, ensfit::rotation_about_axis(Vec3(0, 0, 1), 1.0),
                            Vec3(3, 3, 3));
  ensfit::Conformation conf(moved, peptide());
  CHECK_EQ(conf.n_atoms(), 12);
  CHECK_THROWS(conf.rmsd());
  conf.set_reference(base);
  CHECK(conf.rmsd() > 1.0);
  conf.select("calpha");
  ensfit::SupResult sr = conf.superpose();
  CHECK_EQ(sr.count, 4);
  CHECK(sr.rmsd < 1e-9);
  CHECK(conf.rmsd() < 1e-9);
  CHECK(conf.frame()[0].approx(base[0], 1e-9));
  CHECK_THROWS_AS(conf.set_reference(helix_frame(4)), ensfit::DimensionMismatch);
  std::vector<ensfit::AtomRecord> few;
  add_chain(few, "A", {"ALA"});
  CHECK_THROWS_AS(conf.set_atoms(ensfit::make_topology(few)), ensfit::SizeMismatch);
  CHECK_EQ(conf.context().selection(), "calpha");
}
