
#include <doctest/doctest.h>

#include <cmath>
#include <memory>
#include <string>
#include <vector>
#include <ensfit/ensemble.hpp>
#include <ensfit/trajectory.hpp>
#include "helpers.h"

using ensfit::Frame;
using ensfit::MemorySource;
using ensfit::StreamItem;
using ensfit::Trajectory;
using ensfit::Vec3;

static std::vector<Frame> moving_frames(size_t n_frames, size_t n_atoms, double t0=0.) {
  std::vector<Frame> frames;
  for (size_t k = 0; k != n_frames; ++k) {
    double t = t0 + (double) k;
    ensfit::Mat33 rot = ensfit::rotation_about_axis(Vec3(0, 1, 0), 0.2 * t);
    Frame f = transformed(helix_frame(n_atoms), rot, Vec3(t, 0, -t));
    f[1] += Vec3(0.01 * t, 0, 0);
    frames.push_back(f);
  }
  return frames;
}

// two segments: frames 0-3 and 4-8
static void add_two_segments(Trajectory& traj, MemorySource** first=nullptr,
                             MemorySource** second=nullptr) {
  MemorySource* a = new MemorySource(moving_frames(4, 6), "seg1");
  MemorySource* b = new MemorySource(moving_frames(5, 6, 4.), "seg2");
  traj.add_source(std::unique_ptr<ensfit::FrameSource>(a));
  traj.add_source(std::unique_ptr<ensfit::FrameSource>(b));
  if (first)
    *first = a;
  if (second)
    *second = b;
}

static std::vector<size_t> visible_indices(Trajectory& traj) {
  std::vector<size_t> indices;
  while (StreamItem item = traj.next())
    indices.push_back(item.index);
  return indices;
}

TEST_CASE("Trajectory concatenates segments") {
  Trajectory traj("two");
  add_two_segments(traj);
  CHECK_EQ(traj.n_segments(), 2);
  CHECK_EQ(traj.n_atoms(), 6);
  CHECK_EQ(traj.total_frames(), 9);
  CHECK_EQ(traj.n_frames(), 9);
  CHECK(traj.state() == ensfit::StreamState::Unopened);
  std::vector<size_t> idx = visible_indices(traj);
  CHECK_EQ(idx.size(), 9);
  CHECK_EQ(idx.back(), 8);
  CHECK(traj.state() == ensfit::StreamState::Exhausted);
  // the end-of-stream marker is returned repeatedly
  CHECK(!traj.next());
  CHECK_EQ(traj.next_index(), 9);
}

TEST_CASE("Trajectory range and stride") {
  Trajectory traj;
  add_two_segments(traj);
  traj.set_range(1, 7, 3);
  CHECK_EQ(traj.n_frames(), 3);
  CHECK_EQ(traj.next_index(), 1);
  std::vector<size_t> idx = visible_indices(traj);
  CHECK(idx == std::vector<size_t>{1, 4, 7});
  traj.set_range(2);
  CHECK(visible_indices(traj) == std::vector<size_t>{2, 3, 4, 5, 6, 7, 8});
  traj.set_range(5, 100);
  CHECK_EQ(traj.n_frames(), 4);
  CHECK_THROWS(traj.set_range(0, 5, 0));
  CHECK_THROWS(traj.set_range(4, 3));

  traj.set_range(0, SIZE_MAX, 2);
  traj.skip(2);
  CHECK_EQ(traj.next().index, 4);
  traj.goto_frame(5);  // rounded up to a visible frame
  CHECK_EQ(traj.next().index, 6);
  traj.goto_frame(0);
  CHECK_EQ(traj.next().index, 0);
}

TEST_CASE("iteration after reset is identical") {
  Trajectory traj;
  add_two_segments(traj);
  std::vector<Frame> first_pass;
  while (StreamItem item = traj.next())
    first_pass.push_back(*item.frame);
  traj.reset();
  size_t k = 0;
  while (StreamItem item = traj.next()) {
    REQUIRE(k < first_pass.size());
    CHECK_EQ(item.frame->label, first_pass[k].label);
    for (size_t i = 0; i != item.frame->size(); ++i)
      CHECK((*item.frame)[i] == first_pass[k][i]);
    ++k;
  }
  CHECK_EQ(k, first_pass.size());
  CHECK_EQ(first_pass[5].label, "5");
}

TEST_CASE("segments are opened lazily, one at a time") {
  Trajectory traj;
  MemorySource* a;
  MemorySource* b;
  add_two_segments(traj, &a, &b);
  CHECK(!a->is_open());
  CHECK(!b->is_open());
  CHECK_EQ(a->open_count(), 0);
  traj.next();
  CHECK(a->is_open());
  CHECK(!b->is_open());
  traj.goto_frame(6);
  traj.next();
  CHECK(!a->is_open());
  CHECK(b->is_open());
  while (traj.next()) {}
  // exhausting the stream closes the last segment
  CHECK(!b->is_open());
  CHECK_EQ(a->open_count(), 1);
  CHECK_EQ(b->open_count(), 1);
}

TEST_CASE("add_source with a different number of atoms") {
  Trajectory traj;
  add_two_segments(traj);
  std::unique_ptr<ensfit::FrameSource> bad(new MemorySource(moving_frames(2, 7), "bad"));
  CHECK_THROWS_AS(traj.add_source(std::move(bad)), ensfit::SizeMismatch);
  CHECK_EQ(traj.n_segments(), 2);
  CHECK_EQ(traj.total_frames(), 9);
  std::vector<Frame> uneven;
  uneven.push_back(helix_frame(3));
  uneven.push_back(helix_frame(4));
  CHECK_THROWS_AS(MemorySource(uneven, "uneven"), ensfit::SizeMismatch);
}

TEST_CASE("Trajectory RMSD and superposition") {
  Trajectory traj;
  add_two_segments(traj);
  CHECK_THROWS(traj.rmsd());  // no current frame
  // default reference: the first visible frame
  traj.set_range(2);
  StreamItem item = traj.next();
  CHECK_EQ(traj.reference().label, "2");
  CHECK_EQ(traj.rmsd(), 0.);
  item = traj.next();
  CHECK(traj.rmsd() > 0.5);
  ensfit::SupResult sr = traj.superpose();
  CHECK(sr.rmsd < 0.02);
  CHECK_EQ(traj.rmsd(), doctest::Approx(sr.rmsd));
  // explicit reference
  Frame ref = helix_frame(6);
  traj.set_reference(ref);
  CHECK(&traj.reference() != &ref);
  CHECK(traj.reference()[0] == ref[0]);
  CHECK_THROWS_AS(traj.set_reference(helix_frame(5)), ensfit::DimensionMismatch);
}

TEST_CASE("calculate_rmsf") {
  Trajectory traj;
  add_two_segments(traj);
  std::vector<double> raw = ensfit::calculate_rmsf(traj, false);
  CHECK_EQ(raw.size(), 6);
  std::vector<double> fitted = ensfit::calculate_rmsf(traj, true);
  CHECK_EQ(fitted.size(), 6);
  CHECK(traj.state() == ensfit::StreamState::Positioned);
  CHECK_EQ(traj.next_index(), 0);
  // rigid motion is removed by fitting; only atom 1 moves a little
  for (size_t i = 0; i != 6; ++i)
    CHECK(fitted[i] < raw[i]);
  for (size_t i = 0; i != 6; ++i)
    CHECK(fitted[i] < 0.05);
  // agrees with the single-pass formula
  std::vector<ensfit::Variance3> var(6);
  traj.reset();
  while (StreamItem it = traj.next()) {
    traj.superpose();
    for (size_t i = 0; i != 6; ++i)
      var[i].add_point((*traj.current_frame())[i]);
  }
  for (size_t i = 0; i != 6; ++i)
    CHECK_EQ(fitted[i], doctest::Approx(std::sqrt(var[i].for_population())));
}

TEST_CASE("Ensemble and Trajectory give the same fitted RMSF") {
  std::vector<Frame> frames = moving_frames(7, 8);
  for (size_t k = 0; k != frames.size(); ++k)
    for (size_t i = 0; i != 8; ++i)
      frames[k][i] += Vec3(0.05 * std::sin(1.7 * k + i), 0.03 * std::cos(k * i), 0.02 * k);
  ensfit::Ensemble ens("in memory");
  ens.add_frames(frames);
  ens.superpose();
  std::vector<double> single_pass = ens.rmsfs();

  Trajectory traj("streamed");
  traj.add_source(std::unique_ptr<ensfit::FrameSource>(new MemorySource(frames)));
  std::vector<double> two_pass = ensfit::calculate_rmsf(traj, true);

  REQUIRE_EQ(single_pass.size(), 8);
  REQUIRE_EQ(two_pass.size(), 8);
  for (size_t i = 0; i != 8; ++i) {
    CHECK(single_pass[i] > 0.);
    CHECK_EQ(two_pass[i], doctest::Approx(single_pass[i]).epsilon(1e-9));
  }
}
