// Copyright Global Phasing Ltd.
//
// Frame (one set of coordinates for all atoms of a topology)
// and SelectionMask (boolean subset of atoms).

#ifndef ENSFIT_FRAME_HPP_
#define ENSFIT_FRAME_HPP_

#include <string>
#include <utility>  // for move
#include <vector>
#include "math.hpp"  // for Vec3

namespace ensfit {

struct Frame {
  std::vector<Vec3> pos;
  std::string label;

  Frame() = default;
  explicit Frame(size_t n) : pos(n) {}
  explicit Frame(std::vector<Vec3> p, std::string label_="")
    : pos(std::move(p)), label(std::move(label_)) {}

  size_t size() const { return pos.size(); }
  bool empty() const { return pos.empty(); }
  Vec3& operator[](size_t i) { return pos[i]; }
  const Vec3& operator[](size_t i) const { return pos[i]; }
};

struct SelectionMask {
  std::vector<char> flags;

  SelectionMask() = default;
  explicit SelectionMask(std::vector<char> f) : flags(std::move(f)) {}

  static SelectionMask all(size_t n) { return SelectionMask(std::vector<char>(n, 1)); }

  size_t size() const { return flags.size(); }
  bool empty() const { return flags.empty(); }
  bool operator[](size_t i) const { return flags[i] != 0; }

  size_t count() const {
    size_t n = 0;
    for (char f : flags)
      if (f)
        ++n;
    return n;
  }

  std::vector<size_t> indices() const {
    std::vector<size_t> idx;
    for (size_t i = 0; i != flags.size(); ++i)
      if (flags[i])
        idx.push_back(i);
    return idx;
  }
};

} // namespace ensfit
#endif
