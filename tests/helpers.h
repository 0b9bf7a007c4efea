// Small builders of topologies and frames used in tests.

#pragma once

#include <cmath>
#include <string>
#include <vector>
#include <ensfit/frame.hpp>
#include <ensfit/math.hpp>
#include <ensfit/topology.hpp>

// Appends residues with backbone atoms N, CA, C to atoms.
inline void add_chain(std::vector<ensfit::AtomRecord>& atoms, const std::string& chain,
                      const std::vector<std::string>& resnames, int first_num=1) {
  static const char* names[] = {"N", "CA", "C"};
  for (size_t i = 0; i != resnames.size(); ++i)
    for (const char* name : names) {
      ensfit::AtomRecord a;
      a.serial = (int) atoms.size() + 1;
      a.name = name;
      a.resname = resnames[i];
      a.chain = chain;
      a.seqid = ensfit::SeqId(first_num + (int) i, ' ');
      a.element = std::string(1, name[0]);
      atoms.push_back(a);
    }
}

inline std::vector<std::string> split_names(const std::string& s) {
  std::vector<std::string> r;
  for (size_t i = 0; i + 3 <= s.size(); i += 4)
    r.push_back(s.substr(i, 3));
  return r;
}

// Points on a bent helix; never coplanar for n >= 4.
inline ensfit::Frame helix_frame(size_t n, double phase=0.) {
  ensfit::Frame frame;
  for (size_t i = 0; i != n; ++i) {
    double t = 0.9 * i + phase;
    frame.pos.emplace_back(3 * std::cos(t), 3 * std::sin(t), 1.5 * i + 0.1 * i * i);
  }
  return frame;
}

inline ensfit::Frame transformed(const ensfit::Frame& frame, const ensfit::Mat33& rot,
                                 const ensfit::Vec3& shift) {
  ensfit::Frame out = frame;
  for (ensfit::Vec3& p : out.pos)
    p = rot.multiply(p) + shift;
  return out;
}
