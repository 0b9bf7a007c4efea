// Copyright Global Phasing Ltd.
//
// StructureInput: a topology with one or more frames (models), as produced
// by a structure file reader and consumed by the alignment driver.

#ifndef ENSFIT_STRUCTURE_HPP_
#define ENSFIT_STRUCTURE_HPP_

#include <string>
#include <vector>
#include "frame.hpp"     // for Frame
#include "topology.hpp"  // for TopologyPtr

namespace ensfit {

struct StructureInput {
  std::string name;           // used in output file names
  TopologyPtr topology;
  std::vector<Frame> frames;  // one per model
  std::vector<int> model_numbers;  // from MODEL records, parallel to frames

  size_t n_models() const { return frames.size(); }
  size_t n_atoms() const { return topology ? topology->size() : 0; }
};

} // namespace ensfit
#endif
