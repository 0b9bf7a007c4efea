// Copyright Global Phasing Ltd.
//
// Writing PDB file format (Topology + frames -> pdb file).

#ifndef ENSFIT_TO_PDB_HPP_
#define ENSFIT_TO_PDB_HPP_

#include <ostream>
#include <string>
#include <vector>
#include "frame.hpp"     // for Frame
#include "topology.hpp"  // for Topology

namespace ensfit {

struct PdbWriteOptions {
  bool ter_records = true;     // write TER after each chain
  bool end_record = true;      // write END
  bool model_records = false;  // write MODEL/ENDMDL also for a single frame
  bool preserve_serial = false; // use serial numbers from AtomRecord.serial
};

/// Writes one MODEL per frame (MODEL records are omitted for a single
/// frame unless requested). model_numbers, if not empty, is parallel to frames.
ENSFIT_DLL void write_pdb(const Topology& topology, const std::vector<const Frame*>& frames,
                          std::ostream& os, PdbWriteOptions opt=PdbWriteOptions(),
                          const std::vector<int>& model_numbers=std::vector<int>());

inline void write_pdb(const Topology& topology, const Frame& frame, std::ostream& os,
                      PdbWriteOptions opt=PdbWriteOptions()) {
  write_pdb(topology, std::vector<const Frame*>(1, &frame), os, opt);
}

ENSFIT_DLL std::string make_pdb_string(const Topology& topology, const Frame& frame,
                                       PdbWriteOptions opt=PdbWriteOptions());

/// Writes a file and returns the path. Throws IOWriteError.
ENSFIT_DLL std::string write_pdb_file(const Topology& topology,
                                      const std::vector<const Frame*>& frames,
                                      const std::string& path,
                                      PdbWriteOptions opt=PdbWriteOptions(),
                                      const std::vector<int>& model_numbers=std::vector<int>());

} // namespace ensfit

#endif
