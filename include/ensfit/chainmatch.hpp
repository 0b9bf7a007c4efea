// Copyright Global Phasing Ltd.
//
// Chain correspondence between two structures with possibly different
// chain order or naming. Used before superposing distinct structures.

#ifndef ENSFIT_CHAINMATCH_HPP_
#define ENSFIT_CHAINMATCH_HPP_

#include <string>
#include <utility>   // for pair
#include <vector>
#include "fail.hpp"      // for ENSFIT_DLL
#include "frame.hpp"     // for SelectionMask
#include "logger.hpp"    // for Logger
#include "topology.hpp"  // for Topology

namespace ensfit {

struct MatchOptions {
  double min_identity = 90.;  // percent
  double min_overlap = 0.;    // percent
};

struct ChainMatch {
  enum class Mode { SeqId, Run };
  size_t chain_a = 0;  // index in Topology::chains()
  size_t chain_b = 0;
  std::string name_a;
  std::string name_b;
  Mode mode = Mode::SeqId;
  size_t score = 0;
  double identity = 0.;  // percent of compared residues with equal names
  double overlap = 0.;   // percent of the shorter chain that was compared
  /// pairs of residue indices (Topology::residues()) with equal names
  std::vector<std::pair<size_t, size_t>> residues;
};

struct Correspondence {
  std::vector<ChainMatch> chains;
  std::vector<size_t> atoms_a;  // atoms_a[i] corresponds to atoms_b[i]
  std::vector<size_t> atoms_b;

  size_t size() const { return atoms_a.size(); }
  /// name of the chain in B paired with chain_a, or empty string
  std::string partner_of(const std::string& chain_a) const {
    for (const ChainMatch& m : chains)
      if (m.name_a == chain_a)
        return m.name_b;
    return std::string();
  }
};

/// Compares two chains. The score is the larger of: the number of residues
/// with the same sequence number and name, and the length of the longest
/// common contiguous run of residue names. The residue pairing comes from
/// the mode that gives the larger score (sequence numbers on a tie).
ENSFIT_DLL ChainMatch score_chain_pair(const Topology& a, size_t chain_a,
                                       const Topology& b, size_t chain_b);

/// Greedy one-to-one chain assignment in descending order of score.
/// Equal scores are resolved by chain name in A, then chain name in B,
/// then chain order. Chains without partner are left out.
/// The atom correspondence pairs atoms with equal names (first altloc) in
/// paired residues, with both atoms selected by the masks.
/// Throws InsufficientAtoms if fewer than 3 atom pairs are found,
/// DimensionMismatch if a mask does not fit its topology.
ENSFIT_DLL Correspondence match_chains(const Topology& a, const Topology& b,
                                       const SelectionMask& mask_a,
                                       const SelectionMask& mask_b,
                                       const MatchOptions& options=MatchOptions(),
                                       const Logger& logger=Logger());

} // namespace ensfit
#endif
