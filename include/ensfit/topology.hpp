// Copyright Global Phasing Ltd.
//
// Topology: static per-atom metadata (chain, residue, atom name, element)
// shared by all coordinate frames of one structure or trajectory.

#ifndef ENSFIT_TOPOLOGY_HPP_
#define ENSFIT_TOPOLOGY_HPP_

#include <cstdint>
#include <cstdlib>    // for strtol
#include <memory>     // for shared_ptr
#include <stdexcept>  // for invalid_argument
#include <string>
#include <utility>    // for move
#include <vector>
#include "fail.hpp"   // for ENSFIT_DLL

namespace ensfit {

// residue number and insertion code together
struct SeqId {
  int num = 0;
  char icode = ' ';

  SeqId() = default;
  SeqId(int num_, char icode_) : num(num_), icode(icode_) {}
  explicit SeqId(const std::string& str) {
    char* endptr;
    num = (int) std::strtol(str.c_str(), &endptr, 10);
    if (endptr == str.c_str() || (*endptr != '\0' && endptr[1] != '\0'))
      throw std::invalid_argument("Not a seqid: " + str);
    icode = *endptr != '\0' ? *endptr : ' ';
  }

  bool operator==(const SeqId& o) const {
    return num == o.num && (icode | 0x20) == (o.icode | 0x20);
  }
  bool operator!=(const SeqId& o) const { return !operator==(o); }
  bool operator<(const SeqId& o) const {
    return num != o.num ? num < o.num : (icode | 0x20) < (o.icode | 0x20);
  }

  bool has_icode() const { return icode != ' '; }

  std::string str() const {
    std::string r = std::to_string(num);
    if (icode != ' ')
      r += icode;
    return r;
  }
};

struct AtomRecord {
  int serial = 0;
  std::string name;     // atom name, e.g. CA
  char altloc = '\0';   // '\0' if not set
  std::string resname;  // residue name, e.g. ALA
  std::string chain;    // chain id
  SeqId seqid;
  std::string element;  // upper case, e.g. C, FE
  bool het = false;     // from HETATM record
  float occ = 1.0f;
  float b_iso = 0.0f;

  bool is_hydrogen() const { return element == "H" || element == "D"; }
};

// half-open range of atom indices
struct AtomSpan {
  size_t begin = 0;
  size_t end = 0;
  size_t size() const { return end - begin; }
  bool contains(size_t idx) const { return idx >= begin && idx < end; }
};

struct ResidueInfo : AtomSpan {
  std::string name;
  SeqId seqid;
  size_t chain_idx = 0;  // index in Topology::chains()
};

struct ChainInfo : AtomSpan {
  std::string name;
  size_t first_residue = 0;  // range of indices in Topology::residues()
  size_t end_residue = 0;
  size_t residue_count() const { return end_residue - first_residue; }
};

/// Immutable list of atoms. Chains and residues are contiguous runs of
/// atoms with the same chain id and the same (chain, seqid, resname).
/// Every Topology gets a process-unique token, used as a cache key.
class ENSFIT_DLL Topology {
public:
  explicit Topology(std::vector<AtomRecord> atoms, std::string name="");

  size_t size() const { return atoms_.size(); }
  bool empty() const { return atoms_.empty(); }
  const AtomRecord& operator[](size_t i) const { return atoms_[i]; }
  const AtomRecord& at(size_t i) const { return atoms_.at(i); }
  const std::vector<AtomRecord>& atoms() const { return atoms_; }
  const std::vector<ResidueInfo>& residues() const { return residues_; }
  const std::vector<ChainInfo>& chains() const { return chains_; }
  const std::string& name() const { return name_; }
  std::uint64_t token() const { return token_; }

  /// copy of atoms for which flags[i] is set, with a new token
  std::shared_ptr<Topology> subset(const std::vector<char>& flags) const;

private:
  std::vector<AtomRecord> atoms_;
  std::vector<ResidueInfo> residues_;
  std::vector<ChainInfo> chains_;
  std::string name_;
  std::uint64_t token_;
};

typedef std::shared_ptr<const Topology> TopologyPtr;

inline TopologyPtr make_topology(std::vector<AtomRecord> atoms,
                                 const std::string& name="") {
  return std::make_shared<Topology>(std::move(atoms), name);
}

} // namespace ensfit
#endif
