// Copyright Global Phasing Ltd.

#include <ensfit/topology.hpp>
#include <atomic>

namespace ensfit {

namespace {

std::uint64_t next_token() {
  static std::atomic<std::uint64_t> counter{0};
  return ++counter;
}

} // anonymous namespace

Topology::Topology(std::vector<AtomRecord> atoms, std::string name)
  : atoms_(std::move(atoms)), name_(std::move(name)), token_(next_token()) {
  for (size_t i = 0; i != atoms_.size(); ++i) {
    const AtomRecord& a = atoms_[i];
    if (chains_.empty() || chains_.back().name != a.chain) {
      if (!chains_.empty()) {
        chains_.back().end = i;
        chains_.back().end_residue = residues_.size();
      }
      chains_.emplace_back();
      chains_.back().name = a.chain;
      chains_.back().begin = i;
      chains_.back().first_residue = residues_.size();
    } else if (residues_.back().seqid == a.seqid &&
               residues_.back().name == a.resname) {
      continue;  // the same residue
    }
    if (!residues_.empty())
      residues_.back().end = i;
    residues_.emplace_back();
    ResidueInfo& res = residues_.back();
    res.begin = i;
    res.name = a.resname;
    res.seqid = a.seqid;
    res.chain_idx = chains_.size() - 1;
  }
  if (!atoms_.empty()) {
    residues_.back().end = atoms_.size();
    chains_.back().end = atoms_.size();
    chains_.back().end_residue = residues_.size();
  }
}

std::shared_ptr<Topology> Topology::subset(const std::vector<char>& flags) const {
  if (flags.size() != atoms_.size())
    fail_with<DimensionMismatch>("Topology::subset(): mask has ",
                                 std::to_string(flags.size()), " items, topology has ",
                                 std::to_string(atoms_.size()), " atoms");
  std::vector<AtomRecord> selected;
  for (size_t i = 0; i != atoms_.size(); ++i)
    if (flags[i])
      selected.push_back(atoms_[i]);
  return std::make_shared<Topology>(std::move(selected), name_);
}

} // namespace ensfit
