// Copyright Global Phasing Ltd.
//
// Selections: resolving selection strings to SelectionMask.

#ifndef ENSFIT_SELECT_HPP_
#define ENSFIT_SELECT_HPP_

#include <climits>   // for INT_MIN, INT_MAX
#include <cstdint>
#include <map>
#include <memory>    // for shared_ptr
#include <string>
#include <utility>   // for pair
#include <vector>
#include "frame.hpp"     // for SelectionMask
#include "topology.hpp"  // for Topology, AtomRecord
#include "util.hpp"      // for is_in_list

namespace ensfit {

// from http://www.ccp4.ac.uk/html/pdbcur.html
// Specification of the selection sets:
// either
//     /mdl/chn/s1.i1-s2.i2/at[el]:aloc
// or
//     /mdl/chn/*(res).ic/at[el]:aloc
// followed optionally by ;q<value or ;b>value
//

struct ENSFIT_DLL Selection {
  struct List {
    bool all = true;
    bool inverted = false;
    std::string list;  // comma-separated

    std::string str() const {
      if (all)
        return "*";
      return inverted ? "!" + list : list;
    }

    bool has(const std::string& name) const {
      if (all)
        return true;
      bool found = is_in_list(name, list);
      return inverted ? !found : found;
    }
  };

  struct SequenceId {
    int seqnum;
    char icode;

    bool empty() const {
      return seqnum == INT_MIN || seqnum == INT_MAX;
    }

    std::string str() const;

    int compare(const SeqId& seqid) const {
      if (seqnum != seqid.num)
        return seqnum < seqid.num ? -1 : 1;
      if (icode != '*' && icode != seqid.icode)
        return icode < seqid.icode ? -1 : 1;
      return 0;
    }
  };

  struct AtomInequality {
    char property;
    int relation;
    double value;

    bool matches(const AtomRecord& a) const {
      double atom_value = 0.;
      if (property == 'q')
        atom_value = a.occ;
      else if (property == 'b')
        atom_value = a.b_iso;
      if (relation < 0)
        return atom_value < value;
      if (relation > 0)
        return atom_value > value;
      return atom_value == value;
    }

    std::string str() const;
  };

  int mdl = 0;            // 0 = all
  List chain_ids;
  SequenceId from_seqid = {INT_MIN, '*'};
  SequenceId to_seqid = {INT_MAX, '*'};
  List residue_names;
  List atom_names;
  List elements;          // upper case element symbols
  List altlocs;
  std::vector<AtomInequality> atom_inequalities;

  Selection() = default;
  explicit Selection(const std::string& cid);

  std::string str() const;

  bool matches_model(int model_num) const {
    return mdl == 0 || mdl == model_num;
  }
  bool matches(const AtomRecord& a) const {
    if (!chain_ids.has(a.chain) ||
        !residue_names.has(a.resname) ||
        from_seqid.compare(a.seqid) > 0 ||
        to_seqid.compare(a.seqid) < 0 ||
        !atom_names.has(a.name) ||
        !elements.has(a.element) ||
        !(altlocs.all || altlocs.has(std::string(a.altloc ? 1 : 0, a.altloc))))
      return false;
    for (const AtomInequality& i : atom_inequalities)
      if (!i.matches(a))
        return false;
    return true;
  }
};

/// Residue names treated as amino acids by the "protein" keyword.
ENSFIT_DLL bool is_amino_acid(const std::string& resname);
/// Residue names treated as water by the "water" keyword.
ENSFIT_DLL bool is_water(const std::string& resname);

/// Evaluates a selection string for each atom of the topology.
/// The string is a CID (see above) or an expression combining CIDs and
/// keywords with "and", "or", "not" and parentheses, e.g. "protein and not /B".
/// Keywords: all, calpha, ca, backbone, protein, noh, heavy, hetero, water,
/// and residue groups: nucleic, acidic, basic, charged, neutral, aromatic,
/// aliphatic, cyclic, acyclic, hydrophobic, polar, buried, surface,
/// small, medium, large.
/// Throws InvalidSelectionSyntax or EmptySelection.
ENSFIT_DLL SelectionMask resolve_selection(const std::string& selstr,
                                           const Topology& topology);

/// Cache of resolved masks, keyed by (selection string, topology token).
/// Owned by a container; never shared between containers.
class ENSFIT_DLL MaskCache {
public:
  const SelectionMask& get(const std::string& selstr, const Topology& topology);
  void clear() { cache_.clear(); }
  size_t size() const { return cache_.size(); }
private:
  std::map<std::pair<std::string, std::uint64_t>, SelectionMask> cache_;
};

} // namespace ensfit
#endif
