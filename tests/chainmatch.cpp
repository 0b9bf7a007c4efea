
#include <doctest/doctest.h>

#include <string>
#include <vector>
#include <ensfit/chainmatch.hpp>
#include "helpers.h"

using ensfit::ChainMatch;
using ensfit::SelectionMask;
using ensfit::Topology;

static const char* SEQ1 = "MET ALA LYS GLY LEU SER THR PRO ";
static const char* SEQ2 = "GLU TRP PHE ASN GLN HIS ARG VAL ";

static ensfit::TopologyPtr two_chains(const std::string& name1, const char* seq1,
                                      const std::string& name2, const char* seq2) {
  std::vector<ensfit::AtomRecord> atoms;
  add_chain(atoms, name1, split_names(seq1));
  add_chain(atoms, name2, split_names(seq2));
  return ensfit::make_topology(atoms, name1 + name2);
}

TEST_CASE("score_chain_pair") {
  ensfit::TopologyPtr a = two_chains("A", SEQ1, "B", SEQ2);
  SUBCASE("identical chains") {
    ChainMatch m = ensfit::score_chain_pair(*a, 0, *a, 0);
    CHECK_EQ(m.score, 8);
    CHECK(m.mode == ChainMatch::Mode::SeqId);
    CHECK_EQ(m.identity, 100.);
    CHECK_EQ(m.overlap, 100.);
    CHECK_EQ(m.residues.size(), 8);
  }
  SUBCASE("different sequences") {
    ChainMatch m = ensfit::score_chain_pair(*a, 0, *a, 1);
    CHECK_EQ(m.score, 0);
  }
  SUBCASE("renumbered chain is matched by the contiguous run") {
    std::vector<ensfit::AtomRecord> atoms;
    add_chain(atoms, "A", split_names(std::string("GLY ") + SEQ1), 101);
    Topology b(atoms);
    ChainMatch m = ensfit::score_chain_pair(*a, 0, b, 0);
    CHECK(m.mode == ChainMatch::Mode::Run);
    CHECK_EQ(m.score, 8);
    CHECK_EQ(m.identity, 100.);
    CHECK_EQ(m.overlap, 100.);
    REQUIRE_EQ(m.residues.size(), 8);
    CHECK_EQ(m.residues[0].first, 0);
    CHECK_EQ(m.residues[0].second, 1);  // the extra GLY is skipped
  }
}

TEST_CASE("chains in reversed order are matched by content") {
  ensfit::TopologyPtr a = two_chains("A", SEQ1, "B", SEQ2);
  // the first chain of b has the sequence of chain B of a
  ensfit::TopologyPtr b = two_chains("A", SEQ2, "B", SEQ1);
  ensfit::Correspondence corr = ensfit::match_chains(*a, *b,
                                                     SelectionMask::all(a->size()),
                                                     SelectionMask::all(b->size()));
  REQUIRE_EQ(corr.chains.size(), 2);
  CHECK_EQ(corr.partner_of("A"), "B");
  CHECK_EQ(corr.partner_of("B"), "A");
  CHECK_EQ(corr.chains[0].chain_b, 1);
  CHECK_EQ(corr.chains[1].chain_b, 0);
  REQUIRE_EQ(corr.size(), a->size());
  for (size_t k = 0; k != corr.size(); ++k) {
    const ensfit::AtomRecord& x = (*a)[corr.atoms_a[k]];
    const ensfit::AtomRecord& y = (*b)[corr.atoms_b[k]];
    CHECK_EQ(x.name, y.name);
    CHECK_EQ(x.resname, y.resname);
    CHECK(x.chain != y.chain);
  }
}

TEST_CASE("chain assignment is one-to-one") {
  // two identical chains in a, one in b
  ensfit::TopologyPtr a = two_chains("A", SEQ1, "B", SEQ1);
  std::vector<ensfit::AtomRecord> atoms;
  add_chain(atoms, "X", split_names(SEQ1));
  ensfit::TopologyPtr b = ensfit::make_topology(atoms, "b");
  std::vector<std::string> notes;
  ensfit::Logger logger;
  logger.callback = [&](const std::string& s) { notes.push_back(s); };
  logger.threshold = 5;
  ensfit::Correspondence corr = ensfit::match_chains(*a, *b,
                                                     SelectionMask::all(a->size()),
                                                     SelectionMask::all(b->size()),
                                                     ensfit::MatchOptions(), logger);
  REQUIRE_EQ(corr.chains.size(), 1);
  // equal scores: the chain name in A decides
  CHECK_EQ(corr.chains[0].name_a, "A");
  CHECK_EQ(corr.partner_of("B"), "");
  REQUIRE_EQ(notes.size(), 1);
  CHECK(notes[0].find("chain B") != std::string::npos);
}

TEST_CASE("match_chains uses masks and thresholds") {
  ensfit::TopologyPtr a = two_chains("A", SEQ1, "B", SEQ2);
  SelectionMask ca_a(std::vector<char>(a->size(), 0));
  for (size_t i = 0; i != a->size(); ++i)
    if ((*a)[i].name == "CA")
      ca_a.flags[i] = 1;
  ensfit::Correspondence corr = ensfit::match_chains(*a, *a, ca_a,
                                                     SelectionMask::all(a->size()));
  CHECK_EQ(corr.size(), 16);
  for (size_t i : corr.atoms_b)
    CHECK_EQ((*a)[i].name, "CA");

  // one mutation in eight residues: 87.5% identity
  std::string mutated = SEQ1;
  mutated.replace(12, 3, "TYR");
  std::vector<ensfit::AtomRecord> atoms;
  add_chain(atoms, "A", split_names(mutated));
  Topology b(atoms, "mutant");
  SelectionMask all_b = SelectionMask::all(b.size());
  CHECK_THROWS_AS(ensfit::match_chains(*a, b, SelectionMask::all(a->size()), all_b),
                  ensfit::InsufficientAtoms);
  ensfit::MatchOptions lenient;
  lenient.min_identity = 80;
  corr = ensfit::match_chains(*a, b, SelectionMask::all(a->size()), all_b, lenient);
  REQUIRE_EQ(corr.chains.size(), 1);
  CHECK_EQ(corr.chains[0].identity, doctest::Approx(87.5));
  CHECK_EQ(corr.size(), 7 * 3);

  CHECK_THROWS_AS(ensfit::match_chains(*a, b, all_b, all_b), ensfit::DimensionMismatch);
}
