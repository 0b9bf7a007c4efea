// Copyright Global Phasing Ltd.

#include <ensfit/chainmatch.hpp>
#include <algorithm>  // for sort, min
#include <map>
#include <ensfit/superpose.hpp>  // for check_same_size

namespace ensfit {

namespace {

// index of the first atom named name in the residue, -1 if none
long find_atom(const Topology& topo, const ResidueInfo& res, const std::string& name) {
  for (size_t i = res.begin; i != res.end; ++i)
    if (topo[i].name == name)
      return (long) i;
  return -1;
}

bool is_first_with_name(const Topology& topo, const ResidueInfo& res, size_t idx) {
  return find_atom(topo, res, topo[idx].name) == (long) idx;
}

double percent(size_t n, size_t total) {
  return total == 0 ? 0. : 100. * n / total;
}

} // anonymous namespace

ChainMatch score_chain_pair(const Topology& a, size_t chain_a,
                            const Topology& b, size_t chain_b) {
  const ChainInfo& ch_a = a.chains().at(chain_a);
  const ChainInfo& ch_b = b.chains().at(chain_b);
  const std::vector<ResidueInfo>& res_a = a.residues();
  const std::vector<ResidueInfo>& res_b = b.residues();
  size_t na = ch_a.residue_count();
  size_t nb = ch_b.residue_count();

  ChainMatch m;
  m.chain_a = chain_a;
  m.chain_b = chain_b;
  m.name_a = ch_a.name;
  m.name_b = ch_b.name;

  // residues with the same sequence number
  std::map<SeqId, size_t> by_seqid;
  for (size_t j = ch_b.first_residue; j != ch_b.end_residue; ++j)
    by_seqid.insert(std::make_pair(res_b[j].seqid, j));
  size_t compared = 0;
  std::vector<std::pair<size_t, size_t>> seqid_pairs;
  for (size_t i = ch_a.first_residue; i != ch_a.end_residue; ++i) {
    auto it = by_seqid.find(res_a[i].seqid);
    if (it == by_seqid.end())
      continue;
    ++compared;
    if (res_b[it->second].name == res_a[i].name)
      seqid_pairs.emplace_back(i, it->second);
  }

  // longest common contiguous run of residue names
  size_t run = 0, run_end_a = 0, run_end_b = 0;
  std::vector<size_t> prev(nb + 1, 0), cur(nb + 1, 0);
  for (size_t i = 1; i <= na; ++i) {
    const std::string& name = res_a[ch_a.first_residue + i - 1].name;
    for (size_t j = 1; j <= nb; ++j) {
      if (res_b[ch_b.first_residue + j - 1].name == name) {
        cur[j] = prev[j-1] + 1;
        if (cur[j] > run) {
          run = cur[j];
          run_end_a = i;
          run_end_b = j;
        }
      } else {
        cur[j] = 0;
      }
    }
    prev.swap(cur);
  }

  if (seqid_pairs.size() >= run) {
    m.mode = ChainMatch::Mode::SeqId;
    m.score = seqid_pairs.size();
    m.identity = percent(seqid_pairs.size(), compared);
    m.overlap = percent(compared, std::min(na, nb));
    m.residues.swap(seqid_pairs);
  } else {
    m.mode = ChainMatch::Mode::Run;
    m.score = run;
    m.identity = 100.;
    m.overlap = percent(run, std::min(na, nb));
    for (size_t k = 0; k != run; ++k)
      m.residues.emplace_back(ch_a.first_residue + run_end_a - run + k,
                              ch_b.first_residue + run_end_b - run + k);
  }
  return m;
}

Correspondence match_chains(const Topology& a, const Topology& b,
                            const SelectionMask& mask_a, const SelectionMask& mask_b,
                            const MatchOptions& options, const Logger& logger) {
  check_same_size(mask_a.size(), a.size(), "match_chains(): first mask and topology");
  check_same_size(mask_b.size(), b.size(), "match_chains(): second mask and topology");
  std::vector<ChainMatch> candidates;
  for (size_t i = 0; i != a.chains().size(); ++i)
    for (size_t j = 0; j != b.chains().size(); ++j) {
      ChainMatch m = score_chain_pair(a, i, b, j);
      if (m.score == 0)
        continue;
      if (m.identity < options.min_identity || m.overlap < options.min_overlap) {
        logger.debug("chains ", m.name_a, " and ", m.name_b, " rejected: identity ",
                     m.identity, "%, overlap ", m.overlap, '%');
        continue;
      }
      candidates.push_back(std::move(m));
    }
  std::sort(candidates.begin(), candidates.end(),
            [](const ChainMatch& x, const ChainMatch& y) {
    if (x.score != y.score)
      return x.score > y.score;
    if (x.name_a != y.name_a)
      return x.name_a < y.name_a;
    if (x.name_b != y.name_b)
      return x.name_b < y.name_b;
    if (x.chain_a != y.chain_a)
      return x.chain_a < y.chain_a;
    return x.chain_b < y.chain_b;
  });

  Correspondence corr;
  std::vector<char> used_a(a.chains().size(), 0);
  std::vector<char> used_b(b.chains().size(), 0);
  for (ChainMatch& m : candidates) {
    if (used_a[m.chain_a] || used_b[m.chain_b])
      continue;
    used_a[m.chain_a] = used_b[m.chain_b] = 1;
    logger.mesg("Chain ", m.name_a, " matches chain ", m.name_b, " (", m.score,
                " residues, identity ", m.identity, "%)");
    corr.chains.push_back(std::move(m));
  }
  for (size_t i = 0; i != used_a.size(); ++i)
    if (!used_a[i])
      logger.note("chain ", a.chains()[i].name, " of ",
                  a.name().empty() ? std::string("the reference") : a.name(),
                  " has no matching chain");
  std::sort(corr.chains.begin(), corr.chains.end(),
            [](const ChainMatch& x, const ChainMatch& y) { return x.chain_a < y.chain_a; });

  for (const ChainMatch& m : corr.chains)
    for (const std::pair<size_t, size_t>& rp : m.residues) {
      const ResidueInfo& ra = a.residues()[rp.first];
      const ResidueInfo& rb = b.residues()[rp.second];
      for (size_t i = ra.begin; i != ra.end; ++i) {
        if (!mask_a[i] || !is_first_with_name(a, ra, i))
          continue;
        long j = find_atom(b, rb, a[i].name);
        if (j >= 0 && mask_b[j]) {
          corr.atoms_a.push_back(i);
          corr.atoms_b.push_back((size_t) j);
        }
      }
    }
  if (corr.size() < 3)
    fail_with<InsufficientAtoms>("match_chains(): only ", std::to_string(corr.size()),
                                 " corresponding atoms between ",
                                 a.name(), " and ", b.name());
  return corr;
}

} // namespace ensfit
