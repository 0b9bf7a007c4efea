// Copyright Global Phasing Ltd.

#include "ensfit/select.hpp"
#include <cstdlib>           // for strtol
#include <cctype>            // for isalpha, isdigit
#include <algorithm>         // for min
#include <cstdio>            // for snprintf
#include <cstring>           // for strcmp
#include <system_error>      // for errc
#include <tao/pegtl.hpp>
#include "ensfit/columns.hpp" // for fast_from_chars

namespace ensfit {

namespace {

[[noreturn]]
inline ENSFIT_COLD void wrong_syntax(const std::string& cid, size_t pos,
                                     const char* info=nullptr) {
  std::string msg = "Invalid selection syntax";
  if (info)
    msg += info;
  if (pos != 0)
    cat_to(msg, " near \"", cid.substr(pos, 8), '"');
  cat_to(msg, ": ", cid);
  throw InvalidSelectionSyntax(msg);
}

inline int determine_omitted_cid_fields(const std::string& cid) {
  if (cid[0] == '/')
    return 0; // model
  if (std::isdigit(cid[0]) || cid[0] == '.' || cid[0] == '(' || cid[0] == '-')
    return 2; // residue
  size_t sep = cid.find_first_of("/([:;");
  if (sep == std::string::npos || cid[sep] == '/' || cid[sep] == ';')
    return 1; // chain
  if (cid[sep] == '(')
    return 2; // residue
  return 3;  // atom
}

inline Selection::List make_cid_list(const std::string& cid, size_t pos, size_t end,
                                     const char* disallowed_chars="-[]()!/*.:;") {
  Selection::List list;
  list.all = (cid[pos] == '*');
  list.inverted = (cid[pos] == '!');
  if (list.all || list.inverted)
    ++pos;
  list.list = cid.substr(pos, end - pos);
  // if a list have punctuation other than ',' something must be wrong
  size_t idx = list.list.find_first_of(disallowed_chars);
  if (idx != std::string::npos)
    wrong_syntax(cid, pos + idx, cat(" ('", list.list[idx], "' in a list)").c_str());
  return list;
}

inline Selection::SequenceId parse_cid_seqid(const std::string& cid, size_t& pos,
                                             int default_seqnum) {
  size_t initial_pos = pos;
  int seqnum = default_seqnum;
  char icode = ' ';
  if (cid[pos] == '*') {
    ++pos;
    icode = '*';
  } else if (std::isdigit(cid[pos]) || cid[pos] == '-') {
    char* endptr;
    seqnum = (int) std::strtol(&cid[pos], &endptr, 10);
    pos = endptr - &cid[0];
  }
  if (cid[pos] == '.')
    ++pos;
  if (initial_pos != pos && (std::isalpha(cid[pos]) || cid[pos] == '*'))
    icode = cid[pos++];
  return {seqnum, icode};
}

inline Selection::AtomInequality parse_atom_inequality(const std::string& cid,
                                                       size_t pos, size_t end) {
  Selection::AtomInequality r;
  if (cid[pos] != 'q' && cid[pos] != 'b')
    wrong_syntax(cid, pos);
  r.property = cid[pos];
  ++pos;
  if (cid[pos] == '<')
    r.relation = -1;
  else if (cid[pos] == '>')
    r.relation = 1;
  else if (cid[pos] == '=')
    r.relation = 0;
  else
    wrong_syntax(cid, pos);
  ++pos;
  auto result = fast_from_chars(cid.c_str() + pos, cid.c_str() + end, r.value);
  if (result.ec != std::errc())
    wrong_syntax(cid, pos, " (expected number)");
  if (size_t(result.ptr - cid.c_str()) != end)
    wrong_syntax(cid, pos);
  return r;
}

void parse_cid(const std::string& cid, Selection& sel) {
  if (cid.empty() || (cid.size() == 1 && cid[0] == '*'))
    return;
  int omit = determine_omitted_cid_fields(cid);
  size_t sep = 0;
  size_t semi = std::min(cid.find(';'), cid.size());
  // model
  if (omit == 0) {
    sep = std::min(cid.find('/', 1), semi);
    if (sep != 1 && cid[1] != '*') {
      char* endptr;
      sel.mdl = (int) std::strtol(&cid[1], &endptr, 10);
      size_t end_pos = endptr - &cid[0];
      if (end_pos != sep && end_pos != cid.size())
        wrong_syntax(cid, 0, " (at model number)");
    }
  }

  // chain
  if (omit <= 1 && sep < semi) {
    size_t pos = (sep == 0 ? 0 : sep + 1);
    sep = std::min(cid.find('/', pos), semi);
    // "-" is expected, it's in chain IDs in bioassembly files.
    sel.chain_ids = make_cid_list(cid, pos, sep, "[]()!/*.:;");
  }

  // residue; MMDB CID syntax: s1.i1-s2.i2 or *(res).ic
  // Both 14.a and 14a are accepted.
  if (omit <= 2 && sep < semi) {
    size_t pos = (sep == 0 ? 0 : sep + 1);
    if (cid[pos] != '(')
      sel.from_seqid = parse_cid_seqid(cid, pos, INT_MIN);
    if (cid[pos] == '(') {
      ++pos;
      size_t right_br = cid.find(')', pos);
      if (right_br == std::string::npos)
        wrong_syntax(cid, 0, " (no matching ')')");
      sel.residue_names = make_cid_list(cid, pos, right_br);
      pos = right_br + 1;
    }
    // allow "(RES)." and "(RES).*" and "(RES)*"
    if (cid[pos] == '.')
      ++pos;
    if (cid[pos] == '*')
      ++pos;
    if (cid[pos] == '-') {
      ++pos;
      sel.to_seqid = parse_cid_seqid(cid, pos, INT_MAX);
    } else if (sel.from_seqid.seqnum != INT_MIN) {
      sel.to_seqid = sel.from_seqid;
    }
    sep = pos;
    if (cid[sep] != '/' && cid[sep] != ';' && cid[sep] != '\0')
      wrong_syntax(cid, 0, " (at residue)");
  }

  // atom;  at[el]:aloc
  if (sep < semi) {
    size_t pos = (sep == 0 ? 0 : sep + 1);
    size_t end = std::min(cid.find_first_of("[:", pos), semi);
    if (end != pos) {
      sel.atom_names = make_cid_list(cid, pos, end);
      // Chain name can be empty, but not atom name,
      // so we interpret empty atom name as *.
      if (!sel.atom_names.inverted && sel.atom_names.list.empty())
        sel.atom_names.all = true;
    }
    if (end < semi && cid[end] == '[') {
      pos = end + 1;
      end = cid.find(']', pos);
      if (end == std::string::npos || end > semi)
        wrong_syntax(cid, 0, " (no matching ']')");
      sel.elements = make_cid_list(cid, pos, end);
      for (char& c : sel.elements.list)
        c = std::toupper(c);
      ++end;
    }
    if (end < semi && cid[end] == ':') {
      pos = end + 1;
      sel.altlocs = make_cid_list(cid, pos, semi);
    } else if (end < semi) {
      wrong_syntax(cid, end);
    }
  }

  // extensions after semicolon(s)
  while (semi < cid.size()) {
    size_t pos = semi + 1;
    semi = std::min(cid.find(';', pos), cid.size());
    sel.atom_inequalities.push_back(parse_atom_inequality(cid, pos, semi));
  }
}

// Expression combining CIDs and keywords.
struct SelNode {
  enum class Op { Cid, Keyword, Not, And, Or };
  Op op;
  Selection cid;
  std::string keyword;
  std::unique_ptr<SelNode> left, right;

  explicit SelNode(Op op_) : op(op_) {}

  bool matches(const AtomRecord& a) const {
    switch (op) {
      case Op::Cid: return cid.matches(a);
      case Op::Keyword: return keyword_matches(a);
      case Op::Not: return !left->matches(a);
      case Op::And: return left->matches(a) && right->matches(a);
      case Op::Or: return left->matches(a) || right->matches(a);
    }
    unreachable();
  }

  bool keyword_matches(const AtomRecord& a) const {
    if (keyword == "all")
      return true;
    if (keyword == "protein")
      return is_amino_acid(a.resname);
    if (keyword == "calpha" || keyword == "ca")
      return a.name == "CA" && a.element != "CA" && is_amino_acid(a.resname);
    if (keyword == "backbone")
      return is_amino_acid(a.resname) && is_in_list(a.name, "N,CA,C,O");
    if (keyword == "noh" || keyword == "heavy")
      return !a.is_hydrogen();
    if (keyword == "hetero")
      return a.het && !is_water(a.resname);
    if (keyword == "water")
      return is_water(a.resname);
    // amino acids outside of a group
    if (keyword == "acyclic")
      return is_amino_acid(a.resname) && !in_group("cyclic", a.resname);
    if (keyword == "charged")
      return in_group("acidic", a.resname) || in_group("basic", a.resname);
    if (keyword == "neutral")
      return is_amino_acid(a.resname) &&
             !in_group("acidic", a.resname) && !in_group("basic", a.resname);
    if (keyword == "large")
      return is_amino_acid(a.resname) &&
             !in_group("small", a.resname) && !in_group("medium", a.resname);
    if (keyword == "polar")
      return is_amino_acid(a.resname) && !in_group("hydrophobic", a.resname);
    if (keyword == "surface")
      return is_amino_acid(a.resname) && !in_group("buried", a.resname);
    return in_group(keyword.c_str(), a.resname);
  }

  static bool in_group(const char* group, const std::string& resname) {
    struct ResidueGroup { const char* keyword; const char* resnames; };
    static const ResidueGroup groups[] = {
      {"nucleic", "GUA,ADE,CYT,THY,URA,DA,DC,DG,DT,A,C,G,T,U"},
      {"acidic", "ASP,GLU"},
      {"basic", "LYS,ARG,HIS,HSP,HSD,HIP"},
      {"aromatic", "HIS,PHE,TRP,TYR,HSD,HSE,HSP,HID,HIE,HIP"},
      {"aliphatic", "ALA,GLY,ILE,LEU,VAL,XLE"},
      {"cyclic", "HIS,PHE,PRO,TRP,TYR,HSD,HSE,HSP,HID,HIE,HIP"},
      {"hydrophobic", "ALA,ILE,LEU,MET,PHE,PRO,TRP,VAL,XLE"},
      {"buried", "ALA,LEU,VAL,ILE,XLE,PHE,CYS,MET,TRP"},
      {"small", "ALA,GLY,SER"},
      {"medium", "VAL,THR,ASP,ASN,ASX,PRO,CYS,SEC"},
    };
    for (const ResidueGroup& g : groups)
      if (std::strcmp(g.keyword, group) == 0)
        return is_in_list(resname, g.resnames);
    unreachable();
  }
};

namespace pegtl = tao::pegtl;

// Grammar of selection expressions. Alternatives are distinguished before
// any action runs, so actions never need to be undone.
namespace rules {

using namespace pegtl;

struct ws : star<blank> {};
struct word_end : at<sor<blank, one<'(', ')'>, pegtl::eof>> {};

struct kw_and : pegtl::string<'a','n','d'> {};
struct kw_or : pegtl::string<'o','r'> {};
struct kw_not : pegtl::string<'n','o','t'> {};
struct operator_word : seq<sor<kw_and, kw_or, kw_not>, word_end> {};

// a keyword must not be a prefix of a keyword listed after it
struct keyword : sor<pegtl::string<'a','l','l'>,
                     pegtl::string<'p','r','o','t','e','i','n'>,
                     pegtl::string<'c','a','l','p','h','a'>,
                     pegtl::string<'c','a'>,
                     pegtl::string<'b','a','c','k','b','o','n','e'>,
                     pegtl::string<'n','o','h'>,
                     pegtl::string<'h','e','a','v','y'>,
                     pegtl::string<'h','e','t','e','r','o'>,
                     pegtl::string<'w','a','t','e','r'>,
                     pegtl::string<'n','u','c','l','e','i','c'>,
                     pegtl::string<'a','c','i','d','i','c'>,
                     pegtl::string<'b','a','s','i','c'>,
                     pegtl::string<'a','r','o','m','a','t','i','c'>,
                     pegtl::string<'a','l','i','p','h','a','t','i','c'>,
                     pegtl::string<'c','y','c','l','i','c'>,
                     pegtl::string<'a','c','y','c','l','i','c'>,
                     pegtl::string<'h','y','d','r','o','p','h','o','b','i','c'>,
                     pegtl::string<'p','o','l','a','r'>,
                     pegtl::string<'b','u','r','i','e','d'>,
                     pegtl::string<'s','u','r','f','a','c','e'>,
                     pegtl::string<'s','m','a','l','l'>,
                     pegtl::string<'m','e','d','i','u','m'>,
                     pegtl::string<'l','a','r','g','e'>,
                     pegtl::string<'c','h','a','r','g','e','d'>,
                     pegtl::string<'n','e','u','t','r','a','l'>> {};
struct keyword_term : seq<keyword, word_end> {};

// a CID can contain a parenthesized list of residue names, as in /A/(ALA)
struct cid_char : not_one<' ', '\t', '\n', '\r', '(', ')'> {};
struct cid_resnames : seq<one<'('>, star<not_one<')', ' ', '\t'>>, one<')'>> {};
struct cid : seq<not_at<operator_word>, plus<sor<cid_resnames, cid_char>>> {};

struct expression;
struct factor;
// '(' opens a group only if followed by a keyword, "not" or another '('
struct group_start : seq<ws, sor<one<'('>, seq<kw_not, word_end>, keyword_term>> {};
struct group : seq<one<'('>, at<group_start>,
                   must<ws, expression, ws, one<')'>>> {};
struct negation : seq<kw_not, word_end, ws, must<factor>> {};
struct factor : sor<group, negation, keyword_term, cid> {};
struct and_rest : seq<ws, kw_and, word_end, ws, must<factor>> {};
struct term : seq<factor, star<and_rest>> {};
struct or_rest : seq<ws, kw_or, word_end, ws, must<term>> {};
struct expression : seq<term, star<or_rest>> {};
struct selection : must<ws, expression, ws, pegtl::eof> {};

} // namespace rules

typedef std::vector<std::unique_ptr<SelNode>> NodeStack;

void combine_top(NodeStack& stack, SelNode::Op op) {
  std::unique_ptr<SelNode> node(new SelNode(op));
  node->right = std::move(stack.back());
  stack.pop_back();
  node->left = std::move(stack.back());
  stack.back() = std::move(node);
}

template<typename Rule> struct Action : pegtl::nothing<Rule> {};

template<> struct Action<rules::keyword_term> {
  template<typename Input> static void apply(const Input& in, NodeStack& stack) {
    std::unique_ptr<SelNode> node(new SelNode(SelNode::Op::Keyword));
    node->keyword = in.string();
    stack.push_back(std::move(node));
  }
};
template<> struct Action<rules::cid> {
  template<typename Input> static void apply(const Input& in, NodeStack& stack) {
    std::unique_ptr<SelNode> node(new SelNode(SelNode::Op::Cid));
    node->cid = Selection(in.string());
    stack.push_back(std::move(node));
  }
};
template<> struct Action<rules::negation> {
  static void apply0(NodeStack& stack) {
    std::unique_ptr<SelNode> node(new SelNode(SelNode::Op::Not));
    node->left = std::move(stack.back());
    stack.back() = std::move(node);
  }
};
template<> struct Action<rules::and_rest> {
  static void apply0(NodeStack& stack) { combine_top(stack, SelNode::Op::And); }
};
template<> struct Action<rules::or_rest> {
  static void apply0(NodeStack& stack) { combine_top(stack, SelNode::Op::Or); }
};

std::unique_ptr<SelNode> parse_expression(const std::string& selstr) {
  NodeStack stack;
  pegtl::memory_input<> in(selstr, "selection");
  // InvalidSelectionSyntax thrown by Selection() in an action propagates as is
  try {
    pegtl::parse<rules::selection, Action>(in, stack);
  } catch (pegtl::parse_error& e) {
    size_t pos = e.positions.empty() ? 0 : e.positions.front().byte;
    if (pos >= selstr.size())
      wrong_syntax(selstr, 0, " (unexpected end)");
    wrong_syntax(selstr, pos);
  }
  if (stack.size() != 1)
    fail("internal error: unbalanced selection expression");
  return std::move(stack.back());
}

} // anonymous namespace

Selection::Selection(const std::string& cid) {
  parse_cid(cid, *this);
}

std::string Selection::SequenceId::str() const {
  std::string s;
  if (!empty()) {
    s = std::to_string(seqnum);
    if (icode != '*') {
      s += '.';
      if (icode != ' ')
        s += icode;
    }
  }
  return s;
}

std::string Selection::AtomInequality::str() const {
  char buf[32];
  std::snprintf(buf, sizeof(buf), ";%c%c%g", property,
                relation == 0 ? '=' : relation < 0 ? '<' : '>', value);
  return buf;
}

std::string Selection::str() const {
  std::string cid = "/";
  if (mdl != 0)
    cid += std::to_string(mdl);
  cid += '/';
  cid += chain_ids.str();
  cid += '/';
  cid += from_seqid.str();
  if (!residue_names.all) {
    cid += '(';
    cid += residue_names.str();
    cid += ')';
  }
  if ((!from_seqid.empty() || !to_seqid.empty()) &&
      (from_seqid.seqnum != to_seqid.seqnum || from_seqid.icode != to_seqid.icode)) {
    cid += '-';
    cid += to_seqid.str();
  }
  cid += '/';
  if (!atom_names.all)
    cid += atom_names.str();
  if (!elements.all) {
    cid += '[';
    cid += elements.str();
    cid += ']';
  }
  if (!altlocs.all) {
    cid += ':';
    cid += altlocs.str();
  }
  for (const AtomInequality& ai : atom_inequalities)
    cid += ai.str();
  return cid;
}

bool is_amino_acid(const std::string& resname) {
  static const char* const names =
    "ALA,ARG,ASN,ASP,CYS,GLN,GLU,GLY,HIS,ILE,LEU,LYS,MET,PHE,PRO,SER,THR,TRP,"
    "TYR,VAL,MSE,SEC,PYL,ASX,GLX,HSD,HSE,HSP,HID,HIE,HIP,CYX,CYM,ASH,GLH,LYN";
  return resname.size() == 3 && is_in_list(resname, names);
}

bool is_water(const std::string& resname) {
  return is_in_list(resname, "HOH,WAT,H2O,DOD,TIP,TIP3,SOL");
}

SelectionMask resolve_selection(const std::string& selstr, const Topology& topology) {
  if (trim_str(selstr).empty())
    throw InvalidSelectionSyntax("Invalid selection syntax: empty selection string");
  std::unique_ptr<SelNode> expr = parse_expression(selstr);
  SelectionMask mask(std::vector<char>(topology.size(), 0));
  bool any = false;
  for (size_t i = 0; i != topology.size(); ++i)
    if (expr->matches(topology[i])) {
      mask.flags[i] = 1;
      any = true;
    }
  if (!any)
    throw EmptySelection("Selection \"" + selstr + "\" matches no atoms in " +
                         (topology.name().empty() ? "topology" : topology.name()));
  return mask;
}

const SelectionMask& MaskCache::get(const std::string& selstr, const Topology& topology) {
  auto key = std::make_pair(selstr, topology.token());
  auto it = cache_.find(key);
  if (it == cache_.end())
    it = cache_.emplace(key, resolve_selection(selstr, topology)).first;
  return it->second;
}

} // namespace ensfit
