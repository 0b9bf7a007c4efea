// Copyright Global Phasing Ltd.

#include "ensfit/pdb.hpp"
#include <cctype>              // for isalpha
#include <cstring>             // for strlen
#include <initializer_list>
#include "ensfit/columns.hpp"  // for read_int, read_hybrid36, ...
#include "ensfit/util.hpp"     // for alpha_up

namespace ensfit {

namespace {

// strip directory and suffixes from filename
std::string path_basename(const std::string& path,
                          std::initializer_list<const char*> exts) {
  size_t pos = path.find_last_of("\\/");
  std::string basename = pos == std::string::npos ? path : path.substr(pos + 1);
  for (const char* ext : exts) {
    size_t len = std::strlen(ext);
    if (basename.size() > len &&
        basename.compare(basename.length() - len, len, ext, len) == 0)
      basename.resize(basename.length() - len);
  }
  return basename;
}

SeqId read_seq_id(const char* str) {
  SeqId seqid;
  if (str[4] != '\r' && str[4] != '\n' && str[4] != '\0')
    seqid.icode = str[4];
  seqid.num = read_hybrid36(str, 4);
  return seqid;
}

char read_altloc(char c) { return c == ' ' ? '\0' : c; }

// for record "END": "END ", END\n, END\r match, ENDMDL doesn't
bool is_record_type3(const char* s, const char* record) {
  return alpha_up(s[0]) == record[0] && alpha_up(s[1]) == record[1] &&
         alpha_up(s[2]) == record[2] && !std::isalnum(s[3]);
}

} // anonymous namespace

std::string infer_element_from_padded_name(const char* name) {
  // Old versions of the PDB format had hydrogen names such as "1HB ".
  if (name[0] == ' ' || is_digit(name[0]))
    return std::string(1, alpha_up(name[1]));
  // ... or it can be "C210"
  if (is_digit(name[1]) || !std::isalpha(name[1]))
    return std::string(1, alpha_up(name[0]));
  // Atom names HXXX and DXXX are assumed to be hydrogens.
  if (name[3] != ' ' && name[3] != '\0' &&
      (alpha_up(name[0]) == 'H' || alpha_up(name[0]) == 'D'))
    return std::string(1, alpha_up(name[0]));
  return std::string{alpha_up(name[0]), alpha_up(name[1])};
}

StructureInput read_pdb_from_stream(AnyStream& line_reader, const std::string& source) {
  StructureInput st;
  st.name = path_basename(source, {".gz", ".pdb", ".ent"});
  std::vector<AtomRecord> atoms;
  bool in_model = false;
  char line[122] = {0};
  int line_num = 0;
  auto wrong = [&line_num, &source](const std::string& msg) {
    fail(source, ":", std::to_string(line_num), ": ", msg);
  };
  auto finish_model = [&]() {
    if (st.frames.size() > 1 && st.frames.back().size() != atoms.size())
      wrong("model " + std::to_string(st.model_numbers.back()) + " has " +
            std::to_string(st.frames.back().size()) + " atoms, the first model has " +
            std::to_string(atoms.size()));
    in_model = false;
  };
  while (size_t len = line_reader.copy_line(line, 121)) {
    ++line_num;
    if (is_record_type4(line, "ATOM") || is_record_type4(line, "HETA")) {
      if (len < 55)
        wrong("The line is too short to be correct:\n" + std::string(line));
      if (!in_model) {
        // A single model usually doesn't have the MODEL record. Also,
        // MD trajectories may have frames separated by ENDMDL without MODEL.
        st.frames.emplace_back();
        st.model_numbers.push_back((int) st.frames.size());
        in_model = true;
      }
      Frame& frame = st.frames.back();
      frame.pos.emplace_back(read_double(line+30, 8),
                             read_double(line+38, 8),
                             read_double(line+46, 8));
      if (st.frames.size() == 1) {
        AtomRecord atom;
        atom.serial = read_hybrid36(line+6, 5);
        atom.name = read_string(line+12, 4);
        atom.altloc = read_altloc(line[16]);
        atom.resname = read_string(line+17, 3);
        atom.chain = read_string(line+20, 2);
        atom.seqid = read_seq_id(line+22);
        atom.het = alpha_up(line[0]) == 'H';
        if (len > 58)
          atom.occ = (float) read_double(line+54, 6);
        if (len > 64)
          atom.b_iso = (float) read_double(line+60, 6);
        if (len > 76 && (std::isalpha(line[76]) || std::isalpha(line[77])))
          atom.element = read_string(line+76, 2);
        else
          atom.element = infer_element_from_padded_name(line+12);
        for (char& c : atom.element)
          c = alpha_up(c);
        atoms.push_back(atom);
      } else if (frame.size() > atoms.size()) {
        wrong("model " + std::to_string(st.model_numbers.back()) +
              " has more atoms than the first model");
      }
    } else if (is_record_type4(line, "MODE")) {  // MODEL
      if (in_model)
        finish_model();
      st.frames.emplace_back();
      st.model_numbers.push_back(len > 10 ? read_int(line+10, 4)
                                          : (int) st.frames.size());
      st.frames.back().label = "model " + std::to_string(st.model_numbers.back());
      in_model = true;
    } else if (is_record_type4(line, "ENDM")) {  // ENDMDL
      if (in_model)
        finish_model();
    } else if (is_record_type3(line, "END")) {
      break;
    }
  }
  if (in_model)
    finish_model();
  // MODEL records without atoms
  while (!st.frames.empty() && st.frames.back().empty()) {
    st.frames.pop_back();
    st.model_numbers.pop_back();
  }
  if (atoms.empty())
    fail("No atoms in ", source);
  st.topology = make_topology(std::move(atoms), st.name);
  return st;
}

} // namespace ensfit
