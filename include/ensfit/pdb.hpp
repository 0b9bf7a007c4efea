// Copyright Global Phasing Ltd.
//
// Read atoms and models from the PDB file format into StructureInput.
//
// Only ATOM/HETATM, MODEL/ENDMDL and END records are interpreted.
// Two-character chain IDs (columns 21 and 22) and hybrid-36 serial
// numbers are supported. All models must have the same atoms.

#ifndef ENSFIT_PDB_HPP_
#define ENSFIT_PDB_HPP_

#include <string>
#include "input.hpp"      // for AnyStream, MemoryStream, open_line_stream
#include "structure.hpp"  // for StructureInput
#include "util.hpp"       // for alpha_up

namespace ensfit {

/// Compare the first 4 letters of s, ignoring case, with uppercase record.
/// ' ' and NUL are equivalent in s.
inline bool is_record_type4(const char* s, const char* record) {
  for (int i = 0; i < 4; ++i) {
    char c = (s[i] == '\0' ? ' ' : alpha_up(s[i]));
    char r = (record[i] == '\0' ? ' ' : record[i]);
    if (c != r)
      return false;
  }
  return true;
}

/// Infers the element from the atom name in columns 13-16.
ENSFIT_DLL std::string infer_element_from_padded_name(const char* name);

ENSFIT_DLL StructureInput read_pdb_from_stream(AnyStream& line_reader,
                                               const std::string& source);

inline StructureInput read_pdb_string(const std::string& str,
                                      const std::string& name) {
  MemoryStream stream(str.c_str(), str.length());
  return read_pdb_from_stream(stream, name);
}

/// Reads a PDB file; files with the .gz extension are uncompressed on the fly.
inline StructureInput read_pdb(const std::string& path) {
  return read_pdb_from_stream(*open_line_stream(path), path);
}

} // namespace ensfit
#endif
