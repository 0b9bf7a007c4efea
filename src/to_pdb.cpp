// Copyright Global Phasing Ltd.

#include <ensfit/to_pdb.hpp>
#include <cerrno>
#include <cstring>    // for strerror
#include <fstream>
#include <sstream>
#include <ensfit/columns.hpp>  // for write_hybrid36
#include <ensfit/sprintf.hpp>
#include <ensfit/superpose.hpp>  // for check_same_size

#define WRITE(...) os.write(buf, snprintf_z(buf, 82, __VA_ARGS__))

namespace ensfit {

namespace {

// atom name in columns 13-16; 1-letter elements start in column 14
std::string padded_atom_name(const AtomRecord& a) {
  if (a.name.size() < 4 && a.element.size() == 1)
    return " " + a.name;
  return a.name;
}

// serial numbers above 99999 and residue numbers above 9999 in hybrid-36
struct Hy36 {
  char serial[6] = {0};
  char seqnum[5] = {0};
  Hy36(int serial_, int seqnum_) {
    write_hybrid36(serial_, 5, serial);
    write_hybrid36(seqnum_, 4, seqnum);
  }
};

bool ends_chain(const Topology& topology, size_t i) {
  return i + 1 == topology.size() || topology[i+1].chain != topology[i].chain;
}

} // anonymous namespace

void write_pdb(const Topology& topology, const std::vector<const Frame*>& frames,
               std::ostream& os, PdbWriteOptions opt,
               const std::vector<int>& model_numbers) {
  for (const Frame* frame : frames)
    check_same_size(frame->size(), topology.size(), "write_pdb(): frame and topology");
  bool models = opt.model_records || frames.size() > 1;
  char buf[88];
  for (size_t m = 0; m != frames.size(); ++m) {
    const Frame& frame = *frames[m];
    if (models) {
      int num = m < model_numbers.size() ? model_numbers[m] : (int) m + 1;
      WRITE("MODEL     %4d%66s\n", num, "");
    }
    int serial = 0;
    for (size_t i = 0; i != topology.size(); ++i) {
      const AtomRecord& a = topology[i];
      serial = opt.preserve_serial ? a.serial : serial + 1;
      const Vec3& p = frame[i];
      Hy36 h(serial, a.seqid.num);
      WRITE("%-6s%5s %-4s%c%3.3s%2.2s%4s%c   %8.3f%8.3f%8.3f%6.2f%6.2f          %2s  \n",
            a.het ? "HETATM" : "ATOM", h.serial,
            padded_atom_name(a).c_str(), a.altloc ? a.altloc : ' ',
            a.resname.c_str(), a.chain.c_str(), h.seqnum, a.seqid.icode,
            p.x, p.y, p.z, a.occ, a.b_iso, a.element.c_str());
      if (opt.ter_records && !a.het && ends_chain(topology, i)) {
        ++serial;
        Hy36 t(serial, a.seqid.num);
        WRITE("TER   %5s      %3.3s%2.2s%4s%c%53s\n", t.serial,
              a.resname.c_str(), a.chain.c_str(), t.seqnum, a.seqid.icode, "");
      }
    }
    if (models)
      WRITE("ENDMDL%74s\n", "");
  }
  if (opt.end_record)
    WRITE("%-80s\n", "END");
}

std::string make_pdb_string(const Topology& topology, const Frame& frame,
                            PdbWriteOptions opt) {
  std::ostringstream os;
  write_pdb(topology, frame, os, opt);
  return os.str();
}

std::string write_pdb_file(const Topology& topology,
                           const std::vector<const Frame*>& frames,
                           const std::string& path, PdbWriteOptions opt,
                           const std::vector<int>& model_numbers) {
  std::ofstream os(path.c_str());
  if (!os)
    throw IOWriteError(path, "Failed to open " + path + " for writing: " +
                             std::strerror(errno));
  write_pdb(topology, frames, os, opt, model_numbers);
  os.close();
  if (!os)
    throw IOWriteError(path, "Failed to write " + path);
  return path;
}

} // namespace ensfit
