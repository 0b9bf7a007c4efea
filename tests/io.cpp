
#include <doctest/doctest.h>

#include <cstdio>
#include <sstream>
#include <string>
#include <vector>
#include <ensfit/columns.hpp>
#include <ensfit/dcd.hpp>
#include <ensfit/pdb.hpp>
#include <ensfit/sprintf.hpp>
#include <ensfit/to_pdb.hpp>
#include "helpers.h"

using ensfit::Frame;
using ensfit::Vec3;

static std::string atom_line(const char* record, int serial, const char* name,
                             const char* resname, char chain, int seqnum,
                             const Vec3& p, const char* element) {
  char buf[100];
  ensfit::snprintf_z(buf, 100,
                     "%-6s%5d %-4s %3s %c%4d    %8.3f%8.3f%8.3f%6.2f%6.2f          %2s\n",
                     record, serial, name, resname, chain, seqnum, p.x, p.y, p.z,
                     1.0, 20.0, element);
  return buf;
}

static std::string two_residues(double dx) {
  std::string s;
  s += atom_line("ATOM", 1, " N", "ALA", 'A', 1, Vec3(1 + dx, 2, 3), "N");
  s += atom_line("ATOM", 2, " CA", "ALA", 'A', 1, Vec3(2 + dx, 2, 3), "C");
  s += atom_line("ATOM", 3, " C", "ALA", 'A', 1, Vec3(3 + dx, 2.5, 3), "C");
  s += atom_line("ATOM", 4, " N", "GLY", 'A', 2, Vec3(4 + dx, 2, 3.5), "N");
  s += atom_line("ATOM", 5, " CA", "GLY", 'A', 2, Vec3(5 + dx, 3, 3), "C");
  s += atom_line("HETATM", 6, "ZN", "ZN", 'B', 101, Vec3(0, 0, dx), "");
  return s;
}

TEST_CASE("infer_element_from_padded_name") {
  CHECK_EQ(ensfit::infer_element_from_padded_name(" CA "), "C");
  CHECK_EQ(ensfit::infer_element_from_padded_name("CA  "), "CA");
  CHECK_EQ(ensfit::infer_element_from_padded_name("1HB "), "H");
  CHECK_EQ(ensfit::infer_element_from_padded_name("HG21"), "H");
  CHECK_EQ(ensfit::infer_element_from_padded_name("C210"), "C");
  CHECK_EQ(ensfit::infer_element_from_padded_name("ZN  "), "ZN");
}

TEST_CASE("read_pdb_string with models") {
  std::string pdb = "MODEL        1\n" + two_residues(0.) + "ENDMDL\n"
                    "MODEL        7\n" + two_residues(0.5) + "ENDMDL\nEND\n";
  ensfit::StructureInput st = ensfit::read_pdb_string(pdb, "two.pdb");
  CHECK_EQ(st.name, "two");
  REQUIRE_EQ(st.n_models(), 2);
  CHECK_EQ(st.n_atoms(), 6);
  CHECK(st.model_numbers == std::vector<int>{1, 7});
  CHECK_EQ(st.frames[1].label, "model 7");
  const ensfit::Topology& t = *st.topology;
  CHECK_EQ(t.chains().size(), 2);
  CHECK_EQ(t[1].name, "CA");
  CHECK_EQ(t[1].element, "C");
  CHECK_EQ(t[3].seqid.num, 2);
  CHECK(t[5].het);
  CHECK_EQ(t[5].element, "ZN");  // inferred from the name
  CHECK_EQ(t[5].chain, "B");
  CHECK_EQ(t[0].b_iso, doctest::Approx(20.0));
  CHECK_EQ(st.frames[1][2].x, doctest::Approx(3.5));
}

TEST_CASE("read_pdb_string without MODEL records") {
  ensfit::StructureInput st = ensfit::read_pdb_string(two_residues(0.), "x");
  CHECK_EQ(st.n_models(), 1);
  CHECK(st.model_numbers == std::vector<int>{1});
  // frames separated by ENDMDL only
  std::string md = two_residues(0.) + "ENDMDL\n" + two_residues(1.) + "ENDMDL\n";
  CHECK_EQ(ensfit::read_pdb_string(md, "md").n_models(), 2);
}

TEST_CASE("hybrid-36 serial numbers and sequence numbers") {
  std::string line = atom_line("ATOM", 1, " CA", "ALA", 'A', 1, Vec3(1, 2, 3), "C");
  line.replace(6, 5, "A0000");
  line.replace(22, 4, "A000");
  ensfit::StructureInput st = ensfit::read_pdb_string(line, "h36");
  CHECK_EQ((*st.topology)[0].serial, 100000);
  CHECK_EQ((*st.topology)[0].seqid.num, 10000);

  char serial[6] = {0};
  char seqnum[5] = {0};
  ensfit::write_hybrid36(42, 5, serial);
  CHECK_EQ(std::string(serial), "   42");
  ensfit::write_hybrid36(99999, 5, serial);
  CHECK_EQ(std::string(serial), "99999");
  ensfit::write_hybrid36(100000, 5, serial);
  CHECK_EQ(std::string(serial), "A0000");
  ensfit::write_hybrid36(-5, 4, seqnum);
  CHECK_EQ(std::string(seqnum), "  -5");
  ensfit::write_hybrid36(10035, 4, seqnum);
  CHECK_EQ(std::string(seqnum), "A00Z");
  CHECK_EQ(ensfit::read_hybrid36(seqnum, 4), 10035);
  int lower = 100000 + 26 * 36 * 36 * 36 * 36;
  ensfit::write_hybrid36(lower, 5, serial);
  CHECK_EQ(std::string(serial), "a0000");
  CHECK_EQ(ensfit::read_hybrid36(serial, 5), lower);
  ensfit::write_hybrid36(2 * lower, 5, serial);
  CHECK_EQ(std::string(serial), "*****");
}

TEST_CASE("read_pdb_string errors") {
  std::string pdb = "MODEL        1\n" + two_residues(0.) + "ENDMDL\n"
                    "MODEL        2\n" +
                    atom_line("ATOM", 1, " N", "ALA", 'A', 1, Vec3(), "N") +
                    "ENDMDL\n";
  CHECK_THROWS(ensfit::read_pdb_string(pdb, "bad"));
  CHECK_THROWS(ensfit::read_pdb_string("REMARK nothing here\nEND\n", "empty"));
  CHECK_THROWS(ensfit::read_pdb_string("ATOM      1  CA  ALA A   1\n", "short"));
}

TEST_CASE("write_pdb") {
  ensfit::StructureInput st = ensfit::read_pdb_string(two_residues(0.), "x");
  std::string out = ensfit::make_pdb_string(*st.topology, st.frames[0]);
  CHECK(out.find("MODEL") == std::string::npos);
  CHECK(out.find("\nTER ") != std::string::npos);
  CHECK_EQ(out.compare(0, 30, "ATOM      1  N   ALA A   1    "), 0);
  CHECK(out.find("HETATM    7 ZN    ZN B 101") != std::string::npos);
  ensfit::StructureInput again = ensfit::read_pdb_string(out, "again");
  REQUIRE_EQ(again.n_atoms(), st.n_atoms());
  for (size_t i = 0; i != st.n_atoms(); ++i) {
    CHECK_EQ((*again.topology)[i].name, (*st.topology)[i].name);
    CHECK_EQ((*again.topology)[i].element, (*st.topology)[i].element);
    CHECK(again.frames[0][i].approx(st.frames[0][i], 1e-3));
  }

  // model numbers are kept
  std::vector<const Frame*> frames{&st.frames[0], &st.frames[0]};
  std::ostringstream os;
  ensfit::write_pdb(*st.topology, frames, os, ensfit::PdbWriteOptions(), {3, 9});
  ensfit::StructureInput models = ensfit::read_pdb_string(os.str(), "models");
  CHECK(models.model_numbers == std::vector<int>{3, 9});

  CHECK_THROWS_AS(ensfit::make_pdb_string(*st.topology, helix_frame(4)),
                  ensfit::DimensionMismatch);
}

TEST_CASE("DCD files") {
  const char* path = "ensfit_test_io.dcd";
  std::vector<Frame> frames;
  for (int k = 0; k < 3; ++k)
    frames.push_back(helix_frame(7, 0.1 * k));
  ensfit::write_dcd(frames, path);

  ensfit::DcdFile dcd(path);
  CHECK_EQ(dcd.n_atoms(), 7);
  CHECK_EQ(dcd.n_frames(), 3);
  CHECK_EQ(dcd.header().nset, 3);
  CHECK(!dcd.header().has_unit_cell);
  REQUIRE_EQ(dcd.header().titles.size(), 1);
  CHECK_EQ(dcd.header().titles[0], "Created by ensfit");
  CHECK(!dcd.is_open());
  Frame f;
  CHECK_THROWS(dcd.read_frame(0, f));
  dcd.open();
  dcd.read_frame(2, f);
  REQUIRE_EQ(f.size(), 7);
  for (size_t i = 0; i != 7; ++i)
    CHECK(f[i].approx(frames[2][i], 1e-4));
  CHECK_THROWS_AS(dcd.read_frame(3, f), std::out_of_range);
  dcd.close();

  // the same file twice in a trajectory
  ensfit::Trajectory traj("dcd");
  traj.add_file(path);
  traj.add_file(path);
  CHECK_EQ(traj.total_frames(), 6);
  traj.goto_frame(4);
  ensfit::StreamItem item = traj.next();
  REQUIRE(item);
  CHECK(item.frame->pos[0].approx(frames[1][0], 1e-4));

  traj.close();
  ensfit::DcdWriter writer(path, 7);
  CHECK_THROWS_AS(writer.write_frame(helix_frame(6)), ensfit::DimensionMismatch);
  writer.close();
  CHECK_EQ(ensfit::DcdFile(path).n_frames(), 0);
  std::remove(path);

  CHECK_THROWS(ensfit::DcdFile("no-such-file.dcd"));
  CHECK_THROWS_AS(ensfit::write_dcd(std::vector<Frame>(), path), ensfit::IOWriteError);
}
