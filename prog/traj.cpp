// Copyright Global Phasing Ltd.

#include <stdio.h>
#include <memory>
#include <stdexcept>
#include "ensfit/dcd.hpp"         // for DcdWriter
#include "ensfit/pdb.hpp"         // for read_pdb
#include "ensfit/trajectory.hpp"

#define ENSFIT_PROG traj
#include "options.h"

namespace {

enum OptionIndex {
  Select=5, First, Last, Stride, RefFrame, Fit, Output, Rmsf
};

const option::Descriptor Usage[] = {
  { NoOp, 0, "", "", Arg::None,
    "Usage:\n " EXE_NAME " [options] TOPOLOGY DCD[...]"
    "\nPrints RMSD of each frame of concatenated DCD files from a reference,"
    "\noptionally superposing the frames and writing them to a new DCD file."
    "\nTOPOLOGY is a PDB file with the same atoms as the trajectory." },
  CommonUsage[Help],
  CommonUsage[Version],
  CommonUsage[Verbose],
  CommonUsage[Quiet],
  { Select, 0, "s", "select", Arg::Required,
    "  -s, --select=SEL  \tAtoms used for fitting and RMSD (default: all)." },
  { First, 0, "", "first", Arg::Int,
    "  --first=N  \tFirst frame, counted from 0 (default: 0)." },
  { Last, 0, "", "last", Arg::Int,
    "  --last=N  \tLast frame, inclusive (default: the last one)." },
  { Stride, 0, "", "stride", Arg::Int,
    "  --stride=N  \tUse every N-th frame (default: 1)." },
  { RefFrame, 0, "r", "ref-frame", Arg::Int,
    "  -r, --ref-frame=N  \tReference frame (default: the first visible frame)." },
  { Fit, 0, "f", "fit", Arg::None,
    "  -f, --fit  \tSuperpose each frame onto the reference." },
  { Output, 0, "o", "output", Arg::Required,
    "  -o, --output=FILE  \tWrite the visible (fitted) frames to a DCD file." },
  { Rmsf, 0, "", "rmsf", Arg::None,
    "  --rmsf  \tPrint RMS fluctuation of each selected atom instead." },
  { 0, 0, 0, 0, 0, 0 }
};

int nonnegative(const OptParser& p, int opt, int default_) {
  int n = p.integer_or(opt, default_);
  if (n < 0)
    p.print_try_help_and_exit("Frame numbers must not be negative.");
  return n;
}

} // anonymous namespace

int ENSFIT_MAIN(int argc, char **argv) {
  OptParser p(EXE_NAME);
  p.simple_parse(argc, argv, Usage);
  p.require_input_files_as_args(1);
  ensfit::Logger logger;
  logger.callback = ensfit::Logger::to_stderr;
  logger.threshold = p.verbosity_threshold();
  try {
    ensfit::StructureInput st = ensfit::read_pdb(p.nonOption(0));
    ensfit::Trajectory traj(st.name);
    for (int i = 1; i < p.nonOptionsCount(); ++i)
      traj.add_file(p.nonOption(i));
    logger.mesg(traj.n_segments(), " segment(s), ", traj.total_frames(),
                " frames of ", traj.n_atoms(), " atoms");
    traj.set_atoms(st.topology);
    if (p.options[Select])
      traj.select(p.options[Select].arg);
    if (p.options[RefFrame]) {
      traj.goto_frame(nonnegative(p, RefFrame, 0));
      ensfit::StreamItem ref = traj.next();
      if (!ref)
        throw std::out_of_range("Reference frame beyond the end of trajectory");
      traj.set_reference(*ref.frame);
    }
    size_t last = p.options[Last] ? (size_t) nonnegative(p, Last, 0) : SIZE_MAX;
    int stride = p.integer_or(Stride, 1);
    if (stride < 1)
      p.print_try_help_and_exit("Stride must be positive.");
    traj.set_range(nonnegative(p, First, 0), last, stride);
    logger.mesg(traj.mask().count(), " atoms selected, ", traj.n_frames(),
                " frames in range");

    if (p.options[Rmsf]) {
      std::vector<double> rmsf = ensfit::calculate_rmsf(traj, p.options[Fit], logger);
      std::vector<size_t> indices = traj.mask().indices();
      for (size_t k = 0; k != rmsf.size(); ++k) {
        const ensfit::AtomRecord& a = (*st.topology)[indices[k]];
        printf("%-2s %4d%c %-3s %-4s %8.4f\n", a.chain.c_str(), a.seqid.num,
               a.seqid.icode, a.resname.c_str(), a.name.c_str(), rmsf[k]);
      }
      return 0;
    }

    std::unique_ptr<ensfit::DcdWriter> writer;
    if (p.options[Output])
      writer.reset(new ensfit::DcdWriter(p.options[Output].arg, traj.n_atoms(),
                                         "Created by " EXE_NAME));
    traj.reset();
    while (ensfit::StreamItem item = traj.next()) {
      double rmsd;
      if (p.options[Fit])
        rmsd = traj.superpose(ensfit::SupOptions(), logger).rmsd;
      else
        rmsd = traj.rmsd();
      printf("%8zu %10.4f\n", item.index, rmsd);
      if (writer)
        writer->write_frame(*traj.current_frame());
    }
    traj.close();
    if (writer) {
      writer->close();
      logger.mesg("Written ", writer->written(), " frames to ", writer->path());
    }
  } catch (std::exception& e) {
    fprintf(stderr, "ERROR: %s\n", e.what());
    return 1;
  }
  return 0;
}
