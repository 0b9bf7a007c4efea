// Copyright Global Phasing Ltd.

#include <stdio.h>
#include <string>
#include "ensfit/driver.hpp"
#include "ensfit/pdb.hpp"     // for read_pdb
#include "ensfit/to_pdb.hpp"  // for write_pdb_file

#define ENSFIT_PROG align
#include "options.h"

namespace {

enum OptionIndex {
  Select=5, MatchSel, Prefix, Model, Scale, MinIdentity, MinOverlap
};

const option::Descriptor Usage[] = {
  { NoOp, 0, "", "", Arg::None,
    "Usage:\n " EXE_NAME " [options] INPUT[...]"
    "\nSuperposes all models of a single INPUT onto one of its models,"
    "\nor several INPUT structures onto the first one, matching chains"
    "\nby residue names. The results are written to PDB files." },
  CommonUsage[Help],
  CommonUsage[Version],
  CommonUsage[Verbose],
  CommonUsage[Quiet],
  { Select, 0, "s", "select", Arg::Required,
    "  -s, --select=SEL  \tAtoms used to superpose models (default: calpha)." },
  { MatchSel, 0, "", "match", Arg::Required,
    "  --match=SEL  \tAtoms considered when matching chains of different"
    " structures (default: calpha)." },
  { Prefix, 0, "p", "prefix", Arg::Required,
    "  -p, --prefix=STR  \tPrefix of output files (default: aligned_)." },
  { Model, 0, "m", "model", Arg::Int,
    "  -m, --model=N  \tReference model, counted from 1 (default: 1)." },
  { Scale, 0, "", "scale", Arg::None,
    "  --scale  \tAlso fit an isotropic scale factor." },
  { MinIdentity, 0, "", "min-identity", Arg::Float,
    "  --min-identity=PCT  \tMinimal sequence identity of matched chains"
    " (default: 90)." },
  { MinOverlap, 0, "", "min-overlap", Arg::Float,
    "  --min-overlap=PCT  \tMinimal overlap of matched chains (default: 0)." },
  { NoOp, 0, "", "", Arg::None,
    "\nINPUT is a PDB file, optionally gzipped."
    "\nSEL is a selection expression, for example \"backbone and /A\"." },
  { 0, 0, 0, 0, 0, 0 }
};

std::string write_aligned(const ensfit::StructureInput& input,
                          const std::vector<size_t>& models,
                          const std::string& path) {
  std::vector<const ensfit::Frame*> frames;
  std::vector<int> numbers;
  for (size_t m : models) {
    frames.push_back(&input.frames[m]);
    numbers.push_back(m < input.model_numbers.size() ? input.model_numbers[m]
                                                     : (int) m + 1);
  }
  ensfit::PdbWriteOptions opt;
  return ensfit::write_pdb_file(*input.topology, frames, path, opt, numbers);
}

} // anonymous namespace

int ENSFIT_MAIN(int argc, char **argv) {
  OptParser p(EXE_NAME);
  p.simple_parse(argc, argv, Usage);
  std::vector<std::string> paths = p.paths_from_args();
  ensfit::AlignOptions options;
  if (p.options[Select])
    options.selection = p.options[Select].arg;
  if (p.options[MatchSel])
    options.match_selection = p.options[MatchSel].arg;
  if (p.options[Prefix])
    options.prefix = p.options[Prefix].arg;
  int model = p.integer_or(Model, 1);
  if (model < 1)
    p.print_try_help_and_exit("Model number must be positive.");
  options.model = (size_t) model - 1;
  options.sup.scale = p.options[Scale];
  options.match.min_identity = p.number_or(MinIdentity, options.match.min_identity);
  options.match.min_overlap = p.number_or(MinOverlap, options.match.min_overlap);
  ensfit::Logger logger;
  logger.callback = ensfit::Logger::to_stderr;
  logger.threshold = p.verbosity_threshold();
  try {
    std::vector<ensfit::StructureInput> inputs;
    for (const std::string& path : paths) {
      logger.mesg("Reading ", path, " ...");
      inputs.push_back(ensfit::read_pdb(path));
    }
    ensfit::AlignmentDriver driver(std::move(inputs), options, logger);
    const ensfit::AlignReport& report = driver.run(write_aligned);
    for (const ensfit::AlignItem& item : report.items) {
      if (item.ok)
        printf("%-20s model %-3zu %6zu atoms  RMSD %8.4f  %s\n",
               item.name.c_str(), item.model + 1, item.atom_count, item.rmsd,
               item.path.c_str());
      else
        printf("%-20s model %-3zu FAILED: %s\n",
               item.name.c_str(), item.model + 1, item.error.c_str());
    }
    if (!report.ok()) {
      fprintf(stderr, "%zu of %zu models failed.\n",
              report.n_failed(), report.items.size());
      return 1;
    }
  } catch (std::exception& e) {
    fprintf(stderr, "ERROR: %s\n", e.what());
    return 1;
  }
  return 0;
}
