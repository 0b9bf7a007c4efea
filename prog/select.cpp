// Copyright Global Phasing Ltd.

#include <stdio.h>
#include <iostream>
#include <stdexcept>
#include "ensfit/pdb.hpp"     // for read_pdb
#include "ensfit/select.hpp"  // for resolve_selection
#include "ensfit/to_pdb.hpp"  // for write_pdb, write_pdb_file

#define ENSFIT_PROG select
#include "options.h"

namespace {

enum OptionIndex { Count=5, Model };

const option::Descriptor Usage[] = {
  { NoOp, 0, "", "", Arg::None,
    "Usage:\n " EXE_NAME " [options] SEL INPUT [OUTPUT]"
    "\nWrites atoms matching selection SEL to OUTPUT (default: stdout)." },
  CommonUsage[Help],
  CommonUsage[Version],
  CommonUsage[Verbose],
  CommonUsage[Quiet],
  { Count, 0, "c", "count", Arg::None,
    "  -c, --count  \tOnly print the number of selected atoms." },
  { Model, 0, "m", "model", Arg::Int,
    "  -m, --model=N  \tWrite only the N-th model (counted from 1)." },
  { NoOp, 0, "", "", Arg::None,
    "\nSEL is a CID such as /1/A/10-20/CA[C], a keyword"
    "\n(all, protein, calpha, backbone, noh, hetero, water) or an expression"
    "\ncombining them with and, or, not and parentheses." },
  { 0, 0, 0, 0, 0, 0 }
};

} // anonymous namespace

int ENSFIT_MAIN(int argc, char **argv) {
  OptParser p(EXE_NAME);
  p.simple_parse(argc, argv, Usage);
  if (p.nonOptionsCount() != 2 && p.nonOptionsCount() != 3)
    p.print_try_help_and_exit("Expected arguments: SEL INPUT [OUTPUT]");
  const char* selstr = p.nonOption(0);
  std::string input = p.nonOption(1);
  try {
    ensfit::StructureInput st = ensfit::read_pdb(input);
    ensfit::SelectionMask mask = ensfit::resolve_selection(selstr, *st.topology);
    if (p.options[Count]) {
      printf("%zu\n", mask.count());
      return 0;
    }
    ensfit::TopologyPtr topology = st.topology->subset(mask.flags);
    std::vector<ensfit::Frame> frames;
    std::vector<int> numbers;
    for (size_t m = 0; m != st.frames.size(); ++m) {
      if (p.options[Model] && (int) m + 1 != p.integer_or(Model, 0))
        continue;
      ensfit::Frame frame;
      frame.label = st.frames[m].label;
      for (size_t i = 0; i != mask.size(); ++i)
        if (mask[i])
          frame.pos.push_back(st.frames[m][i]);
      frames.push_back(std::move(frame));
      numbers.push_back(st.model_numbers[m]);
    }
    if (frames.empty())
      throw std::out_of_range("Model #" + std::to_string(p.integer_or(Model, 0)) +
                              " not found in " + input);
    std::vector<const ensfit::Frame*> ptrs;
    for (const ensfit::Frame& frame : frames)
      ptrs.push_back(&frame);
    ensfit::PdbWriteOptions opt;
    opt.preserve_serial = true;
    if (p.nonOptionsCount() == 3)
      ensfit::write_pdb_file(*topology, ptrs, p.nonOption(2), opt, numbers);
    else
      ensfit::write_pdb(*topology, ptrs, std::cout, opt, numbers);
  } catch (std::exception& e) {
    fprintf(stderr, "ERROR: %s\n", e.what());
    return 1;
  }
  return 0;
}
