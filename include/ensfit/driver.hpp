// Copyright Global Phasing Ltd.
//
// Alignment driver: superposes models of one structure, or several
// structures matched by chain correspondence, and writes the results.

#ifndef ENSFIT_DRIVER_HPP_
#define ENSFIT_DRIVER_HPP_

#include <cmath>       // for NAN
#include <functional>
#include <string>
#include <vector>
#include "chainmatch.hpp"  // for MatchOptions
#include "ensemble.hpp"    // for Ensemble
#include "logger.hpp"
#include "structure.hpp"   // for StructureInput
#include "superpose.hpp"   // for SupOptions

namespace ensfit {

struct AlignOptions {
  /// atoms used to superpose models of a single structure
  std::string selection = "calpha";
  /// atoms considered by the chain matcher when aligning distinct structures
  std::string match_selection = "calpha";
  std::string prefix = "aligned_";
  /// reference model (0-based)
  size_t model = 0;
  SupOptions sup;
  MatchOptions match;
};

enum class DriverState { Loaded, ReferenceChosen, Aligned, Written };

/// Outcome for one model of one input.
struct AlignItem {
  size_t input = 0;
  size_t model = 0;
  std::string name;
  bool ok = true;
  std::string error;
  double rmsd = NAN;
  size_t atom_count = 0;
  std::string path;  // set after writing
};

struct AlignReport {
  std::vector<AlignItem> items;

  size_t n_failed() const {
    size_t n = 0;
    for (const AlignItem& item : items)
      if (!item.ok)
        ++n;
    return n;
  }
  bool ok() const { return n_failed() == 0; }
};

/// Writes the selected models of the input to path, returns the written path.
/// Expected to throw IOWriteError on failure.
typedef std::function<std::string(const StructureInput& input,
                                  const std::vector<size_t>& models,
                                  const std::string& path)> StructureWriter;

class ENSFIT_DLL AlignmentDriver {
public:
  AlignmentDriver(std::vector<StructureInput> inputs, AlignOptions options,
                  Logger logger=Logger());

  DriverState state() const { return state_; }
  const std::vector<StructureInput>& inputs() const { return inputs_; }
  const AlignOptions& options() const { return options_; }
  const AlignReport& report() const { return report_; }
  /// true if several models of a single input are aligned
  bool aligns_models() const { return inputs_.size() == 1; }

  /// Loaded -> ReferenceChosen. Throws std::out_of_range for a bad model
  /// index, SelectionError if the selection is invalid (single input).
  void choose_reference();
  /// ReferenceChosen -> Aligned. Failures are recorded per item.
  void align();
  /// Aligned -> Written. Only aligned items are written.
  void write(const StructureWriter& writer);
  /// All the steps above.
  const AlignReport& run(const StructureWriter& writer);

  const Frame& reference() const;
  /// <prefix><name>.pdb, or <prefix><name>_<n>.pdb for models of one input
  std::string output_path(size_t input, size_t model) const;

private:
  std::vector<StructureInput> inputs_;
  AlignOptions options_;
  Logger logger_;
  DriverState state_ = DriverState::Loaded;
  AlignReport report_;
  Frame reference_;
  Ensemble ensemble_;  // models of the single input

  void expect_state(DriverState expected, const char* func) const;
  void align_models();
  void align_structures();
  AlignItem& item(size_t input, size_t model);
};

} // namespace ensfit
#endif
