// Copyright Global Phasing Ltd.

#include <ensfit/driver.hpp>
#include <ensfit/select.hpp>  // for resolve_selection

namespace ensfit {

namespace {

void mark_failed(AlignItem& item, const std::exception& e, const Logger& logger) {
  item.ok = false;
  item.error = e.what();
  logger.warn(item.name, " model ", item.model + 1, ": ", e.what());
}

} // anonymous namespace

AlignmentDriver::AlignmentDriver(std::vector<StructureInput> inputs,
                                 AlignOptions options, Logger logger)
  : inputs_(std::move(inputs)), options_(std::move(options)),
    logger_(std::move(logger)) {
  if (inputs_.empty())
    fail("AlignmentDriver: no input structures");
  for (const StructureInput& input : inputs_)
    if (!input.topology || input.frames.empty())
      fail("AlignmentDriver: input ", input.name, " has no atoms");
}

void AlignmentDriver::expect_state(DriverState expected, const char* func) const {
  if (state_ != expected)
    fail("AlignmentDriver::", func, "() called in a wrong state");
}

AlignItem& AlignmentDriver::item(size_t input, size_t model) {
  for (AlignItem& it : report_.items)
    if (it.input == input && it.model == model)
      return it;
  fail("AlignmentDriver: no item for input ", std::to_string(input),
       " model ", std::to_string(model));
}

const Frame& AlignmentDriver::reference() const {
  if (state_ == DriverState::Loaded)
    fail("AlignmentDriver: reference is not chosen yet");
  return reference_;
}

void AlignmentDriver::choose_reference() {
  expect_state(DriverState::Loaded, "choose_reference");
  const StructureInput& ref = inputs_[0];
  if (options_.model >= ref.frames.size())
    throw std::out_of_range("Model #" + std::to_string(options_.model + 1) +
                            " not found in " + ref.name + " (" +
                            std::to_string(ref.frames.size()) + " models)");
  const Frame& frame = ref.frames[options_.model];
  check_same_size(frame.size(), ref.topology->size(), "reference model");
  reference_ = frame;

  report_.items.clear();
  for (size_t i = 0; i != inputs_.size(); ++i)
    for (size_t m = 0; m != inputs_[i].frames.size(); ++m) {
      AlignItem it;
      it.input = i;
      it.model = m;
      it.name = inputs_[i].name;
      report_.items.push_back(it);
    }

  if (aligns_models()) {
    ensemble_ = Ensemble(ref.name);
    ensemble_.set_atoms(ref.topology);
    for (const Frame& f : ref.frames) {
      try {
        ensemble_.add_frame(f);
      } catch (SizeMismatch&) {
        // keeps indices aligned with models; reported in align()
        ensemble_.add_frame(Frame(ref.topology->size()));
      }
    }
    ensemble_.select(options_.selection);
    ensemble_.set_reference(reference_);
    logger_.mesg("Aligning ", ref.frames.size(), " models of ", ref.name,
                 " on ", ensemble_.mask().count(), " atoms selected by \"",
                 options_.selection, '"');
  } else {
    logger_.mesg("Aligning ", inputs_.size() - 1, " structures on ", ref.name);
  }
  logger_.mesg("Reference: ", ref.name, " model ", options_.model + 1);
  state_ = DriverState::ReferenceChosen;
}

void AlignmentDriver::align_models() {
  StructureInput& input = inputs_[0];
  const SelectionMask& mask = ensemble_.mask();
  for (size_t m = 0; m != input.frames.size(); ++m) {
    AlignItem& it = item(0, m);
    try {
      check_same_size(input.frames[m].size(), input.topology->size(), "model");
      SupResult sr = superpose_in_place(ensemble_[m], ensemble_.reference(), mask,
                                        ensemble_.context().weights_ptr(),
                                        options_.sup, logger_);
      it.rmsd = sr.rmsd;
      it.atom_count = sr.count;
      input.frames[m] = ensemble_[m];
      logger_.mesg(input.name, " model ", m + 1, ": RMSD ", sr.rmsd);
    } catch (DimensionMismatch& e) {
      mark_failed(it, e, logger_);
    } catch (InsufficientAtoms& e) {
      mark_failed(it, e, logger_);
    }
  }
}

void AlignmentDriver::align_structures() {
  const StructureInput& ref = inputs_[0];
  SelectionMask ref_mask = resolve_selection(options_.match_selection, *ref.topology);
  AlignItem& ref_item = item(0, options_.model);
  ref_item.rmsd = 0.;
  ref_item.atom_count = ref_mask.count();
  // the other models of the reference input share its topology
  for (size_t m = 0; m != inputs_[0].frames.size(); ++m) {
    if (m == options_.model)
      continue;
    AlignItem& it = item(0, m);
    try {
      Frame& frame = inputs_[0].frames[m];
      check_same_size(frame.size(), ref.topology->size(), "model");
      SupResult sr = superpose_in_place(frame, reference_, ref_mask, nullptr,
                                        options_.sup, logger_);
      it.rmsd = sr.rmsd;
      it.atom_count = sr.count;
      logger_.mesg(ref.name, " model ", m + 1, ": RMSD ", sr.rmsd,
                   " over ", sr.count, " atoms");
    } catch (DimensionMismatch& e) {
      mark_failed(it, e, logger_);
    } catch (InsufficientAtoms& e) {
      mark_failed(it, e, logger_);
    }
  }

  for (size_t j = 1; j != inputs_.size(); ++j) {
    StructureInput& input = inputs_[j];
    Correspondence corr;
    try {
      SelectionMask mask = resolve_selection(options_.match_selection, *input.topology);
      corr = match_chains(*ref.topology, *input.topology, ref_mask, mask,
                          options_.match, logger_);
    } catch (SelectionError& e) {
      for (size_t m = 0; m != input.frames.size(); ++m)
        mark_failed(item(j, m), e, logger_);
      continue;
    } catch (InsufficientAtoms& e) {
      for (size_t m = 0; m != input.frames.size(); ++m)
        mark_failed(item(j, m), e, logger_);
      continue;
    }
    std::vector<Vec3> ref_pos(corr.size());
    for (size_t k = 0; k != corr.size(); ++k)
      ref_pos[k] = reference_[corr.atoms_a[k]];
    std::vector<Vec3> mob_pos(corr.size());
    for (size_t m = 0; m != input.frames.size(); ++m) {
      AlignItem& it = item(j, m);
      Frame& frame = input.frames[m];
      try {
        check_same_size(frame.size(), input.topology->size(), "model");
        for (size_t k = 0; k != corr.size(); ++k)
          mob_pos[k] = frame[corr.atoms_b[k]];
        SupResult sr = superpose_positions(ref_pos.data(), mob_pos.data(), corr.size(),
                                           nullptr, options_.sup, logger_);
        apply_transform(frame, sr);
        it.rmsd = sr.rmsd;
        it.atom_count = sr.count;
        logger_.mesg(input.name, " model ", m + 1, ": RMSD ", sr.rmsd,
                     " over ", sr.count, " atoms");
      } catch (DimensionMismatch& e) {
        mark_failed(it, e, logger_);
      } catch (InsufficientAtoms& e) {
        mark_failed(it, e, logger_);
      }
    }
  }
}

void AlignmentDriver::align() {
  expect_state(DriverState::ReferenceChosen, "align");
  if (aligns_models())
    align_models();
  else
    align_structures();
  state_ = DriverState::Aligned;
}

std::string AlignmentDriver::output_path(size_t input, size_t model) const {
  const StructureInput& in = inputs_.at(input);
  std::string path = options_.prefix + in.name;
  if (aligns_models() && in.frames.size() > 1) {
    int num = model < in.model_numbers.size() ? in.model_numbers[model] : (int) model + 1;
    path += "_" + std::to_string(num);
  }
  return path + ".pdb";
}

void AlignmentDriver::write(const StructureWriter& writer) {
  expect_state(DriverState::Aligned, "write");
  for (size_t i = 0; i != inputs_.size(); ++i) {
    const StructureInput& input = inputs_[i];
    // one file per model of a single input, one file per input otherwise
    std::vector<std::vector<size_t>> groups;
    for (size_t m = 0; m != input.frames.size(); ++m) {
      if (!item(i, m).ok)
        continue;
      if (aligns_models() || groups.empty())
        groups.emplace_back();
      groups.back().push_back(m);
    }
    for (const std::vector<size_t>& models : groups) {
      std::string path = output_path(i, models[0]);
      try {
        std::string written = writer(input, models, path);
        for (size_t m : models)
          item(i, m).path = written;
        logger_.mesg("Written ", written);
      } catch (IOWriteError& e) {
        for (size_t m : models)
          mark_failed(item(i, m), e, logger_);
      }
    }
  }
  state_ = DriverState::Written;
}

const AlignReport& AlignmentDriver::run(const StructureWriter& writer) {
  choose_reference();
  align();
  write(writer);
  return report_;
}

} // namespace ensfit
