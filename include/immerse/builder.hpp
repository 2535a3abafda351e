// Copyright 2021 Global Phasing Ltd.
//
// SystemBuilder: solute + membrane patch + solvent box -> one model.
// Runs in a fixed order: center, place, resolve clashes, place ions,
// merge and renumber.

#ifndef IMMERSE_BUILDER_HPP_
#define IMMERSE_BUILDER_HPP_

#include <string>
#include <vector>
#include "fail.hpp"       // for IMMERSE_DLL, Shortfall
#include "calculate.hpp"  // for LeafletComposition
#include "clash.hpp"      // for ClashRecord
#include "ions.hpp"       // for IonPlan
#include "logger.hpp"
#include "model.hpp"
#include "options.hpp"    // for BuildOptions
#include "placer.hpp"     // for TilingPlan
#include "renumber.hpp"   // for NumberingCollision

namespace immerse {

struct BuildInput {
  Model solute = Model("solute", FragmentRole::Solute);
  // membrane patch and solvent box with periodic cells;
  // a model without atoms means no membrane (solvent)
  Model membrane = Model("membrane", FragmentRole::Membrane);
  Model solvent = Model("solvent", FragmentRole::Solvent);
  // ligands, cofactors, etc. in the solute frame; not placed, but
  // clash-checked after the solute, in the given order
  std::vector<Model> others;
  // ions already present, in the solute frame
  Model ions = Model("ions", FragmentRole::Ions);
};

/// Recoverable conditions and statistics of one build.
struct Report {
  Vec3 solute_shift;
  std::vector<TilingPlan> tilings;  // membrane first, if any
  std::vector<ClashRecord> clashes;
  IonPlan ion_plan;
  std::vector<Shortfall> shortfalls;  // only with best_effort
  std::vector<NumberingCollision> collisions;
  size_t counts[kMoleculeKindCount] = {};  // residues in the final model
  LeafletComposition leaflets;
  int final_charge = 0;

  size_t removed_residues() const {
    size_t n = 0;
    for (const ClashRecord& c : clashes)
      if (!c.kept)
        ++n;
    return n;
  }
  std::string str() const;
};

struct BuildResult {
  Model model;
  Report report;
};

struct SystemBuilder {
  BuildOptions options;
  Logger logger;

  SystemBuilder() = default;
  explicit SystemBuilder(const BuildOptions& opt) : options(opt) {}

  /// Throws BuildError (or std::runtime_error from fail()) on fatal
  /// conditions; no model is produced then.
  IMMERSE_DLL BuildResult build(const BuildInput& input) const;
};

} // namespace immerse
#endif
