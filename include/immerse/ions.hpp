// Copyright 2019 Global Phasing Ltd.
//
// Converting solvent molecules to ions: salt concentration,
// neutralization and placement of several species in one pass.

#ifndef IMMERSE_IONS_HPP_
#define IMMERSE_IONS_HPP_

#include <cstdint>       // for uint32_t
#include <string>
#include <vector>
#include "clash.hpp"     // for ClashOptions
#include "fail.hpp"      // for IMMERSE_DLL, Shortfall
#include "logger.hpp"
#include "model.hpp"

namespace immerse {

// number of salt ions (of each sign) per water molecule in 1 M solution
constexpr double kSaltIonsPerWater1M = 0.018;

struct IonSpec {
  std::string species;         // Na, K, Cl, Mg or Ca
  int count = -1;              // explicit count; -1 means from concentration
  double concentration = 0.;   // molar
  double min_dist_solute = 5.;
  double min_dist_ions = 5.;
  double neutralize_weight = 1.;

  IonSpec() = default;
  explicit IonSpec(const std::string& sp) : species(sp) {}
};

struct IonOptions {
  std::vector<IonSpec> species;
  bool neutralize = true;
  int target_charge = 0;
  bool best_effort = false;
  bool shuffle = false;    // candidate sites in random order
  std::uint32_t seed = 0;  // the same seed gives the same sites on any platform
  std::string chain = "N";
  std::string cation;      // if set, Na and K already present become this
};

struct IonTarget {
  IonSpec spec;
  const IonSpecies* info = nullptr;
  int existing = 0;  // ions of this species already in the system
  int count = 0;     // ions to be placed
};

struct IonPlan {
  std::vector<IonTarget> targets;
  int n_water = 0;
  int system_charge = 0;  // before placement

  int total() const {
    int n = 0;
    for (const IonTarget& t : targets)
      n += t.count;
    return n;
  }
  int final_charge() const {
    int charge = system_charge;
    for (const IonTarget& t : targets)
      charge += t.count * t.info->charge;
    return charge;
  }
  std::string str() const {
    std::string s = cat("system charge ", system_charge, ", ", n_water, " waters;");
    for (const IonTarget& t : targets)
      s += cat(' ', t.spec.species, ": ", t.count, " to place (",
               t.existing, " present);");
    s += cat(" final charge ", final_charge());
    return s;
  }
};

struct IonPlacement {
  Model ions;
  std::vector<Shortfall> shortfalls;  // non-empty only with best_effort
};

/// Sets the residue to the ion species, keeping one atom
/// (the water oxygen or the first heavy atom).
IMMERSE_DLL void set_ion(Residue& res, const IonSpecies& species);

/// Relabels all monovalent cations (Na, K) in the model as the given
/// cation. Returns the number of converted residues.
IMMERSE_DLL int convert_cations(Model& model, const std::string& species);

/// Counts ions to add for each species: explicit count or the amount
/// for the concentration, minus ions already present; then, with
/// neutralize, corrects the charge towards target_charge.
/// Fails if no combination of the configured species reaches the target.
IMMERSE_DLL IonPlan plan_ions(const std::vector<Model>& system,
                              const IonOptions& options);

/// Converts water molecules of solvent and membrane models into ions.
/// A site is rejected if an atom that is neither water nor ion is closer
/// than clash.distance(Ion, kind), or a solute atom closer than
/// min_dist_solute, or an ion closer than min_dist_ions.
/// Converted residues are removed from their models (which are replaced
/// with filtered copies) and returned in a new Model with role Ions.
/// Throws InsufficientSolvent if there are fewer waters than ions,
/// IonPlacementShortfall if the sites run out (unless best_effort).
IMMERSE_DLL IonPlacement place_ions(std::vector<Model>& system,
                                    const IonPlan& plan,
                                    const IonOptions& options,
                                    const ClashOptions& clash,
                                    const Logger& logger);

} // namespace immerse
#endif
