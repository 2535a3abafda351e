// Copyright 2021 Global Phasing Ltd.
//
// Options of SystemBuilder, with defaults, and setting them by name
// from "key = value" text.

#ifndef IMMERSE_OPTIONS_HPP_
#define IMMERSE_OPTIONS_HPP_

#include <string>
#include "fail.hpp"      // for IMMERSE_DLL
#include "clash.hpp"     // for ClashOptions
#include "ions.hpp"      // for IonOptions
#include "placer.hpp"    // for PlacerOptions
#include "renumber.hpp"  // for RenumberOptions

namespace immerse {

struct BuildOptions {
  // normal, padding, normal_offset and footprint; the rest is set
  // per fragment by the builder
  PlacerOptions placer;
  bool center_normal = false;
  ClashOptions clash;
  IonOptions ions;
  RenumberOptions numbering;

  BuildOptions() {
    IonSpec na("Na");
    na.concentration = 0.150;
    IonSpec cl("Cl");
    cl.concentration = 0.150;
    ions.species.push_back(na);
    ions.species.push_back(cl);
  }
};

/// Sets one option. Recognized keys:
///  normal (x|y|z), padding, normal_offset, footprint (box|diameter),
///  center_normal, clash_distance, clash_distance.KIND1.KIND2,
///  clash_hydrogens, ion (SPECIES:count=N,conc=M,solute=D,ions=D,weight=W,
///  or none to remove all species), neutralize, target_charge, best_effort,
///  seed, shuffle, cation (Na|K|none), numbering_base, preserve.KIND,
///  chain_naming (number|short), ion_chain.
/// Booleans are true/false, yes/no, on/off or 1/0.
/// Fails on unknown keys and malformed values.
IMMERSE_DLL void set_option(BuildOptions& options, const std::string& key,
                            const std::string& value);

/// Parses lines "key = value"; # starts a comment.
IMMERSE_DLL BuildOptions read_options(const std::string& text);

/// Parses SPECIES:count=N,conc=M,... (see set_option).
IMMERSE_DLL IonSpec parse_ion_spec(const std::string& value);

} // namespace immerse
#endif
