// Copyright 2018 Global Phasing Ltd.
//
// Molecule kinds, tabulated residue names of waters, lipids and ions,
// and the ion species that can be placed in the solvent.

#ifndef IMMERSE_RESINFO_HPP_
#define IMMERSE_RESINFO_HPP_

#include <string>
#include "fail.hpp"   // for IMMERSE_DLL

namespace immerse {

// Coarse category of a residue. It drives clash priority and numbering.
enum class MoleculeKind : unsigned char { Solute=0, Lipid, Water, Ion, Other };

constexpr int kMoleculeKindCount = 5;

inline const char* molecule_kind_str(MoleculeKind kind) {
  static const char* names[] = { "solute", "lipid", "water", "ion", "other" };
  return names[static_cast<int>(kind)];
}

/// Inverse of molecule_kind_str(); fails on unknown names.
IMMERSE_DLL MoleculeKind molecule_kind_from_str(const std::string& name);

/// Classifies residue names seen in membrane and solvent patches
/// (CHARMM, Amber, GROMACS naming). Returns Other for unknown names,
/// which includes amino acids - these are tagged Solute by the caller.
IMMERSE_DLL MoleculeKind find_tabulated_kind(const std::string& resname);

struct IonSpecies {
  const char* symbol;   // element symbol, also the name used in options
  const char* resname;  // residue name (CHARMM convention)
  const char* atom_name;
  int charge;
};

/// Returns tabulated species (Na, K, Cl, Mg, Ca), matched case-insensitively
/// by symbol or residue name, or nullptr.
IMMERSE_DLL const IonSpecies* find_ion_species(const std::string& name);

} // namespace immerse
#endif
