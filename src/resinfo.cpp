// Copyright 2018 Global Phasing Ltd.

#include "immerse/resinfo.hpp"
#include "immerse/util.hpp"  // for to_upper, to_lower

namespace immerse {

MoleculeKind molecule_kind_from_str(const std::string& name) {
  std::string lname = to_lower(name);
  for (int i = 0; i != kMoleculeKindCount; ++i) {
    MoleculeKind kind = static_cast<MoleculeKind>(i);
    if (lname == molecule_kind_str(kind))
      return kind;
  }
  fail("unknown molecule kind: " + name);
}

MoleculeKind find_tabulated_kind(const std::string& resname) {
  static const char* waters[] = {
    "HOH", "WAT", "H2O", "DOD", "SOL", "TIP3", "TIP4", "TIP5", "T3P", "T4P",
    "SPC", "SPCE", "TP3", nullptr
  };
  static const char* lipids[] = {
    "POPC", "POPE", "POPG", "POPS", "POPA", "DPPC", "DOPC", "DOPE", "DOPS",
    "DMPC", "DLPC", "DSPC", "DPPE", "DMPE", "SDPC", "PSM", "CHL1", "CHOL",
    "CLR", "CHL", "PA", "PC", "PE", "OL", "PGR", "PS", nullptr
  };
  static const char* ions[] = {
    "NA", "SOD", "NA+", "K", "POT", "K+", "CL", "CLA", "CL-", "MG", "CAL",
    "CA", "ZN", "ZN2", "CS", "CES", "LI", "LIT", "RB", nullptr
  };
  std::string name = to_upper(resname);
  auto listed = [&](const char** list) {
    for (const char** p = list; *p; ++p)
      if (name == *p)
        return true;
    return false;
  };
  if (listed(waters))
    return MoleculeKind::Water;
  if (listed(lipids))
    return MoleculeKind::Lipid;
  if (listed(ions))
    return MoleculeKind::Ion;
  return MoleculeKind::Other;
}

const IonSpecies* find_ion_species(const std::string& name) {
  static const IonSpecies table[] = {
    {"Na", "SOD", "NA", 1},
    {"K",  "POT", "K",  1},
    {"Cl", "CLA", "CL", -1},
    {"Mg", "MG",  "MG", 2},
    {"Ca", "CAL", "CA", 2},
  };
  std::string lname = to_lower(name);
  for (const IonSpecies& sp : table)
    if (lname == to_lower(sp.symbol) || lname == to_lower(sp.resname))
      return &sp;
  return nullptr;
}

} // namespace immerse
