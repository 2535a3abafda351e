// Copyright 2019 Global Phasing Ltd.
//
// Removal of whole residues that overlap with residues of models
// of higher priority (solute > other > membrane > solvent > ions).

#ifndef IMMERSE_CLASH_HPP_
#define IMMERSE_CLASH_HPP_

#include <string>
#include <vector>
#include "fail.hpp"      // for IMMERSE_DLL
#include "logger.hpp"
#include "model.hpp"

namespace immerse {

struct ClashOptions {
  double min_dist = 2.5;
  // per-kind-pair overrides, 0 means min_dist
  double pair_dist[kMoleculeKindCount][kMoleculeKindCount] = {};
  bool include_h = true;

  void set_pair(MoleculeKind a, MoleculeKind b, double dist) {
    pair_dist[static_cast<int>(a)][static_cast<int>(b)] = dist;
    pair_dist[static_cast<int>(b)][static_cast<int>(a)] = dist;
  }
  double distance(MoleculeKind a, MoleculeKind b) const {
    double d = pair_dist[static_cast<int>(a)][static_cast<int>(b)];
    return d > 0 ? d : min_dist;
  }
  double max_distance() const {
    double d = min_dist;
    for (int i = 0; i != kMoleculeKindCount; ++i)
      for (int j = 0; j != kMoleculeKindCount; ++j)
        if (pair_dist[i][j] > d)
          d = pair_dist[i][j];
    return d;
  }
};

struct ClashRecord {
  std::string model;     // name of the model the residue belonged to
  std::string chain;
  std::string resname;
  int seqnum;
  std::string atom_a;    // atom of the removed residue
  std::string atom_b;    // accepted atom, in the higher priority model
  std::string other_model;
  double distance;
  bool kept = false;     // solute residue kept despite the clash

  std::string str() const {
    return cat(kept ? "kept " : "removed ", model, ':', chain, '/', resname,
               ' ', seqnum, " (", atom_a, " - ", other_model, ':', atom_b,
               ' ', distance, " A)");
  }
};

/// Processes the models in the given order. The first model is accepted
/// as a whole; for each following model the residues clashing with
/// anything accepted earlier are removed (the model is replaced by
/// a filtered copy) and then the survivors are accepted.
/// Residues within one model are not checked against each other.
/// Solute residues are never removed; their clashes are only logged.
IMMERSE_DLL std::vector<ClashRecord>
resolve_clashes(std::vector<Model>& models, const ClashOptions& options,
                const Logger& logger);

/// Returns clashes between residues of different models, without removing
/// anything. Used to verify assembled systems.
IMMERSE_DLL std::vector<ClashRecord>
find_clashes(const std::vector<Model>& models, const ClashOptions& options);

} // namespace immerse
#endif
