// Copyright 2019 Global Phasing Ltd.

#include "immerse/clash.hpp"

#include <cmath>               // for sqrt, INFINITY
#include <set>
#include "immerse/calculate.hpp" // for calculate_box, count_residues
#include "immerse/modify.hpp"    // for filter_residues
#include "immerse/neighbor.hpp"  // for NeighborSearch

namespace immerse {

namespace {

struct ResidueClash {
  const Atom* atom = nullptr;
  const NeighborSearch::Mark* mark = nullptr;
  double dist_sq = INFINITY;
  explicit operator bool() const { return atom != nullptr; }
};

// Returns the closest pair (residue atom, indexed atom) that is within
// the kind-pair distance.
ResidueClash check_residue(NeighborSearch& ns, const Residue& res,
                           const ClashOptions& options, double radius) {
  ResidueClash clash;
  for (const Atom& atom : res.atoms) {
    if (!options.include_h && atom.is_hydrogen())
      continue;
    ns.for_each(atom.pos, radius, [&](NeighborSearch::Mark& m, double dist_sq) {
        if (dist_sq < sq(options.distance(res.kind, m.kind)) &&
            dist_sq < clash.dist_sq) {
          clash.atom = &atom;
          clash.mark = &m;
          clash.dist_sq = dist_sq;
        }
    });
  }
  return clash;
}

ClashRecord make_record(const Model& model, const Chain& chain,
                        const Residue& res, const ResidueClash& clash,
                        const std::vector<Model>& models) {
  ClashRecord rec;
  rec.model = model.name;
  rec.chain = chain.name;
  rec.resname = res.name;
  rec.seqnum = res.seqnum;
  rec.atom_a = clash.atom->name;
  const Model& other = models[clash.mark->model_idx];
  rec.other_model = other.name;
  rec.atom_b = atom_str(clash.mark->to_cra(other));
  rec.distance = std::sqrt(clash.dist_sq);
  return rec;
}

Box<Position> union_box(const std::vector<Model>& models) {
  Box<Position> box;
  for (const Model& model : models)
    box.extend(calculate_box(model));
  return box;
}

} // anonymous namespace

std::vector<ClashRecord>
resolve_clashes(std::vector<Model>& models, const ClashOptions& options,
                const Logger& logger) {
  std::vector<ClashRecord> records;
  if (models.empty())
    return records;
  Box<Position> box = union_box(models);
  if (box.empty())
    return records;
  double radius = options.max_distance();
  NeighborSearch ns(box, radius);
  ns.include_h = options.include_h;
  ns.add_model(models[0], 0);
  for (size_t i = 1; i < models.size(); ++i) {
    Model& model = models[i];
    // all queries of this tier run before any of its residues is indexed
    std::set<const Residue*> rejected;
    for (const Chain& chain : model.chains)
      for (const Residue& res : chain.residues) {
        ResidueClash clash = check_residue(ns, res, options, radius);
        if (!clash)
          continue;
        records.push_back(make_record(model, chain, res, clash, models));
        ClashRecord& rec = records.back();
        if (res.kind == MoleculeKind::Solute) {
          rec.kept = true;
          logger.warn("solute residue clashes, keeping it: ", rec.str());
        } else {
          rejected.insert(&res);
          logger.debug(rec.str());
        }
      }
    if (!rejected.empty()) {
      size_t n_before = count_residues(model);
      model = filter_residues(model, [&](const Residue& r) {
          return rejected.count(&r) == 0;
      });
      logger.mesg("Removed ", rejected.size(), " of ", n_before,
                  " residues from ", model.name, " (",
                  fragment_role_str(model.role), ") due to clashes.");
    }
    ns.add_model(model, (int) i);
  }
  return records;
}

std::vector<ClashRecord>
find_clashes(const std::vector<Model>& models, const ClashOptions& options) {
  std::vector<ClashRecord> records;
  Box<Position> box = union_box(models);
  if (box.empty())
    return records;
  double radius = options.max_distance();
  NeighborSearch ns(box, radius);
  ns.include_h = options.include_h;
  for (size_t i = 0; i < models.size(); ++i) {
    const Model& model = models[i];
    if (i != 0)
      for (const Chain& chain : model.chains)
        for (const Residue& res : chain.residues)
          if (ResidueClash clash = check_residue(ns, res, options, radius))
            records.push_back(make_record(model, chain, res, clash, models));
    ns.add_model(model, (int) i);
  }
  return records;
}

} // namespace immerse
