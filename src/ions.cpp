// Copyright 2019 Global Phasing Ltd.

#include "immerse/ions.hpp"

#include <algorithm>             // for max
#include <utility>               // for swap
#include <cstdlib>               // for abs
#include <random>                // for mt19937
#include <set>
#include "immerse/calculate.hpp" // for net_charge, calculate_box
#include "immerse/modify.hpp"    // for filter_residues
#include "immerse/neighbor.hpp"  // for NeighborSearch

namespace immerse {

namespace {

// index of the atom that becomes the ion: water oxygen or first heavy atom
size_t representative_atom(const Residue& res) {
  for (size_t i = 0; i != res.atoms.size(); ++i)
    if (res.atoms[i].element == "O")
      return i;
  for (size_t i = 0; i != res.atoms.size(); ++i)
    if (!res.atoms[i].is_hydrogen())
      return i;
  return 0;
}

const IonSpecies* ion_species_of(const Residue& res) {
  if (res.kind != MoleculeKind::Ion || res.atoms.empty())
    return nullptr;
  if (const IonSpecies* sp = find_ion_species(res.name))
    return sp;
  return find_ion_species(res.atoms[0].element);
}

int sign(int n) { return n > 0 ? 1 : (n < 0 ? -1 : 0); }

// Picks the species that gets the next unit of correction using the
// highest averages method: the largest weight / (taken + 1) wins,
// ties go to the first species. Returns -1 if no species qualifies.
int pick_for_correction(const std::vector<IonTarget>& targets,
                        const std::vector<int>& taken,
                        int charge_sign, int charge_left, bool removing) {
  int best = -1;
  double best_quotient = 0.;
  for (size_t i = 0; i != targets.size(); ++i) {
    const IonTarget& t = targets[i];
    int q = t.info->charge;
    if (sign(q) != charge_sign || std::abs(q) > charge_left ||
        !(t.spec.neutralize_weight > 0) || (removing && t.count == 0))
      continue;
    double quotient = t.spec.neutralize_weight / (taken[i] + 1);
    if (best == -1 || quotient > best_quotient) {
      best = (int) i;
      best_quotient = quotient;
    }
  }
  return best;
}

void neutralize(std::vector<IonTarget>& targets, int excess) {
  if (excess == 0)
    return;
  int excess_sign = sign(excess);
  int left = std::abs(excess);
  // fewer ions of the same sign as the excess
  std::vector<int> taken(targets.size(), 0);
  while (left > 0) {
    int idx = pick_for_correction(targets, taken, excess_sign, left, true);
    if (idx < 0)
      break;
    --targets[idx].count;
    ++taken[idx];
    left -= std::abs(targets[idx].info->charge);
  }
  // more ions of the opposite sign
  std::fill(taken.begin(), taken.end(), 0);
  while (left > 0) {
    int idx = pick_for_correction(targets, taken, -excess_sign, left, false);
    if (idx < 0)
      fail(cat("Cannot neutralize charge ", excess, " with the configured ions: ",
               left, " left uncompensated."));
    ++targets[idx].count;
    ++taken[idx];
    left -= std::abs(targets[idx].info->charge);
  }
}

struct Site {
  int model_idx;
  int chain_idx;
  int residue_idx;
  Position pos;
};

} // anonymous namespace

void set_ion(Residue& res, const IonSpecies& species) {
  if (res.atoms.empty())
    fail("cannot make ion from empty residue " + res.str());
  Atom atom = res.atoms[representative_atom(res)];
  atom.name = species.atom_name;
  atom.element = species.symbol;
  atom.charge = (float) species.charge;
  res.atoms.assign(1, atom);
  res.name = species.resname;
  res.kind = MoleculeKind::Ion;
  res.segment = "ION";
}

int convert_cations(Model& model, const std::string& species) {
  const IonSpecies* sp = find_ion_species(species);
  if (!sp || sp->charge != 1)
    fail("Invalid cation '" + species + "'. Supported cations are Na, K");
  int n = 0;
  for (Chain& chain : model.chains)
    for (Residue& res : chain.residues) {
      const IonSpecies* current = ion_species_of(res);
      if (current && current != sp && current->charge == 1) {
        set_ion(res, *sp);
        ++n;
      }
    }
  return n;
}

IonPlan plan_ions(const std::vector<Model>& system, const IonOptions& options) {
  IonPlan plan;
  for (const Model& model : system) {
    plan.n_water += (int) count_residues(model, MoleculeKind::Water);
    plan.system_charge += net_charge(model);
  }
  for (const IonSpec& spec : options.species) {
    IonTarget t;
    t.spec = spec;
    t.info = find_ion_species(spec.species);
    if (!t.info)
      fail("Unknown ion species: " + spec.species);
    for (const IonTarget& prev : plan.targets)
      if (prev.info == t.info)
        fail("Ion species given twice: " + spec.species);
    for (const Model& model : system)
      for (const Chain& chain : model.chains)
        for (const Residue& res : chain.residues)
          if (ion_species_of(res) == t.info)
            ++t.existing;
    int wanted = spec.count >= 0
      ? spec.count
      : iround(kSaltIonsPerWater1M * plan.n_water * spec.concentration);
    t.count = std::max(0, wanted - t.existing);
    plan.targets.push_back(t);
  }
  if (options.neutralize)
    neutralize(plan.targets, plan.final_charge() - options.target_charge);
  return plan;
}

IonPlacement place_ions(std::vector<Model>& system, const IonPlan& plan,
                        const IonOptions& options, const ClashOptions& clash,
                        const Logger& logger) {
  IonPlacement result{Model("ions", FragmentRole::Ions), {}};
  int total = plan.total();
  if (total == 0)
    return result;

  Box<Position> box;
  std::vector<Site> sites;
  double fixed_radius = 0.;
  double ion_radius = clash.distance(MoleculeKind::Ion, MoleculeKind::Ion);
  for (const IonTarget& t : plan.targets) {
    fixed_radius = std::max(fixed_radius, t.spec.min_dist_solute);
    ion_radius = std::max(ion_radius, t.spec.min_dist_ions);
  }
  for (int k = 0; k != kMoleculeKindCount; ++k)
    fixed_radius = std::max(fixed_radius,
                            clash.distance(MoleculeKind::Ion, (MoleculeKind) k));
  for (int m = 0; m != (int) system.size(); ++m) {
    const Model& model = system[m];
    box.extend(calculate_box(model));
    if (model.role != FragmentRole::Solvent && model.role != FragmentRole::Membrane)
      continue;
    for (int ch = 0; ch != (int) model.chains.size(); ++ch) {
      const Chain& chain = model.chains[ch];
      for (int r = 0; r != (int) chain.residues.size(); ++r) {
        const Residue& res = chain.residues[r];
        if (res.kind == MoleculeKind::Water && !res.atoms.empty())
          sites.push_back({m, ch, r, res.atoms[representative_atom(res)].pos});
      }
    }
  }
  if ((int) sites.size() < total)
    throw InsufficientSolvent("ions", "water", total, (int) sites.size());
  if (options.shuffle) {
    // Fisher-Yates on raw mt19937 output: the same order with any
    // standard library, unlike std::shuffle
    std::mt19937 rng(options.seed);
    for (size_t i = sites.size(); i > 1; --i)
      std::swap(sites[i - 1], sites[rng() % i]);
  }

  // atoms that stay where they are: everything but waters and ions
  NeighborSearch fixed_ns(box, std::max(fixed_radius, 1.));
  fixed_ns.include_h = clash.include_h;
  NeighborSearch ion_ns(box, std::max(ion_radius, 1.));
  for (int m = 0; m != (int) system.size(); ++m) {
    const Model& model = system[m];
    for (int ch = 0; ch != (int) model.chains.size(); ++ch) {
      const Chain& chain = model.chains[ch];
      for (int r = 0; r != (int) chain.residues.size(); ++r) {
        const Residue& res = chain.residues[r];
        if (res.kind == MoleculeKind::Ion)
          ion_ns.add_residue(res, -1, ch, r);  // pre-existing ion
        else if (res.kind != MoleculeKind::Water)
          fixed_ns.add_residue(res, m, ch, r);
      }
    }
  }

  auto site_ok = [&](const Site& site, int s) {
    const IonSpec& spec = plan.targets[s].spec;
    bool ok = true;
    fixed_ns.for_each(site.pos, fixed_radius, [&](NeighborSearch::Mark& mark, double dist_sq) {
        double limit = clash.distance(MoleculeKind::Ion, mark.kind);
        if (mark.kind == MoleculeKind::Solute)
          limit = std::max(limit, spec.min_dist_solute);
        if (dist_sq < sq(limit))
          ok = false;
    });
    if (!ok)
      return false;
    double ion_ion = clash.distance(MoleculeKind::Ion, MoleculeKind::Ion);
    ion_ns.for_each(site.pos, ion_radius, [&](NeighborSearch::Mark& mark, double dist_sq) {
        double limit = std::max(spec.min_dist_ions, ion_ion);
        if (mark.model_idx >= 0)
          limit = std::max(limit, plan.targets[mark.model_idx].spec.min_dist_ions);
        if (dist_sq < sq(limit))
          ok = false;
    });
    return ok;
  };

  size_t n_targets = plan.targets.size();
  std::vector<char> used(sites.size(), 0);
  std::vector<size_t> cursor(n_targets, 0);
  std::vector<int> placed(n_targets, 0);
  std::vector<char> exhausted(n_targets, 0);
  std::vector<std::pair<size_t, int>> selected;  // (site, species)
  for (;;) {
    // the species with the largest remaining fraction of its target
    int s = -1;
    double best_fraction = 0.;
    for (size_t i = 0; i != n_targets; ++i) {
      int count = plan.targets[i].count;
      if (exhausted[i] || placed[i] >= count)
        continue;
      double fraction = double(count - placed[i]) / count;
      if (s == -1 || fraction > best_fraction) {
        s = (int) i;
        best_fraction = fraction;
      }
    }
    if (s == -1)
      break;
    // sites rejected for a species never become acceptable later
    size_t& cur = cursor[s];
    while (cur < sites.size() && (used[cur] || !site_ok(sites[cur], s)))
      ++cur;
    if (cur == sites.size()) {
      exhausted[s] = 1;
      continue;
    }
    used[cur] = 1;
    ion_ns.add_point(sites[cur].pos, MoleculeKind::Ion, s, 0, 0, 0);
    selected.emplace_back(cur, s);
    ++placed[s];
    ++cur;
  }

  for (size_t i = 0; i != n_targets; ++i)
    if (placed[i] < plan.targets[i].count)
      result.shortfalls.push_back({plan.targets[i].spec.species,
                                   plan.targets[i].count,
                                   plan.targets[i].count - placed[i]});
  if (!result.shortfalls.empty()) {
    if (!options.best_effort)
      throw IonPlacementShortfall("ions", result.shortfalls);
    logger.warn(IonPlacementShortfall::describe(result.shortfalls));
  }

  Chain& chain = result.ions.append_chain(Chain(options.chain));
  std::set<const Residue*> converted;
  for (const auto& sel : selected) {
    const Site& site = sites[sel.first];
    const Residue& water = system[site.model_idx].chains[site.chain_idx]
                                                 .residues[site.residue_idx];
    converted.insert(&water);
    chain.residues.push_back(water);
    Residue& ion = chain.residues.back();
    set_ion(ion, *plan.targets[sel.second].info);
    ion.seqnum = (int) chain.residues.size();
  }
  for (Model& model : system)
    if (model.role == FragmentRole::Solvent || model.role == FragmentRole::Membrane)
      model = filter_residues(model, [&](const Residue& r) {
          return converted.count(&r) == 0;
      });
  if (chain.residues.empty())
    result.ions.chains.clear();
  for (size_t i = 0; i != n_targets; ++i)
    logger.mesg("Placed ", placed[i], " of ", plan.targets[i].count, ' ',
                plan.targets[i].spec.species, " ions.");
  return result;
}

} // namespace immerse
