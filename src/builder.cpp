// Copyright 2021 Global Phasing Ltd.

#include "immerse/builder.hpp"

#include <algorithm>             // for min, max
#include "immerse/calculate.hpp" // for center_model, count_residues
#include "immerse/modify.hpp"    // for assign_molecule_kinds, translate

namespace immerse {

namespace {

Model prepare_fragment(const Model& input, FragmentRole role) {
  Model model = input;
  model.role = role;
  assign_molecule_kinds(model);
  remove_empty_children(model);
  return model;
}

int count_host_waters(const std::vector<Model>& models) {
  int n = 0;
  for (const Model& model : models)
    if (model.role == FragmentRole::Solvent || model.role == FragmentRole::Membrane)
      n += (int) count_residues(model, MoleculeKind::Water);
  return n;
}

} // anonymous namespace

std::string Report::str() const {
  std::string s = "Solute shifted by " + solute_shift.str() + ".\n";
  for (const TilingPlan& plan : tilings)
    s += "Tiling: " + plan.str() + "\n";
  s += cat("Clashes: ", clashes.size(), ", removed residues: ",
           removed_residues(), "\n");
  s += "Ions: " + ion_plan.str() + "\n";
  for (const Shortfall& sf : shortfalls)
    s += cat("Shortfall: ", sf.unplaced, " of ", sf.requested, ' ', sf.species,
             " not placed\n");
  s += cat("Numbering collisions: ", collisions.size(), "\n");
  s += "Residues:";
  for (int i = 0; i != kMoleculeKindCount; ++i)
    s += cat(' ', molecule_kind_str(static_cast<MoleculeKind>(i)), ' ', counts[i]);
  s += "\n" + leaflets.str() + "\n";
  s += cat("Total charge: ", final_charge, "\n");
  return s;
}

BuildResult SystemBuilder::build(const BuildInput& input) const {
  Report report;
  const int normal = options.placer.normal;

  // 1. inputs
  Model solute = prepare_fragment(input.solute, FragmentRole::Solute);
  if (solute.empty())
    throw GeometryError("builder", "solute " + solute.name + " has no atoms");
  bool has_membrane = !input.membrane.empty();
  bool has_solvent = !input.solvent.empty();
  std::vector<Model> others;
  for (const Model& other : input.others)
    others.push_back(prepare_fragment(other, FragmentRole::Other));
  Model ions = prepare_fragment(input.ions, FragmentRole::Ions);

  // 2. centering; ligands and ions move with the solute
  report.solute_shift = center_model(solute, normal, options.center_normal);
  for (Model& other : others)
    translate(other, report.solute_shift);
  translate(ions, report.solute_shift);
  logger.mesg("Solute ", solute.name, " shifted by ", report.solute_shift.str());

  // 3. placement
  PlacerOptions mem_opt = options.placer;
  mem_opt.tile_normal = false;
  Box<Position> window = footprint_window(solute, mem_opt);
  std::vector<Model> models;
  models.push_back(std::move(solute));
  for (Model& other : others)
    models.push_back(std::move(other));
  if (has_membrane) {
    Model patch = prepare_fragment(input.membrane, FragmentRole::Membrane);
    PlacedPatch placed = place_patch(window, patch, mem_opt, logger);
    report.tilings.push_back(placed.plan);
    models.push_back(std::move(placed.model));
  }
  if (has_solvent) {
    PlacerOptions sol_opt = options.placer;
    sol_opt.tile_normal = true;
    Box<Position> sol_window = window;
    if (has_membrane) {
      // cover the membrane slab too
      Box<Position> mem_box = calculate_box(models.back());
      double pad = options.placer.padding;
      sol_window.minimum.at(normal) = std::min(sol_window.minimum.at(normal),
                                               mem_box.minimum.at(normal) - pad);
      sol_window.maximum.at(normal) = std::max(sol_window.maximum.at(normal),
                                               mem_box.maximum.at(normal) + pad);
    }
    Model box = prepare_fragment(input.solvent, FragmentRole::Solvent);
    PlacedPatch placed = place_patch(sol_window, box, sol_opt, logger);
    report.tilings.push_back(placed.plan);
    models.push_back(std::move(placed.model));
  }
  if (!ions.empty())
    models.push_back(std::move(ions));

  // 4. clashes, in the priority order of models
  report.clashes = resolve_clashes(models, options.clash, logger);

  // 5. enough solvent left for the ions?
  if (!options.ions.cation.empty())
    for (Model& model : models)
      if (int n = convert_cations(model, options.ions.cation))
        logger.mesg("Relabeled ", n, " cations in ", model.name, " as ",
                    options.ions.cation);
  report.ion_plan = plan_ions(models, options.ions);
  logger.mesg("Ions: ", report.ion_plan.str());
  int available = count_host_waters(models);
  if (report.ion_plan.total() > available)
    throw InsufficientSolvent("clash", "water", report.ion_plan.total(), available);

  // 6. ions
  IonPlacement placement = place_ions(models, report.ion_plan, options.ions,
                                      options.clash, logger);
  report.shortfalls = placement.shortfalls;
  if (!placement.ions.empty())
    models.push_back(std::move(placement.ions));

  // 7. merging
  Model merged = merge_fragments(models, options.numbering, report.collisions,
                                 logger);
  for (int i = 0; i != kMoleculeKindCount; ++i)
    report.counts[i] = count_residues(merged, static_cast<MoleculeKind>(i));
  double midplane = window.get_center().at(normal) + options.placer.normal_offset;
  report.leaflets = leaflet_composition(merged, normal, midplane);
  report.final_charge = net_charge(merged);
  if (options.ions.neutralize && report.shortfalls.empty() &&
      report.final_charge != options.ions.target_charge)
    fail(cat("Total charge ", report.final_charge, " differs from the target ",
             options.ions.target_charge));
  if (has_membrane)
    logger.mesg(report.leaflets.str());
  logger.mesg("Final system: ", count_atom_sites(merged), " atoms, charge ",
              report.final_charge);
  return BuildResult{std::move(merged), std::move(report)};
}

} // namespace immerse
