
#include "doctest.h"
#include "systems.hpp"

#include <immerse/calculate.hpp>
#include <immerse/ions.hpp>

using namespace immerse;

namespace {

Model charged_solute(int n_charges, float charge=1.f) {
  Model model("protein", FragmentRole::Solute);
  Chain& chain = model.append_chain(Chain("A"));
  for (int i = 0; i != n_charges; ++i) {
    Residue res(charge > 0 ? "LYS" : "GLU", i + 1, MoleculeKind::Solute);
    res.atoms.emplace_back("CA", "C", Position(2.0 * i, 0, 0), charge);
    chain.residues.push_back(res);
  }
  return model;
}

IonSpec spec(const std::string& species, int count) {
  IonSpec s(species);
  s.count = count;
  return s;
}

const IonTarget& target(const IonPlan& plan, const std::string& species) {
  for (const IonTarget& t : plan.targets)
    if (t.spec.species == species)
      return t;
  fail("no target " + species);
}

// 4 waters close to the solute at the origin and 8 waters 6 A apart
std::vector<Model> eight_sites_system() {
  std::vector<Model> system;
  system.push_back(charged_solute(1, 0.f));
  Model solvent("solvent", FragmentRole::Solvent);
  Chain& chain = solvent.append_chain(Chain("W"));
  const Position near[4] = {Position(3, 0, 0), Position(-3, 0, 0),
                            Position(0, 3, 0), Position(0, -3, 0)};
  for (const Position& pos : near)
    chain.residues.push_back(systems::water_at(pos, (int) chain.residues.size() + 1));
  for (int i = 0; i != 8; ++i)
    chain.residues.push_back(systems::water_at(Position(20 + 6 * i, 0, 0),
                                               (int) chain.residues.size() + 1));
  system.push_back(solvent);
  return system;
}

size_t count_resname(const Model& model, const std::string& resname) {
  size_t n = 0;
  for (const Chain& chain : model.chains)
    for (const Residue& res : chain.residues)
      if (res.name == resname)
        ++n;
  return n;
}

} // anonymous namespace

TEST_CASE("plan_ions from concentration") {
  std::vector<Model> system;
  system.push_back(charged_solute(0));
  system.push_back(systems::water_box(10, 10, 5));  // 500 waters
  IonOptions options;
  IonSpec na("Na");
  na.concentration = 0.15;
  IonSpec cl("Cl");
  cl.concentration = 0.15;
  options.species = {na, cl};
  IonPlan plan = plan_ions(system, options);
  CHECK_EQ(plan.n_water, 500);
  CHECK_EQ(plan.system_charge, 0);
  // 0.018 * 500 * 0.15 = 1.35
  CHECK_EQ(target(plan, "Na").count, 1);
  CHECK_EQ(target(plan, "Cl").count, 1);
  CHECK_EQ(plan.final_charge(), 0);
}

TEST_CASE("plan_ions neutralizes") {
  std::vector<Model> system;
  system.push_back(charged_solute(3));
  system.push_back(systems::water_box(10, 10, 10));  // 1000 waters
  IonOptions options;
  IonSpec na("Na");
  na.concentration = 0.1;
  IonSpec cl("Cl");
  cl.concentration = 0.1;
  options.species = {na, cl};
  // 0.018 * 1000 * 0.1 = 1.8 -> 2 of each; +3 excess removes both Na
  // and adds one more Cl
  IonPlan plan = plan_ions(system, options);
  CHECK_EQ(plan.system_charge, 3);
  CHECK_EQ(target(plan, "Na").count, 0);
  CHECK_EQ(target(plan, "Cl").count, 3);
  CHECK_EQ(plan.final_charge(), 0);

  options.target_charge = 1;
  plan = plan_ions(system, options);
  CHECK_EQ(target(plan, "Cl").count, 2);
  CHECK_EQ(plan.final_charge(), 1);

  options.neutralize = false;
  plan = plan_ions(system, options);
  CHECK_EQ(target(plan, "Na").count, 2);
  CHECK_EQ(target(plan, "Cl").count, 2);
  CHECK_EQ(plan.final_charge(), 3);
}

TEST_CASE("neutralization is apportioned by weight") {
  std::vector<Model> system;
  system.push_back(charged_solute(4, -1.f));
  system.push_back(systems::water_box(5, 5, 5));
  IonOptions options;
  options.species = {spec("Na", 0), spec("K", 0), spec("Cl", 0)};
  IonPlan plan = plan_ions(system, options);
  CHECK_EQ(target(plan, "Na").count, 2);
  CHECK_EQ(target(plan, "K").count, 2);
  CHECK_EQ(target(plan, "Cl").count, 0);

  options.species[0].neutralize_weight = 3;
  plan = plan_ions(system, options);
  CHECK_EQ(target(plan, "Na").count, 3);
  CHECK_EQ(target(plan, "K").count, 1);

  // a divalent cation cannot compensate odd charge
  system[0] = charged_solute(3, -1.f);
  options.species = {spec("Mg", 0)};
  CHECK_THROWS(plan_ions(system, options));
  options.species = {spec("Mg", 0), spec("Na", 0)};
  plan = plan_ions(system, options);
  CHECK_EQ(plan.final_charge(), 0);
}

TEST_CASE("plan_ions counts ions already present") {
  std::vector<Model> system;
  system.push_back(charged_solute(0));
  Model water = systems::water_box(5, 5, 2);
  set_ion(water.chains[0].residues[0], *find_ion_species("Na"));
  set_ion(water.chains[0].residues[1], *find_ion_species("Na"));
  system.push_back(water);
  IonOptions options;
  options.neutralize = false;
  options.species = {spec("Na", 5)};
  IonPlan plan = plan_ions(system, options);
  CHECK_EQ(target(plan, "Na").existing, 2);
  CHECK_EQ(target(plan, "Na").count, 3);
  CHECK_EQ(plan.system_charge, 2);
  options.species = {spec("Na", 5), spec("sod", 1)};
  CHECK_THROWS(plan_ions(system, options));
  options.species = {spec("Xx", 1)};
  CHECK_THROWS(plan_ions(system, options));
}

TEST_CASE("place_ions shortfall with two cations") {
  std::vector<Model> system = eight_sites_system();
  IonOptions options;
  options.neutralize = false;
  options.species = {spec("Na", 5), spec("K", 5)};
  IonPlan plan = plan_ions(system, options);
  REQUIRE_EQ(plan.total(), 10);
  try {
    place_ions(system, plan, options, ClashOptions(), Logger());
    FAIL("IonPlacementShortfall expected");
  } catch (const IonPlacementShortfall& e) {
    CHECK_EQ(e.total_unplaced(), 2);
    REQUIRE_EQ(e.shortfalls.size(), 2);
    CHECK_EQ(e.shortfalls[0].species, "Na");
    CHECK_EQ(e.shortfalls[0].unplaced, 1);
    CHECK_EQ(e.shortfalls[1].species, "K");
    CHECK_EQ(e.shortfalls[1].unplaced, 1);
    CHECK_EQ(e.component, "ions");
  }
  // nothing was changed
  CHECK_EQ(count_residues(system[1]), 12);

  options.best_effort = true;
  std::vector<std::string> messages;
  Logger logger;
  logger.callback = [&](const std::string& s) { messages.push_back(s); };
  IonPlacement result = place_ions(system, plan, options, ClashOptions(), logger);
  CHECK_EQ(result.shortfalls.size(), 2);
  CHECK_EQ(count_resname(result.ions, "SOD"), 4);
  CHECK_EQ(count_resname(result.ions, "POT"), 4);
  CHECK_EQ(count_residues(system[1]), 4);
  CHECK(result.ions.role == FragmentRole::Ions);
  CHECK_EQ(result.ions.chains[0].name, "N");
  CHECK_EQ(result.ions.chains[0].residues[0].segment, "ION");
  CHECK(starts_with(messages.at(0), "Warning: "));
  // the 4 waters near the solute are left
  for (const Residue& res : system[1].chains[0].residues)
    CHECK(res.atoms[0].pos.length() < 4);
}

TEST_CASE("place_ions keeps the distances") {
  std::vector<Model> system;
  system.push_back(systems::solute_block(Vec3(6, 6, 6)));
  Model water = systems::water_box(8, 8, 8);
  translate(water, Vec3(-12.4, -12.4, -12.4));
  system.push_back(water);
  IonOptions options;
  options.neutralize = false;
  options.species = {spec("Na", 6), spec("K", 6), spec("Cl", 12)};
  options.species[2].min_dist_ions = 7.;
  IonPlan plan = plan_ions(system, options);
  IonPlacement result = place_ions(system, plan, options, ClashOptions(), Logger());
  CHECK(result.shortfalls.empty());
  CHECK_EQ(count_residues(result.ions), 24);
  CHECK_EQ(count_resname(result.ions, "CLA"), 12);
  NeighborSearch solute_ns(system[0], 5.0);
  solute_ns.populate();
  const std::vector<Residue>& ions = result.ions.chains[0].residues;
  for (size_t i = 0; i != ions.size(); ++i) {
    const Position& pos = ions[i].atoms[0].pos;
    CHECK(!solute_ns.any_within(pos, 5.0));
    for (size_t j = 0; j != i; ++j) {
      double limit = (ions[i].name == "CLA" || ions[j].name == "CLA") ? 7. : 5.;
      CHECK(pos.dist(ions[j].atoms[0].pos) >= limit);
    }
  }
  // waters were converted in place
  CHECK_EQ(count_residues(system[1]) + 24, 512);
}

TEST_CASE("place_ions uses the ion-lipid clash distance") {
  Model membrane("membrane", FragmentRole::Membrane);
  Residue lipid("POPC", 1, MoleculeKind::Lipid);
  lipid.atoms.emplace_back("P", "P", Position(0, 0, 0));
  membrane.append_chain(Chain("L")).residues.push_back(lipid);
  Model solvent("solvent", FragmentRole::Solvent);
  Chain& chain = solvent.append_chain(Chain("W"));
  chain.residues.push_back(systems::water_at(Position(3, 0, 0), 1));
  chain.residues.push_back(systems::water_at(Position(10, 0, 0), 2));
  IonOptions options;
  options.neutralize = false;
  options.species = {spec("Na", 1)};

  ClashOptions clash;
  std::vector<Model> system = {membrane, solvent};
  IonPlan plan = plan_ions(system, options);
  IonPlacement result = place_ions(system, plan, options, clash, Logger());
  REQUIRE_EQ(count_residues(result.ions), 1);
  CHECK(result.ions.chains[0].residues[0].atoms[0].pos.approx(Position(3, 0, 0), 1e-9));

  clash.set_pair(MoleculeKind::Ion, MoleculeKind::Lipid, 4.0);
  system = {membrane, solvent};
  // water at 3 A from the lipid is accepted as water
  CHECK(resolve_clashes(system, clash, Logger()).empty());
  result = place_ions(system, plan, options, clash, Logger());
  REQUIRE_EQ(count_residues(result.ions), 1);
  CHECK(result.ions.chains[0].residues[0].atoms[0].pos.approx(Position(10, 0, 0), 1e-9));
  system.push_back(result.ions);
  CHECK(find_clashes(system, clash).empty());
}

TEST_CASE("place_ions is reproducible") {
  IonOptions options;
  options.neutralize = false;
  options.species = {spec("Na", 10), spec("Cl", 10)};
  options.shuffle = true;
  options.seed = 7;
  auto run = [&](std::uint32_t seed) {
    options.seed = seed;
    std::vector<Model> system;
    system.push_back(systems::solute_block(Vec3(4, 4, 4)));
    system.push_back(systems::water_box(10, 10, 10));
    IonPlan plan = plan_ions(system, options);
    IonPlacement result = place_ions(system, plan, options, ClashOptions(), Logger());
    return systems::dump(result.ions);
  };
  std::string first = run(7);
  CHECK_EQ(run(7), first);
  CHECK(run(8) != first);
  options.shuffle = false;
  std::string ordered = run(7);
  CHECK_EQ(run(8), ordered);
}

TEST_CASE("place_ions shuffle depends only on mt19937") {
  Model solvent("solvent", FragmentRole::Solvent);
  Chain& chain = solvent.append_chain(Chain("W"));
  chain.residues.push_back(systems::water_at(Position(0, 0, 0), 1));
  chain.residues.push_back(systems::water_at(Position(10, 0, 0), 2));
  IonOptions options;
  options.neutralize = false;
  options.species = {spec("Na", 1)};
  options.shuffle = true;
  // the first output of mt19937(5489) is 3499211612, even: sites swapped
  options.seed = 5489;
  std::vector<Model> system(1, solvent);
  IonPlan plan = plan_ions(system, options);
  IonPlacement result = place_ions(system, plan, options, ClashOptions(), Logger());
  REQUIRE_EQ(count_residues(result.ions), 1);
  CHECK(result.ions.chains[0].residues[0].atoms[0].pos.approx(Position(10, 0, 0), 1e-9));
}

TEST_CASE("place_ions InsufficientSolvent") {
  std::vector<Model> system = eight_sites_system();
  IonOptions options;
  options.neutralize = false;
  options.species = {spec("Na", 10), spec("Cl", 10)};
  IonPlan plan = plan_ions(system, options);
  try {
    place_ions(system, plan, options, ClashOptions(), Logger());
    FAIL("InsufficientSolvent expected");
  } catch (const InsufficientSolvent& e) {
    CHECK_EQ(e.kind, "water");
    CHECK_EQ(e.needed, 20);
    CHECK_EQ(e.available, 12);
  }
}

TEST_CASE("convert_cations") {
  Model model = systems::water_box(4, 1, 1);
  std::vector<Residue>& res = model.chains[0].residues;
  set_ion(res[0], *find_ion_species("Na"));
  set_ion(res[1], *find_ion_species("K"));
  set_ion(res[2], *find_ion_species("Cl"));
  CHECK_EQ(res[0].atoms.size(), 1);
  CHECK_EQ(res[0].atoms[0].element, "Na");
  CHECK_EQ(res[0].atoms[0].charge, 1.f);
  CHECK_EQ(convert_cations(model, "K"), 1);
  CHECK_EQ(res[0].name, "POT");
  CHECK(res[0].find_atom("K") != nullptr);
  CHECK_EQ(res[2].name, "CLA");
  CHECK_EQ(res[3].name, "HOH");
  CHECK_THROWS(convert_cations(model, "Cl"));
  CHECK_THROWS(convert_cations(model, "Mg"));
}
