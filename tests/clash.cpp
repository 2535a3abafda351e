
#include "doctest.h"
#include "systems.hpp"

#include <immerse/calculate.hpp>
#include <immerse/clash.hpp>

using namespace immerse;

static Model single_residue_model(const std::string& name, FragmentRole role,
                                  const std::string& resname, MoleculeKind kind,
                                  std::vector<Position> positions) {
  Model model(name, role);
  Chain& chain = model.append_chain(Chain("A"));
  chain.residues.emplace_back(resname, 1, kind);
  for (size_t i = 0; i != positions.size(); ++i)
    chain.residues[0].atoms.emplace_back("C" + std::to_string(i + 1), "C",
                                         positions[i]);
  return model;
}

static Model waters(const std::vector<Position>& positions) {
  Model model("solvent", FragmentRole::Solvent);
  Chain& chain = model.append_chain(Chain("W"));
  for (const Position& pos : positions)
    chain.residues.push_back(systems::water_at(pos, (int) chain.residues.size() + 1));
  return model;
}

TEST_CASE("resolve_clashes removes whole residues") {
  std::vector<Model> models;
  models.push_back(single_residue_model("protein", FragmentRole::Solute, "ALA",
                                        MoleculeKind::Solute,
                                        {Position(0, 0, 0), Position(1.5, 0, 0)}));
  models.push_back(waters({Position(3.5, 0, 0), Position(10, 0, 0),
                           Position(0, 2, 0)}));
  Logger logger;
  std::vector<ClashRecord> records = resolve_clashes(models, ClashOptions(), logger);
  REQUIRE_EQ(records.size(), 2);
  CHECK_EQ(count_residues(models[1]), 1);
  CHECK_EQ(models[1].chains[0].residues[0].seqnum, 2);
  CHECK_EQ(records[0].seqnum, 1);
  CHECK_EQ(records[0].atom_b, "A/ALA 1/C2");
  CHECK_EQ(records[0].distance, doctest::Approx(2.0));
  CHECK_EQ(records[1].atom_b, "A/ALA 1/C1");
  CHECK(!records[0].kept);
  // the solute is not touched
  CHECK_EQ(count_atom_sites(models[0]), 2);
}

TEST_CASE("resolve_clashes works tier by tier") {
  std::vector<Model> models;
  models.push_back(single_residue_model("protein", FragmentRole::Solute, "ALA",
                                        MoleculeKind::Solute, {Position(1, 0, 0)}));
  // 1 A apart, but in the same model
  models.push_back(waters({Position(10, 0, 0), Position(11, 0, 0),
                           Position(3, 0, 0)}));
  // would clash only with the water removed from the previous model
  models.push_back(waters({Position(5, 0, 0)}));
  std::vector<ClashRecord> records = resolve_clashes(models, ClashOptions(), Logger());
  CHECK_EQ(records.size(), 1);
  CHECK_EQ(count_residues(models[1]), 2);
  CHECK_EQ(count_residues(models[2]), 1);
}

TEST_CASE("ClashOptions kind-pair distance") {
  ClashOptions options;
  options.set_pair(MoleculeKind::Lipid, MoleculeKind::Water, 4.0);
  CHECK_EQ(options.distance(MoleculeKind::Water, MoleculeKind::Lipid), 4.0);
  CHECK_EQ(options.distance(MoleculeKind::Water, MoleculeKind::Solute), 2.5);
  CHECK_EQ(options.max_distance(), 4.0);

  auto run = [](const ClashOptions& opt) {
    std::vector<Model> models;
    models.push_back(single_residue_model("membrane", FragmentRole::Membrane,
                                          "POPC", MoleculeKind::Lipid,
                                          {Position(0, 0, 0)}));
    models.push_back(waters({Position(3, 0, 0), Position(0, 6, 0)}));
    resolve_clashes(models, opt, Logger());
    return count_residues(models[1]);
  };
  CHECK_EQ(run(ClashOptions()), 2);
  CHECK_EQ(run(options), 1);
}

TEST_CASE("resolve_clashes keeps solute residues") {
  std::vector<Model> models;
  models.push_back(single_residue_model("protein", FragmentRole::Solute, "ALA",
                                        MoleculeKind::Solute, {Position(0, 0, 0)}));
  models.push_back(single_residue_model("peptide", FragmentRole::Other, "GLY",
                                        MoleculeKind::Solute, {Position(1, 0, 0)}));
  std::vector<std::string> messages;
  Logger logger;
  logger.callback = [&](const std::string& s) { messages.push_back(s); };
  std::vector<ClashRecord> records = resolve_clashes(models, ClashOptions(), logger);
  REQUIRE_EQ(records.size(), 1);
  CHECK(records[0].kept);
  CHECK_EQ(count_residues(models[1]), 1);
  REQUIRE_EQ(messages.size(), 1);
  CHECK(starts_with(messages[0], "Warning: "));
}

TEST_CASE("resolve_clashes without hydrogens") {
  auto run = [](bool include_h) {
    std::vector<Model> models;
    models.push_back(single_residue_model("protein", FragmentRole::Solute, "ALA",
                                          MoleculeKind::Solute, {Position(0, 0, 0)}));
    Model solvent("solvent", FragmentRole::Solvent);
    Chain& chain = solvent.append_chain(Chain("W"));
    chain.residues.push_back(systems::water_at(Position(3, 0, 0), 1));
    chain.residues[0].atoms.emplace_back("H1", "H", Position(2, 0, 0));
    models.push_back(solvent);
    ClashOptions options;
    options.include_h = include_h;
    resolve_clashes(models, options, Logger());
    return count_residues(models[1]);
  };
  CHECK_EQ(run(true), 0);
  CHECK_EQ(run(false), 1);
}

TEST_CASE("find_clashes") {
  std::vector<Model> models;
  models.push_back(systems::water_box(3, 3, 3));
  models.push_back(systems::water_box(2, 2, 2));
  models[1].name = "shifted";
  translate(models[1], Vec3(1, 0, 0));
  std::vector<ClashRecord> records = find_clashes(models, ClashOptions());
  CHECK_EQ(records.size(), 8);
  CHECK_EQ(records[0].model, "shifted");
  CHECK_EQ(records[0].distance, doctest::Approx(1.0));
  // nothing removed
  CHECK_EQ(count_residues(models[1]), 8);
  translate(models[1], Vec3(20, 0, 0));
  CHECK(find_clashes(models, ClashOptions()).empty());
}
