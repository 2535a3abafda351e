// Copyright 2021 Global Phasing Ltd.

// Microbenchmark of immerse::NeighborSearch and immerse::resolve_clashes().
// Requires the google/benchmark library. It can be built manually:
// c++ -Wall -O2 -I../include -I$GB/include clash.cpp ../src/clash.cpp ../src/resinfo.cpp $GB/src/libbenchmark.a -pthread

#include "immerse/clash.hpp"
#include "immerse/neighbor.hpp"
#include <benchmark/benchmark.h>

using immerse::Chain;
using immerse::FragmentRole;
using immerse::Model;
using immerse::MoleculeKind;
using immerse::Position;
using immerse::Residue;

// n^3 three-atom waters, 3.1 A apart
static Model make_waters(int n, double shift) {
  Model model("solvent", FragmentRole::Solvent);
  Chain& chain = model.append_chain(Chain("W"));
  for (int k = 0; k != n; ++k)
    for (int j = 0; j != n; ++j)
      for (int i = 0; i != n; ++i) {
        Residue res("HOH", (int) chain.residues.size() + 1, MoleculeKind::Water);
        Position o(i * 3.1 + shift, j * 3.1 + shift, k * 3.1 + shift);
        res.atoms.emplace_back("OH2", "O", o);
        res.atoms.emplace_back("H1", "H", Position(o.x + 0.96, o.y, o.z));
        res.atoms.emplace_back("H2", "H", Position(o.x - 0.24, o.y + 0.93, o.z));
        chain.residues.push_back(res);
      }
  return model;
}

static void neighbor_search_populate(benchmark::State& state) {
  Model model = make_waters(20, 0.);
  for (auto _ : state) {
    immerse::NeighborSearch ns(model, 5.0);
    ns.populate();
    benchmark::DoNotOptimize(ns.size());
  }
}

static void neighbor_search_find_atoms(benchmark::State& state) {
  Model model = make_waters(20, 0.);
  immerse::NeighborSearch ns(model, 5.0);
  ns.populate();
  Position center(31, 31, 31);
  for (auto _ : state)
    benchmark::DoNotOptimize(ns.find_atoms(center, 5.0).size());
}

static void resolve_clashes_two_boxes(benchmark::State& state) {
  const int n = (int) state.range(0);
  std::vector<Model> input;
  input.push_back(make_waters(n, 0.));
  input.push_back(make_waters(n, 1.55));
  input[0].role = FragmentRole::Other;
  immerse::ClashOptions options;
  immerse::Logger logger;
  for (auto _ : state) {
    std::vector<Model> models = input;
    benchmark::DoNotOptimize(resolve_clashes(models, options, logger).size());
  }
}

BENCHMARK(neighbor_search_populate);
BENCHMARK(neighbor_search_find_atoms);
BENCHMARK(resolve_clashes_two_boxes)->Arg(10)->Arg(20);
BENCHMARK_MAIN();
