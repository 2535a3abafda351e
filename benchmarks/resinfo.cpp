// Copyright 2017 Global Phasing Ltd.

// Microbenchmark of immerse::find_tabulated_kind() and find_ion_species().
// Requires the google/benchmark library. It can be built manually:
// c++ -Wall -O2 -I../include -I$GB/include resinfo.cpp ../src/resinfo.cpp $GB/src/libbenchmark.a -pthread

#include "immerse/resinfo.hpp"
#include <benchmark/benchmark.h>
#include <stdlib.h>               // for rand

static const std::string residue_names[10] =
    { "POPC", "HOH", "HOH", "TIP3", "CHL1", "SOD", "HOH", "CLA", "ALA", "POPE" };

static void find_tabulated_kind_x10(benchmark::State& state) {
  std::string names[10];
  for (int i = 0; i != 10; ++i)
    names[i] = rand() % 1000 == 0 ? "GLN" : residue_names[i];
  for (auto _ : state) {
    int n = 0;
    for (int i = 0; i != 10; ++i)
      n += (int) immerse::find_tabulated_kind(names[i]);
    benchmark::DoNotOptimize(n);
  }
}

static void find_ion_species_x10(benchmark::State& state) {
  static const std::string names[10] =
    { "Na", "SOD", "Cl", "CLA", "K", "POT", "Mg", "Ca", "CAL", "Xe" };
  for (auto _ : state) {
    int charge = 0;
    for (int i = 0; i != 10; ++i)
      if (const immerse::IonSpecies* sp = immerse::find_ion_species(names[i]))
        charge += sp->charge;
    benchmark::DoNotOptimize(charge);
  }
}

BENCHMARK(find_tabulated_kind_x10);
BENCHMARK(find_ion_species_x10);
BENCHMARK_MAIN();
