// Copyright 2017-2018 Global Phasing Ltd.
//
// Calculate various properties of the model.

#ifndef IMMERSE_CALCULATE_HPP_
#define IMMERSE_CALCULATE_HPP_

#include <cmath>      // for fabs, round
#include <map>
#include <utility>   // for pair
#include <vector>
#include "model.hpp"
#include "modify.hpp" // for translate

namespace immerse {

template<class T> size_t count_atom_sites(const T& obj) {
  size_t sum = 0;
  for (const auto& child : obj.children())
    sum += count_atom_sites(child);
  return sum;
}
template<> inline size_t count_atom_sites(const Atom&) { return 1; }

inline size_t count_residues(const Model& model, MoleculeKind kind) {
  size_t n = 0;
  for (const Chain& chain : model.chains)
    for (const Residue& res : chain.residues)
      if (res.kind == kind)
        ++n;
  return n;
}

inline size_t count_residues(const Model& model) {
  size_t n = 0;
  for (const Chain& chain : model.chains)
    n += chain.residues.size();
  return n;
}

template<class T> double sum_partial_charges(const T& obj) {
  double sum = 0;
  for (const auto& child : obj.children())
    sum += sum_partial_charges(child);
  return sum;
}
template<> inline double sum_partial_charges(const Atom& atom) {
  return atom.charge;
}

/// Net charge rounded to integer. Fails if the partial charges
/// do not add up to an integer within 0.05.
template<class T> int net_charge(const T& obj) {
  double sum = sum_partial_charges(obj);
  double rounded = std::round(sum);
  if (std::fabs(rounded - sum) > 0.05)
    fail(cat("Total charge of ", sum, " is not integral within a tolerance"
             " of 0.05. Check the partial charges of the input."));
  return static_cast<int>(rounded);
}

template<class T> void expand_box(const T& obj, Box<Position>& box) {
  for (const auto& child : obj.children())
    expand_box(child, box);
}
template<> inline void expand_box(const Atom& atom, Box<Position>& box) {
  box.extend(atom.pos);
}

template<class T> Box<Position> calculate_box(const T& obj, double margin=0.) {
  Box<Position> box;
  expand_box(obj, box);
  if (!box.empty() && margin != 0.)
    box.add_margin(margin);
  return box;
}

/// The largest distance between two atoms projected on the plane
/// perpendicular to the normal axis (0=x, 1=y, 2=z).
/// Quadratic in the number of atoms, which is fine for solutes.
inline double xy_diameter(const Model& model, int normal=2) {
  std::vector<std::pair<double, double>> xy;
  int u = (normal + 1) % 3;
  int v = (normal + 2) % 3;
  for (const Chain& chain : model.chains)
    for (const Residue& res : chain.residues)
      for (const Atom& atom : res.atoms)
        xy.emplace_back(atom.pos.at(u), atom.pos.at(v));
  double max_sq = 0;
  for (size_t i = 0; i < xy.size(); ++i)
    for (size_t j = i + 1; j < xy.size(); ++j) {
      double d2 = sq(xy[i].first - xy[j].first) + sq(xy[i].second - xy[j].second);
      if (d2 > max_sq)
        max_sq = d2;
    }
  return std::sqrt(max_sq);
}

struct LeafletComposition {
  std::map<std::string, int> inner;  // below the midplane
  std::map<std::string, int> outer;
  std::string str() const {
    std::string desc = "Inner leaflet:";
    for (const auto& kv : inner)
      desc += cat(" ", kv.second, " ", kv.first);
    desc += "\nOuter leaflet:";
    for (const auto& kv : outer)
      desc += cat(" ", kv.second, " ", kv.first);
    return desc;
  }
};

/// Counts lipid residues on each side of the membrane midplane.
/// The side is decided by the residue center along the normal.
inline LeafletComposition leaflet_composition(const Model& model, int normal=2,
                                              double midplane=0.) {
  LeafletComposition comp;
  for (const Chain& chain : model.chains)
    for (const Residue& res : chain.residues)
      if (res.kind == MoleculeKind::Lipid) {
        if (res.center().at(normal) < midplane)
          ++comp.inner[res.name];
        else
          ++comp.outer[res.name];
      }
  return comp;
}

/// Moves the model so that the center of its bounding box is at the origin
/// in the membrane plane and, optionally, along the normal too.
/// Returns the applied shift.
inline Vec3 center_model(Model& model, int normal=2, bool center_normal=false) {
  Box<Position> box = calculate_box(model);
  if (box.empty())
    fail("cannot center empty model ", model.name);
  Vec3 shift = box.get_center().negated();
  if (!center_normal)
    shift.at(normal) = 0.;
  translate(model, shift);
  return shift;
}

} // namespace immerse
#endif
