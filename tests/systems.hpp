// Synthetic fragments for tests: a solute block, a lipid bilayer patch
// and a water box, all heavy atoms only, with spacings that keep atoms
// of different residues at least 2.5 A apart within each fragment.

#ifndef IMMERSE_TESTS_SYSTEMS_HPP_
#define IMMERSE_TESTS_SYSTEMS_HPP_

#include <cmath>     // for floor
#include <cstdio>    // for snprintf
#include <set>
#include <string>
#include <utility>   // for pair
#include <immerse/model.hpp>
#include <immerse/neighbor.hpp>

namespace systems {

using immerse::Atom;
using immerse::Chain;
using immerse::FragmentRole;
using immerse::Model;
using immerse::MoleculeKind;
using immerse::Position;
using immerse::Residue;
using immerse::Vec3;

// one-atom residues on a grid filling the box of the given size,
// centered at the origin
inline Model solute_block(const Vec3& size, double spacing=2.0) {
  Model model("solute", FragmentRole::Solute);
  Chain& chain = model.append_chain(Chain("A"));
  int n[3];
  for (int i = 0; i != 3; ++i)
    n[i] = (int) std::floor(size.at(i) / spacing + 1e-9) + 1;
  for (int k = 0; k != n[2]; ++k)
    for (int j = 0; j != n[1]; ++j)
      for (int i = 0; i != n[0]; ++i) {
        Residue res("ALA", (int) chain.residues.size() + 1, MoleculeKind::Solute);
        res.atoms.emplace_back("CA", "C", Position(i * spacing - size.x / 2,
                                                   j * spacing - size.y / 2,
                                                   k * spacing - size.z / 2));
        chain.residues.push_back(res);
      }
  return model;
}

// n x n lipids in each leaflet, head groups at z = +-20
inline Model lipid_patch(int n, double spacing=8.0) {
  Model model("membrane", FragmentRole::Membrane);
  model.cell = Vec3(n * spacing, n * spacing, 50.);
  Chain& chain = model.append_chain(Chain("L"));
  for (int leaflet = -1; leaflet <= 1; leaflet += 2)
    for (int j = 0; j != n; ++j)
      for (int i = 0; i != n; ++i) {
        Residue res("POPC", (int) chain.residues.size() + 1, MoleculeKind::Lipid);
        double x = (i + 0.5) * spacing;
        double y = (j + 0.5) * spacing;
        res.atoms.emplace_back("P", "P", Position(x, y, leaflet * 20.));
        res.atoms.emplace_back("C2", "C", Position(x, y, leaflet * 14.));
        res.atoms.emplace_back("C3", "C", Position(x, y, leaflet * 8.));
        chain.residues.push_back(res);
      }
  return model;
}

// waters (oxygen only) on a grid, periodic with cell n * spacing
inline Model water_box(int nx, int ny, int nz, double spacing=3.1) {
  Model model("solvent", FragmentRole::Solvent);
  model.cell = Vec3(nx * spacing, ny * spacing, nz * spacing);
  Chain& chain = model.append_chain(Chain("W"));
  for (int k = 0; k != nz; ++k)
    for (int j = 0; j != ny; ++j)
      for (int i = 0; i != nx; ++i) {
        Residue res("HOH", (int) chain.residues.size() + 1, MoleculeKind::Water);
        res.atoms.emplace_back("OH2", "O", Position((i + 0.5) * spacing,
                                                    (j + 0.5) * spacing,
                                                    (k + 0.5) * spacing));
        chain.residues.push_back(res);
      }
  return model;
}

inline Residue water_at(const Position& pos, int seqnum) {
  Residue res("HOH", seqnum, MoleculeKind::Water);
  res.atoms.emplace_back("OH2", "O", pos);
  return res;
}

// text with everything that the writers would see
inline std::string dump(const Model& model) {
  std::string out;
  char buf[160];
  for (const Chain& chain : model.chains)
    for (const Residue& res : chain.residues)
      for (const Atom& atom : res.atoms) {
        std::snprintf(buf, sizeof(buf), "%d %s %s %d %s %s %.3f %.3f %.3f %.2f\n",
                      atom.serial, chain.name.c_str(), res.name.c_str(),
                      res.seqnum, atom.name.c_str(), atom.element.c_str(),
                      atom.pos.x, atom.pos.y, atom.pos.z, atom.charge);
        out += buf;
      }
  return out;
}

inline bool has_unique_numbering(const Model& model) {
  std::set<std::pair<std::string, int>> seen;
  for (const Chain& chain : model.chains)
    for (const Residue& res : chain.residues)
      if (!seen.insert(std::make_pair(chain.name, res.seqnum)).second)
        return false;
  return true;
}

inline bool has_contiguous_serials(const Model& model) {
  int expected = 0;
  for (const Chain& chain : model.chains)
    for (const Residue& res : chain.residues)
      for (const Atom& atom : res.atoms)
        if (atom.serial != ++expected)
          return false;
  return true;
}

// the closest distance between atoms of different residues,
// not counting pairs of solute residues; searched up to max_dist
inline double closest_contact(const Model& model, double max_dist) {
  immerse::NeighborSearch ns(model, max_dist);
  ns.populate();
  double min_sq = max_dist * max_dist;
  for (const Chain& chain : model.chains)
    for (const Residue& res : chain.residues)
      for (const Atom& atom : res.atoms)
        ns.for_each(atom.pos, max_dist, [&](immerse::NeighborSearch::Mark& m,
                                             double dist_sq) {
            immerse::const_CRA cra = m.to_cra(model);
            if (cra.residue == &res)
              return;
            if (res.kind == MoleculeKind::Solute &&
                cra.residue->kind == MoleculeKind::Solute)
              return;
            if (dist_sq < min_sq)
              min_sq = dist_sq;
        });
  return std::sqrt(min_sq);
}

} // namespace systems
#endif
