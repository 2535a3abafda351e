// Copyright 2017-2021 Global Phasing Ltd.
//
// Modify various properties of the model.
// Coordinate changes are made in place; filtering returns a new Model.

#ifndef IMMERSE_MODIFY_HPP_
#define IMMERSE_MODIFY_HPP_

#include "model.hpp"
#include "util.hpp"      // for vector_remove_if

namespace immerse {

/// apply Transform to atom positions
template<class T> void transform_pos(T& obj, const Transform& tr) {
  for (auto& child : obj.children())
    transform_pos(child, tr);
}
template<> inline void transform_pos(Atom& atom, const Transform& tr) {
  atom.pos = Position(tr.apply(atom.pos));
}

/// rigid offset applied to every atom
template<class T> void translate(T& obj, const Vec3& shift) {
  for (auto& child : obj.children())
    translate(child, shift);
}
template<> inline void translate(Atom& atom, const Vec3& shift) {
  atom.pos += shift;
}

/// Remove residues without atoms and chains without residues.
inline void remove_empty_children(Chain& chain) {
  vector_remove_if(chain.residues, [](const Residue& r) { return r.atoms.empty(); });
}
inline void remove_empty_children(Model& model) {
  for (Chain& chain : model.chains)
    remove_empty_children(chain);
  vector_remove_if(model.chains, [](const Chain& c) { return c.residues.empty(); });
}

/// Removes (in place) residues for which the predicate returns true.
template<typename Pred>
size_t remove_residues_if(Model& model, Pred&& pred) {
  size_t n = 0;
  for (Chain& chain : model.chains) {
    size_t before = chain.residues.size();
    vector_remove_if(chain.residues, pred);
    n += before - chain.residues.size();
  }
  remove_empty_children(model);
  return n;
}

/// Returns a copy of the model with only the residues satisfying
/// the predicate. Chains left empty are not copied.
template<typename Pred>
Model filter_residues(const Model& model, Pred&& pred) {
  Model out(model.name, model.role);
  out.cell = model.cell;
  for (const Chain& chain : model.chains) {
    Chain new_chain(chain.name);
    for (const Residue& res : chain.residues)
      if (!res.atoms.empty() && pred(res))
        new_chain.residues.push_back(res);
    if (!new_chain.residues.empty())
      out.chains.push_back(std::move(new_chain));
  }
  return out;
}

/// set atom serial numbers to 1, 2, ...
inline void assign_serial_numbers(Model& model) {
  int serial = 0;
  for (Chain& chain : model.chains)
    for (Residue& res : chain.residues)
      for (Atom& atom : res.atoms)
        atom.serial = ++serial;
}

/// Tags residues that have kind Other with MoleculeKind from the tabulated
/// residue names. Residues of a solute fragment are all tagged Solute,
/// except waters and ions that come with it (crystal waters, bound ions).
inline void assign_molecule_kinds(Model& model) {
  for (Chain& chain : model.chains)
    for (Residue& res : chain.residues) {
      if (res.kind != MoleculeKind::Other)
        continue;
      MoleculeKind kind = find_tabulated_kind(res.name);
      if (model.role == FragmentRole::Solute &&
          kind != MoleculeKind::Water && kind != MoleculeKind::Ion)
        kind = MoleculeKind::Solute;
      res.kind = kind;
    }
}

} // namespace immerse
#endif
