// Copyright 2017 Global Phasing Ltd.
//
// Data structures to keep the fragments of a simulation system:
// solute, membrane patch, solvent box, ions.

#ifndef IMMERSE_MODEL_HPP_
#define IMMERSE_MODEL_HPP_

#include <algorithm>  // for find_if
#include <string>
#include <vector>

#include "fail.hpp"      // for fail
#include "math.hpp"      // for Position, Vec3
#include "resinfo.hpp"   // for MoleculeKind

namespace immerse {

namespace impl {

template<typename T>
T* find_or_null(std::vector<T>& vec, const std::string& name) {
  auto it = std::find_if(vec.begin(), vec.end(),
                         [&name](const T& m) { return m.name == name; });
  return it != vec.end() ? &*it : nullptr;
}

} // namespace impl

inline bool is_hydrogen_symbol(const std::string& el) {
  return el.size() == 1 && (el[0] == 'H' || el[0] == 'D' ||
                            el[0] == 'h' || el[0] == 'd');
}

struct Atom {
  static const char* what() { return "Atom"; }
  std::string name;
  std::string element;  // element symbol, e.g. "C", "Na"
  int serial = 0;
  Position pos;
  float charge = 0.f;   // partial charge, as given by the reader

  Atom() = default;
  Atom(const std::string& name_, const std::string& el, const Position& p,
       float charge_=0.f)
    : name(name_), element(el), pos(p), charge(charge_) {}

  bool is_hydrogen() const { return is_hydrogen_symbol(element); }
};

struct Residue {
  static const char* what() { return "Residue"; }
  std::string name;
  int seqnum = 0;
  std::string segment;
  MoleculeKind kind = MoleculeKind::Other;
  std::vector<Atom> atoms;

  Residue() = default;
  Residue(const std::string& name_, int seqnum_, MoleculeKind kind_)
    : name(name_), seqnum(seqnum_), kind(kind_) {}

  std::vector<Atom>& children() { return atoms; }
  const std::vector<Atom>& children() const { return atoms; }

  const Atom* find_atom(const std::string& atom_name) const {
    for (const Atom& a : atoms)
      if (a.name == atom_name)
        return &a;
    return nullptr;
  }
  Atom* find_atom(const std::string& atom_name) {
    const Residue* const_this = this;
    return const_cast<Atom*>(const_this->find_atom(atom_name));
  }

  // geometric center of the atoms
  Position center() const {
    Vec3 sum;
    for (const Atom& a : atoms)
      sum += a.pos;
    return atoms.empty() ? Position() : Position(sum / (double) atoms.size());
  }

  std::string str() const { return name + " " + std::to_string(seqnum); }
};

struct Chain {
  static const char* what() { return "Chain"; }
  std::string name;
  std::vector<Residue> residues;

  explicit Chain(std::string cname) noexcept : name(cname) {}

  std::vector<Residue>& children() { return residues; }
  const std::vector<Residue>& children() const { return residues; }

  Residue* find_residue(int seqnum) {
    auto it = std::find_if(residues.begin(), residues.end(),
                           [&](const Residue& r) { return r.seqnum == seqnum; });
    return it != residues.end() ? &*it : nullptr;
  }
  const Residue* find_residue(int seqnum) const {
    return const_cast<Chain*>(this)->find_residue(seqnum);
  }

  // Returns max seqnum or the argument if the chain is empty.
  int max_seqnum(int if_empty=0) const {
    int n = if_empty;
    bool first = true;
    for (const Residue& res : residues)
      if (first || res.seqnum > n) {
        n = res.seqnum;
        first = false;
      }
    return n;
  }
};

inline std::string atom_str(const std::string& chain_name,
                            const Residue& res,
                            const std::string& atom_name) {
  std::string r = chain_name;
  r += '/';
  r += res.name;
  r += ' ';
  r += std::to_string(res.seqnum);
  r += '/';
  r += atom_name;
  return r;
}

inline std::string atom_str(const Chain& chain, const Residue& res,
                            const Atom& atom) {
  return atom_str(chain.name, res, atom.name);
}

struct const_CRA {
  const Chain* chain;
  const Residue* residue;
  const Atom* atom;
};

struct CRA {
  Chain* chain;
  Residue* residue;
  Atom* atom;
  operator const_CRA() const { return const_CRA{chain, residue, atom}; }
};

inline std::string atom_str(const const_CRA& cra) {
  if (!cra.chain || !cra.residue || !cra.atom)
    return "null";
  return atom_str(*cra.chain, *cra.residue, *cra.atom);
}

// Role of a fragment in the assembled system. The order of the values
// is the order in which fragments are merged.
enum class FragmentRole : unsigned char { Solute=0, Other, Membrane, Solvent, Ions };

inline const char* fragment_role_str(FragmentRole role) {
  static const char* names[] = { "solute", "other", "membrane", "solvent", "ions" };
  return names[static_cast<int>(role)];
}

struct Model {
  static const char* what() { return "Model"; }
  std::string name;
  FragmentRole role = FragmentRole::Other;
  // Dimensions of the periodic box of pre-equilibrated patches;
  // zeros if the fragment is not periodic.
  Vec3 cell;
  std::vector<Chain> chains;

  explicit Model(std::string mname) noexcept : name(mname) {}
  Model(std::string mname, FragmentRole role_) noexcept
    : name(mname), role(role_) {}

  // Returns the first chain with given name, or nullptr.
  Chain* find_chain(const std::string& chain_name) {
    return impl::find_or_null(chains, chain_name);
  }
  const Chain* find_chain(const std::string& chain_name) const {
    return const_cast<Model*>(this)->find_chain(chain_name);
  }

  Chain& append_chain(Chain chain) {
    chains.push_back(std::move(chain));
    return chains.back();
  }

  bool empty() const {
    for (const Chain& chain : chains)
      for (const Residue& res : chain.residues)
        if (!res.atoms.empty())
          return false;
    return true;
  }

  std::vector<Chain>& children() { return chains; }
  const std::vector<Chain>& children() const { return chains; }
};

} // namespace immerse

#endif
