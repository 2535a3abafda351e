// Copyright 2020 Global Phasing Ltd.
//
// Merging fragments into one model with unique chain names,
// unique residue numbers in each chain and atom serials 1..N.

#ifndef IMMERSE_RENUMBER_HPP_
#define IMMERSE_RENUMBER_HPP_

#include <string>
#include <vector>
#include "fail.hpp"      // for IMMERSE_DLL
#include "logger.hpp"
#include "model.hpp"
#include "util.hpp"      // for in_vector

namespace immerse {

enum class ChainNaming : unsigned char { AddNumber, Short };

struct ChainNameGenerator {
  ChainNaming how;
  std::vector<std::string> used_names;

  explicit ChainNameGenerator(ChainNaming how_) : how(how_) {}
  bool has(const std::string& name) const {
    return in_vector(name, used_names);
  }
  const std::string& added(const std::string& name) {
    used_names.push_back(name);
    return name;
  }

  std::string make_short_name(const std::string& preferred) {
    static const char symbols[] = {
      'A','B','C','D','E','F','G','H','I','J','K','L','M',
      'N','O','P','Q','R','S','T','U','V','W','X','Y','Z',
      'a','b','c','d','e','f','g','h','i','j','k','l','m',
      'n','o','p','q','r','s','t','u','v','w','x','y','z',
      '0','1','2','3','4','5','6','7','8','9'
    };
    if (!has(preferred))
      return added(preferred);
    std::string name(1, 'A');
    for (char symbol : symbols) {
      name[0] = symbol;
      if (!has(name))
        return added(name);
    }
    name += 'A';
    for (char symbol1 : symbols) {
      name[0] = symbol1;
      for (char symbol2 : symbols) {
        name[1] = symbol2;
        if (!has(name))
          return added(name);
      }
    }
    fail("run out of 1- and 2-letter chain names");
  }

  // A -> A2, A3, ...
  std::string make_name_with_numeric_postfix(const std::string& base, int n) {
    std::string name = base + std::to_string(n);
    while (has(name))
      name = base + std::to_string(++n);
    return added(name);
  }

  // returns the old name if it is still free
  std::string make_new_name(const std::string& old) {
    if (!has(old))
      return added(old);
    switch (how) {
      case ChainNaming::Short: return make_short_name(old);
      case ChainNaming::AddNumber: return make_name_with_numeric_postfix(old, 2);
    }
    unreachable();
  }
};

struct RenumberOptions {
  int base = 1;
  // keep input residue numbers of these kinds where possible
  bool preserve[kMoleculeKindCount] = {true, false, false, false, false};
  ChainNaming naming = ChainNaming::AddNumber;

  bool preserves(MoleculeKind kind) const {
    return preserve[static_cast<int>(kind)];
  }
};

/// A residue that did not keep its input chain and number.
struct NumberingCollision {
  std::string fragment;
  std::string chain;
  int seqnum;
  std::string resname;
  std::string new_chain;
  int new_seqnum;

  std::string str() const {
    return cat(fragment, ':', chain, '/', resname, ' ', seqnum, " -> ",
               new_chain, '/', resname, ' ', new_seqnum);
  }
};

/// Returns fragments in the merge order: by FragmentRole, stable
/// with respect to the input order within one role.
IMMERSE_DLL std::vector<size_t> merge_order(const std::vector<Model>& fragments);

/// Concatenates fragments into one model. Chain names used by an earlier
/// fragment are replaced (chains with the same name in one fragment are
/// joined). Kinds with preserve set keep their numbers unless a residue
/// earlier in the output chain has the same number; the other residues
/// take the free numbers from base up. Reports preserved numbers that
/// had to change and
/// residues that share the input (chain, number) with a merged residue.
IMMERSE_DLL Model merge_fragments(const std::vector<Model>& fragments,
                                  const RenumberOptions& options,
                                  std::vector<NumberingCollision>& collisions,
                                  const Logger& logger);

} // namespace immerse
#endif
