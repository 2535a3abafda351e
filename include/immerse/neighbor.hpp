// Copyright 2018 Global Phasing Ltd.
//
// Cell-linked lists method for atom searching (a.k.a. grid search, binning,
// bucketing, cell technique for neighbor search, etc).
// Non-periodic: points outside the indexed box go to the border cells.

#ifndef IMMERSE_NEIGHBOR_HPP_
#define IMMERSE_NEIGHBOR_HPP_

#include <algorithm>  // for min, max
#include <cmath>      // for INFINITY, sqrt, floor
#include <utility>    // for pair
#include <vector>

#include "fail.hpp"      // for fail
#include "model.hpp"
#include "calculate.hpp" // for calculate_box

namespace immerse {

struct NeighborSearch {

  struct Mark {
    Position pos;
    MoleculeKind kind;
    // index of the model in a multi-model index, or of any other group
    // of points (IonPlacer stores the species index here)
    int model_idx;
    int chain_idx;
    int residue_idx;
    int atom_idx;

    Mark(const Position& p, MoleculeKind k, int m, int ch, int res, int atom)
    : pos(p), kind(k), model_idx(m), chain_idx(ch), residue_idx(res),
      atom_idx(atom) {}

    CRA to_cra(Model& mdl) const {
      Chain& c = mdl.chains.at(chain_idx);
      Residue& r = c.residues.at(residue_idx);
      Atom& a = r.atoms.at(atom_idx);
      return {&c, &r, &a};
    }
    const_CRA to_cra(const Model& mdl) const {
      const Chain& c = mdl.chains.at(chain_idx);
      const Residue& r = c.residues.at(residue_idx);
      const Atom& a = r.atoms.at(atom_idx);
      return {&c, &r, &a};
    }
  };

  // grid cells can be larger than this, but never smaller
  static constexpr int max_cells_per_dim = 256;

  std::vector<std::vector<Mark>> cells;
  Box<Position> box;
  int nu = 1, nv = 1, nw = 1;
  double radius_specified = 0.;
  const Model* model = nullptr;
  bool include_h = true;

  NeighborSearch() = default;
  NeighborSearch(const Model& model_, double radius) {
    model = &model_;
    radius_specified = radius;
    set_grid(calculate_box(model_));
  }
  NeighborSearch(const Box<Position>& bbox, double radius) {
    radius_specified = radius;
    set_grid(bbox);
  }

  NeighborSearch& populate(bool include_h_=true);
  void add_model(const Model& mdl, int model_idx);
  void add_residue(const Residue& res, int model_idx, int n_ch, int n_res);
  void add_point(const Position& pos, MoleculeKind kind,
                 int model_idx, int n_ch, int n_res, int n_atom) {
    cells[cell_index(pos)].emplace_back(pos, kind, model_idx, n_ch, n_res, n_atom);
  }

  // Removes all marks, keeping the grid. Used to rebuild the index.
  void clear() {
    for (std::vector<Mark>& cell : cells)
      cell.clear();
  }

  size_t size() const {
    size_t n = 0;
    for (const std::vector<Mark>& cell : cells)
      n += cell.size();
    return n;
  }

  template<typename Func>
  void for_each_cell(const Position& pos, const Func& func, int k=1);

  template<typename Func>
  void for_each(const Position& pos, double radius, const Func& func) {
    if (radius <= 0)
      return;
    for_each_cell(pos, [&](std::vector<Mark>& marks) {
        for (Mark& m : marks) {
          double dist_sq = m.pos.dist_sq(pos);
          if (dist_sq < sq(radius))
            func(m, dist_sq);
        }
    }, sufficient_k(radius));
  }

  int sufficient_k(double r) const {
    // .00001 is added to account for possible numeric error in r
    return r <= min_cell_size_ ? 1 : int(r / min_cell_size_ + 1.00001);
  }

  // with radius==0 it uses radius_specified
  std::vector<Mark*> find_atoms(const Position& pos, double radius=0,
                                double min_dist=0) {
    if (radius == 0)
      radius = radius_specified;
    std::vector<Mark*> out;
    for_each(pos, radius, [&](Mark& a, double dist_sq) {
        if (dist_sq >= sq(min_dist))
          out.push_back(&a);
    });
    return out;
  }

  bool any_within(const Position& pos, double radius=0) {
    if (radius == 0)
      radius = radius_specified;
    bool found = false;
    int k = sufficient_k(radius);
    for_each_cell(pos, [&](std::vector<Mark>& marks) {
        if (!found)
          for (const Mark& m : marks)
            if (m.pos.dist_sq(pos) < sq(radius)) {
              found = true;
              break;
            }
    }, k);
    return found;
  }

  std::pair<Mark*, double>
  find_nearest_atom_within_k(const Position& pos, int k, double radius) {
    Mark* mark = nullptr;
    double nearest_dist_sq = radius * radius;
    for_each_cell(pos, [&](std::vector<Mark>& marks) {
        for (Mark& m : marks) {
          double dist_sq = m.pos.dist_sq(pos);
          if (dist_sq < nearest_dist_sq) {
            mark = &m;
            nearest_dist_sq = dist_sq;
          }
        }
    }, k);
    return {mark, nearest_dist_sq};
  }

  Mark* find_nearest_atom(const Position& pos, double radius=INFINITY) {
    int max_k = std::max(std::max(std::max(nu, nv), nw), 1);
    for (int k = 1; ; k *= 2) {
      auto result = find_nearest_atom_within_k(pos, k, radius);
      // marks outside of the k-neighbourhood are further than k cells
      if (result.first != nullptr && result.second < sq(k * min_cell_size_))
        return result.first;
      if (k >= max_k)  // all cells were searched
        return result.first;
      if (result.first != nullptr) {
        // We found an atom, but because it was further away than k cells,
        // so now it's sufficient to search within dist:
        double dist = std::sqrt(result.second);
        int k2 = std::min(sufficient_k(dist), max_k);
        return find_nearest_atom_within_k(pos, k2, radius).first;
      }
    }
  }

private:
  double min_cell_size_ = 1.;
  Vec3 inv_cell_;

  void set_grid(Box<Position> bbox) {
    if (radius_specified <= 0)
      fail("NeighborSearch: radius must be positive");
    if (bbox.empty())
      bbox.extend(Position(0, 0, 0));
    bbox.add_margin(0.01);
    box = bbox;
    Position size = box.get_size();
    double inv_radius = 1 / radius_specified;
    const int max_n = max_cells_per_dim;
    auto ncells = [&](double length) {
      return std::min(std::max(int(length * inv_radius), 1), max_n);
    };
    nu = ncells(size.x);
    nv = ncells(size.y);
    nw = ncells(size.z);
    inv_cell_ = Vec3(nu / size.x, nv / size.y, nw / size.z);
    min_cell_size_ = std::min(std::min(size.x / nu, size.y / nv), size.z / nw);
    cells.clear();
    cells.resize((size_t)nu * nv * nw);
  }

  // clamping keeps cell distances non-expanding, so searches stay exact
  void cell_coords(const Position& pos, int& u, int& v, int& w) const {
    auto clamp = [](double d, int n) {
      if (!(d > 0))  // also catches NaN
        return 0;
      return d >= n ? n - 1 : int(d);
    };
    u = clamp((pos.x - box.minimum.x) * inv_cell_.x, nu);
    v = clamp((pos.y - box.minimum.y) * inv_cell_.y, nv);
    w = clamp((pos.z - box.minimum.z) * inv_cell_.z, nw);
  }

  size_t cell_index(const Position& pos) const {
    int u, v, w;
    cell_coords(pos, u, v, w);
    return size_t(w * nv + v) * nu + u;
  }
};

inline NeighborSearch& NeighborSearch::populate(bool include_h_) {
  if (!model)
    fail("NeighborSearch not initialized");
  include_h = include_h_;
  add_model(*model, 0);
  return *this;
}

inline void NeighborSearch::add_model(const Model& mdl, int model_idx) {
  for (int n_ch = 0; n_ch != (int) mdl.chains.size(); ++n_ch) {
    const Chain& chain = mdl.chains[n_ch];
    for (int n_res = 0; n_res != (int) chain.residues.size(); ++n_res)
      add_residue(chain.residues[n_res], model_idx, n_ch, n_res);
  }
}

inline void NeighborSearch::add_residue(const Residue& res, int model_idx,
                                        int n_ch, int n_res) {
  for (int n_atom = 0; n_atom != (int) res.atoms.size(); ++n_atom) {
    const Atom& atom = res.atoms[n_atom];
    if (include_h || !atom.is_hydrogen())
      add_point(atom.pos, res.kind, model_idx, n_ch, n_res, n_atom);
  }
}

template<typename Func>
void NeighborSearch::for_each_cell(const Position& pos, const Func& func, int k) {
  int u, v, w;
  cell_coords(pos, u, v, w);
  // k can exceed the grid size; clipped below
  int u0 = std::max(0, u - k);
  int v0 = std::max(0, v - k);
  int w0 = std::max(0, w - k);
  int uend = std::min(nu, u + k + 1);
  int vend = std::min(nv, v + k + 1);
  int wend = std::min(nw, w + k + 1);
  for (int iw = w0; iw < wend; ++iw)
    for (int iv = v0; iv < vend; ++iv) {
      size_t idx0 = size_t(iw * nv + iv) * nu;
      for (int iu = u0; iu < uend; ++iu)
        func(cells[idx0 + iu]);
    }
}

} // namespace immerse
#endif
