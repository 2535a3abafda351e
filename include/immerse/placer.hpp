// Copyright 2019 Global Phasing Ltd.
//
// Placing a pre-equilibrated membrane patch or solvent box around
// the solute: centering, periodic tiling and cropping to the window
// that covers the solute footprint plus padding.

#ifndef IMMERSE_PLACER_HPP_
#define IMMERSE_PLACER_HPP_

#include <string>
#include <vector>
#include "fail.hpp"      // for IMMERSE_DLL
#include "logger.hpp"
#include "model.hpp"

namespace immerse {

enum class Footprint : unsigned char {
  Box,      // bounding box of the solute in the membrane plane
  Diameter  // square with the side of the in-plane diameter of the solute
};

struct PlacerOptions {
  int normal = 2;             // membrane normal: 0=x, 1=y, 2=z
  double padding = 10.;
  double normal_offset = 0.;  // midplane position relative to solute center
  Footprint footprint = Footprint::Box;
  bool tile_normal = false;   // tile also along the normal (solvent boxes)
  bool crop_residues = true;

  int axes_mask() const {
    int mask = 7 & ~(1 << normal);
    if (tile_normal)
      mask = 7;
    return mask;
  }
};

/// Rigid transformation applied to the patch before it is tiled.
struct Placement {
  Transform transform;
  std::string str() const {
    return "translation " + transform.vec.str() +
           (transform.is_translation() ? "" : " with rotation");
  }
};

struct TilingPlan {
  Box<Position> window;
  int axes_mask = 3;
  int counts[3] = {1, 1, 1};   // tiles along each axis before cropping
  std::vector<Vec3> offsets;   // offsets of the kept tiles
  size_t cropped_residues = 0;

  int total() const { return counts[0] * counts[1] * counts[2]; }
  size_t kept() const { return offsets.size(); }
  std::string str() const {
    return cat(counts[0], 'x', counts[1], 'x', counts[2], " tiles, ", kept(),
               " kept, ", cropped_residues, " residues cropped");
  }
};

struct PlacedPatch {
  Model model;
  TilingPlan plan;
  Placement placement;
};

/// The region that the patch must cover. In the tiled axes it is the
/// solute footprint plus padding. Along the normal it is the solute
/// extent plus padding.
/// Throws GeometryError if the solute has no atoms.
IMMERSE_DLL Box<Position> footprint_window(const Model& solute,
                                           const PlacerOptions& options);

/// Centers, tiles and crops the patch to cover the window.
/// The patch must have a periodic cell in every tiled axis.
/// Along the normal (when not tiled) the patch midplane goes to
/// the window center plus normal_offset.
IMMERSE_DLL PlacedPatch place_patch(const Box<Position>& window,
                                    const Model& patch,
                                    const PlacerOptions& options,
                                    const Logger& logger);

inline PlacedPatch place_patch(const Model& solute, const Model& patch,
                               const PlacerOptions& options,
                               const Logger& logger) {
  return place_patch(footprint_window(solute, options), patch, options, logger);
}

} // namespace immerse
#endif
