// Copyright 2019 Global Phasing Ltd.

#include "immerse/placer.hpp"

#include <algorithm>             // for max
#include <cmath>                 // for ceil
#include "immerse/calculate.hpp" // for calculate_box, xy_diameter
#include "immerse/modify.hpp"    // for transform_pos, remove_residues_if

namespace immerse {

namespace {

const char* axis_name(int axis) {
  static const char* names[] = { "x", "y", "z" };
  return names[axis];
}

// residue numbers of tile n start after those of tile n-1
int tile_seqnum_block(const Model& patch) {
  int block = 0;
  for (const Chain& chain : patch.chains) {
    block = std::max(block, (int) chain.residues.size());
    block = std::max(block, chain.max_seqnum());
  }
  return block;
}

void append_tile(Model& out, const Model& patch, const Vec3& offset,
                 int seqnum_shift) {
  for (const Chain& chain : patch.chains) {
    Chain* dest = out.find_chain(chain.name);
    if (!dest)
      dest = &out.append_chain(Chain(chain.name));
    for (const Residue& res : chain.residues) {
      dest->residues.push_back(res);
      Residue& copy = dest->residues.back();
      copy.seqnum += seqnum_shift;
      translate(copy, offset);
    }
  }
}

} // anonymous namespace

Box<Position> footprint_window(const Model& solute, const PlacerOptions& options) {
  if (options.normal < 0 || options.normal > 2)
    throw GeometryError("placer", cat("invalid normal axis ", options.normal));
  Box<Position> box = calculate_box(solute);
  if (box.empty())
    throw GeometryError("placer", "solute " + solute.name + " has no atoms");
  if (options.footprint == Footprint::Diameter) {
    double radius = 0.5 * xy_diameter(solute, options.normal);
    Position center = box.get_center();
    for (int i = 0; i != 3; ++i)
      if (i != options.normal) {
        box.minimum.at(i) = center.at(i) - radius;
        box.maximum.at(i) = center.at(i) + radius;
      }
  }
  box.add_margin(options.padding);
  return box;
}

PlacedPatch place_patch(const Box<Position>& window, const Model& patch,
                        const PlacerOptions& options, const Logger& logger) {
  if (window.empty())
    throw GeometryError("placer", "empty window for " + patch.name);
  Box<Position> patch_box = calculate_box(patch);
  if (patch_box.empty())
    throw GeometryError("placer", "patch " + patch.name + " has no atoms");
  int mask = options.axes_mask();
  for (int i = 0; i != 3; ++i)
    if ((mask & (1 << i)) && !(patch.cell.at(i) > 0))
      throw GeometryError("placer", cat("patch ", patch.name,
                                        " has no periodic box along ",
                                        axis_name(i)));

  PlacedPatch result{Model(patch.name, patch.role), TilingPlan(), Placement()};
  TilingPlan& plan = result.plan;
  plan.window = window;
  plan.axes_mask = mask;

  // center the patch on the window; along the normal, unless tiled,
  // the patch center goes to the solute center plus normal_offset
  Vec3 target = window.get_center();
  if (!options.tile_normal)
    target.at(options.normal) += options.normal_offset;
  result.placement.transform = translation(target - patch_box.get_center());
  Model centered = patch;
  transform_pos(centered, result.placement.transform);
  patch_box = calculate_box(centered);

  int m[3] = {0, 0, 0};
  Position window_size = window.get_size();
  for (int i = 0; i != 3; ++i)
    if (mask & (1 << i)) {
      m[i] = (int) std::ceil(0.5 * window_size.at(i) / patch.cell.at(i));
      plan.counts[i] = 2 * m[i] + 1;
    }

  int block = tile_seqnum_block(centered);
  int n_tile = 0;
  for (int k = -m[2]; k <= m[2]; ++k)
    for (int j = -m[1]; j <= m[1]; ++j)
      for (int i = -m[0]; i <= m[0]; ++i) {
        Vec3 offset(i * patch.cell.x, j * patch.cell.y, k * patch.cell.z);
        Box<Position> tile_box = patch_box;
        tile_box.minimum += offset;
        tile_box.maximum += offset;
        if (!tile_box.overlaps(window, mask))
          continue;
        append_tile(result.model, centered, offset, n_tile * block);
        plan.offsets.push_back(offset);
        ++n_tile;
      }

  if (options.crop_residues)
    plan.cropped_residues = remove_residues_if(result.model, [&](const Residue& r) {
        Position c = r.center();
        for (int i = 0; i != 3; ++i)
          if ((mask & (1 << i)) &&
              (c.at(i) < window.minimum.at(i) || c.at(i) > window.maximum.at(i)))
            return true;
        return false;
    });

  for (int i = 0; i != 3; ++i)
    result.model.cell.at(i) = (mask & (1 << i)) ? window_size.at(i)
                                                : patch.cell.at(i);
  logger.mesg("Placed ", patch.name, ": ", plan.str(), ", ",
              result.placement.str());
  return result;
}

} // namespace immerse
