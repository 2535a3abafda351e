// Copyright 2020 Global Phasing Ltd.

#include "immerse/renumber.hpp"

#include <algorithm>             // for stable_sort, max
#include <map>
#include <set>
#include <utility>               // for pair
#include "immerse/calculate.hpp" // for count_atom_sites
#include "immerse/modify.hpp"    // for assign_serial_numbers

namespace immerse {

namespace {

struct ChainNumbers {
  std::set<int> used;
  int next;
  int max_used;
  explicit ChainNumbers(int base) : next(base), max_used(base - 1) {}

  bool has(int n) const { return used.count(n) != 0; }
  int take(int n) {
    used.insert(n);
    max_used = std::max(max_used, n);
    return n;
  }
  int take_next() {
    while (has(next))
      ++next;
    return take(next++);
  }
};

// residue of a fragment on its way to an output chain
struct Slot {
  const Chain* chain;
  const Residue* res;
  bool preserve;
  bool collision;
  int seqnum;
};

struct ChainSlots {
  std::string name;  // output chain name
  std::vector<Slot> slots;
};

void number_slots(std::vector<Slot>& slots, ChainNumbers& nums, int base) {
  // preserved numbers are taken first, other residues fill the gaps
  for (Slot& slot : slots)
    if (slot.preserve) {
      if (!nums.has(slot.res->seqnum))
        slot.seqnum = nums.take(slot.res->seqnum);
      else
        slot.collision = true;
    }
  for (Slot& slot : slots)
    if (slot.collision)
      slot.seqnum = nums.take(std::max(nums.max_used + 1, base));
  for (Slot& slot : slots)
    if (!slot.preserve)
      slot.seqnum = nums.take_next();
}

} // anonymous namespace

std::vector<size_t> merge_order(const std::vector<Model>& fragments) {
  std::vector<size_t> order(fragments.size());
  for (size_t i = 0; i != order.size(); ++i)
    order[i] = i;
  std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
      return fragments[a].role < fragments[b].role;
  });
  return order;
}

Model merge_fragments(const std::vector<Model>& fragments,
                      const RenumberOptions& options,
                      std::vector<NumberingCollision>& collisions,
                      const Logger& logger) {
  Model out("system", FragmentRole::Other);
  ChainNameGenerator namegen(options.naming);
  std::map<std::string, ChainNumbers> numbers;
  // input (chain, seqnum) of merged residues -> was the number preserved
  std::map<std::pair<std::string, int>, bool> seen;
  for (size_t idx : merge_order(fragments)) {
    const Model& frag = fragments[idx];
    for (int i = 0; i != 3; ++i)
      out.cell.at(i) = std::max(out.cell.at(i), frag.cell.at(i));
    std::map<std::string, std::string> names;  // old -> new in this fragment
    std::vector<ChainSlots> groups;
    for (const Chain& chain : frag.chains) {
      if (chain.residues.empty())
        continue;
      auto it = names.find(chain.name);
      if (it == names.end()) {
        it = names.emplace(chain.name, namegen.make_new_name(chain.name)).first;
        if (it->second != chain.name)
          logger.note("chain ", chain.name, " of ", frag.name,
                      " renamed to ", it->second);
        groups.push_back(ChainSlots{it->second, {}});
      }
      ChainSlots* group = nullptr;
      for (ChainSlots& g : groups)
        if (g.name == it->second)
          group = &g;
      for (const Residue& res : chain.residues)
        group->slots.push_back(Slot{&chain, &res, options.preserves(res.kind),
                                    false, 0});
    }
    for (ChainSlots& group : groups) {
      const std::string& new_name = group.name;
      Chain* dest = out.find_chain(new_name);
      if (!dest)
        dest = &out.append_chain(Chain(new_name));
      auto num_it = numbers.find(new_name);
      if (num_it == numbers.end())
        num_it = numbers.emplace(new_name, ChainNumbers(options.base)).first;
      number_slots(group.slots, num_it->second, options.base);
      for (const Slot& slot : group.slots) {
        const Residue& res = *slot.res;
        const std::string& old_name = slot.chain->name;
        bool collision = slot.collision;
        std::pair<std::string, int> address(old_name, res.seqnum);
        auto prev = seen.find(address);
        if (prev != seen.end()) {
          if (new_name != old_name && (slot.preserve || prev->second))
            collision = true;
        } else {
          seen.emplace(address, slot.preserve);
        }
        if (collision) {
          NumberingCollision nc;
          nc.fragment = frag.name;
          nc.chain = old_name;
          nc.seqnum = res.seqnum;
          nc.resname = res.name;
          nc.new_chain = new_name;
          nc.new_seqnum = slot.seqnum;
          logger.note("numbering collision: ", nc.str());
          collisions.push_back(nc);
        }
        dest->residues.push_back(res);
        dest->residues.back().seqnum = slot.seqnum;
      }
    }
  }
  assign_serial_numbers(out);
  logger.mesg("Merged ", fragments.size(), " fragments: ", out.chains.size(),
              " chains, ", count_residues(out), " residues, ",
              count_atom_sites(out), " atoms.");
  return out;
}

} // namespace immerse
