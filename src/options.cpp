// Copyright 2021 Global Phasing Ltd.

#include "immerse/options.hpp"

#include <cerrno>     // for errno
#include <climits>    // for INT_MIN, INT_MAX
#include <cstdlib>    // for strtod, strtol, strtoul
#include "immerse/util.hpp"

namespace immerse {

namespace {

[[noreturn]] void invalid_value(const std::string& key, const std::string& value) {
  fail("Invalid value for option " + key + ": '" + value + "'");
}

double parse_double(const std::string& key, const std::string& value) {
  const char* start = value.c_str();
  char* endptr = nullptr;
  errno = 0;
  double d = std::strtod(start, &endptr);
  if (endptr == start || *endptr != '\0' || errno == ERANGE)
    invalid_value(key, value);
  return d;
}

double parse_nonnegative(const std::string& key, const std::string& value) {
  double d = parse_double(key, value);
  if (d < 0)
    invalid_value(key, value);
  return d;
}

int parse_int(const std::string& key, const std::string& value) {
  const char* start = value.c_str();
  char* endptr = nullptr;
  errno = 0;
  long n = std::strtol(start, &endptr, 10);
  if (endptr == start || *endptr != '\0' || errno == ERANGE ||
      n < INT_MIN || n > INT_MAX)
    invalid_value(key, value);
  return (int) n;
}

std::uint32_t parse_seed(const std::string& key, const std::string& value) {
  const char* start = value.c_str();
  char* endptr = nullptr;
  errno = 0;
  unsigned long n = std::strtoul(start, &endptr, 10);
  if (endptr == start || *endptr != '\0' || errno == ERANGE ||
      value[0] == '-' || n > 0xffffffffUL)
    invalid_value(key, value);
  return (std::uint32_t) n;
}

bool parse_bool(const std::string& key, const std::string& value) {
  std::string v = to_lower(value);
  if (v == "true" || v == "yes" || v == "on" || v == "1")
    return true;
  if (v == "false" || v == "no" || v == "off" || v == "0")
    return false;
  invalid_value(key, value);
}

int parse_axis(const std::string& key, const std::string& value) {
  std::string v = to_lower(value);
  if (v == "x")
    return 0;
  if (v == "y")
    return 1;
  if (v == "z")
    return 2;
  invalid_value(key, value);
}

} // anonymous namespace

IonSpec parse_ion_spec(const std::string& value) {
  size_t colon = value.find(':');
  IonSpec spec(trim_str(value.substr(0, colon)));
  if (!find_ion_species(spec.species))
    fail("Unknown ion species: " + spec.species);
  if (colon == std::string::npos)
    return spec;
  for (const std::string& item : split_str(value.substr(colon + 1), ',')) {
    size_t eq = item.find('=');
    if (eq == std::string::npos)
      fail("Expected name=value in ion spec, got: " + item);
    std::string name = trim_str(item.substr(0, eq));
    std::string val = trim_str(item.substr(eq + 1));
    std::string key = "ion." + name;
    if (name == "count") {
      spec.count = parse_int(key, val);
      if (spec.count < 0)
        invalid_value(key, val);
    } else if (name == "conc") {
      spec.concentration = parse_nonnegative(key, val);
    } else if (name == "solute") {
      spec.min_dist_solute = parse_nonnegative(key, val);
    } else if (name == "ions") {
      spec.min_dist_ions = parse_nonnegative(key, val);
    } else if (name == "weight") {
      spec.neutralize_weight = parse_nonnegative(key, val);
    } else {
      fail("Unknown ion spec parameter: " + name);
    }
  }
  return spec;
}

void set_option(BuildOptions& options, const std::string& key,
                const std::string& value) {
  if (key == "normal") {
    options.placer.normal = parse_axis(key, value);
  } else if (key == "padding") {
    options.placer.padding = parse_nonnegative(key, value);
  } else if (key == "normal_offset") {
    options.placer.normal_offset = parse_double(key, value);
  } else if (key == "footprint") {
    std::string v = to_lower(value);
    if (v == "box")
      options.placer.footprint = Footprint::Box;
    else if (v == "diameter")
      options.placer.footprint = Footprint::Diameter;
    else
      invalid_value(key, value);
  } else if (key == "center_normal") {
    options.center_normal = parse_bool(key, value);
  } else if (key == "clash_distance") {
    double d = parse_double(key, value);
    if (!(d > 0))
      invalid_value(key, value);
    options.clash.min_dist = d;
  } else if (starts_with(key, "clash_distance.")) {
    std::vector<std::string> parts = split_str(key, '.');
    if (parts.size() != 3)
      fail("Expected clash_distance.KIND1.KIND2, got: " + key);
    double d = parse_double(key, value);
    if (!(d > 0))
      invalid_value(key, value);
    options.clash.set_pair(molecule_kind_from_str(parts[1]),
                           molecule_kind_from_str(parts[2]), d);
  } else if (key == "clash_hydrogens") {
    options.clash.include_h = parse_bool(key, value);
  } else if (key == "ion") {
    if (to_lower(value) == "none") {
      options.ions.species.clear();
      return;
    }
    IonSpec spec = parse_ion_spec(value);
    // the same species given again replaces the earlier spec
    const IonSpecies* info = find_ion_species(spec.species);
    for (IonSpec& s : options.ions.species)
      if (find_ion_species(s.species) == info) {
        s = spec;
        return;
      }
    options.ions.species.push_back(spec);
  } else if (key == "neutralize") {
    options.ions.neutralize = parse_bool(key, value);
  } else if (key == "target_charge") {
    options.ions.target_charge = parse_int(key, value);
  } else if (key == "best_effort") {
    options.ions.best_effort = parse_bool(key, value);
  } else if (key == "seed") {
    options.ions.seed = parse_seed(key, value);
  } else if (key == "shuffle") {
    options.ions.shuffle = parse_bool(key, value);
  } else if (key == "numbering_base") {
    options.numbering.base = parse_int(key, value);
  } else if (starts_with(key, "preserve.")) {
    MoleculeKind kind = molecule_kind_from_str(key.substr(9));
    options.numbering.preserve[static_cast<int>(kind)] = parse_bool(key, value);
  } else if (key == "chain_naming") {
    std::string v = to_lower(value);
    if (v == "number")
      options.numbering.naming = ChainNaming::AddNumber;
    else if (v == "short")
      options.numbering.naming = ChainNaming::Short;
    else
      invalid_value(key, value);
  } else if (key == "cation") {
    if (value.empty() || to_lower(value) == "none") {
      options.ions.cation.clear();
      return;
    }
    const IonSpecies* sp = find_ion_species(value);
    if (!sp || sp->charge != 1)
      invalid_value(key, value);
    options.ions.cation = sp->symbol;
  } else if (key == "ion_chain") {
    if (value.empty())
      invalid_value(key, value);
    options.ions.chain = value;
  } else {
    fail("Unknown option: " + key);
  }
}

BuildOptions read_options(const std::string& text) {
  BuildOptions options;
  int line_num = 0;
  for (const std::string& raw_line : split_str(text, '\n')) {
    ++line_num;
    std::string line = trim_str(raw_line.substr(0, raw_line.find('#')));
    if (line.empty())
      continue;
    size_t eq = line.find('=');
    if (eq == std::string::npos)
      fail(cat("line ", line_num, ": expected key = value, got: ", line));
    std::string key = trim_str(line.substr(0, eq));
    std::string value = trim_str(line.substr(eq + 1));
    try {
      set_option(options, key, value);
    } catch (std::runtime_error& e) {
      fail(cat("line ", line_num, ": ", e.what()));
    }
  }
  return options;
}

} // namespace immerse
