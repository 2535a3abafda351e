// Copyright Global Phasing Ltd.
//
// fail(), unreachable() and the exceptions that stop system building.

#ifndef IMMERSE_FAIL_HPP_
#define IMMERSE_FAIL_HPP_

#include <stdexcept>  // for runtime_error
#include <string>
#include <utility>    // for forward
#include <vector>

#if defined(_WIN32) && defined(IMMERSE_SHARED)
# if defined(IMMERSE_BUILD)
#  define IMMERSE_DLL __declspec(dllexport)
# else
#  define IMMERSE_DLL __declspec(dllimport)
# endif
#elif defined(__GNUC__) && defined(IMMERSE_SHARED)
# define IMMERSE_DLL __attribute__((visibility("default")))
#else
# define IMMERSE_DLL
#endif

namespace immerse {

[[noreturn]]
inline void fail(const std::string& msg) { throw std::runtime_error(msg); }

template<typename T, typename... Args> [[noreturn]]
void fail(std::string&& str, T&& arg1, Args&&... args) {
  str += arg1;
  fail(std::move(str), std::forward<Args>(args)...);
}
template<typename T, typename... Args> [[noreturn]]
void fail(const std::string& str, T&& arg1, Args&&... args) {
  fail(str + arg1, std::forward<Args>(args)...);
}

// unreachable() is used to silence GCC -Wreturn-type and hint the compiler
[[noreturn]] inline void unreachable() {
#if defined(__GNUC__) || defined(__clang__)
  __builtin_unreachable();
#elif defined(_MSC_VER)
  __assume(0);
#endif
}

/// Base class of the conditions that abort SystemBuilder::build().
/// component names the stage that failed ("placer", "clash", "ions", ...).
struct BuildError : std::runtime_error {
  std::string component;
  BuildError(const std::string& comp, const std::string& msg)
    : std::runtime_error(comp + ": " + msg), component(comp) {}
};

/// Empty or degenerate bounding box, zero periodic dimension.
struct GeometryError : BuildError {
  GeometryError(const std::string& comp, const std::string& msg)
    : BuildError(comp, msg) {}
};

/// Not enough molecules of a kind left to continue.
/// The caller may widen the solvent box and retry.
struct InsufficientSolvent : BuildError {
  std::string kind;
  int needed;
  int available;
  InsufficientSolvent(const std::string& comp, const std::string& kind_,
                      int needed_, int available_)
    : BuildError(comp, "insufficient " + kind_ + ": " + std::to_string(needed_) +
                       " needed, " + std::to_string(available_) + " available"),
      kind(kind_), needed(needed_), available(available_) {}
};

struct Shortfall {
  std::string species;
  int requested;
  int unplaced;
};

/// Not all requested ions could be placed.
struct IonPlacementShortfall : BuildError {
  std::vector<Shortfall> shortfalls;
  IonPlacementShortfall(const std::string& comp, std::vector<Shortfall> sf)
    : BuildError(comp, describe(sf)), shortfalls(std::move(sf)) {}

  int total_unplaced() const {
    int n = 0;
    for (const Shortfall& s : shortfalls)
      n += s.unplaced;
    return n;
  }

  static std::string describe(const std::vector<Shortfall>& sf) {
    std::string msg = "ion placement shortfall:";
    for (const Shortfall& s : sf)
      msg += " " + s.species + " " + std::to_string(s.unplaced) + " of " +
             std::to_string(s.requested) + " unplaced;";
    return msg;
  }
};

} // namespace immerse
#endif
