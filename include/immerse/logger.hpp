// Copyright Global Phasing Ltd.
//
// Logger - progress messages and warnings of the building steps,
// passed to a callback.

#ifndef IMMERSE_LOGGER_HPP_
#define IMMERSE_LOGGER_HPP_

#include <functional>  // for function
#include "util.hpp"    // for cat

namespace immerse {

/// Messages are strings without a trailing newline. A message is passed
/// to the callback if its level is <= threshold:
/// 8=debug (every clash record), 6=progress, 5=notes (renamed chains,
/// numbering collisions), 3=warnings (kept solute clashes, shortfalls).
/// Warnings never stop the building; errors are thrown.
struct Logger {
  std::function<void(const std::string&)> callback;
  int threshold = 6;

  template<int N, class... Args> void level(Args const&... args) const {
    if (threshold >= N && callback)
      callback(cat(args...));
  }

  template<class... Args> void debug(Args const&... args) const { level<8>("Debug: ", args...); }
  template<class... Args> void mesg(Args const&... args) const { level<6>(args...); }
  template<class... Args> void note(Args const&... args) const { level<5>("Note: ", args...); }
  template<class... Args> void warn(Args const&... args) const { level<3>("Warning: ", args...); }
};

} // namespace immerse
#endif
