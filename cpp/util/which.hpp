#ifndef UTIL_WHICH_HPP
#define UTIL_WHICH_HPP

#include <string>

namespace util {

// Resolves cmd against PATH to the first executable file with that name, or
// returns an empty string. A cmd containing a slash is only checked for
// being executable. Resolutions are remembered unless use_cache is false and
// forgotten once the file stops being executable. Throws if PATH is unset.
std::string which(const std::string& cmd, bool use_cache = true);

}  // namespace util

#endif
