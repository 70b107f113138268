#ifndef UTIL_MISC_HPP
#define UTIL_MISC_HPP
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include <kj/main.h>
#include <kj/string.h>

namespace util {

// Splits s on delim, dropping empty pieces.
std::vector<std::string> split(const std::string& s, char delim);

// Returns s without leading and trailing whitespace.
std::string trim(const std::string& s);

// Option callbacks for kj::MainBuilder that store the parsed value.
std::function<kj::MainBuilder::Validity()> setBool(bool& var);
std::function<kj::MainBuilder::Validity(kj::StringPtr)> setString(
    std::string& var);
std::function<kj::MainBuilder::Validity(kj::StringPtr)> setInt(int32_t& var);

}  // namespace util
#endif
