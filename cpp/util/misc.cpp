#include "util/misc.hpp"

#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>

namespace util {

std::vector<std::string> split(const std::string& s, char delim) {
  std::vector<std::string> pieces;
  size_t begin = 0;
  while (begin <= s.size()) {
    size_t end = s.find(delim, begin);
    if (end == std::string::npos) end = s.size();
    if (end > begin) pieces.push_back(s.substr(begin, end - begin));
    begin = end + 1;
  }
  return pieces;
}

std::string trim(const std::string& s) {
  size_t begin = 0;
  size_t end = s.size();
  while (begin < end && isspace(static_cast<unsigned char>(s[begin]))) begin++;
  while (end > begin && isspace(static_cast<unsigned char>(s[end - 1]))) end--;
  return s.substr(begin, end - begin);
}

std::function<kj::MainBuilder::Validity()> setBool(bool& var) {
  return [&var]() -> kj::MainBuilder::Validity {
    var = true;
    return true;
  };
}

std::function<kj::MainBuilder::Validity(kj::StringPtr)> setString(
    std::string& var) {
  return [&var](kj::StringPtr p) -> kj::MainBuilder::Validity {
    var = p.cStr();
    return true;
  };
}

std::function<kj::MainBuilder::Validity(kj::StringPtr)> setInt(int32_t& var) {
  return [&var](kj::StringPtr p) -> kj::MainBuilder::Validity {
    char* end = nullptr;
    errno = 0;
    long value = strtol(p.cStr(), &end, 10);  // NOLINT
    if (p.size() == 0 || *end != '\0' || errno == ERANGE ||
        value < INT32_MIN || value > INT32_MAX) {
      return kj::str("not an integer: ", p);
    }
    var = static_cast<int32_t>(value);
    return true;
  };
}

}  // namespace util
