#ifndef SANDBOX_ARTIFACT_HPP
#define SANDBOX_ARTIFACT_HPP

#include <string>

#include "sandbox/payload.hpp"

namespace sandbox {
namespace artifact {

// All the functions are no-ops on an empty path, meaning that no artifact is
// expected. File system errors are thrown as std::system_error.

// Removes a stale artifact left by a previous execution and creates the
// directory that will contain the new one.
void Prepare(const std::string& path);

// Removes whatever a failed execution left at path.
void Discard(const std::string& path);

// Makes sure an artifact exists after a successful execution. If the code
// did not produce one, the result mapping is stored there as JSON. Returns
// the artifact path.
std::string Finalize(const std::string& path, const ResultPayload& payload);

}  // namespace artifact
}  // namespace sandbox

#endif
