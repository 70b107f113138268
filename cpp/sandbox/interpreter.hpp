#ifndef SANDBOX_INTERPRETER_HPP
#define SANDBOX_INTERPRETER_HPP

#include <string>

#include "validator/tokenizer.hpp"

namespace sandbox {

// Lifetime of the CPython interpreter used by the restricted backend.
class Interpreter {
 public:
  // Starts an embedded interpreter, unless the process already has one (as
  // when the engine is loaded as an extension module). On return the calling
  // thread does not hold the GIL. The embedded interpreter is never
  // finalized, since extension modules such as numpy do not support it.
  static void EnsureStarted();

  // True if the interpreter was started by EnsureStarted.
  static bool Embedded();

  // Parses source with CPython's own parser into an AST, without compiling
  // nor executing it. Usable as a validator::SyntaxCheck.
  static bool CheckSyntax(const std::string& source,
                          validator::SyntaxError* error);
};

}  // namespace sandbox

#endif
