#ifndef VALIDATOR_MAIN_HPP
#define VALIDATOR_MAIN_HPP
#include <kj/main.h>
#include <string>
#include <vector>

namespace validator {

// The "validate" subcommand: checks source files without running them.
class Main {
 public:
  explicit Main(kj::ProcessContext* context) : context(*context) {}
  kj::MainBuilder::Validity Run();
  kj::MainFunc getMain();

 private:
  bool AddSource(kj::StringPtr path);

  kj::ProcessContext& context;
  std::vector<std::string> sources_;
  bool show_policy_ = false;
  bool policy_json_ = false;
};
}  // namespace validator
#endif
