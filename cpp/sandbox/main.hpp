#ifndef SANDBOX_MAIN_HPP
#define SANDBOX_MAIN_HPP
#include <kj/main.h>
#include <string>

namespace sandbox {

// The "run" subcommand: executes one source file and prints the result.
class Main {
 public:
  explicit Main(kj::ProcessContext* context) : context(*context) {}
  kj::MainBuilder::Validity Run();
  kj::MainFunc getMain();

 private:
  bool SetSource(kj::StringPtr path);

  kj::ProcessContext& context;
  std::string source_path_;
  std::string artifact_path_;
  bool print_stats_ = false;
};
}  // namespace sandbox
#endif
