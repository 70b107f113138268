#include "sandbox/main.hpp"
#include "util/version.hpp"
#include "validator/main.hpp"

class CodeboxMain {
 public:
  // NOLINTNEXTLINE(google-runtime-references)
  explicit CodeboxMain(kj::ProcessContext& context)
      : context(context), rm(&context), vm(&context) {}
  kj::MainFunc getMain() {
    return kj::MainBuilder(context, "Codebox (" + util::version + ")",
                           "Sandboxed execution of generated Python code")
        .addSubCommand("run", KJ_BIND_METHOD(rm, getMain),
                       "validate and execute a program")
        .addSubCommand("validate", KJ_BIND_METHOD(vm, getMain),
                       "statically check programs")
        .build();
  }

 private:
  kj::ProcessContext& context;
  sandbox::Main rm;
  validator::Main vm;
};

KJ_MAIN(CodeboxMain);
