#include "validator/main.hpp"

#include <iostream>

#include <kj/debug.h>
#include "sandbox/interpreter.hpp"
#include "sandbox/result_codec.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"
#include "util/log_manager.hpp"
#include "util/misc.hpp"
#include "util/version.hpp"
#include "validator/static_validator.hpp"

namespace validator {

bool Main::AddSource(kj::StringPtr path) {
  sources_.emplace_back(path.cStr());
  return true;
}

kj::MainBuilder::Validity Main::Run() {
  util::LogManager log_manager(context);
  ValidationPolicy policy = ValidationPolicy::Default();
  if (!Flags::policy_file.empty()) {
    KJ_IF_MAYBE(exception, kj::runCatchingExceptions([&]() {
                  policy = ValidationPolicy::FromFile(Flags::policy_file);
                })) {
      return kj::str("Invalid policy: ", exception->getDescription());
    }
  }

  if (show_policy_) {
    std::cout << (policy_json_ ? policy.ToJson() : policy.Summary())
              << std::endl;
  }
  if (sources_.empty()) {
    if (show_policy_) return true;
    return "You need to specify at least one source file!";
  }

  StaticValidator validator(policy, &sandbox::Interpreter::CheckSyntax);
  size_t rejected = 0;
  for (const std::string& path : sources_) {
    if (!util::File::Exists(path)) {
      return kj::str("Source file not found: ", path);
    }
    ValidationReport report = validator.Validate(util::File::ReadAll(path));
    if (!report.is_safe) rejected++;
    if (sources_.size() > 1) std::cout << path << ": ";
    std::cout << sandbox::ToJson(report) << std::endl;
  }
  if (rejected > 0) {
    context.exitError(kj::str(rejected, " of ", sources_.size(),
                              " sources rejected"));
  }
  return true;
}

kj::MainFunc Main::getMain() {
  return kj::MainBuilder(context, "Codebox Validator (" + util::version + ")",
                         "Statically checks generated Python programs "
                         "without executing them")
      .addOptionWithArg({'L', "logfile"}, util::setString(Flags::log_file),
                        "<LOGFILE>", "Path where the log file should be stored")
      .addOptionWithArg({'p', "policy"}, util::setString(Flags::policy_file),
                        "<FILE>", "JSON file with the validation policy")
      .addOption({'P', "show-policy"}, util::setBool(show_policy_),
                 "Print the policy in use")
      .addOption({"json"}, util::setBool(policy_json_),
                 "Print the policy as JSON")
      .expectZeroOrMoreArgs("<SOURCE>", KJ_BIND_METHOD(*this, AddSource))
      .callAfterParsing(KJ_BIND_METHOD(*this, Run))
      .build();
}
}  // namespace validator
