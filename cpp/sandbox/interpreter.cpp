#include "sandbox/interpreter.hpp"

#include <pybind11/embed.h>

#include <mutex>

#include <kj/debug.h>

namespace sandbox {
namespace {
std::once_flag start_once;
bool embedded = false;

// ast.PyCF_ONLY_AST
const constexpr int kOnlyAst = 0x400;
}  // namespace

void Interpreter::EnsureStarted() {
  std::call_once(start_once, []() {
    if (Py_IsInitialized()) return;
    pybind11::initialize_interpreter(/*init_signal_handlers=*/false);
    embedded = true;
    KJ_LOG(INFO, "Started embedded Python", Py_GetVersion());
    PyEval_SaveThread();
  });
}

bool Interpreter::Embedded() { return embedded; }

bool Interpreter::CheckSyntax(const std::string& source,
                              validator::SyntaxError* error) {
  namespace py = pybind11;
  EnsureStarted();
  py::gil_scoped_acquire gil;
  try {
    py::module::import("builtins")
        .attr("compile")(py::bytes(source), "<generated>", "exec", kOnlyAst,
                         py::arg("dont_inherit") = true);
    return true;
  } catch (py::error_already_set& exc) {
    // Null bytes raise ValueError on older versions.
    error->message = py::str(exc.value()).cast<std::string>();
    error->text.clear();
    error->line = 0;
    error->column = 0;
    if (exc.matches(PyExc_SyntaxError)) {
      py::object value = exc.value();
      if (!value.attr("msg").is_none()) {
        error->message = py::str(value.attr("msg")).cast<std::string>();
      }
      if (!value.attr("lineno").is_none()) {
        error->line = value.attr("lineno").cast<uint32_t>();
      }
      if (!value.attr("offset").is_none()) {
        int offset = value.attr("offset").cast<int>();
        error->column = offset > 0 ? offset - 1 : 0;
      }
      if (!value.attr("text").is_none()) {
        error->text = py::str(value.attr("text")).cast<std::string>();
        error->text.erase(error->text.find_last_not_of(" \t\r\n") + 1);
      }
    }
    return false;
  }
}

}  // namespace sandbox
