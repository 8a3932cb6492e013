#include "ghostmeter/core/version.hpp"
#include "ghostmeter/processing/arrow_utils.hpp"
#include <pybind11/pybind11.h>

namespace py = pybind11;

// Forward declarations for binding functions
void bind_processing(py::module_ &m);
void bind_data(py::module_ &m);

namespace ghostmeter {
void init_engine_bindings(py::module_ &m);
}

/// Main Python module definition
PYBIND11_MODULE(ghostmeter_cpp, m) {
  m.doc() = "Ghostmeter C++ Core - boiler energy estimation and "
            "coefficient learning";

  // Version information
  m.attr("__version__") = ghostmeter::Version::get_version_string();
  m.def("get_version", &ghostmeter::Version::get_version_string,
        "Get library version string");
  m.def("is_arrow_available", &ghostmeter::arrow_utils::is_arrow_available,
        "Whether column reductions use Arrow compute");

  // Component functions (resampler, integrator, solar, meter, learner)
  bind_processing(m);

  // CSV log loaders
  bind_data(m);

  // Request-level API (HeatingEngine)
  ghostmeter::init_engine_bindings(m);
}
