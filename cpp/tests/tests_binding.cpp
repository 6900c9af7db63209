#include <nanobind/nanobind.h>
#include <stdexcept>
#include "guard/guard.h"

namespace nb = nanobind;

NB_MODULE(_probe_tests, m)
{
    m.doc() = "Runs the probe guard test suite from Python";
    m.def(
        "run",
        [](const char *filter, bool verbose) {
            guard::test::set_verbose(verbose);
            int rc = guard::test::run_all(filter && filter[0] ? filter : nullptr);
            if (rc != 0)
            {
                throw std::runtime_error("probe test suite failed");
            }
            return rc;
        },
        nb::arg("filter") = "",
        nb::arg("verbose") = false);
}
