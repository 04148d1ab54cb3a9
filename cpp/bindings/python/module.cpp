#include <pybind11/pybind11.h>
#include <pybind11/functional.h>
#include <pybind11/pytypes.h>
#include <pybind11/stl.h>
#include <cstdint>
#include <optional>
#include <utility>

#include "sieve/sieve.hpp"

namespace py = pybind11;

static py::dict scan_primes_py(std::uint64_t max_exclusive,
                               std::uint64_t progress_stride = 0,
                               bool verify = false,
                               std::optional<py::function> callback = std::nullopt) {

  sieve::ScanConfig cfg{max_exclusive, /*enable_progress=*/callback.has_value(),
                        progress_stride, verify};

  // Prepare C++ progress callback that reacquires the GIL when invoked.
  sieve::ProgressCb cb_cpp;
  if (callback.has_value()) {
    py::function fn = *callback;
    cb_cpp = [fn = std::move(fn)](std::uint64_t count, std::uint64_t prime) {
      py::gil_scoped_acquire gil;
      fn(count, prime);
    };
  }

  // Release the GIL for the heavy computation.
  sieve::ScanResult res;
  {
    py::gil_scoped_release nogil;
    res = sieve::scan_primes(cfg, cb_cpp);
  }

  py::dict out;
  out["max_exclusive"] = py::int_(res.max_exclusive);
  out["count"] = py::int_(res.count);
  out["largest"] = py::int_(res.largest);
  out["ns_elapsed"] = py::int_(res.ns_elapsed);
  out["verified"] = res.verified;
  out["engine_info"] = res.engine_info;
  return out;
}

PYBIND11_MODULE(sievecore, m) {
  m.doc() = "Incremental prime sieve core (pybind11)";
  m.attr("__version__") = sieve::SIEVE_VERSION;

  py::class_<sieve::PrimeGenerator>(m, "PrimeGenerator")
      .def(py::init<std::optional<std::uint64_t>>(),
           py::arg("max_exclusive") = py::none())
      .def("__iter__", [](sieve::PrimeGenerator& g) -> sieve::PrimeGenerator& { return g; })
      .def("__next__", [](sieve::PrimeGenerator& g) {
        auto v = g.next();
        if (!v) throw py::stop_iteration();
        return *v;
      })
      .def_property_readonly("cursor_count", &sieve::PrimeGenerator::cursor_count);

  m.def("primes",
      [](std::optional<std::uint64_t> max_exclusive) {
        return sieve::PrimeGenerator(max_exclusive);
      },
      py::arg("max_exclusive") = py::none(),
      R"pbdoc(Ascending primes below max_exclusive (infinite when omitted).)pbdoc");

  m.def("is_prime", &sieve::is_prime, py::arg("n"));
  m.def("prime_factors", &sieve::prime_factors, py::arg("n"));
  m.def("largest_prime_factor", &sieve::largest_prime_factor, py::arg("n"));
  m.def("nth_prime", &sieve::nth_prime, py::arg("n"));

  m.def("scan_primes", &scan_primes_py,
      py::arg("max_exclusive"),
      py::arg("progress_stride") = 0,         // 0 => auto (~1% of expected count)
      py::arg("verify") = false,
      py::arg("callback") = py::none(),
      R"pbdoc(
Count the primes below max_exclusive with the incremental sieve.

Args:
  max_exclusive (int): upper bound, not included.
  progress_stride (int): 0 for auto; otherwise invoke the callback every N primes.
  verify (bool): cross-check every odd value against GMP.
  callback (callable): optional function (count:int, prime:int) -> None.

Returns:
  dict { max_exclusive, count, largest, ns_elapsed, verified, engine_info }.
)pbdoc");
}
