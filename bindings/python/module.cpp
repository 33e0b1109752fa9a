#include <pybind11/pybind11.h>
#include <pybind11/pytypes.h>
#include <pybind11/stl.h>
#include <string>
#include <vector>

#include "npp/errors.hpp"
#include "npp/npp.hpp"

namespace py = pybind11;

static npp::PredictConfig make_config(const std::string &method,
                                      unsigned precision_digits,
                                      unsigned series_terms,
                                      unsigned max_iterations,
                                      double tolerance, bool fast_path) {
  npp::PredictConfig cfg;
  cfg.method = npp::method_from_string(method.c_str());
  cfg.precision_digits = precision_digits;
  cfg.series_terms = series_terms;
  cfg.max_iterations = max_iterations;
  cfg.tolerance = tolerance;
  cfg.use_fast_path = fast_path;
  return cfg;
}

static py::dict to_dict(const npp::PredictResult &res) {
  // Python ints are unbounded, so hand back the decimal strings as ints.
  py::dict out;
  out["prime"] = py::int_(py::str(res.prime));
  out["estimate"] = py::int_(py::str(res.estimate));
  out["method"] = npp::to_string(res.method);
  out["iterations"] = py::int_(res.iterations);
  out["converged"] = res.converged;
  out["ns_elapsed"] = py::int_(res.ns_elapsed);
  out["candidates_tested"] = py::int_(res.candidates_tested);
  out["offset"] = py::int_(res.offset);
  out["precision_digits"] = py::int_(res.precision_digits);
  return out;
}

static py::dict predict_py(const py::int_ &n, const std::string &method,
                           unsigned precision_digits, unsigned series_terms,
                           unsigned max_iterations, double tolerance,
                           bool fast_path) {
  auto cfg = make_config(method, precision_digits, series_terms,
                         max_iterations, tolerance, fast_path);
  const std::string index = py::str(n);

  npp::PredictResult res;
  {
    py::gil_scoped_release nogil;
    res = npp::predict(index, cfg);
  }
  return to_dict(res);
}

static py::list predict_batch_py(const std::vector<py::int_> &n,
                                 const std::string &method,
                                 unsigned precision_digits,
                                 unsigned series_terms,
                                 unsigned max_iterations, double tolerance,
                                 bool fast_path, unsigned threads) {
  auto cfg = make_config(method, precision_digits, series_terms,
                         max_iterations, tolerance, fast_path);
  std::vector<std::string> index;
  index.reserve(n.size());
  for (const auto &v : n)
    index.push_back(py::str(v));

  std::vector<npp::PredictResult> res;
  {
    py::gil_scoped_release nogil;
    res = npp::predict_batch(index, cfg, threads);
  }
  py::list out;
  for (const auto &r : res)
    out.append(to_dict(r));
  return out;
}

PYBIND11_MODULE(nppcore, m) {
  m.doc() = "nth prime predictor (pybind11)";

  py::register_exception<npp::InputError>(m, "InputError", PyExc_ValueError);
  py::register_exception<npp::PrecisionError>(m, "PrecisionError",
                                              PyExc_OverflowError);
  py::register_exception<npp::RefinementExhaustion>(m, "RefinementExhaustion",
                                                    PyExc_RuntimeError);
  py::register_exception<npp::NumericDegeneracy>(m, "NumericDegeneracy",
                                                 PyExc_ArithmeticError);

  m.def("predict", &predict_py,
        py::arg("n"),
        py::arg("method") = "closed_form",
        py::arg("precision_digits") = 0, // 0 => derived from n
        py::arg("series_terms") = npp::kDefaultSeriesTerms,
        py::arg("max_iterations") = 10,
        py::arg("tolerance") = 1e-50,
        py::arg("fast_path") = true,
        R"pbdoc(
Predict the n-th prime p_n.

Args:
  n (int): index n >= 1, any size up to 1000 digits.
  method (str): "closed_form" or "newton"; used when n is not a reference index.
  precision_digits (int): working precision override, between the derived one and 1024.
  series_terms, max_iterations, tolerance: Newton settings.
  fast_path (bool): answer reference indices (10^k, n <= 25) from the table.

Returns:
  dict { prime, estimate, method, iterations, converged, ns_elapsed,
         candidates_tested, offset, precision_digits }.
)pbdoc");

  m.def("predict_batch", &predict_batch_py,
        py::arg("n"),
        py::arg("method") = "closed_form",
        py::arg("precision_digits") = 0,
        py::arg("series_terms") = npp::kDefaultSeriesTerms,
        py::arg("max_iterations") = 10,
        py::arg("tolerance") = 1e-50,
        py::arg("fast_path") = true,
        py::arg("threads") = 0,
        R"pbdoc(Predict many indices on worker threads with the same settings as predict(); results keep input order.)pbdoc");

  m.def("version", &npp::version);
}
