#include <pybind11/pybind11.h>
#include <pybind11/functional.h>
#include <pybind11/pytypes.h>
#include <pybind11/stl.h>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "dm/block_header.hpp"
#include "dm/difficulty.hpp"
#include "dm/dm.hpp"
#include "dm/hash.hpp"

namespace py = pybind11;

// bytes/bytearray pass through, str is UTF-8 encoded, anything else is an
// InputTypeError (surfaced as TypeError).
static std::string as_bytes(const py::handle& obj) {
  if (py::isinstance<py::bytes>(obj))
    return obj.cast<std::string>();
  if (py::isinstance<py::bytearray>(obj))
    return std::string(obj.cast<py::bytearray>());
  if (py::isinstance<py::str>(obj))
    return obj.cast<std::string>();
  throw dm::InputTypeError("expected bytes, bytearray or str, got " +
                           std::string(py::str(obj.get_type().attr("__name__"))));
}

static std::vector<std::uint8_t> as_byte_vector(const py::handle& obj) {
  std::string s = as_bytes(obj);
  return std::vector<std::uint8_t>(s.begin(), s.end());
}

static py::bytes digest_to_bytes(const dm::Digest& d) {
  return py::bytes(reinterpret_cast<const char*>(d.bytes.data()), d.bytes.size());
}

static std::string digest_py(const py::object& data, const std::string& variant,
                             const std::string& mode) {
  std::string bytes = as_bytes(data);
  const dm::Variant v = dm::parse_variant(variant);
  const dm::MiningMode md = dm::parse_mode(mode);
  py::gil_scoped_release nogil;
  return dm::digest_of(bytes, v, md);
}

static py::dict search_py(const std::string& base, std::uint32_t leading_zeros,
                          std::uint64_t max_nonce, const std::string& variant,
                          const std::string& mode, std::uint64_t progress_stride,
                          std::optional<py::function> callback, unsigned workers) {
  dm::SearchConfig cfg;
  cfg.variant = dm::parse_variant(variant);
  cfg.mode = dm::parse_mode(mode);
  cfg.base_message = base;
  cfg.leading_zeros = leading_zeros;
  cfg.max_nonce = max_nonce;
  cfg.enable_progress = callback.has_value();
  cfg.progress_stride = progress_stride;

  // Prepare C++ progress callback that reacquires the GIL when invoked.
  dm::ProgressCb cb_cpp;
  if (callback.has_value()) {
    py::function fn = *callback;
    cb_cpp = [fn = std::move(fn)](std::uint64_t nonce, const std::string& h) {
      py::gil_scoped_acquire gil;
      fn(nonce, h);
    };
  }

  // Release the GIL for the heavy computation.
  dm::MiningResult res;
  {
    py::gil_scoped_release nogil;
    res = (workers == 1) ? dm::search(cfg, cb_cpp) : dm::parallel_search(cfg, workers);
  }

  py::dict out;
  out["found"] = res.found;
  out["nonce"] = res.found ? py::object(py::int_(res.nonce)) : py::object(py::none());
  out["digest"] = res.digest_hex;
  out["attempts"] = py::int_(res.attempts);
  out["hashes_computed"] = py::int_(res.hashes_computed);
  out["elapsed_seconds"] = res.elapsed_seconds();
  out["cancelled"] = res.cancelled;
  out["engine_info"] = res.engine_info;
  return out;
}

static py::bytes pack_block_header_py(std::int32_t version, const py::object& prev_hash,
                                      const py::object& merkle_root, std::uint32_t timestamp,
                                      std::uint32_t bits, std::uint32_t nonce) {
  dm::BlockHeader h;
  h.version = version;
  h.prev_hash = as_byte_vector(prev_hash);
  h.merkle_root = as_byte_vector(merkle_root);
  h.timestamp = timestamp;
  h.bits = bits;
  h.nonce = nonce;
  const auto packed = dm::pack_block_header(h);
  return py::bytes(reinterpret_cast<const char*>(packed.data()), packed.size());
}

// Keeps the (-1, "") failure pair that Python callers compare against.
static py::tuple mine_block_py(const py::object& header, std::uint32_t target_zeros,
                               std::uint64_t max_nonce, const std::string& mode) {
  const auto bytes = as_byte_vector(header);
  const dm::MiningMode md = dm::parse_mode(mode);
  dm::BlockMineResult res;
  {
    py::gil_scoped_release nogil;
    res = dm::mine_block(bytes, target_zeros, max_nonce, md);
  }
  if (!res.found)
    return py::make_tuple(-1, std::string());
  return py::make_tuple(py::int_(res.nonce), res.digest_hex);
}

static bool verify_block_py(const py::object& header, std::uint64_t nonce,
                            const std::string& expected, const std::string& mode) {
  return dm::verify_block(as_byte_vector(header), nonce, expected, dm::parse_mode(mode));
}

PYBIND11_MODULE(dmcore, m) {
  m.doc() = "Digest engines and leading-zero mining (pybind11)";
  m.attr("__version__") = dm::DM_VERSION;

  py::register_exception<dm::InputTypeError>(m, "InputTypeError", PyExc_TypeError);
  py::register_exception<dm::FormatError>(m, "FormatError", PyExc_ValueError);

  py::class_<dm::DigestEngine>(m, "DigestEngine")
      .def(py::init([](const std::string& variant, const std::string& mode) {
             return dm::DigestEngine(dm::parse_variant(variant), dm::parse_mode(mode));
           }),
           py::arg("variant") = "standard", py::arg("mode") = "standard")
      .def("reset", &dm::DigestEngine::reset)
      .def("update", [](dm::DigestEngine& e, const py::object& data) { e.update(as_bytes(data)); })
      .def("digest", [](const dm::DigestEngine& e) { return digest_to_bytes(e.digest()); })
      .def("hexdigest", &dm::DigestEngine::hexdigest)
      .def("mix_nonce", &dm::DigestEngine::mix_nonce, py::arg("nonce"))
      .def_property_readonly("buffered", &dm::DigestEngine::buffered);

  m.def("digest", &digest_py,
        py::arg("data"), py::arg("variant") = "standard", py::arg("mode") = "standard",
        R"pbdoc(Return the 64-character lowercase hex digest of `data` (bytes or str).)pbdoc");

  m.def("search", &search_py,
        py::arg("base"),
        py::arg("leading_zeros"),
        py::arg("max_nonce") = 10000000,
        py::arg("variant") = "standard",
        py::arg("mode") = "standard",
        py::arg("progress_stride") = 0,         // 0 => auto (~1% of max_nonce)
        py::arg("callback") = py::none(),
        py::arg("workers") = 1,
        R"pbdoc(
Find the smallest nonce n in [0, max_nonce) such that digest(base + str(n))
starts with `leading_zeros` '0' characters.

Args:
  callback (callable): optional function (nonce:int, digest:str) -> None,
    invoked every `progress_stride` attempts (sequential search only).
  workers (int): 1 for a sequential search, 0 for one worker per core.

Returns:
  dict { found, nonce, digest, attempts, hashes_computed, elapsed_seconds,
         cancelled, engine_info }.
)pbdoc");

  m.def("pack_block_header", &pack_block_header_py,
        py::arg("version"), py::arg("prev_hash"), py::arg("merkle_root"),
        py::arg("timestamp"), py::arg("bits"), py::arg("nonce"),
        R"pbdoc(Pack an 80-byte little-endian block header.)pbdoc");

  m.def("mine_block", &mine_block_py,
        py::arg("header"), py::arg("target_zeros"),
        py::arg("max_nonce") = 1ull << 32, py::arg("mode") = "fast",
        R"pbdoc(Return (nonce, hash), or (-1, "") if no nonce qualifies.)pbdoc");

  m.def("verify_block", &verify_block_py,
        py::arg("header"), py::arg("nonce"), py::arg("expected_hash"),
        py::arg("mode") = "fast");

  m.def("expected_attempts",
        [](std::uint32_t k) { return py::int_(py::str(dm::expected_attempts(k))); },
        py::arg("k"));
}
