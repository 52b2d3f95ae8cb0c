#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <fastshard/fastshard.hpp>

namespace py = pybind11;
using namespace fastshard;

namespace {

template<typename T>
T unwrap(result<T> r) {
    if (!r) {
        throw py::value_error(std::string{error_message(r.error())});
    }
    return std::move(*r);
}

std::vector<algorithm> parse_names(const std::vector<std::string>& names) {
    std::vector<algorithm> out;
    for (const auto& n : names) {
        out.push_back(unwrap(parse_algorithm(n)));
    }
    return out;
}

capability_set parse_caps(const std::optional<std::vector<std::string>>& names) {
    if (!names) return host_capabilities();
    return unwrap(capability_set::from_names(*names));
}

// Keys may be passed as bytes or str
std::string key_bytes(const py::object& key) {
    if (py::isinstance<py::bytes>(key)) {
        return key.cast<std::string>();
    }
    if (py::isinstance<py::str>(key)) {
        return key.cast<std::string>();
    }
    throw py::type_error("key must be bytes or str");
}

} // namespace

PYBIND11_MODULE(fastshard, m) {
    m.doc() = R"pbdoc(
        fastshard
        =========

        Deterministic key to shard mapping with per-size-tier algorithm
        preferences and hardware capability fallback.

        >>> import fastshard
        >>> engine = fastshard.Engine(1024)
        >>> 0 <= engine.shard(b"user:42") < 1024
        True
    )pbdoc";

    m.def("host_capabilities", []() { return host_capabilities().to_string(); },
          "Comma separated list of detected CPU capabilities");

    m.def("format_default_config", []() { return format_config(shard_config::defaults()); },
          "Text form of the built-in tier configuration");

    py::class_<shard_engine>(m, "Engine")
        .def(py::init([](uint32_t shards, std::optional<std::string> tiers,
                         std::optional<std::vector<std::string>> caps) {
            auto config = tiers ? unwrap(parse_config(*tiers)) : shard_config::defaults();
            return unwrap(shard_engine::create(shards, std::move(config), parse_caps(caps)));
        }), py::arg("shards"), py::arg("tiers") = py::none(), py::arg("caps") = py::none(),
            R"pbdoc(
            Create a shard engine.

            Parameters
            ----------
            shards : int
                Number of shards, must be positive
            tiers : str, optional
                Tier configuration text, e.g. "0-16:fnv1a;17-*:xxh3|xxh3"
            caps : list of str, optional
                Force a capability set instead of detecting the host
            )pbdoc")

        .def_static("with_tiers", [](uint32_t shards,
                                     const std::vector<std::tuple<size_t, std::optional<size_t>,
                                                                  std::vector<std::string>>>& tiers,
                                     const std::vector<std::string>& defaults) {
            std::vector<tier> parsed;
            for (const auto& [lower, upper, names] : tiers) {
                parsed.push_back(tier{size_range{lower, upper.value_or(size_range::unbounded_upper)},
                                      parse_names(names)});
            }
            auto config = unwrap(shard_config::create(std::move(parsed), parse_names(defaults)));
            return unwrap(shard_engine::create(shards, std::move(config)));
        }, py::arg("shards"), py::arg("tiers"), py::arg("defaults"),
            "Create an engine from (lower, upper or None, [algorithms]) tuples")

        .def("shard", [](const shard_engine& self, const py::object& key) {
            return self.shard(key_bytes(key)).value;
        }, py::arg("key"), "Shard index of a key")

        .def("shard_many", [](const shard_engine& self, const std::vector<std::string>& keys) {
            std::vector<uint32_t> out;
            out.reserve(keys.size());
            for (auto idx : shard_batch(self, keys)) {
                out.push_back(idx.value);
            }
            return out;
        }, py::arg("keys"), "Shard indices for a list of keys")

        .def("select", [](const shard_engine& self, size_t key_size) {
            return std::string{to_string(self.select(key_size))};
        }, py::arg("key_size"), "Algorithm used for keys of this length")

        .def("explain", [](const shard_engine& self, const py::object& key) {
            auto r = self.explain(key_bytes(key));
            py::dict d;
            d["key_size"] = r.key_size;
            d["tier"] = r.matched_tier ? py::cast(*r.matched_tier) : py::none();
            d["preferences"] = format_algorithms(r.preferences);
            d["selected"] = std::string{to_string(r.selected)};
            d["digest_algorithm"] = std::string{to_string(r.digest_algorithm)};
            d["digest"] = r.digest.value;
            d["shard"] = r.shard.value;
            return d;
        }, py::arg("key"), "Routing decisions for a key")

        .def_property_readonly("shards", [](const shard_engine& self) {
            return self.shards().value;
        })
        .def_property_readonly("config", [](const shard_engine& self) {
            return format_config(self.config());
        })
        .def_property_readonly("capabilities", [](const shard_engine& self) {
            return self.capabilities().to_string();
        })

        .def("__repr__", [](const shard_engine& self) {
            return "<fastshard.Engine shards=" + std::to_string(self.shards().value) +
                   " caps=" + self.capabilities().to_string() + ">";
        });
}
