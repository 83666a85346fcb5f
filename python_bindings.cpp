#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/stl/filesystem.h>
#include <pybind11/complex.h>
#include <pybind11/numpy.h>
#include <algorithm>
#include <complex>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "csi/csi.hpp"

namespace py = pybind11;
using csi::utils::ByteOrder;

namespace {

using OptPath = std::optional<std::filesystem::path>;

ByteOrder endian(const std::string& name) { return csi::utils::parse_byte_order(name.c_str()); }

std::span<const uint8_t> as_span(const py::bytes& data) {
    const std::string_view v = data;
    return {reinterpret_cast<const uint8_t*>(v.data()), v.size()};
}

// Copy one column into a NumPy array shaped (count, *per_record_shape).
template <class T>
py::array column_array(const csi::Column<T>& c, std::size_t rows) {
    std::vector<py::ssize_t> shape{py::ssize_t(rows)};
    for (std::size_t d : c.shape()) shape.push_back(py::ssize_t(d));
    py::array_t<T> out(shape);
    std::copy(c.data().begin(), c.data().begin() + std::ptrdiff_t(rows * c.stride()), out.mutable_data());
    return std::move(out);
}

template <class Records>
py::dict columns(const Records& r, std::size_t rows) {
    py::dict d;
    r.for_each_column([&](const char* name, const auto& c) { d[name] = column_array(c, rows); });
    return d;
}

template <class Records>
py::object column(const Records& r, std::size_t rows, const std::string& name) {
    py::object found = py::none();
    r.for_each_column([&](const char* n, const auto& c) {
        if (name == n) found = column_array(c, rows);
    });
    if (found.is_none()) throw py::attribute_error("no column '" + name + "'");
    return found;
}

py::dict report_dict(const csi::ReadReport& rep) {
    py::dict d;
    d["appended"] = rep.appended;
    d["auxiliary"] = rep.auxiliary;
    d["skipped"] = rep.skipped;
    d["malformed"] = rep.malformed;
    d["dropped"] = rep.dropped;
    d["stop"] = csi::to_string(rep.stop);
    return d;
}

// Accessors shared by every session type; `get` maps the bound object to
// its underlying csi::rx::Session.
template <class Cls, class Get>
void bind_common(Cls& cls, Get get) {
    using Self = typename Cls::type;
    cls.def_property_readonly("count", [get](Self& self) { return get(self).count(); })
        .def_property_readonly("file", [get](Self& self) { return get(self).file(); })
        .def("report", [get](Self& self) { return report_dict(get(self).report()); })
        .def("columns", [get](Self& self) {
            auto& s = get(self);
            return columns(s.records(), s.count());
        })
        .def("__getattr__", [get](Self& self, const std::string& name) {
            auto& s = get(self);
            return column(s.records(), s.count(), name);
        })
        .def("__len__", [get](Self& self) { return get(self).count(); });
}

template <class Format, class Cls>
void bind_session_ops(Cls& cls) {
    using S = csi::rx::Session<Format>;
    cls.def("read", [](S& s, const std::string& e) { return s.read(endian(e)); }, py::arg("endian") = "little")
        .def("seek", [](S& s, const std::filesystem::path& file, uint64_t pos, std::size_t num, const std::string& e) {
                 return s.seek(file, pos, num, endian(e));
             }, py::arg("file"), py::arg("pos"), py::arg("num"), py::arg("endian") = "little")
        .def("pmsg", [](S& s, const py::bytes& data, const std::string& e) {
                 return s.pmsg(as_span(data), endian(e));
             }, py::arg("data"), py::arg("endian") = "little");
    bind_common(cls, [](S& s) -> S& { return s; });
}

} // namespace

PYBIND11_MODULE(csi_lite, m) {
    m.doc() = "CSI capture decoders (Intel 5300, Atheros, Nexmon)";

    py::register_exception<csi::UnsupportedProfile>(m, "UnsupportedProfile", PyExc_ValueError);
    py::register_exception<csi::MissingSidecar>(m, "MissingSidecar", PyExc_FileNotFoundError);
    py::register_exception<csi::TruncatedInputError>(m, "TruncatedInputError", PyExc_EOFError);
    py::register_exception<csi::Error>(m, "CsiError", PyExc_RuntimeError);

    // Intel
    py::class_<csi::Intel> intel(m, "Intel");
    intel.def(py::init([](OptPath file, unsigned nrxnum, unsigned ntxnum, std::size_t pl_size,
                          bool if_report, std::size_t bufsize) {
                  return csi::Intel(std::move(file), csi::rx::IntelFormat({nrxnum, ntxnum, pl_size}),
                                    {if_report, bufsize});
              }),
              py::arg("file") = py::none(), py::arg("nrxnum") = 3, py::arg("ntxnum") = 2,
              py::arg("pl_size") = 0, py::arg("if_report") = true, py::arg("bufsize") = 0)
        .def("readstp", [](csi::Intel& s, const std::string& e) { return s.readstp(endian(e)); },
             py::arg("endian") = "little")
        .def("get_total_rss", [](csi::Intel& s) { return csi::dsp::get_total_rss(s.records()); })
        .def("get_scaled_csi", [](csi::Intel& s, bool inplace) -> py::array {
                 if (inplace) {
                     csi::dsp::get_scaled_csi_inplace(s.records());
                     return column_array(s.records().csi, s.count());
                 }
                 return column_array(csi::dsp::get_scaled_csi(s.records()), s.count());
             }, py::arg("inplace") = false)
        .def("get_scaled_csi_sm", [](csi::Intel& s, bool inplace) -> py::array {
                 if (inplace) {
                     csi::dsp::get_scaled_csi_sm_inplace(s.records());
                     return column_array(s.records().csi, s.count());
                 }
                 return column_array(csi::dsp::get_scaled_csi_sm(s.records()), s.count());
             }, py::arg("inplace") = false)
        .def("apply_sm", [](csi::Intel& s) {
                 return column_array(csi::dsp::apply_sm(s.records(), s.records().csi), s.count());
             });
    bind_session_ops<csi::rx::IntelFormat>(intel);

    // Atheros
    py::class_<csi::Atheros> atheros(m, "Atheros");
    atheros.def(py::init([](OptPath file, unsigned nrxnum, unsigned ntxnum, std::size_t pl_size, unsigned tones,
                            bool if_report, std::size_t bufsize) {
                    return csi::Atheros(std::move(file), csi::rx::AtherosFormat({nrxnum, ntxnum, pl_size, tones}),
                                        {if_report, bufsize});
                }),
                py::arg("file") = py::none(), py::arg("nrxnum") = 3, py::arg("ntxnum") = 2,
                py::arg("pl_size") = 0, py::arg("tones") = 56, py::arg("if_report") = true,
                py::arg("bufsize") = 0)
        .def("readstp", [](csi::Atheros& s, const std::string& e) { return s.readstp(endian(e)); },
             py::arg("endian") = "little");
    bind_session_ops<csi::rx::AtherosFormat>(atheros);

    // Nexmon
    py::class_<csi::Nexmon> nexmon(m, "Nexmon");
    nexmon.def(py::init([](OptPath file, const std::string& chip, unsigned bw, bool if_report, std::size_t bufsize) {
                   return csi::Nexmon(std::move(file),
                                      csi::rx::NexmonFormat({csi::rx::parse_chip(chip), bw, true}),
                                      {if_report, bufsize});
               }),
               py::arg("file") = py::none(), py::arg("chip") = "43455c0", py::arg("bw") = 80,
               py::arg("if_report") = true, py::arg("bufsize") = 0);
    bind_session_ops<csi::rx::NexmonFormat>(nexmon);

    // Variants
    py::class_<csi::AtherosPull10> pull10(m, "AtherosPull10");
    pull10.def(py::init([](OptPath file, unsigned nrxnum, unsigned ntxnum, std::size_t pl_size, unsigned tones,
                           bool if_report, std::size_t bufsize) {
                   return std::make_unique<csi::AtherosPull10>(std::move(file),
                                                               csi::rx::AtherosParams{nrxnum, ntxnum, pl_size, tones},
                                                               csi::rx::SessionOptions{if_report, bufsize});
               }),
               py::arg("file") = py::none(), py::arg("nrxnum") = 3, py::arg("ntxnum") = 2,
               py::arg("pl_size") = 0, py::arg("tones") = 56, py::arg("if_report") = true,
               py::arg("bufsize") = 0)
        .def("read", &csi::AtherosPull10::read)
        .def("seek", [](csi::AtherosPull10& s, const std::filesystem::path& file, uint64_t pos, std::size_t num) {
                 return s.seek(file, pos, num);
             }, py::arg("file"), py::arg("pos"), py::arg("num"))
        .def("pmsg", [](csi::AtherosPull10& s, const py::bytes& data, const std::string& e) {
                 return s.pmsg(as_span(data), endian(e));
             }, py::arg("data"), py::arg("endian") = "little")
        .def("readstp", [](csi::AtherosPull10& s, const std::string& e) { return s.readstp(endian(e)); },
             py::arg("endian") = "little");
    bind_common(pull10, [](csi::AtherosPull10& s) -> csi::Atheros& { return s.session(); });

    py::class_<csi::NexmonPull46> pull46(m, "NexmonPull46");
    pull46.def(py::init([](OptPath file, const std::string& chip, unsigned bw, bool if_report, std::size_t bufsize) {
                   return std::make_unique<csi::NexmonPull46>(std::move(file),
                                                              csi::rx::NexmonParams{csi::rx::parse_chip(chip), bw},
                                                              csi::rx::SessionOptions{if_report, bufsize});
               }),
               py::arg("file") = py::none(), py::arg("chip") = "43455c0", py::arg("bw") = 80,
               py::arg("if_report") = true, py::arg("bufsize") = 0)
        .def("read", [](csi::NexmonPull46& s) { return s.read(); })
        .def("seek", [](csi::NexmonPull46& s, const std::filesystem::path& file, uint64_t pos, std::size_t num) {
                 return s.seek(file, pos, num);
             }, py::arg("file"), py::arg("pos"), py::arg("num"))
        .def("pmsg", [](csi::NexmonPull46& s, const py::bytes& data) { return s.pmsg(as_span(data)); },
             py::arg("data"));
    bind_common(pull46, [](csi::NexmonPull46& s) -> csi::Nexmon& { return s.session(); });

    m.def("split_pull46_magic", [](uint32_t magic) {
        const auto f = csi::rx::split_pull46_magic(magic);
        return py::make_tuple(f.magic, f.rssi, f.fc);
    }, "Split a pull 46 magic word into (magic, rssi, fc)", py::arg("magic"));
}
