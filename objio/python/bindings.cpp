#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include "objio/objio.hpp"
#include <string>

namespace py = pybind11;

namespace {

// Read up to size bytes (all remaining bytes when size < 0); b"" at end of object
py::bytes read_bytes(objio::ByteSource& source, py::ssize_t size) {
    std::string out;
    if (size >= 0) {
        out.resize(static_cast<size_t>(size));
        objio::ReadResult r = source.read(reinterpret_cast<std::byte*>(&out[0]), out.size());
        out.resize(r.bytes);
        return py::bytes(out);
    }

    std::string chunk(64 * 1024, '\0');
    for (;;) {
        objio::ReadResult r = source.read(reinterpret_cast<std::byte*>(&chunk[0]), chunk.size());
        out.append(chunk, 0, r.bytes);
        if (r.eof) {
            return py::bytes(out);
        }
    }
}

objio::Whence whence_from_int(int whence) {
    switch (whence) {
        case 0: return objio::Whence::Start;
        case 1: return objio::Whence::Current;
        case 2: return objio::Whence::End;
        default:
            throw objio::ObjError(objio::ErrorCode::InvalidArgument, "Invalid whence " + std::to_string(whence));
    }
}

} // anonymous namespace

PYBIND11_MODULE(pyobjio, m) {
    m.doc() = "objio - lazy seekable object streams and scoped temp files";

    // Error codes
    py::enum_<objio::ErrorCode>(m, "ErrorCode")
        .value("NotFound", objio::ErrorCode::NotFound)
        .value("AccessDenied", objio::ErrorCode::AccessDenied)
        .value("NetworkError", objio::ErrorCode::NetworkError)
        .value("InvalidURI", objio::ErrorCode::InvalidURI)
        .value("IOError", objio::ErrorCode::IOError)
        .value("ConfigError", objio::ErrorCode::ConfigError)
        .value("Unsupported", objio::ErrorCode::Unsupported)
        .value("InvalidArgument", objio::ErrorCode::InvalidArgument)
        .export_values();

    // ObjError exception
    py::register_exception<objio::ObjError>(m, "ObjError");

    // URI class
    py::class_<objio::URI>(m, "URI")
        .def(py::init<>())
        .def(py::init<const std::string&>())
        .def_static("parse", &objio::URI::parse)
        .def("is_relative", &objio::URI::is_relative)
        .def("is_absolute", &objio::URI::is_absolute)
        .def("routed", &objio::URI::routed)
        .def("transport", &objio::URI::transport)
        .def("transport_name", &objio::URI::transport_name)
        .def("container", &objio::URI::container)
        .def("key", &objio::URI::key)
        .def("to_string", &objio::URI::to_string)
        .def("empty", &objio::URI::empty)
        .def("__str__", &objio::URI::to_string)
        .def("__repr__", [](const objio::URI& uri) {
            return "URI('" + uri.to_string() + "')";
        });

    py::class_<objio::ObjectInfo>(m, "ObjectInfo")
        .def_readonly("size", &objio::ObjectInfo::size)
        .def_readonly("content_type", &objio::ObjectInfo::content_type)
        .def_readonly("etag", &objio::ObjectInfo::etag);

    // LazySeekableStream class
    py::class_<objio::LazySeekableStream>(m, "LazySeekableStream")
        .def("read", [](objio::LazySeekableStream& s, py::ssize_t size) {
            return read_bytes(s, size);
        }, py::arg("size") = -1)
        .def("seek", [](objio::LazySeekableStream& s, int64_t offset, int whence) {
            return s.seek(offset, whence_from_int(whence));
        }, py::arg("offset"), py::arg("whence") = 0)
        .def("tell", &objio::LazySeekableStream::position)
        .def("size", &objio::LazySeekableStream::size)
        .def("close", &objio::LazySeekableStream::close)
        .def("info", &objio::LazySeekableStream::info)
        .def("__enter__", [](objio::LazySeekableStream& s) -> objio::LazySeekableStream& { return s; },
             py::return_value_policy::reference)
        .def("__exit__", [](objio::LazySeekableStream& s, py::object, py::object, py::object) {
            s.close();
        });

    // TempFile class
    py::class_<objio::TempFile>(m, "TempFile")
        .def("read", [](objio::TempFile& f, py::ssize_t size) {
            return read_bytes(f, size);
        }, py::arg("size") = -1)
        .def("write", [](objio::TempFile& f, py::bytes data) {
            std::string buf = data;
            f.write(reinterpret_cast<const std::byte*>(buf.data()), buf.size());
            return buf.size();
        }, py::arg("data"))
        .def("seek", [](objio::TempFile& f, int64_t offset, int whence) {
            return f.seek(offset, whence_from_int(whence));
        }, py::arg("offset"), py::arg("whence") = 0)
        .def("size", &objio::TempFile::size)
        .def("release", &objio::TempFile::release)
        .def("owned", &objio::TempFile::owned)
        .def("path", [](const objio::TempFile& f) {
            return f.path().string();
        })
        .def("__len__", &objio::TempFile::size)
        .def("__enter__", [](objio::TempFile& f) -> objio::TempFile& { return f; },
             py::return_value_policy::reference)
        .def("__exit__", [](objio::TempFile& f, py::object, py::object, py::object) {
            f.release();
        });

    m.def("sweep_stale_temp_files", [](const std::string& dir, const std::string& prefix) {
        return objio::sweep_stale_temp_files(dir, prefix);
    }, py::arg("dir"), py::arg("prefix"), "Remove <dir>/<prefix>* left by earlier runs");

    // ObjectStore class
    py::class_<objio::ObjectStore>(m, "ObjectStore")
        .def(py::init<const std::string&>(), py::arg("config_path"))
        // Streams reference the store's transports: keep the store alive
        .def("open", [](objio::ObjectStore& store, const std::string& uri) {
            return store.open(uri);
        }, py::arg("uri"), py::keep_alive<0, 1>())
        .def("open", [](objio::ObjectStore& store, const objio::URI& uri) {
            return store.open(uri.to_string());
        }, py::arg("uri"), py::keep_alive<0, 1>())
        .def("stat", [](objio::ObjectStore& store, const std::string& uri) {
            return store.stat(uri);
        }, py::arg("uri"))
        .def("stat", [](objio::ObjectStore& store, const objio::URI& uri) {
            return store.stat(uri.to_string());
        }, py::arg("uri"))
        .def("download", &objio::ObjectStore::download, py::arg("uri"),
             "Copy the object into a temp file rewound to offset 0")
        .def("download_to", [](objio::ObjectStore& store, const std::string& uri, const std::string& target,
                               uint64_t offset) {
            return store.download_to(uri, target, offset);
        }, py::arg("uri"), py::arg("target"), py::arg("offset") = 0,
           "Write the object to target through a temp file; no partial output on failure")
        .def("create_temp", &objio::ObjectStore::create_temp)
        .def("sweep_temp", &objio::ObjectStore::sweep_temp)
        .def("transport_count", &objio::ObjectStore::transport_count)
        .def("transport_names", &objio::ObjectStore::transport_names)
        .def("temp_dir", [](const objio::ObjectStore& store) {
            return store.temp_options().dir.string();
        });
}
