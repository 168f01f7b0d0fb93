#pragma once

#include "gvmi/core/type.hpp"
#include "gvmi/core/error.hpp"
#include "gvmi/core/macros.hpp"

#include <hdf5.h>

#include <cstdint>
#include <cstdlib>
#include <string>
#include <type_traits>
#include <vector>

// =============================================================================
// FILE: gvmi/io/hdf5.hpp
// BRIEF: RAII wrappers over the HDF5 C API
// =============================================================================

namespace gvmi::io::h5 {

namespace detail {

// Map C++ types to HDF5 native types
template <typename T>
inline hid_t native_type() {
    if constexpr (std::is_same_v<T, float>)         return H5T_NATIVE_FLOAT;
    else if constexpr (std::is_same_v<T, double>)   return H5T_NATIVE_DOUBLE;
    else if constexpr (std::is_same_v<T, int32_t>)  return H5T_NATIVE_INT32;
    else if constexpr (std::is_same_v<T, int64_t>)  return H5T_NATIVE_INT64;
    else if constexpr (std::is_same_v<T, uint32_t>) return H5T_NATIVE_UINT32;
    else if constexpr (std::is_same_v<T, uint64_t>) return H5T_NATIVE_UINT64;
    else {
        static_assert(!sizeof(T), "Unsupported HDF5 native type");
    }
}

inline void check_h5(herr_t err, const std::string& context) {
    if (err < 0) {
        std::string msg = "HDF5: " + context;

        struct ErrorWalker {
            std::string* msg;
        } walker{&msg};

        herr_t walk_err = H5Ewalk2(H5E_DEFAULT, H5E_WALK_DOWNWARD,
            [](unsigned, const H5E_error2_t* e, void* data) -> herr_t {
                auto* w = static_cast<ErrorWalker*>(data);
                if (e->desc) {
                    *w->msg += "\n  " + std::string(e->desc);
                }
                return 0;
            }, &walker);

        if (walk_err < 0) {
            msg += " (failed to retrieve error details)";
        }

        throw IOError(msg);
    }
}

inline void check_id(hid_t id, const std::string& context) {
    if (id < 0) {
        throw IOError("HDF5 invalid ID: " + context);
    }
}

// Suppresses the library's automatic error printing for one scope.
// Used around probes that are expected to fail.
class ScopedSilence {
public:
    ScopedSilence() noexcept {
        H5Eget_auto2(H5E_DEFAULT, &func_, &data_);
        H5Eset_auto2(H5E_DEFAULT, nullptr, nullptr);
    }

    ~ScopedSilence() noexcept {
        H5Eset_auto2(H5E_DEFAULT, func_, data_);
    }

    ScopedSilence(const ScopedSilence&) = delete;
    ScopedSilence& operator=(const ScopedSilence&) = delete;

private:
    H5E_auto2_t func_ = nullptr;
    void* data_ = nullptr;
};

} // namespace detail

// =============================================================================
// Object - owning handle with a type-specific closer
// =============================================================================

class Object {
protected:
    hid_t _id;
    herr_t (*_closer)(hid_t);

    Object(hid_t id, herr_t (*closer)(hid_t)) noexcept
        : _id(id), _closer(closer) {}

    Object() noexcept : _id(H5I_INVALID_HID), _closer(nullptr) {}

public:
    virtual ~Object() noexcept { close(); }

    void close() noexcept {
        if (is_valid() && _closer) {
            _closer(_id);
            _id = H5I_INVALID_HID;
        }
    }

    Object(Object&& other) noexcept
        : _id(other._id), _closer(other._closer)
    {
        other._id = H5I_INVALID_HID;
        other._closer = nullptr;
    }

    Object& operator=(Object&& other) noexcept {
        if (this != &other) {
            close();
            _id = other._id;
            _closer = other._closer;
            other._id = H5I_INVALID_HID;
            other._closer = nullptr;
        }
        return *this;
    }

    Object(const Object&) = delete;
    Object& operator=(const Object&) = delete;

    GVMI_NODISCARD hid_t id() const noexcept { return _id; }

    GVMI_NODISCARD bool is_valid() const noexcept {
        return _id >= 0 && _id != H5I_INVALID_HID;
    }
};

// =============================================================================
// Dataspace
// =============================================================================

class Dataspace : public Object {
public:
    explicit Dataspace(const std::vector<hsize_t>& dims)
        : Object(H5Screate_simple(static_cast<int>(dims.size()), dims.data(), nullptr),
                 H5Sclose)
    {
        detail::check_id(_id, "H5Screate_simple");
    }

    // Takes ownership of an existing id
    static Dataspace adopt(hid_t space_id) {
        detail::check_id(space_id, "dataspace");
        return Dataspace(space_id, H5Sclose);
    }

    static Dataspace scalar() {
        hid_t id = H5Screate(H5S_SCALAR);
        detail::check_id(id, "H5Screate(SCALAR)");
        return Dataspace(id, H5Sclose);
    }

    GVMI_NODISCARD int rank() const {
        return H5Sget_simple_extent_ndims(_id);
    }

    std::vector<hsize_t> dims() const {
        const int r = rank();
        if (r <= 0) return {};
        std::vector<hsize_t> out(static_cast<size_t>(r));
        detail::check_h5(H5Sget_simple_extent_dims(_id, out.data(), nullptr),
                         "H5Sget_simple_extent_dims");
        return out;
    }

    GVMI_NODISCARD hsize_t num_elements() const {
        const hssize_t n = H5Sget_simple_extent_npoints(_id);
        return n > 0 ? static_cast<hsize_t>(n) : 0;
    }

    // Contiguous block selection, one start/count per dimension
    void select_hyperslab(const std::vector<hsize_t>& start,
                          const std::vector<hsize_t>& count) {
        detail::check_h5(
            H5Sselect_hyperslab(_id, H5S_SELECT_SET, start.data(), nullptr,
                                count.data(), nullptr),
            "H5Sselect_hyperslab");
    }

private:
    using Object::Object;
};

// =============================================================================
// Datatype
// =============================================================================

class Datatype : public Object {
public:
    static Datatype adopt(hid_t type_id) {
        detail::check_id(type_id, "datatype");
        return Datatype(type_id, H5Tclose);
    }

    static Datatype string_vlen() {
        hid_t id = H5Tcopy(H5T_C_S1);
        detail::check_id(id, "H5Tcopy(H5T_C_S1)");
        Datatype t(id, H5Tclose);
        detail::check_h5(H5Tset_size(id, H5T_VARIABLE), "H5Tset_size");
        detail::check_h5(H5Tset_cset(id, H5T_CSET_UTF8), "H5Tset_cset");
        return t;
    }

    static Datatype string_fixed(size_t len) {
        hid_t id = H5Tcopy(H5T_C_S1);
        detail::check_id(id, "H5Tcopy(H5T_C_S1)");
        Datatype t(id, H5Tclose);
        detail::check_h5(H5Tset_size(id, len), "H5Tset_size");
        return t;
    }

    GVMI_NODISCARD size_t size() const { return H5Tget_size(_id); }
    GVMI_NODISCARD H5T_class_t type_class() const { return H5Tget_class(_id); }
    GVMI_NODISCARD bool is_variable_string() const { return H5Tis_variable_str(_id) > 0; }

    GVMI_NODISCARD bool is_numeric() const {
        const H5T_class_t c = type_class();
        return c == H5T_INTEGER || c == H5T_FLOAT;
    }

private:
    using Object::Object;
};

// =============================================================================
// String Buffers
// =============================================================================

namespace detail {

// Split n fixed-width strings, dropping NUL padding
inline std::vector<std::string> decode_fixed(const std::vector<char>& raw, size_t width, size_t n) {
    std::vector<std::string> out;
    out.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        const char* s = raw.data() + i * width;
        size_t len = 0;
        while (len < width && s[len] != '\0') ++len;
        out.emplace_back(s, len);
    }
    return out;
}

} // namespace detail

// =============================================================================
// Attribute
// =============================================================================

class Attribute : public Object {
public:
    Attribute(hid_t loc_id, const std::string& name)
        : Object(H5Aopen(loc_id, name.c_str(), H5P_DEFAULT), H5Aclose)
    {
        detail::check_id(_id, "H5Aopen: " + name);
    }

    static Attribute create(hid_t loc_id, const std::string& name,
                            hid_t type_id, const Dataspace& space) {
        hid_t id = H5Acreate2(loc_id, name.c_str(), type_id, space.id(),
                              H5P_DEFAULT, H5P_DEFAULT);
        detail::check_id(id, "H5Acreate: " + name);
        return Attribute(id, H5Aclose);
    }

    Dataspace space() const { return Dataspace::adopt(H5Aget_space(_id)); }
    Datatype type() const { return Datatype::adopt(H5Aget_type(_id)); }

    template <typename T>
    void read(T* buffer) const {
        detail::check_h5(H5Aread(_id, detail::native_type<T>(), buffer), "H5Aread");
    }

    template <typename T>
    void write(const T* buffer) {
        detail::check_h5(H5Awrite(_id, detail::native_type<T>(), buffer), "H5Awrite");
    }

    template <typename T>
    std::vector<T> read_vector() const {
        std::vector<T> data(space().num_elements());
        if (!data.empty()) read(data.data());
        return data;
    }

    std::string read_string() const {
        Datatype dtype = type();
        if (dtype.type_class() != H5T_STRING) {
            throw TypeError("Attribute is not a string");
        }

        if (dtype.is_variable_string()) {
            Datatype mem = Datatype::string_vlen();
            char* str_ptr = nullptr;
            detail::check_h5(H5Aread(_id, mem.id(), &str_ptr), "H5Aread vlen string");
            std::string result(str_ptr ? str_ptr : "");
            if (str_ptr) {
                Dataspace sp = space();
                H5Dvlen_reclaim(mem.id(), sp.id(), H5P_DEFAULT, &str_ptr);
            }
            return result;
        }

        const size_t width = dtype.size();
        std::vector<char> raw(width, '\0');
        detail::check_h5(H5Aread(_id, dtype.id(), raw.data()), "H5Aread string");
        return detail::decode_fixed(raw, width, 1).front();
    }

private:
    using Object::Object;
};

// =============================================================================
// Dataset
// =============================================================================

class Dataset : public Object {
public:
    Dataset(hid_t loc_id, const std::string& name)
        : Object(H5Dopen2(loc_id, name.c_str(), H5P_DEFAULT), H5Dclose)
    {
        detail::check_id(_id, "H5Dopen: " + name);
    }

    static Dataset create(hid_t loc_id, const std::string& name,
                          hid_t type_id, const Dataspace& space) {
        hid_t id = H5Dcreate2(loc_id, name.c_str(), type_id, space.id(),
                              H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
        detail::check_id(id, "H5Dcreate: " + name);
        return Dataset(id, H5Dclose);
    }

    Dataspace space() const { return Dataspace::adopt(H5Dget_space(_id)); }
    Datatype type() const { return Datatype::adopt(H5Dget_type(_id)); }
    std::vector<hsize_t> dims() const { return space().dims(); }
    GVMI_NODISCARD hsize_t num_elements() const { return space().num_elements(); }

    // Reads with conversion from the stored numeric type
    template <typename T>
    void read(T* buffer) const {
        if (!type().is_numeric()) {
            throw TypeError("Dataset does not hold numeric data");
        }
        detail::check_h5(
            H5Dread(_id, detail::native_type<T>(), H5S_ALL, H5S_ALL, H5P_DEFAULT, buffer),
            "H5Dread");
    }

    template <typename T>
    void write(const T* buffer) {
        detail::check_h5(
            H5Dwrite(_id, detail::native_type<T>(), H5S_ALL, H5S_ALL, H5P_DEFAULT, buffer),
            "H5Dwrite");
    }

    template <typename T>
    std::vector<T> read_vector() const {
        std::vector<T> data(num_elements());
        if (!data.empty()) read(data.data());
        return data;
    }

    // Reads the block [start, start + count) into a dense buffer of shape count
    template <typename T>
    void read_hyperslab(T* buffer,
                        const std::vector<hsize_t>& start,
                        const std::vector<hsize_t>& count) const {
        if (!type().is_numeric()) {
            throw TypeError("Dataset does not hold numeric data");
        }
        Dataspace file_space = space();
        file_space.select_hyperslab(start, count);
        Dataspace mem_space(count);
        detail::check_h5(
            H5Dread(_id, detail::native_type<T>(), mem_space.id(), file_space.id(),
                    H5P_DEFAULT, buffer),
            "H5Dread hyperslab");
    }

    // 1-D string dataset, variable- or fixed-length
    std::vector<std::string> read_strings() const {
        Datatype dtype = type();
        if (dtype.type_class() != H5T_STRING) {
            throw TypeError("Dataset does not hold strings");
        }

        Dataspace sp = space();
        const size_t n = sp.num_elements();
        if (n == 0) return {};

        if (dtype.is_variable_string()) {
            Datatype mem = Datatype::string_vlen();
            std::vector<char*> ptrs(n, nullptr);
            detail::check_h5(
                H5Dread(_id, mem.id(), H5S_ALL, H5S_ALL, H5P_DEFAULT, ptrs.data()),
                "H5Dread vlen strings");

            std::vector<std::string> out;
            out.reserve(n);
            for (char* p : ptrs) {
                out.emplace_back(p ? p : "");
            }
            H5Dvlen_reclaim(mem.id(), sp.id(), H5P_DEFAULT, ptrs.data());
            return out;
        }

        const size_t width = dtype.size();
        std::vector<char> raw(n * width, '\0');
        detail::check_h5(
            H5Dread(_id, dtype.id(), H5S_ALL, H5S_ALL, H5P_DEFAULT, raw.data()),
            "H5Dread fixed strings");
        return detail::decode_fixed(raw, width, n);
    }

    void write_strings(const std::vector<std::string>& values) {
        Datatype mem = Datatype::string_vlen();
        std::vector<const char*> ptrs;
        ptrs.reserve(values.size());
        for (const auto& v : values) {
            ptrs.push_back(v.c_str());
        }
        detail::check_h5(
            H5Dwrite(_id, mem.id(), H5S_ALL, H5S_ALL, H5P_DEFAULT, ptrs.data()),
            "H5Dwrite vlen strings");
    }

private:
    using Object::Object;
};

// =============================================================================
// Location - shared by File and Group
// =============================================================================

class Group;

class Location : public Object {
protected:
    using Object::Object;
    Location() = default;

public:
    // Accepts nested paths; a missing intermediate group yields false
    GVMI_NODISCARD bool exists(const std::string& path) const {
        detail::ScopedSilence silence;
        std::string prefix;
        size_t start = 0;
        while (start <= path.size()) {
            size_t slash = path.find('/', start);
            std::string part = path.substr(start, slash == std::string::npos
                                                      ? std::string::npos
                                                      : slash - start);
            if (!part.empty()) {
                prefix += prefix.empty() ? part : "/" + part;
                if (H5Lexists(_id, prefix.c_str(), H5P_DEFAULT) <= 0) {
                    return false;
                }
            }
            if (slash == std::string::npos) break;
            start = slash + 1;
        }
        return !prefix.empty();
    }

    GVMI_NODISCARD bool is_group(const std::string& path) const {
        if (!exists(path)) return false;
        hid_t obj = H5Oopen(_id, path.c_str(), H5P_DEFAULT);
        if (obj < 0) return false;
        const bool group = H5Iget_type(obj) == H5I_GROUP;
        H5Oclose(obj);
        return group;
    }

    GVMI_NODISCARD bool has_attr(const std::string& name) const {
        return H5Aexists(_id, name.c_str()) > 0;
    }

    Dataset open_dataset(const std::string& path) const {
        return Dataset(_id, path);
    }

    Group open_group(const std::string& path) const;

    std::string read_attr_string(const std::string& name) const {
        return Attribute(_id, name).read_string();
    }

    template <typename T>
    T read_attr(const std::string& name) const {
        T value{};
        Attribute(_id, name).read(&value);
        return value;
    }

    template <typename T>
    std::vector<T> read_attr_vector(const std::string& name) const {
        return Attribute(_id, name).read_vector<T>();
    }

    template <typename T>
    void write_attr(const std::string& name, const T& value) {
        Attribute attr = Attribute::create(_id, name, detail::native_type<T>(),
                                           Dataspace::scalar());
        attr.write(&value);
    }

    template <typename T>
    void write_attr_vector(const std::string& name, const std::vector<T>& values) {
        Attribute attr = Attribute::create(_id, name, detail::native_type<T>(),
                                           Dataspace(std::vector<hsize_t>{values.size()}));
        attr.write(values.data());
    }

    void write_attr_string(const std::string& name, const std::string& value) {
        Datatype dtype = Datatype::string_vlen();
        Attribute attr = Attribute::create(_id, name, dtype.id(), Dataspace::scalar());
        const char* ptr = value.c_str();
        detail::check_h5(H5Awrite(attr.id(), dtype.id(), &ptr), "H5Awrite string");
    }

    template <typename T>
    void write_dataset(const std::string& name, const T* data,
                       const std::vector<hsize_t>& dims) {
        Dataset dset = Dataset::create(_id, name, detail::native_type<T>(), Dataspace(dims));
        dset.write(data);
    }

    void write_strings(const std::string& name, const std::vector<std::string>& values) {
        Datatype dtype = Datatype::string_vlen();
        Dataset dset = Dataset::create(_id, name, dtype.id(), Dataspace(std::vector<hsize_t>{values.size()}));
        dset.write_strings(values);
    }

    Group create_group(const std::string& name);
};

// =============================================================================
// Group
// =============================================================================

class Group : public Location {
public:
    Group(hid_t loc_id, const std::string& name) : Location() {
        _id = H5Gopen2(loc_id, name.c_str(), H5P_DEFAULT);
        _closer = H5Gclose;
        detail::check_id(_id, "H5Gopen: " + name);
    }

    static Group create(hid_t loc_id, const std::string& name) {
        hid_t id = H5Gcreate2(loc_id, name.c_str(), H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
        detail::check_id(id, "H5Gcreate: " + name);
        Group g;
        g._id = id;
        g._closer = H5Gclose;
        return g;
    }

private:
    Group() = default;
};

inline Group Location::open_group(const std::string& path) const {
    return Group(_id, path);
}

inline Group Location::create_group(const std::string& name) {
    return Group::create(_id, name);
}

// =============================================================================
// File
// =============================================================================

class File : public Location {
public:
    // Read-only open; a path HDF5 cannot recognise raises ReadError
    explicit File(const std::string& path) : Location() {
        detail::ScopedSilence silence;
        _id = H5Fopen(path.c_str(), H5F_ACC_RDONLY, H5P_DEFAULT);
        _closer = H5Fclose;
        if (_id < 0) {
            throw ReadError("Not a readable HDF5 file: " + path);
        }
    }

    // Truncates an existing file
    static File create(const std::string& path) {
        hid_t id = H5Fcreate(path.c_str(), H5F_ACC_TRUNC, H5P_DEFAULT, H5P_DEFAULT);
        if (id < 0) {
            throw WriteError("Cannot create HDF5 file: " + path);
        }
        File f;
        f._id = id;
        f._closer = H5Fclose;
        return f;
    }

    void flush() {
        detail::check_h5(H5Fflush(_id, H5F_SCOPE_GLOBAL), "H5Fflush");
    }

private:
    File() = default;
};

} // namespace gvmi::io::h5
