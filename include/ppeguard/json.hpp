#pragma once

#include <cstddef>
#include <map>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace ppeguard {

class Json {
public:
    using object_t = std::map<std::string, Json>;
    using array_t = std::vector<Json>;
    using value_t = std::variant<std::nullptr_t, bool, double, std::string, object_t, array_t>;

    Json() : value_(nullptr) {}
    Json(std::nullptr_t) : value_(nullptr) {}
    Json(bool v) : value_(v) {}
    Json(int v) : value_(static_cast<double>(v)) {}
    Json(long v) : value_(static_cast<double>(v)) {}
    Json(long long v) : value_(static_cast<double>(v)) {}
    Json(unsigned v) : value_(static_cast<double>(v)) {}
    Json(unsigned long v) : value_(static_cast<double>(v)) {}
    Json(unsigned long long v) : value_(static_cast<double>(v)) {}
    Json(float v) : value_(static_cast<double>(v)) {}
    Json(double v) : value_(v) {}
    Json(const char* v) : value_(std::string(v)) {}
    Json(std::string v) : value_(std::move(v)) {}
    Json(object_t v) : value_(std::move(v)) {}
    Json(array_t v) : value_(std::move(v)) {}

    static Json object() { return Json(object_t{}); }
    static Json array() { return Json(array_t{}); }

    bool is_null() const { return std::holds_alternative<std::nullptr_t>(value_); }
    bool is_boolean() const { return std::holds_alternative<bool>(value_); }
    bool is_number() const { return std::holds_alternative<double>(value_); }
    bool is_string() const { return std::holds_alternative<std::string>(value_); }
    bool is_object() const { return std::holds_alternative<object_t>(value_); }
    bool is_array() const { return std::holds_alternative<array_t>(value_); }

    const object_t& as_object() const;
    object_t& as_object();
    const array_t& as_array() const;
    array_t& as_array();
    const std::string& as_string() const;
    double as_number() const;
    bool as_bool() const;

    // Object access. The const overload throws std::out_of_range for a missing key,
    // the mutable one inserts null like std::map.
    const Json& operator[](const std::string& key) const;
    Json& operator[](const std::string& key);
    const Json& at(const std::string& key) const { return (*this)[key]; }

    bool contains(const std::string& key) const;

    // Typed lookups with a fallback for absent or null keys. A present key of the
    // wrong type is a configuration error and throws std::runtime_error.
    std::string get_string(const std::string& key, const std::string& fallback = {}) const;
    double get_number(const std::string& key, double fallback = 0.0) const;
    int get_int(const std::string& key, int fallback = 0) const;
    bool get_bool(const std::string& key, bool fallback = false) const;

    void push_back(Json value);

    std::string dump(int indent = -1) const;

    static Json parse(const std::string& text);
    static Json parse_file(const std::string& path);

private:
    value_t value_;

    void dump_impl(std::string& out, int indent, int depth) const;
};

}  // namespace ppeguard
