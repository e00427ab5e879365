#include "value.hpp"

#include <cmath>
#include <cstdio>
#include <unordered_set>

namespace crancache {

namespace {

constexpr double kMaxExactInteger = 1e15;

bool is_integral(double n) {
    return std::isfinite(n) && std::floor(n) == n && std::fabs(n) < kMaxExactInteger;
}

nlohmann::json convert(const Value& v, std::unordered_set<const Value*>& on_path) {
    switch (v.type()) {
        case Value::Type::Null:
            return nullptr;
        case Value::Type::Boolean:
            return v.as_bool();
        case Value::Type::Number:
            if (!std::isfinite(v.as_number())) return nullptr;
            if (is_integral(v.as_number())) return static_cast<int64_t>(v.as_number());
            return v.as_number();
        case Value::Type::String:
            return v.as_string();
        case Value::Type::Array:
        case Value::Type::Object:
            break;
    }

    if (!on_path.insert(&v).second) {
        throw CircularReferenceError("value graph contains a circular reference");
    }

    nlohmann::json out;
    if (v.type() == Value::Type::Array) {
        out = nlohmann::json::array();
        for (const auto& item : v.items()) {
            out.push_back(item ? convert(*item, on_path) : nlohmann::json(nullptr));
        }
    } else {
        out = nlohmann::json::object();
        for (const auto& [key, field] : v.fields()) {
            out[key] = field ? convert(*field, on_path) : nlohmann::json(nullptr);
        }
    }

    on_path.erase(&v);
    return out;
}

} // namespace

ValuePtr Value::null() {
    return std::make_shared<Value>(Key{}, Type::Null);
}

ValuePtr Value::boolean(bool b) {
    auto v = std::make_shared<Value>(Key{}, Type::Boolean);
    v->bool_ = b;
    return v;
}

ValuePtr Value::number(double n) {
    auto v = std::make_shared<Value>(Key{}, Type::Number);
    v->number_ = n;
    return v;
}

ValuePtr Value::string(std::string s) {
    auto v = std::make_shared<Value>(Key{}, Type::String);
    v->string_ = std::move(s);
    return v;
}

ValuePtr Value::array(ValueArray items) {
    auto v = std::make_shared<Value>(Key{}, Type::Array);
    v->array_ = std::move(items);
    return v;
}

ValuePtr Value::object(ValueObject fields) {
    auto v = std::make_shared<Value>(Key{}, Type::Object);
    v->object_ = std::move(fields);
    return v;
}

ValuePtr Value::from_json(const nlohmann::json& j) {
    switch (j.type()) {
        case nlohmann::json::value_t::boolean:
            return boolean(j.get<bool>());
        case nlohmann::json::value_t::number_integer:
        case nlohmann::json::value_t::number_unsigned:
        case nlohmann::json::value_t::number_float:
            return number(j.get<double>());
        case nlohmann::json::value_t::string:
            return string(j.get<std::string>());
        case nlohmann::json::value_t::array: {
            auto arr = array();
            arr->array_.reserve(j.size());
            for (const auto& item : j) arr->array_.push_back(from_json(item));
            return arr;
        }
        case nlohmann::json::value_t::object: {
            auto obj = object();
            obj->object_.reserve(j.size());
            for (auto it = j.begin(); it != j.end(); ++it) {
                obj->object_.emplace_back(it.key(), from_json(it.value()));
            }
            return obj;
        }
        default:
            return null();
    }
}

nlohmann::json Value::to_json() const {
    std::unordered_set<const Value*> on_path;
    return convert(*this, on_path);
}

void Value::push(ValuePtr item) {
    array_.push_back(std::move(item));
}

void Value::set(const std::string& key, ValuePtr value) {
    for (auto& field : object_) {
        if (field.first == key) {
            field.second = std::move(value);
            return;
        }
    }
    object_.emplace_back(key, std::move(value));
}

ValuePtr Value::at(const std::string& key) const {
    if (type_ != Type::Object) return nullptr;
    for (const auto& field : object_) {
        if (field.first == key) return field.second;
    }
    return nullptr;
}

std::string Value::format_number(double n) {
    if (!std::isfinite(n)) return "null";
    if (is_integral(n)) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%lld", static_cast<long long>(n));
        return buf;
    }
    return nlohmann::json(n).dump();
}

} // namespace crancache
