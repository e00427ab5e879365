#pragma once
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace crancache {

class Value;
using ValuePtr = std::shared_ptr<Value>;
using ValueArray = std::vector<ValuePtr>;
using ValueObject = std::vector<std::pair<std::string, ValuePtr>>;

// Thrown by Value::to_json when a container is reachable from itself.
class CircularReferenceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// JSON-like node whose containers hold children by shared reference, so a
// value graph may share substructures or point back at itself. Breaking a
// cycle (e.g. clearing the array) is the owner's job; shared_ptr cycles leak.
class Value {
public:
    enum class Type { Null, Boolean, Number, String, Array, Object };

    static ValuePtr null();
    static ValuePtr boolean(bool b);
    static ValuePtr number(double n);
    static ValuePtr string(std::string s);
    static ValuePtr array(ValueArray items = {});
    static ValuePtr object(ValueObject fields = {});

    // Deep copy of a JSON document.
    static ValuePtr from_json(const nlohmann::json& j);

    // Deep conversion; throws CircularReferenceError on a cycle.
    nlohmann::json to_json() const;

    Type type() const { return type_; }
    bool is_null() const { return type_ == Type::Null; }
    bool is_container() const { return type_ == Type::Array || type_ == Type::Object; }

    bool as_bool() const { return bool_; }
    double as_number() const { return number_; }
    const std::string& as_string() const { return string_; }

    ValueArray& items() { return array_; }
    const ValueArray& items() const { return array_; }
    ValueObject& fields() { return object_; }
    const ValueObject& fields() const { return object_; }

    void push(ValuePtr item);

    // Replaces an existing key in place, otherwise appends.
    void set(const std::string& key, ValuePtr value);

    // nullptr if absent or not an object.
    ValuePtr at(const std::string& key) const;

    // Shortest textual form of a number (integers without a fraction).
    static std::string format_number(double n);

private:
    struct Key {};

public:
    // Reachable only through the builders; Key is private.
    Value(Key, Type type) : type_(type) {}

private:
    Type type_;
    bool bool_ = false;
    double number_ = 0.0;
    std::string string_;
    ValueArray array_;
    ValueObject object_;
};

} // namespace crancache
