#include "size_estimator.hpp"

namespace crancache {

size_t estimate_entry_size(const std::string& key, const ValuePtr& value) {
    return key.size() * 2 + estimate_value_size(value) + kEntryMetadataBytes;
}

size_t estimate_value_size(const ValuePtr& value) {
    if (!value) return 4 * 2; // "null"

    try {
        return value->to_json().dump().size() * 2;
    } catch (const CircularReferenceError&) {
        // fall through to the walk
    } catch (const nlohmann::json::exception&) {
        // dump() rejects strings that are not valid UTF-8
    }

    std::unordered_set<const Value*> on_path;
    return estimate_size_recursive(value.get(), on_path) * 2;
}

size_t estimate_size_recursive(const Value* value,
                               std::unordered_set<const Value*>& on_path) {
    if (!value) return 4;

    switch (value->type()) {
        case Value::Type::Null:
            return 4;
        case Value::Type::Boolean:
            return 5;
        case Value::Type::Number:
            return Value::format_number(value->as_number()).size();
        case Value::Type::String:
            return value->as_string().size();
        case Value::Type::Array:
        case Value::Type::Object:
            break;
    }

    if (on_path.count(value)) return kCircularReferenceUnits;
    on_path.insert(value);

    size_t total = 2; // brackets
    if (value->type() == Value::Type::Array) {
        for (const auto& item : value->items()) {
            total += estimate_size_recursive(item.get(), on_path);
        }
    } else {
        for (const auto& [key, field] : value->fields()) {
            total += key.size() + 3 + estimate_size_recursive(field.get(), on_path);
        }
    }

    on_path.erase(value);
    return total;
}

} // namespace crancache
