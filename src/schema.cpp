#include "foundry/schema.hpp"
#include <cmath>

namespace foundry {

namespace {

bool check_type(const std::string& t, const nlohmann::json& v) {
    if (t == "string")  return v.is_string();
    if (t == "integer") {
        if (v.is_number_integer()) return true;
        // 3.0 is an integer as far as JSON Schema is concerned.
        return v.is_number_float() && std::isfinite(v.get<double>())
               && std::floor(v.get<double>()) == v.get<double>();
    }
    if (t == "number")  return v.is_number();
    if (t == "boolean") return v.is_boolean();
    if (t == "object")  return v.is_object();
    if (t == "array")   return v.is_array();
    if (t == "null")    return v.is_null();
    return true;
}

std::optional<std::string> validate(const nlohmann::json& schema, const nlohmann::json& value,
                                    const std::string& path) {
    if (!schema.is_object()) return std::nullopt;

    if (auto it = schema.find("type"); it != schema.end()) {
        if (it->is_string()) {
            if (!check_type(it->get<std::string>(), value)) {
                return path + ": expected " + it->get<std::string>();
            }
        } else if (it->is_array()) {
            bool any = false;
            for (const auto& t : *it) {
                if (t.is_string() && check_type(t.get<std::string>(), value)) { any = true; break; }
            }
            if (!any) return path + ": expected one of " + it->dump();
        }
    }

    if (auto it = schema.find("enum"); it != schema.end() && it->is_array()) {
        bool found = false;
        for (const auto& candidate : *it) {
            if (candidate == value) { found = true; break; }
        }
        if (!found) return path + ": value not in " + it->dump();
    }

    if (value.is_number()) {
        double d = value.get<double>();
        if (auto it = schema.find("minimum"); it != schema.end() && it->is_number() && d < it->get<double>()) {
            return path + ": below minimum " + it->dump();
        }
        if (auto it = schema.find("maximum"); it != schema.end() && it->is_number() && d > it->get<double>()) {
            return path + ": above maximum " + it->dump();
        }
    }

    if (value.is_string()) {
        auto len = value.get_ref<const std::string&>().size();
        if (auto it = schema.find("minLength"); it != schema.end() && it->is_number_unsigned()
            && len < it->get<std::size_t>()) {
            return path + ": shorter than " + it->dump();
        }
        if (auto it = schema.find("maxLength"); it != schema.end() && it->is_number_unsigned()
            && len > it->get<std::size_t>()) {
            return path + ": longer than " + it->dump();
        }
    }

    if (value.is_object()) {
        if (auto it = schema.find("required"); it != schema.end() && it->is_array()) {
            for (const auto& r : *it) {
                if (r.is_string() && !value.contains(r.get<std::string>())) {
                    return path + ": missing required field '" + r.get<std::string>() + "'";
                }
            }
        }
        auto props = schema.find("properties");
        const bool has_props = props != schema.end() && props->is_object();
        if (has_props) {
            for (const auto& [key, sub] : props->items()) {
                auto v = value.find(key);
                if (v == value.end()) continue;
                if (auto err = validate(sub, *v, path + "." + key)) return err;
            }
        }
        if (auto it = schema.find("additionalProperties"); it != schema.end() && it->is_boolean()
            && !it->get<bool>()) {
            for (const auto& [key, v] : value.items()) {
                if (!has_props || !props->contains(key)) {
                    return path + ": unexpected field '" + key + "'";
                }
            }
        }
    }

    if (value.is_array()) {
        if (auto it = schema.find("items"); it != schema.end() && it->is_object()) {
            for (std::size_t i = 0; i < value.size(); ++i) {
                if (auto err = validate(*it, value[i], path + "[" + std::to_string(i) + "]")) return err;
            }
        }
    }

    return std::nullopt;
}

} // anonymous namespace

std::optional<std::string> validate_arguments(const nlohmann::json& schema, const nlohmann::json& value) {
    return validate(schema, value, "$");
}

} // namespace foundry
