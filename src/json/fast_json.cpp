#include "etcdpp/json/fast_json.hpp"

namespace etcdpp {

namespace {

[[nodiscard]] JsonParseError simdjson_failure(simdjson::error_code code) {
    return JsonParseError(std::string(simdjson::error_message(code)));
}

}  // namespace

JsonResult FastJsonParser::parse(std::string_view json_str) {
    const simdjson::padded_string padded(json_str);

    try {
        auto doc = parser_.iterate(padded);
        if (doc.error() != simdjson::SUCCESS) {
            return tl::unexpected(simdjson_failure(doc.error()));
        }

        // Scalars at the root are not values in the on-demand API
        bool is_scalar = false;
        if (auto scalar = doc.is_scalar(); scalar.error() == simdjson::SUCCESS) {
            is_scalar = scalar.value();
        }
        if (is_scalar) {
            return nlohmann::json::parse(json_str);
        }

        simdjson::ondemand::value root;
        if (auto err = doc.get_value().get(root); err != simdjson::SUCCESS) {
            return tl::unexpected(simdjson_failure(err));
        }
        auto converted = convert(root, 0);
        if (converted.has_value() && doc.at_end() == false) {
            return tl::unexpected(JsonParseError("Trailing content after JSON document"));
        }
        return converted;
    } catch (const simdjson::simdjson_error& e) {
        return tl::unexpected(JsonParseError(e.what()));
    } catch (const nlohmann::json::exception& e) {
        return tl::unexpected(JsonParseError(e.what()));
    }
}

JsonResult FastJsonParser::convert(simdjson::ondemand::value value, std::size_t depth) {
    if (depth > config_.max_depth) {
        return tl::unexpected(JsonParseError(
            "Maximum nesting depth exceeded (" + std::to_string(config_.max_depth) + ")"
        ));
    }

    simdjson::ondemand::json_type type;
    if (auto err = value.type().get(type); err != simdjson::SUCCESS) {
        return tl::unexpected(simdjson_failure(err));
    }

    switch (type) {
        case simdjson::ondemand::json_type::object: {
            simdjson::ondemand::object obj;
            if (auto err = value.get_object().get(obj); err != simdjson::SUCCESS) {
                return tl::unexpected(simdjson_failure(err));
            }
            nlohmann::json out = nlohmann::json::object();
            for (auto field : obj) {
                std::string_view key;
                if (auto err = field.unescaped_key().get(key); err != simdjson::SUCCESS) {
                    return tl::unexpected(simdjson_failure(err));
                }
                std::string key_copy(key);
                simdjson::ondemand::value member_value;
                if (auto err = field.value().get(member_value); err != simdjson::SUCCESS) {
                    return tl::unexpected(simdjson_failure(err));
                }
                auto member = convert(member_value, depth + 1);
                if (member.has_value() == false) {
                    return member;
                }
                out[std::move(key_copy)] = std::move(*member);
            }
            return out;
        }

        case simdjson::ondemand::json_type::array: {
            simdjson::ondemand::array arr;
            if (auto err = value.get_array().get(arr); err != simdjson::SUCCESS) {
                return tl::unexpected(simdjson_failure(err));
            }
            nlohmann::json out = nlohmann::json::array();
            for (auto element : arr) {
                simdjson::ondemand::value item;
                if (auto err = element.get(item); err != simdjson::SUCCESS) {
                    return tl::unexpected(simdjson_failure(err));
                }
                auto converted = convert(item, depth + 1);
                if (converted.has_value() == false) {
                    return converted;
                }
                out.push_back(std::move(*converted));
            }
            return out;
        }

        case simdjson::ondemand::json_type::string: {
            std::string_view str;
            if (auto err = value.get_string().get(str); err != simdjson::SUCCESS) {
                return tl::unexpected(simdjson_failure(err));
            }
            return nlohmann::json(std::string(str));
        }

        case simdjson::ondemand::json_type::number: {
            // Indices are uint64 on the server; try the integer forms first
            std::int64_t as_int = 0;
            if (value.get_int64().get(as_int) == simdjson::SUCCESS) {
                return nlohmann::json(as_int);
            }
            std::uint64_t as_uint = 0;
            if (value.get_uint64().get(as_uint) == simdjson::SUCCESS) {
                return nlohmann::json(as_uint);
            }
            double as_double = 0.0;
            if (auto err = value.get_double().get(as_double); err != simdjson::SUCCESS) {
                return tl::unexpected(simdjson_failure(err));
            }
            return nlohmann::json(as_double);
        }

        case simdjson::ondemand::json_type::boolean: {
            bool flag = false;
            if (auto err = value.get_bool().get(flag); err != simdjson::SUCCESS) {
                return tl::unexpected(simdjson_failure(err));
            }
            return nlohmann::json(flag);
        }

        case simdjson::ondemand::json_type::null:
            return nlohmann::json(nullptr);

        default:
            break;
    }

    return tl::unexpected(JsonParseError("Unknown JSON type"));
}

JsonResult fast_parse(std::string_view json_str) {
    thread_local FastJsonParser parser;
    return parser.parse(json_str);
}

std::string fast_json_implementation() {
    return std::string(simdjson::get_active_implementation()->name());
}

}  // namespace etcdpp
