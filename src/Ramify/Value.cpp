// =================================================================
// src/Ramify/Value.cpp
// =================================================================
// Implementation of argument values.

#include "Ramify/Value.hpp"
#include "Ramify/Errors.hpp"

namespace Ramify {

Value::Value() : m_kind(ValueKind::DATA), m_data(nullptr) {}

Value Value::session(std::shared_ptr<HostSession> session) {
    Value value;
    value.m_kind = ValueKind::SESSION_HANDLE;
    value.m_session = std::move(session);
    value.m_type_name = "session";
    return value;
}

Value Value::cancellationToken(const CancellationToken& token) {
    Value value;
    value.m_kind = ValueKind::CANCELLATION_TOKEN;
    value.m_token = token;
    value.m_type_name = "cancellation_token";
    return value;
}

Value Value::callable(const std::string& type_name) {
    Value value;
    value.m_kind = ValueKind::CALLABLE;
    value.m_type_name = type_name.empty() ? "callable" : type_name;
    return value;
}

Value Value::opaque(const std::string& type_name) {
    Value value;
    value.m_kind = ValueKind::OPAQUE;
    value.m_type_name = type_name.empty() ? "object" : type_name;
    return value;
}

bool Value::isNull() const {
    return m_kind == ValueKind::DATA && m_data.is_null();
}

std::string Value::getTypeName() const {
    if (m_kind != ValueKind::DATA) {
        return m_type_name;
    }

    switch (m_data.type()) {
        case nlohmann::json::value_t::null: return "null";
        case nlohmann::json::value_t::boolean: return "boolean";
        case nlohmann::json::value_t::number_integer:
        case nlohmann::json::value_t::number_unsigned: return "integer";
        case nlohmann::json::value_t::number_float: return "number";
        case nlohmann::json::value_t::string: return "string";
        case nlohmann::json::value_t::array: return "array";
        case nlohmann::json::value_t::object: return "object";
        default: return "binary";
    }
}

std::string Value::toDisplayString() const {
    if (m_kind != ValueKind::DATA) {
        return "<" + m_type_name + ">";
    }
    if (m_data.is_string()) {
        return m_data.get<std::string>();
    }
    return m_data.dump();
}

nlohmann::json argumentsToJson(const ArgumentMap& args) {
    nlohmann::json object = nlohmann::json::object();
    for (const auto& [name, value] : args) {
        if (value.isData()) {
            object[name] = value.getData();
        }
    }
    return object;
}

ArgumentMap argumentsFromJson(const nlohmann::json& object) {
    if (!object.is_object()) {
        throw ValidationError("Arguments must be a JSON object, got " + std::string(object.type_name()));
    }

    ArgumentMap args;
    for (auto it = object.begin(); it != object.end(); ++it) {
        args.emplace(it.key(), Value(it.value()));
    }
    return args;
}

} // namespace Ramify
