// =================================================================
// include/Ramify/Value.hpp
// =================================================================
// Dynamically typed argument values exchanged with tools and templates.

#pragma once

#include "Ramify/Cancellation.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <memory>
#include <string>
#include <type_traits>

namespace Ramify {

class HostSession;

/**
 * @brief What a Value carries
 */
enum class ValueKind {
    DATA,               ///< Plain data (null, bool, number, string, array, object)
    SESSION_HANDLE,     ///< A live host session
    CANCELLATION_TOKEN, ///< A cancellation token
    CALLABLE,           ///< A host delegate or callback
    OPAQUE              ///< Any other host object
};

/**
 * @brief A single argument value
 *
 * Plain data is stored as JSON. Host objects travel alongside data in the
 * same argument map but are never rendered into prompts or split into
 * parallel work items.
 */
class Value {
public:
    /**
     * @brief Construct a null data value
     */
    Value();

    /**
     * @brief Construct a data value from anything nlohmann::json accepts
     */
    template<typename T,
             typename = typename std::enable_if<
                 !std::is_same<typename std::decay<T>::type, Value>::value &&
                 std::is_constructible<nlohmann::json, T>::value>::type>
    Value(T&& data) : m_kind(ValueKind::DATA), m_data(std::forward<T>(data)) {}

    static Value session(std::shared_ptr<HostSession> session);
    static Value cancellationToken(const CancellationToken& token);
    static Value callable(const std::string& type_name);
    static Value opaque(const std::string& type_name);

    ValueKind getKind() const { return m_kind; }
    bool isData() const { return m_kind == ValueKind::DATA; }

    /**
     * @brief True for a data value holding JSON null
     */
    bool isNull() const;

    const nlohmann::json& getData() const { return m_data; }
    std::shared_ptr<HostSession> getSession() const { return m_session; }
    const CancellationToken& getCancellationToken() const { return m_token; }

    /**
     * @brief Runtime type name, used in validation messages
     * @return "null", "boolean", "integer", "number", "string", "array",
     *         "object", or the host object type name
     */
    std::string getTypeName() const;

    /**
     * @brief Human readable rendering: strings raw, other data as compact JSON
     */
    std::string toDisplayString() const;

private:
    ValueKind m_kind;
    nlohmann::json m_data;
    std::shared_ptr<HostSession> m_session;
    CancellationToken m_token;
    std::string m_type_name;
};

/**
 * @brief Named arguments of a tool call or delegation request
 */
using ArgumentMap = std::map<std::string, Value>;

/**
 * @brief Collect the plain-data entries of an argument map into a JSON object
 */
nlohmann::json argumentsToJson(const ArgumentMap& args);

/**
 * @brief Wrap every member of a JSON object as a data argument
 * @throws ValidationError if the JSON is not an object
 */
ArgumentMap argumentsFromJson(const nlohmann::json& object);

} // namespace Ramify
