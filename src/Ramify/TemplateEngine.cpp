// =================================================================
// src/Ramify/TemplateEngine.cpp
// =================================================================
// Implementation of placeholder rendering and prompt bindings.

#include "Ramify/TemplateEngine.hpp"
#include "Ramify/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace Ramify {

namespace {

size_t countOccurrences(const std::string& text, const std::string& token) {
    size_t count = 0;
    size_t pos = text.find(token);
    while (pos != std::string::npos) {
        ++count;
        pos = text.find(token, pos + token.size());
    }
    return count;
}

std::string trim(const std::string& text) {
    auto begin = std::find_if_not(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(text.rbegin(), text.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

bool isIndex(const std::string& segment) {
    return !segment.empty() &&
           std::all_of(segment.begin(), segment.end(), [](unsigned char c) { return std::isdigit(c); });
}

} // namespace

std::string PlaceholderTemplateEngine::render(const std::string& tmpl, const nlohmann::json& bindings) const {
    if (tmpl.empty()) {
        return tmpl;
    }

    if (countOccurrences(tmpl, "{{") != countOccurrences(tmpl, "}}")) {
        LOG_WARNING("TemplateEngine", "Unmatched '{{' and '}}' tokens, using template as-is");
        return tmpl;
    }

    try {
        std::ostringstream out;
        size_t pos = 0;
        while (true) {
            size_t open = tmpl.find("{{", pos);
            if (open == std::string::npos) {
                out << tmpl.substr(pos);
                break;
            }
            size_t close = tmpl.find("}}", open + 2);
            if (close == std::string::npos) {
                LOG_WARNING("TemplateEngine", "Unterminated placeholder, using template as-is");
                return tmpl;
            }

            out << tmpl.substr(pos, open - pos);

            std::string path = trim(tmpl.substr(open + 2, close - open - 2));
            const nlohmann::json* value = resolvePath(bindings, path);
            if (value && value->is_string()) {
                out << value->get<std::string>();
            } else if (value && !value->is_null()) {
                out << value->dump();
            }

            pos = close + 2;
        }
        return out.str();

    } catch (const std::exception& e) {
        LOG_WARNING("TemplateEngine", "Template rendering failed, using template as-is: " + std::string(e.what()));
        return tmpl;
    }
}

const nlohmann::json* PlaceholderTemplateEngine::resolvePath(const nlohmann::json& bindings, const std::string& path) {
    if (path.empty()) {
        return nullptr;
    }

    const nlohmann::json* current = &bindings;
    std::istringstream segments(path);
    std::string segment;
    while (std::getline(segments, segment, '.')) {
        segment = trim(segment);
        if (current->is_object()) {
            auto it = current->find(segment);
            if (it == current->end()) {
                return nullptr;
            }
            current = &(*it);
        } else if (current->is_array() && isIndex(segment)) {
            size_t index = std::stoul(segment);
            if (index >= current->size()) {
                return nullptr;
            }
            current = &(*current)[index];
        } else {
            return nullptr;
        }
    }
    return current;
}

nlohmann::json buildTemplateBindings(const ArgumentMap& args, const DelegationConfig& config,
                                     const std::optional<WorkItem>& item) {
    nlohmann::json bindings = nlohmann::json::object();

    // Declared inputs first; keep the key for required inputs that are absent
    for (const auto& parameter : config.input_parameters) {
        auto it = args.find(parameter.name);
        if (it != args.end()) {
            if (it->second.isData()) {
                bindings[parameter.name] = it->second.getData();
            }
        } else if (parameter.required) {
            bindings[parameter.name] = nullptr;
        }
    }

    for (const auto& [name, value] : args) {
        if (bindings.contains(name) || name.rfind("_Parameter", 0) == 0 || !value.isData()) {
            continue;
        }
        bindings[name] = value.getData();
    }

    bindings["_Config"] = config.toJson();

    nlohmann::json parameter = nlohmann::json::object();
    if (item) {
        parameter["Name"] = item->name;
        parameter["Value"] = item->value.isData() ? item->value.getData() : nlohmann::json(item->value.toDisplayString());
    } else {
        parameter["Name"] = nullptr;
        parameter["Value"] = nullptr;
    }
    bindings["_Parameter"] = parameter;

    return bindings;
}

} // namespace Ramify
