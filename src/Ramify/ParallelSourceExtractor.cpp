// =================================================================
// src/Ramify/ParallelSourceExtractor.cpp
// =================================================================
// Implementation of work item extraction.

#include "Ramify/ParallelSourceExtractor.hpp"
#include "Ramify/Errors.hpp"
#include "Ramify/Logger.hpp"
#include <algorithm>
#include <cctype>

namespace Ramify {

namespace {

std::string toLower(const std::string& text) {
    std::string lowered = text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

} // namespace

std::vector<WorkItem> ParallelSourceExtractor::extract(const ArgumentMap& args, const ParallelConfig& config) {
    switch (config.execution_type) {
        case ParallelExecutionType::NONE:
            return {};
        case ParallelExecutionType::LIST_BASED:
            return extractListBased(args, config);
        case ParallelExecutionType::EXTERNAL_LIST:
            return extractExternalList(config);
        case ParallelExecutionType::PARAMETER_BASED:
            return extractParameterBased(args, config);
        default:
            throw ConfigurationError("Unsupported parallel execution type: " +
                                     std::to_string(static_cast<int>(config.execution_type)));
    }
}

const std::set<std::string>& ParallelSourceExtractor::builtinExcludedNames() {
    static const std::set<std::string> names = {
        "dassession", "hostsession", "session", "parentsession", "cancellationtoken"
    };
    return names;
}

bool ParallelSourceExtractor::isExcluded(const std::string& name, const std::vector<std::string>& extra_excluded) {
    std::string lowered = toLower(name);
    if (builtinExcludedNames().count(lowered) > 0) {
        return true;
    }
    return std::any_of(extra_excluded.begin(), extra_excluded.end(),
                       [&lowered](const std::string& excluded) { return toLower(excluded) == lowered; });
}

std::vector<WorkItem> ParallelSourceExtractor::extractListBased(const ArgumentMap& args, const ParallelConfig& config) {
    if (config.list_parameter_name.empty()) {
        throw ConfigurationError("ListBased parallel execution requires list_parameter_name");
    }

    auto it = args.find(config.list_parameter_name);
    if (it == args.end() || it->second.isNull()) {
        throw ConfigurationError("List parameter '" + config.list_parameter_name + "' is missing");
    }

    const Value& list = it->second;
    if (!list.isData() || !list.getData().is_array()) {
        throw ConfigurationError("Parameter '" + config.list_parameter_name + "' must be a list, got " +
                                 list.getTypeName());
    }

    std::vector<WorkItem> items;
    for (const auto& element : list.getData()) {
        items.push_back(WorkItem{config.list_parameter_name, Value(element)});
    }

    if (items.empty()) {
        throw ConfigurationError("List parameter '" + config.list_parameter_name + "' is empty");
    }

    LOG_DEBUG("ParallelSourceExtractor", "Extracted " + std::to_string(items.size()) + " items from list " +
              config.list_parameter_name);
    return items;
}

std::vector<WorkItem> ParallelSourceExtractor::extractExternalList(const ParallelConfig& config) {
    if (config.external_list.empty()) {
        throw ConfigurationError("ExternalList parallel execution requires a non-empty external_list");
    }

    std::vector<WorkItem> items;
    items.reserve(config.external_list.size());
    for (const auto& entry : config.external_list) {
        items.push_back(WorkItem{"ExternalList", Value(entry)});
    }
    return items;
}

std::vector<WorkItem> ParallelSourceExtractor::extractParameterBased(const ArgumentMap& args,
                                                                     const ParallelConfig& config) {
    std::vector<WorkItem> items;
    for (const auto& [name, value] : args) {
        if (isExcluded(name, config.excluded_parameter_names)) {
            continue;
        }
        if (!value.isData()) {
            LOG_DEBUG("ParallelSourceExtractor", "Skipping non-data parameter " + name, value.getTypeName());
            continue;
        }
        // Null values stay so templates see an empty value
        items.push_back(WorkItem{name, value});
    }
    return items;
}

} // namespace Ramify
