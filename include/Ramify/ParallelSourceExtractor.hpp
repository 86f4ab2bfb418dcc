// =================================================================
// include/Ramify/ParallelSourceExtractor.hpp
// =================================================================
// Derives the work items of a parallel delegation from the request.

#pragma once

#include "Ramify/DelegationConfig.hpp"
#include "Ramify/ParallelTypes.hpp"
#include "Ramify/Value.hpp"
#include <set>
#include <string>
#include <vector>

namespace Ramify {

/**
 * @brief Turns request arguments into work items per ParallelExecutionType
 */
class ParallelSourceExtractor {
public:
    /**
     * @brief Extract the work items for a request
     * @param args Request arguments
     * @param config Parallel settings
     * @return Work items; empty for NONE and for PARAMETER_BASED with nothing left after filtering
     * @throws ConfigurationError for a missing or empty list source
     */
    static std::vector<WorkItem> extract(const ArgumentMap& args, const ParallelConfig& config);

    /**
     * @brief Argument names never turned into work items, lowercased
     */
    static const std::set<std::string>& builtinExcludedNames();

    static bool isExcluded(const std::string& name, const std::vector<std::string>& extra_excluded);

private:
    static std::vector<WorkItem> extractListBased(const ArgumentMap& args, const ParallelConfig& config);
    static std::vector<WorkItem> extractExternalList(const ParallelConfig& config);
    static std::vector<WorkItem> extractParameterBased(const ArgumentMap& args, const ParallelConfig& config);
};

} // namespace Ramify
