// =================================================================
// src/Ramify/DelegationHandler.cpp
// =================================================================
// Implementation of the delegation entry point.

#include "Ramify/DelegationHandler.hpp"
#include "Ramify/ChildSessionCoordinator.hpp"
#include "Ramify/Errors.hpp"
#include "Ramify/Logger.hpp"
#include "Ramify/ParallelOrchestrator.hpp"
#include "Ramify/ParallelSourceExtractor.hpp"
#include "Ramify/ParameterValidator.hpp"
#include "Ramify/RecursionGuard.hpp"
#include "Ramify/ResultFormatter.hpp"
#include <algorithm>
#include <cctype>
#include <future>

namespace Ramify {

namespace {

const char* const SESSION_ARGUMENT = "DasSession";

bool isBlank(const std::string& text) {
    return std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c); });
}

bool equalsIgnoreCase(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

} // namespace

DelegationHandler::DelegationHandler(std::shared_ptr<Host> host, const DelegationConfig& config,
                                     std::shared_ptr<HostSession> context_session,
                                     std::shared_ptr<const TemplateEngine> engine)
    : m_host(std::move(host)), m_config(config), m_context_session(std::move(context_session)),
      m_engine(std::move(engine)) {
    if (!m_host) {
        throw DelegationError("DelegationHandler requires a host");
    }
    if (!m_engine) {
        m_engine = std::make_shared<PlaceholderTemplateEngine>();
    }
}

std::string DelegationHandler::delegate(const ArgumentMap& args) {
    DelegationConfig config = getConfig();

    std::shared_ptr<HostSession> context = m_context_session;
    auto session_arg = args.find(SESSION_ARGUMENT);
    if (session_arg != args.end() && session_arg->second.getKind() == ValueKind::SESSION_HANDLE &&
        session_arg->second.getSession()) {
        context = session_arg->second.getSession();
    }

    if (config.max_recursion_level < 0) {
        throw ConfigurationError("max_recursion_level must not be negative (got " +
                                 std::to_string(config.max_recursion_level) + ")");
    }

    std::string error_reporting_problem = config.validateErrorReporting();
    if (!error_reporting_problem.empty()) {
        LOG_WARNING("DelegationHandler", "Invalid error reporting configuration", error_reporting_problem);
        return error_reporting_problem;
    }

    int level = 0;
    if (context) {
        level = RecursionGuard(m_host).currentLevel(context);
        try {
            RecursionGuard::validate(level, config.max_recursion_level);
        } catch (const RecursionLimitExceeded& e) {
            LOG_WARNING("DelegationHandler", e.what(), "Session: " + context->getId());
            return e.what();
        }
    }

    Logger::getInstance().logDelegationStart(config.function_name, context ? context->getId() : "",
                                             level, config.isParallel());

    ValidationReport report = ParameterValidator::validate(config.input_parameters, args);
    if (!report.missing_required.empty()) {
        return "Missing required parameters: " + ParameterValidator::describeMissing(config.input_parameters, args);
    }

    if (config.dangling_behavior == DanglingBehavior::URGE && isBlank(config.urging_message)) {
        throw ConfigurationError("urging_message must not be empty when dangling_behavior is urge");
    }

    std::string person = selectExecutivePerson(context, config);
    if (person.empty()) {
        return "No assistants available";
    }

    CancellationToken token = context ? context->getCancellationToken() : CancellationToken();

    if (config.isParallel()) {
        return runParallel(args, config, context, person, token);
    }

    try {
        ChildResult result = runChild(args, config, context, person, std::nullopt, token);
        return ResultFormatter::formatChildResult(result);
    } catch (const DanglingExhaustedError&) {
        throw;
    } catch (const OperationCancelledError&) {
        throw;
    } catch (const ConfigurationError&) {
        throw;
    } catch (const std::exception& e) {
        LOG_ERROR("DelegationHandler", std::string("Child session failed: ") + e.what());
        return std::string("Failed: ") + e.what();
    }
}

std::string DelegationHandler::runParallel(const ArgumentMap& args, const DelegationConfig& config,
                                           const std::shared_ptr<HostSession>& context, const std::string& person,
                                           const CancellationToken& token) {
    std::vector<WorkItem> sources;
    try {
        sources = ParallelSourceExtractor::extract(args, *config.parallel);
    } catch (const ConfigurationError& e) {
        LOG_WARNING("DelegationHandler", std::string("Could not extract parallel sources: ") + e.what());
        return std::string("Parallel execution error: ") + e.what();
    }

    if (sources.empty()) {
        return "No valid parameters for parallel execution";
    }

    ParallelOrchestrator orchestrator(*config.parallel, context);
    WorkItemRunner runner = [this, &args, &config, &context, &person](const WorkItem& item,
                                                                      const CancellationToken& item_token) {
        return runChild(args, config, context, person, item, item_token);
    };

    AggregateOutcome outcome = orchestrator.run(sources, runner, token);
    return ResultFormatter::formatAggregate(outcome);
}

ChildResult DelegationHandler::runChild(const ArgumentMap& args, const DelegationConfig& config,
                                        const std::shared_ptr<HostSession>& context, const std::string& person,
                                        const std::optional<WorkItem>& item, const CancellationToken& token) {
    token.throwIfCancellationRequested("Delegation " + config.function_name);

    std::shared_ptr<HostSession> child = m_host->createChildSession(context, person);
    if (!child) {
        throw DelegationError("Host did not create a child session for " + person);
    }

    nlohmann::json bindings = buildTemplateBindings(args, config, item);
    std::string prompt = m_engine->render(config.prompt_message, bindings);
    std::string urging = m_engine->render(config.urging_message, bindings);

    LOG_INFO("DelegationHandler", "Started child session " + child->getId(),
             item ? "Work item: " + item->name + "=" + item->value.toDisplayString() : "Person: " + person);

    ChildSessionCoordinator coordinator(child, config);
    return coordinator.run(prompt, urging, token);
}

std::string DelegationHandler::selectExecutivePerson(const std::shared_ptr<HostSession>& context,
                                                     const DelegationConfig& config) const {
    if (config.executive_person && !isBlank(config.executive_person->name)) {
        const std::string& wanted = config.executive_person->name;
        std::vector<Assistant> assistants = m_host->listAssistants(std::nullopt);
        auto it = std::find_if(assistants.begin(), assistants.end(),
                               [&wanted](const Assistant& a) { return equalsIgnoreCase(a.name, wanted); });
        if (it == assistants.end()) {
            throw ConfigurationError("Configured executive person '" + wanted + "' is not available");
        }
        return it->name;
    }

    if (context) {
        std::vector<std::string> names = context->getPersonNames();
        if (!names.empty() && !isBlank(names.front())) {
            return names.front();
        }
    }

    std::vector<Assistant> assistants = m_host->listAssistants(std::nullopt);
    if (!assistants.empty()) {
        return assistants.front().name;
    }
    return "";
}

void DelegationHandler::updateConfig(const DelegationConfig& config) {
    std::lock_guard<std::mutex> lock(m_config_mutex);
    m_config = config;
}

DelegationConfig DelegationHandler::getConfig() const {
    std::lock_guard<std::mutex> lock(m_config_mutex);
    return m_config;
}

ToolFunction DelegationHandler::toToolFunction() {
    auto self = shared_from_this();
    ToolFunction function;
    function.schema = getConfig().getDelegationToolSchema();
    function.handler = [self](const ArgumentMap& args) {
        return std::async(std::launch::async, [self, args]() { return self->delegate(args); });
    };
    return function;
}

} // namespace Ramify
