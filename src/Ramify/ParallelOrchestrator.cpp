// =================================================================
// src/Ramify/ParallelOrchestrator.cpp
// =================================================================
// Implementation of the parallel execution engine.

#include "Ramify/ParallelOrchestrator.hpp"
#include "Ramify/Errors.hpp"
#include "Ramify/Logger.hpp"
#include "Ramify/WorkerPool.hpp"
#include <algorithm>
#include <condition_variable>
#include <deque>
#include <optional>
#include <thread>

namespace Ramify {

namespace {

constexpr std::chrono::milliseconds POLL_INTERVAL(10);

// State shared between the collecting thread and the workers
struct RunState {
    std::mutex mutex;
    std::condition_variable condition;
    std::vector<WorkItemOutcome> outcomes;
    std::deque<size_t> finished;
    std::exception_ptr fatal;
};

WorkItemOutcome runWorkItem(const WorkItem& item, const WorkItemRunner& runner,
                            const CancellationToken& run_token, std::chrono::milliseconds timeout) {
    WorkItemOutcome outcome;
    outcome.name = item.name;
    outcome.value = item.value;
    outcome.start_time = std::chrono::system_clock::now();

    CancellationSource item_source(run_token, timeout);

    try {
        item_source.token().throwIfCancellationRequested("Work item " + item.name);
        outcome.child_result = runner(item, item_source.token());
    } catch (const DanglingExhaustedError&) {
        throw;
    } catch (const OperationCancelledError& e) {
        if (item_source.hasTimedOut()) {
            WorkItemTimeoutError timeout_error("Work item " + item.name + "=" + item.value.toDisplayString() +
                                               " timed out after " + std::to_string(timeout.count()) + " ms");
            outcome.exception = std::make_exception_ptr(timeout_error);
            outcome.exception_message = timeout_error.what();
        } else {
            outcome.exception = std::current_exception();
            outcome.exception_message = e.what();
        }
    } catch (const std::exception& e) {
        outcome.exception = std::current_exception();
        outcome.exception_message = e.what();
    } catch (...) {
        outcome.exception = std::current_exception();
        outcome.exception_message = "Unknown error";
    }

    outcome.end_time = std::chrono::system_clock::now();
    return outcome;
}

} // namespace

NotificationGroup::~NotificationGroup() {
    wait();
}

void NotificationGroup::spawn(std::function<void()> task) {
    auto future = std::async(std::launch::async, [task = std::move(task)]() {
        try {
            task();
        } catch (const std::exception& e) {
            LOG_WARNING("ParallelOrchestrator", std::string("Notification failed: ") + e.what());
        }
    });

    std::lock_guard<std::mutex> lock(m_mutex);
    m_tasks.push_back(std::move(future));
}

void NotificationGroup::wait() {
    std::vector<std::future<void>> tasks;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto& task : m_tasks) {
            if (task.valid()) {
                tasks.push_back(std::move(task));
            }
        }
    }

    for (auto& task : tasks) {
        task.wait();
    }
}

size_t NotificationGroup::getSpawnedCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_tasks.size();
}

ParallelOrchestrator::ParallelOrchestrator(const ParallelConfig& config,
                                           std::shared_ptr<HostSession> parent_session)
    : m_config(config), m_parent_session(std::move(parent_session)) {}

int ParallelOrchestrator::effectiveConcurrency(int configured, size_t source_count) {
    int limit = configured;
    if (limit <= 0) {
        limit = static_cast<int>(std::thread::hardware_concurrency());
    }
    long bounded = std::min<long>(limit, static_cast<long>(source_count));
    return static_cast<int>(std::max<long>(1, bounded));
}

std::string ParallelOrchestrator::formatNotification(const WorkItemOutcome& outcome) {
    std::string prefix = "Parallel session " + outcome.name + "=" + outcome.value.toDisplayString();

    if (outcome.isSuccess()) {
        return prefix + " completed successfully: " + outcome.child_result->result.value_or("");
    }
    if (!outcome.exception && outcome.child_result) {
        return prefix + " reported an error: " + outcome.getErrorText();
    }
    return prefix + " failed: " + outcome.getErrorText();
}

AggregateOutcome ParallelOrchestrator::run(const std::vector<WorkItem>& sources, const WorkItemRunner& runner,
                                           const CancellationToken& token) {
    switch (m_config.result_strategy) {
        case ResultStrategy::STREAM_INDIVIDUAL:
        case ResultStrategy::WAIT_FOR_ALL:
        case ResultStrategy::FIRST_RESULT_WINS:
            break;
        default:
            throw ConfigurationError("Unsupported result strategy: " +
                                     std::to_string(static_cast<int>(m_config.result_strategy)));
    }

    if (sources.empty()) {
        throw ConfigurationError("No work items for parallel execution");
    }
    if (!runner) {
        throw ConfigurationError("No work item runner provided");
    }

    const ResultStrategy strategy = m_config.result_strategy;
    const size_t total = sources.size();
    const int concurrency = effectiveConcurrency(m_config.max_concurrency, total);
    const std::chrono::milliseconds timeout(m_config.session_timeout_ms);

    LOG_INFO("ParallelOrchestrator", "Starting " + std::to_string(total) + " work items",
             "Strategy: " + resultStrategyToString(strategy) + ", concurrency: " + std::to_string(concurrency));

    AggregateOutcome aggregate;
    aggregate.strategy = strategy;
    aggregate.total_count = static_cast<int>(total);
    aggregate.start_time = std::chrono::system_clock::now();

    auto state = std::make_shared<RunState>();
    state->outcomes.resize(total);

    CancellationSource run_source(token);
    CancellationToken run_token = run_source.token();

    NotificationGroup notifications;
    std::vector<size_t> arrival_order;
    std::optional<size_t> winner;
    bool cancelled_by_caller = false;
    std::exception_ptr fatal;

    {
        WorkerPool pool(static_cast<size_t>(concurrency), [state](std::exception_ptr failure) {
            std::lock_guard<std::mutex> lock(state->mutex);
            if (!state->fatal) {
                state->fatal = failure;
            }
            state->condition.notify_all();
        });

        for (size_t i = 0; i < total; ++i) {
            pool.submit([state, i, &sources, &runner, run_token, timeout]() {
                // DanglingExhaustedError escapes to the pool's failure handler
                WorkItemOutcome outcome = runWorkItem(sources[i], runner, run_token, timeout);

                std::lock_guard<std::mutex> lock(state->mutex);
                state->outcomes[i] = std::move(outcome);
                state->finished.push_back(i);
                state->condition.notify_all();
            });
        }

        while (arrival_order.size() < total) {
            std::vector<size_t> ready;
            {
                std::unique_lock<std::mutex> lock(state->mutex);
                state->condition.wait_for(lock, POLL_INTERVAL, [&state]() {
                    return !state->finished.empty() || state->fatal;
                });

                if (state->fatal) {
                    fatal = state->fatal;
                }
                ready.assign(state->finished.begin(), state->finished.end());
                state->finished.clear();
            }

            if (fatal) {
                LOG_ERROR("ParallelOrchestrator", "A work item failed fatally, cancelling the remaining items");
                run_source.cancel();
                break;
            }

            for (size_t index : ready) {
                arrival_order.push_back(index);
                const WorkItemOutcome& outcome = state->outcomes[index];

                if (strategy == ResultStrategy::STREAM_INDIVIDUAL) {
                    notifyParent(notifications, outcome);
                } else if (strategy == ResultStrategy::FIRST_RESULT_WINS && outcome.isSuccess()) {
                    winner = index;
                    break;
                }
            }

            if (winner) {
                LOG_INFO("ParallelOrchestrator", "First result arrived, cancelling the remaining items",
                         "Winner: " + sources[*winner].name + "=" + sources[*winner].value.toDisplayString());
                run_source.cancel();
                break;
            }

            if (token.isCancellationRequested()) {
                cancelled_by_caller = true;
                run_source.cancel();
                break;
            }
        }
        // Leaving the scope joins the workers; cancelled items finish promptly
    }

    notifications.wait();
    if (strategy == ResultStrategy::STREAM_INDIVIDUAL) {
        LOG_DEBUG("ParallelOrchestrator",
                  "Delivered " + std::to_string(notifications.getSpawnedCount()) + " parent notifications");
    }

    if (fatal) {
        std::rethrow_exception(fatal);
    }
    if (cancelled_by_caller) {
        throw OperationCancelledError("Parallel execution was cancelled");
    }

    aggregate.end_time = std::chrono::system_clock::now();

    if (strategy == ResultStrategy::FIRST_RESULT_WINS) {
        if (winner) {
            // Failures observed before the winner, then the winner itself
            for (size_t index : arrival_order) {
                if (index != *winner) {
                    aggregate.outcomes.push_back(state->outcomes[index]);
                }
            }
            aggregate.outcomes.push_back(state->outcomes[*winner]);
            aggregate.completed_count = 1;
            aggregate.failed_count = static_cast<int>(aggregate.outcomes.size()) - 1;
            aggregate.success = true;
        } else {
            aggregate.outcomes = state->outcomes;
            aggregate.completed_count = 0;
            aggregate.failed_count = static_cast<int>(total);
            aggregate.success = false;
            aggregate.error_message = "All parallel sessions failed";
        }
    } else {
        aggregate.outcomes = state->outcomes;
        aggregate.completed_count = static_cast<int>(std::count_if(
            aggregate.outcomes.begin(), aggregate.outcomes.end(),
            [](const WorkItemOutcome& outcome) { return outcome.isSuccess(); }));
        aggregate.failed_count = aggregate.total_count - aggregate.completed_count;
        aggregate.success = aggregate.completed_count > 0;
        if (!aggregate.success) {
            aggregate.error_message = std::to_string(aggregate.completed_count) + "/" +
                                      std::to_string(aggregate.total_count) + " completed, " +
                                      std::to_string(aggregate.failed_count) + " failed";
        }
    }

    Logger::getInstance().logParallelSummary(resultStrategyToString(strategy), total,
                                             static_cast<size_t>(aggregate.completed_count),
                                             static_cast<size_t>(aggregate.failed_count),
                                             static_cast<long>(aggregate.getDuration().count()));
    return aggregate;
}

void ParallelOrchestrator::notifyParent(NotificationGroup& group, const WorkItemOutcome& outcome) {
    if (!m_parent_session) {
        LOG_DEBUG("ParallelOrchestrator", "No parent session to notify for " + outcome.name);
        return;
    }

    auto parent = m_parent_session;
    std::string text = formatNotification(outcome);
    group.spawn([parent, text]() {
        parent->sendMessage(MessageKind::INFO_ONLY, text).get();
    });
}

} // namespace Ramify
