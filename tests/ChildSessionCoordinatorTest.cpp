// =================================================================
// tests/ChildSessionCoordinatorTest.cpp
// =================================================================
// Unit tests for the child session state machine.

#include "Ramify/ChildSessionCoordinator.hpp"
#include "Ramify/Errors.hpp"
#include "Ramify/Logger.hpp"
#include "MockHost.hpp"
#include <iostream>
#include <cassert>
#include <chrono>
#include <future>
#include <memory>
#include <thread>

using namespace Ramify;
using RamifyTest::MockSession;

class ChildSessionCoordinatorTest {
private:
    DelegationConfig createConfig() {
        DelegationConfig config;
        config.function_name = "research";
        return config;
    }

    ErrorReportingConfig createErrorReporting(ErrorReportingBehavior behavior) {
        ErrorReportingConfig reporting;
        reporting.behavior = behavior;
        return reporting;
    }

    template<typename Predicate>
    bool waitUntil(Predicate predicate, std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (predicate()) {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return predicate();
    }

public:
    void testSuccessfulResult() {
        std::cout << "Testing successful result..." << std::endl;

        auto session = std::make_shared<MockSession>("child-1");
        session->setScript(RamifyTest::succeedWith("analysis done"));

        ChildSessionCoordinator coordinator(session, createConfig());
        ChildResult result = coordinator.run("Do the research", "Please report");

        assert(result.success);
        assert(result.result && result.result->find("analysis done") != std::string::npos);
        assert(coordinator.getState() == ChildState::SUCCEEDED);
        assert(coordinator.getUrgeAttempts() == 0);
        assert(session->getCancelCount() >= 1 && "Terminal states cancel the child");
        assert(session->hasTool("set_result"));
        assert(!session->hasTool("report_error") && "No error tool without error reporting");
        assert(session->getModes().front() == ToolExecutionMode::REQUIRE_ANY);

        auto messages = session->getMessages();
        assert(messages.size() == 1);
        assert(messages[0].first == MessageKind::MESSAGE);
        assert(messages[0].second == "Do the research");

        std::cout << "✓ Successful result test passed" << std::endl;
    }

    void testResultAfterOneReminder() {
        std::cout << "Testing result after one reminder..." << std::endl;

        auto session = std::make_shared<MockSession>("child-1");
        session->setScript([](MockSession& s, const std::string& text) {
            if (text == "Please report") {
                RamifyTest::succeedWith("late answer")(s, text);
            }
        });

        ChildSessionCoordinator coordinator(session, createConfig());
        ChildResult result = coordinator.run("Do the research", "Please report");

        assert(result.success);
        assert(coordinator.getUrgeAttempts() == 1);
        assert(session->countMessages(MessageKind::MESSAGE) == 2);

        std::cout << "✓ Result after reminder test passed" << std::endl;
    }

    void testUrgeCeiling() {
        std::cout << "Testing reminder ceiling..." << std::endl;

        auto session = std::make_shared<MockSession>("child-1");
        session->setScript([](MockSession&, const std::string&) {});

        ChildSessionCoordinator coordinator(session, createConfig());

        bool exhausted = false;
        try {
            coordinator.run("Do the research", "Please report");
        } catch (const DanglingExhaustedError& e) {
            exhausted = true;
            assert(std::string(e.what()).find("3 reminder attempts") != std::string::npos);
        }

        assert(exhausted && "Ignored reminders are fatal");
        assert(coordinator.getUrgeAttempts() == ChildSessionCoordinator::MAX_URGE_ATTEMPTS);
        assert(session->countMessages(MessageKind::MESSAGE) == 4 && "One prompt plus three reminders");
        assert(coordinator.getState() == ChildState::FAILED_DANGLING);
        assert(session->getCancelCount() >= 1);

        std::cout << "✓ Reminder ceiling test passed" << std::endl;
    }

    void testReportedError() {
        std::cout << "Testing reported error..." << std::endl;

        DelegationConfig config = createConfig();
        ErrorReportingConfig reporting = createErrorReporting(ErrorReportingBehavior::REPORT_ERROR);
        reporting.custom_parent_message = "Parent note: {ErrorMessage}";
        config.error_reporting = reporting;

        auto session = std::make_shared<MockSession>("child-1");
        session->setScript(RamifyTest::reportErrorWith("disk full"));

        ChildSessionCoordinator coordinator(session, config);
        ChildResult result = coordinator.run("Do the research", "Please report");

        assert(!result.success);
        assert(result.error_message && *result.error_message == "Parent note: disk full");
        assert(coordinator.getState() == ChildState::FAILED_REPORTED);
        assert(session->hasTool("report_error"));

        std::cout << "✓ Reported error test passed" << std::endl;
    }

    void testPausedErrorWaitsForIntervention() {
        std::cout << "Testing paused error..." << std::endl;

        DelegationConfig config = createConfig();
        config.error_reporting = createErrorReporting(ErrorReportingBehavior::PAUSE);

        auto session = std::make_shared<MockSession>("child-1");
        session->setScript(RamifyTest::reportErrorWith("need credentials"));

        ChildSessionCoordinator coordinator(session, config);
        auto running = std::async(std::launch::async, [&coordinator]() {
            return coordinator.run("Do the research", "Please report");
        });

        assert(waitUntil([&coordinator, &session]() {
            return coordinator.getState() == ChildState::PAUSED && session->getReplies().size() == 1;
        }));
        assert(session->getReplies()[0].find("paused") != std::string::npos);

        // Give the loop time to observe the ended turn; it must not urge
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        assert(session->countMessages(MessageKind::MESSAGE) == 1);

        ArgumentMap args;
        args["success"] = true;
        args["message"] = "resolved by operator";
        session->callTool("set_result", args);

        ChildResult result = running.get();
        assert(result.success);
        assert(result.result->find("resolved by operator") != std::string::npos);
        assert(coordinator.getState() == ChildState::SUCCEEDED);

        std::cout << "✓ Paused error test passed" << std::endl;
    }

    void testDanglingReportError() {
        std::cout << "Testing dangling turn with report_error..." << std::endl;

        DelegationConfig config = createConfig();
        config.dangling_behavior = DanglingBehavior::REPORT_ERROR;
        config.error_message = "No result was provided";

        auto session = std::make_shared<MockSession>("child-1");
        session->setScript([](MockSession&, const std::string&) {});

        ChildSessionCoordinator coordinator(session, config);
        ChildResult result = coordinator.run("Do the research", "Please report");

        assert(!result.success);
        assert(*result.error_message == "No result was provided");
        assert(coordinator.getState() == ChildState::FAILED_DANGLING);
        assert(session->countMessages(MessageKind::MESSAGE) == 1);

        config.error_message = "";
        auto second = std::make_shared<MockSession>("child-2");
        second->setScript([](MockSession&, const std::string&) {});
        ChildSessionCoordinator fallback(second, config);
        result = fallback.run("Do the research", "Please report");
        assert(*result.error_message == "Child session ended its turn without reporting a result.");

        std::cout << "✓ Dangling report_error test passed" << std::endl;
    }

    void testDanglingPause() {
        std::cout << "Testing dangling turn with pause..." << std::endl;

        DelegationConfig config = createConfig();
        config.dangling_behavior = DanglingBehavior::PAUSE;

        auto session = std::make_shared<MockSession>("child-1");
        session->setScript([](MockSession&, const std::string&) {});

        ChildSessionCoordinator coordinator(session, config);
        auto running = std::async(std::launch::async, [&coordinator]() {
            return coordinator.run("Do the research", "Please report");
        });

        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        assert(running.wait_for(std::chrono::milliseconds(0)) == std::future_status::timeout &&
               "A paused child keeps waiting");
        assert(session->countMessages(MessageKind::MESSAGE) == 1);

        ArgumentMap args;
        args["success"] = true;
        args["message"] = "manual";
        session->callTool("set_result", args);

        assert(running.get().success);

        std::cout << "✓ Dangling pause test passed" << std::endl;
    }

    void testValidationExhaustion() {
        std::cout << "Testing validation exhaustion..." << std::endl;

        auto session = std::make_shared<MockSession>("child-1");
        session->setScript([](MockSession& s, const std::string&) {
            for (int i = 0; i < ValidationFailureCounter::MAX_FAILURES; ++i) {
                s.callTool("set_result", ArgumentMap());
            }
        });

        ChildSessionCoordinator coordinator(session, createConfig());
        ChildResult result = coordinator.run("Do the research", "Please report");

        assert(!result.success);
        assert(result.error_message->find("Validation failed after 5 attempts") != std::string::npos);
        assert(coordinator.getState() == ChildState::FAILED_DANGLING);

        // The last reply is recorded after the gate has already settled
        assert(waitUntil([&session]() { return session->getReplies().size() == 5; }));
        auto replies = session->getReplies();
        assert(replies[0].find("Validation failed: ") == 0);

        std::cout << "✓ Validation exhaustion test passed" << std::endl;
    }

    void testCancellation() {
        std::cout << "Testing cancellation..." << std::endl;

        auto session = std::make_shared<MockSession>("child-1");
        session->setScript([](MockSession& s, const std::string&) {
            s.getCancellationToken().waitFor(std::chrono::milliseconds(5000));
        });

        CancellationSource source;
        ChildSessionCoordinator coordinator(session, createConfig());
        auto running = std::async(std::launch::async, [&coordinator, &source]() {
            return coordinator.run("Do the research", "Please report", source.token());
        });

        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        auto start = std::chrono::steady_clock::now();
        source.cancel();

        bool cancelled = false;
        try {
            running.get();
        } catch (const OperationCancelledError&) {
            cancelled = true;
        }

        auto elapsed = std::chrono::steady_clock::now() - start;
        assert(cancelled);
        assert(elapsed < std::chrono::milliseconds(2000) && "Cancellation interrupts the running turn");
        assert(coordinator.getState() == ChildState::CANCELLED);
        assert(session->getCancelCount() >= 1);

        std::cout << "✓ Cancellation test passed" << std::endl;
    }

    void testStateNames() {
        std::cout << "Testing state names..." << std::endl;

        assert(childStateToString(ChildState::AWAITING_TOOL) == "AwaitingTool");
        assert(childStateToString(ChildState::FAILED_REPORTED) == "FailedReported");
        assert(messageKindToString(MessageKind::INFO_ONLY) == "info_only");
        assert(messageKindToString(MessageKind::MESSAGE) == "message");
        assert(toolExecutionModeToString(ToolExecutionMode::REQUIRE_ANY) == "require_any");

        std::cout << "✓ State names test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running ChildSessionCoordinator unit tests..." << std::endl;

        testSuccessfulResult();
        testResultAfterOneReminder();
        testUrgeCeiling();
        testReportedError();
        testPausedErrorWaitsForIntervention();
        testDanglingReportError();
        testDanglingPause();
        testValidationExhaustion();
        testCancellation();
        testStateNames();

        std::cout << "All ChildSessionCoordinator tests passed!" << std::endl;
    }
};

int main() {
    try {
        Ramify::Logger::getInstance().setConsoleLogLevel(Ramify::LogLevel::ERROR);

        ChildSessionCoordinatorTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All ChildSessionCoordinator component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
