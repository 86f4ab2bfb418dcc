// =================================================================
// tests/CompletionGateTest.cpp
// =================================================================
// Unit tests for CompletionGate, EventSignal and the result tools.

#include "Ramify/CompletionGate.hpp"
#include "Ramify/DelegationConfig.hpp"
#include "Ramify/Errors.hpp"
#include "Ramify/ResultTools.hpp"
#include <iostream>
#include <cassert>
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace Ramify;

class CompletionGateTest {
public:
    void testSetOnce() {
        std::cout << "Testing set-once semantics..." << std::endl;

        CompletionGate gate;
        assert(!gate.isSettled());
        assert(gate.trySet(ChildResult::succeeded("first")));
        assert(!gate.trySet(ChildResult::succeeded("second")));
        assert(!gate.trySetFault(std::make_exception_ptr(DelegationError("late"))));

        ChildResult result = gate.get();
        assert(result.success);
        assert(result.result && *result.result == "first");
        assert(!gate.isFaulted());

        std::cout << "✓ Set-once test passed" << std::endl;
    }

    void testConcurrentSetters() {
        std::cout << "Testing concurrent setters..." << std::endl;

        for (int round = 0; round < 20; ++round) {
            CompletionGate gate;
            std::atomic<int> winners{0};
            std::atomic<int> winning_index{-1};
            std::vector<std::thread> threads;

            for (int i = 0; i < 8; ++i) {
                threads.emplace_back([&gate, &winners, &winning_index, i]() {
                    if (gate.trySet(ChildResult::succeeded("setter-" + std::to_string(i)))) {
                        ++winners;
                        winning_index = i;
                    }
                });
            }
            for (auto& thread : threads) {
                thread.join();
            }

            assert(winners == 1 && "Exactly one concurrent trySet wins");
            assert(*gate.get().result == "setter-" + std::to_string(winning_index.load()));
        }

        std::cout << "✓ Concurrent setters test passed" << std::endl;
    }

    void testFault() {
        std::cout << "Testing faulted gate..." << std::endl;

        CompletionGate gate;
        assert(gate.trySetFault(std::make_exception_ptr(ValidationExhaustedError("too many attempts"))));
        assert(gate.isSettled());
        assert(gate.isFaulted());
        assert(!gate.trySet(ChildResult::succeeded("ignored")));

        bool threw = false;
        try {
            gate.get();
        } catch (const ValidationExhaustedError& e) {
            threw = true;
            assert(std::string(e.what()) == "too many attempts");
        }
        assert(threw);

        std::cout << "✓ Faulted gate test passed" << std::endl;
    }

    void testUnsettledGet() {
        std::cout << "Testing unsettled get..." << std::endl;

        CompletionGate gate;
        bool threw = false;
        try {
            gate.get();
        } catch (const DelegationError&) {
            threw = true;
        }
        assert(threw);
        assert(!gate.waitFor(std::chrono::milliseconds(5)));

        std::cout << "✓ Unsettled get test passed" << std::endl;
    }

    void testSignalLatches() {
        std::cout << "Testing event signal..." << std::endl;

        auto signal = std::make_shared<EventSignal>();
        CompletionGate gate(signal);

        gate.trySet(ChildResult::failed("nope"));
        assert(signal->waitFor(std::chrono::milliseconds(0)) && "Notification before the wait is kept");
        assert(!signal->waitFor(std::chrono::milliseconds(0)) && "The signal resets after a wait");

        std::thread notifier([signal]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            signal->notify();
        });
        assert(signal->waitFor(std::chrono::seconds(5)));
        notifier.join();

        std::cout << "✓ Event signal test passed" << std::endl;
    }

    void testReturnToolFiltersArguments() {
        std::cout << "Testing return tool..." << std::endl;

        DelegationConfig config;
        auto tool = std::make_shared<ReturnResultTool>("child-1", config.getReturnToolSchema());

        ArgumentMap args;
        args["success"] = true;
        args["message"] = "done";
        args["unexpected"] = "dropped";

        std::string reply = tool->setResult(args);
        assert(reply == "Custom result set and returned to parent session. Session child-1 will now close.");

        ChildResult result = tool->getGate().get();
        assert(result.success);
        nlohmann::json payload = nlohmann::json::parse(*result.result);
        assert(payload["success"] == true);
        assert(payload["message"] == "done");
        assert(!payload.contains("unexpected") && "Undeclared arguments are not returned");

        std::string second = tool->setResult(args);
        assert(second.find("was already set") != std::string::npos);

        std::cout << "✓ Return tool test passed" << std::endl;
    }

    void testReturnToolExhaustion() {
        std::cout << "Testing return tool exhaustion..." << std::endl;

        DelegationConfig config;
        auto tool = std::make_shared<ReturnResultTool>("child-2", config.getReturnToolSchema());
        ArgumentMap empty;

        for (int i = 1; i < ValidationFailureCounter::MAX_FAILURES; ++i) {
            std::string reply = tool->setResult(empty);
            assert(reply == "Validation failed: Missing required parameters: success.");
            assert(!tool->getGate().isSettled());
        }

        std::string last = tool->setResult(empty);
        assert(last.find("will now close due to exceeded retry attempts") != std::string::npos);
        assert(tool->getGate().isFaulted());
        assert(tool->getMissingRequiredFailures() == ValidationFailureCounter::MAX_FAILURES);

        std::cout << "✓ Return tool exhaustion test passed" << std::endl;
    }

    void testParentMessageTemplate() {
        std::cout << "Testing parent message template..." << std::endl;

        auto timestamp = std::chrono::system_clock::from_time_t(0);
        std::string message = ErrorReportingTool::buildParentMessage(
            "{FunctionName}/{SessionId} at {Timestamp} via {ErrorToolName}: {ErrorMessage}",
            "research", "child-9", timestamp, "quota {SessionId}", "report_error");
        assert(message == "research/child-9 at 1970-01-01T00:00:00Z via report_error: quota {SessionId}");

        std::string fallback = ErrorReportingTool::buildParentMessage("", "research", "child-9", timestamp,
                                                                      "disk full", "report_error");
        assert(fallback == "disk full" && "Without a template the child's message is passed on");

        std::string blank = ErrorReportingTool::buildParentMessage("  ", "research", "child-9", timestamp,
                                                                   "", "report_error");
        assert(blank == ErrorReportingTool::getDefaultParentMessage());

        std::string empty_render = ErrorReportingTool::buildParentMessage("{ErrorMessage}", "research", "child-9",
                                                                          timestamp, " ", "report_error");
        assert(empty_render == ErrorReportingTool::getDefaultParentMessage());

        std::cout << "✓ Parent message template test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running CompletionGate unit tests..." << std::endl;

        testSetOnce();
        testConcurrentSetters();
        testFault();
        testUnsettledGet();
        testSignalLatches();
        testReturnToolFiltersArguments();
        testReturnToolExhaustion();
        testParentMessageTemplate();

        std::cout << "All CompletionGate tests passed!" << std::endl;
    }
};

int main() {
    try {
        CompletionGateTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All CompletionGate component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
