// =================================================================
// tests/MockHost.hpp
// =================================================================
// Scriptable in-memory host and session used by the delegation tests.

#pragma once

#include "Ramify/Cancellation.hpp"
#include "Ramify/Host.hpp"
#include "Ramify/ToolFunction.hpp"
#include <algorithm>
#include <atomic>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace RamifyTest {

class MockSession;

/**
 * @brief Behaviour of the simulated model for one turn
 *
 * Runs on its own thread for every MESSAGE sent to the session. The turn
 * ends when the function returns.
 */
using TurnScript = std::function<void(MockSession& session, const std::string& text)>;

class MockSession : public Ramify::HostSession {
public:
    MockSession(const std::string& id, std::optional<std::string> parent_id = std::nullopt,
                std::vector<std::string> persons = {})
        : m_id(id), m_parent_id(std::move(parent_id)), m_persons(std::move(persons)) {}

    std::string getId() const override { return m_id; }
    std::optional<std::string> getParentId() const override { return m_parent_id; }
    std::vector<std::string> getPersonNames() const override { return m_persons; }

    std::future<void> sendMessage(Ramify::MessageKind kind, const std::string& text) override {
        TurnScript script;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_messages.emplace_back(kind, text);
            script = m_script;
        }

        if (kind != Ramify::MessageKind::MESSAGE || !script) {
            std::promise<void> done;
            done.set_value();
            return done.get_future();
        }

        return std::async(std::launch::async, [this, script, text]() { script(*this, text); });
    }

    void registerTools(const Ramify::ToolMap& tools) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& [name, tool] : tools) {
            m_tools[name] = tool;
        }
    }

    void setToolExecutionMode(Ramify::ToolExecutionMode mode) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_modes.push_back(mode);
    }

    Ramify::CancellationToken getCancellationToken() const override { return m_cancellation.token(); }

    void cancel() override {
        m_cancellation.cancel();
        ++m_cancel_count;
    }

    void dispose() override { ++m_dispose_count; }

    // --- Test helpers ---

    void setScript(TurnScript script) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_script = std::move(script);
    }

    /**
     * @brief Call a registered tool the way the model would
     * @return Reply text of the tool
     */
    std::string callTool(const std::string& name, const Ramify::ArgumentMap& args) {
        Ramify::ToolMap tools;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            tools = m_tools;
        }
        std::string reply = Ramify::invokeTool(tools, name, args);

        std::lock_guard<std::mutex> lock(m_mutex);
        m_replies.push_back(reply);
        return reply;
    }

    bool hasTool(const std::string& name) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_tools.count(name) > 0;
    }

    std::vector<std::pair<Ramify::MessageKind, std::string>> getMessages() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_messages;
    }

    size_t countMessages(Ramify::MessageKind kind) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return static_cast<size_t>(std::count_if(m_messages.begin(), m_messages.end(),
            [kind](const std::pair<Ramify::MessageKind, std::string>& m) { return m.first == kind; }));
    }

    std::vector<std::string> getReplies() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_replies;
    }

    std::vector<Ramify::ToolExecutionMode> getModes() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_modes;
    }

    int getCancelCount() const { return m_cancel_count.load(); }
    int getDisposeCount() const { return m_dispose_count.load(); }

private:
    std::string m_id;
    std::optional<std::string> m_parent_id;
    std::vector<std::string> m_persons;

    mutable std::mutex m_mutex;
    TurnScript m_script;
    Ramify::ToolMap m_tools;
    std::vector<std::pair<Ramify::MessageKind, std::string>> m_messages;
    std::vector<std::string> m_replies;
    std::vector<Ramify::ToolExecutionMode> m_modes;

    Ramify::CancellationSource m_cancellation;
    std::atomic<int> m_cancel_count{0};
    std::atomic<int> m_dispose_count{0};
};

class MockHost : public Ramify::Host {
public:
    /**
     * @brief Chooses the script of a new child from its creation index
     */
    using ScriptFactory = std::function<TurnScript(size_t index)>;

    std::shared_ptr<Ramify::HostSession> createChildSession(const std::shared_ptr<Ramify::HostSession>& parent,
                                                            const std::string& person_name) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        size_t index = m_children.size();
        std::optional<std::string> parent_id;
        if (parent) {
            parent_id = parent->getId();
        }

        auto child = std::make_shared<MockSession>("child-" + std::to_string(index + 1), parent_id,
                                                   std::vector<std::string>{person_name});
        if (m_factory) {
            child->setScript(m_factory(index));
        } else {
            child->setScript(m_script);
        }

        m_children.push_back(child);
        m_sessions[child->getId()] = child;
        m_persons_used.push_back(person_name);
        return child;
    }

    std::vector<Ramify::Assistant> listAssistants(const std::optional<std::string>& name = std::nullopt) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!name) {
            return m_assistants;
        }
        std::vector<Ramify::Assistant> matching;
        for (const auto& assistant : m_assistants) {
            if (assistant.name == *name) {
                matching.push_back(assistant);
            }
        }
        return matching;
    }

    std::shared_ptr<Ramify::HostSession> openSession(const std::string& session_id) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_sessions.find(session_id);
        return it == m_sessions.end() ? nullptr : it->second;
    }

    // --- Test helpers ---

    void addAssistant(const std::string& name, const std::string& description = "") {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_assistants.push_back(Ramify::Assistant{name, description});
    }

    void addSession(const std::shared_ptr<MockSession>& session) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_sessions[session->getId()] = session;
    }

    void setChildScript(TurnScript script) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_script = std::move(script);
    }

    void setScriptFactory(ScriptFactory factory) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_factory = std::move(factory);
    }

    std::vector<std::shared_ptr<MockSession>> getChildren() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_children;
    }

    std::vector<std::string> getPersonsUsed() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_persons_used;
    }

private:
    mutable std::mutex m_mutex;
    std::vector<Ramify::Assistant> m_assistants;
    std::map<std::string, std::shared_ptr<MockSession>> m_sessions;
    std::vector<std::shared_ptr<MockSession>> m_children;
    std::vector<std::string> m_persons_used;
    TurnScript m_script;
    ScriptFactory m_factory;
};

/**
 * @brief Script that answers every turn with a successful set_result call
 */
inline TurnScript succeedWith(const std::string& message, const std::string& tool = "set_result") {
    return [message, tool](MockSession& session, const std::string&) {
        Ramify::ArgumentMap args;
        args["success"] = true;
        args["message"] = message;
        session.callTool(tool, args);
    };
}

/**
 * @brief Script that reports an error through the error tool
 */
inline TurnScript reportErrorWith(const std::string& error_message, const std::string& tool = "report_error") {
    return [error_message, tool](MockSession& session, const std::string&) {
        Ramify::ArgumentMap args;
        args["error_message"] = error_message;
        session.callTool(tool, args);
    };
}

} // namespace RamifyTest
