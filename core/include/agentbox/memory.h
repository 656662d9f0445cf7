#pragma once

#include "errors.h"
#include "value.h"

#include <json-c/json.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace agentbox {

// ---- Messages: the flat conversation fed back to the model ----

enum class MessageRole { SYSTEM, USER, ASSISTANT, TOOL_CALL, TOOL_RESPONSE };

const char* message_role_name(MessageRole r);
std::optional<MessageRole> message_role_from_name(const std::string& s);

struct ContentBlock {
    enum class Type { TEXT, IMAGE } type{Type::TEXT};
    std::string text;   // TEXT: the text; IMAGE: image reference (path, URL or base64)

    static ContentBlock of_text(std::string t) { return {Type::TEXT, std::move(t)}; }
    static ContentBlock of_image(std::string ref) { return {Type::IMAGE, std::move(ref)}; }

    bool operator==(const ContentBlock& o) const { return type == o.type && text == o.text; }
};

struct Message {
    MessageRole role{MessageRole::USER};
    std::vector<ContentBlock> content;

    static Message text(MessageRole role, std::string t);

    bool operator==(const Message& o) const { return role == o.role && content == o.content; }
};

json_object* message_to_json(const Message& m);
bool message_from_json(json_object* o, Message* out);
json_object* messages_to_json(const std::vector<Message>& msgs);

// ---- Step records ----

struct ToolCall {
    std::string name;
    Value arguments;
    std::string id;   // stable for the turn; correlates the later tool response

    json_object* to_json() const;
};

// Error as recorded on a step: kind name plus message.
struct StepError {
    std::string type;
    std::string message;

    static StepError from(const AgentError& e);
};

enum class StepKind { SYSTEM_PROMPT, TASK, PLANNING, ACTION };

const char* step_kind_name(StepKind k);

// One entry of an agent run's history. The set of kinds is closed; each
// kind projects itself into messages.
class MemoryStep {
public:
    virtual ~MemoryStep() = default;
    virtual StepKind kind() const = 0;

    // Pure: depends on the step's fields and the two flags only.
    virtual std::vector<Message> to_messages(bool summary_mode, bool include_raw_memory) const = 0;

    // Serialized form with a "type" tag; caller owns the object.
    virtual json_object* to_json() const = 0;
};

class SystemPromptStep final : public MemoryStep {
public:
    explicit SystemPromptStep(std::string system_prompt) : system_prompt(std::move(system_prompt)) {}

    StepKind kind() const override { return StepKind::SYSTEM_PROMPT; }
    std::vector<Message> to_messages(bool summary_mode, bool include_raw_memory) const override;
    json_object* to_json() const override;

    std::string system_prompt;
};

class TaskStep final : public MemoryStep {
public:
    explicit TaskStep(std::string task, std::vector<std::string> task_images = {})
        : task(std::move(task)), task_images(std::move(task_images)) {}

    StepKind kind() const override { return StepKind::TASK; }
    std::vector<Message> to_messages(bool summary_mode, bool include_raw_memory) const override;
    json_object* to_json() const override;

    std::string task;
    std::vector<std::string> task_images;
};

class PlanningStep final : public MemoryStep {
public:
    PlanningStep(std::string facts, std::string plan) : facts(std::move(facts)), plan(std::move(plan)) {}

    StepKind kind() const override { return StepKind::PLANNING; }
    std::vector<Message> to_messages(bool summary_mode, bool include_raw_memory) const override;
    json_object* to_json() const override;

    std::string facts;
    std::string plan;
};

// Filled in progressively by the turn that owns it (timing, tool call,
// result, then error or observations) and handed to MemoryStore when done.
class ActionStep final : public MemoryStep {
public:
    ActionStep() = default;

    StepKind kind() const override { return StepKind::ACTION; }
    std::vector<Message> to_messages(bool summary_mode, bool include_raw_memory) const override;
    json_object* to_json() const override;

    // Serialized form without the agent_memory snapshot.
    json_object* to_json_succinct() const;

    std::optional<double> start_time;
    std::optional<double> end_time;
    std::optional<double> duration;
    int step_number{0};
    std::optional<std::vector<ToolCall>> tool_calls;
    std::optional<std::string> llm_output;
    std::optional<std::string> observations;
    std::vector<std::string> observations_images;
    Value action_output;
    std::optional<StepError> error;
    std::optional<std::vector<Message>> agent_memory;
};

// Rebuild any step from its to_json() form; nullptr (and *err) on bad input.
std::unique_ptr<MemoryStep> step_from_json(json_object* o, std::string* err);

// ---- MemoryStore ----

class MemoryStore {
public:
    // Appends at the end. A SystemPromptStep with position 0 replaces slot 0
    // instead (inserted when the store is empty); any other position, or
    // position 0 with another kind, throws std::invalid_argument.
    void append(std::unique_ptr<MemoryStep> step);
    void append(std::unique_ptr<MemoryStep> step, size_t position);

    // Clears the steps. The chat-message audit log is kept.
    void reset();

    size_t size() const { return steps_.size(); }
    bool empty() const { return steps_.empty(); }
    const MemoryStep& at(size_t i) const { return *steps_.at(i); }
    const std::vector<std::unique_ptr<MemoryStep>>& steps() const { return steps_; }

    std::vector<Message> to_messages(bool summary_mode = false, bool include_raw_memory = false) const;

    // Raw model responses, for auditing only; never part of to_messages().
    void log_chat_message(Message msg) { chat_messages_.push_back(std::move(msg)); }
    const std::vector<Message>& chat_messages() const { return chat_messages_; }

    // Array of steps without agent_memory snapshots.
    json_object* succinct_steps() const;
    // {"steps":[...], "chat_messages":[...]}
    json_object* full_steps() const;

    // Persistence for offline replay (same shape as full_steps()).
    json_object* to_json() const { return full_steps(); }
    static bool from_json(json_object* o, MemoryStore* out, std::string* err);
    std::string save(const std::string& path) const;                       // "" on success
    static std::string load(const std::string& path, MemoryStore* out);    // "" on success

private:
    std::vector<std::unique_ptr<MemoryStep>> steps_;
    std::vector<Message> chat_messages_;
};

} // namespace agentbox
