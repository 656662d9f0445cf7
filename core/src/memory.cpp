#include "agentbox/memory.h"
#include "agentbox/json_util.h"

#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>

namespace agentbox {

namespace {

const char* kRetryHint =
    "\nNow let's retry: take care not to repeat previous errors! "
    "If you have retried several times, try a completely different approach.\n";

std::string strip(const std::string& s) {
    const char* ws = " \t\r\n\f\v";
    size_t b = s.find_first_not_of(ws);
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

void add_str(json_object* o, const char* key, const std::string& s) {
    json_object_object_add(o, key, json_util::new_string(s));
}

void add_opt_str(json_object* o, const char* key, const std::optional<std::string>& s) {
    json_object_object_add(o, key, s ? json_util::new_string(*s) : nullptr);
}

void add_opt_double(json_object* o, const char* key, const std::optional<double>& d) {
    json_object_object_add(o, key, d ? json_object_new_double(*d) : nullptr);
}

json_object* string_array(const std::vector<std::string>& v) {
    json_object* a = json_object_new_array();
    for (const auto& s : v) json_object_array_add(a, json_util::new_string(s));
    return a;
}

std::vector<std::string> read_string_array(json_object* o, const char* key) {
    std::vector<std::string> out;
    json_object* a = json_util::get_field(o, key);
    if (!a || !json_object_is_type(a, json_type_array)) return out;
    const size_t n = json_object_array_length(a);
    for (size_t i = 0; i < n; i++) {
        json_object* it = json_object_array_get_idx(a, i);
        if (it && json_object_is_type(it, json_type_string)) out.emplace_back(json_object_get_string(it));
    }
    return out;
}

std::optional<std::string> read_opt_str(json_object* o, const char* key) {
    return json_util::get_string(o, key);
}

std::optional<double> read_opt_double(json_object* o, const char* key) {
    return json_util::get_double(o, key);
}

json_object* new_step_object(StepKind k) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "type", json_object_new_string(step_kind_name(k)));
    return o;
}

} // namespace

// ---- messages ----

const char* message_role_name(MessageRole r) {
    switch (r) {
        case MessageRole::SYSTEM:        return "system";
        case MessageRole::USER:          return "user";
        case MessageRole::ASSISTANT:     return "assistant";
        case MessageRole::TOOL_CALL:     return "tool-call";
        case MessageRole::TOOL_RESPONSE: return "tool-response";
    }
    return "user";
}

std::optional<MessageRole> message_role_from_name(const std::string& s) {
    if (s == "system") return MessageRole::SYSTEM;
    if (s == "user") return MessageRole::USER;
    if (s == "assistant") return MessageRole::ASSISTANT;
    if (s == "tool-call") return MessageRole::TOOL_CALL;
    if (s == "tool-response") return MessageRole::TOOL_RESPONSE;
    return std::nullopt;
}

Message Message::text(MessageRole role, std::string t) {
    Message m;
    m.role = role;
    m.content.push_back(ContentBlock::of_text(std::move(t)));
    return m;
}

json_object* message_to_json(const Message& m) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "role", json_object_new_string(message_role_name(m.role)));
    json_object* content = json_object_new_array();
    for (const auto& b : m.content) {
        json_object* bo = json_object_new_object();
        if (b.type == ContentBlock::Type::TEXT) {
            json_object_object_add(bo, "type", json_object_new_string("text"));
            add_str(bo, "text", b.text);
        } else {
            json_object_object_add(bo, "type", json_object_new_string("image"));
            add_str(bo, "image", b.text);
        }
        json_object_array_add(content, bo);
    }
    json_object_object_add(o, "content", content);
    return o;
}

bool message_from_json(json_object* o, Message* out) {
    auto role_s = json_util::get_string(o, "role");
    if (!role_s || !out) return false;
    auto role = message_role_from_name(*role_s);
    if (!role) return false;

    Message m;
    m.role = *role;
    json_object* content = json_util::get_field(o, "content");
    if (content && json_object_is_type(content, json_type_string)) {
        // plain-string content is accepted as a single text block
        m.content.push_back(ContentBlock::of_text(json_object_get_string(content)));
    } else if (content && json_object_is_type(content, json_type_array)) {
        const size_t n = json_object_array_length(content);
        for (size_t i = 0; i < n; i++) {
            json_object* b = json_object_array_get_idx(content, i);
            auto type = json_util::get_string(b, "type");
            if (!type) return false;
            if (*type == "text") {
                auto t = json_util::get_string(b, "text");
                if (!t) return false;
                m.content.push_back(ContentBlock::of_text(*t));
            } else if (*type == "image") {
                auto img = json_util::get_string(b, "image");
                if (!img) return false;
                m.content.push_back(ContentBlock::of_image(*img));
            } else {
                return false;
            }
        }
    } else if (content) {
        return false;
    }
    *out = std::move(m);
    return true;
}

json_object* messages_to_json(const std::vector<Message>& msgs) {
    json_object* a = json_object_new_array();
    for (const auto& m : msgs) json_object_array_add(a, message_to_json(m));
    return a;
}

// ---- tool calls / errors ----

json_object* ToolCall::to_json() const {
    json_object* o = json_object_new_object();
    add_str(o, "id", id);
    json_object_object_add(o, "type", json_object_new_string("function"));
    json_object* fn = json_object_new_object();
    add_str(fn, "name", name);
    json_object_object_add(fn, "arguments", value_to_json(arguments));
    json_object_object_add(o, "function", fn);
    return o;
}

static bool tool_call_from_json(json_object* o, ToolCall* out, std::string* err) {
    auto id = json_util::get_string(o, "id");
    json_object* fn = json_util::get_field(o, "function");
    auto name = json_util::get_string(fn, "name");
    if (!id || !name) { *err = "tool call without id/function.name"; return false; }
    ToolCall tc;
    tc.id = *id;
    tc.name = *name;
    if (!value_from_json(json_util::get_field(fn, "arguments"), &tc.arguments, err)) return false;
    *out = std::move(tc);
    return true;
}

StepError StepError::from(const AgentError& e) {
    return StepError{e.kind_name(), e.what()};
}

const char* step_kind_name(StepKind k) {
    switch (k) {
        case StepKind::SYSTEM_PROMPT: return "system_prompt";
        case StepKind::TASK:          return "task";
        case StepKind::PLANNING:      return "planning";
        case StepKind::ACTION:        return "action";
    }
    return "action";
}

// ---- SystemPromptStep ----

std::vector<Message> SystemPromptStep::to_messages(bool summary_mode, bool) const {
    if (summary_mode) return {};
    return {Message::text(MessageRole::SYSTEM, strip(system_prompt))};
}

json_object* SystemPromptStep::to_json() const {
    json_object* o = new_step_object(kind());
    add_str(o, "system_prompt", system_prompt);
    return o;
}

// ---- TaskStep ----

std::vector<Message> TaskStep::to_messages(bool, bool) const {
    Message m = Message::text(MessageRole::USER, "New task:\n" + task);
    for (const auto& img : task_images) m.content.push_back(ContentBlock::of_image(img));
    return {m};
}

json_object* TaskStep::to_json() const {
    json_object* o = new_step_object(kind());
    add_str(o, "task", task);
    json_object_object_add(o, "task_images", string_array(task_images));
    return o;
}

// ---- PlanningStep ----

std::vector<Message> PlanningStep::to_messages(bool summary_mode, bool) const {
    std::vector<Message> out;
    out.push_back(Message::text(MessageRole::ASSISTANT, "[FACTS LIST]:\n" + strip(facts)));
    if (!summary_mode) {
        out.push_back(Message::text(MessageRole::ASSISTANT, "[PLAN]:\n" + strip(plan)));
    }
    return out;
}

json_object* PlanningStep::to_json() const {
    json_object* o = new_step_object(kind());
    add_str(o, "facts", facts);
    add_str(o, "plan", plan);
    return o;
}

// ---- ActionStep ----

std::vector<Message> ActionStep::to_messages(bool summary_mode, bool include_raw_memory) const {
    std::vector<Message> out;

    if (agent_memory && include_raw_memory) {
        json_object* snap = messages_to_json(*agent_memory);
        out.push_back(Message::text(MessageRole::SYSTEM, json_util::to_plain(snap)));
        json_object_put(snap);
    }
    if (llm_output && !summary_mode) {
        out.push_back(Message::text(MessageRole::ASSISTANT, strip(*llm_output)));
    }
    if (tool_calls) {
        json_object* a = json_object_new_array();
        for (const auto& tc : *tool_calls) json_object_array_add(a, tc.to_json());
        out.push_back(Message::text(MessageRole::ASSISTANT, json_util::to_plain(a)));
        json_object_put(a);
    }

    const bool has_call = tool_calls && !tool_calls->empty();
    if (error) {
        std::string text = "Error:\n" + error->message + kRetryHint;
        if (!has_call) {
            out.push_back(Message::text(MessageRole::ASSISTANT, text));
        } else {
            out.push_back(Message::text(MessageRole::TOOL_RESPONSE,
                                        "Call id: " + tool_calls->front().id + "\n" + text));
        }
    } else if (observations && has_call) {
        out.push_back(Message::text(MessageRole::TOOL_RESPONSE,
                                    "Call id: " + tool_calls->front().id + "\nObservation:\n" + *observations));
    }

    if (!observations_images.empty()) {
        Message m = Message::text(MessageRole::USER, "Here are the observed images:");
        for (const auto& img : observations_images) m.content.push_back(ContentBlock::of_image(img));
        out.push_back(std::move(m));
    }
    return out;
}

json_object* ActionStep::to_json_succinct() const {
    json_object* o = new_step_object(kind());
    if (tool_calls) {
        json_object* a = json_object_new_array();
        for (const auto& tc : *tool_calls) json_object_array_add(a, tc.to_json());
        json_object_object_add(o, "tool_calls", a);
    } else {
        json_object_object_add(o, "tool_calls", nullptr);
    }
    add_opt_double(o, "start_time", start_time);
    add_opt_double(o, "end_time", end_time);
    json_object_object_add(o, "step", json_object_new_int(step_number));
    if (error) {
        json_object* e = json_object_new_object();
        add_str(e, "type", error->type);
        add_str(e, "message", error->message);
        json_object_object_add(o, "error", e);
    } else {
        json_object_object_add(o, "error", nullptr);
    }
    add_opt_double(o, "duration", duration);
    add_opt_str(o, "llm_output", llm_output);
    add_opt_str(o, "observations", observations);
    json_object_object_add(o, "observations_images", string_array(observations_images));
    json_object_object_add(o, "action_output", value_to_json(action_output));
    return o;
}

json_object* ActionStep::to_json() const {
    json_object* o = to_json_succinct();
    json_object_object_add(o, "agent_memory", agent_memory ? messages_to_json(*agent_memory) : nullptr);
    return o;
}

static std::unique_ptr<MemoryStep> action_from_json(json_object* o, std::string* err) {
    auto step = std::make_unique<ActionStep>();

    json_object* calls = json_util::get_field(o, "tool_calls");
    if (calls && json_object_is_type(calls, json_type_array)) {
        std::vector<ToolCall> tcs;
        const size_t n = json_object_array_length(calls);
        for (size_t i = 0; i < n; i++) {
            ToolCall tc;
            if (!tool_call_from_json(json_object_array_get_idx(calls, i), &tc, err)) return nullptr;
            tcs.push_back(std::move(tc));
        }
        step->tool_calls = std::move(tcs);
    }
    step->start_time = read_opt_double(o, "start_time");
    step->end_time = read_opt_double(o, "end_time");
    step->duration = read_opt_double(o, "duration");
    step->step_number = (int)json_util::get_int(o, "step").value_or(0);
    step->llm_output = read_opt_str(o, "llm_output");
    step->observations = read_opt_str(o, "observations");
    step->observations_images = read_string_array(o, "observations_images");

    json_object* e = json_util::get_field(o, "error");
    if (e && json_object_is_type(e, json_type_object)) {
        StepError se;
        se.type = json_util::get_string(e, "type").value_or("AgentError");
        se.message = json_util::get_string(e, "message").value_or("");
        step->error = std::move(se);
    }
    if (!value_from_json(json_util::get_field(o, "action_output"), &step->action_output, err)) {
        *err = "action_output: " + *err;
        return nullptr;
    }

    json_object* mem = json_util::get_field(o, "agent_memory");
    if (mem && json_object_is_type(mem, json_type_array)) {
        std::vector<Message> snap;
        const size_t n = json_object_array_length(mem);
        for (size_t i = 0; i < n; i++) {
            Message m;
            if (!message_from_json(json_object_array_get_idx(mem, i), &m)) {
                *err = "agent_memory: malformed message";
                return nullptr;
            }
            snap.push_back(std::move(m));
        }
        step->agent_memory = std::move(snap);
    }
    return step;
}

std::unique_ptr<MemoryStep> step_from_json(json_object* o, std::string* err) {
    std::string scratch;
    if (!err) err = &scratch;
    auto type = json_util::get_string(o, "type");
    if (!type) { *err = "step without type"; return nullptr; }

    if (*type == "system_prompt") {
        auto p = json_util::get_string(o, "system_prompt");
        if (!p) { *err = "system_prompt step without text"; return nullptr; }
        return std::make_unique<SystemPromptStep>(*p);
    }
    if (*type == "task") {
        auto t = json_util::get_string(o, "task");
        if (!t) { *err = "task step without text"; return nullptr; }
        return std::make_unique<TaskStep>(*t, read_string_array(o, "task_images"));
    }
    if (*type == "planning") {
        auto facts = json_util::get_string(o, "facts");
        auto plan = json_util::get_string(o, "plan");
        if (!facts || !plan) { *err = "planning step without facts/plan"; return nullptr; }
        return std::make_unique<PlanningStep>(*facts, *plan);
    }
    if (*type == "action") return action_from_json(o, err);

    *err = "unknown step type '" + *type + "'";
    return nullptr;
}

// ---- MemoryStore ----

void MemoryStore::append(std::unique_ptr<MemoryStep> step) {
    if (!step) throw std::invalid_argument("MemoryStore::append: null step");
    steps_.push_back(std::move(step));
}

void MemoryStore::append(std::unique_ptr<MemoryStep> step, size_t position) {
    if (!step) throw std::invalid_argument("MemoryStore::append: null step");
    if (position != 0 || step->kind() != StepKind::SYSTEM_PROMPT) {
        throw std::invalid_argument("MemoryStore::append: only a system prompt may be placed at position 0");
    }
    if (steps_.empty()) {
        steps_.push_back(std::move(step));
    } else {
        steps_[0] = std::move(step);
    }
}

void MemoryStore::reset() {
    steps_.clear();
}

std::vector<Message> MemoryStore::to_messages(bool summary_mode, bool include_raw_memory) const {
    std::vector<Message> out;
    for (const auto& s : steps_) {
        auto part = s->to_messages(summary_mode, include_raw_memory);
        out.insert(out.end(), std::make_move_iterator(part.begin()), std::make_move_iterator(part.end()));
    }
    return out;
}

json_object* MemoryStore::succinct_steps() const {
    json_object* a = json_object_new_array();
    for (const auto& s : steps_) {
        if (s->kind() == StepKind::ACTION) {
            json_object_array_add(a, static_cast<const ActionStep&>(*s).to_json_succinct());
        } else {
            json_object_array_add(a, s->to_json());
        }
    }
    return a;
}

json_object* MemoryStore::full_steps() const {
    json_object* o = json_object_new_object();
    json_object* a = json_object_new_array();
    for (const auto& s : steps_) json_object_array_add(a, s->to_json());
    json_object_object_add(o, "steps", a);
    json_object_object_add(o, "chat_messages", messages_to_json(chat_messages_));
    return o;
}

bool MemoryStore::from_json(json_object* o, MemoryStore* out, std::string* err) {
    std::string scratch;
    if (!err) err = &scratch;
    if (!out) { *err = "null output"; return false; }
    json_object* steps = json_util::get_field(o, "steps");
    if (!steps || !json_object_is_type(steps, json_type_array)) {
        *err = "memory document without a steps array";
        return false;
    }

    MemoryStore m;
    const size_t n = json_object_array_length(steps);
    for (size_t i = 0; i < n; i++) {
        auto step = step_from_json(json_object_array_get_idx(steps, i), err);
        if (!step) {
            *err = "step " + std::to_string(i) + ": " + *err;
            return false;
        }
        m.steps_.push_back(std::move(step));
    }

    json_object* chat = json_util::get_field(o, "chat_messages");
    if (chat && json_object_is_type(chat, json_type_array)) {
        const size_t cn = json_object_array_length(chat);
        for (size_t i = 0; i < cn; i++) {
            Message msg;
            if (!message_from_json(json_object_array_get_idx(chat, i), &msg)) {
                *err = "chat_messages[" + std::to_string(i) + "] malformed";
                return false;
            }
            m.chat_messages_.push_back(std::move(msg));
        }
    }
    *out = std::move(m);
    return true;
}

std::string MemoryStore::save(const std::string& path) const {
    json_object* doc = to_json();
    std::string text = json_util::to_pretty(doc);
    json_object_put(doc);

    std::ofstream f(path, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!f) return "cannot open for writing: " + path;
    f << text << "\n";
    f.flush();
    if (!f) return "write failed: " + path;
    return "";
}

std::string MemoryStore::load(const std::string& path, MemoryStore* out) {
    std::ifstream f(path, std::ios::in | std::ios::binary);
    if (!f) return "cannot open: " + path;
    std::ostringstream ss;
    ss << f.rdbuf();

    json_util::Doc d;
    if (!json_util::parse_ok(ss.str(), &d) || !d) return "invalid JSON: " + path;
    std::string err;
    if (!from_json(d.root, out, &err)) return err;
    return "";
}

} // namespace agentbox
