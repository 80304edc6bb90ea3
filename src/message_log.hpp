#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

// Player-facing message log.
//
// The simulation never writes files. It pushes messages into a MessageSink owned
// by whoever drives it (frontend, headless runner, tests).

enum class MessageKind : uint8_t {
    Info = 0,
    Combat,
    Loot,
    System,
    Warning,
    Success,
};

const char* messageKindName(MessageKind k);

struct Message {
    std::string text;
    MessageKind kind = MessageKind::Info;
    bool fromPlayer = true;
    int repeat = 1;
    uint64_t tick = 0;
};

class MessageSink {
public:
    virtual ~MessageSink() = default;
    virtual void push(const Message& m) = 0;
};

// In-memory scrollback. Consecutive identical messages are coalesced into a
// repeat counter for the renderer.
class MessageLog : public MessageSink {
public:
    void push(const Message& m) override;

    const std::vector<Message>& messages() const { return msgs_; }
    size_t size() const { return msgs_.size(); }
    bool empty() const { return msgs_.empty(); }
    void clear() { msgs_.clear(); }

    // Count of messages (including repeats) whose text contains `needle`.
    int countContaining(const std::string& needle) const;

private:
    std::vector<Message> msgs_;
};

// One line per message: "<tick> <KIND> <text>[ xN]".
class StreamMessageSink : public MessageSink {
public:
    explicit StreamMessageSink(std::ostream& out) : out_(out) {}
    void push(const Message& m) override;

private:
    std::ostream& out_;
};

// Forwards to two sinks (either may be null).
class TeeMessageSink : public MessageSink {
public:
    TeeMessageSink(MessageSink* a, MessageSink* b) : a_(a), b_(b) {}
    void push(const Message& m) override;

private:
    MessageSink* a_ = nullptr;
    MessageSink* b_ = nullptr;
};
