#include "message_log.hpp"

const char* messageKindName(MessageKind k) {
    switch (k) {
        case MessageKind::Info:    return "INFO";
        case MessageKind::Combat:  return "COMBAT";
        case MessageKind::Loot:    return "LOOT";
        case MessageKind::System:  return "SYSTEM";
        case MessageKind::Warning: return "WARNING";
        case MessageKind::Success: return "SUCCESS";
    }
    return "INFO";
}

void MessageLog::push(const Message& m) {
    if (!msgs_.empty()) {
        Message& last = msgs_.back();
        if (last.text == m.text && last.kind == m.kind && last.fromPlayer == m.fromPlayer) {
            if (last.repeat < 9999) {
                ++last.repeat;
            }
            last.tick = m.tick;
            return;
        }
    }

    // Keep some scrollback
    if (msgs_.size() > 400) {
        msgs_.erase(msgs_.begin(), msgs_.begin() + 100);
    }
    msgs_.push_back(m);
}

int MessageLog::countContaining(const std::string& needle) const {
    int n = 0;
    for (const auto& m : msgs_) {
        if (m.text.find(needle) != std::string::npos) n += m.repeat;
    }
    return n;
}

void StreamMessageSink::push(const Message& m) {
    out_ << m.tick << " " << messageKindName(m.kind) << " " << m.text;
    if (m.repeat > 1) out_ << " x" << m.repeat;
    out_ << "\n";
}

void TeeMessageSink::push(const Message& m) {
    if (a_) a_->push(m);
    if (b_) b_->push(m);
}
