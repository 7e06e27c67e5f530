#include "scripting/ConsoleBuffer.h"

namespace SBX {

ConsoleBuffer::ConsoleBuffer(bool enabled, size_t maxEntries, size_t maxBytes)
    : enabled_(enabled), maxEntries_(maxEntries), maxBytes_(maxBytes) {}

void ConsoleBuffer::append(ConsoleLevel level, std::string message) {
    if (!enabled_) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (truncated_) {
        return;
    }

    if (entries_.size() >= maxEntries_ || bytes_ + message.size() > maxBytes_) {
        truncated_ = true;
        entries_.push_back(ConsoleEntry{ConsoleLevel::Warn, TRUNCATION_MESSAGE});
        return;
    }

    bytes_ += message.size();
    entries_.push_back(ConsoleEntry{level, std::move(message)});
}

bool ConsoleBuffer::isTruncated() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return truncated_;
}

std::vector<ConsoleEntry> ConsoleBuffer::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
}

std::vector<ConsoleEntry> ConsoleBuffer::takeEntries() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ConsoleEntry> entries = std::move(entries_);
    entries_.clear();
    return entries;
}

}  // namespace SBX
