#pragma once

#include "SBXTypes.h"
#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

namespace SBX {

/**
 * @brief Ordered, bounded console capture for one invocation
 *
 * Entries keep emission order. Once either cap would be exceeded a single warn entry
 * "console output truncated" is appended and later writes are dropped. A disabled
 * buffer ignores every write.
 *
 * Writes come from the invocation's execution thread; the mutex only matters when the
 * caller snapshots a buffer whose thread was abandoned after a timeout.
 */
class ConsoleBuffer {
public:
    static constexpr const char *TRUNCATION_MESSAGE = "console output truncated";

    ConsoleBuffer(bool enabled, size_t maxEntries, size_t maxBytes);

    void append(ConsoleLevel level, std::string message);

    bool isEnabled() const {
        return enabled_;
    }

    bool isTruncated() const;

    std::vector<ConsoleEntry> snapshot() const;

    std::vector<ConsoleEntry> takeEntries();

private:
    const bool enabled_;
    const size_t maxEntries_;
    const size_t maxBytes_;
    mutable std::mutex mutex_;
    std::vector<ConsoleEntry> entries_;
    size_t bytes_ = 0;
    bool truncated_ = false;
};

}  // namespace SBX
