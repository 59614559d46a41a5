/**
 * @file output_capture.hpp
 * @brief Size-capped capture buffer for sandboxed output streams.
 * @author Dimitris Kafetzis
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace exec_engine {

/// Appended to a stream whose output went past the cap.
inline constexpr std::string_view kTruncationMarker = "\n[output truncated]\n";

/**
 * @brief Keeps at most `limit` bytes of a stream and counts the rest.
 *
 * Bytes past the cap are accepted and dropped so the writer is never
 * blocked on a full pipe.
 */
class CappedBuffer {
public:
    explicit CappedBuffer(size_t limit);

    void append(const char* data, size_t size);
    void append(std::string_view data) { append(data.data(), data.size()); }

    /// The retained bytes, with kTruncationMarker when anything was dropped.
    [[nodiscard]] std::string take();

    [[nodiscard]] bool truncated() const noexcept { return discarded_ > 0; }
    [[nodiscard]] uint64_t discarded() const noexcept { return discarded_; }
    [[nodiscard]] size_t size() const noexcept { return data_.size(); }

private:
    size_t limit_;
    std::string data_;
    uint64_t discarded_{0};
};

}  // namespace exec_engine
