/**
 * @file output_capture.cpp
 * @brief CappedBuffer implementation.
 * @author Dimitris Kafetzis
 */

#include "sandbox/output_capture.hpp"

#include <algorithm>

namespace exec_engine {

CappedBuffer::CappedBuffer(size_t limit) : limit_(limit) {}

void CappedBuffer::append(const char* data, size_t size) {
    size_t room = limit_ > data_.size() ? limit_ - data_.size() : 0;
    size_t kept = std::min(room, size);
    data_.append(data, kept);
    discarded_ += size - kept;
}

std::string CappedBuffer::take() {
    std::string out = std::move(data_);
    data_.clear();
    if (discarded_ > 0) {
        out += kTruncationMarker;
    }
    return out;
}

}  // namespace exec_engine
