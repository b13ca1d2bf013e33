// src/core/transport/line_framed.hpp
#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace transport
{

    // Longest frame accepted while waiting for its newline: 16 MiB
    constexpr size_t kMaxFrameBytes = 16u * 1024u * 1024u;

    // Splits an arbitrarily chunked byte stream into newline-terminated frames.
    // Bytes after the last newline are kept until a later chunk completes them.
    class LineFramer
    {
    public:
        explicit LineFramer(size_t max_len = kMaxFrameBytes) : max_len_(max_len) {}

        // Appends chunk and moves every completed frame (without its '\n') into out,
        // in arrival order.
        // Returns false (err set) when the pending partial frame grows past max_len.
        bool feed(std::string_view chunk, std::vector<std::string> &out, std::string &err);

        // Partial frame still waiting for its newline.
        const std::string &pending() const { return buffer_; }

        void reset() { buffer_.clear(); }

    private:
        std::string buffer_;
        size_t max_len_;
    };

    // Appends the single '\n' terminator.
    // Returns false (err set) if payload itself contains a newline.
    bool encode_frame(const std::string &payload, std::string &out, std::string &err);

} // namespace transport
