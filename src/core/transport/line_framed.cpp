// src/core/transport/line_framed.cpp
#include "line_framed.hpp"

namespace transport
{

    bool LineFramer::feed(std::string_view chunk, std::vector<std::string> &out, std::string &err)
    {
        err.clear();

        if (chunk.empty())
        {
            return true;
        }

        buffer_.append(chunk.data(), chunk.size());

        // Everything before the last newline is complete; the tail is retained
        // (empty if the chunk ended exactly on a newline).
        size_t start = 0;
        while (true)
        {
            const size_t nl = buffer_.find('\n', start);
            if (nl == std::string::npos)
            {
                break;
            }
            out.emplace_back(buffer_, start, nl - start);
            start = nl + 1;
        }

        if (start > 0)
        {
            buffer_.erase(0, start);
        }

        if (buffer_.size() > max_len_)
        {
            err = "frame length exceeds max (" + std::to_string(buffer_.size()) +
                  " bytes without newline)";
            return false;
        }

        return true;
    }

    bool encode_frame(const std::string &payload, std::string &out, std::string &err)
    {
        err.clear();

        if (payload.find('\n') != std::string::npos)
        {
            err = "frame payload contains a newline";
            return false;
        }

        out.clear();
        out.reserve(payload.size() + 1);
        out += payload;
        out += '\n';
        return true;
    }

} // namespace transport
