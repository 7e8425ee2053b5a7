#include "line_buffer.hpp"

#include <algorithm>
#include <cctype>

namespace mcpcli
{
namespace internal
{

bool is_blank(const std::string& line)
{
    return std::all_of(line.begin(), line.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

std::vector<std::string> LineBuffer::add_data(const std::string& data)
{
    return add_data(data.data(), data.size());
}

std::vector<std::string> LineBuffer::add_data(const char* data, size_t size)
{
    buffer_.append(data, size);

    std::vector<std::string> lines;
    size_t start = 0;
    size_t pos;
    while ((pos = buffer_.find('\n', std::max(start, scanned_))) != std::string::npos)
    {
        std::string line = buffer_.substr(start, pos - start);
        if (!is_blank(line))
            lines.push_back(std::move(line));
        start = pos + 1;
    }

    buffer_.erase(0, start);
    scanned_ = buffer_.size();
    return lines;
}

std::optional<std::string> LineBuffer::flush()
{
    std::string tail;
    tail.swap(buffer_);
    scanned_ = 0;

    if (is_blank(tail))
        return std::nullopt;
    return tail;
}

} // namespace internal
} // namespace mcpcli
