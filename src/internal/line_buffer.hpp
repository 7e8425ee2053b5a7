#ifndef MCPCLI_INTERNAL_LINE_BUFFER_HPP
#define MCPCLI_INTERNAL_LINE_BUFFER_HPP

#include <optional>
#include <string>
#include <vector>

namespace mcpcli
{
namespace internal
{

// Reassembles '\n'-terminated lines from arbitrary chunks.
// Never holds a complete line between calls.
class LineBuffer
{
  public:
    // Append a chunk and return the non-blank lines it completed, in order
    // (terminator removed)
    std::vector<std::string> add_data(const std::string& data);
    std::vector<std::string> add_data(const char* data, size_t size);

    // End of stream: the unterminated tail, if it is not blank. Clears the buffer.
    std::optional<std::string> flush();

    // Check if buffer has buffered data
    bool has_buffered_data() const
    {
        return !buffer_.empty();
    }

    const std::string& buffered() const
    {
        return buffer_;
    }

    // Clear buffer
    void clear_buffer()
    {
        buffer_.clear();
        scanned_ = 0;
    }

  private:
    std::string buffer_;
    size_t scanned_ = 0; // Bytes of buffer_ already known to hold no '\n'
};

bool is_blank(const std::string& line);

} // namespace internal
} // namespace mcpcli

#endif // MCPCLI_INTERNAL_LINE_BUFFER_HPP
