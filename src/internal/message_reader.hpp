#ifndef MCPGUARD_INTERNAL_MESSAGE_READER_HPP
#define MCPGUARD_INTERNAL_MESSAGE_READER_HPP

#include <mcpguard/options.hpp>
#include <mcpguard/types.hpp>
#include <functional>
#include <optional>
#include <string>

namespace mcpguard
{
namespace protocol
{

/**
 * Splits a byte stream into back-to-back JSON values.
 *
 * Values may be separated by any whitespace (newline-delimited streams are the
 * common case) or simply follow each other. Objects and arrays are delimited by
 * tracking nesting depth outside of string literals, so a pretty-printed value
 * spanning several lines is still one frame.
 *
 * A frame that fails to decode also drops the rest of its line, so stray text
 * on a newline-delimited stream (a startup banner, a log line) costs exactly
 * one decode error.
 */
class MessageReader
{
  public:
    // Pulls up to size bytes from the underlying stream, 0 on EOF
    using ReadFn = std::function<size_t(char* buffer, size_t size)>;

    explicit MessageReader(size_t max_buffer_size = DEFAULT_MAX_MESSAGE_SIZE);

    // Parse one complete JSON text, throws ProtocolDecodeError
    static json parse_message(const std::string& text);

    // Append raw bytes. Throws ProtocolDecodeError when a pending value outgrows
    // the size limit; that value is dropped through the end of its line.
    void add_data(const std::string& data);

    // Next complete frame, if the buffer holds one
    std::optional<std::string> next_frame();

    // Block on read_some until a value is decoded. Returns std::nullopt on a
    // clean EOF; a value cut short by EOF throws ProtocolDecodeError.
    std::optional<json> read_message(const ReadFn& read_some);

    // True when non-whitespace bytes are waiting
    bool has_buffered_data() const;

    void clear_buffer();

  private:
    json decode_frame(const std::string& frame);
    bool skip_rest_of_line();
    void reset_scan();

    std::string buffer_;
    size_t max_buffer_size_;

    // Incremental scan state for the frame at the front of buffer_
    size_t scan_pos_ = 0;
    int depth_ = 0;
    bool in_string_ = false;
    bool escaped_ = false;

    // Set after a bad frame; bytes up to the next newline are discarded
    bool skip_line_ = false;
};

} // namespace protocol
} // namespace mcpguard

#endif // MCPGUARD_INTERNAL_MESSAGE_READER_HPP
