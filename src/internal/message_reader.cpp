#include "message_reader.hpp"

#include <mcpguard/errors.hpp>

namespace mcpguard
{
namespace protocol
{

namespace
{
bool is_space(char c)
{
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

// Characters that end a bare scalar (number, literal) in a back-to-back stream
bool ends_scalar(char c)
{
    return is_space(c) || c == '{' || c == '[' || c == '"';
}
} // namespace

MessageReader::MessageReader(size_t max_buffer_size) : max_buffer_size_(max_buffer_size) {}

json MessageReader::parse_message(const std::string& text)
{
    try
    {
        return json::parse(text);
    }
    catch (const json::exception& e)
    {
        throw ProtocolDecodeError(std::string("JSON parse error: ") + e.what());
    }
}

void MessageReader::add_data(const std::string& data)
{
    buffer_ += data;

    if (buffer_.size() > max_buffer_size_)
    {
        size_t size = buffer_.size();
        size_t newline = buffer_.find('\n');
        if (newline == std::string::npos)
        {
            buffer_.clear();
            skip_line_ = true;
        }
        else
        {
            buffer_.erase(0, newline + 1);
        }
        reset_scan();
        throw ProtocolDecodeError("Buffer exceeded maximum size of " +
                                  std::to_string(max_buffer_size_) + " bytes (was " +
                                  std::to_string(size) + ")");
    }
}

std::optional<std::string> MessageReader::next_frame()
{
    if (scan_pos_ == 0)
    {
        if (skip_line_ && !skip_rest_of_line())
            return std::nullopt;

        size_t start = 0;
        while (start < buffer_.size() && is_space(buffer_[start]))
            ++start;
        buffer_.erase(0, start);
    }

    if (buffer_.empty())
        return std::nullopt;

    const char first = buffer_[0];
    const bool structured = first == '{' || first == '[';
    const bool quoted = first == '"';

    size_t i = scan_pos_;
    if (i == 0)
    {
        // Opening character of the frame
        if (structured)
            depth_ = 1;
        in_string_ = quoted;
        i = 1;
    }

    for (; i < buffer_.size(); ++i)
    {
        const char c = buffer_[i];

        if (in_string_)
        {
            // JSON strings cannot span lines
            if (c == '\n')
            {
                --i;
                break;
            }
            if (escaped_)
                escaped_ = false;
            else if (c == '\\')
                escaped_ = true;
            else if (c == '"')
            {
                in_string_ = false;
                if (quoted)
                    break;
            }
            continue;
        }

        if (!structured && !quoted)
        {
            if (ends_scalar(c))
            {
                --i; // frame ends before the delimiter
                break;
            }
            continue;
        }

        if (c == '"')
            in_string_ = true;
        else if (c == '{' || c == '[')
            ++depth_;
        else if (c == '}' || c == ']')
        {
            if (--depth_ == 0)
                break;
        }
    }

    if (i >= buffer_.size())
    {
        // Incomplete, resume from here once more data arrives
        scan_pos_ = buffer_.size();
        return std::nullopt;
    }

    std::string frame = buffer_.substr(0, i + 1);
    buffer_.erase(0, i + 1);
    reset_scan();
    return frame;
}

std::optional<json> MessageReader::read_message(const ReadFn& read_some)
{
    char chunk[4096];
    while (true)
    {
        if (auto frame = next_frame())
            return decode_frame(*frame);

        size_t n = read_some(chunk, sizeof(chunk));
        if (n == 0)
        {
            if (!has_buffered_data())
                return std::nullopt;

            // EOF in the middle of a value; a bare scalar is complete at EOF
            std::string rest = buffer_;
            bool bare_scalar = scan_pos_ > 0 && depth_ == 0 && !in_string_;
            clear_buffer();
            if (bare_scalar)
                return decode_frame(rest);
            throw ProtocolDecodeError("Unexpected end of input inside a message (" +
                                      std::to_string(rest.size()) + " bytes buffered)");
        }

        add_data(std::string(chunk, n));
    }
}

json MessageReader::decode_frame(const std::string& frame)
{
    try
    {
        return parse_message(frame);
    }
    catch (const ProtocolDecodeError&)
    {
        skip_line_ = true;
        throw;
    }
}

bool MessageReader::skip_rest_of_line()
{
    size_t newline = buffer_.find('\n');
    if (newline == std::string::npos)
    {
        buffer_.clear();
        return false;
    }
    buffer_.erase(0, newline + 1);
    skip_line_ = false;
    return true;
}

bool MessageReader::has_buffered_data() const
{
    for (char c : buffer_)
        if (!is_space(c))
            return true;
    return false;
}

void MessageReader::clear_buffer()
{
    buffer_.clear();
    skip_line_ = false;
    reset_scan();
}

void MessageReader::reset_scan()
{
    scan_pos_ = 0;
    depth_ = 0;
    in_string_ = false;
    escaped_ = false;
}

} // namespace protocol
} // namespace mcpguard
