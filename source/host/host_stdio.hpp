#ifndef CDPDBG_HOST_STDIO_HPP
#define CDPDBG_HOST_STDIO_HPP

// Host stdio transport: JSON objects in on stdin, out on stdout.
// Framing counts braces while respecting strings and escapes, so it works
// with newline-delimited and streamed JSON alike.

#include <deque>
#include <string>

namespace host_stdio {

class MessageFramer {
public:
    // Feed one character. Returns true when it completes a JSON object,
    // which is then moved into output_message.
    bool feed(char character, std::string &output_message);

    // Feed a chunk; every completed object is appended to output_messages.
    void feed(const char *data, size_t length, std::deque<std::string> &output_messages);

private:
    std::string buffer;
    int brace_depth = 0;
    bool inside_string = false;
    bool escape_next = false;
    bool started = false;
};

// Wait up to timeout_milliseconds for a complete message on stdin.
// Returns true with output_message set when one is available; sets
// end_of_input once stdin is closed and every buffered message was returned.
bool poll_message(int timeout_milliseconds, std::string &output_message, bool &end_of_input);

// Write a JSON message to stdout, followed by a newline.
void write_message(const std::string &json_string);

// Write a log message to stderr.
void log_message(const std::string &message);

} // namespace host_stdio

#endif // CDPDBG_HOST_STDIO_HPP
