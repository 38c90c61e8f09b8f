#include "host/host_stdio.hpp"
#include "utils/debug_log.hpp"

#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <iostream>

namespace host_stdio {

bool MessageFramer::feed(char character, std::string &output_message) {
    // Skip anything before the opening brace (whitespace, newlines, etc.)
    if (!started) {
        if (character == '{') {
            started = true;
            brace_depth = 1;
            buffer = character;
        }
        return false;
    }

    buffer += character;

    if (escape_next) {
        escape_next = false;
        return false;
    }
    if (character == '\\' && inside_string) {
        escape_next = true;
        return false;
    }
    if (character == '"') {
        inside_string = !inside_string;
        return false;
    }
    if (inside_string) {
        return false;
    }

    if (character == '{') {
        brace_depth++;
    } else if (character == '}') {
        brace_depth--;
        if (brace_depth == 0) {
            output_message = std::move(buffer);
            buffer.clear();
            started = false;
            return true;
        }
    }
    return false;
}

void MessageFramer::feed(const char *data, size_t length, std::deque<std::string> &output_messages) {
    std::string message;
    for (size_t index = 0; index < length; index++) {
        if (feed(data[index], message)) {
            output_messages.push_back(std::move(message));
            message.clear();
        }
    }
}

// stdin state shared by successive poll_message() calls.
static MessageFramer stdin_framer;
static std::deque<std::string> ready_messages;
static bool stdin_closed = false;

bool poll_message(int timeout_milliseconds, std::string &output_message, bool &end_of_input) {
    end_of_input = false;

    if (ready_messages.empty() && !stdin_closed) {
        struct pollfd poll_descriptor;
        poll_descriptor.fd = STDIN_FILENO;
        poll_descriptor.events = POLLIN;
        poll_descriptor.revents = 0;
        int poll_status = poll(&poll_descriptor, 1, timeout_milliseconds);
        if (poll_status > 0) {
            char buffer[4096];
            ssize_t bytes_read = read(STDIN_FILENO, buffer, sizeof(buffer));
            if (bytes_read > 0) {
                stdin_framer.feed(buffer, static_cast<size_t>(bytes_read), ready_messages);
            } else if (bytes_read == 0 || (errno != EINTR && errno != EAGAIN)) {
                stdin_closed = true;
            }
        } else if (poll_status < 0 && errno != EINTR) {
            stdin_closed = true;
        }
    }

    if (!ready_messages.empty()) {
        output_message = std::move(ready_messages.front());
        ready_messages.pop_front();
        return true;
    }
    end_of_input = stdin_closed;
    return false;
}

void write_message(const std::string &json_string) {
    std::cout << json_string << "\n";
    std::cout.flush();
}

void log_message(const std::string &message) {
    debug_log::log_always(message);
}

} // namespace host_stdio
