#pragma once

#include "protocol.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace hostbridge::codec {

class DecodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Decode one raw channel message into a Command.
 *
 * @param bytes Everything read between one open and end-of-stream
 * @throws DecodeError on invalid JSON, a missing or non-string "Command",
 *         a non-object "Arguments", or an argument value that is not a
 *         string, boolean or number
 */
Command decode_command(const std::string& bytes);

/**
 * Split a channel message into the requests it carries.
 *
 * A message that is one JSON value, pretty-printed or not, is one request.
 * Otherwise several producers shared the read and the message is taken as
 * newline-delimited requests; blank lines are skipped. A message with no
 * non-blank line is returned unchanged so it still decodes as malformed.
 */
std::vector<std::string> split_requests(const std::string& bytes);

const ArgumentValue* find_argument(const Arguments& args, const std::string& key);
std::string as_string(const ArgumentValue& value, const std::string& fallback = "");
int64_t as_int64(const ArgumentValue& value, int64_t fallback = 0);
bool as_bool(const ArgumentValue& value, bool fallback = false);
double as_double(const ArgumentValue& value, double fallback = 0.0);

} // namespace hostbridge::codec
