#include "json_codec.hpp"

#include <nlohmann/json.hpp>

#include <limits>
#include <utility>

namespace hostbridge::codec {

namespace {

using json = nlohmann::json;

ArgumentValue to_argument_value(const std::string& key, const json& value) {
    switch (value.type()) {
        case json::value_t::string:
            return value.get<std::string>();
        case json::value_t::boolean:
            return value.get<bool>();
        case json::value_t::number_integer:
            return value.get<int64_t>();
        case json::value_t::number_unsigned: {
            auto u = value.get<uint64_t>();
            if (u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                return static_cast<double>(u);
            }
            return static_cast<int64_t>(u);
        }
        case json::value_t::number_float:
            return value.get<double>();
        default:
            throw DecodeError("argument '" + key + "' has unsupported type " + value.type_name());
    }
}

} // namespace

Command decode_command(const std::string& bytes) {
    json root = json::parse(bytes, nullptr, false);
    if (root.is_discarded()) {
        throw DecodeError("invalid JSON");
    }
    if (!root.is_object()) {
        throw DecodeError(std::string("expected a JSON object, got ") + root.type_name());
    }

    auto command_it = root.find("Command");
    if (command_it == root.end()) {
        throw DecodeError("missing 'Command' field");
    }
    if (!command_it->is_string()) {
        throw DecodeError("'Command' must be a string");
    }

    Command cmd;
    cmd.name = command_it->get<std::string>();

    auto args_it = root.find("Arguments");
    if (args_it != root.end()) {
        if (!args_it->is_object()) {
            throw DecodeError("'Arguments' must be an object");
        }
        Arguments args;
        for (auto it = args_it->begin(); it != args_it->end(); ++it) {
            args.emplace(it.key(), to_argument_value(it.key(), it.value()));
        }
        cmd.arguments = std::move(args);
    }

    return cmd;
}

std::vector<std::string> split_requests(const std::string& bytes) {
    if (json::accept(bytes)) {
        return {bytes};
    }

    std::vector<std::string> requests;
    size_t start = 0;
    while (start <= bytes.size()) {
        size_t end = bytes.find('\n', start);
        if (end == std::string::npos) {
            end = bytes.size();
        }
        std::string line = bytes.substr(start, end - start);
        if (line.find_first_not_of(" \t\r") != std::string::npos) {
            requests.push_back(std::move(line));
        }
        start = end + 1;
    }

    if (requests.empty()) {
        requests.push_back(bytes);
    }
    return requests;
}

const ArgumentValue* find_argument(const Arguments& args, const std::string& key) {
    auto it = args.find(key);
    if (it == args.end()) {
        return nullptr;
    }
    return &it->second;
}

std::string as_string(const ArgumentValue& value, const std::string& fallback) {
    if (auto str = std::get_if<std::string>(&value)) {
        return *str;
    }
    return fallback;
}

int64_t as_int64(const ArgumentValue& value, int64_t fallback) {
    if (auto i = std::get_if<int64_t>(&value)) {
        return *i;
    }
    return fallback;
}

bool as_bool(const ArgumentValue& value, bool fallback) {
    if (auto b = std::get_if<bool>(&value)) {
        return *b;
    }
    return fallback;
}

double as_double(const ArgumentValue& value, double fallback) {
    if (auto d = std::get_if<double>(&value)) {
        return *d;
    }
    if (auto i = std::get_if<int64_t>(&value)) {
        return static_cast<double>(*i);
    }
    return fallback;
}

} // namespace hostbridge::codec
