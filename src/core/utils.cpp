#include "utils.hpp"
#include "types.hpp"

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::None:               return "ok";
        case ErrorCode::Generic:            return "error";
        case ErrorCode::ConstructionFailed: return "construction failed";
        case ErrorCode::NotFound:           return "not found";
        case ErrorCode::InvalidArgument:    return "invalid argument";
        case ErrorCode::ConfigError:        return "config error";
    }
    return "error";
}

int safe_stoi(const std::string& s, int fallback) {
    try {
        size_t used = 0;
        int value = std::stoi(s, &used);
        if (used != s.size()) return fallback;
        return value;
    } catch (const std::exception&) {
        return fallback;
    }
}

std::string join_ints(const std::vector<int>& values, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < values.size(); i++) {
        if (i > 0) out += sep;
        out += std::to_string(values[i]);
    }
    return out;
}

std::string shell_quote(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    out += "'";
    return out;
}
