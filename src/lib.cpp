#include "lib.hpp"

std::string vformat_msg(const char* fmt, va_list args) {
    // Two passes: size first, then write. va_list must be copied for the first one.
    va_list args_copy;
    va_copy(args_copy, args);
    int required_size = std::vsnprintf(nullptr, 0, fmt, args_copy);
    va_end(args_copy);

    if (required_size < 0) {
        throw std::runtime_error("Error: Failed to determine required buffer size.");
    }

    std::vector<char> buffer(required_size + 1);
    std::vsnprintf(buffer.data(), buffer.size(), fmt, args);
    return std::string(buffer.data(), required_size);
}

std::string format_msg(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    std::string out = vformat_msg(fmt, args);
    va_end(args);
    return out;
}

// Throws std::runtime_error("file:line: <formatted msg>")
[[noreturn]] void error(const char* msg, const char* file, int line, ...) {
    va_list args;
    va_start(args, line);
    std::string text = vformat_msg(msg, args);
    va_end(args);

    std::stringstream ss;
    ss << file << ":" << line << ": " << text;
    throw std::runtime_error(ss.str());
}

[[noreturn]] void invariant(const char* msg, const char* file, int line, ...) {
    va_list args;
    va_start(args, line);
    std::string text = vformat_msg(msg, args);
    va_end(args);

    std::stringstream ss;
    ss << file << ":" << line << ": invariant violated: " << text;
    throw InvariantError(ss.str());
}

std::string kind_name(MigrationError::Kind kind) {
    using K = MigrationError::Kind;
    switch (kind) {
        case K::InvalidName:           return "invalid migration name";
        case K::CycleDetected:         return "cycle detected in migrations";
        case K::InvalidDependency:     return "invalid dependency";
        case K::DuplicateMigration:    return "duplicate migration";
        case K::DuplicateModel:        return "duplicate model";
        case K::UnsupportedAlterField: return "unsupported alter field";
        case K::InvalidDocument:       return "invalid document";
        case K::InvalidState:          return "invalid schema state";
    }
    return "unknown";
}
