#pragma once
#include <stdexcept>
#include <string>
#include <vector>
#include <cstdarg>
#include <cstdio>
#include <sstream> // To build the final string

// printf-style formatting; %s arguments must be const char*
std::string format_msg(const char* fmt, ...);
std::string vformat_msg(const char* fmt, va_list args);

[[noreturn]] void error(const char* msg, const char* file, int line, ...);
[[noreturn]] void invariant(const char* msg, const char* file, int line, ...);
// A helper macro to automatically pass __FILE__ and __LINE__
#define THROW(msg, ...) error(msg, __FILE__, __LINE__, ##__VA_ARGS__)
// Broken internal invariant: the planner itself is wrong, not its input
#define THROW_INVARIANT(msg, ...) invariant(msg, __FILE__, __LINE__, ##__VA_ARGS__)

/**
 * Context attached to a MigrationError so callers can report which
 * migration / table / column caused it. Empty members are unknown.
 */
struct ErrorContext {
    std::string group;
    std::string migration;
    std::string table;
    std::string column;
};

/**
 * User data errors: bad input, recoverable by fixing models or migrations.
 */
class MigrationError : public std::runtime_error {
public:
    enum class Kind {
        InvalidName,           // migration identifier has no parsable sequence number
        CycleDetected,         // finalized migrations depend on each other
        InvalidDependency,     // dependency points to an unknown migration/model
        DuplicateMigration,    // same group::name twice
        DuplicateModel,        // two migrations create the same table in a group
        UnsupportedAlterField, // column attributes changed, alter field is not supported
        InvalidDocument,       // malformed model/migration JSON
        InvalidState           // operation does not apply to the schema state
    };

    MigrationError(Kind kind, const std::string& msg, ErrorContext ctx = {})
        : std::runtime_error(msg), kind_(kind), ctx_(std::move(ctx)) {}

    Kind kind() const { return kind_; }
    const ErrorContext& context() const { return ctx_; }

private:
    Kind kind_;
    ErrorContext ctx_;
};

std::string kind_name(MigrationError::Kind kind);

/**
 * Programming invariant violations (cycle breaker / sequencer defects).
 */
class InvariantError : public std::logic_error {
public:
    explicit InvariantError(const std::string& msg) : std::logic_error(msg) {}
};

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};
