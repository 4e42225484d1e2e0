#pragma once
#include <string>

enum class StatusType { Creating, Created, Adding, Added, Removing, Removed, Modifying, Modified };

// Progress messages of a planning run, written to std::clog.
namespace status {

    void print(StatusType type, const std::string& msg);

    // Debug traces, printed only when verbose is on (config "verbose").
    void debug(const std::string& msg);
    void set_verbose(bool on);

} // namespace status
