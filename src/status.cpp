#include "status.hpp"
#include <atomic>
#include <iomanip>
#include <iostream>

namespace {
    std::atomic<bool> verbose_{false};

    const char* label(StatusType type) {
        switch (type) {
            case StatusType::Creating:  return "Creating";
            case StatusType::Created:   return "Created";
            case StatusType::Adding:    return "Adding";
            case StatusType::Added:     return "Added";
            case StatusType::Removing:  return "Removing";
            case StatusType::Removed:   return "Removed";
            case StatusType::Modifying: return "Modifying";
            case StatusType::Modified:  return "Modified";
        }
        return "";
    }
}

namespace status {

    void print(StatusType type, const std::string& msg) {
        std::clog << std::setw(12) << std::right << label(type) << " " << msg << std::endl;
    }

    void debug(const std::string& msg) {
        if (verbose_) std::clog << "[debug] " << msg << std::endl;
    }

    void set_verbose(bool on) { verbose_ = on; }

} // namespace status
