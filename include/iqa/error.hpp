#pragma once
#include <stdexcept>
#include <string>

namespace iqa
{
    // Run-level failure: bad dataset root, unreadable/malformed table,
    // failed table write. Caught once by the entry points.
    class Error : public std::runtime_error
    {
    public:
        explicit Error(const std::string &what) : std::runtime_error(what) {}
    };
}
