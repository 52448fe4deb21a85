#include "unflake/core/contract.hpp"
#include <sstream>

namespace unflake {

auto fail_assertion(const char* condition, const char* message, const char* file, int line)
    -> void {
    std::ostringstream oss;
    oss << file << ":" << line << ": Assertion `" << condition << "` failed: " << message;
    throw InternalError(oss.str());
}

} // namespace unflake
