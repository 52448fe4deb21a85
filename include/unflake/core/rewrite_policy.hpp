#pragma once

#include "unflake/core/safe_symbols.hpp"

namespace unflake {

struct RewritePolicy {
    const SafeSymbolRegistry& eligible_imports;
    bool remove_all_unused_imports = false;  // Ignore eligible_imports entirely
    bool remove_unused_variables = false;
};

} // namespace unflake
