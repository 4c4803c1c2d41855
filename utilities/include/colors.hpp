#ifndef COLORS_HPP
#define COLORS_HPP
#include <string>

namespace Color {
    const std::string RESET   = "\033[0m";
    const std::string BOLD    = "\033[1m";
    const std::string RED     = "\033[31m"; // Errors
    const std::string GREEN   = "\033[32m"; // Success
    const std::string YELLOW  = "\033[33m"; // Warnings / no-ops
    const std::string MAGENTA = "\033[35m"; // Headers
    const std::string CYAN    = "\033[36m"; // Addresses
}

namespace Icon {
    const std::string CHECK   = "✅ ";
    const std::string CROSS   = "❌ ";
    const std::string WARN    = "⚠️ ";
    const std::string TREE    = "├── ";
}
#endif
