#include "ErrorHandler.hpp"
#include <iostream>

namespace pano {

void requireNonDegenerate(int height, int width, const std::string& what)
{
    if (height < 2 || width < 2) {
        THROW_CONTEXT_AS(DegenerateImageError,
                         what + " must be at least 2x2, got " +
                         std::to_string(width) + "x" + std::to_string(height));
    }
}

void printErrorWithContext(const std::exception& e, const std::string& context) {
    std::cerr << "\n";
    std::cerr << "═══════════════════════════════════════════════════════════\n";
    std::cerr << "ERROR OCCURRED";
    if (!context.empty()) {
        std::cerr << " in " << context;
    }
    std::cerr << "\n";
    std::cerr << "═══════════════════════════════════════════════════════════\n";

    // Check if it's a ContextException for additional info
    const auto* ctx_e = dynamic_cast<const ContextException*>(&e);
    if (ctx_e == nullptr) {
        std::cerr << "Message: " << e.what() << "\n";
        std::cerr << "═══════════════════════════════════════════════════════════\n";
        return;
    }

    std::cerr << "Kind:    " << ctx_e->kind() << "\n";
    std::cerr << "Message: " << ctx_e->message() << "\n";
    if (!ctx_e->file().empty() || ctx_e->line() > 0) {
        std::cerr << "\nLocation:\n";
        std::cerr << "  File: " << ctx_e->file() << "\n";
        std::cerr << "  Line: " << ctx_e->line() << "\n";
        if (!ctx_e->function().empty()) {
            std::cerr << "  Function: " << ctx_e->function() << "\n";
        }
    }
    std::cerr << "═══════════════════════════════════════════════════════════\n";
}

} // namespace pano
