#include "adapter.hpp"

namespace pg {

std::string_view to_string(AdapterType type) {
    switch (type) {
        case AdapterType::Direct: return "Direct";
        case AdapterType::Reject: return "Reject";
        case AdapterType::Pass: return "Pass";
        case AdapterType::Compatible: return "Compatible";
        case AdapterType::Routed: return "Routed";
    }
    return "Unknown";
}

} // namespace pg
