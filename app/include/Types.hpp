#ifndef TYPES_HPP
#define TYPES_HPP

#include <string>

// Locale identifier, bare ("en") or territory-qualified ("en-US").
using LocaleId = std::string;

// File name of an informational page under <pages>/<locale>/.
using PageId = std::string;

enum class AutostartState {Unregistered, Registered};

inline std::string to_string(AutostartState state) {
    switch (state) {
        case AutostartState::Registered: return "Registered";
        case AutostartState::Unregistered: return "Unregistered";
        default: return "Unknown";
    }
}

struct LsbInfo {
    std::string codename;
    std::string release;
};

#endif
