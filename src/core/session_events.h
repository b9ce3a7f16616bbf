#pragma once

#include "core/types.h"
#include <string>
#include <variant>

namespace termdock {

struct OutputEvent {
    SessionId session_id;
    std::string data;
};

struct ExitEvent {
    SessionId session_id;
    int exit_code;
};

using ProcessEvent = std::variant<OutputEvent, ExitEvent>;

}
