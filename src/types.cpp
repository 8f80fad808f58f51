#include "hubdrive/types.hpp"

#include <algorithm>
#include <cctype>

namespace hubdrive {

bool parseDriveCommand(const std::string& text, DriveCommand& out) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower == "f" || lower == "forward" || lower == "fwd")  { out = DriveCommand::Forward; return true; }
    if (lower == "t" || lower == "turbo")                      { out = DriveCommand::Turbo; return true; }
    if (lower == "b" || lower == "backward" || lower == "back" || lower == "reverse") {
        out = DriveCommand::Backward;
        return true;
    }
    if (lower == "l" || lower == "left")                       { out = DriveCommand::TurnLeft; return true; }
    if (lower == "r" || lower == "right")                      { out = DriveCommand::TurnRight; return true; }
    if (lower == "c" || lower == "center" || lower == "centre") { out = DriveCommand::Center; return true; }
    if (lower == "s" || lower == "stop")                       { out = DriveCommand::Stop; return true; }
    if (lower == "x" || lower == "shutdown")                   { out = DriveCommand::Shutdown; return true; }
    return false;
}

} // namespace hubdrive
