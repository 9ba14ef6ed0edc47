#pragma once

#include <cstdint>

namespace shapeedit {

enum class Tool : std::uint8_t {
    None = 0,
    Circle = 1,
    Rectangle = 2,
    Path = 3
};

enum class SessionPhase : std::uint8_t {
    Idle = 0,
    Staging = 1,      // Circle/Rectangle waiting for the second click
    PathBuilding = 2  // Path accumulating vertices until commit
};

enum class PointerButton : std::uint8_t {
    Primary = 0,
    Secondary = 1
};

// Host-neutral key signals. Hosts map physical keys onto these
// (Esc, Delete, Enter, R, E in the reference key map).
enum class EditorKey : std::uint8_t {
    Cancel = 0,
    DeleteSelection = 1,
    CommitPath = 2,
    RotateClockwise = 3,
    RotateCounterClockwise = 4
};

} // namespace shapeedit
