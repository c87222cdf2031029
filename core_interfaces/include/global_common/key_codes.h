#pragma once

// Values match GLFW key codes so callbacks can cast directly
enum class DriveKey : int {
    UNKNOWN = -1,
    SPACE = 32,
    NUM_1 = 49,
    NUM_2 = 50,
    NUM_3 = 51,
    A = 65,
    D = 68,
    E = 69,
    Q = 81,
    R = 82,
    S = 83,
    W = 87,
    ESCAPE = 256,
    TAB = 258,
    RIGHT = 262,
    LEFT = 263,
    DOWN = 264,
    UP = 265,
    LEFT_SHIFT = 340,
    LEFT_ALT = 342
};

enum class KeyAction {
    PRESS,
    RELEASE,
    REPEAT
};

enum class DriveMouseButton : int {
    LEFT = 0,
    RIGHT = 1
};
