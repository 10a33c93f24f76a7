#pragma once

#include <string>

namespace cadence::ui {

struct InputEvent {
    enum class Type {
        None,
        KeyPress,
        Resize,
        Eof  // stdin closed
    };

    Type type = Type::None;
    int key = 0;           // char code or special key code
    std::string key_name;  // "up", "delete", "enter", "a", ...

    bool is_key(const std::string& name_to_check) const {
        return type == Type::KeyPress && key_name == name_to_check;
    }
};

}  // namespace cadence::ui
