#include "edit/KeyBindings.h"

namespace hexgrid {

namespace {
constexpr Qt::KeyboardModifiers kRelevantModifiers =
    Qt::ShiftModifier | Qt::ControlModifier | Qt::AltModifier | Qt::MetaModifier;
}  // namespace

KeyBindings::KeyBindings() = default;

KeyBindings KeyBindings::defaults() {
    KeyBindings bindings;
    bindings.bind(Qt::Key_Left, Qt::NoModifier, EditorCommand::MoveLeft);
    bindings.bind(Qt::Key_Right, Qt::NoModifier, EditorCommand::MoveRight);
    bindings.bind(Qt::Key_Up, Qt::NoModifier, EditorCommand::MoveUp);
    bindings.bind(Qt::Key_Down, Qt::NoModifier, EditorCommand::MoveDown);
    bindings.bind(Qt::Key_PageUp, Qt::NoModifier, EditorCommand::PageUp);
    bindings.bind(Qt::Key_PageDown, Qt::NoModifier, EditorCommand::PageDown);
    bindings.bind(Qt::Key_Home, Qt::NoModifier, EditorCommand::MoveHome);
    bindings.bind(Qt::Key_End, Qt::NoModifier, EditorCommand::MoveEnd);

    bindings.bind(Qt::Key_Left, Qt::ShiftModifier, EditorCommand::ExtendLeft);
    bindings.bind(Qt::Key_Right, Qt::ShiftModifier, EditorCommand::ExtendRight);
    bindings.bind(Qt::Key_Up, Qt::ShiftModifier, EditorCommand::ExtendUp);
    bindings.bind(Qt::Key_Down, Qt::ShiftModifier, EditorCommand::ExtendDown);
    bindings.bind(Qt::Key_Shift, Qt::ShiftModifier, EditorCommand::BeginExtend);

    bindings.bind(Qt::Key_Tab, Qt::NoModifier, EditorCommand::NextPane);
    bindings.bind(Qt::Key_Backtab, Qt::ShiftModifier, EditorCommand::PreviousPane);
    bindings.bind(Qt::Key_Backtab, Qt::NoModifier, EditorCommand::PreviousPane);
    bindings.bind(Qt::Key_Tab, Qt::ShiftModifier, EditorCommand::PreviousPane);

    bindings.bind(Qt::Key_Backspace, Qt::NoModifier, EditorCommand::DeleteBackward);
    bindings.bind(Qt::Key_Delete, Qt::NoModifier, EditorCommand::DeleteForward);
    bindings.bind(Qt::Key_Insert, Qt::NoModifier, EditorCommand::ToggleInsert);

    bindings.bind(Qt::Key_C, Qt::ControlModifier, EditorCommand::Copy);
    bindings.bind(Qt::Key_X, Qt::ControlModifier, EditorCommand::Cut);
    bindings.bind(Qt::Key_V, Qt::ControlModifier, EditorCommand::Paste);
    return bindings;
}

void KeyBindings::bind(int key, Qt::KeyboardModifiers modifiers, EditorCommand command) {
    m_table.insert(makeKey(key, modifiers), command);
}

void KeyBindings::unbind(int key, Qt::KeyboardModifiers modifiers) {
    m_table.remove(makeKey(key, modifiers));
}

EditorCommand KeyBindings::resolve(int key, Qt::KeyboardModifiers modifiers) const {
    return m_table.value(makeKey(key, modifiers), EditorCommand::None);
}

int KeyBindings::size() const { return static_cast<int>(m_table.size()); }

const char* KeyBindings::commandName(EditorCommand command) {
    switch (command) {
        case EditorCommand::None:
            return "None";
        case EditorCommand::MoveLeft:
            return "MoveLeft";
        case EditorCommand::MoveRight:
            return "MoveRight";
        case EditorCommand::MoveUp:
            return "MoveUp";
        case EditorCommand::MoveDown:
            return "MoveDown";
        case EditorCommand::PageUp:
            return "PageUp";
        case EditorCommand::PageDown:
            return "PageDown";
        case EditorCommand::MoveHome:
            return "MoveHome";
        case EditorCommand::MoveEnd:
            return "MoveEnd";
        case EditorCommand::ExtendLeft:
            return "ExtendLeft";
        case EditorCommand::ExtendRight:
            return "ExtendRight";
        case EditorCommand::ExtendUp:
            return "ExtendUp";
        case EditorCommand::ExtendDown:
            return "ExtendDown";
        case EditorCommand::BeginExtend:
            return "BeginExtend";
        case EditorCommand::NextPane:
            return "NextPane";
        case EditorCommand::PreviousPane:
            return "PreviousPane";
        case EditorCommand::DeleteBackward:
            return "DeleteBackward";
        case EditorCommand::DeleteForward:
            return "DeleteForward";
        case EditorCommand::ToggleInsert:
            return "ToggleInsert";
        case EditorCommand::Copy:
            return "Copy";
        case EditorCommand::Cut:
            return "Cut";
        case EditorCommand::Paste:
            return "Paste";
    }
    return "Unknown";
}

quint64 KeyBindings::makeKey(int key, Qt::KeyboardModifiers modifiers) {
    const quint64 mods = static_cast<quint64>((modifiers & kRelevantModifiers).toInt());
    return (mods << 32U) | static_cast<quint32>(key);
}

}  // namespace hexgrid
