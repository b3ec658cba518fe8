#pragma once

#include <QHash>
#include <QtGlobal>

namespace hexgrid {

enum class EditorCommand {
    None = 0,
    MoveLeft,
    MoveRight,
    MoveUp,
    MoveDown,
    PageUp,
    PageDown,
    MoveHome,
    MoveEnd,
    ExtendLeft,
    ExtendRight,
    ExtendUp,
    ExtendDown,
    BeginExtend,
    NextPane,
    PreviousPane,
    DeleteBackward,
    DeleteForward,
    ToggleInsert,
    Copy,
    Cut,
    Paste,
};

// (key, modifiers) -> command. Modifiers are reduced to Shift/Control/Alt/Meta
// before the lookup so keypad variants resolve to the same command.
class KeyBindings {
public:
    KeyBindings();

    static KeyBindings defaults();

    void bind(int key, Qt::KeyboardModifiers modifiers, EditorCommand command);
    void unbind(int key, Qt::KeyboardModifiers modifiers);
    EditorCommand resolve(int key, Qt::KeyboardModifiers modifiers) const;
    int size() const;

    static const char* commandName(EditorCommand command);

private:
    static quint64 makeKey(int key, Qt::KeyboardModifiers modifiers);

    QHash<quint64, EditorCommand> m_table;
};

}  // namespace hexgrid
