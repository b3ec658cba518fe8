#pragma once

#include <memory>

#include <QtGlobal>

#include "edit/ChangeTracker.h"
#include "edit/EditorEvents.h"
#include "edit/SelectionModel.h"
#include "grid/GridGeometry.h"
#include "grid/ScrollController.h"
#include "store/ByteStore.h"
#include "text/ByteCharConverter.h"

namespace hexgrid {

enum class InputMode {
    Empty = 0,
    HexEntry,
    CharEntry,
};

struct EditOptions {
    bool readOnly = false;
    bool enableCut = true;
    bool enableDelete = true;
    bool enablePaste = true;
    bool enableOverwritePaste = false;
    bool retainDirtyOnSwap = false;
    bool retainCommittedOnSwap = false;
    bool autoCommitOnSwap = false;
    bool hexLowerCase = false;
    bool copyKeyAsHex = false;
    // Added to every offset shown in the line-info gutter.
    qint64 lineInfoOffset = 0;
    GridLayoutOptions layout;
};

// Everything a command handler reads or mutates. Owned by HexEditEngine and
// passed by reference into the input-mode handlers.
struct EditorState {
    ByteStore* store = nullptr;
    std::shared_ptr<const ByteCharConverter> converter =
        std::make_shared<DefaultByteCharConverter>();
    EditOptions options;
    InputMode mode = InputMode::Empty;
    bool insertActive = false;

    GridGeometry geometry;
    ScrollController scroll;
    SelectionModel selection;
    ChangeTracker changes;

    // Collected while a command runs; flushed by the engine afterwards.
    EditorEvents pending;

    bool hasStore() const { return store != nullptr; }
    qint64 length() const { return store != nullptr ? store->length() : 0; }
    bool canWrite() const { return store != nullptr && !options.readOnly && store->supportsWrite(); }
    bool canInsert() const {
        return store != nullptr && !options.readOnly && store->supportsInsert();
    }
    bool canDelete() const {
        return store != nullptr && !options.readOnly && options.enableDelete &&
               store->supportsDelete();
    }
};

}  // namespace hexgrid
