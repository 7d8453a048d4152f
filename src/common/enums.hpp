#pragma once

namespace honeyforge {

enum class EntryType {
    Symlink,
    Directory,
    RegularFile,
    BlockDevice,
    CharDevice,
    Socket,
    Fifo
};

enum class SnapshotEncoding {
    Json,
    Cbor
};

enum class SkipReason {
    Excluded,
    Unreadable,
    StatFailed,
    SymlinkEscapesRoot,
    DanglingSymlink,
    UnknownType,
    InvalidName
};

} // namespace honeyforge
