#pragma once

#include <filesystem>

#include <QByteArray>

#include "common/models.hpp"

namespace honeyforge {

// Envelope written around the root entry.
constexpr const char *kSnapshotFormatName = "honeyforge-fs";
constexpr int kSnapshotFormatVersion = 1;

// Throws ForgeError(IOFailure) when the tree cannot be encoded.
QByteArray encodeSnapshot(const SnapshotEntry &root, SnapshotEncoding encoding);

/**
 * Decode an artifact produced by encodeSnapshot. The encoding is detected
 * from the first byte. Throws ForgeError(ParseError) when the document is
 * malformed, has the wrong envelope, or an entry's payload does not match
 * its type.
 */
SnapshotEntry decodeSnapshot(const QByteArray &data);

/**
 * Write an encoded artifact. The bytes reach outputPath only once they are
 * complete and synced; a path that exists at any point before publication
 * is never replaced.
 * Throws ForgeError(AlreadyExists | IOFailure).
 */
void writeSnapshotFile(const std::filesystem::path &outputPath, const QByteArray &data);

// Throws ForgeError(SourceNotFound | IOFailure | ParseError).
SnapshotEntry readSnapshotFile(const std::filesystem::path &path);

} // namespace honeyforge
