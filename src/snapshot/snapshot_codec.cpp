#include "snapshot/snapshot_codec.hpp"

#include <cctype>
#include <cerrno>
#include <cstring>
#include <cstdint>
#include <system_error>
#include <vector>

#include <QFile>
#include <QString>
#include <QTemporaryFile>

#include <unistd.h>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/json_utils.hpp"

namespace honeyforge {

namespace {

bool looksLikeJsonText(const QByteArray &data)
{
    for (const char c : data) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            continue;
        }
        return c == '{';
    }
    return false;
}

} // namespace

QByteArray encodeSnapshot(const SnapshotEntry &root, SnapshotEncoding encoding)
{
    const nlohmann::json document = {
        {"format", kSnapshotFormatName},
        {"version", kSnapshotFormatVersion},
        {"root", root}
    };

    try {
        if (encoding == SnapshotEncoding::Cbor) {
            const std::vector<std::uint8_t> bytes = nlohmann::json::to_cbor(document);
            return QByteArray(reinterpret_cast<const char *>(bytes.data()),
                              static_cast<qsizetype>(bytes.size()));
        }
        return QByteArray::fromStdString(document.dump());
    } catch (const nlohmann::json::exception &ex) {
        throw ForgeError(ErrorKind::IOFailure,
                         std::string("cannot encode snapshot: ") + ex.what());
    }
}

SnapshotEntry decodeSnapshot(const QByteArray &data)
{
    if (data.isEmpty()) {
        throw ForgeError(ErrorKind::ParseError, "empty snapshot artifact");
    }

    try {
        nlohmann::json document;
        if (looksLikeJsonText(data)) {
            document = nlohmann::json::parse(data.toStdString());
        } else {
            const std::vector<std::uint8_t> bytes(data.begin(), data.end());
            document = nlohmann::json::from_cbor(bytes);
        }

        if (!document.is_object()
            || document.value("format", "") != kSnapshotFormatName) {
            throw ForgeError(ErrorKind::ParseError, "not a honeyforge snapshot");
        }
        if (document.value("version", 0) != kSnapshotFormatVersion) {
            throw ForgeError(ErrorKind::ParseError,
                             "unsupported snapshot version "
                                 + document.value("version", nlohmann::json()).dump());
        }

        SnapshotEntry root = document.at("root").get<SnapshotEntry>();
        if (root.name != "/" || root.type != EntryType::Directory) {
            throw ForgeError(ErrorKind::ParseError,
                             "snapshot root must be the \"/\" directory");
        }
        return root;
    } catch (const nlohmann::json::exception &ex) {
        throw ForgeError(ErrorKind::ParseError,
                         std::string("malformed snapshot: ") + ex.what());
    }
}

void writeSnapshotFile(const std::filesystem::path &outputPath, const QByteArray &data)
{
    std::error_code error;
    if (std::filesystem::exists(std::filesystem::symlink_status(outputPath, error))) {
        throw ForgeError(ErrorKind::AlreadyExists,
                         "output already exists: " + outputPath.string());
    }

    // Written beside the target, then hard-linked into place: link(2) fails
    // with EEXIST instead of replacing a file that appeared meanwhile.
    QTemporaryFile staging(QString::fromStdString(outputPath.string())
                           + QStringLiteral(".XXXXXX"));
    if (!staging.open()) {
        throw ForgeError(ErrorKind::IOFailure,
                         "cannot stage " + outputPath.string() + ": "
                             + staging.errorString().toStdString());
    }
    if (staging.write(data) != data.size() || !staging.flush()) {
        throw ForgeError(ErrorKind::IOFailure,
                         "short write to " + staging.fileName().toStdString() + ": "
                             + staging.errorString().toStdString());
    }
    if (::fsync(staging.handle()) != 0) {
        throw ForgeError(ErrorKind::IOFailure,
                         "cannot sync " + staging.fileName().toStdString() + ": "
                             + std::strerror(errno));
    }

    const QByteArray stagingPath = QFile::encodeName(staging.fileName());
    if (::link(stagingPath.constData(), outputPath.c_str()) != 0) {
        const int linkErrno = errno;
        if (linkErrno == EEXIST) {
            throw ForgeError(ErrorKind::AlreadyExists,
                             "output already exists: " + outputPath.string());
        }
        throw ForgeError(ErrorKind::IOFailure,
                         "cannot publish " + outputPath.string() + ": "
                             + std::strerror(linkErrno));
    }
    // The staging name is removed when `staging` goes out of scope.
}

SnapshotEntry readSnapshotFile(const std::filesystem::path &path)
{
    QFile file(QString::fromStdString(path.string()));
    if (!file.exists()) {
        throw ForgeError(ErrorKind::SourceNotFound,
                         "snapshot not found: " + path.string());
    }
    if (!file.open(QIODevice::ReadOnly)) {
        throw ForgeError(ErrorKind::IOFailure,
                         "cannot open " + path.string() + ": "
                             + file.errorString().toStdString());
    }
    return decodeSnapshot(file.readAll());
}

} // namespace honeyforge
