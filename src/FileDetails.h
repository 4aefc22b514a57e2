#pragma once
#include <QDateTime>
#include <QString>
#include <optional>

struct FileDetails {
  QString path;
  QString fileName;
  QString format;                    // lower-case extension
  qint64 sizeBytes = 0;
  QDateTime lastModified;
  std::optional<QString> md5;        // hex digest; empty if the file could not be read

  static FileDetails read(const QString& path);

  // MD5 of the file contents, streamed in 4 KiB chunks.
  static std::optional<QString> md5Hex(const QString& path);

  bool operator==(const FileDetails& o) const {
    return path == o.path && fileName == o.fileName && format == o.format
        && sizeBytes == o.sizeBytes && lastModified == o.lastModified && md5 == o.md5;
  }
};
