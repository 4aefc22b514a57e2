#include "FileDetails.h"
#include "Logging.h"
#include <QCryptographicHash>
#include <QFile>
#include <QFileInfo>

std::optional<QString> FileDetails::md5Hex(const QString& path) {
  QFile f(path);
  if (!f.open(QIODevice::ReadOnly)) {
    qCWarning(lcPipeline) << "hash: cannot open" << path << ":" << f.errorString();
    return std::nullopt;
  }
  QCryptographicHash hash(QCryptographicHash::Md5);
  while (!f.atEnd()) {
    const QByteArray chunk = f.read(4096);
    if (chunk.isEmpty() && f.error() != QFileDevice::NoError) {
      qCWarning(lcPipeline) << "hash: read failed for" << path << ":" << f.errorString();
      return std::nullopt;
    }
    hash.addData(chunk);
  }
  return QString::fromLatin1(hash.result().toHex());
}

FileDetails FileDetails::read(const QString& path) {
  FileDetails d;
  const QFileInfo info(path);
  d.path = path;
  d.fileName = info.fileName();
  d.format = info.suffix().toLower();
  if (!info.exists()) return d;
  d.sizeBytes = info.size();
  d.lastModified = info.lastModified();
  d.md5 = md5Hex(path);
  return d;
}
