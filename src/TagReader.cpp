#include "TagReader.h"
#include "Logging.h"
#include <QFile>
#include <taglib/fileref.h>
#include <taglib/tag.h>
#include <taglib/tstring.h>

const QString TrackMetadata::kUnknown = QStringLiteral("Unknown");

QString TrackMetadata::display(const std::optional<QString>& field) {
  return field ? *field : kUnknown;
}

namespace {

// Blank text counts as missing.
std::optional<QString> text(const TagLib::String& s) {
  const QString v = QString::fromUtf8(s.toCString(true)).trimmed();
  if (v.isEmpty()) return std::nullopt;
  return v;
}

} // namespace

TrackMetadata TagReader::read(const QString& path) {
  TrackMetadata md;

#ifdef Q_OS_WIN
  const TagLib::FileRef f(reinterpret_cast<const wchar_t*>(path.utf16()), false);
#else
  const QByteArray encoded = QFile::encodeName(path);
  const TagLib::FileRef f(encoded.constData(), false);
#endif
  if (f.isNull() || !f.tag()) {
    qCDebug(lcTags) << "no readable tags in" << path;
    return md;
  }

  const TagLib::Tag* tag = f.tag();
  md.artist = text(tag->artist());
  md.title  = text(tag->title());
  md.album  = text(tag->album());
  md.genre  = text(tag->genre());
  if (tag->year() > 0) md.year = QString::number(tag->year());

  qCDebug(lcTags) << path << "| artist" << TrackMetadata::display(md.artist)
                  << "| title" << TrackMetadata::display(md.title);
  return md;
}
