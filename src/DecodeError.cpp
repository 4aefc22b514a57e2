#include "DecodeError.h"

QString DecodeError::reasonName(Reason r) {
  switch (r) {
    case Reason::NotFound:          return QStringLiteral("file not found");
    case Reason::Unreadable:        return QStringLiteral("file not readable");
    case Reason::UnsupportedFormat: return QStringLiteral("unsupported format");
    case Reason::Corrupt:           return QStringLiteral("corrupt stream");
    case Reason::Empty:             return QStringLiteral("no audio data");
  }
  return QStringLiteral("unknown error");
}

QString DecodeError::message() const {
  QString msg = QString("%1: %2").arg(path, reasonName(reason));
  if (!detail.isEmpty()) msg += QString(" (%1)").arg(detail);
  return msg;
}
