#pragma once
#include <QString>

// Fatal: the file could not be turned into an AudioSignal.
struct DecodeError {
  enum class Reason {
    NotFound,
    Unreadable,
    UnsupportedFormat,
    Corrupt,
    Empty
  };

  Reason reason = Reason::Corrupt;
  QString path;
  QString detail;

  // "<path>: <reason> (<detail>)"
  QString message() const;
  static QString reasonName(Reason r);
};
