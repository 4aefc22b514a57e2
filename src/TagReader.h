#pragma once
#include <QString>
#include <optional>

struct TrackMetadata {
  std::optional<QString> artist;
  std::optional<QString> title;
  std::optional<QString> album;
  std::optional<QString> year;
  std::optional<QString> genre;

  // Missing fields render as "Unknown", never as "".
  static QString display(const std::optional<QString>& field);
  static const QString kUnknown;

  bool isEmpty() const { return !artist && !title && !album && !year && !genre; }

  bool operator==(const TrackMetadata& o) const {
    return artist == o.artist && title == o.title && album == o.album && year == o.year && genre == o.genre;
  }
};

// Artist/title/album/year/genre through TagLib (ID3v1/v2, RIFF INFO, AIFF,
// FLAC and Ogg comments). Never fails: anything unreadable stays missing.
class TagReader {
public:
  static TrackMetadata read(const QString& path);
};
