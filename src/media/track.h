/*
 * Gooseberry
 * Copyright 2026, Gooseberry developers
 *
 * Gooseberry is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * Gooseberry is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with Gooseberry.  If not, see <http://www.gnu.org/licenses/>.
 *
 */

#ifndef TRACK_H
#define TRACK_H

#include "config.h"

#include <optional>

#include <QtGlobal>
#include <QSharedData>
#include <QSharedDataPointer>
#include <QMetaType>
#include <QList>
#include <QString>
#include <QStringList>

#include "mediasource.h"

class SqlRow;
class SqlQuery;

// Catalog entry for one piece of music.
// The uid never changes, the revision increases with every stored change.
class Track {
 public:
  Track();
  Track(const Track &other);
  ~Track();

  Track &operator=(const Track &other);

  static const QStringList kColumns;
  static const QString kColumnSpec;
  static const QString kBindSpec;
  static const QString kUpdateSpec;

  // Columns of the tracks table joined with media_sources.
  static QString JoinedColumnSpec();

  static QString CreateUid();

  void InitFromQuery(const SqlRow &row);
  void BindToQuery(SqlQuery *query) const;

  bool is_valid() const;

  // Checks that the track can be stored, the reason is set otherwise.
  bool Validate(QString *error) const;

  int id() const;
  const QString &uid() const;
  qint64 revision() const;

  const MediaSource &media_source() const;
  MediaSource &media_source();

  const QString &title() const;
  const QString &artist() const;
  const QString &album() const;
  const QString &albumartist() const;
  const QString &composer() const;
  const QString &genre() const;
  const QString &grouping() const;
  const QString &comment() const;
  int year() const;
  int track() const;
  int disc() const;
  std::optional<double> bpm() const;
  const QString &initial_key() const;
  const QStringList &tags() const;
  qint64 updated_at() const;

  // True if the track has local edits that were not written by an import.
  bool has_unsynchronized_changes() const;

  void set_id(const int id);
  void set_uid(const QString &uid);
  void set_revision(const qint64 revision);
  void set_media_source(const MediaSource &media_source);

  void set_title(const QString &title);
  void set_artist(const QString &artist);
  void set_album(const QString &album);
  void set_albumartist(const QString &albumartist);
  void set_composer(const QString &composer);
  void set_genre(const QString &genre);
  void set_grouping(const QString &grouping);
  void set_comment(const QString &comment);
  void set_year(const int year);
  void set_track(const int track);
  void set_disc(const int disc);
  void set_bpm(const std::optional<double> bpm);
  void set_initial_key(const QString &initial_key);
  void set_tags(const QStringList &tags);
  void set_updated_at(const qint64 updated_at);

  // Metadata equality, ignoring identity, revision and timestamps.
  bool IsMetadataEqual(const Track &other) const;

  QString PrettyTitle() const;

 private:
  struct Private;
  QSharedDataPointer<Private> d;
};

Q_DECLARE_METATYPE(Track)

using TrackList = QList<Track>;

Q_DECLARE_METATYPE(TrackList)

#endif  // TRACK_H
