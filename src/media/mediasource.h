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

#ifndef MEDIASOURCE_H
#define MEDIASOURCE_H

#include "config.h"

#include <optional>

#include <QMetaType>
#include <QList>
#include <QByteArray>
#include <QString>
#include <QStringList>
#include <QUrl>

class SqlRow;
class SqlQuery;

// One file of a collection, identified by its content path.
struct MediaSource {
  MediaSource();

  static const QStringList kColumns;
  static const QString kColumnSpec;
  static const QString kBindSpec;
  static const QString kUpdateSpec;

  bool is_valid() const { return id != -1; }

  void InitFromQuery(const SqlRow &row);
  void BindToQuery(SqlQuery *query) const;

  int id;
  int collection_id;
  QString content_path;
  QString content_type;
  QByteArray digest;

  qint64 duration_msec;
  int bitrate;
  int samplerate;
  int channels;
  int bitdepth;

  bool art_embedded;
  QUrl art_url;

  // Track revision written by the last import, unset if never imported.
  std::optional<qint64> synchronized_rev;

  // Seconds since epoch
  qint64 collected_at;
  qint64 synchronized_at;
};

Q_DECLARE_METATYPE(MediaSource)

using MediaSourceList = QList<MediaSource>;

Q_DECLARE_METATYPE(MediaSourceList)

#endif  // MEDIASOURCE_H
