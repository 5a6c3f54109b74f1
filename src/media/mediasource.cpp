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

#include "config.h"

#include <QString>
#include <QStringList>

#include "utilities/strutils.h"
#include "core/sqlrow.h"
#include "core/sqlquery.h"
#include "mediasource.h"

using namespace Qt::Literals::StringLiterals;

const QStringList MediaSource::kColumns = QStringList() << u"collection_id"_s
                                                        << u"content_path"_s
                                                        << u"content_type"_s
                                                        << u"digest"_s
                                                        << u"duration_msec"_s
                                                        << u"bitrate"_s
                                                        << u"samplerate"_s
                                                        << u"channels"_s
                                                        << u"bitdepth"_s
                                                        << u"art_embedded"_s
                                                        << u"art_url"_s
                                                        << u"synchronized_rev"_s
                                                        << u"collected_at"_s
                                                        << u"synchronized_at"_s;

const QString MediaSource::kColumnSpec = MediaSource::kColumns.join(", "_L1);
const QString MediaSource::kBindSpec = Utilities::Prepend(u":"_s, MediaSource::kColumns).join(", "_L1);
const QString MediaSource::kUpdateSpec = Utilities::Updateify(MediaSource::kColumns).join(", "_L1);

MediaSource::MediaSource()
    : id(-1),
      collection_id(-1),
      duration_msec(-1),
      bitrate(-1),
      samplerate(-1),
      channels(-1),
      bitdepth(-1),
      art_embedded(false),
      collected_at(-1),
      synchronized_at(-1) {}

void MediaSource::InitFromQuery(const SqlRow &row) {

  id = row.ValueToInt(u"source_id"_s);
  collection_id = row.ValueToInt(u"collection_id"_s);
  content_path = row.ValueToString(u"content_path"_s);
  content_type = row.ValueToString(u"content_type"_s);
  digest = row.ValueToByteArray(u"digest"_s);
  duration_msec = row.ValueToLongLong(u"duration_msec"_s);
  bitrate = row.ValueToInt(u"bitrate"_s);
  samplerate = row.ValueToInt(u"samplerate"_s);
  channels = row.ValueToInt(u"channels"_s);
  bitdepth = row.ValueToInt(u"bitdepth"_s);
  art_embedded = row.ValueToBool(u"art_embedded"_s);
  art_url = row.ValueToUrl(u"art_url"_s);
  synchronized_rev = row.ValueToOptionalLongLong(u"synchronized_rev"_s);
  collected_at = row.ValueToLongLong(u"collected_at"_s);
  synchronized_at = row.ValueToLongLong(u"synchronized_at"_s);

}

void MediaSource::BindToQuery(SqlQuery *query) const {

  query->BindValue(u":collection_id"_s, collection_id);
  query->BindStringValue(u":content_path"_s, content_path);
  query->BindStringValue(u":content_type"_s, content_type);
  query->BindBlobValue(u":digest"_s, digest);
  query->BindLongLongValue(u":duration_msec"_s, duration_msec);
  query->BindIntValue(u":bitrate"_s, bitrate);
  query->BindIntValue(u":samplerate"_s, samplerate);
  query->BindIntValue(u":channels"_s, channels);
  query->BindIntValue(u":bitdepth"_s, bitdepth);
  query->BindBoolValue(u":art_embedded"_s, art_embedded);
  query->BindUrlValue(u":art_url"_s, art_url);
  query->BindOptionalLongLongValue(u":synchronized_rev"_s, synchronized_rev);
  query->BindLongLongValue(u":collected_at"_s, collected_at);
  query->BindLongLongValue(u":synchronized_at"_s, synchronized_at);

}
