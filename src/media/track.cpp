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

#include <optional>

#include <QSharedData>
#include <QString>
#include <QStringList>
#include <QUuid>
#include <QFileInfo>

#include "utilities/strutils.h"
#include "core/sqlrow.h"
#include "core/sqlquery.h"
#include "track.h"

using namespace Qt::Literals::StringLiterals;

const QStringList Track::kColumns = QStringList() << u"uid"_s
                                                  << u"revision"_s
                                                  << u"media_source_id"_s
                                                  << u"title"_s
                                                  << u"artist"_s
                                                  << u"album"_s
                                                  << u"albumartist"_s
                                                  << u"composer"_s
                                                  << u"genre"_s
                                                  << u"grouping"_s
                                                  << u"comment"_s
                                                  << u"year"_s
                                                  << u"track"_s
                                                  << u"disc"_s
                                                  << u"bpm"_s
                                                  << u"initial_key"_s
                                                  << u"tags"_s
                                                  << u"updated_at"_s;

const QString Track::kColumnSpec = Track::kColumns.join(", "_L1);
const QString Track::kBindSpec = Utilities::Prepend(u":"_s, Track::kColumns).join(", "_L1);
const QString Track::kUpdateSpec = Utilities::Updateify(Track::kColumns).join(", "_L1);

namespace {
constexpr char kTagSeparator[] = ";";
}

struct Track::Private : public QSharedData {
  Private();

  int id_;
  QString uid_;
  qint64 revision_;

  MediaSource media_source_;

  QString title_;
  QString artist_;
  QString album_;
  QString albumartist_;
  QString composer_;
  QString genre_;
  QString grouping_;
  QString comment_;
  int year_;
  int track_;
  int disc_;
  std::optional<double> bpm_;
  QString initial_key_;
  QStringList tags_;

  qint64 updated_at_;
};

Track::Private::Private()
    : id_(-1),
      revision_(0),
      year_(-1),
      track_(-1),
      disc_(-1),
      updated_at_(-1) {}

Track::Track() : d(new Private) {}
Track::Track(const Track &other) = default;
Track::~Track() = default;

Track &Track::operator=(const Track &other) {
  d = other.d;
  return *this;
}

QString Track::JoinedColumnSpec() {

  return u"tracks.ROWID AS track_id, media_sources.ROWID AS source_id, "_s +
         Utilities::Prepend(u"tracks."_s, kColumns).join(", "_L1) + u", "_s +
         Utilities::Prepend(u"media_sources."_s, MediaSource::kColumns).join(", "_L1);

}

QString Track::CreateUid() {
  return QUuid::createUuid().toString(QUuid::WithoutBraces);
}

bool Track::is_valid() const { return d->id_ != -1; }

int Track::id() const { return d->id_; }
const QString &Track::uid() const { return d->uid_; }
qint64 Track::revision() const { return d->revision_; }

const MediaSource &Track::media_source() const { return d->media_source_; }
MediaSource &Track::media_source() { return d->media_source_; }

const QString &Track::title() const { return d->title_; }
const QString &Track::artist() const { return d->artist_; }
const QString &Track::album() const { return d->album_; }
const QString &Track::albumartist() const { return d->albumartist_; }
const QString &Track::composer() const { return d->composer_; }
const QString &Track::genre() const { return d->genre_; }
const QString &Track::grouping() const { return d->grouping_; }
const QString &Track::comment() const { return d->comment_; }
int Track::year() const { return d->year_; }
int Track::track() const { return d->track_; }
int Track::disc() const { return d->disc_; }
std::optional<double> Track::bpm() const { return d->bpm_; }
const QString &Track::initial_key() const { return d->initial_key_; }
const QStringList &Track::tags() const { return d->tags_; }
qint64 Track::updated_at() const { return d->updated_at_; }

bool Track::has_unsynchronized_changes() const {
  return d->media_source_.synchronized_rev.has_value() && d->media_source_.synchronized_rev.value() != d->revision_;
}

void Track::set_id(const int id) { d->id_ = id; }
void Track::set_uid(const QString &uid) { d->uid_ = uid; }
void Track::set_revision(const qint64 revision) { d->revision_ = revision; }
void Track::set_media_source(const MediaSource &media_source) { d->media_source_ = media_source; }

void Track::set_title(const QString &title) { d->title_ = title; }
void Track::set_artist(const QString &artist) { d->artist_ = artist; }
void Track::set_album(const QString &album) { d->album_ = album; }
void Track::set_albumartist(const QString &albumartist) { d->albumartist_ = albumartist; }
void Track::set_composer(const QString &composer) { d->composer_ = composer; }
void Track::set_genre(const QString &genre) { d->genre_ = genre; }
void Track::set_grouping(const QString &grouping) { d->grouping_ = grouping; }
void Track::set_comment(const QString &comment) { d->comment_ = comment; }
void Track::set_year(const int year) { d->year_ = year; }
void Track::set_track(const int track) { d->track_ = track; }
void Track::set_disc(const int disc) { d->disc_ = disc; }
void Track::set_bpm(const std::optional<double> bpm) { d->bpm_ = bpm; }
void Track::set_initial_key(const QString &initial_key) { d->initial_key_ = initial_key; }
void Track::set_tags(const QStringList &tags) { d->tags_ = tags; }
void Track::set_updated_at(const qint64 updated_at) { d->updated_at_ = updated_at; }

void Track::InitFromQuery(const SqlRow &row) {

  d->id_ = row.ValueToInt(u"track_id"_s);
  d->uid_ = row.ValueToString(u"uid"_s);
  d->revision_ = row.ValueToLongLong(u"revision"_s);

  d->title_ = row.ValueToString(u"title"_s);
  d->artist_ = row.ValueToString(u"artist"_s);
  d->album_ = row.ValueToString(u"album"_s);
  d->albumartist_ = row.ValueToString(u"albumartist"_s);
  d->composer_ = row.ValueToString(u"composer"_s);
  d->genre_ = row.ValueToString(u"genre"_s);
  d->grouping_ = row.ValueToString(u"grouping"_s);
  d->comment_ = row.ValueToString(u"comment"_s);
  d->year_ = row.ValueToInt(u"year"_s);
  d->track_ = row.ValueToInt(u"track"_s);
  d->disc_ = row.ValueToInt(u"disc"_s);
  d->bpm_ = row.ValueToOptionalDouble(u"bpm"_s);
  d->initial_key_ = row.ValueToString(u"initial_key"_s);
  d->tags_ = row.ValueToString(u"tags"_s).split(QLatin1String(kTagSeparator), Qt::SkipEmptyParts);
  d->updated_at_ = row.ValueToLongLong(u"updated_at"_s);

  d->media_source_.InitFromQuery(row);

}

void Track::BindToQuery(SqlQuery *query) const {

  query->BindStringValue(u":uid"_s, d->uid_);
  query->BindValue(u":revision"_s, d->revision_);
  query->BindValue(u":media_source_id"_s, d->media_source_.id);

  query->BindStringValue(u":title"_s, d->title_);
  query->BindStringValue(u":artist"_s, d->artist_);
  query->BindStringValue(u":album"_s, d->album_);
  query->BindStringValue(u":albumartist"_s, d->albumartist_);
  query->BindStringValue(u":composer"_s, d->composer_);
  query->BindStringValue(u":genre"_s, d->genre_);
  query->BindStringValue(u":grouping"_s, d->grouping_);
  query->BindStringValue(u":comment"_s, d->comment_);
  query->BindIntValue(u":year"_s, d->year_);
  query->BindIntValue(u":track"_s, d->track_);
  query->BindIntValue(u":disc"_s, d->disc_);
  query->BindDoubleOrNullValue(u":bpm"_s, d->bpm_);
  query->BindStringValue(u":initial_key"_s, d->initial_key_);
  query->BindStringValue(u":tags"_s, d->tags_.join(QLatin1String(kTagSeparator)));
  query->BindLongLongValue(u":updated_at"_s, d->updated_at_);

}

bool Track::Validate(QString *error) const {

  if (d->uid_.isEmpty()) {
    if (error) *error = u"Missing uid"_s;
    return false;
  }
  if (d->revision_ < 1) {
    if (error) *error = u"Invalid revision %1"_s.arg(d->revision_);
    return false;
  }
  if (d->media_source_.content_path.isEmpty() || d->media_source_.content_path.endsWith(u'/')) {
    if (error) *error = u"Invalid content path"_s;
    return false;
  }
  if (d->media_source_.content_type.isEmpty()) {
    if (error) *error = u"Missing content type"_s;
    return false;
  }
  if (d->year_ > 9999) {
    if (error) *error = u"Invalid year %1"_s.arg(d->year_);
    return false;
  }
  if (d->bpm_.has_value() && *d->bpm_ < 0) {
    if (error) *error = u"Invalid tempo"_s;
    return false;
  }

  return true;

}

bool Track::IsMetadataEqual(const Track &other) const {

  return d->title_ == other.d->title_ &&
         d->artist_ == other.d->artist_ &&
         d->album_ == other.d->album_ &&
         d->albumartist_ == other.d->albumartist_ &&
         d->composer_ == other.d->composer_ &&
         d->genre_ == other.d->genre_ &&
         d->grouping_ == other.d->grouping_ &&
         d->comment_ == other.d->comment_ &&
         d->year_ == other.d->year_ &&
         d->track_ == other.d->track_ &&
         d->disc_ == other.d->disc_ &&
         d->bpm_ == other.d->bpm_ &&
         d->initial_key_ == other.d->initial_key_ &&
         d->tags_ == other.d->tags_;

}

QString Track::PrettyTitle() const {

  if (!d->title_.isEmpty()) return d->title_;

  return QFileInfo(d->media_source_.content_path).fileName();

}
