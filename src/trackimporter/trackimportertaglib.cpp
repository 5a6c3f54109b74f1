/*
 * Gooseberry
 * This file was part of Strawberry Music Player.
 * Copyright 2013, David Sansome <me@davidsansome.com>
 * Copyright 2018-2025, Jonas Kvinge <jonas@jkvinge.net>
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

#include <taglib/tbytevector.h>
#include <taglib/tbytevectorstream.h>
#include <taglib/tstringlist.h>
#include <taglib/audioproperties.h>
#include <taglib/tag.h>
#include <taglib/xiphcomment.h>
#include <taglib/flacfile.h>
#include <taglib/mpegfile.h>
#include <taglib/mp4file.h>
#include <taglib/mp4tag.h>
#include <taglib/apefile.h>
#include <taglib/wavpackfile.h>
#include <taglib/wavfile.h>
#include <taglib/aifffile.h>
#include <taglib/id3v2tag.h>

#include <QObject>
#include <QByteArray>
#include <QString>
#include <QStringList>
#include <QFileInfo>
#include <QMimeDatabase>
#include <QMimeType>

#include "core/logging.h"
#include "trackimportertaglib.h"

using namespace Qt::Literals::StringLiterals;

namespace {

const QStringList &SupportedSuffixes() {

  static const QStringList suffixes = QStringList() << u"mp3"_s << u"mp2"_s << u"flac"_s << u"ogg"_s << u"oga"_s << u"opus"_s << u"spx"_s
                                                    << u"m4a"_s << u"m4b"_s << u"mp4"_s << u"aac"_s << u"wma"_s << u"asf"_s
                                                    << u"wav"_s << u"aif"_s << u"aiff"_s << u"ape"_s << u"mpc"_s << u"wv"_s;
  return suffixes;

}

}  // namespace

TrackImporterTagLib::TrackImporterTagLib() = default;

TrackImporterTagLib::~TrackImporterTagLib() = default;

bool TrackImporterTagLib::IsSupportedFile(const QString &content_path) {

  return SupportedSuffixes().contains(QFileInfo(content_path).suffix().toLower());

}

TrackImporterResult TrackImporterTagLib::Import(const QByteArray &data, const QString &content_path, const Track *existing, const ImportTrackConfig &config, Track *track, QStringList *issues) const {

  if (!IsSupportedFile(content_path)) {
    return TrackImporterResult(TrackImporterResult::ErrorCode::Unsupported, content_path);
  }

  if (data.isEmpty()) {
    return TrackImporterResult(TrackImporterResult::ErrorCode::FileParseError, QObject::tr("File is empty"));
  }

  qLog(Debug) << "Reading tags from" << content_path;

  TagLib::ByteVector buffer(data.constData(), static_cast<unsigned int>(data.size()));
  TagLib::ByteVectorStream stream(buffer);
  TagLib::FileRef fileref(&stream, true, TagLib::AudioProperties::Average);
  if (fileref.isNull() || !fileref.file() || !fileref.file()->isValid()) {
    qLog(Error) << "TagLib could not parse" << content_path;
    return TrackImporterResult::ErrorCode::FileParseError;
  }

  Track imported;
  if (existing) {
    // Tags are kept, they are not stored in the file.
    imported.set_tags(existing->tags());
  }

  MediaSource &media_source = imported.media_source();
  media_source.content_path = content_path;
  media_source.content_type = QMimeDatabase().mimeTypeForFileNameAndData(content_path, data).name();

  if (TagLib::Tag *tag = fileref.tag()) {
    imported.set_title(TagLibStringToQString(tag->title()).trimmed());
    imported.set_artist(TagLibStringToQString(tag->artist()).trimmed());
    imported.set_album(TagLibStringToQString(tag->album()).trimmed());
    imported.set_genre(TagLibStringToQString(tag->genre()).trimmed());
    imported.set_comment(TagLibStringToQString(tag->comment()).trimmed());
    if (tag->year() > 0) imported.set_year(static_cast<int>(tag->year()));
    if (tag->track() > 0) imported.set_track(static_cast<int>(tag->track()));
  }
  else {
    issues->append(QObject::tr("No tags found"));
  }

  ReadProperties(fileref.file()->properties(), &imported, issues);
  ReadAudioProperties(&fileref, &imported);

  if (config.read_embedded_artwork) {
    media_source.art_embedded = HasEmbeddedArtwork(&fileref);
  }

  if (config.genres_as_tags && !imported.genre().isEmpty()) {
    QStringList tags = imported.tags();
    const QStringList genres = SplitGenres(imported.genre());
    for (const QString &genre : genres) {
      if (!tags.contains(genre)) tags << genre;
    }
    imported.set_tags(tags);
  }

  if (imported.title().isEmpty()) {
    issues->append(QObject::tr("Title is missing"));
  }

  *track = imported;

  return TrackImporterResult::ErrorCode::Success;

}

QString TrackImporterTagLib::PropertyValue(const TagLib::PropertyMap &properties, const char *key) {

  const TagLib::PropertyMap::ConstIterator it = properties.find(key);
  if (it == properties.end() || it->second.isEmpty()) {
    return QString();
  }

  return TagLibStringToQString(it->second.toString(";")).trimmed();

}

void TrackImporterTagLib::ReadProperties(const TagLib::PropertyMap &properties, Track *track, QStringList *issues) {

  track->set_albumartist(PropertyValue(properties, "ALBUMARTIST"));
  track->set_composer(PropertyValue(properties, "COMPOSER"));
  track->set_initial_key(PropertyValue(properties, "INITIALKEY"));

  QString grouping = PropertyValue(properties, "GROUPING");
  if (grouping.isEmpty()) grouping = PropertyValue(properties, "CONTENTGROUP");
  track->set_grouping(grouping);

  // Multiple genres are kept, separated like the tags.
  const QString genre = PropertyValue(properties, "GENRE");
  if (!genre.isEmpty()) track->set_genre(genre);

  const QString disc = PropertyValue(properties, "DISCNUMBER");
  if (!disc.isEmpty()) {
    const int disc_number = ParseLeadingNumber(disc);
    if (disc_number > 0) {
      track->set_disc(disc_number);
    }
    else {
      issues->append(QObject::tr("Invalid disc number \"%1\"").arg(disc));
    }
  }

  const QString bpm = PropertyValue(properties, "BPM");
  if (!bpm.isEmpty()) {
    bool ok = false;
    const double value = bpm.toDouble(&ok);
    if (ok && value >= 0.0) {
      track->set_bpm(value);
    }
    else {
      issues->append(QObject::tr("Invalid tempo \"%1\"").arg(bpm));
    }
  }

}

void TrackImporterTagLib::ReadAudioProperties(TagLib::FileRef *fileref, Track *track) {

  MediaSource &media_source = track->media_source();

  if (TagLib::AudioProperties *audio_properties = fileref->audioProperties()) {
    media_source.duration_msec = audio_properties->lengthInMilliseconds();
    media_source.bitrate = audio_properties->bitrate();
    media_source.samplerate = audio_properties->sampleRate();
    media_source.channels = audio_properties->channels();
  }

  if (TagLib::FLAC::File *file_flac = dynamic_cast<TagLib::FLAC::File*>(fileref->file())) {
    if (file_flac->audioProperties()) media_source.bitdepth = file_flac->audioProperties()->bitsPerSample();
  }
  else if (TagLib::WavPack::File *file_wavpack = dynamic_cast<TagLib::WavPack::File*>(fileref->file())) {
    if (file_wavpack->audioProperties()) media_source.bitdepth = file_wavpack->audioProperties()->bitsPerSample();
  }
  else if (TagLib::APE::File *file_ape = dynamic_cast<TagLib::APE::File*>(fileref->file())) {
    if (file_ape->audioProperties()) media_source.bitdepth = file_ape->audioProperties()->bitsPerSample();
  }
  else if (TagLib::MP4::File *file_mp4 = dynamic_cast<TagLib::MP4::File*>(fileref->file())) {
    if (file_mp4->audioProperties()) media_source.bitdepth = file_mp4->audioProperties()->bitsPerSample();
  }
  else if (TagLib::RIFF::WAV::File *file_wav = dynamic_cast<TagLib::RIFF::WAV::File*>(fileref->file())) {
    if (file_wav->audioProperties()) media_source.bitdepth = file_wav->audioProperties()->bitsPerSample();
  }
  else if (TagLib::RIFF::AIFF::File *file_aiff = dynamic_cast<TagLib::RIFF::AIFF::File*>(fileref->file())) {
    if (file_aiff->audioProperties()) media_source.bitdepth = file_aiff->audioProperties()->bitsPerSample();
  }

}

bool TrackImporterTagLib::HasEmbeddedArtwork(TagLib::FileRef *fileref) {

  if (TagLib::FLAC::File *file_flac = dynamic_cast<TagLib::FLAC::File*>(fileref->file())) {
    const TagLib::List<TagLib::FLAC::Picture*> pictures = file_flac->pictureList();
    for (TagLib::FLAC::Picture *picture : pictures) {
      if ((picture->type() == TagLib::FLAC::Picture::FrontCover || picture->type() == TagLib::FLAC::Picture::Other) && picture->data().size() > 0) {
        return true;
      }
    }
    return false;
  }

  if (TagLib::Ogg::XiphComment *vorbis_comment = dynamic_cast<TagLib::Ogg::XiphComment*>(fileref->file()->tag())) {
    const TagLib::List<TagLib::FLAC::Picture*> pictures = vorbis_comment->pictureList();
    for (TagLib::FLAC::Picture *picture : pictures) {
      if (picture->data().size() > 0) return true;
    }
    return false;
  }

  if (TagLib::MPEG::File *file_mpeg = dynamic_cast<TagLib::MPEG::File*>(fileref->file())) {
    return file_mpeg->hasID3v2Tag() && !file_mpeg->ID3v2Tag()->frameList("APIC").isEmpty();
  }

  if (TagLib::MP4::File *file_mp4 = dynamic_cast<TagLib::MP4::File*>(fileref->file())) {
    return file_mp4->tag() && file_mp4->tag()->contains("covr");
  }

  return false;

}
