/*
 * Gooseberry
 * This file was part of Strawberry Music Player and Clementine.
 * Copyright 2012, David Sansome <me@davidsansome.com>
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

#ifndef COMMANDLINEOPTIONS_H
#define COMMANDLINEOPTIONS_H

#include "config.h"

#include <optional>

#include <QtGlobal>
#include <QString>
#include <QStringList>
#include <QUrl>

#include "mediatracker/dirtrackingstatus.h"
#include "mediatracker/syncmode.h"

class CommandlineOptions {
 public:
  explicit CommandlineOptions(int argc = 0, char **argv = nullptr);

  enum class Command {
    None,
    AddCollection,
    Scan,
    Import,
    Status,
    Untrack,
    PurgeOrphaned,
    PurgeUntracked,
    Relocate,
    FindUntracked,
    Relink,
    Backup
  };

  // Returns false if the arguments are invalid, the reason is written to stderr.
  bool Parse();

  Command command() const { return command_; }
  bool help_requested() const { return help_requested_; }

  QString database() const { return database_; }
  QString log_levels() const { return log_levels_; }

  // The collection the command works on, given as its root directory
  QUrl collection_url() const { return collection_url_; }
  // A directory below the collection root, empty for the whole collection
  QUrl root_url() const { return root_url_; }
  // Relocate only
  QUrl old_prefix_url() const { return old_prefix_url_; }
  QUrl new_prefix_url() const { return new_prefix_url_; }

  QString title() const { return title_; }
  std::optional<SyncMode> sync_mode() const { return sync_mode_; }
  std::optional<int> max_depth() const { return max_depth_; }
  std::optional<DirTrackingStatus> status_filter() const { return status_filter_; }
  bool read_embedded_artwork() const { return read_embedded_artwork_; }
  bool genres_as_tags() const { return genres_as_tags_; }

  static QString HelpText();
  static std::optional<Command> CommandFromString(const QString &command);

 private:
  // These are "invalid" characters to pass to getopt_long for options that shouldn't have a short (single character) option.
  enum LongOptions {
    Database = 256,
    Root,
    Title,
    SyncModeOption,
    MaxDepth,
    Status,
    NoEmbeddedArtwork,
    GenresAsTags,
    Quiet,
    Verbose,
    LogLevels,
    Version
  };

  bool ParseArguments(const QStringList &arguments);

  static QString OptArgToString(const char *opt);
  static QString DecodeName(char *opt);
  static QUrl DirectoryToUrl(const QString &directory);

 private:
  int argc_;
  char **argv_;

  Command command_;
  bool help_requested_;

  QString database_;
  QString log_levels_;

  QUrl collection_url_;
  QUrl root_url_;
  QUrl old_prefix_url_;
  QUrl new_prefix_url_;

  QString title_;
  std::optional<SyncMode> sync_mode_;
  std::optional<int> max_depth_;
  std::optional<DirTrackingStatus> status_filter_;
  bool read_embedded_artwork_;
  bool genres_as_tags_;
};

#endif  // COMMANDLINEOPTIONS_H
