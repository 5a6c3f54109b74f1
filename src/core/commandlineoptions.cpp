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

#include "config.h"

#include <cstdlib>
#include <iostream>
#include <optional>

#include <QtGlobal>
#include <QObject>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QByteArray>
#include <QString>
#include <QStringList>
#include <QUrl>

#include "commandlineoptions.h"
#include "core/logging.h"

#include <getopt.h>

using namespace Qt::Literals::StringLiterals;

namespace {

constexpr char kHelpText[] =
    "%1: gooseberry-tracker [%2] <%3> [%4]\n"
    "\n"
    "%5:\n"
    "  add-collection <dir>                %6\n"
    "  scan <collection>                   %7\n"
    "  import <collection>                 %8\n"
    "  status <collection>                 %9\n"
    "  untrack <collection>                %10\n"
    "  purge-orphaned <collection>         %11\n"
    "  purge-untracked <collection>        %12\n"
    "  relocate <collection> <old> <new>   %13\n"
    "  find-untracked <collection>         %14\n"
    "  relink <collection>                 %15\n"
    "  backup                              %16\n"
    "\n"
    "%17:\n"
    "      --database <file>               %18\n"
    "      --root <dir>                    %19\n"
    "      --title <title>                 %20\n"
    "      --sync-mode <mode>              %21\n"
    "      --max-depth <n>                 %22\n"
    "      --status <status>               %23\n"
    "      --no-embedded-artwork           %24\n"
    "      --genres-as-tags                %25\n"
    "      --quiet                         %26\n"
    "      --verbose                       %27\n"
    "      --log-levels <levels>           %28\n"
    "      --version                       %29\n"
    "  -h, --help                          %30\n";

constexpr char kVersionText[] = "Gooseberry %1";

}  // namespace

CommandlineOptions::CommandlineOptions(int argc, char **argv)
    : argc_(argc),
      argv_(argv),
      command_(Command::None),
      help_requested_(false),
      log_levels_(QLatin1String(logging::kDefaultLogLevels)),
      read_embedded_artwork_(true),
      genres_as_tags_(false) {}

QString CommandlineOptions::HelpText() {

  return QObject::tr(kHelpText)
      .arg(QObject::tr("Usage"), QObject::tr("options"), QObject::tr("command"), QObject::tr("arguments"))
      .arg(QObject::tr("Commands"),
           QObject::tr("Add a collection rooted at a directory"),
           QObject::tr("Detect added, modified and removed directories"),
           QObject::tr("Import the tracks of pending directories"),
           QObject::tr("Show the number of directories per status"),
           QObject::tr("Remove tracking records"),
           QObject::tr("Delete media sources of orphaned directories"),
           QObject::tr("Delete media sources without a tracking record"),
           QObject::tr("Move content paths to a new directory"))
      .arg(QObject::tr("List files that have no media source"),
           QObject::tr("Move tracks of moved files to their new location"),
           QObject::tr("Write a backup copy of the database"),
           QObject::tr("Options"),
           QObject::tr("Use a different database file"),
           QObject::tr("Only work on this directory of the collection"),
           QObject::tr("Title of a new collection"),
           QObject::tr("once, modified, modified-resync or always"),
           QObject::tr("Directory levels to scan, -1 for unlimited"))
      .arg(QObject::tr("Only untrack directories with this status"),
           QObject::tr("Don't look for embedded artwork"),
           QObject::tr("Store genres as tags too"),
           QObject::tr("Less output"),
           QObject::tr("More output"),
           QObject::tr("Comma separated list of class:level, level is 0-3"),
           QObject::tr("Print out version information"),
           QObject::tr("Print this help"));

}

std::optional<CommandlineOptions::Command> CommandlineOptions::CommandFromString(const QString &command) {

  if (command == "add-collection"_L1) return Command::AddCollection;
  if (command == "scan"_L1) return Command::Scan;
  if (command == "import"_L1) return Command::Import;
  if (command == "status"_L1) return Command::Status;
  if (command == "untrack"_L1) return Command::Untrack;
  if (command == "purge-orphaned"_L1) return Command::PurgeOrphaned;
  if (command == "purge-untracked"_L1) return Command::PurgeUntracked;
  if (command == "relocate"_L1) return Command::Relocate;
  if (command == "find-untracked"_L1) return Command::FindUntracked;
  if (command == "relink"_L1) return Command::Relink;
  if (command == "backup"_L1) return Command::Backup;

  return std::nullopt;

}

bool CommandlineOptions::Parse() {

  static const struct option kOptions[] = {
      {"help", no_argument, nullptr, 'h'},
      {"database", required_argument, nullptr, LongOptions::Database},
      {"root", required_argument, nullptr, LongOptions::Root},
      {"title", required_argument, nullptr, LongOptions::Title},
      {"sync-mode", required_argument, nullptr, LongOptions::SyncModeOption},
      {"max-depth", required_argument, nullptr, LongOptions::MaxDepth},
      {"status", required_argument, nullptr, LongOptions::Status},
      {"no-embedded-artwork", no_argument, nullptr, LongOptions::NoEmbeddedArtwork},
      {"genres-as-tags", no_argument, nullptr, LongOptions::GenresAsTags},
      {"quiet", no_argument, nullptr, LongOptions::Quiet},
      {"verbose", no_argument, nullptr, LongOptions::Verbose},
      {"log-levels", required_argument, nullptr, LongOptions::LogLevels},
      {"version", no_argument, nullptr, LongOptions::Version},
      {nullptr, 0, nullptr, 0}};

  // Parse the arguments
  bool ok = false;
  Q_FOREVER {
    const int c = getopt_long(argc_, argv_, "h", kOptions, nullptr);

    // End of the options
    if (c == -1) break;

    switch (c) {
      case 'h':
        help_requested_ = true;
        return true;

      case LongOptions::Database:
        database_ = QFileInfo(DecodeName(optarg)).absoluteFilePath();
        break;

      case LongOptions::Root:
        root_url_ = DirectoryToUrl(DecodeName(optarg));
        break;

      case LongOptions::Title:
        title_ = OptArgToString(optarg);
        break;

      case LongOptions::SyncModeOption:{
        const QString value = OptArgToString(optarg);
        sync_mode_ = SyncModeFromString(value);
        if (!sync_mode_.has_value()) {
          std::cerr << QObject::tr("Unknown sync mode: %1").arg(value).toLocal8Bit().constData() << std::endl;
          return false;
        }
        break;
      }

      case LongOptions::MaxDepth:{
        const int max_depth = OptArgToString(optarg).toInt(&ok);
        if (!ok || max_depth < -1) {
          std::cerr << QObject::tr("Invalid maximum depth: %1").arg(OptArgToString(optarg)).toLocal8Bit().constData() << std::endl;
          return false;
        }
        max_depth_ = max_depth;
        break;
      }

      case LongOptions::Status:{
        const QString value = OptArgToString(optarg);
        status_filter_ = DirTrackingStatusFromString(value);
        if (!status_filter_.has_value()) {
          std::cerr << QObject::tr("Unknown directory status: %1").arg(value).toLocal8Bit().constData() << std::endl;
          return false;
        }
        break;
      }

      case LongOptions::NoEmbeddedArtwork:
        read_embedded_artwork_ = false;
        break;

      case LongOptions::GenresAsTags:
        genres_as_tags_ = true;
        break;

      case LongOptions::Quiet:
        log_levels_ = u"1"_s;
        break;

      case LongOptions::Verbose:
        log_levels_ = u"3"_s;
        break;

      case LongOptions::LogLevels:
        log_levels_ = OptArgToString(optarg);
        break;

      case LongOptions::Version:{
        const QString version_text = QString::fromUtf8(kVersionText).arg(QStringLiteral(GOOSEBERRY_VERSION_DISPLAY));
        std::cout << version_text.toLocal8Bit().constData() << std::endl;
        std::exit(0);
      }

      case '?':
      default:
        return false;
    }
  }

  QStringList arguments;
  for (int i = optind; i < argc_; ++i) {
    arguments << DecodeName(argv_[i]);
  }

  return ParseArguments(arguments);

}

bool CommandlineOptions::ParseArguments(const QStringList &arguments) {

  if (arguments.isEmpty()) {
    std::cerr << QObject::tr("No command given").toLocal8Bit().constData() << std::endl;
    return false;
  }

  const std::optional<Command> command = CommandFromString(arguments.first());
  if (!command.has_value()) {
    std::cerr << QObject::tr("Unknown command: %1").arg(arguments.first()).toLocal8Bit().constData() << std::endl;
    return false;
  }
  command_ = *command;

  qsizetype expected_arguments = 1;
  switch (command_) {
    case Command::Backup:
      expected_arguments = 0;
      break;
    case Command::Relocate:
      expected_arguments = 3;
      break;
    default:
      break;
  }

  if (arguments.count() - 1 != expected_arguments) {
    std::cerr << QObject::tr("Wrong number of arguments for %1").arg(arguments.first()).toLocal8Bit().constData() << std::endl;
    return false;
  }

  if (expected_arguments >= 1) {
    collection_url_ = DirectoryToUrl(arguments.value(1));
  }
  if (command_ == Command::Relocate) {
    old_prefix_url_ = DirectoryToUrl(arguments.value(2));
    new_prefix_url_ = DirectoryToUrl(arguments.value(3));
  }

  return true;

}

QUrl CommandlineOptions::DirectoryToUrl(const QString &directory) {

  if (directory.contains("://"_L1)) {
    return QUrl(directory);
  }

  return QUrl::fromLocalFile(QFileInfo(directory).absoluteFilePath());

}

QString CommandlineOptions::OptArgToString(const char *opt) {

  return QString::fromUtf8(opt);

}

QString CommandlineOptions::DecodeName(char *opt) {

  return QFile::decodeName(opt);

}
