/*
 * Gooseberry
 * This file was part of Strawberry Music Player and Clementine.
 * Copyright 2010, David Sansome <me@davidsansome.com>
 * Copyright 2018-2021, Jonas Kvinge <jonas@jkvinge.net>
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

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <optional>

#include <QtGlobal>
#include <QCoreApplication>
#include <QObject>
#include <QThread>
#include <QFileInfo>
#include <QString>
#include <QUrl>
#include <QSqlDatabase>

#include "includes/shared_ptr.h"
#include "core/logging.h"
#include "core/metatypes.h"
#include "core/commandlineoptions.h"
#include "core/unixsignalwatcher.h"
#include "core/settings.h"
#include "core/taskmanager.h"
#include "core/database.h"
#include "constants/mediatrackersettings.h"
#include "media/collection.h"
#include "mediatracker/mediatracker.h"
#include "mediatracker/mediatrackerbackend.h"
#include "mediatracker/mediatrackeroutcomes.h"
#include "trackimporter/trackimportertaglib.h"

using namespace Qt::Literals::StringLiterals;
using std::make_shared;

namespace {

constexpr int kExitAborted = 2;

void PrintLine(const QString &line) {
  std::cout << line.toLocal8Bit().constData() << std::endl;
}

void PrintError(const QString &line) {
  std::cerr << line.toLocal8Bit().constData() << std::endl;
}

QString DirectoriesStatusText(const DirectoriesStatus &status) {
  return u"current=%1 outdated=%2 added=%3 modified=%4 orphaned=%5"_s
      .arg(status.current)
      .arg(status.outdated)
      .arg(status.added)
      .arg(status.modified)
      .arg(status.orphaned);
}

QString CompletionText(const Completion completion) {
  return completion == Completion::Aborted ? u"aborted"_s : u"finished"_s;
}

void PrintCollection(const Collection &collection) {
  PrintLine(u"collection %1 %2 \"%3\" %4"_s.arg(collection.id).arg(collection.uid, collection.title, collection.root_url.toString()));
}

void PrintScanOutcome(const ScanOutcome &outcome) {
  PrintLine(u"scan %1: %2"_s.arg(CompletionText(outcome.completion), outcome.root_url.toString()));
  PrintLine(u"  directories: %1 skipped=%2"_s.arg(DirectoriesStatusText(outcome.directories)).arg(outcome.directories.skipped));
}

void PrintImportOutcome(const ImportOutcome &outcome) {

  PrintLine(u"import %1: %2"_s.arg(CompletionText(outcome.completion), outcome.root_url.toString()));
  PrintLine(u"  tracks: created=%1 updated=%2 unchanged=%3 skipped=%4 failed=%5 not_imported=%6 not_created=%7 not_updated=%8"_s
                .arg(outcome.tracks.created)
                .arg(outcome.tracks.updated)
                .arg(outcome.tracks.unchanged)
                .arg(outcome.tracks.skipped)
                .arg(outcome.tracks.failed)
                .arg(outcome.tracks.not_imported)
                .arg(outcome.tracks.not_created)
                .arg(outcome.tracks.not_updated));
  PrintLine(u"  directories: confirmed=%1 skipped=%2 untracked=%3"_s
                .arg(outcome.directories.confirmed)
                .arg(outcome.directories.skipped)
                .arg(outcome.directories.untracked));
  for (const ImportIssue &issue : outcome.issues) {
    PrintLine(u"  %1: %2"_s.arg(issue.content_path, issue.messages.join("; "_L1)));
  }

}

}  // namespace

int main(int argc, char *argv[]) {

  QCoreApplication::setApplicationName(u"Gooseberry"_s);
  QCoreApplication::setOrganizationName(u"Gooseberry"_s);
  QCoreApplication::setApplicationVersion(QStringLiteral(GOOSEBERRY_VERSION_DISPLAY));

  RegisterMetaTypes();

  // Initialize logging. Log levels are set after the commandline options are parsed below.
  logging::Init();

  CommandlineOptions options(argc, argv);
  if (!options.Parse()) {
    PrintError(CommandlineOptions::HelpText());
    return EXIT_FAILURE;
  }
  if (options.help_requested()) {
    PrintLine(CommandlineOptions::HelpText());
    return EXIT_SUCCESS;
  }
  logging::SetLevels(options.log_levels());

  QCoreApplication app(argc, argv);

  Q_INIT_RESOURCE(data);

  QString database_filename = options.database();
  if (database_filename.isEmpty()) {
    Settings s;
    s.beginGroup(QLatin1String(MediaTrackerSettings::kSettingsGroup));
    database_filename = s.value(QLatin1String(MediaTrackerSettings::kDatabase)).toString();
    s.endGroup();
  }

  SharedPtr<TaskManager> task_manager = make_shared<TaskManager>();
  SharedPtr<Database> database = make_shared<Database>(task_manager, nullptr, database_filename);
  if (!database->Connect().isOpen()) {
    PrintError(QObject::tr("Could not open the database %1").arg(database->database_filename()));
    database->Close();
    return EXIT_FAILURE;
  }

  if (options.command() == CommandlineOptions::Command::Backup) {
    bool backup_success = false;
    QObject::connect(&*database, &Database::BackupFinished, &app, [&backup_success](const bool success) { backup_success = success; });
    database->DoBackup();
    database->Close();
    if (!backup_success) {
      PrintError(QObject::tr("Database backup failed"));
      return EXIT_FAILURE;
    }
    PrintLine(QObject::tr("Database backed up to %1.bak").arg(database->database_filename()));
    return EXIT_SUCCESS;
  }

  SharedPtr<MediaTrackerBackend> backend = make_shared<MediaTrackerBackend>();
  backend->Init(database);

  Collection collection;
  if (!backend->LoadCollectionByUrl(options.collection_url(), &collection)) {
    PrintError(QObject::tr("Could not load the collection %1").arg(options.collection_url().toString()));
    backend->Close();
    return EXIT_FAILURE;
  }

  if (options.command() == CommandlineOptions::Command::AddCollection) {
    int exit_code = EXIT_SUCCESS;
    if (!collection.is_valid()) {
      const QString title = options.title().isEmpty() ? QFileInfo(options.collection_url().toLocalFile()).fileName() : options.title();
      if (!backend->AddCollection(options.collection_url(), title, &collection)) {
        PrintError(QObject::tr("Could not add the collection %1").arg(options.collection_url().toString()));
        exit_code = EXIT_FAILURE;
      }
    }
    if (exit_code == EXIT_SUCCESS) PrintCollection(collection);
    backend->Close();
    return exit_code;
  }

  if (!collection.is_valid()) {
    PrintError(QObject::tr("There is no collection at %1, add it with add-collection").arg(options.collection_url().toString()));
    backend->Close();
    return EXIT_FAILURE;
  }

  // The main thread connection is not needed anymore, the tracker thread opens its own.
  backend->Close();

  SharedPtr<TrackImporterBase> importer = make_shared<TrackImporterTagLib>();
  SharedPtr<MediaTracker> tracker = make_shared<MediaTracker>(task_manager, backend, importer);

  QThread tracker_thread;
  tracker_thread.setObjectName(u"MediaTracker"_s);
  backend->moveToThread(&tracker_thread);
  tracker->moveToThread(&tracker_thread);

  int exit_code = EXIT_SUCCESS;

  UnixSignalWatcher signal_watcher;
  signal_watcher.WatchForSignal(SIGINT);
  signal_watcher.WatchForSignal(SIGTERM);
  QObject::connect(&signal_watcher, &UnixSignalWatcher::UnixSignal, &app, [&tracker](const int signal) {
    qLog(Info) << "Received signal" << signal << "aborting";
    tracker->Abort();
  });

  // Shutdown: the tracker and the backend return to the main thread, then the thread stops.
  QObject::connect(&*tracker, &MediaTracker::ExitFinished, &app, [&backend]() { backend->ExitAsync(); });
  QObject::connect(&*backend, &MediaTrackerBackend::ExitFinished, &app, [&tracker_thread, &exit_code]() {
    tracker_thread.quit();
    QCoreApplication::exit(exit_code);
  });

  const auto finish = [&tracker, &exit_code](const int code) {
    exit_code = code;
    tracker->ExitAsync();
  };

  QObject::connect(&*tracker, &MediaTracker::Error, &app, [finish](const QString &error) {
    PrintError(error);
    finish(EXIT_FAILURE);
  });
  QObject::connect(&*tracker, &MediaTracker::ScanProgressUpdated, &app, [](const ScanProgress &progress) {
    qLog(Debug) << "Scanned" << progress.directories_finished << "directories," << progress.entries_finished << "entries in" << progress.elapsed_msec << "msec";
  });
  QObject::connect(&*tracker, &MediaTracker::ImportProgressUpdated, &app, [](const ImportProgress &progress) {
    qLog(Debug) << "Imported" << progress.tracks.total() << "files," << progress.directories.confirmed << "directories in" << progress.elapsed_msec << "msec";
  });
  QObject::connect(&*tracker, &MediaTracker::ScanFinished, &app, [finish](const ScanOutcome &outcome) {
    PrintScanOutcome(outcome);
    finish(outcome.completion == Completion::Aborted ? kExitAborted : EXIT_SUCCESS);
  });
  QObject::connect(&*tracker, &MediaTracker::ImportFinished, &app, [finish](const ImportOutcome &outcome) {
    PrintImportOutcome(outcome);
    finish(outcome.completion == Completion::Aborted ? kExitAborted : EXIT_SUCCESS);
  });
  QObject::connect(&*tracker, &MediaTracker::StatusQueried, &app, [finish](const QUrl &root_url, const DirectoriesStatus &status) {
    PrintLine(u"status: %1"_s.arg(root_url.toString()));
    PrintLine(u"  directories: %1 pending=%2 total=%3"_s.arg(DirectoriesStatusText(status)).arg(status.pending()).arg(status.total()));
    finish(EXIT_SUCCESS);
  });
  QObject::connect(&*tracker, &MediaTracker::UntrackFinished, &app, [finish](const UntrackOutcome &outcome) {
    PrintLine(u"untrack: %1"_s.arg(outcome.root_url.toString()));
    PrintLine(u"  directories: untracked=%1"_s.arg(outcome.untracked));
    finish(EXIT_SUCCESS);
  });
  QObject::connect(&*tracker, &MediaTracker::PurgeFinished, &app, [finish](const PurgeOutcome &outcome) {
    PrintLine(u"purge: %1"_s.arg(outcome.root_url.toString()));
    PrintLine(u"  purged: sources=%1 tracks=%2 untracked=%3"_s.arg(outcome.purged_sources).arg(outcome.purged_tracks).arg(outcome.untracked));
    finish(EXIT_SUCCESS);
  });
  QObject::connect(&*tracker, &MediaTracker::RelocateFinished, &app, [finish](const RelocateOutcome &outcome) {
    PrintLine(u"relocate: %1 -> %2"_s.arg(outcome.old_prefix_url.toString(), outcome.new_prefix_url.toString()));
    PrintLine(u"  relocated: sources=%1 directories=%2"_s.arg(outcome.relocated_sources).arg(outcome.relocated_directories));
    finish(EXIT_SUCCESS);
  });

  QObject::connect(&*tracker, &MediaTracker::FindUntrackedFinished, &app, [finish](const FindUntrackedOutcome &outcome) {
    PrintLine(u"find-untracked %1: %2"_s.arg(CompletionText(outcome.completion), outcome.root_url.toString()));
    for (const QString &content_path : outcome.content_paths) {
      PrintLine(u"  %1"_s.arg(content_path));
    }
    PrintLine(u"  untracked files: %1"_s.arg(outcome.content_paths.count()));
    finish(outcome.completion == Completion::Aborted ? kExitAborted : EXIT_SUCCESS);
  });
  QObject::connect(&*tracker, &MediaTracker::RelinkFinished, &app, [finish](const RelinkOutcome &outcome) {
    PrintLine(u"relink %1: %2"_s.arg(CompletionText(outcome.completion), outcome.root_url.toString()));
    for (const RelinkedMediaSource &relinked : outcome.relinked) {
      PrintLine(u"  %1 -> %2"_s.arg(relinked.old_content_path, relinked.new_content_path));
    }
    PrintLine(u"  tracks: relinked=%1 skipped=%2"_s.arg(outcome.relinked.count()).arg(outcome.skipped));
    finish(outcome.completion == Completion::Aborted ? kExitAborted : EXIT_SUCCESS);
  });

  tracker_thread.start();

  switch (options.command()) {
    case CommandlineOptions::Command::Scan:{
      ScanParams params;
      params.root_url = options.root_url();
      params.max_depth = options.max_depth().value_or(tracker->max_depth());
      tracker->ScanAsync(collection.id, params);
      break;
    }
    case CommandlineOptions::Command::Import:{
      ImportParams params;
      params.root_url = options.root_url();
      params.sync_mode = options.sync_mode().value_or(tracker->sync_mode());
      params.import_config.read_embedded_artwork = options.read_embedded_artwork();
      params.import_config.genres_as_tags = options.genres_as_tags();
      tracker->ImportAsync(collection.id, params);
      break;
    }
    case CommandlineOptions::Command::Status:
      tracker->QueryStatusAsync(collection.id, options.root_url());
      break;
    case CommandlineOptions::Command::Untrack:
      tracker->UntrackAsync(collection.id, options.root_url(), options.status_filter());
      break;
    case CommandlineOptions::Command::PurgeOrphaned:
      tracker->PurgeOrphanedAsync(collection.id, options.root_url());
      break;
    case CommandlineOptions::Command::PurgeUntracked:
      tracker->PurgeUntrackedAsync(collection.id, options.root_url());
      break;
    case CommandlineOptions::Command::Relocate:
      tracker->RelocateAsync(collection.id, options.old_prefix_url(), options.new_prefix_url());
      break;
    case CommandlineOptions::Command::FindUntracked:{
      ScanParams params;
      params.root_url = options.root_url();
      params.max_depth = options.max_depth().value_or(tracker->max_depth());
      tracker->FindUntrackedFilesAsync(collection.id, params);
      break;
    }
    case CommandlineOptions::Command::Relink:
      tracker->RelinkAsync(collection.id, options.root_url());
      break;
    default:
      finish(EXIT_FAILURE);
      break;
  }

  const int ret = app.exec();

  tracker_thread.wait();
  database->Close();

  return ret;

}
