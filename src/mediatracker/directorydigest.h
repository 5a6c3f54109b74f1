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

#ifndef DIRECTORYDIGEST_H
#define DIRECTORYDIGEST_H

#include "config.h"

#include <QByteArray>
#include <QString>
#include <QStringList>

// Digests used for change detection.
class DirectoryDigest {
 public:
  struct Listing {
    Listing() : entries(0) {}
    QByteArray digest;
    // Absolute paths of the immediate subdirectories, sorted by name
    QStringList subdirectories;
    int entries;
  };

  // Hashes the immediate listing of a directory: name, kind, size and modification time of every entry.
  // File contents are never read. Hidden entries are ignored.
  static bool Calculate(const QString &path, Listing *listing, QString *error = nullptr);

  static QByteArray FileDigest(const QByteArray &data);
};

#endif  // DIRECTORYDIGEST_H
