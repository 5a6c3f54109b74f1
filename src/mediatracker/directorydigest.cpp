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

#include <algorithm>

#include <QtEndian>
#include <QByteArray>
#include <QByteArrayView>
#include <QString>
#include <QStringList>
#include <QDir>
#include <QFileInfo>
#include <QFileInfoList>
#include <QDateTime>
#include <QCryptographicHash>

#include "directorydigest.h"

using namespace Qt::Literals::StringLiterals;

namespace {

void AddNumber(QCryptographicHash *hash, const qint64 value) {

  const quint64 big_endian = qToBigEndian(static_cast<quint64>(value));
  hash->addData(QByteArrayView(reinterpret_cast<const char*>(&big_endian), sizeof(big_endian)));

}

}  // namespace

bool DirectoryDigest::Calculate(const QString &path, Listing *listing, QString *error) {

  const QFileInfo dir_info(path);
  if (!dir_info.exists() || !dir_info.isDir()) {
    if (error) *error = u"%1 is not a directory"_s.arg(path);
    return false;
  }
  if (!dir_info.isReadable() || !dir_info.isExecutable()) {
    if (error) *error = u"%1 is not readable"_s.arg(path);
    return false;
  }

  QDir dir(path);
  QFileInfoList entries = dir.entryInfoList(QDir::Dirs | QDir::Files | QDir::NoDotAndDotDot, QDir::NoSort);

  // The order returned by the file system is not stable
  std::sort(entries.begin(), entries.end(), [](const QFileInfo &a, const QFileInfo &b) { return a.fileName().toUtf8() < b.fileName().toUtf8(); });

  QCryptographicHash hash(QCryptographicHash::Sha256);
  AddNumber(&hash, entries.count());

  listing->subdirectories.clear();
  for (const QFileInfo &entry : std::as_const(entries)) {
    const QByteArray name = entry.fileName().toUtf8();
    char kind = 'o';
    if (entry.isDir()) kind = 'd';
    else if (entry.isFile()) kind = 'f';

    hash.addData(QByteArrayView(&kind, 1));
    AddNumber(&hash, name.size());
    hash.addData(name);
    AddNumber(&hash, kind == 'f' ? entry.size() : 0);
    AddNumber(&hash, entry.lastModified().toMSecsSinceEpoch());

    if (kind == 'd') {
      listing->subdirectories << entry.absoluteFilePath();
    }
  }

  listing->digest = hash.result();
  listing->entries = static_cast<int>(entries.count());

  return true;

}

QByteArray DirectoryDigest::FileDigest(const QByteArray &data) {

  return QCryptographicHash::hash(data, QCryptographicHash::Sha256);

}
