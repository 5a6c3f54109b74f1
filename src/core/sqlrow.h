/*
 * Gooseberry
 * This file was part of Strawberry Music Player.
 * Copyright 2018-2024, Jonas Kvinge <jonas@jkvinge.net>
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

#ifndef SQLROW_H
#define SQLROW_H

#include "config.h"

#include <optional>

#include <QList>
#include <QMap>
#include <QVariant>
#include <QByteArray>
#include <QString>
#include <QUrl>
#include <QSqlQuery>

// A copy of the current row of a query, looked up by column name.
class SqlRow {

 public:
  // WARNING: Implicit construction from QSqlQuery.
  SqlRow(const QSqlQuery &query);

  QVariant value(const int number) const;
  QVariant value(const QString &name) const;

  QString ValueToString(const QString &n) const;
  QUrl ValueToUrl(const QString &n) const;
  QByteArray ValueToByteArray(const QString &n) const;
  int ValueToInt(const QString &n) const;
  qint64 ValueToLongLong(const QString &n) const;
  std::optional<qint64> ValueToOptionalLongLong(const QString &n) const;
  std::optional<double> ValueToOptionalDouble(const QString &n) const;
  bool ValueToBool(const QString &n) const;

 private:
  void Init(const QSqlQuery &query);

  QMap<int, QVariant> columns_by_number_;
  QMap<QString, QVariant> columns_by_name_;
};

using SqlRowList = QList<SqlRow>;

#endif  // SQLROW_H
