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

#ifndef SCOPEDTRANSACTION_H
#define SCOPEDTRANSACTION_H

#include "config.h"

#include <QtGlobal>

class QSqlDatabase;

// Opens a transaction on a database.
// Rolls back the transaction if the object goes out of scope before Commit() is called.
class ScopedTransaction {
 public:
  explicit ScopedTransaction(QSqlDatabase *db);
  ~ScopedTransaction();

  // Returns false if the commit failed, the transaction is rolled back then.
  bool Commit();

 private:
  QSqlDatabase *db_;
  bool pending_;

  Q_DISABLE_COPY(ScopedTransaction)
};

#endif  // SCOPEDTRANSACTION_H
