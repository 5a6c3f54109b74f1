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

#include <QSqlDatabase>
#include <QSqlError>

#include "logging.h"
#include "scopedtransaction.h"

ScopedTransaction::ScopedTransaction(QSqlDatabase *db)
    : db_(db), pending_(true) {

  if (!db_->transaction()) {
    qLog(Error) << "Failed to begin transaction:" << db_->lastError().text();
  }

}

ScopedTransaction::~ScopedTransaction() {

  if (pending_) {
    qLog(Warning) << "Rolling back transaction";
    if (!db_->rollback()) {
      qLog(Error) << "Failed to roll back transaction:" << db_->lastError().text();
    }
  }

}

bool ScopedTransaction::Commit() {

  if (!pending_) {
    qLog(Warning) << "Tried to commit a ScopedTransaction twice";
    return false;
  }

  pending_ = false;

  if (!db_->commit()) {
    qLog(Error) << "Failed to commit transaction:" << db_->lastError().text();
    if (!db_->rollback()) {
      qLog(Error) << "Failed to roll back transaction:" << db_->lastError().text();
    }
    return false;
  }

  return true;

}
