/*
 * Gooseberry
 * This file was part of Strawberry Music Player.
 * Copyright 2024, Jonas Kvinge <jonas@jkvinge.net>
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

#ifndef MEMORYDATABASE_H
#define MEMORYDATABASE_H

#include "config.h"

#include <QObject>

#include "includes/shared_ptr.h"
#include "database.h"

class TaskManager;

// A database that only lives as long as the object, used by the tests.
// Each thread connecting to it sees its own empty database.
class MemoryDatabase : public Database {
  Q_OBJECT

 public:
  explicit MemoryDatabase(SharedPtr<TaskManager> task_manager, QObject *parent = nullptr);
  ~MemoryDatabase() override;
};

#endif  // MEMORYDATABASE_H
