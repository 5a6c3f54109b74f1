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

#include <QObject>
#include <QMutex>
#include <QList>
#include <QString>

#include "taskmanager.h"

TaskManager::TaskManager(QObject *parent) : QObject(parent), next_task_id_(1) {

  setObjectName(QLatin1String(QObject::metaObject()->className()));

}

int TaskManager::StartTask(const QString &name) {

  Task t;
  t.name = name;

  {
    QMutexLocker l(&mutex_);
    t.id = next_task_id_++;
    tasks_[t.id] = t;
  }

  Q_EMIT TasksChanged();
  return t.id;

}

QList<TaskManager::Task> TaskManager::GetTasks() {

  QMutexLocker l(&mutex_);
  return tasks_.values();

}

void TaskManager::SetTaskProgress(const int id, const quint64 progress, const quint64 max) {

  Task t;
  {
    QMutexLocker l(&mutex_);
    if (!tasks_.contains(id)) return;

    t = tasks_.value(id);
    t.progress = progress;
    if (max > 0) t.progress_max = max;
    tasks_[id] = t;
  }

  Q_EMIT TasksChanged();

}

void TaskManager::SetTaskFinished(const int id) {

  {
    QMutexLocker l(&mutex_);
    if (!tasks_.contains(id)) return;
    tasks_.remove(id);
  }

  Q_EMIT TasksChanged();

}
