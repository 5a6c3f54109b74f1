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

#ifndef MUTEX_PROTECTED_H
#define MUTEX_PROTECTED_H

#include <boost/noncopyable.hpp>

#include <QMutex>
#include <QMutexLocker>

// A value that can be read and written from several threads.
template<typename T>
class mutex_protected : public boost::noncopyable {
 public:
  explicit mutex_protected(const T value) : value_(value) {}

  T value() const {
    QMutexLocker l(&mutex_);
    return value_;
  }

  bool operator==(const T value) const {
    QMutexLocker l(&mutex_);
    return value == value_;
  }

  bool operator!=(const T value) const {
    QMutexLocker l(&mutex_);
    return value != value_;
  }

  mutex_protected &operator=(const T value) {
    QMutexLocker l(&mutex_);
    value_ = value;
    return *this;
  }

  // Stores the new value and returns the previous one.
  T exchange(const T value) {
    QMutexLocker l(&mutex_);
    T old = value_;
    value_ = value;
    return old;
  }

 private:
  T value_;
  mutable QMutex mutex_;
};

#endif  // MUTEX_PROTECTED_H
