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

#ifndef ABORTFLAG_H
#define ABORTFLAG_H

#include "config.h"

#include <QtGlobal>

#include "includes/mutex_protected.h"

// Cooperative cancellation token shared between the caller and a running operation.
// An abort requested while no operation runs applies to the next one.
class AbortFlag {
 public:
  AbortFlag() : abort_requested_(false) {}

  // Clears the flag when the operation finishes.
  class ScopedOperation {
   public:
    explicit ScopedOperation(AbortFlag *abort_flag) : abort_flag_(abort_flag) {}

    ~ScopedOperation() {
      if (abort_flag_) abort_flag_->Reset();
    }

   private:
    AbortFlag *abort_flag_;

    Q_DISABLE_COPY(ScopedOperation)
  };

  void Abort() { abort_requested_ = true; }
  void Reset() { abort_requested_ = false; }
  bool abort_requested() const { return abort_requested_.value(); }

 private:
  mutex_protected<bool> abort_requested_;

  Q_DISABLE_COPY(AbortFlag)
};

#endif  // ABORTFLAG_H
