/*
 * Gooseberry
 * This file was part of Strawberry Music Player.
 * Copyright 2026, Jonas Kvinge <jonas@jkvinge.net>
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

#include <cstring>
#include <csignal>
#include <cerrno>
#include <sys/socket.h>
#include <unistd.h>
#include <fcntl.h>

#include <QSocketNotifier>

#include "core/logging.h"
#include "unixsignalwatcher.h"

UnixSignalWatcher *UnixSignalWatcher::sInstance = nullptr;

UnixSignalWatcher::UnixSignalWatcher(QObject *parent)
    : QObject(parent),
      signal_fd_{-1, -1},
      socket_notifier_(nullptr) {

  Q_ASSERT(!sInstance);

  if (::socketpair(AF_UNIX, SOCK_STREAM, 0, signal_fd_) != 0) {
    qLog(Error) << "Failed to create socket pair for signal handling:" << ::strerror(errno);
    signal_fd_[0] = -1;
    signal_fd_[1] = -1;
    return;
  }

  // The handler must never block on a full socket, and the notification loop reads until EAGAIN.
  SetNonBlocking(signal_fd_[0]);
  SetNonBlocking(signal_fd_[1]);

  socket_notifier_ = new QSocketNotifier(signal_fd_[0], QSocketNotifier::Read, this);
  QObject::connect(socket_notifier_, &QSocketNotifier::activated, this, &UnixSignalWatcher::HandleSignalNotification);

  sInstance = this;

}

UnixSignalWatcher::~UnixSignalWatcher() {

  if (socket_notifier_) {
    socket_notifier_->setEnabled(false);
  }

  for (qsizetype i = 0; i < watched_signals_.size(); ++i) {
    if (::sigaction(watched_signals_[i], &original_signal_actions_[i], nullptr) != 0) {
      qLog(Error) << "Failed to restore signal handler for signal" << watched_signals_[i] << ::strerror(errno);
    }
  }

  for (int &fd : signal_fd_) {
    if (fd != -1) {
      ::close(fd);
      fd = -1;
    }
  }

  sInstance = nullptr;

}

bool UnixSignalWatcher::SetNonBlocking(const int fd) {

  const int flags = ::fcntl(fd, F_GETFL, 0);
  if (flags == -1 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1) {
    qLog(Error) << "Failed to make socket non-blocking:" << ::strerror(errno);
    return false;
  }

  return true;

}

void UnixSignalWatcher::WatchForSignal(const int signal) {

  if (!is_valid()) {
    qLog(Error) << "Cannot watch for signal" << signal << "without a socket pair";
    return;
  }

  if (watched_signals_.contains(signal)) {
    qLog(Warning) << "Already watching for signal" << signal;
    return;
  }

  struct sigaction signal_action{};
  sigemptyset(&signal_action.sa_mask);
  signal_action.sa_handler = UnixSignalWatcher::SignalHandler;
  signal_action.sa_flags = SA_RESTART;

  struct sigaction old_signal_action{};
  if (::sigaction(signal, &signal_action, &old_signal_action) != 0) {
    qLog(Error) << "sigaction error:" << ::strerror(errno);
    return;
  }

  watched_signals_ << signal;
  original_signal_actions_ << old_signal_action;

}

void UnixSignalWatcher::SignalHandler(const int signal) {

  if (!sInstance || sInstance->signal_fd_[1] == -1) {
    return;
  }

  // Only async-signal-safe calls here, a failed write can't be reported.
  const ssize_t bytes_written = ::write(sInstance->signal_fd_[1], &signal, sizeof(signal));
  Q_UNUSED(bytes_written)

}

void UnixSignalWatcher::HandleSignalNotification() {

  Q_FOREVER {
    int signal = 0;
    const ssize_t bytes_read = ::read(signal_fd_[0], &signal, sizeof(signal));
    if (bytes_read != sizeof(signal)) break;
    qLog(Debug) << "Caught signal" << signal;
    Q_EMIT UnixSignal(signal);
  }

}
