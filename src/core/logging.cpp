/* This file is part of Gooseberry.
   It was part of Strawberry.
   Copyright 2011, David Sansome <me@davidsansome.com>
   Copyright 2018-2021, Jonas Kvinge <jonas@jkvinge.net>

   Licensed under the Apache License, Version 2.0 (the "License");
   you may not use this file except in compliance with the License.
   You may obtain a copy of the License at

       http://www.apache.org/licenses/LICENSE-2.0

   Unless required by applicable law or agreed to in writing, software
   distributed under the License is distributed on an "AS IS" BASIS,
   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
   See the License for the specific language governing permissions and
   limitations under the License.
*/

#include "config.h"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <chrono>

#ifdef HAVE_BACKTRACE
#  include <execinfo.h>
#  include <cxxabi.h>
#endif

#include <QByteArray>
#include <QMap>
#include <QMutex>
#include <QString>
#include <QStringList>
#include <QRegularExpression>
#include <QRegularExpressionMatch>
#include <QDateTime>
#include <QtMessageHandler>
#include <QMessageLogContext>
#include <QDebug>

#include "logging.h"

using namespace Qt::Literals::StringLiterals;

namespace logging {

namespace {

Level sDefaultLevel = Level_Debug;
QMap<QString, Level> *sCategoryLevels = nullptr;
QIODevice *sNullDevice = nullptr;
QMutex sLevelsMutex;

constexpr char kMessageHandlerMagic[] = "__logging_message__";
const size_t kMessageHandlerMagicLen = strlen(kMessageHandlerMagic);
QtMessageHandler sOriginalMessageHandler = nullptr;

// Messages of these levels go to stderr, everything else to stdout.
bool IsErrorType(const QtMsgType type) {
  return type == QtCriticalMsg || type == QtFatalMsg;
}

const char *LevelName(const Level level) {

  switch (level) {
    case Level_Debug:   return " DEBUG ";
    case Level_Info:    return " INFO  ";
    case Level_Warning: return " WARN  ";
    case Level_Error:   return " ERROR ";
    case Level_Fatal:   return " FATAL ";
  }

  return " ????? ";

}

QString ParsePrettyFunction(const char *pretty_function) {

  // Take the class name out of the function signature
  QString class_name = QLatin1String(pretty_function);
  const qint64 paren = class_name.indexOf(u'(');
  if (paren != -1) {
    const qint64 colons = class_name.lastIndexOf("::"_L1, paren);
    if (colons != -1) {
      class_name = class_name.left(colons);
    }
    else {
      class_name = class_name.left(paren);
    }
  }

  const qint64 space = class_name.lastIndexOf(u' ');
  if (space != -1) {
    class_name = class_name.mid(space + 1);
  }

  return class_name;

}

class LoggedDebug : public QDebug {
 public:
  LoggedDebug() : QDebug(sNullDevice) {}
  explicit LoggedDebug(QtMsgType type) : QDebug(type) { nospace() << kMessageHandlerMagic; }
};

QString Prefix(const Level level, const QString &class_name, const int line, const char *category) {

  QString function_line = class_name;
  if (line != -1) {
    function_line += u':' + QString::number(line);
  }
  if (category) {
    function_line += u'(' + QLatin1String(category) + u')';
  }

  return QDateTime::currentDateTime().toString(u"hh:mm:ss.zzz"_s) + QLatin1String(LevelName(level)) + function_line.leftJustified(32);

}

QDebug CreateLogger(const Level level, const QString &class_name, const int line, const char *category) {

  const QString filter_category = category ? QLatin1String(category) : class_name;
  if (level > LevelForCategory(filter_category)) {
    return LoggedDebug();
  }

  LoggedDebug ret(level == Level_Fatal ? QtFatalMsg : (level == Level_Error ? QtCriticalMsg : QtDebugMsg));
  ret.nospace() << Prefix(level, class_name, line, category).toLatin1().constData();

  return ret.space();

}

void MessageHandler(QtMsgType type, const QMessageLogContext &message_log_context, const QString &message) {

  Q_UNUSED(message_log_context)

  FILE *stream = IsErrorType(type) ? stderr : stdout;

  if (message.startsWith(QLatin1String(kMessageHandlerMagic))) {
    const QByteArray message_data = message.toUtf8();
    fprintf(stream, "%s\n", message_data.constData() + kMessageHandlerMagicLen);
    fflush(stream);
    if (type == QtFatalMsg) abort();
    return;
  }

  // A message from Qt itself or from a library using qDebug() directly.
  Level level = Level_Debug;
  switch (type) {
    case QtFatalMsg:
    case QtCriticalMsg:
      level = Level_Error;
      break;
    case QtWarningMsg:
      level = Level_Warning;
      break;
    case QtInfoMsg:
      level = Level_Info;
      break;
    case QtDebugMsg:
    default:
      level = Level_Debug;
      break;
  }

  if (level <= LevelForCategory(u"Qt"_s)) {
    const QStringList lines = message.split(u'\n');
    for (const QString &line : lines) {
      const QByteArray data = (Prefix(level, u"Qt"_s, -1, nullptr) + u' ' + line).toLocal8Bit();
      fprintf(stream, "%s\n", data.constData());
    }
    fflush(stream);
  }

  if (type == QtFatalMsg) {
    abort();
  }

}

}  // namespace

const char *kDefaultLogLevels = "*:3";

void Init() {

  {
    QMutexLocker l(&sLevelsMutex);
    delete sCategoryLevels;
    sCategoryLevels = new QMap<QString, Level>();
  }

  delete sNullDevice;
  sNullDevice = new NullDevice;
  sNullDevice->open(QIODevice::ReadWrite);

  if (!sOriginalMessageHandler) {
    sOriginalMessageHandler = qInstallMessageHandler(MessageHandler);
  }

}

void SetLevels(const QString &levels) {

  QMutexLocker l(&sLevelsMutex);

  if (!sCategoryLevels) return;

  const QStringList items = levels.split(u',', Qt::SkipEmptyParts);
  for (const QString &item : items) {
    const QStringList category_level = item.split(u':');

    QString category;
    bool ok = false;
    int level = Level_Error;

    if (category_level.count() == 1) {
      level = category_level.last().toInt(&ok);
    }
    else if (category_level.count() == 2) {
      category = category_level.first();
      level = category_level.last().toInt(&ok);
    }

    if (!ok || level < Level_Error || level > Level_Debug) {
      continue;
    }

    if (category.isEmpty() || category == u'*') {
      sDefaultLevel = static_cast<Level>(level);
    }
    else {
      sCategoryLevels->insert(category, static_cast<Level>(level));
    }
  }

}

Level LevelForCategory(const QString &category) {

  QMutexLocker l(&sLevelsMutex);
  if (sCategoryLevels && sCategoryLevels->contains(category)) {
    return sCategoryLevels->value(category);
  }
  return sDefaultLevel;

}

void DumpStackTrace() {

#ifdef HAVE_BACKTRACE
  void *callstack[128];
  const int callstack_size = backtrace(reinterpret_cast<void**>(&callstack), sizeof(callstack) / sizeof(callstack[0]));
  char **symbols = backtrace_symbols(reinterpret_cast<void**>(&callstack), callstack_size);
  static const QRegularExpression regex_symbol(u"\\(([^+]+)"_s);
  // Start from 1 to skip ourself.
  for (int i = 1; i < callstack_size; ++i) {
    QString symbol = QString::fromLatin1(symbols[i]);
    const QRegularExpressionMatch match = regex_symbol.match(symbol);
    if (match.hasMatch()) {
      int status = 0;
      char *demangled = abi::__cxa_demangle(match.captured(1).toLatin1().constData(), nullptr, nullptr, &status);
      if (status == 0 && demangled) {
        symbol = QString::fromLatin1(demangled);
      }
      free(demangled);
    }
    std::cerr << symbol.toStdString() << std::endl;
  }
  free(symbols);
#else
  qLog(Debug) << "Stack traces are not available on this platform";
#endif

}

QDebug CreateLoggerFatal(const int line, const char *pretty_function, const char *category) { return CreateLogger(Level_Fatal, ParsePrettyFunction(pretty_function), line, category); }
QDebug CreateLoggerError(const int line, const char *pretty_function, const char *category) { return CreateLogger(Level_Error, ParsePrettyFunction(pretty_function), line, category); }
QDebug CreateLoggerWarning(const int line, const char *pretty_function, const char *category) { return CreateLogger(Level_Warning, ParsePrettyFunction(pretty_function), line, category); }
QDebug CreateLoggerInfo(const int line, const char *pretty_function, const char *category) { return CreateLogger(Level_Info, ParsePrettyFunction(pretty_function), line, category); }
QDebug CreateLoggerDebug(const int line, const char *pretty_function, const char *category) { return CreateLogger(Level_Debug, ParsePrettyFunction(pretty_function), line, category); }

}  // namespace logging

QDebug operator<<(QDebug dbg, std::chrono::milliseconds msecs) {

  QDebugStateSaver saver(dbg);
  dbg.nospace() << QString::number(msecs.count()) << "ms";

  return dbg;

}
