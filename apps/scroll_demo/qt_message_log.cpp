#include "qt_message_log.hpp"
#include <QDebug>
#include <QString>

void QtMessageLog::debug(const std::string &msg) { qDebug().noquote() << QString::fromStdString(msg); }
void QtMessageLog::warn(const std::string &msg) { qWarning().noquote() << QString::fromStdString(msg); }
void QtMessageLog::error(const std::string &msg) { qCritical().noquote() << QString::fromStdString(msg); }
