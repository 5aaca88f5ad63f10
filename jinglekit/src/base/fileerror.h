/*
 * fileerror.h - file system error description
 * Copyright (C) 2024  The jinglekit authors
 *
 * This library is free software; you can redistribute it and/or
 * modify it under the terms of the GNU Lesser General Public
 * License as published by the Free Software Foundation; either
 * version 2.1 of the License, or (at your option) any later version.
 *
 * This library is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
 * Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with this library.  If not, see <https://www.gnu.org/licenses/>.
 *
 */

#ifndef JINGLEKIT_FILEERROR_H
#define JINGLEKIT_FILEERROR_H

#include <QFileDevice>
#include <QMetaType>
#include <QString>

namespace JingleKit {

/**
 * @brief The FileError class describes a failed file system operation.
 *
 * It's never mixed with protocol errors (Jingle::Reason).
 */
class FileError {
public:
    FileError() = default;
    FileError(QFileDevice::FileError code, const QString &path, const QString &message = QString());

    static FileError fromDevice(const QFileDevice &dev);

    inline bool                   isValid() const { return _code != QFileDevice::NoError; }
    inline QFileDevice::FileError code() const { return _code; }
    inline QString                path() const { return _path; }
    inline QString                message() const { return _message; }
    QString                       toString() const;

private:
    QFileDevice::FileError _code = QFileDevice::NoError;
    QString                _path;
    QString                _message;
};

} // namespace JingleKit

Q_DECLARE_METATYPE(JingleKit::FileError)

#endif // JINGLEKIT_FILEERROR_H
