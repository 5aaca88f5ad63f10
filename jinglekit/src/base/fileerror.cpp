/*
 * fileerror.cpp - file system error description
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

#include "fileerror.h"

namespace JingleKit {

FileError::FileError(QFileDevice::FileError code, const QString &path, const QString &message) :
    _code(code), _path(path), _message(message)
{
}

FileError FileError::fromDevice(const QFileDevice &dev)
{
    auto code = dev.error();
    if (code == QFileDevice::NoError) {
        code = QFileDevice::UnspecifiedError;
    }
    return FileError(code, dev.fileName(), dev.errorString());
}

QString FileError::toString() const
{
    if (!isValid()) {
        return QString();
    }
    if (_message.isEmpty()) {
        return QString("%1: file error %2").arg(_path, QString::number(int(_code)));
    }
    return QString("%1: %2").arg(_path, _message);
}

} // namespace JingleKit
