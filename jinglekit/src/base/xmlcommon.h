/*
 * xmlcommon.h - helper functions for dealing with XML
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

#ifndef JINGLEKIT_XMLCOMMON_H
#define JINGLEKIT_XMLCOMMON_H

#include <QDomElement>
#include <QList>

class QDateTime;

namespace JingleKit { namespace XMLHelper {

    QString     subTagText(const QDomElement &e, const QString &name);

    QDomElement textTag(QDomDocument &doc, const QString &name, const QString &content);
    QDomElement textTag(QDomDocument &doc, const QString &name, qint64 content);
    void        setTagText(QDomElement &e, const QString &text);

    // direct children only, in document order
    QList<QDomElement> childElements(const QDomElement &e, const QString &tagName = QString());

    QString   dateToStamp(const QDateTime &d); // ISO-8601 UTC with trailing 'Z'
    QDateTime stampToDate(const QString &stamp);

} // namespace XMLHelper
} // namespace JingleKit

#endif // JINGLEKIT_XMLCOMMON_H
