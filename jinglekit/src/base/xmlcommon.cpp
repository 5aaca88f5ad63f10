/*
 * xmlcommon.cpp - helper functions for dealing with XML
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

#include "xmlcommon.h"

#include <QDateTime>
#include <QDomDocument>

namespace JingleKit { namespace XMLHelper {

    QString subTagText(const QDomElement &e, const QString &name)
    {
        QDomElement i = e.firstChildElement(name);
        if (!i.isNull())
            return i.text();
        return QString();
    }

    QDomElement textTag(QDomDocument &doc, const QString &name, const QString &content)
    {
        QDomElement tag = doc.createElement(name);
        QDomText    text = doc.createTextNode(content);
        tag.appendChild(text);

        return tag;
    }

    QDomElement textTag(QDomDocument &doc, const QString &name, qint64 content)
    {
        return textTag(doc, name, QString::number(content));
    }

    void setTagText(QDomElement &e, const QString &text)
    {
        QDomText t = e.ownerDocument().createTextNode(text);
        e.appendChild(t);
    }

    QList<QDomElement> childElements(const QDomElement &e, const QString &tagName)
    {
        QList<QDomElement> ret;
        for (auto c = e.firstChildElement(tagName); !c.isNull(); c = c.nextSiblingElement(tagName)) {
            ret.append(c);
        }
        return ret;
    }

    QString dateToStamp(const QDateTime &d)
    {
        return d.toUTC().toString(QStringLiteral("yyyy-MM-dd'T'HH:mm:ss")) + QLatin1Char('Z');
    }

    QDateTime stampToDate(const QString &stamp)
    {
        auto d = QDateTime::fromString(stamp.left(19), Qt::ISODate);
        if (d.isValid()) {
            d.setTimeSpec(Qt::UTC);
        }
        return d;
    }

} // namespace XMLHelper
} // namespace JingleKit
