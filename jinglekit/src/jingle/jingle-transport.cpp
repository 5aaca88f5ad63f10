/*
 * jingle-transport.cpp - Jingle candidate transports
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

#include "jingle-transport.h"

#include <QDomDocument>
#include <QMap>

#include <algorithm>

namespace JingleKit { namespace Jingle {

    static const QString CANDIDATE_TAG       = QStringLiteral("candidate");
    static const QString CANDIDATE_ERROR_TAG = QStringLiteral("candidate-error");

    //----------------------------------------------------------------------------
    // Candidate
    //----------------------------------------------------------------------------
    Candidate::Candidate(const QDomElement &el)
    {
        bool    ok;
        QString host(el.attribute(QStringLiteral("host")));
        QString jid(el.attribute(QStringLiteral("jid")));
        auto    portStr = el.attribute(QStringLiteral("port"));
        quint16 port    = 0;
        if (!portStr.isEmpty()) {
            port = portStr.toUShort(&ok);
            if (!ok) {
                return; // make the whole candidate invalid
            }
        }
        auto priorityStr = el.attribute(QStringLiteral("priority"));
        if (priorityStr.isEmpty()) {
            return;
        }
        quint32 priority = priorityStr.toUInt(&ok);
        if (!ok) {
            return;
        }
        QString cid = el.attribute(QStringLiteral("cid"));
        if (cid.isEmpty()) {
            return;
        }

        QString ct = el.attribute(QStringLiteral("type"));
        if (ct.isEmpty()) {
            ct = QStringLiteral("direct");
        }
        static QMap<QString, Type> types { { QStringLiteral("assisted"), Assisted },
                                           { QStringLiteral("direct"), Direct },
                                           { QStringLiteral("proxy"), Proxy },
                                           { QStringLiteral("tunnel"), Tunnel } };
        auto                       candidateType = types.value(ct);
        if (candidateType == None) {
            return;
        }

        if ((candidateType == Proxy && jid.isEmpty()) || (candidateType != Proxy && (host.isEmpty() || !port))) {
            return;
        }

        _cid      = cid;
        _host     = host;
        _jid      = jid;
        _port     = port;
        _priority = priority;
        _type     = candidateType;
    }

    Candidate::Candidate(const QString &cid, const QString &host, quint16 port, quint32 priority, Type type) :
        _cid(cid), _host(host), _port(port), _priority(priority), _type(type)
    {
    }

    bool Candidate::operator==(const Candidate &other) const
    {
        return _cid == other._cid && _host == other._host && _jid == other._jid && _port == other._port
            && _priority == other._priority && _type == other._type;
    }

    QDomElement Candidate::toXml(QDomDocument *doc) const
    {
        auto e = doc->createElement(CANDIDATE_TAG);
        e.setAttribute(QStringLiteral("cid"), _cid);
        if (_type == Proxy) {
            e.setAttribute(QStringLiteral("jid"), _jid);
        }
        if (!_host.isEmpty() && _port) {
            e.setAttribute(QStringLiteral("host"), _host);
            e.setAttribute(QStringLiteral("port"), _port);
        }
        e.setAttribute(QStringLiteral("priority"), _priority);

        static const char *types[] = { "proxy", "tunnel", "assisted" }; // same order as in enum
        if (_type && _type < Direct) {
            e.setAttribute(QStringLiteral("type"), QLatin1String(types[_type - 1]));
        }
        return e;
    }

    QString Candidate::toString() const
    {
        if (isValid())
            return QString("Candidate(%1 cid=%2 %3:%4)").arg(typeText(_type), _cid, _host, QString::number(_port));
        return QString("Candidate(null)");
    }

    QString Candidate::typeText(Candidate::Type t)
    {
        switch (t) {
        case None:
            return QLatin1String("None");
        case Proxy:
            return QLatin1String("Proxy");
        case Tunnel:
            return QLatin1String("Tunnel");
        case Assisted:
            return QLatin1String("Assisted");
        case Direct:
            return QLatin1String("Direct");
        }
        return QLatin1String("Unknown");
    }

    //----------------------------------------------------------------------------
    // CandidateTransport
    //----------------------------------------------------------------------------
    CandidateTransport::~CandidateTransport() { }

    bool CandidateTransport::isCandidateError(const QDomElement &transportEl)
    {
        return !transportEl.firstChildElement(CANDIDATE_ERROR_TAG).isNull();
    }

    //----------------------------------------------------------------------------
    // S5BTransport
    //----------------------------------------------------------------------------
    const QString S5BTransport::NS(QStringLiteral("urn:xmpp:jingle:transports:s5b:1"));

    S5BTransport::S5BTransport(const QString &sid) : _sid(sid) { }

    S5BTransport::S5BTransport(const QDomElement &transportEl)
    {
        if (transportEl.namespaceURI() != NS) {
            return;
        }
        auto mode = transportEl.attribute(QStringLiteral("mode"));
        if (!mode.isEmpty() && mode != QLatin1String("tcp")) {
            qDebug("jingle-s5b: unsupported mode %s", qPrintable(mode));
            return;
        }
        _sid     = transportEl.attribute(QStringLiteral("sid"));
        _dstaddr = transportEl.attribute(QStringLiteral("dstaddr"));
    }

    void S5BTransport::addLocalCandidate(const Candidate &candidate)
    {
        auto it = std::find_if(_localCandidates.begin(), _localCandidates.end(),
                               [&candidate](auto const &c) { return c.cid() == candidate.cid(); });
        if (it == _localCandidates.end()) {
            _localCandidates.append(candidate);
        } else {
            *it = candidate;
        }
    }

    QString S5BTransport::ns() const { return NS; }

    void S5BTransport::mergeRemoteCandidates(const QList<Candidate> &candidates)
    {
        for (auto const &c : candidates) {
            auto it = std::find_if(_remoteCandidates.begin(), _remoteCandidates.end(),
                                   [&c](auto const &rc) { return rc.cid() == c.cid(); });
            if (it == _remoteCandidates.end()) {
                qDebug("jingle-s5b: new remote %s", qPrintable(c.toString()));
                _remoteCandidates.append(c);
            } else {
                qDebug("jingle-s5b: updated remote %s", qPrintable(c.toString()));
                *it = c;
            }
        }
    }

    QDomElement S5BTransport::buildOutboundPayload(QDomDocument                          *doc,
                                                   const std::optional<QList<Candidate>> &candidates)
    {
        QDomElement tel = doc->createElementNS(NS, QStringLiteral("transport"));
        tel.setAttribute(QStringLiteral("sid"), _sid);
        tel.setAttribute(QStringLiteral("mode"), QStringLiteral("tcp"));
        if (!_dstaddr.isEmpty()) {
            tel.setAttribute(QStringLiteral("dstaddr"), _dstaddr);
        }
        for (auto const &c : candidates ? *candidates : _localCandidates) {
            tel.appendChild(c.toXml(doc));
        }
        return tel;
    }

    QList<Candidate> S5BTransport::parseInboundPayload(const QDomElement &el)
    {
        QList<Candidate> ret;
        if (el.isNull() || el.namespaceURI() != NS) {
            return ret;
        }
        auto sid = el.attribute(QStringLiteral("sid"));
        if (!_sid.isEmpty() && !sid.isEmpty() && sid != _sid) {
            qDebug("jingle-s5b: sid mismatch %s != %s", qPrintable(sid), qPrintable(_sid));
            return ret;
        }
        for (auto ce = el.firstChildElement(CANDIDATE_TAG); !ce.isNull(); ce = ce.nextSiblingElement(CANDIDATE_TAG)) {
            Candidate c(ce);
            if (!c.isValid()) {
                qDebug("jingle-s5b: skipping invalid candidate");
                continue;
            }
            ret.append(c);
        }
        return ret;
    }

} // namespace Jingle
} // namespace JingleKit
