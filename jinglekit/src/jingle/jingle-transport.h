/*
 * jingle-transport.h - Jingle candidate transports
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

#ifndef JINGLEKIT_JINGLE_TRANSPORT_H
#define JINGLEKIT_JINGLE_TRANSPORT_H

#include <QDomElement>
#include <QList>
#include <QString>

#include <optional>

class QDomDocument;

namespace JingleKit { namespace Jingle {

    /**
     * @brief The Candidate class is one connectivity option offered by a peer.
     *
     * A candidate without cid, or a non-proxy candidate without host/port, is invalid.
     */
    class Candidate {
    public:
        enum Type {
            None, // non-standard, just a default
            Proxy,
            Tunnel,
            Assisted,
            Direct
        };

        Candidate() = default;
        Candidate(const QDomElement &el);
        Candidate(const QString &cid, const QString &host, quint16 port, quint32 priority, Type type = Direct);

        inline bool    isValid() const { return _type != None; }
        inline QString cid() const { return _cid; }
        inline QString host() const { return _host; }
        inline QString jid() const { return _jid; }
        inline void    setJid(const QString &jid) { _jid = jid; }
        inline quint16 port() const { return _port; }
        inline quint32 priority() const { return _priority; }
        inline Type    type() const { return _type; }

        bool operator==(const Candidate &other) const;
        inline bool operator!=(const Candidate &other) const { return !(*this == other); }

        QDomElement    toXml(QDomDocument *doc) const;
        QString        toString() const;
        static QString typeText(Type t);

    private:
        QString _cid;
        QString _host;
        QString _jid;
        quint16 _port     = 0;
        quint32 _priority = 0;
        Type    _type     = None;
    };

    /**
     * @brief The CandidateTransport class exchanges connectivity candidates for one content.
     *
     * Connectivity checks and the bytestream itself belong to the implementation,
     * the negotiation code only moves candidates in and out.
     */
    class CandidateTransport {
    public:
        virtual ~CandidateTransport();

        virtual QString ns() const = 0;

        // later calls supersede or extend earlier ones
        virtual void             mergeRemoteCandidates(const QList<Candidate> &candidates) = 0;
        virtual QList<Candidate> remoteCandidates() const                               = 0;

        /**
         * @brief buildOutboundPayload makes our <transport/> element
         * @param candidates when not set all local candidates are added, otherwise just the passed ones
         *        (an empty list suppresses candidates at all)
         */
        virtual QDomElement buildOutboundPayload(QDomDocument                          *doc,
                                                 const std::optional<QList<Candidate>> &candidates = std::nullopt)
            = 0;
        virtual QList<Candidate> parseInboundPayload(const QDomElement &el) = 0;

        // whether the peer addressing scheme allows to request a byte range of a file
        virtual bool rangeSupported() const { return false; }

        static bool isCandidateError(const QDomElement &transportEl);
    };

    /**
     * @brief The S5BTransport class is the XEP-0260 flavour of candidate transport.
     */
    class S5BTransport : public CandidateTransport {
    public:
        static const QString NS;

        S5BTransport(const QString &sid);
        S5BTransport(const QDomElement &transportEl);

        inline bool    isValid() const { return !_sid.isEmpty(); }
        inline QString sid() const { return _sid; }
        inline QString dstaddr() const { return _dstaddr; }
        inline void    setDstaddr(const QString &dstaddr) { _dstaddr = dstaddr; }

        void             addLocalCandidate(const Candidate &candidate);
        QList<Candidate> localCandidates() const { return _localCandidates; }

        QString          ns() const override;
        void             mergeRemoteCandidates(const QList<Candidate> &candidates) override;
        QList<Candidate> remoteCandidates() const override { return _remoteCandidates; }
        QDomElement      buildOutboundPayload(QDomDocument                          *doc,
                                              const std::optional<QList<Candidate>> &candidates = std::nullopt) override;
        QList<Candidate> parseInboundPayload(const QDomElement &el) override;
        bool             rangeSupported() const override { return true; }

    private:
        QString          _sid;
        QString          _dstaddr;
        QList<Candidate> _localCandidates;
        QList<Candidate> _remoteCandidates;
    };

} // namespace Jingle
} // namespace JingleKit

#endif // JINGLEKIT_JINGLE_TRANSPORT_H
