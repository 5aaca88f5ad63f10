/*
 * jingle.h - Jingle (XEP-0166) basic types
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

#ifndef JINGLEKIT_JINGLE_H
#define JINGLEKIT_JINGLE_H

#include <QDomElement>
#include <QPair>
#include <QString>

#include <cstddef>

class QDomDocument;

namespace JingleKit { namespace Jingle {
    extern const QString NS;

    enum class Origin { None, Both, Initiator, Responder };

    Origin negateOrigin(Origin o);

    /*
     The action vocabulary is fixed. Every content keeps a handler slot for each
     of them, in both directions, so dispatch is a plain index into an array.
     Iq results/errors are not real jingle actions but they are routed to the
     contents the same way.
    */
    enum class Action {
        NoAction, // non-standard, just a default
        ContentAccept,
        ContentAdd,
        ContentModify,
        ContentReject,
        ContentRemove,
        DescriptionInfo,
        SecurityInfo,
        SessionAccept,
        SessionInfo,
        SessionInitiate,
        SessionTerminate,
        TransportAccept,
        TransportInfo,
        TransportReject,
        TransportReplace,
        IqResult,
        IqError,
        Last = IqError
    };

    constexpr std::size_t ActionCount = std::size_t(Action::Last) + 1;

    // "content-accept" -> ContentAccept; "content-accept-sent" -> ContentAccept with *sent = true
    Action  parseAction(QStringView text, bool *sent = nullptr);
    QString actionName(Action action, bool sent = false);

    // actions which may appear in an outgoing <jingle/> (iq-result/error are never sent by us as jingle)
    bool isSendable(Action action);

    enum class Media { None, File, Audio, Video };

    typedef QPair<QString, Origin> ContentKey;

    class Reason {
    public:
        enum Condition {
            NoReason = 0, // non-standard, just a default
            AlternativeSession,
            Busy,
            Cancel,
            ConnectivityError,
            Decline,
            Expired,
            FailedApplication,
            FailedTransport,
            GeneralError,
            Gone,
            IncompatibleParameters,
            MediaError,
            SecurityError,
            Success,
            Timeout,
            UnsupportedApplications,
            UnsupportedTransports
        };

        Reason() = default;
        Reason(Condition cond, const QString &text = QString());
        Reason(const QDomElement &el);

        inline bool      isValid() const { return _cond != NoReason; }
        inline Condition condition() const { return _cond; }
        inline void      setCondition(Condition cond) { _cond = cond; }
        inline QString   text() const { return _text; }
        inline void      setText(const QString &text) { _text = text; }

        QDomElement toXml(QDomDocument *doc) const;

    private:
        Condition _cond = NoReason;
        QString   _text;
    };

    class ContentBase {
    public:
        inline ContentBase() { }
        ContentBase(Origin creator, const QString &name);
        ContentBase(const QDomElement &el);

        inline bool       isValid() const { return creator != Origin::None && !name.isEmpty(); }
        inline ContentKey key() const { return ContentKey { name, creator }; }

        QDomElement   toXml(QDomDocument *doc, const char *tagName, const QString &ns = QString()) const;
        static Origin creatorAttr(const QDomElement &el);
        static bool   setCreatorAttr(QDomElement &el, Origin creator);

        Origin  creator = Origin::None;
        QString name;
        Origin  senders = Origin::Both;
        QString disposition; // default "session"
    };

} // namespace Jingle
} // namespace JingleKit

#endif // JINGLEKIT_JINGLE_H
