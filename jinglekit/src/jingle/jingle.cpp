/*
 * jingle.cpp - Jingle (XEP-0166) basic types
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

#include "jingle.h"

#include "xmlcommon.h"

#include <QDomDocument>
#include <QMap>

namespace JingleKit { namespace Jingle {
    const QString NS(QStringLiteral("urn:xmpp:jingle:1"));

    static const QLatin1String SENT_SUFFIX("-sent");

    static const struct {
        const char *text;
        Action      action;
    } jingleActions[]
        = { { "content-accept", Action::ContentAccept },       { "content-add", Action::ContentAdd },
            { "content-modify", Action::ContentModify },       { "content-reject", Action::ContentReject },
            { "content-remove", Action::ContentRemove },       { "description-info", Action::DescriptionInfo },
            { "security-info", Action::SecurityInfo },         { "session-accept", Action::SessionAccept },
            { "session-info", Action::SessionInfo },           { "session-initiate", Action::SessionInitiate },
            { "session-terminate", Action::SessionTerminate }, { "transport-accept", Action::TransportAccept },
            { "transport-info", Action::TransportInfo },       { "transport-reject", Action::TransportReject },
            { "transport-replace", Action::TransportReplace }, { "iq-result", Action::IqResult },
            { "iq-error", Action::IqError } };

    Origin negateOrigin(Origin o)
    {
        switch (o) {
        case Origin::None:
            return Origin::Both;
        case Origin::Both:
            return Origin::None;
        case Origin::Initiator:
            return Origin::Responder;
        case Origin::Responder:
            return Origin::Initiator;
        }
        return Origin::None;
    }

    Action parseAction(QStringView text, bool *sent)
    {
        bool isSent = text.endsWith(SENT_SUFFIX);
        if (isSent) {
            text.chop(SENT_SUFFIX.size());
        }
        if (sent) {
            *sent = isSent;
        }
        for (auto const &a : jingleActions) {
            if (text == QLatin1String(a.text)) {
                if (isSent && !isSendable(a.action)) {
                    return Action::NoAction;
                }
                return a.action;
            }
        }
        return Action::NoAction;
    }

    QString actionName(Action action, bool sent)
    {
        for (auto const &a : jingleActions) {
            if (a.action == action) {
                auto name = QString::fromLatin1(a.text);
                return sent ? name + SENT_SUFFIX : name;
            }
        }
        return QString();
    }

    bool isSendable(Action action)
    {
        return action != Action::NoAction && action != Action::IqResult && action != Action::IqError;
    }

    //----------------------------------------------------------------------------
    // Reason
    //----------------------------------------------------------------------------
    using ReasonMap = QMap<QString, Reason::Condition>;

    Q_GLOBAL_STATIC_WITH_ARGS(ReasonMap, reasonConditions,
                              ({
                                  { QLatin1String("alternative-session"), Reason::AlternativeSession },
                                  { QLatin1String("busy"), Reason::Busy },
                                  { QLatin1String("cancel"), Reason::Cancel },
                                  { QLatin1String("connectivity-error"), Reason::ConnectivityError },
                                  { QLatin1String("decline"), Reason::Decline },
                                  { QLatin1String("expired"), Reason::Expired },
                                  { QLatin1String("failed-application"), Reason::FailedApplication },
                                  { QLatin1String("failed-transport"), Reason::FailedTransport },
                                  { QLatin1String("general-error"), Reason::GeneralError },
                                  { QLatin1String("gone"), Reason::Gone },
                                  { QLatin1String("incompatible-parameters"), Reason::IncompatibleParameters },
                                  { QLatin1String("media-error"), Reason::MediaError },
                                  { QLatin1String("security-error"), Reason::SecurityError },
                                  { QLatin1String("success"), Reason::Success },
                                  { QLatin1String("timeout"), Reason::Timeout },
                                  { QLatin1String("unsupported-applications"), Reason::UnsupportedApplications },
                                  { QLatin1String("unsupported-transports"), Reason::UnsupportedTransports },
                              }))

    Reason::Reason(Reason::Condition cond, const QString &text) : _cond(cond), _text(text) { }

    Reason::Reason(const QDomElement &e)
    {
        if (e.tagName() != QLatin1String("reason"))
            return;

        Condition condition = NoReason;
        QString   text;
        QString   rns = e.namespaceURI();

        for (QDomElement c = e.firstChildElement(); !c.isNull(); c = c.nextSiblingElement()) {
            if (c.tagName() == QLatin1String("text")) {
                text = c.text();
            } else if (c.namespaceURI() == rns) {
                condition = reasonConditions->value(c.tagName());
            }
        }

        if (condition != NoReason) {
            _cond = condition;
            _text = text;
        }
    }

    QDomElement Reason::toXml(QDomDocument *doc) const
    {
        if (_cond == NoReason) {
            return QDomElement();
        }
        for (auto r = reasonConditions->cbegin(); r != reasonConditions->cend(); ++r) {
            if (r.value() == _cond) {
                QDomElement e = doc->createElement(QLatin1String("reason"));
                e.appendChild(doc->createElement(r.key()));
                if (!_text.isEmpty()) {
                    e.appendChild(XMLHelper::textTag(*doc, QLatin1String("text"), _text));
                }
                return e;
            }
        }
        return QDomElement();
    }

    //----------------------------------------------------------------------------
    // ContentBase
    //----------------------------------------------------------------------------
    ContentBase::ContentBase(Origin creator, const QString &name) : creator(creator), name(name) { }

    ContentBase::ContentBase(const QDomElement &el)
    {
        static QMap<QString, Origin> sendersMap({ { QStringLiteral("initiator"), Origin::Initiator },
                                                  { QStringLiteral("none"), Origin::None },
                                                  { QStringLiteral("responder"), Origin::Responder },
                                                  { QStringLiteral("both"), Origin::Both } });
        creator     = creatorAttr(el);
        name        = el.attribute(QLatin1String("name"));
        senders     = sendersMap.value(el.attribute(QLatin1String("senders")), Origin::Both);
        disposition = el.attribute(QLatin1String("disposition")); // if empty, it's "session"
    }

    QDomElement ContentBase::toXml(QDomDocument *doc, const char *tagName, const QString &ns) const
    {
        if (!isValid()) {
            return QDomElement();
        }
        auto el = ns.isEmpty() ? doc->createElement(QLatin1String(tagName))
                               : doc->createElementNS(ns, QLatin1String(tagName));
        setCreatorAttr(el, creator);
        el.setAttribute(QLatin1String("name"), name);

        QString sendersStr;
        switch (senders) {
        case Origin::None:
            sendersStr = QLatin1String("none");
            break;
        case Origin::Initiator:
            sendersStr = QLatin1String("initiator");
            break;
        case Origin::Responder:
            sendersStr = QLatin1String("responder");
            break;
        case Origin::Both:
            sendersStr = QLatin1String("both");
            break;
        }

        if (!disposition.isEmpty() && disposition != QLatin1String("session")) {
            el.setAttribute(QLatin1String("disposition"), disposition);
        }
        el.setAttribute(QLatin1String("senders"), sendersStr);

        return el;
    }

    Origin ContentBase::creatorAttr(const QDomElement &el)
    {
        auto creatorStr = el.attribute(QLatin1String("creator"));
        if (creatorStr == QLatin1String("initiator")) {
            return Origin::Initiator;
        }
        if (creatorStr == QLatin1String("responder")) {
            return Origin::Responder;
        }
        return Origin::None;
    }

    bool ContentBase::setCreatorAttr(QDomElement &el, Origin creator)
    {
        if (creator == Origin::Initiator) {
            el.setAttribute(QLatin1String("creator"), QLatin1String("initiator"));
        } else if (creator == Origin::Responder) {
            el.setAttribute(QLatin1String("creator"), QLatin1String("responder"));
        } else {
            return false;
        }
        return true;
    }

} // namespace Jingle
} // namespace JingleKit
