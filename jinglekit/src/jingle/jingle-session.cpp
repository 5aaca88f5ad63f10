/*
 * jingle-session.cpp - Jingle session. Owns and routes contents
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

#include "jingle-session.h"

#include "jingle-content.h"
#include "jingle-security.h"
#include "jingle-transport.h"
#include "xmlcommon.h"

#include <QMutexLocker>

namespace JingleKit { namespace Jingle {

    Session::Session(const QString &sid, const Settings &settings, QObject *parent) :
        QObject(parent), _sid(sid), _settings(settings)
    {
    }

    Session::~Session() { }

    bool Session::addContent(Content *content, Origin creator, const QString &name)
    {
        if (!content || content->_session || name.isEmpty()
            || (creator != Origin::Initiator && creator != Origin::Responder)) {
            qWarning("jingle: refusing to add invalid content %s", qPrintable(name));
            return false;
        }
        ContentKey key { name, creator };
        {
            QMutexLocker locker(&_contentsMutex);
            if (_contents.contains(key)) {
                qWarning("jingle: content %s already exists in session %s", qPrintable(name), qPrintable(_sid));
                return false;
            }
            _contents.insert(key, content);
        }
        content->_session = this;
        content->_creator = creator;
        content->_name    = name;
        content->setParent(this);
        if (content->_transfer && content->_transfer->direction() == FileTransfer::Direction::Send
            && !content->_transfer->hasHash()) {
            content->_transfer->setAlgorithm(_settings.hashType);
        }
        connect(content, &Content::fileError, this, &Session::fileError);
        connect(content, &Content::transportFailed, this, [this, content]() { emit transportFailed(content); });
        return true;
    }

    Content *Session::content(const QString &name, Origin creator) const
    {
        QMutexLocker locker(&_contentsMutex);
        return _contents.value(ContentKey { name, creator });
    }

    QList<Content *> Session::contents() const
    {
        QMutexLocker locker(&_contentsMutex);
        return _contents.values();
    }

    void Session::removeContent(const ContentKey &key)
    {
        QMutexLocker locker(&_contentsMutex);
        _contents.remove(key);
    }

    QDomElement Session::deliver(QStringView action, const QDomElement &jingle, const QDomElement &error)
    {
        bool sent;
        auto a = parseAction(action, &sent);
        if (sent) {
            qWarning("jingle: can't deliver %s. it's a local action", qPrintable(action.toString()));
            return QDomElement();
        }
        return deliver(a, jingle, error);
    }

    QDomElement Session::deliver(Action action, const QDomElement &jingle, const QDomElement &error)
    {
        if (action == Action::NoAction) {
            qDebug("jingle: ignoring unknown action in session %s", qPrintable(_sid));
            return QDomElement();
        }

        auto contentEls = XMLHelper::childElements(jingle, QStringLiteral("content"));
        if (contentEls.isEmpty()) {
            for (auto c : contents()) {
                ActionContext ctx { jingle, QDomElement(), error, QDomElement() };
                c->onStanza(action, false, ctx);
            }
            return QDomElement();
        }

        QDomElement replyJingle;
        for (auto const &el : contentEls) {
            ContentBase cb(el);
            auto        c = content(cb.name, cb.creator);
            if (!c) {
                if (action == Action::SessionInitiate || action == Action::ContentAdd) {
                    c = addRemoteContent(el);
                } else {
                    qWarning("jingle: %s for unknown content %s dropped", qPrintable(actionName(action)),
                             qPrintable(cb.name));
                }
                if (!c) {
                    continue;
                }
            }

            ActionContext ctx { jingle, el, error, QDomElement() };
            if (action == Action::TransportReplace || action == Action::TransportAccept) {
                if (replyJingle.isNull()) {
                    replyJingle = makeJingle(action == Action::TransportReplace ? Action::TransportAccept
                                                                                : Action::TransportInfo);
                }
                ctx.reply = c->wrapper(&_doc);
                replyJingle.appendChild(ctx.reply);
            }
            c->onStanza(action, false, ctx);
        }

        if (replyJingle.isNull()) {
            return QDomElement();
        }
        bool hasPayload = false;
        for (auto const &r : XMLHelper::childElements(replyJingle)) {
            hasPayload = hasPayload || r.hasChildNodes();
        }
        if (!hasPayload) {
            return QDomElement();
        }
        emit outgoingJingle(replyJingle);
        return replyJingle;
    }

    QDomElement Session::send(Action action, const QList<Content *> &contents)
    {
        if (!isSendable(action)) {
            qWarning("jingle: %s can't be sent", qPrintable(actionName(action)));
            return QDomElement();
        }
        auto jingle = makeJingle(action);
        for (auto c : contents.isEmpty() ? this->contents() : contents) {
            if (c->session() != this) {
                qWarning("jingle: content %s doesn't belong to session %s", qPrintable(c->name()), qPrintable(_sid));
                continue;
            }
            auto wrapper = c->wrapper(&_doc);
            jingle.appendChild(wrapper);
            ActionContext ctx { jingle, wrapper, QDomElement(), QDomElement() };
            c->onStanza(action, true, ctx);
        }
        emit outgoingJingle(jingle);
        return jingle;
    }

    void Session::sendTransportInfo(const QDomElement &content)
    {
        auto jingle = makeJingle(Action::TransportInfo);
        jingle.appendChild(content);
        emit outgoingJingle(jingle);
    }

    void Session::sendDescriptionInfo(const QDomElement &content)
    {
        auto jingle = makeJingle(Action::DescriptionInfo);
        jingle.appendChild(content);
        emit outgoingJingle(jingle);
    }

    void Session::rejectContent(Content *content, const Reason &reason)
    {
        ContentBase cb(content->creator(), content->name());
        cb.senders = content->senders();
        content->destroy();
        sendReject(cb, reason);
    }

    void Session::sendReject(const ContentBase &cb, const Reason &reason)
    {
        auto jingle = makeJingle(Action::ContentReject);
        jingle.appendChild(cb.toXml(&_doc, "content"));
        auto rel = reason.toXml(&_doc);
        if (!rel.isNull()) {
            jingle.appendChild(rel);
        }
        emit outgoingJingle(jingle);
        emit contentRejected(cb.name, reason.condition());
    }

    void Session::terminate(const Reason &reason)
    {
        if (_terminated) {
            return;
        }
        auto jingle = makeJingle(Action::SessionTerminate);
        auto rel    = reason.toXml(&_doc);
        if (!rel.isNull()) {
            jingle.appendChild(rel);
        }
        for (auto c : contents()) {
            ActionContext ctx { jingle, QDomElement(), QDomElement(), QDomElement() };
            c->onStanza(Action::SessionTerminate, true, ctx);
        }
        _terminated = true;
        emit outgoingJingle(jingle);
        emit terminated();
    }

    void Session::contentNegotiated(Content *content)
    {
        qDebug("jingle: content %s negotiated in session %s", qPrintable(content->name()), qPrintable(_sid));
        if (_activated) {
            return;
        }
        for (auto c : contents()) {
            if (!c->isNegotiated()) {
                return;
            }
        }
        _activated = true;
        emit activated();
    }

    Content *Session::addRemoteContent(const QDomElement &contentEl)
    {
        ContentBase cb(contentEl);
        if (!cb.isValid()) {
            qWarning("jingle: invalid content offer in session %s", qPrintable(_sid));
            return nullptr;
        }

        std::unique_ptr<CandidateTransport> transport;
        auto tel = contentEl.firstChildElement(QStringLiteral("transport"));
        if (tel.namespaceURI() == S5BTransport::NS) {
            auto s5b = std::make_unique<S5BTransport>(tel);
            if (s5b->isValid()) {
                transport = std::move(s5b);
            }
        }
        if (!transport) {
            qDebug("jingle: unsupported transport %s for %s", qPrintable(tel.namespaceURI()), qPrintable(cb.name));
            sendReject(cb, Reason(Reason::UnsupportedTransports));
            return nullptr;
        }

        auto c = new Content(std::move(transport), cb.senders);
        if (!addContent(c, cb.creator, cb.name)) {
            delete c;
            return nullptr;
        }
        auto err = c->setRemoteDescription(contentEl.firstChildElement(QStringLiteral("description")), _sid);
        if (err != SetDescError::Ok) {
            qDebug("jingle: failed to parse description of %s", qPrintable(cb.name));
            rejectContent(c,
                          Reason(err == SetDescError::Unparsed ? Reason::FailedApplication
                                                                : Reason::IncompatibleParameters));
            return nullptr;
        }
        auto sel = contentEl.firstChildElement(QStringLiteral("security"));
        if (!sel.isNull()) {
            c->setRemoteSecurity(XtlsSecurity(sel));
            c->setUseSecurity(true);
        }
        emit contentAdded(c);
        return c;
    }

    QDomElement Session::makeJingle(Action action)
    {
        auto jingle = _doc.createElementNS(NS, QStringLiteral("jingle"));
        jingle.setAttribute(QStringLiteral("action"), actionName(action));
        jingle.setAttribute(QStringLiteral("sid"), _sid);
        return jingle;
    }

} // namespace Jingle
} // namespace JingleKit
