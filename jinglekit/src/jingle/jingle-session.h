/*
 * jingle-session.h - Jingle session. Owns and routes contents
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

#ifndef JINGLEKIT_JINGLE_SESSION_H
#define JINGLEKIT_JINGLE_SESSION_H

#include "fileerror.h"
#include "jingle.h"
#include "settings.h"

#include <QDomDocument>
#include <QMap>
#include <QMutex>
#include <QObject>

namespace JingleKit { namespace Jingle {
    class Content;

    /**
     * @brief The Session class owns contents keyed by (name, creator) and routes actions to them.
     *
     * Stanzas are not sent by the session itself. Every outgoing <jingle/> is emitted
     * with outgoingJingle() for the stream layer.
     */
    class Session : public QObject {
        Q_OBJECT
    public:
        Session(const QString &sid, const Settings &settings = Settings(), QObject *parent = nullptr);
        ~Session() override;

        inline QString         sid() const { return _sid; }
        inline const Settings &settings() const { return _settings; }
        inline QDomDocument   *document() { return &_doc; }
        inline bool            isActive() const { return _activated; }
        inline bool            isTerminated() const { return _terminated; }

        // takes ownership. false if the key is taken or invalid
        bool            addContent(Content *content, Origin creator, const QString &name);
        Content        *content(const QString &name, Origin creator) const;
        QList<Content *> contents() const;

        /**
         * @brief deliver routes a received action to the contents mentioned in the <jingle/>.
         *
         * Unknown contents are dropped, except for session-initiate and content-add where
         * they are created from the offer. Actions without contents go to every content.
         * @return reply <jingle/> if the contents appended something to it, null otherwise
         */
        QDomElement deliver(Action action, const QDomElement &jingle, const QDomElement &error = QDomElement());
        QDomElement deliver(QStringView action, const QDomElement &jingle, const QDomElement &error = QDomElement());

        // builds <jingle action=".."/> for the contents (all by default) and runs their "-sent" handlers
        QDomElement send(Action action, const QList<Content *> &contents = QList<Content *>());
        void        sendTransportInfo(const QDomElement &content);
        void        sendDescriptionInfo(const QDomElement &content);
        void        rejectContent(Content *content, const Reason &reason);
        void        terminate(const Reason &reason);

    signals:
        void outgoingJingle(const QDomElement &jingle);
        void contentAdded(JingleKit::Jingle::Content *content);
        void contentRejected(const QString &name, JingleKit::Jingle::Reason::Condition condition);
        void activated();
        void terminated();
        void fileError(const JingleKit::FileError &error);
        void transportFailed(JingleKit::Jingle::Content *content);

    private:
        friend class Content;

        void        contentNegotiated(Content *content);
        void        removeContent(const ContentKey &key);
        Content    *addRemoteContent(const QDomElement &contentEl);
        QDomElement makeJingle(Action action);
        void        sendReject(const ContentBase &cb, const Reason &reason);

        QString                     _sid;
        Settings                    _settings;
        QDomDocument                _doc;
        mutable QMutex              _contentsMutex;
        QMap<ContentKey, Content *> _contents;
        bool                        _activated  = false;
        bool                        _terminated = false;
    };

} // namespace Jingle
} // namespace JingleKit

#endif // JINGLEKIT_JINGLE_SESSION_H
