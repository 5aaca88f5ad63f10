/*
 * jingle-content.h - Jingle content negotiation
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

#ifndef JINGLEKIT_JINGLE_CONTENT_H
#define JINGLEKIT_JINGLE_CONTENT_H

#include "fileerror.h"
#include "jingle-security.h"
#include "jingle-transport.h"
#include "jingle.h"
#include "transferrecord.h"

#include <QList>
#include <QObject>

#include <array>
#include <memory>
#include <optional>

namespace JingleKit {
namespace FileTransfer {
    class FileHasher;
}

namespace Jingle {
    class Session;

    enum class SetDescError {
        Ok,
        Unparsed,
        IncompatibleParameters // this one is for <reason>
    };

    struct ActionContext {
        QDomElement stanza;  // whole <jingle/>. received or being sent
        QDomElement content; // our <content/> in it
        QDomElement error;   // for iq-error
        QDomElement reply;   // <content/> of the reply being built, if any
    };

    /**
     * @brief The Content class negotiates one content of a session.
     *
     * Every action has a list of handlers for the received stanza and another one
     * for the stanza we are sending ("-sent" mirror). All handlers of the list
     * are executed in order. Actions without handlers keep an empty list.
     */
    class Content : public QObject {
        Q_OBJECT
    public:
        using Handler = void (Content::*)(ActionContext &ctx);

        Content(std::unique_ptr<CandidateTransport> transport, Origin senders = Origin::Both);
        ~Content() override;

        // identity is assigned when the content is added to a session
        inline Session   *session() const { return _session; }
        inline Origin     creator() const { return _creator; }
        inline QString    name() const { return _name; }
        inline ContentKey key() const { return ContentKey { _name, _creator }; }

        inline std::optional<Media> media() const { return _media; }
        inline void                 setMedia(Media media) { _media = media; }
        inline Origin               senders() const { return _senders; }
        inline bool                 allowSending() const { return _allowSending; }
        inline void                 setAllowSending(bool allow) { _allowSending = allow; }

        inline bool isAccepted() const { return _accepted; }
        inline bool isSent() const { return _sent; }
        inline bool isNegotiated() const { return _negotiated; }
        inline bool isReady() const { return _accepted && !_sent; }
        inline bool isDestroyed() const { return _destroyed; }
        inline bool isTransportFailed() const { return _transportFailed; }
        void        accept();
        void        onNegotiated();

        inline CandidateTransport *transport() const { return _transport.get(); }

        inline FileTransfer::TransferRecordPtr transfer() const { return _transfer; }
        void                                   setTransfer(const FileTransfer::TransferRecordPtr &transfer);

        inline std::optional<bool> useSecurity() const { return _useSecurity; }
        inline void                setUseSecurity(bool use) { _useSecurity = use; }
        inline XtlsSecurity        remoteSecurity() const { return _remoteSecurity; }
        inline void                setRemoteSecurity(const XtlsSecurity &security) { _remoteSecurity = security; }

        // makes a receive transfer out of the offered <description/>
        SetDescError setRemoteDescription(const QDomElement &description, const QString &transferSid);

        void onStanza(Action action, bool sent, ActionContext &ctx);
        void onStanza(QStringView action, ActionContext &ctx); // e.g. "session-accept-sent"

        void addRemoteCandidates(const QList<Candidate> &candidates);
        void sendCandidate(const Candidate &candidate);
        void sendErrorCandidate();
        void sendDescriptionInfo();

        /**
         * @brief prepare computes the hash of a big outgoing file in background.
         * prepared() is emitted when done. Small files and incoming transfers are prepared immediately.
         */
        void      prepare();
        bool      isPrepared() const { return _prepared; }
        FileError lastFileError() const { return _lastFileError; }

        // removes the content from its session. any further dispatch to it is a programming error
        void destroy();

        QDomElement wrapper(QDomDocument *doc) const;

    signals:
        void negotiated();
        void prepared();
        void fileError(const JingleKit::FileError &error);
        void transportFailed();

    private:
        friend class Session;

        void fillStanza(ActionContext &ctx);
        void onAccept(ActionContext &ctx);
        void onTransportInfo(ActionContext &ctx);
        void onTransportReplace(ActionContext &ctx);

        void fillContent(QDomElement &content);
        void computeHashNow();
        void reportFileError(const FileError &error);
        void hasherFinished();
        void ensureSession() const;
        void checkCandidatesExhausted();

        using HandlerTable = std::array<QList<Handler>, ActionCount>;

        HandlerTable _received;
        HandlerTable _sent;

        Session *_session = nullptr;
        Origin   _creator = Origin::None;
        QString  _name;

        std::optional<Media> _media;
        Origin               _senders      = Origin::Both;
        bool                 _allowSending = true;

        bool _accepted   = false;
        bool _sent       = false;
        bool _negotiated = false;
        bool _destroyed  = false;
        bool _prepared   = false;

        bool _remoteReportedCandidateError = false; // peer can't reach our candidates
        bool _localReportedCandidateError  = false; // we can't reach theirs
        bool _transportFailed              = false;

        std::unique_ptr<CandidateTransport>      _transport;
        FileTransfer::TransferRecordPtr          _transfer;
        std::optional<bool>                      _useSecurity;
        XtlsSecurity                             _remoteSecurity;
        std::unique_ptr<FileTransfer::FileHasher> _hasher;
        FileError                                _lastFileError;
    };

} // namespace Jingle
} // namespace JingleKit

#endif // JINGLEKIT_JINGLE_CONTENT_H
