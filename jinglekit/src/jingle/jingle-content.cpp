/*
 * jingle-content.cpp - Jingle content negotiation
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

#include "jingle-content.h"

#include "file.h"
#include "jingle-session.h"

#include <QDomDocument>
#include <QFile>

#include <stdexcept>

namespace JingleKit { namespace Jingle {

    using namespace FileTransfer;

    Content::Content(std::unique_ptr<CandidateTransport> transport, Origin senders) :
        _senders(senders), _transport(std::move(transport))
    {
        auto &r = _received;
        // clang-format off
        r[std::size_t(Action::ContentAccept)]    = { &Content::onTransportInfo, &Content::onAccept };
        r[std::size_t(Action::ContentAdd)]       = { &Content::onTransportInfo };
        r[std::size_t(Action::SessionAccept)]    = { &Content::onTransportInfo, &Content::onAccept };
        r[std::size_t(Action::SessionInitiate)]  = { &Content::onTransportInfo };
        r[std::size_t(Action::TransportInfo)]    = { &Content::onTransportInfo };
        r[std::size_t(Action::TransportReplace)] = { &Content::onTransportReplace };
        r[std::size_t(Action::TransportAccept)]  = { &Content::onTransportReplace };

        auto &s = _sent;
        s[std::size_t(Action::ContentAccept)]    = { &Content::fillStanza, &Content::onAccept };
        s[std::size_t(Action::ContentAdd)]       = { &Content::fillStanza };
        s[std::size_t(Action::SessionInitiate)]  = { &Content::fillStanza };
        s[std::size_t(Action::SessionAccept)]    = { &Content::fillStanza, &Content::onAccept };
        // clang-format on
    }

    Content::~Content() { }

    void Content::accept() { _accepted = true; }

    void Content::onNegotiated()
    {
        if (_negotiated || !_accepted) {
            return;
        }
        _negotiated = true;
        emit negotiated();
        if (_session) {
            _session->contentNegotiated(this);
        }
    }

    void Content::setTransfer(const TransferRecordPtr &transfer)
    {
        _transfer = transfer;
        if (transfer && !_media) {
            _media = Media::File;
        }
        if (transfer && _session && transfer->direction() == Direction::Send && !transfer->hasHash()) {
            transfer->setAlgorithm(_session->settings().hashType);
        }
    }

    SetDescError Content::setRemoteDescription(const QDomElement &description, const QString &transferSid)
    {
        auto file = File::fromDescription(description);
        if (!file.isValid()) {
            return SetDescError::Unparsed;
        }
        if (!file.size() || file.name().isEmpty()) {
            return SetDescError::IncompatibleParameters;
        }
        auto record = TransferRecordPtr::create(Direction::Receive, transferSid);
        record->applyFile(file);
        setTransfer(record);
        return SetDescError::Ok;
    }

    void Content::onStanza(Action action, bool sent, ActionContext &ctx)
    {
        if (_destroyed) {
            throw std::logic_error("dispatch to a destroyed jingle content");
        }
        if (action == Action::NoAction || (sent && !isSendable(action))) {
            return;
        }
        auto const &handlers = (sent ? _sent : _received)[std::size_t(action)];
        for (auto handler : handlers) {
            (this->*handler)(ctx);
        }
    }

    void Content::onStanza(QStringView action, ActionContext &ctx)
    {
        bool sent;
        auto a = parseAction(action, &sent);
        onStanza(a, sent, ctx);
    }

    void Content::fillStanza(ActionContext &ctx)
    {
        fillContent(ctx.content);
        _sent = true;
        if (_transport) {
            auto doc = ctx.content.ownerDocument();
            ctx.content.appendChild(_transport->buildOutboundPayload(&doc));
        } else {
            qWarning("jingle: content %s has no transport", qPrintable(_name));
        }
    }

    void Content::onAccept(ActionContext &) { onNegotiated(); }

    void Content::onTransportInfo(ActionContext &ctx)
    {
        if (!_transport) {
            return;
        }
        auto tel = ctx.content.firstChildElement(QStringLiteral("transport"));
        if (tel.isNull()) {
            return;
        }
        auto candidates = _transport->parseInboundPayload(tel);
        if (!candidates.isEmpty()) {
            addRemoteCandidates(candidates);
        }
        if (CandidateTransport::isCandidateError(tel)) {
            qDebug("jingle: remote side can't connect to our candidates for %s", qPrintable(_name));
            _remoteReportedCandidateError = true;
            checkCandidatesExhausted();
        }
    }

    void Content::checkCandidatesExhausted()
    {
        if (_transportFailed || !_remoteReportedCandidateError) {
            return;
        }
        // we still may connect to one of theirs
        if (!_localReportedCandidateError && !_transport->remoteCandidates().isEmpty()) {
            return;
        }
        qDebug("jingle: no viable transport candidate left for %s", qPrintable(_name));
        _transportFailed = true;
        if (_transfer) {
            _transfer->fail(QStringLiteral("no viable transport candidate"));
        }
        emit transportFailed();
    }

    void Content::onTransportReplace(ActionContext &ctx)
    {
        if (!_transport || ctx.reply.isNull()) {
            return;
        }
        auto doc = ctx.reply.ownerDocument();
        ctx.reply.appendChild(_transport->buildOutboundPayload(&doc));
    }

    void Content::addRemoteCandidates(const QList<Candidate> &candidates)
    {
        if (_transport) {
            _transport->mergeRemoteCandidates(candidates);
        }
    }

    void Content::sendCandidate(const Candidate &candidate)
    {
        ensureSession();
        auto doc     = _session->document();
        auto content = wrapper(doc);
        content.appendChild(_transport->buildOutboundPayload(doc, QList<Candidate> { candidate }));
        _session->sendTransportInfo(content);
    }

    void Content::sendErrorCandidate()
    {
        ensureSession();
        auto doc     = _session->document();
        auto content = wrapper(doc);
        auto tp      = _transport->buildOutboundPayload(doc, QList<Candidate>());
        tp.appendChild(doc->createElement(QStringLiteral("candidate-error")));
        content.appendChild(tp);
        _session->sendTransportInfo(content);
        _localReportedCandidateError = true;
        checkCandidatesExhausted();
    }

    void Content::sendDescriptionInfo()
    {
        ensureSession();
        auto content = wrapper(_session->document());
        fillContent(content);
        _session->sendDescriptionInfo(content);
    }

    void Content::fillContent(QDomElement &content)
    {
        auto           doc      = content.ownerDocument();
        const Settings settings = _session ? _session->settings() : Settings();
        if (_transfer) {
            auto const sending = _transfer->direction() == Direction::Send;
            if (sending && !_transfer->hasHash() && qint64(_transfer->size()) < settings.hashThreshold) {
                computeHashNow();
            }
            auto file = _transfer->toFile(); // has the hash if we know it
            if (sending && !_transfer->hasHash()) {
                file.addHash(Hash(_transfer->algorithm())); // <hash-used/>. checksum comes later
            }
            content.appendChild(file.descriptionXml(&doc));
        }

        if (_useSecurity.value_or(settings.useSecurity)) {
            auto path = settings.certificatePath;
            auto cert = Certificate::load(path);
            if (cert.isNull()) {
                qWarning("jingle: failed to load certificate from %s. security element is not added",
                         qPrintable(path));
            } else {
                auto sec = XtlsSecurity::fromCertificate(cert).toXml(&doc);
                if (!sec.isNull()) {
                    content.appendChild(sec);
                }
            }
        }
    }

    void Content::computeHashNow()
    {
        QFile file(_transfer->filePath());
        if (!file.open(QIODevice::ReadOnly)) {
            reportFileError(FileError::fromDevice(file));
            return;
        }
        auto hash = Hash::from(_transfer->algorithm(), &file);
        if (file.error() != QFileDevice::NoError) {
            reportFileError(FileError::fromDevice(file));
            return;
        }
        if (hash.isValid()) {
            _transfer->setHash(hash);
        } else {
            qWarning("jingle-ft: failed to compute %s hash of %s", qPrintable(Hash(_transfer->algorithm()).stringType()),
                     qPrintable(_transfer->filePath()));
        }
    }

    void Content::reportFileError(const FileError &error)
    {
        qWarning("jingle-ft: %s", qPrintable(error.toString()));
        _lastFileError = error;
        if (_transfer) {
            _transfer->setFileError(error);
        }
        emit fileError(error);
    }

    void Content::prepare()
    {
        if (_hasher) {
            return; // in progress
        }
        bool needHasher = _transfer && _transfer->direction() == Direction::Send && !_transfer->hasHash()
            && _session && qint64(_transfer->size()) >= _session->settings().hashThreshold;
        if (!needHasher) {
            _prepared = true;
            emit prepared();
            return;
        }
        _hasher.reset(new FileHasher(_transfer->algorithm()));
        connect(_hasher.get(), &FileHasher::finished, this, &Content::hasherFinished, Qt::QueuedConnection);
        _hasher->hashFile(_transfer->filePath());
    }

    void Content::hasherFinished()
    {
        if (!_hasher) {
            return;
        }
        auto hash  = _hasher->result();
        auto error = _hasher->error();
        _hasher.reset();

        if (error.isValid()) {
            reportFileError(error);
        } else if (hash.isValid() && _transfer) {
            _transfer->setHash(hash);
            if (_sent && _session && !_destroyed) {
                sendDescriptionInfo(); // the offer went out with <hash-used/>
            }
        }
        _prepared = true;
        emit prepared();
    }

    void Content::destroy()
    {
        if (_destroyed) {
            return;
        }
        _destroyed = true;
        if (_session) {
            _session->removeContent(key());
            _session = nullptr;
        }
        deleteLater();
    }

    QDomElement Content::wrapper(QDomDocument *doc) const
    {
        ContentBase cb(_creator, _name);
        cb.senders = _senders;
        return cb.toXml(doc, "content");
    }

    void Content::ensureSession() const
    {
        if (!_session || _destroyed) {
            throw std::logic_error("jingle content is not attached to a session");
        }
        if (!_transport) {
            throw std::logic_error("jingle content has no transport");
        }
    }

} // namespace Jingle
} // namespace JingleKit
