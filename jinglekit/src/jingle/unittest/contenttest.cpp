/*
 * contenttest.cpp
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

#include "file.h"
#include "jingle-content.h"
#include "jingle-session.h"
#include "qttestutil/qttestutil.h"
#include "transferrecord.h"

#include <QDomDocument>
#include <QObject>
#include <QSignalSpy>
#include <QTemporaryDir>
#include <QtTest/QtTest>

#include <stdexcept>

using namespace JingleKit;
using namespace JingleKit::Jingle;
using namespace JingleKit::FileTransfer;

class ContentTest : public QObject {
    Q_OBJECT

    QTemporaryDir *dir = nullptr;

    QString makeFile(const QString &name, qint64 size)
    {
        QFile f(dir->filePath(name));
        if (!f.open(QIODevice::WriteOnly) || !f.resize(size)) {
            return QString();
        }
        return f.fileName();
    }

    Content *addSendContent(Session &session, const QString &path, const QString &name = QString("file"))
    {
        auto transport = std::make_unique<S5BTransport>(session.sid());
        transport->addLocalCandidate(Candidate("cand1", "192.168.0.10", 6000, 8257636));
        auto c = new Content(std::move(transport));
        if (!session.addContent(c, Origin::Initiator, name)) {
            delete c;
            return nullptr;
        }
        FileError err;
        c->setTransfer(TransferRecord::forSending(session.sid(), path, "test file", &err));
        return c;
    }

    // the first <content/> of a <jingle/>
    static QDomElement firstContent(const QDomElement &jingle) { return jingle.firstChildElement("content"); }

    static QDomElement fileEl(const QDomElement &content)
    {
        return content.firstChildElement("description").firstChildElement("file");
    }

private slots:
    void init() { dir = new QTemporaryDir; }

    void cleanup()
    {
        delete dir;
        dir = nullptr;
    }

    void testNegotiatedRequiresAccepted()
    {
        Session session("s1");
        auto    c = new Content(std::make_unique<S5BTransport>("s1"));
        QVERIFY(session.addContent(c, Origin::Initiator, "file"));
        QVERIFY(c->senders() == Origin::Both);
        QVERIFY(c->allowSending());
        QSignalSpy spy(c, &Content::negotiated);

        ActionContext ctx;
        c->onStanza(Action::SessionAccept, false, ctx);
        c->onStanza(Action::ContentAccept, false, ctx);
        c->onStanza(u"transport-info", ctx);
        c->onNegotiated();
        QVERIFY(!c->isAccepted());
        QVERIFY(!c->isNegotiated());
        QCOMPARE(spy.count(), 0);

        c->accept();
        QVERIFY(c->isReady());
        c->onStanza(Action::SessionAccept, false, ctx);
        QVERIFY(c->isNegotiated());
        QVERIFY(c->isAccepted());
        QCOMPARE(spy.count(), 1);
    }

    void testRedeliveryIsIdempotent()
    {
        Session session("s1");
        auto    c = new Content(std::make_unique<S5BTransport>("s1"));
        QVERIFY(session.addContent(c, Origin::Initiator, "file"));
        QSignalSpy negotiatedSpy(c, &Content::negotiated);
        QSignalSpy activatedSpy(&session, &Session::activated);

        c->accept();
        ActionContext ctx;
        for (int i = 0; i < 3; ++i) {
            c->onStanza(u"session-accept", ctx);
            QVERIFY(c->isNegotiated());
        }
        QCOMPARE(negotiatedSpy.count(), 1);
        QCOMPARE(activatedSpy.count(), 1);
    }

    void testSentOnlyAfterFill()
    {
        Session session("s1");
        auto    path = makeFile("small.bin", 1000);
        auto    c    = addSendContent(session, path);
        QVERIFY(c);

        ActionContext ctx;
        c->onStanza(Action::TransportInfo, true, ctx);
        c->onStanza(Action::SessionInfo, true, ctx);
        c->onStanza(u"content-modify-sent", ctx);
        QVERIFY(!c->isSent());

        auto jingle = session.send(Action::SessionInitiate);
        QVERIFY(c->isSent());
        QVERIFY(!c->isReady());
        QCOMPARE(jingle.attribute("action"), QString("session-initiate"));

        auto content = firstContent(jingle);
        QCOMPARE(content.attribute("name"), QString("file"));
        QCOMPARE(content.attribute("creator"), QString("initiator"));
        QCOMPARE(content.firstChildElement("description").namespaceURI(), FileTransfer::NS);
        auto tel = content.firstChildElement("transport");
        QCOMPARE(tel.namespaceURI(), S5BTransport::NS);
        QCOMPARE(tel.firstChildElement("candidate").attribute("cid"), QString("cand1"));
    }

    void testSmallFileHashedInline()
    {
        Session session("s1");
        auto    path = makeFile("small.bin", 8000000);
        QVERIFY(!path.isEmpty());
        auto c = addSendContent(session, path);
        QVERIFY(c);

        auto file = fileEl(firstContent(session.send(Action::SessionInitiate)));
        QCOMPARE(file.firstChildElement("name").text(), QString("small.bin"));
        QCOMPARE(file.firstChildElement("size").text(), QString("8000000"));
        QCOMPARE(file.firstChildElement("desc").text(), QString("test file"));

        auto hash = file.firstChildElement("hash");
        QVERIFY(!hash.isNull());
        QCOMPARE(hash.attribute("algo"), QString("sha-256"));
        QVERIFY(!hash.text().isEmpty());
        QVERIFY(file.firstChildElement("hash-used").isNull());
        QVERIFY(c->transfer()->hasHash());
    }

    void testLargeFileNotHashedInline()
    {
        Session session("s1");
        auto    path = makeFile("large.bin", 12000000);
        QVERIFY(!path.isEmpty());
        auto c = addSendContent(session, path);
        QVERIFY(c);

        auto file = fileEl(firstContent(session.send(Action::SessionInitiate)));
        QCOMPARE(file.firstChildElement("size").text(), QString("12000000"));
        QVERIFY(file.firstChildElement("hash").isNull());
        QCOMPARE(file.firstChildElement("hash-used").attribute("algo"), QString("sha-256"));
        QVERIFY(!c->transfer()->hasHash());
    }

    void testConfiguredHashAlgorithm()
    {
        Settings settings;
        settings.hashType = Hash::Sha512;
        Session session("s1", settings);
        auto    c = addSendContent(session, makeFile("small.bin", 1000));
        QVERIFY(c);
        QVERIFY(c->transfer()->algorithm() == Hash::Sha512);

        auto hash = fileEl(firstContent(session.send(Action::SessionInitiate))).firstChildElement("hash");
        QCOMPARE(hash.attribute("algo"), QString("sha-512"));
    }

    void testSecurityBlockOrder()
    {
        if (!QCA::isSupported("cert") || !QCA::isSupported("rsa")) {
            QSKIP("no QCA provider with certificate and rsa support");
        }
        auto key = QCA::KeyGenerator().createRSA(2048);
        QVERIFY(!key.isNull());
        QCA::CertificateInfo info;
        info.insert(QCA::CommonName, "jinglekit test");
        QCA::CertificateOptions opts;
        opts.setInfo(info);
        opts.setSerialNumber(QCA::BigInteger(1));
        opts.setValidityPeriod(QDateTime::currentDateTimeUtc(), QDateTime::currentDateTimeUtc().addDays(1));
        QCA::Certificate qcert(opts, key);
        QVERIFY(!qcert.isNull());
        QVERIFY(qcert.toPEMFile(dir->filePath("cert.pem")));

        Settings settings;
        settings.certificatePath = dir->filePath("cert.pem");
        settings.useSecurity     = true;
        Session session("s1", settings);
        auto    c = addSendContent(session, makeFile("small.bin", 1000));
        QVERIFY(c);

        auto               content = firstContent(session.send(Action::SessionInitiate));
        QList<QDomElement> children;
        for (auto el = content.firstChildElement(); !el.isNull(); el = el.nextSiblingElement()) {
            children.append(el);
        }
        QCOMPARE(children.size(), 3);
        QCOMPARE(children[0].tagName(), QString("description"));
        QCOMPARE(children[1].tagName(), QString("security"));
        QCOMPARE(children[1].namespaceURI(), XtlsSecurity::NS);
        QCOMPARE(children[2].tagName(), QString("transport"));

        auto sec = children[1];
        QCOMPARE(sec.elementsByTagName("fingerprint").count(), 1);
        QCOMPARE(sec.firstChildElement("fingerprint").text(),
                 fingerprintText(Certificate::load(settings.certificatePath).fingerprint()));
        QVERIFY(!sec.firstChildElement("fingerprint").text().isEmpty());
        auto methods = sec.elementsByTagName("method");
        QCOMPARE(methods.count(), 1);
        QCOMPARE(methods.at(0).toElement().attribute("name"), QString("x509"));
    }

    void testSecurityWithoutCertificate()
    {
        Settings settings;
        settings.certificatePath = dir->filePath("absent.pem");
        Session session("s1", settings);
        auto    c = addSendContent(session, makeFile("small.bin", 1000));
        QVERIFY(c);
        c->setUseSecurity(true);

        auto content = firstContent(session.send(Action::SessionInitiate));
        QVERIFY(content.firstChildElement("security").isNull());
        QCOMPARE(content.firstChildElement().tagName(), QString("description"));
        QCOMPARE(content.lastChildElement().tagName(), QString("transport"));
    }

    void testBackgroundHashSendsDescriptionInfo()
    {
        Settings settings;
        settings.hashThreshold = 1024;
        Session session("s1", settings);
        auto    path = makeFile("medium.bin", 64 * 1024);
        auto    c    = addSendContent(session, path);
        QVERIFY(c);

        QList<QDomElement> outgoing;
        connect(&session, &Session::outgoingJingle, this, [&outgoing](const QDomElement &j) { outgoing.append(j); });

        session.send(Action::SessionInitiate);
        QVERIFY(!c->transfer()->hasHash());

        QSignalSpy prepared(c, &Content::prepared);
        c->prepare();
        QVERIFY(prepared.wait(10000));
        QVERIFY(c->isPrepared());
        QVERIFY(c->transfer()->hasHash());

        QFile f(path);
        QVERIFY(f.open(QIODevice::ReadOnly));
        QVERIFY(c->transfer()->hash() == Hash::from(Hash::Sha256, &f));

        QCOMPARE(outgoing.size(), 2);
        QCOMPARE(outgoing[1].attribute("action"), QString("description-info"));
        auto hash = fileEl(firstContent(outgoing[1])).firstChildElement("hash");
        QCOMPARE(hash.text(), QString::fromLatin1(c->transfer()->hash().data().toBase64()));
    }

    void testPrepareSmallFileImmediately()
    {
        Session    session("s1");
        auto       c = addSendContent(session, makeFile("small.bin", 100));
        QSignalSpy prepared(c, &Content::prepared);
        c->prepare();
        QCOMPARE(prepared.count(), 1);
        QVERIFY(c->isPrepared());
    }

    void testMissingFileIsRefused()
    {
        FileError err;
        QVERIFY(!TransferRecord::forSending("s1", dir->filePath("nope.bin"), QString(), &err));
        QVERIFY(err.isValid());
        QCOMPARE(err.path(), dir->filePath("nope.bin"));

        err = FileError();
        QVERIFY(!TransferRecord::forSending("s1", makeFile("empty.bin", 0), QString(), &err));
        QVERIFY(err.isValid());
    }

    void testUnreadableFileReported()
    {
        Session session("s1");
        auto    path = makeFile("vanishing.bin", 100);
        auto    c    = addSendContent(session, path);
        QVERIFY(c);
        QVERIFY(QFile::remove(path));

        QList<FileError> errors;
        connect(&session, &Session::fileError, this, [&errors](const FileError &e) { errors.append(e); });
        session.send(Action::SessionInitiate);

        QCOMPARE(errors.size(), 1);
        QCOMPARE(errors[0].path(), path);
        QVERIFY(c->lastFileError().isValid());
        QVERIFY(c->isSent());
    }

    void testCandidatesMerged()
    {
        Session session("s1");
        auto    c = new Content(std::make_unique<S5BTransport>("s1"));
        QVERIFY(session.addContent(c, Origin::Initiator, "file"));

        S5BTransport  peer("s1");
        QDomDocument  doc;
        ActionContext ctx;
        ctx.content = c->wrapper(&doc);
        ctx.content.appendChild(
            peer.buildOutboundPayload(&doc, QList<Candidate> { Candidate("r1", "10.1.1.1", 7777, 100) }));
        c->onStanza(Action::TransportInfo, false, ctx);
        QCOMPARE(c->transport()->remoteCandidates().size(), 1);

        ctx.content = c->wrapper(&doc);
        ctx.content.appendChild(
            peer.buildOutboundPayload(&doc, QList<Candidate> { Candidate("r1", "10.1.1.2", 7778, 100) }));
        c->onStanza(Action::TransportInfo, false, ctx);
        QCOMPARE(c->transport()->remoteCandidates().size(), 1);
        QCOMPARE(c->transport()->remoteCandidates()[0].host(), QString("10.1.1.2"));
    }

    // inbound transport-info with the given candidates, or a candidate-error if there are none
    static void deliverTransportInfo(Content *c, const QList<Candidate> &candidates)
    {
        QDomDocument  doc;
        ActionContext ctx;
        ctx.content = c->wrapper(&doc);
        auto tel    = S5BTransport("s1").buildOutboundPayload(&doc, candidates);
        if (candidates.isEmpty()) {
            tel.appendChild(doc.createElement("candidate-error"));
        }
        ctx.content.appendChild(tel);
        c->onStanza(Action::TransportInfo, false, ctx);
    }

    void testCandidateErrorFailsTransfer()
    {
        Session session("s1");
        auto    c = addSendContent(session, makeFile("small.bin", 100));
        QVERIFY(c);
        QSignalSpy failed(c, &Content::transportFailed);

        deliverTransportInfo(c, QList<Candidate>());

        QCOMPARE(failed.count(), 1);
        QVERIFY(c->isTransportFailed());
        QVERIFY(c->transfer()->status() == Status::Error);
        QVERIFY(c->transport()->remoteCandidates().isEmpty());
    }

    void testCandidateErrorKeepsReachableTransfer()
    {
        Session session("s1");
        auto    c = addSendContent(session, makeFile("small.bin", 100));
        QVERIFY(c);
        QSignalSpy failed(c, &Content::transportFailed);

        deliverTransportInfo(c, QList<Candidate> { Candidate("r1", "10.1.1.2", 7778, 100) });
        deliverTransportInfo(c, QList<Candidate>());
        QCOMPARE(failed.count(), 0);
        QVERIFY(!c->isTransportFailed());
        QVERIFY(c->transfer()->status() != Status::Error);
        QCOMPARE(c->transport()->remoteCandidates().size(), 1);

        // now we can't reach theirs either
        c->sendErrorCandidate();
        QCOMPARE(failed.count(), 1);
        QVERIFY(c->transfer()->status() == Status::Error);

        deliverTransportInfo(c, QList<Candidate>());
        QCOMPARE(failed.count(), 1);
    }

    void testLocalCandidateErrorAlone()
    {
        Session session("s1");
        auto    c = addSendContent(session, makeFile("small.bin", 100));
        QVERIFY(c);
        QSignalSpy failed(c, &Content::transportFailed);

        c->sendErrorCandidate();
        QCOMPARE(failed.count(), 0);
        QVERIFY(c->transfer()->status() != Status::Error);

        deliverTransportInfo(c, QList<Candidate>());
        QCOMPARE(failed.count(), 1);
    }

    void testSendErrorCandidate()
    {
        Session session("s1");
        auto    c = new Content(std::make_unique<S5BTransport>("s1"));
        QVERIFY(session.addContent(c, Origin::Responder, "file"));

        QList<QDomElement> outgoing;
        connect(&session, &Session::outgoingJingle, this, [&outgoing](const QDomElement &j) { outgoing.append(j); });
        c->sendErrorCandidate();
        c->sendCandidate(Candidate("c2", "10.0.0.4", 1234, 1));

        QCOMPARE(outgoing.size(), 2);
        QCOMPARE(outgoing[0].attribute("action"), QString("transport-info"));
        auto tel = firstContent(outgoing[0]).firstChildElement("transport");
        QVERIFY(CandidateTransport::isCandidateError(tel));
        QVERIFY(tel.firstChildElement("candidate").isNull());

        auto tel2 = firstContent(outgoing[1]).firstChildElement("transport");
        QCOMPARE(tel2.elementsByTagName("candidate").count(), 1);
        QCOMPARE(tel2.firstChildElement("candidate").attribute("cid"), QString("c2"));
    }

    void testDetachedContentThrows()
    {
        Content c(std::make_unique<S5BTransport>("s1"));
        bool    thrown = false;
        try {
            c.sendDescriptionInfo();
        } catch (const std::logic_error &) {
            thrown = true;
        }
        QVERIFY(thrown);
    }

    void testDispatchToDestroyedContentThrows()
    {
        Session session("s1");
        auto    c = new Content(std::make_unique<S5BTransport>("s1"));
        QVERIFY(session.addContent(c, Origin::Initiator, "file"));
        QPointer<Content> guard(c);

        c->destroy();
        QVERIFY(c->isDestroyed());
        QVERIFY(!session.content("file", Origin::Initiator));

        ActionContext ctx;
        bool          thrown = false;
        try {
            c->onStanza(Action::TransportInfo, false, ctx);
        } catch (const std::logic_error &) {
            thrown = true;
        }
        QVERIFY(thrown);

        QCoreApplication::sendPostedEvents(c, QEvent::DeferredDelete);
        QVERIFY(guard.isNull());
    }

    void testUnknownActionIsNoop()
    {
        Session session("s1");
        auto    c = new Content(std::make_unique<S5BTransport>("s1"));
        QVERIFY(session.addContent(c, Origin::Initiator, "file"));
        c->accept();

        ActionContext ctx;
        c->onStanza(u"content-dance", ctx);
        c->onStanza(u"iq-result-sent", ctx);
        c->onStanza(Action::SecurityInfo, false, ctx);
        QVERIFY(!c->isNegotiated());
        QVERIFY(!c->isSent());
    }

    void testRemoteDescription()
    {
        QDomDocument doc;
        File         file;
        file.setName("photo.jpg");
        file.setSize(500000);
        file.addHash(Hash::from(Hash::Sha256, QByteArray("data")));

        Content c(std::make_unique<S5BTransport>("s1"));
        QVERIFY(c.setRemoteDescription(file.descriptionXml(&doc), "s1") == SetDescError::Ok);
        QVERIFY(c.transfer()->direction() == Direction::Receive);
        QCOMPARE(c.transfer()->name(), QString("photo.jpg"));
        QCOMPARE(c.transfer()->size(), std::uint64_t(500000));
        QVERIFY(c.transfer()->hasHash());
        QVERIFY(c.media() == Media::File);

        File noSize;
        noSize.setName("photo.jpg");
        QVERIFY(c.setRemoteDescription(noSize.descriptionXml(&doc), "s1") == SetDescError::IncompatibleParameters);

        auto foreign = doc.createElementNS("urn:xmpp:jingle:apps:rtp:1", "description");
        QVERIFY(c.setRemoteDescription(foreign, "s1") == SetDescError::Unparsed);
    }
};

QTTESTUTIL_REGISTER_TEST(ContentTest);
#include "contenttest.moc"
