/*
 * sessiontest.cpp
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

using namespace JingleKit;
using namespace JingleKit::Jingle;
using namespace JingleKit::FileTransfer;

class SessionTest : public QObject {
    Q_OBJECT

    QTemporaryDir *dir = nullptr;
    QDomDocument   doc;

    Content *addOffer(Session &session, const QString &name = QString("file"))
    {
        QFile f(dir->filePath(name + ".bin"));
        if (!f.open(QIODevice::WriteOnly) || f.write(QByteArray(1000, 'x')) != 1000) {
            return nullptr;
        }
        f.close();

        auto transport = std::make_unique<S5BTransport>(session.sid());
        transport->addLocalCandidate(Candidate("cand1", "192.168.0.10", 6000, 8257636));
        auto c = new Content(std::move(transport));
        if (!session.addContent(c, Origin::Initiator, name)) {
            delete c;
            return nullptr;
        }
        c->setTransfer(TransferRecord::forSending(session.sid(), f.fileName(), QString(), nullptr));
        return c;
    }

    // <jingle><content><description/><transport/></content></jingle> built by hand
    QDomElement handmadeOffer(const File &file, const QString &transportNs)
    {
        auto jingle = doc.createElementNS(Jingle::NS, "jingle");
        jingle.setAttribute("action", "session-initiate");
        jingle.setAttribute("sid", "sid1");
        auto content = ContentBase(Origin::Initiator, "offer").toXml(&doc, "content");
        content.appendChild(file.descriptionXml(&doc));
        auto tel = doc.createElementNS(transportNs, "transport");
        tel.setAttribute("sid", "sid1");
        content.appendChild(tel);
        jingle.appendChild(content);
        return jingle;
    }

    static File validFile()
    {
        File file;
        file.setName("report.pdf");
        file.setSize(2048);
        return file;
    }

private slots:
    void init() { dir = new QTemporaryDir; }

    void cleanup()
    {
        delete dir;
        dir = nullptr;
    }

    void testInitiateAndAccept()
    {
        Session initiator("sid1");
        Session responder("sid1");
        auto    ic = addOffer(initiator);
        QVERIFY(ic);

        QList<Content *> added;
        connect(&responder, &Session::contentAdded, this, [&added](Content *c) { added.append(c); });
        QSignalSpy initiatorActive(&initiator, &Session::activated);
        QSignalSpy responderActive(&responder, &Session::activated);

        auto offer = initiator.send(Action::SessionInitiate);
        QVERIFY(responder.deliver(u"session-initiate", offer).isNull());

        QCOMPARE(added.size(), 1);
        auto rc = responder.content("file", Origin::Initiator);
        QCOMPARE(rc, added[0]);
        QVERIFY(rc->transfer()->direction() == Direction::Receive);
        QCOMPARE(rc->transfer()->sid(), QString("sid1"));
        QCOMPARE(rc->transfer()->name(), QString("file.bin"));
        QCOMPARE(rc->transfer()->size(), std::uint64_t(1000));
        QVERIFY(rc->transfer()->hash() == ic->transfer()->hash());
        QCOMPARE(rc->transport()->remoteCandidates().size(), 1);
        QCOMPARE(rc->transport()->remoteCandidates()[0].cid(), QString("cand1"));
        QVERIFY(!rc->isNegotiated());

        rc->accept();
        auto answer = responder.send(Action::SessionAccept);
        QVERIFY(rc->isNegotiated());
        QCOMPARE(responderActive.count(), 1);
        QVERIFY(responder.isActive());

        ic->accept();
        initiator.deliver(Action::SessionAccept, answer);
        QVERIFY(ic->isNegotiated());
        QCOMPARE(initiatorActive.count(), 1);
    }

    void testActivationWaitsForAllContents()
    {
        Session session("sid1");
        auto    first  = addOffer(session, "first");
        auto    second = addOffer(session, "second");
        QVERIFY(first && second);
        QSignalSpy active(&session, &Session::activated);

        first->accept();
        second->accept();

        auto accept = doc.createElementNS(Jingle::NS, "jingle");
        accept.appendChild(ContentBase(Origin::Initiator, "first").toXml(&doc, "content"));
        session.deliver(Action::SessionAccept, accept);
        QVERIFY(first->isNegotiated());
        QCOMPARE(active.count(), 0);

        // no contents listed: goes to all of them
        session.deliver(Action::SessionAccept, doc.createElementNS(Jingle::NS, "jingle"));
        QVERIFY(second->isNegotiated());
        QCOMPARE(active.count(), 1);
    }

    void testUnknownContentDropped()
    {
        Session session("sid1");
        QVERIFY(addOffer(session));
        int added = 0;
        connect(&session, &Session::contentAdded, this, [&added](Content *) { ++added; });

        auto info = doc.createElementNS(Jingle::NS, "jingle");
        auto cel  = ContentBase(Origin::Responder, "stranger").toXml(&doc, "content");
        cel.appendChild(S5BTransport("sid1").buildOutboundPayload(&doc));
        info.appendChild(cel);

        QVERIFY(session.deliver(Action::TransportInfo, info).isNull());
        QCOMPARE(added, 0);
        QCOMPARE(session.contents().size(), 1);
    }

    void testUnsupportedTransportRejected()
    {
        Session                  session("sid1");
        QList<QDomElement>       outgoing;
        QList<Reason::Condition> rejected;
        connect(&session, &Session::outgoingJingle, this, [&outgoing](const QDomElement &j) { outgoing.append(j); });
        connect(&session, &Session::contentRejected, this,
                [&rejected](const QString &, Reason::Condition cond) { rejected.append(cond); });

        session.deliver(Action::SessionInitiate, handmadeOffer(validFile(), "urn:xmpp:jingle:transports:ibb:1"));

        QVERIFY(session.contents().isEmpty());
        QCOMPARE(rejected.size(), 1);
        QCOMPARE(rejected[0], Reason::UnsupportedTransports);
        QCOMPARE(outgoing.size(), 1);
        QCOMPARE(outgoing[0].attribute("action"), QString("content-reject"));
        QCOMPARE(outgoing[0].firstChildElement("content").attribute("name"), QString("offer"));
        QCOMPARE(Reason(outgoing[0].firstChildElement("reason")).condition(), Reason::UnsupportedTransports);
    }

    void testBadDescriptionRejected_data()
    {
        QTest::addColumn<bool>("hasSize");
        QTest::addColumn<bool>("foreignNs");
        QTest::addColumn<int>("condition");

        QTest::newRow("no size") << false << false << int(Reason::IncompatibleParameters);
        QTest::newRow("not a file") << true << true << int(Reason::FailedApplication);
    }

    void testBadDescriptionRejected()
    {
        QFETCH(bool, hasSize);
        QFETCH(bool, foreignNs);
        QFETCH(int, condition);

        File file;
        file.setName("report.pdf");
        if (hasSize) {
            file.setSize(2048);
        }
        auto offer = handmadeOffer(file, S5BTransport::NS);
        if (foreignNs) {
            auto content = offer.firstChildElement("content");
            content.replaceChild(doc.createElementNS("urn:xmpp:jingle:apps:rtp:1", "description"),
                                 content.firstChildElement("description"));
        }

        Session                  session("sid1");
        QList<Reason::Condition> rejected;
        connect(&session, &Session::contentRejected, this,
                [&rejected](const QString &, Reason::Condition cond) { rejected.append(cond); });
        int added = 0;
        connect(&session, &Session::contentAdded, this, [&added](Content *) { ++added; });

        session.deliver(Action::SessionInitiate, offer);
        QCOMPARE(added, 0);
        QVERIFY(!session.content("offer", Origin::Initiator));
        QCOMPARE(rejected.size(), 1);
        QCOMPARE(int(rejected[0]), condition);
    }

    void testRemoteSecurity()
    {
        auto offer = handmadeOffer(validFile(), S5BTransport::NS);
        auto sec   = doc.createElementNS(XtlsSecurity::NS, "security");
        auto fp    = doc.createElement("fingerprint");
        fp.appendChild(doc.createTextNode("AA:BB"));
        sec.appendChild(fp);
        offer.firstChildElement("content").appendChild(sec);

        Session session("sid1");
        session.deliver(Action::ContentAdd, offer);
        auto c = session.content("offer", Origin::Initiator);
        QVERIFY(c);
        QVERIFY(c->useSecurity().value_or(false));
        QCOMPARE(c->remoteSecurity().fingerprint(), QString("AA:BB"));
    }

    void testTransportReplaceAnswered()
    {
        Session session("sid1");
        auto    c = addOffer(session);
        QVERIFY(c);
        int outgoing = 0;
        connect(&session, &Session::outgoingJingle, this, [&outgoing](const QDomElement &) { ++outgoing; });

        auto replace = doc.createElementNS(Jingle::NS, "jingle");
        auto cel     = ContentBase(Origin::Initiator, "file").toXml(&doc, "content");
        cel.appendChild(S5BTransport("sid1").buildOutboundPayload(&doc));
        replace.appendChild(cel);

        auto reply = session.deliver(u"transport-replace", replace);
        QCOMPARE(reply.attribute("action"), QString("transport-accept"));
        QCOMPARE(reply.attribute("sid"), QString("sid1"));
        auto tel = reply.firstChildElement("content").firstChildElement("transport");
        QCOMPARE(tel.namespaceURI(), S5BTransport::NS);
        QCOMPARE(tel.firstChildElement("candidate").attribute("cid"), QString("cand1"));
        QCOMPARE(outgoing, 1);

        auto accepted = session.deliver(Action::TransportAccept, replace);
        QCOMPARE(accepted.attribute("action"), QString("transport-info"));
        QCOMPARE(outgoing, 2);
    }

    void testSentActionIsNotDeliverable()
    {
        Session session("sid1");
        auto    c = addOffer(session);
        QVERIFY(c);
        c->accept();
        session.deliver(u"session-accept-sent", doc.createElementNS(Jingle::NS, "jingle"));
        QVERIFY(!c->isNegotiated());
    }

    void testContentKeys()
    {
        Session session("sid1");
        QVERIFY(addOffer(session, "file"));
        auto dup = new Content(std::make_unique<S5BTransport>("sid1"));
        QVERIFY(!session.addContent(dup, Origin::Initiator, "file"));
        QVERIFY(!session.addContent(dup, Origin::Both, "other"));
        QVERIFY(!session.addContent(dup, Origin::Responder, QString()));
        QVERIFY(session.addContent(dup, Origin::Responder, "file")); // same name, other creator
        QCOMPARE(session.contents().size(), 2);
        QVERIFY(dup->key() == ContentKey("file", Origin::Responder));
    }

    void testRejectContent()
    {
        Session session("sid1");
        auto    c = addOffer(session);
        QVERIFY(c);
        QList<QDomElement> outgoing;
        connect(&session, &Session::outgoingJingle, this, [&outgoing](const QDomElement &j) { outgoing.append(j); });

        session.rejectContent(c, Reason(Reason::Decline));
        QVERIFY(c->isDestroyed());
        QVERIFY(session.contents().isEmpty());
        QCOMPARE(outgoing.size(), 1);
        QCOMPARE(outgoing[0].attribute("action"), QString("content-reject"));
        QCOMPARE(Reason(outgoing[0].firstChildElement("reason")).condition(), Reason::Decline);
    }

    void testTerminate()
    {
        Session session("sid1");
        QVERIFY(addOffer(session));
        QList<QDomElement> outgoing;
        connect(&session, &Session::outgoingJingle, this, [&outgoing](const QDomElement &j) { outgoing.append(j); });
        QSignalSpy terminated(&session, &Session::terminated);

        session.terminate(Reason(Reason::Success));
        session.terminate(Reason(Reason::Cancel));
        QVERIFY(session.isTerminated());
        QCOMPARE(terminated.count(), 1);
        QCOMPARE(outgoing.size(), 1);
        QCOMPARE(outgoing[0].attribute("action"), QString("session-terminate"));
        QCOMPARE(Reason(outgoing[0].firstChildElement("reason")).condition(), Reason::Success);
    }
};

QTTESTUTIL_REGISTER_TEST(SessionTest);
#include "sessiontest.moc"
