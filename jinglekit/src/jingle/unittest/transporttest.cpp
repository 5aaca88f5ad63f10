/*
 * transporttest.cpp
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
#include "qttestutil/qttestutil.h"

#include <QDomDocument>
#include <QObject>
#include <QtTest/QtTest>

using namespace JingleKit::Jingle;

class TransportTest : public QObject {
    Q_OBJECT

    QDomDocument doc;

    QDomElement candidateEl(const QString &cid, const QString &host, const QString &port,
                            const QString &type = QString())
    {
        auto el = doc.createElement("candidate");
        el.setAttribute("cid", cid);
        el.setAttribute("host", host);
        el.setAttribute("port", port);
        el.setAttribute("priority", "8257636");
        if (!type.isEmpty()) {
            el.setAttribute("type", type);
        }
        return el;
    }

private slots:
    void testCandidateParsing()
    {
        Candidate c(candidateEl("hft54dqy", "192.168.4.1", "5086"));
        QVERIFY(c.isValid());
        QCOMPARE(c.type(), Candidate::Direct);
        QCOMPARE(c.port(), quint16(5086));
        QCOMPARE(c.priority(), quint32(8257636));

        QVERIFY(!Candidate(candidateEl("", "192.168.4.1", "5086")).isValid());
        QVERIFY(!Candidate(candidateEl("x", "192.168.4.1", "port")).isValid());
        QVERIFY(!Candidate(candidateEl("x", "", "5086")).isValid());
        QVERIFY(!Candidate(candidateEl("x", "192.168.4.1", "5086", "carrier-pigeon")).isValid());

        auto proxy = candidateEl("p1", "", "", "proxy");
        QVERIFY(!Candidate(proxy).isValid()); // no jid
        proxy.setAttribute("jid", "proxy.example.com");
        QCOMPARE(Candidate(proxy).type(), Candidate::Proxy);
    }

    void testCandidateToXml()
    {
        Candidate c("ht567dq", "10.0.0.2", 1080, 100, Candidate::Assisted);
        auto      el = c.toXml(&doc);
        QCOMPARE(el.attribute("type"), QString("assisted"));
        QVERIFY(Candidate(el) == c);

        auto direct = Candidate("d1", "10.0.0.3", 1081, 200).toXml(&doc);
        QVERIFY(!direct.hasAttribute("type"));
    }

    void testTransportElement()
    {
        auto tel = doc.createElementNS(S5BTransport::NS, "transport");
        tel.setAttribute("sid", "vj3hs98y");
        tel.setAttribute("dstaddr", "972b7bf47291ca609517f67f86b5081086052dad");
        QVERIFY(S5BTransport(tel).isValid());
        QCOMPARE(S5BTransport(tel).dstaddr(), QString("972b7bf47291ca609517f67f86b5081086052dad"));

        tel.setAttribute("mode", "udp");
        QVERIFY(!S5BTransport(tel).isValid());

        auto ibb = doc.createElementNS("urn:xmpp:jingle:transports:ibb:1", "transport");
        ibb.setAttribute("sid", "vj3hs98y");
        QVERIFY(!S5BTransport(ibb).isValid());
    }

    void testMergeLastWriterWins()
    {
        S5BTransport t("sid1");
        t.mergeRemoteCandidates({ Candidate("a", "10.0.0.1", 1000, 10), Candidate("b", "10.0.0.2", 1000, 20) });
        t.mergeRemoteCandidates({ Candidate("a", "10.0.0.9", 2000, 30), Candidate("c", "10.0.0.3", 1000, 5) });

        auto rc = t.remoteCandidates();
        QCOMPARE(rc.size(), 3);
        QCOMPARE(rc[0].host(), QString("10.0.0.9"));
        QCOMPARE(rc[0].port(), quint16(2000));
        QCOMPARE(rc[1].cid(), QString("b"));
        QCOMPARE(rc[2].cid(), QString("c"));
    }

    void testOutboundPayload()
    {
        S5BTransport t("sid1");
        t.addLocalCandidate(Candidate("a", "10.0.0.1", 1000, 10));
        t.addLocalCandidate(Candidate("b", "10.0.0.2", 1000, 20));

        auto all = t.buildOutboundPayload(&doc);
        QCOMPARE(all.namespaceURI(), S5BTransport::NS);
        QCOMPARE(all.attribute("sid"), QString("sid1"));
        QCOMPARE(all.elementsByTagName("candidate").count(), 2);

        auto one = t.buildOutboundPayload(&doc, QList<Candidate> { Candidate("z", "10.0.0.7", 7, 1) });
        QCOMPARE(one.elementsByTagName("candidate").count(), 1);
        QCOMPARE(one.firstChildElement("candidate").attribute("cid"), QString("z"));

        auto none = t.buildOutboundPayload(&doc, QList<Candidate>());
        QVERIFY(none.firstChildElement("candidate").isNull());
    }

    void testInboundPayload()
    {
        S5BTransport local("sid1");
        S5BTransport remote("sid1");
        remote.addLocalCandidate(Candidate("a", "10.0.0.1", 1000, 10));
        auto tel = remote.buildOutboundPayload(&doc);
        tel.appendChild(candidateEl("", "10.0.0.5", "1")); // invalid, skipped

        auto parsed = local.parseInboundPayload(tel);
        QCOMPARE(parsed.size(), 1);
        QCOMPARE(parsed[0].cid(), QString("a"));

        S5BTransport other("sid2");
        QVERIFY(other.parseInboundPayload(tel).isEmpty());
    }

    void testCandidateError()
    {
        S5BTransport t("sid1");
        auto         tel = t.buildOutboundPayload(&doc, QList<Candidate>());
        QVERIFY(!CandidateTransport::isCandidateError(tel));
        tel.appendChild(doc.createElement("candidate-error"));
        QVERIFY(CandidateTransport::isCandidateError(tel));
    }
};

QTTESTUTIL_REGISTER_TEST(TransportTest);
#include "transporttest.moc"
