/*
 * hashtest.cpp
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

#include "hash.h"
#include "qttestutil/qttestutil.h"

#include <QBuffer>
#include <QDomDocument>
#include <QObject>
#include <QtTest/QtTest>

using namespace JingleKit;

static const QByteArray ABC_SHA256
    = QByteArray::fromHex("ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

class HashTest : public QObject {
    Q_OBJECT

private slots:
    void testParseType()
    {
        QCOMPARE(Hash::parseType(u"sha-256"), Hash::Sha256);
        QCOMPARE(Hash::parseType(u"sha1"), Hash::Sha1);
        QCOMPARE(Hash::parseType(u"md5"), Hash::Unknown);
        QCOMPARE(Hash(Hash::Sha512).stringType(), QString("sha-512"));
    }

    void testComputeFromData()
    {
        auto h = Hash::from(Hash::Sha256, QByteArray("abc"));
        QVERIFY(h.isValid());
        QCOMPARE(h.data(), ABC_SHA256);
    }

    void testComputeFromDevice()
    {
        QByteArray data("abc");
        QBuffer    buf(&data);
        QVERIFY(buf.open(QIODevice::ReadOnly));
        QCOMPARE(Hash::from(Hash::Sha256, &buf).data(), ABC_SHA256);
    }

    void testStreamHash()
    {
        StreamHash sh(Hash::Sha256);
        QVERIFY(sh.addData("a"));
        QVERIFY(sh.addData("bc"));
        QCOMPARE(sh.final().data(), ABC_SHA256);
    }

    void testUnavailableAlgorithm()
    {
        QVERIFY(!Hash::from(Hash::Unknown, QByteArray("abc")).isValid());
        StreamHash sh(Hash::Unknown);
        QVERIFY(!sh.addData("abc"));
        QVERIFY(!sh.final().isValid());
    }

    void testToXml()
    {
        QDomDocument doc;
        auto         el = Hash(Hash::Sha256, ABC_SHA256).toXml(&doc);
        QCOMPARE(el.tagName(), QString("hash"));
        QCOMPARE(el.namespaceURI(), HASH_NS);
        QCOMPARE(el.attribute("algo"), QString("sha-256"));
        QCOMPARE(el.text(), QString::fromLatin1(ABC_SHA256.toBase64()));

        auto used = Hash(Hash::Sha256).toXml(&doc);
        QCOMPARE(used.tagName(), QString("hash-used"));
        QVERIFY(used.text().isEmpty());

        Hash parsed(el);
        QVERIFY(parsed == Hash(Hash::Sha256, ABC_SHA256));
        QVERIFY(Hash(used) == Hash(Hash::Sha256));

        auto empty = doc.createElementNS(HASH_NS, "hash");
        empty.setAttribute("algo", "sha-256");
        QVERIFY(!Hash(empty).isValid());
    }
};

QTTESTUTIL_REGISTER_TEST(HashTest);
#include "hashtest.moc"
