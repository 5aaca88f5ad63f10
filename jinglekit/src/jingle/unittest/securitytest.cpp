/*
 * securitytest.cpp
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

#include "jingle-security.h"
#include "qttestutil/qttestutil.h"

#include <QDomDocument>
#include <QObject>
#include <QTemporaryDir>
#include <QtTest/QtTest>

using namespace JingleKit;
using namespace JingleKit::Jingle;

class SecurityTest : public QObject {
    Q_OBJECT

private slots:
    void testFingerprintText()
    {
        QCOMPARE(fingerprintText(QByteArray::fromHex("0a1bff")), QString("0A:1B:FF"));
    }

    void testDigestName_data()
    {
        QTest::addColumn<int>("algorithm");
        QTest::addColumn<QString>("digest");

        QTest::newRow("rsa-sha1") << int(QCA::EMSA3_SHA1) << "sha1";
        QTest::newRow("dsa-sha1") << int(QCA::EMSA1_SHA1) << "sha1";
        QTest::newRow("md5") << int(QCA::EMSA3_MD5) << "md5";
        QTest::newRow("md2") << int(QCA::EMSA3_MD2) << "md2";
        QTest::newRow("ripemd160") << int(QCA::EMSA3_RIPEMD160) << "ripemd160";
        QTest::newRow("sha224") << int(QCA::EMSA3_SHA224) << "sha224";
        QTest::newRow("sha256") << int(QCA::EMSA3_SHA256) << "sha256";
        QTest::newRow("sha384") << int(QCA::EMSA3_SHA384) << "sha384";
        QTest::newRow("sha512") << int(QCA::EMSA3_SHA512) << "sha512";
        QTest::newRow("unknown") << int(QCA::SignatureUnknown) << QString();
    }

    void testDigestName()
    {
        QFETCH(int, algorithm);
        QFETCH(QString, digest);
        QCOMPARE(Certificate::digestName(QCA::SignatureAlgorithm(algorithm)), digest);
    }

    void testParse()
    {
        QDomDocument doc;
        auto         el = doc.createElementNS(XtlsSecurity::NS, "security");
        auto         fp = doc.createElement("fingerprint");
        fp.appendChild(doc.createTextNode(" 0A:1B:FF\n"));
        el.appendChild(fp);
        auto m = doc.createElement("method");
        m.setAttribute("name", "x509");
        el.appendChild(m);

        XtlsSecurity sec(el);
        QVERIFY(sec.isValid());
        QCOMPARE(sec.fingerprint(), QString("0A:1B:FF"));
        QCOMPARE(sec.methods(), QStringList { "x509" });

        auto out = sec.toXml(&doc);
        QCOMPARE(out.namespaceURI(), XtlsSecurity::NS);
        QCOMPARE(out.firstChildElement("fingerprint").text(), QString("0A:1B:FF"));
        QCOMPARE(out.firstChildElement("method").attribute("name"), QString("x509"));

        auto foreign = doc.createElementNS("urn:xmpp:jingle:security:stub:0", "security");
        QVERIFY(!XtlsSecurity(foreign).isValid());
    }

    void testMissingCertificate()
    {
        QTemporaryDir dir;
        auto          cert = Certificate::load(dir.filePath("absent.pem"));
        QVERIFY(cert.isNull());
        QVERIFY(cert.fingerprint().isEmpty());
        QVERIFY(!XtlsSecurity::fromCertificate(cert).isValid());

        QDomDocument doc;
        QVERIFY(XtlsSecurity().toXml(&doc).isNull());
    }

    void testGarbageCertificate()
    {
        if (!QCA::isSupported("cert")) {
            QSKIP("no QCA provider with certificate support");
        }
        QTemporaryDir dir;
        QFile         f(dir.filePath("garbage.pem"));
        QVERIFY(f.open(QIODevice::WriteOnly));
        f.write("-----BEGIN CERTIFICATE-----\nbm90IGEgY2VydA==\n-----END CERTIFICATE-----\n");
        f.close();

        QCA::ConvertResult result = QCA::ConvertGood;
        QVERIFY(Certificate::load(f.fileName(), &result).isNull());
        QVERIFY(result != QCA::ConvertGood);
    }

    void testSelfSignedFingerprint()
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

        QTemporaryDir dir;
        auto          path = dir.filePath("cert.pem");
        QVERIFY(qcert.toPEMFile(path));

        auto cert = Certificate::load(path);
        QVERIFY(!cert.isNull());
        QCOMPARE(cert.signatureAlgorithm(), Certificate::digestName(qcert.signatureAlgorithm()));
        QVERIFY(!cert.signatureAlgorithm().isEmpty());

        auto fp = cert.fingerprint();
        QVERIFY(!fp.isEmpty());
        QCOMPARE(fp, QCA::Hash(cert.signatureAlgorithm()).hash(qcert.toDER()).toByteArray());

        auto sec = XtlsSecurity::fromCertificate(cert);
        QVERIFY(sec.isValid());
        QCOMPARE(sec.fingerprint(), fingerprintText(fp));
        QCOMPARE(sec.methods(), XtlsSecurity::supportedMethods());
    }
};

QTTESTUTIL_REGISTER_TEST(SecurityTest);
#include "securitytest.moc"
