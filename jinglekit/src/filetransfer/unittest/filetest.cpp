/*
 * filetest.cpp
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
#include "qttestutil/qttestutil.h"
#include "xmlcommon.h"

#include <QDomDocument>
#include <QObject>
#include <QTemporaryDir>
#include <QtTest/QtTest>

using namespace JingleKit;
using namespace JingleKit::FileTransfer;

class FileTest : public QObject {
    Q_OBJECT

private slots:
    void testToXml()
    {
        QDomDocument doc;
        File         file;
        file.setName("test.txt");
        file.setDate(QDateTime(QDate(2015, 7, 26), QTime(17, 46, 37), Qt::UTC));
        file.setSize(6144);
        file.setMediaType("text/plain");
        file.setDescription("This is a test. If this were a real file...");
        file.addHash(Hash::from(Hash::Sha256, QByteArray("test")));

        auto el = file.toXml(&doc);
        QCOMPARE(el.namespaceURI(), FileTransfer::NS);
        QStringList order;
        for (auto const &c : XMLHelper::childElements(el)) {
            order << c.tagName();
        }
        QCOMPARE(order, QStringList({ "name", "date", "size", "media-type", "hash", "desc" }));
        QCOMPARE(el.firstChildElement("date").text(), QString("2015-07-26T17:46:37Z"));
        QCOMPARE(el.firstChildElement("size").text(), QString("6144"));

        File parsed(el);
        QVERIFY(parsed.isValid());
        QCOMPARE(parsed.name(), file.name());
        QCOMPARE(parsed.date(), file.date());
        QCOMPARE(parsed.size().value_or(0), std::uint64_t(6144));
        QCOMPARE(parsed.mediaType(), QString("text/plain"));
        QVERIFY(parsed.hash(Hash::Sha256) == file.hash());
        QVERIFY(!parsed.range());
    }

    void testParseRange()
    {
        QDomDocument doc;
        File         file;
        file.setName("big.iso");
        file.setRange(Range(270336, 0));
        auto el = file.toXml(&doc);
        QCOMPARE(el.firstChildElement("range").attribute("offset"), QString("270336"));
        QVERIFY(!el.firstChildElement("range").hasAttribute("length"));

        auto range = File(el).range();
        QVERIFY(range);
        QCOMPARE(range->offset, std::uint64_t(270336));
        QCOMPARE(range->length, std::uint64_t(0));

        el.firstChildElement("range").setAttribute("length", "0");
        QVERIFY(!File(el).isValid());
    }

    void testInvalidValues()
    {
        QDomDocument doc;
        File         file;
        file.setName("x");
        file.setSize(10);
        auto el = file.toXml(&doc);
        auto sizeEl = el.firstChildElement("size");
        XMLHelper::setTagText(sizeEl, "ten");
        QVERIFY(!File(el).isValid());

        QVERIFY(File().toXml(&doc).isNull());

        auto desc = doc.createElementNS(FileTransfer::NS, "description");
        QVERIFY(!File::fromDescription(desc).isValid());
        QVERIFY(!File::fromDescription(QDomElement()).isValid());
    }

    void testHashUsed()
    {
        QDomDocument doc;
        File         file;
        file.setName("later.bin");
        file.addHash(Hash(Hash::Sha512));
        auto el = file.toXml(&doc);
        QCOMPARE(el.firstChildElement("hash-used").attribute("algo"), QString("sha-512"));

        File parsed(el);
        QCOMPARE(parsed.hashes().size(), 1);
        QCOMPARE(parsed.hashes()[0].type(), Hash::Sha512);
        QVERIFY(parsed.hashes()[0].data().isEmpty());
    }

    void testFileHasher()
    {
        QTemporaryDir dir;
        QFile         f(dir.filePath("data.bin"));
        QVERIFY(f.open(QIODevice::WriteOnly));
        QByteArray data(300 * 1024, 'q');
        QCOMPARE(f.write(data), qint64(data.size()));
        f.close();

        FileHasher hasher(Hash::Sha256);
        bool       finished = false;
        connect(&hasher, &FileHasher::finished, this, [&finished]() { finished = true; }, Qt::QueuedConnection);
        hasher.hashFile(f.fileName());
        QTRY_VERIFY_WITH_TIMEOUT(finished, 10000);
        QVERIFY(hasher.result() == Hash::from(Hash::Sha256, data));
        QVERIFY(!hasher.error().isValid());
    }

    void testFileHasherMissingFile()
    {
        QTemporaryDir dir;
        FileHasher    hasher(Hash::Sha256);
        hasher.hashFile(dir.filePath("nothing.bin"));
        QVERIFY(!hasher.result().isValid()); // waits for the hashing thread
        QVERIFY(hasher.error().isValid());
        QCOMPARE(hasher.error().path(), dir.filePath("nothing.bin"));
    }

    void testStreamedHasher()
    {
        FileHasher hasher(Hash::Sha256);
        hasher.addData("ab");
        hasher.addData("c");
        QVERIFY(hasher.result() == Hash::from(Hash::Sha256, QByteArray("abc")));
    }
};

QTTESTUTIL_REGISTER_TEST(FileTest);
#include "filetest.moc"
