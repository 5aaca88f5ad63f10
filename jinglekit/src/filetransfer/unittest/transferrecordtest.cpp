/*
 * transferrecordtest.cpp
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

#include "qttestutil/qttestutil.h"
#include "transferrecord.h"

#include <QObject>
#include <QTemporaryDir>
#include <QtTest/QtTest>

using namespace JingleKit;
using namespace JingleKit::FileTransfer;
using namespace std::chrono_literals;

class TransferRecordTest : public QObject {
    Q_OBJECT

    static TransferRecordPtr receiving(std::uint64_t size)
    {
        auto r = TransferRecordPtr::create(Direction::Receive, "sid1");
        r->setName("data.bin");
        r->setSize(size);
        return r;
    }

private slots:
    void testStatusLifecycle()
    {
        auto r   = receiving(1000);
        auto now = Clock::now();
        QVERIFY(r->status() == Status::Waiting);

        r->start(now);
        QVERIFY(r->status() == Status::Download);
        r->pause();
        QVERIFY(r->status() == Status::Paused);
        r->resume(now + 1s);
        QVERIFY(r->status() == Status::Download);
        r->setStalled(true);
        QVERIFY(r->status() == Status::Waiting);
        r->updateProgress(1000, now + 2s);
        QVERIFY(r->status() == Status::Complete);
        QCOMPARE(statusText(r->status()), QString("complete"));

        auto s = TransferRecordPtr::create(Direction::Send, "sid2");
        s->setSize(10);
        s->start(now);
        QVERIFY(s->status() == Status::Upload);
    }

    void testStoppedDominatesPaused()
    {
        auto r = receiving(1000);
        r->start(Clock::now());
        r->pause();
        r->setConnected(false);
        QVERIFY(r->status() == Status::Stopped);

        auto c = receiving(1000);
        c->start(Clock::now());
        c->pause();
        c->cancel();
        QVERIFY(c->status() == Status::Stopped);
        QVERIFY(!c->isConnected());
    }

    void testErrorDominates()
    {
        auto r = receiving(1000);
        r->start(Clock::now());
        r->fail("candidate exhaustion");
        QVERIFY(r->status() == Status::Error);
        QCOMPARE(r->failReason(), QString("candidate exhaustion"));
        QVERIFY(!r->isActive());
    }

    void testVerificationOnlyWithHash()
    {
        auto now = Clock::now();
        auto r   = receiving(100);
        r->setHash(Hash::from(Hash::Sha256, QByteArray("x")));
        r->start(now);
        r->updateProgress(100, now + 1s);
        QVERIFY(r->status() == Status::Verifying);
        r->updateProgress(100, now + 2s); // late callback
        QVERIFY(r->status() == Status::Verifying);
        r->finishVerification(true);
        QVERIFY(r->status() == Status::Complete);

        auto bad = receiving(100);
        bad->setHash(Hash::from(Hash::Sha256, QByteArray("x")));
        bad->start(now);
        bad->updateProgress(100, now + 1s);
        bad->finishVerification(false);
        QVERIFY(bad->status() == Status::Error);
        QVERIFY(bad->isStopped());
    }

    void testProgressFromOffset()
    {
        auto now = Clock::now();
        auto r   = receiving(1000);
        r->setOffset(400);
        r->start(now);
        QCOMPARE(r->transferred(), std::uint64_t(400));
        QCOMPARE(r->percent(), 40.0);

        r->updateProgress(500, now + 1s);
        QCOMPARE(r->samples().size(), std::size_t(1));
        QCOMPARE(r->samples().back().bytes, std::uint64_t(100));
        QCOMPARE(r->percent(), 50.0);
    }

    void testPercentRounding()
    {
        auto r = receiving(3);
        r->start(Clock::now());
        r->updateProgress(1, Clock::now());
        QCOMPARE(r->percent(), 33.3);
        QCOMPARE(receiving(0)->percent(), 0.0);
    }

    void testNoSampleWithoutElapsedTime()
    {
        auto now = Clock::now();
        auto r   = receiving(1000);
        r->start(now);
        r->updateProgress(10, now);
        QVERIFY(r->samples().empty());
        r->updateProgress(20, now + 1s);
        QCOMPARE(r->samples().size(), std::size_t(1));
    }

    void testSampleWindowCapped()
    {
        auto now = Clock::now();
        auto r   = receiving(100000);
        r->setSampleWindow(3);
        r->start(now);
        for (int i = 1; i <= 10; ++i) {
            r->updateProgress(std::uint64_t(i) * 100, now + std::chrono::seconds(i));
        }
        QCOMPARE(r->samples().size(), std::size_t(3));
        QCOMPARE(r->samples().front().bytes, std::uint64_t(800));
        QCOMPARE(r->samples().back().bytes, std::uint64_t(1000));
    }

    void testForSending()
    {
        QTemporaryDir dir;
        QFile         f(dir.filePath("notes.txt"));
        QVERIFY(f.open(QIODevice::WriteOnly));
        f.write("hello");
        f.close();

        FileError err;
        auto      r = TransferRecord::forSending("sid1", f.fileName(), "notes", &err);
        QVERIFY(r);
        QVERIFY(!err.isValid());
        QVERIFY(r->direction() == Direction::Send);
        QCOMPARE(r->name(), QString("notes.txt"));
        QCOMPARE(r->size(), std::uint64_t(5));
        QCOMPARE(r->description(), QString("notes"));
        QCOMPARE(r->date().timeSpec(), Qt::UTC);

        auto file = r->toFile();
        QCOMPARE(file.name(), QString("notes.txt"));
        QCOMPARE(file.size().value_or(0), std::uint64_t(5));
        QVERIFY(!file.range());
    }

    void testApplyFile()
    {
        File file;
        file.setName("in.bin");
        file.setSize(42);
        file.setMediaType("application/octet-stream");
        file.addHash(Hash(Hash::Sha512));
        file.setRange(Range(10, 0));

        auto r = receiving(0);
        r->applyFile(file);
        QCOMPARE(r->name(), QString("in.bin"));
        QCOMPARE(r->size(), std::uint64_t(42));
        QCOMPARE(r->mediaType(), QString("application/octet-stream"));
        QCOMPARE(r->algorithm(), Hash::Sha512);
        QVERIFY(!r->hasHash());
        QCOMPARE(r->offset(), std::uint64_t(10));
    }

    void testCancelReleasesDevice()
    {
        QTemporaryDir dir;
        auto          r = receiving(1000);
        r->setFilePath(dir.filePath("partial.bin"));
        auto dev = r->openDevice(QIODevice::WriteOnly);
        QVERIFY(dev);
        QVERIFY(dev->isOpen());
        QCOMPARE(dev->write("abc"), qint64(3));

        r->start(Clock::now());
        r->cancel();
        QVERIFY(!r->device());
        QCOMPARE(QFileInfo(dir.filePath("partial.bin")).size(), qint64(3));

        r->cancel(); // twice is fine
        QVERIFY(r->status() == Status::Stopped);
    }

    void testOpenDeviceFailure()
    {
        QTemporaryDir dir;
        auto          r = receiving(1000);
        r->setFilePath(dir.filePath("no/such/dir/file.bin"));
        QVERIFY(!r->openDevice(QIODevice::WriteOnly));
        QVERIFY(r->lastFileError().isValid());
        QCOMPARE(r->lastFileError().path(), dir.filePath("no/such/dir/file.bin"));
    }
};

QTTESTUTIL_REGISTER_TEST(TransferRecordTest);
#include "transferrecordtest.moc"
