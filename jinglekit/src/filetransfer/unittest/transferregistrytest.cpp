/*
 * transferregistrytest.cpp
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
#include "transferregistry.h"

#include <QObject>
#include <QtTest/QtTest>

using namespace JingleKit;
using namespace JingleKit::FileTransfer;
using namespace std::chrono_literals;

class TransferRegistryTest : public QObject {
    Q_OBJECT

    static TransferRecordPtr record(Direction dir, const QString &sid, std::uint64_t size = 1000)
    {
        auto r = TransferRecordPtr::create(dir, sid);
        r->setName("file.bin");
        r->setSize(size);
        return r;
    }

private slots:
    void testAddFind()
    {
        Settings settings;
        settings.sampleWindow = 4;
        TransferRegistry registry(settings);

        auto in  = record(Direction::Receive, "sid1");
        auto out = record(Direction::Send, "sid1");
        QVERIFY(registry.add(in));
        QVERIFY(registry.add(out)); // same sid, other direction
        QCOMPARE(in->sampleWindow(), 4);

        QVERIFY(registry.find(Direction::Receive, "sid1") == in);
        QVERIFY(registry.find(out->id()) == out);
        QVERIFY(!registry.find(Direction::Receive, "sid2"));
        QCOMPARE(registry.records().size(), 2);

        QVERIFY(!registry.add(record(Direction::Receive, "sid1"))); // still active
        QVERIFY(!registry.add(record(Direction::Receive, QString())));
        QVERIFY(!registry.add(TransferRecordPtr()));

        in->cancel();
        auto again = record(Direction::Receive, "sid1");
        QVERIFY(registry.add(again));
        QVERIFY(registry.find(Direction::Receive, "sid1") == again);
    }

    void testProgressFeed()
    {
        TransferRegistry registry;
        auto             r = record(Direction::Receive, "sid1", 300);
        QVERIFY(registry.add(r));

        QList<Status> statuses;
        int           progress = 0;
        connect(&registry, &TransferRegistry::statusChanged, this,
                [&statuses](const TransferRecordPtr &rec) { statuses.append(rec->status()); });
        connect(&registry, &TransferRegistry::progress, this, [&progress](const TransferRecordPtr &) { ++progress; });

        auto base = Clock::now();
        QVERIFY(registry.start(r->id(), base));
        registry.onProgress(r->id(), 100, base + 1s);
        registry.onProgress(r->id(), 200, base + 2s);
        QVERIFY(registry.status(r->id()) == Status::Download);
        QCOMPARE(registry.estimate(r->id()).bytesPerSecond, 100.0);
        QCOMPARE(registry.estimate(r->id()).etaSeconds, 1.0);

        registry.onProgress(r->id(), 300, base + 3s);
        QVERIFY(registry.status(r->id()) == Status::Complete);
        QCOMPARE(progress, 3);
        QVERIFY(statuses == QList<Status>({ Status::Download, Status::Complete }));

        registry.onProgress(TransferId { Direction::Send, "nothing" }, 10, base);
        QCOMPARE(progress, 3);
        QVERIFY(registry.status(TransferId { Direction::Send, "nothing" }) == Status::Stopped);
    }

    void testVerificationNeeded()
    {
        TransferRegistry registry;
        auto             r = record(Direction::Receive, "sid1", 100);
        r->setHash(Hash::from(Hash::Sha256, QByteArray("payload")));
        QVERIFY(registry.add(r));

        QList<TransferRecordPtr> needed;
        connect(&registry, &TransferRegistry::verificationNeeded, this,
                [&needed](const TransferRecordPtr &rec) { needed.append(rec); });

        auto base = Clock::now();
        registry.start(r->id(), base);
        registry.onProgress(r->id(), 100, base + 1s);
        QCOMPARE(needed.size(), 1);
        QVERIFY(needed[0] == r);
    }

    void testUserActions()
    {
        TransferRegistry registry;
        auto             r = record(Direction::Send, "sid1");
        QVERIFY(registry.add(r));
        auto base = Clock::now();

        QVERIFY(registry.start(r->id(), base));
        QVERIFY(registry.pause(r->id()));
        QVERIFY(registry.status(r->id()) == Status::Paused);
        QVERIFY(registry.resume(r->id(), base + 5s));
        QVERIFY(registry.status(r->id()) == Status::Upload);
        QVERIFY(registry.cancel(r->id()));
        QVERIFY(registry.status(r->id()) == Status::Stopped);

        QVERIFY(!registry.pause(TransferId { Direction::Send, "unknown" }));
        QVERIFY(!registry.cancel(TransferId { Direction::Send, "unknown" }));
    }

    void testStallDetection()
    {
        Settings settings;
        settings.stallTimeout = 5s;
        TransferRegistry registry(settings);
        auto             r = record(Direction::Receive, "sid1");
        QVERIFY(registry.add(r));

        auto base = Clock::now();
        registry.start(r->id(), base);
        registry.onProgress(r->id(), 10, base + 1s);

        registry.checkStalled(base + 3s);
        QVERIFY(registry.status(r->id()) == Status::Download);
        registry.checkStalled(base + 10s);
        QVERIFY(registry.status(r->id()) == Status::Waiting);

        registry.onProgress(r->id(), 20, base + 11s);
        QVERIFY(registry.status(r->id()) == Status::Download);
    }

    void testCleanup()
    {
        TransferRegistry registry;
        auto             done    = record(Direction::Receive, "done", 10);
        auto             stopped = record(Direction::Receive, "stopped");
        auto             running = record(Direction::Receive, "running");
        QVERIFY(registry.add(done) && registry.add(stopped) && registry.add(running));

        auto base = Clock::now();
        registry.start(done->id(), base);
        registry.onProgress(done->id(), 10, base + 1s);
        registry.start(running->id(), base);
        registry.cancel(stopped->id());

        QCOMPARE(registry.cleanup(), 2);
        QCOMPARE(registry.records().size(), 1);
        QVERIFY(registry.records()[0] == running);
        QVERIFY(registry.remove(running->id()));
        QVERIFY(!registry.remove(running->id()));
    }
};

QTTESTUTIL_REGISTER_TEST(TransferRegistryTest);
#include "transferregistrytest.moc"
