/*
 * throughputtest.cpp
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
#include "throughputestimator.h"
#include "transferrecord.h"

#include <QObject>
#include <QtTest/QtTest>

using namespace JingleKit::FileTransfer;
using namespace std::chrono_literals;

class ThroughputTest : public QObject {
    Q_OBJECT

private slots:
    void testWindowSpeed()
    {
        auto base = Clock::now();
        auto r    = TransferRecordPtr::create(Direction::Receive, "sid1");
        r->setSize(10000);
        r->start(base - 1s);
        r->updateProgress(0, base);
        r->updateProgress(100, base + 1s);
        r->updateProgress(300, base + 2s);

        auto e = ThroughputEstimator::estimate(*r);
        QCOMPARE(e.bytesPerSecond, 150.0);
        QCOMPARE(e.etaSeconds, (10000.0 - 300.0) / 150.0);
    }

    void testPauseClearsSamples()
    {
        auto base = Clock::now();
        auto r    = TransferRecordPtr::create(Direction::Receive, "sid1");
        r->setSize(10000);
        r->start(base);
        r->updateProgress(100, base + 1s);
        r->updateProgress(200, base + 2s);
        QCOMPARE(r->samples().size(), std::size_t(2));

        r->pause();
        QVERIFY(r->samples().empty());
        auto paused = ThroughputEstimator::estimate(*r);
        QCOMPARE(paused.bytesPerSecond, 0.0);
        QCOMPARE(paused.etaSeconds, 0.0);

        // the pause itself is not counted as elapsed time
        r->resume(base + 10s);
        r->updateProgress(500, base + 12s);
        QCOMPARE(r->samples().size(), std::size_t(1));
        auto e = ThroughputEstimator::estimate(*r);
        QCOMPARE(e.bytesPerSecond, 125.0);
        QCOMPARE(e.etaSeconds, 9500.0 / 125.0);
    }

    void testCallbacksWhilePaused()
    {
        auto base = Clock::now();
        auto r    = TransferRecordPtr::create(Direction::Receive, "sid1");
        r->setSize(10000);
        r->start(base);
        r->updateProgress(100, base + 1s);
        r->updateProgress(200, base + 2s);

        r->pause();
        r->updateProgress(200, base + 5s); // buffered data still arriving
        QVERIFY(r->samples().empty());
        QCOMPARE(qint64(std::chrono::duration_cast<std::chrono::milliseconds>(r->elapsedTime()).count()), qint64(2000));

        r->resume(base + 10s);
        r->updateProgress(500, base + 12s);
        QCOMPARE(qint64(std::chrono::duration_cast<std::chrono::milliseconds>(r->elapsedTime()).count()), qint64(4000));
        QCOMPARE(ThroughputEstimator::estimate(*r).bytesPerSecond, 125.0);
    }

    void testNoProgress()
    {
        auto base = Clock::now();
        auto r    = TransferRecordPtr::create(Direction::Send, "sid1");
        r->setSize(10000);
        r->start(base);
        QCOMPARE(ThroughputEstimator::estimate(*r).bytesPerSecond, 0.0);

        r->updateProgress(0, base + 1s);
        r->updateProgress(0, base + 2s);
        auto e = ThroughputEstimator::estimate(*r);
        QCOMPARE(e.bytesPerSecond, 0.0);
        QCOMPARE(e.etaSeconds, 0.0);
    }

    void testSpeedIsRounded()
    {
        auto base = Clock::now();
        auto r    = TransferRecordPtr::create(Direction::Receive, "sid1");
        r->setSize(10000);
        r->start(base);
        r->updateProgress(100, base + 3s);
        QCOMPARE(ThroughputEstimator::estimate(*r).bytesPerSecond, 33.0);
    }

    void testEstimateIsPure()
    {
        auto base = Clock::now();
        auto r    = TransferRecordPtr::create(Direction::Receive, "sid1");
        r->setSize(10000);
        r->start(base);
        r->updateProgress(1000, base + 1s);
        r->updateProgress(3000, base + 2s);

        auto a = ThroughputEstimator::estimate(*r);
        auto b = ThroughputEstimator::estimate(*r);
        QCOMPARE(a.bytesPerSecond, b.bytesPerSecond);
        QCOMPARE(a.etaSeconds, b.etaSeconds);
        QCOMPARE(r->samples().size(), std::size_t(2));
    }

    void testFormatEta()
    {
        QCOMPARE(ThroughputEstimator::formatEta(0), QString("00:00:00"));
        QCOMPARE(ThroughputEstimator::formatEta(64.7), QString("00:01:05"));
        QCOMPARE(ThroughputEstimator::formatEta(3 * 3600 + 25 * 60 + 7), QString("03:25:07"));
        QCOMPARE(ThroughputEstimator::formatEta(-5), QString("00:00:00"));
    }
};

QTTESTUTIL_REGISTER_TEST(ThroughputTest);
#include "throughputtest.moc"
