/*
 * integrityrecoverytest.cpp
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

#include "integrityrecovery.h"
#include "qttestutil/qttestutil.h"
#include "transferregistry.h"

#include <QDir>
#include <QObject>
#include <QTemporaryDir>
#include <QtTest/QtTest>

using namespace JingleKit;
using namespace JingleKit::FileTransfer;
using namespace std::chrono_literals;

class IntegrityRecoveryTest : public QObject {
    Q_OBJECT

    QTemporaryDir *dir = nullptr;

    QString writeFile(const QString &name, const QByteArray &data)
    {
        QFile f(dir->filePath(name));
        if (!f.open(QIODevice::WriteOnly) || f.write(data) != data.size()) {
            return QString();
        }
        return f.fileName();
    }

    TransferRecordPtr incoming(const QString &sid, const QString &path, std::uint64_t size)
    {
        auto r = TransferRecordPtr::create(Direction::Receive, sid);
        r->setName(QFileInfo(path).fileName());
        r->setFilePath(path);
        r->setSize(size);
        return r;
    }

private slots:
    void init() { dir = new QTemporaryDir; }

    void cleanup()
    {
        delete dir;
        dir = nullptr;
    }

    void testMismatchRestartsTransfer()
    {
        QByteArray received(500000, 'a');
        auto       path = writeFile("photo.raw", received);
        QVERIFY(!path.isEmpty());

        auto date = QDateTime(QDate(2024, 3, 1), QTime(12, 0), Qt::UTC);
        auto old  = incoming("sid1", path, 500000);
        old->setDate(date);
        old->setDescription("holiday");
        old->setMediaType("image/x-raw");
        old->setHash(Hash::from(Hash::Sha256, QByteArray(500000, 'b')));

        TransferRegistry  registry;
        IntegrityRecovery recovery(&registry);
        recovery.setAutoVerify(true);
        recovery.setSidGenerator([]() { return QStringLiteral("sid2"); });
        QVERIFY(registry.add(old));

        QList<TransferRecordPtr> rerequested;
        connect(&recovery, &IntegrityRecovery::rerequestNeeded, this,
                [&rerequested](const TransferRecordPtr &r) { rerequested.append(r); });

        auto base = Clock::now();
        registry.start(old->id(), base);
        registry.onProgress(old->id(), 500000, base + 1s);

        QVERIFY(!QFile::exists(path));
        QVERIFY(old->status() == Status::Error);

        QCOMPARE(rerequested.size(), 1);
        QCOMPARE(registry.records().size(), 1);
        auto fresh = registry.find(Direction::Receive, "sid2");
        QVERIFY(fresh);
        QVERIFY(fresh == rerequested[0]);
        QVERIFY(!registry.find(old->id()));

        QCOMPARE(fresh->offset(), std::uint64_t(0));
        QCOMPARE(fresh->transferred(), std::uint64_t(0));
        QCOMPARE(fresh->name(), QString("photo.raw"));
        QCOMPARE(fresh->filePath(), path);
        QCOMPARE(fresh->size(), std::uint64_t(500000));
        QCOMPARE(fresh->date(), date);
        QCOMPARE(fresh->description(), QString("holiday"));
        QCOMPARE(fresh->mediaType(), QString("image/x-raw"));
        QVERIFY(fresh->hash() == old->hash());
        QVERIFY(fresh->status() == Status::Waiting);
    }

    void testUndeletableFileIsNotRerequested()
    {
        // a non-empty directory in place of the received file can't be removed
        QVERIFY(QDir(dir->path()).mkdir("stuck"));
        auto path = dir->filePath("stuck");
        QVERIFY(!writeFile("stuck/inner", "x").isEmpty());

        auto old = incoming("sid1", path, 100);
        old->setHash(Hash::from(Hash::Sha256, QByteArray("y")));

        TransferRegistry  registry;
        IntegrityRecovery recovery(&registry);
        recovery.setSidGenerator([]() { return QStringLiteral("sid2"); });
        QVERIFY(registry.add(old));

        int rerequested = 0;
        int errors      = 0;
        connect(&recovery, &IntegrityRecovery::rerequestNeeded, this,
                [&rerequested](const TransferRecordPtr &) { ++rerequested; });
        connect(&recovery, &IntegrityRecovery::fileError, this, [&errors](const FileError &) { ++errors; });

        QVERIFY(!recovery.restart(old));
        QCOMPARE(rerequested, 0);
        QCOMPARE(errors, 1);
        QVERIFY(old->lastFileError().isValid());
        QVERIFY(old->status() == Status::Error);
        QVERIFY(registry.find(old->id()) == old);
        QVERIFY(!registry.find(Direction::Receive, "sid2"));
    }

    void testMatchingHashCompletes()
    {
        QByteArray data(4096, 'z');
        auto       path = writeFile("ok.bin", data);
        auto       r    = incoming("sid1", path, 4096);
        r->setHash(Hash::from(Hash::Sha256, data));

        TransferRegistry  registry;
        IntegrityRecovery recovery(&registry);
        int               verified = 0;
        connect(&recovery, &IntegrityRecovery::verified, this, [&verified](const TransferRecordPtr &) { ++verified; });
        QVERIFY(registry.add(r));

        auto base = Clock::now();
        registry.start(r->id(), base);
        registry.onProgress(r->id(), 4096, base + 1s);
        QVERIFY(r->status() == Status::Verifying); // auto verification is off

        QVERIFY(recovery.verify(r) == IntegrityRecovery::Result::Verified);
        QVERIFY(r->status() == Status::Complete);
        QCOMPARE(verified, 1);
        QVERIFY(QFile::exists(path));
    }

    void testNoHash()
    {
        auto              r = incoming("sid1", writeFile("plain.bin", "abc"), 3);
        TransferRegistry  registry;
        IntegrityRecovery recovery(&registry);
        QVERIFY(recovery.verify(r) == IntegrityRecovery::Result::NoHash);
    }

    void testVanishedFileFails()
    {
        auto r = incoming("sid1", dir->filePath("gone.bin"), 3);
        r->setHash(Hash::from(Hash::Sha256, QByteArray("abc")));

        TransferRegistry  registry;
        IntegrityRecovery recovery(&registry);
        QList<FileError>  errors;
        connect(&recovery, &IntegrityRecovery::fileError, this, [&errors](const FileError &e) { errors.append(e); });

        QVERIFY(recovery.verify(r) == IntegrityRecovery::Result::Failed);
        QCOMPARE(errors.size(), 1);
        QCOMPARE(errors[0].path(), dir->filePath("gone.bin"));
        QVERIFY(r->status() == Status::Error);
    }

    void testInspectDestination()
    {
        std::uint64_t existing = 1;
        FileError     err;

        auto absent = incoming("sid1", dir->filePath("new.bin"), 100);
        QVERIFY(IntegrityRecovery::inspectDestination(*absent, &existing, &err) == Destination::Absent);
        QCOMPARE(existing, std::uint64_t(0));
        QVERIFY(!err.isValid());

        auto partial = incoming("sid1", writeFile("part.bin", QByteArray(40, 'p')), 100);
        QVERIFY(IntegrityRecovery::inspectDestination(*partial, &existing, &err) == Destination::Partial);
        QCOMPARE(existing, std::uint64_t(40));

        auto complete = incoming("sid1", writeFile("full.bin", QByteArray(100, 'f')), 100);
        QVERIFY(IntegrityRecovery::inspectDestination(*complete, &existing, &err) == Destination::Complete);

        auto nowhere = incoming("sid1", dir->filePath("missing/dir/x.bin"), 100);
        IntegrityRecovery::inspectDestination(*nowhere, &existing, &err);
        QVERIFY(err.isValid());
        QCOMPARE(err.code(), QFileDevice::PermissionsError);
    }

    void testResumeNeedsRangeSupport()
    {
        auto      path = writeFile("part.bin", QByteArray(40, 'p'));
        auto      r    = incoming("sid1", path, 100);
        FileError err;

        QVERIFY(IntegrityRecovery::prepareReceive(*r, ResumeDecision::Resume, ResumePolicy { true }, &err));
        QCOMPARE(r->offset(), std::uint64_t(40));
        QVERIFY(QFile::exists(path));
        QCOMPARE(r->toFile().range()->offset, std::uint64_t(40));

        auto other = incoming("sid2", path, 100);
        QVERIFY(IntegrityRecovery::prepareReceive(*other, ResumeDecision::Resume, ResumePolicy { false }, &err));
        QCOMPARE(other->offset(), std::uint64_t(0));
        QVERIFY(!QFile::exists(path));
    }

    void testOverwriteAndFinished()
    {
        auto      path = writeFile("full.bin", QByteArray(100, 'f'));
        FileError err;

        auto finished = incoming("sid1", path, 100);
        QVERIFY(IntegrityRecovery::prepareReceive(*finished, ResumeDecision::TreatAsFinished, ResumePolicy(), &err));
        QVERIFY(finished->status() == Status::Complete);
        QVERIFY(QFile::exists(path));

        auto overwrite = incoming("sid2", path, 100);
        QVERIFY(IntegrityRecovery::prepareReceive(*overwrite, ResumeDecision::Overwrite, ResumePolicy { true }, &err));
        QVERIFY(!QFile::exists(path));
        QCOMPARE(overwrite->offset(), std::uint64_t(0));
        QVERIFY(overwrite->status() == Status::Waiting);

        auto bad = incoming("sid3", dir->filePath("missing/dir/x.bin"), 100);
        QVERIFY(!IntegrityRecovery::prepareReceive(*bad, ResumeDecision::Overwrite, ResumePolicy(), &err));
        QVERIFY(err.isValid());
        QVERIFY(bad->lastFileError().isValid());
    }
};

QTTESTUTIL_REGISTER_TEST(IntegrityRecoveryTest);
#include "integrityrecoverytest.moc"
