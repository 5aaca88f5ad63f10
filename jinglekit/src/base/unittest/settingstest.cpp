/*
 * settingstest.cpp
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
#include "settings.h"

#include <QObject>
#include <QSettings>
#include <QTemporaryDir>
#include <QtTest/QtTest>

using namespace JingleKit;

class SettingsTest : public QObject {
    Q_OBJECT

private slots:
    void testDefaults()
    {
        QTemporaryDir dir;
        QSettings     s(dir.filePath("empty.ini"), QSettings::IniFormat);
        auto      st = Settings::load(s);
        QCOMPARE(st.hashThreshold, qint64(10000000));
        QCOMPARE(st.hashType, Hash::Sha256);
        QCOMPARE(st.sampleWindow, 6);
        QCOMPARE(qint64(st.stallTimeout.count()), qint64(10000));
        QVERIFY(!st.useSecurity);
        QVERIFY(st.certificatePath.isEmpty());
    }

    void testInvalidValuesFallBack()
    {
        QTemporaryDir dir;
        QSettings     s(dir.filePath("broken.ini"), QSettings::IniFormat);
        s.setValue("filetransfer/hashThreshold", "lots");
        s.setValue("filetransfer/hashAlgorithm", "md5");
        s.setValue("filetransfer/sampleWindow", 1);
        s.setValue("filetransfer/stallTimeout", -5);

        auto st = Settings::load(s);
        QCOMPARE(st.hashThreshold, Settings::DefaultHashThreshold);
        QCOMPARE(st.hashType, Hash::Sha256);
        QCOMPARE(st.sampleWindow, Settings::DefaultSampleWindow);
        QCOMPARE(qint64(st.stallTimeout.count()), qint64(10000));
    }

    void testSaveLoad()
    {
        QTemporaryDir dir;
        Settings      st;
        st.hashThreshold   = 4096;
        st.hashType        = Hash::Sha512;
        st.certificatePath = "/etc/jinglekit/cert.pem";
        st.useSecurity     = true;
        st.sampleWindow    = 10;
        st.stallTimeout    = std::chrono::milliseconds(2500);
        {
            QSettings s(dir.filePath("saved.ini"), QSettings::IniFormat);
            st.save(s);
        }
        QSettings s(dir.filePath("saved.ini"), QSettings::IniFormat);
        auto      loaded = Settings::load(s);
        QCOMPARE(loaded.hashThreshold, qint64(4096));
        QCOMPARE(loaded.hashType, Hash::Sha512);
        QCOMPARE(loaded.certificatePath, QString("/etc/jinglekit/cert.pem"));
        QVERIFY(loaded.useSecurity);
        QCOMPARE(loaded.sampleWindow, 10);
        QCOMPARE(qint64(loaded.stallTimeout.count()), qint64(2500));
    }
};

QTTESTUTIL_REGISTER_TEST(SettingsTest);
#include "settingstest.moc"
