/*
 * settings.cpp - file transfer configuration
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

#include "settings.h"

#include <QSettings>

namespace JingleKit {

static const QString HASH_THRESHOLD_KEY = QStringLiteral("filetransfer/hashThreshold");
static const QString HASH_ALGO_KEY      = QStringLiteral("filetransfer/hashAlgorithm");
static const QString SAMPLE_WINDOW_KEY  = QStringLiteral("filetransfer/sampleWindow");
static const QString STALL_TIMEOUT_KEY  = QStringLiteral("filetransfer/stallTimeout"); // msecs
static const QString CERT_PATH_KEY      = QStringLiteral("security/certificate");
static const QString USE_SECURITY_KEY   = QStringLiteral("security/enabled");

Settings Settings::load(QSettings &s)
{
    Settings ret;

    bool ok;
    auto threshold = s.value(HASH_THRESHOLD_KEY, ret.hashThreshold).toLongLong(&ok);
    if (ok && threshold >= 0) {
        ret.hashThreshold = threshold;
    } else {
        qWarning("jingle-ft: invalid %s. using default", qPrintable(HASH_THRESHOLD_KEY));
    }

    auto algo = s.value(HASH_ALGO_KEY, QStringLiteral("sha-256")).toString();
    auto type = Hash::parseType(QStringView { algo });
    if (type != Hash::Unknown) {
        ret.hashType = type;
    } else {
        qWarning("jingle-ft: unknown hash algorithm %s. using sha-256", qPrintable(algo));
    }

    auto window = s.value(SAMPLE_WINDOW_KEY, ret.sampleWindow).toInt(&ok);
    if (ok && window >= 2) {
        ret.sampleWindow = window;
    } else {
        qWarning("jingle-ft: sample window must be at least 2. using default");
    }

    auto stall = s.value(STALL_TIMEOUT_KEY, qlonglong(ret.stallTimeout.count())).toLongLong(&ok);
    if (ok && stall > 0) {
        ret.stallTimeout = std::chrono::milliseconds(stall);
    }

    ret.certificatePath = s.value(CERT_PATH_KEY).toString();
    ret.useSecurity     = s.value(USE_SECURITY_KEY, false).toBool();
    return ret;
}

void Settings::save(QSettings &s) const
{
    s.setValue(HASH_THRESHOLD_KEY, hashThreshold);
    s.setValue(HASH_ALGO_KEY, Hash(hashType).stringType());
    s.setValue(SAMPLE_WINDOW_KEY, sampleWindow);
    s.setValue(STALL_TIMEOUT_KEY, qlonglong(stallTimeout.count()));
    s.setValue(CERT_PATH_KEY, certificatePath);
    s.setValue(USE_SECURITY_KEY, useSecurity);
}

} // namespace JingleKit
