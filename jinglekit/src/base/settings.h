/*
 * settings.h - file transfer configuration
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

#ifndef JINGLEKIT_SETTINGS_H
#define JINGLEKIT_SETTINGS_H

#include "hash.h"

#include <QString>

#include <chrono>

class QSettings;

namespace JingleKit {

class Settings {
public:
    static constexpr qint64 DefaultHashThreshold = 10000000; // bytes
    static constexpr int    DefaultSampleWindow  = 6;

    // files below the threshold are hashed synchronously when the description is sent
    qint64                    hashThreshold = DefaultHashThreshold;
    Hash::Type                hashType      = Hash::Sha256;
    QString                   certificatePath;
    bool                      useSecurity  = false;
    int                       sampleWindow = DefaultSampleWindow;
    std::chrono::milliseconds stallTimeout = std::chrono::seconds(10);

    static Settings load(QSettings &s);
    void            save(QSettings &s) const;
};

} // namespace JingleKit

#endif // JINGLEKIT_SETTINGS_H
