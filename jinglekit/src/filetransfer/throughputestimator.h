/*
 * throughputestimator.h - transfer speed and ETA
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

#ifndef JINGLEKIT_THROUGHPUTESTIMATOR_H
#define JINGLEKIT_THROUGHPUTESTIMATOR_H

#include <QString>

namespace JingleKit { namespace FileTransfer {

    class TransferRecord;

    struct Estimate {
        double etaSeconds     = 0.0;
        double bytesPerSecond = 0.0;
    };

    /*
     Speed is the rate over the retained sample window (first to last sample),
     or transferred/elapsed when there is just one sample. Pure function of the record.
    */
    class ThroughputEstimator {
    public:
        static Estimate estimate(const TransferRecord &record);

        // HH:MM:SS
        static QString formatEta(double seconds);
    };

} // namespace FileTransfer
} // namespace JingleKit

#endif // JINGLEKIT_THROUGHPUTESTIMATOR_H
