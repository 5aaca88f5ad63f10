/*
 * throughputestimator.cpp - transfer speed and ETA
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

#include "throughputestimator.h"

#include "transferrecord.h"

#include <cmath>

namespace JingleKit { namespace FileTransfer {

    using Seconds = std::chrono::duration<double>;

    Estimate ThroughputEstimator::estimate(const TransferRecord &record)
    {
        auto const &samples = record.samples();
        if (samples.empty()) {
            return {};
        }

        double speed;
        if (samples.size() == 1) {
            auto elapsed = Seconds(record.elapsedTime()).count();
            if (elapsed <= 0) {
                return {};
            }
            speed = std::round(double(samples.back().bytes) / elapsed);
        } else {
            auto const &first = samples.front();
            auto const &last  = samples.back();
            auto        tim   = Seconds(last.time - first.time).count();
            if (tim <= 0 || last.bytes < first.bytes) {
                return {};
            }
            speed = std::round(double(last.bytes - first.bytes) / tim);
        }
        if (speed == 0.0) {
            return {};
        }

        auto remaining = record.size() > record.transferred() ? record.size() - record.transferred() : 0;
        return { double(remaining) / speed, speed };
    }

    QString ThroughputEstimator::formatEta(double seconds)
    {
        auto total = qint64(seconds > 0 ? std::llround(seconds) : 0);
        auto h     = total / 3600;
        auto m     = (total / 60) % 60;
        auto s     = total % 60;
        return QString("%1:%2:%3")
            .arg(h, 2, 10, QLatin1Char('0'))
            .arg(m, 2, 10, QLatin1Char('0'))
            .arg(s, 2, 10, QLatin1Char('0'));
    }

} // namespace FileTransfer
} // namespace JingleKit
