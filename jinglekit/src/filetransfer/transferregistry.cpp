/*
 * transferregistry.cpp - registry of file transfers
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

#include "transferregistry.h"

namespace JingleKit { namespace FileTransfer {

    TransferRegistry::TransferRegistry(const Settings &settings, QObject *parent) :
        QObject(parent), _settings(settings)
    {
    }

    TransferRegistry::~TransferRegistry() { }

    bool TransferRegistry::add(const TransferRecordPtr &record)
    {
        if (!record || record->sid().isEmpty()) {
            return false;
        }
        auto existing = _records.value(record->id());
        if (existing && existing != record && existing->isActive()) {
            qWarning("jingle-ft: transfer %s is still active", qPrintable(record->sid()));
            return false;
        }
        record->setSampleWindow(_settings.sampleWindow);
        _records.insert(record->id(), record);
        return true;
    }

    TransferRecordPtr TransferRegistry::find(const TransferId &id) const { return _records.value(id); }

    TransferRecordPtr TransferRegistry::find(Direction direction, const QString &sid) const
    {
        return _records.value(TransferId { direction, sid });
    }

    QList<TransferRecordPtr> TransferRegistry::records() const { return _records.values(); }

    bool TransferRegistry::remove(const TransferId &id) { return _records.remove(id) > 0; }

    int TransferRegistry::cleanup()
    {
        int removed = 0;
        for (auto it = _records.begin(); it != _records.end();) {
            if (it.value()->isCompleted() || it.value()->isStopped()) {
                it = _records.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        return removed;
    }

    template <typename Func> bool TransferRegistry::mutate(const TransferId &id, Func &&func)
    {
        auto record = _records.value(id);
        if (!record) {
            qDebug("jingle-ft: no transfer %s", qPrintable(id.sid));
            return false;
        }
        auto before = record->status();
        func(*record);
        auto after = record->status();
        if (before != after) {
            emit statusChanged(record);
            if (after == Status::Verifying) {
                emit verificationNeeded(record);
            }
        }
        return true;
    }

    void TransferRegistry::onProgress(const TransferId &id, std::uint64_t bytes, TimePoint timestamp)
    {
        auto record = _records.value(id); // may be replaced while verifying
        if (mutate(id, [bytes, timestamp](TransferRecord &r) { r.updateProgress(bytes, timestamp); })) {
            emit progress(record);
        }
    }

    void TransferRegistry::checkStalled(TimePoint now)
    {
        for (auto const &record : records()) {
            auto st = record->status();
            if ((st == Status::Download || st == Status::Upload) && now - record->lastTime() > _settings.stallTimeout) {
                mutate(record->id(), [](TransferRecord &r) { r.setStalled(true); });
            }
        }
    }

    bool TransferRegistry::start(const TransferId &id, TimePoint now)
    {
        return mutate(id, [now](TransferRecord &r) { r.start(now); });
    }

    bool TransferRegistry::pause(const TransferId &id)
    {
        return mutate(id, [](TransferRecord &r) { r.pause(); });
    }

    bool TransferRegistry::resume(const TransferId &id, TimePoint now)
    {
        return mutate(id, [now](TransferRecord &r) { r.resume(now); });
    }

    bool TransferRegistry::cancel(const TransferId &id)
    {
        return mutate(id, [](TransferRecord &r) { r.cancel(); });
    }

    Status TransferRegistry::status(const TransferId &id) const
    {
        auto record = _records.value(id);
        return record ? record->status() : Status::Stopped;
    }

    Estimate TransferRegistry::estimate(const TransferId &id) const
    {
        auto record = _records.value(id);
        return record ? ThroughputEstimator::estimate(*record) : Estimate();
    }

} // namespace FileTransfer
} // namespace JingleKit
