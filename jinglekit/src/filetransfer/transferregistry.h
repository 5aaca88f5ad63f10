/*
 * transferregistry.h - registry of file transfers
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

#ifndef JINGLEKIT_TRANSFERREGISTRY_H
#define JINGLEKIT_TRANSFERREGISTRY_H

#include "settings.h"
#include "throughputestimator.h"
#include "transferrecord.h"

#include <QMap>
#include <QObject>

namespace JingleKit { namespace FileTransfer {

    /**
     * @brief The TransferRegistry class tracks transfers by (direction, sid).
     *
     * Only one active record may exist for a pair. The bytestream layer feeds
     * progress with onProgress(). Status and estimates are recomputed from the record on every call.
     */
    class TransferRegistry : public QObject {
        Q_OBJECT
    public:
        explicit TransferRegistry(const Settings &settings = Settings(), QObject *parent = nullptr);
        ~TransferRegistry() override;

        inline const Settings &settings() const { return _settings; }

        bool                     add(const TransferRecordPtr &record);
        TransferRecordPtr        find(const TransferId &id) const;
        TransferRecordPtr        find(Direction direction, const QString &sid) const;
        QList<TransferRecordPtr> records() const;
        bool                     remove(const TransferId &id);
        int                      cleanup(); // drops completed and stopped records

        void onProgress(const TransferId &id, std::uint64_t bytes, TimePoint timestamp);
        void checkStalled(TimePoint now);

        bool start(const TransferId &id, TimePoint now);
        bool pause(const TransferId &id);
        bool resume(const TransferId &id, TimePoint now);
        bool cancel(const TransferId &id);

        Status   status(const TransferId &id) const;
        Estimate estimate(const TransferId &id) const;

    signals:
        void progress(const JingleKit::FileTransfer::TransferRecordPtr &record);
        void statusChanged(const JingleKit::FileTransfer::TransferRecordPtr &record);
        void verificationNeeded(const JingleKit::FileTransfer::TransferRecordPtr &record);

    private:
        template <typename Func> bool mutate(const TransferId &id, Func &&func);

        Settings                            _settings;
        QMap<TransferId, TransferRecordPtr> _records;
    };

} // namespace FileTransfer
} // namespace JingleKit

#endif // JINGLEKIT_TRANSFERREGISTRY_H
