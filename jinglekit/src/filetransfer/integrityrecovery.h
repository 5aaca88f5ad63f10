/*
 * integrityrecovery.h - received file verification and restart
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

#ifndef JINGLEKIT_INTEGRITYRECOVERY_H
#define JINGLEKIT_INTEGRITYRECOVERY_H

#include "fileerror.h"
#include "transferrecord.h"

#include <QObject>

#include <functional>

namespace JingleKit { namespace FileTransfer {

    class TransferRegistry;

    struct ResumePolicy {
        bool rangeSupported = false; // from the transport
    };

    enum class Destination {
        Absent,
        Partial, // smaller than expected
        Complete
    };

    enum class ResumeDecision { Overwrite, Resume, TreatAsFinished };

    /**
     * @brief The IntegrityRecovery class checks received files against the expected hash.
     *
     * A corrupted file is never kept. The only recovery is a full restart: the file
     * is removed and a fresh receive record with a new sid replaces the old one.
     */
    class IntegrityRecovery : public QObject {
        Q_OBJECT
    public:
        enum class Result { Verified, Restarted, NoHash, Failed };

        using SidGenerator = std::function<QString()>;

        explicit IntegrityRecovery(TransferRegistry *registry, QObject *parent = nullptr);

        // watch the registry and verify records as soon as they are fully received
        void setAutoVerify(bool enabled);
        void setSidGenerator(const SidGenerator &generator) { _sidGenerator = generator; }

        Result verify(const TransferRecordPtr &record);
        // returns null if the corrupted file can't be removed. nothing is re-requested then
        TransferRecordPtr restart(const TransferRecordPtr &corrupted);

        // checks the destination of an incoming file before it's started
        static Destination inspectDestination(const TransferRecord &record, std::uint64_t *existingSize,
                                              FileError *error);
        static bool        prepareReceive(TransferRecord &record, ResumeDecision decision, const ResumePolicy &policy,
                                          FileError *error);

    signals:
        void verified(const JingleKit::FileTransfer::TransferRecordPtr &record);
        void rerequestNeeded(const JingleKit::FileTransfer::TransferRecordPtr &fresh);
        void fileError(const JingleKit::FileError &error);

    private:
        QString newSid() const;

        TransferRegistry        *_registry;
        SidGenerator             _sidGenerator;
        QMetaObject::Connection _autoVerify;
    };

} // namespace FileTransfer
} // namespace JingleKit

#endif // JINGLEKIT_INTEGRITYRECOVERY_H
