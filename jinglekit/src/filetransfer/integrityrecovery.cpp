/*
 * integrityrecovery.cpp - received file verification and restart
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

#include "transferregistry.h"

#include <QFile>
#include <QFileInfo>
#include <QUuid>

namespace JingleKit { namespace FileTransfer {

    IntegrityRecovery::IntegrityRecovery(TransferRegistry *registry, QObject *parent) :
        QObject(parent), _registry(registry)
    {
    }

    void IntegrityRecovery::setAutoVerify(bool enabled)
    {
        disconnect(_autoVerify);
        if (enabled) {
            _autoVerify = connect(_registry, &TransferRegistry::verificationNeeded, this,
                                  [this](const TransferRecordPtr &record) { verify(record); });
        }
    }

    IntegrityRecovery::Result IntegrityRecovery::verify(const TransferRecordPtr &record)
    {
        if (!record->hasHash()) {
            if (record->isVerifying()) {
                record->finishVerification(true);
            }
            return Result::NoHash;
        }

        QFile file(record->filePath());
        if (!file.open(QIODevice::ReadOnly)) {
            auto err = FileError::fromDevice(file);
            qWarning("jingle-ft: can't verify %s", qPrintable(err.toString()));
            record->setFileError(err);
            record->fail(QStringLiteral("failed to read received file"));
            emit fileError(err);
            return Result::Failed;
        }
        auto computed = Hash::from(record->hash().type(), &file);
        if (!computed.isValid()) {
            auto err = file.error() != QFileDevice::NoError
                ? FileError::fromDevice(file)
                : FileError(QFileDevice::ReadError, record->filePath(), QStringLiteral("hash computation failed"));
            record->setFileError(err);
            record->fail(QStringLiteral("failed to compute hash"));
            emit fileError(err);
            return Result::Failed;
        }
        file.close();

        if (computed.data() == record->hash().data()) {
            record->finishVerification(true);
            emit verified(record);
            return Result::Verified;
        }

        qWarning("jingle-ft: %s hash mismatch for %s. restarting transfer", qPrintable(computed.stringType()),
                 qPrintable(record->name()));
        record->finishVerification(false);
        return restart(record) ? Result::Restarted : Result::Failed;
    }

    TransferRecordPtr IntegrityRecovery::restart(const TransferRecordPtr &corrupted)
    {
        QFile file(corrupted->filePath());
        if (file.exists() && !file.remove()) {
            auto err = FileError::fromDevice(file);
            qWarning("jingle-ft: failed to remove corrupted file %s", qPrintable(err.toString()));
            corrupted->setFileError(err);
            corrupted->fail(QStringLiteral("failed to remove corrupted file"));
            emit fileError(err);
            return TransferRecordPtr();
        }

        auto fresh = TransferRecordPtr::create(Direction::Receive, newSid());
        fresh->setName(corrupted->name());
        fresh->setFilePath(corrupted->filePath());
        fresh->setSize(corrupted->size());
        fresh->setDate(corrupted->date());
        fresh->setHash(corrupted->hash());
        fresh->setDescription(corrupted->description());
        fresh->setMediaType(corrupted->mediaType());

        _registry->remove(corrupted->id());
        if (!_registry->add(fresh)) {
            qWarning("jingle-ft: can't register restarted transfer %s", qPrintable(fresh->sid()));
            return TransferRecordPtr();
        }
        emit rerequestNeeded(fresh);
        return fresh;
    }

    Destination IntegrityRecovery::inspectDestination(const TransferRecord &record, std::uint64_t *existingSize,
                                                      FileError *error)
    {
        QFileInfo fi(record.filePath());
        if (existingSize) {
            *existingSize = 0;
        }
        if (!fi.exists()) {
            QFileInfo dir(fi.absolutePath());
            if (error && (!dir.isDir() || !dir.isWritable())) {
                *error = FileError(QFileDevice::PermissionsError, dir.absoluteFilePath(),
                                   QStringLiteral("directory is not writable"));
            }
            return Destination::Absent;
        }
        if (error && !fi.isWritable()) {
            *error = FileError(QFileDevice::PermissionsError, fi.absoluteFilePath(),
                               QStringLiteral("file is not writable"));
        }
        auto size = std::uint64_t(fi.size());
        if (existingSize) {
            *existingSize = size;
        }
        return size >= record.size() ? Destination::Complete : Destination::Partial;
    }

    bool IntegrityRecovery::prepareReceive(TransferRecord &record, ResumeDecision decision, const ResumePolicy &policy,
                                           FileError *error)
    {
        std::uint64_t existing = 0;
        FileError     err;
        auto          dest = inspectDestination(record, &existing, &err);
        if (err.isValid()) {
            qWarning("jingle-ft: %s", qPrintable(err.toString()));
            record.setFileError(err);
            if (error) {
                *error = err;
            }
            return false;
        }

        if (decision == ResumeDecision::Resume || decision == ResumeDecision::TreatAsFinished) {
            if (dest == Destination::Complete) {
                record.markTransferred();
                return true;
            }
            if (dest == Destination::Partial && policy.rangeSupported) {
                record.setOffset(existing);
                return true;
            }
            if (dest == Destination::Partial) {
                qDebug("jingle-ft: peer can't send ranges. overwriting %s", qPrintable(record.filePath()));
            }
        }

        // overwrite
        QFile file(record.filePath());
        if (dest != Destination::Absent && !file.remove()) {
            err = FileError::fromDevice(file);
            qWarning("jingle-ft: %s", qPrintable(err.toString()));
            record.setFileError(err);
            if (error) {
                *error = err;
            }
            return false;
        }
        record.setOffset(0);
        return true;
    }

    QString IntegrityRecovery::newSid() const
    {
        if (_sidGenerator) {
            return _sidGenerator();
        }
        return QUuid::createUuid().toString(QUuid::WithoutBraces);
    }

} // namespace FileTransfer
} // namespace JingleKit
