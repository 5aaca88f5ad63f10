/*
 * transferrecord.cpp - state of a single file transfer
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

#include "transferrecord.h"

#include <QFileInfo>

#include <cmath>

namespace JingleKit { namespace FileTransfer {

    TransferRecord::TransferRecord(Direction direction, const QString &sid) : _direction(direction), _sid(sid) { }

    TransferRecord::~TransferRecord() { closeDevice(); }

    QSharedPointer<TransferRecord> TransferRecord::forSending(const QString &sid, const QString &filePath,
                                                              const QString &description, FileError *error)
    {
        QFileInfo fi(filePath);
        if (!fi.exists() || !fi.isFile()) {
            if (error) {
                *error = FileError(QFileDevice::OpenError, filePath, QStringLiteral("file does not exist"));
            }
            return {};
        }
        if (fi.size() == 0) {
            if (error) {
                *error = FileError(QFileDevice::ReadError, filePath, QStringLiteral("file is empty"));
            }
            return {};
        }

        auto record = QSharedPointer<TransferRecord>::create(Direction::Send, sid);
        record->_name        = fi.fileName();
        record->_filePath    = fi.absoluteFilePath();
        record->_size        = std::uint64_t(fi.size());
        record->_date        = fi.lastModified().toUTC();
        record->_description = description;
        return record;
    }

    void TransferRecord::setHash(const Hash &hash)
    {
        _hash = hash;
        if (hash.isValid()) {
            _algorithm = hash.type();
        }
    }

    File TransferRecord::toFile() const
    {
        File file;
        file.setName(_name);
        if (_date.isValid()) {
            file.setDate(_date);
        }
        file.setSize(_size);
        if (!_description.isEmpty()) {
            file.setDescription(_description);
        }
        if (!_mediaType.isEmpty()) {
            file.setMediaType(_mediaType);
        }
        if (hasHash()) {
            file.addHash(_hash);
        }
        if (_offset) {
            file.setRange(Range(_offset, 0));
        }
        return file;
    }

    void TransferRecord::applyFile(const File &file)
    {
        _name        = file.name();
        _date        = file.date();
        _size        = file.size().value_or(0);
        _description = file.description();
        _mediaType   = file.mediaType();
        for (auto const &h : file.hashes()) {
            if (!h.data().isEmpty()) {
                setHash(h);
                break;
            }
            _algorithm = h.type(); // hash-used
        }
        auto range = file.range();
        if (range) {
            _offset = range->offset;
        }
    }

    double TransferRecord::percent() const
    {
        if (_size == 0) {
            return 0.0;
        }
        return std::round(double(_transferred) / double(_size) * 1000.0) / 10.0;
    }

    void TransferRecord::start(TimePoint now)
    {
        if (!_started) {
            _elapsed     = Clock::duration::zero();
            _transferred = _offset;
        }
        _started   = true;
        _connected = true;
        _stalled   = false;
        _lastTime  = now;
    }

    void TransferRecord::updateProgress(std::uint64_t transferred, TimePoint now)
    {
        if (_stopped || _completed || _verifying) {
            return; // late callback from the bytestream
        }
        if (!_paused && now > _lastTime) {
            _elapsed += now - _lastTime;
        }
        _lastTime    = now;
        _transferred = transferred;
        _stalled     = false;

        if (!_paused && _elapsed > Clock::duration::zero()) {
            _samples.push_back({ now, transferred > _offset ? transferred - _offset : 0 });
            while (_samples.size() > std::size_t(_sampleWindow)) {
                _samples.pop_front();
            }
        }

        if (_transferred >= _size) {
            finish();
        }
    }

    void TransferRecord::pause()
    {
        _paused = true;
        _samples.clear();
    }

    void TransferRecord::resume(TimePoint now)
    {
        _paused   = false;
        _stalled  = false;
        _lastTime = now;
    }

    void TransferRecord::cancel()
    {
        _stopped   = true;
        _connected = false;
        closeDevice();
    }

    void TransferRecord::finishVerification(bool success)
    {
        _verifying = false;
        if (success) {
            _completed = true;
            return;
        }
        _failed     = true;
        _failReason = QStringLiteral("hash mismatch");
        _stopped    = true;
    }

    void TransferRecord::markTransferred()
    {
        _started     = true;
        _transferred = _size;
        _samples.clear();
        finish();
    }

    void TransferRecord::fail(const QString &reason)
    {
        _failed     = true;
        _failReason = reason;
        _stopped    = true;
        _connected  = false;
        closeDevice();
    }

    void TransferRecord::finish()
    {
        closeDevice();
        if (_direction == Direction::Receive && hasHash()) {
            _verifying = true;
        } else {
            _completed = true;
        }
    }

    Status TransferRecord::status() const
    {
        if (_failed)
            return Status::Error;
        if (_completed)
            return Status::Complete;
        if (_verifying)
            return Status::Verifying;
        if (_stopped)
            return Status::Stopped;
        if (!_started)
            return Status::Waiting;
        if (!_connected)
            return Status::Stopped;
        if (_paused)
            return Status::Paused;
        if (_stalled)
            return Status::Waiting;
        return _direction == Direction::Receive ? Status::Download : Status::Upload;
    }

    QFile *TransferRecord::openDevice(QIODevice::OpenMode mode)
    {
        if (_device && _device->isOpen()) {
            return _device.data();
        }
        _device.reset(new QFile(_filePath));
        if (!_device->open(mode)) {
            _lastFileError = FileError::fromDevice(*_device);
            qWarning("jingle-ft: %s", qPrintable(_lastFileError.toString()));
            _device.reset();
            return nullptr;
        }
        if (_offset && !_device->seek(qint64(_offset))) {
            _lastFileError = FileError::fromDevice(*_device);
            qWarning("jingle-ft: failed to seek to %llu: %s", qulonglong(_offset),
                     qPrintable(_lastFileError.toString()));
            _device.reset();
            return nullptr;
        }
        return _device.data();
    }

    void TransferRecord::closeDevice()
    {
        if (!_device) {
            return;
        }
        if (_device->isOpen() && (_device->openMode() & QIODevice::WriteOnly) && !_device->flush()) {
            _lastFileError = FileError::fromDevice(*_device);
            qWarning("jingle-ft: %s", qPrintable(_lastFileError.toString()));
        }
        _device->close();
        _device.reset();
    }

    QString statusText(Status status)
    {
        switch (status) {
        case Status::Stopped:
            return QStringLiteral("stopped");
        case Status::Paused:
            return QStringLiteral("paused");
        case Status::Waiting:
            return QStringLiteral("waiting");
        case Status::Download:
            return QStringLiteral("download");
        case Status::Upload:
            return QStringLiteral("upload");
        case Status::Verifying:
            return QStringLiteral("verifying");
        case Status::Complete:
            return QStringLiteral("complete");
        case Status::Error:
            return QStringLiteral("error");
        }
        return QString();
    }

} // namespace FileTransfer
} // namespace JingleKit
