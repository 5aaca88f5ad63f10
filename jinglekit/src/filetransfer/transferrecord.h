/*
 * transferrecord.h - state of a single file transfer
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

#ifndef JINGLEKIT_TRANSFERRECORD_H
#define JINGLEKIT_TRANSFERRECORD_H

#include "file.h"
#include "fileerror.h"
#include "hash.h"
#include "settings.h"

#include <QDateTime>
#include <QFile>
#include <QScopedPointer>
#include <QSharedPointer>
#include <QString>

#include <chrono>
#include <deque>

namespace JingleKit { namespace FileTransfer {

    enum class Direction { Send, Receive };

    enum class Status { Stopped, Paused, Waiting, Download, Upload, Verifying, Complete, Error };

    using Clock     = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;

    struct TransferId {
        Direction direction = Direction::Receive;
        QString   sid;

        inline bool operator==(const TransferId &other) const
        {
            return direction == other.direction && sid == other.sid;
        }
        inline bool operator<(const TransferId &other) const
        {
            return direction < other.direction || (direction == other.direction && sid < other.sid);
        }
    };

    /**
     * @brief The TransferRecord class keeps metadata, progress and lifecycle flags of one transfer.
     *
     * The record is mutated from one place at a time: the byte-progress feed of its
     * bytestream or a user action. Status is never stored but derived from the flags.
     */
    class TransferRecord {
    public:
        struct Sample {
            TimePoint     time;
            std::uint64_t bytes; // transferred since offset
        };

        TransferRecord(Direction direction, const QString &sid);
        ~TransferRecord();

        // refuses missing and empty files
        static QSharedPointer<TransferRecord> forSending(const QString &sid, const QString &filePath,
                                                         const QString &description, FileError *error);

        inline TransferId id() const { return { _direction, _sid }; }
        inline Direction  direction() const { return _direction; }
        inline QString    sid() const { return _sid; }

        inline QString       name() const { return _name; }
        inline void          setName(const QString &name) { _name = name; }
        inline QString       filePath() const { return _filePath; }
        inline void          setFilePath(const QString &path) { _filePath = path; }
        inline std::uint64_t size() const { return _size; }
        inline void          setSize(std::uint64_t size) { _size = size; }
        inline QDateTime     date() const { return _date; }
        inline void          setDate(const QDateTime &date) { _date = date; }
        inline QString       description() const { return _description; }
        inline void          setDescription(const QString &desc) { _description = desc; }
        inline QString       mediaType() const { return _mediaType; }
        inline void          setMediaType(const QString &mediaType) { _mediaType = mediaType; }

        // hash with data is an expected (receive) or computed (send) checksum
        inline Hash       hash() const { return _hash; }
        void              setHash(const Hash &hash);
        inline Hash::Type algorithm() const { return _algorithm; }
        inline void       setAlgorithm(Hash::Type type) { _algorithm = type; }
        inline bool       hasHash() const { return _hash.isValid() && !_hash.data().isEmpty(); }

        inline std::uint64_t offset() const { return _offset; }
        inline void          setOffset(std::uint64_t offset) { _offset = offset; }

        File toFile() const;
        void applyFile(const File &file);

        // progress
        inline std::uint64_t             transferred() const { return _transferred; }
        inline const std::deque<Sample> &samples() const { return _samples; }
        inline Clock::duration           elapsedTime() const { return _elapsed; }
        inline TimePoint                 lastTime() const { return _lastTime; }
        inline void                      setSampleWindow(int window) { _sampleWindow = window; }
        inline int                       sampleWindow() const { return _sampleWindow; }
        double                           percent() const;

        void start(TimePoint now);
        void updateProgress(std::uint64_t transferred, TimePoint now);
        void pause();
        void resume(TimePoint now);
        void cancel();
        void finishVerification(bool success);
        void markTransferred(); // the whole file is already on disk
        void fail(const QString &reason);

        inline void setStalled(bool stalled) { _stalled = stalled; }
        inline void setConnected(bool connected) { _connected = connected; }

        inline bool    isStarted() const { return _started; }
        inline bool    isPaused() const { return _paused; }
        inline bool    isStalled() const { return _stalled; }
        inline bool    isConnected() const { return _connected; }
        inline bool    isStopped() const { return _stopped; }
        inline bool    isCompleted() const { return _completed; }
        inline bool    isVerifying() const { return _verifying; }
        inline bool    hasFailed() const { return _failed; }
        inline QString failReason() const { return _failReason; }
        inline bool    isActive() const { return !_stopped && !_completed; }

        Status status() const;

        // file handle for the bytestream. released on cancel or close
        QFile    *openDevice(QIODevice::OpenMode mode);
        QFile    *device() const { return _device.data(); }
        void      closeDevice();
        FileError lastFileError() const { return _lastFileError; }
        void      setFileError(const FileError &error) { _lastFileError = error; }

    private:
        void finish();

        Direction     _direction;
        QString       _sid;
        QString       _name;
        QString       _filePath;
        std::uint64_t _size = 0;
        QDateTime     _date;
        QString       _description;
        QString       _mediaType;
        Hash          _hash;
        Hash::Type    _algorithm = Hash::Sha256;
        std::uint64_t _offset    = 0;

        std::uint64_t      _transferred = 0;
        std::deque<Sample> _samples;
        int                _sampleWindow = Settings::DefaultSampleWindow;
        Clock::duration    _elapsed { 0 };
        TimePoint          _lastTime;

        bool    _started   = false;
        bool    _paused    = false;
        bool    _stalled   = false;
        bool    _connected = false;
        bool    _stopped   = false;
        bool    _completed = false;
        bool    _verifying = false;
        bool    _failed    = false;
        QString _failReason;

        QScopedPointer<QFile> _device;
        FileError             _lastFileError;
    };

    using TransferRecordPtr = QSharedPointer<TransferRecord>;

    QString statusText(Status status);

} // namespace FileTransfer
} // namespace JingleKit

#endif // JINGLEKIT_TRANSFERRECORD_H
