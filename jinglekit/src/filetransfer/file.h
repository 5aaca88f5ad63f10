/*
 * file.h - Jingle file transfer description
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

#ifndef JINGLEKIT_FILETRANSFER_FILE_H
#define JINGLEKIT_FILETRANSFER_FILE_H

#include "fileerror.h"
#include "hash.h"

#include <QDateTime>
#include <QDomElement>
#include <QObject>
#include <QSharedDataPointer>

#include <memory>
#include <optional>

namespace JingleKit { namespace FileTransfer {
    extern const QString NS;

    struct Range {
        std::uint64_t offset = 0; // 0 - default value from the XEP even when not set.
        std::uint64_t length = 0; // 0 - from offset to the end of the file

        inline Range() { }
        inline Range(std::uint64_t offset, std::uint64_t length) : offset(offset), length(length) { }
        inline bool isValid() const { return offset || length; }
        QDomElement toXml(QDomDocument *doc) const;
    };

    class File {
    public:
        File();
        File(const File &other);
        File(const QDomElement &file);
        ~File();
        File       &operator=(const File &other);
        inline bool isValid() const { return d != nullptr; }
        QDomElement toXml(QDomDocument *doc) const;

        // <description xmlns=NS><file/></description>
        QDomElement descriptionXml(QDomDocument *doc) const;
        static File fromDescription(const QDomElement &description);

        QDateTime                    date() const;
        QString                      description() const;
        QList<Hash>                  hashes() const;
        Hash                         hash(Hash::Type t = Hash::Unknown) const;
        QString                      mediaType() const;
        QString                      name() const;
        std::optional<std::uint64_t> size() const;
        std::optional<Range>         range() const;

        void setDate(const QDateTime &date);
        void setDescription(const QString &desc);
        void addHash(const Hash &hash);
        void setMediaType(const QString &mediaType);
        void setName(const QString &name);
        void setSize(std::uint64_t size);
        void setRange(const Range &range = Range()); // default empty just to indicate it's supported

    private:
        class Private;
        Private                    *ensureD();
        QSharedDataPointer<Private> d;
    };

    /**
     * @brief The FileHasher class computes a file hash in a separate thread.
     *
     * Either feed it with data portions or let it read a whole file with hashFile().
     */
    class FileHasher : public QObject {
        Q_OBJECT
    public:
        FileHasher(Hash::Type type);
        ~FileHasher();

        /**
         * @brief addData add next portion of data for hash computation.
         * @param data to be added to hash function. if empty it will signal hashing thread to exit
         */
        void addData(const QByteArray &data = QByteArray());

        // reads the file in the hashing thread. finished() is emitted when done
        void hashFile(const QString &path);

        Hash      result();
        FileError error() const;

    signals:
        void finished();

    private:
        class Private;
        std::unique_ptr<Private> d;
    };

} // namespace FileTransfer
} // namespace JingleKit

#endif // JINGLEKIT_FILETRANSFER_FILE_H
