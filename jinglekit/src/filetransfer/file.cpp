/*
 * file.cpp - Jingle file transfer description
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

#include "file.h"

#include "xmlcommon.h"

#include <QDomDocument>
#include <QFile>
#include <QSemaphore>
#include <QThread>
#include <QTimer>

namespace JingleKit { namespace FileTransfer {

    const QString NS = QStringLiteral("urn:xmpp:jingle:apps:file-transfer:5");

    static const QString RANGE_TAG       = QStringLiteral("range");
    static const QString DATE_TAG        = QStringLiteral("date");
    static const QString DESC_TAG        = QStringLiteral("desc");
    static const QString MEDIA_TYPE_TAG  = QStringLiteral("media-type");
    static const QString NAME_TAG        = QStringLiteral("name");
    static const QString SIZE_TAG        = QStringLiteral("size");
    static const QString FILE_TAG        = QStringLiteral("file");
    static const QString DESCRIPTION_TAG = QStringLiteral("description");

    static const qint64 HASH_CHUNK_SIZE = 64 * 1024;

    QDomElement Range::toXml(QDomDocument *doc) const
    {
        auto r = doc->createElement(RANGE_TAG);
        if (length) {
            r.setAttribute(QStringLiteral("length"), QString::number(length));
        }
        if (offset) {
            r.setAttribute(QStringLiteral("offset"), QString::number(offset));
        }
        return r;
    }

    //----------------------------------------------------------------------------
    // File
    //----------------------------------------------------------------------------
    class File::Private : public QSharedData {
    public:
        bool          rangeSupported = false;
        bool          hasSize        = false;
        QDateTime     date;
        QString       mediaType;
        QString       name;
        QString       desc;
        std::uint64_t size = 0;
        Range         range;
        QList<Hash>   hashes;
    };

    File::File() { }

    File::~File() { }

    File &File::operator=(const File &other)
    {
        d = other.d;
        return *this;
    }

    File::File(const File &other) : d(other.d) { }

    File::File(const QDomElement &file)
    {
        QDateTime     date;
        QString       mediaType;
        QString       name;
        QString       desc;
        std::uint64_t size           = 0;
        bool          rangeSupported = false;
        bool          hasSize        = false;
        Range         range;
        QList<Hash>   hashes;

        bool ok;

        for (QDomElement ce = file.firstChildElement(); !ce.isNull(); ce = ce.nextSiblingElement()) {

            if (ce.tagName() == DATE_TAG) {
                date = XMLHelper::stampToDate(ce.text());
                if (!date.isValid()) {
                    return;
                }

            } else if (ce.tagName() == MEDIA_TYPE_TAG) {
                mediaType = ce.text();

            } else if (ce.tagName() == NAME_TAG) {
                name = ce.text();

            } else if (ce.tagName() == SIZE_TAG) {
                size = ce.text().toULongLong(&ok);
                if (!ok) {
                    return;
                }
                hasSize = true;

            } else if (ce.tagName() == RANGE_TAG) {
                if (ce.hasAttribute(QLatin1String("offset"))) {
                    range.offset = ce.attribute(QLatin1String("offset")).toULongLong(&ok);
                    if (!ok) {
                        return;
                    }
                }
                if (ce.hasAttribute(QLatin1String("length"))) {
                    range.length = ce.attribute(QLatin1String("length")).toULongLong(&ok);
                    if (!ok || !range.length) { // 0-length is nonsense
                        return;
                    }
                }
                rangeSupported = true;

            } else if (ce.tagName() == DESC_TAG) {
                desc = ce.text();

            } else if (ce.tagName() == QLatin1String("hash") || ce.tagName() == QLatin1String("hash-used")) {
                if (ce.namespaceURI() == HASH_NS) {
                    Hash h(ce);
                    if (h.type() == Hash::Type::Unknown) {
                        return;
                    }
                    hashes.append(h);
                }
            }
        }

        auto p            = new Private;
        p->date           = date;
        p->mediaType      = mediaType;
        p->name           = name;
        p->desc           = desc;
        p->size           = size;
        p->rangeSupported = rangeSupported;
        p->hasSize        = hasSize;
        p->range          = range;
        p->hashes         = hashes;

        d = p;
    }

    QDomElement File::toXml(QDomDocument *doc) const
    {
        if (!isValid()) {
            return QDomElement();
        }
        QDomElement el = doc->createElementNS(NS, FILE_TAG);
        if (d->name.size()) {
            el.appendChild(XMLHelper::textTag(*doc, NAME_TAG, d->name));
        }
        if (d->date.isValid()) {
            el.appendChild(XMLHelper::textTag(*doc, DATE_TAG, XMLHelper::dateToStamp(d->date)));
        }
        if (d->hasSize) {
            el.appendChild(XMLHelper::textTag(*doc, SIZE_TAG, qint64(d->size)));
        }
        if (d->mediaType.size()) {
            el.appendChild(XMLHelper::textTag(*doc, MEDIA_TYPE_TAG, d->mediaType));
        }
        for (const auto &h : d->hashes) {
            auto hel = h.toXml(doc);
            if (!hel.isNull()) {
                el.appendChild(hel);
            }
        }
        if (d->desc.size()) {
            el.appendChild(XMLHelper::textTag(*doc, DESC_TAG, d->desc));
        }
        if (d->rangeSupported || d->range.isValid()) {
            el.appendChild(d->range.toXml(doc));
        }
        return el;
    }

    QDomElement File::descriptionXml(QDomDocument *doc) const
    {
        auto desc = doc->createElementNS(NS, DESCRIPTION_TAG);
        auto fel  = toXml(doc);
        if (!fel.isNull()) {
            desc.appendChild(fel);
        }
        return desc;
    }

    File File::fromDescription(const QDomElement &description)
    {
        if (description.isNull() || description.namespaceURI() != NS) {
            return File();
        }
        auto fel = description.firstChildElement(FILE_TAG);
        if (fel.isNull()) {
            return File();
        }
        return File(fel);
    }

    QDateTime File::date() const { return d ? d->date : QDateTime(); }

    QString File::description() const { return d ? d->desc : QString(); }

    QList<Hash> File::hashes() const { return d ? d->hashes : QList<Hash>(); }

    Hash File::hash(Hash::Type t) const
    {
        if (d && d->hashes.count()) {
            if (t == Hash::Unknown)
                return d->hashes.at(0);
            for (auto const &h : d->hashes) {
                if (h.type() == t) {
                    return h;
                }
            }
        }
        return Hash();
    }

    QString File::mediaType() const { return d ? d->mediaType : QString(); }

    QString File::name() const { return d ? d->name : QString(); }

    std::optional<std::uint64_t> File::size() const
    {
        if (d && d->hasSize) {
            return d->size;
        }
        return std::nullopt;
    }

    std::optional<Range> File::range() const
    {
        if (d && d->rangeSupported) {
            return d->range;
        }
        return std::nullopt;
    }

    void File::setDate(const QDateTime &date) { ensureD()->date = date; }

    void File::setDescription(const QString &desc) { ensureD()->desc = desc; }

    void File::addHash(const Hash &hash) { ensureD()->hashes.append(hash); }

    void File::setMediaType(const QString &mediaType) { ensureD()->mediaType = mediaType; }

    void File::setName(const QString &name) { ensureD()->name = name; }

    void File::setSize(std::uint64_t size)
    {
        ensureD()->size = size;
        d->hasSize      = true;
    }

    void File::setRange(const Range &range)
    {
        ensureD()->range  = range;
        d->rangeSupported = true;
    }

    File::Private *File::ensureD()
    {
        if (!d) {
            d = new Private;
        }
        return d.data();
    }

    //----------------------------------------------------------------------------
    // FileHasher
    //----------------------------------------------------------------------------
    class FileHasher::Private {
    public:
        QThread    thread;
        StreamHash streamHash;
        Hash       result;
        FileError  error;
        bool       fileMode = false;

        Private(Hash::Type hashType) : streamHash(hashType) { }
    };

    FileHasher::FileHasher(Hash::Type type) : d(new Private(type))
    {
        QSemaphore sem;
        moveToThread(&d->thread);
        QObject::connect(&d->thread, &QThread::started, this, [&sem]() { sem.release(); });
        d->thread.start();
        sem.acquire();
    }

    FileHasher::~FileHasher()
    {
        if (d->thread.isRunning()) {
            if (!d->fileMode) {
                addData(); // ensure exit called
            }
            d->thread.wait();
        }
    }

    void FileHasher::addData(const QByteArray &data)
    {
        QTimer::singleShot(0, this, [data, this]() {
            // executed in a thread
            d->streamHash.addData(data);
            if (data.isEmpty()) {
                d->result = d->streamHash.final();
                thread()->exit();
            }
        });
        if (data.isEmpty())
            d->thread.wait();
    }

    void FileHasher::hashFile(const QString &path)
    {
        d->fileMode = true;
        QTimer::singleShot(0, this, [path, this]() {
            // executed in a thread
            QFile file(path);
            if (!file.open(QIODevice::ReadOnly)) {
                d->error = FileError::fromDevice(file);
            } else {
                while (!file.atEnd()) {
                    auto chunk = file.read(HASH_CHUNK_SIZE);
                    if (chunk.isEmpty()) {
                        d->error = FileError::fromDevice(file);
                        break;
                    }
                    d->streamHash.addData(chunk);
                }
                if (!d->error.isValid()) {
                    d->result = d->streamHash.final();
                }
            }
            thread()->exit();
            emit finished();
        });
    }

    Hash FileHasher::result()
    {
        if (d->thread.isRunning()) {
            if (!d->fileMode) {
                addData(); // ensure exit called
            }
            d->thread.wait();
        }
        return d->result;
    }

    FileError FileHasher::error() const { return d->error; }

} // namespace FileTransfer
} // namespace JingleKit
