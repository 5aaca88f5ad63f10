/*
 * hash.h - XEP-0300 hashes
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

#ifndef JINGLEKIT_HASH_H
#define JINGLEKIT_HASH_H

#include <QByteArray>
#include <QString>
#include <QStringView>

#include <memory>

class QDomElement;
class QDomDocument;
class QIODevice;

namespace JingleKit {

extern const QString HASH_NS;

/**
 * @brief The Hash class is a checksum of a file as it's carried in <hash/> and <hash-used/>.
 *
 * A hash with a known type but no data names the algorithm only.
 */
class Hash {
public:
    enum Type { Unknown, Sha1, Sha256, Sha512, Sha3_256, Sha3_512, Blake2b256, Blake2b512 };

    inline Hash(Type type = Unknown) : _type(type) { }
    inline Hash(Type type, const QByteArray &data) : _type(type), _data(data) { }
    explicit Hash(const QDomElement &el); // <hash/> or <hash-used/>

    inline bool operator==(const Hash &other) const { return _type == other._type && _data == other._data; }
    inline bool operator!=(const Hash &other) const { return !(*this == other); }

    inline bool       isValid() const { return _type != Unknown; }
    inline Type       type() const { return _type; }
    inline QByteArray data() const { return _data; }

    QString     stringType() const; // "sha-256". empty for Unknown
    static Type parseType(QStringView algo);

    // <hash algo=".."/> with data or <hash-used algo=".."/> without
    QDomElement toXml(QDomDocument *doc) const;

    // returns invalid hash if the algorithm isn't available or the device can't be read
    static Hash from(Type type, const QByteArray &data);
    static Hash from(Type type, QIODevice *dev);

private:
    Type       _type = Unknown;
    QByteArray _data;
};

class Digest;
class StreamHash {
public:
    explicit StreamHash(Hash::Type type);
    ~StreamHash();

    bool addData(const QByteArray &data);
    Hash final();

private:
    Hash::Type              _type;
    std::unique_ptr<Digest> _digest;
};

} // namespace JingleKit

#endif // JINGLEKIT_HASH_H
