/*
 * hash.cpp - XEP-0300 hashes
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

#include "hash.h"

#include "xmlcommon.h"

#include <QCryptographicHash>
#include <QDomDocument>
#include <QIODevice>
#include <QtCrypto>

#include <optional>
#include <variant>

namespace JingleKit {

const QString HASH_NS = QStringLiteral("urn:xmpp:hashes:2");

namespace {

    struct Algorithm {
        Hash::Type  type;
        const char *name;    // XEP-0300
        const char *qcaName; // QCA provider name
        std::optional<QCryptographicHash::Algorithm> qtAlgorithm;
    };

    const Algorithm algorithms[] = {
        { Hash::Sha1, "sha-1", "sha1", QCryptographicHash::Sha1 },
        { Hash::Sha256, "sha-256", "sha256", QCryptographicHash::Sha256 },
        { Hash::Sha512, "sha-512", "sha512", QCryptographicHash::Sha512 },
        { Hash::Sha3_256, "sha3-256", "sha3_256", QCryptographicHash::Sha3_256 },
        { Hash::Sha3_512, "sha3-512", "sha3_512", QCryptographicHash::Sha3_512 },
#if QT_VERSION >= QT_VERSION_CHECK(6, 0, 0)
        { Hash::Blake2b256, "blake2b-256", "blake2b_256", QCryptographicHash::Blake2b_256 },
        { Hash::Blake2b512, "blake2b-512", "blake2b_512", QCryptographicHash::Blake2b_512 },
#else
        { Hash::Blake2b256, "blake2b-256", "blake2b_256", std::nullopt },
        { Hash::Blake2b512, "blake2b-512", "blake2b_512", std::nullopt },
#endif
    };

    const Algorithm *findAlgorithm(Hash::Type type)
    {
        for (auto const &a : algorithms) {
            if (a.type == type) {
                return &a;
            }
        }
        return nullptr;
    }

} // namespace

// QCA first, Qt if no provider has the algorithm
class Digest {
public:
    explicit Digest(Hash::Type type)
    {
        auto algo = findAlgorithm(type);
        if (!algo) {
            return;
        }
        if (QCA::isSupported(algo->qcaName)) {
            QCA::Hash h(QString::fromLatin1(algo->qcaName));
            if (h.context()) {
                _impl.emplace<QCA::Hash>(h);
                return;
            }
        }
        if (algo->qtAlgorithm) {
            _impl.emplace<QCryptographicHash>(*algo->qtAlgorithm);
        }
    }

    inline bool isNull() const { return std::holds_alternative<std::monostate>(_impl); }

    void update(const QByteArray &data)
    {
        if (auto h = std::get_if<QCA::Hash>(&_impl)) {
            h->update(data);
        } else if (auto h = std::get_if<QCryptographicHash>(&_impl)) {
            h->addData(data);
        }
    }

    bool update(QIODevice *dev)
    {
        while (!dev->atEnd()) {
            auto chunk = dev->read(64 * 1024);
            if (chunk.isEmpty()) {
                return false;
            }
            update(chunk);
        }
        return true;
    }

    QByteArray result()
    {
        if (auto h = std::get_if<QCA::Hash>(&_impl)) {
            return h->final().toByteArray();
        }
        if (auto h = std::get_if<QCryptographicHash>(&_impl)) {
            return h->result();
        }
        return QByteArray();
    }

private:
    std::variant<std::monostate, QCA::Hash, QCryptographicHash> _impl;
};

//----------------------------------------------------------------------------
// Hash
//----------------------------------------------------------------------------
Hash::Hash(const QDomElement &el)
{
    _type = parseType(el.attribute(QStringLiteral("algo")));
    if (_type != Unknown && el.tagName() == QLatin1String("hash")) {
        _data = QByteArray::fromBase64(el.text().toLatin1());
        if (_data.isEmpty()) {
            _type = Unknown; // <hash/> must carry a value
        }
    }
}

QString Hash::stringType() const
{
    auto algo = findAlgorithm(_type);
    return algo ? QString::fromLatin1(algo->name) : QString();
}

Hash::Type Hash::parseType(QStringView algo)
{
    if (algo == QLatin1String("sha1")) {
        return Sha1; // seen in the wild
    }
    for (auto const &a : algorithms) {
        if (algo == QLatin1String(a.name)) {
            return a.type;
        }
    }
    return Unknown;
}

QDomElement Hash::toXml(QDomDocument *doc) const
{
    auto stype = stringType();
    if (stype.isEmpty()) {
        return QDomElement();
    }
    auto el = doc->createElementNS(HASH_NS, _data.isEmpty() ? QStringLiteral("hash-used") : QStringLiteral("hash"));
    el.setAttribute(QStringLiteral("algo"), stype);
    if (!_data.isEmpty()) {
        XMLHelper::setTagText(el, QString::fromLatin1(_data.toBase64()));
    }
    return el;
}

Hash Hash::from(Type type, const QByteArray &data)
{
    Digest digest(type);
    if (digest.isNull()) {
        qDebug("no %s hash implementation", qPrintable(Hash(type).stringType()));
        return Hash();
    }
    digest.update(data);
    return Hash(type, digest.result());
}

Hash Hash::from(Type type, QIODevice *dev)
{
    Digest digest(type);
    if (digest.isNull()) {
        qDebug("no %s hash implementation", qPrintable(Hash(type).stringType()));
        return Hash();
    }
    if (!digest.update(dev)) {
        qDebug("failed to read device for %s hash", qPrintable(Hash(type).stringType()));
        return Hash();
    }
    return Hash(type, digest.result());
}

//----------------------------------------------------------------------------
// StreamHash
//----------------------------------------------------------------------------
StreamHash::StreamHash(Hash::Type type) : _type(type), _digest(new Digest(type)) { }

StreamHash::~StreamHash() { }

bool StreamHash::addData(const QByteArray &data)
{
    if (_digest->isNull()) {
        return false;
    }
    _digest->update(data);
    return true;
}

Hash StreamHash::final()
{
    auto data = _digest->result();
    if (data.isEmpty()) {
        qDebug("failed to compute %s hash on a stream", qPrintable(Hash(_type).stringType()));
        return Hash();
    }
    return Hash(_type, data);
}

} // namespace JingleKit
