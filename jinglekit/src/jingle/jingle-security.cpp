/*
 * jingle-security.cpp - XTLS security element and local certificate
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

#include "jingle-security.h"

#include "xmlcommon.h"

#include <QDomDocument>

namespace JingleKit { namespace Jingle {

    //----------------------------------------------------------------------------
    // Certificate
    //----------------------------------------------------------------------------
    Certificate::Certificate(const QCA::Certificate &cert) : _cert(cert) { }

    Certificate Certificate::load(const QString &path, QCA::ConvertResult *result)
    {
        QCA::ConvertResult res  = QCA::ErrorFile;
        Certificate        cert;
        if (QCA::isSupported("cert")) {
            cert._cert = QCA::Certificate::fromPEMFile(path, &res);
        }
        if (res != QCA::ConvertGood) {
            cert._cert = QCA::Certificate();
        }
        if (result) {
            *result = res;
        }
        return cert;
    }

    QString Certificate::digestName(QCA::SignatureAlgorithm algorithm)
    {
        switch (algorithm) {
        case QCA::EMSA1_SHA1:
        case QCA::EMSA3_SHA1:
            return QStringLiteral("sha1");
        case QCA::EMSA3_MD5:
            return QStringLiteral("md5");
        case QCA::EMSA3_MD2:
            return QStringLiteral("md2");
        case QCA::EMSA3_RIPEMD160:
            return QStringLiteral("ripemd160");
        case QCA::EMSA3_SHA224:
            return QStringLiteral("sha224");
        case QCA::EMSA3_SHA256:
            return QStringLiteral("sha256");
        case QCA::EMSA3_SHA384:
            return QStringLiteral("sha384");
        case QCA::EMSA3_SHA512:
            return QStringLiteral("sha512");
        default:
            break;
        }
        return QString();
    }

    QString Certificate::signatureAlgorithm() const { return digestName(_cert.signatureAlgorithm()); }

    QByteArray Certificate::fingerprint() const
    {
        if (_cert.isNull()) {
            return QByteArray();
        }
        auto algo = signatureAlgorithm();
        if (algo.isEmpty() || !QCA::isSupported(algo.toLatin1().constData())) {
            qWarning("jingle: unsupported certificate signature digest \"%s\"", qPrintable(algo));
            return QByteArray();
        }
        return QCA::Hash(algo).hash(_cert.toDER()).toByteArray();
    }

    QString fingerprintText(const QByteArray &digest) { return QString::fromLatin1(digest.toHex(':').toUpper()); }

    //----------------------------------------------------------------------------
    // XtlsSecurity
    //----------------------------------------------------------------------------
    const QString XtlsSecurity::NS(QStringLiteral("urn:xmpp:jingle:security:xtls:0"));

    XtlsSecurity::XtlsSecurity(const QDomElement &el)
    {
        if (el.namespaceURI() != NS) {
            return;
        }
        _fingerprint = XMLHelper::subTagText(el, QStringLiteral("fingerprint")).trimmed();
        for (auto const &m : XMLHelper::childElements(el, QStringLiteral("method"))) {
            auto name = m.attribute(QStringLiteral("name"));
            if (!name.isEmpty()) {
                _methods.append(name);
            }
        }
    }

    XtlsSecurity XtlsSecurity::fromCertificate(const Certificate &cert)
    {
        XtlsSecurity sec;
        auto         fp = cert.fingerprint();
        if (!fp.isEmpty()) {
            sec._fingerprint = fingerprintText(fp);
            sec._methods     = supportedMethods();
        }
        return sec;
    }

    QStringList XtlsSecurity::supportedMethods() { return { QStringLiteral("x509") }; }

    QDomElement XtlsSecurity::toXml(QDomDocument *doc) const
    {
        if (!isValid()) {
            return QDomElement();
        }
        auto el = doc->createElementNS(NS, QStringLiteral("security"));
        el.appendChild(XMLHelper::textTag(*doc, QStringLiteral("fingerprint"), _fingerprint));
        for (auto const &m : _methods) {
            auto mel = doc->createElement(QStringLiteral("method"));
            mel.setAttribute(QStringLiteral("name"), m);
            el.appendChild(mel);
        }
        return el;
    }

} // namespace Jingle
} // namespace JingleKit
