/*
 * jingle-security.h - XTLS security element and local certificate
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

#ifndef JINGLEKIT_JINGLE_SECURITY_H
#define JINGLEKIT_JINGLE_SECURITY_H

#include <QDomElement>
#include <QStringList>
#include <QtCrypto>

namespace JingleKit { namespace Jingle {

    class Certificate {
    public:
        Certificate() = default;
        explicit Certificate(const QCA::Certificate &cert);

        // loads PEM certificate. returns null certificate on failure
        static Certificate load(const QString &path, QCA::ConvertResult *result = nullptr);

        inline bool             isNull() const { return _cert.isNull(); }
        inline QCA::Certificate qcaCertificate() const { return _cert; }

        // digest part of the signature algorithm, e.g. "sha256" for sha256WithRSAEncryption
        static QString digestName(QCA::SignatureAlgorithm algorithm);
        QString        signatureAlgorithm() const;

        // DER digest with the certificate's own signature digest. empty if it can't be computed
        QByteArray fingerprint() const;

    private:
        QCA::Certificate _cert;
    };

    // AB:CD:EF..
    QString fingerprintText(const QByteArray &digest);

    class XtlsSecurity {
    public:
        static const QString NS;

        XtlsSecurity() = default;
        XtlsSecurity(const QDomElement &el);

        // fingerprint computed with the certificate's own signature digest
        static XtlsSecurity fromCertificate(const Certificate &cert);
        static QStringList  supportedMethods();

        inline bool        isValid() const { return !_fingerprint.isEmpty(); }
        inline QString     fingerprint() const { return _fingerprint; }
        inline QStringList methods() const { return _methods; }

        QDomElement toXml(QDomDocument *doc) const;

    private:
        QString     _fingerprint;
        QStringList _methods;
    };

} // namespace Jingle
} // namespace JingleKit

#endif // JINGLEKIT_JINGLE_SECURITY_H
