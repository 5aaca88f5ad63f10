/*
 * actiontest.cpp
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

#include "jingle.h"
#include "qttestutil/qttestutil.h"

#include <QDomDocument>
#include <QObject>
#include <QtTest/QtTest>

using namespace JingleKit::Jingle;

class ActionTest : public QObject {
    Q_OBJECT

private slots:
    void testParseAction()
    {
        bool sent = true;
        QVERIFY(parseAction(u"content-accept", &sent) == Action::ContentAccept);
        QVERIFY(!sent);
        QVERIFY(parseAction(u"transport-replace") == Action::TransportReplace);
        QVERIFY(parseAction(u"iq-error") == Action::IqError);
        QVERIFY(parseAction(u"session-dance") == Action::NoAction);
        QVERIFY(parseAction(u"") == Action::NoAction);
    }

    void testParseSentAction()
    {
        bool sent = false;
        QVERIFY(parseAction(u"session-accept-sent", &sent) == Action::SessionAccept);
        QVERIFY(sent);

        // results and errors are never mirrored
        QVERIFY(parseAction(u"iq-result-sent", &sent) == Action::NoAction);
        QVERIFY(parseAction(u"iq-error-sent", &sent) == Action::NoAction);
    }

    void testActionNames()
    {
        QCOMPARE(actionName(Action::DescriptionInfo), QString("description-info"));
        QCOMPARE(actionName(Action::ContentAdd, true), QString("content-add-sent"));
        QVERIFY(actionName(Action::NoAction).isEmpty());

        for (std::size_t i = 1; i < ActionCount; ++i) {
            auto a = Action(i);
            QVERIFY(parseAction(actionName(a)) == a);
            if (isSendable(a)) {
                bool sent = false;
                QVERIFY(parseAction(actionName(a, true), &sent) == a);
                QVERIFY(sent);
            }
        }
    }

    void testReason()
    {
        QDomDocument doc;
        auto         el = Reason(Reason::IncompatibleParameters, "no size").toXml(&doc);
        QCOMPARE(el.tagName(), QString("reason"));
        QCOMPARE(el.firstChildElement().tagName(), QString("incompatible-parameters"));

        Reason parsed(el);
        QCOMPARE(parsed.condition(), Reason::IncompatibleParameters);
        QCOMPARE(parsed.text(), QString("no size"));

        QVERIFY(Reason().toXml(&doc).isNull());
    }

    void testContentBase()
    {
        QDomDocument doc;
        ContentBase  cb(Origin::Responder, "file");
        cb.senders = Origin::None;
        auto el    = cb.toXml(&doc, "content");
        QCOMPARE(el.attribute("creator"), QString("responder"));
        QCOMPARE(el.attribute("name"), QString("file"));
        QCOMPARE(el.attribute("senders"), QString("none"));

        ContentBase parsed(el);
        QVERIFY(parsed.isValid());
        QVERIFY(parsed.key() == cb.key());
        QVERIFY(parsed.senders == Origin::None);

        el.removeAttribute("senders");
        QVERIFY(ContentBase(el).senders == Origin::Both);

        QVERIFY(negateOrigin(Origin::Initiator) == Origin::Responder);
    }
};

QTTESTUTIL_REGISTER_TEST(ActionTest);
#include "actiontest.moc"
