/*
 * testregistry.cpp - registry of QtTest test classes
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

#include "qttestutil/testregistry.h"

#include <QObject>
#include <QtTest/QtTest>

namespace QtTestUtil {

TestRegistry *TestRegistry::getInstance()
{
    static TestRegistry registry;
    return &registry;
}

void TestRegistry::registerTest(QObject *test) { _tests += test; }

int TestRegistry::runTests(int argc, char *argv[])
{
    int failed = 0;
    for (auto test : std::as_const(_tests)) {
        if (QTest::qExec(test, argc, argv) != 0) {
            qWarning("%s failed", test->metaObject()->className());
            ++failed;
        }
    }
    return failed;
}

} // namespace QtTestUtil
