/*
 * testregistry.h - registry of QtTest test classes
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

#ifndef JINGLEKIT_QTTESTUTIL_TESTREGISTRY_H
#define JINGLEKIT_QTTESTUTIL_TESTREGISTRY_H

#include <QList>

class QObject;

namespace QtTestUtil {

/**
 * @brief The TestRegistry class collects every test registered with QTTESTUTIL_REGISTER_TEST
 * so a single executable can run them all.
 */
class TestRegistry {
public:
    static TestRegistry *getInstance();

    void registerTest(QObject *test);

    // runs all registered tests with QTest::qExec(). returns the number of failed test classes
    int runTests(int argc, char *argv[]);

private:
    TestRegistry() = default;

    QList<QObject *> _tests;
};

} // namespace QtTestUtil

#endif // JINGLEKIT_QTTESTUTIL_TESTREGISTRY_H
