/*
 * qttestutil.h - registration macro for unit tests
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

#ifndef JINGLEKIT_QTTESTUTIL_H
#define JINGLEKIT_QTTESTUTIL_H

#include "qttestutil/testregistration.h"

/**
 * Registers a QtTest class with the TestRegistry.
 *
 * Put it after the class definition in the test's .cpp file:
 *    class HashTest : public QObject { ... };
 *    QTTESTUTIL_REGISTER_TEST(HashTest);
 */
#define QTTESTUTIL_REGISTER_TEST(TestClass) static QtTestUtil::TestRegistration<TestClass> TestClass##Registration

#endif // JINGLEKIT_QTTESTUTIL_H
