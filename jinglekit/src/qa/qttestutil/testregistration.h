/*
 * testregistration.h - static registration of a test class
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

#ifndef JINGLEKIT_QTTESTUTIL_TESTREGISTRATION_H
#define JINGLEKIT_QTTESTUTIL_TESTREGISTRATION_H

#include "qttestutil/testregistry.h"

#include <memory>

namespace QtTestUtil {

// Used by QTTESTUTIL_REGISTER_TEST() only
template <typename TestClass> class TestRegistration {
public:
    TestRegistration() : _test(std::make_unique<TestClass>()) { TestRegistry::getInstance()->registerTest(_test.get()); }

private:
    std::unique_ptr<TestClass> _test;
};

} // namespace QtTestUtil

#endif // JINGLEKIT_QTTESTUTIL_TESTREGISTRATION_H
