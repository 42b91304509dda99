// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#include <veritas/core/veritas_exception.hpp>

#include <gtest/gtest.h>

#include <cstring>
#include <string>
#include <unistd.h>

using namespace veritas;

namespace
{
    TEST(VeritasExceptionTest, message)
    {
        try {
            VERITAS_ASSERT_THROW(1 + 1 == 3, "arithmetic");
        }
        catch (VeritasException const &e) {
            ASSERT_STREQ(e.message(), "arithmetic");
            return;
        }
        FAIL();
    }

    TEST(VeritasExceptionTest, message_truncated)
    {
        std::string const message(
            VeritasException::message_buffer_size + 10, 'x');
        try {
            VERITAS_ASSERT_THROW(false, message.c_str());
        }
        catch (VeritasException const &e) {
            EXPECT_EQ(
                std::strlen(e.message()),
                VeritasException::message_buffer_size - 1);
            return;
        }
        FAIL();
    }

    TEST(VeritasExceptionTest, print)
    {
        try {
            VERITAS_ASSERT_THROW(false, "hello world");
        }
        catch (VeritasException const &e) {
            int fds[2];
            ASSERT_NE(::pipe(fds), -1);
            e.print(fds[1]);
            ::close(fds[1]);
            char buffer[1024];
            auto const n = ::read(fds[0], buffer, sizeof(buffer) - 1);
            ::close(fds[0]);
            ASSERT_GT(n, 0);
            buffer[n] = '\0';
            EXPECT_NE(std::strstr(buffer, "'hello world'"), nullptr);
            EXPECT_NE(std::strstr(buffer, "'false'"), nullptr);
            return;
        }
        FAIL();
    }
}
