//****************************************************************************************************************************************************
//* Zero-Clause BSD (0BSD)
//*
//* Copyright (c) 2025, Mana Battery
//*
//* Permission to use, copy, modify, and/or distribute this software for any purpose with or without fee is hereby granted.
//*
//* THE SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL WARRANTIES WITH REGARD TO THIS SOFTWARE INCLUDING ALL IMPLIED WARRANTIES OF
//* MERCHANTABILITY AND FITNESS. IN NO EVENT SHALL THE AUTHOR BE LIABLE FOR ANY SPECIAL, DIRECT, INDIRECT, OR CONSEQUENTIAL DAMAGES OR ANY DAMAGES
//* WHATSOEVER RESULTING FROM LOSS OF USE, DATA OR PROFITS, WHETHER IN AN ACTION OF CONTRACT, NEGLIGENCE OR OTHER TORTIOUS ACTION, ARISING OUT OF
//* OR IN CONNECTION WITH THE USE OR PERFORMANCE OF THIS SOFTWARE.
//****************************************************************************************************************************************************

#include <Bootsteps/Framework/Exception/ShutdownAggregateException.hpp>
#include <gtest/gtest.h>
#include <exception>
#include <stdexcept>
#include <string>
#include <vector>

namespace Bootsteps
{
  namespace
  {
    std::exception_ptr MakeError(const std::string& message)
    {
      return std::make_exception_ptr(std::runtime_error(message));
    }
  }

  TEST(ShutdownAggregateExceptionTest, Construct_EmptyFailures_Throws)
  {
    EXPECT_THROW(ShutdownAggregateException("failed", {}), std::invalid_argument);
  }

  TEST(ShutdownAggregateExceptionTest, Construct_EmptyMessage_UsesDefault)
  {
    const ShutdownAggregateException ex("", {ComponentFailure{"worker.pool", MakeError("boom")}});
    EXPECT_STRNE(ex.what(), "");
  }

  TEST(ShutdownAggregateExceptionTest, Failures_AreKeptInOrder)
  {
    const ShutdownAggregateException ex("2 failures", {ComponentFailure{"worker.consumer", MakeError("first")},
                                                      ComponentFailure{"worker.pool", MakeError("second")}});

    ASSERT_EQ(ex.FailureCount(), 2u);
    EXPECT_EQ(ex.GetFailures()[0].ComponentName, "worker.consumer");
    EXPECT_EQ(ex.GetFailures()[1].ComponentName, "worker.pool");
    EXPECT_THROW(std::rethrow_exception(ex.GetFailures()[1].Exception), std::runtime_error);
  }

  TEST(ShutdownAggregateExceptionTest, ToString_ListsEveryFailure)
  {
    const ShutdownAggregateException ex("shutdown failed", {ComponentFailure{"worker.consumer", MakeError("first")},
                                                           ComponentFailure{"OnStopped", std::make_exception_ptr(42)}});

    const auto text = ex.ToString();

    EXPECT_NE(text.find("shutdown failed"), std::string::npos);
    EXPECT_NE(text.find("[0] worker.consumer"), std::string::npos);
    EXPECT_NE(text.find("first"), std::string::npos);
    EXPECT_NE(text.find("[1] OnStopped: (unknown exception type)"), std::string::npos);
  }
}
