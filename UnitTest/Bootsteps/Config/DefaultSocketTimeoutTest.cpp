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

#include <Bootsteps/Framework/Config/DefaultSocketTimeout.hpp>
#include <Bootsteps/TestComponents.hpp>
#include <gtest/gtest.h>
#include <chrono>
#include <future>
#include <memory>
#include <stdexcept>
#include <thread>

namespace Bootsteps
{
  using namespace std::chrono_literals;

  TEST(DefaultSocketTimeoutTest, Set_Get)
  {
    TestSupport::SocketTimeoutRestorer restorer;

    DefaultSocketTimeout::Set(1500ms);
    EXPECT_EQ(DefaultSocketTimeout::Get(), std::chrono::milliseconds(1500));

    DefaultSocketTimeout::Set(std::nullopt);
    EXPECT_FALSE(DefaultSocketTimeout::Get().has_value());
  }

  TEST(DefaultSocketTimeoutTest, Set_Negative_ClampsToZero)
  {
    TestSupport::SocketTimeoutRestorer restorer;

    DefaultSocketTimeout::Set(-5ms);
    EXPECT_EQ(DefaultSocketTimeout::Get(), std::chrono::milliseconds(0));
  }

  TEST(ScopedSocketTimeoutTest, Scope_OverridesAndRestores)
  {
    TestSupport::SocketTimeoutRestorer restorer;
    DefaultSocketTimeout::Set(std::nullopt);
    {
      ScopedSocketTimeout scoped(5000ms);
      EXPECT_EQ(DefaultSocketTimeout::Get(), std::chrono::milliseconds(5000));
      EXPECT_FALSE(scoped.GetPrevious().has_value());
    }
    EXPECT_FALSE(DefaultSocketTimeout::Get().has_value());
  }

  TEST(ScopedSocketTimeoutTest, Exception_Restores)
  {
    TestSupport::SocketTimeoutRestorer restorer;
    DefaultSocketTimeout::Set(30ms);

    EXPECT_THROW(
      {
        ScopedSocketTimeout scoped(std::nullopt);
        EXPECT_FALSE(DefaultSocketTimeout::Get().has_value());
        throw std::runtime_error("socket hung");
      },
      std::runtime_error);

    EXPECT_EQ(DefaultSocketTimeout::Get(), std::chrono::milliseconds(30));
  }

  TEST(ScopedSocketTimeoutTest, Nested_RestoresInReverseOrder)
  {
    TestSupport::SocketTimeoutRestorer restorer;
    DefaultSocketTimeout::Set(std::nullopt);
    {
      ScopedSocketTimeout outer(5000ms);
      {
        ScopedSocketTimeout inner(100ms);
        EXPECT_EQ(DefaultSocketTimeout::Get(), std::chrono::milliseconds(100));
      }
      EXPECT_EQ(DefaultSocketTimeout::Get(), std::chrono::milliseconds(5000));
    }
    EXPECT_FALSE(DefaultSocketTimeout::Get().has_value());
  }

  TEST(ScopedSocketTimeoutTest, Overlapping_FirstEndsFirst_RestoresOriginal)
  {
    TestSupport::SocketTimeoutRestorer restorer;
    DefaultSocketTimeout::Set(std::nullopt);

    auto first = std::make_unique<ScopedSocketTimeout>(5000ms);
    auto second = std::make_unique<ScopedSocketTimeout>(2000ms);
    EXPECT_EQ(second->GetPrevious(), std::chrono::milliseconds(5000));

    // The first override ends while the second is still active
    first.reset();
    EXPECT_EQ(DefaultSocketTimeout::Get(), std::chrono::milliseconds(2000));

    second.reset();
    EXPECT_FALSE(DefaultSocketTimeout::Get().has_value());
  }

  TEST(ScopedSocketTimeoutTest, Overlapping_AcrossThreads_RestoresOriginal)
  {
    TestSupport::SocketTimeoutRestorer restorer;
    DefaultSocketTimeout::Set(250ms);

    std::promise<void> firstCreated;
    std::promise<void> secondCreated;
    std::promise<void> firstEnded;

    std::thread firstThread(
      [&]()
      {
        {
          ScopedSocketTimeout scoped(5000ms);
          firstCreated.set_value();
          secondCreated.get_future().wait();
        }
        firstEnded.set_value();
      });
    std::thread secondThread(
      [&]()
      {
        firstCreated.get_future().wait();
        ScopedSocketTimeout scoped(5000ms);
        secondCreated.set_value();
        firstEnded.get_future().wait();
      });

    firstThread.join();
    secondThread.join();

    EXPECT_EQ(DefaultSocketTimeout::Get(), std::chrono::milliseconds(250));
  }
}
