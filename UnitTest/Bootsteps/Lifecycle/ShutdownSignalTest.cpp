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

#include <Bootsteps/Framework/Host/ComponentHost.hpp>
#include <Bootsteps/Framework/Lifecycle/Namespace.hpp>
#include <Bootsteps/Framework/Lifecycle/ShutdownSignal.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/system/system_error.hpp>
#include <gtest/gtest.h>
#include <chrono>
#include <exception>
#include <optional>
#include <thread>
#include <utility>

namespace Bootsteps
{
  using namespace std::chrono_literals;

  namespace
  {
    struct AsyncResult
    {
      bool Completed{false};
      std::exception_ptr Error;
      bool Value{false};
    };

    template <typename TAwaitable>
    void Spawn(boost::asio::io_context& ioContext, TAwaitable awaitable, AsyncResult& result)
    {
      boost::asio::co_spawn(ioContext, std::move(awaitable),
                            [&result](std::exception_ptr error, bool value)
                            {
                              result.Completed = true;
                              result.Error = error;
                              result.Value = value;
                            });
    }
  }

  TEST(ShutdownSignalTest, Set_OnlyFirstCallReturnsTrue)
  {
    ShutdownSignal signal;
    EXPECT_FALSE(signal.IsSet());

    EXPECT_TRUE(signal.Set());
    EXPECT_FALSE(signal.Set());
    EXPECT_TRUE(signal.IsSet());
  }

  TEST(ShutdownSignalTest, Wait_Timeout_ReturnsFalse)
  {
    ShutdownSignal signal;
    EXPECT_FALSE(signal.Wait(5ms));
  }

  TEST(ShutdownSignalTest, Wait_AlreadySet_ReturnsTrue)
  {
    ShutdownSignal signal;
    signal.Set();
    EXPECT_TRUE(signal.Wait(0ms));
    EXPECT_TRUE(signal.Wait());
  }

  TEST(ShutdownSignalTest, Wait_ReleasedFromOtherThread)
  {
    ShutdownSignal signal;
    std::thread setter(
      [&signal]()
      {
        std::this_thread::sleep_for(10ms);
        signal.Set();
      });

    EXPECT_TRUE(signal.Wait());
    setter.join();
  }

  TEST(ShutdownSignalTest, AsyncWait_AlreadySet_CompletesImmediately)
  {
    boost::asio::io_context ioContext;
    ShutdownSignal signal;
    signal.Set();
    AsyncResult result;

    Spawn(ioContext, signal.AsyncWait(), result);
    ioContext.run();

    ASSERT_TRUE(result.Completed);
    EXPECT_FALSE(result.Error);
    EXPECT_TRUE(result.Value);
  }

  TEST(ShutdownSignalTest, AsyncWait_ReleasedBySet)
  {
    boost::asio::io_context ioContext;
    ShutdownSignal signal;
    AsyncResult first;
    AsyncResult second;

    Spawn(ioContext, signal.AsyncWait(), first);
    Spawn(ioContext, signal.AsyncWait(), second);
    boost::asio::post(ioContext, [&signal]() { signal.Set(); });
    ioContext.run();

    ASSERT_TRUE(first.Completed);
    ASSERT_TRUE(second.Completed);
    EXPECT_TRUE(first.Value);
    EXPECT_TRUE(second.Value);
  }

  TEST(ShutdownSignalTest, AsyncWait_ReleasedBySetFromOtherThread)
  {
    boost::asio::io_context ioContext;
    ShutdownSignal signal;
    AsyncResult result;

    Spawn(ioContext, signal.AsyncWait(), result);
    std::thread setter(
      [&signal]()
      {
        std::this_thread::sleep_for(10ms);
        signal.Set();
      });
    ioContext.run();
    setter.join();

    ASSERT_TRUE(result.Completed);
    EXPECT_TRUE(result.Value);
  }

  TEST(ShutdownSignalTest, AsyncWait_Timeout_ReturnsFalse)
  {
    boost::asio::io_context ioContext;
    ShutdownSignal signal;
    AsyncResult result;

    Spawn(ioContext, signal.AsyncWait(5ms), result);
    ioContext.run();

    ASSERT_TRUE(result.Completed);
    EXPECT_FALSE(result.Error);
    EXPECT_FALSE(result.Value);
  }

  TEST(ShutdownSignalTest, AsyncWait_Cancelled_ThrowsOperationAborted)
  {
    boost::asio::io_context ioContext;
    ShutdownSignal signal;
    AsyncResult result;

    Spawn(ioContext, signal.AsyncWait(), result);
    boost::asio::post(ioContext, [&signal]() { signal.CancelAsyncWaits(); });
    ioContext.run();

    ASSERT_TRUE(result.Completed);
    ASSERT_TRUE(result.Error);
    try
    {
      std::rethrow_exception(result.Error);
    }
    catch (const boost::system::system_error& ex)
    {
      EXPECT_EQ(ex.code(), boost::asio::error::operation_aborted);
    }
    EXPECT_FALSE(signal.IsSet());
  }

  TEST(NamespaceJoinAsyncTest, Cancelled_IsReportedAsCompleted)
  {
    boost::asio::io_context ioContext;
    ComponentRegistry registry;
    Namespace ns("empty", {}, {}, registry);
    AsyncResult result;

    Spawn(ioContext, ns.JoinAsync(), result);
    boost::asio::post(ioContext, [&ns]() { ns.GetShutdownSignal().CancelAsyncWaits(); });
    ioContext.run();

    ASSERT_TRUE(result.Completed);
    EXPECT_FALSE(result.Error);
    EXPECT_TRUE(result.Value);
  }

  TEST(NamespaceJoinAsyncTest, Stop_CompletesJoin)
  {
    boost::asio::io_context ioContext;
    ComponentRegistry registry;
    ComponentHost host;
    Namespace ns("empty", {}, {}, registry);
    ns.Apply(host);
    ns.Start(host);
    AsyncResult result;

    Spawn(ioContext, ns.JoinAsync(), result);
    boost::asio::post(ioContext, [&ns, &host]() { ns.Stop(host); });
    ioContext.run();

    ASSERT_TRUE(result.Completed);
    EXPECT_TRUE(result.Value);
    EXPECT_EQ(ns.GetState(), NamespaceState::Terminate);
  }

  TEST(NamespaceJoinAsyncTest, Timeout_ReturnsFalse)
  {
    boost::asio::io_context ioContext;
    ComponentRegistry registry;
    Namespace ns("empty", {}, {}, registry);
    AsyncResult result;

    Spawn(ioContext, ns.JoinAsync(5ms), result);
    ioContext.run();

    ASSERT_TRUE(result.Completed);
    EXPECT_FALSE(result.Value);
  }
}
