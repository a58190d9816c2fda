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
#include <atomic>
#include <cstdint>
#include <list>
#include <mutex>
#include <utility>

namespace Bootsteps
{
  namespace
  {
    // -1 encodes "no timeout"
    constexpr int64_t NoTimeout = -1;

    std::atomic<int64_t> g_defaultSocketTimeoutMs{NoTimeout};

    // Active ScopedSocketTimeout overrides in construction order and the value that was current before the
    // first of them. The newest active override decides the current value.
    struct ActiveOverrides
    {
      std::mutex Mutex;
      std::list<std::pair<const ScopedSocketTimeout*, int64_t>> Entries;
      int64_t Original{NoTimeout};
    };

    ActiveOverrides& GetActiveOverrides()
    {
      static ActiveOverrides overrides;
      return overrides;
    }

    constexpr int64_t Encode(const std::optional<std::chrono::milliseconds> timeout) noexcept
    {
      if (!timeout)
      {
        return NoTimeout;
      }
      return timeout->count() < 0 ? 0 : static_cast<int64_t>(timeout->count());
    }

    constexpr std::optional<std::chrono::milliseconds> Decode(const int64_t value) noexcept
    {
      if (value == NoTimeout)
      {
        return std::nullopt;
      }
      return std::chrono::milliseconds(value);
    }
  }

  namespace DefaultSocketTimeout
  {
    std::optional<std::chrono::milliseconds> Get() noexcept
    {
      return Decode(g_defaultSocketTimeoutMs.load());
    }

    void Set(const std::optional<std::chrono::milliseconds> timeout) noexcept
    {
      g_defaultSocketTimeoutMs.store(Encode(timeout));
    }
  }

  ScopedSocketTimeout::ScopedSocketTimeout(const std::optional<std::chrono::milliseconds> timeout)
  {
    auto& overrides = GetActiveOverrides();
    std::lock_guard<std::mutex> lock(overrides.Mutex);
    const int64_t encoded = Encode(timeout);
    const int64_t previous = g_defaultSocketTimeoutMs.exchange(encoded);
    if (overrides.Entries.empty())
    {
      overrides.Original = previous;
    }
    overrides.Entries.emplace_back(this, encoded);
    m_previous = Decode(previous);
  }

  ScopedSocketTimeout::~ScopedSocketTimeout()
  {
    auto& overrides = GetActiveOverrides();
    std::lock_guard<std::mutex> lock(overrides.Mutex);
    for (auto itr = overrides.Entries.begin(); itr != overrides.Entries.end(); ++itr)
    {
      if (itr->first == this)
      {
        overrides.Entries.erase(itr);
        break;
      }
    }
    // Overlapping scopes may end in any order: fall back to the newest override still active, or to the
    // value that was current before the first override once none are left
    g_defaultSocketTimeoutMs.store(overrides.Entries.empty() ? overrides.Original : overrides.Entries.back().second);
  }
}
