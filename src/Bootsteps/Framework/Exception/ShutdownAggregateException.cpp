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
#include <sstream>
#include <typeinfo>
#include <utility>

namespace Bootsteps
{
  namespace
  {
    std::string GenerateMessage(const std::string& message)
    {
      return message.empty() ? std::string("One or more components failed during shutdown.") : message;
    }

    std::vector<ComponentFailure>& ValidateNonEmpty(std::vector<ComponentFailure>& failures)
    {
      if (failures.empty())
      {
        throw std::invalid_argument("The failures argument must contain at least one failure.");
      }
      return failures;
    }
  }

  ShutdownAggregateException::ShutdownAggregateException(const std::string& message, std::vector<ComponentFailure> failures)
    : std::runtime_error(GenerateMessage(message))
    , m_failures(std::move(ValidateNonEmpty(failures)))
  {
  }

  std::string ShutdownAggregateException::ToString() const
  {
    std::ostringstream oss;
    oss << what();

    for (std::size_t i = 0; i < m_failures.size(); ++i)
    {
      oss << "\n  [" << i << "] " << m_failures[i].ComponentName << ": ";
      try
      {
        if (m_failures[i].Exception)
        {
          std::rethrow_exception(m_failures[i].Exception);
        }
        oss << "(null exception)";
      }
      catch (const std::exception& ex)
      {
        oss << typeid(ex).name() << ": " << ex.what();
      }
      catch (...)
      {
        oss << "(unknown exception type)";
      }
    }
    return oss.str();
  }
}
