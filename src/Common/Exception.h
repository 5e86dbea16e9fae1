#pragma once

#include <exception>
#include <string>
#include <utility>

#include <Poco/Exception.h>

#include <fmt/format.h>


namespace Gluid
{

class Exception : public Poco::Exception
{
public:
    Exception() = default;
    Exception(const std::string & msg, int code);

    Exception(int code, const std::string & message)
        : Exception(message, code)
    {}

    // Format message with fmt::format, like the logging functions.
    template <typename ...Args>
    Exception(int code, const std::string & fmt, Args&&... args)
        : Exception(fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...), code)
    {}

    struct CreateFromPocoTag {};
    struct CreateFromSTDTag {};

    Exception(CreateFromPocoTag, const Poco::Exception & exc);
    Exception(CreateFromSTDTag, const std::exception & exc);

    Exception * clone() const override { return new Exception(*this); }
    void rethrow() const override { throw *this; } // NOLINT(cert-err60-cpp)
    const char * name() const noexcept override { return "Gluid::Exception"; }
    const char * what() const noexcept override { return message().data(); }

    /// Add something to the existing message.
    template <typename ...Args>
    void addMessage(const std::string & format, Args&&... args)
    {
        extendedMessage(fmt::format(fmt::runtime(format), std::forward<Args>(args)...));
    }

    void addMessage(const std::string & message)
    {
        extendedMessage(message);
    }

private:
    const char * className() const noexcept override { return "Gluid::Exception"; }
};


/** Prints current exception in canonical format:
  * "Code: <code>. <name>: <message>". Must be called from a catch block.
  */
std::string getCurrentExceptionMessage();

/// Returns error code from ErrorCodes
int getCurrentExceptionCode();
int getExceptionErrorCode(std::exception_ptr e);

std::string getExceptionMessage(const Exception & e);

}
