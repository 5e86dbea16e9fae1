#include <Common/Exception.h>
#include <Common/ErrorCodes.h>

#include <cstdlib>
#include <typeinfo>

#include <cxxabi.h>


namespace Gluid
{

namespace ErrorCodes
{
    extern const int POCO_EXCEPTION;
    extern const int STD_EXCEPTION;
    extern const int UNKNOWN_EXCEPTION;
}

namespace
{

std::string demangle(const char * name)
{
    int status = 0;
    char * demangled = abi::__cxa_demangle(name, nullptr, nullptr, &status);
    if (status != 0 || demangled == nullptr)
        return name;

    std::string res(demangled);
    std::free(demangled); // NOLINT(cppcoreguidelines-no-malloc)
    return res;
}

}

Exception::Exception(const std::string & msg, int code)
    : Poco::Exception(msg, code)
{
    ErrorCodes::increment(code);
}

Exception::Exception(CreateFromPocoTag, const Poco::Exception & exc)
    : Poco::Exception(exc.displayText(), ErrorCodes::POCO_EXCEPTION)
{
    ErrorCodes::increment(ErrorCodes::POCO_EXCEPTION);
}

Exception::Exception(CreateFromSTDTag, const std::exception & exc)
    : Poco::Exception(demangle(typeid(exc).name()) + ": " + std::string(exc.what()), ErrorCodes::STD_EXCEPTION)
{
    ErrorCodes::increment(ErrorCodes::STD_EXCEPTION);
}


std::string getExceptionMessage(const Exception & e)
{
    return fmt::format("Code: {}. {}: {}", e.code(), ErrorCodes::getName(e.code()), e.message());
}

std::string getCurrentExceptionMessage()
{
    try
    {
        throw;
    }
    catch (const Exception & e)
    {
        return getExceptionMessage(e);
    }
    catch (const Poco::Exception & e)
    {
        return fmt::format("Poco::Exception. Code: {}, e.code() = {}, {}", ErrorCodes::POCO_EXCEPTION, e.code(), e.displayText());
    }
    catch (const std::exception & e)
    {
        return fmt::format("std::exception. Code: {}, type: {}, e.what() = {}",
            ErrorCodes::STD_EXCEPTION, demangle(typeid(e).name()), e.what());
    }
    catch (...)
    {
        return fmt::format("Unknown exception. Code: {}", ErrorCodes::UNKNOWN_EXCEPTION);
    }
}

int getCurrentExceptionCode()
{
    try
    {
        throw;
    }
    catch (const Exception & e)
    {
        return e.code();
    }
    catch (const Poco::Exception &)
    {
        return ErrorCodes::POCO_EXCEPTION;
    }
    catch (const std::exception &)
    {
        return ErrorCodes::STD_EXCEPTION;
    }
    catch (...)
    {
        return ErrorCodes::UNKNOWN_EXCEPTION;
    }
}

int getExceptionErrorCode(std::exception_ptr e)
{
    try
    {
        std::rethrow_exception(e);
    }
    catch (const Exception & exception)
    {
        return exception.code();
    }
    catch (const Poco::Exception &)
    {
        return ErrorCodes::POCO_EXCEPTION;
    }
    catch (const std::exception &)
    {
        return ErrorCodes::STD_EXCEPTION;
    }
    catch (...)
    {
        return ErrorCodes::UNKNOWN_EXCEPTION;
    }
}

}
