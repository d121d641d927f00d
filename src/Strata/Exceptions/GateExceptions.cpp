#include <Strata/Exceptions/PoisonedException.hpp>
#include <Strata/Exceptions/ReentrancyException.hpp>

#include <string>

namespace Strata::Exceptions
{
    namespace
    {
        std::string Describe(const char* container, const char* what)
        {
            std::string message = container ? container : "container";
            message += ": ";
            message += what;
            return message;
        }
    }// namespace

    ReentrancyException::ReentrancyException(const char* container)
        : Exception(Describe(container, "mutation attempted while another mutation of the same container is in progress")),
          m_container(container)
    {
    }

    PoisonedException::PoisonedException(const char* container)
        : Exception(Describe(container, "a previous mutation exited abnormally while holding the lock; further insertions are rejected")),
          m_container(container)
    {
    }
}// namespace Strata::Exceptions
