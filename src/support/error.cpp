//===----------------------------------------------------------------------===//
//
// Part of the Quasar project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/support/error.cpp
// Purpose: Names for the shared error codes.
// Key invariants: Every enumerator has a distinct name.
// Ownership/Lifetime: Returns views of string literals.
// Links: src/support/error.hpp
//
//===----------------------------------------------------------------------===//

#include "support/error.hpp"

namespace quasar::support
{

std::string_view errorName(Error error)
{
    switch (error)
    {
        case Error::None:
            return "None";
        case Error::InvalidArg:
            return "InvalidArg";
        case Error::NotFound:
            return "NotFound";
        case Error::NoResource:
            return "NoResource";
        case Error::Busy:
            return "Busy";
        case Error::Cancelled:
            return "Cancelled";
        case Error::Contended:
            return "Contended";
        case Error::Timeout:
            return "Timeout";
        case Error::InvalidHandle:
            return "InvalidHandle";
        case Error::HandleClosed:
            return "HandleClosed";
        case Error::WrongDirection:
            return "WrongDirection";
        case Error::Denied:
            return "Denied";
        case Error::PeerClosed:
            return "PeerClosed";
        case Error::AlreadyRegistered:
            return "AlreadyRegistered";
        case Error::DuplicateBit:
            return "DuplicateBit";
        case Error::BitOutOfRange:
            return "BitOutOfRange";
        case Error::GuardConflict:
            return "GuardConflict";
        case Error::PortalClosed:
            return "PortalClosed";
        case Error::ProtocolViolation:
            return "ProtocolViolation";
        case Error::SchemaMismatch:
            return "SchemaMismatch";
        case Error::UnknownRoute:
            return "UnknownRoute";
        case Error::DuplicateRoute:
            return "DuplicateRoute";
        case Error::NotNegotiated:
            return "NotNegotiated";
        case Error::Remote:
            return "Remote";
    }
    return "Unknown";
}

Error errorFromCode(std::int32_t code)
{
    const Error e = static_cast<Error>(code);
    if (e == Error::None || errorName(e) == "Unknown")
        return Error::Remote;
    return e;
}

std::ostream &operator<<(std::ostream &os, Error error)
{
    return os << errorName(error);
}

} // namespace quasar::support
