#include <tincture/error.hpp>

namespace tincture
{

const char* error_kind_name(ErrorKind kind)
{
    switch (kind)
    {
        case ErrorKind::InvalidParameter:
            return "InvalidParameter";
        case ErrorKind::InvalidExtras:
            return "InvalidExtras";
        case ErrorKind::DuplicateKey:
            return "DuplicateKey";
        case ErrorKind::TemplateParseError:
            return "TemplateParseError";
        case ErrorKind::MissingExtra:
            return "MissingExtra";
        case ErrorKind::SlotOutOfRange:
            return "SlotOutOfRange";
        case ErrorKind::InvalidDocument:
            return "InvalidDocument";
        case ErrorKind::Io:
            return "Io";
    }
    return "Unknown";
}

Error::Error(ErrorKind kind, const std::string& message, std::string subject)
    : std::runtime_error(message), kind_(kind), subject_(std::move(subject))
{
}

}   // namespace tincture
