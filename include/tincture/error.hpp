#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace tincture
{

enum class ErrorKind
{
    InvalidParameter,     // Bad generation inputs (N <= 0, curve length mismatch, ...)
    InvalidExtras,        // Extras index outside the palette
    DuplicateKey,         // Same extras name given twice
    TemplateParseError,   // Malformed exporter template or declaration
    MissingExtra,         // Theme lacks an extra the template requires
    SlotOutOfRange,       // {HEXk} with k >= palette size
    InvalidDocument,      // Malformed preset / scheme / exporter / config TOML
    Io                    // File could not be read or written
};

const char* error_kind_name(ErrorKind kind);

// Every fallible tincture operation reports failure by throwing this.
// `subject()` names the offending key, slot or template when there is one.
class Error : public std::runtime_error
{
   public:
    Error(ErrorKind kind, const std::string& message, std::string subject = {});

    ErrorKind          kind() const noexcept { return kind_; }
    const std::string& subject() const noexcept { return subject_; }

   private:
    ErrorKind   kind_;
    std::string subject_;
};

}   // namespace tincture
