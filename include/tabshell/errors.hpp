#pragma once

#include <stdexcept>
#include <string>

namespace tabshell
{

enum class ErrorKind
{
    NotFound,
    ResourceExhausted,
};

// Base class for every error the command API throws.  Invalid-state
// requests (go_back with no history, stop on an idle view, ...) are not
// errors: they are no-ops.
class ShellError : public std::runtime_error
{
   public:
    ShellError(ErrorKind kind, const std::string& what) : std::runtime_error(what), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

   private:
    ErrorKind kind_;
};

// Unknown window or view id on a lookup that requires the entity.
class NotFoundError : public ShellError
{
   public:
    explicit NotFoundError(const std::string& what) : ShellError(ErrorKind::NotFound, what) {}
};

// The rendering capability could not create a surface.  The command that
// needed it registered nothing.
class ResourceExhaustedError : public ShellError
{
   public:
    explicit ResourceExhaustedError(const std::string& what)
        : ShellError(ErrorKind::ResourceExhausted, what)
    {
    }
};

}   // namespace tabshell
