#include <flagalg/formats/file_error.hh>

using namespace flagalg;

using std::string;

FileError::FileError(const string & filename, const string & message, bool x) noexcept :
    _what("Error with file '" + filename + "': " + message),
    _exists(x)
{
}

auto FileError::what() const noexcept -> const char *
{
    return _what.c_str();
}

auto FileError::file_at_least_existed() const noexcept -> bool
{
    return _exists;
}
