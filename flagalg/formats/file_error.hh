#ifndef FLAG_ALGEBRA_GUARD_FLAGALG_FORMATS_FILE_ERROR_HH
#define FLAG_ALGEBRA_GUARD_FLAGALG_FORMATS_FILE_ERROR_HH 1

#include <exception>
#include <string>

namespace flagalg
{
    /**
     * Thrown if we come across bad data in an SDP or densities file, or if we
     * can't read or write one.
     */
    class FileError : public std::exception
    {
    private:
        std::string _what;
        bool _exists;

    public:
        FileError(const std::string & filename, const std::string & message, bool exists) noexcept;

        auto what() const noexcept -> const char * override;
        auto file_at_least_existed() const noexcept -> bool;
    };
}

#endif
