#ifndef FLAG_ALGEBRA_GUARD_FLAGALG_RATIONAL_HH
#define FLAG_ALGEBRA_GUARD_FLAGALG_RATIONAL_HH 1

#include <compare>
#include <cstring>
#include <exception>
#include <gmp.h>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace flagalg
{
    /**
     * Thrown if a Rational is constructed with a zero denominator.
     */
    class InvalidRational : public std::exception
    {
    private:
        std::string _what;

    public:
        explicit InvalidRational(const std::string & message) noexcept :
            _what("Invalid rational: " + message)
        {
        }

        auto what() const noexcept -> const char * override
        {
            return _what.c_str();
        }
    };

    /**
     * An exact rational number. Always kept in canonical form (lowest
     * terms, positive denominator).
     */
    class Rational
    {
    private:
        mpq_t value;

    public:
        Rational()
        {
            mpq_init(value);
        }

        Rational(long v)
        {
            mpq_init(value);
            mpq_set_si(value, v, 1);
        }

        Rational(int v) :
            Rational(long{v})
        {
        }

        Rational(unsigned long v)
        {
            mpq_init(value);
            mpq_set_ui(value, v, 1);
        }

        Rational(long num, long den)
        {
            if (0 == den)
                throw InvalidRational{std::to_string(num) + "/0"};
            mpq_init(value);
            if (den < 0) {
                num = -num;
                den = -den;
            }
            mpq_set_si(value, num, static_cast<unsigned long>(den));
            mpq_canonicalize(value);
        }

        Rational(const Rational & other)
        {
            mpq_init(value);
            mpq_set(value, other.value);
        }

        Rational(Rational && other) noexcept
        {
            mpq_init(value);
            mpq_swap(value, other.value);
        }

        ~Rational()
        {
            mpq_clear(value);
        }

        mpq_t & raw()
        {
            return value;
        }

        const mpq_t & raw() const
        {
            return value;
        }

        Rational & operator=(const Rational & other)
        {
            if (this != &other) mpq_set(value, other.value);
            return *this;
        }

        Rational & operator=(Rational && other) noexcept
        {
            mpq_swap(value, other.value);
            return *this;
        }

        /**
         * Parse "p" or "p/q" in base 10, where p is an optionally negative
         * run of digits and q a run of digits. Returns nullopt for anything
         * else, including whitespace and a zero denominator.
         */
        static auto from_string(const std::string & s) -> std::optional<Rational>
        {
            auto digits_end = [&](std::string::size_type from) {
                auto end = s.find_first_not_of("0123456789", from);
                return end == std::string::npos ? s.size() : end;
            };

            std::string::size_type pos = (! s.empty() && s[0] == '-') ? 1 : 0;
            auto numerator_end = digits_end(pos);
            if (numerator_end == pos)
                return std::nullopt;
            if (numerator_end != s.size()) {
                if (s[numerator_end] != '/')
                    return std::nullopt;
                auto denominator_end = digits_end(numerator_end + 1);
                if (denominator_end == numerator_end + 1 || denominator_end != s.size())
                    return std::nullopt;
            }

            Rational r;
            if (0 != mpq_set_str(r.value, s.c_str(), 10))
                return std::nullopt;
            if (0 == mpz_sgn(mpq_denref(r.value)))
                return std::nullopt;
            mpq_canonicalize(r.value);
            return r;
        }

        auto sign() const -> int
        {
            return mpq_sgn(value);
        }

        auto is_zero() const -> bool
        {
            return 0 == mpq_sgn(value);
        }

        auto to_double() const -> double
        {
            return mpq_get_d(value);
        }

        Rational operator-() const
        {
            Rational r;
            mpq_neg(r.value, value);
            return r;
        }

        Rational operator+(const Rational & rhs) const
        {
            Rational r;
            mpq_add(r.value, value, rhs.value);
            return r;
        }

        Rational operator-(const Rational & rhs) const
        {
            Rational r;
            mpq_sub(r.value, value, rhs.value);
            return r;
        }

        Rational operator*(const Rational & rhs) const
        {
            Rational r;
            mpq_mul(r.value, value, rhs.value);
            return r;
        }

        /**
         * Caller ensures rhs is nonzero.
         */
        Rational operator/(const Rational & rhs) const
        {
            Rational r;
            mpq_div(r.value, value, rhs.value);
            return r;
        }

        Rational & operator+=(const Rational & rhs)
        {
            mpq_add(value, value, rhs.value);
            return *this;
        }

        Rational & operator-=(const Rational & rhs)
        {
            mpq_sub(value, value, rhs.value);
            return *this;
        }

        Rational & operator*=(const Rational & rhs)
        {
            mpq_mul(value, value, rhs.value);
            return *this;
        }

        Rational & operator/=(const Rational & rhs)
        {
            mpq_div(value, value, rhs.value);
            return *this;
        }

        bool operator==(const Rational & rhs) const noexcept
        {
            return 0 != mpq_equal(value, rhs.value);
        }

        std::strong_ordering operator<=>(const Rational & rhs) const noexcept
        {
            int cmp = mpq_cmp(value, rhs.value);
            if (cmp < 0) return std::strong_ordering::less;
            if (cmp > 0) return std::strong_ordering::greater;
            return std::strong_ordering::equal;
        }

        /**
         * Exact text, "p" or "p/q".
         */
        auto to_string() const -> std::string
        {
            char * str = mpq_get_str(nullptr, 10, value);
            std::string result{str};
            void (*freefunc)(void *, size_t);
            mp_get_memory_functions(nullptr, nullptr, &freefunc);
            freefunc(str, std::strlen(str) + 1);
            return result;
        }

        /**
         * Decimal approximation with the given number of significant digits,
         * for handing to floating point consumers.
         */
        auto to_decimal_string(int digits) const -> std::string
        {
            mpf_t f;
            mpf_init2(f, static_cast<mp_bitcnt_t>(digits * 4 + 64));
            mpf_set_q(f, value);
            int len = gmp_snprintf(nullptr, 0, "%.*Fg", digits, f);
            std::vector<char> buf(len + 1);
            gmp_snprintf(buf.data(), buf.size(), "%.*Fg", digits, f);
            mpf_clear(f);
            return std::string{buf.data()};
        }

        friend std::ostream & operator<<(std::ostream & os, const Rational & x)
        {
            return os << x.to_string();
        }
    };

    inline auto abs(const Rational & x) -> Rational
    {
        return x.sign() < 0 ? -x : x;
    }
}

#endif
