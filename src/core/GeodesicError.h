#ifndef GEODESIC_ERROR_H
#define GEODESIC_ERROR_H

#include <stdexcept>
#include <string>

namespace core
{
    enum class ErrorKind
    {
        InvalidInput,
        SolverFailure
    };

    inline const char *errorKindName(ErrorKind kind)
    {
        switch (kind)
        {
        case ErrorKind::InvalidInput:
            return "InvalidInput";
        case ErrorKind::SolverFailure:
            return "SolverFailure";
        }
        return "Unknown";
    }

    /**
     * @class GeodesicError
     * @brief Failure of a distance query. Never cached, never retried.
     */
    class GeodesicError : public std::runtime_error
    {
    public:
        GeodesicError(ErrorKind kind, const std::string &what)
            : std::runtime_error(what), m_kind(kind)
        {
        }

        ErrorKind kind() const { return m_kind; }

    private:
        ErrorKind m_kind;
    };

    /// Non-finite or out-of-range coordinates.
    class InvalidInputError : public GeodesicError
    {
    public:
        explicit InvalidInputError(const std::string &what)
            : GeodesicError(ErrorKind::InvalidInput, what)
        {
        }
    };

    /// The solver did not converge or rejected its input.
    class SolverFailureError : public GeodesicError
    {
    public:
        explicit SolverFailureError(const std::string &what)
            : GeodesicError(ErrorKind::SolverFailure, what)
        {
        }
    };

} // namespace core

#endif // GEODESIC_ERROR_H
