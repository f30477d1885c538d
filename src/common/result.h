#ifndef STEPCOACH_RESULT_H
#define STEPCOACH_RESULT_H

#include <optional>
#include <utility>

namespace stepcoach {

/**
 * @brief Value-or-error return type for calls that fail as a matter of course
 * @tparam T Value type
 * @tparam E Error type
 */
template<typename T, typename E>
class Result {
public:
    static Result success(T value) {
        Result result;
        result.m_value.emplace(std::move(value));
        return result;
    }

    static Result failure(E error) {
        Result result;
        result.m_error.emplace(std::move(error));
        return result;
    }

    bool ok() const { return m_value.has_value(); }
    explicit operator bool() const { return ok(); }

    /**
     * @brief Access the value; throws std::bad_optional_access on failure
     */
    const T& value() const& { return m_value.value(); }
    T& value() & { return m_value.value(); }
    T&& value() && { return std::move(m_value.value()); }

    /**
     * @brief Access the error; throws std::bad_optional_access on success
     */
    const E& error() const { return m_error.value(); }

    T valueOr(T fallback) const {
        return m_value ? *m_value : std::move(fallback);
    }

    template<typename F>
    auto map(F&& fn) const -> Result<decltype(fn(std::declval<const T&>())), E> {
        using U = decltype(fn(std::declval<const T&>()));
        if (m_value) {
            return Result<U, E>::success(fn(*m_value));
        }
        return Result<U, E>::failure(*m_error);
    }

private:
    Result() = default;

    std::optional<T> m_value;
    std::optional<E> m_error;
};

} // namespace stepcoach

#endif // STEPCOACH_RESULT_H
