#pragma once

#include <utility>
#include <variant>

namespace DiceTune {

/**
 * Holds either a value or an error. Used for recoverable failures (config lookup,
 * config validation) where the caller decides how to report the problem.
 *
 * Example:
 *   Result<int, std::string> parse(const std::string& s);
 *   auto result = parse("42");
 *   if (result.isError()) { ... result.errorValue() ... }
 */
template <typename T, typename E>
class Result {
public:
    static Result okay(T value) { return Result(std::in_place_index<0>, std::move(value)); }

    static Result error(E error) { return Result(std::in_place_index<1>, std::move(error)); }

    bool isValue() const { return data_.index() == 0; }
    bool isError() const { return data_.index() == 1; }

    const T& value() const { return std::get<0>(data_); }
    T& value() { return std::get<0>(data_); }

    const E& errorValue() const { return std::get<1>(data_); }

private:
    template <std::size_t I, typename V>
    Result(std::in_place_index_t<I> tag, V&& value) : data_(tag, std::forward<V>(value))
    {}

    std::variant<T, E> data_;
};

} // namespace DiceTune
