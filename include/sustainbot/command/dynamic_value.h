#pragma once

#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace sustainbot::command {

// Rendered in place of a value whose producer threw.
inline constexpr std::string_view kResolveErrorText = "<error getting value>";

/**
 * A value that is either fixed at declaration time or produced on demand.
 *
 * Producers are evaluated every time the value is resolved (help rendering),
 * so they can read live configuration. A producer reports failure by throwing
 * an std::exception-derived error.
 */
template <typename T>
class DynamicValue {
public:
    using Producer = std::function<T()>;

    DynamicValue(T value)
        : _v(std::in_place_index<0>, std::move(value))
    {}

    template <typename F, typename = std::enable_if_t<std::is_invocable_r_v<T, F&>>>
    DynamicValue(F producer)
        : _v(std::in_place_index<1>, Producer(std::move(producer)))
    {}

    bool is_producer() const noexcept { return _v.index() == 1; }

    const T* static_value() const noexcept { return std::get_if<0>(&_v); }
    const Producer* producer() const noexcept { return std::get_if<1>(&_v); }

private:
    std::variant<T, Producer> _v;
};

using TextValue = DynamicValue<std::string>;
using ChoiceList = DynamicValue<std::vector<std::string>>;

namespace detail {
void report_resolve_failure(const char* what);
} // namespace detail

// Evaluates the value. Returns nullopt (after logging) if the producer threw
// or is empty; never propagates the producer's exception.
template <typename T>
std::optional<T> try_resolve(const DynamicValue<T>& dv)
{
    if (const T* v = dv.static_value()) {
        return *v;
    }

    const auto* p = dv.producer();
    if (!p || !*p) {
        detail::report_resolve_failure("empty producer");
        return std::nullopt;
    }

    try {
        return (*p)();
    } catch (const std::exception& ex) {
        detail::report_resolve_failure(ex.what());
        return std::nullopt;
    }
}

// Text form of resolve(): the resolved string, or kResolveErrorText on failure.
std::string resolve(const TextValue& dv);

} // namespace sustainbot::command
