#pragma once

#include <acb/error.hpp>
#include <variant>
#include <utility>

namespace acb {

template<typename T>
class Result {
    std::variant<T, AcbError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from AcbError so ACB_TRY can forward errors across Result<T> types
    Result(AcbError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<AcbError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    AcbError& error() & { return std::get<AcbError>(data_); }
    const AcbError& error() const& { return std::get<AcbError>(data_); }
    AcbError&& error() && { return std::get<AcbError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define ACB_TRY(expr) \
    do { \
        auto _acb_result = (expr); \
        if (_acb_result.is_err()) return std::move(_acb_result).error(); \
    } while(0)

} // namespace acb
