#pragma once

/*
    SHC ШЭЙДИНГ ЦӨМ

    ФАЙЛ: result.hpp
    МОДУЛЬ: core
    ЗОРИЛГО: Contract шалгалтын үр дүнг exception-гүйгээр дамжуулах Result/Status төрлүүд.
*/


#include <string>
#include <utility>

namespace shc
{
    template<typename T>
    struct Result
    {
        bool ok = false;
        T value{};
        std::string error{};

        static Result<T> success(T v)
        {
            return Result<T>{true, std::move(v), {}};
        }

        static Result<T> failure(std::string e)
        {
            return Result<T>{false, T{}, std::move(e)};
        }

        explicit operator bool() const { return ok; }
    };

    // Утга буцаахгүй шалгалтуудад (layout validation гэх мэт).
    struct Status
    {
        bool ok = true;
        std::string error{};

        static Status success()
        {
            return Status{};
        }

        static Status failure(std::string e)
        {
            return Status{false, std::move(e)};
        }

        explicit operator bool() const { return ok; }
    };
}
