#pragma once

/*
    MURK РЕНДЕРЕР САН

    ФАЙЛ: result.hpp
    МОДУЛЬ: core
    ЗОРИЛГО: Host талын алдаа гарч болох үйлдлүүдийн (texture үүсгэх, frame target
            хуваарилах, capture бичих) буцаах утгын төрөл.
*/


#include <string>
#include <utility>

namespace murk
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

    // Утга буцаадаггүй үйлдлүүдэд.
    struct Unit {};
    using Status = Result<Unit>;

    inline Status ok_status()
    {
        return Status::success(Unit{});
    }
}
