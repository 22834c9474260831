#pragma once

/*
    SHC ШЭЙДИНГ ЦӨМ

    ФАЙЛ: pipeline_kind.hpp
    МОДУЛЬ: shader
    ЗОРИЛГО: Basic (зөвхөн diffuse texture) болон Lit (normal map + Blinn-Phong)
            pipeline хувилбаруудыг ялгах tag.
*/


#include <cstdint>

namespace shc
{
    enum class PipelineKind : uint8_t
    {
        Basic = 0,
        Lit = 1
    };

    inline const char* pipeline_kind_name(PipelineKind k)
    {
        return k == PipelineKind::Lit ? "lit" : "basic";
    }
}
