#pragma once

/*
    SHC ШЭЙДИНГ ЦӨМ

    ФАЙЛ: program.hpp
    МОДУЛЬ: shader
    ЗОРИЛГО: Vertex/fragment stage-уудыг нэг pipeline хувилбарт холбох program.
*/


#include <functional>

#include "shc/shader/attribute_fetch.hpp"
#include "shc/shader/pipeline_kind.hpp"
#include "shc/shader/types.hpp"

namespace shc
{
    using VertexShaderFn = std::function<VertexOut(const VertexInput&, const InstanceInput&, const ShaderResources&)>;
    using FragmentShaderFn = std::function<FragmentOut(const FragmentIn&, const ShaderResources&)>;

    struct ShaderProgram
    {
        PipelineKind kind = PipelineKind::Basic;
        VertexShaderFn vs{};
        FragmentShaderFn fs{};

        bool valid() const
        {
            return (bool)vs && (bool)fs;
        }
    };
}
