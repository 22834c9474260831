#pragma once

/*
    SHC ШЭЙДИНГ ЦӨМ

    ФАЙЛ: builtin_shaders.hpp
    МОДУЛЬ: shader
    ЗОРИЛГО: Basic болон Lit pipeline-ийн бэлэн ShaderProgram-ууд.
*/


#include "shc/shader/fragment_stage.hpp"
#include "shc/shader/program.hpp"
#include "shc/shader/vertex_stage.hpp"

namespace shc
{
    inline ShaderProgram make_basic_program()
    {
        ShaderProgram p{};
        p.kind = PipelineKind::Basic;
        p.vs = [](const VertexInput& v, const InstanceInput& inst, const ShaderResources& res) -> VertexOut
        {
            return vertex_stage_basic(v, inst, res);
        };
        p.fs = [](const FragmentIn& in, const ShaderResources& res) -> FragmentOut
        {
            return fragment_stage_basic(in, res);
        };
        return p;
    }

    inline ShaderProgram make_lit_program()
    {
        ShaderProgram p{};
        p.kind = PipelineKind::Lit;
        p.vs = [](const VertexInput& v, const InstanceInput& inst, const ShaderResources& res) -> VertexOut
        {
            return vertex_stage_lit(v, inst, res);
        };
        p.fs = [](const FragmentIn& in, const ShaderResources& res) -> FragmentOut
        {
            return fragment_stage_lit(in, res);
        };
        return p;
    }

    inline ShaderProgram make_program(PipelineKind kind)
    {
        return kind == PipelineKind::Lit ? make_lit_program() : make_basic_program();
    }
}
