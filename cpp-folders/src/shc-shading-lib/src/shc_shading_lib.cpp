/*
    SHC ШЭЙДИНГ ЦӨМ

    ФАЙЛ: shc_shading_lib.cpp
    МОДУЛЬ: shc-shading-lib
    ЗОРИЛГО: Compiled library target anchor translation unit. Header бүрийг нэг удаа
            compile хийлгэж бие даан include хийгдэх чадварыг нь шалгана.
*/

#include "shc/core/log.hpp"
#include "shc/core/result.hpp"
#include "shc/core/time.hpp"
#include "shc/job/thread_pool_job_system.hpp"
#include "shc/render/draw.hpp"
#include "shc/resources/primitives.hpp"
#include "shc/resources/procedural_textures.hpp"
#include "shc/scene/camera_controller.hpp"
#include "shc/scene/instance_grid.hpp"
#include "shc/scene/light.hpp"

namespace shc
{
    int shc_shading_compiled_target_anchor()
    {
        return 0;
    }
}
