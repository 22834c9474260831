#pragma once

/*
    SHC ШЭЙДИНГ ЦӨМ

    ФАЙЛ: platform_input.hpp
    МОДУЛЬ: platform
    ЗОРИЛГО: Нэг frame-ийн оролтын төлөв. Toggle-ууд зөвхөн дарсан frame-д true байна.
*/


namespace shc
{
    struct PlatformInputState
    {
        bool quit = false;
        bool toggle_frame_rate = false;
        bool toggle_pipeline = false;
        bool up_axis_x = false;
        bool up_axis_y = false;
        bool up_axis_z = false;

        bool forward = false;
        bool backward = false;
        bool left = false;
        bool right = false;

        bool mouse_moved = false;
        float mouse_x = 0.0f;
        float mouse_y = 0.0f;
        int window_w = 0;
        int window_h = 0;
    };
}
