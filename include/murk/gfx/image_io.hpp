#pragma once

/*
    MURK РЕНДЕРЕР САН

    ФАЙЛ: image_io.hpp
    МОДУЛЬ: gfx
    ЗОРИЛГО: 8 битийн дэлгэцийн буферийг binary PPM (P6) файлд бичих.
*/


#include <fstream>
#include <string>

#include "murk/core/result.hpp"
#include "murk/gfx/rt_types.hpp"

namespace murk
{
    // RT_ColorLDR нь дээрээс доош эрэмбэтэй тул мөрийг шууд бичнэ.
    inline Status write_ldr_to_ppm(const std::string& path, const RT_ColorLDR& ldr)
    {
        if (ldr.w <= 0 || ldr.h <= 0) return Status::failure("empty image, nothing to write");

        std::ofstream out(path, std::ios::binary);
        if (!out) return Status::failure("cannot open '" + path + "' for writing");

        out << "P6\n" << ldr.w << " " << ldr.h << "\n255\n";
        for (int y = 0; y < ldr.h; ++y)
        {
            for (int x = 0; x < ldr.w; ++x)
            {
                const Color c = ldr.color.at(x, y);
                const char rgb[3] = {(char)c.r, (char)c.g, (char)c.b};
                out.write(rgb, 3);
            }
        }
        if (!out.good()) return Status::failure("write failed for '" + path + "'");
        return ok_status();
    }
}
