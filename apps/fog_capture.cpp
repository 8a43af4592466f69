/*
    MURK РЕНДЕРЕР САН

    ФАЙЛ: fog_capture.cpp
    МОДУЛЬ: apps
    ЗОРИЛГО: Цонхгүйгээр demo тайзыг рендерлэж PPM файлд бичих.
*/

#include <murk/core/log.hpp>
#include <murk/frame/frame_params_env.hpp>

#include "demo_host.hpp"

int main(int argc, char* argv[])
{
    const demo::DemoOptions opt = demo::parse_demo_options(argc, argv);

    murk::FrameParams fp{};
    fp.w = opt.width;
    fp.h = opt.height;
    murk::apply_env_overrides(fp);
    murk::log_info("capture: " + demo::describe(fp));

    return demo::run_headless(opt, fp);
}
