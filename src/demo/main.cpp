//=============================================================================
// yquad-demo - scrolling widget wall through the GPU culling pipeline
//=============================================================================

#include "demo-app.h"

#include <ytrace/ytrace.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::cfg::load_env_levels();

    auto result = yquad::demo::DemoApp::create(argc, argv);
    if (!result) {
        // Help text was already printed
        const yquad::Error* err = &result.error();
        while (err->cause()) err = err->cause();
        if (err->message() == "Help requested") {
            return 0;
        }
        yerror("Failed to initialize yquad-demo: {}", yquad::error_msg(result));
        return 1;
    }

    auto app = *result;
    if (auto runResult = app->run(); !runResult) {
        yerror("yquad-demo run failed: {}", yquad::error_msg(runResult));
        return 1;
    }
    return 0;
}
