/**
 * @file test_gpu_common.cpp
 * @brief Unit tests for WebGPU error scope reporting
 */

#include <catch2/catch_test_macros.hpp>
#include <michadame/effects/gpu_common.h>
#include <string>

using namespace michadame::effects::gpu;

TEST_CASE("Error scope results", "[core][gpu]") {
    SECTION("a clean scope reports nothing") {
        std::string text = describeErrorScope(WGPUPopErrorScopeStatus_Success,
                                              WGPUErrorType_NoError, WGPUStringView{nullptr, 0});
        REQUIRE(text.empty());
    }

    SECTION("shader validation errors carry the device message") {
        const char* message = "Shader 'composite' parsing error: expected ';'";
        std::string text = describeErrorScope(WGPUPopErrorScopeStatus_Success,
                                              WGPUErrorType_Validation, toStringView(message));
        REQUIRE(text == std::string("validation error: ") + message);
    }

    SECTION("null-terminated messages are read to the terminator") {
        std::string text = describeErrorScope(WGPUPopErrorScopeStatus_Success,
                                              WGPUErrorType_OutOfMemory,
                                              WGPUStringView{"texture", WGPU_STRLEN});
        REQUIRE(text == "out of memory: texture");
    }

    SECTION("a scope that cannot be popped is an error") {
        std::string text = describeErrorScope(WGPUPopErrorScopeStatus_Error,
                                              WGPUErrorType_NoError, WGPUStringView{nullptr, 0});
        REQUIRE_FALSE(text.empty());
    }
}
