#pragma once

#include <gtest/gtest.h>
#include <filesystem>
#include <string>
#include <unistd.h>

// Per-test scratch directory. ctest runs each discovered test in its own
// process, possibly in parallel, so the name carries the test and pid.
inline std::filesystem::path unique_temp_dir(const std::string& prefix) {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    std::string name = prefix;
    if (info) name += std::string("_") + info->test_suite_name() + "_" + info->name();
    name += "_" + std::to_string(getpid());
    return std::filesystem::temp_directory_path() / name;
}
