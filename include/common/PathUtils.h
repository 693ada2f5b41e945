#pragma once

#include <string>
#include <filesystem>

namespace quantsim {
namespace utils {

class PathUtils {
public:
    // 실행 파일 디렉토리 (읽을 수 없으면 현재 작업 디렉토리)
    static std::filesystem::path getExecutableDir();

    static std::filesystem::path resolveRelativePath(const std::string& relative_path);

    // Absolute paths are returned unchanged, relative ones are anchored at the executable
    static std::filesystem::path resolvePath(const std::string& path);
};

} // namespace utils
} // namespace quantsim
