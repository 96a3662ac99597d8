#pragma once

#include <filesystem>
#include <string>

namespace zenith {
namespace utils {

// 설정 파일/로그/저널 경로 해석
class PathUtils {
public:
    // /proc/self/exe 기준. procfs 가 없으면 작업 디렉토리
    static std::filesystem::path getExecutableDir();

    // 절대 경로는 그대로. 상대 경로는 작업 디렉토리에 있으면 그 경로,
    // 없으면 실행 파일 디렉토리 기준
    static std::filesystem::path resolveRelativePath(const std::string& path);

    // 파일의 상위 디렉토리 생성. 실패 시 false
    static bool ensureParentDir(const std::filesystem::path& file_path);
};

} // namespace utils
} // namespace zenith
