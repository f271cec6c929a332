#include "common/PathUtils.h"
#include <system_error>

namespace signalbench {
namespace utils {

std::filesystem::path PathUtils::getExecutableDir() {
    std::error_code ec;
    const auto exe_path = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec || exe_path.empty()) {
        // procfs 없는 환경: 작업 디렉토리 기준
        return std::filesystem::current_path(ec);
    }
    return exe_path.parent_path();
}

std::filesystem::path PathUtils::resolveRelativePath(const std::string& relative_path) {
    return getExecutableDir() / relative_path;
}

} // namespace utils
} // namespace signalbench
